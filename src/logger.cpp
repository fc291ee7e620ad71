#include "utils/logger.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>

#include "utils/compiler.hpp"

namespace {
/**
 * @brief Получение текущего времени в формате для лога
 * @return Строка с текущим временем в формате "YYYY-MM-DD HH:MM:SS.mmm"
 */
std::string getCurrentTimeFormatted()
{
    const auto now = std::chrono::system_clock::now();
    const auto timeNow = std::chrono::system_clock::to_time_t(now);
    const auto ms
        = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    // localtime_r не использует общий статический буфер
    std::tm localTime{};
    localtime_r(&timeNow, &localTime);

    std::ostringstream oss;
    oss << std::put_time(&localTime, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0')
        << std::setw(3) << ms.count();
    return oss.str();
}

// Только имя файла без пути
std::string extractFileName(const std::string_view fullPath)
{
    const auto pos = fullPath.find_last_of("/\\");
    if (pos != std::string_view::npos) {
        return std::string(fullPath.substr(pos + 1));
    }
    return std::string(fullPath);
}

namespace ConsoleColor {
constexpr const char *RESET = "\033[0m";
constexpr const char *RED = "\033[31m";
constexpr const char *GREEN = "\033[32m";
constexpr const char *YELLOW = "\033[33m";
constexpr const char *BLUE = "\033[34m";
constexpr const char *MAGENTA = "\033[35m";
constexpr const char *CYAN = "\033[36m";
constexpr const char *BOLD = "\033[1m";
} // namespace ConsoleColor
} // namespace

namespace minter::utils {
std::string errnoToString(int errnum)
{
    char buffer[128] = { 0 };
#if defined(__GLIBC__) && defined(_GNU_SOURCE)
    // GNU-версия strerror_r возвращает char*
    return std::string(strerror_r(errnum, buffer, sizeof(buffer)));
#else
    // XSI-совместимая версия strerror_r возвращает int
    if (strerror_r(errnum, buffer, sizeof(buffer)) == 0) {
        return std::string(buffer);
    }
    return "Unknown error";
#endif
}

Logger &Logger::getInstance()
{
    static Logger instance;
    return instance;
}

Logger::Logger()
    : enabled_(false)
    , consoleOutput_(false)
    , colorOutput_(false)
    , logFilePath_(std::nullopt)
    , minimumLevel_(LogLevel::INFO)
{
}

void Logger::enable(bool logToConsole, std::optional<std::filesystem::path> logFile,
                    LogLevel minLevel, bool useColors)
{
    std::ostringstream configMsg;
    bool needColorWarning = false;

    {
        std::lock_guard<std::mutex> lock(logMutex_);

        enabled_ = true;
        consoleOutput_ = logToConsole;
        logFilePath_ = std::move(logFile);
        minimumLevel_ = minLevel;

        if (useColors) {
            const auto isColorSupported = isColorSupportedByTerminal();
            needColorWarning = !isColorSupported;
            colorOutput_ = isColorSupported;
        }
        else {
            colorOutput_ = false;
        }

        if (logFilePath_.has_value()) {
            const auto dir = logFilePath_->parent_path();
            std::error_code ec;
            if (!dir.empty()) {
                std::filesystem::create_directories(dir, ec);
            }

            std::ofstream file(*logFilePath_, std::ios::out | std::ios::app);
            if (file) {
                file << "--- MINTER логирование начато в " << getCurrentTimeFormatted() << " ---"
                     << std::endl;
            }
        }

        configMsg << "Логирование включено (минимальный уровень: " << levelToString(minimumLevel_)
                  << ", вывод в консоль: " << (consoleOutput_ ? "да" : "нет")
                  << ", цветной вывод: " << (colorOutput_ ? "да" : "нет") << ")";
    }

    if (needColorWarning) {
        log(LogLevel::WARNING, "Запрошен цветной вывод, однако консоль не поддерживает ANSI цвета",
            __FILE__, __LINE__);
    }
    log(LogLevel::DEBUG, configMsg.str(), __FILE__, __LINE__);
}

void Logger::disable()
{
    std::lock_guard<std::mutex> lock(logMutex_);
    enabled_ = false;
}

bool Logger::isEnabled() const
{
    return enabled_;
}

void Logger::setMinLogLevel(LogLevel level)
{
    std::lock_guard<std::mutex> lock(logMutex_);
    minimumLevel_ = level;
}

LogLevel Logger::getMinLogLevel() const
{
    return minimumLevel_;
}

void Logger::log(LogLevel level, const std::string &message, const std::string_view file, int line)
{
    if (!enabled_ || level < minimumLevel_) {
        return;
    }

    std::lock_guard<std::mutex> lock(logMutex_);

    const auto formattedMessage = formatLogMessage(level, message, file, line);

    if (consoleOutput_) {
        writeToConsole(formattedMessage, level);
    }

    if (logFilePath_.has_value()) {
        writeToFile(formattedMessage);
    }
}

std::string Logger::levelToString(LogLevel level)
{
    switch (level) {
    case LogLevel::TRACE:
        return "TRACE";
    case LogLevel::DEBUG:
        return "DEBUG";
    case LogLevel::INFO:
        return "INFO";
    case LogLevel::WARNING:
        return "WARNING";
    case LogLevel::ERROR:
        return "ERROR";
    case LogLevel::CRITICAL:
        return "CRITICAL";
    case LogLevel::IMPORTANT:
        return "IMPORTANT";
    default:
        UNREACHABLE("Unsupported LogLevel");
    }
}

std::string Logger::formatLogMessage(LogLevel level, const std::string &message,
                                     const std::string_view file, int line) const
{
    std::ostringstream oss;
    oss << "[" << getCurrentTimeFormatted() << "] "
        << "[" << levelToString(level) << "] ";

    if (!file.empty()) {
        oss << "[" << extractFileName(file) << ":" << line << "] ";
    }

    oss << message;
    return oss.str();
}

bool Logger::writeToFile(const std::string &formattedMessage)
{
    std::ofstream file(*logFilePath_, std::ios::out | std::ios::app);
    if (!file) {
        std::cerr << "MINTER: Не удалось открыть файл для записи: " << *logFilePath_ << std::endl;
        return false;
    }

    file << formattedMessage << std::endl;
    return true;
}

void Logger::writeToConsole(const std::string &formattedMessage, LogLevel level)
{
    const std::string prefix = "MINTER: ";

    if (!colorOutput_) {
        std::cerr << prefix << formattedMessage << std::endl;
        return;
    }

    const char *colorCode = ConsoleColor::RESET;
    switch (level) {
    case LogLevel::TRACE:
        colorCode = ConsoleColor::CYAN;
        break;
    case LogLevel::DEBUG:
        colorCode = ConsoleColor::BLUE;
        break;
    case LogLevel::INFO:
        colorCode = ConsoleColor::GREEN;
        break;
    case LogLevel::WARNING:
        colorCode = ConsoleColor::YELLOW;
        break;
    case LogLevel::ERROR:
        colorCode = ConsoleColor::RED;
        break;
    case LogLevel::CRITICAL:
        colorCode = ConsoleColor::MAGENTA;
        break;
    case LogLevel::IMPORTANT:
        colorCode = ConsoleColor::BOLD;
        break;
    default:
        UNREACHABLE("Unsupported LogLevel");
    }

    std::cerr << colorCode << prefix << formattedMessage << ConsoleColor::RESET << std::endl;
}

bool Logger::isColorSupportedByTerminal() const
{
    const char *term = std::getenv("TERM");
    if (term == nullptr) {
        return false;
    }
    return std::string(term) != "dumb" && std::string(term) != "unknown";
}

LogStream::LogStream(LogLevel level, const std::string_view file, int line)
    : level_(level)
    , file_(file)
    , line_(line)
{
}

LogStream::~LogStream()
{
    Logger::getInstance().log(level_, stream_.str(), file_, line_);
}

} // namespace minter::utils
