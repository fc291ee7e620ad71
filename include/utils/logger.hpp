#pragma once

#include <atomic>
#include <filesystem>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace minter::utils {
/**
 * @brief Потокобезопасное преобразование кода ошибки в строковое описание
 * @return Строковое описание ошибки
 */
std::string errnoToString(int errnum);

/**
 * @enum LogLevel
 * @brief Уровни логирования, определяющие важность сообщения
 */
enum class LogLevel {
    TRACE, // Детальная трассировка для отладки
    DEBUG, // Отладочные сообщения
    INFO, // Информационные сообщения
    WARNING, // Предупреждения, не являющиеся ошибками
    ERROR, // Ошибки, не прерывающие работу программы
    CRITICAL, // Критические ошибки
    IMPORTANT // Сообщения о жизненном цикле процесса, выводятся всегда
};

/**
 * @class Logger
 * @brief Управляет логированием сообщений с различными уровнями важности
 *
 * Logger является синглтоном и обеспечивает потокобезопасное логирование.
 * По умолчанию логирование отключено: библиотека молчит, пока исполняемый
 * файл явно не включит вывод.
 */
class Logger {
public:
    /**
     * @brief Получение единственного экземпляра логгера
     * @return Ссылка на экземпляр логгера
     */
    static Logger &getInstance();

    /**
     * @brief Включает логирование
     * @param logToConsole Включить вывод в консоль (stderr)
     * @param logFile Путь к файлу для логирования (опционально)
     * @param minLevel Минимальный уровень сообщений для логирования
     * @param useColors Использовать цветной вывод в консоли (если поддерживается)
     */
    void enable(bool logToConsole = true,
                std::optional<std::filesystem::path> logFile = std::nullopt,
                LogLevel minLevel = LogLevel::INFO, bool useColors = true);

    /**
     * @brief Отключает логирование
     */
    void disable();

    bool isEnabled() const;

    void setMinLogLevel(LogLevel level);
    LogLevel getMinLogLevel() const;

    /**
     * @brief Логирование сообщения с указанным уровнем
     * @param level Уровень сообщения
     * @param message Текст сообщения
     * @param file Имя файла, из которого вызвана функция логирования
     * @param line Номер строки, из которой вызвана функция логирования
     */
    void log(LogLevel level, const std::string &message, const std::string_view file = {},
             int line = 0);

private:
    Logger();
    ~Logger() = default;
    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;

    std::atomic<bool> enabled_;
    bool consoleOutput_;
    bool colorOutput_;
    std::optional<std::filesystem::path> logFilePath_;
    std::atomic<LogLevel> minimumLevel_;
    std::mutex logMutex_;

    static std::string levelToString(LogLevel level);

    /**
     * @brief Форматирует сообщение: [ВРЕМЯ] [УРОВЕНЬ] [ФАЙЛ:СТРОКА] Сообщение
     */
    std::string formatLogMessage(LogLevel level, const std::string &message,
                                 const std::string_view file, int line) const;

    bool writeToFile(const std::string &formattedMessage);
    void writeToConsole(const std::string &formattedMessage, LogLevel level);

    /**
     * @brief Проверяет, поддерживает ли консоль ANSI цвета
     * @return true, если консоль поддерживает ANSI цвета
     */
    bool isColorSupportedByTerminal() const;
};

/**
 * @brief Вспомогательный класс для логирования с использованием потокового синтаксиса
 *
 * Сообщение собирается во внутренний поток и отправляется в логгер в деструкторе.
 */
class LogStream {
public:
    LogStream(LogLevel level, const std::string_view file, int line);
    ~LogStream();

    template <typename T> LogStream &operator<<(const T &val)
    {
        stream_ << val;
        return *this;
    }

private:
    LogLevel level_;
    std::ostringstream stream_;
    std::string_view file_;
    int line_;
};

} // namespace minter::utils

#define MINTER_LOG_ENABLED(level)                                                                  \
    (minter::utils::Logger::getInstance().isEnabled()                                              \
     && minter::utils::Logger::getInstance().getMinLogLevel() <= minter::utils::LogLevel::level)

// Макросы для удобного логирования с автоматическим указанием файла и строки
#define MINTER_LOG(level)                                                                          \
    if (MINTER_LOG_ENABLED(level))                                                                 \
    minter::utils::LogStream(minter::utils::LogLevel::level, __FILE__, __LINE__)

#define LOG_TRACE MINTER_LOG(TRACE)
#define LOG_DEBUG MINTER_LOG(DEBUG)
#define LOG_INFO MINTER_LOG(INFO)
#define LOG_WARNING MINTER_LOG(WARNING)
#define LOG_ERROR MINTER_LOG(ERROR)
#define LOG_CRITICAL MINTER_LOG(CRITICAL)
#define LOG_IMPORTANT MINTER_LOG(IMPORTANT)
