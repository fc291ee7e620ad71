#include "utils/file_utils.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <fstream>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "utils/file_lock_guard.hpp"
#include "utils/logger.hpp"

namespace {
bool isExistingDirectory(const std::filesystem::path &path)
{
    std::error_code ec;
    return std::filesystem::is_directory(path, ec);
}

// Временная метка для имен резервных копий: YYYYMMDD_HHMMSS_mmm
std::string getCurrentTimeFormatted()
{
    const auto now = std::chrono::system_clock::now();
    const auto timeNow = std::chrono::system_clock::to_time_t(now);
    const auto ms
        = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm localTime{};
    localtime_r(&timeNow, &localTime);

    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y%m%d_%H%M%S", &localTime);
    return std::string(buffer) + "_" + std::to_string(ms.count());
}

// Путь для временного файла рядом с основным: имя уникально в пределах процесса
std::filesystem::path getTempFilePath(const std::filesystem::path &originalPath)
{
    static std::atomic<uint64_t> tempCounter{ 0 };
    const auto filename = originalPath.filename().string();
    std::filesystem::path tempPath;
    do {
        tempPath = originalPath.parent_path()
                   / (filename + ".tmp." + std::to_string(getpid()) + "."
                      + std::to_string(tempCounter.fetch_add(1)));
    } while (std::filesystem::exists(tempPath));
    return tempPath;
}

std::filesystem::path getBackupFilePath(const std::filesystem::path &originalPath)
{
    const auto filename = originalPath.filename().string();
    std::filesystem::path backupPath;
    uint32_t attempt = 0;
    do {
        backupPath = originalPath.parent_path()
                     / (filename + ".backup." + getCurrentTimeFormatted() + "."
                        + std::to_string(attempt++));
    } while (std::filesystem::exists(backupPath));
    return backupPath;
}

// Директория файла, для относительного имени без директории - текущая
std::filesystem::path parentDirectory(const std::filesystem::path &filePath)
{
    return filePath.has_parent_path() ? filePath.parent_path() : std::filesystem::path(".");
}

// Синхронизация директории, чтобы переименование пережило сбой питания
bool syncDirectory(const std::filesystem::path &dir)
{
    const auto fd = open(dir.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd == -1) {
        LOG_ERROR << "Не удалось открыть директорию для синхронизации: " << dir.string()
                  << ", ошибка: " << minter::utils::errnoToString(errno);
        return false;
    }

    const auto success = fsync(fd) == 0;
    if (!success) {
        LOG_ERROR << "Ошибка синхронизации директории: " << dir.string()
                  << ", ошибка: " << minter::utils::errnoToString(errno);
    }
    close(fd);
    return success;
}
} // namespace

namespace minter::utils {
bool ensureDirectoryExists(const std::filesystem::path &dir, bool createIfMissing)
{
    std::error_code ec;
    if (std::filesystem::exists(dir, ec)) {
        if (!std::filesystem::is_directory(dir, ec)) {
            LOG_ERROR << "Путь существует, но не является директорией: " << dir.string();
            return false;
        }
        return true;
    }
    if (ec) {
        LOG_ERROR << "Ошибка при проверке существования директории: " << dir.string()
                  << ", код ошибки: " << ec.value() << ", сообщение: " << ec.message();
        return false;
    }

    if (!createIfMissing) {
        LOG_DEBUG << "Директория не существует и не будет создана: " << dir.string();
        return false;
    }

    std::filesystem::create_directories(dir, ec);
    if (ec) {
        LOG_ERROR << "Ошибка при создании директории: " << dir.string()
                  << ", код ошибки: " << ec.value() << ", сообщение: " << ec.message();
        return false;
    }

    // create_directories возвращает false, если директорию успел создать другой поток
    if (!std::filesystem::is_directory(dir, ec)) {
        LOG_ERROR << "Не удалось создать директорию: " << dir.string();
        return false;
    }

    LOG_INFO << "Создана директория: " << dir.string();
    return true;
}

bool atomicFileWrite(const std::filesystem::path &filePath, const std::string &data)
{
    LOG_DEBUG << "Атомарная запись в файл: " << filePath.string()
              << ", размер данных: " << data.size();
    if (isExistingDirectory(filePath)) {
        LOG_ERROR << "Ошибка при атомарной записи: " << filePath.string()
                  << " - это директория, а не файл";
        return false;
    }

    FileLockGuard lock(filePath, LockMode::EXCLUSIVE);
    if (!lock.isLocked()) {
        LOG_ERROR << "Не удалось получить блокировку для файла: " << filePath.string();
        return false;
    }

    const auto parentDir = parentDirectory(filePath);
    if (!ensureDirectoryExists(parentDir)) {
        LOG_ERROR << "Не удалось обеспечить существование директории: " << parentDir.string();
        return false;
    }

    const auto tempFilePath = getTempFilePath(filePath);
    std::error_code ec;
    {
        std::ofstream outFile(tempFilePath, std::ios::binary | std::ios::trunc);
        if (!outFile) {
            LOG_ERROR << "Не удалось открыть временный файл для записи: " << tempFilePath.string();
            return false;
        }

        outFile.write(data.data(), static_cast<std::streamsize>(data.size()));
        outFile.flush();
        outFile.close();
        if (!outFile) {
            LOG_ERROR << "Не удалось записать данные во временный файл: " << tempFilePath.string();
            std::filesystem::remove(tempFilePath, ec);
            return false;
        }
    }

    std::filesystem::rename(tempFilePath, filePath, ec);
    if (ec) {
        // Некоторые ФС не умеют атомарно заменять файл: сохраняем копию и пробуем еще раз
        LOG_WARNING << "Атомарное переименование не сработало: " << filePath.string()
                    << ", сообщение: " << ec.message();

        std::optional<std::filesystem::path> backupPath;
        if (std::filesystem::exists(filePath)) {
            backupPath = createFileBackup(filePath);
            if (!backupPath.has_value()) {
                std::filesystem::remove(tempFilePath, ec);
                return false;
            }
            std::filesystem::remove(filePath, ec);
        }

        std::filesystem::rename(tempFilePath, filePath, ec);
        if (ec) {
            LOG_ERROR << "Ошибка при повторном переименовании временного файла: "
                      << tempFilePath.string() << ", сообщение: " << ec.message();
            if (backupPath.has_value()) {
                std::error_code restoreEc;
                std::filesystem::copy_file(*backupPath, filePath,
                                           std::filesystem::copy_options::overwrite_existing,
                                           restoreEc);
                if (restoreEc) {
                    LOG_CRITICAL << "Не удалось восстановить из резервной копии: "
                                 << backupPath->string() << ", сообщение: " << restoreEc.message();
                }
            }
            std::filesystem::remove(tempFilePath, ec);
            return false;
        }

        if (backupPath.has_value()) {
            std::filesystem::remove(*backupPath, ec);
        }
    }

    // После rename новое содержимое уже видно читателям, поэтому запись считается выполненной
    if (!syncDirectory(parentDir)) {
        LOG_WARNING << "Файл записан, но синхронизация директории не удалась: "
                    << filePath.string();
    }

    LOG_DEBUG << "Атомарная запись завершена: " << filePath.string();
    return true;
}

bool safeFileRead(const std::filesystem::path &filePath, std::string &data)
{
    LOG_DEBUG << "Безопасное чтение файла: " << filePath.string();

    if (isExistingDirectory(filePath)) {
        LOG_ERROR << "Ошибка при безопасном чтении: " << filePath.string()
                  << " - это директория, а не файл";
        return false;
    }

    FileLockGuard lock(filePath, LockMode::SHARED);
    if (!lock.isLocked()) {
        LOG_ERROR << "Не удалось получить блокировку для чтения файла: " << filePath.string();
        return false;
    }

    if (!isFileReadable(filePath)) {
        LOG_ERROR << "Файл не доступен для чтения: " << filePath.string();
        return false;
    }

    std::ifstream inFile(filePath, std::ios::binary | std::ios::ate);
    if (!inFile) {
        LOG_ERROR << "Не удалось открыть файл для чтения: " << filePath.string();
        return false;
    }

    const auto fileSize = inFile.tellg();
    if (fileSize < 0) {
        LOG_ERROR << "Ошибка при определении размера файла: " << filePath.string();
        return false;
    }

    const auto expectedSize = static_cast<std::streamsize>(fileSize);
    data.resize(static_cast<size_t>(expectedSize));
    inFile.seekg(0);
    inFile.read(data.data(), expectedSize);
    if (inFile.gcount() != expectedSize) {
        LOG_ERROR << "Ошибка при чтении: " << filePath.string() << ", прочитано "
                  << inFile.gcount() << " байт из " << fileSize << " ожидаемых";
        return false;
    }
    return true;
}

bool isFileReadable(const std::filesystem::path &filePath)
{
    std::error_code ec;
    if (!std::filesystem::exists(filePath, ec)) {
        if (ec) {
            LOG_ERROR << "Ошибка при проверке существования файла: " << filePath.string()
                      << ", код ошибки: " << ec.value() << ", сообщение: " << ec.message();
        }
        return false;
    }

    if (std::filesystem::is_directory(filePath, ec)) {
        return false;
    }

    std::ifstream testFile(filePath);
    return testFile.good();
}

std::optional<std::filesystem::path> createFileBackup(const std::filesystem::path &filePath)
{
    if (!isFileReadable(filePath)) {
        LOG_ERROR << "Не удается создать резервную копию: файл не доступен для чтения: "
                  << filePath.string();
        return std::nullopt;
    }

    const auto backupPath = getBackupFilePath(filePath);
    LOG_INFO << "Создание резервной копии: " << filePath.string() << " -> " << backupPath.string();

    std::error_code ec;
    std::filesystem::copy_file(filePath, backupPath,
                               std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        LOG_ERROR << "Ошибка при создании резервной копии: " << backupPath.string()
                  << ", код ошибки: " << ec.value() << ", сообщение: " << ec.message();
        return std::nullopt;
    }

    if (!syncDirectory(parentDirectory(filePath))) {
        LOG_WARNING << "Резервная копия создана, но синхронизация директории не удалась: "
                    << filePath.string();
        return std::nullopt;
    }
    return backupPath;
}
} // namespace minter::utils
