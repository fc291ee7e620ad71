#include "utils/file_lock_guard.hpp"

#include <cerrno>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include "utils/compiler.hpp"
#include "utils/file_utils.hpp"
#include "utils/logger.hpp"

namespace {
// Информация о блокировке, захваченной текущим процессом
struct LockInfo {
    int fd; // Дескриптор lock-файла
    minter::utils::LockMode mode; // Режим блокировки
    std::thread::id threadId; // Поток, захвативший блокировку
    size_t refCount; // Счетчик ссылок для разделяемых блокировок
};

// Реестр блокировок текущего процесса: путь к lock-файлу -> информация о блокировке
std::unordered_map<std::string, LockInfo> fileLockMap;
std::mutex fileLockMutex;

const char *getLockModeString(minter::utils::LockMode mode)
{
    switch (mode) {
    case minter::utils::LockMode::EXCLUSIVE:
        return "EXCLUSIVE";
    case minter::utils::LockMode::SHARED:
        return "SHARED";
    default:
        UNREACHABLE("Unsupported LockMode");
    }
}

/**
 * @brief Приостанавливает блокировку мьютекса
 * @param lock Обертка над мьютексом с блокировкой
 * @param pause Время паузы (в миллисекундах)
 */
void pauseLock(std::unique_lock<std::mutex> &lock, size_t pause = 2)
{
    lock.unlock();
    std::this_thread::sleep_for(std::chrono::milliseconds(pause));
    lock.lock();
}

/**
 * @brief Истекло ли время ожидания для выбранной стратегии
 */
bool waitExpired(minter::utils::LockWaitStrategy strategy,
                 std::chrono::steady_clock::time_point startTime, std::chrono::milliseconds timeout)
{
    switch (strategy) {
    case minter::utils::LockWaitStrategy::STANDARD:
        return false;
    case minter::utils::LockWaitStrategy::INSTANTLY:
        return true;
    case minter::utils::LockWaitStrategy::TIMEOUT:
        return std::chrono::steady_clock::now() - startTime >= timeout;
    default:
        UNREACHABLE("Unsupported LockWaitStrategy");
    }
}
} // namespace

namespace minter::utils {
FileLockGuard::FileLockGuard(const std::filesystem::path &filePath, LockMode mode,
                             LockWaitStrategy waitStrategy, std::chrono::milliseconds timeout)
    : originalLockPath_(filePath)
    , locked_(acquireFileLock(originalLockPath_, mode, waitStrategy, timeout))
{
}

FileLockGuard::~FileLockGuard()
{
    if (locked_) {
        release();
    }
}

bool FileLockGuard::isLocked() const
{
    return locked_;
}

bool FileLockGuard::release()
{
    if (!locked_) {
        return false;
    }

    const auto result = releaseFileLock(originalLockPath_);
    if (result) {
        locked_ = false;
    }
    return result;
}

std::filesystem::path FileLockGuard::lockFilePath(const std::filesystem::path &filePath)
{
    return std::filesystem::path(filePath.string() + ".lock");
}

bool FileLockGuard::acquireFileLock(const std::filesystem::path &filePath, LockMode mode,
                                    LockWaitStrategy waitStrategy,
                                    std::chrono::milliseconds timeout)
{
    LOG_DEBUG << "Попытка получения блокировки: " << filePath.string()
              << ", режим: " << getLockModeString(mode);

    const auto parentDir = filePath.parent_path();
    if (!parentDir.empty() && !ensureDirectoryExists(parentDir)) {
        LOG_ERROR << "Не удалось обеспечить существование директории для файла блокировки: "
                  << parentDir.string();
        return false;
    }

    const auto lockPath = lockFilePath(filePath);
    const auto lockPathStr = lockPath.string();
    const auto currentThreadId = std::this_thread::get_id();
    const auto startTime = std::chrono::steady_clock::now();

    std::unique_lock<std::mutex> lock(fileLockMutex);

    // Сначала разбираемся с блокировками внутри текущего процесса
    while (true) {
        auto it = fileLockMap.find(lockPathStr);
        if (it == fileLockMap.end()) {
            break;
        }

        auto &info = it->second;
        if (mode == LockMode::SHARED && info.mode == LockMode::SHARED) {
            info.refCount++;
            LOG_DEBUG << "Увеличен счетчик ссылок для разделяемой блокировки: "
                      << filePath.string() << ", новое значение: " << info.refCount;
            return true;
        }

        if (info.threadId == currentThreadId) {
            LOG_ERROR << "Попытка повторного захвата блокировки в том же потоке: "
                      << filePath.string() << ". Это привело бы к deadlock";
            return false;
        }

        if (waitExpired(waitStrategy, startTime, timeout)) {
            LOG_WARNING << "Блокировка уже захвачена другим потоком: " << filePath.string();
            return false;
        }
        pauseLock(lock);
    }

    // Затем захватываем flock(), который разделяется с другими процессами
    const auto fd = open(lockPath.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0666);
    if (fd == -1) {
        LOG_ERROR << "Не удалось открыть файл блокировки: " << lockPathStr
                  << ", ошибка: " << errnoToString(errno);
        return false;
    }

    const int lockType = (mode == LockMode::EXCLUSIVE) ? LOCK_EX : LOCK_SH;
    while (flock(fd, lockType | LOCK_NB) != 0) {
        if (errno != EWOULDBLOCK && errno != EINTR) {
            LOG_ERROR << "Не удалось получить блокировку: " << lockPathStr
                      << ", ошибка: " << errnoToString(errno);
            close(fd);
            return false;
        }

        if (waitExpired(waitStrategy, startTime, timeout)) {
            LOG_WARNING << "Таймаут ожидания блокировки: " << lockPathStr;
            close(fd);
            return false;
        }
        pauseLock(lock);
    }

    // Пока мьютекс был отпущен, другой поток мог зарегистрировать ту же разделяемую блокировку
    auto existing = fileLockMap.find(lockPathStr);
    if (existing != fileLockMap.end()) {
        flock(fd, LOCK_UN);
        close(fd);
        if (mode == LockMode::SHARED && existing->second.mode == LockMode::SHARED) {
            existing->second.refCount++;
            return true;
        }
        LOG_ERROR << "Конфликт блокировок внутри процесса: " << lockPathStr;
        return false;
    }

    if (mode == LockMode::EXCLUSIVE) {
        // Информация о владельце нужна только для диагностики
        const std::string lockInfo
            = "PID: " + std::to_string(getpid())
              + " ThreadID: " + std::to_string(std::hash<std::thread::id>{}(currentThreadId))
              + "\n";
        if (ftruncate(fd, 0) != 0 || write(fd, lockInfo.c_str(), lockInfo.size()) == -1) {
            LOG_WARNING << "Не удалось записать информацию в файл блокировки: " << lockPathStr
                        << ", ошибка: " << errnoToString(errno);
        }
    }

    fileLockMap.emplace(lockPathStr, LockInfo{ fd, mode, currentThreadId, 1 });

    LOG_DEBUG << "Получена блокировка: " << lockPathStr << ", режим: " << getLockModeString(mode);
    return true;
}

bool FileLockGuard::releaseFileLock(const std::filesystem::path &filePath)
{
    const auto lockPathStr = lockFilePath(filePath).string();
    LOG_DEBUG << "Освобождение блокировки: " << lockPathStr;

    std::lock_guard<std::mutex> guard(fileLockMutex);

    auto it = fileLockMap.find(lockPathStr);
    if (it == fileLockMap.end()) {
        LOG_WARNING << "Попытка освободить несуществующую блокировку: " << lockPathStr;
        return false;
    }

    auto &info = it->second;
    if (info.mode == LockMode::SHARED && info.refCount > 1) {
        info.refCount--;
        return true;
    }

    if (info.mode == LockMode::EXCLUSIVE && info.threadId != std::this_thread::get_id()) {
        LOG_ERROR << "Попытка освободить блокировку из другого потока: " << lockPathStr;
        return false;
    }

    if (flock(info.fd, LOCK_UN) != 0) {
        LOG_ERROR << "Ошибка при снятии блокировки: " << lockPathStr
                  << ", ошибка: " << errnoToString(errno);
        return false;
    }

    if (close(info.fd) != 0) {
        // flock() уже снят, поэтому блокировку считаем освобожденной
        LOG_WARNING << "Ошибка при закрытии файлового дескриптора: " << lockPathStr
                    << ", ошибка: " << errnoToString(errno);
    }

    fileLockMap.erase(it);
    LOG_DEBUG << "Блокировка освобождена: " << lockPathStr;
    return true;
}
} // namespace minter::utils
