#pragma once

#include <chrono>
#include <filesystem>

namespace minter::utils {
/**
 * @enum LockMode
 * @brief Режимы блокировки
 */
enum class LockMode {
    EXCLUSIVE, // Эксклюзивная блокировка
    SHARED, // Разделяемая блокировка
};

/**
 * @enum LockWaitStrategy
 * @brief Стратегии ожидания при попытке получения блокировки
 */
enum class LockWaitStrategy {
    STANDARD, // Бесконечное ожидание
    INSTANTLY, // Немедленный возврат при невозможности блокировки
    TIMEOUT, // Ожидание с таймаутом
};

/**
 * @class FileLockGuard
 * @brief Автоматически управляет блокировкой файла.
 *
 * Блокировка действует одновременно между потоками текущего процесса (через
 * общий реестр блокировок) и между процессами (через flock() на файле
 * `<путь>.lock`). Захватывается в конструкторе, освобождается в деструкторе.
 *
 * Файл `<путь>.lock` после освобождения не удаляется: удаление открывает окно,
 * в котором два процесса держат flock() на разных inode одного и того же пути.
 */
class FileLockGuard {
public:
    /**
     * @brief Конструктор, создает и захватывает блокировку
     * @param filePath Путь к файлу, который нужно заблокировать
     * @param mode Режим блокировки (EXCLUSIVE или SHARED)
     * @param waitStrategy Стратегия ожидания
     * @param timeout Таймаут ожидания (для LockWaitStrategy::TIMEOUT)
     */
    explicit FileLockGuard(const std::filesystem::path &filePath,
                           LockMode mode = LockMode::EXCLUSIVE,
                           LockWaitStrategy waitStrategy = LockWaitStrategy::TIMEOUT,
                           std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

    ~FileLockGuard();

    FileLockGuard(const FileLockGuard &) = delete;
    FileLockGuard &operator=(const FileLockGuard &) = delete;
    FileLockGuard(FileLockGuard &&) = delete;
    FileLockGuard &operator=(FileLockGuard &&) = delete;

    /**
     * @brief Проверяет, была ли блокировка успешно захвачена
     * @return true, если блокировка успешно захвачена
     */
    bool isLocked() const;

    /**
     * @brief Явно освобождает блокировку
     * @return true, если блокировка успешно освобождена
     */
    bool release();

    /**
     * @brief Пытается захватить блокировку файла
     * @param filePath Путь к блокируемому файлу
     * @param mode Режим блокировки
     * @param waitStrategy Стратегия ожидания
     * @param timeout Таймаут ожидания
     * @return true, если блокировка успешно захвачена
     */
    static bool
    acquireFileLock(const std::filesystem::path &filePath, LockMode mode = LockMode::EXCLUSIVE,
                    LockWaitStrategy waitStrategy = LockWaitStrategy::TIMEOUT,
                    std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

    /**
     * @brief Освобождает ранее захваченную блокировку
     * @param filePath Путь к заблокированному файлу
     * @return true, если блокировка успешно освобождена
     */
    static bool releaseFileLock(const std::filesystem::path &filePath);

    /**
     * @brief Путь к файлу блокировки для указанного файла
     */
    static std::filesystem::path lockFilePath(const std::filesystem::path &filePath);

private:
    const std::filesystem::path originalLockPath_;
    bool locked_;
};
} // namespace minter::utils
