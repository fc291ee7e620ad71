#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <future>
#include <thread>
#include <vector>

#include "testing_utils.hpp"
#include "utils/file_lock_guard.hpp"

namespace {
constexpr auto SHORT_TIMEOUT = std::chrono::milliseconds(100);
} // namespace

namespace minter::tests {
class FileLockGuardTest : public ::testing::Test {
protected:
    std::filesystem::path testDir; // Путь к тестовой директории
    std::filesystem::path filePath; // Блокируемый файл

    void SetUp() override
    {
        testDir = createTmpDirectory("FileLockGuard");
        filePath = testDir / "counters";
    }

    void TearDown() override
    {
        removeTmpDirectory(testDir);
    }
};

// Захват и освобождение блокировки, lock-файл остается на месте
TEST_F(FileLockGuardTest, LockTestBasicAcquireRelease)
{
    const auto lockPath = utils::FileLockGuard::lockFilePath(filePath);
    EXPECT_EQ(filePath.string() + ".lock", lockPath.string());

    {
        utils::FileLockGuard lock(filePath);
        EXPECT_TRUE(lock.isLocked());
        EXPECT_TRUE(std::filesystem::exists(lockPath));
    }

    // Удаление lock-файла приводило бы к гонке между процессами
    EXPECT_TRUE(std::filesystem::exists(lockPath));

    // После освобождения блокировку можно захватить снова
    utils::FileLockGuard lock(filePath, utils::LockMode::EXCLUSIVE,
                              utils::LockWaitStrategy::INSTANTLY);
    EXPECT_TRUE(lock.isLocked());
}

// Явное освобождение и повторный вызов release()
TEST_F(FileLockGuardTest, LockTestExplicitRelease)
{
    utils::FileLockGuard lock(filePath);
    EXPECT_TRUE(lock.isLocked());

    EXPECT_TRUE(lock.release());
    EXPECT_FALSE(lock.isLocked());
    EXPECT_FALSE(lock.release());
}

// Повторный захват в том же потоке отклоняется вместо deadlock
TEST_F(FileLockGuardTest, LockTestSameThreadRelock)
{
    utils::FileLockGuard first(filePath);
    ASSERT_TRUE(first.isLocked());

    utils::FileLockGuard second(filePath, utils::LockMode::EXCLUSIVE,
                                utils::LockWaitStrategy::STANDARD);
    EXPECT_FALSE(second.isLocked());

    utils::FileLockGuard shared(filePath, utils::LockMode::SHARED);
    EXPECT_FALSE(shared.isLocked());

    EXPECT_TRUE(first.isLocked());
}

// Разделяемые блокировки совместимы между собой и несовместимы с эксклюзивной
TEST_F(FileLockGuardTest, LockTestSharedMode)
{
    utils::FileLockGuard first(filePath, utils::LockMode::SHARED);
    utils::FileLockGuard second(filePath, utils::LockMode::SHARED);
    EXPECT_TRUE(first.isLocked());
    EXPECT_TRUE(second.isLocked());

    auto exclusive = std::async(std::launch::async, [this]() {
        utils::FileLockGuard lock(filePath, utils::LockMode::EXCLUSIVE,
                                  utils::LockWaitStrategy::TIMEOUT, SHORT_TIMEOUT);
        return lock.isLocked();
    });
    EXPECT_FALSE(exclusive.get());

    // Одна ссылка освобождена, вторая все еще держит блокировку
    EXPECT_TRUE(first.release());
    exclusive = std::async(std::launch::async, [this]() {
        utils::FileLockGuard lock(filePath, utils::LockMode::EXCLUSIVE,
                                  utils::LockWaitStrategy::INSTANTLY);
        return lock.isLocked();
    });
    EXPECT_FALSE(exclusive.get());

    EXPECT_TRUE(second.release());
    exclusive = std::async(std::launch::async, [this]() {
        utils::FileLockGuard lock(filePath, utils::LockMode::EXCLUSIVE,
                                  utils::LockWaitStrategy::INSTANTLY);
        return lock.isLocked();
    });
    EXPECT_TRUE(exclusive.get());
}

// Стратегии ожидания: INSTANTLY не ждет, TIMEOUT ждет не меньше таймаута
TEST_F(FileLockGuardTest, LockTestWaitStrategies)
{
    utils::FileLockGuard lock(filePath);
    ASSERT_TRUE(lock.isLocked());

    auto instantly = std::async(std::launch::async, [this]() {
        utils::FileLockGuard other(filePath, utils::LockMode::EXCLUSIVE,
                                   utils::LockWaitStrategy::INSTANTLY);
        return other.isLocked();
    });
    EXPECT_FALSE(instantly.get());

    auto timeout = std::async(std::launch::async, [this]() {
        const auto start = std::chrono::steady_clock::now();
        utils::FileLockGuard other(filePath, utils::LockMode::EXCLUSIVE,
                                   utils::LockWaitStrategy::TIMEOUT, SHORT_TIMEOUT);
        const auto elapsed = std::chrono::steady_clock::now() - start;
        EXPECT_GE(elapsed, SHORT_TIMEOUT);
        return other.isLocked();
    });
    EXPECT_FALSE(timeout.get());

    // STANDARD дожидается освобождения
    std::atomic<bool> acquired{ false };
    auto standard = std::async(std::launch::async, [this, &acquired]() {
        utils::FileLockGuard other(filePath, utils::LockMode::EXCLUSIVE,
                                   utils::LockWaitStrategy::STANDARD);
        acquired = other.isLocked();
    });
    std::this_thread::sleep_for(SHORT_TIMEOUT);
    EXPECT_FALSE(acquired);
    EXPECT_TRUE(lock.release());
    standard.get();
    EXPECT_TRUE(acquired);
}

// Эксклюзивную блокировку нельзя освободить из другого потока
TEST_F(FileLockGuardTest, LockTestReleaseFromOtherThread)
{
    utils::FileLockGuard lock(filePath);
    ASSERT_TRUE(lock.isLocked());

    auto future = std::async(std::launch::async, [this]() {
        return utils::FileLockGuard::releaseFileLock(filePath);
    });
    EXPECT_FALSE(future.get());

    EXPECT_TRUE(lock.isLocked());
    EXPECT_TRUE(lock.release());
}

// Недостающие директории создаются, недоступные - приводят к ошибке
TEST_F(FileLockGuardTest, LockTestDirectories)
{
    utils::FileLockGuard nested(testDir / "a" / "b" / "file");
    EXPECT_TRUE(nested.isLocked());

    const auto blocker = testDir / "blocker";
    {
        utils::FileLockGuard lock(blocker);
        ASSERT_TRUE(lock.isLocked());
    }
    // Родитель является файлом, директорию создать нельзя
    utils::FileLockGuard invalid(utils::FileLockGuard::lockFilePath(blocker) / "file");
    EXPECT_FALSE(invalid.isLocked());
}

// Эксклюзивная блокировка сериализует критическую секцию между потоками
TEST_F(FileLockGuardTest, LockTestConcurrentCriticalSection)
{
    constexpr size_t THREAD_COUNT = 8;
    constexpr size_t ITERATIONS = 50;

    std::atomic<int> inside{ 0 };
    std::atomic<bool> overlap{ false };
    size_t counter = 0;

    auto task = [&]() {
        for (size_t i = 0; i < ITERATIONS; i++) {
            utils::FileLockGuard lock(filePath, utils::LockMode::EXCLUSIVE,
                                      utils::LockWaitStrategy::STANDARD);
            ASSERT_TRUE(lock.isLocked());
            if (inside.fetch_add(1) != 0) {
                overlap = true;
            }
            counter++;
            inside.fetch_sub(1);
        }
    };

    std::vector<std::future<void>> futures;
    for (size_t i = 0; i < THREAD_COUNT; i++) {
        futures.push_back(std::async(std::launch::async, task));
    }
    for (auto &future : futures) {
        future.wait();
    }

    EXPECT_FALSE(overlap);
    EXPECT_EQ(THREAD_COUNT * ITERATIONS, counter);
}
} // namespace minter::tests
