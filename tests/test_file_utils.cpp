#include <gtest/gtest.h>
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

#include "testing_utils.hpp"
#include "utils/file_lock_guard.hpp"
#include "utils/file_utils.hpp"

namespace minter::tests {
class FileUtilsTest : public ::testing::Test {
protected:
    std::filesystem::path testDir; // Путь к тестовой директории

    void SetUp() override
    {
        testDir = createTmpDirectory("FileUtils");
    }

    void TearDown() override
    {
        removeTmpDirectory(testDir);
    }

    /**
     * @brief Считывает файл без блокировок
     */
    static std::string readFile(const std::filesystem::path &path)
    {
        std::ifstream file(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    }
};

// Создание вложенных директорий и обработка пути, занятого файлом
TEST_F(FileUtilsTest, EnsureDirectoryExists)
{
    const auto nested = testDir / "a" / "b" / "c";
    EXPECT_FALSE(utils::ensureDirectoryExists(nested, false));
    EXPECT_FALSE(std::filesystem::exists(nested));

    EXPECT_TRUE(utils::ensureDirectoryExists(nested));
    EXPECT_TRUE(std::filesystem::is_directory(nested));
    // Повторный вызов для существующей директории
    EXPECT_TRUE(utils::ensureDirectoryExists(nested));

    const auto filePath = testDir / "file";
    std::ofstream(filePath) << "content";
    EXPECT_FALSE(utils::ensureDirectoryExists(filePath));
}

// Атомарная запись создает и перезаписывает файл без временных остатков
TEST_F(FileUtilsTest, AtomicFileWriteOverwrite)
{
    const auto filePath = testDir / "data.json";

    EXPECT_TRUE(utils::atomicFileWrite(filePath, "{\"a\": 1}"));
    EXPECT_EQ("{\"a\": 1}", readFile(filePath));

    EXPECT_TRUE(utils::atomicFileWrite(filePath, ""));
    EXPECT_EQ("", readFile(filePath));

    const std::string binary("\x00\x01\xff\n\r", 5);
    EXPECT_TRUE(utils::atomicFileWrite(filePath, binary));
    EXPECT_EQ(binary, readFile(filePath));

    // В директории остаются только файл и его lock-файл
    std::vector<std::string> names;
    for (const auto &entry : std::filesystem::directory_iterator(testDir)) {
        names.push_back(entry.path().filename().string());
    }
    std::sort(names.begin(), names.end());
    EXPECT_EQ((std::vector<std::string>{ "data.json", "data.json.lock" }), names);
}

// Запись в путь, являющийся директорией, и в новую директорию
TEST_F(FileUtilsTest, AtomicFileWriteTargets)
{
    EXPECT_FALSE(utils::atomicFileWrite(testDir, "content"));

    const auto filePath = testDir / "new" / "dir" / "file";
    EXPECT_TRUE(utils::atomicFileWrite(filePath, "content"));
    EXPECT_EQ("content", readFile(filePath));
}

// Директорию без права чтения нельзя открыть для fsync, но rename в ней проходит
TEST_F(FileUtilsTest, AtomicFileWriteWithoutDirectorySync)
{
    if (geteuid() == 0) {
        GTEST_SKIP() << "root игнорирует права доступа к директории";
    }

    const auto dir = testDir / "write_only";
    ASSERT_TRUE(utils::ensureDirectoryExists(dir));
    const auto filePath = dir / "counters.json";
    ASSERT_TRUE(utils::atomicFileWrite(filePath, "old"));

    std::filesystem::permissions(dir,
                                 std::filesystem::perms::owner_write
                                     | std::filesystem::perms::owner_exec,
                                 std::filesystem::perm_options::replace);

    const auto written = utils::atomicFileWrite(filePath, "new");
    const auto content = readFile(filePath);
    std::filesystem::permissions(dir, std::filesystem::perms::owner_all,
                                 std::filesystem::perm_options::replace);

    // Результат совпадает с тем, что видят читатели
    EXPECT_TRUE(written);
    EXPECT_EQ("new", content);
}

// Запись отклоняется, пока файл эксклюзивно заблокирован тем же потоком
TEST_F(FileUtilsTest, AtomicFileWriteUnderOwnLock)
{
    const auto filePath = testDir / "file";
    utils::FileLockGuard lock(filePath);
    ASSERT_TRUE(lock.isLocked());

    EXPECT_FALSE(utils::atomicFileWrite(filePath, "content"));
    EXPECT_FALSE(std::filesystem::exists(filePath));
}

// Чтение существующего, пустого и отсутствующего файла
TEST_F(FileUtilsTest, SafeFileRead)
{
    const auto filePath = testDir / "file";
    std::string data = "stale";

    EXPECT_FALSE(utils::safeFileRead(filePath, data));
    EXPECT_FALSE(utils::safeFileRead(testDir, data));

    std::ofstream(filePath) << "line 1\nline 2";
    EXPECT_TRUE(utils::safeFileRead(filePath, data));
    EXPECT_EQ("line 1\nline 2", data);

    std::ofstream(filePath, std::ios::trunc).close();
    EXPECT_TRUE(utils::safeFileRead(filePath, data));
    EXPECT_TRUE(data.empty());
}

// Читатели видят либо старое, либо новое содержимое целиком
TEST_F(FileUtilsTest, AtomicFileWriteWithConcurrentReaders)
{
    const auto filePath = testDir / "file";
    const std::string first(4096, 'a');
    const std::string second(8192, 'b');
    ASSERT_TRUE(utils::atomicFileWrite(filePath, first));

    auto writer = std::async(std::launch::async, [&]() {
        for (size_t i = 0; i < 50; i++) {
            EXPECT_TRUE(utils::atomicFileWrite(filePath, (i % 2 == 0) ? second : first));
        }
    });

    std::vector<std::future<void>> readers;
    for (size_t r = 0; r < 4; r++) {
        readers.push_back(std::async(std::launch::async, [&]() {
            for (size_t i = 0; i < 50; i++) {
                std::string data;
                ASSERT_TRUE(utils::safeFileRead(filePath, data));
                EXPECT_TRUE(data == first || data == second);
                // Пауза дает писателю возможность получить эксклюзивную блокировку
                std::this_thread::sleep_for(std::chrono::milliseconds(2));
            }
        }));
    }

    writer.get();
    for (auto &reader : readers) {
        reader.get();
    }
}

// Проверка доступности файла для чтения
TEST_F(FileUtilsTest, IsFileReadable)
{
    const auto filePath = testDir / "file";
    EXPECT_FALSE(utils::isFileReadable(filePath));
    EXPECT_FALSE(utils::isFileReadable(testDir));

    std::ofstream(filePath) << "content";
    EXPECT_TRUE(utils::isFileReadable(filePath));
}

// Резервная копия содержит те же данные и не заменяет предыдущие копии
TEST_F(FileUtilsTest, CreateFileBackup)
{
    const auto filePath = testDir / "file";
    EXPECT_FALSE(utils::createFileBackup(filePath).has_value());

    std::ofstream(filePath) << "content";
    const auto first = utils::createFileBackup(filePath);
    const auto second = utils::createFileBackup(filePath);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());

    EXPECT_NE(*first, *second);
    EXPECT_EQ("content", readFile(*first));
    EXPECT_EQ("content", readFile(*second));
    EXPECT_EQ(0U, first->filename().string().find("file.backup."));
}
} // namespace minter::tests
