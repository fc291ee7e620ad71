#include "storage/file_counter_store.hpp"

#include "generator/errors.hpp"
#include "utils/file_lock_guard.hpp"
#include "utils/file_utils.hpp"
#include "utils/logger.hpp"

namespace minter {
namespace {
// Блокировка всей операции чтение-изменение-запись. Путь отличается от пути файла
// счетчиков, так как atomicFileWrite сам блокирует файл назначения.
class StoreLock {
public:
    explicit StoreLock(const std::filesystem::path &lockPath)
        : guard_(lockPath, utils::LockMode::EXCLUSIVE, utils::LockWaitStrategy::TIMEOUT)
    {
        if (!guard_.isLocked()) {
            throw StorageError("Не удалось заблокировать хранилище счетчиков: "
                               + lockPath.string());
        }
    }

private:
    utils::FileLockGuard guard_;
};

int64_t counterValue(const nlohmann::json &counters, const std::string &key)
{
    const auto &value = counters.at(key);
    if (!value.is_number_integer()) {
        throw StorageError("Некорректное значение счетчика " + key);
    }
    return value.get<int64_t>();
}
} // namespace

FileCounterStore::FileCounterStore(const std::filesystem::path &dataDir)
    : filePath_(dataDir / FILE_NAME)
    , lockPath_(dataDir / LOCK_NAME)
{
    if (!utils::ensureDirectoryExists(dataDir)) {
        throw StorageError("Не удалось подготовить директорию хранилища: " + dataDir.string());
    }
}

std::optional<int64_t> FileCounterStore::get(const std::string &key)
{
    std::lock_guard<std::mutex> lock(storeMutex_);
    StoreLock fileLock(lockPath_);

    const auto counters = load();
    if (!counters.contains(key)) {
        return std::nullopt;
    }
    return counterValue(counters, key);
}

void FileCounterStore::set(const std::string &key, int64_t value)
{
    std::lock_guard<std::mutex> lock(storeMutex_);
    StoreLock fileLock(lockPath_);

    auto counters = load();
    counters[key] = value;
    save(counters);
}

int64_t FileCounterStore::fetchAndIncrement(const std::string &key, int64_t start)
{
    std::lock_guard<std::mutex> lock(storeMutex_);
    StoreLock fileLock(lockPath_);

    auto counters = load();
    const auto current = counters.contains(key) ? counterValue(counters, key) : start;
    counters[key] = current + 1;
    save(counters);

    LOG_DEBUG << "Счетчик " << key << ": выдано значение " << current;
    return current;
}

nlohmann::json FileCounterStore::load() const
{
    std::error_code ec;
    if (!std::filesystem::exists(filePath_, ec)) {
        if (ec) {
            throw StorageError("Не удалось проверить файл счетчиков: " + ec.message());
        }
        return nlohmann::json::object();
    }

    std::string content;
    if (!utils::safeFileRead(filePath_, content)) {
        throw StorageError("Не удалось прочитать файл счетчиков: " + filePath_.string());
    }
    if (content.empty()) {
        return nlohmann::json::object();
    }

    try {
        auto counters = nlohmann::json::parse(content);
        if (!counters.is_object()) {
            throw StorageError("Файл счетчиков не содержит JSON-объект: " + filePath_.string());
        }
        return counters;
    }
    catch (const nlohmann::json::exception &e) {
        LOG_ERROR << "Файл счетчиков поврежден: " << filePath_.string() << ", " << e.what();
        throw StorageError("Файл счетчиков поврежден: " + std::string(e.what()));
    }
}

void FileCounterStore::save(const nlohmann::json &counters) const
{
    if (!utils::atomicFileWrite(filePath_, counters.dump(2))) {
        throw StorageError("Не удалось записать файл счетчиков: " + filePath_.string());
    }
}
} // namespace minter
