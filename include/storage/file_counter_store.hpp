#pragma once

#include <filesystem>
#include <mutex>

#include <nlohmann/json.hpp>

#include "storage/counter_store.hpp"

namespace minter {
/**
 * @class FileCounterStore
 * @brief Счетчики в JSON-файле `<dir>/sequences.json`
 *
 * Каждая операция выполняется под мьютексом процесса и эксклюзивной файловой
 * блокировкой, поэтому несколько процессов могут использовать одну директорию.
 * Файл перезаписывается атомарно. Повторных попыток при ошибках нет.
 */
class FileCounterStore : public CounterStore {
public:
    static constexpr char FILE_NAME[] = "sequences.json";
    static constexpr char LOCK_NAME[] = "sequences";

    /**
     * @param dataDir Директория хранилища, создается при необходимости
     * @throw StorageError если директорию не удалось создать
     */
    explicit FileCounterStore(const std::filesystem::path &dataDir);

    FileCounterStore(const FileCounterStore &) = delete;
    FileCounterStore &operator=(const FileCounterStore &) = delete;

    std::optional<int64_t> get(const std::string &key) override;
    void set(const std::string &key, int64_t value) override;
    int64_t fetchAndIncrement(const std::string &key, int64_t start) override;

    const std::filesystem::path &filePath() const
    {
        return filePath_;
    }

private:
    std::filesystem::path filePath_;
    std::filesystem::path lockPath_;
    std::mutex storeMutex_;

    nlohmann::json load() const;
    void save(const nlohmann::json &counters) const;
};
} // namespace minter
