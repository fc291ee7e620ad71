#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace minter {
/**
 * @class CounterStore
 * @brief Хранилище именованных счетчиков с атомарным чтением и увеличением
 *
 * Ошибки чтения и записи выбрасываются как StorageError.
 */
class CounterStore {
public:
    virtual ~CounterStore() = default;

    /**
     * @brief Текущее значение счетчика или std::nullopt, если счетчика нет
     */
    virtual std::optional<int64_t> get(const std::string &key) = 0;

    /**
     * @brief Устанавливает значение счетчика
     */
    virtual void set(const std::string &key, int64_t value) = 0;

    /**
     * @brief Атомарно возвращает текущее значение и сохраняет значение + 1
     * @param key Имя счетчика
     * @param start Значение для отсутствующего счетчика
     * @return Значение до увеличения
     */
    virtual int64_t fetchAndIncrement(const std::string &key, int64_t start) = 0;
};

/**
 * @class MemoryCounterStore
 * @brief Счетчики в памяти процесса (теряются при завершении)
 */
class MemoryCounterStore : public CounterStore {
public:
    std::optional<int64_t> get(const std::string &key) override;
    void set(const std::string &key, int64_t value) override;
    int64_t fetchAndIncrement(const std::string &key, int64_t start) override;

private:
    std::mutex countersMutex_;
    std::unordered_map<std::string, int64_t> counters_;
};
} // namespace minter
