#include "storage/counter_store.hpp"

namespace minter {
std::optional<int64_t> MemoryCounterStore::get(const std::string &key)
{
    std::lock_guard<std::mutex> lock(countersMutex_);
    const auto it = counters_.find(key);
    if (it == counters_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MemoryCounterStore::set(const std::string &key, int64_t value)
{
    std::lock_guard<std::mutex> lock(countersMutex_);
    counters_[key] = value;
}

int64_t MemoryCounterStore::fetchAndIncrement(const std::string &key, int64_t start)
{
    std::lock_guard<std::mutex> lock(countersMutex_);
    auto it = counters_.try_emplace(key, start).first;
    return it->second++;
}
} // namespace minter
