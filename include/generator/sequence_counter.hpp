#pragma once

#include <cstdint>
#include <string>

#include "storage/counter_store.hpp"

namespace minter {
/**
 * @class SequenceCounter
 * @brief Монотонные последовательности значений для именованных контекстов
 *
 * Значения хранятся в CounterStore под ключом `seq_<контекст>`, где контекст
 * приводится к нижнему регистру и очищается от символов вне [a-z0-9_-].
 */
class SequenceCounter {
public:
    static constexpr int64_t DEFAULT_START = 1000;

    explicit SequenceCounter(CounterStore &store);

    /**
     * @brief Следующее значение последовательности
     * @param context Имя последовательности
     * @param start Первое значение для новой последовательности
     * @throw StorageError при ошибке хранилища
     */
    int64_t next(const std::string &context = "default", int64_t start = DEFAULT_START);

    /**
     * @brief Следующее значение, дополненное нулями слева до padding цифр, с префиксом
     *
     * Значения длиннее padding не обрезаются.
     * @throw InvalidRangeError при padding < 0
     */
    std::string sequentialId(const std::string &prefix = "", int padding = 8,
                             const std::string &context = "default",
                             int64_t start = DEFAULT_START);

    /**
     * @brief Ключ хранилища для контекста
     */
    static std::string storageKey(const std::string &context);

private:
    CounterStore &store_;
};
} // namespace minter
