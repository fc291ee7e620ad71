#include "generator/sequence_counter.hpp"

#include <cctype>

#include "generator/errors.hpp"

namespace minter {
SequenceCounter::SequenceCounter(CounterStore &store)
    : store_(store)
{
}

int64_t SequenceCounter::next(const std::string &context, int64_t start)
{
    return store_.fetchAndIncrement(storageKey(context), start);
}

std::string SequenceCounter::sequentialId(const std::string &prefix, int padding,
                                          const std::string &context, int64_t start)
{
    if (padding < 0) {
        throw InvalidRangeError("Ширина дополнения не может быть отрицательной, получено: "
                                + std::to_string(padding));
    }

    auto digits = std::to_string(next(context, start));
    if (digits.size() < static_cast<size_t>(padding)) {
        digits.insert(0, static_cast<size_t>(padding) - digits.size(), '0');
    }
    return prefix + digits;
}

std::string SequenceCounter::storageKey(const std::string &context)
{
    std::string sanitized;
    sanitized.reserve(context.size());
    for (const auto symbol : context) {
        const auto lower = static_cast<char>(std::tolower(static_cast<unsigned char>(symbol)));
        if ((lower >= 'a' && lower <= 'z') || (lower >= '0' && lower <= '9') || lower == '_'
            || lower == '-') {
            sanitized.push_back(lower);
        }
    }
    return "seq_" + (sanitized.empty() ? std::string("default") : sanitized);
}
} // namespace minter
