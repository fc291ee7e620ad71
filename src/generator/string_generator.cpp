#include "generator/string_generator.hpp"

#include "generator/errors.hpp"

namespace minter {
StringGenerator::StringGenerator(RandomSelector &random)
    : random_(random)
{
}

std::string StringGenerator::generate(int length, const std::string &charset, bool secure)
{
    return generate(length, CharsetBuilder::resolve(charset), secure);
}

std::string StringGenerator::generate(int length, const Charset &charset, bool secure)
{
    if (length <= 0) {
        throw InvalidRangeError("Длина строки должна быть положительной, получено: "
                                + std::to_string(length));
    }

    const auto size = static_cast<int>(charset.size());
    std::string result;
    result.reserve(static_cast<size_t>(length));
    for (int i = 0; i < length; i++) {
        result.push_back(charset.at(static_cast<size_t>(random_.uniform(size, secure))));
    }
    return result;
}
} // namespace minter
