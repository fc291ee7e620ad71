#include "generator/code_composer.hpp"

#include "generator/errors.hpp"
#include "utils/logger.hpp"

namespace minter {
void CodeOptions::validate() const
{
    if (length < 1) {
        throw InvalidRangeError("Длина сегмента должна быть не меньше 1, получено: "
                                + std::to_string(length));
    }
    if (segments < 1) {
        throw InvalidRangeError("Количество сегментов должно быть не меньше 1, получено: "
                                + std::to_string(segments));
    }
}

CodeComposer::CodeComposer(StringGenerator &strings)
    : strings_(strings)
{
}

std::string CodeComposer::code(const CodeOptions &options)
{
    options.validate();
    const auto charset = CharsetBuilder::build(options.uppercase, options.numbers, options.exclude);

    std::string result = options.prefix;
    for (int i = 0; i < options.segments; i++) {
        if (i > 0) {
            result += options.separator;
        }
        result += strings_.generate(options.length, charset);
    }
    result += options.suffix;

    LOG_DEBUG << "Сгенерирован код из " << options.segments << " сегментов по "
              << options.length << " символов, набор: " << charset.size() << " символов";
    return result;
}
} // namespace minter
