#include "generator/charset_builder.hpp"

#include "generator/errors.hpp"
#include "utils/logger.hpp"

namespace minter {
Charset::Charset(std::string symbols)
    : symbols_(std::move(symbols))
{
    if (symbols_.empty()) {
        throw EmptyCharsetError("Набор символов пуст");
    }
}

Charset CharsetBuilder::build(bool uppercase, bool includeDigits, const std::set<char> &exclude)
{
    std::string symbols = uppercase ? UPPERCASE : LOWERCASE;
    if (includeDigits) {
        symbols += DIGITS;
    }

    std::string filtered;
    filtered.reserve(symbols.size());
    for (const auto symbol : symbols) {
        if (exclude.count(symbol) == 0) {
            filtered.push_back(symbol);
        }
    }

    if (filtered.empty()) {
        LOG_ERROR << "После исключения " << exclude.size() << " символов набор оказался пустым";
        throw EmptyCharsetError("Набор символов пуст после применения исключений");
    }
    return Charset(std::move(filtered));
}

std::optional<Charset> CharsetBuilder::preset(const std::string &name)
{
    if (name == "alnum") {
        return Charset(std::string(LOWERCASE) + UPPERCASE + DIGITS);
    }
    if (name == "alpha") {
        return Charset(std::string(LOWERCASE) + UPPERCASE);
    }
    if (name == "numeric") {
        return Charset(DIGITS);
    }
    if (name == "hex") {
        return Charset(HEX_DIGITS);
    }
    return std::nullopt;
}

Charset CharsetBuilder::resolve(const std::string &nameOrLiteral)
{
    auto charset = preset(nameOrLiteral);
    if (charset.has_value()) {
        return std::move(*charset);
    }
    return Charset(nameOrLiteral);
}
} // namespace minter
