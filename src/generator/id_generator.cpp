#include "generator/id_generator.hpp"

#include <regex>

#include "utils/digest.hpp"

namespace minter {
IdGenerator::IdGenerator(RandomSelector &random, StringGenerator &strings)
    : random_(random)
    , strings_(strings)
{
}

/**
 * Формат: [xxxxxxxx-xxxx-4xxx-Nxxx-xxxxxxxxxxxx]
 *  - 122 случайных бита
 *  - [4] - версия UUID v4 (старшие 4 бита байта 6)
 *  - [N] - вариант RFC 4122, значение из набора [8, 9, a, b] (старшие 2 бита байта 8)
 */
std::string IdGenerator::uuid()
{
    auto bytes = random_.bytes(16);
    bytes[6] = static_cast<char>((static_cast<uint8_t>(bytes[6]) & 0x0F) | 0x40);
    bytes[8] = static_cast<char>((static_cast<uint8_t>(bytes[8]) & 0x3F) | 0x80);

    const auto hex = utils::toHex(bytes);
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-"
        + hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

bool IdGenerator::isValidUuid(const std::string &uuid)
{
    // Регулярное выражение для проверки (регистр всех символов должен быть нижним)
    static const std::regex uuidRegex(
        R"(^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$)");

    return std::regex_match(uuid, uuidRegex);
}

std::string IdGenerator::key(const std::string &prefix, int length)
{
    return (prefix.empty() ? std::string("id") : prefix) + "_"
        + strings_.generate(length, KEY_ALPHABET);
}

std::string IdGenerator::shortId(int length)
{
    return strings_.generate(length, SHORT_ID_ALPHABET);
}
} // namespace minter
