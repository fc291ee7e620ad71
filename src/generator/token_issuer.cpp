#include "generator/token_issuer.hpp"

#include <limits>

#include "generator/errors.hpp"
#include "utils/digest.hpp"
#include "utils/logger.hpp"

namespace minter {
TokenIssuer::TokenIssuer(RandomSelector &random, StringGenerator &strings, NonceService &nonces,
                         std::string secret, utils::Clock clock)
    : random_(random)
    , strings_(strings)
    , nonces_(nonces)
    , secret_(std::move(secret))
    , clock_(std::move(clock))
{
}

std::string TokenIssuer::token(int length, const std::string &bindingKey, TokenFormat format)
{
    if (length <= 0) {
        throw InvalidRangeError("Длина токена должна быть положительной, получено: "
                                + std::to_string(length));
    }
    if (length < MIN_TOKEN_LENGTH) {
        LOG_DEBUG << "Длина токена " << length << " увеличена до " << MIN_TOKEN_LENGTH;
        length = MIN_TOKEN_LENGTH;
    }

    if (format == TokenFormat::HEX) {
        return hexToken(length);
    }

    auto randomPart = strings_.generate(length, "alnum", true);
    if (bindingKey.empty()) {
        return randomPart;
    }

    const auto binding = nonces_.createBinding(bindingKey);
    const auto raw = randomPart + "|" + binding + "|" + std::to_string(clock_());
    return expandHash(raw, static_cast<size_t>(length));
}

TokenRecord TokenIssuer::magicToken(long long expiresIn, const std::string &context, int length)
{
    if (expiresIn < 0) {
        throw InvalidRangeError("Срок действия не может быть отрицательным, получено: "
                                + std::to_string(expiresIn));
    }
    if (length <= 0) {
        throw InvalidRangeError("Длина токена должна быть положительной, получено: "
                                + std::to_string(length));
    }

    const auto now = clock_();
    if (now > 0 && expiresIn > std::numeric_limits<std::time_t>::max() - now) {
        throw InvalidRangeError("Срок действия слишком велик: " + std::to_string(expiresIn));
    }

    TokenRecord record;
    record.expiresAt = now + static_cast<std::time_t>(expiresIn);
    const auto expires = utils::formatUtcDateTime(record.expiresAt);
    if (!expires.has_value()) {
        throw InvalidRangeError("Срок действия не представим в виде даты: "
                                + std::to_string(expiresIn));
    }
    record.expires = *expires;
    record.context = context;

    const auto bytes = random_.secureBytes(static_cast<size_t>(length));
    if (bytes.has_value()) {
        record.token = utils::toHex(*bytes);
    }
    else {
        LOG_WARNING << "Токен ссылки сгенерирован некриптостойким источником";
        record.token = strings_.generate(length * 2, "alnum", false);
    }

    return record;
}

std::string TokenIssuer::hexToken(int length)
{
    const auto byteCount = static_cast<size_t>((length + 1) / 2);
    const auto bytes = random_.secureBytes(byteCount);
    if (bytes.has_value()) {
        return utils::toHex(*bytes).substr(0, static_cast<size_t>(length));
    }

    LOG_WARNING << "Токен сгенерирован из некриптостойкого пароля";
    const auto password = strings_.generate(length, "alnum", false);
    return expandHash(password, static_cast<size_t>(length));
}

std::string TokenIssuer::expandHash(const std::string &data, size_t length) const
{
    // Один HMAC дает 64 hex-символа, для более длинных токенов добавляем номер блока
    auto result = utils::hmacSha256Hex(secret_, data);
    for (size_t block = 1; result.size() < length; block++) {
        result += utils::hmacSha256Hex(secret_, data + "|" + std::to_string(block));
    }
    return result.substr(0, length);
}

TokenFormat parseTokenFormat(const std::string &name)
{
    if (name == "alnum") {
        return TokenFormat::ALNUM;
    }
    if (name == "hex") {
        return TokenFormat::HEX;
    }
    throw InvalidRangeError("Неизвестный формат токена: " + name);
}
} // namespace minter
