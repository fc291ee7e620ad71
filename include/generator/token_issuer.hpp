#pragma once

#include <ctime>
#include <string>

#include "generator/nonce_service.hpp"
#include "generator/random_source.hpp"
#include "generator/string_generator.hpp"
#include "utils/time_utils.hpp"

namespace minter {
/**
 * @enum TokenFormat
 * @brief Формат токена
 */
enum class TokenFormat {
    ALNUM, // Латинские буквы и цифры
    HEX, // Шестнадцатеричные цифры в нижнем регистре
};

/**
 * @struct TokenRecord
 * @brief Токен для одноразовой ссылки и его срок действия
 */
struct TokenRecord {
    std::string token;
    std::string expires; // UTC, "YYYY-MM-DD HH:MM:SS"
    std::time_t expiresAt = 0;
    std::string context;
};

/**
 * @class TokenIssuer
 * @brief Выпускает токены безопасности и токены одноразовых ссылок
 */
class TokenIssuer {
public:
    static constexpr int MIN_TOKEN_LENGTH = 8;

    TokenIssuer(RandomSelector &random, StringGenerator &strings, NonceService &nonces,
                std::string secret, utils::Clock clock = utils::currentUnixTime);

    /**
     * @brief Токен безопасности
     * @param length Длина результата; значения от 1 до 7 увеличиваются до 8
     * @param bindingKey Действие, к которому привязывается токен (только для ALNUM)
     * @param format Формат результата
     * @throw InvalidRangeError при length <= 0
     */
    std::string token(int length = 32, const std::string &bindingKey = "",
                      TokenFormat format = TokenFormat::ALNUM);

    /**
     * @brief Токен одноразовой ссылки со сроком действия
     * @param expiresIn Через сколько секунд токен истекает
     * @param context Назначение токена, возвращается без изменений
     * @param length Количество случайных байтов (длина токена - 2*length)
     * @throw InvalidRangeError при expiresIn < 0, length <= 0 или сроке, не представимом датой
     */
    TokenRecord magicToken(long long expiresIn = 86400, const std::string &context = "",
                           int length = 32);

private:
    RandomSelector &random_;
    StringGenerator &strings_;
    NonceService &nonces_;
    std::string secret_;
    utils::Clock clock_;

    std::string hexToken(int length);
    std::string expandHash(const std::string &data, size_t length) const;
};

/**
 * @brief Разбирает наименование формата ("alnum" или "hex")
 * @throw InvalidRangeError для неизвестного формата
 */
TokenFormat parseTokenFormat(const std::string &name);
} // namespace minter
