#pragma once

#include <string>

#include "generator/random_source.hpp"
#include "generator/string_generator.hpp"

namespace minter {
/**
 * @class IdGenerator
 * @brief Генерирует UUID v4, ключи с префиксом и короткие идентификаторы для URL
 */
class IdGenerator {
public:
    static constexpr char KEY_ALPHABET[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    // Без визуально похожих символов 0, O, 1, I, l
    static constexpr char SHORT_ID_ALPHABET[]
        = "abcdefghijkmnopqrstuvwxyzABCDEFGHJKLMNPQRSTUVWXYZ23456789";

    IdGenerator(RandomSelector &random, StringGenerator &strings);

    /**
     * @brief UUID версии 4 (RFC 4122) в нижнем регистре
     */
    std::string uuid();

    /**
     * @brief Проверяет формат UUID v4 (только нижний регистр)
     */
    static bool isValidUuid(const std::string &uuid);

    /**
     * @brief Ключ вида `prefix_xxxxxxxxx`
     * @param prefix Префикс, пустой заменяется на "id"
     * @param length Длина случайной части
     * @throw InvalidRangeError при length <= 0
     */
    std::string key(const std::string &prefix = "id", int length = 9);

    /**
     * @brief Короткий идентификатор для URL
     * @throw InvalidRangeError при length <= 0
     */
    std::string shortId(int length = 7);

private:
    RandomSelector &random_;
    StringGenerator &strings_;
};
} // namespace minter
