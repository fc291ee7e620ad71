#pragma once

#include <string>

#include "generator/charset_builder.hpp"
#include "generator/random_source.hpp"

namespace minter {
/**
 * @class StringGenerator
 * @brief Генерирует случайные строки из пресета или произвольного алфавита
 *
 * Каждый символ выбирается независимо и равномерно из набора.
 */
class StringGenerator {
public:
    explicit StringGenerator(RandomSelector &random);

    /**
     * @brief Случайная строка
     * @param length Длина строки
     * @param charset Имя пресета (alnum, alpha, numeric, hex) или сам алфавит
     * @param secure false - использовать некриптостойкий источник
     * @throw InvalidRangeError при length <= 0
     * @throw EmptyCharsetError при пустом алфавите
     */
    std::string generate(int length, const std::string &charset = "alnum", bool secure = true);

    std::string generate(int length, const Charset &charset, bool secure = true);

private:
    RandomSelector &random_;
};
} // namespace minter
