#pragma once

#include <set>
#include <string>

#include "generator/string_generator.hpp"

namespace minter {
/**
 * @struct CodeOptions
 * @brief Параметры составного кода (купоны, коды подтверждения и т.п.)
 */
struct CodeOptions {
    int length = 4; // Длина одного сегмента
    int segments = 1; // Количество сегментов
    std::string separator; // Разделитель между сегментами
    bool uppercase = true; // Регистр букв
    bool numbers = true; // Добавлять цифры 0-9
    std::set<char> exclude = { '0', 'O', '1', 'I' }; // Визуально похожие символы
    std::string prefix; // Добавляется перед кодом как есть
    std::string suffix; // Добавляется после кода как есть

    /**
     * @throw InvalidRangeError при length < 1 или segments < 1
     */
    void validate() const;
};

/**
 * @class CodeComposer
 * @brief Собирает код вида `prefix + seg (separator seg)* + suffix`
 *
 * Итоговая длина: len(prefix) + segments*length + (segments-1)*len(separator) + len(suffix).
 */
class CodeComposer {
public:
    explicit CodeComposer(StringGenerator &strings);

    /**
     * @throw InvalidRangeError при некорректных параметрах
     * @throw EmptyCharsetError если исключения удалили все символы
     */
    std::string code(const CodeOptions &options);

private:
    StringGenerator &strings_;
};
} // namespace minter
