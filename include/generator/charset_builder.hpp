#pragma once

#include <optional>
#include <set>
#include <string>

namespace minter {
/**
 * @class Charset
 * @brief Упорядоченный непустой набор символов, из которого выбираются случайные символы
 *
 * Порядок символов детерминирован для одинаковых параметров построения, поэтому
 * при фиксированном seed результат генерации воспроизводим. Пустой набор создать
 * нельзя: конструктор выбрасывает EmptyCharsetError.
 */
class Charset {
public:
    explicit Charset(std::string symbols);

    size_t size() const
    {
        return symbols_.size();
    }

    char at(size_t index) const
    {
        return symbols_[index];
    }

    bool contains(char symbol) const
    {
        return symbols_.find(symbol) != std::string::npos;
    }

    const std::string &str() const
    {
        return symbols_;
    }

private:
    std::string symbols_;
};

/**
 * @class CharsetBuilder
 * @brief Составляет наборы символов из флагов, пресетов и множеств исключений
 */
class CharsetBuilder {
public:
    static constexpr char LOWERCASE[] = "abcdefghijklmnopqrstuvwxyz";
    static constexpr char UPPERCASE[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ";
    static constexpr char DIGITS[] = "0123456789";
    static constexpr char HEX_DIGITS[] = "0123456789abcdef";

    /**
     * @brief Латинские буквы одного регистра, при необходимости цифры, минус исключения
     * @param uppercase Верхний регистр букв (иначе нижний)
     * @param includeDigits Добавить цифры 0-9 после букв
     * @param exclude Символы, которые нужно удалить (порядок остальных сохраняется)
     * @return Итоговый набор
     * @throw EmptyCharsetError если после исключений не осталось символов
     */
    static Charset build(bool uppercase, bool includeDigits, const std::set<char> &exclude = {});

    /**
     * @brief Именованный пресет: alnum, alpha, numeric, hex
     * @return Набор или std::nullopt, если пресет с таким именем не существует
     */
    static std::optional<Charset> preset(const std::string &name);

    /**
     * @brief Пресет по имени, иначе сама строка как произвольный алфавит
     *
     * Повторы в произвольном алфавите не удаляются и смещают распределение.
     * @throw EmptyCharsetError для пустой строки
     */
    static Charset resolve(const std::string &nameOrLiteral);
};
} // namespace minter
