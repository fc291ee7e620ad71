#include <gtest/gtest.h>
#include <regex>
#include <set>
#include <string>

#include "generator/code_composer.hpp"
#include "generator/errors.hpp"

namespace minter::tests {
class CodeComposerTest : public ::testing::Test {
protected:
    RandomSelector random;
    StringGenerator strings{ random };
    CodeComposer composer{ strings };
};

// Параметры по умолчанию: 4 символа без визуально похожих
TEST_F(CodeComposerTest, CodeTestDefaults)
{
    static const std::regex codeRegex("^[A-HJ-NP-Z2-9]{4}$");
    for (size_t i = 0; i < 1000; i++) {
        const auto code = composer.code({});
        EXPECT_TRUE(std::regex_match(code, codeRegex)) << code;
    }
}

// Четыре сегмента по четыре символа через дефис
TEST_F(CodeComposerTest, CodeTestSegments)
{
    static const std::regex codeRegex("^[A-HJ-NP-Z2-9]{4}(-[A-HJ-NP-Z2-9]{4}){3}$");

    CodeOptions options;
    options.segments = 4;
    options.separator = "-";
    for (size_t i = 0; i < 1000; i++) {
        const auto code = composer.code(options);
        EXPECT_TRUE(std::regex_match(code, codeRegex)) << code;
    }
}

// Без исключений используется полный набор из 36 символов
TEST_F(CodeComposerTest, CodeTestSegmentsFullCharset)
{
    static const std::regex codeRegex("^[A-Z0-9]{4}(-[A-Z0-9]{4}){3}$");

    CodeOptions options;
    options.segments = 4;
    options.separator = "-";
    options.exclude = {};

    std::set<char> seen;
    for (size_t i = 0; i < 1000; i++) {
        const auto code = composer.code(options);
        EXPECT_TRUE(std::regex_match(code, codeRegex)) << code;
        for (const auto symbol : code) {
            if (symbol != '-') {
                seen.insert(symbol);
            }
        }
    }
    // 16000 выборок: каждый из 36 символов встречается, включая 0, O, 1, I
    EXPECT_EQ(36U, seen.size());
}

// Итоговая длина: prefix + segments*length + (segments-1)*separator + suffix
TEST_F(CodeComposerTest, CodeTestLengthFormula)
{
    for (int segments = 1; segments <= 5; segments++) {
        for (int length = 1; length <= 6; length++) {
            CodeOptions options;
            options.length = length;
            options.segments = segments;
            options.separator = "::";
            options.prefix = "PRE-";
            options.suffix = "-S";

            const auto code = composer.code(options);
            const auto expected = options.prefix.size() + static_cast<size_t>(segments * length)
                + static_cast<size_t>(segments - 1) * options.separator.size()
                + options.suffix.size();
            EXPECT_EQ(expected, code.size());
            EXPECT_EQ(0U, code.find("PRE-"));
            EXPECT_EQ(code.size() - 2, code.rfind("-S"));
        }
    }
}

// Нижний регистр без цифр
TEST_F(CodeComposerTest, CodeTestLowercaseWithoutNumbers)
{
    CodeOptions options;
    options.length = 12;
    options.uppercase = false;
    options.numbers = false;
    options.exclude = {};

    const auto code = composer.code(options);
    EXPECT_TRUE(std::regex_match(code, std::regex("^[a-z]{12}$"))) << code;
}

// Некорректные параметры
TEST_F(CodeComposerTest, CodeTestInvalidOptions)
{
    CodeOptions options;
    options.length = 0;
    EXPECT_THROW(composer.code(options), InvalidRangeError);

    options.length = 4;
    options.segments = 0;
    EXPECT_THROW(composer.code(options), InvalidRangeError);

    // Исключены все символы
    options.segments = 1;
    options.numbers = false;
    options.exclude.clear();
    for (char c = 'A'; c <= 'Z'; c++) {
        options.exclude.insert(c);
    }
    EXPECT_THROW(composer.code(options), EmptyCharsetError);

    // Нижний регистр без цифр, исключены все строчные буквы
    options.uppercase = false;
    options.exclude.clear();
    for (char c = 'a'; c <= 'z'; c++) {
        options.exclude.insert(c);
    }
    EXPECT_THROW(composer.code(options), EmptyCharsetError);
}
} // namespace minter::tests
