#include <gtest/gtest.h>
#include <set>
#include <string>

#include "generator/charset_builder.hpp"
#include "generator/errors.hpp"

namespace minter::tests {
// Визуально похожие символы исключаются с сохранением порядка
TEST(CharsetBuilderTest, CharsetTestDefaultCodeExclusions)
{
    const auto charset = CharsetBuilder::build(true, true, { '0', 'O', '1', 'I' });
    EXPECT_EQ("ABCDEFGHJKLMNPQRSTUVWXYZ23456789", charset.str());
    EXPECT_EQ(32U, charset.size());
}

// Регистр и цифры
TEST(CharsetBuilderTest, CharsetTestCaseAndDigits)
{
    EXPECT_EQ("abcdefghijklmnopqrstuvwxyz", CharsetBuilder::build(false, false).str());
    EXPECT_EQ("ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789", CharsetBuilder::build(true, true).str());

    // Исключения, отсутствующие в наборе, ни на что не влияют
    std::set<char> exclude = { 'A', '0', 'a' };
    for (char c = 'd'; c <= 'z'; c++) {
        exclude.insert(c);
    }
    EXPECT_EQ("bc", CharsetBuilder::build(false, false, exclude).str());
}

// Пустой набор после исключений
TEST(CharsetBuilderTest, CharsetTestEmptyAfterExclusion)
{
    std::set<char> everything;
    for (char c = 'A'; c <= 'Z'; c++) {
        everything.insert(c);
    }
    EXPECT_THROW(CharsetBuilder::build(true, false, everything), EmptyCharsetError);

    for (char c = '0'; c <= '9'; c++) {
        everything.insert(c);
    }
    EXPECT_THROW(CharsetBuilder::build(true, true, everything), EmptyCharsetError);
    EXPECT_THROW(CharsetBuilder::build(true, true, everything), GeneratorError);
}

// Пресеты и произвольные алфавиты
TEST(CharsetBuilderTest, CharsetTestPresets)
{
    EXPECT_EQ(62U, CharsetBuilder::resolve("alnum").size());
    EXPECT_EQ(52U, CharsetBuilder::resolve("alpha").size());
    EXPECT_EQ("0123456789", CharsetBuilder::resolve("numeric").str());
    EXPECT_EQ("0123456789abcdef", CharsetBuilder::resolve("hex").str());
    EXPECT_FALSE(CharsetBuilder::preset("unknown").has_value());

    // Неизвестное имя считается алфавитом, повторы сохраняются
    const auto literal = CharsetBuilder::resolve("aab");
    EXPECT_EQ("aab", literal.str());
    EXPECT_TRUE(literal.contains('b'));
    EXPECT_FALSE(literal.contains('c'));

    EXPECT_THROW(CharsetBuilder::resolve(""), EmptyCharsetError);
    EXPECT_THROW(Charset(""), EmptyCharsetError);
}
} // namespace minter::tests
