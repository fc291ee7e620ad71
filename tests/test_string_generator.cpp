#include <gtest/gtest.h>
#include <string>

#include "generator/errors.hpp"
#include "generator/string_generator.hpp"
#include "testing_utils.hpp"

namespace minter::tests {
class StringGeneratorTest : public ::testing::Test {
protected:
    RandomSelector random;
    StringGenerator strings{ random };
};

// Длина и принадлежность символов набору
TEST_F(StringGeneratorTest, StringTestPresetMembership)
{
    for (const auto *name : { "alnum", "alpha", "numeric", "hex" }) {
        const auto charset = CharsetBuilder::resolve(name);
        for (size_t i = 0; i < 200; i++) {
            const auto result = strings.generate(24, name);
            ASSERT_EQ(24U, result.size());
            for (const auto symbol : result) {
                EXPECT_TRUE(charset.contains(symbol)) << name << ": " << symbol;
            }
        }
    }
}

// Произвольный алфавит
TEST_F(StringGeneratorTest, StringTestLiteralCharset)
{
    const auto result = strings.generate(64, "xyz");
    EXPECT_EQ(64U, result.size());
    EXPECT_EQ(std::string::npos, result.find_first_not_of("xyz"));

    // Алфавит из одного символа
    EXPECT_EQ("qqqq", strings.generate(4, "q"));
}

// Некорректные аргументы
TEST_F(StringGeneratorTest, StringTestInvalidArguments)
{
    EXPECT_THROW(strings.generate(0), InvalidRangeError);
    EXPECT_THROW(strings.generate(-1, "alnum"), InvalidRangeError);
    EXPECT_THROW(strings.generate(8, ""), EmptyCharsetError);
}

// Некриптостойкий режим и деградация основного источника
TEST_F(StringGeneratorTest, StringTestInsecureAndDegraded)
{
    const auto insecure = strings.generate(32, "alnum", false);
    EXPECT_EQ(32U, insecure.size());

    auto degraded = makeDegradedSelector();
    StringGenerator degradedStrings(*degraded);
    const auto result = degradedStrings.generate(32, "numeric");
    EXPECT_EQ(32U, result.size());
    EXPECT_EQ(std::string::npos, result.find_first_not_of("0123456789"));
}
} // namespace minter::tests
