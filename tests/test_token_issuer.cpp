#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <limits>
#include <regex>
#include <string>

#include "generator/errors.hpp"
#include "generator/nonce_service.hpp"
#include "generator/token_issuer.hpp"
#include "testing_utils.hpp"
#include "utils/time_utils.hpp"

namespace {
constexpr std::time_t FIXED_TIME = 1700000000; // 2023-11-14 22:13:20 UTC
const std::string SECRET = "0123456789abcdef0123456789abcdef0123456789abcdef0123456789abcdef";
} // namespace

namespace minter::tests {
class TokenIssuerTest : public ::testing::Test {
protected:
    std::atomic<std::time_t> now{ FIXED_TIME };
    utils::Clock clock = [this]() { return now.load(); };

    RandomSelector random;
    StringGenerator strings{ random };
    HmacNonceService nonces{ SECRET, std::chrono::hours(24), clock };
    TokenIssuer issuer{ random, strings, nonces, SECRET, clock };
};

// Токен по умолчанию: 32 символа alnum
TEST_F(TokenIssuerTest, TokenTestDefaultAlnum)
{
    static const std::regex tokenRegex("^[a-zA-Z0-9]{32}$");
    for (size_t i = 0; i < 100; i++) {
        EXPECT_TRUE(std::regex_match(issuer.token(), tokenRegex));
    }
}

// Шестнадцатеричный токен: ровно запрошенная длина, в том числе нечетная
TEST_F(TokenIssuerTest, TokenTestHex)
{
    EXPECT_TRUE(std::regex_match(issuer.token(16, "", TokenFormat::HEX),
                                 std::regex("^[0-9a-f]{16}$")));
    EXPECT_TRUE(std::regex_match(issuer.token(33, "", TokenFormat::HEX),
                                 std::regex("^[0-9a-f]{33}$")));
}

// Короткие длины увеличиваются до 8, неположительные отклоняются
TEST_F(TokenIssuerTest, TokenTestLengthClamping)
{
    EXPECT_EQ(8U, issuer.token(1).size());
    EXPECT_EQ(8U, issuer.token(7, "", TokenFormat::HEX).size());
    EXPECT_EQ(8U, issuer.token(5, "login").size());
    EXPECT_THROW(issuer.token(0), InvalidRangeError);
    EXPECT_THROW(issuer.token(-3, "", TokenFormat::HEX), InvalidRangeError);
}

// Токен с привязкой к действию: hex нужной длины, в том числе длиннее одного HMAC
TEST_F(TokenIssuerTest, TokenTestBound)
{
    EXPECT_TRUE(std::regex_match(issuer.token(32, "reset_password"), std::regex("^[0-9a-f]{32}$")));
    EXPECT_TRUE(std::regex_match(issuer.token(150, "reset_password"),
                                 std::regex("^[0-9a-f]{150}$")));
    // Случайная часть делает токены различными
    EXPECT_NE(issuer.token(32, "login"), issuer.token(32, "login"));
}

// Токен ссылки при фиксированном времени
TEST_F(TokenIssuerTest, MagicTokenTestFixedClock)
{
    const auto record = issuer.magicToken(3600, "login");
    EXPECT_TRUE(std::regex_match(record.token, std::regex("^[0-9a-f]{64}$")));
    EXPECT_EQ(FIXED_TIME + 3600, record.expiresAt);
    EXPECT_EQ("2023-11-14 23:13:20", record.expires);
    EXPECT_EQ("login", record.context);

    const auto defaults = issuer.magicToken();
    EXPECT_EQ(FIXED_TIME + 86400, defaults.expiresAt);
    EXPECT_EQ("2023-11-15 22:13:20", defaults.expires);
    EXPECT_EQ("", defaults.context);

    EXPECT_EQ(20U, issuer.magicToken(0, "", 10).token.size());
    EXPECT_EQ(FIXED_TIME, issuer.magicToken(0).expiresAt);
}

// Некорректные параметры токена ссылки
TEST_F(TokenIssuerTest, MagicTokenTestInvalidArguments)
{
    EXPECT_THROW(issuer.magicToken(-1), InvalidRangeError);
    EXPECT_THROW(issuer.magicToken(60, "", 0), InvalidRangeError);

    // Сумма с текущим временем переполняет time_t
    EXPECT_THROW(issuer.magicToken(std::numeric_limits<long long>::max(), "x"),
                 InvalidRangeError);
    // Переполнения нет, но год не помещается в std::tm
    EXPECT_THROW(issuer.magicToken(100000000000000000LL, "x"), InvalidRangeError);
    EXPECT_FALSE(utils::formatUtcDateTime(std::numeric_limits<std::time_t>::max()).has_value());

    // Граница, при которой дата еще форматируется
    const auto record = issuer.magicToken(253402300799LL - FIXED_TIME, "x");
    EXPECT_EQ("9999-12-31 23:59:59", record.expires);
}

// Деградация при недоступном криптостойком источнике
TEST_F(TokenIssuerTest, TokenTestDegradedSource)
{
    auto degraded = makeDegradedSelector();
    StringGenerator degradedStrings(*degraded);
    TokenIssuer degradedIssuer(*degraded, degradedStrings, nonces, SECRET, clock);

    // hex получается из HMAC некриптостойкого пароля
    EXPECT_TRUE(std::regex_match(degradedIssuer.token(16, "", TokenFormat::HEX),
                                 std::regex("^[0-9a-f]{16}$")));
    EXPECT_TRUE(std::regex_match(degradedIssuer.token(100, "", TokenFormat::HEX),
                                 std::regex("^[0-9a-f]{100}$")));

    // Токен ссылки - строка alnum двойной длины
    const auto record = degradedIssuer.magicToken(60, "", 16);
    EXPECT_TRUE(std::regex_match(record.token, std::regex("^[a-zA-Z0-9]{32}$")));
    EXPECT_EQ(FIXED_TIME + 60, record.expiresAt);
}

// Формат токена из строки
TEST_F(TokenIssuerTest, TokenTestParseFormat)
{
    EXPECT_EQ(TokenFormat::ALNUM, parseTokenFormat("alnum"));
    EXPECT_EQ(TokenFormat::HEX, parseTokenFormat("hex"));
    EXPECT_THROW(parseTokenFormat("base64"), InvalidRangeError);
}

// Привязка действительна в текущем и предыдущем окне
TEST_F(TokenIssuerTest, NonceTestVerify)
{
    const auto binding = nonces.createBinding("delete_post");
    EXPECT_EQ(HmacNonceService::BINDING_LENGTH, binding.size());
    EXPECT_TRUE(std::regex_match(binding, std::regex("^[0-9a-f]{10}$")));

    EXPECT_EQ(1, nonces.verify(binding, "delete_post"));
    EXPECT_EQ(0, nonces.verify(binding, "edit_post"));
    EXPECT_EQ(0, nonces.verify("", "delete_post"));
    EXPECT_NE(binding, nonces.createBinding("edit_post"));

    // Через половину времени жизни привязка относится к предыдущему окну
    now = FIXED_TIME + 12 * 3600;
    EXPECT_EQ(2, nonces.verify(binding, "delete_post"));

    // Через полное время жизни привязка недействительна
    now = FIXED_TIME + 24 * 3600;
    EXPECT_EQ(0, nonces.verify(binding, "delete_post"));
}

// Привязка зависит от секрета
TEST_F(TokenIssuerTest, NonceTestSecretDependency)
{
    HmacNonceService other("another secret", std::chrono::hours(24), clock);
    EXPECT_NE(nonces.createBinding("login"), other.createBinding("login"));
    EXPECT_THROW(HmacNonceService("s", std::chrono::seconds(1), clock), InvalidRangeError);
}
} // namespace minter::tests
