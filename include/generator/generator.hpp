#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "generator/code_composer.hpp"
#include "generator/id_generator.hpp"
#include "generator/nonce_service.hpp"
#include "generator/random_source.hpp"
#include "generator/sequence_counter.hpp"
#include "generator/slug_generator.hpp"
#include "generator/string_generator.hpp"
#include "generator/token_issuer.hpp"
#include "storage/counter_store.hpp"
#include "utils/time_utils.hpp"

namespace minter {
/**
 * @struct GeneratorConfig
 * @brief Параметры генератора
 */
struct GeneratorConfig {
    std::string secret; // Ключ для HMAC токенов и привязок
    std::chrono::seconds nonceLifetime = std::chrono::hours(24);
    utils::Clock clock = utils::currentUnixTime;
};

/**
 * @class Generator
 * @brief Точка входа: владеет источниками случайности, хранилищем счетчиков и всеми генераторами
 */
class Generator {
public:
    /**
     * @param config Параметры
     * @param store Хранилище счетчиков последовательностей
     * @param random Источники случайности (по умолчанию OpenSSL + mt19937)
     */
    Generator(GeneratorConfig config, std::unique_ptr<CounterStore> store,
              std::unique_ptr<RandomSelector> random = std::make_unique<RandomSelector>());

    Generator(const Generator &) = delete;
    Generator &operator=(const Generator &) = delete;
    Generator(Generator &&) = delete;
    Generator &operator=(Generator &&) = delete;

    std::string code(const CodeOptions &options = {})
    {
        return codes_.code(options);
    }

    std::string string(int length = 16, const std::string &charset = "alnum", bool secure = true)
    {
        return strings_.generate(length, charset, secure);
    }

    std::string token(int length = 32, const std::string &bindingKey = "",
                      TokenFormat format = TokenFormat::ALNUM)
    {
        return tokens_.token(length, bindingKey, format);
    }

    TokenRecord magicToken(long long expiresIn = 86400, const std::string &context = "",
                           int length = 32)
    {
        return tokens_.magicToken(expiresIn, context, length);
    }

    std::string uuid()
    {
        return ids_.uuid();
    }

    std::string key(const std::string &prefix = "id", int length = 9)
    {
        return ids_.key(prefix, length);
    }

    std::string shortId(int length = 7)
    {
        return ids_.shortId(length);
    }

    std::string sequentialId(const std::string &prefix = "", int padding = 8,
                             const std::string &context = "default",
                             int64_t start = SequenceCounter::DEFAULT_START)
    {
        return sequences_.sequentialId(prefix, padding, context, start);
    }

    std::string slug(const std::string &title, const std::string &context = "post",
                     const std::string &type = "post") const
    {
        return slugs_.slug(title, context, type);
    }

    /**
     * @brief Подключает проверки занятости slug. Не потокобезопасно относительно slug().
     */
    void setSlugChecks(SlugChecks checks)
    {
        slugs_.setChecks(std::move(checks));
    }

    HmacNonceService &nonces()
    {
        return nonces_;
    }

    SequenceCounter &sequences()
    {
        return sequences_;
    }

private:
    std::unique_ptr<CounterStore> store_;
    std::unique_ptr<RandomSelector> random_;
    StringGenerator strings_;
    CodeComposer codes_;
    HmacNonceService nonces_;
    TokenIssuer tokens_;
    SequenceCounter sequences_;
    IdGenerator ids_;
    SlugGenerator slugs_;
};
} // namespace minter
