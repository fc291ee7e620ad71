#pragma once

#include <chrono>
#include <string>

#include "utils/time_utils.hpp"

namespace minter {
/**
 * @class NonceService
 * @brief Создает значения, привязанные к действию и текущему временному окну
 */
class NonceService {
public:
    virtual ~NonceService() = default;

    /**
     * @brief Значение, привязанное к действию
     * @param action Произвольное наименование действия
     */
    virtual std::string createBinding(const std::string &action) = 0;
};

/**
 * @class HmacNonceService
 * @brief Привязки на основе HMAC-SHA-256 от секрета, номера временного окна и действия
 *
 * Время жизни делится на два окна: привязка, созданная в текущем окне, проверяется
 * с результатом 1, созданная в предыдущем окне - с результатом 2.
 */
class HmacNonceService : public NonceService {
public:
    static constexpr size_t BINDING_LENGTH = 10;

    /**
     * @param secret Секрет процесса
     * @param lifetime Время жизни привязки, не меньше 2 секунд
     * @param clock Источник текущего времени
     * @throw InvalidRangeError при lifetime < 2 секунд
     */
    HmacNonceService(std::string secret, std::chrono::seconds lifetime,
                     utils::Clock clock = utils::currentUnixTime);

    std::string createBinding(const std::string &action) override;

    /**
     * @brief Проверяет привязку для действия
     * @return 1 - текущее окно, 2 - предыдущее окно, 0 - привязка недействительна
     */
    int verify(const std::string &nonce, const std::string &action) const;

private:
    std::string secret_;
    std::chrono::seconds lifetime_;
    utils::Clock clock_;

    long long tick() const;
    std::string bindingForTick(long long tick, const std::string &action) const;
};
} // namespace minter
