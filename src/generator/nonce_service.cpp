#include "generator/nonce_service.hpp"

#include "generator/errors.hpp"
#include "utils/digest.hpp"

namespace minter {
HmacNonceService::HmacNonceService(std::string secret, std::chrono::seconds lifetime,
                                   utils::Clock clock)
    : secret_(std::move(secret))
    , lifetime_(lifetime)
    , clock_(std::move(clock))
{
    if (lifetime_.count() < 2) {
        throw InvalidRangeError("Время жизни привязки должно быть не меньше 2 секунд");
    }
}

std::string HmacNonceService::createBinding(const std::string &action)
{
    return bindingForTick(tick(), action);
}

int HmacNonceService::verify(const std::string &nonce, const std::string &action) const
{
    if (nonce.empty()) {
        return 0;
    }

    const auto current = tick();
    if (utils::constantTimeEquals(bindingForTick(current, action), nonce)) {
        return 1;
    }
    if (utils::constantTimeEquals(bindingForTick(current - 1, action), nonce)) {
        return 2;
    }
    return 0;
}

long long HmacNonceService::tick() const
{
    const auto half = static_cast<long long>(lifetime_.count() / 2);
    const auto now = static_cast<long long>(clock_());
    // ceil(now / half) для неотрицательного времени
    return (now + half - 1) / half;
}

std::string HmacNonceService::bindingForTick(long long tick, const std::string &action) const
{
    const auto hash = utils::hmacSha256Hex(secret_, std::to_string(tick) + "|" + action);
    return hash.substr(hash.size() - 12, BINDING_LENGTH);
}
} // namespace minter
