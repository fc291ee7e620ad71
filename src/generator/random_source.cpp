#include "generator/random_source.hpp"

#include <limits>

#include <openssl/err.h>
#include <openssl/rand.h>

#include "generator/errors.hpp"
#include "utils/logger.hpp"

namespace minter {
std::optional<int> RandomSource::uniform(int n)
{
    if (n <= 0) {
        throw InvalidRangeError("Размер диапазона должен быть положительным, получено: "
                                + std::to_string(n));
    }

    const auto range = static_cast<uint32_t>(n);
    // 2^32 mod n: значения ниже порога дали бы смещение в сторону младших остатков
    const auto threshold = static_cast<uint32_t>(-range) % range;

    while (true) {
        uint8_t raw[sizeof(uint32_t)];
        if (!randomBytes(raw, sizeof(raw))) {
            return std::nullopt;
        }

        uint32_t value = 0;
        for (const auto byte : raw) {
            value = (value << 8) | byte;
        }

        if (value >= threshold) {
            return static_cast<int>(value % range);
        }
    }
}

bool SecureRandomSource::randomBytes(uint8_t *buffer, size_t size)
{
    if (size == 0) {
        return true;
    }
    if (size > static_cast<size_t>(std::numeric_limits<int>::max())) {
        LOG_ERROR << "Запрошено слишком много случайных байтов: " << size;
        return false;
    }

    if (RAND_bytes(buffer, static_cast<int>(size)) != 1) {
        char message[256] = { 0 };
        ERR_error_string_n(ERR_get_error(), message, sizeof(message));
        LOG_ERROR << "Криптостойкий источник случайности недоступен: " << message;
        return false;
    }
    return true;
}

WeakRandomSource::WeakRandomSource()
    : engine_(std::random_device{}())
{
}

WeakRandomSource::WeakRandomSource(uint32_t seed)
    : engine_(seed)
{
}

bool WeakRandomSource::randomBytes(uint8_t *buffer, size_t size)
{
    std::lock_guard<std::mutex> lock(engineMutex_);
    for (size_t i = 0; i < size; i++) {
        // Каждый вызов mt19937 дает 32 равномерных бита, берем младший байт
        buffer[i] = static_cast<uint8_t>(engine_() & 0xFF);
    }
    return true;
}

RandomSelector::RandomSelector()
    : RandomSelector(std::make_unique<SecureRandomSource>(), std::make_unique<WeakRandomSource>())
{
}

RandomSelector::RandomSelector(std::unique_ptr<RandomSource> primary,
                               std::unique_ptr<RandomSource> fallback)
    : primary_(std::move(primary))
    , fallback_(std::move(fallback))
{
}

int RandomSelector::uniform(int n, bool secure)
{
    if (secure) {
        const auto value = primary_->uniform(n);
        if (value.has_value()) {
            return *value;
        }
        reportFallback();
    }

    const auto value = fallback_->uniform(n);
    if (!value.has_value()) {
        throw SecureSourceUnavailable("Недоступны все источники случайности");
    }
    return *value;
}

std::string RandomSelector::bytes(size_t count)
{
    auto result = secureBytes(count);
    if (result.has_value()) {
        return std::move(*result);
    }
    reportFallback();

    std::string buffer(count, '\0');
    if (!fallback_->randomBytes(reinterpret_cast<uint8_t *>(buffer.data()), count)) {
        throw SecureSourceUnavailable("Недоступны все источники случайности");
    }
    return buffer;
}

std::optional<std::string> RandomSelector::secureBytes(size_t count)
{
    std::string buffer(count, '\0');
    if (!primary_->randomBytes(reinterpret_cast<uint8_t *>(buffer.data()), count)) {
        return std::nullopt;
    }
    return buffer;
}

void RandomSelector::reportFallback()
{
    // Предупреждаем один раз, чтобы не засорять лог при каждом символе
    if (!fallbackReported_.exchange(true)) {
        LOG_WARNING << "Криптостойкий источник случайности недоступен, используется резервный "
                       "некриптостойкий источник";
    }
}
} // namespace minter
