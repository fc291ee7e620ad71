#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>

namespace minter {
/**
 * @class RandomSource
 * @brief Источник случайных байтов с явным признаком доступности
 *
 * Недоступность источника сообщается возвращаемым значением, а не исключением:
 * решение о переходе на резервный источник принимает RandomSelector.
 */
class RandomSource {
public:
    virtual ~RandomSource() = default;

    /**
     * @brief Заполняет буфер случайными байтами
     * @return false, если источник недоступен (содержимое буфера не определено)
     */
    virtual bool randomBytes(uint8_t *buffer, size_t size) = 0;

    /**
     * @brief Является ли источник криптостойким
     */
    virtual bool isSecure() const = 0;

    /**
     * @brief Равномерно распределенное число из [0, n)
     *
     * Используется отбраковка: 32-битные значения меньше 2^32 mod n отбрасываются,
     * оставшийся диапазон делится на n нацело, поэтому остаток от деления не смещен.
     * @return Число или std::nullopt, если источник недоступен
     * @throw InvalidRangeError при n <= 0
     */
    std::optional<int> uniform(int n);
};

/**
 * @class SecureRandomSource
 * @brief Криптостойкий источник на основе OpenSSL RAND_bytes
 */
class SecureRandomSource : public RandomSource {
public:
    bool randomBytes(uint8_t *buffer, size_t size) override;
    bool isSecure() const override
    {
        return true;
    }
};

/**
 * @class WeakRandomSource
 * @brief Некриптостойкий источник (Mersenne Twister), доступен всегда
 *
 * Используется как резервный при недоступности криптостойкого источника и
 * для вызовов, явно отказавшихся от криптостойкости.
 */
class WeakRandomSource : public RandomSource {
public:
    /**
     * @brief Источник с seed из std::random_device
     */
    WeakRandomSource();

    /**
     * @brief Источник с фиксированным seed (воспроизводимая последовательность)
     */
    explicit WeakRandomSource(uint32_t seed);

    bool randomBytes(uint8_t *buffer, size_t size) override;
    bool isSecure() const override
    {
        return false;
    }

private:
    std::mt19937 engine_;
    std::mutex engineMutex_;
};

/**
 * @class RandomSelector
 * @brief Двухуровневый выбор источника случайности
 *
 * Основной источник (криптостойкий) используется всегда, когда доступен.
 * Резервный используется только если основной сообщил о недоступности, либо
 * если вызывающий явно попросил некриптостойкий результат.
 */
class RandomSelector {
public:
    /**
     * @brief SecureRandomSource в качестве основного и WeakRandomSource в качестве резервного
     */
    RandomSelector();

    RandomSelector(std::unique_ptr<RandomSource> primary, std::unique_ptr<RandomSource> fallback);

    RandomSelector(const RandomSelector &) = delete;
    RandomSelector &operator=(const RandomSelector &) = delete;

    /**
     * @brief Равномерное число из [0, n)
     * @param n Размер диапазона
     * @param secure false - сразу резервный источник
     * @throw InvalidRangeError при n <= 0
     * @throw SecureSourceUnavailable если недоступен и резервный источник
     */
    int uniform(int n, bool secure = true);

    /**
     * @brief Случайные байты с переходом на резервный источник при необходимости
     */
    std::string bytes(size_t count);

    /**
     * @brief Случайные байты только из основного источника
     * @return Байты или std::nullopt, если основной источник недоступен
     */
    std::optional<std::string> secureBytes(size_t count);

private:
    std::unique_ptr<RandomSource> primary_;
    std::unique_ptr<RandomSource> fallback_;
    std::atomic<bool> fallbackReported_{ false };

    void reportFallback();
};
} // namespace minter
