#pragma once

#include <stdexcept>
#include <string>

namespace minter {
/**
 * @class GeneratorError
 * @brief Базовое исключение для всех ошибок генерации
 */
class GeneratorError : public std::runtime_error {
public:
    explicit GeneratorError(const std::string &message)
        : std::runtime_error(message)
    {
    }
};

/**
 * @brief Набор символов пуст после применения исключений
 */
class EmptyCharsetError : public GeneratorError {
public:
    using GeneratorError::GeneratorError;
};

/**
 * @brief Запрошена неположительная длина или пустой диапазон
 */
class InvalidRangeError : public GeneratorError {
public:
    using GeneratorError::GeneratorError;
};

/**
 * @brief Недоступен ни криптостойкий, ни резервный источник случайности
 */
class SecureSourceUnavailable : public GeneratorError {
public:
    using GeneratorError::GeneratorError;
};

/**
 * @brief Ошибка чтения или записи хранилища счетчиков
 */
class StorageError : public GeneratorError {
public:
    using GeneratorError::GeneratorError;
};
} // namespace minter
