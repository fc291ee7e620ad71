#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace minter::utils {
/**
 * @brief Кодирует байты в шестнадцатеричную строку (нижний регистр)
 */
std::string toHex(const uint8_t *data, size_t size);
std::string toHex(const std::string &bytes);

/**
 * @brief HMAC-SHA-256 от данных с указанным ключом, результат в hex (64 символа)
 */
std::string hmacSha256Hex(const std::string &key, const std::string &data);

/**
 * @brief Сравнение строк за время, не зависящее от позиции первого различия
 */
bool constantTimeEquals(const std::string &lhs, const std::string &rhs);
} // namespace minter::utils
