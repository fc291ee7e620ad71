#pragma once

#include <ctime>
#include <functional>
#include <optional>
#include <string>

namespace minter::utils {
/**
 * @brief Источник текущего времени (unix timestamp), подменяется в тестах
 */
using Clock = std::function<std::time_t()>;

/**
 * @brief Текущее время по системным часам
 */
std::time_t currentUnixTime();

/**
 * @brief Форматирует timestamp как UTC "YYYY-MM-DD HH:MM:SS"
 * @return std::nullopt, если год не представим в std::tm
 */
std::optional<std::string> formatUtcDateTime(std::time_t timestamp);
} // namespace minter::utils
