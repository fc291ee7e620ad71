#pragma once

#include <filesystem>
#include <string>

namespace minter {
/**
 * @brief Загружает секрет из `<dir>/secret.key` или создает его
 *
 * Новый секрет - 32 криптостойких байта в hex (64 символа), файл создается с
 * правами 0600.
 * @param dataDir Директория хранилища
 * @return Секрет
 * @throw StorageError если файл не удалось прочитать или создать, либо он некорректен
 * @throw SecureSourceUnavailable если криптостойкий источник недоступен
 */
std::string loadOrCreateSecret(const std::filesystem::path &dataDir);

/**
 * @brief Случайный секрет на время жизни процесса
 */
std::string generateEphemeralSecret();
} // namespace minter
