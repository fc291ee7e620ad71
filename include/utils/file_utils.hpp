#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace minter::utils {
/**
 * @brief Проверяет существование директории и создает её (и все родительские директории) при
 * необходимости
 * @param dir Путь к директории
 * @param createIfMissing Создавать директорию, если отсутствует
 * @return true, если директория существует или была успешно создана
 */
bool ensureDirectoryExists(const std::filesystem::path &dir, bool createIfMissing = true);

/**
 * @brief Атомарно записывает данные в файл (через временный файл и rename)
 *
 * Ошибка синхронизации директории после rename только логируется: новое
 * содержимое к этому моменту уже заменило старое.
 * @param filePath Путь к файлу назначения
 * @param data Данные для записи
 * @return true, если новое содержимое записано в файл
 */
bool atomicFileWrite(const std::filesystem::path &filePath, const std::string &data);

/**
 * @brief Считывает все содержимое файла под разделяемой блокировкой
 * @param filePath Путь к файлу для чтения
 * @param[out] data Буфер для сохранения прочитанных данных
 * @return true, если чтение выполнено успешно
 */
bool safeFileRead(const std::filesystem::path &filePath, std::string &data);

/**
 * @brief Проверяет, существует ли файл и доступен ли для чтения
 */
bool isFileReadable(const std::filesystem::path &filePath);

/**
 * @brief Создаёт резервную копию файла с временной меткой в имени
 * @param filePath Путь к файлу для резервного копирования
 * @return Путь к созданной резервной копии или пустое значение в случае ошибки
 */
std::optional<std::filesystem::path> createFileBackup(const std::filesystem::path &filePath);
} // namespace minter::utils
