#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "generator/token_issuer.hpp"

namespace minter::server {
/**
 * @enum CommandType
 * @brief Типы команд, принимаемых сервером
 */
enum class CommandType {
    CODE,
    STRING,
    TOKEN,
    MAGIC_TOKEN,
    UUID,
    KEY,
    SHORT_ID,
    SEQUENTIAL_ID,
    SLUG,
    PING,
    UNKNOWN,
};

/**
 * @struct Request
 * @brief Запрос клиента
 */
struct Request {
    std::string requestId;
    CommandType command = CommandType::UNKNOWN;
    nlohmann::json params = nlohmann::json::object(); // Аргументы команды по именам

    /**
     * @brief Десериализация запроса из JSON
     * @param jsonStr JSON-строка
     * @return Request или std::nullopt при ошибке
     */
    static std::optional<Request> fromJson(const std::string &jsonStr);

    /**
     * @brief Конвертация строкового представления команды в CommandType
     * @param cmdStr Строковое представление команды
     * @return Соответствующий CommandType
     */
    static CommandType stringToCommand(const std::string &cmdStr);
};

/**
 * @struct Response
 * @brief Ответ сервера
 */
struct Response {
    std::string requestId;
    bool success = false;
    nlohmann::json result; // Строка или объект, null при ошибке
    std::optional<std::string> error;

    /**
     * @brief Сериализация ответа в JSON
     * @return JSON-строка
     */
    std::string toJson() const;
};

/**
 * @brief Представление токена ссылки в виде JSON-объекта
 */
nlohmann::json tokenRecordToJson(const TokenRecord &record);

/**
 * @brief Класс для работы с форматом сообщений по протоколу
 *
 * Формат: [4 байта длины сообщения][JSON-сообщение]
 */
class ProtocolFrame {
public:
    static constexpr size_t HEADER_SIZE = sizeof(uint32_t);

    /**
     * @brief Обертывание JSON-сообщения в фрейм протокола
     * @param jsonMessage Сообщение в формате JSON
     * @return Байты фрейма протокола
     */
    static std::vector<uint8_t> wrapMessage(const std::string &jsonMessage);

    /**
     * @brief Извлечение JSON-сообщения из частичного буфера
     * @param buffer Буфер с данными
     * @return std::nullopt, если сообщение неполное, или JSON-сообщение
     */
    static std::optional<std::string> extractMessage(std::vector<uint8_t> &buffer);

    /**
     * @brief Извлечение длины сообщения из заголовка
     * @param headerBytes Байты заголовка (4 байта)
     * @return Длина сообщения
     */
    static uint32_t decodeLength(const uint8_t *headerBytes);

    /**
     * @brief Кодирование длины сообщения в заголовок
     * @param length Длина сообщения
     * @return Байты заголовка (4 байта)
     */
    static std::vector<uint8_t> encodeLength(uint32_t length);
};
} // namespace minter::server
