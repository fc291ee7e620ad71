#include "protocol.hpp"

#include "utils/logger.hpp"

namespace minter::server {
using json = nlohmann::json;

std::optional<Request> Request::fromJson(const std::string &jsonStr)
{
    try {
        const auto jsonData = json::parse(jsonStr);

        // Проверка обязательных полей, params может отсутствовать
        if (!jsonData.is_object() || !jsonData.contains("request_id")
            || !jsonData.contains("command")) {
            LOG_ERROR << "JSON не содержит обязательных полей";
            return std::nullopt;
        }

        Request req;
        req.requestId = jsonData["request_id"].get<std::string>();
        req.command = stringToCommand(jsonData["command"].get<std::string>());

        if (jsonData.contains("params")) {
            const auto &params = jsonData["params"];
            if (!params.is_object()) {
                LOG_ERROR << "Поле params должно быть объектом";
                return std::nullopt;
            }
            req.params = params;
        }

        return req;
    }
    catch (const json::exception &e) {
        LOG_ERROR << "Ошибка при разборе JSON: " << e.what();
        return std::nullopt;
    }
}

CommandType Request::stringToCommand(const std::string &cmdStr)
{
    if (cmdStr == "code")
        return CommandType::CODE;
    if (cmdStr == "string")
        return CommandType::STRING;
    if (cmdStr == "token")
        return CommandType::TOKEN;
    if (cmdStr == "magic_token")
        return CommandType::MAGIC_TOKEN;
    if (cmdStr == "uuid")
        return CommandType::UUID;
    if (cmdStr == "key")
        return CommandType::KEY;
    if (cmdStr == "short_id")
        return CommandType::SHORT_ID;
    if (cmdStr == "sequential_id")
        return CommandType::SEQUENTIAL_ID;
    if (cmdStr == "slug")
        return CommandType::SLUG;
    if (cmdStr == "ping")
        return CommandType::PING;
    return CommandType::UNKNOWN;
}

std::string Response::toJson() const
{
    json jsonData;
    jsonData["request_id"] = requestId;
    jsonData["success"] = success;
    jsonData["result"] = result;

    if (error.has_value()) {
        jsonData["error"] = *error;
    }

    return jsonData.dump();
}

json tokenRecordToJson(const TokenRecord &record)
{
    return json{ { "token", record.token },
                 { "expires", record.expires },
                 { "expires_at", static_cast<int64_t>(record.expiresAt) },
                 { "context", record.context } };
}

std::vector<uint8_t> ProtocolFrame::wrapMessage(const std::string &jsonMessage)
{
    // Вычисляем длину сообщения
    const uint32_t length = static_cast<uint32_t>(jsonMessage.size());

    // Кодируем длину
    auto lengthBytes = encodeLength(length);

    // Создаем результирующий буфер
    const auto lengthBytesSize = lengthBytes.size();
    std::vector<uint8_t> frame(lengthBytesSize + jsonMessage.size());

    // Копируем заголовок и сообщение
    std::copy(lengthBytes.begin(), lengthBytes.end(), frame.begin());
    std::copy(jsonMessage.begin(), jsonMessage.end(), frame.begin() + lengthBytesSize);

    return frame;
}

std::optional<std::string> ProtocolFrame::extractMessage(std::vector<uint8_t> &buffer)
{
    // Проверяем, есть ли достаточно данных для чтения заголовка
    if (buffer.size() < HEADER_SIZE) {
        return std::nullopt;
    }

    // Извлекаем длину сообщения
    const auto messageLength = decodeLength(buffer.data());

    // Проверяем, получили ли мы все сообщение
    if (buffer.size() < HEADER_SIZE + messageLength) {
        return std::nullopt;
    }

    // Извлекаем сообщение
    std::string message(buffer.begin() + HEADER_SIZE, buffer.begin() + HEADER_SIZE + messageLength);

    // Удаляем обработанные данные из буфера
    buffer.erase(buffer.begin(), buffer.begin() + HEADER_SIZE + messageLength);

    return message;
}

// !! Для кодирования/декодирования используем формат little-endian

uint32_t ProtocolFrame::decodeLength(const uint8_t *headerBytes)
{
    constexpr size_t BITS_PER_BYTE = 8;
    uint32_t length = 0;
    for (size_t i = 0; i < HEADER_SIZE; ++i) {
        length |= static_cast<uint32_t>(headerBytes[i]) << (i * BITS_PER_BYTE);
    }
    return length;
}

std::vector<uint8_t> ProtocolFrame::encodeLength(uint32_t length)
{
    constexpr size_t BITS_PER_BYTE = 8;
    std::vector<uint8_t> bytes(HEADER_SIZE);
    for (size_t i = 0; i < HEADER_SIZE; i++) {
        bytes[i] = (length >> (i * BITS_PER_BYTE)) & 0xFF;
    }
    return bytes;
}
} // namespace minter::server
