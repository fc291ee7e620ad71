#pragma once

#include "generator/generator.hpp"
#include "protocol.hpp"

namespace minter::server {
/**
 * @brief Выполняет запрос клиента
 *
 * Исключения генератора не выходят наружу: они превращаются в ответ с
 * success = false и текстом ошибки.
 * @param generator Генератор
 * @param request Запрос
 * @return Ответ с тем же request_id
 */
Response dispatchRequest(Generator &generator, const Request &request);
} // namespace minter::server
