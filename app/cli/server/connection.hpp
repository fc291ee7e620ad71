#pragma once

#include <memory>
#include <mutex>
#include <queue>
#include <vector>

#include <boost/asio.hpp>

#include "generator/generator.hpp"
#include "protocol.hpp"

namespace minter::server {
/**
 * @class Connection
 * @brief Класс, обрабатывающий одно соединение с клиентом
 */
class Connection : public std::enable_shared_from_this<Connection> {
public:
    using SharedConnection = std::shared_ptr<Connection>;

    /**
     * @brief Создает новое соединение
     * @param ioCtx ASIO контекст
     * @param generator Ссылка на генератор
     * @return Указатель на новое соединение
     */
    static SharedConnection create(boost::asio::io_context &ioCtx, Generator &generator);

    /**
     * @brief Получить сокет
     * @return Ссылка на сокет
     */
    boost::asio::local::stream_protocol::socket &socket();

    /**
     * @brief Начать обработку соединения
     */
    void start();

private:
    Generator &generator_;
    boost::asio::local::stream_protocol::socket socket_;
    std::vector<uint8_t> readBuffer_; // Накопленные, но еще не разобранные байты
    std::queue<std::shared_ptr<std::vector<uint8_t>>> writeQueue_; // Очередь буферов для записи
    std::mutex writeMutex_; // Мьютекс для защиты очереди записи
    bool writeInProgress_ = false; // Выполняется ли в данный момент операция записи

    Connection(boost::asio::io_context &ioCtx, Generator &generator);

    /**
     * @brief Асинхронное чтение данных
     */
    void read();

    /**
     * @brief Обработка сообщений в буфере
     * @return false, если соединение нужно закрыть
     */
    bool processMessages();

    /**
     * @brief Постановка ответа в очередь на отправку
     */
    void write(const Response &response);

    /**
     * @brief Асинхронная запись сообщения из очереди
     */
    void do_write();
};
} // namespace minter::server
