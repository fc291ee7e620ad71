#pragma once

#include <atomic>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio.hpp>

#include "generator/generator.hpp"

namespace minter::server {
/**
 * @class Server
 * @brief Принимает запросы на генерацию через Unix Domain Socket
 */
class Server {
public:
    /**
     * @brief Инициализация и запуск сервера (блокирует до получения SIGINT/SIGTERM)
     * @param generator Генератор
     * @param socketPath Путь к сокету, по умолчанию `<tmp>/minter.sock`
     * @return Код завершения
     */
    static int startServer(Generator &generator, std::optional<std::string> socketPath);

private:
    Generator &generator_;
    std::filesystem::path socketPath_;
    std::unique_ptr<boost::asio::io_context> ioCtx_;
    std::unique_ptr<boost::asio::local::stream_protocol::acceptor> acceptor_;
    std::unique_ptr<boost::asio::signal_set> signalSet_; // Обработчик сигналов завершения
    std::atomic<bool> running_;

    Server(Generator &generator, std::optional<std::string> socketPath);
    ~Server();

    int start();
    void stop();

    /**
     * @brief Принятие нового соединения
     */
    void accept();
};
} // namespace minter::server
