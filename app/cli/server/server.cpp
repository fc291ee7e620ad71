#include "server.hpp"

#include <boost/system/error_code.hpp>

#include "connection.hpp"
#include "utils/file_utils.hpp"
#include "utils/logger.hpp"

namespace {
std::filesystem::path getSocketPath(std::optional<std::string> socketPath)
{
    if (socketPath.has_value()) {
        return std::filesystem::path(std::move(*socketPath));
    }
    return std::filesystem::temp_directory_path() / "minter.sock";
}
} // namespace

namespace minter::server {
Server::Server(Generator &generator, std::optional<std::string> socketPath)
    : generator_(generator)
    , socketPath_(getSocketPath(std::move(socketPath)))
    , running_(false)
{
}

Server::~Server()
{
    stop();
}

int Server::startServer(Generator &generator, std::optional<std::string> socketPath)
{
    Server server(generator, std::move(socketPath));
    return server.start();
}

int Server::start()
{
    try {
        std::error_code ec;
        if (std::filesystem::exists(socketPath_, ec)) {
            LOG_ERROR << "Сокет существует: " << socketPath_.string()
                      << ", удалите его вручную и перезапустите программу";
            return 1;
        }

        if (socketPath_.has_parent_path()
            && !utils::ensureDirectoryExists(socketPath_.parent_path())) {
            LOG_ERROR << "Не удалось обеспечить существование директории для сокета: "
                      << socketPath_.string();
            return 1;
        }

        ioCtx_ = std::make_unique<boost::asio::io_context>();
        acceptor_ = std::make_unique<boost::asio::local::stream_protocol::acceptor>(
            *ioCtx_, boost::asio::local::stream_protocol::endpoint(socketPath_.string()));

        // Флаг выставляется до первого accept(), иначе цикл приема не продолжится
        running_ = true;
        accept();

        signalSet_ = std::make_unique<boost::asio::signal_set>(*ioCtx_, SIGINT, SIGTERM);
        signalSet_->async_wait([this](const boost::system::error_code &sigEc, int sig) {
            if (!sigEc) {
                LOG_IMPORTANT << "Получен сигнал " << sig;
                stop();
            }
        });

        LOG_IMPORTANT << "Запуск сервера на сокете " << socketPath_.string() << "...";

        // Блокирующий вызов
        ioCtx_->run();

        LOG_IMPORTANT << "Сервер завершил работу";
        return 0;
    }
    catch (const std::exception &e) {
        LOG_ERROR << "Ошибка при запуске сервера: " << e.what();
        running_ = true;
        stop();
        return 1;
    }
}

void Server::stop()
{
    if (!running_.exchange(false)) {
        return;
    }

    LOG_IMPORTANT << "Останавливаем сервер...";

    if (signalSet_ != nullptr) {
        boost::system::error_code ec;
        signalSet_->cancel(ec);
        if (ec) {
            LOG_ERROR << "Ошибка при отмене регистрации сигналов: " << ec.message();
        }
    }

    if (acceptor_ != nullptr) {
        boost::system::error_code ec;
        acceptor_->close(ec);
        if (ec) {
            LOG_ERROR << "Ошибка при закрытии аксептора: " << ec.message();
        }
    }

    if (ioCtx_ != nullptr) {
        ioCtx_->stop();
    }

    // Файл сокета создан этим процессом, удаляем его
    if (acceptor_ != nullptr) {
        std::error_code ec;
        std::filesystem::remove(socketPath_, ec);
        if (ec) {
            LOG_ERROR << "Ошибка при удалении сокета: " << socketPath_.string()
                      << ", код ошибки: " << ec.value() << ", сообщение: " << ec.message();
        }
    }
}

void Server::accept()
{
    if (acceptor_ == nullptr || ioCtx_ == nullptr) {
        return;
    }

    auto newConnection = Connection::create(*ioCtx_, generator_);
    acceptor_->async_accept(newConnection->socket(),
                            [this, newConnection](const boost::system::error_code &ec) {
                                if (!ec) {
                                    newConnection->start();
                                }
                                else if (ec != boost::asio::error::operation_aborted) {
                                    LOG_ERROR << "Ошибка при приеме соединения: " << ec.message();
                                }
                                if (running_) {
                                    accept();
                                }
                            });
}
} // namespace minter::server
