#include "connection.hpp"

#include "dispatcher.hpp"
#include "utils/logger.hpp"

namespace minter::server {
// Максимальный размер одного запроса вместе с заголовком (16 КБ)
constexpr size_t MAX_BUFFER_SIZE = 16384;
// Размер порции чтения из сокета
constexpr size_t READ_CHUNK_SIZE = 1024;

Connection::SharedConnection Connection::create(boost::asio::io_context &ioCtx,
                                                Generator &generator)
{
    return SharedConnection(new Connection(ioCtx, generator));
}

Connection::Connection(boost::asio::io_context &ioCtx, Generator &generator)
    : generator_(generator)
    , socket_(ioCtx)
{
    readBuffer_.reserve(MAX_BUFFER_SIZE);
}

boost::asio::local::stream_protocol::socket &Connection::socket()
{
    return socket_;
}

void Connection::start()
{
    LOG_DEBUG << "Новое соединение установлено";
    read();
}

void Connection::read()
{
    auto tmpBuffer = std::make_shared<std::vector<uint8_t>>(READ_CHUNK_SIZE);

    socket_.async_read_some(
        boost::asio::buffer(*tmpBuffer), [this, self = shared_from_this(), tmpBuffer](
                                             boost::system::error_code ec, std::size_t length) {
            if (ec) {
                if (ec == boost::asio::error::eof) {
                    LOG_DEBUG << "Клиент закрыл соединение";
                }
                else if (ec != boost::asio::error::operation_aborted) {
                    LOG_ERROR << "Ошибка при чтении: " << ec.message();
                }
                return;
            }

            if (length == 0) {
                read();
                return;
            }

            readBuffer_.insert(readBuffer_.end(), tmpBuffer->begin(), tmpBuffer->begin() + length);
            if (!processMessages()) {
                boost::system::error_code closeEc;
                socket_.close(closeEc);
                if (closeEc) {
                    LOG_ERROR << "Ошибка при закрытии соединения: " << closeEc.message();
                }
                return;
            }

            read();
        });
}

bool Connection::processMessages()
{
    while (true) {
        // Заголовок с длиной больше допустимой означает ошибку кадрирования: дальнейшие
        // байты не удастся разобрать, поэтому соединение закрывается
        if (readBuffer_.size() >= ProtocolFrame::HEADER_SIZE) {
            const auto messageLength = ProtocolFrame::decodeLength(readBuffer_.data());
            if (messageLength + ProtocolFrame::HEADER_SIZE > MAX_BUFFER_SIZE) {
                LOG_ERROR << "Слишком большое сообщение: " << messageLength << " байт";
                Response errorResponse;
                errorResponse.requestId = "error";
                errorResponse.error = "Message too large";
                write(errorResponse);
                readBuffer_.clear();
                return false;
            }
        }

        const auto jsonMessage = ProtocolFrame::extractMessage(readBuffer_);
        if (!jsonMessage.has_value()) {
            return true;
        }
        LOG_DEBUG << "Извлечено сообщение: " << *jsonMessage;

        const auto request = Request::fromJson(*jsonMessage);
        if (request.has_value()) {
            write(dispatchRequest(generator_, *request));
        }
        else {
            LOG_ERROR << "Некорректный формат запроса: " << *jsonMessage;
            Response errorResponse;
            errorResponse.requestId = "error";
            errorResponse.error = "Invalid request format";
            write(errorResponse);
        }
    }
}

void Connection::write(const Response &response)
{
    auto buffer
        = std::make_shared<std::vector<uint8_t>>(ProtocolFrame::wrapMessage(response.toJson()));
    {
        std::lock_guard<std::mutex> lock(writeMutex_);
        writeQueue_.push(buffer);
        // Текущая операция записи сама запустит следующую при завершении
        if (writeInProgress_) {
            return;
        }
    }
    do_write();
}

void Connection::do_write()
{
    std::shared_ptr<std::vector<uint8_t>> buffer;
    {
        std::lock_guard<std::mutex> lock(writeMutex_);
        if (writeQueue_.empty()) {
            writeInProgress_ = false;
            return;
        }
        writeInProgress_ = true;
        buffer = writeQueue_.front();
        writeQueue_.pop();
    }

    boost::asio::async_write(
        socket_, boost::asio::buffer(*buffer),
        [this, self = shared_from_this(), buffer](boost::system::error_code ec, std::size_t) {
            if (ec) {
                if (ec != boost::asio::error::operation_aborted) {
                    LOG_ERROR << "Ошибка при записи: " << ec.message();
                }
                std::lock_guard<std::mutex> lock(writeMutex_);
                writeInProgress_ = false;
                return;
            }
            do_write();
        });
}
} // namespace minter::server
