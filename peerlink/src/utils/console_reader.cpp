#include "../../include/utils/console_reader.hpp"
#include "../../include/utils/logger.hpp"
#include <stdexcept>
#include <unistd.h>

namespace peerlink {

ConsoleReader::ConsoleReader(boost::asio::io_context& ioc,
                             int fd,
                             std::function<void(const std::string& line)> on_line,
                             std::function<void()> on_eof)
    : input_(ioc),
      buffer_(std::make_shared<boost::asio::streambuf>()),
      on_line_(std::move(on_line)),
      on_eof_(std::move(on_eof)),
      alive_(std::make_shared<bool>(true)) {
    const int copy = ::dup(fd);
    if (copy < 0) {
        throw std::runtime_error("Cannot duplicate input descriptor");
    }
    boost::system::error_code ec;
    input_.assign(copy, ec);
    if (ec) {
        ::close(copy);
        throw std::runtime_error("Input cannot be read asynchronously: " + ec.message());
    }
}

ConsoleReader::~ConsoleReader() {
    stop();
}

void ConsoleReader::start() {
    readLine();
}

void ConsoleReader::stop() {
    stopped_ = true;
    boost::system::error_code ec;
    input_.close(ec);
}

void ConsoleReader::readLine() {
    if (stopped_) {
        return;
    }
    std::weak_ptr<bool> alive = alive_;
    // The pending read keeps its buffer even if this reader is destroyed first
    std::shared_ptr<boost::asio::streambuf> buffer = buffer_;
    boost::asio::async_read_until(input_, *buffer, '\n',
        [this, alive, buffer](const boost::system::error_code& ec, std::size_t length) {
            if (alive.expired() || stopped_) {
                return;
            }
            if (ec) {
                if (ec != boost::asio::error::eof) {
                    Logger::getInstance().warning("Input read error: " + ec.message());
                }
                // Last line without a newline
                std::string rest(boost::asio::buffers_begin(buffer->data()),
                                 boost::asio::buffers_end(buffer->data()));
                buffer->consume(buffer->size());
                stop();
                if (!rest.empty() && ec == boost::asio::error::eof) {
                    on_line_(rest);
                }
                on_eof_();
                return;
            }

            std::string line(boost::asio::buffers_begin(buffer->data()),
                             boost::asio::buffers_begin(buffer->data()) + length - 1);
            buffer->consume(length);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            on_line_(line);
            readLine();
        });
}

} // namespace peerlink
