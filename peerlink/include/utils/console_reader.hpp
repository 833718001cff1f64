#ifndef CONSOLE_READER_HPP
#define CONSOLE_READER_HPP

#include <string>
#include <functional>
#include <memory>
#include <boost/asio.hpp>

namespace peerlink {

/**
 * Line reader for a terminal or pipe, driven by the io_context.
 *
 * The descriptor is duplicated, so the caller keeps ownership of fd. Lines
 * are delivered without the trailing newline; on_eof runs once when the
 * input ends or fails. Nothing is delivered after stop(). Regular files
 * cannot be polled and are rejected with std::runtime_error.
 */
class ConsoleReader {
public:
    ConsoleReader(boost::asio::io_context& ioc,
                  int fd,
                  std::function<void(const std::string& line)> on_line,
                  std::function<void()> on_eof);
    ~ConsoleReader();

    void start();
    void stop();

private:
    boost::asio::posix::stream_descriptor input_;
    std::shared_ptr<boost::asio::streambuf> buffer_;
    std::function<void(const std::string& line)> on_line_;
    std::function<void()> on_eof_;
    bool stopped_ = false;
    std::shared_ptr<bool> alive_;   // expires with this object, checked by read callbacks

    void readLine();
};

} // namespace peerlink

#endif // CONSOLE_READER_HPP
