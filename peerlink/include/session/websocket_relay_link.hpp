#ifndef WEBSOCKET_RELAY_LINK_HPP
#define WEBSOCKET_RELAY_LINK_HPP

#include <string>
#include <deque>
#include <memory>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include "relay_link.hpp"

namespace peerlink {
namespace session {

/**
 * Relay link over a Boost.Beast websocket client.
 *
 * All operations must be called on the io_context the link was created
 * with. Writes are queued and issued one at a time.
 */
class WebSocketRelayLink : public RelayLink,
                           public std::enable_shared_from_this<WebSocketRelayLink> {
public:
    /**
     * url is ws://host[:port][/path]. Throws std::invalid_argument otherwise.
     */
    WebSocketRelayLink(boost::asio::io_context& ioc, const std::string& url);
    ~WebSocketRelayLink() override;

    void setListener(Listener listener) override;
    void open() override;
    bool isWritable() const override;
    void send(const std::string& message) override;
    void close() override;

private:
    enum class LinkState {
        Idle,
        Connecting,
        Open,
        Closed
    };

    boost::asio::ip::tcp::resolver resolver_;
    boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
    boost::beast::flat_buffer buffer_;
    std::deque<std::string> write_queue_;

    std::string host_;
    std::string port_;
    std::string target_;

    Listener listener_;
    LinkState state_ = LinkState::Idle;

    void onResolve(boost::beast::error_code ec, boost::asio::ip::tcp::resolver::results_type results);
    void onConnect(boost::beast::error_code ec, boost::asio::ip::tcp::resolver::results_type::endpoint_type endpoint);
    void onHandshake(boost::beast::error_code ec);
    void doRead();
    void onRead(boost::beast::error_code ec);
    void doWrite();
    void onWrite(boost::beast::error_code ec);

    // Moves to Closed and reports reason once.
    void fail(const std::string& reason);
};

} // namespace session
} // namespace peerlink

#endif // WEBSOCKET_RELAY_LINK_HPP
