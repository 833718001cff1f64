#include "../../include/session/websocket_relay_link.hpp"
#include "../../include/config/config.hpp"
#include "../../include/core/errors.hpp"
#include "../../include/utils/logger.hpp"
#include <chrono>
#include <stdexcept>

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace peerlink {
namespace session {

WebSocketRelayLink::WebSocketRelayLink(net::io_context& ioc, const std::string& url)
    : resolver_(ioc), ws_(ioc) {
    if (!parseRelayUrl(url, host_, port_, target_)) {
        throw std::invalid_argument("Invalid relay URL: " + url);
    }
}

WebSocketRelayLink::~WebSocketRelayLink() {
    listener_ = Listener{};
    beast::error_code ec;
    beast::get_lowest_layer(ws_).socket().close(ec);
}

void WebSocketRelayLink::setListener(Listener listener) {
    listener_ = std::move(listener);
}

void WebSocketRelayLink::open() {
    if (state_ != LinkState::Idle) {
        return;
    }
    state_ = LinkState::Connecting;
    Logger::getInstance().info("Connecting to relay " + host_ + ":" + port_ + target_);

    resolver_.async_resolve(host_, port_,
        [self = shared_from_this()](beast::error_code ec, tcp::resolver::results_type results) {
            self->onResolve(ec, results);
        });
}

void WebSocketRelayLink::onResolve(beast::error_code ec, tcp::resolver::results_type results) {
    if (state_ != LinkState::Connecting) return;
    if (ec) {
        fail("resolve failed: " + ec.message());
        return;
    }

    beast::get_lowest_layer(ws_).expires_after(std::chrono::seconds(30));
    beast::get_lowest_layer(ws_).async_connect(results,
        [self = shared_from_this()](beast::error_code ec, tcp::resolver::results_type::endpoint_type endpoint) {
            self->onConnect(ec, endpoint);
        });
}

void WebSocketRelayLink::onConnect(beast::error_code ec, tcp::resolver::results_type::endpoint_type endpoint) {
    if (state_ != LinkState::Connecting) return;
    if (ec) {
        fail("connect failed: " + ec.message());
        return;
    }

    // The websocket stream manages its own timeouts from here on
    beast::get_lowest_layer(ws_).expires_never();
    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));

    const std::string host_header = host_ + ":" + std::to_string(endpoint.port());
    ws_.async_handshake(host_header, target_,
        [self = shared_from_this()](beast::error_code ec) {
            self->onHandshake(ec);
        });
}

void WebSocketRelayLink::onHandshake(beast::error_code ec) {
    if (state_ != LinkState::Connecting) return;
    if (ec) {
        fail("websocket handshake failed: " + ec.message());
        return;
    }

    state_ = LinkState::Open;
    ws_.text(true);
    Logger::getInstance().info("Relay link open");
    doRead();

    if (listener_.on_open) {
        listener_.on_open();
    }
}

void WebSocketRelayLink::doRead() {
    ws_.async_read(buffer_,
        [self = shared_from_this()](beast::error_code ec, std::size_t) {
            self->onRead(ec);
        });
}

void WebSocketRelayLink::onRead(beast::error_code ec) {
    if (state_ != LinkState::Open) return;
    if (ec == websocket::error::closed) {
        fail("closed by relay");
        return;
    }
    if (ec) {
        fail("read error: " + ec.message());
        return;
    }

    std::string message = beast::buffers_to_string(buffer_.data());
    buffer_.consume(buffer_.size());
    doRead();

    if (listener_.on_message) {
        listener_.on_message(message);
    }
}

bool WebSocketRelayLink::isWritable() const {
    return state_ == LinkState::Open;
}

void WebSocketRelayLink::send(const std::string& message) {
    if (!isWritable()) {
        throw RelayConnectionError("Relay link is not open");
    }
    write_queue_.push_back(message);
    if (write_queue_.size() == 1) {
        doWrite();
    }
}

void WebSocketRelayLink::doWrite() {
    ws_.async_write(net::buffer(write_queue_.front()),
        [self = shared_from_this()](beast::error_code ec, std::size_t) {
            self->onWrite(ec);
        });
}

void WebSocketRelayLink::onWrite(beast::error_code ec) {
    if (state_ != LinkState::Open) {
        write_queue_.clear();
        return;
    }
    if (ec) {
        fail("write error: " + ec.message());
        return;
    }

    write_queue_.pop_front();
    if (!write_queue_.empty()) {
        doWrite();
    }
}

void WebSocketRelayLink::close() {
    if (state_ == LinkState::Closed) {
        return;
    }
    // A close frame cannot be written while a write is in flight
    const bool graceful = state_ == LinkState::Open && write_queue_.empty();
    state_ = LinkState::Closed;
    listener_ = Listener{};
    resolver_.cancel();

    if (graceful) {
        ws_.async_close(websocket::close_code::normal,
            [self = shared_from_this()](beast::error_code ec) {
                if (ec) {
                    Logger::getInstance().debug("Relay link close error: " + ec.message());
                }
            });
    } else {
        beast::error_code ec;
        beast::get_lowest_layer(ws_).socket().close(ec);
    }
    Logger::getInstance().info("Relay link closed");
}

void WebSocketRelayLink::fail(const std::string& reason) {
    if (state_ == LinkState::Closed) {
        return;
    }
    state_ = LinkState::Closed;
    beast::error_code ec;
    beast::get_lowest_layer(ws_).socket().close(ec);
    Logger::getInstance().warning("Relay link lost: " + reason);

    // Listener may destroy this link
    Listener listener = std::move(listener_);
    listener_ = Listener{};
    if (listener.on_closed) {
        listener.on_closed(reason);
    }
}

} // namespace session
} // namespace peerlink
