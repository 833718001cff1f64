#include "../../include/server/relay_server.hpp"
#include "../../include/signaling/relay_connection.hpp"
#include "../../include/utils/logger.hpp"
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <deque>
#include <thread>
#include <vector>

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace peerlink {

class RelayServer::Session : public RelayConnection,
                             public std::enable_shared_from_this<RelayServer::Session> {
public:
    Session(tcp::socket&& socket, RelayServer& server)
        : ws_(std::move(socket)), server_(server) {
        beast::error_code ec;
        auto remote = beast::get_lowest_layer(ws_).socket().remote_endpoint(ec);
        endpoint_ = ec ? std::string("unknown") : remote.address().to_string() + ":" + std::to_string(remote.port());
    }

    void run() {
        net::dispatch(ws_.get_executor(),
            [self = shared_from_this()]() {
                self->ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
                self->ws_.async_accept(
                    [self](beast::error_code ec) {
                        self->onAccept(ec);
                    });
            });
    }

    void send(const std::string& message) override {
        net::post(ws_.get_executor(),
            [self = shared_from_this(), message]() {
                if (self->closing_ || self->disconnected_) {
                    return;
                }
                self->write_queue_.push_back(message);
                if (self->write_queue_.size() == 1) {
                    self->doWrite();
                }
            });
    }

    void close() override {
        net::post(ws_.get_executor(),
            [self = shared_from_this()]() {
                self->close_requested_ = true;
                if (self->write_queue_.empty()) {
                    self->doClose();
                }
            });
    }

    std::string remoteEndpoint() const override {
        return endpoint_;
    }

private:
    websocket::stream<beast::tcp_stream> ws_;
    RelayServer& server_;
    beast::flat_buffer buffer_;
    std::deque<std::string> write_queue_;
    std::string endpoint_;
    bool accepted_ = false;
    bool close_requested_ = false;
    bool closing_ = false;
    bool disconnected_ = false;

    void onAccept(beast::error_code ec) {
        if (ec) {
            Logger::getInstance().error("WebSocket accept error: " + ec.message());
            handleDisconnect();
            return;
        }

        accepted_ = true;
        Logger::getInstance().info("WebSocket connection accepted: " + endpoint_);
        server_.handler_.onConnect(shared_from_this());
        doRead();
    }

    void doRead() {
        ws_.async_read(buffer_,
            [self = shared_from_this()](beast::error_code ec, std::size_t) {
                self->onRead(ec);
            });
    }

    void onRead(beast::error_code ec) {
        if (ec == websocket::error::closed) {
            Logger::getInstance().info("WebSocket connection closed: " + endpoint_);
            handleDisconnect();
            return;
        }
        if (ec) {
            Logger::getInstance().warning("WebSocket read error from " + endpoint_ + ": " + ec.message());
            handleDisconnect();
            return;
        }

        std::string message = beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());

        if (!closing_) {
            server_.handler_.onMessage(shared_from_this(), message);
        }
        doRead();
    }

    void doWrite() {
        ws_.text(true);
        ws_.async_write(net::buffer(write_queue_.front()),
            [self = shared_from_this()](beast::error_code ec, std::size_t) {
                self->onWrite(ec);
            });
    }

    void onWrite(beast::error_code ec) {
        if (ec) {
            Logger::getInstance().warning("WebSocket write error to " + endpoint_ + ": " + ec.message());
            write_queue_.clear();
            return;
        }

        write_queue_.pop_front();
        if (disconnected_) {
            write_queue_.clear();
        } else if (!write_queue_.empty()) {
            doWrite();
        } else if (close_requested_) {
            doClose();
        }
    }

    void doClose() {
        if (closing_ || disconnected_) {
            return;
        }
        closing_ = true;
        ws_.async_close(websocket::close_code::normal,
            [self = shared_from_this()](beast::error_code ec) {
                if (ec) {
                    Logger::getInstance().debug("WebSocket close error for " + self->endpoint_ + ": " + ec.message());
                }
            });
    }

    void handleDisconnect() {
        if (disconnected_) {
            return;
        }
        disconnected_ = true;
        if (accepted_) {
            server_.handler_.onDisconnect(shared_from_this());
        }
        server_.removeSession(shared_from_this());
    }
};

RelayServer::RelayServer(const std::string& address, unsigned short port, RelayHandler& handler)
    : address_(address), port_(port), handler_(handler),
      control_strand_(net::make_strand(ioc_)), shutdown_timer_(control_strand_) {
}

RelayServer::~RelayServer() {
    stop();
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions_.clear();
    }
    acceptor_.reset();
}

bool RelayServer::start() {
    try {
        tcp::endpoint endpoint(net::ip::make_address(address_), port_);
        acceptor_ = std::make_unique<tcp::acceptor>(control_strand_);
        acceptor_->open(endpoint.protocol());
        acceptor_->set_option(net::socket_base::reuse_address(true));
        acceptor_->bind(endpoint);
        acceptor_->listen(net::socket_base::max_listen_connections);
        bound_port_ = acceptor_->local_endpoint().port();

        running_ = true;
        Logger::getInstance().info("Relay server listening on " + address_ + ":" + std::to_string(bound_port_));

        acceptConnections();
        return true;
    } catch (const std::exception& e) {
        Logger::getInstance().error("Relay server failed to start: " + std::string(e.what()));
        acceptor_.reset();
        return false;
    }
}

void RelayServer::run(int threads) {
    std::vector<std::thread> workers;
    for (int i = 1; i < threads; ++i) {
        workers.emplace_back([this]() { ioc_.run(); });
    }
    ioc_.run();
    for (auto& worker : workers) {
        worker.join();
    }
}

void RelayServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    net::post(control_strand_, [this]() {
        if (acceptor_) {
            beast::error_code ec;
            acceptor_->close(ec);
        }

        std::set<std::shared_ptr<Session>> sessions;
        {
            std::lock_guard<std::mutex> lock(sessions_mutex_);
            sessions = sessions_;
        }
        for (const auto& session : sessions) {
            session->close();
        }
        Logger::getInstance().info("Relay server stopping, closing " + std::to_string(sessions.size()) + " session(s)");

        // Clients that never answer the close frame do not hold up shutdown
        shutdown_timer_.expires_after(kShutdownGrace);
        shutdown_timer_.async_wait([this](const beast::error_code& ec) {
            if (ec == net::error::operation_aborted) {
                return;
            }
            ioc_.stop();
        });
        checkShutdownComplete();
    });
}

void RelayServer::checkShutdownComplete() {
    if (running_) {
        return;
    }
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    if (sessions_.empty()) {
        shutdown_timer_.cancel();
        Logger::getInstance().info("Relay server stopped");
    }
}

size_t RelayServer::sessionCount() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.size();
}

void RelayServer::acceptConnections() {
    if (!running_) return;

    acceptor_->async_accept(net::make_strand(ioc_),
        [this](beast::error_code ec, tcp::socket socket) {
            if (!ec) {
                auto session = std::make_shared<Session>(std::move(socket), *this);
                addSession(session);
                session->run();
            } else if (ec != net::error::operation_aborted) {
                Logger::getInstance().error("Accept error: " + ec.message());
            }
            acceptConnections();
        });
}

void RelayServer::addSession(const std::shared_ptr<Session>& session) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions_.insert(session);
}

void RelayServer::removeSession(const std::shared_ptr<Session>& session) {
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions_.erase(session);
    }
    if (!running_) {
        net::post(control_strand_, [this]() { checkShutdownComplete(); });
    }
}

} // namespace peerlink
