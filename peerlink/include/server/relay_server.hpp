#ifndef RELAY_SERVER_HPP
#define RELAY_SERVER_HPP

#include <string>
#include <memory>
#include <mutex>
#include <set>
#include <atomic>
#include <chrono>
#include <boost/asio.hpp>
#include "../signaling/relay_handler.hpp"

namespace peerlink {

/**
 * Websocket front end for a relay.
 *
 * Accepts websocket clients on address:port and feeds their text frames to a
 * RelayHandler (SignalingRelay or RoomRelay). Each client gets its own write
 * queue so frames from different senders never interleave mid-write.
 */
class RelayServer {
public:
    RelayServer(const std::string& address, unsigned short port, RelayHandler& handler);
    ~RelayServer();

    /**
     * Bind and start accepting. Port 0 binds an ephemeral port.
     */
    bool start();

    /**
     * Run the io_context on the calling thread plus threads - 1 workers.
     * Returns after stop().
     */
    void run(int threads = 1);

    /**
     * Stop accepting and send a close frame to every client. run() returns once
     * all sessions are gone, or after a short grace period. Safe to call from
     * any thread.
     */
    void stop();

    /**
     * Bound port, valid after start().
     */
    unsigned short port() const { return bound_port_; }

    size_t sessionCount() const;

private:
    class Session;
    friend class Session;

    std::string address_;
    unsigned short port_;
    unsigned short bound_port_ = 0;
    RelayHandler& handler_;

    static constexpr std::chrono::milliseconds kShutdownGrace{1000};

    boost::asio::io_context ioc_;
    // Serializes the acceptor and shutdown handling across worker threads
    boost::asio::strand<boost::asio::io_context::executor_type> control_strand_;
    std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
    boost::asio::steady_timer shutdown_timer_;
    std::atomic<bool> running_{false};

    std::set<std::shared_ptr<Session>> sessions_;
    mutable std::mutex sessions_mutex_;

    void acceptConnections();
    void addSession(const std::shared_ptr<Session>& session);
    void removeSession(const std::shared_ptr<Session>& session);
    void checkShutdownComplete();
};

} // namespace peerlink

#endif // RELAY_SERVER_HPP
