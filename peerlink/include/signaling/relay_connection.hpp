#ifndef RELAY_CONNECTION_HPP
#define RELAY_CONNECTION_HPP

#include <string>
#include <memory>

namespace peerlink {

/**
 * Server-side view of one client socket.
 * Implementations must be safe to call from any thread.
 */
class RelayConnection {
public:
    virtual ~RelayConnection() = default;

    /**
     * Queue a text frame for delivery. Frames are written in call order.
     */
    virtual void send(const std::string& message) = 0;

    /**
     * Close the socket after pending frames are flushed.
     */
    virtual void close() = 0;

    virtual std::string remoteEndpoint() const = 0;
};

using RelayConnectionPtr = std::shared_ptr<RelayConnection>;

} // namespace peerlink

#endif // RELAY_CONNECTION_HPP
