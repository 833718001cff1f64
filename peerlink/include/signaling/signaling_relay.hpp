#ifndef SIGNALING_RELAY_HPP
#define SIGNALING_RELAY_HPP

#include <string>
#include <map>
#include <mutex>
#include <vector>
#include "relay_connection.hpp"
#include "relay_handler.hpp"
#include "signaling_protocol.hpp"

namespace peerlink {

/**
 * Addressed signaling relay
 *
 * Keeps an identity -> connection registry and forwards session setup
 * messages between registered peers. Message bodies are never inspected
 * beyond the envelope and are forwarded verbatim.
 */
class SignalingRelay : public RelayHandler {
public:
    SignalingRelay() = default;
    ~SignalingRelay() override = default;

    void onConnect(const RelayConnectionPtr& connection) override;
    void onMessage(const RelayConnectionPtr& connection, const std::string& message) override;
    void onDisconnect(const RelayConnectionPtr& connection) override;

    /**
     * Bind an identity to a connection. A previous binding of the same
     * identity is replaced, as is any other identity the connection held.
     */
    void registerConnection(const std::string& identity, const RelayConnectionPtr& connection);

    /**
     * Remove every entry bound to this connection.
     */
    void unregisterConnection(const RelayConnectionPtr& connection);

    /**
     * Parse one frame and register or route it. Malformed frames are
     * answered with an error message and dropped.
     */
    void handleMessage(const RelayConnectionPtr& connection, const std::string& message);

    /**
     * Deliver raw to the recipient, or to every identity except the sender
     * when the envelope has no recipient. A broadcast also skips origin.
     * Returns the number of deliveries.
     */
    size_t route(const SignalingProtocol::Envelope& envelope,
                 const std::string& raw,
                 const RelayConnectionPtr& origin = nullptr);

    size_t connectionCount() const;
    bool isRegistered(const std::string& identity) const;

private:
    std::map<std::string, RelayConnectionPtr> registry_;
    mutable std::mutex registry_mutex_;
};

} // namespace peerlink

#endif // SIGNALING_RELAY_HPP
