#ifndef RELAY_HANDLER_HPP
#define RELAY_HANDLER_HPP

#include <string>
#include "relay_connection.hpp"

namespace peerlink {

/**
 * Connection lifecycle hooks the relay server drives.
 * Called concurrently from the server's worker threads.
 */
class RelayHandler {
public:
    virtual ~RelayHandler() = default;

    virtual void onConnect(const RelayConnectionPtr& connection) = 0;
    virtual void onMessage(const RelayConnectionPtr& connection, const std::string& message) = 0;
    virtual void onDisconnect(const RelayConnectionPtr& connection) = 0;
};

} // namespace peerlink

#endif // RELAY_HANDLER_HPP
