#include "../../include/signaling/signaling_relay.hpp"
#include "../../include/core/errors.hpp"
#include "../../include/utils/logger.hpp"

namespace peerlink {

namespace {

// Types only the relay itself may emit.
bool isRelayOnlyType(const std::string& type) {
    return type == SignalingProtocol::RELAY_ERROR ||
           type == SignalingProtocol::INIT ||
           type == SignalingProtocol::PEER_JOINED ||
           type == SignalingProtocol::ENCRYPTED_MESSAGE;
}

} // namespace

void SignalingRelay::onConnect(const RelayConnectionPtr& connection) {
    Logger::getInstance().debug("Relay connection opened: " + connection->remoteEndpoint());
}

void SignalingRelay::onMessage(const RelayConnectionPtr& connection, const std::string& message) {
    handleMessage(connection, message);
}

void SignalingRelay::onDisconnect(const RelayConnectionPtr& connection) {
    unregisterConnection(connection);
}

void SignalingRelay::registerConnection(const std::string& identity, const RelayConnectionPtr& connection) {
    std::lock_guard<std::mutex> lock(registry_mutex_);

    for (auto it = registry_.begin(); it != registry_.end();) {
        if (it->second == connection && it->first != identity) {
            Logger::getInstance().info("Connection re-registered, dropping identity: " + it->first);
            it = registry_.erase(it);
        } else {
            ++it;
        }
    }

    auto existing = registry_.find(identity);
    if (existing != registry_.end() && existing->second != connection) {
        Logger::getInstance().info("Identity superseded by a newer connection: " + identity);
    }
    registry_[identity] = connection;

    Logger::getInstance().info("Registered identity: " + identity +
                              " (total: " + std::to_string(registry_.size()) + ")");
}

void SignalingRelay::unregisterConnection(const RelayConnectionPtr& connection) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    for (auto it = registry_.begin(); it != registry_.end();) {
        if (it->second == connection) {
            Logger::getInstance().info("Unregistered identity: " + it->first);
            it = registry_.erase(it);
        } else {
            ++it;
        }
    }
}

void SignalingRelay::handleMessage(const RelayConnectionPtr& connection, const std::string& message) {
    SignalingProtocol::Envelope envelope;
    try {
        envelope = SignalingProtocol::parseEnvelope(message);
    } catch (const SignalingParseError& e) {
        Logger::getInstance().warning("Dropping malformed signaling message from " +
                                      connection->remoteEndpoint() + ": " + e.what());
        connection->send(SignalingProtocol::createError(std::string("Invalid message: ") + e.what()));
        return;
    }

    if (envelope.type == SignalingProtocol::REGISTER) {
        registerConnection(envelope.sender, connection);
        return;
    }

    if (isRelayOnlyType(envelope.type)) {
        Logger::getInstance().warning("Client sent relay-only message type: " + envelope.type);
        connection->send(SignalingProtocol::createError("Message type not accepted: " + envelope.type));
        return;
    }

    size_t delivered = route(envelope, message, connection);
    Logger::getInstance().debug("Routed " + envelope.type + " from " + envelope.sender +
                               " to " + std::to_string(delivered) + " peer(s)");
}

size_t SignalingRelay::route(const SignalingProtocol::Envelope& envelope,
                             const std::string& raw,
                             const RelayConnectionPtr& origin) {
    std::vector<RelayConnectionPtr> targets;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        if (envelope.hasRecipient()) {
            auto it = registry_.find(envelope.recipient);
            if (it != registry_.end()) {
                targets.push_back(it->second);
            }
        } else {
            for (const auto& pair : registry_) {
                if (pair.first != envelope.sender && pair.second != origin) {
                    targets.push_back(pair.second);
                }
            }
        }
    }

    if (targets.empty() && envelope.hasRecipient()) {
        Logger::getInstance().debug("Recipient not registered, dropping " + envelope.type +
                                   " for " + envelope.recipient);
    }

    // Deliver outside the lock; each connection has its own write queue.
    for (const auto& target : targets) {
        target->send(raw);
    }
    return targets.size();
}

size_t SignalingRelay::connectionCount() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    return registry_.size();
}

bool SignalingRelay::isRegistered(const std::string& identity) const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    return registry_.find(identity) != registry_.end();
}

} // namespace peerlink
