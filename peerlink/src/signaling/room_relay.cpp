#include "../../include/signaling/room_relay.hpp"
#include "../../include/signaling/signaling_protocol.hpp"
#include "../../include/utils/json_parser.hpp"
#include "../../include/utils/logger.hpp"
#include <algorithm>
#include <stdexcept>

namespace peerlink {

constexpr size_t RoomRelay::kCapacity;

void RoomRelay::onConnect(const RelayConnectionPtr& connection) {
    bool admitted = false;
    bool is_initiator = false;
    RelayConnectionPtr waiting;
    {
        std::lock_guard<std::mutex> lock(occupants_mutex_);
        if (occupants_.size() < kCapacity) {
            is_initiator = occupants_.empty();
            if (!is_initiator) {
                waiting = occupants_.front();
            }
            occupants_.push_back(connection);
            admitted = true;
        }
    }

    if (!admitted) {
        Logger::getInstance().warning("Room is full, rejecting " + connection->remoteEndpoint());
        connection->send(SignalingProtocol::createError(SignalingProtocol::ROOM_FULL_MESSAGE));
        connection->close();
        return;
    }

    Logger::getInstance().info("Room occupant joined: " + connection->remoteEndpoint() +
                              (is_initiator ? " (initiator)" : " (responder)"));
    connection->send(SignalingProtocol::createInit(is_initiator));
    if (waiting) {
        waiting->send(SignalingProtocol::createPeerJoined());
    }
}

void RoomRelay::onMessage(const RelayConnectionPtr& connection, const std::string& message) {
    try {
        JsonParser::parse(message);
    } catch (const std::invalid_argument& e) {
        Logger::getInstance().warning("Dropping unparseable room message: " + std::string(e.what()));
        return;
    }

    RelayConnectionPtr other;
    {
        std::lock_guard<std::mutex> lock(occupants_mutex_);
        if (std::find(occupants_.begin(), occupants_.end(), connection) == occupants_.end()) {
            return;
        }
        for (const auto& occupant : occupants_) {
            if (occupant != connection) {
                other = occupant;
            }
        }
    }

    if (other) {
        other->send(message);
    } else {
        Logger::getInstance().debug("No other occupant, dropping room message");
    }
}

void RoomRelay::onDisconnect(const RelayConnectionPtr& connection) {
    std::lock_guard<std::mutex> lock(occupants_mutex_);
    auto it = std::find(occupants_.begin(), occupants_.end(), connection);
    if (it != occupants_.end()) {
        occupants_.erase(it);
        Logger::getInstance().info("Room occupant left: " + connection->remoteEndpoint());
    }
}

size_t RoomRelay::occupantCount() const {
    std::lock_guard<std::mutex> lock(occupants_mutex_);
    return occupants_.size();
}

} // namespace peerlink
