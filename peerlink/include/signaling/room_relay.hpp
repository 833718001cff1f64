#ifndef ROOM_RELAY_HPP
#define ROOM_RELAY_HPP

#include <string>
#include <vector>
#include <mutex>
#include "relay_connection.hpp"
#include "relay_handler.hpp"

namespace peerlink {

/**
 * Two-party room relay
 *
 * The first occupant is told it is the initiator, the second that it is not,
 * and a third connection is rejected with "Room is full". Frames from one
 * occupant are relayed verbatim to the other.
 */
class RoomRelay : public RelayHandler {
public:
    static constexpr size_t kCapacity = 2;

    RoomRelay() = default;
    ~RoomRelay() override = default;

    void onConnect(const RelayConnectionPtr& connection) override;
    void onMessage(const RelayConnectionPtr& connection, const std::string& message) override;
    void onDisconnect(const RelayConnectionPtr& connection) override;

    size_t occupantCount() const;

private:
    std::vector<RelayConnectionPtr> occupants_;
    mutable std::mutex occupants_mutex_;
};

} // namespace peerlink

#endif // ROOM_RELAY_HPP
