#ifndef SESSION_EVENTS_HPP
#define SESSION_EVENTS_HPP

#include <string>
#include <functional>
#include "../core/errors.hpp"

namespace peerlink {
namespace session {

enum class Role {
    Initiator,
    Responder
};

enum class SessionState {
    Idle,
    Registered,
    Initiating,
    AwaitingInitiation,
    Negotiating,
    TransportOpen,
    KeyExchanging,
    Secure,
    Error,
    Closed
};

enum class SessionEventType {
    Registered,
    RoleAssigned,
    TransportReady,
    KeyExchangeReady,
    PeerEncryptionReady,
    Secure,
    MessageReceived,
    TransportClosed,
    Error,
    Closed
};

struct ChatMessage {
    std::string text;
    std::string sender;
    std::string recipient;
};

struct SessionEvent {
    SessionEventType type;

    // RoleAssigned
    Role role = Role::Initiator;
    std::string peer;            // empty in room mode

    // MessageReceived
    ChatMessage message;

    // Error
    ErrorKind error_kind = ErrorKind::RelayConnection;
    std::string error_message;
};

using SessionEventHandler = std::function<void(const SessionEvent& event)>;

inline const char* roleToString(Role role) {
    return role == Role::Initiator ? "initiator" : "responder";
}

inline const char* sessionStateToString(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "idle";
        case SessionState::Registered: return "registered";
        case SessionState::Initiating: return "initiating";
        case SessionState::AwaitingInitiation: return "awaiting_initiation";
        case SessionState::Negotiating: return "negotiating";
        case SessionState::TransportOpen: return "transport_open";
        case SessionState::KeyExchanging: return "key_exchanging";
        case SessionState::Secure: return "secure";
        case SessionState::Error: return "error";
        case SessionState::Closed: return "closed";
        default: return "unknown";
    }
}

inline const char* sessionEventTypeToString(SessionEventType type) {
    switch (type) {
        case SessionEventType::Registered: return "registered";
        case SessionEventType::RoleAssigned: return "role_assigned";
        case SessionEventType::TransportReady: return "transport_ready";
        case SessionEventType::KeyExchangeReady: return "key_exchange_ready";
        case SessionEventType::PeerEncryptionReady: return "peer_encryption_ready";
        case SessionEventType::Secure: return "secure";
        case SessionEventType::MessageReceived: return "message_received";
        case SessionEventType::TransportClosed: return "transport_closed";
        case SessionEventType::Error: return "error";
        case SessionEventType::Closed: return "closed";
        default: return "unknown";
    }
}

} // namespace session
} // namespace peerlink

#endif // SESSION_EVENTS_HPP
