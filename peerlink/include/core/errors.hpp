#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

namespace peerlink {

/**
 * Error categories surfaced by the session layer.
 * Carried on Error events so a host application can react without
 * parsing the human-readable message.
 */
enum class ErrorKind {
    RelayConnection,
    SignalingParse,
    TransportNegotiation,
    KeyFormat,
    KeyDerivation,
    ChannelNotReady,
    Decryption,
    HandshakeTimeout,
    RelayRejected
};

/**
 * Base class of every exception thrown by PeerLink.
 */
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class RelayConnectionError : public Error {
public:
    explicit RelayConnectionError(const std::string& message)
        : Error(ErrorKind::RelayConnection, message) {}
};

class SignalingParseError : public Error {
public:
    explicit SignalingParseError(const std::string& message)
        : Error(ErrorKind::SignalingParse, message) {}
};

class TransportNegotiationError : public Error {
public:
    explicit TransportNegotiationError(const std::string& message)
        : Error(ErrorKind::TransportNegotiation, message) {}
};

class KeyFormatError : public Error {
public:
    explicit KeyFormatError(const std::string& message)
        : Error(ErrorKind::KeyFormat, message) {}
};

class KeyDerivationError : public Error {
public:
    explicit KeyDerivationError(const std::string& message)
        : Error(ErrorKind::KeyDerivation, message) {}
};

class ChannelNotReadyError : public Error {
public:
    explicit ChannelNotReadyError(const std::string& message)
        : Error(ErrorKind::ChannelNotReady, message) {}
};

class DecryptionError : public Error {
public:
    explicit DecryptionError(const std::string& message)
        : Error(ErrorKind::Decryption, message) {}
};

inline const char* errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::RelayConnection: return "relay_connection";
        case ErrorKind::SignalingParse: return "signaling_parse";
        case ErrorKind::TransportNegotiation: return "transport_negotiation";
        case ErrorKind::KeyFormat: return "key_format";
        case ErrorKind::KeyDerivation: return "key_derivation";
        case ErrorKind::ChannelNotReady: return "channel_not_ready";
        case ErrorKind::Decryption: return "decryption";
        case ErrorKind::HandshakeTimeout: return "handshake_timeout";
        case ErrorKind::RelayRejected: return "relay_rejected";
        default: return "unknown";
    }
}

} // namespace peerlink

#endif // ERRORS_HPP
