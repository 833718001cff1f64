#include "../../include/session/session_coordinator.hpp"
#include "../../include/core/errors.hpp"
#include "../../include/utils/json_parser.hpp"
#include "../../include/utils/logger.hpp"
#include <stdexcept>

namespace peerlink {
namespace session {

namespace Proto = SignalingProtocol;

SessionCoordinator::SessionCoordinator(boost::asio::io_context& ioc,
                                       const Options& options,
                                       std::shared_ptr<RelayLink> relay,
                                       std::shared_ptr<Transport> transport,
                                       crypto::CryptoProvider& provider)
    : options_(options),
      relay_(std::move(relay)),
      transport_(std::move(transport)),
      key_exchange_(provider),
      channel_(provider),
      handshake_timer_(ioc),
      alive_(std::make_shared<bool>(true)) {
    if (options_.identity.empty()) {
        throw std::invalid_argument("Session identity must not be empty");
    }
    if (!relay_ || !transport_) {
        throw std::invalid_argument("Session requires a relay link and a transport");
    }
}

SessionCoordinator::~SessionCoordinator() {
    handler_ = nullptr;
    cleanup();
}

void SessionCoordinator::setEventHandler(SessionEventHandler handler) {
    handler_ = std::move(handler);
}

SessionState SessionCoordinator::state() const {
    if (closed_) return SessionState::Closed;
    if (failed_) return SessionState::Error;
    if (!relay_open_) return SessionState::Idle;
    if (!role_) return SessionState::Registered;
    if (secure_) return SessionState::Secure;
    if (transport_open_) {
        return key_sent_ ? SessionState::KeyExchanging : SessionState::TransportOpen;
    }
    if (negotiation_started_) return SessionState::Negotiating;
    return *role_ == Role::Initiator ? SessionState::Initiating : SessionState::AwaitingInitiation;
}

void SessionCoordinator::start() {
    if (started_ || closed_) {
        return;
    }
    started_ = true;

    RelayLink::Listener relay_listener;
    relay_listener.on_open = [this]() { onRelayOpen(); };
    relay_listener.on_message = [this](const std::string& message) { onRelayMessage(message); };
    relay_listener.on_closed = [this](const std::string& reason) { onRelayClosed(reason); };
    relay_->setListener(std::move(relay_listener));

    attachTransport();

    // Queued until the link is writable, so it always goes out first
    sendSignal(Proto::createRegister(options_.identity));

    Logger::getInstance().info("Session starting for identity " + options_.identity);
    relay_->open();
}

void SessionCoordinator::setRecipient(const std::string& peer_identity) {
    if (!started_) {
        throw std::logic_error("setRecipient called before start");
    }
    if (peer_identity.empty() || peer_identity == options_.identity) {
        throw std::invalid_argument("Invalid recipient identity");
    }
    if (closed_ || failed_) {
        return;
    }
    if (role_) {
        Logger::getInstance().warning("Recipient ignored: session already has a peer");
        return;
    }

    assignRole(Role::Initiator, peer_identity);
    sendPublicKey();
    sendSignal(Proto::createInitiate(options_.identity, peer_));
    beginNegotiation();
    consumePendingKey(peer_);
}

void SessionCoordinator::sendChatMessage(const std::string& text) {
    if (state() != SessionState::Secure) {
        throw ChannelNotReadyError("Secure session not established");
    }

    const std::string payload = Proto::createChatPayload(text, options_.identity, peer_);
    const std::string frame = Proto::createEncryptedMessage(channel_.sealToBase64(payload));
    transport_->send(frame);
}

void SessionCoordinator::cleanup() {
    if (closed_) {
        return;
    }
    closed_ = true;
    releaseResources();
    relay_->close();
    relay_open_ = false;
    outbound_.clear();
    Logger::getInstance().info("Session closed for identity " + options_.identity);
    emitSimple(SessionEventType::Closed);
    handler_ = nullptr;
}

// ---- relay ----

void SessionCoordinator::onRelayOpen() {
    if (closed_) return;
    relay_open_ = true;
    flushOutbound();
    emitSimple(SessionEventType::Registered);
}

void SessionCoordinator::onRelayClosed(const std::string& reason) {
    if (closed_) return;
    relay_open_ = false;
    outbound_.clear();
    releaseResources();
    transport_open_ = false;
    secure_ = false;
    fail(ErrorKind::RelayConnection, "Relay connection lost: " + reason);
}

void SessionCoordinator::sendSignal(const std::string& message) {
    if (closed_) return;
    outbound_.push_back(message);
    flushOutbound();
}

void SessionCoordinator::flushOutbound() {
    while (!outbound_.empty() && relay_->isWritable()) {
        relay_->send(outbound_.front());
        outbound_.pop_front();
    }
}

void SessionCoordinator::onRelayMessage(const std::string& raw) {
    if (closed_ || failed_) return;

    Proto::Envelope envelope;
    try {
        envelope = Proto::parseEnvelope(raw);
    } catch (const SignalingParseError& e) {
        Logger::getInstance().warning("Dropping malformed relay message: " + std::string(e.what()));
        return;
    }

    if (envelope.hasRecipient() && envelope.recipient != options_.identity) {
        Logger::getInstance().debug("Ignoring " + envelope.type + " addressed to " + envelope.recipient);
        return;
    }
    if (envelope.hasSender() && envelope.sender == options_.identity) {
        return;
    }

    const std::string& type = envelope.type;
    if (type == Proto::INIT) {
        handleInit(envelope);
    } else if (type == Proto::PEER_JOINED) {
        handlePeerJoined();
    } else if (type == Proto::INITIATE) {
        handleInitiate(envelope);
    } else if (type == Proto::OFFER) {
        handleOffer(envelope);
    } else if (type == Proto::ANSWER) {
        handleAnswer(envelope);
    } else if (type == Proto::ICE_CANDIDATE) {
        handleIceCandidate(envelope);
    } else if (type == Proto::ECDH_PUBLIC_KEY) {
        handlePublicKey(envelope);
    } else if (type == Proto::ENCRYPTION_READY) {
        handleEncryptionReady(envelope);
    } else if (type == Proto::RELAY_ERROR) {
        fail(ErrorKind::RelayRejected, "Relay error: " + envelope.field("message"));
    } else {
        Logger::getInstance().debug("Ignoring relay message of type " + type);
    }
}

void SessionCoordinator::handleInit(const Proto::Envelope& envelope) {
    if (role_) {
        Logger::getInstance().warning("Ignoring init: role already assigned");
        return;
    }
    room_mode_ = true;
    const bool is_initiator = envelope.field("isInitiator") == "true";

    if (is_initiator) {
        // Negotiation starts once the second occupant arrives
        assignRole(Role::Initiator, "");
    } else {
        assignRole(Role::Responder, "");
        sendPublicKey();
    }

    if (!pending_keys_.empty()) {
        consumePendingKey(pending_keys_.back().first);
    }
}

void SessionCoordinator::handlePeerJoined() {
    if (!room_mode_ || !role_ || *role_ != Role::Initiator) {
        return;
    }
    Logger::getInstance().info("Peer joined the room");
    sendPublicKey();
    beginNegotiation();
}

void SessionCoordinator::handleInitiate(const Proto::Envelope& envelope) {
    if (!envelope.hasSender()) {
        Logger::getInstance().warning("Ignoring initiate without sender");
        return;
    }
    if (role_) {
        if (peer_ != envelope.sender) {
            Logger::getInstance().warning("Ignoring initiate from " + envelope.sender + ": session busy");
            return;
        }
        // Both sides named each other: the larger identity answers instead
        if (*role_ == Role::Initiator && !remote_description_set_ && options_.identity > peer_) {
            yieldToPeerOffer();
        }
        return;
    }

    assignRole(Role::Responder, envelope.sender);
    sendPublicKey();
    consumePendingKey(envelope.sender);
}

void SessionCoordinator::yieldToPeerOffer() {
    Logger::getInstance().info("Simultaneous initiate with " + peer_ + ", answering their offer");
    try {
        transport_->resetNegotiation();
    } catch (const TransportNegotiationError& e) {
        fail(ErrorKind::TransportNegotiation, e.what());
        return;
    }
    role_ = Role::Responder;
    negotiation_started_ = false;

    SessionEvent event;
    event.type = SessionEventType::RoleAssigned;
    event.role = Role::Responder;
    event.peer = peer_;
    emit(std::move(event));
}

void SessionCoordinator::handleOffer(const Proto::Envelope& envelope) {
    if (!role_ || *role_ != Role::Responder || !isFromPeer(envelope)) {
        Logger::getInstance().warning("Ignoring unexpected offer");
        return;
    }
    if (negotiation_started_) {
        Logger::getInstance().warning("Ignoring duplicate offer");
        return;
    }
    negotiation_started_ = true;

    try {
        transport_->acceptOffer(envelope.field("offer"));
    } catch (const TransportNegotiationError& e) {
        fail(ErrorKind::TransportNegotiation, e.what());
        return;
    }
    remote_description_set_ = true;
    applyPendingCandidates();
}

void SessionCoordinator::handleAnswer(const Proto::Envelope& envelope) {
    if (!role_ || *role_ != Role::Initiator || !isFromPeer(envelope)) {
        Logger::getInstance().warning("Ignoring unexpected answer");
        return;
    }
    if (!negotiation_started_ || remote_description_set_) {
        Logger::getInstance().warning("Ignoring answer outside negotiation");
        return;
    }

    try {
        transport_->applyAnswer(envelope.field("answer"));
    } catch (const TransportNegotiationError& e) {
        fail(ErrorKind::TransportNegotiation, e.what());
        return;
    }
    remote_description_set_ = true;
    applyPendingCandidates();
}

void SessionCoordinator::handleIceCandidate(const Proto::Envelope& envelope) {
    if (!role_ || !isFromPeer(envelope)) {
        return;
    }

    IceCandidate candidate;
    candidate.candidate = envelope.field("candidate");
    candidate.sdp_mid = envelope.field("sdpMid");

    if (!remote_description_set_) {
        pending_candidates_.push_back(candidate);
        return;
    }

    try {
        transport_->addRemoteCandidate(candidate);
    } catch (const TransportNegotiationError& e) {
        fail(ErrorKind::TransportNegotiation, e.what());
    }
}

void SessionCoordinator::handlePublicKey(const Proto::Envelope& envelope) {
    const std::string key = envelope.field("key");

    if (!role_ || (!room_mode_ && peer_.empty())) {
        // Addressed mode: the key may precede initiate
        holdPendingKey(envelope.sender, key);
        return;
    }
    if (!isFromPeer(envelope)) {
        Logger::getInstance().warning("Ignoring public key from " + envelope.sender);
        return;
    }
    completeKeyExchange(key);
}

void SessionCoordinator::handleEncryptionReady(const Proto::Envelope& envelope) {
    if (!role_ || !isFromPeer(envelope)) {
        return;
    }
    if (key_exchange_.markPeerConfirmed()) {
        Logger::getInstance().info("Peer reports encryption ready");
        emitSimple(SessionEventType::PeerEncryptionReady);
    }
}

// ---- transport ----

void SessionCoordinator::attachTransport() {
    Transport::Listener listener;
    listener.on_local_description = [this](const std::string& sdp, const std::string& type) {
        onLocalDescription(sdp, type);
    };
    listener.on_local_candidate = [this](const IceCandidate& candidate) { onLocalCandidate(candidate); };
    listener.on_open = [this]() { onTransportOpen(); };
    listener.on_closed = [this]() { onTransportClosed(); };
    listener.on_message = [this](const std::string& message) { onTransportMessage(message); };
    listener.on_failure = [this](const std::string& reason) {
        fail(ErrorKind::TransportNegotiation, reason);
    };
    transport_->setListener(std::move(listener));
}

void SessionCoordinator::beginNegotiation() {
    if (negotiation_started_) {
        return;
    }
    negotiation_started_ = true;
    try {
        transport_->createOffer();
    } catch (const TransportNegotiationError& e) {
        fail(ErrorKind::TransportNegotiation, e.what());
    }
}

void SessionCoordinator::applyPendingCandidates() {
    std::vector<IceCandidate> candidates;
    candidates.swap(pending_candidates_);
    for (const auto& candidate : candidates) {
        try {
            transport_->addRemoteCandidate(candidate);
        } catch (const TransportNegotiationError& e) {
            fail(ErrorKind::TransportNegotiation, e.what());
            return;
        }
    }
}

void SessionCoordinator::onLocalDescription(const std::string& sdp, const std::string& type) {
    if (closed_ || failed_) return;
    if (type == "offer") {
        if (!role_ || *role_ != Role::Initiator) {
            Logger::getInstance().debug("Discarding local offer: no longer the offering side");
            return;
        }
        sendSignal(Proto::createOffer(options_.identity, peer_, sdp));
    } else if (type == "answer") {
        sendSignal(Proto::createAnswer(options_.identity, peer_, sdp));
    } else {
        Logger::getInstance().warning("Ignoring local description of type " + type);
    }
}

void SessionCoordinator::onLocalCandidate(const IceCandidate& candidate) {
    if (closed_ || failed_) return;
    sendSignal(Proto::createIceCandidate(options_.identity, peer_, candidate.candidate, candidate.sdp_mid));
}

void SessionCoordinator::onTransportOpen() {
    if (closed_ || failed_ || transport_open_) return;
    transport_open_ = true;
    Logger::getInstance().info("Transport open");
    emitSimple(SessionEventType::TransportReady);
    checkSecure();
}

void SessionCoordinator::onTransportClosed() {
    if (closed_ || !transport_open_) return;
    transport_open_ = false;
    secure_ = false;
    emitSimple(SessionEventType::TransportClosed);
    fail(ErrorKind::TransportNegotiation, "Transport closed");
}

void SessionCoordinator::onTransportMessage(const std::string& raw) {
    if (closed_) return;

    Proto::Envelope envelope;
    try {
        envelope = Proto::parseEnvelope(raw);
    } catch (const SignalingParseError& e) {
        Logger::getInstance().warning("Dropping malformed data channel frame: " + std::string(e.what()));
        return;
    }
    if (envelope.type != Proto::ENCRYPTED_MESSAGE) {
        Logger::getInstance().debug("Ignoring data channel frame of type " + envelope.type);
        return;
    }
    if (!channel_.isReady()) {
        emitError(ErrorKind::ChannelNotReady, "Encrypted message received before key exchange completed");
        return;
    }

    std::string plaintext;
    try {
        plaintext = channel_.openFromBase64(envelope.field("message"));
    } catch (const DecryptionError& e) {
        emitError(ErrorKind::Decryption, e.what());
        return;
    }

    std::map<std::string, std::string> payload;
    try {
        payload = JsonParser::parse(plaintext);
    } catch (const std::invalid_argument&) {
        Logger::getInstance().warning("Dropping chat payload that is not a JSON object");
        return;
    }

    SessionEvent event;
    event.type = SessionEventType::MessageReceived;
    event.peer = peer_;
    event.message.text = payload["text"];
    event.message.sender = payload["sender"];
    event.message.recipient = payload["recipient"];
    emit(std::move(event));
}

// ---- key exchange ----

void SessionCoordinator::assignRole(Role role, const std::string& peer) {
    role_ = role;
    peer_ = peer;
    Logger::getInstance().info(std::string("Role assigned: ") + roleToString(role) +
                              (peer.empty() ? std::string(" (room)") : " for peer " + peer));

    SessionEvent event;
    event.type = SessionEventType::RoleAssigned;
    event.role = role;
    event.peer = peer;
    emit(std::move(event));

    armHandshakeTimer();
}

void SessionCoordinator::sendPublicKey() {
    if (key_sent_ || closed_ || failed_) {
        return;
    }

    std::string key;
    try {
        key = key_exchange_.localPublicKeyBase64();
    } catch (const KeyDerivationError& e) {
        fail(ErrorKind::KeyDerivation, e.what());
        return;
    }
    key_sent_ = true;
    sendSignal(Proto::createPublicKey(options_.identity, peer_, key));
}

void SessionCoordinator::completeKeyExchange(const std::string& peer_key_b64) {
    sendPublicKey();
    if (failed_ || closed_) {
        return;
    }

    try {
        if (!key_exchange_.completeWithPeerKey(peer_key_b64)) {
            return;
        }
        channel_.setKey(key_exchange_.sessionKey());
    } catch (const KeyFormatError& e) {
        fail(ErrorKind::KeyFormat, e.what());
        return;
    } catch (const KeyDerivationError& e) {
        fail(ErrorKind::KeyDerivation, e.what());
        return;
    }

    Logger::getInstance().info("Session key derived");
    emitSimple(SessionEventType::KeyExchangeReady);
    sendSignal(Proto::createEncryptionReady(options_.identity, peer_));
    checkSecure();
}

void SessionCoordinator::holdPendingKey(const std::string& sender, const std::string& key) {
    for (auto it = pending_keys_.begin(); it != pending_keys_.end(); ++it) {
        if (it->first == sender) {
            pending_keys_.erase(it);
            break;
        }
    }
    // Senders are unauthenticated, so only the most recent few are kept
    if (pending_keys_.size() >= kMaxPendingKeys) {
        Logger::getInstance().warning("Dropping held public key from " + pending_keys_.front().first);
        pending_keys_.pop_front();
    }
    pending_keys_.emplace_back(sender, key);
    Logger::getInstance().debug("Holding public key from " + sender + " until the sender becomes our peer");
}

void SessionCoordinator::consumePendingKey(const std::string& sender) {
    std::string key;
    bool found = false;
    for (const auto& entry : pending_keys_) {
        if (entry.first == sender) {
            key = entry.second;
            found = true;
        }
    }
    if (!found) {
        return;
    }
    pending_keys_.clear();
    completeKeyExchange(key);
}

bool SessionCoordinator::isFromPeer(const Proto::Envelope& envelope) const {
    if (room_mode_) {
        return true;
    }
    return !peer_.empty() && envelope.sender == peer_;
}

void SessionCoordinator::checkSecure() {
    if (secure_ || failed_ || closed_) {
        return;
    }
    if (transport_open_ && key_exchange_.isComplete()) {
        secure_ = true;
        handshake_timer_.cancel();
        Logger::getInstance().info("Session secure with " + (peer_.empty() ? std::string("room peer") : peer_));
        emitSimple(SessionEventType::Secure);
    }
}

// ---- lifecycle ----

void SessionCoordinator::armHandshakeTimer() {
    if (timer_armed_ || options_.handshake_timeout.count() <= 0) {
        return;
    }
    timer_armed_ = true;
    handshake_timer_.expires_after(options_.handshake_timeout);
    std::weak_ptr<bool> alive = alive_;
    handshake_timer_.async_wait([this, alive](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted || alive.expired()) {
            return;
        }
        if (closed_ || failed_ || secure_) {
            return;
        }
        fail(ErrorKind::HandshakeTimeout, "Handshake timed out");
    });
}

void SessionCoordinator::releaseResources() {
    handshake_timer_.cancel();
    transport_->close();
    transport_open_ = false;
    key_exchange_.reset();
    channel_.reset();
    pending_keys_.clear();
    pending_candidates_.clear();
}

void SessionCoordinator::emit(SessionEvent event) {
    if (closed_ && event.type != SessionEventType::Closed) {
        return;
    }
    Logger::getInstance().debug(std::string("Session event: ") + sessionEventTypeToString(event.type));
    if (!handler_) {
        return;
    }
    // The handler may call cleanup() and reset handler_
    SessionEventHandler handler = handler_;
    handler(event);
}

void SessionCoordinator::emitSimple(SessionEventType type) {
    SessionEvent event;
    event.type = type;
    event.peer = peer_;
    emit(std::move(event));
}

void SessionCoordinator::emitError(ErrorKind kind, const std::string& message) {
    Logger::getInstance().error(std::string("Session error [") + errorKindToString(kind) + "]: " + message);
    SessionEvent event;
    event.type = SessionEventType::Error;
    event.peer = peer_;
    event.error_kind = kind;
    event.error_message = message;
    emit(std::move(event));
}

void SessionCoordinator::fail(ErrorKind kind, const std::string& message) {
    if (closed_) {
        return;
    }
    failed_ = true;
    secure_ = false;
    handshake_timer_.cancel();
    emitError(kind, message);
}

} // namespace session
} // namespace peerlink
