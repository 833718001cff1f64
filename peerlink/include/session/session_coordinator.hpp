#ifndef SESSION_COORDINATOR_HPP
#define SESSION_COORDINATOR_HPP

#include <string>
#include <vector>
#include <deque>
#include <map>
#include <utility>
#include <memory>
#include <optional>
#include <chrono>
#include <boost/asio.hpp>
#include "relay_link.hpp"
#include "transport.hpp"
#include "session_events.hpp"
#include "../crypto/crypto_provider.hpp"
#include "../crypto/key_exchange.hpp"
#include "../crypto/secure_channel.hpp"
#include "../signaling/signaling_protocol.hpp"

namespace peerlink {
namespace session {

/**
 * Per-peer session state machine
 *
 * Registers the local identity with the relay, negotiates the transport with
 * one peer, runs the key exchange over the relay and then carries encrypted
 * chat messages over the transport.
 *
 * Not thread-safe: every call must be made on the io_context passed to the
 * constructor, which is also where all callbacks and timers run.
 */
class SessionCoordinator {
public:
    struct Options {
        std::string identity;
        std::chrono::milliseconds handshake_timeout{std::chrono::seconds(30)}; // zero disables
    };

    SessionCoordinator(boost::asio::io_context& ioc,
                       const Options& options,
                       std::shared_ptr<RelayLink> relay,
                       std::shared_ptr<Transport> transport,
                       crypto::CryptoProvider& provider);
    ~SessionCoordinator();

    void setEventHandler(SessionEventHandler handler);

    /**
     * Queue the registration and open the relay link.
     */
    void start();

    /**
     * Become the initiator towards peer_identity: send our public key, an
     * initiate message and an offer. Throws std::invalid_argument for an
     * empty identity or our own.
     *
     * If the peer names us at the same time, the side with the larger
     * identity drops its offer and answers the other one.
     */
    void setRecipient(const std::string& peer_identity);

    /**
     * Encrypt and send one chat message to the peer.
     * Throws ChannelNotReadyError unless the session is Secure.
     */
    void sendChatMessage(const std::string& text);

    /**
     * Release the transport, the relay link and all key material.
     * Emits Closed; no events follow.
     */
    void cleanup();

    SessionState state() const;
    std::optional<Role> role() const { return role_; }
    const std::string& peer() const { return peer_; }
    const std::string& identity() const { return options_.identity; }
    bool isSecure() const { return state() == SessionState::Secure; }
    bool peerConfirmed() const { return key_exchange_.peerConfirmed(); }

private:
    Options options_;
    std::shared_ptr<RelayLink> relay_;
    std::shared_ptr<Transport> transport_;
    crypto::KeyExchange key_exchange_;
    crypto::SecureChannel channel_;
    boost::asio::steady_timer handshake_timer_;
    SessionEventHandler handler_;
    std::shared_ptr<bool> alive_;   // expires with this object, checked by timer callbacks

    std::deque<std::string> outbound_;
    static constexpr size_t kMaxPendingKeys = 8;

    // (sender, key) held until the sender is our peer, oldest first
    std::deque<std::pair<std::string, std::string>> pending_keys_;
    std::vector<IceCandidate> pending_candidates_;      // held until a remote description is applied

    std::optional<Role> role_;
    std::string peer_;
    bool room_mode_ = false;
    bool started_ = false;
    bool relay_open_ = false;
    bool negotiation_started_ = false;
    bool remote_description_set_ = false;
    bool transport_open_ = false;
    bool key_sent_ = false;
    bool secure_ = false;
    bool failed_ = false;
    bool closed_ = false;
    bool timer_armed_ = false;

    // Relay side
    void onRelayOpen();
    void onRelayMessage(const std::string& raw);
    void onRelayClosed(const std::string& reason);
    void sendSignal(const std::string& message);
    void flushOutbound();

    void handleInit(const SignalingProtocol::Envelope& envelope);
    void handlePeerJoined();
    void handleInitiate(const SignalingProtocol::Envelope& envelope);
    void yieldToPeerOffer();
    void handleOffer(const SignalingProtocol::Envelope& envelope);
    void handleAnswer(const SignalingProtocol::Envelope& envelope);
    void handleIceCandidate(const SignalingProtocol::Envelope& envelope);
    void handlePublicKey(const SignalingProtocol::Envelope& envelope);
    void handleEncryptionReady(const SignalingProtocol::Envelope& envelope);

    // Transport side
    void attachTransport();
    void onLocalDescription(const std::string& sdp, const std::string& type);
    void onLocalCandidate(const IceCandidate& candidate);
    void onTransportOpen();
    void onTransportClosed();
    void onTransportMessage(const std::string& raw);
    void beginNegotiation();
    void applyPendingCandidates();

    // Key exchange
    void assignRole(Role role, const std::string& peer);
    void sendPublicKey();
    void completeKeyExchange(const std::string& peer_key_b64);
    void holdPendingKey(const std::string& sender, const std::string& key);
    void consumePendingKey(const std::string& sender);
    bool isFromPeer(const SignalingProtocol::Envelope& envelope) const;
    void checkSecure();

    void armHandshakeTimer();
    void releaseResources();

    void emit(SessionEvent event);
    void emitSimple(SessionEventType type);
    void emitError(ErrorKind kind, const std::string& message);

    // Error state, no retry
    void fail(ErrorKind kind, const std::string& message);
};

} // namespace session
} // namespace peerlink

#endif // SESSION_COORDINATOR_HPP
