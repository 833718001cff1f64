#ifndef SIGNALING_PROTOCOL_HPP
#define SIGNALING_PROTOCOL_HPP

#include <string>
#include <map>

namespace peerlink {

/**
 * PeerLink Signaling Protocol Definitions
 *
 * Flat JSON messages exchanged through the relay (session setup) and over the
 * data channel (encrypted chat).
 */

namespace SignalingProtocol {

    // Relay message types
    constexpr const char* REGISTER = "register";
    constexpr const char* INITIATE = "initiate";
    constexpr const char* OFFER = "offer";
    constexpr const char* ANSWER = "answer";
    constexpr const char* ICE_CANDIDATE = "ice-candidate";
    constexpr const char* ECDH_PUBLIC_KEY = "ecdh-public-key";
    constexpr const char* ENCRYPTION_READY = "encryption-ready";
    constexpr const char* RELAY_ERROR = "error";

    // Room mode, relay -> client only
    constexpr const char* INIT = "init";
    constexpr const char* PEER_JOINED = "peer-joined";

    // Data channel message type
    constexpr const char* ENCRYPTED_MESSAGE = "encrypted-message";

    constexpr const char* ROOM_FULL_MESSAGE = "Room is full";

    struct Envelope {
        std::string type;
        std::string sender;                        // empty when absent
        std::string recipient;                     // empty when absent
        std::map<std::string, std::string> fields; // every other member

        bool hasSender() const { return !sender.empty(); }
        bool hasRecipient() const { return !recipient.empty(); }

        /**
         * Value of a payload field, empty when missing.
         */
        std::string field(const std::string& name) const;
    };

    std::string createRegister(const std::string& identity);

    std::string createInitiate(const std::string& sender,
                               const std::string& recipient);

    std::string createOffer(const std::string& sender,
                            const std::string& recipient,
                            const std::string& offer);

    std::string createAnswer(const std::string& sender,
                             const std::string& recipient,
                             const std::string& answer);

    std::string createIceCandidate(const std::string& sender,
                                   const std::string& recipient,
                                   const std::string& candidate,
                                   const std::string& sdp_mid);

    std::string createPublicKey(const std::string& sender,
                                const std::string& recipient,
                                const std::string& key_b64);

    std::string createEncryptionReady(const std::string& sender,
                                      const std::string& recipient);

    /**
     * Relay -> client error report
     */
    std::string createError(const std::string& message);

    std::string createInit(bool is_initiator);

    std::string createPeerJoined();

    std::string createEncryptedMessage(const std::string& sealed_b64);

    /**
     * Plaintext chat payload carried inside an encrypted-message.
     */
    std::string createChatPayload(const std::string& text,
                                  const std::string& sender,
                                  const std::string& recipient);

    bool isKnownType(const std::string& type);

    /**
     * Check type-specific required fields.
     * Returns false and sets reason when the envelope is incomplete.
     */
    bool validateEnvelope(const Envelope& envelope, std::string& reason);

    /**
     * Parse and validate a relay or data channel message.
     * Throws SignalingParseError on malformed JSON, unknown type or missing
     * required fields.
     */
    Envelope parseEnvelope(const std::string& json);

} // namespace SignalingProtocol

} // namespace peerlink

#endif // SIGNALING_PROTOCOL_HPP
