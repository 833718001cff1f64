#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include "crypto_provider.hpp"

namespace peerlink {
namespace crypto {

enum class KeyExchangePhase {
    NotStarted,
    InProgress,
    Complete
};

/**
 * Ephemeral X25519 handshake state for one session.
 *
 * The local key pair is generated on first use and lives as long as this
 * object. The session key is SHA-256 of the raw X25519 secret.
 */
class KeyExchange {
public:
    explicit KeyExchange(CryptoProvider& provider);
    ~KeyExchange();

    /**
     * Raw agreement. Throws KeyFormatError unless both keys are exactly
     * kX25519KeySize bytes, KeyDerivationError when the agreement fails.
     */
    static std::vector<uint8_t> deriveSharedSecret(
        CryptoProvider& provider,
        const std::vector<uint8_t>& local_private_key,
        const std::vector<uint8_t>& peer_public_key
    );

    /**
     * One-way hash of the raw secret into a kKeySize symmetric key.
     */
    static std::vector<uint8_t> deriveSessionKey(
        CryptoProvider& provider,
        const std::vector<uint8_t>& raw_secret
    );

    const std::vector<uint8_t>& localPublicKey();
    std::string localPublicKeyBase64();

    /**
     * Derive the session key from the peer's public key.
     * Returns true only for the call that completes the exchange. A call while
     * complete or while a derivation is running is a no-op returning false.
     * On failure the phase returns to NotStarted and the error is rethrown.
     */
    bool completeWithPeerKey(const std::vector<uint8_t>& peer_public_key);

    /**
     * Same as above for a base64 encoded key.
     * Throws KeyFormatError when the text is not valid base64.
     */
    bool completeWithPeerKey(const std::string& peer_public_key_b64);

    /**
     * Record that the peer reported its own derivation complete.
     * Returns true the first time only.
     */
    bool markPeerConfirmed();

    KeyExchangePhase phase() const { return phase_; }
    bool isComplete() const { return phase_ == KeyExchangePhase::Complete; }
    bool peerConfirmed() const { return peer_confirmed_; }
    const std::vector<uint8_t>& sessionKey() const { return session_key_; }
    const std::vector<uint8_t>& peerPublicKey() const { return peer_public_key_; }

    /**
     * Discard all key material, including the local key pair.
     */
    void reset();

private:
    CryptoProvider& provider_;
    KeyPair local_keys_;
    std::vector<uint8_t> peer_public_key_;
    std::vector<uint8_t> session_key_;
    KeyExchangePhase phase_ = KeyExchangePhase::NotStarted;
    bool peer_confirmed_ = false;

    KeyExchange(const KeyExchange&) = delete;
    KeyExchange& operator=(const KeyExchange&) = delete;
};

} // namespace crypto
} // namespace peerlink
