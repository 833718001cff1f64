#include "../../include/crypto/key_exchange.hpp"
#include "../../include/core/errors.hpp"
#include "../../include/utils/logger.hpp"
#include <stdexcept>

namespace peerlink {
namespace crypto {

KeyExchange::KeyExchange(CryptoProvider& provider)
    : provider_(provider) {}

KeyExchange::~KeyExchange() {
    reset();
}

std::vector<uint8_t> KeyExchange::deriveSharedSecret(
    CryptoProvider& provider,
    const std::vector<uint8_t>& local_private_key,
    const std::vector<uint8_t>& peer_public_key
) {
    if (local_private_key.size() != kX25519KeySize) {
        throw KeyFormatError("Local private key must be " + std::to_string(kX25519KeySize) +
                             " bytes, got " + std::to_string(local_private_key.size()));
    }
    if (peer_public_key.size() != kX25519KeySize) {
        throw KeyFormatError("Peer public key must be " + std::to_string(kX25519KeySize) +
                             " bytes, got " + std::to_string(peer_public_key.size()));
    }

    try {
        return provider.deriveSharedSecret(local_private_key, peer_public_key);
    } catch (const std::invalid_argument& e) {
        throw KeyFormatError(e.what());
    } catch (const std::runtime_error& e) {
        throw KeyDerivationError(std::string("Key agreement failed: ") + e.what());
    }
}

std::vector<uint8_t> KeyExchange::deriveSessionKey(
    CryptoProvider& provider,
    const std::vector<uint8_t>& raw_secret
) {
    if (raw_secret.empty()) {
        throw KeyDerivationError("Empty shared secret");
    }
    std::vector<uint8_t> key;
    try {
        key = provider.hash(raw_secret);
    } catch (const std::runtime_error& e) {
        throw KeyDerivationError(std::string("Session key hash failed: ") + e.what());
    }
    if (key.size() != kKeySize) {
        secureWipe(key);
        throw KeyDerivationError("Session key has unexpected length");
    }
    return key;
}

const std::vector<uint8_t>& KeyExchange::localPublicKey() {
    if (local_keys_.public_key.empty()) {
        try {
            local_keys_ = provider_.generateKeyPair();
        } catch (const std::runtime_error& e) {
            throw KeyDerivationError(std::string("Ephemeral key generation failed: ") + e.what());
        }
    }
    return local_keys_.public_key;
}

std::string KeyExchange::localPublicKeyBase64() {
    return base64Encode(localPublicKey());
}

bool KeyExchange::completeWithPeerKey(const std::vector<uint8_t>& peer_public_key) {
    if (phase_ != KeyExchangePhase::NotStarted) {
        Logger::getInstance().debug("Key derivation skipped: exchange already " +
            std::string(phase_ == KeyExchangePhase::Complete ? "complete" : "in progress"));
        return false;
    }
    phase_ = KeyExchangePhase::InProgress;

    try {
        const std::vector<uint8_t>& own_public = localPublicKey();
        if (constantTimeEquals(own_public, peer_public_key)) {
            throw KeyFormatError("Peer public key equals the local public key");
        }

        std::vector<uint8_t> raw_secret = deriveSharedSecret(provider_, local_keys_.private_key, peer_public_key);
        std::vector<uint8_t> session_key;
        try {
            session_key = deriveSessionKey(provider_, raw_secret);
        } catch (...) {
            secureWipe(raw_secret);
            throw;
        }
        secureWipe(raw_secret);

        peer_public_key_ = peer_public_key;
        session_key_ = std::move(session_key);
        phase_ = KeyExchangePhase::Complete;
        return true;
    } catch (...) {
        phase_ = KeyExchangePhase::NotStarted;
        throw;
    }
}

bool KeyExchange::completeWithPeerKey(const std::string& peer_public_key_b64) {
    std::vector<uint8_t> decoded;
    try {
        decoded = base64Decode(peer_public_key_b64);
    } catch (const std::invalid_argument& e) {
        throw KeyFormatError(std::string("Peer public key is not valid base64: ") + e.what());
    }
    return completeWithPeerKey(decoded);
}

bool KeyExchange::markPeerConfirmed() {
    if (peer_confirmed_) {
        return false;
    }
    peer_confirmed_ = true;
    return true;
}

void KeyExchange::reset() {
    secureWipe(local_keys_.private_key);
    local_keys_.public_key.clear();
    secureWipe(session_key_);
    peer_public_key_.clear();
    phase_ = KeyExchangePhase::NotStarted;
    peer_confirmed_ = false;
}

} // namespace crypto
} // namespace peerlink
