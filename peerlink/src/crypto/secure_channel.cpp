#include "../../include/crypto/secure_channel.hpp"
#include "../../include/core/errors.hpp"
#include <stdexcept>

namespace peerlink {
namespace crypto {

SecureChannel::SecureChannel(CryptoProvider& provider)
    : provider_(provider) {}

SecureChannel::~SecureChannel() {
    reset();
}

void SecureChannel::setKey(const std::vector<uint8_t>& key) {
    if (key.size() != kKeySize) {
        throw KeyFormatError("Session key must be " + std::to_string(kKeySize) + " bytes");
    }
    secureWipe(key_);
    key_ = key;
}

std::vector<uint8_t> SecureChannel::seal(const std::vector<uint8_t>& plaintext) {
    if (!isReady()) {
        throw ChannelNotReadyError("Encryption key not set");
    }

    std::vector<uint8_t> nonce = provider_.randomBytes(kNonceSize);
    std::vector<uint8_t> sealed = provider_.seal(key_, nonce, plaintext);

    std::vector<uint8_t> blob;
    blob.reserve(nonce.size() + sealed.size());
    blob.insert(blob.end(), nonce.begin(), nonce.end());
    blob.insert(blob.end(), sealed.begin(), sealed.end());
    return blob;
}

std::vector<uint8_t> SecureChannel::open(const std::vector<uint8_t>& sealed) {
    if (!isReady()) {
        throw ChannelNotReadyError("Encryption key not set");
    }
    if (sealed.size() < kNonceSize + kTagSize) {
        throw DecryptionError("Sealed message too short: " + std::to_string(sealed.size()) + " bytes");
    }

    std::vector<uint8_t> nonce(sealed.begin(), sealed.begin() + kNonceSize);
    std::vector<uint8_t> body(sealed.begin() + kNonceSize, sealed.end());

    std::vector<uint8_t> plaintext;
    if (!provider_.open(key_, nonce, body, plaintext)) {
        throw DecryptionError("Message authentication failed");
    }
    return plaintext;
}

std::string SecureChannel::sealToBase64(const std::string& plaintext) {
    std::vector<uint8_t> bytes(plaintext.begin(), plaintext.end());
    return base64Encode(seal(bytes));
}

std::string SecureChannel::openFromBase64(const std::string& sealed_b64) {
    if (!isReady()) {
        throw ChannelNotReadyError("Encryption key not set");
    }
    std::vector<uint8_t> sealed;
    try {
        sealed = base64Decode(sealed_b64);
    } catch (const std::invalid_argument& e) {
        throw DecryptionError(std::string("Sealed message is not valid base64: ") + e.what());
    }
    std::vector<uint8_t> plaintext = open(sealed);
    return std::string(plaintext.begin(), plaintext.end());
}

void SecureChannel::reset() {
    secureWipe(key_);
}

} // namespace crypto
} // namespace peerlink
