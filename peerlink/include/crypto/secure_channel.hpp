#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include "crypto_provider.hpp"

namespace peerlink {
namespace crypto {

/**
 * AEAD wrapper around the session key.
 *
 * Sealed blob layout: nonce (12) || ciphertext || tag (16).
 * A fresh random nonce is drawn for every seal.
 */
class SecureChannel {
public:
    explicit SecureChannel(CryptoProvider& provider);
    ~SecureChannel();

    /**
     * Install the session key. Throws KeyFormatError unless it is kKeySize bytes.
     */
    void setKey(const std::vector<uint8_t>& key);
    bool isReady() const { return !key_.empty(); }

    /**
     * Throws ChannelNotReadyError before setKey.
     */
    std::vector<uint8_t> seal(const std::vector<uint8_t>& plaintext);

    /**
     * Throws ChannelNotReadyError before setKey, DecryptionError when the blob
     * is too short or fails authentication.
     */
    std::vector<uint8_t> open(const std::vector<uint8_t>& sealed);

    std::string sealToBase64(const std::string& plaintext);
    std::string openFromBase64(const std::string& sealed_b64);

    /**
     * Wipe the key. The channel is unusable until the next setKey.
     */
    void reset();

private:
    CryptoProvider& provider_;
    std::vector<uint8_t> key_;

    SecureChannel(const SecureChannel&) = delete;
    SecureChannel& operator=(const SecureChannel&) = delete;
};

} // namespace crypto
} // namespace peerlink
