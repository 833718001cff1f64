#pragma once

/**
 * PeerLink cryptographic primitives
 *
 * - X25519 for key agreement
 * - SHA-256 for session key derivation
 * - AES-256-GCM for message encryption
 *
 * The session layer only talks to the CryptoProvider interface; the OpenSSL
 * implementation below is the one used in production and in tests.
 */

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace peerlink {
namespace crypto {

constexpr size_t kKeySize = 32;        // AES-256 key / SHA-256 digest
constexpr size_t kNonceSize = 12;      // AES-GCM nonce
constexpr size_t kTagSize = 16;        // AES-GCM tag
constexpr size_t kX25519KeySize = 32;

/**
 * Key pair for X25519 key exchange
 */
struct KeyPair {
    std::vector<uint8_t> public_key;  // 32 bytes
    std::vector<uint8_t> private_key; // 32 bytes
};

class CryptoProvider {
public:
    virtual ~CryptoProvider() = default;

    /**
     * Generate a fresh ephemeral X25519 key pair.
     */
    virtual KeyPair generateKeyPair() = 0;

    /**
     * Raw X25519 agreement of own private key with the peer's public key.
     * Throws std::invalid_argument on wrong key sizes, std::runtime_error when
     * the agreement itself fails (for example a low-order peer point).
     */
    virtual std::vector<uint8_t> deriveSharedSecret(
        const std::vector<uint8_t>& own_private_key,
        const std::vector<uint8_t>& peer_public_key
    ) = 0;

    /**
     * Fixed-length digest (kKeySize bytes).
     */
    virtual std::vector<uint8_t> hash(const std::vector<uint8_t>& data) = 0;

    /**
     * AEAD encrypt. Returns ciphertext followed by the kTagSize-byte tag.
     */
    virtual std::vector<uint8_t> seal(
        const std::vector<uint8_t>& key,
        const std::vector<uint8_t>& nonce,
        const std::vector<uint8_t>& plaintext
    ) = 0;

    /**
     * AEAD decrypt of ciphertext||tag.
     * Returns false when authentication fails; plaintext is left empty.
     */
    virtual bool open(
        const std::vector<uint8_t>& key,
        const std::vector<uint8_t>& nonce,
        const std::vector<uint8_t>& sealed,
        std::vector<uint8_t>& plaintext
    ) = 0;

    virtual std::vector<uint8_t> randomBytes(size_t length) = 0;
};

/**
 * CryptoProvider backed by OpenSSL EVP.
 */
class OpenSslCryptoProvider : public CryptoProvider {
public:
    OpenSslCryptoProvider() = default;

    KeyPair generateKeyPair() override;
    std::vector<uint8_t> deriveSharedSecret(
        const std::vector<uint8_t>& own_private_key,
        const std::vector<uint8_t>& peer_public_key
    ) override;
    std::vector<uint8_t> hash(const std::vector<uint8_t>& data) override;
    std::vector<uint8_t> seal(
        const std::vector<uint8_t>& key,
        const std::vector<uint8_t>& nonce,
        const std::vector<uint8_t>& plaintext
    ) override;
    bool open(
        const std::vector<uint8_t>& key,
        const std::vector<uint8_t>& nonce,
        const std::vector<uint8_t>& sealed,
        std::vector<uint8_t>& plaintext
    ) override;
    std::vector<uint8_t> randomBytes(size_t length) override;

private:
    OpenSslCryptoProvider(const OpenSslCryptoProvider&) = delete;
    OpenSslCryptoProvider& operator=(const OpenSslCryptoProvider&) = delete;
};

/**
 * Base64 encode bytes (standard alphabet, padded, no newlines).
 */
std::string base64Encode(const std::vector<uint8_t>& data);

/**
 * Base64 decode. Throws std::invalid_argument on malformed input.
 */
std::vector<uint8_t> base64Decode(const std::string& encoded);

/**
 * Constant-time comparison of two byte arrays.
 */
bool constantTimeEquals(const std::vector<uint8_t>& a, const std::vector<uint8_t>& b);

/**
 * Overwrite and clear key material.
 */
void secureWipe(std::vector<uint8_t>& data);

} // namespace crypto
} // namespace peerlink
