/**
 * OpenSSL implementation of the PeerLink primitives:
 * - X25519 for key exchange
 * - SHA-256 for key derivation
 * - AES-256-GCM for authenticated encryption
 */

#include "../../include/crypto/crypto_provider.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/crypto.h>
#include <openssl/sha.h>
#include <memory>
#include <stdexcept>
#include <string>

namespace peerlink {
namespace crypto {

namespace {

// Owning pointer that releases an OpenSSL object with its matching free function
template <typename T, void (*Free)(T*)>
struct OpenSslFree {
    void operator()(T* ptr) const { Free(ptr); }
};

template <typename T, void (*Free)(T*)>
using OpenSslPtr = std::unique_ptr<T, OpenSslFree<T, Free>>;

using PkeyPtr = OpenSslPtr<EVP_PKEY, EVP_PKEY_free>;
using PkeyCtxPtr = OpenSslPtr<EVP_PKEY_CTX, EVP_PKEY_CTX_free>;
using CipherCtxPtr = OpenSslPtr<EVP_CIPHER_CTX, EVP_CIPHER_CTX_free>;

// OpenSSL reports success as a positive return
void check(int result, const char* what) {
    if (result <= 0) {
        throw std::runtime_error(std::string("OpenSSL: ") + what);
    }
}

PkeyPtr x25519Key(const std::vector<uint8_t>& raw, bool is_private) {
    EVP_PKEY* key = is_private
        ? EVP_PKEY_new_raw_private_key(EVP_PKEY_X25519, nullptr, raw.data(), raw.size())
        : EVP_PKEY_new_raw_public_key(EVP_PKEY_X25519, nullptr, raw.data(), raw.size());
    if (!key) {
        throw std::runtime_error(is_private ? "OpenSSL: load X25519 private key"
                                            : "OpenSSL: load X25519 public key");
    }
    return PkeyPtr(key);
}

void checkAeadInputs(const std::vector<uint8_t>& key, const std::vector<uint8_t>& nonce) {
    if (key.size() != kKeySize) {
        throw std::invalid_argument("Invalid key size");
    }
    if (nonce.size() != kNonceSize) {
        throw std::invalid_argument("Invalid nonce size");
    }
}

bool isBase64Char(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') || c == '+' || c == '/';
}

} // namespace

std::vector<uint8_t> OpenSslCryptoProvider::randomBytes(size_t length) {
    std::vector<uint8_t> buffer(length);
    if (length > 0 && RAND_bytes(buffer.data(), static_cast<int>(length)) != 1) {
        throw std::runtime_error("Failed to generate random bytes");
    }
    return buffer;
}

KeyPair OpenSslCryptoProvider::generateKeyPair() {
    PkeyCtxPtr keygen(EVP_PKEY_CTX_new_id(EVP_PKEY_X25519, nullptr));
    if (!keygen) {
        throw std::runtime_error("OpenSSL: X25519 context");
    }
    check(EVP_PKEY_keygen_init(keygen.get()), "X25519 keygen init");

    EVP_PKEY* generated = nullptr;
    check(EVP_PKEY_keygen(keygen.get(), &generated), "X25519 keygen");
    PkeyPtr key(generated);

    KeyPair pair;
    pair.public_key.resize(kX25519KeySize);
    pair.private_key.resize(kX25519KeySize);
    size_t public_len = pair.public_key.size();
    size_t private_len = pair.private_key.size();
    try {
        check(EVP_PKEY_get_raw_public_key(key.get(), pair.public_key.data(), &public_len), "export public key");
        check(EVP_PKEY_get_raw_private_key(key.get(), pair.private_key.data(), &private_len), "export private key");
    } catch (const std::runtime_error&) {
        secureWipe(pair.private_key);
        throw;
    }
    return pair;
}

std::vector<uint8_t> OpenSslCryptoProvider::deriveSharedSecret(
    const std::vector<uint8_t>& own_private_key,
    const std::vector<uint8_t>& peer_public_key
) {
    if (own_private_key.size() != kX25519KeySize || peer_public_key.size() != kX25519KeySize) {
        throw std::invalid_argument("Invalid key size");
    }

    PkeyPtr own = x25519Key(own_private_key, true);
    PkeyPtr peer = x25519Key(peer_public_key, false);

    PkeyCtxPtr derive(EVP_PKEY_CTX_new(own.get(), nullptr));
    if (!derive) {
        throw std::runtime_error("OpenSSL: derivation context");
    }
    check(EVP_PKEY_derive_init(derive.get()), "derive init");
    check(EVP_PKEY_derive_set_peer(derive.get(), peer.get()), "derive set peer");

    std::vector<uint8_t> secret(kX25519KeySize);
    size_t secret_len = secret.size();
    try {
        check(EVP_PKEY_derive(derive.get(), secret.data(), &secret_len), "derive");
    } catch (const std::runtime_error&) {
        secureWipe(secret);
        throw;
    }
    secret.resize(secret_len);
    return secret;
}

std::vector<uint8_t> OpenSslCryptoProvider::hash(const std::vector<uint8_t>& data) {
    std::vector<uint8_t> digest(SHA256_DIGEST_LENGTH);
    unsigned int digest_len = 0;
    if (EVP_Digest(data.data(), data.size(), digest.data(), &digest_len, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Failed to compute SHA-256");
    }
    digest.resize(digest_len);
    return digest;
}

std::vector<uint8_t> OpenSslCryptoProvider::seal(
    const std::vector<uint8_t>& key,
    const std::vector<uint8_t>& nonce,
    const std::vector<uint8_t>& plaintext
) {
    checkAeadInputs(key, nonce);

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx.get()) {
        throw std::runtime_error("Failed to create cipher context");
    }

    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1) {
        throw std::runtime_error("Failed to init encryption");
    }

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kNonceSize), nullptr) != 1) {
        throw std::runtime_error("Failed to set nonce length");
    }

    if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1) {
        throw std::runtime_error("Failed to set key/nonce");
    }

    std::vector<uint8_t> sealed(plaintext.size() + kTagSize);
    int len = 0;
    if (!plaintext.empty()) {
        if (EVP_EncryptUpdate(ctx.get(), sealed.data(), &len,
                plaintext.data(), static_cast<int>(plaintext.size())) != 1) {
            throw std::runtime_error("Failed to encrypt");
        }
    }
    int ciphertext_len = len;

    if (EVP_EncryptFinal_ex(ctx.get(), sealed.data() + ciphertext_len, &len) != 1) {
        throw std::runtime_error("Failed to finalize encryption");
    }
    ciphertext_len += len;

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(kTagSize),
            sealed.data() + ciphertext_len) != 1) {
        throw std::runtime_error("Failed to get tag");
    }
    sealed.resize(ciphertext_len + kTagSize);

    return sealed;
}

bool OpenSslCryptoProvider::open(
    const std::vector<uint8_t>& key,
    const std::vector<uint8_t>& nonce,
    const std::vector<uint8_t>& sealed,
    std::vector<uint8_t>& plaintext
) {
    checkAeadInputs(key, nonce);
    plaintext.clear();
    if (sealed.size() < kTagSize) {
        return false;
    }
    const size_t ciphertext_size = sealed.size() - kTagSize;

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx.get()) {
        throw std::runtime_error("Failed to create cipher context");
    }

    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1) {
        throw std::runtime_error("Failed to init decryption");
    }

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kNonceSize), nullptr) != 1) {
        throw std::runtime_error("Failed to set nonce length");
    }

    if (EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1) {
        throw std::runtime_error("Failed to set key/nonce");
    }

    std::vector<uint8_t> output(ciphertext_size + kTagSize);
    int len = 0;
    if (ciphertext_size > 0) {
        if (EVP_DecryptUpdate(ctx.get(), output.data(), &len,
                sealed.data(), static_cast<int>(ciphertext_size)) != 1) {
            return false;
        }
    }
    int plaintext_len = len;

    std::vector<uint8_t> tag(sealed.end() - kTagSize, sealed.end());
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(kTagSize), tag.data()) != 1) {
        return false;
    }

    // Tag verification happens here
    if (EVP_DecryptFinal_ex(ctx.get(), output.data() + plaintext_len, &len) != 1) {
        secureWipe(output);
        return false;
    }
    plaintext_len += len;

    output.resize(plaintext_len);
    plaintext = std::move(output);
    return true;
}

std::string base64Encode(const std::vector<uint8_t>& data) {
    if (data.empty()) {
        return "";
    }
    std::string result(4 * ((data.size() + 2) / 3), '\0');
    const int written = EVP_EncodeBlock(
        reinterpret_cast<unsigned char*>(&result[0]), data.data(), static_cast<int>(data.size()));
    result.resize(static_cast<size_t>(written));
    return result;
}

std::vector<uint8_t> base64Decode(const std::string& encoded) {
    if (encoded.empty()) {
        return {};
    }
    if (encoded.size() % 4 != 0) {
        throw std::invalid_argument("Base64 input length is not a multiple of 4");
    }

    size_t padding = 0;
    for (size_t i = 0; i < encoded.size(); i++) {
        const char c = encoded[i];
        if (c == '=') {
            if (i < encoded.size() - 2) {
                throw std::invalid_argument("Base64 padding in the middle of input");
            }
            padding++;
        } else if (padding > 0 || !isBase64Char(c)) {
            throw std::invalid_argument("Invalid base64 character");
        }
    }

    std::vector<uint8_t> result(3 * (encoded.size() / 4));
    const int decoded_len = EVP_DecodeBlock(
        result.data(), reinterpret_cast<const unsigned char*>(encoded.data()),
        static_cast<int>(encoded.size()));
    if (decoded_len < 0) {
        throw std::invalid_argument("Base64 decode failed");
    }

    // EVP_DecodeBlock counts padding as zero bytes
    result.resize(static_cast<size_t>(decoded_len) - padding);
    return result;
}

bool constantTimeEquals(const std::vector<uint8_t>& a, const std::vector<uint8_t>& b) {
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

void secureWipe(std::vector<uint8_t>& data) {
    if (!data.empty()) {
        OPENSSL_cleanse(data.data(), data.size());
    }
    data.clear();
}

} // namespace crypto
} // namespace peerlink
