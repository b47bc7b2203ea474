// =============================================================================
// CastLink - Crypto Engine
// =============================================================================
// AES-256-GCM sealing of video payloads. Every call draws a fresh 96-bit nonce;
// the key lives in the injected KeyStore and is addressed by handle only.
//
// On-wire payload layout produced by seal():
//   nonce (12) | ciphertext (N) | tag (16)
// =============================================================================
#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "key_store.hpp"
#include "result.hpp"

namespace castlink {

static constexpr const char* DEFAULT_KEY_ALIAS = "castlink_encryption_key";

class CryptoEngine {
public:
    // Ensures the key for `alias` exists. Fails if the store cannot produce it.
    static Result<std::shared_ptr<CryptoEngine>> create(std::shared_ptr<KeyStore> store,
                                                        const std::string& alias = DEFAULT_KEY_ALIAS);

    CryptoEngine(std::shared_ptr<KeyStore> store, KeyHandle handle);

    Result<SealedPayload> encrypt(const uint8_t* plaintext, size_t len);
    Result<std::vector<uint8_t>> decrypt(const uint8_t* nonce,
                                         const uint8_t* ciphertext, size_t len);

    // nonce || ciphertext || tag in one buffer
    Result<std::vector<uint8_t>> seal(const uint8_t* plaintext, size_t len);
    // AuthFailed when shorter than nonce + tag or the tag does not verify
    Result<std::vector<uint8_t>> open(const uint8_t* payload, size_t len);

    const KeyHandle& handle() const { return handle_; }

private:
    std::shared_ptr<KeyStore> store_;
    KeyHandle handle_;
};

} // namespace castlink
