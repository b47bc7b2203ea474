// =============================================================================
// CastLink - Secure Key Store
// =============================================================================
// The store owns the symmetric key material. Callers only ever hold a
// KeyHandle and ask the store to encrypt/decrypt; raw key bytes never leave it.
// =============================================================================
#pragma once
#include <array>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "castlink_protocol.hpp"
#include "result.hpp"

namespace castlink {

// Opaque reference to a key inside a KeyStore
struct KeyHandle {
    std::string alias;
    uint64_t id = 0;
};

struct SealedPayload {
    std::array<uint8_t, protocol::NONCE_SIZE> nonce{};
    std::vector<uint8_t> ciphertext;  // ciphertext || tag
};

class KeyStore {
public:
    virtual ~KeyStore() = default;

    // Generate the key for `alias` if absent (once per install), never rotate
    virtual Result<KeyHandle> ensureKeyExists(const std::string& alias) = 0;

    // InvalidArgument above protocol::MAX_VIDEO_PLAINTEXT
    virtual Result<SealedPayload> encrypt(const KeyHandle& handle,
                                          const uint8_t* plaintext, size_t len) = 0;

    // AuthFailed on tag mismatch or truncated input
    virtual Result<std::vector<uint8_t>> decrypt(const KeyHandle& handle,
                                                 const uint8_t* nonce,
                                                 const uint8_t* ciphertext, size_t len) = 0;
};

/**
 * Software key store backed by OpenSSL AES-256-GCM.
 * Keys persist as <key_dir>/<alias>.key (32 raw bytes, owner-only permissions).
 * An empty key_dir keeps keys in memory for the lifetime of the store.
 */
class FileKeyStore : public KeyStore {
public:
    explicit FileKeyStore(std::string key_dir);
    ~FileKeyStore() override;

    Result<KeyHandle> ensureKeyExists(const std::string& alias) override;
    Result<SealedPayload> encrypt(const KeyHandle& handle,
                                  const uint8_t* plaintext, size_t len) override;
    Result<std::vector<uint8_t>> decrypt(const KeyHandle& handle,
                                         const uint8_t* nonce,
                                         const uint8_t* ciphertext, size_t len) override;

    const std::string& keyDirectory() const { return key_dir_; }

private:
    using Key = std::array<uint8_t, protocol::KEY_SIZE>;

    struct Entry {
        uint64_t id = 0;
        Key key{};
    };

    Result<Key> loadOrCreate(const std::string& alias);
    bool lookup(const KeyHandle& handle, Key& out) const;

    std::string key_dir_;
    mutable std::mutex mutex_;
    std::map<std::string, Entry> keys_;
    uint64_t next_id_ = 1;
};

} // namespace castlink
