#include "crypto_engine.hpp"

#include <cstring>

#include "castlink_log.hpp"

namespace castlink {

using namespace protocol;

Result<std::shared_ptr<CryptoEngine>> CryptoEngine::create(std::shared_ptr<KeyStore> store,
                                                           const std::string& alias) {
    if (!store) {
        return Err<std::shared_ptr<CryptoEngine>>(ErrorKind::InvalidArgument, "no key store");
    }
    auto handle = store->ensureKeyExists(alias);
    if (handle.is_err()) {
        CLOG_ERROR("crypto", "Key '%s' unavailable: %s", alias.c_str(),
                   handle.error().message.c_str());
        return handle.error();
    }
    return Ok(std::make_shared<CryptoEngine>(std::move(store), handle.value()));
}

CryptoEngine::CryptoEngine(std::shared_ptr<KeyStore> store, KeyHandle handle)
    : store_(std::move(store)), handle_(std::move(handle)) {}

Result<SealedPayload> CryptoEngine::encrypt(const uint8_t* plaintext, size_t len) {
    return store_->encrypt(handle_, plaintext, len);
}

Result<std::vector<uint8_t>> CryptoEngine::decrypt(const uint8_t* nonce,
                                                   const uint8_t* ciphertext, size_t len) {
    return store_->decrypt(handle_, nonce, ciphertext, len);
}

Result<std::vector<uint8_t>> CryptoEngine::seal(const uint8_t* plaintext, size_t len) {
    auto sealed = encrypt(plaintext, len);
    if (sealed.is_err()) return sealed.error();

    const SealedPayload& s = sealed.value();
    std::vector<uint8_t> out(NONCE_SIZE + s.ciphertext.size());
    memcpy(out.data(), s.nonce.data(), NONCE_SIZE);
    memcpy(out.data() + NONCE_SIZE, s.ciphertext.data(), s.ciphertext.size());
    return Ok(std::move(out));
}

Result<std::vector<uint8_t>> CryptoEngine::open(const uint8_t* payload, size_t len) {
    if (len < NONCE_SIZE + GCM_TAG_SIZE) {
        return Err<std::vector<uint8_t>>(ErrorKind::AuthFailed,
            "sealed payload of " + std::to_string(len) + " bytes is truncated");
    }
    return decrypt(payload, payload + NONCE_SIZE, len - NONCE_SIZE);
}

} // namespace castlink
