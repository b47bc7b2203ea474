#include "key_store.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <cctype>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <memory>

#include "castlink_log.hpp"

namespace castlink {

using namespace protocol;
namespace fs = std::filesystem;

namespace {

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { if (ctx) EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

bool validAlias(const std::string& alias) {
    if (alias.empty() || alias.size() > 128) return false;
    for (char c : alias) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-' && c != '.') {
            return false;
        }
    }
    return alias != "." && alias != "..";
}

} // anonymous namespace

FileKeyStore::FileKeyStore(std::string key_dir) : key_dir_(std::move(key_dir)) {}

FileKeyStore::~FileKeyStore() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [alias, entry] : keys_) {
        OPENSSL_cleanse(entry.key.data(), entry.key.size());
    }
}

Result<FileKeyStore::Key> FileKeyStore::loadOrCreate(const std::string& alias) {
    Key key{};

    if (key_dir_.empty()) {
        if (RAND_bytes(key.data(), static_cast<int>(key.size())) != 1) {
            return Err<Key>(ErrorKind::IoError, "RAND_bytes failed while generating key");
        }
        return Ok(key);
    }

    const fs::path path = fs::path(key_dir_) / (alias + ".key");
    std::error_code ec;

    if (fs::exists(path, ec)) {
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open()) {
            return Err<Key>(ErrorKind::IoError, "cannot open key file " + path.string());
        }
        in.read(reinterpret_cast<char*>(key.data()), static_cast<std::streamsize>(key.size()));
        if (in.gcount() != static_cast<std::streamsize>(key.size()) || in.peek() != EOF) {
            OPENSSL_cleanse(key.data(), key.size());
            return Err<Key>(ErrorKind::IoError, "key file " + path.string() + " is corrupt");
        }
        CLOG_DEBUG("keystore", "Loaded key '%s'", alias.c_str());
        return Ok(key);
    }

    fs::create_directories(key_dir_, ec);
    if (ec) {
        return Err<Key>(ErrorKind::IoError,
                        "cannot create key directory " + key_dir_ + ": " + ec.message());
    }

    if (RAND_bytes(key.data(), static_cast<int>(key.size())) != 1) {
        return Err<Key>(ErrorKind::IoError, "RAND_bytes failed while generating key");
    }

    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            OPENSSL_cleanse(key.data(), key.size());
            return Err<Key>(ErrorKind::IoError, "cannot write key file " + path.string());
        }
        out.write(reinterpret_cast<const char*>(key.data()), static_cast<std::streamsize>(key.size()));
        if (!out) {
            OPENSSL_cleanse(key.data(), key.size());
            return Err<Key>(ErrorKind::IoError, "short write on key file " + path.string());
        }
    }
    fs::permissions(path, fs::perms::owner_read | fs::perms::owner_write,
                    fs::perm_options::replace, ec);
    if (ec) {
        CLOG_WARN("keystore", "Could not restrict permissions on %s: %s",
                  path.string().c_str(), ec.message().c_str());
    }

    CLOG_INFO("keystore", "Generated encryption key '%s'", alias.c_str());
    return Ok(key);
}

Result<KeyHandle> FileKeyStore::ensureKeyExists(const std::string& alias) {
    if (!validAlias(alias)) {
        return Err<KeyHandle>(ErrorKind::InvalidArgument, "invalid key alias '" + alias + "'");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = keys_.find(alias);
    if (it == keys_.end()) {
        auto key = loadOrCreate(alias);
        if (key.is_err()) return key.error();

        Entry entry;
        entry.id = next_id_++;
        entry.key = key.value();
        OPENSSL_cleanse(key.value().data(), key.value().size());
        it = keys_.emplace(alias, entry).first;
    }

    KeyHandle handle;
    handle.alias = alias;
    handle.id = it->second.id;
    return Ok(handle);
}

bool FileKeyStore::lookup(const KeyHandle& handle, Key& out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = keys_.find(handle.alias);
    if (it == keys_.end() || it->second.id != handle.id) return false;
    out = it->second.key;
    return true;
}

Result<SealedPayload> FileKeyStore::encrypt(const KeyHandle& handle,
                                            const uint8_t* plaintext, size_t len) {
    if (len > MAX_VIDEO_PLAINTEXT) {
        return Err<SealedPayload>(ErrorKind::InvalidArgument,
            "plaintext of " + std::to_string(len) + " bytes exceeds " +
            std::to_string(MAX_VIDEO_PLAINTEXT));
    }

    Key key;
    if (!lookup(handle, key)) {
        return Err<SealedPayload>(ErrorKind::InvalidArgument, "unknown key handle '" + handle.alias + "'");
    }

    SealedPayload sealed;
    if (RAND_bytes(sealed.nonce.data(), static_cast<int>(sealed.nonce.size())) != 1) {
        OPENSSL_cleanse(key.data(), key.size());
        return Err<SealedPayload>(ErrorKind::IoError, "RAND_bytes failed for nonce");
    }

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        OPENSSL_cleanse(key.data(), key.size());
        return Err<SealedPayload>(ErrorKind::IoError, "EVP_CIPHER_CTX_new failed");
    }

    sealed.ciphertext.resize(len + GCM_TAG_SIZE);
    static const uint8_t kEmpty[1] = {0};
    const uint8_t* in = len > 0 ? plaintext : kEmpty;
    int out_len = 0;
    int final_len = 0;

    bool ok =
        EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1 &&
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(NONCE_SIZE), nullptr) == 1 &&
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), sealed.nonce.data()) == 1 &&
        EVP_EncryptUpdate(ctx.get(), sealed.ciphertext.data(), &out_len, in, static_cast<int>(len)) == 1 &&
        EVP_EncryptFinal_ex(ctx.get(), sealed.ciphertext.data() + out_len, &final_len) == 1 &&
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(GCM_TAG_SIZE),
                            sealed.ciphertext.data() + len) == 1;

    OPENSSL_cleanse(key.data(), key.size());
    if (!ok) {
        return Err<SealedPayload>(ErrorKind::IoError, "AES-256-GCM encryption failed");
    }
    return Ok(std::move(sealed));
}

Result<std::vector<uint8_t>> FileKeyStore::decrypt(const KeyHandle& handle,
                                                   const uint8_t* nonce,
                                                   const uint8_t* ciphertext, size_t len) {
    if (len < GCM_TAG_SIZE) {
        return Err<std::vector<uint8_t>>(ErrorKind::AuthFailed, "ciphertext shorter than tag");
    }
    if (len > MAX_FRAME_PAYLOAD - NONCE_SIZE) {
        return Err<std::vector<uint8_t>>(ErrorKind::AuthFailed, "ciphertext exceeds frame bound");
    }

    Key key;
    if (!lookup(handle, key)) {
        return Err<std::vector<uint8_t>>(ErrorKind::InvalidArgument,
                                         "unknown key handle '" + handle.alias + "'");
    }

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        OPENSSL_cleanse(key.data(), key.size());
        return Err<std::vector<uint8_t>>(ErrorKind::IoError, "EVP_CIPHER_CTX_new failed");
    }

    const size_t body_len = len - GCM_TAG_SIZE;
    std::vector<uint8_t> plaintext(body_len + 1);  // +1 keeps data() valid for empty bodies
    static const uint8_t kEmpty[1] = {0};
    const uint8_t* in = body_len > 0 ? ciphertext : kEmpty;
    std::array<uint8_t, GCM_TAG_SIZE> tag;
    memcpy(tag.data(), ciphertext + body_len, GCM_TAG_SIZE);
    int out_len = 0;
    int final_len = 0;

    bool setup =
        EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1 &&
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(NONCE_SIZE), nullptr) == 1 &&
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce) == 1 &&
        EVP_DecryptUpdate(ctx.get(), plaintext.data(), &out_len, in, static_cast<int>(body_len)) == 1 &&
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(GCM_TAG_SIZE), tag.data()) == 1;

    OPENSSL_cleanse(key.data(), key.size());
    if (!setup) {
        return Err<std::vector<uint8_t>>(ErrorKind::IoError, "AES-256-GCM decrypt setup failed");
    }

    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + out_len, &final_len) != 1) {
        OPENSSL_cleanse(plaintext.data(), plaintext.size());
        return Err<std::vector<uint8_t>>(ErrorKind::AuthFailed, "GCM tag mismatch");
    }

    plaintext.resize(body_len);
    return Ok(std::move(plaintext));
}

} // namespace castlink
