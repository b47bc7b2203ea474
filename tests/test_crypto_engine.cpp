// =============================================================================
// Unit tests for CryptoEngine and FileKeyStore
// (src/crypto_engine.hpp/.cpp, src/key_store.hpp, src/file_key_store.cpp)
// =============================================================================
#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <set>
#include <string>
#include <vector>

#include "crypto_engine.hpp"
#include "frame_codec.hpp"

using namespace castlink;
using namespace castlink::protocol;
namespace fs = std::filesystem;

namespace {

std::shared_ptr<CryptoEngine> memoryEngine() {
    auto engine = CryptoEngine::create(std::make_shared<FileKeyStore>(""));
    EXPECT_TRUE(engine.is_ok());
    return engine.value();
}

std::vector<uint8_t> bytesOf(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

class TempKeyDir {
public:
    TempKeyDir() {
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = fs::temp_directory_path() / ("castlink_keys_" + std::to_string(stamp));
    }
    ~TempKeyDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    std::string str() const { return path_.string(); }
    fs::path keyFile(const std::string& alias) const { return path_ / (alias + ".key"); }

private:
    fs::path path_;
};

} // namespace

// ---------------------------------------------------------------------------
// CE-1: seal/open round trip, layout nonce || ciphertext || tag
// ---------------------------------------------------------------------------
TEST(CryptoEngineTest, SealOpenRoundTrip) {
    auto engine = memoryEngine();
    auto msg = bytesOf("keyframe bytes from the encoder");

    auto sealed = engine->seal(msg.data(), msg.size());
    ASSERT_TRUE(sealed.is_ok());
    EXPECT_EQ(sealed.value().size(), NONCE_SIZE + msg.size() + GCM_TAG_SIZE);

    auto opened = engine->open(sealed.value().data(), sealed.value().size());
    ASSERT_TRUE(opened.is_ok());
    EXPECT_EQ(opened.value(), msg);
}

TEST(CryptoEngineTest, EmptyPlaintext) {
    auto engine = memoryEngine();

    auto sealed = engine->seal(nullptr, 0);
    ASSERT_TRUE(sealed.is_ok());
    EXPECT_EQ(sealed.value().size(), NONCE_SIZE + GCM_TAG_SIZE);

    auto opened = engine->open(sealed.value().data(), sealed.value().size());
    ASSERT_TRUE(opened.is_ok());
    EXPECT_TRUE(opened.value().empty());
}

// ---------------------------------------------------------------------------
// CE-2: every call draws a fresh nonce
// ---------------------------------------------------------------------------
TEST(CryptoEngineTest, FreshNoncePerCall) {
    auto engine = memoryEngine();
    auto msg = bytesOf("same plaintext");

    std::set<std::vector<uint8_t>> nonces;
    std::set<std::vector<uint8_t>> bodies;
    for (int i = 0; i < 64; i++) {
        auto sealed = engine->encrypt(msg.data(), msg.size());
        ASSERT_TRUE(sealed.is_ok());
        nonces.emplace(sealed.value().nonce.begin(), sealed.value().nonce.end());
        bodies.insert(sealed.value().ciphertext);
    }
    EXPECT_EQ(nonces.size(), 64u);
    EXPECT_EQ(bodies.size(), 64u);
}

// ---------------------------------------------------------------------------
// CE-3: tampering and truncation fail authentication
// ---------------------------------------------------------------------------
TEST(CryptoEngineTest, FlippedCiphertextBitFailsAuth) {
    auto engine = memoryEngine();
    auto msg = bytesOf("payload");
    auto sealed = engine->seal(msg.data(), msg.size()).value();

    sealed[NONCE_SIZE + 2] ^= 0x01;
    auto opened = engine->open(sealed.data(), sealed.size());
    ASSERT_TRUE(opened.is_err());
    EXPECT_EQ(opened.error().kind, ErrorKind::AuthFailed);
}

TEST(CryptoEngineTest, FlippedTagFailsAuth) {
    auto engine = memoryEngine();
    auto msg = bytesOf("payload");
    auto sealed = engine->seal(msg.data(), msg.size()).value();

    sealed.back() ^= 0x80;
    auto opened = engine->open(sealed.data(), sealed.size());
    ASSERT_TRUE(opened.is_err());
    EXPECT_EQ(opened.error().kind, ErrorKind::AuthFailed);
}

TEST(CryptoEngineTest, FlippedNonceFailsAuth) {
    auto engine = memoryEngine();
    auto msg = bytesOf("payload");
    auto sealed = engine->seal(msg.data(), msg.size()).value();

    sealed[0] ^= 0xFF;
    EXPECT_EQ(engine->open(sealed.data(), sealed.size()).error().kind, ErrorKind::AuthFailed);
}

TEST(CryptoEngineTest, TruncatedPayloadFailsAuth) {
    auto engine = memoryEngine();
    std::vector<uint8_t> short_payload(NONCE_SIZE + GCM_TAG_SIZE - 1, 0x55);

    auto opened = engine->open(short_payload.data(), short_payload.size());
    ASSERT_TRUE(opened.is_err());
    EXPECT_EQ(opened.error().kind, ErrorKind::AuthFailed);
}

TEST(CryptoEngineTest, CiphertextShorterThanTagFailsAuth) {
    auto engine = memoryEngine();
    uint8_t nonce[NONCE_SIZE] = {};
    uint8_t ct[4] = {1, 2, 3, 4};

    auto r = engine->decrypt(nonce, ct, sizeof(ct));
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::AuthFailed);
}

TEST(CryptoEngineTest, DifferentKeyFailsAuth) {
    auto a = memoryEngine();
    auto b = memoryEngine();
    auto msg = bytesOf("payload");
    auto sealed = a->seal(msg.data(), msg.size()).value();

    EXPECT_EQ(b->open(sealed.data(), sealed.size()).error().kind, ErrorKind::AuthFailed);
}

// ---------------------------------------------------------------------------
// CE-4: the largest accepted plaintext still fits one video frame once sealed
// ---------------------------------------------------------------------------
TEST(CryptoEngineTest, LargestPlaintextFitsOneFrame) {
    auto engine = memoryEngine();
    std::vector<uint8_t> msg(MAX_VIDEO_PLAINTEXT);
    for (size_t i = 0; i < msg.size(); i += 4096) msg[i] = static_cast<uint8_t>(i >> 12);
    msg.back() = 0xA5;

    auto sealed = engine->seal(msg.data(), msg.size());
    ASSERT_TRUE(sealed.is_ok());
    ASSERT_EQ(sealed.value().size(), static_cast<size_t>(MAX_FRAME_PAYLOAD));

    auto wire = encodeVideoFrame(sealed.value().data(), sealed.value().size(), 1, 777);
    ASSERT_TRUE(wire.is_ok());

    FrameDecoder dec;
    dec.feed(wire.value().data(), wire.value().size());
    auto r = dec.decodeNext();
    ASSERT_EQ(r.status, FrameDecoder::Status::FrameReady);
    EXPECT_EQ(r.frame.video.timestamp_us, 777);

    auto opened = engine->open(r.frame.video.payload.data(), r.frame.video.payload.size());
    ASSERT_TRUE(opened.is_ok());
    EXPECT_TRUE(opened.value() == msg);
}

TEST(CryptoEngineTest, PlaintextOverFrameBoundRejected) {
    auto engine = memoryEngine();
    std::vector<uint8_t> msg(static_cast<size_t>(MAX_VIDEO_PLAINTEXT) + 1);

    auto sealed = engine->seal(msg.data(), msg.size());
    ASSERT_TRUE(sealed.is_err());
    EXPECT_EQ(sealed.error().kind, ErrorKind::InvalidArgument);
}

TEST(CryptoEngineTest, CreateWithoutStoreFails) {
    auto r = CryptoEngine::create(nullptr);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::InvalidArgument);
}

// ---------------------------------------------------------------------------
// KS-1: key is generated once, persisted and reused
// ---------------------------------------------------------------------------
TEST(FileKeyStoreTest, KeyPersistsAcrossInstances) {
    TempKeyDir dir;
    auto msg = bytesOf("persisted");

    std::vector<uint8_t> sealed;
    {
        auto engine = CryptoEngine::create(std::make_shared<FileKeyStore>(dir.str()));
        ASSERT_TRUE(engine.is_ok());
        sealed = engine.value()->seal(msg.data(), msg.size()).value();
    }
    ASSERT_TRUE(fs::exists(dir.keyFile(DEFAULT_KEY_ALIAS)));
    EXPECT_EQ(fs::file_size(dir.keyFile(DEFAULT_KEY_ALIAS)), KEY_SIZE);

    auto engine = CryptoEngine::create(std::make_shared<FileKeyStore>(dir.str()));
    ASSERT_TRUE(engine.is_ok());
    auto opened = engine.value()->open(sealed.data(), sealed.size());
    ASSERT_TRUE(opened.is_ok());
    EXPECT_EQ(opened.value(), msg);
}

TEST(FileKeyStoreTest, EnsureKeyExistsIsIdempotent) {
    FileKeyStore store("");
    auto h1 = store.ensureKeyExists("alias_a");
    auto h2 = store.ensureKeyExists("alias_a");
    auto h3 = store.ensureKeyExists("alias_b");
    ASSERT_TRUE(h1.is_ok() && h2.is_ok() && h3.is_ok());

    EXPECT_EQ(h1.value().id, h2.value().id);
    EXPECT_NE(h1.value().id, h3.value().id);
}

TEST(FileKeyStoreTest, InvalidAliasRejected) {
    FileKeyStore store("");
    EXPECT_EQ(store.ensureKeyExists("").error().kind, ErrorKind::InvalidArgument);
    EXPECT_EQ(store.ensureKeyExists("../escape").error().kind, ErrorKind::InvalidArgument);
    EXPECT_EQ(store.ensureKeyExists("..").error().kind, ErrorKind::InvalidArgument);
    EXPECT_EQ(store.ensureKeyExists(std::string(129, 'a')).error().kind, ErrorKind::InvalidArgument);
}

TEST(FileKeyStoreTest, CorruptKeyFileIsIoError) {
    TempKeyDir dir;
    fs::create_directories(dir.str());
    {
        std::ofstream f(dir.keyFile("broken"), std::ios::binary);
        f << "short";
    }

    FileKeyStore store(dir.str());
    auto r = store.ensureKeyExists("broken");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::IoError);
}

TEST(FileKeyStoreTest, UnknownHandleRejected) {
    FileKeyStore store("");
    KeyHandle bogus{"never_created", 77};
    uint8_t pt[4] = {};

    auto r = store.encrypt(bogus, pt, sizeof(pt));
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::InvalidArgument);
}
