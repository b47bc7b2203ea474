// =============================================================================
// Unit tests for config_loader.hpp
// Tests: defaults, file loading, sanitizing, environment overrides
// =============================================================================
#include <gtest/gtest.h>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include "config_loader.hpp"

using namespace castlink;
using namespace castlink::config;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------
static void writeTmpJson(const char* path, const char* content) {
    std::ofstream f(path);
    f << content;
}

static void setEnv(const char* name, const char* value) {
#ifdef _WIN32
    _putenv_s(name, value);
#else
    setenv(name, value, 1);
#endif
}

static void unsetEnv(const char* name) {
#ifdef _WIN32
    _putenv_s(name, "");
#else
    unsetenv(name);
#endif
}

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override { clearEnv(); }
    void TearDown() override { clearEnv(); }

    static void clearEnv() {
        for (const char* name : {"CASTLINK_TRANSPORT", "CASTLINK_TARGET_ADDRESS",
                                 "CASTLINK_TARGET_DEVICE", "CASTLINK_PORT", "CASTLINK_KEY_DIR",
                                 "CASTLINK_LOG_PATH", "CASTLINK_LOG_LEVEL"}) {
            unsetEnv(name);
        }
    }
};

// ---------------------------------------------------------------------------
// C-1: AppConfig defaults
// ---------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, DefaultValues) {
    AppConfig cfg;
    EXPECT_EQ(cfg.transport.kind,                "wifi");
    EXPECT_EQ(cfg.transport.port,                9295);
    EXPECT_TRUE(cfg.transport.target_address.empty());
    EXPECT_EQ(cfg.bitrate.min_bps,               1000000u);
    EXPECT_EQ(cfg.bitrate.max_bps,               20000000u);
    EXPECT_EQ(cfg.bitrate.initial_bps,           15000000u);
    EXPECT_EQ(cfg.bitrate.window_ms,             1000);
    EXPECT_FLOAT_EQ(cfg.input.dead_zone,         0.1f);
    EXPECT_EQ(cfg.crypto.key_dir,                "keys");
    EXPECT_EQ(cfg.crypto.key_alias,              "castlink_encryption_key");
    EXPECT_EQ(cfg.session.send_queue_capacity,   64);
    EXPECT_TRUE(cfg.log.log_path.empty());
    EXPECT_EQ(cfg.log.level,                     "info");
    EXPECT_TRUE(cfg.log.to_stderr);
}

// ---------------------------------------------------------------------------
// C-2: missing file returns defaults
// ---------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, LoadConfigMissingFileReturnsDefaults) {
    AppConfig cfg = loadConfig("__nonexistent_castlink_xyz.json", true);
    EXPECT_EQ(cfg.transport.kind, "wifi");
    EXPECT_EQ(cfg.transport.port, 9295);
    EXPECT_EQ(cfg.crypto.key_dir, "keys");
}

// ---------------------------------------------------------------------------
// C-3: full file
// ---------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, LoadFullFile) {
    const char* path = "__test_castlink_full.json";
    writeTmpJson(path, R"({
        "transport": {"kind": "bluetooth", "target_address": "192.168.1.20",
                      "target_device": "AA:BB:CC:DD:EE:FF", "port": 9400},
        "bitrate":   {"min_bps": 2000000, "max_bps": 12000000, "initial_bps": 8000000, "window_ms": 500},
        "input":     {"dead_zone": 0.2},
        "crypto":    {"key_dir": "/tmp/castlink_keys", "key_alias": "living_room"},
        "session":   {"send_queue_capacity": 16},
        "log":       {"log_path": "castlink.log", "level": "debug", "to_stderr": false}
    })");

    AppConfig cfg = loadConfig(path, true);
    EXPECT_EQ(cfg.transport.kind,              "bluetooth");
    EXPECT_EQ(cfg.transport.target_address,    "192.168.1.20");
    EXPECT_EQ(cfg.transport.target_device,     "AA:BB:CC:DD:EE:FF");
    EXPECT_EQ(cfg.transport.port,              9400);
    EXPECT_EQ(cfg.bitrate.min_bps,             2000000u);
    EXPECT_EQ(cfg.bitrate.max_bps,             12000000u);
    EXPECT_EQ(cfg.bitrate.initial_bps,         8000000u);
    EXPECT_EQ(cfg.bitrate.window_ms,           500);
    EXPECT_FLOAT_EQ(cfg.input.dead_zone,       0.2f);
    EXPECT_EQ(cfg.crypto.key_dir,              "/tmp/castlink_keys");
    EXPECT_EQ(cfg.crypto.key_alias,            "living_room");
    EXPECT_EQ(cfg.session.send_queue_capacity, 16);
    EXPECT_EQ(cfg.log.log_path,                "castlink.log");
    EXPECT_EQ(cfg.log.level,                   "debug");
    EXPECT_FALSE(cfg.log.to_stderr);
    std::remove(path);
}

// ---------------------------------------------------------------------------
// C-4: partial file keeps defaults for missing sections
// ---------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, PartialFileKeepsDefaults) {
    const char* path = "__test_castlink_partial.json";
    writeTmpJson(path, R"({"transport": {"target_address": "10.0.0.5"}})");

    AppConfig cfg = loadConfig(path, true);
    EXPECT_EQ(cfg.transport.target_address, "10.0.0.5");
    EXPECT_EQ(cfg.transport.port,           9295);
    EXPECT_EQ(cfg.bitrate.initial_bps,      15000000u);
    EXPECT_EQ(cfg.crypto.key_alias,         "castlink_encryption_key");
    std::remove(path);
}

// ---------------------------------------------------------------------------
// C-5: malformed JSON falls back to defaults
// ---------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, MalformedJsonUsesDefaults) {
    const char* path = "__test_castlink_bad.json";
    writeTmpJson(path, R"({"transport": {"kind": "bluetooth",)");

    AppConfig cfg = loadConfig(path, true);
    EXPECT_EQ(cfg.transport.kind, "wifi");
    std::remove(path);
}

TEST_F(ConfigLoaderTest, WrongTypeUsesKeyDefault) {
    nlohmann::json j = nlohmann::json::parse(R"({"transport": {"port": "not a port", "kind": "bluetooth"}})");
    AppConfig cfg = parseConfig(j);
    EXPECT_EQ(cfg.transport.port, 9295);
    EXPECT_EQ(cfg.transport.kind, "bluetooth");
}

// ---------------------------------------------------------------------------
// C-6: sanitize
// ---------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, SanitizeClampsValues) {
    nlohmann::json j = nlohmann::json::parse(R"({
        "transport": {"kind": "carrier-pigeon", "port": 70000},
        "bitrate":   {"min_bps": 9000000, "max_bps": 3000000, "initial_bps": 50000000, "window_ms": 5},
        "input":     {"dead_zone": 1.5},
        "session":   {"send_queue_capacity": 0}
    })");
    AppConfig cfg = parseConfig(j);
    EXPECT_EQ(cfg.transport.kind, "wifi");
    EXPECT_EQ(cfg.transport.port, 9295);
    EXPECT_EQ(cfg.bitrate.min_bps, 3000000u);
    EXPECT_EQ(cfg.bitrate.max_bps, 9000000u);
    EXPECT_EQ(cfg.bitrate.initial_bps, 9000000u);
    EXPECT_EQ(cfg.bitrate.window_ms, 100);
    EXPECT_FLOAT_EQ(cfg.input.dead_zone, 0.1f);
    EXPECT_EQ(cfg.session.send_queue_capacity, 1);
}

// ---------------------------------------------------------------------------
// C-7: environment overrides the file
// ---------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, EnvironmentOverridesFile) {
    const char* path = "__test_castlink_env.json";
    writeTmpJson(path, R"({"transport": {"kind": "wifi", "target_address": "10.0.0.5", "port": 9400}})");

    setEnv("CASTLINK_TRANSPORT", "bt");
    setEnv("CASTLINK_TARGET_DEVICE", "11:22:33:44:55:66");
    setEnv("CASTLINK_PORT", "9500");
    setEnv("CASTLINK_LOG_LEVEL", "warn");

    AppConfig cfg = loadConfig(path, true);
    EXPECT_EQ(cfg.transport.kind,           "bt");
    EXPECT_EQ(cfg.transport.target_address, "10.0.0.5");
    EXPECT_EQ(cfg.transport.target_device,  "11:22:33:44:55:66");
    EXPECT_EQ(cfg.transport.port,           9500);
    EXPECT_EQ(cfg.log.level,                "warn");
    std::remove(path);
}

TEST_F(ConfigLoaderTest, NonNumericPortEnvIgnored) {
    setEnv("CASTLINK_PORT", "ninety");
    AppConfig cfg = loadConfig("__nonexistent_castlink_xyz.json", true);
    EXPECT_EQ(cfg.transport.port, 9295);
}

// ---------------------------------------------------------------------------
// C-8: transport kind names and connect target
// ---------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, ParseTransportKind) {
    EXPECT_EQ(parseTransportKind("wifi"),      TransportKind::WifiSocket);
    EXPECT_EQ(parseTransportKind("socket"),    TransportKind::WifiSocket);
    EXPECT_EQ(parseTransportKind("bluetooth"), TransportKind::Bluetooth);
    EXPECT_EQ(parseTransportKind("bt"),        TransportKind::Bluetooth);
    EXPECT_FALSE(parseTransportKind("usb").has_value());
}

TEST_F(ConfigLoaderTest, ConnectTargetPerKind) {
    AppConfig cfg;
    cfg.transport.target_address = "192.168.0.9";
    cfg.transport.target_device = "AA:BB:CC:DD:EE:FF";
    EXPECT_EQ(connectTarget(cfg), "192.168.0.9:9295");

    cfg.transport.kind = "bluetooth";
    EXPECT_EQ(connectTarget(cfg), "AA:BB:CC:DD:EE:FF");
}
