#pragma once
// =============================================================================
// CastLink Config Loader
// =============================================================================
// Loads settings from castlink.json with nlohmann/json. Every key has a
// default; CASTLINK_* environment variables override the file.
// =============================================================================

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include "castlink_log.hpp"
#include "castlink_protocol.hpp"
#include "transport.hpp"

namespace castlink {
namespace config {

struct TransportConfig {
    std::string kind = "wifi";           // "wifi" | "bluetooth"
    std::string target_address;          // Wi-Fi host
    std::string target_device;           // Bluetooth address
    int port = protocol::DEFAULT_WIFI_PORT;
};

struct BitrateConfig {
    uint32_t min_bps = 1000000;
    uint32_t max_bps = 20000000;
    uint32_t initial_bps = 15000000;
    int window_ms = 1000;
};

struct InputConfig {
    float dead_zone = 0.1f;
};

struct CryptoConfig {
    std::string key_dir = "keys";
    std::string key_alias = "castlink_encryption_key";
};

struct SessionConfig {
    int send_queue_capacity = 64;
};

struct LogConfig {
    std::string log_path;                // empty = stderr only
    std::string level = "info";
    bool to_stderr = true;               // false: log file / sink only
};

struct AppConfig {
    TransportConfig transport;
    BitrateConfig bitrate;
    InputConfig input;
    CryptoConfig crypto;
    SessionConfig session;
    LogConfig log;
};

inline std::optional<TransportKind> parseTransportKind(const std::string& name) {
    if (name == "wifi" || name == "socket") return TransportKind::WifiSocket;
    if (name == "bluetooth" || name == "bt") return TransportKind::Bluetooth;
    return std::nullopt;
}

// Connect target for the configured kind: "host:port" or the device address
inline std::string connectTarget(const AppConfig& config) {
    auto kind = parseTransportKind(config.transport.kind);
    if (kind && *kind == TransportKind::Bluetooth) return config.transport.target_device;
    return config.transport.target_address + ":" + std::to_string(config.transport.port);
}

// Safe JSON accessor with section/key and default value
template<typename T>
T jsonGet(const nlohmann::json& j, const std::string& section,
          const std::string& key, const T& def) {
    try {
        if (j.contains(section) && j[section].contains(key)) {
            return j[section][key].get<T>();
        }
    } catch (const nlohmann::json::exception& e) {
        CLOG_WARN("config", "%s.%s: %s, using default", section.c_str(), key.c_str(), e.what());
    }
    return def;
}

// Clamp values the core cannot run with back into range
inline void sanitize(AppConfig& config) {
    if (!parseTransportKind(config.transport.kind)) {
        CLOG_WARN("config", "Unknown transport.kind '%s', using wifi", config.transport.kind.c_str());
        config.transport.kind = "wifi";
    }
    if (config.transport.port < 1 || config.transport.port > 65535) {
        CLOG_WARN("config", "transport.port %d out of range, using %u",
                  config.transport.port, static_cast<unsigned>(protocol::DEFAULT_WIFI_PORT));
        config.transport.port = protocol::DEFAULT_WIFI_PORT;
    }
    if (config.bitrate.min_bps == 0) config.bitrate.min_bps = 1;
    if (config.bitrate.max_bps < config.bitrate.min_bps) {
        CLOG_WARN("config", "bitrate.max_bps below min_bps, swapping");
        std::swap(config.bitrate.min_bps, config.bitrate.max_bps);
    }
    if (config.bitrate.initial_bps < config.bitrate.min_bps) config.bitrate.initial_bps = config.bitrate.min_bps;
    if (config.bitrate.initial_bps > config.bitrate.max_bps) config.bitrate.initial_bps = config.bitrate.max_bps;
    if (config.bitrate.window_ms < 100) config.bitrate.window_ms = 100;
    if (config.input.dead_zone < 0.0f || config.input.dead_zone >= 1.0f) {
        CLOG_WARN("config", "input.dead_zone %.2f out of [0,1), using 0.1", config.input.dead_zone);
        config.input.dead_zone = 0.1f;
    }
    if (config.session.send_queue_capacity < 1) config.session.send_queue_capacity = 1;
    if (config.crypto.key_alias.empty()) config.crypto.key_alias = "castlink_encryption_key";
}

inline AppConfig parseConfig(const nlohmann::json& j) {
    AppConfig config;

    config.transport.kind = jsonGet<std::string>(j, "transport", "kind", "wifi");
    config.transport.target_address = jsonGet<std::string>(j, "transport", "target_address", "");
    config.transport.target_device = jsonGet<std::string>(j, "transport", "target_device", "");
    config.transport.port = jsonGet<int>(j, "transport", "port", protocol::DEFAULT_WIFI_PORT);

    config.bitrate.min_bps = jsonGet<uint32_t>(j, "bitrate", "min_bps", 1000000u);
    config.bitrate.max_bps = jsonGet<uint32_t>(j, "bitrate", "max_bps", 20000000u);
    config.bitrate.initial_bps = jsonGet<uint32_t>(j, "bitrate", "initial_bps", 15000000u);
    config.bitrate.window_ms = jsonGet<int>(j, "bitrate", "window_ms", 1000);

    config.input.dead_zone = jsonGet<float>(j, "input", "dead_zone", 0.1f);

    config.crypto.key_dir = jsonGet<std::string>(j, "crypto", "key_dir", "keys");
    config.crypto.key_alias = jsonGet<std::string>(j, "crypto", "key_alias", "castlink_encryption_key");

    config.session.send_queue_capacity = jsonGet<int>(j, "session", "send_queue_capacity", 64);

    config.log.log_path = jsonGet<std::string>(j, "log", "log_path", "");
    config.log.level = jsonGet<std::string>(j, "log", "level", "info");
    config.log.to_stderr = jsonGet<bool>(j, "log", "to_stderr", true);

    sanitize(config);
    return config;
}

inline bool envInt(const char* name, int& out) {
    const char* val = std::getenv(name);
    if (!val || !*val) return false;
    char* end = nullptr;
    long v = std::strtol(val, &end, 10);
    if (*end != '\0') {
        CLOG_WARN("config", "%s=%s is not a number, ignored", name, val);
        return false;
    }
    out = static_cast<int>(v);
    return true;
}

inline void applyEnvironmentOverrides(AppConfig& config) {
    const char* val;

    if ((val = std::getenv("CASTLINK_TRANSPORT"))) config.transport.kind = val;
    if ((val = std::getenv("CASTLINK_TARGET_ADDRESS"))) config.transport.target_address = val;
    if ((val = std::getenv("CASTLINK_TARGET_DEVICE"))) config.transport.target_device = val;
    envInt("CASTLINK_PORT", config.transport.port);
    if ((val = std::getenv("CASTLINK_KEY_DIR"))) config.crypto.key_dir = val;
    if ((val = std::getenv("CASTLINK_LOG_PATH"))) config.log.log_path = val;
    if ((val = std::getenv("CASTLINK_LOG_LEVEL"))) config.log.level = val;

    sanitize(config);
}

// @param configPath  Path to config file
// @param strict      If true, only try the exact path (no fallback search)
inline AppConfig loadConfig(const std::string& configPath = "castlink.json",
                            bool strict = false) {
    AppConfig config;

    std::ifstream file(configPath);
    if (!file.is_open() && !strict) {
        file.open("../castlink.json");
    }
    if (!file.is_open()) {
        CLOG_WARN("config", "%s not found, using defaults", configPath.c_str());
        applyEnvironmentOverrides(config);
        return config;
    }

    try {
        nlohmann::json j = nlohmann::json::parse(file);
        config = parseConfig(j);
    } catch (const nlohmann::json::exception& e) {
        CLOG_ERROR("config", "JSON parse error: %s", e.what());
        config = AppConfig{};
    }

    applyEnvironmentOverrides(config);

    CLOG_INFO("config", "Loaded: transport=%s target=%s bitrate=[%u..%u] dead_zone=%.2f",
              config.transport.kind.c_str(), connectTarget(config).c_str(),
              config.bitrate.min_bps, config.bitrate.max_bps, config.input.dead_zone);
    return config;
}

// Level and optional log file from the [log] section
inline void applyLogConfig(const LogConfig& log_config) {
    log::setLogLevel(log::parseLevel(log_config.level));
    log::setStderrEnabled(log_config.to_stderr);
    if (!log_config.log_path.empty() && !log::openLogFile(log_config.log_path.c_str())) {
        CLOG_WARN("config", "Cannot open log file %s", log_config.log_path.c_str());
    }
}

} // namespace config
} // namespace castlink
