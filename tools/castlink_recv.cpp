// castlink_recv - accept one sender, decrypt its video and log its input
//
// Usage: castlink_recv [--config castlink.json] [--port N] [--out video.bin]
//
// Decrypted frames are written as [u32 BE length][u32 BE flags][i64 BE timestamp][bytes].

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>
#include <variant>

#include "castlink_log.hpp"
#include "castlink_protocol.hpp"
#include "config_loader.hpp"
#include "crypto_engine.hpp"
#include "input_state.hpp"
#include "session.hpp"
#include "socket_listener.hpp"

using namespace castlink;

namespace {

void usage() {
    fprintf(stderr, "Usage: castlink_recv [--config FILE] [--port N] [--out FILE]\n");
}

void writeFrame(std::ofstream& out, const VideoFrame& frame) {
    uint8_t header[16];
    protocol::put_u32_be(header, static_cast<uint32_t>(frame.payload.size()));
    protocol::put_u32_be(header + 4, frame.flags);
    protocol::put_u64_be(header + 8, static_cast<uint64_t>(frame.timestamp_us));
    out.write(reinterpret_cast<const char*>(header), sizeof(header));
    out.write(reinterpret_cast<const char*>(frame.payload.data()),
              static_cast<std::streamsize>(frame.payload.size()));
}

void logInput(const InputEvent& ev) {
    if (ev.kind == InputKind::Button) {
        const char* name = pad::buttonName(ev.code);
        CLOG_INFO("recv", "button %s(%d) %s", name ? name : "?", ev.code,
                  ev.value > 0.5f ? "down" : "up");
    } else if (ev.kind == InputKind::Touchpad && !ev.active) {
        CLOG_INFO("recv", "touchpad released");
    } else {
        CLOG_INFO("recv", "%s code=%d value=%.3f", inputKindName(ev.kind), ev.code, ev.value);
    }
}

} // anonymous namespace

int main(int argc, char** argv) {
    std::string config_path = "castlink.json";
    std::string out_path = "received.bin";
    int port = -1;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) config_path = argv[++i];
        else if (arg == "--port" && i + 1 < argc) port = atoi(argv[++i]);
        else if (arg == "--out" && i + 1 < argc) out_path = argv[++i];
        else if (arg == "-h" || arg == "--help") { usage(); return 0; }
        else { usage(); return 2; }
    }

    auto config = config::loadConfig(config_path, true);
    if (port > 0) config.transport.port = port;
    config::sanitize(config);
    config::applyLogConfig(config.log);

    auto store = std::make_shared<FileKeyStore>(config.crypto.key_dir);
    auto crypto = CryptoEngine::create(store, config.crypto.key_alias);
    if (crypto.is_err()) {
        CLOG_FATAL("recv", "Crypto unavailable: %s", crypto.error().message.c_str());
        return 1;
    }

    std::ofstream out(out_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        CLOG_FATAL("recv", "Cannot open %s", out_path.c_str());
        return 1;
    }

    SocketListener listener;
    auto rc = listener.listen("0.0.0.0", static_cast<uint16_t>(config.transport.port));
    if (rc.is_err()) {
        CLOG_FATAL("recv", "%s", rc.error().message.c_str());
        return 1;
    }

    auto accepted = listener.accept();
    if (accepted.is_err()) {
        CLOG_FATAL("recv", "%s", accepted.error().message.c_str());
        return 1;
    }
    listener.close();

    Session session(crypto.value());
    std::string peer = accepted.value()->peer();
    auto attached = session.attach(std::move(accepted.value()), peer);
    if (attached.is_err()) {
        CLOG_FATAL("recv", "attach: %s", attached.error().message.c_str());
        return 1;
    }

    uint64_t frames = 0;
    int exit_code = 0;
    bool done = false;
    while (!done) {
        auto ev = session.events().waitPop(std::chrono::milliseconds(500));
        if (!ev) continue;

        if (auto* data = std::get_if<DataReceivedEvent>(&*ev)) {
            if (data->type == FrameType::Video) {
                writeFrame(out, data->video);
                frames++;
            } else {
                logInput(data->input);
            }
        } else if (auto* err = std::get_if<ErrorEvent>(&*ev)) {
            CLOG_ERROR("recv", "Session error (%s): %s", errorKindName(err->kind), err->message.c_str());
            exit_code = 1;
            done = true;
        } else if (auto* dis = std::get_if<DisconnectedEvent>(&*ev)) {
            CLOG_INFO("recv", "Disconnected: %s", dis->cause.c_str());
            done = true;
        }
    }

    session.disconnect();
    auto totals = session.link().totals();
    CLOG_INFO("recv", "Wrote %llu frames to %s (auth failures %llu, malformed %llu)",
              static_cast<unsigned long long>(frames), out_path.c_str(),
              static_cast<unsigned long long>(totals.auth_failures),
              static_cast<unsigned long long>(totals.malformed_frames));
    log::closeLogFile();
    return exit_code;
}
