// castlink_send - stream recorded encoder output to a receiver
//
// Usage: castlink_send [--config castlink.json] [--kind wifi|bluetooth]
//                      [--target host:port | AA:BB:CC:DD:EE:FF] [--fps N] <frames.bin>
//
// frames.bin holds length-delimited encoder frames: [u32 BE length][u32 BE flags][bytes]...

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include "castlink_log.hpp"
#include "castlink_protocol.hpp"
#include "config_loader.hpp"
#include "crypto_engine.hpp"
#include "mirror_controller.hpp"
#include "session.hpp"

using namespace castlink;

namespace {

void usage() {
    fprintf(stderr,
            "Usage: castlink_send [--config FILE] [--kind wifi|bluetooth] [--target ADDR]\n"
            "                     [--fps N] <frames.bin>\n");
}

struct RecordedFrame {
    uint32_t flags = 0;
    std::vector<uint8_t> data;
};

bool readFrame(std::ifstream& in, RecordedFrame& out) {
    uint8_t header[8];
    if (!in.read(reinterpret_cast<char*>(header), sizeof(header))) return false;
    uint32_t len = protocol::get_u32_be(header);
    out.flags = protocol::get_u32_be(header + 4);
    if (len > protocol::MAX_VIDEO_PLAINTEXT) {
        CLOG_ERROR("send", "Frame of %u bytes exceeds limit, stopping", len);
        return false;
    }
    out.data.resize(len);
    return len == 0 || static_cast<bool>(in.read(reinterpret_cast<char*>(out.data.data()), len));
}

// Drain session events until the predicate state is reached or the deadline passes
bool waitForState(Session& session, SessionState wanted, int timeout_ms) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        auto ev = session.events().waitPop(std::chrono::milliseconds(100));
        if (!ev) continue;
        if (auto* sc = std::get_if<StateChangedEvent>(&*ev)) {
            if (sc->to == wanted) return true;
            if (sc->to == SessionState::Error || sc->to == SessionState::Disconnected) {
                CLOG_ERROR("send", "Session ended: %s", sc->cause.c_str());
                return false;
            }
        }
    }
    return false;
}

} // anonymous namespace

int main(int argc, char** argv) {
    std::string config_path = "castlink.json";
    std::string kind_arg;
    std::string target_arg;
    std::string frames_path;
    int fps = 60;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) config_path = argv[++i];
        else if (arg == "--kind" && i + 1 < argc) kind_arg = argv[++i];
        else if (arg == "--target" && i + 1 < argc) target_arg = argv[++i];
        else if (arg == "--fps" && i + 1 < argc) fps = atoi(argv[++i]);
        else if (arg == "-h" || arg == "--help") { usage(); return 0; }
        else if (!arg.empty() && arg[0] != '-') frames_path = arg;
        else { usage(); return 2; }
    }
    if (frames_path.empty()) { usage(); return 2; }
    if (fps < 1) fps = 1;

    auto config = config::loadConfig(config_path, true);
    if (!kind_arg.empty()) config.transport.kind = kind_arg;
    config::sanitize(config);
    config::applyLogConfig(config.log);

    auto kind = config::parseTransportKind(config.transport.kind);
    std::string target = target_arg.empty() ? config::connectTarget(config) : target_arg;

    auto store = std::make_shared<FileKeyStore>(config.crypto.key_dir);
    auto crypto = CryptoEngine::create(store, config.crypto.key_alias);
    if (crypto.is_err()) {
        CLOG_FATAL("send", "Crypto unavailable: %s", crypto.error().message.c_str());
        return 1;
    }

    std::ifstream in(frames_path, std::ios::binary);
    if (!in.is_open()) {
        CLOG_FATAL("send", "Cannot open %s", frames_path.c_str());
        return 1;
    }

    Session::Options session_opts;
    session_opts.send_queue_capacity = static_cast<size_t>(config.session.send_queue_capacity);
    Session session(crypto.value(), defaultTransportFactory(), session_opts);

    MirrorController::Options mirror_opts;
    mirror_opts.bitrate.min_bps = config.bitrate.min_bps;
    mirror_opts.bitrate.max_bps = config.bitrate.max_bps;
    mirror_opts.bitrate.initial_bps = config.bitrate.initial_bps;
    mirror_opts.window_ms = config.bitrate.window_ms;
    mirror_opts.dead_zone = config.input.dead_zone;
    MirrorController mirror(session, mirror_opts);
    mirror.setBitrateCallback([](uint32_t bps) {
        CLOG_INFO("send", "Encoder target bitrate: %u bps", bps);
    });

    auto rc = session.connect(*kind, target);
    if (rc.is_err()) {
        CLOG_FATAL("send", "connect: %s", rc.error().message.c_str());
        return 1;
    }
    if (!waitForState(session, SessionState::Connected, 15000)) {
        session.disconnect();
        return 1;
    }
    mirror.start();

    const auto frame_interval = std::chrono::microseconds(1000000 / fps);
    const auto t0 = std::chrono::steady_clock::now();
    auto next_due = t0;
    RecordedFrame frame;
    uint64_t sent = 0;
    uint64_t dropped = 0;

    while (readFrame(in, frame)) {
        if (session.state() != SessionState::Connected) {
            CLOG_ERROR("send", "Session left Connected, stopping");
            break;
        }
        std::this_thread::sleep_until(next_due);
        next_due += frame_interval;

        int64_t ts = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - t0).count();
        if (mirror.submitEncodedFrame(frame.data.data(), frame.data.size(), frame.flags, ts)) {
            sent++;
        } else {
            dropped++;
        }
    }

    // Let the sender worker flush the queue
    for (int i = 0; i < 50 && session.link().totals().frames_sent < sent; i++) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    mirror.stop();
    session.disconnect();

    CLOG_INFO("send", "Done: %llu frames queued, %llu dropped",
              static_cast<unsigned long long>(sent), static_cast<unsigned long long>(dropped));
    log::closeLogFile();
    return 0;
}
