#include "mirror_controller.hpp"

#include <chrono>
#include <system_error>

#include "castlink_log.hpp"

namespace castlink {

MirrorController::MirrorController(Session& session, const Options& options)
    : session_(session),
      options_(options),
      bitrate_(options.bitrate),
      input_(options.dead_zone) {
    if (options_.window_ms < 100) options_.window_ms = 100;
}

MirrorController::~MirrorController() {
    stop();
}

void MirrorController::setBitrateCallback(BitrateCallback cb) {
    std::lock_guard<std::mutex> lock(bitrate_mtx_);
    bitrate_cb_ = std::move(cb);
}

bool MirrorController::start() {
    if (running_.load()) return true;

    {
        std::lock_guard<std::mutex> lock(input_mtx_);
        input_.reset();
    }
    uint32_t initial;
    {
        std::lock_guard<std::mutex> lock(bitrate_mtx_);
        bitrate_.reset();
        initial = bitrate_.current();
    }

    running_.store(true);
    try {
        eval_thread_ = std::thread(&MirrorController::evaluationLoop, this);
    } catch (const std::system_error& e) {
        CLOG_ERROR("mirror", "Failed to start evaluation thread: %s", e.what());
        running_.store(false);
        return false;
    }

    CLOG_INFO("mirror", "Started (initial bitrate %u bps, window %d ms)", initial, options_.window_ms);
    notifyBitrate(initial);
    return true;
}

void MirrorController::stop() {
    if (!running_.exchange(false)) return;
    {
        std::lock_guard<std::mutex> lock(wait_mtx_);
    }
    wait_cv_.notify_all();
    if (eval_thread_.joinable()) eval_thread_.join();
    CLOG_INFO("mirror", "Stopped");
}

void MirrorController::evaluationLoop() {
    while (running_.load()) {
        {
            std::unique_lock<std::mutex> lock(wait_mtx_);
            wait_cv_.wait_for(lock, std::chrono::milliseconds(options_.window_ms),
                              [this] { return !running_.load(); });
        }
        if (!running_.load()) break;

        auto next = evaluateOnce();
        if (next) notifyBitrate(*next);
    }
}

std::optional<uint32_t> MirrorController::evaluateOnce() {
    if (session_.state() != SessionState::Connected) return std::nullopt;

    const LinkMonitor::Sample sample = session_.link().sample();
    std::lock_guard<std::mutex> lock(bitrate_mtx_);
    return bitrate_.onFeedback(sample);
}

void MirrorController::notifyBitrate(uint32_t bps) {
    BitrateCallback cb;
    {
        std::lock_guard<std::mutex> lock(bitrate_mtx_);
        cb = bitrate_cb_;
    }
    if (cb) cb(bps);
}

uint32_t MirrorController::targetBitrate() const {
    std::lock_guard<std::mutex> lock(bitrate_mtx_);
    return bitrate_.current();
}

bool MirrorController::submitEncodedFrame(const uint8_t* data, size_t len, uint32_t flags,
                                          int64_t timestamp_us) {
    return session_.sendVideoFrame(data, len, flags, timestamp_us);
}

bool MirrorController::submitButton(int32_t code, bool pressed) {
    std::optional<InputEvent> ev;
    {
        std::lock_guard<std::mutex> lock(input_mtx_);
        ev = input_.onButton(code, pressed);
    }
    return ev && session_.sendInputEvent(*ev);
}

bool MirrorController::submitAxis(int32_t code, float raw_value) {
    std::optional<InputEvent> ev;
    {
        std::lock_guard<std::mutex> lock(input_mtx_);
        ev = input_.onAxis(code, raw_value);
    }
    return ev && session_.sendInputEvent(*ev);
}

size_t MirrorController::submitTouch(float x, float y) {
    std::vector<InputEvent> events;
    {
        std::lock_guard<std::mutex> lock(input_mtx_);
        events = input_.onTouch(x, y);
    }
    size_t sent = 0;
    for (const auto& ev : events) {
        if (session_.sendInputEvent(ev)) sent++;
    }
    return sent;
}

bool MirrorController::submitTouchRelease() {
    std::optional<InputEvent> ev;
    {
        std::lock_guard<std::mutex> lock(input_mtx_);
        ev = input_.onTouchRelease();
    }
    return ev && session_.sendInputEvent(*ev);
}

} // namespace castlink
