// =============================================================================
// CastLink - Mirror Controller
// =============================================================================
// Sender-side wiring around a Session: encoded frames in, controller input in,
// and target bitrate back out to the encoder once per evaluation window.
// =============================================================================
#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>

#include "bitrate_controller.hpp"
#include "input_state.hpp"
#include "session.hpp"

namespace castlink {

class MirrorController {
public:
    using BitrateCallback = std::function<void(uint32_t target_bps)>;

    struct Options {
        BitrateController::Config bitrate;
        int window_ms = 1000;
        float dead_zone = pad::DEFAULT_DEAD_ZONE;
    };

    MirrorController(Session& session, const Options& options);
    ~MirrorController();

    // Called from the evaluation thread; applied by the encoder
    void setBitrateCallback(BitrateCallback cb);

    // Starts the evaluation thread and announces the initial target
    bool start();
    void stop();
    bool running() const { return running_.load(); }

    bool submitEncodedFrame(const uint8_t* data, size_t len, uint32_t flags, int64_t timestamp_us);

    // Return true when an event went onto the wire
    bool submitButton(int32_t code, bool pressed);
    bool submitAxis(int32_t code, float raw_value);
    size_t submitTouch(float x, float y);
    bool submitTouchRelease();

    // One evaluation window; the thread calls this every window_ms
    std::optional<uint32_t> evaluateOnce();

    uint32_t targetBitrate() const;

private:
    void evaluationLoop();
    void notifyBitrate(uint32_t bps);

    Session& session_;
    Options options_;

    mutable std::mutex bitrate_mtx_;
    BitrateController bitrate_;
    BitrateCallback bitrate_cb_;

    std::mutex input_mtx_;
    InputStateTracker input_;

    std::atomic<bool> running_{false};
    std::thread eval_thread_;
    std::mutex wait_mtx_;
    std::condition_variable wait_cv_;
};

} // namespace castlink
