#pragma once
#include <cstdint>

#include <atomic>
#include <chrono>
#include <mutex>

namespace castlink {

/**
 * Tracks carrier health for one session: throughput in both directions, the
 * outbound queue backlog, and frames lost to drops, decrypt failures or
 * protocol violations.
 * Hot-path record*() calls are lock-free; sample() is called once per
 * evaluation window and feeds the BitrateController.
 */
class LinkMonitor {
public:
    struct Sample {
        float send_mbps = 0.0f;
        float recv_mbps = 0.0f;
        uint32_t backlog = 0;               // frames waiting in the send queue
        uint64_t dropped = 0;               // frames dropped this window
        uint64_t auth_failures = 0;         // decrypt failures this window
        uint32_t consecutive_auth_failures = 0;
        uint64_t malformed = 0;             // protocol violations this window
        int64_t window_ms = 0;
        bool is_alive = false;              // traffic seen recently
    };

    struct Totals {
        uint64_t bytes_sent = 0;
        uint64_t bytes_received = 0;
        uint64_t frames_sent = 0;
        uint64_t frames_received = 0;
        uint64_t frames_dropped = 0;
        uint64_t auth_failures = 0;
        uint64_t malformed_frames = 0;
    };

    LinkMonitor();

    void recordSend(size_t bytes);
    void recordRecv(size_t bytes);
    void recordFrameReceived();
    void recordDrop();
    void recordMalformed();
    void setBacklog(uint32_t frames) { backlog_.store(frames, std::memory_order_relaxed); }

    // Returns the new consecutive count
    uint32_t recordAuthFailure();
    void recordAuthSuccess();
    uint32_t consecutiveAuthFailures() const { return consecutive_auth_failures_.load(); }

    // Closes the current window and returns its deltas
    Sample sample();

    Totals totals() const;

    void reset();

private:
    static int64_t nowNs();

    std::atomic<uint64_t> bytes_sent_{0};
    std::atomic<uint64_t> bytes_recv_{0};
    std::atomic<uint64_t> frames_sent_{0};
    std::atomic<uint64_t> frames_recv_{0};
    std::atomic<uint64_t> dropped_{0};
    std::atomic<uint64_t> auth_failures_{0};
    std::atomic<uint64_t> malformed_{0};
    std::atomic<uint32_t> consecutive_auth_failures_{0};
    std::atomic<uint32_t> backlog_{0};
    std::atomic<int64_t> last_activity_ns_{0};

    // Window bookkeeping (guarded by window_mutex_)
    mutable std::mutex window_mutex_;
    std::chrono::steady_clock::time_point last_sample_;
    uint64_t prev_bytes_sent_ = 0;
    uint64_t prev_bytes_recv_ = 0;
    uint64_t prev_dropped_ = 0;
    uint64_t prev_auth_failures_ = 0;
    uint64_t prev_malformed_ = 0;

    static constexpr int ALIVE_TIMEOUT_MS = 5000;
};

} // namespace castlink
