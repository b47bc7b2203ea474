#include "link_monitor.hpp"

namespace castlink {

int64_t LinkMonitor::nowNs() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

LinkMonitor::LinkMonitor() {
    last_activity_ns_.store(nowNs());
    last_sample_ = std::chrono::steady_clock::now();
}

void LinkMonitor::recordSend(size_t bytes) {
    bytes_sent_.fetch_add(bytes, std::memory_order_relaxed);
    frames_sent_.fetch_add(1, std::memory_order_relaxed);
    last_activity_ns_.store(nowNs(), std::memory_order_relaxed);
}

void LinkMonitor::recordRecv(size_t bytes) {
    bytes_recv_.fetch_add(bytes, std::memory_order_relaxed);
    last_activity_ns_.store(nowNs(), std::memory_order_relaxed);
}

void LinkMonitor::recordFrameReceived() {
    frames_recv_.fetch_add(1, std::memory_order_relaxed);
}

void LinkMonitor::recordDrop() {
    dropped_.fetch_add(1, std::memory_order_relaxed);
}

void LinkMonitor::recordMalformed() {
    malformed_.fetch_add(1, std::memory_order_relaxed);
}

uint32_t LinkMonitor::recordAuthFailure() {
    auth_failures_.fetch_add(1, std::memory_order_relaxed);
    return consecutive_auth_failures_.fetch_add(1) + 1;
}

void LinkMonitor::recordAuthSuccess() {
    consecutive_auth_failures_.store(0);
}

LinkMonitor::Sample LinkMonitor::sample() {
    std::lock_guard<std::mutex> lock(window_mutex_);

    auto now = std::chrono::steady_clock::now();
    int64_t elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now - last_sample_).count();
    float elapsed_sec = (elapsed_ms > 0 ? elapsed_ms : 1) / 1000.0f;

    uint64_t sent = bytes_sent_.load();
    uint64_t recv = bytes_recv_.load();
    uint64_t dropped = dropped_.load();
    uint64_t auth = auth_failures_.load();
    uint64_t malformed = malformed_.load();

    Sample s;
    s.send_mbps = ((sent - prev_bytes_sent_) * 8.0f / 1000000.0f) / elapsed_sec;
    s.recv_mbps = ((recv - prev_bytes_recv_) * 8.0f / 1000000.0f) / elapsed_sec;
    s.backlog = backlog_.load(std::memory_order_relaxed);
    s.dropped = dropped - prev_dropped_;
    s.auth_failures = auth - prev_auth_failures_;
    s.consecutive_auth_failures = consecutive_auth_failures_.load();
    s.malformed = malformed - prev_malformed_;
    s.window_ms = elapsed_ms;

    int64_t idle_ms = (nowNs() - last_activity_ns_.load(std::memory_order_relaxed)) / 1000000LL;
    s.is_alive = idle_ms < ALIVE_TIMEOUT_MS;

    prev_bytes_sent_ = sent;
    prev_bytes_recv_ = recv;
    prev_dropped_ = dropped;
    prev_auth_failures_ = auth;
    prev_malformed_ = malformed;
    last_sample_ = now;
    return s;
}

LinkMonitor::Totals LinkMonitor::totals() const {
    Totals t;
    t.bytes_sent = bytes_sent_.load();
    t.bytes_received = bytes_recv_.load();
    t.frames_sent = frames_sent_.load();
    t.frames_received = frames_recv_.load();
    t.frames_dropped = dropped_.load();
    t.auth_failures = auth_failures_.load();
    t.malformed_frames = malformed_.load();
    return t;
}

void LinkMonitor::reset() {
    std::lock_guard<std::mutex> lock(window_mutex_);
    bytes_sent_.store(0);
    bytes_recv_.store(0);
    frames_sent_.store(0);
    frames_recv_.store(0);
    dropped_.store(0);
    auth_failures_.store(0);
    malformed_.store(0);
    consecutive_auth_failures_.store(0);
    backlog_.store(0);
    last_activity_ns_.store(nowNs());

    prev_bytes_sent_ = 0;
    prev_bytes_recv_ = 0;
    prev_dropped_ = 0;
    prev_auth_failures_ = 0;
    prev_malformed_ = 0;
    last_sample_ = std::chrono::steady_clock::now();
}

} // namespace castlink
