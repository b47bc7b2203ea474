#include "bitrate_controller.hpp"
#include "castlink_log.hpp"

#include <algorithm>

namespace castlink {

BitrateController::BitrateController() : BitrateController(Config{}) {}

BitrateController::BitrateController(const Config& config) : config_(config) {
    if (config_.min_bps == 0) config_.min_bps = 1;
    if (config_.max_bps < config_.min_bps) {
        CLOG_WARN("Bitrate", "max_bps %u below min_bps %u, using min as max",
                  config_.max_bps, config_.min_bps);
        config_.max_bps = config_.min_bps;
    }
    if (config_.decrease_factor <= 0.0f || config_.decrease_factor >= 1.0f) {
        config_.decrease_factor = 0.75f;
    }
    if (config_.congestion_windows < 1) config_.congestion_windows = 1;
    if (config_.recovery_windows < 1) config_.recovery_windows = 1;

    current_bps_ = clamp(config_.initial_bps);
    last_debug_log_ = std::chrono::steady_clock::now();
}

uint32_t BitrateController::clamp(uint64_t bps) const {
    if (bps < config_.min_bps) return config_.min_bps;
    if (bps > config_.max_bps) return config_.max_bps;
    return static_cast<uint32_t>(bps);
}

std::optional<uint32_t> BitrateController::onFeedback(const LinkMonitor::Sample& fb) {
    const bool congested = fb.backlog >= config_.backlog_threshold ||
                           fb.dropped > 0 ||
                           fb.consecutive_auth_failures > 0;

    if (congested) {
        consecutive_congested_++;
        consecutive_clean_ = 0;
    } else {
        consecutive_clean_++;
        consecutive_congested_ = 0;
    }

    const auto now = std::chrono::steady_clock::now();
    if (std::chrono::duration_cast<std::chrono::seconds>(now - last_debug_log_).count() >= 10) {
        last_debug_log_ = now;
        CLOG_DEBUG("Bitrate", "tick: target=%u send=%.1fMbps backlog=%u drops=%llu auth=%u cong=%d clean=%d",
                   current_bps_, fb.send_mbps, fb.backlog,
                   static_cast<unsigned long long>(fb.dropped),
                   fb.consecutive_auth_failures, consecutive_congested_, consecutive_clean_);
    }

    uint32_t next = current_bps_;
    if (consecutive_congested_ >= config_.congestion_windows) {
        next = clamp(static_cast<uint64_t>(current_bps_ * static_cast<double>(config_.decrease_factor)));
        consecutive_congested_ = 0;
    } else if (consecutive_clean_ >= config_.recovery_windows) {
        next = clamp(static_cast<uint64_t>(current_bps_) + config_.increase_step_bps);
        consecutive_clean_ = 0;
    }

    if (next == current_bps_) return std::nullopt;

    CLOG_INFO("Bitrate", "%s %u -> %u bps (backlog=%u drops=%llu)",
              next < current_bps_ ? "decrease" : "increase",
              current_bps_, next, fb.backlog, static_cast<unsigned long long>(fb.dropped));
    current_bps_ = next;
    return next;
}

void BitrateController::reset() {
    current_bps_ = clamp(config_.initial_bps);
    consecutive_congested_ = 0;
    consecutive_clean_ = 0;
}

} // namespace castlink
