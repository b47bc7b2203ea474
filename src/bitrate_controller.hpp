#pragma once

#include "link_monitor.hpp"
#include <chrono>
#include <cstdint>
#include <optional>

namespace castlink {

/**
 * Adapts the encoder's target bitrate to what the carrier is absorbing.
 *
 * One onFeedback() call per evaluation window:
 *   - congested window: send backlog at/over threshold, any dropped frame,
 *     or a decrypt failure streak on the link
 *   - CONGESTION_WINDOWS congested windows in a row -> multiply by decrease_factor
 *   - RECOVERY_WINDOWS clean windows in a row       -> add increase_step_bps
 * Result is clamped to [min_bps, max_bps]; at most one change per call.
 */
class BitrateController {
public:
    struct Config {
        uint32_t min_bps = 1000000;
        uint32_t max_bps = 20000000;
        uint32_t initial_bps = 15000000;
        float decrease_factor = 0.75f;
        uint32_t increase_step_bps = 500000;
        uint32_t backlog_threshold = 4;
        int congestion_windows = 2;
        int recovery_windows = 3;
    };

    BitrateController();
    explicit BitrateController(const Config& config);

    // Returns the new target when it changed this window
    std::optional<uint32_t> onFeedback(const LinkMonitor::Sample& feedback);

    uint32_t current() const { return current_bps_; }
    const Config& config() const { return config_; }

    // Back to initial_bps with cleared hysteresis
    void reset();

private:
    uint32_t clamp(uint64_t bps) const;

    Config config_;
    uint32_t current_bps_;

    // Consecutive counts for hysteresis
    int consecutive_congested_ = 0;
    int consecutive_clean_ = 0;

    std::chrono::steady_clock::time_point last_debug_log_{};
};

} // namespace castlink
