// =============================================================================
// CastLink - BitrateController Unit Tests
// =============================================================================

#include <gtest/gtest.h>
#include "bitrate_controller.hpp"

using namespace castlink;

namespace {

LinkMonitor::Sample clean() {
    LinkMonitor::Sample s;
    s.send_mbps = 12.0f;
    s.is_alive = true;
    return s;
}

LinkMonitor::Sample backlogged(uint32_t frames) {
    LinkMonitor::Sample s = clean();
    s.backlog = frames;
    return s;
}

LinkMonitor::Sample dropping() {
    LinkMonitor::Sample s = clean();
    s.dropped = 3;
    return s;
}

} // namespace

// =============================================================================
// Initial state
// =============================================================================

TEST(BitrateControllerTest, StartsAtInitial) {
    BitrateController bc;
    EXPECT_EQ(bc.current(), 15000000u);
}

TEST(BitrateControllerTest, InitialClampedIntoRange) {
    BitrateController::Config cfg;
    cfg.min_bps = 2000000;
    cfg.max_bps = 8000000;
    cfg.initial_bps = 15000000;
    BitrateController bc(cfg);
    EXPECT_EQ(bc.current(), 8000000u);
}

TEST(BitrateControllerTest, InvertedRangeSanitized) {
    BitrateController::Config cfg;
    cfg.min_bps = 5000000;
    cfg.max_bps = 1000000;
    cfg.decrease_factor = 1.5f;
    BitrateController bc(cfg);
    EXPECT_EQ(bc.config().max_bps, 5000000u);
    EXPECT_FLOAT_EQ(bc.config().decrease_factor, 0.75f);
    EXPECT_EQ(bc.current(), 5000000u);
}

// =============================================================================
// Decrease on sustained congestion
// =============================================================================

TEST(BitrateControllerTest, SingleCongestedWindowHoldsTarget) {
    BitrateController bc;
    EXPECT_FALSE(bc.onFeedback(backlogged(10)).has_value());
    EXPECT_EQ(bc.current(), 15000000u);
}

TEST(BitrateControllerTest, SustainedBacklogDecreases) {
    BitrateController bc;
    bc.onFeedback(backlogged(10));
    auto next = bc.onFeedback(backlogged(10));
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(*next, 11250000u);
    EXPECT_EQ(bc.current(), 11250000u);
}

TEST(BitrateControllerTest, BacklogBelowThresholdIsClean) {
    BitrateController bc;
    bc.onFeedback(backlogged(3));
    EXPECT_FALSE(bc.onFeedback(backlogged(3)).has_value());
    EXPECT_EQ(bc.current(), 15000000u);
}

TEST(BitrateControllerTest, DropsCountAsCongestion) {
    BitrateController bc;
    bc.onFeedback(dropping());
    EXPECT_TRUE(bc.onFeedback(dropping()).has_value());
    EXPECT_LT(bc.current(), 15000000u);
}

TEST(BitrateControllerTest, AuthFailureStreakCountsAsCongestion) {
    BitrateController bc;
    auto s = clean();
    s.consecutive_auth_failures = 1;
    bc.onFeedback(s);
    EXPECT_TRUE(bc.onFeedback(s).has_value());
}

TEST(BitrateControllerTest, NeverBelowMinimum) {
    BitrateController bc;
    for (int i = 0; i < 100; i++) bc.onFeedback(backlogged(50));
    EXPECT_EQ(bc.current(), 1000000u);
    EXPECT_FALSE(bc.onFeedback(backlogged(50)).has_value());
}

// =============================================================================
// Hysteresis
// =============================================================================

TEST(BitrateControllerTest, AlternatingWindowsHold) {
    BitrateController bc;
    for (int i = 0; i < 10; i++) {
        EXPECT_FALSE(bc.onFeedback(backlogged(10)).has_value());
        EXPECT_FALSE(bc.onFeedback(clean()).has_value());
    }
    EXPECT_EQ(bc.current(), 15000000u);
}

// =============================================================================
// Recovery
// =============================================================================

TEST(BitrateControllerTest, RecoversAfterCleanWindows) {
    BitrateController bc;
    bc.onFeedback(backlogged(10));
    bc.onFeedback(backlogged(10));
    ASSERT_EQ(bc.current(), 11250000u);

    EXPECT_FALSE(bc.onFeedback(clean()).has_value());
    EXPECT_FALSE(bc.onFeedback(clean()).has_value());
    auto next = bc.onFeedback(clean());
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(*next, 11750000u);
}

TEST(BitrateControllerTest, NeverAboveMaximum) {
    BitrateController bc;
    for (int i = 0; i < 100; i++) bc.onFeedback(clean());
    EXPECT_EQ(bc.current(), 20000000u);
    EXPECT_FALSE(bc.onFeedback(clean()).has_value());
}

TEST(BitrateControllerTest, ResetRestoresInitial) {
    BitrateController bc;
    bc.onFeedback(backlogged(10));
    bc.onFeedback(backlogged(10));
    bc.onFeedback(backlogged(10));
    bc.reset();
    EXPECT_EQ(bc.current(), 15000000u);
    // Hysteresis cleared: one congested window is not enough
    EXPECT_FALSE(bc.onFeedback(backlogged(10)).has_value());
}
