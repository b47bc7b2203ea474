// =============================================================================
// Unit tests for InputStateTracker (src/input_state.hpp/.cpp)
// =============================================================================
#include <gtest/gtest.h>
#include "input_state.hpp"

using namespace castlink;

// ---------------------------------------------------------------------------
// IS-1: dead zone
// ---------------------------------------------------------------------------
TEST(InputStateTest, DeadZoneFilter) {
    EXPECT_FLOAT_EQ(InputStateTracker::applyDeadZone(0.05f, 0.1f), 0.0f);
    EXPECT_FLOAT_EQ(InputStateTracker::applyDeadZone(-0.09f, 0.1f), 0.0f);
    EXPECT_FLOAT_EQ(InputStateTracker::applyDeadZone(0.1f, 0.1f), 0.1f);
    EXPECT_FLOAT_EQ(InputStateTracker::applyDeadZone(-0.8f, 0.1f), -0.8f);
}

TEST(InputStateTest, AxisInsideDeadZoneEmitsNothing) {
    InputStateTracker t(0.1f);
    EXPECT_FALSE(t.onAxis(pad::AXIS_LEFT_X, 0.05f).has_value());
    EXPECT_FALSE(t.onAxis(pad::AXIS_LEFT_X, -0.02f).has_value());
}

// ---------------------------------------------------------------------------
// IS-2: axes emit on change only
// ---------------------------------------------------------------------------
TEST(InputStateTest, AxisEmitsOnChange) {
    InputStateTracker t;
    auto a = t.onAxis(pad::AXIS_RIGHT_Y, 0.5f);
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->kind, InputKind::Axis);
    EXPECT_EQ(a->code, pad::AXIS_RIGHT_Y);
    EXPECT_FLOAT_EQ(a->value, 0.5f);

    EXPECT_FALSE(t.onAxis(pad::AXIS_RIGHT_Y, 0.5f).has_value());

    // Back into the dead zone reports the return to center once
    auto centered = t.onAxis(pad::AXIS_RIGHT_Y, 0.03f);
    ASSERT_TRUE(centered.has_value());
    EXPECT_FLOAT_EQ(centered->value, 0.0f);
    EXPECT_FALSE(t.onAxis(pad::AXIS_RIGHT_Y, 0.01f).has_value());
}

TEST(InputStateTest, AxesTrackedIndependently) {
    InputStateTracker t;
    EXPECT_TRUE(t.onAxis(pad::AXIS_LEFT_X, 0.7f).has_value());
    EXPECT_TRUE(t.onAxis(pad::AXIS_LEFT_Y, 0.7f).has_value());
    EXPECT_FALSE(t.onAxis(pad::AXIS_LEFT_X, 0.7f).has_value());
}

// ---------------------------------------------------------------------------
// IS-3: buttons
// ---------------------------------------------------------------------------
TEST(InputStateTest, ButtonPressAndRelease) {
    InputStateTracker t;
    auto down = t.onButton(pad::BUTTON_CROSS, true);
    ASSERT_TRUE(down.has_value());
    EXPECT_EQ(down->kind, InputKind::Button);
    EXPECT_FLOAT_EQ(down->value, 1.0f);

    EXPECT_FALSE(t.onButton(pad::BUTTON_CROSS, true).has_value());

    auto up = t.onButton(pad::BUTTON_CROSS, false);
    ASSERT_TRUE(up.has_value());
    EXPECT_FLOAT_EQ(up->value, 0.0f);
}

TEST(InputStateTest, ReleaseWithoutPressEmitsNothing) {
    InputStateTracker t;
    EXPECT_FALSE(t.onButton(pad::BUTTON_PS, false).has_value());
    EXPECT_TRUE(t.onButton(pad::BUTTON_PS, true).has_value());
}

TEST(InputStateTest, ButtonNames) {
    EXPECT_STREQ(pad::buttonName(pad::BUTTON_CROSS), "Cross");
    EXPECT_STREQ(pad::buttonName(pad::BUTTON_OPTIONS), "Options");
    EXPECT_EQ(pad::buttonName(12345), nullptr);
}

// ---------------------------------------------------------------------------
// IS-4: touchpad
// ---------------------------------------------------------------------------
TEST(InputStateTest, FirstTouchSendsBothCoordinates) {
    InputStateTracker t;
    auto evs = t.onTouch(100.0f, 200.0f);
    ASSERT_EQ(evs.size(), 2u);
    EXPECT_EQ(evs[0].code, TOUCHPAD_CODE_X);
    EXPECT_FLOAT_EQ(evs[0].value, 100.0f);
    EXPECT_EQ(evs[1].code, TOUCHPAD_CODE_Y);
    EXPECT_FLOAT_EQ(evs[1].value, 200.0f);
    EXPECT_TRUE(evs[0].active);
    EXPECT_TRUE(evs[1].active);
}

TEST(InputStateTest, TouchMoveSendsChangedCoordinateOnly) {
    InputStateTracker t;
    t.onTouch(100.0f, 200.0f);

    auto evs = t.onTouch(150.0f, 200.0f);
    ASSERT_EQ(evs.size(), 1u);
    EXPECT_EQ(evs[0].code, TOUCHPAD_CODE_X);

    EXPECT_TRUE(t.onTouch(150.0f, 200.0f).empty());
}

TEST(InputStateTest, TouchRelease) {
    InputStateTracker t;
    EXPECT_FALSE(t.onTouchRelease().has_value());

    t.onTouch(10.0f, 20.0f);
    auto up = t.onTouchRelease();
    ASSERT_TRUE(up.has_value());
    EXPECT_EQ(up->kind, InputKind::Touchpad);
    EXPECT_FALSE(up->active);
    EXPECT_FALSE(t.onTouchRelease().has_value());

    // Next touch starts fresh, even at the same point
    EXPECT_EQ(t.onTouch(10.0f, 20.0f).size(), 2u);
}

// ---------------------------------------------------------------------------
// IS-5: reset forgets state
// ---------------------------------------------------------------------------
TEST(InputStateTest, ResetResendsEverything) {
    InputStateTracker t;
    t.onButton(pad::BUTTON_L1, true);
    t.onAxis(pad::AXIS_L2_TRIGGER, 0.9f);
    t.reset();

    EXPECT_TRUE(t.onAxis(pad::AXIS_L2_TRIGGER, 0.9f).has_value());
    EXPECT_FALSE(t.onButton(pad::BUTTON_L1, false).has_value());
}

TEST(InputStateTest, DeadZoneAdjustable) {
    InputStateTracker t(0.1f);
    t.setDeadZone(0.5f);
    EXPECT_FLOAT_EQ(t.deadZone(), 0.5f);
    EXPECT_FALSE(t.onAxis(pad::AXIS_LEFT_X, 0.4f).has_value());
    EXPECT_TRUE(t.onAxis(pad::AXIS_LEFT_X, 0.6f).has_value());
}
