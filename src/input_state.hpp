// =============================================================================
// CastLink - Controller Input State
// =============================================================================
// Turns raw controller samples into InputEvents, emitting only on change.
// Axis samples go through the dead-zone filter first, so stick noise near
// center never reaches the wire.
// =============================================================================
#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <vector>

#include "input_event.hpp"

namespace castlink {

namespace pad {

// PlayStation buttons (Android KeyEvent codes as reported by DS4/DualSense)
static constexpr int32_t BUTTON_CROSS    = 96;   // KEYCODE_BUTTON_A
static constexpr int32_t BUTTON_CIRCLE   = 97;   // KEYCODE_BUTTON_B
static constexpr int32_t BUTTON_SQUARE   = 99;   // KEYCODE_BUTTON_X
static constexpr int32_t BUTTON_TRIANGLE = 100;  // KEYCODE_BUTTON_Y
static constexpr int32_t BUTTON_L1       = 102;
static constexpr int32_t BUTTON_R1       = 103;
static constexpr int32_t BUTTON_L2       = 104;
static constexpr int32_t BUTTON_R2       = 105;
static constexpr int32_t BUTTON_L3       = 106;  // KEYCODE_BUTTON_THUMBL
static constexpr int32_t BUTTON_R3       = 107;  // KEYCODE_BUTTON_THUMBR
static constexpr int32_t BUTTON_OPTIONS  = 108;  // KEYCODE_BUTTON_START
static constexpr int32_t BUTTON_SHARE    = 109;  // KEYCODE_BUTTON_SELECT
static constexpr int32_t BUTTON_PS       = 110;  // KEYCODE_BUTTON_MODE

// Analog axes (Android MotionEvent axis ids)
static constexpr int32_t AXIS_LEFT_X     = 0;    // AXIS_X
static constexpr int32_t AXIS_LEFT_Y     = 1;    // AXIS_Y
static constexpr int32_t AXIS_RIGHT_X    = 11;   // AXIS_Z
static constexpr int32_t AXIS_RIGHT_Y    = 14;   // AXIS_RZ
static constexpr int32_t AXIS_L2_TRIGGER = 17;   // AXIS_LTRIGGER
static constexpr int32_t AXIS_R2_TRIGGER = 18;   // AXIS_RTRIGGER

static constexpr float DEFAULT_DEAD_ZONE = 0.1f;

// "Cross", "L1", ... or nullptr for an unmapped code
const char* buttonName(int32_t code);

} // namespace pad

class InputStateTracker {
public:
    explicit InputStateTracker(float dead_zone = pad::DEFAULT_DEAD_ZONE);

    // |value| < threshold -> 0.0
    static float applyDeadZone(float value, float threshold);

    std::optional<InputEvent> onButton(int32_t code, bool pressed);
    std::optional<InputEvent> onAxis(int32_t code, float raw_value);

    // Touch down / move: X and Y samples for whichever coordinate changed
    std::vector<InputEvent> onTouch(float x, float y);
    // Touch up: one inactive sample, nothing if no touch was active
    std::optional<InputEvent> onTouchRelease();

    // Forget retained state; the next sample of every control is sent again
    void reset();

    float deadZone() const { return dead_zone_; }
    void setDeadZone(float threshold) { dead_zone_ = threshold; }

private:
    float dead_zone_;
    std::map<int32_t, bool> buttons_;
    std::map<int32_t, float> axes_;
    bool touch_active_ = false;
    float touch_x_ = 0.0f;
    float touch_y_ = 0.0f;
};

} // namespace castlink
