#include "input_state.hpp"

#include <cmath>

#include "castlink_log.hpp"

namespace castlink {

namespace pad {

const char* buttonName(int32_t code) {
    switch (code) {
        case BUTTON_CROSS:    return "Cross";
        case BUTTON_CIRCLE:   return "Circle";
        case BUTTON_SQUARE:   return "Square";
        case BUTTON_TRIANGLE: return "Triangle";
        case BUTTON_L1:       return "L1";
        case BUTTON_R1:       return "R1";
        case BUTTON_L2:       return "L2";
        case BUTTON_R2:       return "R2";
        case BUTTON_L3:       return "L3";
        case BUTTON_R3:       return "R3";
        case BUTTON_OPTIONS:  return "Options";
        case BUTTON_SHARE:    return "Share";
        case BUTTON_PS:       return "PS";
        default:              return nullptr;
    }
}

} // namespace pad

InputStateTracker::InputStateTracker(float dead_zone) : dead_zone_(dead_zone) {}

float InputStateTracker::applyDeadZone(float value, float threshold) {
    return std::fabs(value) < threshold ? 0.0f : value;
}

std::optional<InputEvent> InputStateTracker::onButton(int32_t code, bool pressed) {
    auto it = buttons_.find(code);
    if (it != buttons_.end() && it->second == pressed) return std::nullopt;
    if (it == buttons_.end() && !pressed) {
        // Release of a button never seen pressed
        buttons_[code] = false;
        return std::nullopt;
    }
    buttons_[code] = pressed;

    const char* name = pad::buttonName(code);
    CLOG_TRACE("input", "Button %s(%d): %s", name ? name : "?", code,
               pressed ? "pressed" : "released");

    InputEvent ev;
    ev.kind = InputKind::Button;
    ev.code = code;
    ev.value = pressed ? 1.0f : 0.0f;
    return ev;
}

std::optional<InputEvent> InputStateTracker::onAxis(int32_t code, float raw_value) {
    const float filtered = applyDeadZone(raw_value, dead_zone_);

    // Axes rest at center; an unseen axis starts at 0.0
    auto it = axes_.find(code);
    const float previous = (it != axes_.end()) ? it->second : 0.0f;
    if (filtered == previous) return std::nullopt;
    axes_[code] = filtered;

    InputEvent ev;
    ev.kind = InputKind::Axis;
    ev.code = code;
    ev.value = filtered;
    return ev;
}

std::vector<InputEvent> InputStateTracker::onTouch(float x, float y) {
    std::vector<InputEvent> out;
    const bool was_active = touch_active_;

    if (!was_active || x != touch_x_) {
        InputEvent ev;
        ev.kind = InputKind::Touchpad;
        ev.code = TOUCHPAD_CODE_X;
        ev.value = x;
        ev.active = true;
        out.push_back(ev);
    }
    if (!was_active || y != touch_y_) {
        InputEvent ev;
        ev.kind = InputKind::Touchpad;
        ev.code = TOUCHPAD_CODE_Y;
        ev.value = y;
        ev.active = true;
        out.push_back(ev);
    }

    touch_active_ = true;
    touch_x_ = x;
    touch_y_ = y;
    return out;
}

std::optional<InputEvent> InputStateTracker::onTouchRelease() {
    if (!touch_active_) return std::nullopt;
    touch_active_ = false;

    InputEvent ev;
    ev.kind = InputKind::Touchpad;
    ev.code = TOUCHPAD_CODE_X;
    ev.value = TOUCHPAD_RELEASED_VALUE;
    ev.active = false;
    return ev;
}

void InputStateTracker::reset() {
    buttons_.clear();
    axes_.clear();
    touch_active_ = false;
    touch_x_ = 0.0f;
    touch_y_ = 0.0f;
}

} // namespace castlink
