// =============================================================================
// CastLink - Controller Input Event
// =============================================================================
#pragma once
#include <cstdint>
#include <cstring>
#include <optional>
#include <string>

namespace castlink {

enum class InputKind { Button, Axis, Touchpad };

// Touchpad sample codes
static constexpr int32_t TOUCHPAD_CODE_X = 0;
static constexpr int32_t TOUCHPAD_CODE_Y = 1;

// Wire value for a touchpad sample with active == false. Touch coordinates are
// device pixels and never negative.
static constexpr float TOUCHPAD_RELEASED_VALUE = -1.0f;

/**
 * One controller sample.
 *   Button:   value is 0.0 (released) or 1.0 (pressed)
 *   Axis:     value in [-1.0, 1.0] after dead-zone filtering
 *   Touchpad: value is a device-pixel coordinate for `code` (X or Y) while
 *             active; every touchpad event carries `active`
 */
struct InputEvent {
    InputKind kind = InputKind::Button;
    int32_t code = 0;
    float value = 0.0f;
    bool active = true;  // meaningful for Touchpad only

    bool operator==(const InputEvent& o) const {
        return kind == o.kind && code == o.code && active == o.active &&
               std::memcmp(&value, &o.value, sizeof(value)) == 0;
    }
};

inline const char* inputKindName(InputKind k) {
    switch (k) {
        case InputKind::Button:   return "button";
        case InputKind::Axis:     return "axis";
        case InputKind::Touchpad: return "touchpad";
    }
    return "button";
}

inline std::optional<InputKind> parseInputKind(const std::string& name) {
    if (name == "button")   return InputKind::Button;
    if (name == "axis")     return InputKind::Axis;
    if (name == "touchpad") return InputKind::Touchpad;
    return std::nullopt;
}

} // namespace castlink
