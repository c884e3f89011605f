#pragma once

#include <cstdint>
#include <string>

namespace kiln::input {

enum class RawInputType : uint8_t {
    device_added,
    device_removed,
    key,
    pointer_motion,
    pointer_button,
    pointer_axis,
    other,
};

/// @brief Input backend event reduced to what the translator needs. Keycodes are evdev codes.
struct RawInputEvent {
    RawInputType type = RawInputType::other;
    uint32_t time_msec = 0;
    uint32_t code = 0; // key or button
    bool pressed = false;
    double dx = 0.0;
    double dy = 0.0;
    double axis_value = 0.0;
    bool horizontal = false;
    std::string device_name;
};

} // namespace kiln::input
