#pragma once

#include "keymap.hpp"

#include <cstdint>

namespace kiln::input {

/// @brief Protocol-side keyboard that forwarded keys are delivered to.
class KeyboardSink {
public:
    virtual ~KeyboardSink() = default;

    KeyboardSink() = default;
    KeyboardSink(const KeyboardSink&) = delete;
    KeyboardSink& operator=(const KeyboardSink&) = delete;
    KeyboardSink(KeyboardSink&&) = delete;
    KeyboardSink& operator=(KeyboardSink&&) = delete;

    virtual void send_key(uint32_t time_msec, uint32_t keycode, bool pressed) = 0;
    virtual void send_modifiers(const ModifierState& modifiers) = 0;
    /// @brief True while the focused surface holds an active keyboard-shortcuts inhibitor.
    [[nodiscard]] virtual auto shortcuts_inhibited() const -> bool = 0;
};

} // namespace kiln::input
