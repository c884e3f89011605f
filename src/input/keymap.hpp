#pragma once

#include <cstdint>
#include <string>

namespace kiln::input {

struct KeyDescription {
    uint32_t keysym = 0;
    std::string name;
    std::string text;
};

/// @brief Serialized modifier state in the form the protocol's keyboard expects.
struct ModifierState {
    uint32_t depressed = 0;
    uint32_t latched = 0;
    uint32_t locked = 0;
    uint32_t group = 0;
    uint8_t portable = 0; // runtime::modifier bits

    auto operator==(const ModifierState&) const -> bool = default;
};

/// @brief Keycode to key resolution with tracked modifier state.
class Keymap {
public:
    virtual ~Keymap() = default;

    Keymap() = default;
    Keymap(const Keymap&) = delete;
    Keymap& operator=(const Keymap&) = delete;
    Keymap(Keymap&&) = delete;
    Keymap& operator=(Keymap&&) = delete;

    [[nodiscard]] virtual auto describe(uint32_t keycode) const -> KeyDescription = 0;
    /// @brief Feeds a key transition into the modifier state and returns the new state.
    virtual auto update_key(uint32_t keycode, bool pressed) -> ModifierState = 0;
    [[nodiscard]] virtual auto modifiers() const -> ModifierState = 0;
};

} // namespace kiln::input
