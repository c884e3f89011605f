#pragma once

#include "keymap.hpp"

#include <memory>
#include <string>
#include <util/error.hpp>

extern "C" {
struct xkb_context; // NOLINT(readability-identifier-naming)
struct xkb_keymap;  // NOLINT(readability-identifier-naming)
struct xkb_state;   // NOLINT(readability-identifier-naming)
}

namespace kiln::input {

struct XkbRules {
    std::string layout;
    std::string variant;
    std::string options;
};

/// @brief xkbcommon keymap compiled from RMLVO names. Empty names use the system defaults.
class XkbKeymap final : public Keymap {
public:
    ~XkbKeymap() override;

    [[nodiscard]] static auto create(const XkbRules& rules) -> ResultPtr<XkbKeymap>;

    [[nodiscard]] auto describe(uint32_t keycode) const -> KeyDescription override;
    auto update_key(uint32_t keycode, bool pressed) -> ModifierState override;
    [[nodiscard]] auto modifiers() const -> ModifierState override;

    /// @brief The compiled keymap, for handing to the protocol keyboard. Not transferred.
    [[nodiscard]] auto native() const -> xkb_keymap*;

private:
    struct Impl;
    XkbKeymap();

    std::unique_ptr<Impl> m_impl;
};

} // namespace kiln::input
