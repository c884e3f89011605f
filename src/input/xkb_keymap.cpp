#include "xkb_keymap.hpp"

#include <algorithm>
#include <array>
#include <runtime/app_channel.hpp>
#include <util/logging.hpp>
#include <xkbcommon/xkbcommon.h>

namespace kiln::input {

namespace {

// evdev keycodes are offset by 8 in the XKB keycode space.
constexpr uint32_t XKB_KEYCODE_OFFSET = 8;

auto to_optional_name(const std::string& value) -> const char* {
    return value.empty() ? nullptr : value.c_str();
}

} // namespace

struct XkbKeymap::Impl {
    xkb_context* context = nullptr;
    xkb_keymap* keymap = nullptr;
    xkb_state* state = nullptr;

    ~Impl() {
        if (state) {
            xkb_state_unref(state);
        }
        if (keymap) {
            xkb_keymap_unref(keymap);
        }
        if (context) {
            xkb_context_unref(context);
        }
    }

    [[nodiscard]] auto portable_modifiers() const -> uint8_t {
        uint8_t bits = 0;
        auto active = [this](const char* name) {
            return xkb_state_mod_name_is_active(state, name, XKB_STATE_MODS_EFFECTIVE) > 0;
        };
        if (active(XKB_MOD_NAME_SHIFT)) {
            bits |= runtime::modifier::shift;
        }
        if (active(XKB_MOD_NAME_CTRL)) {
            bits |= runtime::modifier::ctrl;
        }
        if (active(XKB_MOD_NAME_ALT)) {
            bits |= runtime::modifier::alt;
        }
        if (active(XKB_MOD_NAME_LOGO)) {
            bits |= runtime::modifier::logo;
        }
        if (active(XKB_MOD_NAME_CAPS)) {
            bits |= runtime::modifier::caps_lock;
        }
        if (active(XKB_MOD_NAME_NUM)) {
            bits |= runtime::modifier::num_lock;
        }
        return bits;
    }
};

XkbKeymap::XkbKeymap() : m_impl(std::make_unique<Impl>()) {}

XkbKeymap::~XkbKeymap() = default;

auto XkbKeymap::create(const XkbRules& rules) -> ResultPtr<XkbKeymap> {
    auto keymap = std::unique_ptr<XkbKeymap>(new XkbKeymap());
    auto& impl = *keymap->m_impl;

    impl.context = xkb_context_new(XKB_CONTEXT_NO_FLAGS);
    if (!impl.context) {
        return make_result_ptr_error<XkbKeymap>(ErrorCode::input_init_failed,
                                                "Failed to create xkb context");
    }

    xkb_rule_names names{};
    names.layout = to_optional_name(rules.layout);
    names.variant = to_optional_name(rules.variant);
    names.options = to_optional_name(rules.options);

    impl.keymap = xkb_keymap_new_from_names(impl.context, &names, XKB_KEYMAP_COMPILE_NO_FLAGS);
    if (!impl.keymap) {
        return make_result_ptr_error<XkbKeymap>(
            ErrorCode::input_init_failed,
            "Failed to compile xkb keymap (layout='" + rules.layout + "', variant='" +
                rules.variant + "', options='" + rules.options + "')");
    }

    impl.state = xkb_state_new(impl.keymap);
    if (!impl.state) {
        return make_result_ptr_error<XkbKeymap>(ErrorCode::input_init_failed,
                                                "Failed to create xkb state");
    }

    KILN_LOG_DEBUG("xkb keymap compiled: layout='{}'", rules.layout.empty() ? "default" : rules.layout);
    return make_result_ptr(std::move(keymap));
}

auto XkbKeymap::describe(uint32_t keycode) const -> KeyDescription {
    const auto& impl = *m_impl;
    xkb_keycode_t xkb_code = keycode + XKB_KEYCODE_OFFSET;

    KeyDescription description{};
    description.keysym = xkb_state_key_get_one_sym(impl.state, xkb_code);

    std::array<char, 64> buffer{};
    if (xkb_keysym_get_name(description.keysym, buffer.data(), buffer.size()) > 0) {
        description.name = buffer.data();
    }
    // The return value is the full length even when the buffer truncated it.
    int length = xkb_state_key_get_utf8(impl.state, xkb_code, buffer.data(), buffer.size());
    if (length <= 0) {
        return description;
    }
    if (static_cast<size_t>(length) < buffer.size()) {
        description.text.assign(buffer.data(), static_cast<size_t>(length));
    } else {
        description.text.resize(static_cast<size_t>(length) + 1);
        int written = xkb_state_key_get_utf8(impl.state, xkb_code, description.text.data(),
                                             description.text.size());
        description.text.resize(static_cast<size_t>(std::max(written, 0)));
    }
    return description;
}

auto XkbKeymap::update_key(uint32_t keycode, bool pressed) -> ModifierState {
    xkb_state_update_key(m_impl->state, keycode + XKB_KEYCODE_OFFSET,
                         pressed ? XKB_KEY_DOWN : XKB_KEY_UP);
    return modifiers();
}

auto XkbKeymap::modifiers() const -> ModifierState {
    const auto& impl = *m_impl;
    return ModifierState{
        .depressed = xkb_state_serialize_mods(impl.state, XKB_STATE_MODS_DEPRESSED),
        .latched = xkb_state_serialize_mods(impl.state, XKB_STATE_MODS_LATCHED),
        .locked = xkb_state_serialize_mods(impl.state, XKB_STATE_MODS_LOCKED),
        .group = xkb_state_serialize_layout(impl.state, XKB_STATE_LAYOUT_EFFECTIVE),
        .portable = impl.portable_modifiers(),
    };
}

auto XkbKeymap::native() const -> xkb_keymap* {
    return m_impl->keymap;
}

} // namespace kiln::input
