#include "input_translator.hpp"

#include <algorithm>
#include <util/logging.hpp>
#include <xkbcommon/xkbcommon-keysyms.h>

namespace kiln::input {

InputTranslator::InputTranslator(Keymap& keymap, TranslatorSettings settings)
    : m_keymap(keymap), m_settings(settings), m_modifiers(keymap.modifiers()) {}

auto InputTranslator::on_raw_event(const RawInputEvent& event, runtime::AppChannel& channel)
    -> KeyDisposition {
    switch (event.type) {
    case RawInputType::key:
        return on_key(event, channel);
    case RawInputType::device_added:
        KILN_LOG_INFO("Input device added: {}", event.device_name);
        break;
    case RawInputType::device_removed:
        KILN_LOG_INFO("Input device removed: {}", event.device_name);
        break;
    case RawInputType::pointer_motion:
    case RawInputType::pointer_button:
    case RawInputType::pointer_axis:
        ++m_stats.pointer;
        KILN_LOG_TRACE("Pointer event from {} ignored", event.device_name);
        break;
    case RawInputType::other:
        break;
    }
    return KeyDisposition{};
}

auto InputTranslator::classify_press(const KeyDescription& key) const -> KeyDisposition {
    if (key.keysym == m_settings.shutdown_keysym) {
        return KeyDisposition{.action = KeyAction::shutdown};
    }
    if (key.keysym >= XKB_KEY_XF86Switch_VT_1 && key.keysym <= XKB_KEY_XF86Switch_VT_12) {
        bool inhibited = m_sink && m_sink->shortcuts_inhibited();
        if (m_settings.vt_switching && !inhibited) {
            return KeyDisposition{.action = KeyAction::vt_switch,
                                  .vt = key.keysym - XKB_KEY_XF86Switch_VT_1 + 1};
        }
    }
    return KeyDisposition{.action = KeyAction::forwarded};
}

auto InputTranslator::on_key(const RawInputEvent& event, runtime::AppChannel& channel)
    -> KeyDisposition {
    KeyDescription key = m_keymap.describe(event.code);

    KeyDisposition disposition{.action = KeyAction::forwarded};
    auto consumed = std::find(m_consumed_keys.begin(), m_consumed_keys.end(), event.code);
    if (event.pressed) {
        disposition = classify_press(key);
        if (disposition.action != KeyAction::forwarded && consumed == m_consumed_keys.end()) {
            m_consumed_keys.push_back(event.code);
        }
    } else if (consumed != m_consumed_keys.end()) {
        m_consumed_keys.erase(consumed);
        disposition.action = KeyAction::ignored;
    }

    switch (disposition.action) {
    case KeyAction::shutdown:
        KILN_LOG_INFO("Shutdown key {} pressed", key.name);
        channel.request_exit(runtime::AppExit::success);
        ++m_stats.consumed;
        break;
    case KeyAction::vt_switch:
        KILN_LOG_DEBUG("VT switch to {} requested", disposition.vt);
        ++m_stats.consumed;
        break;
    case KeyAction::ignored:
        ++m_stats.consumed;
        break;
    case KeyAction::forwarded:
        if (m_sink) {
            m_sink->send_key(event.time_msec, event.code, event.pressed);
        }
        channel.send_key(runtime::KeyInput{
            .keycode = event.code,
            .keysym = key.keysym,
            .name = key.name,
            .text = key.text,
            .pressed = event.pressed,
            .modifiers = m_modifiers.portable,
            .time_msec = event.time_msec,
        });
        ++m_stats.forwarded;
        break;
    }

    update_modifiers(event.code, event.pressed);
    return disposition;
}

void InputTranslator::update_modifiers(uint32_t keycode, bool pressed) {
    ModifierState next = m_keymap.update_key(keycode, pressed);
    if (next == m_modifiers) {
        return;
    }
    m_modifiers = next;
    if (m_sink) {
        m_sink->send_modifiers(m_modifiers);
    }
}

} // namespace kiln::input
