#pragma once

#include "keyboard_sink.hpp"
#include "keymap.hpp"
#include "raw_input.hpp"

#include <cstdint>
#include <runtime/app_channel.hpp>
#include <vector>

namespace kiln::input {

enum class KeyAction : uint8_t {
    forwarded,
    shutdown,
    vt_switch,
    ignored,
};

struct KeyDisposition {
    KeyAction action = KeyAction::ignored;
    uint32_t vt = 0; // target terminal for vt_switch
};

struct TranslatorSettings {
    uint32_t shutdown_keysym = 0;
    bool vt_switching = true;
};

/// @brief Turns raw keyboard events into focused-client keys and application key input.
///
/// The reserved shutdown key never reaches a client: its press requests a successful exit
/// through the application channel. VT switch keys are consumed unless VT switching is
/// disabled or the focused surface inhibits shortcuts. A key consumed on press also has its
/// release consumed. Pointer events are acknowledged and otherwise ignored.
class InputTranslator {
public:
    struct Stats {
        uint64_t forwarded = 0;
        uint64_t consumed = 0;
        uint64_t pointer = 0;
    };

    InputTranslator(Keymap& keymap, TranslatorSettings settings);

    /// @brief Routes forwarded keys to @p sink. Null detaches.
    void set_sink(KeyboardSink* sink) { m_sink = sink; }

    auto on_raw_event(const RawInputEvent& event, runtime::AppChannel& channel) -> KeyDisposition;

    [[nodiscard]] auto modifiers() const -> const ModifierState& { return m_modifiers; }
    [[nodiscard]] auto stats() const -> const Stats& { return m_stats; }

private:
    auto on_key(const RawInputEvent& event, runtime::AppChannel& channel) -> KeyDisposition;
    [[nodiscard]] auto classify_press(const KeyDescription& key) const -> KeyDisposition;
    void update_modifiers(uint32_t keycode, bool pressed);

    Keymap& m_keymap;
    KeyboardSink* m_sink = nullptr;
    TranslatorSettings m_settings;
    ModifierState m_modifiers;
    std::vector<uint32_t> m_consumed_keys;
    Stats m_stats;
};

} // namespace kiln::input
