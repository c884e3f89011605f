#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace kiln::runtime {

enum class AppExit : std::uint8_t { success, failure };

[[nodiscard]] constexpr auto to_string(AppExit exit) -> const char* {
    return exit == AppExit::success ? "success" : "failure";
}

namespace modifier {
constexpr uint8_t shift = 1U << 0U;
constexpr uint8_t ctrl = 1U << 1U;
constexpr uint8_t alt = 1U << 2U;
constexpr uint8_t logo = 1U << 3U;
constexpr uint8_t caps_lock = 1U << 4U;
constexpr uint8_t num_lock = 1U << 5U;
} // namespace modifier

/// Keyboard event after keymap resolution, as seen by the application.
struct KeyInput {
    uint32_t keycode = 0; // evdev
    uint32_t keysym = 0;
    std::string name;
    std::string text;
    bool pressed = false;
    uint8_t modifiers = 0;
    uint32_t time_msec = 0;
};

/// @brief The application's event channel: translated keys in, exit requests out.
///
/// Owned by the runtime state and touched only from the reactor thread. The first exit request
/// wins; later ones are ignored. At most `MAX_PENDING_KEYS` keys are held; the oldest go first.
class AppChannel {
public:
    static constexpr size_t MAX_PENDING_KEYS = 256;

    void send_key(KeyInput key) {
        if (m_keys.size() >= MAX_PENDING_KEYS) {
            m_keys.erase(m_keys.begin());
            ++m_dropped_keys;
        }
        m_keys.push_back(std::move(key));
    }

    /// @brief Returns and clears the keys delivered since the last drain, in arrival order.
    [[nodiscard]] auto drain_keys() -> std::vector<KeyInput> { return std::exchange(m_keys, {}); }

    void drop_keys() {
        m_dropped_keys += m_keys.size();
        m_keys.clear();
    }

    [[nodiscard]] auto pending_keys() const -> size_t { return m_keys.size(); }
    [[nodiscard]] auto dropped_keys() const -> uint64_t { return m_dropped_keys; }

    void request_exit(AppExit exit) {
        if (!m_exit) {
            m_exit = exit;
        }
    }

    [[nodiscard]] auto exit_requested() const -> std::optional<AppExit> { return m_exit; }

private:
    std::vector<KeyInput> m_keys;
    uint64_t m_dropped_keys = 0;
    std::optional<AppExit> m_exit;
};

} // namespace kiln::runtime
