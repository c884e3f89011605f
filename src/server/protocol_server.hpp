#pragma once

#include <chrono>
#include <cstdint>
#include <input/keyboard_sink.hpp>
#include <memory>
#include <output/display_device.hpp>
#include <string>
#include <sys/types.h>
#include <util/error.hpp>
#include <vector>

// Forward declarations for C library types (snake_case)
extern "C" {
struct wl_display;
struct wl_event_loop;
struct xkb_keymap;                       // NOLINT(readability-identifier-naming)
struct wlr_security_context_manager_v1; // NOLINT(readability-identifier-naming)
}

namespace kiln::server {

struct ProtocolSettings {
    std::string seat_name = "seat0";
    int32_t repeat_rate = 45;
    int32_t repeat_delay = 250;
    output::OutputDescriptor output;
    dev_t main_device = 0;
};

/// @brief Protocol globals, seat and surface tracking, delegated to wlroots.
///
/// Owns the `wl_display`. Keyboard focus follows the most recently mapped toplevel and falls
/// back to the previous one when it goes away. Toplevels are told to use server-side
/// decorations. Text-input state of the focused client is relayed to the seat's input method.
/// Clients with a security context do not see the data-control, security-context or
/// input-method manager globals.
class ProtocolServer final : public input::KeyboardSink {
public:
    ~ProtocolServer() override;

    ProtocolServer(const ProtocolServer&) = delete;
    ProtocolServer& operator=(const ProtocolServer&) = delete;
    ProtocolServer(ProtocolServer&&) = delete;
    ProtocolServer& operator=(ProtocolServer&&) = delete;

    [[nodiscard]] static auto create(const ProtocolSettings& settings)
        -> ResultPtr<ProtocolServer>;

    [[nodiscard]] auto display() const -> wl_display*;
    [[nodiscard]] auto security_manager() const -> wlr_security_context_manager_v1*;

    /// @brief Descriptor of the protocol event loop, readable when clients sent requests.
    [[nodiscard]] auto event_fd() const -> int;
    [[nodiscard]] auto dispatch() -> Result<void>;
    void flush_clients();

    /// @brief Publishes @p keymap on the seat keyboard. The keymap is referenced, not adopted.
    void set_keymap(xkb_keymap* keymap);

    /// Sends frame-done to every mapped surface.
    void send_frame_done(std::chrono::nanoseconds monotonic_now);

    [[nodiscard]] auto mapped_surfaces() const -> size_t;
    [[nodiscard]] auto has_focus() const -> bool;

    void send_key(uint32_t time_msec, uint32_t keycode, bool pressed) override;
    void send_modifiers(const input::ModifierState& modifiers) override;
    [[nodiscard]] auto shortcuts_inhibited() const -> bool override;

private:
    struct Impl;
    ProtocolServer();

    std::unique_ptr<Impl> m_impl;
};

struct ProtocolDispatched {};

/// @brief Reactor source for the protocol event loop of a server owned elsewhere.
class ProtocolNotifier {
public:
    using Event = ProtocolDispatched;

    explicit ProtocolNotifier(ProtocolServer& server) : m_server(&server) {}

    [[nodiscard]] auto fd() const -> int { return m_server->event_fd(); }
    [[nodiscard]] auto dispatch(std::vector<Event>& out) -> Result<void> {
        KILN_TRY(m_server->dispatch());
        out.push_back(ProtocolDispatched{});
        return {};
    }

private:
    ProtocolServer* m_server;
};

} // namespace kiln::server
