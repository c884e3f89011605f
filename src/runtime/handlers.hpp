#pragma once

#include "display_notifier.hpp"
#include "event_multiplexer.hpp"
#include "runtime_state.hpp"
#include "signal_notifier.hpp"

#include <server/listening_socket.hpp>
#include <server/protocol_server.hpp>
#include <session/input_context.hpp>
#include <session/session.hpp>
#include <session/udev_monitor.hpp>

namespace kiln::runtime {

using RuntimeMultiplexer =
    EventMultiplexer<RuntimeState, session::SessionNotifier, session::UdevMonitor,
                     session::InputNotifier, server::ListeningSocket, server::ProtocolNotifier,
                     DisplayNotifier, SignalNotifier>;

enum class DeviceChange : uint8_t { none, output_lost };

void on_session_event(session::SessionEvent& event, RuntimeState& state);
/// @brief Handles a hot-plug notification. Returns `output_lost` when the managed GPU went away.
auto on_device_event(session::DeviceEvent& event, RuntimeState& state) -> DeviceChange;

/// @brief `on_device_event`, plus unregistering the display source from @p mux once the output
/// is lost. Its completions can no longer arrive and its fd may already be closed.
template <typename Multiplexer>
auto on_device_event(Multiplexer& mux, session::DeviceEvent& event, RuntimeState& state)
    -> DeviceChange {
    auto change = on_device_event(event, state);
    if (change == DeviceChange::output_lost && state.display_source) {
        mux.remove(*state.display_source);
        state.display_source.reset();
    }
    return change;
}

void on_raw_input(input::RawInputEvent& event, RuntimeState& state);
void on_connection(server::ListeningSocket::Event& event, RuntimeState& state);
void on_completion(output::CompletionEvent& event, RuntimeState& state);
void on_signal(SignalEvent& event, RuntimeState& state);

} // namespace kiln::runtime
