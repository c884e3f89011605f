#include "handlers.hpp"

#include <csignal>
#include <cstring>
#include <util/logging.hpp>

namespace kiln::runtime {

void on_session_event(session::SessionEvent& event, RuntimeState& state) {
    state.session_active = event.active;
    if (!event.active) {
        KILN_LOG_INFO("Session paused, frame ticks suspended");
        if (state.input) {
            state.input->suspend();
        }
        return;
    }

    KILN_LOG_INFO("Session active, resuming output");
    if (state.input) {
        auto resumed = state.input->resume();
        if (!resumed) {
            KILN_LOG_ERROR("Input did not resume: {}", resumed.error().message);
        }
    }
    if (state.output) {
        state.output->on_session_resumed();
    }
}

auto on_device_event(session::DeviceEvent& event, RuntimeState& state) -> DeviceChange {
    KILN_LOG_DEBUG("DRM device {} {}", event.path.string(), session::to_string(event.action));
    bool managed = state.output && event.devnum == state.output->descriptor().device;
    if (!managed) {
        if (event.action == session::DeviceAction::added) {
            KILN_LOG_INFO("Ignoring new GPU {}", event.path.string());
        }
        return DeviceChange::none;
    }

    switch (event.action) {
    case session::DeviceAction::removed:
        KILN_LOG_ERROR("Display device {} removed", event.path.string());
        if (state.output && !state.output->is_lost()) {
            state.output->mark_lost();
        }
        return DeviceChange::output_lost;
    case session::DeviceAction::changed:
        // Connector changes are not acted on; the bound mode stays in use.
        KILN_LOG_DEBUG("Display device {} changed", event.path.string());
        return DeviceChange::none;
    case session::DeviceAction::added:
        return DeviceChange::none;
    }
    return DeviceChange::none;
}

void on_raw_input(input::RawInputEvent& event, RuntimeState& state) {
    if (!state.translator) {
        return;
    }
    auto disposition = state.translator->on_raw_event(event, state.channel);
    if (disposition.action != input::KeyAction::vt_switch || !state.session) {
        return;
    }
    auto switched = state.session->switch_vt(disposition.vt);
    if (!switched) {
        KILN_LOG_WARN("{}", switched.error().message);
    }
}

void on_connection(server::ListeningSocket::Event& event, RuntimeState& state) {
    if (!event) {
        KILN_LOG_CRITICAL("Listening socket failed: {}", event.error().message);
        state.channel.request_exit(AppExit::failure);
        return;
    }
    if (!state.clients) {
        return;
    }
    auto client = state.clients->accept(std::move(*event));
    if (!client) {
        KILN_LOG_WARN("Rejected connection: {}", client.error().message);
    }
}

void on_completion(output::CompletionEvent& event, RuntimeState& state) {
    if (state.output) {
        state.output->on_completion(event);
    }
}

void on_signal(SignalEvent& event, RuntimeState& state) {
    KILN_LOG_INFO("Received {}, shutting down", ::strsignal(event.signo));
    state.channel.request_exit(AppExit::success);
}

} // namespace kiln::runtime
