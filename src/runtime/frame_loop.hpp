#pragma once

#include "runtime_state.hpp"

#include <util/logging.hpp>

namespace kiln::runtime {

/// @brief One render-and-present cycle: acquire a slot, render into it, submit it.
///
/// Skipped without side effects while the session is paused or the output is gone. A starved
/// swapchain, a failed import or render, and a rejected commit each skip the frame and leave
/// the presented buffer on screen.
void run_frame_tick(RuntimeState& state);

/// @brief Runs a frame tick if the pacer says one is due at @p now.
/// @return Whether a tick was attempted.
auto tick_if_due(RuntimeState& state, FramePacer::Clock::time_point now) -> bool;

void log_frame_stats(const RuntimeState& state);

/// @brief Drives @p mux until an exit is requested and returns that exit.
///
/// The exit request is checked after every `run_once`, before the pacer, so no tick runs once
/// shutdown has been signalled.
template <typename Multiplexer>
auto run_loop(Multiplexer& mux, RuntimeState& state) -> AppExit {
    while (true) {
        if (state.protocol) {
            state.protocol->flush_clients();
        }

        auto dispatched = mux.run_once(state.pacer.timeout(FramePacer::Clock::now()), state);
        if (!dispatched) {
            KILN_LOG_CRITICAL("Event loop failed: {}", dispatched.error().message);
            state.channel.request_exit(AppExit::failure);
        }

        if (auto exit = state.channel.exit_requested()) {
            KILN_LOG_INFO("Leaving event loop ({})", to_string(*exit));
            return *exit;
        }

        tick_if_due(state, FramePacer::Clock::now());
    }
}

} // namespace kiln::runtime
