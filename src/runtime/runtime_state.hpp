#pragma once

#include "app_channel.hpp"
#include "event_multiplexer.hpp"
#include "frame_pacer.hpp"

#include <chrono>
#include <cstdint>
#include <input/input_translator.hpp>
#include <input/keymap.hpp>
#include <memory>
#include <optional>
#include <output/output_controller.hpp>
#include <render/frame_bridge.hpp>
#include <render/render_engine.hpp>
#include <server/client_registry.hpp>
#include <server/protocol_server.hpp>
#include <session/input_context.hpp>
#include <session/session.hpp>

namespace kiln::runtime {

/// @brief Everything the reactor thread mutates, passed by reference into every handler.
///
/// Members are destroyed in reverse order, so each one may refer to those declared before it.
/// Subsystems held by pointer may be absent; the frame loop and handlers skip what is missing.
struct RuntimeState {
    struct Stats {
        uint64_t ticks = 0;
        uint64_t rendered = 0;
        uint64_t skipped_inactive = 0;
        uint64_t skipped_lost = 0;
        uint64_t skipped_no_slot = 0;
        uint64_t skipped_import = 0;
        uint64_t skipped_render = 0;
        uint64_t rejected_commits = 0;
        uint64_t no_slot_streak = 0;
    };

    explicit RuntimeState(std::chrono::nanoseconds frame_interval) : pacer(frame_interval) {}

    RuntimeState(const RuntimeState&) = delete;
    RuntimeState& operator=(const RuntimeState&) = delete;
    RuntimeState(RuntimeState&&) = delete;
    RuntimeState& operator=(RuntimeState&&) = delete;

    AppChannel channel;
    std::unique_ptr<session::Session> session;
    std::unique_ptr<session::SeatDevice> gpu;
    std::unique_ptr<output::OutputController> output;
    std::unique_ptr<render::RenderEngine> engine;
    render::FrameBridge bridge;
    FramePacer pacer;
    std::unique_ptr<server::ProtocolServer> protocol;
    std::unique_ptr<server::ClientRegistry> clients;
    std::unique_ptr<input::Keymap> keymap;
    std::unique_ptr<input::InputTranslator> translator;
    std::unique_ptr<session::InputContext> input;
    std::optional<SourceId> display_source;
    // Mirrors the last seat notification; frame ticks are skipped while false.
    bool session_active = true;
    Stats stats;
};

} // namespace kiln::runtime
