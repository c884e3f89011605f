#include "frame_loop.hpp"

#include <util/profiling.hpp>

namespace kiln::runtime {

namespace {

void note_slot_starvation(RuntimeState& state, const Error& error) {
    ++state.stats.skipped_no_slot;
    if (state.stats.no_slot_streak++ == 0) {
        KILN_LOG_WARN("No free swapchain slot, skipping frames: {}", error.message);
    } else {
        KILN_LOG_DEBUG("Still no free swapchain slot ({} ticks)", state.stats.no_slot_streak);
    }
}

void end_slot_starvation(RuntimeState& state) {
    if (state.stats.no_slot_streak == 0) {
        return;
    }
    KILN_LOG_INFO("Swapchain slot available again after {} skipped ticks",
                  state.stats.no_slot_streak);
    state.stats.no_slot_streak = 0;
}

// Keys belong to the frame they arrive before. A frame that never reaches the engine drops them
// instead of replaying them later in one burst.
void drop_frame_keys(RuntimeState& state) {
    if (state.channel.pending_keys() == 0) {
        return;
    }
    KILN_LOG_DEBUG("Dropping {} key events of a skipped frame", state.channel.pending_keys());
    state.channel.drop_keys();
}

} // namespace

void run_frame_tick(RuntimeState& state) {
    KILN_PROFILE_FUNCTION();
    ++state.stats.ticks;

    if (!state.session_active) {
        ++state.stats.skipped_inactive;
        drop_frame_keys(state);
        return;
    }
    if (!state.output || state.output->is_lost() || !state.engine) {
        ++state.stats.skipped_lost;
        drop_frame_keys(state);
        return;
    }

    auto& output = *state.output;
    auto slot = output.acquire_writable_buffer();
    if (!slot) {
        if (slot.error().code == ErrorCode::no_free_slot) {
            note_slot_starvation(state, slot.error());
        } else {
            KILN_LOG_ERROR("Acquiring a swapchain slot failed: {}", slot.error().message);
        }
        drop_frame_keys(state);
        return;
    }
    end_slot_starvation(state);

    auto rendered = state.bridge.tick(*state.engine, output.buffer(*slot), state.channel);
    if (!rendered) {
        drop_frame_keys(state);
        output.discard(*slot);
        if (rendered.error().code == ErrorCode::vulkan_device_lost) {
            ++state.stats.skipped_render;
            KILN_LOG_CRITICAL("Render engine lost its device: {}", rendered.error().message);
            state.channel.request_exit(AppExit::failure);
            return;
        }
        if (rendered.error().code == ErrorCode::import_failed) {
            ++state.stats.skipped_import;
        } else {
            ++state.stats.skipped_render;
        }
        KILN_LOG_WARN("Frame skipped ({}): {}", error_code_name(rendered.error().code),
                      rendered.error().message);
        return;
    }

    auto submitted = output.submit(*slot, {});
    if (!submitted) {
        ++state.stats.rejected_commits;
        KILN_LOG_WARN("Display commit rejected, keeping current frame: {}",
                      submitted.error().message);
        return;
    }
    ++state.stats.rendered;

    if (state.protocol) {
        state.protocol->send_frame_done(FramePacer::Clock::now().time_since_epoch());
    }
}

auto tick_if_due(RuntimeState& state, FramePacer::Clock::time_point now) -> bool {
    if (!state.pacer.poll(now)) {
        return false;
    }
    run_frame_tick(state);
    return true;
}

void log_frame_stats(const RuntimeState& state) {
    const auto& s = state.stats;
    KILN_LOG_INFO("Frames: {} ticks, {} rendered, {} intervals dropped", s.ticks, s.rendered,
                  state.pacer.skipped_intervals());
    KILN_LOG_INFO("Skipped ticks: {} inactive, {} output lost, {} no slot, {} import, {} render, "
                  "{} rejected",
                  s.skipped_inactive, s.skipped_lost, s.skipped_no_slot, s.skipped_import,
                  s.skipped_render, s.rejected_commits);
    if (state.channel.dropped_keys() > 0) {
        KILN_LOG_INFO("Key events dropped by skipped frames: {}", state.channel.dropped_keys());
    }
    if (state.output) {
        const auto& o = state.output->stats();
        KILN_LOG_INFO("Output: {} submitted, {} presented, {} rejected, {} exhausted",
                      o.submitted, o.presented, o.rejected, o.exhausted);
    }
}

} // namespace kiln::runtime
