#include "output_controller.hpp"

#include <util/logging.hpp>
#include <util/profiling.hpp>

namespace kiln::output {

OutputController::OutputController(std::unique_ptr<DisplayDevice> device)
    : m_device(std::move(device)), m_swapchain(m_device->slot_count()) {}

auto OutputController::acquire_writable_buffer() -> Result<SlotId> {
    if (m_lost) {
        return make_error<SlotId>(ErrorCode::no_free_slot, "Output device is gone");
    }
    auto slot = m_swapchain.acquire();
    if (!slot && slot.error().code == ErrorCode::no_free_slot) {
        ++m_stats.exhausted;
    }
    KILN_PROFILE_VALUE("free_slots", m_swapchain.count(SlotState::free));
    return slot;
}

auto OutputController::buffer(SlotId slot) const -> const util::ExternalImage& {
    return m_device->buffer(slot);
}

void OutputController::discard(SlotId slot) {
    auto result = m_swapchain.cancel(slot);
    if (!result) {
        KILN_LOG_WARN("Discarding slot {} failed: {}", slot, result.error().message);
    }
}

auto OutputController::submit(SlotId slot, DamageRegion damage) -> Result<void> {
    KILN_PROFILE_FUNCTION();
    if (m_lost) {
        discard(slot);
        return make_error<void>(ErrorCode::commit_rejected, "Output device is gone");
    }

    KILN_TRY(m_swapchain.queue(slot));
    ++m_stats.submitted;

    if (m_in_flight) {
        KILN_LOG_TRACE("Slot {} queued behind in-flight slot {}", slot, *m_in_flight);
        m_pending.push_back(PendingCommit{.slot = slot, .damage = std::move(damage)});
        return {};
    }

    return commit_now(slot, damage);
}

auto OutputController::commit_now(SlotId slot, const DamageRegion& damage) -> Result<void> {
    auto commit = m_device->commit(slot, damage);
    if (!commit) {
        ++m_stats.rejected;
        auto reverted = m_swapchain.reject(slot);
        if (!reverted) {
            KILN_LOG_ERROR("Reverting rejected slot {} failed: {}", slot,
                           reverted.error().message);
        }
        return make_error<void>(ErrorCode::commit_rejected, commit.error().message,
                                commit.error().location);
    }
    m_in_flight = slot;
    m_in_flight_commit = *commit;
    return {};
}

void OutputController::commit_next_pending() {
    while (!m_in_flight && !m_pending.empty()) {
        PendingCommit next = std::move(m_pending.front());
        m_pending.pop_front();
        auto result = commit_now(next.slot, next.damage);
        if (!result) {
            KILN_LOG_ERROR("Queued commit for slot {} rejected: {}", next.slot,
                           result.error().message);
        }
    }
}

void OutputController::on_completion(const CompletionEvent& event) {
    KILN_PROFILE_FUNCTION();
    if (!m_in_flight || *m_in_flight != event.slot || m_in_flight_commit != event.commit) {
        KILN_LOG_WARN("Completion for slot {} (commit {}) does not match the in-flight commit",
                      event.slot, event.commit);
        return;
    }

    auto released = m_swapchain.present(event.slot);
    m_in_flight.reset();
    m_in_flight_commit = 0;
    if (!released) {
        KILN_LOG_ERROR("Presenting slot {} failed: {}", event.slot, released.error().message);
    } else {
        ++m_stats.presented;
        if (*released) {
            KILN_LOG_TRACE("Slot {} presented (seq {}), slot {} released", event.slot,
                           event.sequence, **released);
        }
        KILN_PROFILE_FRAME("Present");
    }

    commit_next_pending();
}

void OutputController::on_session_resumed() {
    m_device->request_modeset();
    // Completions for commits issued before the pause are not delivered after a VT switch.
    if (m_in_flight) {
        KILN_LOG_DEBUG("Treating in-flight slot {} as presented after resume", *m_in_flight);
        on_completion(CompletionEvent{.slot = *m_in_flight, .commit = m_in_flight_commit});
    }
}

void OutputController::mark_lost() {
    if (m_lost) {
        return;
    }
    m_lost = true;
    for (const auto& pending : m_pending) {
        if (auto reverted = m_swapchain.reject(pending.slot); !reverted) {
            KILN_LOG_WARN("Dropping queued slot {} failed: {}", pending.slot,
                          reverted.error().message);
        }
    }
    m_pending.clear();
    KILN_LOG_ERROR("Output '{}' lost; frame submission disabled", descriptor().name);
}

} // namespace kiln::output
