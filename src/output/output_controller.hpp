#pragma once

#include "display_device.hpp"
#include "swapchain.hpp"

#include <deque>
#include <memory>
#include <optional>
#include <util/error.hpp>

namespace kiln::output {

/// @brief Drives the swapchain in lock-step with presentation completions.
///
/// At most one commit is in flight. Buffers submitted while a commit is in flight stay queued
/// and are committed in submission order as completions arrive.
class OutputController {
public:
    struct Stats {
        uint64_t submitted = 0;
        uint64_t presented = 0;
        uint64_t rejected = 0;
        uint64_t exhausted = 0;
    };

    explicit OutputController(std::unique_ptr<DisplayDevice> device);

    OutputController(const OutputController&) = delete;
    OutputController& operator=(const OutputController&) = delete;
    OutputController(OutputController&&) = delete;
    OutputController& operator=(OutputController&&) = delete;

    /// @return The slot, or `no_free_slot` with no slot state changed.
    [[nodiscard]] auto acquire_writable_buffer() -> Result<SlotId>;
    [[nodiscard]] auto buffer(SlotId slot) const -> const util::ExternalImage&;
    void discard(SlotId slot);
    /// Commits immediately unless a commit is already in flight.
    /// @return `commit_rejected` if the kernel refused the commit. The slot is then free and
    /// the presented slot is unchanged. Not retried.
    [[nodiscard]] auto submit(SlotId slot, DamageRegion damage) -> Result<void>;
    /// @brief Marks the in-flight slot presented, frees the previous one, commits the next.
    ///
    /// Completions for any other commit, including ones issued before a session pause, are
    /// ignored.
    void on_completion(const CompletionEvent& event);

    /// @brief Re-arms the output after the session was re-activated.
    void on_session_resumed();
    void mark_lost();

    [[nodiscard]] auto is_lost() const -> bool { return m_lost; }
    [[nodiscard]] auto in_flight() const -> std::optional<SlotId> { return m_in_flight; }
    [[nodiscard]] auto pending() const -> size_t { return m_pending.size(); }
    [[nodiscard]] auto swapchain() const -> const Swapchain& { return m_swapchain; }
    [[nodiscard]] auto descriptor() const -> const OutputDescriptor& {
        return m_device->descriptor();
    }
    [[nodiscard]] auto stats() const -> const Stats& { return m_stats; }
    [[nodiscard]] auto device() -> DisplayDevice& { return *m_device; }

private:
    struct PendingCommit {
        SlotId slot;
        DamageRegion damage;
    };

    [[nodiscard]] auto commit_now(SlotId slot, const DamageRegion& damage) -> Result<void>;
    void commit_next_pending();

    std::unique_ptr<DisplayDevice> m_device;
    Swapchain m_swapchain;
    std::optional<SlotId> m_in_flight;
    CommitId m_in_flight_commit = 0;
    std::deque<PendingCommit> m_pending;
    Stats m_stats;
    bool m_lost = false;
};

} // namespace kiln::output
