#pragma once

#include <chrono>
#include <cstdint>

namespace kiln::runtime {

/// @brief Gates frame ticks to a fixed interval, independent of how often the reactor wakes.
///
/// `poll` reports at most one due tick per call and restarts the interval from the time it was
/// called. Intervals missed while the reactor was busy are dropped, not caught up.
class FramePacer {
public:
    using Clock = std::chrono::steady_clock;

    explicit FramePacer(std::chrono::nanoseconds interval, Clock::time_point start = Clock::now());

    [[nodiscard]] static auto interval_for_fps(uint32_t fps) -> std::chrono::nanoseconds;

    /// @brief Returns true and restarts the interval if a tick is due at @p now.
    [[nodiscard]] auto poll(Clock::time_point now) -> bool;

    /// @brief Reactor wait bound: time until the next tick is due, never above the interval.
    [[nodiscard]] auto timeout(Clock::time_point now) const -> std::chrono::milliseconds;

    [[nodiscard]] auto interval() const -> std::chrono::nanoseconds { return m_interval; }
    [[nodiscard]] auto ticks() const -> uint64_t { return m_ticks; }
    // Whole intervals that elapsed without a tick, summed over all ticks.
    [[nodiscard]] auto skipped_intervals() const -> uint64_t { return m_skipped; }

private:
    std::chrono::nanoseconds m_interval;
    Clock::time_point m_last_tick;
    uint64_t m_ticks = 0;
    uint64_t m_skipped = 0;
};

} // namespace kiln::runtime
