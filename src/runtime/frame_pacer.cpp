#include "frame_pacer.hpp"

#include <algorithm>

namespace kiln::runtime {

FramePacer::FramePacer(std::chrono::nanoseconds interval, Clock::time_point start)
    : m_interval(std::max(interval, std::chrono::nanoseconds{1})), m_last_tick(start) {}

auto FramePacer::interval_for_fps(uint32_t fps) -> std::chrono::nanoseconds {
    return std::chrono::nanoseconds{std::chrono::seconds{1}} / std::max<uint32_t>(fps, 1);
}

auto FramePacer::poll(Clock::time_point now) -> bool {
    auto elapsed = now - m_last_tick;
    if (elapsed < m_interval) {
        return false;
    }
    m_skipped += static_cast<uint64_t>(elapsed / m_interval) - 1;
    m_last_tick = now;
    ++m_ticks;
    return true;
}

auto FramePacer::timeout(Clock::time_point now) const -> std::chrono::milliseconds {
    auto remaining = std::clamp<std::chrono::nanoseconds>(m_interval - (now - m_last_tick),
                                                          std::chrono::nanoseconds{0}, m_interval);
    return std::chrono::ceil<std::chrono::milliseconds>(remaining);
}

} // namespace kiln::runtime
