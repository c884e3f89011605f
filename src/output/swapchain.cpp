#include "swapchain.hpp"

#include <algorithm>
#include <string>

namespace kiln::output {

Swapchain::Swapchain(uint32_t slot_count)
    : m_states(std::clamp(slot_count, MIN_SLOTS, MAX_SLOTS), SlotState::free) {}

auto Swapchain::acquire() -> Result<SlotId> {
    if (writable()) {
        return make_error<SlotId>(ErrorCode::invalid_data,
                                  "Slot " + std::to_string(*writable()) + " is already writable");
    }

    for (uint32_t step = 0; step < size(); ++step) {
        SlotId candidate = (m_next + step) % size();
        if (m_states[candidate] == SlotState::free) {
            m_states[candidate] = SlotState::writable;
            m_next = (candidate + 1) % size();
            return candidate;
        }
    }

    return make_error<SlotId>(ErrorCode::no_free_slot,
                              "All " + std::to_string(size()) + " swapchain slots are outstanding");
}

auto Swapchain::cancel(SlotId slot) -> Result<void> {
    KILN_TRY(expect(slot, SlotState::writable));
    m_states[slot] = SlotState::free;
    return {};
}

auto Swapchain::queue(SlotId slot) -> Result<void> {
    KILN_TRY(expect(slot, SlotState::writable));
    m_states[slot] = SlotState::queued;
    return {};
}

auto Swapchain::reject(SlotId slot) -> Result<void> {
    KILN_TRY(expect(slot, SlotState::queued));
    m_states[slot] = SlotState::free;
    return {};
}

auto Swapchain::present(SlotId slot) -> Result<std::optional<SlotId>> {
    KILN_TRY(expect(slot, SlotState::queued));

    std::optional<SlotId> released = presented();
    if (released) {
        m_states[*released] = SlotState::free;
    }
    m_states[slot] = SlotState::presented;
    return released;
}

auto Swapchain::count(SlotState state) const -> uint32_t {
    return static_cast<uint32_t>(std::count(m_states.begin(), m_states.end(), state));
}

auto Swapchain::presented() const -> std::optional<SlotId> {
    auto it = std::find(m_states.begin(), m_states.end(), SlotState::presented);
    if (it == m_states.end()) {
        return std::nullopt;
    }
    return static_cast<SlotId>(std::distance(m_states.begin(), it));
}

auto Swapchain::writable() const -> std::optional<SlotId> {
    auto it = std::find(m_states.begin(), m_states.end(), SlotState::writable);
    if (it == m_states.end()) {
        return std::nullopt;
    }
    return static_cast<SlotId>(std::distance(m_states.begin(), it));
}

auto Swapchain::expect(SlotId slot, SlotState expected) const -> Result<void> {
    if (slot >= size()) {
        return make_error<void>(ErrorCode::invalid_data,
                                "Slot " + std::to_string(slot) + " is out of range");
    }
    if (m_states[slot] != expected) {
        return make_error<void>(ErrorCode::invalid_data,
                                "Slot " + std::to_string(slot) + " is " +
                                    to_string(m_states[slot]) + ", expected " +
                                    to_string(expected));
    }
    return {};
}

} // namespace kiln::output
