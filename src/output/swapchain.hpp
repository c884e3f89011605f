#pragma once

#include <cstdint>
#include <optional>
#include <util/error.hpp>
#include <vector>

namespace kiln::output {

using SlotId = uint32_t;

// Free: owned by nobody. Writable: owned by the frame tick. Queued: handed to the display
// subsystem, not yet on screen. Presented: currently scanned out.
enum class SlotState : std::uint8_t { free, writable, queued, presented };

[[nodiscard]] constexpr auto to_string(SlotState state) -> const char* {
    switch (state) {
    case SlotState::free:
        return "free";
    case SlotState::writable:
        return "writable";
    case SlotState::queued:
        return "queued";
    case SlotState::presented:
        return "presented";
    }
    return "unknown";
}

/// @brief Fixed pool of buffer slots indexed by id. The only mutator of slot state.
///
/// Invariants: at most one slot is writable; at most one slot is presented; a slot only moves
/// queued -> presented through `present()`; a writable slot only comes from a free one.
/// Failed transitions leave every slot untouched.
class Swapchain {
public:
    static constexpr uint32_t MIN_SLOTS = 2;
    static constexpr uint32_t MAX_SLOTS = 4;

    explicit Swapchain(uint32_t slot_count);

    /// Moves the next free slot to writable, cycling through the pool.
    /// @return The slot, `no_free_slot` when all slots are outstanding, or `invalid_data` if
    /// a writable slot already exists.
    [[nodiscard]] auto acquire() -> Result<SlotId>;
    [[nodiscard]] auto cancel(SlotId slot) -> Result<void>;
    // writable -> queued
    [[nodiscard]] auto queue(SlotId slot) -> Result<void>;
    // queued -> free, for a buffer the display refused
    [[nodiscard]] auto reject(SlotId slot) -> Result<void>;
    /// queued -> presented. @return The previously presented slot, now free, if any.
    [[nodiscard]] auto present(SlotId slot) -> Result<std::optional<SlotId>>;

    [[nodiscard]] auto state(SlotId slot) const -> SlotState { return m_states.at(slot); }
    [[nodiscard]] auto size() const -> uint32_t { return static_cast<uint32_t>(m_states.size()); }
    [[nodiscard]] auto count(SlotState state) const -> uint32_t;
    [[nodiscard]] auto presented() const -> std::optional<SlotId>;
    [[nodiscard]] auto writable() const -> std::optional<SlotId>;

private:
    [[nodiscard]] auto expect(SlotId slot, SlotState expected) const -> Result<void>;

    std::vector<SlotState> m_states;
    SlotId m_next = 0;
};

} // namespace kiln::output
