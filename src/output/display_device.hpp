#pragma once

#include "swapchain.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <sys/types.h>
#include <util/config.hpp>
#include <util/error.hpp>
#include <util/external_image.hpp>
#include <vector>

namespace kiln::output {

struct OutputMode {
    uint32_t width = 0;
    uint32_t height = 0;
    uint32_t refresh_mhz = 0;
};

// Set once at startup.
struct OutputDescriptor {
    std::string name;
    OutputMode mode;
    uint32_t physical_width_mm = 0;
    uint32_t physical_height_mm = 0;
    OutputTransform transform = OutputTransform::normal;
    int32_t x = 0;
    int32_t y = 0;
    dev_t device = 0;
};

struct DamageRect {
    int32_t x = 0;
    int32_t y = 0;
    int32_t width = 0;
    int32_t height = 0;
};

// Buffer coordinates. Empty means the whole frame.
using DamageRegion = std::vector<DamageRect>;

/// @brief Identifies one atomic commit. Never reused by a device; 0 is never issued.
using CommitId = uint64_t;

/// @brief Presentation completion reported by the display subsystem for one commit.
struct CompletionEvent {
    SlotId slot = 0;
    CommitId commit = 0;
    uint32_t crtc_id = 0;
    uint32_t sequence = 0;
    std::chrono::nanoseconds timestamp{0};
};

/// @brief Kernel-facing half of the output: buffers and atomic commits, no slot bookkeeping.
class DisplayDevice {
public:
    virtual ~DisplayDevice() = default;

    DisplayDevice() = default;
    DisplayDevice(const DisplayDevice&) = delete;
    DisplayDevice& operator=(const DisplayDevice&) = delete;
    DisplayDevice(DisplayDevice&&) = delete;
    DisplayDevice& operator=(DisplayDevice&&) = delete;

    [[nodiscard]] virtual auto descriptor() const -> const OutputDescriptor& = 0;
    [[nodiscard]] virtual auto slot_count() const -> uint32_t = 0;
    /// @brief Returns the dmabuf backing @p slot. The device keeps ownership of the fd.
    [[nodiscard]] virtual auto buffer(SlotId slot) const -> const util::ExternalImage& = 0;
    /// @brief Issues one atomic commit scanning out @p slot. Completion arrives asynchronously
    /// and carries the returned id.
    [[nodiscard]] virtual auto commit(SlotId slot, const DamageRegion& damage)
        -> Result<CommitId> = 0;
    virtual void request_modeset() = 0;

    /// @brief Descriptor that becomes readable when completions are pending, or -1.
    [[nodiscard]] virtual auto event_fd() const -> int = 0;
    /// @brief Drains pending completions in arrival order.
    [[nodiscard]] virtual auto read_completions(std::vector<CompletionEvent>& out)
        -> Result<void> = 0;
};

} // namespace kiln::output
