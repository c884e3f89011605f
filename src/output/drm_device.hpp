#pragma once

#include "display_device.hpp"

#include <memory>
#include <util/config.hpp>
#include <util/error.hpp>

namespace kiln::output {

struct DrmSettings {
    uint32_t slot_count = 3;
    OutputTransform transform = OutputTransform::normal;
    bool damage_tracking = true;
};

/// @brief Atomic KMS output on one connector, scanning out GBM-allocated linear buffers.
///
/// Setup picks the first connected connector with a mode (its preferred mode if flagged), a
/// CRTC its encoders can drive, and the primary plane of that CRTC. Every failure during setup
/// is reported as a setup error; nothing is retried at runtime.
class DrmDevice final : public DisplayDevice {
public:
    ~DrmDevice() override;

    /// @brief Binds the device and allocates one scanout buffer per slot.
    /// @param drm_fd Borrowed DRM primary node fd. Must outlive the device.
    /// @param settings Slot count, transform and damage options.
    /// @return A ready device or a setup error.
    [[nodiscard]] static auto create(int drm_fd, const DrmSettings& settings)
        -> ResultPtr<DrmDevice>;

    [[nodiscard]] auto descriptor() const -> const OutputDescriptor& override;
    [[nodiscard]] auto slot_count() const -> uint32_t override;
    [[nodiscard]] auto buffer(SlotId slot) const -> const util::ExternalImage& override;
    [[nodiscard]] auto commit(SlotId slot, const DamageRegion& damage)
        -> Result<CommitId> override;
    void request_modeset() override;
    [[nodiscard]] auto event_fd() const -> int override;
    [[nodiscard]] auto read_completions(std::vector<CompletionEvent>& out)
        -> Result<void> override;

private:
    struct Impl;
    DrmDevice();

    std::unique_ptr<Impl> m_impl;
};

} // namespace kiln::output
