#pragma once

#include "render_engine.hpp"

#include <memory>
#include <sys/types.h>
#include <util/error.hpp>

namespace kiln::render {

/// @brief Vulkan render engine that draws into imported scanout dmabufs.
///
/// The update clears the attached target to a slowly cycling colour. Space pauses and resumes
/// the animation. Imports are cached per buffer, so a fixed swapchain imports each slot once.
class VulkanEngine final : public RenderEngine {
public:
    struct Settings {
        /// DRM device the scanout buffers live on; used to pick the matching GPU. 0 = any.
        dev_t drm_device = 0;
        bool enable_validation = false;
    };

    ~VulkanEngine() override;

    /// @brief Creates the instance, device, queue and command resources.
    /// @return A ready engine or `vulkan_init_failed`.
    [[nodiscard]] static auto create(const Settings& settings) -> ResultPtr<VulkanEngine>;

    [[nodiscard]] auto import_target(const util::ExternalImage& image)
        -> Result<FrameTarget> override;
    void attach_target(TargetHandle handle, const FrameTarget& target) override;
    [[nodiscard]] auto update(runtime::AppChannel& channel) -> Result<void> override;
    void release_target(TargetHandle handle, const FrameTarget& target) override;

private:
    struct Impl;
    VulkanEngine();

    std::unique_ptr<Impl> m_impl;
};

} // namespace kiln::render
