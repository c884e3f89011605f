#pragma once

#include <cstdint>
#include <runtime/app_channel.hpp>
#include <util/error.hpp>
#include <util/external_image.hpp>

namespace kiln::render {

/// @brief Name under which the engine's camera finds the externally provided target.
using TargetHandle = uint32_t;

constexpr TargetHandle PRIMARY_TARGET = 0;

/// @brief An imported scanout buffer as the engine sees it. Valid for one frame tick.
struct FrameTarget {
    uint64_t id = 0;
    uint32_t width = 0;
    uint32_t height = 0;
    uint32_t drm_format = 0;
};

/// @brief Render engine contract: accept an external target, populate it once per update.
class RenderEngine {
public:
    virtual ~RenderEngine() = default;

    RenderEngine() = default;
    RenderEngine(const RenderEngine&) = delete;
    RenderEngine& operator=(const RenderEngine&) = delete;
    RenderEngine(RenderEngine&&) = delete;
    RenderEngine& operator=(RenderEngine&&) = delete;

    /// @brief Imports a dmabuf as a render target without copying pixels.
    /// @return The target, or `import_failed` for unsupported formats or foreign devices.
    [[nodiscard]] virtual auto import_target(const util::ExternalImage& image)
        -> Result<FrameTarget> = 0;
    virtual void attach_target(TargetHandle handle, const FrameTarget& target) = 0;
    /// @brief Runs one update cycle. The attached target is populated when this returns.
    /// @param channel Application channel; the engine consumes keys and may request exit.
    [[nodiscard]] virtual auto update(runtime::AppChannel& channel) -> Result<void> = 0;
    /// @brief Unbinds @p handle. The engine may keep the import cached for the same buffer.
    virtual void release_target(TargetHandle handle, const FrameTarget& target) = 0;
};

} // namespace kiln::render
