#pragma once

#include "render_engine.hpp"

#include <cstdint>
#include <runtime/app_channel.hpp>
#include <util/error.hpp>
#include <util/external_image.hpp>

namespace kiln::render {

/// @brief Hands one writable scanout buffer to the render engine per frame tick.
///
/// Each tick imports exactly one target, runs exactly one engine update against it, then
/// detaches it. The target never outlives the tick.
class FrameBridge {
public:
    struct Stats {
        uint64_t ticks = 0;
        uint64_t imports = 0;
        uint64_t updates = 0;
        uint64_t import_failures = 0;
        uint64_t update_failures = 0;
    };

    /// @brief Renders into @p buffer.
    /// @return `import_failed` if the buffer could not be imported (no update ran), or
    /// `render_failed` if the update reported an error. On success the buffer holds the frame.
    [[nodiscard]] auto tick(RenderEngine& engine, const util::ExternalImage& buffer,
                            runtime::AppChannel& channel) -> Result<void>;

    [[nodiscard]] auto stats() const -> const Stats& { return m_stats; }

private:
    Stats m_stats;
};

} // namespace kiln::render
