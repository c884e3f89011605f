#include "frame_bridge.hpp"

#include <util/logging.hpp>
#include <util/profiling.hpp>

namespace kiln::render {

auto FrameBridge::tick(RenderEngine& engine, const util::ExternalImage& buffer,
                       runtime::AppChannel& channel) -> Result<void> {
    KILN_PROFILE_FUNCTION();
    ++m_stats.ticks;

    auto target = engine.import_target(buffer);
    if (!target) {
        ++m_stats.import_failures;
        return make_error<void>(ErrorCode::import_failed,
                                "Target import failed: " + target.error().message,
                                target.error().location);
    }
    ++m_stats.imports;

    engine.attach_target(PRIMARY_TARGET, *target);
    auto updated = [&] {
        KILN_PROFILE_SCOPE("EngineUpdate");
        return engine.update(channel);
    }();
    ++m_stats.updates;
    engine.release_target(PRIMARY_TARGET, *target);

    if (!updated) {
        ++m_stats.update_failures;
        return make_error<void>(ErrorCode::render_failed,
                                "Engine update failed: " + updated.error().message,
                                updated.error().location);
    }

    KILN_LOG_TRACE("Frame {} rendered into target {} ({}x{})", m_stats.ticks, target->id,
                   target->width, target->height);
    return {};
}

} // namespace kiln::render
