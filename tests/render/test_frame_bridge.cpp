#include "render/fake_render_engine.hpp"
#include "render/frame_bridge.hpp"

#include <catch2/catch_test_macros.hpp>
#include <fcntl.h>
#include <string>
#include <unistd.h>
#include <vector>

using namespace kiln;

namespace {

auto make_buffer() -> util::ExternalImage {
    util::ExternalImage image;
    image.width = 640;
    image.height = 480;
    image.stride = 640 * 4;
    image.drm_format = 0x34325258;
    image.handle = util::UniqueFd{::open("/dev/null", O_RDONLY | O_CLOEXEC)};
    return image;
}

} // namespace

TEST_CASE("FrameBridge imports once and updates once per tick", "[frame_bridge]") {
    test::FakeRenderEngine engine;
    render::FrameBridge bridge;
    runtime::AppChannel channel;
    auto buffer = make_buffer();

    REQUIRE(bridge.tick(engine, buffer, channel));
    REQUIRE(engine.calls == std::vector<std::string>{"import", "attach", "update", "release"});
    REQUIRE(engine.imported_fds == std::vector<int>{buffer.handle.get()});
    REQUIRE_FALSE(engine.attached.has_value());

    REQUIRE(bridge.tick(engine, buffer, channel));
    REQUIRE(engine.updates == 2);
    REQUIRE(bridge.stats().ticks == 2);
    REQUIRE(bridge.stats().imports == 2);
    REQUIRE(bridge.stats().updates == 2);
}

TEST_CASE("FrameBridge skips the update when the import fails", "[frame_bridge]") {
    test::FakeRenderEngine engine;
    engine.fail_import = true;
    render::FrameBridge bridge;
    runtime::AppChannel channel;
    auto buffer = make_buffer();

    auto result = bridge.tick(engine, buffer, channel);
    REQUIRE(!result);
    REQUIRE(result.error().code == ErrorCode::import_failed);
    REQUIRE(engine.updates == 0);
    REQUIRE(engine.calls == std::vector<std::string>{"import"});
    REQUIRE(bridge.stats().import_failures == 1);
}

TEST_CASE("FrameBridge detaches the target when the update fails", "[frame_bridge]") {
    test::FakeRenderEngine engine;
    engine.fail_update = true;
    render::FrameBridge bridge;
    runtime::AppChannel channel;
    auto buffer = make_buffer();

    auto result = bridge.tick(engine, buffer, channel);
    REQUIRE(!result);
    REQUIRE(result.error().code == ErrorCode::render_failed);
    REQUIRE(engine.calls.back() == "release");
    REQUIRE_FALSE(engine.attached.has_value());
    REQUIRE(bridge.stats().update_failures == 1);
}

TEST_CASE("FrameBridge hands queued keys to the engine", "[frame_bridge]") {
    test::FakeRenderEngine engine;
    render::FrameBridge bridge;
    runtime::AppChannel channel;
    auto buffer = make_buffer();

    channel.send_key(runtime::KeyInput{.keycode = 57, .name = "space", .pressed = true});
    REQUIRE(bridge.tick(engine, buffer, channel));
    REQUIRE(engine.seen_keys.size() == 1);
    REQUIRE(engine.seen_keys.front().name == "space");
    REQUIRE(channel.drain_keys().empty());
}
