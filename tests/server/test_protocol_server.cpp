#include "server/protocol_server.hpp"

#include <algorithm>
#include <array>
#include <catch2/catch_test_macros.hpp>
#include <string>
#include <sys/socket.h>
#include <sys/stat.h>
#include <vector>

extern "C" {
#include <wayland-client-core.h>
#include <wayland-client-protocol.h>
#include <wayland-server-core.h>
}

using namespace kiln;

namespace {

constexpr const char* RENDER_NODE = "/dev/dri/renderD128";

struct ClientDisplayDeleter {
    void operator()(wl_display* display) const { wl_display_disconnect(display); }
};

// Interfaces announced to one client on its first registry round.
struct GlobalList {
    std::vector<std::string> interfaces;

    [[nodiscard]] auto has(const std::string& name) const -> bool {
        return std::find(interfaces.begin(), interfaces.end(), name) != interfaces.end();
    }
};

void on_global(void* data, wl_registry* /*registry*/, uint32_t /*name*/, const char* interface,
               uint32_t /*version*/) {
    static_cast<GlobalList*>(data)->interfaces.emplace_back(interface);
}

void on_global_remove(void* /*data*/, wl_registry* /*registry*/, uint32_t /*name*/) {}

constexpr wl_registry_listener REGISTRY_LISTENER{
    .global = on_global,
    .global_remove = on_global_remove,
};

auto list_globals(server::ProtocolServer& server) -> GlobalList {
    std::array<int, 2> fds{-1, -1};
    REQUIRE(::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds.data()) == 0);
    REQUIRE(wl_client_create(server.display(), fds[0]) != nullptr);
    std::unique_ptr<wl_display, ClientDisplayDeleter> client{wl_display_connect_to_fd(fds[1])};
    REQUIRE(client);

    GlobalList globals;
    wl_registry* registry = wl_display_get_registry(client.get());
    wl_registry_add_listener(registry, &REGISTRY_LISTENER, &globals);
    REQUIRE(wl_display_flush(client.get()) >= 0);

    REQUIRE(server.dispatch());
    server.flush_clients();
    REQUIRE(wl_display_dispatch(client.get()) >= 0);
    wl_registry_destroy(registry);
    return globals;
}

} // namespace

TEST_CASE("ProtocolServer advertises text input, input method and decoration globals",
          "[server][protocol]") {
    struct stat node{};
    if (::stat(RENDER_NODE, &node) != 0) {
        SKIP("No DRM render node for linux-dmabuf feedback");
    }

    server::ProtocolSettings settings;
    settings.output.name = "TEST-1";
    settings.output.mode = {.width = 64, .height = 32, .refresh_mhz = 60000};
    settings.main_device = node.st_rdev;

    auto server = server::ProtocolServer::create(settings);
    REQUIRE(server);

    auto globals = list_globals(**server);
    CHECK(globals.has("wl_compositor"));
    CHECK(globals.has("xdg_wm_base"));
    CHECK(globals.has("zxdg_decoration_manager_v1"));
    CHECK(globals.has("zwp_text_input_manager_v3"));
    CHECK(globals.has("zwp_input_method_manager_v2"));
    CHECK(globals.has("zwp_keyboard_shortcuts_inhibit_manager_v1"));
}
