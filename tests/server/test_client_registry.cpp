#include "server/client_registry.hpp"

#include <array>
#include <catch2/catch_test_macros.hpp>
#include <fcntl.h>
#include <memory>
#include <sys/socket.h>
#include <unistd.h>

extern "C" {
#include <wayland-server-core.h>
}

using namespace kiln;
using kiln::server::ClientRegistry;

namespace {

struct DisplayDeleter {
    void operator()(wl_display* display) const { wl_display_destroy(display); }
};

struct SocketPair {
    util::UniqueFd server;
    util::UniqueFd client;

    SocketPair() {
        std::array<int, 2> fds{-1, -1};
        if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds.data()) == 0) {
            server = util::UniqueFd{fds[0]};
            client = util::UniqueFd{fds[1]};
        }
    }
};

// The registry is declared after the display so it is destroyed first.
struct Fixture {
    std::unique_ptr<wl_display, DisplayDeleter> display{wl_display_create()};
    std::unique_ptr<ClientRegistry> registry = std::make_unique<ClientRegistry>(display.get());
};

} // namespace

TEST_CASE("ClientRegistry accepts a socket connection", "[client_registry]") {
    Fixture fx;
    SocketPair pair;

    auto id = fx.registry->accept(std::move(pair.server));
    REQUIRE(id);
    REQUIRE(fx.registry->size() == 1);
    REQUIRE(fx.registry->stats().accepted == 1);

    SECTION("The record carries the peer credentials") {
        const auto* record = fx.registry->find(nullptr);
        REQUIRE(record == nullptr);
        wl_client* client = nullptr;
        wl_list* clients = wl_display_get_client_list(fx.display.get());
        client = wl_client_from_link(clients->next);
        record = fx.registry->find(client);
        REQUIRE(record != nullptr);
        REQUIRE(record->id == *id);
        REQUIRE(record->pid == ::getpid());
    }

    SECTION("No security context without a manager") {
        REQUIRE_FALSE(fx.registry->security_context(*id).has_value());
    }
}

TEST_CASE("ClientRegistry assigns distinct ids", "[client_registry]") {
    Fixture fx;
    SocketPair a;
    SocketPair b;
    auto first = fx.registry->accept(std::move(a.server));
    auto second = fx.registry->accept(std::move(b.server));
    REQUIRE(first);
    REQUIRE(second);
    REQUIRE(*first != *second);
    REQUIRE(fx.registry->size() == 2);
}

TEST_CASE("ClientRegistry rejects descriptors that are not sockets", "[client_registry]") {
    Fixture fx;

    SECTION("Invalid descriptor") {
        auto id = fx.registry->accept(util::UniqueFd{});
        REQUIRE(!id);
        REQUIRE(id.error().code == ErrorCode::client_failed);
    }

    SECTION("Pipe") {
        std::array<int, 2> fds{-1, -1};
        REQUIRE(::pipe2(fds.data(), O_CLOEXEC) == 0);
        util::UniqueFd write_end{fds[1]};
        auto id = fx.registry->accept(util::UniqueFd{fds[0]});
        REQUIRE(!id);
        REQUIRE(id.error().code == ErrorCode::client_failed);
        REQUIRE(error_kind(id.error().code) == ErrorKind::client_failure);
    }

    REQUIRE(fx.registry->size() == 0);
    REQUIRE(fx.registry->stats().failed == 1);
}

TEST_CASE("ClientRegistry forgets destroyed clients", "[client_registry]") {
    Fixture fx;
    SocketPair keep;
    SocketPair drop;
    auto kept = fx.registry->accept(std::move(keep.server));
    REQUIRE(kept);
    REQUIRE(fx.registry->accept(std::move(drop.server)));
    REQUIRE(fx.registry->size() == 2);

    SECTION("Destroyed by the server") {
        wl_list* clients = wl_display_get_client_list(fx.display.get());
        wl_client* last = wl_client_from_link(clients->prev);
        wl_client_destroy(last);
    }

    SECTION("Peer hung up") {
        drop.client.reset();
        wl_event_loop* loop = wl_display_get_event_loop(fx.display.get());
        REQUIRE(wl_event_loop_dispatch(loop, 100) >= 0);
    }

    REQUIRE(fx.registry->size() == 1);
    REQUIRE(fx.registry->stats().disconnected == 1);
    REQUIRE(fx.registry->stats().accepted == 2);
    // The other client is unaffected.
    REQUIRE_FALSE(fx.registry->security_context(*kept).has_value());
    wl_list* clients = wl_display_get_client_list(fx.display.get());
    REQUIRE(fx.registry->find(wl_client_from_link(clients->next)) != nullptr);
}

TEST_CASE("ClientRegistry tracks clients created outside accept", "[client_registry]") {
    Fixture fx;
    SocketPair pair;
    wl_client* client = wl_client_create(fx.display.get(), pair.server.release());
    REQUIRE(client != nullptr);
    REQUIRE(fx.registry->size() == 1);
    REQUIRE(fx.registry->find(client) != nullptr);
}
