#include "util/unique_fd.hpp"

#include <array>
#include <catch2/catch_test_macros.hpp>
#include <fcntl.h>
#include <unistd.h>
#include <utility>

using namespace kiln::util;

namespace {

auto is_open(int fd) -> bool {
    return fcntl(fd, F_GETFD) != -1;
}

// Both ends of a pipe, owned.
struct Pipe {
    UniqueFd read_end;
    UniqueFd write_end;

    Pipe() {
        std::array<int, 2> fds{-1, -1};
        if (::pipe(fds.data()) == 0) {
            read_end = UniqueFd{fds[0]};
            write_end = UniqueFd{fds[1]};
        }
    }
};

} // namespace

TEST_CASE("UniqueFd construction", "[unique_fd]") {
    SECTION("Default construction is invalid") {
        UniqueFd fd;
        REQUIRE(!fd.valid());
        REQUIRE(!fd);
        REQUIRE(fd.get() == -1);
    }

    SECTION("Adopts a valid descriptor") {
        Pipe pipe;
        REQUIRE(pipe.read_end);
        REQUIRE(pipe.read_end.get() >= 0);
    }
}

TEST_CASE("UniqueFd closes on destruction", "[unique_fd]") {
    int raw = -1;
    {
        Pipe pipe;
        raw = pipe.write_end.get();
        REQUIRE(is_open(raw));
    }
    REQUIRE(!is_open(raw));
}

TEST_CASE("UniqueFd move transfers ownership", "[unique_fd]") {
    Pipe pipe;
    int raw = pipe.read_end.get();

    SECTION("Move construction") {
        UniqueFd moved{std::move(pipe.read_end)};
        REQUIRE(moved.get() == raw);
        REQUIRE(!pipe.read_end.valid()); // NOLINT(bugprone-use-after-move)
    }

    SECTION("Move assignment closes the previous descriptor") {
        Pipe other;
        int replaced = other.read_end.get();
        other.read_end = std::move(pipe.read_end);
        REQUIRE(other.read_end.get() == raw);
        REQUIRE(!is_open(replaced));
    }
}

TEST_CASE("UniqueFd reset closes and adopts", "[unique_fd]") {
    Pipe pipe;
    int old_fd = pipe.read_end.get();
    int adopted = pipe.write_end.release();

    pipe.read_end.reset(adopted);
    REQUIRE(!is_open(old_fd));
    REQUIRE(pipe.read_end.get() == adopted);

    pipe.read_end.reset();
    REQUIRE(!pipe.read_end.valid());
    REQUIRE(!is_open(adopted));
}

TEST_CASE("UniqueFd dup_from returns an independent close-on-exec copy", "[unique_fd]") {
    Pipe pipe;
    UniqueFd copy = UniqueFd::dup_from(pipe.write_end.get());

    REQUIRE(copy.valid());
    REQUIRE(copy.get() != pipe.write_end.get());
    REQUIRE((fcntl(copy.get(), F_GETFD) & FD_CLOEXEC) != 0);

    pipe.write_end.reset();
    char byte = 'k';
    REQUIRE(::write(copy.get(), &byte, 1) == 1);

    SECTION("Negative input yields an invalid fd") {
        REQUIRE(!UniqueFd::dup_from(-1).valid());
        REQUIRE(!UniqueFd{}.dup().valid());
    }
}

TEST_CASE("UniqueFd release gives up ownership", "[unique_fd]") {
    Pipe pipe;
    int raw = pipe.read_end.release();
    REQUIRE(!pipe.read_end.valid());
    REQUIRE(is_open(raw));
    ::close(raw);
}
