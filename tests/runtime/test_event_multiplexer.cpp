#include "runtime/event_multiplexer.hpp"
#include "runtime/fd_notifier.hpp"
#include "runtime/pipe_source.hpp"

#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <fcntl.h>
#include <stdexcept>
#include <string>
#include <unistd.h>

using namespace kiln;
using namespace std::chrono_literals;

namespace {

struct Log {
    std::string entries;
};

using TestMultiplexer = runtime::EventMultiplexer<Log, test::PipeSource, test::FdNotifier>;

auto make_mux() -> std::unique_ptr<TestMultiplexer> {
    auto mux = TestMultiplexer::create();
    REQUIRE(mux);
    return std::move(*mux);
}

// Appends "<tag><byte>" for every byte the source delivers.
auto tagging(char tag) -> TestMultiplexer::Handler<test::PipeSource> {
    return [tag](char& byte, Log& log) {
        log.entries += tag;
        log.entries += byte;
    };
}

} // namespace

TEST_CASE("EventMultiplexer runs simultaneously ready sources in registration order",
          "[event_multiplexer]") {
    auto mux = make_mux();
    test::TestPipe a;
    test::TestPipe b;
    REQUIRE(mux->insert_source(test::PipeSource{a.read_end.get()}, tagging('A')));
    REQUIRE(mux->insert_source(test::PipeSource{b.read_end.get()}, tagging('B')));

    // B fires first, A second; registration order still wins.
    b.write("1");
    a.write("2");

    Log log;
    auto dispatched = mux->run_once(0ms, log);
    REQUIRE(dispatched);
    REQUIRE(*dispatched == 2);
    REQUIRE(log.entries == "A2B1");
}

TEST_CASE("EventMultiplexer delivers one source's events in arrival order",
          "[event_multiplexer]") {
    auto mux = make_mux();
    test::TestPipe pipe;
    REQUIRE(mux->insert_source(test::PipeSource{pipe.read_end.get()}, tagging('P')));

    pipe.write("xyz");
    Log log;
    REQUIRE(mux->run_once(0ms, log));
    REQUIRE(log.entries == "PxPyPz");
}

TEST_CASE("EventMultiplexer returns zero on timeout", "[event_multiplexer]") {
    auto mux = make_mux();
    test::TestPipe pipe;
    REQUIRE(mux->insert_source(test::PipeSource{pipe.read_end.get()}, tagging('P')));

    Log log;
    auto start = std::chrono::steady_clock::now();
    auto dispatched = mux->run_once(5ms, log);
    REQUIRE(dispatched);
    REQUIRE(*dispatched == 0);
    REQUIRE(log.entries.empty());
    REQUIRE(std::chrono::steady_clock::now() - start >= 4ms);
}

TEST_CASE("EventMultiplexer refuses sources it cannot poll", "[event_multiplexer]") {
    auto mux = make_mux();
    auto noop = [](test::FdReady&, Log&) {};

    SECTION("Negative descriptor") {
        auto id = mux->insert_source(test::FdNotifier{-1}, noop);
        REQUIRE(!id);
        REQUIRE(id.error().code == ErrorCode::registration_failed);
    }

    SECTION("Descriptor epoll does not support") {
        util::UniqueFd file{::open(KILN_SOURCE_DIR "/CMakeLists.txt", O_RDONLY | O_CLOEXEC)};
        REQUIRE(file);
        auto id = mux->insert_source(test::FdNotifier{file.get()}, noop);
        REQUIRE(!id);
        REQUIRE(id.error().code == ErrorCode::registration_failed);
    }

    REQUIRE(mux->size() == 0);
}

TEST_CASE("EventMultiplexer defers removal requested while dispatching",
          "[event_multiplexer]") {
    auto mux = make_mux();
    test::TestPipe a;
    test::TestPipe b;
    runtime::SourceId b_id = 0;

    REQUIRE(mux->insert_source(test::PipeSource{a.read_end.get()},
                               [&](char& byte, Log& log) {
                                   log.entries += 'A';
                                   log.entries += byte;
                                   mux->remove(b_id);
                                   log.entries += mux->contains(b_id) ? '+' : '-';
                               }));
    auto id = mux->insert_source(test::PipeSource{b.read_end.get()}, tagging('B'));
    REQUIRE(id);
    b_id = *id;

    a.write("1");
    b.write("2");
    Log log;
    REQUIRE(mux->run_once(0ms, log));

    // B was already ready in this wait, so it still runs once.
    REQUIRE(log.entries == "A1-B2");
    REQUIRE(mux->size() == 1);
    REQUIRE_FALSE(mux->contains(b_id));

    b.write("3");
    log.entries.clear();
    auto dispatched = mux->run_once(0ms, log);
    REQUIRE(dispatched);
    REQUIRE(*dispatched == 0);
    REQUIRE(log.entries.empty());
}

TEST_CASE("EventMultiplexer keeps dispatching after a handler throws", "[event_multiplexer]") {
    auto mux = make_mux();
    test::TestPipe a;
    test::TestPipe b;
    REQUIRE(mux->insert_source(test::PipeSource{a.read_end.get()},
                               [](char&, Log&) { throw std::runtime_error("handler failed"); }));
    REQUIRE(mux->insert_source(test::PipeSource{b.read_end.get()}, tagging('B')));

    a.write("1");
    b.write("2");
    Log log;
    REQUIRE(mux->run_once(0ms, log));
    REQUIRE(log.entries == "B2");
}

TEST_CASE("EventMultiplexer removes sources immediately outside dispatch",
          "[event_multiplexer]") {
    auto mux = make_mux();
    test::TestPipe pipe;
    auto id = mux->insert_source(test::PipeSource{pipe.read_end.get()}, tagging('P'));
    REQUIRE(id);
    REQUIRE(mux->contains(*id));

    mux->remove(*id);
    REQUIRE_FALSE(mux->contains(*id));
    REQUIRE(mux->size() == 0);

    pipe.write("x");
    Log log;
    auto dispatched = mux->run_once(0ms, log);
    REQUIRE(dispatched);
    REQUIRE(*dispatched == 0);
}
