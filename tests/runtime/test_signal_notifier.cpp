#include "runtime/event_multiplexer.hpp"
#include "runtime/signal_notifier.hpp"

#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <csignal>
#include <vector>

using namespace kiln;
using namespace std::chrono_literals;

TEST_CASE("SignalNotifier delivers blocked signals as events", "[signal_notifier]") {
    auto notifier = runtime::SignalNotifier::create({SIGUSR1});
    REQUIRE(notifier);
    REQUIRE(notifier->fd() >= 0);

    std::vector<runtime::SignalEvent> events;
    REQUIRE(notifier->dispatch(events));
    REQUIRE(events.empty());

    REQUIRE(::raise(SIGUSR1) == 0);
    REQUIRE(notifier->dispatch(events));
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].signo == SIGUSR1);
}

TEST_CASE("SignalNotifier wakes the multiplexer", "[signal_notifier]") {
    struct Seen {
        std::vector<int> signals;
    };
    using Mux = runtime::EventMultiplexer<Seen, runtime::SignalNotifier>;

    auto mux = Mux::create();
    REQUIRE(mux);
    auto notifier = runtime::SignalNotifier::create({SIGUSR2});
    REQUIRE(notifier);
    REQUIRE((*mux)->insert_source(std::move(*notifier),
                                  [](runtime::SignalEvent& event, Seen& seen) {
                                      seen.signals.push_back(event.signo);
                                  }));

    REQUIRE(::raise(SIGUSR2) == 0);
    Seen seen;
    auto dispatched = (*mux)->run_once(100ms, seen);
    REQUIRE(dispatched);
    REQUIRE(*dispatched == 1);
    REQUIRE(seen.signals == std::vector<int>{SIGUSR2});
}
