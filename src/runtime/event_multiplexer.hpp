#pragma once

#include "poller.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <type_traits>
#include <util/error.hpp>
#include <util/logging.hpp>
#include <utility>
#include <variant>
#include <vector>

namespace kiln::runtime {

using SourceId = uint64_t;

/// @brief Single-threaded reactor over a closed set of event source kinds.
///
/// Every source kind provides `using Event`, `fd() const -> int` and
/// `dispatch(std::vector<Event>&) -> Result<void>`, which drains whatever the descriptor has
/// ready without blocking. Handlers receive each event together with the runtime state.
///
/// Among sources that are ready in the same wait, handlers run in registration order. Events of
/// one source are delivered in the order `dispatch` produced them. A source removed from inside
/// a handler stays registered until the current `run_once` has finished dispatching.
template <typename State, typename... Sources>
class EventMultiplexer {
public:
    template <typename Source>
    using Handler = std::function<void(typename Source::Event&, State&)>;

    [[nodiscard]] static auto create() -> ResultPtr<EventMultiplexer> {
        auto poller = KILN_TRY(Poller::create());
        return make_result_ptr(
            std::unique_ptr<EventMultiplexer>(new EventMultiplexer(std::move(poller))));
    }

    EventMultiplexer(const EventMultiplexer&) = delete;
    EventMultiplexer& operator=(const EventMultiplexer&) = delete;
    EventMultiplexer(EventMultiplexer&&) = delete;
    EventMultiplexer& operator=(EventMultiplexer&&) = delete;

    ~EventMultiplexer() = default;

    /// @brief Takes ownership of @p source and starts polling it.
    /// @return The id for `remove`, or `registration_failed` if the source cannot be polled.
    template <typename Source>
    [[nodiscard]] auto insert_source(Source source, Handler<Source> handler) -> Result<SourceId> {
        static_assert((std::is_same_v<Source, Sources> || ...),
                      "Source kind is not part of this multiplexer");
        int fd = source.fd();
        if (fd < 0) {
            return make_error<SourceId>(ErrorCode::registration_failed,
                                        "Event source has no pollable descriptor");
        }
        SourceId id = m_next_id;
        KILN_TRY(m_poller.add(fd, id));
        ++m_next_id;
        m_sources.emplace(id, Entry{std::in_place_type<Registration<Source>>,
                                    Registration<Source>{std::move(source), std::move(handler), {}}});
        return id;
    }

    /// @brief Stops polling a source and destroys it. Deferred while dispatching.
    void remove(SourceId id) {
        if (m_dispatching) {
            m_pending_removals.push_back(id);
            return;
        }
        erase(id);
    }

    [[nodiscard]] auto contains(SourceId id) const -> bool {
        return m_sources.contains(id) &&
               std::find(m_pending_removals.begin(), m_pending_removals.end(), id) ==
                   m_pending_removals.end();
    }
    [[nodiscard]] auto size() const -> size_t { return m_sources.size(); }

    /// @brief Waits up to @p timeout, then runs the handlers of every ready source.
    /// @return Number of sources dispatched; zero on timeout. Errors only for a failed wait.
    [[nodiscard]] auto run_once(std::chrono::milliseconds timeout, State& state) -> Result<size_t> {
        KILN_TRY(m_poller.wait(timeout, m_ready));
        std::sort(m_ready.begin(), m_ready.end());
        m_ready.erase(std::unique(m_ready.begin(), m_ready.end()), m_ready.end());

        size_t dispatched = 0;
        m_dispatching = true;
        for (SourceId id : m_ready) {
            auto it = m_sources.find(id);
            if (it == m_sources.end()) {
                continue;
            }
            std::visit([this, id, &state](auto& registration) { dispatch(id, registration, state); },
                       it->second);
            ++dispatched;
        }
        m_dispatching = false;

        for (SourceId id : std::exchange(m_pending_removals, {})) {
            erase(id);
        }
        return dispatched;
    }

private:
    template <typename Source>
    struct Registration {
        Source source;
        Handler<Source> handler;
        std::vector<typename Source::Event> events;
    };

    using Entry = std::variant<Registration<Sources>...>;

    explicit EventMultiplexer(Poller poller) : m_poller(std::move(poller)) {}

    static auto fd_of(const Entry& entry) -> int {
        return std::visit([](const auto& registration) { return registration.source.fd(); },
                          entry);
    }

    template <typename Source>
    void dispatch(SourceId id, Registration<Source>& registration, State& state) {
        registration.events.clear();
        auto drained = registration.source.dispatch(registration.events);
        if (!drained) {
            KILN_LOG_WARN("Event source {} dispatch failed: {}", id, drained.error().message);
        }
        for (auto& event : registration.events) {
            try {
                registration.handler(event, state);
            } catch (const std::exception& e) {
                KILN_LOG_ERROR("Handler for event source {} threw: {}", id, e.what());
            }
        }
        registration.events.clear();
    }

    void erase(SourceId id) {
        auto it = m_sources.find(id);
        if (it == m_sources.end()) {
            return;
        }
        m_poller.remove(fd_of(it->second));
        m_sources.erase(it);
    }

    Poller m_poller;
    std::map<SourceId, Entry> m_sources;
    std::vector<uint64_t> m_ready;
    std::vector<SourceId> m_pending_removals;
    SourceId m_next_id = 1;
    bool m_dispatching = false;
};

} // namespace kiln::runtime
