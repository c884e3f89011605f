#pragma once

#include "session.hpp"

#include <input/raw_input.hpp>
#include <memory>
#include <string>
#include <util/error.hpp>
#include <vector>

namespace kiln::session {

/// @brief libinput udev context whose device nodes are opened through the session.
class InputContext {
public:
    using Event = input::RawInputEvent;

    ~InputContext();

    InputContext(const InputContext&) = delete;
    InputContext& operator=(const InputContext&) = delete;
    InputContext(InputContext&&) = delete;
    InputContext& operator=(InputContext&&) = delete;

    /// @brief Creates the context and assigns it to the session's seat.
    /// @param session Must outlive the context.
    [[nodiscard]] static auto create(Session& session) -> ResultPtr<InputContext>;

    [[nodiscard]] auto fd() const -> int;
    /// @brief Reads pending libinput events and converts them, in arrival order.
    [[nodiscard]] auto dispatch(std::vector<Event>& out) -> Result<void>;

    void suspend();
    [[nodiscard]] auto resume() -> Result<void>;

private:
    struct Impl;
    InputContext();

    std::unique_ptr<Impl> m_impl;
};

// Reactor source for an input context owned elsewhere.
class InputNotifier {
public:
    using Event = input::RawInputEvent;

    explicit InputNotifier(InputContext& context) : m_context(&context) {}

    [[nodiscard]] auto fd() const -> int { return m_context->fd(); }
    [[nodiscard]] auto dispatch(std::vector<Event>& out) -> Result<void> {
        return m_context->dispatch(out);
    }

private:
    InputContext* m_context;
};

} // namespace kiln::session
