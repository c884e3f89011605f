#pragma once

#include <initializer_list>
#include <util/error.hpp>
#include <util/unique_fd.hpp>
#include <vector>

namespace kiln::runtime {

struct SignalEvent {
    int signo = 0;
};

/// @brief Delivers process signals through a signalfd so they are handled on the reactor thread.
class SignalNotifier {
public:
    using Event = SignalEvent;

    /// @brief Blocks @p signals for the calling thread and opens a signalfd for them.
    [[nodiscard]] static auto create(std::initializer_list<int> signals) -> Result<SignalNotifier>;

    [[nodiscard]] auto fd() const -> int { return m_fd.get(); }
    [[nodiscard]] auto dispatch(std::vector<Event>& out) -> Result<void>;

private:
    explicit SignalNotifier(util::UniqueFd fd) : m_fd(std::move(fd)) {}

    util::UniqueFd m_fd;
};

} // namespace kiln::runtime
