#pragma once

#include <chrono>
#include <cstdint>
#include <util/error.hpp>
#include <util/unique_fd.hpp>
#include <vector>

namespace kiln::runtime {

/// @brief Level-triggered epoll set keyed by caller-chosen tokens.
class Poller {
public:
    [[nodiscard]] static auto create() -> Result<Poller>;

    /// @return `registration_failed` if the kernel refuses the descriptor.
    [[nodiscard]] auto add(int fd, uint64_t token) -> Result<void>;
    void remove(int fd);

    /// @brief Waits until at least one descriptor is readable or @p timeout elapses.
    /// @param ready Cleared, then filled with the tokens of readable descriptors.
    /// @return Empty on timeout or signal interruption; `invalid_data` on other wait failures.
    [[nodiscard]] auto wait(std::chrono::milliseconds timeout, std::vector<uint64_t>& ready)
        -> Result<void>;

    [[nodiscard]] auto fd() const -> int { return m_epoll.get(); }

private:
    explicit Poller(util::UniqueFd epoll) : m_epoll(std::move(epoll)) {}

    util::UniqueFd m_epoll;
};

} // namespace kiln::runtime
