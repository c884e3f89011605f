#pragma once

#include <util/error.hpp>
#include <vector>

namespace kiln::test {

struct FdReady {
    int fd = -1;
};

/// Reports a borrowed descriptor as readable on every wakeup. The handler does the reading.
class FdNotifier {
public:
    using Event = FdReady;

    explicit FdNotifier(int fd) : m_fd(fd) {}

    [[nodiscard]] auto fd() const -> int { return m_fd; }

    [[nodiscard]] auto dispatch(std::vector<Event>& out) -> Result<void> {
        out.push_back(FdReady{.fd = m_fd});
        return {};
    }

private:
    int m_fd;
};

} // namespace kiln::test
