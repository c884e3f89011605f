#pragma once

#include <fcntl.h>
#include <unistd.h>
#include <utility>

namespace kiln::util {

class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : m_fd(fd) {}

    ~UniqueFd() { close_current(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept : m_fd(std::exchange(other.m_fd, -1)) {}

    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset(std::exchange(other.m_fd, -1));
        }
        return *this;
    }

    /// Returns an invalid fd if @p fd is negative.
    [[nodiscard]] static UniqueFd dup_from(int fd) {
        if (fd < 0) {
            return UniqueFd{};
        }
        return UniqueFd{::fcntl(fd, F_DUPFD_CLOEXEC, 0)};
    }

    [[nodiscard]] UniqueFd dup() const { return dup_from(m_fd); }

    void reset(int fd = -1) {
        if (fd != m_fd) {
            close_current();
        }
        m_fd = fd;
    }

    [[nodiscard]] int get() const { return m_fd; }
    int release() { return std::exchange(m_fd, -1); }
    [[nodiscard]] bool valid() const { return m_fd >= 0; }
    explicit operator bool() const { return valid(); }

private:
    void close_current() {
        if (m_fd >= 0) {
            ::close(m_fd);
        }
    }

    int m_fd = -1;
};

} // namespace kiln::util
