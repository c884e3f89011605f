#include "poller.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <string>
#include <sys/epoll.h>
#include <util/logging.hpp>

namespace kiln::runtime {

namespace {

constexpr int MAX_EVENTS = 32;

} // namespace

auto Poller::create() -> Result<Poller> {
    util::UniqueFd epoll{::epoll_create1(EPOLL_CLOEXEC)};
    if (!epoll) {
        return make_error<Poller>(ErrorCode::registration_failed,
                                  std::string("epoll_create1 failed: ") + std::strerror(errno));
    }
    return Poller{std::move(epoll)};
}

auto Poller::add(int fd, uint64_t token) -> Result<void> {
    epoll_event event{};
    event.events = EPOLLIN;
    event.data.u64 = token;
    if (::epoll_ctl(m_epoll.get(), EPOLL_CTL_ADD, fd, &event) < 0) {
        return make_error<void>(ErrorCode::registration_failed,
                                "Cannot poll fd " + std::to_string(fd) + ": " +
                                    std::strerror(errno));
    }
    return {};
}

void Poller::remove(int fd) {
    if (::epoll_ctl(m_epoll.get(), EPOLL_CTL_DEL, fd, nullptr) < 0) {
        KILN_LOG_DEBUG("epoll_ctl(DEL, {}) failed: {}", fd, std::strerror(errno));
    }
}

auto Poller::wait(std::chrono::milliseconds timeout, std::vector<uint64_t>& ready)
    -> Result<void> {
    ready.clear();
    std::array<epoll_event, MAX_EVENTS> events{};
    int count = ::epoll_wait(m_epoll.get(), events.data(), MAX_EVENTS,
                             static_cast<int>(std::max<int64_t>(timeout.count(), 0)));
    if (count < 0) {
        if (errno == EINTR) {
            return {};
        }
        return make_error<void>(ErrorCode::invalid_data,
                                std::string("epoll_wait failed: ") + std::strerror(errno));
    }
    for (int i = 0; i < count; ++i) {
        ready.push_back(events[static_cast<size_t>(i)].data.u64);
    }
    return {};
}

} // namespace kiln::runtime
