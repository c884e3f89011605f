#include "signal_notifier.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <string>
#include <sys/signalfd.h>
#include <unistd.h>

namespace kiln::runtime {

auto SignalNotifier::create(std::initializer_list<int> signals) -> Result<SignalNotifier> {
    sigset_t mask;
    sigemptyset(&mask);
    for (int signo : signals) {
        sigaddset(&mask, signo);
    }
    if (::sigprocmask(SIG_BLOCK, &mask, nullptr) < 0) {
        return make_error<SignalNotifier>(ErrorCode::registration_failed,
                                          std::string("sigprocmask failed: ") +
                                              std::strerror(errno));
    }

    util::UniqueFd fd{::signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC)};
    if (!fd) {
        return make_error<SignalNotifier>(ErrorCode::registration_failed,
                                          std::string("signalfd failed: ") + std::strerror(errno));
    }
    return SignalNotifier{std::move(fd)};
}

auto SignalNotifier::dispatch(std::vector<Event>& out) -> Result<void> {
    signalfd_siginfo info{};
    while (true) {
        ssize_t n = ::read(m_fd.get(), &info, sizeof(info));
        if (n == static_cast<ssize_t>(sizeof(info))) {
            out.push_back(SignalEvent{.signo = static_cast<int>(info.ssi_signo)});
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && errno != EAGAIN) {
            return make_error<void>(ErrorCode::invalid_data,
                                    std::string("signalfd read failed: ") + std::strerror(errno));
        }
        return {};
    }
}

} // namespace kiln::runtime
