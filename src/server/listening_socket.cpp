#include "listening_socket.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>
#include <util/logging.hpp>

namespace kiln::server {

namespace {

constexpr int LISTEN_BACKLOG = 128;

} // namespace

ListeningSocket::~ListeningSocket() {
    if (!m_fd) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove(m_socket_path, ec);
    if (m_lock_fd) {
        std::filesystem::remove(m_lock_path, ec);
    }
}

auto ListeningSocket::bind(const std::filesystem::path& runtime_dir, const std::string& name)
    -> Result<ListeningSocket> {
    if (!name.empty()) {
        return try_bind(runtime_dir, name);
    }

    for (int display = FIRST_DISPLAY; display <= LAST_DISPLAY; ++display) {
        auto bound = try_bind(runtime_dir, "wayland-" + std::to_string(display));
        if (bound) {
            return bound;
        }
        KILN_LOG_DEBUG("wayland-{} unavailable: {}", display, bound.error().message);
    }
    return make_error<ListeningSocket>(
        ErrorCode::socket_failed, "No free Wayland socket (wayland-" +
                                      std::to_string(FIRST_DISPLAY) + "..wayland-" +
                                      std::to_string(LAST_DISPLAY) + " all in use)");
}

auto ListeningSocket::try_bind(const std::filesystem::path& runtime_dir, const std::string& name)
    -> Result<ListeningSocket> {
    ListeningSocket socket;
    socket.m_name = name;
    socket.m_socket_path = runtime_dir / name;
    socket.m_lock_path = runtime_dir / (name + ".lock");

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    const std::string socket_path = socket.m_socket_path.string();
    if (socket_path.size() >= sizeof(addr.sun_path)) {
        return make_error<ListeningSocket>(ErrorCode::socket_failed,
                                           "Socket path too long: " + socket_path);
    }
    std::memcpy(addr.sun_path, socket_path.c_str(), socket_path.size() + 1);

    socket.m_lock_fd.reset(::open(socket.m_lock_path.c_str(), O_CREAT | O_CLOEXEC | O_RDWR,
                                  S_IRUSR | S_IWUSR | S_IRGRP | S_IWGRP));
    if (!socket.m_lock_fd) {
        return make_error<ListeningSocket>(ErrorCode::socket_failed,
                                           "Cannot open lock " + socket.m_lock_path.string() +
                                               ": " + std::strerror(errno));
    }
    if (::flock(socket.m_lock_fd.get(), LOCK_EX | LOCK_NB) < 0) {
        // Held by a live server; keep its lock file in place.
        socket.m_lock_fd.reset();
        return make_error<ListeningSocket>(ErrorCode::socket_failed,
                                           socket.m_lock_path.string() + " is held");
    }

    // The lock is ours, so any existing socket file is stale.
    struct stat st {};
    if (::lstat(socket_path.c_str(), &st) == 0 && ::unlink(socket_path.c_str()) < 0) {
        return make_error<ListeningSocket>(ErrorCode::socket_failed,
                                           "Cannot remove stale " + socket_path + ": " +
                                               std::strerror(errno));
    }

    util::UniqueFd fd{::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0)};
    if (!fd) {
        return make_error<ListeningSocket>(ErrorCode::socket_failed,
                                           std::string("socket() failed: ") +
                                               std::strerror(errno));
    }
    if (::bind(fd.get(), reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
        return make_error<ListeningSocket>(ErrorCode::socket_failed,
                                           "bind(" + socket_path + ") failed: " +
                                               std::strerror(errno));
    }
    if (::listen(fd.get(), LISTEN_BACKLOG) < 0) {
        ::unlink(socket_path.c_str());
        return make_error<ListeningSocket>(ErrorCode::socket_failed,
                                           "listen(" + socket_path + ") failed: " +
                                               std::strerror(errno));
    }

    socket.m_fd = std::move(fd);
    KILN_LOG_INFO("Listening on {}", socket_path);
    return socket;
}

auto ListeningSocket::dispatch(std::vector<Event>& out) -> Result<void> {
    while (true) {
        int client = ::accept4(m_fd.get(), nullptr, nullptr, SOCK_CLOEXEC | SOCK_NONBLOCK);
        if (client >= 0) {
            out.emplace_back(util::UniqueFd{client});
            continue;
        }
        if (errno == EINTR || errno == ECONNABORTED) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return {};
        }
        out.emplace_back(nonstd::make_unexpected(
            Error{ErrorCode::socket_failed, "accept on " + m_socket_path.string() + " failed: " +
                                                std::strerror(errno)}));
        return {};
    }
}

} // namespace kiln::server
