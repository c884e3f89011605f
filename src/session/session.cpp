#include "session.hpp"

#include <cerrno>
#include <cstring>
#include <sys/stat.h>
#include <util/c_log.hpp>
#include <util/logging.hpp>

extern "C" {
#include <libseat.h>
}

namespace kiln::session {

namespace {

constexpr int ENABLE_ATTEMPTS = 50;
constexpr int ENABLE_WAIT_MS = 100;

void libseat_log_bridge(enum libseat_log_level level, const char* format, va_list args) {
    auto formatted = util::format_c_log_message(format, args);
    if (formatted.status != util::CLogFormatStatus::ok || formatted.message.empty()) {
        return;
    }
    switch (level) {
    case LIBSEAT_LOG_LEVEL_ERROR:
        KILN_LOG_ERROR("[seat] {}", formatted.message);
        return;
    case LIBSEAT_LOG_LEVEL_INFO:
        KILN_LOG_INFO("[seat] {}", formatted.message);
        return;
    case LIBSEAT_LOG_LEVEL_DEBUG:
        KILN_LOG_DEBUG("[seat] {}", formatted.message);
        return;
    default:
        return;
    }
}

auto libseat_level_from_log_level(spdlog::level::level_enum level) -> enum libseat_log_level {
    if (level <= spdlog::level::debug) {
        return LIBSEAT_LOG_LEVEL_DEBUG;
    }
    if (level <= spdlog::level::info) {
        return LIBSEAT_LOG_LEVEL_INFO;
    }
    return LIBSEAT_LOG_LEVEL_ERROR;
}

} // namespace

struct Session::Impl {
    libseat* seat = nullptr;
    libseat_seat_listener listener{};
    bool active = false;
    std::vector<SessionEvent> pending;

    ~Impl() {
        if (seat) {
            libseat_close_seat(seat);
        }
    }

    static void handle_enable(libseat* /*seat*/, void* data) {
        auto* impl = static_cast<Impl*>(data);
        impl->active = true;
        impl->pending.push_back(SessionEvent{.active = true});
        KILN_LOG_INFO("Session activated");
    }

    static void handle_disable(libseat* seat, void* data) {
        auto* impl = static_cast<Impl*>(data);
        impl->active = false;
        impl->pending.push_back(SessionEvent{.active = false});
        KILN_LOG_INFO("Session paused");
        if (libseat_disable_seat(seat) < 0) {
            KILN_LOG_ERROR("Failed to acknowledge seat disable: {}", std::strerror(errno));
        }
    }
};

SeatDevice::SeatDevice(Session& session, int device_id, util::UniqueFd fd,
                       std::filesystem::path path, dev_t devnum)
    : m_session(session), m_device_id(device_id), m_fd(std::move(fd)), m_path(std::move(path)),
      m_devnum(devnum) {}

SeatDevice::~SeatDevice() {
    m_session.close_device(m_device_id);
}

Session::Session() : m_impl(std::make_unique<Impl>()) {}

Session::~Session() = default;

auto Session::create() -> ResultPtr<Session> {
    libseat_set_log_level(libseat_level_from_log_level(get_logger()->level()));
    libseat_set_log_handler(libseat_log_bridge);

    auto session = std::unique_ptr<Session>(new Session());
    auto& impl = *session->m_impl;
    impl.listener.enable_seat = Impl::handle_enable;
    impl.listener.disable_seat = Impl::handle_disable;

    impl.seat = libseat_open_seat(&impl.listener, &impl);
    if (!impl.seat) {
        return make_result_ptr_error<Session>(ErrorCode::session_failed,
                                              std::string("Failed to open seat: ") +
                                                  std::strerror(errno));
    }

    for (int attempt = 0; attempt < ENABLE_ATTEMPTS && !impl.active; ++attempt) {
        if (libseat_dispatch(impl.seat, ENABLE_WAIT_MS) < 0) {
            return make_result_ptr_error<Session>(ErrorCode::session_failed,
                                                  std::string("Seat dispatch failed: ") +
                                                      std::strerror(errno));
        }
    }
    if (!impl.active) {
        return make_result_ptr_error<Session>(ErrorCode::session_failed,
                                              "Timed out waiting for the seat to be enabled");
    }
    impl.pending.clear();

    KILN_LOG_INFO("Session opened on {}", session->seat_name());
    return make_result_ptr(std::move(session));
}

auto Session::fd() const -> int {
    return libseat_get_fd(m_impl->seat);
}

auto Session::dispatch(std::vector<SessionEvent>& out) -> Result<void> {
    auto& impl = *m_impl;
    int result = libseat_dispatch(impl.seat, 0);
    out.insert(out.end(), impl.pending.begin(), impl.pending.end());
    impl.pending.clear();
    if (result < 0) {
        return make_error<void>(ErrorCode::session_failed,
                                std::string("Seat dispatch failed: ") + std::strerror(errno));
    }
    return {};
}

auto Session::active() const -> bool {
    return m_impl->active;
}

auto Session::seat_name() const -> std::string {
    const char* name = libseat_seat_name(m_impl->seat);
    return name ? name : "";
}

auto Session::open_device(const std::filesystem::path& path) -> ResultPtr<SeatDevice> {
    int raw_fd = -1;
    int device_id = libseat_open_device(m_impl->seat, path.c_str(), &raw_fd);
    if (device_id < 0) {
        return make_result_ptr_error<SeatDevice>(ErrorCode::device_open_failed,
                                                 "Failed to open " + path.string() + ": " +
                                                     std::strerror(errno));
    }
    util::UniqueFd fd{raw_fd};

    struct stat st {};
    if (::fstat(fd.get(), &st) < 0) {
        int saved = errno;
        if (libseat_close_device(m_impl->seat, device_id) < 0) {
            KILN_LOG_WARN("Failed to close {} through the seat", path.string());
        }
        return make_result_ptr_error<SeatDevice>(ErrorCode::device_open_failed,
                                                 "Failed to stat " + path.string() + ": " +
                                                     std::strerror(saved));
    }

    KILN_LOG_DEBUG("Opened {} through the seat (device {})", path.string(), device_id);
    return make_result_ptr(
        std::make_unique<SeatDevice>(*this, device_id, std::move(fd), path, st.st_rdev));
}

void Session::close_device(int device_id) {
    if (libseat_close_device(m_impl->seat, device_id) < 0) {
        KILN_LOG_WARN("Failed to close seat device {}: {}", device_id, std::strerror(errno));
    }
}

auto Session::switch_vt(uint32_t vt) -> Result<void> {
    if (libseat_switch_session(m_impl->seat, static_cast<int>(vt)) < 0) {
        return make_error<void>(ErrorCode::session_failed,
                                "Failed to switch to VT " + std::to_string(vt) + ": " +
                                    std::strerror(errno));
    }
    return {};
}

} // namespace kiln::session
