#include "input_context.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <util/c_log.hpp>
#include <util/logging.hpp>

extern "C" {
#include <libinput.h>
#include <libudev.h>
}

namespace kiln::session {

namespace {

void libinput_log_bridge(libinput* /*ctx*/, enum libinput_log_priority priority,
                         const char* format, va_list args) {
    auto formatted = util::format_c_log_message(format, args);
    if (formatted.status != util::CLogFormatStatus::ok || formatted.message.empty()) {
        return;
    }
    switch (priority) {
    case LIBINPUT_LOG_PRIORITY_ERROR:
        KILN_LOG_ERROR("[input] {}", formatted.message);
        return;
    case LIBINPUT_LOG_PRIORITY_INFO:
        KILN_LOG_INFO("[input] {}", formatted.message);
        return;
    case LIBINPUT_LOG_PRIORITY_DEBUG:
        KILN_LOG_DEBUG("[input] {}", formatted.message);
        return;
    }
}

auto libinput_priority_from_log_level(spdlog::level::level_enum level)
    -> enum libinput_log_priority {
    if (level <= spdlog::level::debug) {
        return LIBINPUT_LOG_PRIORITY_DEBUG;
    }
    if (level <= spdlog::level::info) {
        return LIBINPUT_LOG_PRIORITY_INFO;
    }
    return LIBINPUT_LOG_PRIORITY_ERROR;
}

auto to_msec(uint64_t usec) -> uint32_t {
    return static_cast<uint32_t>(usec / 1000);
}

auto convert(libinput_event* event) -> input::RawInputEvent {
    input::RawInputEvent raw{};
    libinput_device* device = libinput_event_get_device(event);
    if (device) {
        const char* name = libinput_device_get_name(device);
        raw.device_name = name ? name : "";
    }

    switch (libinput_event_get_type(event)) {
    case LIBINPUT_EVENT_DEVICE_ADDED:
        raw.type = input::RawInputType::device_added;
        break;
    case LIBINPUT_EVENT_DEVICE_REMOVED:
        raw.type = input::RawInputType::device_removed;
        break;
    case LIBINPUT_EVENT_KEYBOARD_KEY: {
        auto* key = libinput_event_get_keyboard_event(event);
        raw.type = input::RawInputType::key;
        raw.time_msec = to_msec(libinput_event_keyboard_get_time_usec(key));
        raw.code = libinput_event_keyboard_get_key(key);
        raw.pressed = libinput_event_keyboard_get_key_state(key) == LIBINPUT_KEY_STATE_PRESSED;
        break;
    }
    case LIBINPUT_EVENT_POINTER_MOTION: {
        auto* pointer = libinput_event_get_pointer_event(event);
        raw.type = input::RawInputType::pointer_motion;
        raw.time_msec = to_msec(libinput_event_pointer_get_time_usec(pointer));
        raw.dx = libinput_event_pointer_get_dx(pointer);
        raw.dy = libinput_event_pointer_get_dy(pointer);
        break;
    }
    case LIBINPUT_EVENT_POINTER_BUTTON: {
        auto* pointer = libinput_event_get_pointer_event(event);
        raw.type = input::RawInputType::pointer_button;
        raw.time_msec = to_msec(libinput_event_pointer_get_time_usec(pointer));
        raw.code = libinput_event_pointer_get_button(pointer);
        raw.pressed =
            libinput_event_pointer_get_button_state(pointer) == LIBINPUT_BUTTON_STATE_PRESSED;
        break;
    }
    case LIBINPUT_EVENT_POINTER_SCROLL_WHEEL: {
        auto* pointer = libinput_event_get_pointer_event(event);
        raw.type = input::RawInputType::pointer_axis;
        raw.time_msec = to_msec(libinput_event_pointer_get_time_usec(pointer));
        raw.horizontal = libinput_event_pointer_has_axis(
                             pointer, LIBINPUT_POINTER_AXIS_SCROLL_HORIZONTAL) != 0;
        raw.axis_value = libinput_event_pointer_get_scroll_value(
            pointer, raw.horizontal ? LIBINPUT_POINTER_AXIS_SCROLL_HORIZONTAL
                                    : LIBINPUT_POINTER_AXIS_SCROLL_VERTICAL);
        break;
    }
    default:
        raw.type = input::RawInputType::other;
        break;
    }
    return raw;
}

} // namespace

struct InputContext::Impl {
    Session* session = nullptr;
    udev* udev_ctx = nullptr;
    libinput* context = nullptr;
    std::vector<std::unique_ptr<SeatDevice>> devices;

    ~Impl() {
        if (context) {
            libinput_unref(context);
        }
        devices.clear();
        if (udev_ctx) {
            udev_unref(udev_ctx);
        }
    }

    static auto open_restricted(const char* path, int /*flags*/, void* data) -> int {
        auto* impl = static_cast<Impl*>(data);
        auto device = impl->session->open_device(path);
        if (!device) {
            KILN_LOG_WARN("Cannot open input device {}: {}", path, device.error().message);
            return -EACCES;
        }
        int fd = (*device)->fd();
        impl->devices.push_back(std::move(*device));
        return fd;
    }

    static void close_restricted(int fd, void* data) {
        auto* impl = static_cast<Impl*>(data);
        std::erase_if(impl->devices, [fd](const auto& device) { return device->fd() == fd; });
    }

    static const libinput_interface INTERFACE;
};

const libinput_interface InputContext::Impl::INTERFACE = {
    .open_restricted = InputContext::Impl::open_restricted,
    .close_restricted = InputContext::Impl::close_restricted,
};

InputContext::InputContext() : m_impl(std::make_unique<Impl>()) {}

InputContext::~InputContext() = default;

auto InputContext::create(Session& session) -> ResultPtr<InputContext> {
    auto context = std::unique_ptr<InputContext>(new InputContext());
    auto& impl = *context->m_impl;
    impl.session = &session;

    impl.udev_ctx = udev_new();
    if (!impl.udev_ctx) {
        return make_result_ptr_error<InputContext>(ErrorCode::input_init_failed,
                                                   "Failed to create udev context");
    }

    impl.context = libinput_udev_create_context(&Impl::INTERFACE, &impl, impl.udev_ctx);
    if (!impl.context) {
        return make_result_ptr_error<InputContext>(ErrorCode::input_init_failed,
                                                   "Failed to create libinput context");
    }
    libinput_log_set_handler(impl.context, libinput_log_bridge);
    libinput_log_set_priority(impl.context, libinput_priority_from_log_level(get_logger()->level()));

    std::string seat = session.seat_name();
    if (libinput_udev_assign_seat(impl.context, seat.c_str()) != 0) {
        return make_result_ptr_error<InputContext>(ErrorCode::input_init_failed,
                                                   "Failed to assign libinput to " + seat);
    }

    KILN_LOG_INFO("libinput assigned to {}", seat);
    return make_result_ptr(std::move(context));
}

auto InputContext::fd() const -> int {
    return libinput_get_fd(m_impl->context);
}

auto InputContext::dispatch(std::vector<Event>& out) -> Result<void> {
    auto& impl = *m_impl;
    if (int rc = libinput_dispatch(impl.context); rc != 0) {
        return make_error<void>(ErrorCode::invalid_data,
                                std::string("libinput_dispatch failed: ") + std::strerror(-rc));
    }
    while (libinput_event* event = libinput_get_event(impl.context)) {
        out.push_back(convert(event));
        libinput_event_destroy(event);
    }
    return {};
}

void InputContext::suspend() {
    libinput_suspend(m_impl->context);
}

auto InputContext::resume() -> Result<void> {
    if (libinput_resume(m_impl->context) != 0) {
        return make_error<void>(ErrorCode::input_init_failed, "Failed to resume libinput");
    }
    return {};
}

} // namespace kiln::session
