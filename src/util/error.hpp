#pragma once

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <nonstd/expected.hpp>
#include <source_location>
#include <string>
#include <utility>

namespace kiln {

enum class ErrorCode : std::uint8_t {
    ok,
    file_not_found,
    file_read_failed,
    parse_error,
    invalid_config,
    invalid_data,
    session_failed,
    device_open_failed,
    drm_setup_failed,
    gbm_alloc_failed,
    protocol_init_failed,
    input_init_failed,
    vulkan_init_failed,
    vulkan_device_lost,
    registration_failed,
    socket_failed,
    no_free_slot,
    commit_rejected,
    import_failed,
    render_failed,
    client_failed,
    unknown_error
};

/// @brief Coarse classification that decides how the runtime reacts to an error.
enum class ErrorKind : std::uint8_t {
    setup_failure,
    runtime_transient,
    resource_exhaustion,
    client_failure,
};

struct Error {
    ErrorCode code;
    std::string message;
    std::source_location location;

    Error(ErrorCode error_code, std::string msg,
          std::source_location loc = std::source_location::current())
        : code(error_code), message(std::move(msg)), location(loc) {}
};

template <typename T>
using Result = nonstd::expected<T, Error>;

template <typename T>
using ResultPtr = Result<std::unique_ptr<T>>;

template <typename T>
[[nodiscard]] inline auto make_error(ErrorCode code, std::string message,
                                     std::source_location loc = std::source_location::current())
    -> Result<T> {
    return nonstd::make_unexpected(Error{code, std::move(message), loc});
}

template <typename T>
[[nodiscard]] inline auto make_result_ptr(std::unique_ptr<T> ptr) -> ResultPtr<T> {
    return ResultPtr<T>{std::move(ptr)};
}

template <typename T>
[[nodiscard]] inline auto
make_result_ptr_error(ErrorCode code, std::string message,
                      std::source_location loc = std::source_location::current())
    -> ResultPtr<T> {
    return nonstd::make_unexpected(Error{code, std::move(message), loc});
}

[[nodiscard]] constexpr auto error_code_name(ErrorCode code) -> const char* {
    switch (code) {
    case ErrorCode::ok:
        return "ok";
    case ErrorCode::file_not_found:
        return "file_not_found";
    case ErrorCode::file_read_failed:
        return "file_read_failed";
    case ErrorCode::parse_error:
        return "parse_error";
    case ErrorCode::invalid_config:
        return "invalid_config";
    case ErrorCode::invalid_data:
        return "invalid_data";
    case ErrorCode::session_failed:
        return "session_failed";
    case ErrorCode::device_open_failed:
        return "device_open_failed";
    case ErrorCode::drm_setup_failed:
        return "drm_setup_failed";
    case ErrorCode::gbm_alloc_failed:
        return "gbm_alloc_failed";
    case ErrorCode::protocol_init_failed:
        return "protocol_init_failed";
    case ErrorCode::input_init_failed:
        return "input_init_failed";
    case ErrorCode::vulkan_init_failed:
        return "vulkan_init_failed";
    case ErrorCode::vulkan_device_lost:
        return "vulkan_device_lost";
    case ErrorCode::registration_failed:
        return "registration_failed";
    case ErrorCode::socket_failed:
        return "socket_failed";
    case ErrorCode::no_free_slot:
        return "no_free_slot";
    case ErrorCode::commit_rejected:
        return "commit_rejected";
    case ErrorCode::import_failed:
        return "import_failed";
    case ErrorCode::render_failed:
        return "render_failed";
    case ErrorCode::client_failed:
        return "client_failed";
    case ErrorCode::unknown_error:
        return "unknown_error";
    }
    return "unknown";
}

/// @brief Maps an error code to the policy bucket the frame loop applies to it.
///
/// Setup failures abort startup. Transients are logged and the loop continues. Resource
/// exhaustion additionally skips the tick's hardware submission. Client failures stay isolated
/// to the offending client.
[[nodiscard]] constexpr auto error_kind(ErrorCode code) -> ErrorKind {
    switch (code) {
    case ErrorCode::no_free_slot:
        return ErrorKind::resource_exhaustion;
    case ErrorCode::commit_rejected:
    case ErrorCode::import_failed:
    case ErrorCode::render_failed:
    case ErrorCode::vulkan_device_lost:
    case ErrorCode::invalid_data:
        return ErrorKind::runtime_transient;
    case ErrorCode::client_failed:
        return ErrorKind::client_failure;
    default:
        return ErrorKind::setup_failure;
    }
}

[[nodiscard]] constexpr auto error_kind_name(ErrorKind kind) -> const char* {
    switch (kind) {
    case ErrorKind::setup_failure:
        return "setup_failure";
    case ErrorKind::runtime_transient:
        return "runtime_transient";
    case ErrorKind::resource_exhaustion:
        return "resource_exhaustion";
    case ErrorKind::client_failure:
        return "client_failure";
    }
    return "unknown";
}

} // namespace kiln

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

/// Propagate error or return value. Expression-style like Rust's `?` operator.
// NOLINTNEXTLINE(bugprone-macro-parentheses)
#define KILN_TRY(expr)                                                                             \
    ({                                                                                             \
        auto _try_result = (expr);                                                                 \
        if (!_try_result)                                                                          \
            return nonstd::make_unexpected(_try_result.error());                                   \
        std::move(_try_result).value();                                                            \
    })

/// Abort on error or return value. Use for internal invariants where failure is a bug.
// NOLINTNEXTLINE(bugprone-macro-parentheses)
#define KILN_MUST(expr)                                                                            \
    ({                                                                                             \
        auto _must_result = (expr);                                                                \
        if (!_must_result) {                                                                       \
            auto& _err = _must_result.error();                                                     \
            std::fprintf(stderr, "KILN_MUST failed at %s:%u in %s\n  %s: %s\n",                    \
                         _err.location.file_name(), _err.location.line(),                          \
                         _err.location.function_name(), kiln::error_code_name(_err.code),          \
                         _err.message.c_str());                                                    \
            std::abort();                                                                          \
        }                                                                                          \
        std::move(_must_result).value();                                                           \
    })

// NOLINTEND(cppcoreguidelines-macro-usage)
