#pragma once

#include <cstdarg>
#include <cstdint>
#include <string>

namespace kiln::util {

enum class CLogFormatStatus : std::uint8_t { ok, null_format, format_error };

struct FormattedCLogMessage {
    std::string message;
    CLogFormatStatus status = CLogFormatStatus::ok;
};

/// @brief Formats a printf-style message from a C library log callback, minus trailing newlines.
[[nodiscard]] auto format_c_log_message(const char* format, va_list args) -> FormattedCLogMessage;

} // namespace kiln::util
