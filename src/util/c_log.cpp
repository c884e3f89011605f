#include "c_log.hpp"

#include <array>
#include <cstdio>

namespace kiln::util {

namespace {

void strip_newlines(std::string& message) {
    while (!message.empty() && message.back() == '\n') {
        message.pop_back();
    }
}

} // namespace

auto format_c_log_message(const char* format, va_list args) -> FormattedCLogMessage {
    if (!format) {
        return {.message = {}, .status = CLogFormatStatus::null_format};
    }

    std::array<char, 512> buffer{};
    va_list args_copy;
    va_copy(args_copy, args);
    int length = std::vsnprintf(buffer.data(), buffer.size(), format, args_copy);
    va_end(args_copy);

    if (length < 0) {
        return {.message = {}, .status = CLogFormatStatus::format_error};
    }

    if (static_cast<size_t>(length) < buffer.size()) {
        std::string message(buffer.data(), static_cast<size_t>(length));
        strip_newlines(message);
        return {.message = std::move(message), .status = CLogFormatStatus::ok};
    }

    std::string message(static_cast<size_t>(length) + 1, '\0');
    va_copy(args_copy, args);
    std::vsnprintf(message.data(), message.size(), format, args_copy);
    va_end(args_copy);
    message.resize(static_cast<size_t>(length));
    strip_newlines(message);
    return {.message = std::move(message), .status = CLogFormatStatus::ok};
}

} // namespace kiln::util
