#pragma once

#include <string>
#include <util/error.hpp>
#include <vulkan/vulkan.hpp>

namespace kiln::render {

/// @brief Error carrying @p msg and the name of the failing vk::Result.
template <typename T>
[[nodiscard]] auto make_vk_error(ErrorCode code, const std::string& msg, vk::Result result,
                                 std::source_location loc = std::source_location::current())
    -> Result<T> {
    return make_error<T>(code, msg + ": " + vk::to_string(result), loc);
}

} // namespace kiln::render

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

/// Returns a `Result<void>` error from the enclosing function unless @p call yields eSuccess.
/// Usage: KILN_VK_TRY(cmd.end(), ErrorCode::vulkan_device_lost, "Command buffer end failed");
// NOLINTNEXTLINE(bugprone-macro-parentheses)
#define KILN_VK_TRY(call, code, msg)                                                               \
    do {                                                                                           \
        if (auto _kiln_vk_result = (call); _kiln_vk_result != vk::Result::eSuccess) {              \
            return ::kiln::render::make_vk_error<void>(code, msg, _kiln_vk_result);                \
        }                                                                                          \
    } while (0)

// NOLINTEND(cppcoreguidelines-macro-usage)
