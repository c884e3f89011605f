#pragma once

#ifndef SPDLOG_ACTIVE_LEVEL
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#endif

#include "error.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <spdlog/spdlog.h>
#include <string_view>

namespace kiln {

// Initialize the global logger
// Should be called once at application startup
void initialize_logger(std::string_view app_name = "kiln");

// Get the global logger (for advanced usage)
[[nodiscard]] auto get_logger() -> std::shared_ptr<spdlog::logger>;

// Set log level at runtime
void set_log_level(spdlog::level::level_enum level);

// Parse a config-style level name ("trace" .. "critical")
[[nodiscard]] auto parse_log_level(std::string_view name) -> std::optional<spdlog::level::level_enum>;

// Mirror all output into a file in addition to the console
[[nodiscard]] auto add_log_file(const std::filesystem::path& path) -> Result<void>;

} // namespace kiln

// Project-wide logging macros
// These wrap spdlog and use the global logger

#define KILN_LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::kiln::get_logger(), __VA_ARGS__)

#define KILN_LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::kiln::get_logger(), __VA_ARGS__)

#define KILN_LOG_INFO(...) SPDLOG_LOGGER_INFO(::kiln::get_logger(), __VA_ARGS__)

#define KILN_LOG_WARN(...) SPDLOG_LOGGER_WARN(::kiln::get_logger(), __VA_ARGS__)

#define KILN_LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::kiln::get_logger(), __VA_ARGS__)

#define KILN_LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(::kiln::get_logger(), __VA_ARGS__)
