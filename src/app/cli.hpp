#pragma once

#include "util/error.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace kiln::app {

struct CliOptions {
    std::filesystem::path config_path;
    std::optional<uint32_t> target_fps;
    std::string device;
    std::string socket;
    std::string log_level;
    bool validation = false;
};

enum class CliAction : std::uint8_t {
    run,
    exit_ok,
};

struct CliParseOutcome {
    CliAction action = CliAction::run;
    CliOptions options;
};

using CliResult = Result<CliParseOutcome>;

/// @brief Parses the command line. `--help` and `--version` print and yield `exit_ok`.
/// @return The options to run with, or `parse_error` after CLI11 printed the reason.
[[nodiscard]] auto parse_cli(int argc, char** argv) -> CliResult;

} // namespace kiln::app
