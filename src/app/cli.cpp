#include "app/cli.hpp"

#include <CLI/CLI.hpp>
#include <util/logging.hpp>
#include <util/paths.hpp>
#include <util/profiling.hpp>

namespace kiln::app {
namespace {

[[nodiscard]] auto make_exit_ok() -> CliResult {
    return CliParseOutcome{
        .action = CliAction::exit_ok,
        .options = {},
    };
}

auto register_options(CLI::App& app, CliOptions& options) -> void {
    app.add_option("-c,--config", options.config_path, "Path to configuration file");
    app.add_option("--target-fps", options.target_fps, "Override the frame tick rate")
        ->check(CLI::Range(1u, 1000u));
    app.add_option("--device", options.device,
                   "DRM primary node to drive (default: the seat's boot GPU)");
    app.add_option("--socket", options.socket,
                   "Listening socket name under XDG_RUNTIME_DIR (default: first free wayland-N)");
    app.add_option("--log-level", options.log_level,
                   "Log level: trace, debug, info, warn, error, critical")
        ->check([](const std::string& value) -> std::string {
            return parse_log_level(value) ? std::string{} : "unknown log level '" + value + "'";
        });
    app.add_flag("--validation", options.validation, "Enable the Vulkan validation layer");
}

} // namespace

auto parse_cli(int argc, char** argv) -> CliResult {
    KILN_PROFILE_FUNCTION();
    CLI::App app{KILN_PROJECT_NAME " - frame-paced display server"};
    app.set_version_flag("--version,-v", KILN_PROJECT_NAME " v" KILN_VERSION);

    CliOptions options;
    options.config_path = util::default_config_path();
    register_options(app, options);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        if (e.get_exit_code() == 0) {
            (void)app.exit(e);
            return make_exit_ok();
        }
        (void)app.exit(e);
        return make_error<CliParseOutcome>(ErrorCode::parse_error,
                                           "Failed to parse command line arguments.");
    }

    return CliParseOutcome{
        .action = CliAction::run,
        .options = std::move(options),
    };
}

} // namespace kiln::app
