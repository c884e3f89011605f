#include "app/cli.hpp"

#include <catch2/catch_test_macros.hpp>
#include <string>
#include <util/paths.hpp>
#include <vector>

using namespace kiln;

namespace {

struct ArgvBuilder {
    std::vector<std::string> storage;
    std::vector<char*> argv;

    explicit ArgvBuilder(std::initializer_list<std::string> args) : storage(args) {
        argv.reserve(storage.size());
        for (auto& arg : storage) {
            argv.push_back(arg.data());
        }
    }

    [[nodiscard]] auto argc() const -> int { return static_cast<int>(argv.size()); }
};

[[nodiscard]] auto test_config_path() -> std::string {
    return std::string(KILN_SOURCE_DIR) + "/tests/util/test_data/valid_config.toml";
}

} // namespace

TEST_CASE("parse_cli: no arguments runs with defaults", "[cli]") {
    ArgvBuilder args({"kiln"});

    auto result = app::parse_cli(args.argc(), args.argv.data());
    REQUIRE(result);
    REQUIRE(result->action == app::CliAction::run);
    REQUIRE(result->options.config_path == util::default_config_path());
    REQUIRE_FALSE(result->options.target_fps.has_value());
    REQUIRE(result->options.device.empty());
    REQUIRE(result->options.socket.empty());
    REQUIRE(result->options.log_level.empty());
    REQUIRE_FALSE(result->options.validation);
}

TEST_CASE("parse_cli: overrides are collected", "[cli]") {
    auto cfg = test_config_path();
    ArgvBuilder args({"kiln", "-c", cfg, "--target-fps", "90", "--device", "/dev/dri/card2",
                      "--socket", "kiln-0", "--log-level", "trace", "--validation"});

    auto result = app::parse_cli(args.argc(), args.argv.data());
    REQUIRE(result);
    REQUIRE(result->action == app::CliAction::run);
    REQUIRE(result->options.config_path == cfg);
    REQUIRE(result->options.target_fps == 90u);
    REQUIRE(result->options.device == "/dev/dri/card2");
    REQUIRE(result->options.socket == "kiln-0");
    REQUIRE(result->options.log_level == "trace");
    REQUIRE(result->options.validation);
}

TEST_CASE("parse_cli: target fps must be within 1-1000", "[cli]") {
    SECTION("Zero") {
        ArgvBuilder args({"kiln", "--target-fps", "0"});
        auto result = app::parse_cli(args.argc(), args.argv.data());
        REQUIRE(!result);
        REQUIRE(result.error().code == ErrorCode::parse_error);
    }

    SECTION("Too high") {
        ArgvBuilder args({"kiln", "--target-fps", "1001"});
        auto result = app::parse_cli(args.argc(), args.argv.data());
        REQUIRE(!result);
        REQUIRE(result.error().code == ErrorCode::parse_error);
    }

    SECTION("Not a number") {
        ArgvBuilder args({"kiln", "--target-fps", "fast"});
        auto result = app::parse_cli(args.argc(), args.argv.data());
        REQUIRE(!result);
    }
}

TEST_CASE("parse_cli: rejects unknown log levels", "[cli]") {
    ArgvBuilder args({"kiln", "--log-level", "verbose"});

    auto result = app::parse_cli(args.argc(), args.argv.data());
    REQUIRE(!result);
    REQUIRE(result.error().code == ErrorCode::parse_error);
}

TEST_CASE("parse_cli: rejects unknown options", "[cli]") {
    ArgvBuilder args({"kiln", "--detach"});

    auto result = app::parse_cli(args.argc(), args.argv.data());
    REQUIRE(!result);
    REQUIRE(result.error().code == ErrorCode::parse_error);
}

TEST_CASE("parse_cli: --version and --help exit cleanly", "[cli]") {
    SECTION("Version") {
        ArgvBuilder args({"kiln", "--version"});
        auto result = app::parse_cli(args.argc(), args.argv.data());
        REQUIRE(result);
        REQUIRE(result->action == app::CliAction::exit_ok);
    }

    SECTION("Help") {
        ArgvBuilder args({"kiln", "--help"});
        auto result = app::parse_cli(args.argc(), args.argv.data());
        REQUIRE(result);
        REQUIRE(result->action == app::CliAction::exit_ok);
    }
}
