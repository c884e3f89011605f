#include "util/config.hpp"

#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>
#include <string>

using namespace kiln;

namespace {

auto test_data(const std::string& name) -> std::filesystem::path {
    return std::filesystem::path(KILN_SOURCE_DIR) / "tests/util/test_data" / name;
}

// Writes @p contents to a scratch file removed when the guard goes out of scope.
class TempConfig {
public:
    TempConfig(const std::string& name, const std::string& contents)
        : m_path(std::filesystem::temp_directory_path() / ("kiln-test-" + name)) {
        std::ofstream file(m_path);
        file << contents;
    }
    ~TempConfig() { std::filesystem::remove(m_path); }

    TempConfig(const TempConfig&) = delete;
    TempConfig& operator=(const TempConfig&) = delete;
    TempConfig(TempConfig&&) = delete;
    TempConfig& operator=(TempConfig&&) = delete;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return m_path; }

private:
    std::filesystem::path m_path;
};

} // namespace

TEST_CASE("default_config returns expected values", "[config]") {
    auto config = default_config();

    SECTION("Runtime defaults") {
        REQUIRE(config.runtime.target_fps == 144);
    }

    SECTION("Output defaults") {
        REQUIRE(config.output.device.empty());
        REQUIRE(config.output.swapchain_slots == 3);
        REQUIRE(config.output.transform == OutputTransform::normal);
        REQUIRE(config.output.damage_tracking);
    }

    SECTION("Input defaults") {
        REQUIRE(config.input.shutdown_key == "Escape");
        REQUIRE(config.input.vt_switching);
    }

    SECTION("Logging defaults") {
        REQUIRE(config.logging.level == "info");
        REQUIRE(config.logging.file.empty());
    }
}

TEST_CASE("load_config handles missing file", "[config]") {
    auto missing = test_data("nonexistent.toml");
    auto result = load_config(missing);

    REQUIRE(!result.has_value());
    REQUIRE(result.error().code == ErrorCode::file_not_found);
    REQUIRE(result.error().message.find("Configuration file not found") != std::string::npos);
    REQUIRE(result.error().message.find(missing.string()) != std::string::npos);
}

TEST_CASE("load_config parses valid configuration", "[config]") {
    auto result = load_config(test_data("valid_config.toml"));

    REQUIRE(result.has_value());
    const auto& config = result.value();

    SECTION("Runtime section") {
        REQUIRE(config.runtime.target_fps == 60);
    }

    SECTION("Output section") {
        REQUIRE(config.output.device == "/dev/dri/card1");
        REQUIRE(config.output.swapchain_slots == 2);
        REQUIRE(config.output.transform == OutputTransform::flipped_90);
        REQUIRE_FALSE(config.output.damage_tracking);
    }

    SECTION("Render section") {
        REQUIRE(config.render.enable_validation);
    }

    SECTION("Input section") {
        REQUIRE(config.input.shutdown_key == "F12");
        REQUIRE(config.input.repeat_rate == 30);
        REQUIRE(config.input.repeat_delay == 400);
        REQUIRE(config.input.xkb_layout == "de");
        REQUIRE(config.input.xkb_variant == "nodeadkeys");
        REQUIRE(config.input.xkb_options == "ctrl:nocaps");
        REQUIRE_FALSE(config.input.vt_switching);
    }

    SECTION("Server section") {
        REQUIRE(config.server.socket == "kiln-test");
        REQUIRE(config.server.seat_name == "seat1");
    }

    SECTION("Logging section") {
        REQUIRE(config.logging.level == "debug");
        REQUIRE(config.logging.file == "test.log");
    }
}

TEST_CASE("load_config uses defaults for partial configuration", "[config]") {
    auto result = load_config(test_data("partial_config.toml"));

    REQUIRE(result.has_value());
    const auto& config = result.value();

    SECTION("Uses defaults for missing sections") {
        REQUIRE(config.output.swapchain_slots == 3);
        REQUIRE(config.input.shutdown_key == "Escape");
        REQUIRE(config.logging.level == "info");
    }

    SECTION("Uses provided values") {
        REQUIRE(config.runtime.target_fps == 75);
        REQUIRE_FALSE(config.input.vt_switching);
    }
}

TEST_CASE("load_config validates transform names", "[config]") {
    auto result = load_config(test_data("invalid_config.toml"));

    REQUIRE(!result.has_value());
    REQUIRE(result.error().code == ErrorCode::invalid_config);
    REQUIRE(result.error().message.find("Invalid transform") != std::string::npos);
    REQUIRE(result.error().message.find("upside-down") != std::string::npos);
}

TEST_CASE("load_config validates target_fps bounds", "[config]") {
    SECTION("Negative") {
        TempConfig file("negative_fps.toml", "[runtime]\ntarget_fps = -10\n");
        auto result = load_config(file.path());
        REQUIRE(!result.has_value());
        REQUIRE(result.error().code == ErrorCode::invalid_config);
        REQUIRE(result.error().message.find("Invalid target_fps") != std::string::npos);
        REQUIRE(result.error().message.find("-10") != std::string::npos);
        REQUIRE(result.error().message.find("1-1000") != std::string::npos);
    }

    SECTION("Too high") {
        TempConfig file("high_fps.toml", "[runtime]\ntarget_fps = 2000\n");
        auto result = load_config(file.path());
        REQUIRE(!result.has_value());
        REQUIRE(result.error().message.find("2000") != std::string::npos);
    }
}

TEST_CASE("load_config validates swapchain_slots", "[config]") {
    TempConfig file("slots.toml", "[output]\nswapchain_slots = 8\n");
    auto result = load_config(file.path());

    REQUIRE(!result.has_value());
    REQUIRE(result.error().code == ErrorCode::invalid_config);
    REQUIRE(result.error().message.find("Invalid swapchain_slots") != std::string::npos);
}

TEST_CASE("load_config validates the shutdown key", "[config]") {
    TempConfig file("shutdown_key.toml", "[input]\nshutdown_key = \"NotAKey\"\n");
    auto result = load_config(file.path());

    REQUIRE(!result.has_value());
    REQUIRE(result.error().code == ErrorCode::invalid_config);
    REQUIRE(result.error().message.find("NotAKey") != std::string::npos);
}

TEST_CASE("load_config rejects socket paths", "[config]") {
    TempConfig file("socket.toml", "[server]\nsocket = \"/tmp/wayland-1\"\n");
    auto result = load_config(file.path());

    REQUIRE(!result.has_value());
    REQUIRE(result.error().message.find("Invalid socket") != std::string::npos);
}

TEST_CASE("load_config validates log level values", "[config]") {
    TempConfig file("log_level.toml", "[logging]\nlevel = \"invalid_level\"\n");
    auto result = load_config(file.path());

    REQUIRE(!result.has_value());
    REQUIRE(result.error().code == ErrorCode::invalid_config);
    REQUIRE(result.error().message.find("Invalid log level") != std::string::npos);
    REQUIRE(result.error().message.find("trace, debug, info, warn, error, critical") !=
            std::string::npos);
}

TEST_CASE("load_config reports type mismatches", "[config]") {
    TempConfig file("type.toml", "[output]\ndamage_tracking = \"yes\"\n");
    auto result = load_config(file.path());

    REQUIRE(!result.has_value());
    REQUIRE(result.error().code == ErrorCode::invalid_config);
}

TEST_CASE("load_config reports malformed TOML", "[config]") {
    TempConfig file("malformed.toml", "[runtime\ntarget_fps = \n");
    auto result = load_config(file.path());

    REQUIRE(!result.has_value());
    REQUIRE(result.error().code == ErrorCode::parse_error);
}

TEST_CASE("parse_output_transform round-trips every name", "[config]") {
    REQUIRE(parse_output_transform("90") == OutputTransform::rotate_90);
    REQUIRE(parse_output_transform("flipped-270") == OutputTransform::flipped_270);
    REQUIRE_FALSE(parse_output_transform("sideways").has_value());
}
