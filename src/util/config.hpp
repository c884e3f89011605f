#pragma once

#include "error.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace kiln {

enum class OutputTransform : uint8_t {
    normal,
    rotate_90,
    rotate_180,
    rotate_270,
    flipped,
    flipped_90,
    flipped_180,
    flipped_270,
};

[[nodiscard]] constexpr auto to_string(OutputTransform transform) -> const char* {
    switch (transform) {
    case OutputTransform::normal:
        return "normal";
    case OutputTransform::rotate_90:
        return "90";
    case OutputTransform::rotate_180:
        return "180";
    case OutputTransform::rotate_270:
        return "270";
    case OutputTransform::flipped:
        return "flipped";
    case OutputTransform::flipped_90:
        return "flipped-90";
    case OutputTransform::flipped_180:
        return "flipped-180";
    case OutputTransform::flipped_270:
        return "flipped-270";
    }
    return "unknown";
}

[[nodiscard]] auto parse_output_transform(std::string_view name) -> std::optional<OutputTransform>;

struct Config {
    struct Runtime {
        uint32_t target_fps = 144;
    } runtime;

    struct Output {
        std::string device;
        uint32_t swapchain_slots = 3;
        OutputTransform transform = OutputTransform::normal;
        bool damage_tracking = true;
    } output;

    struct Render {
        bool enable_validation = false;
    } render;

    struct Input {
        std::string shutdown_key = "Escape";
        int32_t repeat_rate = 45;
        int32_t repeat_delay = 250;
        std::string xkb_layout;
        std::string xkb_variant;
        std::string xkb_options;
        bool vt_switching = true;
    } input;

    struct Server {
        std::string socket;
        std::string seat_name = "seat0";
    } server;

    struct Logging {
        std::string level = "info";
        std::string file;
    } logging;
};

[[nodiscard]] auto load_config(const std::filesystem::path& path) -> Result<Config>;
[[nodiscard]] auto default_config() -> Config;

} // namespace kiln
