#include "config.hpp"

#include <toml.hpp>
#include <xkbcommon/xkbcommon.h>

namespace kiln {

auto parse_output_transform(std::string_view name) -> std::optional<OutputTransform> {
    for (auto transform :
         {OutputTransform::normal, OutputTransform::rotate_90, OutputTransform::rotate_180,
          OutputTransform::rotate_270, OutputTransform::flipped, OutputTransform::flipped_90,
          OutputTransform::flipped_180, OutputTransform::flipped_270}) {
        if (name == to_string(transform)) {
            return transform;
        }
    }
    return std::nullopt;
}

auto default_config() -> Config {
    return Config{}; // Uses struct defaults
}

auto load_config(const std::filesystem::path& path) -> Result<Config> {
    if (!std::filesystem::exists(path)) {
        return make_error<Config>(ErrorCode::file_not_found,
                                  "Configuration file not found: " + path.string());
    }

    toml::value data;
    try {
        data = toml::parse(path);
    } catch (const std::exception& e) {
        return make_error<Config>(ErrorCode::parse_error,
                                  "Failed to parse TOML: " + std::string(e.what()));
    }

    Config config = default_config();

    try {
        if (data.contains("runtime")) {
            const auto runtime = toml::find(data, "runtime");
            if (runtime.contains("target_fps")) {
                auto fps = toml::find<int64_t>(runtime, "target_fps");
                if (fps <= 0 || fps > 1000) {
                    return make_error<Config>(ErrorCode::invalid_config,
                                              "Invalid target_fps: " + std::to_string(fps) +
                                                  " (expected: 1-1000)");
                }
                config.runtime.target_fps = static_cast<uint32_t>(fps);
            }
        }

        if (data.contains("output")) {
            const auto output = toml::find(data, "output");
            if (output.contains("device")) {
                config.output.device = toml::find<std::string>(output, "device");
            }
            if (output.contains("swapchain_slots")) {
                auto slots = toml::find<int64_t>(output, "swapchain_slots");
                if (slots < 2 || slots > 4) {
                    return make_error<Config>(ErrorCode::invalid_config,
                                              "Invalid swapchain_slots: " + std::to_string(slots) +
                                                  " (expected: 2-4)");
                }
                config.output.swapchain_slots = static_cast<uint32_t>(slots);
            }
            if (output.contains("transform")) {
                auto name = toml::find<std::string>(output, "transform");
                auto transform = parse_output_transform(name);
                if (!transform) {
                    return make_error<Config>(
                        ErrorCode::invalid_config,
                        "Invalid transform: " + name +
                            " (expected: normal, 90, 180, 270, flipped, flipped-90, "
                            "flipped-180, flipped-270)");
                }
                config.output.transform = *transform;
            }
            if (output.contains("damage_tracking")) {
                config.output.damage_tracking = toml::find<bool>(output, "damage_tracking");
            }
        }

        if (data.contains("render")) {
            const auto render = toml::find(data, "render");
            if (render.contains("enable_validation")) {
                config.render.enable_validation = toml::find<bool>(render, "enable_validation");
            }
        }

        if (data.contains("input")) {
            const auto input = toml::find(data, "input");
            if (input.contains("shutdown_key")) {
                config.input.shutdown_key = toml::find<std::string>(input, "shutdown_key");
                if (xkb_keysym_from_name(config.input.shutdown_key.c_str(),
                                         XKB_KEYSYM_NO_FLAGS) == XKB_KEY_NoSymbol) {
                    return make_error<Config>(ErrorCode::invalid_config,
                                              "Invalid shutdown_key: " +
                                                  config.input.shutdown_key +
                                                  " (expected an xkb keysym name)");
                }
            }
            if (input.contains("repeat_rate")) {
                auto rate = toml::find<int64_t>(input, "repeat_rate");
                if (rate < 0 || rate > 1000) {
                    return make_error<Config>(ErrorCode::invalid_config,
                                              "Invalid repeat_rate: " + std::to_string(rate) +
                                                  " (expected: 0-1000)");
                }
                config.input.repeat_rate = static_cast<int32_t>(rate);
            }
            if (input.contains("repeat_delay")) {
                auto delay = toml::find<int64_t>(input, "repeat_delay");
                if (delay < 0 || delay > 10000) {
                    return make_error<Config>(ErrorCode::invalid_config,
                                              "Invalid repeat_delay: " + std::to_string(delay) +
                                                  " (expected: 0-10000)");
                }
                config.input.repeat_delay = static_cast<int32_t>(delay);
            }
            if (input.contains("xkb_layout")) {
                config.input.xkb_layout = toml::find<std::string>(input, "xkb_layout");
            }
            if (input.contains("xkb_variant")) {
                config.input.xkb_variant = toml::find<std::string>(input, "xkb_variant");
            }
            if (input.contains("xkb_options")) {
                config.input.xkb_options = toml::find<std::string>(input, "xkb_options");
            }
            if (input.contains("vt_switching")) {
                config.input.vt_switching = toml::find<bool>(input, "vt_switching");
            }
        }

        if (data.contains("server")) {
            const auto server = toml::find(data, "server");
            if (server.contains("socket")) {
                config.server.socket = toml::find<std::string>(server, "socket");
                if (config.server.socket.find('/') != std::string::npos) {
                    return make_error<Config>(ErrorCode::invalid_config,
                                              "Invalid socket: " + config.server.socket +
                                                  " (expected a name, not a path)");
                }
            }
            if (server.contains("seat_name")) {
                config.server.seat_name = toml::find<std::string>(server, "seat_name");
                if (config.server.seat_name.empty()) {
                    return make_error<Config>(ErrorCode::invalid_config,
                                              "Invalid seat_name: must not be empty");
                }
            }
        }

        if (data.contains("logging")) {
            const auto logging = toml::find(data, "logging");
            if (logging.contains("level")) {
                config.logging.level = toml::find<std::string>(logging, "level");

                // Validate log level
                const auto& level = config.logging.level;
                if (level != "trace" && level != "debug" && level != "info" && level != "warn" &&
                    level != "error" && level != "critical") {
                    return make_error<Config>(
                        ErrorCode::invalid_config,
                        "Invalid log level: " + level +
                            " (expected: trace, debug, info, warn, error, critical)");
                }
            }
            if (logging.contains("file")) {
                config.logging.file = toml::find<std::string>(logging, "file");
            }
        }
    } catch (const toml::type_error& e) {
        return make_error<Config>(ErrorCode::invalid_config,
                                  "Configuration value has the wrong type: " +
                                      std::string(e.what()));
    }

    return config;
}

} // namespace kiln
