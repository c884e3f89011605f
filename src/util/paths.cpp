#include "paths.hpp"

#include "profiling.hpp"

#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace kiln::util {

namespace {

auto get_env(std::string_view key) -> std::optional<std::string> {
    const char* value = std::getenv(std::string(key).c_str());
    if (value == nullptr || value[0] == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

auto get_env_path(std::string_view key) -> std::optional<std::filesystem::path> {
    auto value = get_env(key);
    if (!value) {
        return std::nullopt;
    }
    std::filesystem::path p(*value);
    if (!p.is_absolute()) {
        return std::nullopt;
    }
    return p;
}

auto resolve_config_root() -> std::optional<std::filesystem::path> {
    if (auto env = get_env_path("XDG_CONFIG_HOME")) {
        return env;
    }
    if (auto home = get_env_path("HOME")) {
        return *home / ".config";
    }
    return std::nullopt;
}

} // namespace

auto resolve_runtime_dir() -> Result<std::filesystem::path> {
    KILN_PROFILE_FUNCTION();
    auto runtime_dir = get_env_path("XDG_RUNTIME_DIR");
    if (!runtime_dir) {
        return make_error<std::filesystem::path>(
            ErrorCode::file_not_found, "XDG_RUNTIME_DIR is not set or is not an absolute path");
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(*runtime_dir, ec) || ec) {
        return make_error<std::filesystem::path>(ErrorCode::file_not_found,
                                                 "XDG_RUNTIME_DIR does not exist: " +
                                                     runtime_dir->string());
    }
    return runtime_dir->lexically_normal();
}

auto default_config_path() -> std::filesystem::path {
    if (auto root = resolve_config_root()) {
        auto candidate = *root / "kiln" / "kiln.toml";
        std::error_code ec;
        if (std::filesystem::is_regular_file(candidate, ec) && !ec) {
            return candidate;
        }
    }
    return std::filesystem::path("config") / "kiln.toml";
}

} // namespace kiln::util
