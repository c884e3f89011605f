#include "util/paths.hpp"

#include <catch2/catch_test_macros.hpp>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unistd.h>
#include <vector>

namespace {

class EnvVarGuard {
public:
    EnvVarGuard(std::string key, std::optional<std::string> value) : m_key(std::move(key)) {
        const char* prev = std::getenv(m_key.c_str());
        if (prev != nullptr) {
            m_prev = std::string(prev);
        }

        if (value.has_value()) {
            setenv(m_key.c_str(), value->c_str(), 1);
        } else {
            unsetenv(m_key.c_str());
        }
    }

    ~EnvVarGuard() {
        if (m_prev.has_value()) {
            setenv(m_key.c_str(), m_prev->c_str(), 1);
        } else {
            unsetenv(m_key.c_str());
        }
    }

    EnvVarGuard(const EnvVarGuard&) = delete;
    EnvVarGuard& operator=(const EnvVarGuard&) = delete;
    EnvVarGuard(EnvVarGuard&&) = delete;
    EnvVarGuard& operator=(EnvVarGuard&&) = delete;

private:
    std::string m_key;
    std::optional<std::string> m_prev;
};

class TempDir {
public:
    explicit TempDir(std::string_view name_prefix) {
        auto base = std::filesystem::temp_directory_path();
        auto tmpl_path = base / (std::string(name_prefix) + "-XXXXXX");
        auto tmpl = tmpl_path.string();

        std::vector<char> buf;
        buf.reserve(tmpl.size() + 1);
        buf.insert(buf.end(), tmpl.begin(), tmpl.end());
        buf.push_back('\0');

        char* dir = mkdtemp(buf.data());
        if (dir == nullptr) {
            m_path = base / std::string(name_prefix);
            std::error_code ec;
            std::filesystem::create_directories(m_path, ec);
            return;
        }

        m_path = std::filesystem::path(dir);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return m_path; }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;
    TempDir(TempDir&&) = delete;
    TempDir& operator=(TempDir&&) = delete;

private:
    std::filesystem::path m_path;
};

} // namespace

TEST_CASE("paths: resolve_runtime_dir uses XDG_RUNTIME_DIR", "[paths]") {
    TempDir tmp("kiln_paths");
    EnvVarGuard runtime("XDG_RUNTIME_DIR", tmp.path().string());

    auto result = kiln::util::resolve_runtime_dir();
    REQUIRE(result.has_value());
    REQUIRE(result.value() == tmp.path().lexically_normal());
}

TEST_CASE("paths: resolve_runtime_dir rejects unset or relative values", "[paths]") {
    SECTION("Unset") {
        EnvVarGuard runtime("XDG_RUNTIME_DIR", std::nullopt);
        auto result = kiln::util::resolve_runtime_dir();
        REQUIRE(!result.has_value());
        REQUIRE(result.error().code == kiln::ErrorCode::file_not_found);
    }

    SECTION("Relative") {
        EnvVarGuard runtime("XDG_RUNTIME_DIR", "relative/run");
        auto result = kiln::util::resolve_runtime_dir();
        REQUIRE(!result.has_value());
    }
}

TEST_CASE("paths: resolve_runtime_dir rejects a missing directory", "[paths]") {
    TempDir tmp("kiln_paths");
    EnvVarGuard runtime("XDG_RUNTIME_DIR", (tmp.path() / "missing").string());

    auto result = kiln::util::resolve_runtime_dir();
    REQUIRE(!result.has_value());
    REQUIRE(result.error().message.find("missing") != std::string::npos);
}

TEST_CASE("paths: default_config_path prefers XDG_CONFIG_HOME", "[paths]") {
    TempDir tmp("kiln_paths");
    auto xdg_config = tmp.path() / "xdg_config";
    std::filesystem::create_directories(xdg_config / "kiln");
    std::FILE* f = std::fopen((xdg_config / "kiln" / "kiln.toml").c_str(), "wb");
    REQUIRE(f != nullptr);
    std::fclose(f);

    EnvVarGuard home("HOME", (tmp.path() / "home").string());
    EnvVarGuard xdg("XDG_CONFIG_HOME", xdg_config.string());

    REQUIRE(kiln::util::default_config_path() == xdg_config / "kiln" / "kiln.toml");
}

TEST_CASE("paths: default_config_path falls back to the working directory", "[paths]") {
    TempDir tmp("kiln_paths");
    EnvVarGuard home("HOME", (tmp.path() / "home").string());
    EnvVarGuard xdg("XDG_CONFIG_HOME", (tmp.path() / "xdg_config").string());

    REQUIRE(kiln::util::default_config_path() == std::filesystem::path("config") / "kiln.toml");
}
