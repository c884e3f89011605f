#pragma once

#include <cstdlib>
#include <filesystem>
#include <string>
#include <system_error>

namespace kiln::test {

/// mkdtemp directory, removed with its contents on destruction.
class TempDir {
public:
    explicit TempDir(const std::string& prefix) {
        std::string tmpl = (std::filesystem::temp_directory_path() / (prefix + "-XXXXXX")).string();
        if (char* dir = ::mkdtemp(tmpl.data())) {
            m_path = dir;
        }
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;
    TempDir(TempDir&&) = delete;
    TempDir& operator=(TempDir&&) = delete;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return m_path; }

private:
    std::filesystem::path m_path;
};

} // namespace kiln::test
