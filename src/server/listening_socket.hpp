#pragma once

#include <filesystem>
#include <string>
#include <util/error.hpp>
#include <util/unique_fd.hpp>
#include <vector>

namespace kiln::server {

/// @brief Wayland listening socket under the runtime directory, guarded by a `.lock` file.
///
/// A socket whose lock is held by another process is considered in use. A socket without a
/// held lock is stale and replaced. The socket and lock are unlinked on destruction.
class ListeningSocket {
public:
    /// Accepted connection, or the error that made the listening socket unusable.
    using Event = Result<util::UniqueFd>;

    static constexpr int FIRST_DISPLAY = 1;
    static constexpr int LAST_DISPLAY = 32;

    ~ListeningSocket();

    ListeningSocket(ListeningSocket&& other) noexcept = default;
    ListeningSocket& operator=(ListeningSocket&&) = delete;
    ListeningSocket(const ListeningSocket&) = delete;
    ListeningSocket& operator=(const ListeningSocket&) = delete;

    /// @brief Binds @p name, or the first free `wayland-N` when @p name is empty.
    [[nodiscard]] static auto bind(const std::filesystem::path& runtime_dir,
                                   const std::string& name) -> Result<ListeningSocket>;

    [[nodiscard]] auto name() const -> const std::string& { return m_name; }
    [[nodiscard]] auto path() const -> const std::filesystem::path& { return m_socket_path; }

    [[nodiscard]] auto fd() const -> int { return m_fd.get(); }
    /// @brief Accepts every pending connection without blocking.
    [[nodiscard]] auto dispatch(std::vector<Event>& out) -> Result<void>;

private:
    ListeningSocket() = default;

    [[nodiscard]] static auto try_bind(const std::filesystem::path& runtime_dir,
                                       const std::string& name) -> Result<ListeningSocket>;

    util::UniqueFd m_fd;
    util::UniqueFd m_lock_fd;
    std::filesystem::path m_socket_path;
    std::filesystem::path m_lock_path;
    std::string m_name;
};

} // namespace kiln::server
