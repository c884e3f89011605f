#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <sys/types.h>
#include <util/error.hpp>
#include <util/unique_fd.hpp>

extern "C" {
struct wl_client;
struct wl_display;
struct wlr_security_context_manager_v1; // NOLINT(readability-identifier-naming)
}

namespace kiln::server {

using ClientId = uint64_t;

/// @brief Capability token a sandboxed client connected with.
struct SecurityContext {
    std::string sandbox_engine;
    std::string app_id;
    std::string instance_id;
};

struct ClientRecord {
    ClientId id = 0;
    wl_client* client = nullptr;
    pid_t pid = 0;
};

/// @brief Tracks every protocol client on a display from creation to destruction.
///
/// Clients created by `accept` and clients the protocol library creates itself (for example
/// through a security-context listener) are registered alike. A client is dropped when the
/// protocol library destroys it, after which its protocol objects are already released.
class ClientRegistry {
public:
    struct Stats {
        uint64_t accepted = 0;
        uint64_t disconnected = 0;
        uint64_t failed = 0;
    };

    /// @param display Must outlive the registry.
    explicit ClientRegistry(wl_display* display);
    ~ClientRegistry();

    ClientRegistry(const ClientRegistry&) = delete;
    ClientRegistry& operator=(const ClientRegistry&) = delete;
    ClientRegistry(ClientRegistry&&) = delete;
    ClientRegistry& operator=(ClientRegistry&&) = delete;

    /// @brief Wraps an accepted connection in a protocol client with no capability token.
    /// @return The client id, or `client_failed` if the protocol library refused the fd.
    [[nodiscard]] auto accept(util::UniqueFd connection) -> Result<ClientId>;

    /// @brief Forgets @p client. Called from the client's destroy notification.
    void on_disconnect(wl_client* client);

    /// @brief Enables capability lookups for sandboxed clients. Null disables them.
    void set_security_manager(wlr_security_context_manager_v1* manager) {
        m_security_manager = manager;
    }
    [[nodiscard]] auto security_context(ClientId id) const -> std::optional<SecurityContext>;

    [[nodiscard]] auto find(const wl_client* client) const -> const ClientRecord*;
    [[nodiscard]] auto size() const -> size_t { return m_clients.size(); }
    [[nodiscard]] auto stats() const -> const Stats& { return m_stats; }

private:
    struct Entry;
    struct Listeners;

    void register_client(wl_client* client);

    wl_display* m_display;
    std::unique_ptr<Listeners> m_listeners;
    std::map<ClientId, std::unique_ptr<Entry>> m_clients;
    wlr_security_context_manager_v1* m_security_manager = nullptr;
    ClientId m_next_id = 1;
    Stats m_stats;
};

} // namespace kiln::server
