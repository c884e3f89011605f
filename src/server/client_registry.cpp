#include "client_registry.hpp"

#include <cstddef>
#include <util/logging.hpp>

extern "C" {
#include <wayland-server-core.h>
#include <wlr/types/wlr_security_context_v1.h>
}

namespace kiln::server {

struct ClientRegistry::Entry {
    ClientRegistry* registry = nullptr;
    ClientRecord record;
    wl_listener destroy{};
};

struct ClientRegistry::Listeners {
    ClientRegistry* registry = nullptr;
    wl_listener client_created{};
};

ClientRegistry::ClientRegistry(wl_display* display)
    : m_display(display), m_listeners(std::make_unique<Listeners>()) {
    m_listeners->registry = this;
    m_listeners->client_created.notify = [](wl_listener* listener, void* data) {
        auto* list = reinterpret_cast<Listeners*>(reinterpret_cast<char*>(listener) -
                                                  offsetof(Listeners, client_created));
        list->registry->register_client(static_cast<wl_client*>(data));
    };
    wl_display_add_client_created_listener(m_display, &m_listeners->client_created);
}

ClientRegistry::~ClientRegistry() {
    for (auto& [id, entry] : m_clients) {
        wl_list_remove(&entry->destroy.link);
    }
    m_clients.clear();
    wl_list_remove(&m_listeners->client_created.link);
}

auto ClientRegistry::accept(util::UniqueFd connection) -> Result<ClientId> {
    if (!connection) {
        ++m_stats.failed;
        return make_error<ClientId>(ErrorCode::client_failed, "Invalid client connection");
    }

    // The protocol library owns the fd once the client exists.
    wl_client* client = wl_client_create(m_display, connection.get());
    if (!client) {
        ++m_stats.failed;
        KILN_LOG_WARN("Failed to create protocol client for fd {}", connection.get());
        return make_error<ClientId>(ErrorCode::client_failed, "wl_client_create failed");
    }
    connection.release();

    const ClientRecord* record = find(client);
    if (!record) {
        ++m_stats.failed;
        return make_error<ClientId>(ErrorCode::client_failed,
                                    "Client was destroyed during creation");
    }
    ++m_stats.accepted;
    return record->id;
}

void ClientRegistry::register_client(wl_client* client) {
    auto entry = std::make_unique<Entry>();
    entry->registry = this;
    entry->record.id = m_next_id++;
    entry->record.client = client;
    wl_client_get_credentials(client, &entry->record.pid, nullptr, nullptr);

    entry->destroy.notify = [](wl_listener* listener, void* data) {
        auto* e =
            reinterpret_cast<Entry*>(reinterpret_cast<char*>(listener) - offsetof(Entry, destroy));
        e->registry->on_disconnect(static_cast<wl_client*>(data));
    };
    wl_client_add_destroy_listener(client, &entry->destroy);

    KILN_LOG_DEBUG("Client {} connected (pid {})", entry->record.id, entry->record.pid);
    ClientId id = entry->record.id;
    m_clients.emplace(id, std::move(entry));
}

void ClientRegistry::on_disconnect(wl_client* client) {
    for (auto it = m_clients.begin(); it != m_clients.end(); ++it) {
        if (it->second->record.client != client) {
            continue;
        }
        KILN_LOG_DEBUG("Client {} disconnected", it->first);
        wl_list_remove(&it->second->destroy.link);
        m_clients.erase(it);
        ++m_stats.disconnected;
        return;
    }
}

auto ClientRegistry::security_context(ClientId id) const -> std::optional<SecurityContext> {
    auto it = m_clients.find(id);
    if (it == m_clients.end() || !m_security_manager) {
        return std::nullopt;
    }
    const wlr_security_context_v1_state* state =
        wlr_security_context_v1_lookup(m_security_manager, it->second->record.client);
    if (!state) {
        return std::nullopt;
    }
    return SecurityContext{
        .sandbox_engine = state->sandbox_engine ? state->sandbox_engine : "",
        .app_id = state->app_id ? state->app_id : "",
        .instance_id = state->instance_id ? state->instance_id : "",
    };
}

auto ClientRegistry::find(const wl_client* client) const -> const ClientRecord* {
    for (const auto& [id, entry] : m_clients) {
        if (entry->record.client == client) {
            return &entry->record;
        }
    }
    return nullptr;
}

} // namespace kiln::server
