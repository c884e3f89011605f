#include "protocol_server.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <ctime>
#include <drm_fourcc.h>
#include <util/c_log.hpp>
#include <util/logging.hpp>

extern "C" {
#include <wayland-server-core.h>
#include <wlr/backend.h>
#include <wlr/backend/headless.h>
#include <wlr/interfaces/wlr_keyboard.h>
#include <wlr/render/drm_format_set.h>
#include <wlr/types/wlr_compositor.h>
#include <wlr/types/wlr_data_control_v1.h>
#include <wlr/types/wlr_data_device.h>
#include <wlr/types/wlr_keyboard.h>
#include <wlr/types/wlr_keyboard_shortcuts_inhibit_v1.h>
#include <wlr/types/wlr_linux_dmabuf_v1.h>
#include <wlr/types/wlr_output.h>
#include <wlr/types/wlr_output_layout.h>
#include <wlr/types/wlr_primary_selection.h>
#include <wlr/types/wlr_primary_selection_v1.h>
#include <wlr/types/wlr_seat.h>
#include <wlr/types/wlr_security_context_v1.h>
#include <wlr/types/wlr_shm.h>
#include <wlr/types/wlr_subcompositor.h>
#include <wlr/types/wlr_text_input_v3.h>
#include <wlr/types/wlr_xdg_decoration_v1.h>
#include <wlr/types/wlr_xdg_foreign_registry.h>
#include <wlr/types/wlr_xdg_foreign_v1.h>
#include <wlr/types/wlr_xdg_foreign_v2.h>
#include <wlr/types/wlr_xdg_output_v1.h>
#include <wlr/types/wlr_xdg_shell.h>
#include <wlr/util/log.h>
#include <xkbcommon/xkbcommon.h>

// wlr_input_method_v2_state has a member named 'delete'
#define delete delete_
#include <wlr/types/wlr_input_method_v2.h>
#undef delete
}

namespace kiln::server {

namespace {

constexpr std::array<uint32_t, 2> SHM_FORMATS = {DRM_FORMAT_ARGB8888, DRM_FORMAT_XRGB8888};

struct KeyboardDeleter {
    void operator()(wlr_keyboard* kb) const {
        if (kb) {
            wlr_keyboard_finish(kb);
            delete kb;
        }
    }
};
using UniqueKeyboard = std::unique_ptr<wlr_keyboard, KeyboardDeleter>;

auto wlr_importance_from_log_level(spdlog::level::level_enum level) -> wlr_log_importance {
    if (level <= spdlog::level::debug) {
        return WLR_DEBUG;
    }
    if (level <= spdlog::level::info) {
        return WLR_INFO;
    }
    if (level <= spdlog::level::critical) {
        return WLR_ERROR;
    }
    return WLR_SILENT;
}

void wlr_log_bridge(wlr_log_importance importance, const char* format, va_list args) {
    const util::FormattedCLogMessage formatted = util::format_c_log_message(format, args);
    if (formatted.status != util::CLogFormatStatus::ok) {
        if (formatted.status == util::CLogFormatStatus::null_format) {
            KILN_LOG_WARN("[wlr] log formatting failed: null format string");
        } else {
            KILN_LOG_WARN("[wlr] log formatting failed for format '{}'",
                          format ? format : "<null>");
        }
        return;
    }

    if (formatted.message.empty()) {
        return;
    }

    switch (importance) {
    case WLR_ERROR:
        KILN_LOG_ERROR("[wlr] {}", formatted.message);
        return;
    case WLR_INFO:
        KILN_LOG_INFO("[wlr] {}", formatted.message);
        return;
    case WLR_DEBUG:
        KILN_LOG_DEBUG("[wlr] {}", formatted.message);
        return;
    case WLR_SILENT:
    case WLR_LOG_IMPORTANCE_LAST:
        return;
    }
}

void initialize_wlroots_logging() {
    wlr_log_init(wlr_importance_from_log_level(get_logger()->level()), wlr_log_bridge);
}

template <typename Owner, size_t Offset>
auto owner_of(wl_listener* listener) -> Owner* {
    return reinterpret_cast<Owner*>(reinterpret_cast<char*>(listener) - Offset);
}

void detach(wl_listener& listener) {
    wl_list_remove(&listener.link);
    wl_list_init(&listener.link);
}

} // namespace

struct ProtocolServer::Impl {
    struct ToplevelHooks {
        Impl* impl = nullptr;
        wlr_xdg_toplevel* toplevel = nullptr;
        wlr_surface* surface = nullptr;
        bool mapped = false;

        wl_listener surface_commit{};
        wl_listener surface_map{};
        wl_listener surface_unmap{};
        wl_listener surface_destroy{};
    };

    struct InhibitorHooks {
        Impl* impl = nullptr;
        wlr_keyboard_shortcuts_inhibitor_v1* inhibitor = nullptr;
        wl_listener destroy{};
    };

    struct DecorationHooks {
        Impl* impl = nullptr;
        wlr_xdg_toplevel_decoration_v1* decoration = nullptr;
        wl_listener request_mode{};
        wl_listener destroy{};
    };

    struct TextInputHooks {
        Impl* impl = nullptr;
        wlr_text_input_v3* text_input = nullptr;
        wl_listener enable{};
        wl_listener commit{};
        wl_listener disable{};
        wl_listener destroy{};
    };

    struct Listeners {
        Impl* impl = nullptr;

        wl_listener new_xdg_toplevel{};
        wl_listener new_inhibitor{};
        wl_listener request_set_selection{};
        wl_listener request_set_primary_selection{};
        wl_listener new_decoration{};
        wl_listener new_text_input{};
        wl_listener new_input_method{};
        wl_listener input_method_commit{};
        wl_listener input_method_destroy{};
    };

    ProtocolSettings settings;
    wl_display* display = nullptr;
    wl_event_loop* event_loop = nullptr;
    wlr_backend* backend = nullptr;
    wlr_compositor* compositor = nullptr;
    wlr_xdg_shell* xdg_shell = nullptr;
    wlr_seat* seat = nullptr;
    UniqueKeyboard keyboard;
    wlr_output_layout* output_layout = nullptr;
    wlr_output* output = nullptr;
    wlr_linux_dmabuf_v1* linux_dmabuf = nullptr;
    wlr_data_control_manager_v1* data_control = nullptr;
    wlr_security_context_manager_v1* security_manager = nullptr;
    wlr_keyboard_shortcuts_inhibit_manager_v1* inhibit_manager = nullptr;
    wlr_keyboard_shortcuts_inhibitor_v1* active_inhibitor = nullptr;
    wlr_xdg_foreign_registry* foreign_registry = nullptr;
    wlr_xdg_decoration_manager_v1* decoration_manager = nullptr;
    wlr_text_input_manager_v3* text_input_manager = nullptr;
    wlr_input_method_manager_v2* input_method_manager = nullptr;
    wlr_input_method_v2* input_method = nullptr; // one per seat
    wlr_surface* focused_surface = nullptr;
    std::vector<ToplevelHooks*> toplevels;
    std::vector<ToplevelHooks*> mapped; // map order, most recent last
    std::vector<InhibitorHooks*> inhibitors;
    std::vector<DecorationHooks*> decorations;
    std::vector<TextInputHooks*> text_inputs;
    Listeners listeners;

    Impl() { listeners.impl = this; }

    [[nodiscard]] auto setup_display() -> Result<void>;
    [[nodiscard]] auto setup_buffer_protocols() -> Result<void>;
    [[nodiscard]] auto setup_xdg_shell() -> Result<void>;
    [[nodiscard]] auto setup_seat() -> Result<void>;
    [[nodiscard]] auto setup_selection() -> Result<void>;
    [[nodiscard]] auto setup_output() -> Result<void>;
    [[nodiscard]] auto setup_foreign() -> Result<void>;
    [[nodiscard]] auto setup_shortcuts_inhibit() -> Result<void>;
    [[nodiscard]] auto setup_security_context() -> Result<void>;
    [[nodiscard]] auto setup_decoration() -> Result<void>;
    [[nodiscard]] auto setup_text_input() -> Result<void>;
    void teardown();

    void handle_new_toplevel(wlr_xdg_toplevel* toplevel);
    void handle_commit(ToplevelHooks* hooks);
    void handle_map(ToplevelHooks* hooks);
    void handle_unmap(ToplevelHooks* hooks);
    void handle_destroy(ToplevelHooks* hooks);
    void handle_new_inhibitor(wlr_keyboard_shortcuts_inhibitor_v1* inhibitor);
    void handle_inhibitor_destroy(InhibitorHooks* hooks);
    void handle_new_decoration(wlr_xdg_toplevel_decoration_v1* decoration);
    void apply_decoration_mode(DecorationHooks* hooks);
    void handle_decoration_destroy(DecorationHooks* hooks);
    void handle_new_text_input(wlr_text_input_v3* text_input);
    void handle_text_input_enable(TextInputHooks* hooks);
    void handle_text_input_commit(TextInputHooks* hooks);
    void handle_text_input_disable(TextInputHooks* hooks);
    void handle_text_input_destroy(TextInputHooks* hooks);
    void handle_new_input_method(wlr_input_method_v2* method);
    void handle_input_method_commit();
    void handle_input_method_destroy();
    void send_text_input_state(wlr_text_input_v3* text_input);
    void update_text_input_focus();
    [[nodiscard]] auto active_text_input() const -> wlr_text_input_v3*;
    void focus_surface(wlr_surface* surface);
    void update_inhibitor();

    static auto filter_global(const wl_client* client, const wl_global* global, void* data)
        -> bool;
};

auto ProtocolServer::Impl::setup_display() -> Result<void> {
    display = wl_display_create();
    if (!display) {
        return make_error<void>(ErrorCode::protocol_init_failed,
                                "Failed to create Wayland display");
    }

    event_loop = wl_display_get_event_loop(display);
    if (!event_loop) {
        return make_error<void>(ErrorCode::protocol_init_failed, "Failed to get event loop");
    }

    backend = wlr_headless_backend_create(event_loop);
    if (!backend) {
        return make_error<void>(ErrorCode::protocol_init_failed,
                                "Failed to create headless backend");
    }

    wl_display_set_global_filter(display, filter_global, this);
    return {};
}

auto ProtocolServer::Impl::setup_buffer_protocols() -> Result<void> {
    compositor = wlr_compositor_create(display, 6, nullptr);
    if (!compositor) {
        return make_error<void>(ErrorCode::protocol_init_failed, "Failed to create compositor");
    }
    if (!wlr_subcompositor_create(display)) {
        return make_error<void>(ErrorCode::protocol_init_failed,
                                "Failed to create subcompositor");
    }
    if (!wlr_shm_create(display, 1, SHM_FORMATS.data(), SHM_FORMATS.size())) {
        return make_error<void>(ErrorCode::protocol_init_failed, "Failed to create wl_shm");
    }

    wlr_linux_dmabuf_feedback_v1 feedback{};
    feedback.main_device = settings.main_device;
    wl_array_init(&feedback.tranches);
    wlr_linux_dmabuf_feedback_v1_tranche* tranche =
        wlr_linux_dmabuf_feedback_add_tranche(&feedback);
    if (!tranche) {
        wlr_linux_dmabuf_feedback_v1_finish(&feedback);
        return make_error<void>(ErrorCode::protocol_init_failed,
                                "Failed to build dmabuf feedback");
    }
    tranche->target_device = settings.main_device;
    for (uint32_t format : SHM_FORMATS) {
        wlr_drm_format_set_add(&tranche->formats, format, DRM_FORMAT_MOD_LINEAR);
    }
    linux_dmabuf = wlr_linux_dmabuf_v1_create(display, 4, &feedback);
    wlr_linux_dmabuf_feedback_v1_finish(&feedback);
    if (!linux_dmabuf) {
        return make_error<void>(ErrorCode::protocol_init_failed,
                                "Failed to create linux-dmabuf");
    }
    return {};
}

auto ProtocolServer::Impl::setup_xdg_shell() -> Result<void> {
    xdg_shell = wlr_xdg_shell_create(display, 3);
    if (!xdg_shell) {
        return make_error<void>(ErrorCode::protocol_init_failed, "Failed to create xdg-shell");
    }

    listeners.new_xdg_toplevel.notify = [](wl_listener* listener, void* data) {
        auto* list = owner_of<Listeners, offsetof(Listeners, new_xdg_toplevel)>(listener);
        list->impl->handle_new_toplevel(static_cast<wlr_xdg_toplevel*>(data));
    };
    wl_signal_add(&xdg_shell->events.new_toplevel, &listeners.new_xdg_toplevel);
    return {};
}

auto ProtocolServer::Impl::setup_seat() -> Result<void> {
    seat = wlr_seat_create(display, settings.seat_name.c_str());
    if (!seat) {
        return make_error<void>(ErrorCode::protocol_init_failed, "Failed to create seat");
    }
    wlr_seat_set_capabilities(seat, WL_SEAT_CAPABILITY_KEYBOARD | WL_SEAT_CAPABILITY_POINTER);

    keyboard = UniqueKeyboard(new wlr_keyboard{});
    wlr_keyboard_init(keyboard.get(), nullptr, "virtual-keyboard");
    wlr_keyboard_set_repeat_info(keyboard.get(), settings.repeat_rate, settings.repeat_delay);
    wlr_seat_set_keyboard(seat, keyboard.get());
    return {};
}

auto ProtocolServer::Impl::setup_selection() -> Result<void> {
    if (!wlr_data_device_manager_create(display)) {
        return make_error<void>(ErrorCode::protocol_init_failed,
                                "Failed to create data device manager");
    }
    if (!wlr_primary_selection_v1_device_manager_create(display)) {
        return make_error<void>(ErrorCode::protocol_init_failed,
                                "Failed to create primary selection manager");
    }
    data_control = wlr_data_control_manager_v1_create(display);
    if (!data_control) {
        return make_error<void>(ErrorCode::protocol_init_failed,
                                "Failed to create data control manager");
    }

    listeners.request_set_selection.notify = [](wl_listener* listener, void* data) {
        auto* list = owner_of<Listeners, offsetof(Listeners, request_set_selection)>(listener);
        auto* event = static_cast<wlr_seat_request_set_selection_event*>(data);
        wlr_seat_set_selection(list->impl->seat, event->source, event->serial);
    };
    wl_signal_add(&seat->events.request_set_selection, &listeners.request_set_selection);

    listeners.request_set_primary_selection.notify = [](wl_listener* listener, void* data) {
        auto* list =
            owner_of<Listeners, offsetof(Listeners, request_set_primary_selection)>(listener);
        auto* event = static_cast<wlr_seat_request_set_primary_selection_event*>(data);
        wlr_seat_set_primary_selection(list->impl->seat, event->source, event->serial);
    };
    wl_signal_add(&seat->events.request_set_primary_selection,
                  &listeners.request_set_primary_selection);
    return {};
}

auto ProtocolServer::Impl::setup_output() -> Result<void> {
    output_layout = wlr_output_layout_create(display);
    if (!output_layout) {
        return make_error<void>(ErrorCode::protocol_init_failed,
                                "Failed to create output layout");
    }

    if (!wlr_backend_start(backend)) {
        return make_error<void>(ErrorCode::protocol_init_failed,
                                "Failed to start headless backend");
    }

    const auto& descriptor = settings.output;
    output = wlr_headless_add_output(backend, descriptor.mode.width, descriptor.mode.height);
    if (!output) {
        return make_error<void>(ErrorCode::protocol_init_failed,
                                "Failed to create protocol output");
    }
    output->phys_width = static_cast<int32_t>(descriptor.physical_width_mm);
    output->phys_height = static_cast<int32_t>(descriptor.physical_height_mm);
    wlr_output_set_description(output, descriptor.name.c_str());

    wlr_output_state state;
    wlr_output_state_init(&state);
    wlr_output_state_set_enabled(&state, true);
    wlr_output_state_set_custom_mode(&state, static_cast<int32_t>(descriptor.mode.width),
                                     static_cast<int32_t>(descriptor.mode.height),
                                     static_cast<int32_t>(descriptor.mode.refresh_mhz));
    wlr_output_state_set_transform(&state,
                                   static_cast<wl_output_transform>(descriptor.transform));
    if (!wlr_output_commit_state(output, &state)) {
        KILN_LOG_WARN("Protocol output state commit failed; advertising defaults");
    }
    wlr_output_state_finish(&state);

    if (!wlr_output_layout_add(output_layout, output, descriptor.x, descriptor.y)) {
        return make_error<void>(ErrorCode::protocol_init_failed,
                                "Failed to place protocol output");
    }
    wlr_output_create_global(output, display);

    if (!wlr_xdg_output_manager_v1_create(display, output_layout)) {
        return make_error<void>(ErrorCode::protocol_init_failed,
                                "Failed to create xdg-output manager");
    }
    return {};
}

auto ProtocolServer::Impl::setup_foreign() -> Result<void> {
    foreign_registry = wlr_xdg_foreign_registry_create(display);
    if (!foreign_registry) {
        return make_error<void>(ErrorCode::protocol_init_failed,
                                "Failed to create xdg-foreign registry");
    }
    if (!wlr_xdg_foreign_v1_create(display, foreign_registry) ||
        !wlr_xdg_foreign_v2_create(display, foreign_registry)) {
        return make_error<void>(ErrorCode::protocol_init_failed,
                                "Failed to create xdg-foreign globals");
    }
    return {};
}

auto ProtocolServer::Impl::setup_shortcuts_inhibit() -> Result<void> {
    inhibit_manager = wlr_keyboard_shortcuts_inhibit_v1_create(display);
    if (!inhibit_manager) {
        return make_error<void>(ErrorCode::protocol_init_failed,
                                "Failed to create keyboard shortcuts inhibit manager");
    }
    listeners.new_inhibitor.notify = [](wl_listener* listener, void* data) {
        auto* list = owner_of<Listeners, offsetof(Listeners, new_inhibitor)>(listener);
        list->impl->handle_new_inhibitor(static_cast<wlr_keyboard_shortcuts_inhibitor_v1*>(data));
    };
    wl_signal_add(&inhibit_manager->events.new_inhibitor, &listeners.new_inhibitor);
    return {};
}

auto ProtocolServer::Impl::setup_security_context() -> Result<void> {
    security_manager = wlr_security_context_manager_v1_create(display);
    if (!security_manager) {
        return make_error<void>(ErrorCode::protocol_init_failed,
                                "Failed to create security context manager");
    }
    return {};
}

auto ProtocolServer::Impl::setup_decoration() -> Result<void> {
    decoration_manager = wlr_xdg_decoration_manager_v1_create(display);
    if (!decoration_manager) {
        return make_error<void>(ErrorCode::protocol_init_failed,
                                "Failed to create xdg-decoration manager");
    }
    listeners.new_decoration.notify = [](wl_listener* listener, void* data) {
        auto* list = owner_of<Listeners, offsetof(Listeners, new_decoration)>(listener);
        list->impl->handle_new_decoration(static_cast<wlr_xdg_toplevel_decoration_v1*>(data));
    };
    wl_signal_add(&decoration_manager->events.new_toplevel_decoration, &listeners.new_decoration);
    return {};
}

auto ProtocolServer::Impl::setup_text_input() -> Result<void> {
    text_input_manager = wlr_text_input_manager_v3_create(display);
    input_method_manager = wlr_input_method_manager_v2_create(display);
    if (!text_input_manager || !input_method_manager) {
        return make_error<void>(ErrorCode::protocol_init_failed,
                                "Failed to create text-input/input-method globals");
    }
    listeners.new_text_input.notify = [](wl_listener* listener, void* data) {
        auto* list = owner_of<Listeners, offsetof(Listeners, new_text_input)>(listener);
        list->impl->handle_new_text_input(static_cast<wlr_text_input_v3*>(data));
    };
    wl_signal_add(&text_input_manager->events.text_input, &listeners.new_text_input);

    listeners.new_input_method.notify = [](wl_listener* listener, void* data) {
        auto* list = owner_of<Listeners, offsetof(Listeners, new_input_method)>(listener);
        list->impl->handle_new_input_method(static_cast<wlr_input_method_v2*>(data));
    };
    wl_signal_add(&input_method_manager->events.input_method, &listeners.new_input_method);
    return {};
}

auto ProtocolServer::Impl::filter_global(const wl_client* client, const wl_global* global,
                                         void* data) -> bool {
    auto* impl = static_cast<Impl*>(data);
    bool privileged = (impl->data_control && global == impl->data_control->global) ||
                      (impl->security_manager && global == impl->security_manager->global) ||
                      (impl->input_method_manager && global == impl->input_method_manager->global);
    if (!privileged || !impl->security_manager) {
        return true;
    }
    // Sandboxed clients carry a security context; keep privileged globals from them.
    return wlr_security_context_v1_lookup(impl->security_manager,
                                          const_cast<wl_client*>(client)) == nullptr;
}

void ProtocolServer::Impl::handle_new_toplevel(wlr_xdg_toplevel* toplevel) {
    auto* hooks = new ToplevelHooks{};
    hooks->impl = this;
    hooks->toplevel = toplevel;
    hooks->surface = toplevel->base->surface;
    toplevels.push_back(hooks);

    hooks->surface_commit.notify = [](wl_listener* listener, void* /*data*/) {
        auto* h = owner_of<ToplevelHooks, offsetof(ToplevelHooks, surface_commit)>(listener);
        h->impl->handle_commit(h);
    };
    wl_signal_add(&hooks->surface->events.commit, &hooks->surface_commit);

    hooks->surface_map.notify = [](wl_listener* listener, void* /*data*/) {
        auto* h = owner_of<ToplevelHooks, offsetof(ToplevelHooks, surface_map)>(listener);
        h->impl->handle_map(h);
    };
    wl_signal_add(&hooks->surface->events.map, &hooks->surface_map);

    hooks->surface_unmap.notify = [](wl_listener* listener, void* /*data*/) {
        auto* h = owner_of<ToplevelHooks, offsetof(ToplevelHooks, surface_unmap)>(listener);
        h->impl->handle_unmap(h);
    };
    wl_signal_add(&hooks->surface->events.unmap, &hooks->surface_unmap);

    hooks->surface_destroy.notify = [](wl_listener* listener, void* /*data*/) {
        auto* h = owner_of<ToplevelHooks, offsetof(ToplevelHooks, surface_destroy)>(listener);
        h->impl->handle_destroy(h);
    };
    wl_signal_add(&hooks->surface->events.destroy, &hooks->surface_destroy);
}

void ProtocolServer::Impl::handle_commit(ToplevelHooks* hooks) {
    if (!hooks->toplevel->base->initial_commit) {
        return;
    }
    // Initial configure: size the window to the output.
    wlr_xdg_toplevel_set_size(hooks->toplevel, static_cast<int32_t>(settings.output.mode.width),
                              static_cast<int32_t>(settings.output.mode.height));
    for (auto* decoration : decorations) {
        if (decoration->decoration->toplevel == hooks->toplevel) {
            apply_decoration_mode(decoration);
        }
    }
}

void ProtocolServer::Impl::handle_map(ToplevelHooks* hooks) {
    hooks->mapped = true;
    mapped.push_back(hooks);
    KILN_LOG_DEBUG("Toplevel mapped: app_id='{}' title='{}'",
                   hooks->toplevel->app_id ? hooks->toplevel->app_id : "",
                   hooks->toplevel->title ? hooks->toplevel->title : "");
    focus_surface(hooks->surface);
}

void ProtocolServer::Impl::handle_unmap(ToplevelHooks* hooks) {
    hooks->mapped = false;
    std::erase(mapped, hooks);
    if (focused_surface == hooks->surface) {
        focus_surface(mapped.empty() ? nullptr : mapped.back()->surface);
    }
}

void ProtocolServer::Impl::handle_destroy(ToplevelHooks* hooks) {
    detach(hooks->surface_commit);
    detach(hooks->surface_map);
    detach(hooks->surface_unmap);
    detach(hooks->surface_destroy);

    if (hooks->mapped) {
        handle_unmap(hooks);
    }
    if (focused_surface == hooks->surface) {
        focus_surface(nullptr);
    }
    std::erase(toplevels, hooks);
    delete hooks;
}

void ProtocolServer::Impl::handle_new_inhibitor(wlr_keyboard_shortcuts_inhibitor_v1* inhibitor) {
    auto* hooks = new InhibitorHooks{};
    hooks->impl = this;
    hooks->inhibitor = inhibitor;
    inhibitors.push_back(hooks);

    hooks->destroy.notify = [](wl_listener* listener, void* /*data*/) {
        auto* h = owner_of<InhibitorHooks, offsetof(InhibitorHooks, destroy)>(listener);
        h->impl->handle_inhibitor_destroy(h);
    };
    wl_signal_add(&inhibitor->events.destroy, &hooks->destroy);

    update_inhibitor();
}

void ProtocolServer::Impl::handle_inhibitor_destroy(InhibitorHooks* hooks) {
    detach(hooks->destroy);
    if (active_inhibitor == hooks->inhibitor) {
        active_inhibitor = nullptr;
    }
    std::erase(inhibitors, hooks);
    delete hooks;
}

void ProtocolServer::Impl::handle_new_decoration(wlr_xdg_toplevel_decoration_v1* decoration) {
    auto* hooks = new DecorationHooks{};
    hooks->impl = this;
    hooks->decoration = decoration;
    decorations.push_back(hooks);

    hooks->request_mode.notify = [](wl_listener* listener, void* /*data*/) {
        auto* h = owner_of<DecorationHooks, offsetof(DecorationHooks, request_mode)>(listener);
        h->impl->apply_decoration_mode(h);
    };
    wl_signal_add(&decoration->events.request_mode, &hooks->request_mode);

    hooks->destroy.notify = [](wl_listener* listener, void* /*data*/) {
        auto* h = owner_of<DecorationHooks, offsetof(DecorationHooks, destroy)>(listener);
        h->impl->handle_decoration_destroy(h);
    };
    wl_signal_add(&decoration->events.destroy, &hooks->destroy);

    apply_decoration_mode(hooks);
}

// The single window fills the output with nothing drawn around it, so clients are always told
// that decorations are handled here. Configures can only be sent after the initial commit.
void ProtocolServer::Impl::apply_decoration_mode(DecorationHooks* hooks) {
    if (!hooks->decoration->toplevel->base->initialized) {
        return;
    }
    wlr_xdg_toplevel_decoration_v1_set_mode(hooks->decoration,
                                            WLR_XDG_TOPLEVEL_DECORATION_V1_MODE_SERVER_SIDE);
}

void ProtocolServer::Impl::handle_decoration_destroy(DecorationHooks* hooks) {
    detach(hooks->request_mode);
    detach(hooks->destroy);
    std::erase(decorations, hooks);
    delete hooks;
}

void ProtocolServer::Impl::handle_new_text_input(wlr_text_input_v3* text_input) {
    if (text_input->seat != seat) {
        return;
    }
    auto* hooks = new TextInputHooks{};
    hooks->impl = this;
    hooks->text_input = text_input;
    text_inputs.push_back(hooks);

    hooks->enable.notify = [](wl_listener* listener, void* /*data*/) {
        auto* h = owner_of<TextInputHooks, offsetof(TextInputHooks, enable)>(listener);
        h->impl->handle_text_input_enable(h);
    };
    wl_signal_add(&text_input->events.enable, &hooks->enable);

    hooks->commit.notify = [](wl_listener* listener, void* /*data*/) {
        auto* h = owner_of<TextInputHooks, offsetof(TextInputHooks, commit)>(listener);
        h->impl->handle_text_input_commit(h);
    };
    wl_signal_add(&text_input->events.commit, &hooks->commit);

    hooks->disable.notify = [](wl_listener* listener, void* /*data*/) {
        auto* h = owner_of<TextInputHooks, offsetof(TextInputHooks, disable)>(listener);
        h->impl->handle_text_input_disable(h);
    };
    wl_signal_add(&text_input->events.disable, &hooks->disable);

    hooks->destroy.notify = [](wl_listener* listener, void* /*data*/) {
        auto* h = owner_of<TextInputHooks, offsetof(TextInputHooks, destroy)>(listener);
        h->impl->handle_text_input_destroy(h);
    };
    wl_signal_add(&text_input->events.destroy, &hooks->destroy);

    // A client may bind text-input after its surface already has focus.
    if (focused_surface && wl_resource_get_client(text_input->resource) ==
                               wl_resource_get_client(focused_surface->resource)) {
        wlr_text_input_v3_send_enter(text_input, focused_surface);
    }
}

void ProtocolServer::Impl::handle_text_input_enable(TextInputHooks* hooks) {
    if (!input_method) {
        return;
    }
    wlr_input_method_v2_send_activate(input_method);
    send_text_input_state(hooks->text_input);
}

void ProtocolServer::Impl::handle_text_input_commit(TextInputHooks* hooks) {
    if (!input_method || !hooks->text_input->current_enabled) {
        return;
    }
    send_text_input_state(hooks->text_input);
}

void ProtocolServer::Impl::handle_text_input_disable(TextInputHooks* /*hooks*/) {
    if (!input_method) {
        return;
    }
    wlr_input_method_v2_send_deactivate(input_method);
    wlr_input_method_v2_send_done(input_method);
}

void ProtocolServer::Impl::handle_text_input_destroy(TextInputHooks* hooks) {
    if (hooks->text_input->current_enabled && input_method) {
        wlr_input_method_v2_send_deactivate(input_method);
        wlr_input_method_v2_send_done(input_method);
    }
    detach(hooks->enable);
    detach(hooks->commit);
    detach(hooks->disable);
    detach(hooks->destroy);
    std::erase(text_inputs, hooks);
    delete hooks;
}

void ProtocolServer::Impl::send_text_input_state(wlr_text_input_v3* text_input) {
    const auto& state = text_input->current;
    if (text_input->active_features & WLR_TEXT_INPUT_V3_FEATURE_SURROUNDING_TEXT) {
        wlr_input_method_v2_send_surrounding_text(input_method,
                                                  state.surrounding.text ? state.surrounding.text
                                                                         : "",
                                                  state.surrounding.cursor,
                                                  state.surrounding.anchor);
    }
    wlr_input_method_v2_send_text_change_cause(input_method, state.text_change_cause);
    if (text_input->active_features & WLR_TEXT_INPUT_V3_FEATURE_CONTENT_TYPE) {
        wlr_input_method_v2_send_content_type(input_method, state.content_type.hint,
                                              state.content_type.purpose);
    }
    wlr_input_method_v2_send_done(input_method);
}

void ProtocolServer::Impl::handle_new_input_method(wlr_input_method_v2* method) {
    if (method->seat != seat) {
        return;
    }
    if (input_method) {
        KILN_LOG_WARN("Second input method on seat '{}' refused", settings.seat_name);
        wlr_input_method_v2_send_unavailable(method);
        return;
    }
    input_method = method;

    listeners.input_method_commit.notify = [](wl_listener* listener, void* /*data*/) {
        auto* list = owner_of<Listeners, offsetof(Listeners, input_method_commit)>(listener);
        list->impl->handle_input_method_commit();
    };
    wl_signal_add(&method->events.commit, &listeners.input_method_commit);

    listeners.input_method_destroy.notify = [](wl_listener* listener, void* /*data*/) {
        auto* list = owner_of<Listeners, offsetof(Listeners, input_method_destroy)>(listener);
        list->impl->handle_input_method_destroy();
    };
    wl_signal_add(&method->events.destroy, &listeners.input_method_destroy);
    KILN_LOG_DEBUG("Input method bound on seat '{}'", settings.seat_name);

    if (auto* text_input = active_text_input()) {
        wlr_input_method_v2_send_activate(input_method);
        send_text_input_state(text_input);
    }
}

void ProtocolServer::Impl::handle_input_method_commit() {
    auto* text_input = active_text_input();
    if (!text_input) {
        return;
    }
    const auto& state = input_method->current;
    if (state.preedit.text) {
        wlr_text_input_v3_send_preedit_string(text_input, state.preedit.text,
                                              state.preedit.cursor_begin, state.preedit.cursor_end);
    }
    if (state.commit_text) {
        wlr_text_input_v3_send_commit_string(text_input, state.commit_text);
    }
    if (state.delete_.before_length || state.delete_.after_length) {
        wlr_text_input_v3_send_delete_surrounding_text(text_input, state.delete_.before_length,
                                                       state.delete_.after_length);
    }
    wlr_text_input_v3_send_done(text_input);
}

void ProtocolServer::Impl::handle_input_method_destroy() {
    detach(listeners.input_method_commit);
    detach(listeners.input_method_destroy);
    input_method = nullptr;
    if (auto* text_input = active_text_input()) {
        wlr_text_input_v3_send_preedit_string(text_input, nullptr, 0, 0);
        wlr_text_input_v3_send_done(text_input);
    }
}

auto ProtocolServer::Impl::active_text_input() const -> wlr_text_input_v3* {
    for (auto* hooks : text_inputs) {
        if (hooks->text_input->focused_surface && hooks->text_input->current_enabled) {
            return hooks->text_input;
        }
    }
    return nullptr;
}

void ProtocolServer::Impl::update_text_input_focus() {
    for (auto* hooks : text_inputs) {
        auto* text_input = hooks->text_input;
        if (text_input->focused_surface == focused_surface) {
            continue;
        }
        if (text_input->focused_surface) {
            if (text_input->current_enabled && input_method) {
                wlr_input_method_v2_send_deactivate(input_method);
                wlr_input_method_v2_send_done(input_method);
            }
            wlr_text_input_v3_send_leave(text_input);
        }
        if (focused_surface && wl_resource_get_client(text_input->resource) ==
                                   wl_resource_get_client(focused_surface->resource)) {
            wlr_text_input_v3_send_enter(text_input, focused_surface);
        }
    }
}

void ProtocolServer::Impl::update_inhibitor() {
    wlr_keyboard_shortcuts_inhibitor_v1* wanted = nullptr;
    for (auto* hooks : inhibitors) {
        if (focused_surface && hooks->inhibitor->surface == focused_surface) {
            wanted = hooks->inhibitor;
            break;
        }
    }
    if (wanted == active_inhibitor) {
        return;
    }
    if (active_inhibitor) {
        wlr_keyboard_shortcuts_inhibitor_v1_deactivate(active_inhibitor);
    }
    active_inhibitor = wanted;
    if (active_inhibitor) {
        wlr_keyboard_shortcuts_inhibitor_v1_activate(active_inhibitor);
    }
}

void ProtocolServer::Impl::focus_surface(wlr_surface* surface) {
    if (focused_surface == surface) {
        return;
    }
    for (auto* hooks : mapped) {
        if (hooks->surface == focused_surface) {
            wlr_xdg_toplevel_set_activated(hooks->toplevel, false);
        }
    }

    focused_surface = surface;
    update_text_input_focus();
    if (!surface) {
        wlr_seat_keyboard_clear_focus(seat);
        update_inhibitor();
        return;
    }

    for (auto* hooks : mapped) {
        if (hooks->surface == surface) {
            wlr_xdg_toplevel_set_activated(hooks->toplevel, true);
        }
    }
    wlr_seat_set_keyboard(seat, keyboard.get());
    wlr_seat_keyboard_notify_enter(seat, surface, keyboard->keycodes, keyboard->num_keycodes,
                                   &keyboard->modifiers);
    update_inhibitor();
}

void ProtocolServer::Impl::teardown() {
    if (!display) {
        return;
    }

    wl_display_destroy_clients(display);

    // wlroots asserts that no listeners remain on its objects when they are destroyed.
    for (wl_listener* listener :
         {&listeners.new_xdg_toplevel, &listeners.new_inhibitor, &listeners.request_set_selection,
          &listeners.request_set_primary_selection, &listeners.new_decoration,
          &listeners.new_text_input, &listeners.new_input_method, &listeners.input_method_commit,
          &listeners.input_method_destroy}) {
        if (listener->link.next) {
            detach(*listener);
        }
    }
    for (auto* hooks : toplevels) {
        detach(hooks->surface_commit);
        detach(hooks->surface_map);
        detach(hooks->surface_unmap);
        detach(hooks->surface_destroy);
        delete hooks;
    }
    toplevels.clear();
    mapped.clear();
    for (auto* hooks : inhibitors) {
        detach(hooks->destroy);
        delete hooks;
    }
    inhibitors.clear();
    for (auto* hooks : decorations) {
        detach(hooks->request_mode);
        detach(hooks->destroy);
        delete hooks;
    }
    decorations.clear();
    for (auto* hooks : text_inputs) {
        detach(hooks->enable);
        detach(hooks->commit);
        detach(hooks->disable);
        detach(hooks->destroy);
        delete hooks;
    }
    text_inputs.clear();
    input_method = nullptr;
    focused_surface = nullptr;
    active_inhibitor = nullptr;

    keyboard.reset();
    if (seat) {
        wlr_seat_destroy(seat);
        seat = nullptr;
    }
    if (output_layout) {
        wlr_output_layout_destroy(output_layout);
        output_layout = nullptr;
    }
    output = nullptr;
    if (backend) {
        wlr_backend_destroy(backend);
        backend = nullptr;
    }

    wl_display_destroy(display);
    display = nullptr;
    event_loop = nullptr;
}

ProtocolServer::ProtocolServer() : m_impl(std::make_unique<Impl>()) {}

ProtocolServer::~ProtocolServer() {
    m_impl->teardown();
}

auto ProtocolServer::create(const ProtocolSettings& settings) -> ResultPtr<ProtocolServer> {
    initialize_wlroots_logging();

    auto server = std::unique_ptr<ProtocolServer>(new ProtocolServer());
    auto& impl = *server->m_impl;
    impl.settings = settings;

    auto setup = [&impl]() -> Result<void> {
        KILN_TRY(impl.setup_display());
        KILN_TRY(impl.setup_buffer_protocols());
        KILN_TRY(impl.setup_xdg_shell());
        KILN_TRY(impl.setup_seat());
        KILN_TRY(impl.setup_selection());
        KILN_TRY(impl.setup_output());
        KILN_TRY(impl.setup_foreign());
        KILN_TRY(impl.setup_shortcuts_inhibit());
        KILN_TRY(impl.setup_security_context());
        KILN_TRY(impl.setup_decoration());
        KILN_TRY(impl.setup_text_input());
        return {};
    }();
    if (!setup) {
        return nonstd::make_unexpected(setup.error());
    }

    KILN_LOG_INFO("Protocol globals ready on seat '{}'", settings.seat_name);
    return make_result_ptr(std::move(server));
}

auto ProtocolServer::display() const -> wl_display* {
    return m_impl->display;
}

auto ProtocolServer::security_manager() const -> wlr_security_context_manager_v1* {
    return m_impl->security_manager;
}

auto ProtocolServer::event_fd() const -> int {
    return wl_event_loop_get_fd(m_impl->event_loop);
}

auto ProtocolServer::dispatch() -> Result<void> {
    if (wl_event_loop_dispatch(m_impl->event_loop, 0) < 0) {
        return make_error<void>(ErrorCode::invalid_data, "Protocol event loop dispatch failed");
    }
    return {};
}

void ProtocolServer::flush_clients() {
    wl_display_flush_clients(m_impl->display);
}

void ProtocolServer::set_keymap(xkb_keymap* keymap) {
    if (!wlr_keyboard_set_keymap(m_impl->keyboard.get(), keymap)) {
        KILN_LOG_WARN("Failed to publish keymap on the seat keyboard");
    }
}

void ProtocolServer::send_frame_done(std::chrono::nanoseconds monotonic_now) {
    timespec now{};
    now.tv_sec = static_cast<time_t>(
        std::chrono::duration_cast<std::chrono::seconds>(monotonic_now).count());
    now.tv_nsec = static_cast<long>((monotonic_now % std::chrono::seconds{1}).count());
    for (auto* hooks : m_impl->mapped) {
        wlr_surface_send_frame_done(hooks->surface, &now);
    }
}

auto ProtocolServer::mapped_surfaces() const -> size_t {
    return m_impl->mapped.size();
}

auto ProtocolServer::has_focus() const -> bool {
    return m_impl->focused_surface != nullptr;
}

void ProtocolServer::send_key(uint32_t time_msec, uint32_t keycode, bool pressed) {
    auto& impl = *m_impl;
    if (!impl.focused_surface) {
        return;
    }
    wlr_seat_set_keyboard(impl.seat, impl.keyboard.get());
    wlr_seat_keyboard_notify_key(impl.seat, time_msec, keycode,
                                 pressed ? WL_KEYBOARD_KEY_STATE_PRESSED
                                         : WL_KEYBOARD_KEY_STATE_RELEASED);
}

void ProtocolServer::send_modifiers(const input::ModifierState& modifiers) {
    auto& impl = *m_impl;
    if (!impl.keyboard->xkb_state) {
        return;
    }
    // Emits the keyboard's modifiers signal, which the seat forwards to the focused client.
    wlr_keyboard_notify_modifiers(impl.keyboard.get(), modifiers.depressed, modifiers.latched,
                                  modifiers.locked, modifiers.group);
}

auto ProtocolServer::shortcuts_inhibited() const -> bool {
    return m_impl->active_inhibitor != nullptr && m_impl->active_inhibitor->active;
}

} // namespace kiln::server
