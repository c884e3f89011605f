#include "cli.hpp"

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <input/input_translator.hpp>
#include <input/xkb_keymap.hpp>
#include <output/drm_device.hpp>
#include <output/output_controller.hpp>
#include <render/vulkan_engine.hpp>
#include <runtime/frame_loop.hpp>
#include <runtime/handlers.hpp>
#include <runtime/runtime_state.hpp>
#include <server/client_registry.hpp>
#include <server/listening_socket.hpp>
#include <server/protocol_server.hpp>
#include <session/input_context.hpp>
#include <session/session.hpp>
#include <session/udev_monitor.hpp>
#include <util/config.hpp>
#include <util/error.hpp>
#include <util/logging.hpp>
#include <util/paths.hpp>
#include <util/profiling.hpp>
#include <xkbcommon/xkbcommon.h>

namespace {

auto load_effective_config(const kiln::app::CliOptions& cli_opts) -> kiln::Config {
    auto config_result = kiln::load_config(cli_opts.config_path);

    kiln::Config config;
    if (!config_result) {
        const auto& error = config_result.error();
        KILN_LOG_ERROR("Failed to load configuration from '{}': {} ({})",
                       cli_opts.config_path.string(), error.message,
                       kiln::error_code_name(error.code));
        KILN_LOG_INFO("Using default configuration");
        config = kiln::default_config();
    } else {
        config = config_result.value();
    }

    if (cli_opts.target_fps) {
        config.runtime.target_fps = *cli_opts.target_fps;
        KILN_LOG_INFO("Target FPS overridden by CLI: {}", config.runtime.target_fps);
    }
    if (!cli_opts.device.empty()) {
        config.output.device = cli_opts.device;
    }
    if (!cli_opts.socket.empty()) {
        config.server.socket = cli_opts.socket;
    }
    if (!cli_opts.log_level.empty()) {
        config.logging.level = cli_opts.log_level;
    }
    if (cli_opts.validation) {
        config.render.enable_validation = true;
    }
    return config;
}

void log_config(const kiln::Config& config) {
    KILN_LOG_DEBUG("Configuration loaded:");
    KILN_LOG_DEBUG("  Runtime target_fps: {}", config.runtime.target_fps);
    KILN_LOG_DEBUG("  Output device: {}",
                   config.output.device.empty() ? "<auto>" : config.output.device);
    KILN_LOG_DEBUG("  Output swapchain_slots: {}", config.output.swapchain_slots);
    KILN_LOG_DEBUG("  Output transform: {}", to_string(config.output.transform));
    KILN_LOG_DEBUG("  Output damage_tracking: {}", config.output.damage_tracking);
    KILN_LOG_DEBUG("  Render enable_validation: {}", config.render.enable_validation);
    KILN_LOG_DEBUG("  Input shutdown_key: {}", config.input.shutdown_key);
    KILN_LOG_DEBUG("  Input vt_switching: {}", config.input.vt_switching);
    KILN_LOG_DEBUG("  Server socket: {}",
                   config.server.socket.empty() ? "<auto>" : config.server.socket);
    KILN_LOG_DEBUG("  Log level: {}", config.logging.level);
}

// Brings up every subsystem in dependency order. A failure leaves the already created members
// in place; they are torn down with the state.
auto setup_runtime(const kiln::Config& config, kiln::runtime::RuntimeState& state)
    -> kiln::Result<void> {
    KILN_PROFILE_FUNCTION();
    using namespace kiln;

    state.session = KILN_TRY(session::Session::create());
    state.session_active = state.session->active();

    std::filesystem::path gpu_path = config.output.device;
    if (gpu_path.empty()) {
        gpu_path = KILN_TRY(session::find_primary_gpu(state.session->seat_name()));
    }
    state.gpu = KILN_TRY(state.session->open_device(gpu_path));
    KILN_LOG_INFO("Using GPU {}", gpu_path.string());

    output::DrmSettings drm_settings{
        .slot_count = config.output.swapchain_slots,
        .transform = config.output.transform,
        .damage_tracking = config.output.damage_tracking,
    };
    auto device = KILN_TRY(output::DrmDevice::create(state.gpu->fd(), drm_settings));
    state.output = std::make_unique<output::OutputController>(std::move(device));
    const auto& descriptor = state.output->descriptor();
    KILN_LOG_INFO("Output {} {}x{}@{}mHz, {} slots", descriptor.name, descriptor.mode.width,
                  descriptor.mode.height, descriptor.mode.refresh_mhz,
                  state.output->swapchain().size());

    state.engine = KILN_TRY(render::VulkanEngine::create({
        .drm_device = state.gpu->devnum(),
        .enable_validation = config.render.enable_validation,
    }));

    server::ProtocolSettings protocol_settings{
        .seat_name = config.server.seat_name,
        .repeat_rate = config.input.repeat_rate,
        .repeat_delay = config.input.repeat_delay,
        .output = descriptor,
        .main_device = state.gpu->devnum(),
    };
    state.protocol = KILN_TRY(server::ProtocolServer::create(protocol_settings));
    state.clients = std::make_unique<server::ClientRegistry>(state.protocol->display());
    state.clients->set_security_manager(state.protocol->security_manager());

    state.input = KILN_TRY(session::InputContext::create(*state.session));

    auto keymap = KILN_TRY(input::XkbKeymap::create({
        .layout = config.input.xkb_layout,
        .variant = config.input.xkb_variant,
        .options = config.input.xkb_options,
    }));
    state.protocol->set_keymap(keymap->native());
    state.keymap = std::move(keymap);

    input::TranslatorSettings translator_settings{
        .shutdown_keysym =
            xkb_keysym_from_name(config.input.shutdown_key.c_str(), XKB_KEYSYM_NO_FLAGS),
        .vt_switching = config.input.vt_switching,
    };
    if (translator_settings.shutdown_keysym == XKB_KEY_NoSymbol) {
        return make_error<void>(ErrorCode::invalid_config,
                                "Unknown shutdown key: " + config.input.shutdown_key);
    }
    state.translator = std::make_unique<input::InputTranslator>(*state.keymap, translator_settings);
    state.translator->set_sink(state.protocol.get());
    return {};
}

auto bind_socket(const kiln::Config& config) -> kiln::Result<kiln::server::ListeningSocket> {
    auto runtime_dir = KILN_TRY(kiln::util::resolve_runtime_dir());
    auto socket = KILN_TRY(kiln::server::ListeningSocket::bind(runtime_dir, config.server.socket));
    if (::setenv("WAYLAND_DISPLAY", socket.name().c_str(), 1) != 0) {
        return kiln::make_error<kiln::server::ListeningSocket>(kiln::ErrorCode::socket_failed,
                                                               "Failed to export WAYLAND_DISPLAY");
    }
    return socket;
}

// Sources are registered in the order their handlers should run when ready together: seat
// state first, then hot-plug, input, new clients, client requests, completions and signals.
auto register_sources(kiln::runtime::RuntimeMultiplexer& mux, kiln::runtime::RuntimeState& state,
                      kiln::server::ListeningSocket socket) -> kiln::Result<void> {
    using namespace kiln;
    using namespace kiln::runtime;

    KILN_TRY(mux.insert_source(session::SessionNotifier{*state.session}, on_session_event));

    auto udev = KILN_TRY(session::UdevMonitor::create());
    KILN_TRY(mux.insert_source(std::move(udev),
                               [&mux](session::DeviceEvent& event, RuntimeState& rs) {
                                   (void)on_device_event(mux, event, rs);
                               }));

    KILN_TRY(mux.insert_source(session::InputNotifier{*state.input}, on_raw_input));
    KILN_TRY(mux.insert_source(std::move(socket), on_connection));
    KILN_TRY(mux.insert_source(server::ProtocolNotifier{*state.protocol},
                               [](server::ProtocolDispatched&, RuntimeState&) {}));

    state.display_source =
        KILN_TRY(mux.insert_source(DisplayNotifier{state.output->device()}, on_completion));

    auto signals = KILN_TRY(SignalNotifier::create({SIGINT, SIGTERM}));
    KILN_TRY(mux.insert_source(std::move(signals), on_signal));
    return {};
}

} // namespace

static auto run_app(int argc, char** argv) -> int {
    auto cli_result = kiln::app::parse_cli(argc, argv);
    if (!cli_result) {
        return EXIT_FAILURE;
    }
    if (cli_result->action == kiln::app::CliAction::exit_ok) {
        return EXIT_SUCCESS;
    }
    const auto& cli_opts = cli_result->options;

    kiln::initialize_logger("kiln");
    KILN_LOG_INFO(KILN_PROJECT_NAME " v" KILN_VERSION " starting");

    auto config = load_effective_config(cli_opts);

    if (auto level = kiln::parse_log_level(config.logging.level)) {
        kiln::set_log_level(*level);
    } else {
        KILN_LOG_WARN("Unknown log level '{}', keeping default", config.logging.level);
    }
    if (!config.logging.file.empty()) {
        auto file_result = kiln::add_log_file(config.logging.file);
        if (!file_result) {
            KILN_LOG_WARN("{}", file_result.error().message);
        }
    }
    log_config(config);

    kiln::runtime::RuntimeState state{
        kiln::runtime::FramePacer::interval_for_fps(config.runtime.target_fps)};

    auto setup_result = setup_runtime(config, state);
    if (!setup_result) {
        KILN_LOG_CRITICAL("Startup failed: {} ({})", setup_result.error().message,
                          kiln::error_code_name(setup_result.error().code));
        return EXIT_FAILURE;
    }

    auto socket_result = bind_socket(config);
    if (!socket_result) {
        KILN_LOG_CRITICAL("Failed to create listening socket: {}",
                          socket_result.error().message);
        return EXIT_FAILURE;
    }

    auto mux_result = kiln::runtime::RuntimeMultiplexer::create();
    if (!mux_result) {
        KILN_LOG_CRITICAL("Failed to create event loop: {}", mux_result.error().message);
        return EXIT_FAILURE;
    }
    auto& mux = **mux_result;

    auto register_result = register_sources(mux, state, std::move(*socket_result));
    if (!register_result) {
        KILN_LOG_CRITICAL("Failed to register event sources: {}",
                          register_result.error().message);
        return EXIT_FAILURE;
    }

    KILN_LOG_INFO("Entering event loop at {} FPS", config.runtime.target_fps);
    auto exit = kiln::runtime::run_loop(mux, state);
    kiln::runtime::log_frame_stats(state);

    KILN_LOG_INFO("Shutting down...");
    return exit == kiln::runtime::AppExit::success ? EXIT_SUCCESS : EXIT_FAILURE;
}

auto main(int argc, char** argv) -> int {
    try {
        return run_app(argc, argv);
    } catch (const std::exception& e) {
        std::fprintf(stderr, "[CRITICAL] Unhandled exception: %s\n", e.what());
        try {
            KILN_LOG_CRITICAL("Unhandled exception caught in main: {}", e.what());
            spdlog::shutdown();
        } catch (...) {
            std::fprintf(stderr, "[CRITICAL] Logger failed to handle exception\n");
        }
        return EXIT_FAILURE;
    } catch (...) {
        std::fprintf(stderr, "[CRITICAL] Unknown exception caught in main\n");
        return EXIT_FAILURE;
    }
}
