/// @file supervisor.cpp
/// @brief Startup and shutdown orchestration implementation

#include <mudhost/kernel/supervisor.hpp>
#include <mudhost/kernel/signal_bridge.hpp>
#include <mudhost/engine/config.hpp>
#include <mudhost/engine/event_loop.hpp>
#include <mudhost/engine/hooks.hpp>
#include <mudhost/engine/network.hpp>
#include <mudhost/core/log.hpp>

#include <exception>
#include <system_error>

namespace mudhost_kernel {

Supervisor::Supervisor(SupervisorConfig config, SupervisorDeps deps)
    : m_config(std::move(config))
    , m_deps(deps)
    , m_privileges(deps.identity, deps.config)
    , m_loader(deps.importer) {
}

int Supervisor::run() {
    if (m_started) {
        mudhost_core::kernel_logger()->error("Supervisor::run() called twice");
        return EXIT_FATAL;
    }
    m_started = true;

    enter(BootPhase::ConfigLoad);
    if (auto result = load_config(); !result) {
        return fail(result.error());
    }

    enter(BootPhase::NetworkInit);
    if (auto result = init_network(); !result) {
        return fail(result.error());
    }

    if (m_config.early_identity) {
        enter(BootPhase::EarlyIdentity);
        if (auto result = apply_identity(); !result) {
            return fail(result.error());
        }
    }

    enter(BootPhase::CompatibilityShim);
    install_services();

    enter(BootPhase::ModuleLoad);
    if (auto result = load_modules(); !result) {
        return fail(result.error());
    }

    if (!m_config.early_identity) {
        enter(BootPhase::LateIdentity);
        if (auto result = apply_identity(); !result) {
            return fail(result.error());
        }
    }

    enter(BootPhase::SignalRegister);
    if (auto result = register_signals(); !result) {
        return fail(result.error());
    }

    enter(BootPhase::RunLoop);
    m_event = run_loop();

    enter(BootPhase::ShutdownHooks);
    run_shutdown_hooks();

    enter(BootPhase::Terminate);
    mudhost_core::kernel_logger()->info("The server has stopped.");
    mudhost_core::flush_all_loggers();
    // Only a crashed event engine leaves an error behind at this point
    return m_error ? EXIT_FATAL : EXIT_OK;
}

// =============================================================================
// Phase Helpers
// =============================================================================

void Supervisor::enter(BootPhase phase) {
    m_phases.push_back(phase);
    mudhost_core::kernel_logger()->debug("Entering phase {}", to_string(phase));
}

int Supervisor::fail(mudhost_core::Error error) {
    mudhost_core::kernel_logger()->debug("Startup aborted: {}", mudhost_core::build_error_chain(error));
    m_error = std::move(error);
    enter(BootPhase::Terminate);
    mudhost_core::flush_all_loggers();
    return EXIT_FATAL;
}

// =============================================================================
// Phases
// =============================================================================

mudhost_core::Result<void> Supervisor::load_config() {
    namespace fs = std::filesystem;
    auto log = mudhost_core::kernel_logger();
    std::error_code ec;

    fs::path root = fs::absolute(m_config.library_path, ec);
    if (ec) {
        root = m_config.library_path;
    }
    root = root.lexically_normal();

    fs::path config_path = root / m_config.config_file;
    bool has_config = fs::is_regular_file(config_path, ec);
    bool has_marker = fs::exists(root / m_config.library_marker, ec);

    if (!fs::is_directory(root, ec) || (!has_config && !has_marker)) {
        auto error = mudhost_core::BootError::missing_library(m_config.library_path.string());
        log->error("{}", error.message);
        return mudhost_core::Err(error);
    }
    m_library_root = root;

    if (m_config.enter_library) {
        fs::current_path(root, ec);
        if (ec) {
            auto error = mudhost_core::BootError::missing_library(root.string());
            log->error("Unable to enter the MUD library at {}: {}", root.string(), ec.message());
            return mudhost_core::Err(error);
        }
    }

    if (has_config) {
        auto loaded = m_deps.config.load_toml(config_path, mudhost_engine::ConfigStore::LIBRARY_LAYER);
        if (!loaded) {
            log->error("{}", loaded.error().message());
            return loaded;
        }
        log->info("Loaded configuration from {}", config_path.string());
    }

    return mudhost_core::Ok();
}

mudhost_core::Result<void> Supervisor::init_network() {
    auto result = m_deps.network.initialize(m_config.bind_address, m_config.http_address);
    if (!result) {
        mudhost_core::kernel_logger()->error("Unable to initialize networking: {}", result.error().message());
    }
    return result;
}

mudhost_core::Result<void> Supervisor::apply_identity() {
    // PrivilegeTransition logs the failure itself
    auto result = m_privileges.apply(m_config.identity);
    if (!result) {
        return mudhost_core::Err(result.error());
    }
    m_identity = std::move(*result);
    return mudhost_core::Ok();
}

void Supervisor::install_services() {
    auto& services = m_deps.services;

    services.provide("config", m_deps.config);
    services.provide("hooks", m_deps.hooks);
    services.provide("engine", m_deps.engine);
    services.provide("network", m_deps.network);
    services.provide("signals", m_deps.signals);

    if (m_deps.config.get_bool("legacy_compatible", false)) {
        services.provide("mudsys", *this);
        services.alias("event", "engine");
        services.alias("mudsock", "network");
        services.alias("storage", "config");
        mudhost_core::kernel_logger()->debug("Legacy service names registered");
    }
}

mudhost_core::Result<void> Supervisor::load_modules() {
    mudhost_core::LogScope scope("module load", mudhost_core::kernel_logger());

    if (m_config.copyover) {
        mudhost_core::kernel_logger()->warn(
            "Copyover recovery was requested ({}), but it is not available. Starting fresh.", *m_config.copyover);
    }

    auto result = m_loader.load(m_library_root / m_config.module_directory, m_deps.services);
    if (result) {
        mudhost_core::kernel_logger()->info("Loaded {} module(s).", m_loader.manifest().size());
    }
    return result;
}

mudhost_core::Result<void> Supervisor::register_signals() {
    auto result = m_deps.signals.register_handlers();
    if (!result) {
        mudhost_core::kernel_logger()->error("Unable to register signal handlers: {}", result.error().message());
    }
    return result;
}

ControlEvent Supervisor::run_loop() {
    auto log = mudhost_core::kernel_logger();
    SignalBridge& signals = m_deps.signals;

    m_deps.engine.set_stop_check([&signals]() { return signals.pending().has_value(); });

    log->info("Entering the event loop.");
    try {
        m_deps.engine.start();
    } catch (const std::exception& e) {
        log->critical("The event engine failed: {}", e.what());
        m_error = mudhost_core::Error(std::string("event engine failed: ") + e.what());
    } catch (...) {
        log->critical("The event engine failed with an unknown exception");
        m_error = mudhost_core::Error("event engine failed with an unknown exception");
    }
    m_deps.engine.set_stop_check({});

    ControlEvent event = signals.take().value_or(ControlEvent::Normal);
    switch (event) {
        case ControlEvent::CopyoverRequested:
            log->info("A copyover was requested. The server would now restart in place.");
            break;
        case ControlEvent::Interrupted:
            log->info("Interrupted. Shutting down.");
            break;
        case ControlEvent::Normal:
            log->info("The event loop has finished.");
            break;
    }
    return event;
}

void Supervisor::run_shutdown_hooks() {
    auto& hooks = m_deps.hooks;
    std::size_t total = hooks.count(mudhost_engine::SHUTDOWN_EVENT);
    std::size_t completed = hooks.run(mudhost_engine::SHUTDOWN_EVENT);
    mudhost_core::kernel_logger()->debug("Ran {}/{} shutdown hook(s)", completed, total);
}

} // namespace mudhost_kernel
