/// @file supervisor.hpp
/// @brief Startup and shutdown orchestration
///
/// The supervisor walks the boot phases strictly in order:
/// ConfigLoad, NetworkInit, EarlyIdentity (optional), CompatibilityShim,
/// ModuleLoad, LateIdentity (optional), SignalRegister, RunLoop,
/// ShutdownHooks, Terminate.
/// A fatal error in any phase before RunLoop flushes the logs and ends the
/// run with exit status 1. Shutdown hooks run exactly once after the
/// event engine returns, whatever the reason. An engine that throws still
/// gets its shutdown hooks, and the run ends with status 1.

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "identity.hpp"
#include "module_loader.hpp"
#include "services.hpp"

#include <mudhost/core/error.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace mudhost_engine {
class ConfigStore;
class HookRegistry;
class IEventEngine;
class INetwork;
}

namespace mudhost_kernel {

// =============================================================================
// Supervisor Configuration
// =============================================================================

/// Startup settings, usually built from the command line
struct SupervisorConfig {
    std::filesystem::path library_path = "lib";
    std::string module_directory = "modules";   ///< Relative to the library root
    std::string config_file = "config.toml";    ///< Relative to the library root
    std::string library_marker = "muddata";     ///< Alternative library marker

    std::optional<std::string> bind_address;
    std::optional<std::string> http_address;

    IdentitySpec identity;
    bool early_identity = false;                ///< Drop privileges before modules load

    std::optional<std::string> copyover;        ///< Hot-restart handoff token
    bool enter_library = true;                  ///< chdir into the library root
};

/// Collaborators the supervisor drives. All are borrowed.
struct SupervisorDeps {
    mudhost_engine::ConfigStore& config;
    mudhost_engine::INetwork& network;
    mudhost_engine::IEventEngine& engine;
    mudhost_engine::HookRegistry& hooks;
    IdentitySystem& identity;
    ModuleImporter& importer;
    SignalBridge& signals;
    ServiceRegistry& services;
};

// =============================================================================
// Supervisor
// =============================================================================

/// Phase state machine around the event engine
class Supervisor {
public:
    static constexpr int EXIT_OK = 0;
    static constexpr int EXIT_FATAL = 1;

    Supervisor(SupervisorConfig config, SupervisorDeps deps);

    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    /// Run every phase. Blocks while the event engine runs.
    /// Returns the process exit status.
    [[nodiscard]] int run();

    // =========================================================================
    // Inspection
    // =========================================================================

    [[nodiscard]] const SupervisorConfig& config() const { return m_config; }

    /// Phases entered so far, in order
    [[nodiscard]] const std::vector<BootPhase>& phases() const { return m_phases; }

    /// Why the run loop ended (set once RunLoop completes)
    [[nodiscard]] std::optional<ControlEvent> control_event() const { return m_event; }

    /// Identity applied during EarlyIdentity or LateIdentity
    [[nodiscard]] const std::optional<ResolvedIdentity>& resolved_identity() const { return m_identity; }

    [[nodiscard]] const ModuleManifest& manifest() const { return m_loader.manifest(); }

    /// Absolute library root (set during ConfigLoad)
    [[nodiscard]] const std::filesystem::path& library_root() const { return m_library_root; }

    /// Error that ended a failed run
    [[nodiscard]] const std::optional<mudhost_core::Error>& fatal_error() const { return m_error; }

private:
    void enter(BootPhase phase);
    [[nodiscard]] int fail(mudhost_core::Error error);

    [[nodiscard]] mudhost_core::Result<void> load_config();
    [[nodiscard]] mudhost_core::Result<void> init_network();
    [[nodiscard]] mudhost_core::Result<void> apply_identity();
    void install_services();
    [[nodiscard]] mudhost_core::Result<void> load_modules();
    [[nodiscard]] mudhost_core::Result<void> register_signals();
    [[nodiscard]] ControlEvent run_loop();
    void run_shutdown_hooks();

    SupervisorConfig m_config;
    SupervisorDeps m_deps;
    PrivilegeTransition m_privileges;
    ModuleLoader m_loader;

    std::filesystem::path m_library_root;
    std::vector<BootPhase> m_phases;
    std::optional<ResolvedIdentity> m_identity;
    std::optional<ControlEvent> m_event;
    std::optional<mudhost_core::Error> m_error;
    bool m_started = false;
};

} // namespace mudhost_kernel
