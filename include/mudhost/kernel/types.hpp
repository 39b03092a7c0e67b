/// @file types.hpp
/// @brief Core types for mudhost_kernel
///
/// Provides the value types shared by the kernel components:
/// - Identity requests and results
/// - Module manifest records
/// - Control events and boot phases

#pragma once

#include "fwd.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <sys/types.h>

namespace mudhost_kernel {

// =============================================================================
// Identity Types
// =============================================================================

/// A number or a name
using IdentityValue = std::variant<std::int64_t, std::string>;

/// Build an IdentityValue from text. Text made only of decimal digits
/// becomes a number.
[[nodiscard]] IdentityValue identity_value(const std::string& text);

/// Render an IdentityValue for logs
[[nodiscard]] std::string to_string(const IdentityValue& value);

/// Requested identity. Absent fields fall back to the configuration.
struct IdentitySpec {
    std::optional<IdentityValue> uid;
    std::optional<IdentityValue> gid;
    std::optional<IdentityValue> umask;

    [[nodiscard]] bool empty() const { return !uid && !gid && !umask; }
};

/// Identity after PrivilegeTransition::apply
struct ResolvedIdentity {
    std::optional<uid_t> uid;
    std::optional<gid_t> gid;
    std::optional<mode_t> umask;
    std::optional<mode_t> previous_umask;
    bool uid_changed = false;
    bool gid_changed = false;
    bool explicit_root = false;     ///< uid 0 was requested explicitly
};

// =============================================================================
// Module Types
// =============================================================================

/// Module import status
enum class ModuleStatus : std::uint8_t {
    Pending,    ///< Discovered, not attempted
    Loaded,     ///< Imported and initialized
    Failed,     ///< Import raised an error
};

/// Convert module status to string
[[nodiscard]] const char* to_string(ModuleStatus status);

/// One discovered module
struct ModuleRecord {
    std::string name;
    std::filesystem::path path;         ///< Shared object actually imported
    ModuleStatus status = ModuleStatus::Pending;
    std::string error;                  ///< Reason when Failed
};

/// Modules in import order, rebuilt on every load
struct ModuleManifest {
    std::vector<ModuleRecord> records;

    [[nodiscard]] std::size_t size() const { return records.size(); }
    [[nodiscard]] bool empty() const { return records.empty(); }

    [[nodiscard]] const ModuleRecord* find(const std::string& name) const;

    /// Names in import order
    [[nodiscard]] std::vector<std::string> names() const;

    /// Number of records with the given status
    [[nodiscard]] std::size_t count(ModuleStatus status) const;
};

// =============================================================================
// Control Types
// =============================================================================

/// Why the run loop ended
enum class ControlEvent : std::uint8_t {
    Normal = 1,             ///< Engine returned on its own
    CopyoverRequested = 2,  ///< SIGHUP
    Interrupted = 3,        ///< SIGINT or SIGTERM
};

[[nodiscard]] const char* to_string(ControlEvent event);

/// Supervisor phases, in execution order
enum class BootPhase : std::uint8_t {
    ConfigLoad,
    NetworkInit,
    EarlyIdentity,
    CompatibilityShim,
    ModuleLoad,
    LateIdentity,
    SignalRegister,
    RunLoop,
    ShutdownHooks,
    Terminate,
};

[[nodiscard]] const char* to_string(BootPhase phase);

} // namespace mudhost_kernel
