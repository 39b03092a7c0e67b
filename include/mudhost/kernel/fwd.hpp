/// @file fwd.hpp
/// @brief Forward declarations for mudhost_kernel
///
/// Provides forward declarations for all kernel types to minimize
/// header dependencies.

#pragma once

#include <cstdint>

namespace mudhost_kernel {

// =============================================================================
// Identity
// =============================================================================

/// Requested uid/gid/umask
struct IdentitySpec;

/// Identity after the transition
struct ResolvedIdentity;

/// OS identity primitives
class IdentitySystem;
class PosixIdentitySystem;

/// Applies an IdentitySpec to the process
class PrivilegeTransition;

// =============================================================================
// Module System
// =============================================================================

/// Module import status
enum class ModuleStatus : std::uint8_t;

/// One discovered module
struct ModuleRecord;

/// Ordered list of discovered modules
struct ModuleManifest;

/// Module interface
class IModule;

/// Context handed to IModule::initialize
struct ModuleContext;

/// Exported module entry point
struct ModuleEntryPoint;

/// Platform-specific module handle
class ModuleHandle;

/// Imports a single module
class ModuleImporter;
class DynamicModuleImporter;

/// Discovers and imports modules from a directory
class ModuleLoader;

/// Services handed to modules
class ServiceRegistry;

// =============================================================================
// Control
// =============================================================================

/// Reason the run loop ended
enum class ControlEvent : std::uint8_t;

/// Signal to control event bridge
class SignalBridge;

/// Startup phases
enum class BootPhase : std::uint8_t;

/// Supervisor configuration
struct SupervisorConfig;

/// Startup and shutdown orchestrator
class Supervisor;

} // namespace mudhost_kernel
