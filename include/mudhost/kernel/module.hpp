/// @file module.hpp
/// @brief Extension module ABI
///
/// A module is a shared object exporting one entry point,
/// `mudhost_module_entry`, normally through MUDHOST_MODULE_ENTRY:
///
/// @code
/// class GreeterModule : public mudhost_kernel::IModule {
/// public:
///     mudhost_core::Result<void> initialize(mudhost_kernel::ModuleContext& ctx) override;
/// };
/// MUDHOST_MODULE_ENTRY(GreeterModule)
/// @endcode

#pragma once

#include "fwd.hpp"

#include <mudhost/core/error.hpp>
#include <mudhost/core/version.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace spdlog {
class logger;
}

namespace mudhost_kernel {

// =============================================================================
// Module Context
// =============================================================================

/// Everything a module receives when it is initialized
struct ModuleContext {
    ServiceRegistry& services;
    std::string module_name;
    std::filesystem::path module_path;
    std::shared_ptr<spdlog::logger> logger;     ///< The "modules" logger
};

// =============================================================================
// Module Interface
// =============================================================================

/// Interface every loadable module implements
class IModule {
public:
    virtual ~IModule() = default;

    /// Called once, right after the module is created. An error (or an
    /// exception) makes the import fail.
    [[nodiscard]] virtual mudhost_core::Result<void> initialize(ModuleContext& context) = 0;

    /// Called in reverse load order when the host unloads modules
    virtual void shutdown() {}
};

/// Module factory function signature
using ModuleFactoryFn = IModule* (*)();

/// Module destroy function signature
using ModuleDestroyFn = void (*)(IModule*);

/// Module entry point structure (exported by modules)
struct ModuleEntryPoint {
    static constexpr const char* SYMBOL_NAME = "mudhost_module_entry";

    const char* name;
    std::uint32_t api_version;
    ModuleFactoryFn create;
    ModuleDestroyFn destroy;
};

// =============================================================================
// Module Registration Helpers
// =============================================================================

/// Platform-specific export macro
#if defined(_WIN32)
    #define MUDHOST_EXPORT __declspec(dllexport)
#else
    #define MUDHOST_EXPORT __attribute__((visibility("default")))
#endif

/// Helper macro for defining module entry point
#define MUDHOST_MODULE_ENTRY(ModuleClass) \
    extern "C" { \
        MUDHOST_EXPORT mudhost_kernel::ModuleEntryPoint mudhost_module_entry = { \
            .name = #ModuleClass, \
            .api_version = ::mudhost_core::MODULE_API_VERSION, \
            .create = []() -> mudhost_kernel::IModule* { return new ModuleClass(); }, \
            .destroy = [](mudhost_kernel::IModule* m) { delete m; }, \
        }; \
    }

} // namespace mudhost_kernel
