/// @file module_loader.hpp
/// @brief Extension module discovery and import
///
/// Provides:
/// - Deterministic discovery of modules in a directory
/// - Fail-fast import in discovery order
/// - dlopen-based importing through the ModuleImporter seam

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "module.hpp"

#include <mudhost/core/error.hpp>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace mudhost_kernel {

// =============================================================================
// Module Handle
// =============================================================================

/// Platform-specific module handle wrapping native library handle
class ModuleHandle {
public:
    ModuleHandle() = default;
    ~ModuleHandle();

    // Non-copyable, movable
    ModuleHandle(const ModuleHandle&) = delete;
    ModuleHandle& operator=(const ModuleHandle&) = delete;
    ModuleHandle(ModuleHandle&& other) noexcept;
    ModuleHandle& operator=(ModuleHandle&& other) noexcept;

    [[nodiscard]] bool is_valid() const { return m_handle != nullptr; }

    /// Get symbol address
    [[nodiscard]] void* get_symbol(const char* name) const;

    /// Get symbol as typed pointer
    template<typename T>
    [[nodiscard]] T get_symbol_as(const char* name) const {
        return reinterpret_cast<T>(get_symbol(name));
    }

    [[nodiscard]] const std::filesystem::path& path() const { return m_path; }

    /// Open a shared object with RTLD_NOW | RTLD_GLOBAL so later modules
    /// can use symbols of earlier ones
    [[nodiscard]] static mudhost_core::Result<ModuleHandle> load(const std::filesystem::path& path);

    void unload();

private:
    ModuleHandle(void* handle, std::filesystem::path path);

    void* m_handle = nullptr;
    std::filesystem::path m_path;
};

// =============================================================================
// Module Importer
// =============================================================================

/// Imports one discovered module
class ModuleImporter {
public:
    virtual ~ModuleImporter() = default;

    /// Import and initialize the module described by record.
    /// The returned error's message is the failure reason.
    [[nodiscard]] virtual mudhost_core::Result<void> import_module(const ModuleRecord& record,
                                                                   ServiceRegistry& services) = 0;
};

/// Importer for shared objects exporting mudhost_module_entry
class DynamicModuleImporter final : public ModuleImporter {
public:
    DynamicModuleImporter() = default;
    ~DynamicModuleImporter() override;

    DynamicModuleImporter(const DynamicModuleImporter&) = delete;
    DynamicModuleImporter& operator=(const DynamicModuleImporter&) = delete;

    [[nodiscard]] mudhost_core::Result<void> import_module(const ModuleRecord& record,
                                                           ServiceRegistry& services) override;

    /// Shut down and destroy module instances in reverse load order.
    /// Libraries stay mapped until the importer is destroyed.
    void shutdown_all();

    [[nodiscard]] std::size_t loaded_count() const { return m_modules.size(); }
    [[nodiscard]] bool is_loaded(const std::string& name) const;

private:
    struct LoadedModule {
        std::string name;
        ModuleHandle handle;
        IModule* instance = nullptr;
        ModuleDestroyFn destroy = nullptr;
    };

    std::vector<LoadedModule> m_modules;
    std::vector<ModuleHandle> m_retired;    ///< Handles kept open after failure or shutdown
};

// =============================================================================
// Module Loader
// =============================================================================

/// Discovery rules
struct LoaderOptions {
    std::string suffix = ".so";             ///< Module file suffix
    std::string package_marker = "init.so"; ///< Marks a directory as one package
    char hidden_prefix = '.';               ///< Entries starting with it are skipped
};

/// Discovers modules in a directory and imports them in a fixed order,
/// stopping at the first failure
class ModuleLoader {
public:
    explicit ModuleLoader(ModuleImporter& importer, LoaderOptions options = {});

    ModuleLoader(const ModuleLoader&) = delete;
    ModuleLoader& operator=(const ModuleLoader&) = delete;

    /// Discover and import every module of a directory. Runs once.
    /// The manifest is available afterwards whether or not this succeeds.
    [[nodiscard]] mudhost_core::Result<void> load(const std::filesystem::path& directory,
                                                  ServiceRegistry& services);

    /// Build the manifest for a directory without importing anything
    [[nodiscard]] mudhost_core::Result<ModuleManifest> discover(const std::filesystem::path& directory) const;

    [[nodiscard]] const ModuleManifest& manifest() const { return m_manifest; }
    [[nodiscard]] const LoaderOptions& options() const { return m_options; }
    [[nodiscard]] bool has_run() const { return m_has_run; }

private:
    [[nodiscard]] bool is_hidden(const std::string& name) const;
    [[nodiscard]] bool has_suffix(const std::string& name) const;

    ModuleImporter& m_importer;
    LoaderOptions m_options;
    ModuleManifest m_manifest;
    bool m_has_run = false;
};

} // namespace mudhost_kernel
