/// @file module_loader.cpp
/// @brief Extension module discovery and import implementation

#include <mudhost/kernel/module_loader.hpp>
#include <mudhost/kernel/services.hpp>
#include <mudhost/core/log.hpp>

#include <algorithm>
#include <exception>
#include <system_error>

#include <dlfcn.h>

namespace mudhost_kernel {

// =============================================================================
// ModuleHandle Implementation
// =============================================================================

ModuleHandle::ModuleHandle(void* handle, std::filesystem::path path)
    : m_handle(handle), m_path(std::move(path)) {}

ModuleHandle::~ModuleHandle() {
    unload();
}

ModuleHandle::ModuleHandle(ModuleHandle&& other) noexcept
    : m_handle(other.m_handle), m_path(std::move(other.m_path)) {
    other.m_handle = nullptr;
}

ModuleHandle& ModuleHandle::operator=(ModuleHandle&& other) noexcept {
    if (this != &other) {
        unload();
        m_handle = other.m_handle;
        m_path = std::move(other.m_path);
        other.m_handle = nullptr;
    }
    return *this;
}

void* ModuleHandle::get_symbol(const char* name) const {
    if (!m_handle) return nullptr;
    return ::dlsym(m_handle, name);
}

mudhost_core::Result<ModuleHandle> ModuleHandle::load(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return mudhost_core::Error(mudhost_core::ErrorCode::NotFound, "file not found: " + path.string());
    }

    void* handle = ::dlopen(path.c_str(), RTLD_NOW | RTLD_GLOBAL);
    if (!handle) {
        const char* reason = ::dlerror();
        return mudhost_core::Error(mudhost_core::ErrorCode::LoadFailed,
                                   reason ? std::string(reason) : "dlopen failed");
    }

    return ModuleHandle(handle, path);
}

void ModuleHandle::unload() {
    if (m_handle) {
        ::dlclose(m_handle);
        m_handle = nullptr;
    }
}

// =============================================================================
// DynamicModuleImporter Implementation
// =============================================================================

DynamicModuleImporter::~DynamicModuleImporter() {
    shutdown_all();
}

mudhost_core::Result<void> DynamicModuleImporter::import_module(const ModuleRecord& record,
                                                               ServiceRegistry& services) {
    using mudhost_core::Error;
    using mudhost_core::ErrorCode;

    auto handle_result = ModuleHandle::load(record.path);
    if (!handle_result) {
        return mudhost_core::Err(handle_result.error());
    }
    auto handle = std::move(*handle_result);

    auto* entry = handle.get_symbol_as<ModuleEntryPoint*>(ModuleEntryPoint::SYMBOL_NAME);
    if (!entry) {
        return mudhost_core::Err(Error(ErrorCode::LoadFailed,
            std::string("missing entry point '") + ModuleEntryPoint::SYMBOL_NAME + "'"));
    }

    if (entry->api_version != mudhost_core::MODULE_API_VERSION) {
        return mudhost_core::Err(Error(ErrorCode::NotSupported,
            "module API version " + std::to_string(entry->api_version) + ", expected " +
            std::to_string(mudhost_core::MODULE_API_VERSION)));
    }

    if (!entry->create || !entry->destroy) {
        return mudhost_core::Err(Error(ErrorCode::LoadFailed, "module creation failed"));
    }

    ModuleContext context{services, record.name, record.path, mudhost_core::module_logger()};

    // Construction and initialization both run module code
    IModule* instance = nullptr;
    mudhost_core::Result<void> init = mudhost_core::Ok();
    try {
        instance = entry->create();
        if (!instance) {
            init = mudhost_core::Err(Error(ErrorCode::LoadFailed, "module creation failed"));
        } else {
            init = instance->initialize(context);
        }
    } catch (const std::exception& e) {
        init = mudhost_core::Err(Error(ErrorCode::LoadFailed, e.what()));
    } catch (...) {
        init = mudhost_core::Err(Error(ErrorCode::LoadFailed, "unknown exception while loading the module"));
    }

    if (!init) {
        if (instance) {
            entry->destroy(instance);
        }
        // The module may have left callbacks behind; keep its code mapped
        m_retired.push_back(std::move(handle));
        return init;
    }

    mudhost_core::module_logger()->debug("Module '{}' ({}) initialized", record.name,
                                         entry->name ? entry->name : "?");
    m_modules.push_back(LoadedModule{record.name, std::move(handle), instance, entry->destroy});
    return mudhost_core::Ok();
}

void DynamicModuleImporter::shutdown_all() {
    while (!m_modules.empty()) {
        LoadedModule module = std::move(m_modules.back());
        m_modules.pop_back();

        try {
            module.instance->shutdown();
        } catch (const std::exception& e) {
            mudhost_core::module_logger()->error("Module '{}' failed to shut down: {}", module.name, e.what());
        } catch (...) {
            mudhost_core::module_logger()->error("Module '{}' failed to shut down: unknown exception", module.name);
        }
        module.destroy(module.instance);
        mudhost_core::module_logger()->debug("Module '{}' shut down", module.name);

        m_retired.push_back(std::move(module.handle));
    }
}

bool DynamicModuleImporter::is_loaded(const std::string& name) const {
    return std::any_of(m_modules.begin(), m_modules.end(),
                       [&name](const LoadedModule& m) { return m.name == name; });
}

// =============================================================================
// ModuleLoader Implementation
// =============================================================================

ModuleLoader::ModuleLoader(ModuleImporter& importer, LoaderOptions options)
    : m_importer(importer), m_options(std::move(options)) {
}

bool ModuleLoader::is_hidden(const std::string& name) const {
    return !name.empty() && name.front() == m_options.hidden_prefix;
}

bool ModuleLoader::has_suffix(const std::string& name) const {
    const auto& suffix = m_options.suffix;
    return name.size() > suffix.size() &&
           name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

mudhost_core::Result<ModuleManifest> ModuleLoader::discover(const std::filesystem::path& directory) const {
    namespace fs = std::filesystem;
    std::error_code ec;

    if (!fs::is_directory(directory, ec)) {
        return mudhost_core::Err<ModuleManifest>(mudhost_core::ModuleError::missing_directory(directory.string()));
    }

    ModuleManifest manifest;

    // A package marker turns the whole directory into one module
    fs::path marker = directory / m_options.package_marker;
    if (fs::is_regular_file(marker, ec)) {
        fs::path normalized = directory.lexically_normal();
        std::string name = normalized.filename().string();
        if (name.empty()) {
            name = normalized.parent_path().filename().string();
        }
        manifest.records.push_back(ModuleRecord{name, marker, ModuleStatus::Pending, {}});
        return manifest;
    }

    std::vector<std::string> entries;
    for (fs::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
        entries.push_back(it->path().filename().string());
    }
    if (ec) {
        return mudhost_core::Err<ModuleManifest>(mudhost_core::Error(mudhost_core::ErrorCode::IOError,
            "Unable to read module directory " + directory.string() + ": " + ec.message()));
    }

    std::sort(entries.begin(), entries.end());

    for (const auto& entry : entries) {
        if (is_hidden(entry)) {
            continue;
        }

        fs::path full = directory / entry;
        std::error_code status_ec;
        auto status = fs::status(full, status_ec);

        if (fs::is_regular_file(status)) {
            if (!has_suffix(entry)) {
                continue;
            }
            std::string name = entry.substr(0, entry.size() - m_options.suffix.size());
            manifest.records.push_back(ModuleRecord{name, full, ModuleStatus::Pending, {}});
        } else if (fs::is_directory(status)) {
            fs::path package = full / m_options.package_marker;
            if (!fs::is_regular_file(package, status_ec)) {
                continue;
            }
            manifest.records.push_back(ModuleRecord{entry, package, ModuleStatus::Pending, {}});
        }
    }

    return manifest;
}

mudhost_core::Result<void> ModuleLoader::load(const std::filesystem::path& directory, ServiceRegistry& services) {
    auto log = mudhost_core::module_logger();

    if (m_has_run) {
        return mudhost_core::Err(mudhost_core::ModuleError::invalid_state("modules were already loaded"));
    }
    m_has_run = true;

    auto discovered = discover(directory);
    if (!discovered) {
        log->error("{}", discovered.error().message());
        return mudhost_core::Err(discovered.error());
    }
    m_manifest = std::move(*discovered);

    log->debug("Found {} module(s) in {}", m_manifest.size(), directory.string());

    for (auto& record : m_manifest.records) {
        log->debug("Importing module '{}' from {}", record.name, record.path.string());

        auto result = m_importer.import_module(record, services);
        if (!result) {
            record.status = ModuleStatus::Failed;
            record.error = result.error().message();
            log->error("An error occurred when attempting to import module: {} ({}): {}",
                       record.name, record.path.string(), record.error);
            return mudhost_core::Err(mudhost_core::ModuleError::import_failed(
                record.name, record.path.string(), record.error));
        }

        record.status = ModuleStatus::Loaded;
        log->info("Loaded module '{}'", record.name);
    }

    return mudhost_core::Ok();
}

} // namespace mudhost_kernel
