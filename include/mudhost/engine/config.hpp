/// @file config.hpp
/// @brief Layered configuration store for mudhost
///
/// Provides:
/// - Prioritised layers (command line, library file, defaults)
/// - TOML loading with nested tables flattened to dotted keys
/// - Typed accessors with defaults

#pragma once

#include "fwd.hpp"

#include <mudhost/core/error.hpp>

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace mudhost_engine {

/// A single configuration value
using ConfigValue = std::variant<bool, std::int64_t, double, std::string>;

/// Render a value for log output
[[nodiscard]] std::string to_string(const ConfigValue& value);

// =============================================================================
// Config Layer
// =============================================================================

/// Configuration layer priority (lower = higher priority)
enum class ConfigLayerPriority : std::int32_t {
    CommandLine = -1000,    ///< Values given on the command line (highest)
    Library = 0,            ///< The library's config.toml
    Default = 1000,         ///< Built-in defaults (lowest)
};

/// A named set of key/value pairs
class ConfigLayer {
public:
    explicit ConfigLayer(const std::string& name, ConfigLayerPriority priority = ConfigLayerPriority::Library)
        : m_name(name), m_priority(priority) {}

    [[nodiscard]] const std::string& name() const { return m_name; }
    [[nodiscard]] ConfigLayerPriority priority() const { return m_priority; }

    [[nodiscard]] bool contains(const std::string& key) const;
    [[nodiscard]] std::optional<ConfigValue> get(const std::string& key) const;
    void set(const std::string& key, ConfigValue value);
    bool remove(const std::string& key);
    void clear() { m_values.clear(); }

    [[nodiscard]] std::vector<std::string> keys() const;
    [[nodiscard]] std::size_t size() const { return m_values.size(); }
    [[nodiscard]] bool empty() const { return m_values.empty(); }

private:
    std::string m_name;
    ConfigLayerPriority m_priority;
    std::map<std::string, ConfigValue> m_values;
};

// =============================================================================
// Config Store
// =============================================================================

/// Layered configuration store. A lookup returns the value of the highest
/// priority layer holding the key.
class ConfigStore {
public:
    /// Layer names created by create_default_layers()
    static constexpr const char* COMMAND_LINE_LAYER = "command_line";
    static constexpr const char* LIBRARY_LAYER = "library";
    static constexpr const char* DEFAULT_LAYER = "defaults";

    ConfigStore() = default;

    ConfigStore(const ConfigStore&) = delete;
    ConfigStore& operator=(const ConfigStore&) = delete;

    // =========================================================================
    // Layer Management
    // =========================================================================

    void add_layer(std::unique_ptr<ConfigLayer> layer);

    [[nodiscard]] ConfigLayer* get_layer(const std::string& name);
    [[nodiscard]] const ConfigLayer* get_layer(const std::string& name) const;

    bool remove_layer(const std::string& name);

    [[nodiscard]] std::size_t layer_count() const { return m_layers.size(); }

    /// Create the command_line, library and defaults layers (idempotent)
    void create_default_layers();

    // =========================================================================
    // Value Access (Merged View)
    // =========================================================================

    [[nodiscard]] bool contains(const std::string& key) const;

    [[nodiscard]] std::optional<ConfigValue> get(const std::string& key) const;

    [[nodiscard]] bool get_bool(const std::string& key, bool default_value = false) const;
    [[nodiscard]] std::int64_t get_int(const std::string& key, std::int64_t default_value = 0) const;
    [[nodiscard]] std::string get_string(const std::string& key, const std::string& default_value = "") const;

    /// Set a value, creating the layer if it does not exist yet
    void set(const std::string& key, ConfigValue value, const std::string& layer_name = LIBRARY_LAYER);

    // =========================================================================
    // File Operations
    // =========================================================================

    /// Load a TOML file into a layer. Nested tables become dotted keys.
    [[nodiscard]] mudhost_core::Result<void> load_toml(const std::filesystem::path& path,
                                                      const std::string& layer_name = LIBRARY_LAYER);

    /// Load TOML text into a layer
    [[nodiscard]] mudhost_core::Result<void> load_toml_string(const std::string& content,
                                                             const std::string& source_name,
                                                             const std::string& layer_name = LIBRARY_LAYER);

private:
    [[nodiscard]] std::vector<const ConfigLayer*> sorted_layers() const;

    ConfigLayer& layer_or_create(const std::string& name);

    std::vector<std::unique_ptr<ConfigLayer>> m_layers;
};

} // namespace mudhost_engine
