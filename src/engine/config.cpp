/// @file config.cpp
/// @brief Configuration store implementation for mudhost

#include <mudhost/engine/config.hpp>
#include <mudhost/core/log.hpp>

#include <toml++/toml.hpp>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace mudhost_engine {

std::string to_string(const ConfigValue& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else {
            return std::to_string(v);
        }
    }, value);
}

// =============================================================================
// ConfigLayer
// =============================================================================

bool ConfigLayer::contains(const std::string& key) const {
    return m_values.find(key) != m_values.end();
}

std::optional<ConfigValue> ConfigLayer::get(const std::string& key) const {
    auto it = m_values.find(key);
    if (it != m_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

void ConfigLayer::set(const std::string& key, ConfigValue value) {
    m_values[key] = std::move(value);
}

bool ConfigLayer::remove(const std::string& key) {
    return m_values.erase(key) > 0;
}

std::vector<std::string> ConfigLayer::keys() const {
    std::vector<std::string> result;
    result.reserve(m_values.size());
    for (const auto& [key, _] : m_values) {
        result.push_back(key);
    }
    return result;
}

// =============================================================================
// ConfigStore
// =============================================================================

void ConfigStore::add_layer(std::unique_ptr<ConfigLayer> layer) {
    m_layers.push_back(std::move(layer));
}

ConfigLayer* ConfigStore::get_layer(const std::string& name) {
    for (auto& layer : m_layers) {
        if (layer->name() == name) {
            return layer.get();
        }
    }
    return nullptr;
}

const ConfigLayer* ConfigStore::get_layer(const std::string& name) const {
    for (const auto& layer : m_layers) {
        if (layer->name() == name) {
            return layer.get();
        }
    }
    return nullptr;
}

bool ConfigStore::remove_layer(const std::string& name) {
    auto it = std::remove_if(m_layers.begin(), m_layers.end(),
        [&name](const std::unique_ptr<ConfigLayer>& layer) {
            return layer->name() == name;
        });
    if (it != m_layers.end()) {
        m_layers.erase(it, m_layers.end());
        return true;
    }
    return false;
}

void ConfigStore::create_default_layers() {
    if (!get_layer(COMMAND_LINE_LAYER)) {
        add_layer(std::make_unique<ConfigLayer>(COMMAND_LINE_LAYER, ConfigLayerPriority::CommandLine));
    }
    if (!get_layer(LIBRARY_LAYER)) {
        add_layer(std::make_unique<ConfigLayer>(LIBRARY_LAYER, ConfigLayerPriority::Library));
    }
    if (!get_layer(DEFAULT_LAYER)) {
        add_layer(std::make_unique<ConfigLayer>(DEFAULT_LAYER, ConfigLayerPriority::Default));
    }
}

bool ConfigStore::contains(const std::string& key) const {
    for (const auto& layer : m_layers) {
        if (layer->contains(key)) {
            return true;
        }
    }
    return false;
}

std::optional<ConfigValue> ConfigStore::get(const std::string& key) const {
    for (const auto* layer : sorted_layers()) {
        auto value = layer->get(key);
        if (value) {
            return value;
        }
    }
    return std::nullopt;
}

bool ConfigStore::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) return default_value;
    if (auto* v = std::get_if<bool>(&*value)) return *v;
    if (auto* v = std::get_if<std::int64_t>(&*value)) return *v != 0;
    if (auto* v = std::get_if<std::string>(&*value)) {
        return *v == "true" || *v == "yes" || *v == "on" || *v == "1";
    }
    return default_value;
}

std::int64_t ConfigStore::get_int(const std::string& key, std::int64_t default_value) const {
    auto value = get(key);
    if (!value) return default_value;
    if (auto* v = std::get_if<std::int64_t>(&*value)) return *v;
    if (auto* v = std::get_if<double>(&*value)) return static_cast<std::int64_t>(*v);
    return default_value;
}

std::string ConfigStore::get_string(const std::string& key, const std::string& default_value) const {
    auto value = get(key);
    if (!value) return default_value;
    if (auto* v = std::get_if<std::string>(&*value)) return *v;
    return to_string(*value);
}

void ConfigStore::set(const std::string& key, ConfigValue value, const std::string& layer_name) {
    layer_or_create(layer_name).set(key, std::move(value));
}

std::vector<const ConfigLayer*> ConfigStore::sorted_layers() const {
    std::vector<const ConfigLayer*> layers;
    layers.reserve(m_layers.size());
    for (const auto& layer : m_layers) {
        layers.push_back(layer.get());
    }
    std::stable_sort(layers.begin(), layers.end(),
        [](const ConfigLayer* a, const ConfigLayer* b) {
            return static_cast<std::int32_t>(a->priority()) < static_cast<std::int32_t>(b->priority());
        });
    return layers;
}

ConfigLayer& ConfigStore::layer_or_create(const std::string& name) {
    if (auto* layer = get_layer(name)) {
        return *layer;
    }
    auto priority = ConfigLayerPriority::Library;
    if (name == COMMAND_LINE_LAYER) priority = ConfigLayerPriority::CommandLine;
    if (name == DEFAULT_LAYER) priority = ConfigLayerPriority::Default;
    add_layer(std::make_unique<ConfigLayer>(name, priority));
    return *m_layers.back();
}

// =============================================================================
// TOML Loading
// =============================================================================

namespace {

void flatten_table(const toml::table& tbl, const std::string& prefix, ConfigLayer& layer) {
    for (auto&& [key, node] : tbl) {
        std::string full_key = prefix.empty() ? std::string(key.str()) : prefix + "." + std::string(key.str());

        if (const auto* sub = node.as_table()) {
            flatten_table(*sub, full_key, layer);
        } else if (auto v = node.value_exact<bool>()) {
            layer.set(full_key, *v);
        } else if (auto v = node.value_exact<std::int64_t>()) {
            layer.set(full_key, *v);
        } else if (auto v = node.value_exact<double>()) {
            layer.set(full_key, *v);
        } else if (auto v = node.value_exact<std::string>()) {
            layer.set(full_key, *v);
        } else {
            mudhost_core::engine_logger()->debug("Ignoring configuration key '{}' of unsupported type", full_key);
        }
    }
}

} // anonymous namespace

mudhost_core::Result<void> ConfigStore::load_toml(const std::filesystem::path& path,
                                                  const std::string& layer_name) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return mudhost_core::Err(mudhost_core::BootError::config_invalid(path.string(), "cannot open file"));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    return load_toml_string(buffer.str(), path.string(), layer_name);
}

mudhost_core::Result<void> ConfigStore::load_toml_string(const std::string& content,
                                                         const std::string& source_name,
                                                         const std::string& layer_name) {
    toml::table tbl;
    try {
        tbl = toml::parse(content, source_name);
    } catch (const toml::parse_error& err) {
        return mudhost_core::Err(mudhost_core::BootError::config_invalid(source_name, std::string(err.description())));
    }

    auto& layer = layer_or_create(layer_name);
    flatten_table(tbl, {}, layer);

    mudhost_core::engine_logger()->debug("Loaded {} configuration values from {}", layer.size(), source_name);
    return mudhost_core::Ok();
}

} // namespace mudhost_engine
