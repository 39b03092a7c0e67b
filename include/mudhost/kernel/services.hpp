/// @file services.hpp
/// @brief Named service registry handed to modules
///
/// Holds non-owning pointers to the host's collaborators under stable
/// names. Modules look services up by name and type; the registry never
/// owns what it points at.

#pragma once

#include "fwd.hpp"

#include <any>
#include <map>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <vector>

namespace mudhost_kernel {

/// Non-owning name -> service map
class ServiceRegistry {
public:
    ServiceRegistry() = default;

    ServiceRegistry(const ServiceRegistry&) = delete;
    ServiceRegistry& operator=(const ServiceRegistry&) = delete;

    /// Register (or replace) a service under a name
    template<typename T>
    void provide(const std::string& name, T& service) {
        m_services[name] = Entry{std::any(&service), std::type_index(typeid(T))};
    }

    /// Register another name for an existing service.
    /// Returns false if the target is not registered.
    bool alias(const std::string& name, const std::string& target) {
        auto it = m_services.find(target);
        if (it == m_services.end()) {
            return false;
        }
        Entry copy = it->second;
        m_services[name] = std::move(copy);
        return true;
    }

    /// Look up a service. Returns nullptr if missing or of another type.
    template<typename T>
    [[nodiscard]] T* get(const std::string& name) const {
        auto it = m_services.find(name);
        if (it == m_services.end()) {
            return nullptr;
        }
        if (const auto* ptr = std::any_cast<T*>(&it->second.service)) {
            return *ptr;
        }
        return nullptr;
    }

    [[nodiscard]] bool has(const std::string& name) const {
        return m_services.count(name) > 0;
    }

    /// Type registered under a name (typeid(void) if missing)
    [[nodiscard]] std::type_index type_of(const std::string& name) const {
        auto it = m_services.find(name);
        return it != m_services.end() ? it->second.type : std::type_index(typeid(void));
    }

    bool remove(const std::string& name) {
        return m_services.erase(name) > 0;
    }

    [[nodiscard]] std::vector<std::string> names() const {
        std::vector<std::string> result;
        result.reserve(m_services.size());
        for (const auto& [name, _] : m_services) {
            result.push_back(name);
        }
        return result;
    }

    [[nodiscard]] std::size_t size() const { return m_services.size(); }

    void clear() { m_services.clear(); }

private:
    struct Entry {
        std::any service;
        std::type_index type = std::type_index(typeid(void));
    };

    std::map<std::string, Entry> m_services;
};

} // namespace mudhost_kernel
