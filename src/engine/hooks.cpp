/// @file hooks.cpp
/// @brief Hook registry implementation for mudhost

#include <mudhost/engine/hooks.hpp>
#include <mudhost/core/log.hpp>

#include <algorithm>
#include <exception>

namespace mudhost_engine {

void HookRegistry::add(const std::string& event, const std::string& name, HookCallback callback,
                       HookPriority priority) {
    auto& hooks = m_hooks[event];
    hooks.erase(std::remove_if(hooks.begin(), hooks.end(),
                    [&name](const Hook& h) { return h.name == name; }),
                hooks.end());

    Hook hook{name, std::move(callback), priority, m_next_sequence++};

    auto pos = std::upper_bound(hooks.begin(), hooks.end(), hook,
        [](const Hook& a, const Hook& b) {
            return static_cast<std::int32_t>(a.priority) < static_cast<std::int32_t>(b.priority);
        });
    hooks.insert(pos, std::move(hook));
}

bool HookRegistry::remove(const std::string& event, const std::string& name) {
    auto it = m_hooks.find(event);
    if (it == m_hooks.end()) {
        return false;
    }
    auto& hooks = it->second;
    auto before = hooks.size();
    hooks.erase(std::remove_if(hooks.begin(), hooks.end(),
                    [&name](const Hook& h) { return h.name == name; }),
                hooks.end());
    return hooks.size() != before;
}

bool HookRegistry::has(const std::string& event, const std::string& name) const {
    auto it = m_hooks.find(event);
    if (it == m_hooks.end()) {
        return false;
    }
    return std::any_of(it->second.begin(), it->second.end(),
                       [&name](const Hook& h) { return h.name == name; });
}

std::size_t HookRegistry::count(const std::string& event) const {
    auto it = m_hooks.find(event);
    return it != m_hooks.end() ? it->second.size() : 0;
}

std::size_t HookRegistry::run(const std::string& event) {
    m_run_counts[event]++;

    auto it = m_hooks.find(event);
    if (it == m_hooks.end()) {
        mudhost_core::engine_logger()->debug("No hooks registered for '{}'", event);
        return 0;
    }

    // Copy so a hook may add or remove hooks while running
    auto hooks = it->second;
    std::size_t completed = 0;

    for (const auto& hook : hooks) {
        mudhost_core::engine_logger()->trace("Running {} hook '{}'", event, hook.name);
        try {
            hook.callback();
            completed++;
        } catch (const std::exception& e) {
            mudhost_core::engine_logger()->error("Hook '{}' for '{}' failed: {}", hook.name, event, e.what());
        }
    }

    return completed;
}

std::uint32_t HookRegistry::run_count(const std::string& event) const {
    auto it = m_run_counts.find(event);
    return it != m_run_counts.end() ? it->second : 0;
}

} // namespace mudhost_engine
