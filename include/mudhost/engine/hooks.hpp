/// @file hooks.hpp
/// @brief Named hook registry for mudhost
///
/// Hooks are zero-argument callbacks grouped by event name ("shutdown",
/// and whatever modules define). Running an event calls its hooks in
/// priority order, then registration order.

#pragma once

#include "fwd.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace mudhost_engine {

/// Priority for hooks (lower = earlier)
enum class HookPriority : std::int32_t {
    System = -100,       ///< Core hooks
    Default = 0,         ///< Normal hooks
    Late = 100,          ///< Late hooks
};

/// Hook callback signature
using HookCallback = std::function<void()>;

/// Well-known event names
inline constexpr const char* SHUTDOWN_EVENT = "shutdown";

/// Ordered collections of named callbacks, keyed by event name
class HookRegistry {
public:
    HookRegistry() = default;

    HookRegistry(const HookRegistry&) = delete;
    HookRegistry& operator=(const HookRegistry&) = delete;

    /// Register a hook. A hook with the same name on the same event is replaced.
    void add(const std::string& event, const std::string& name, HookCallback callback,
             HookPriority priority = HookPriority::Default);

    /// Remove a hook by name
    bool remove(const std::string& event, const std::string& name);

    [[nodiscard]] bool has(const std::string& event, const std::string& name) const;

    /// Number of hooks registered for an event
    [[nodiscard]] std::size_t count(const std::string& event) const;

    /// Run every hook of an event. A hook that throws is logged and the
    /// remaining hooks still run. Returns the number of hooks that completed.
    std::size_t run(const std::string& event);

    /// Number of times run() was called for an event
    [[nodiscard]] std::uint32_t run_count(const std::string& event) const;

private:
    struct Hook {
        std::string name;
        HookCallback callback;
        HookPriority priority = HookPriority::Default;
        std::uint64_t sequence = 0;
    };

    std::map<std::string, std::vector<Hook>> m_hooks;
    std::map<std::string, std::uint32_t> m_run_counts;
    std::uint64_t m_next_sequence = 0;
};

} // namespace mudhost_engine
