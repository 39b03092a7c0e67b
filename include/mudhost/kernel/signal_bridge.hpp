/// @file signal_bridge.hpp
/// @brief Turns process signals into a single control event
///
/// SIGHUP requests a copyover; SIGINT and SIGTERM interrupt the server.
/// The handler only writes a lock-free slot. The first event to arrive is
/// kept and every later one is ignored.

#pragma once

#include "fwd.hpp"
#include "types.hpp"

#include <mudhost/core/error.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>

namespace mudhost_kernel {

/// Write-once control event slot fed by signal handlers
class SignalBridge {
public:
    SignalBridge();
    ~SignalBridge();

    SignalBridge(const SignalBridge&) = delete;
    SignalBridge& operator=(const SignalBridge&) = delete;

    /// Install the handlers. Only one bridge may be registered at a time.
    [[nodiscard]] mudhost_core::Result<void> register_handlers();

    /// Restore the previous handlers (done by the destructor too)
    void unregister_handlers();

    /// True between register_handlers() and unregister_handlers()
    [[nodiscard]] bool is_registered() const { return m_registered; }

    /// Event currently held, if any
    [[nodiscard]] std::optional<ControlEvent> pending() const;

    /// Consume the held event. Later calls return nullopt.
    [[nodiscard]] std::optional<ControlEvent> take();

    /// Offer an event from ordinary code. Returns true if it was stored.
    bool notify(ControlEvent event);

    /// Map a signal number to its event
    [[nodiscard]] static std::optional<ControlEvent> event_for_signal(int signo);

private:
    static constexpr std::uint8_t EMPTY = 0;
    static constexpr std::uint8_t TAKEN = 0xFF;

    static void handle_signal(int signo);

    bool offer(ControlEvent event);

    std::atomic<std::uint8_t> m_slot{EMPTY};
    bool m_registered = false;

    struct PlatformData;
    std::unique_ptr<PlatformData> m_platform;

    static SignalBridge* s_active;
};

} // namespace mudhost_kernel
