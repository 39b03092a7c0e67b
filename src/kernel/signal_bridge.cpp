/// @file signal_bridge.cpp
/// @brief Signal to control event bridge implementation

#include <mudhost/kernel/signal_bridge.hpp>
#include <mudhost/core/log.hpp>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <vector>

namespace mudhost_kernel {

static_assert(std::atomic<std::uint8_t>::is_always_lock_free, "signal slot must be lock-free");

// =============================================================================
// Platform-Specific Data
// =============================================================================

struct SignalBridge::PlatformData {
    struct Installed {
        int signo;
        struct sigaction previous;
    };
    std::vector<Installed> installed;
};

SignalBridge* SignalBridge::s_active = nullptr;

namespace {

/// Signals handled by the bridge, where the platform has them
const std::vector<int>& bridged_signals() {
    static const std::vector<int> signals = {
#ifdef SIGHUP
        SIGHUP,
#endif
#ifdef SIGINT
        SIGINT,
#endif
#ifdef SIGTERM
        SIGTERM,
#endif
    };
    return signals;
}

} // anonymous namespace

// =============================================================================
// SignalBridge Implementation
// =============================================================================

SignalBridge::SignalBridge() : m_platform(std::make_unique<PlatformData>()) {
}

SignalBridge::~SignalBridge() {
    unregister_handlers();
}

std::optional<ControlEvent> SignalBridge::event_for_signal(int signo) {
    switch (signo) {
#ifdef SIGHUP
        case SIGHUP: return ControlEvent::CopyoverRequested;
#endif
#ifdef SIGINT
        case SIGINT: return ControlEvent::Interrupted;
#endif
#ifdef SIGTERM
        case SIGTERM: return ControlEvent::Interrupted;
#endif
        default: return std::nullopt;
    }
}

mudhost_core::Result<void> SignalBridge::register_handlers() {
    if (m_registered) {
        return mudhost_core::Err(mudhost_core::Error(mudhost_core::ErrorCode::InvalidState,
                                                     "signal handlers already registered"));
    }
    if (s_active) {
        return mudhost_core::Err(mudhost_core::Error(mudhost_core::ErrorCode::InvalidState,
                                                     "another signal bridge is registered"));
    }

    s_active = this;

    struct sigaction sa = {};
    sa.sa_handler = handle_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;    // No SA_RESTART: poll() must wake up with EINTR

    for (int signo : bridged_signals()) {
        PlatformData::Installed entry{signo, {}};
        if (::sigaction(signo, &sa, &entry.previous) != 0) {
            int err = errno;
            unregister_handlers();
            s_active = nullptr;
            return mudhost_core::Err(mudhost_core::Error(mudhost_core::ErrorCode::IOError,
                "sigaction(" + std::to_string(signo) + ") failed: " + std::strerror(err)));
        }
        m_platform->installed.push_back(entry);
    }

    m_registered = true;
    mudhost_core::kernel_logger()->debug("Installed handlers for {} signal(s)", m_platform->installed.size());
    return mudhost_core::Ok();
}

void SignalBridge::unregister_handlers() {
    for (auto it = m_platform->installed.rbegin(); it != m_platform->installed.rend(); ++it) {
        ::sigaction(it->signo, &it->previous, nullptr);
    }
    m_platform->installed.clear();
    m_registered = false;

    if (s_active == this) {
        s_active = nullptr;
    }
}

std::optional<ControlEvent> SignalBridge::pending() const {
    std::uint8_t value = m_slot.load(std::memory_order_acquire);
    if (value == EMPTY || value == TAKEN) {
        return std::nullopt;
    }
    return static_cast<ControlEvent>(value);
}

std::optional<ControlEvent> SignalBridge::take() {
    std::uint8_t value = m_slot.load(std::memory_order_acquire);
    while (value != EMPTY && value != TAKEN) {
        if (m_slot.compare_exchange_weak(value, TAKEN, std::memory_order_acq_rel)) {
            return static_cast<ControlEvent>(value);
        }
    }
    return std::nullopt;
}

bool SignalBridge::notify(ControlEvent event) {
    return offer(event);
}

bool SignalBridge::offer(ControlEvent event) {
    std::uint8_t expected = EMPTY;
    return m_slot.compare_exchange_strong(expected, static_cast<std::uint8_t>(event),
                                          std::memory_order_acq_rel);
}

void SignalBridge::handle_signal(int signo) {
    // Async-signal context: touch the atomic slot only
    SignalBridge* bridge = s_active;
    if (!bridge) {
        return;
    }
    if (auto event = event_for_signal(signo)) {
        bridge->offer(*event);
    }
}

} // namespace mudhost_kernel
