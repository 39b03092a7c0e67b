/// @file network.hpp
/// @brief Listening sockets for the telnet and HTTP front doors
///
/// Only binding and accepting live here. What is spoken over an accepted
/// connection belongs to whichever handler a module installs.

#pragma once

#include "fwd.hpp"
#include "event_loop.hpp"

#include <mudhost/core/error.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mudhost_engine {

class ConfigStore;

// =============================================================================
// Listen Address
// =============================================================================

/// Parsed "ADDRESS:PORT" value
struct ListenAddress {
    std::string host;           ///< Empty means all interfaces
    std::uint16_t port = 0;

    /// Parse "host:port", "[v6]:port", ":port" or "port"
    [[nodiscard]] static mudhost_core::Result<ListenAddress> parse(const std::string& text);

    [[nodiscard]] std::string to_string() const;
};

// =============================================================================
// Listener
// =============================================================================

/// A bound, listening, non-blocking TCP socket (closed on destruction)
class Listener {
public:
    ~Listener();

    Listener(const Listener&) = delete;
    Listener& operator=(const Listener&) = delete;

    [[nodiscard]] static mudhost_core::Result<std::unique_ptr<Listener>> open(
        const std::string& name, const ListenAddress& address, int backlog = 64);

    [[nodiscard]] const std::string& name() const { return m_name; }
    [[nodiscard]] int fd() const { return m_fd; }
    [[nodiscard]] const ListenAddress& address() const { return m_address; }

    /// Port actually bound (differs from address().port when that was 0)
    [[nodiscard]] std::uint16_t bound_port() const { return m_bound_port; }

private:
    Listener(std::string name, int fd, ListenAddress address, std::uint16_t bound_port);

    std::string m_name;
    int m_fd = -1;
    ListenAddress m_address;
    std::uint16_t m_bound_port = 0;
};

// =============================================================================
// Network Service
// =============================================================================

/// Called for every accepted connection. The handler owns the fd.
using ConnectionHandler = std::function<void(int fd, const std::string& peer, const std::string& listener)>;

/// Network initialisation contract used during startup
class INetwork {
public:
    virtual ~INetwork() = default;

    /// Bind the front doors. Absent addresses fall back to configuration.
    [[nodiscard]] virtual mudhost_core::Result<void> initialize(
        const std::optional<std::string>& bind_address,
        const std::optional<std::string>& http_address) = 0;
};

/// Owns the telnet and HTTP listeners and feeds accepted connections to
/// the installed handler from the event loop
class NetworkService final : public INetwork {
public:
    static constexpr const char* DEFAULT_BIND = "0.0.0.0:4000";

    /// How long a listener stops accepting after the process runs out of
    /// file descriptors
    static constexpr std::chrono::milliseconds DEFAULT_ACCEPT_BACKOFF{1000};

    NetworkService(EventLoop& loop, const ConfigStore& config);
    ~NetworkService() override;

    NetworkService(const NetworkService&) = delete;
    NetworkService& operator=(const NetworkService&) = delete;

    [[nodiscard]] mudhost_core::Result<void> initialize(
        const std::optional<std::string>& bind_address,
        const std::optional<std::string>& http_address) override;

    /// Replace the handler for one listener ("telnet" or "http")
    void set_connection_handler(const std::string& listener, ConnectionHandler handler);

    [[nodiscard]] const Listener* listener(const std::string& name) const;

    [[nodiscard]] bool is_initialized() const { return m_initialized; }

    void set_accept_backoff(std::chrono::milliseconds delay) { m_accept_backoff = delay; }

    /// True while a listener is backing off after EMFILE or ENFILE
    [[nodiscard]] bool is_paused(const std::string& listener) const { return m_paused.count(listener) > 0; }

    /// Close all listeners and unregister them from the loop
    void close_all();

private:
    [[nodiscard]] mudhost_core::Result<void> open_listener(const std::string& name, const std::string& address);
    void accept_ready(const std::string& name, int fd);
    void pause_listener(const std::string& name, int fd);

    EventLoop& m_loop;
    const ConfigStore& m_config;
    std::vector<std::unique_ptr<Listener>> m_listeners;
    std::vector<std::pair<std::string, ConnectionHandler>> m_handlers;
    std::map<std::string, TimerId> m_paused;
    std::chrono::milliseconds m_accept_backoff = DEFAULT_ACCEPT_BACKOFF;
    bool m_initialized = false;
};

} // namespace mudhost_engine
