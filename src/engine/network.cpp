/// @file network.cpp
/// @brief Listening socket implementation

#include <mudhost/engine/network.hpp>
#include <mudhost/engine/config.hpp>
#include <mudhost/engine/event_loop.hpp>
#include <mudhost/core/log.hpp>

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <cstring>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace mudhost_engine {

// =============================================================================
// ListenAddress
// =============================================================================

mudhost_core::Result<ListenAddress> ListenAddress::parse(const std::string& text) {
    using mudhost_core::Error;
    using mudhost_core::ErrorCode;

    ListenAddress address;
    std::string port_text;

    if (!text.empty() && text.front() == '[') {
        auto close = text.find(']');
        if (close == std::string::npos || close + 1 >= text.size() || text[close + 1] != ':') {
            return Error(ErrorCode::InvalidArgument, "Malformed address: " + text);
        }
        address.host = text.substr(1, close - 1);
        port_text = text.substr(close + 2);
    } else {
        auto colon = text.rfind(':');
        if (colon == std::string::npos) {
            port_text = text;
        } else {
            address.host = text.substr(0, colon);
            port_text = text.substr(colon + 1);
        }
    }

    unsigned int port = 0;
    auto [ptr, ec] = std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
    if (port_text.empty() || ec != std::errc{} || ptr != port_text.data() + port_text.size() || port > 65535) {
        return Error(ErrorCode::InvalidArgument, "Invalid port in address: " + text);
    }
    address.port = static_cast<std::uint16_t>(port);

    return address;
}

std::string ListenAddress::to_string() const {
    std::string shown = host.empty() ? "*" : host;
    if (shown.find(':') != std::string::npos) {
        shown = "[" + shown + "]";
    }
    return shown + ":" + std::to_string(port);
}

// =============================================================================
// Listener
// =============================================================================

Listener::Listener(std::string name, int fd, ListenAddress address, std::uint16_t bound_port)
    : m_name(std::move(name)), m_fd(fd), m_address(std::move(address)), m_bound_port(bound_port) {}

Listener::~Listener() {
    if (m_fd >= 0) {
        ::close(m_fd);
    }
}

mudhost_core::Result<std::unique_ptr<Listener>> Listener::open(
    const std::string& name, const ListenAddress& address, int backlog)
{
    using mudhost_core::BootError;

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE | AI_NUMERICSERV;

    addrinfo* results = nullptr;
    std::string port = std::to_string(address.port);
    int rc = ::getaddrinfo(address.host.empty() ? nullptr : address.host.c_str(), port.c_str(), &hints, &results);
    if (rc != 0) {
        return mudhost_core::Err<std::unique_ptr<Listener>>(
            BootError::network_failed(address.to_string(), ::gai_strerror(rc)));
    }

    std::string last_error = "no usable address";
    int fd = -1;

    for (addrinfo* ai = results; ai != nullptr; ai = ai->ai_next) {
        fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) {
            last_error = std::strerror(errno);
            continue;
        }

        int one = 1;
        ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

        if (::bind(fd, ai->ai_addr, ai->ai_addrlen) == 0 && ::listen(fd, backlog) == 0) {
            break;
        }

        last_error = std::strerror(errno);
        ::close(fd);
        fd = -1;
    }
    ::freeaddrinfo(results);

    if (fd < 0) {
        return mudhost_core::Err<std::unique_ptr<Listener>>(
            BootError::network_failed(address.to_string(), last_error));
    }

    sockaddr_storage bound{};
    socklen_t len = sizeof(bound);
    std::uint16_t bound_port = address.port;
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
        if (bound.ss_family == AF_INET) {
            bound_port = ntohs(reinterpret_cast<sockaddr_in*>(&bound)->sin_port);
        } else if (bound.ss_family == AF_INET6) {
            bound_port = ntohs(reinterpret_cast<sockaddr_in6*>(&bound)->sin6_port);
        }
    }

    return std::unique_ptr<Listener>(new Listener(name, fd, address, bound_port));
}

// =============================================================================
// NetworkService
// =============================================================================

namespace {

std::string describe_peer(const sockaddr_storage& addr) {
    char host[INET6_ADDRSTRLEN] = {0};
    std::uint16_t port = 0;
    if (addr.ss_family == AF_INET) {
        const auto* in = reinterpret_cast<const sockaddr_in*>(&addr);
        ::inet_ntop(AF_INET, &in->sin_addr, host, sizeof(host));
        port = ntohs(in->sin_port);
        return std::string(host) + ":" + std::to_string(port);
    }
    if (addr.ss_family == AF_INET6) {
        const auto* in6 = reinterpret_cast<const sockaddr_in6*>(&addr);
        ::inet_ntop(AF_INET6, &in6->sin6_addr, host, sizeof(host));
        port = ntohs(in6->sin6_port);
        return "[" + std::string(host) + "]:" + std::to_string(port);
    }
    return "unknown";
}

void close_connection(int fd, const std::string& peer, const std::string& listener) {
    mudhost_core::network_logger()->info("No {} handler installed; closing connection from {}", listener, peer);
    ::close(fd);
}

} // anonymous namespace

NetworkService::NetworkService(EventLoop& loop, const ConfigStore& config)
    : m_loop(loop), m_config(config) {
}

NetworkService::~NetworkService() {
    close_all();
}

mudhost_core::Result<void> NetworkService::initialize(
    const std::optional<std::string>& bind_address,
    const std::optional<std::string>& http_address)
{
    if (m_initialized) {
        return mudhost_core::Err(mudhost_core::BootError::invalid_state("network already initialized"));
    }

    std::string telnet = bind_address.value_or(m_config.get_string("network.bind", DEFAULT_BIND));
    auto result = open_listener("telnet", telnet);
    if (!result) {
        close_all();
        return result;
    }

    std::string http = http_address.value_or(m_config.get_string("network.http", ""));
    if (!http.empty()) {
        result = open_listener("http", http);
        if (!result) {
            close_all();
            return result;
        }
    }

    m_initialized = true;
    return mudhost_core::Ok();
}

void NetworkService::set_connection_handler(const std::string& listener, ConnectionHandler handler) {
    for (auto& [name, existing] : m_handlers) {
        if (name == listener) {
            existing = std::move(handler);
            return;
        }
    }
    m_handlers.emplace_back(listener, std::move(handler));
}

const Listener* NetworkService::listener(const std::string& name) const {
    for (const auto& l : m_listeners) {
        if (l->name() == name) {
            return l.get();
        }
    }
    return nullptr;
}

void NetworkService::close_all() {
    for (const auto& [name, timer] : m_paused) {
        m_loop.cancel(timer);
    }
    m_paused.clear();

    for (const auto& l : m_listeners) {
        m_loop.remove_reader(l->fd());
    }
    m_listeners.clear();
    m_initialized = false;
}

mudhost_core::Result<void> NetworkService::open_listener(const std::string& name, const std::string& address) {
    auto parsed = ListenAddress::parse(address);
    if (!parsed) {
        mudhost_core::network_logger()->error("Invalid {} address '{}': {}", name, address, parsed.error().message());
        return mudhost_core::Err(mudhost_core::BootError::network_failed(address, parsed.error().message()));
    }

    auto opened = Listener::open(name, *parsed);
    if (!opened) {
        mudhost_core::network_logger()->error("{}", opened.error().message());
        return mudhost_core::Err(opened.error());
    }

    auto& listener = *opened;
    mudhost_core::network_logger()->info("Listening for {} connections on {} (port {})",
                                         name, listener->address().to_string(), listener->bound_port());

    m_loop.add_reader(listener->fd(), [this, name](int fd) { accept_ready(name, fd); });
    m_listeners.push_back(std::move(listener));
    return mudhost_core::Ok();
}

void NetworkService::accept_ready(const std::string& name, int fd) {
    // Drain the backlog; the socket is non-blocking
    while (true) {
        sockaddr_storage peer{};
        socklen_t len = sizeof(peer);
        int client = ::accept4(fd, reinterpret_cast<sockaddr*>(&peer), &len, SOCK_NONBLOCK | SOCK_CLOEXEC);
        if (client < 0) {
            int err = errno;
            if (err == EMFILE || err == ENFILE) {
                // The pending connection keeps the socket readable
                pause_listener(name, fd);
            } else if (err != EAGAIN && err != EWOULDBLOCK && err != EINTR) {
                mudhost_core::network_logger()->warn("accept on {} listener failed: {}", name, std::strerror(err));
            }
            return;
        }

        std::string peer_text = describe_peer(peer);
        mudhost_core::network_logger()->debug("Accepted {} connection from {}", name, peer_text);

        auto it = std::find_if(m_handlers.begin(), m_handlers.end(),
                               [&name](const auto& h) { return h.first == name; });
        if (it != m_handlers.end() && it->second) {
            it->second(client, peer_text, name);
        } else {
            close_connection(client, peer_text, name);
        }
    }
}

void NetworkService::pause_listener(const std::string& name, int fd) {
    mudhost_core::network_logger()->warn("Out of file descriptors; pausing the {} listener for {}ms",
                                         name, m_accept_backoff.count());

    m_loop.remove_reader(fd);
    m_paused[name] = m_loop.call_later(m_accept_backoff, [this, name]() {
        m_paused.erase(name);
        const Listener* resumed = listener(name);
        if (!resumed) {
            return;
        }
        mudhost_core::network_logger()->info("Resuming the {} listener", name);
        m_loop.add_reader(resumed->fd(), [this, name](int ready) { accept_ready(name, ready); });
    });
}

} // namespace mudhost_engine
