/// @file motd_module.cpp
/// @brief motd module implementation

#include "motd_module.hpp"

#include <mudhost/core/log.hpp>
#include <mudhost/engine/config.hpp>
#include <mudhost/engine/hooks.hpp>
#include <mudhost/engine/network.hpp>
#include <mudhost/kernel/services.hpp>

#include <chrono>

#include <sys/socket.h>
#include <unistd.h>

namespace motd {

mudhost_core::Result<void> MotdModule::initialize(mudhost_kernel::ModuleContext& context) {
    m_log = context.logger;

    auto* config = context.services.get<mudhost_engine::ConfigStore>("config");
    m_hooks = context.services.get<mudhost_engine::HookRegistry>("hooks");
    if (!config || !m_hooks) {
        return mudhost_core::Err("motd needs the 'config' and 'hooks' services");
    }

    m_text = config->get_string("motd.text", m_text);
    auto interval = config->get_int("motd.interval", 300);

    m_hooks->add(mudhost_engine::SHUTDOWN_EVENT, HOOK_NAME, [this]() {
        m_log->info("[motd] Goodbye.");
    });

    // Optional services
    m_loop = context.services.get<mudhost_engine::EventLoop>("event_loop");
    if (m_loop && interval > 0) {
        m_timer = m_loop->call_every(std::chrono::seconds(interval), [this]() {
            m_log->info("[motd] {}", m_text);
        });
    }

    m_network = context.services.get<mudhost_engine::NetworkService>("listeners");
    if (m_network) {
        m_network->set_connection_handler("telnet", [this](int fd, const std::string& peer, const std::string&) {
            greet(fd, peer);
        });
    }

    m_log->info("[motd] Ready ({})", context.module_path.string());
    return mudhost_core::Ok();
}

void MotdModule::shutdown() {
    if (m_network) {
        m_network->set_connection_handler("telnet", {});
    }
    if (m_loop && m_timer.is_valid()) {
        m_loop->cancel(m_timer);
    }
    if (m_hooks) {
        m_hooks->remove(mudhost_engine::SHUTDOWN_EVENT, HOOK_NAME);
    }
}

void MotdModule::greet(int fd, const std::string& peer) const {
    std::string message = m_text + "\r\n";
    if (::send(fd, message.data(), message.size(), MSG_NOSIGNAL) < 0) {
        m_log->debug("[motd] Could not greet {}", peer);
    }
    ::close(fd);
}

} // namespace motd

// =============================================================================
// Module Entry Point
// =============================================================================

MUDHOST_MODULE_ENTRY(motd::MotdModule)
