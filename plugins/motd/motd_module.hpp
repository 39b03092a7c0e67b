/// @file motd_module.hpp
/// @brief motd module - message of the day
///
/// Sends the message of the day to every telnet connection, repeats it in
/// the server log on an interval and says goodbye from a shutdown hook.
///
/// Configuration:
/// - motd.text: message (default "Welcome.")
/// - motd.interval: seconds between log reminders, 0 disables (default 300)

#pragma once

#include <mudhost/kernel/module.hpp>
#include <mudhost/engine/event_loop.hpp>

#include <memory>
#include <string>

namespace mudhost_engine {
class HookRegistry;
class NetworkService;
}

namespace motd {

class MotdModule : public mudhost_kernel::IModule {
public:
    static constexpr const char* HOOK_NAME = "motd.goodbye";

    MotdModule() = default;
    ~MotdModule() override = default;

    [[nodiscard]] mudhost_core::Result<void> initialize(mudhost_kernel::ModuleContext& context) override;
    void shutdown() override;

    [[nodiscard]] const std::string& text() const { return m_text; }

private:
    void greet(int fd, const std::string& peer) const;

    std::string m_text = "Welcome.";
    std::shared_ptr<spdlog::logger> m_log;
    mudhost_engine::HookRegistry* m_hooks = nullptr;
    mudhost_engine::EventLoop* m_loop = nullptr;
    mudhost_engine::NetworkService* m_network = nullptr;
    mudhost_engine::TimerId m_timer;
};

} // namespace motd
