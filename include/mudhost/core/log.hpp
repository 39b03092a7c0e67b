#pragma once

/// @file log.hpp
/// @brief Logging utilities for mudhost

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>
#include <string>
#include <memory>
#include <optional>
#include <chrono>

// =============================================================================
// Logging Macros
// =============================================================================

#define MUDHOST_LOG_TRACE(...) ::mudhost_core::core_logger()->trace(__VA_ARGS__)
#define MUDHOST_LOG_DEBUG(...) ::mudhost_core::core_logger()->debug(__VA_ARGS__)
#define MUDHOST_LOG_INFO(...) ::mudhost_core::core_logger()->info(__VA_ARGS__)
#define MUDHOST_LOG_WARN(...) ::mudhost_core::core_logger()->warn(__VA_ARGS__)
#define MUDHOST_LOG_ERROR(...) ::mudhost_core::core_logger()->error(__VA_ARGS__)
#define MUDHOST_LOG_CRITICAL(...) ::mudhost_core::core_logger()->critical(__VA_ARGS__)

namespace mudhost_core {

// =============================================================================
// Log Configuration
// =============================================================================

/// Configuration for the logging system
struct LogConfig {
    bool console_enabled = true;
    bool console_color = true;
    bool file_enabled = false;
    std::string log_directory;
    std::string file_name = "server.log";
    std::size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    std::size_t max_files = 5;
    spdlog::level::level_enum level = spdlog::level::info;
};

/// Configure logging system. Existing loggers are rebuilt on the new sinks.
/// Returns false when the file sink could not be opened (console still works).
bool configure_logging(const LogConfig& config);

/// Attach an extra sink to every current and future logger
void add_log_sink(spdlog::sink_ptr sink);

/// Detach a sink previously added with add_log_sink
void remove_log_sink(const spdlog::sink_ptr& sink);

// =============================================================================
// Named Loggers
// =============================================================================

/// Get or create a named logger
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

std::shared_ptr<spdlog::logger> core_logger();
std::shared_ptr<spdlog::logger> kernel_logger();
std::shared_ptr<spdlog::logger> engine_logger();
std::shared_ptr<spdlog::logger> module_logger();
std::shared_ptr<spdlog::logger> network_logger();

// =============================================================================
// Log Level Management
// =============================================================================

void set_global_log_level(spdlog::level::level_enum level);

[[nodiscard]] spdlog::level::level_enum get_global_log_level();

/// Parse log level from string (case-insensitive)
[[nodiscard]] std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

[[nodiscard]] const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Log Scoping (RAII)
// =============================================================================

/// RAII log scope for phase tracing
class LogScope {
public:
    LogScope(const std::string& name, std::shared_ptr<spdlog::logger> logger);
    ~LogScope();

    LogScope(const LogScope&) = delete;
    LogScope& operator=(const LogScope&) = delete;
    LogScope(LogScope&&) = delete;
    LogScope& operator=(LogScope&&) = delete;

private:
    std::string m_name;
    std::shared_ptr<spdlog::logger> m_logger;
    std::chrono::steady_clock::time_point m_start;
};

// =============================================================================
// Lifecycle
// =============================================================================

/// Flush all loggers
void flush_all_loggers();

/// Flush and close all loggers. Must be the last logging call of the process.
void shutdown_logging();

} // namespace mudhost_core
