/// @file log.cpp
/// @brief Logging system implementation for mudhost_core
///
/// All named loggers share one sink set: a console sink and, when a log
/// directory is configured, a rotating file sink. Reconfiguring replaces
/// the sinks of every registered logger in place, so cached logger
/// pointers stay valid.

#include <mudhost/core/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace mudhost_core {

// =============================================================================
// Logger Registry
// =============================================================================

namespace {

struct LoggerRegistry {
    std::mutex mutex;
    std::map<std::string, std::shared_ptr<spdlog::logger>> loggers;
    std::vector<spdlog::sink_ptr> base_sinks;
    std::vector<spdlog::sink_ptr> extra_sinks;
    spdlog::level::level_enum global_level = spdlog::level::info;
    bool configured = false;
};

LoggerRegistry& get_registry() {
    static LoggerRegistry registry;
    return registry;
}

spdlog::sink_ptr make_console_sink(bool color) {
    spdlog::sink_ptr sink;
    if (color) {
        sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    } else {
        sink = std::make_shared<spdlog::sinks::stdout_sink_mt>();
    }
    sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%n] %v");
    return sink;
}

/// Build the shared sink set. Sets file_ok to false if the file sink failed.
std::vector<spdlog::sink_ptr> create_sinks(const LogConfig& config, bool& file_ok) {
    std::vector<spdlog::sink_ptr> sinks;
    file_ok = true;

    if (config.console_enabled) {
        sinks.push_back(make_console_sink(config.console_color));
    }

    if (config.file_enabled && !config.log_directory.empty()) {
        try {
            std::error_code ec;
            std::filesystem::create_directories(config.log_directory, ec);
            std::filesystem::path log_path = std::filesystem::path(config.log_directory) / config.file_name;
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_path.string(),
                config.max_file_size,
                config.max_files);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
            sinks.push_back(file_sink);
        } catch (const spdlog::spdlog_ex&) {
            file_ok = false;
        }
    }

    return sinks;
}

void ensure_default_sinks(LoggerRegistry& reg) {
    if (!reg.configured) {
        reg.base_sinks.push_back(make_console_sink(true));
        reg.configured = true;
    }
}

void rebuild_sinks(LoggerRegistry& reg, spdlog::logger& logger) {
    auto& sinks = logger.sinks();
    sinks.clear();
    sinks.insert(sinks.end(), reg.base_sinks.begin(), reg.base_sinks.end());
    sinks.insert(sinks.end(), reg.extra_sinks.begin(), reg.extra_sinks.end());
}

} // anonymous namespace

// =============================================================================
// Logger Configuration
// =============================================================================

bool configure_logging(const LogConfig& config) {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    bool file_ok = true;
    reg.base_sinks = create_sinks(config, file_ok);
    reg.global_level = config.level;
    reg.configured = true;

    for (auto& [name, logger] : reg.loggers) {
        logger->flush();
        rebuild_sinks(reg, *logger);
        logger->set_level(reg.global_level);
    }

    spdlog::set_level(reg.global_level);
    return file_ok;
}

void add_log_sink(spdlog::sink_ptr sink) {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    reg.extra_sinks.push_back(sink);
    for (auto& [name, logger] : reg.loggers) {
        logger->sinks().push_back(sink);
    }
}

void remove_log_sink(const spdlog::sink_ptr& sink) {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    reg.extra_sinks.erase(std::remove(reg.extra_sinks.begin(), reg.extra_sinks.end(), sink),
                          reg.extra_sinks.end());
    for (auto& [name, logger] : reg.loggers) {
        auto& sinks = logger->sinks();
        sinks.erase(std::remove(sinks.begin(), sinks.end(), sink), sinks.end());
    }
}

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    auto it = reg.loggers.find(name);
    if (it != reg.loggers.end()) {
        return it->second;
    }

    ensure_default_sinks(reg);

    auto logger = std::make_shared<spdlog::logger>(name);
    rebuild_sinks(reg, *logger);
    logger->set_level(reg.global_level);

    reg.loggers[name] = logger;
    return logger;
}

std::shared_ptr<spdlog::logger> core_logger() {
    static std::shared_ptr<spdlog::logger> logger = get_logger("core");
    return logger;
}

std::shared_ptr<spdlog::logger> kernel_logger() {
    static std::shared_ptr<spdlog::logger> logger = get_logger("kernel");
    return logger;
}

std::shared_ptr<spdlog::logger> engine_logger() {
    static std::shared_ptr<spdlog::logger> logger = get_logger("engine");
    return logger;
}

std::shared_ptr<spdlog::logger> module_logger() {
    static std::shared_ptr<spdlog::logger> logger = get_logger("modules");
    return logger;
}

std::shared_ptr<spdlog::logger> network_logger() {
    static std::shared_ptr<spdlog::logger> logger = get_logger("network");
    return logger;
}

// =============================================================================
// Log Level Management
// =============================================================================

void set_global_log_level(spdlog::level::level_enum level) {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    reg.global_level = level;
    spdlog::set_level(level);

    for (auto& [name, logger] : reg.loggers) {
        logger->set_level(level);
    }
}

spdlog::level::level_enum get_global_log_level() {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    return reg.global_level;
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return spdlog::level::trace;
    if (lower == "debug") return spdlog::level::debug;
    if (lower == "info") return spdlog::level::info;
    if (lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "error" || lower == "err") return spdlog::level::err;
    if (lower == "critical" || lower == "fatal") return spdlog::level::critical;
    if (lower == "off") return spdlog::level::off;
    return std::nullopt;
}

const char* log_level_name(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace: return "trace";
        case spdlog::level::debug: return "debug";
        case spdlog::level::info: return "info";
        case spdlog::level::warn: return "warn";
        case spdlog::level::err: return "error";
        case spdlog::level::critical: return "critical";
        case spdlog::level::off: return "off";
        default: return "unknown";
    }
}

// =============================================================================
// Log Scoping
// =============================================================================

LogScope::LogScope(const std::string& name, std::shared_ptr<spdlog::logger> logger)
    : m_name(name)
    , m_logger(std::move(logger))
    , m_start(std::chrono::steady_clock::now())
{
    m_logger->trace(">>> Entering {}", m_name);
}

LogScope::~LogScope() {
    auto end = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - m_start);
    m_logger->trace("<<< Leaving {} ({}us)", m_name, duration.count());
}

// =============================================================================
// Logging Shutdown
// =============================================================================

void flush_all_loggers() {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    for (auto& [name, logger] : reg.loggers) {
        logger->flush();
    }
}

void shutdown_logging() {
    flush_all_loggers();

    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    // Loggers stay registered (cached pointers remain usable) but lose their sinks
    for (auto& [name, logger] : reg.loggers) {
        logger->sinks().clear();
    }
    reg.base_sinks.clear();
    reg.extra_sinks.clear();

    spdlog::shutdown();
}

} // namespace mudhost_core
