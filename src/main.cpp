/// @file main.cpp
/// @brief mudhost server entry point
///
/// Parses the command line, configures logging and hands the process to
/// the Supervisor.

#include <mudhost/core/log.hpp>
#include <mudhost/core/version.hpp>
#include <mudhost/engine/command_line.hpp>
#include <mudhost/engine/config.hpp>
#include <mudhost/engine/event_loop.hpp>
#include <mudhost/engine/hooks.hpp>
#include <mudhost/engine/network.hpp>
#include <mudhost/kernel/identity.hpp>
#include <mudhost/kernel/module_loader.hpp>
#include <mudhost/kernel/services.hpp>
#include <mudhost/kernel/signal_bridge.hpp>
#include <mudhost/kernel/supervisor.hpp>

#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace {

mudhost_kernel::SupervisorConfig supervisor_config(const mudhost_engine::CommandLine& cli) {
    mudhost_kernel::SupervisorConfig config;
    config.library_path = cli.library_path;
    config.bind_address = cli.bind_address;
    config.http_address = cli.http_address;
    config.copyover = cli.copyover;
    config.early_identity = cli.early;

    if (cli.uid) config.identity.uid = mudhost_kernel::identity_value(*cli.uid);
    if (cli.gid) config.identity.gid = mudhost_kernel::identity_value(*cli.gid);
    // Umask text is octal, so it must not go through identity_value()
    if (cli.umask) config.identity.umask = mudhost_kernel::IdentityValue{*cli.umask};

    return config;
}

int run_server(const mudhost_engine::CommandLine& cli) {
    // Declared first so module code stays mapped until everything that may
    // hold module callbacks is gone
    mudhost_kernel::DynamicModuleImporter importer;

    mudhost_engine::ConfigStore config;
    config.create_default_layers();

    mudhost_engine::EventLoop loop;
    mudhost_engine::NetworkService network(loop, config);
    mudhost_engine::HookRegistry hooks;
    mudhost_kernel::PosixIdentitySystem identity;
    mudhost_kernel::SignalBridge signals;
    mudhost_kernel::ServiceRegistry services;

    // Concrete services for modules that need more than the core contracts
    services.provide("event_loop", loop);
    services.provide("listeners", network);

    mudhost_kernel::Supervisor supervisor(
        supervisor_config(cli),
        mudhost_kernel::SupervisorDeps{config, network, loop, hooks, identity, importer, signals, services});

    int status = supervisor.run();

    importer.shutdown_all();
    network.close_all();
    return status;
}

} // anonymous namespace

int main(int argc, char** argv) {
    auto parsed = mudhost_engine::parse_command_line(argc, argv);
    if (!parsed) {
        std::cerr << "Error: " << parsed.error().message() << "\n\n";
        mudhost_engine::print_usage(std::cerr, argv[0]);
        return 1;
    }
    const auto& cli = *parsed;

    if (cli.show_help) {
        mudhost_engine::print_usage(std::cout, argv[0]);
        return 0;
    }
    if (cli.show_version) {
        mudhost_engine::print_version(std::cout);
        return 0;
    }

    fs::path log_dir = cli.log_path.is_absolute() ? cli.log_path : cli.library_path / cli.log_path;

    mudhost_core::LogConfig log_config;
    log_config.console_color = cli.color;
    log_config.file_enabled = true;
    log_config.log_directory = log_dir.lexically_normal().string();
    log_config.level = mudhost_core::parse_log_level(cli.log_level).value_or(spdlog::level::info);

    if (!mudhost_core::configure_logging(log_config)) {
        MUDHOST_LOG_WARN("Unable to write log files to {}; logging to the console only.",
                         log_config.log_directory);
    }

    MUDHOST_LOG_INFO("mudhost {} starting.", mudhost_core::server_version().to_string());

    int status = run_server(cli);

    mudhost_core::shutdown_logging();
    return status;
}
