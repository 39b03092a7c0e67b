/// @file command_line.hpp
/// @brief Command-line options for the mudhost server

#pragma once

#include "fwd.hpp"

#include <mudhost/core/error.hpp>

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace mudhost_engine {

/// Parsed command line
struct CommandLine {
    // Basic
    std::filesystem::path library_path = "lib";
    std::optional<std::string> copyover;

    // Network
    std::optional<std::string> bind_address;
    std::optional<std::string> http_address;

    // Logging
    std::filesystem::path log_path = "../log";  ///< Relative to the library root
    std::string log_level = "info";
    bool color = true;

    // Identity
    std::optional<std::string> uid;
    std::optional<std::string> gid;
    std::optional<std::string> umask;
    bool early = false;

    bool show_help = false;
    bool show_version = false;
};

/// Parse arguments (argv[0] is skipped). Accepts "--opt value" and "--opt=value".
[[nodiscard]] mudhost_core::Result<CommandLine> parse_command_line(int argc, const char* const* argv);

[[nodiscard]] mudhost_core::Result<CommandLine> parse_command_line(const std::vector<std::string>& args);

void print_usage(std::ostream& out, const std::string& program_name);

void print_version(std::ostream& out);

} // namespace mudhost_engine
