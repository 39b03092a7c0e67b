/// @file command_line.cpp
/// @brief Command-line parsing for the mudhost server

#include <mudhost/engine/command_line.hpp>
#include <mudhost/core/log.hpp>
#include <mudhost/core/version.hpp>

namespace mudhost_engine {

namespace {

/// Options that take a value, by every spelling they accept
enum class ValueOption {
    Path, Copyover, Bind, Http, Log, Level, Uid, Gid, Umask,
};

std::optional<ValueOption> value_option(const std::string& name) {
    if (name == "--path") return ValueOption::Path;
    if (name == "--copyover") return ValueOption::Copyover;
    if (name == "-b" || name == "--bind") return ValueOption::Bind;
    if (name == "--http") return ValueOption::Http;
    if (name == "-l" || name == "--log") return ValueOption::Log;
    if (name == "--level") return ValueOption::Level;
    if (name == "-u" || name == "--uid") return ValueOption::Uid;
    if (name == "-g" || name == "--gid") return ValueOption::Gid;
    if (name == "--umask") return ValueOption::Umask;
    return std::nullopt;
}

void assign(CommandLine& cmd, ValueOption option, const std::string& value) {
    switch (option) {
        case ValueOption::Path: cmd.library_path = value; break;
        case ValueOption::Copyover: cmd.copyover = value; break;
        case ValueOption::Bind: cmd.bind_address = value; break;
        case ValueOption::Http: cmd.http_address = value; break;
        case ValueOption::Log: cmd.log_path = value; break;
        case ValueOption::Level: cmd.log_level = value; break;
        case ValueOption::Uid: cmd.uid = value; break;
        case ValueOption::Gid: cmd.gid = value; break;
        case ValueOption::Umask: cmd.umask = value; break;
    }
}

} // anonymous namespace

mudhost_core::Result<CommandLine> parse_command_line(int argc, const char* const* argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parse_command_line(args);
}

mudhost_core::Result<CommandLine> parse_command_line(const std::vector<std::string>& args) {
    using mudhost_core::Error;
    using mudhost_core::ErrorCode;

    CommandLine cmd;

    for (std::size_t i = 0; i < args.size(); ++i) {
        std::string arg = args[i];

        if (arg == "--help" || arg == "-h") {
            cmd.show_help = true;
            continue;
        }
        if (arg == "--version" || arg == "-v") {
            cmd.show_version = true;
            continue;
        }
        if (arg == "--early") {
            cmd.early = true;
            continue;
        }
        if (arg == "--no-color") {
            cmd.color = false;
            continue;
        }

        // --opt=value
        std::optional<std::string> inline_value;
        auto eq = arg.find('=');
        if (arg.rfind("--", 0) == 0 && eq != std::string::npos) {
            inline_value = arg.substr(eq + 1);
            arg = arg.substr(0, eq);
        }

        auto option = value_option(arg);
        if (!option) {
            return Error(ErrorCode::InvalidArgument, "Unknown option: " + args[i]);
        }

        if (inline_value) {
            assign(cmd, *option, *inline_value);
        } else if (i + 1 < args.size()) {
            assign(cmd, *option, args[++i]);
        } else {
            return Error(ErrorCode::InvalidArgument, "Option " + arg + " requires a value");
        }
    }

    if (!mudhost_core::parse_log_level(cmd.log_level)) {
        return Error(ErrorCode::InvalidArgument, "Unknown log level: " + cmd.log_level);
    }

    return cmd;
}

void print_usage(std::ostream& out, const std::string& program_name) {
    out << "Usage: " << program_name << " [OPTIONS]\n"
        << "\n"
        << "Options:\n"
        << "  --path PATH           Load the MUD library from PATH (default: lib)\n"
        << "  -h, --help            Show this help message\n"
        << "  -v, --version         Show version information\n"
        << "\n"
        << "Network Options:\n"
        << "  -b, --bind ADDR:PORT  Bind the telnet server to ADDR:PORT\n"
        << "  --http ADDR:PORT      Bind the HTTP server to ADDR:PORT\n"
        << "\n"
        << "Logging Options:\n"
        << "  -l, --log PATH        Store log files at PATH, relative to the library (default: ../log)\n"
        << "  --level LEVEL         Only log messages of LEVEL or higher (default: info)\n"
        << "  --no-color            Disable console output colorization\n"
        << "\n"
        << "User/Group ID Manipulation:\n"
        << "  These are applied immediately before entering the event loop, after\n"
        << "  the library's modules have run, so privileged ports can still be\n"
        << "  bound as root. Values may be names or numbers and may also be set\n"
        << "  in the library configuration.\n"
        << "  -u, --uid USER        Run as the specified user\n"
        << "  -g, --gid GROUP       Run as the specified group\n"
        << "  --umask MASK          Use the provided umask (octal)\n"
        << "  --early               Assume the new identity before loading any modules\n";
}

void print_version(std::ostream& out) {
    out << "mudhost " << mudhost_core::server_version().to_string() << "\n";
}

} // namespace mudhost_engine
