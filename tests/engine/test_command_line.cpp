// mudhost_engine command-line tests

#include <catch2/catch_test_macros.hpp>
#include <mudhost/engine/command_line.hpp>
#include <sstream>
#include <string>
#include <vector>

using namespace mudhost_engine;

TEST_CASE("Command line defaults", "[engine][cli]") {
    auto result = parse_command_line(std::vector<std::string>{});
    REQUIRE(result);

    const auto& cli = *result;
    REQUIRE(cli.library_path == "lib");
    REQUIRE(cli.log_path == "../log");
    REQUIRE(cli.log_level == "info");
    REQUIRE(cli.color);
    REQUIRE_FALSE(cli.early);
    REQUIRE_FALSE(cli.uid.has_value());
    REQUIRE_FALSE(cli.bind_address.has_value());
    REQUIRE_FALSE(cli.copyover.has_value());
}

TEST_CASE("Command line options", "[engine][cli]") {
    SECTION("separate values") {
        auto result = parse_command_line(std::vector<std::string>{
            "--path", "/srv/mud", "-b", "127.0.0.1:4001", "--http", ":8080",
            "-u", "mud", "-g", "1001", "--umask", "027", "--early", "--no-color"});
        REQUIRE(result);
        REQUIRE(result->library_path == "/srv/mud");
        REQUIRE(*result->bind_address == "127.0.0.1:4001");
        REQUIRE(*result->http_address == ":8080");
        REQUIRE(*result->uid == "mud");
        REQUIRE(*result->gid == "1001");
        REQUIRE(*result->umask == "027");
        REQUIRE(result->early);
        REQUIRE_FALSE(result->color);
    }

    SECTION("inline values") {
        auto result = parse_command_line(std::vector<std::string>{
            "--path=/srv/mud", "--level=debug", "--copyover=12", "--log=/var/log/mud"});
        REQUIRE(result);
        REQUIRE(result->library_path == "/srv/mud");
        REQUIRE(result->log_level == "debug");
        REQUIRE(*result->copyover == "12");
        REQUIRE(result->log_path == "/var/log/mud");
    }

    SECTION("help and version") {
        auto result = parse_command_line(std::vector<std::string>{"-h", "--version"});
        REQUIRE(result);
        REQUIRE(result->show_help);
        REQUIRE(result->show_version);
    }

    SECTION("argc/argv form skips the program name") {
        const char* argv[] = {"mudhost", "--uid", "0"};
        auto result = parse_command_line(3, argv);
        REQUIRE(result);
        REQUIRE(*result->uid == "0");
    }
}

TEST_CASE("Command line errors", "[engine][cli]") {
    SECTION("unknown option") {
        auto result = parse_command_line(std::vector<std::string>{"--frobnicate"});
        REQUIRE_FALSE(result);
        REQUIRE(result.error().code() == mudhost_core::ErrorCode::InvalidArgument);
        REQUIRE(result.error().message().find("--frobnicate") != std::string::npos);
    }

    SECTION("missing value") {
        auto result = parse_command_line(std::vector<std::string>{"--path"});
        REQUIRE_FALSE(result);
    }

    SECTION("bad log level") {
        auto result = parse_command_line(std::vector<std::string>{"--level", "shouty"});
        REQUIRE_FALSE(result);
    }
}

TEST_CASE("Usage and version output", "[engine][cli]") {
    std::ostringstream usage;
    print_usage(usage, "mudhost");
    REQUIRE(usage.str().find("Usage: mudhost") == 0);
    REQUIRE(usage.str().find("--umask") != std::string::npos);

    std::ostringstream version;
    print_version(version);
    REQUIRE(version.str().find("mudhost ") == 0);
}
