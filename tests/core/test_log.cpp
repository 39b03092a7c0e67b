// mudhost_core logging tests

#include <catch2/catch_test_macros.hpp>
#include <mudhost/core/log.hpp>
#include "../test_support.hpp"

using namespace mudhost_core;

TEST_CASE("Log level parsing", "[core][log]") {
    REQUIRE(parse_log_level("debug") == spdlog::level::debug);
    REQUIRE(parse_log_level("WARNING") == spdlog::level::warn);
    REQUIRE(parse_log_level("Critical") == spdlog::level::critical);
    REQUIRE_FALSE(parse_log_level("loud").has_value());

    REQUIRE(std::string(log_level_name(spdlog::level::info)) == "info");
}

TEST_CASE("Named loggers share extra sinks", "[core][log]") {
    mudhost_test::LogCapture capture;

    kernel_logger()->info("from kernel");
    module_logger()->warn("from modules");
    MUDHOST_LOG_ERROR("from core {}", 42);

    REQUIRE(capture.contains("info from kernel"));
    REQUIRE(capture.contains("warning from modules"));
    REQUIRE(capture.contains("error from core 42"));

    SECTION("same name returns same logger") {
        REQUIRE(get_logger("kernel") == kernel_logger());
    }
}

TEST_CASE("Global log level filters messages", "[core][log]") {
    mudhost_test::LogCapture capture;

    set_global_log_level(spdlog::level::warn);
    REQUIRE(get_global_log_level() == spdlog::level::warn);

    engine_logger()->info("hidden");
    engine_logger()->warn("shown");

    REQUIRE_FALSE(capture.contains("hidden"));
    REQUIRE(capture.contains("shown"));
}

TEST_CASE("Sinks stop receiving once removed", "[core][log]") {
    std::string text;
    {
        mudhost_test::LogCapture capture;
        network_logger()->info("inside");
        text = capture.text();
    }
    network_logger()->info("outside");

    REQUIRE(text.find("inside") != std::string::npos);
    REQUIRE(text.find("outside") == std::string::npos);
}

TEST_CASE("LogScope traces entry and exit", "[core][log]") {
    mudhost_test::LogCapture logs;
    {
        LogScope scope("module load", kernel_logger());
        REQUIRE(logs.contains(">>> Entering module load"));
        REQUIRE_FALSE(logs.contains("<<< Leaving module load"));
    }
    REQUIRE(logs.contains("<<< Leaving module load"));
}
