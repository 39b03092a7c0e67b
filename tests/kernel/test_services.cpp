// mudhost_kernel service registry tests

#include <catch2/catch_test_macros.hpp>
#include <mudhost/kernel/services.hpp>

#include <string>

using namespace mudhost_kernel;

namespace {

struct Clock {
    int ticks = 0;
};

} // anonymous namespace

TEST_CASE("ServiceRegistry lookup", "[kernel][services]") {
    ServiceRegistry services;
    Clock clock;
    std::string motd = "Welcome";

    services.provide("clock", clock);
    services.provide("motd", motd);

    SECTION("by name and type") {
        REQUIRE(services.get<Clock>("clock") == &clock);
        REQUIRE(*services.get<std::string>("motd") == "Welcome");
        REQUIRE(services.has("clock"));
        REQUIRE(services.size() == 2);
    }

    SECTION("missing name") {
        REQUIRE(services.get<Clock>("calendar") == nullptr);
        REQUIRE_FALSE(services.has("calendar"));
        REQUIRE(services.type_of("calendar") == std::type_index(typeid(void)));
    }

    SECTION("wrong type") {
        REQUIRE(services.get<std::string>("clock") == nullptr);
        REQUIRE(services.type_of("clock") == std::type_index(typeid(Clock)));
    }

    SECTION("services are borrowed") {
        services.get<Clock>("clock")->ticks = 5;
        REQUIRE(clock.ticks == 5);
    }
}

TEST_CASE("ServiceRegistry aliases and replacement", "[kernel][services]") {
    ServiceRegistry services;
    Clock first;
    Clock second;

    services.provide("clock", first);
    REQUIRE(services.alias("timer", "clock"));
    REQUIRE(services.get<Clock>("timer") == &first);
    REQUIRE_FALSE(services.alias("ghost", "nothing"));
    REQUIRE_FALSE(services.has("ghost"));

    // Aliases keep pointing at the original service
    services.provide("clock", second);
    REQUIRE(services.get<Clock>("clock") == &second);
    REQUIRE(services.get<Clock>("timer") == &first);

    REQUIRE(services.names() == std::vector<std::string>{"clock", "timer"});

    REQUIRE(services.remove("timer"));
    REQUIRE_FALSE(services.remove("timer"));

    services.clear();
    REQUIRE(services.size() == 0);
}
