// mudhost_engine configuration tests

#include <catch2/catch_test_macros.hpp>
#include <mudhost/engine/config.hpp>
#include "../test_support.hpp"

using namespace mudhost_engine;

TEST_CASE("Config layers resolve by priority", "[engine][config]") {
    ConfigStore store;
    store.create_default_layers();
    REQUIRE(store.layer_count() == 3);

    store.set("network.bind", std::string("0.0.0.0:4000"), ConfigStore::DEFAULT_LAYER);
    REQUIRE(store.get_string("network.bind") == "0.0.0.0:4000");

    store.set("network.bind", std::string("127.0.0.1:5000"), ConfigStore::LIBRARY_LAYER);
    REQUIRE(store.get_string("network.bind") == "127.0.0.1:5000");

    store.set("network.bind", std::string("10.0.0.1:6000"), ConfigStore::COMMAND_LINE_LAYER);
    REQUIRE(store.get_string("network.bind") == "10.0.0.1:6000");

    SECTION("removing a layer falls back") {
        REQUIRE(store.remove_layer(ConfigStore::COMMAND_LINE_LAYER));
        REQUIRE(store.get_string("network.bind") == "127.0.0.1:5000");
    }

    SECTION("create_default_layers is idempotent") {
        store.create_default_layers();
        REQUIRE(store.layer_count() == 3);
    }
}

TEST_CASE("Config typed accessors", "[engine][config]") {
    ConfigStore store;
    store.set("uid", std::int64_t{1001});
    store.set("legacy_compatible", true);
    store.set("flag_text", std::string("yes"));
    store.set("ratio", 2.5);

    REQUIRE(store.get_int("uid") == 1001);
    REQUIRE(store.get_bool("legacy_compatible"));
    REQUIRE(store.get_bool("flag_text"));
    REQUIRE(store.get_int("ratio") == 2);
    REQUIRE(store.get_string("uid") == "1001");

    REQUIRE(store.get_int("missing", 7) == 7);
    REQUIRE_FALSE(store.get_bool("missing"));
    REQUIRE(store.get_string("missing", "dflt") == "dflt");
    REQUIRE_FALSE(store.get("missing").has_value());
}

TEST_CASE("Config TOML loading", "[engine][config]") {
    ConfigStore store;
    store.create_default_layers();

    SECTION("nested tables become dotted keys") {
        auto result = store.load_toml_string(
            "uid = \"mud\"\n"
            "umask = \"027\"\n"
            "legacy_compatible = true\n"
            "[network]\n"
            "bind = \"127.0.0.1:4000\"\n"
            "[motd]\n"
            "interval = 60\n",
            "inline.toml");
        REQUIRE(result);

        REQUIRE(store.get_string("uid") == "mud");
        REQUIRE(store.get_string("umask") == "027");
        REQUIRE(store.get_bool("legacy_compatible"));
        REQUIRE(store.get_string("network.bind") == "127.0.0.1:4000");
        REQUIRE(store.get_int("motd.interval") == 60);

        const auto* layer = store.get_layer(ConfigStore::LIBRARY_LAYER);
        REQUIRE(layer != nullptr);
        REQUIRE(layer->contains("network.bind"));
    }

    SECTION("parse errors are reported") {
        auto result = store.load_toml_string("this is = = not toml", "broken.toml");
        REQUIRE_FALSE(result);
        REQUIRE(result.error().is<mudhost_core::BootError>());
        REQUIRE(result.error().as<mudhost_core::BootError>()->kind ==
                mudhost_core::BootError::Kind::ConfigInvalid);
        REQUIRE(result.error().message().find("broken.toml") != std::string::npos);
    }

    SECTION("files") {
        mudhost_test::TempDir dir;
        auto path = dir.write("config.toml", "gid = 1001\n");

        REQUIRE(store.load_toml(path));
        REQUIRE(store.get_int("gid") == 1001);

        REQUIRE_FALSE(store.load_toml(dir.path() / "absent.toml"));
    }
}
