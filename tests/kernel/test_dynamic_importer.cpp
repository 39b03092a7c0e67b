// mudhost_kernel shared object importing tests
//
// The fixture modules are built next to the test binary; their paths come
// from the MUDHOST_FIXTURE_* compile definitions.

#include <catch2/catch_test_macros.hpp>
#include <mudhost/kernel/module_loader.hpp>
#include <mudhost/kernel/services.hpp>
#include <mudhost/engine/config.hpp>
#include <mudhost/engine/hooks.hpp>
#include "../test_support.hpp"

#include <string>
#include <vector>

using namespace mudhost_kernel;
using mudhost_core::ErrorCode;
using mudhost_test::TempDir;

namespace {

/// Services the recorder fixture expects
struct RecorderServices {
    ServiceRegistry registry;
    int counter = 0;
    std::vector<std::string> events;

    RecorderServices() {
        registry.provide("counter", counter);
        registry.provide("events", events);
    }
};

ModuleRecord record_for(const std::string& name, const std::filesystem::path& path) {
    return ModuleRecord{name, path, ModuleStatus::Pending, {}};
}

bool mentions(const mudhost_core::Error& error, const std::string& needle) {
    return error.message().find(needle) != std::string::npos;
}

} // anonymous namespace

TEST_CASE("A module is imported, initialized and shut down", "[kernel][importer]") {
    RecorderServices services;
    DynamicModuleImporter importer;

    auto result = importer.import_module(record_for("recorder", MUDHOST_FIXTURE_GOOD), services.registry);
    REQUIRE(result);
    REQUIRE(services.counter == 1);
    REQUIRE(importer.loaded_count() == 1);
    REQUIRE(importer.is_loaded("recorder"));

    importer.shutdown_all();
    REQUIRE(importer.loaded_count() == 0);
    REQUIRE(services.events == std::vector<std::string>{"init:recorder", "shutdown:recorder"});
}

TEST_CASE("Modules shut down in reverse load order", "[kernel][importer]") {
    TempDir dir;
    auto first = dir.copy(MUDHOST_FIXTURE_GOOD, "first.so");
    auto second = dir.copy(MUDHOST_FIXTURE_GOOD, "second.so");

    RecorderServices services;
    DynamicModuleImporter importer;

    REQUIRE(importer.import_module(record_for("first", first), services.registry));
    REQUIRE(importer.import_module(record_for("second", second), services.registry));
    REQUIRE(services.counter == 2);

    importer.shutdown_all();
    REQUIRE(services.events == std::vector<std::string>{
        "init:first", "init:second", "shutdown:second", "shutdown:first"});
}

TEST_CASE("A module that needs missing services fails to import", "[kernel][importer]") {
    ServiceRegistry empty;
    DynamicModuleImporter importer;

    auto result = importer.import_module(record_for("recorder", MUDHOST_FIXTURE_GOOD), empty);
    REQUIRE_FALSE(result);
    REQUIRE(mentions(result.error(), "'counter' and 'events'"));
    REQUIRE(importer.loaded_count() == 0);
}

TEST_CASE("Import failures carry the reason", "[kernel][importer]") {
    RecorderServices services;
    DynamicModuleImporter importer;

    SECTION("initialize returns an error") {
        auto result = importer.import_module(record_for("refuser", MUDHOST_FIXTURE_FAIL), services.registry);
        REQUIRE_FALSE(result);
        REQUIRE(result.error().message() == "refused to start");
    }

    SECTION("initialize throws") {
        auto result = importer.import_module(record_for("thrower", MUDHOST_FIXTURE_THROW), services.registry);
        REQUIRE_FALSE(result);
        REQUIRE(result.error().code() == ErrorCode::LoadFailed);
        REQUIRE(result.error().message() == "division by zero");
    }

    SECTION("constructor throws") {
        auto result = importer.import_module(record_for("broken", MUDHOST_FIXTURE_CTOR), services.registry);
        REQUIRE_FALSE(result);
        REQUIRE(result.error().code() == ErrorCode::LoadFailed);
        REQUIRE(result.error().message() == "constructor failed");
    }

    SECTION("no entry point") {
        auto result = importer.import_module(record_for("plain", MUDHOST_FIXTURE_NOENTRY), services.registry);
        REQUIRE_FALSE(result);
        REQUIRE(mentions(result.error(), "missing entry point 'mudhost_module_entry'"));
    }

    SECTION("other API version") {
        auto result = importer.import_module(record_for("future", MUDHOST_FIXTURE_VERSION), services.registry);
        REQUIRE_FALSE(result);
        REQUIRE(result.error().code() == ErrorCode::NotSupported);
    }

    SECTION("not a shared object") {
        TempDir dir;
        auto bogus = dir.write("bogus.so", "this is not an ELF file");
        auto result = importer.import_module(record_for("bogus", bogus), services.registry);
        REQUIRE_FALSE(result);
        REQUIRE(result.error().code() == ErrorCode::LoadFailed);
    }

    SECTION("missing file") {
        TempDir dir;
        auto result = importer.import_module(record_for("ghost", dir.path() / "ghost.so"), services.registry);
        REQUIRE_FALSE(result);
        REQUIRE(result.error().code() == ErrorCode::NotFound);
    }

    REQUIRE(importer.loaded_count() == 0);
}

TEST_CASE("Loading a module directory stops at the broken module", "[kernel][importer]") {
    mudhost_test::LogCapture logs;
    TempDir dir;
    dir.copy(MUDHOST_FIXTURE_GOOD, "modules/a.so");
    dir.copy(MUDHOST_FIXTURE_THROW, "modules/b.so");
    dir.copy(MUDHOST_FIXTURE_GOOD, "modules/c.so");

    RecorderServices services;
    DynamicModuleImporter importer;
    ModuleLoader loader(importer);

    auto result = loader.load(dir.path() / "modules", services.registry);
    REQUIRE_FALSE(result);

    REQUIRE(services.counter == 1);
    REQUIRE(importer.is_loaded("a"));
    REQUIRE_FALSE(importer.is_loaded("c"));

    const auto& manifest = loader.manifest();
    REQUIRE(manifest.find("a")->status == ModuleStatus::Loaded);
    REQUIRE(manifest.find("b")->status == ModuleStatus::Failed);
    REQUIRE(manifest.find("b")->error == "division by zero");
    REQUIRE(manifest.find("c")->status == ModuleStatus::Pending);
    REQUIRE(logs.contains("An error occurred when attempting to import module: b"));
}

TEST_CASE("A module whose constructor throws stops the load", "[kernel][importer]") {
    mudhost_test::LogCapture logs;
    TempDir dir;
    dir.copy(MUDHOST_FIXTURE_GOOD, "modules/a.so");
    dir.copy(MUDHOST_FIXTURE_CTOR, "modules/b.so");
    dir.copy(MUDHOST_FIXTURE_GOOD, "modules/c.so");

    RecorderServices services;
    DynamicModuleImporter importer;
    ModuleLoader loader(importer);

    auto result = loader.load(dir.path() / "modules", services.registry);
    REQUIRE_FALSE(result);
    REQUIRE(result.error().as<mudhost_core::ModuleError>()->kind == mudhost_core::ModuleError::Kind::ImportFailed);

    const auto& manifest = loader.manifest();
    REQUIRE(manifest.find("a")->status == ModuleStatus::Loaded);
    REQUIRE(manifest.find("b")->status == ModuleStatus::Failed);
    REQUIRE(manifest.find("b")->error == "constructor failed");
    REQUIRE(manifest.find("c")->status == ModuleStatus::Pending);
    REQUIRE(services.counter == 1);
    REQUIRE(logs.contains("An error occurred when attempting to import module: b"));
}

TEST_CASE("A module that throws on shutdown does not stop the others", "[kernel][importer]") {
    mudhost_test::LogCapture logs;
    TempDir dir;
    auto recorder = dir.copy(MUDHOST_FIXTURE_GOOD, "recorder.so");

    RecorderServices services;
    DynamicModuleImporter importer;

    REQUIRE(importer.import_module(record_for("recorder", recorder), services.registry));
    REQUIRE(importer.import_module(record_for("stubborn", MUDHOST_FIXTURE_SHUTDOWN), services.registry));

    importer.shutdown_all();
    REQUIRE(importer.loaded_count() == 0);
    REQUIRE(logs.contains("Module 'stubborn' failed to shut down: unknown exception"));
    REQUIRE(services.events.back() == "shutdown:recorder");
}

TEST_CASE("The motd module hooks into the host", "[kernel][importer]") {
    mudhost_engine::ConfigStore config;
    config.set("motd.text", std::string("Welcome to the test realm."));
    mudhost_engine::HookRegistry hooks;

    ServiceRegistry services;
    services.provide("config", config);
    services.provide("hooks", hooks);

    DynamicModuleImporter importer;
    REQUIRE(importer.import_module(record_for("motd", MUDHOST_MOTD_MODULE), services));
    REQUIRE(hooks.has(mudhost_engine::SHUTDOWN_EVENT, "motd.goodbye"));

    importer.shutdown_all();
    REQUIRE_FALSE(hooks.has(mudhost_engine::SHUTDOWN_EVENT, "motd.goodbye"));
}
