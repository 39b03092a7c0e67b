// mudhost_kernel signal bridge tests

#include <catch2/catch_test_macros.hpp>
#include <mudhost/kernel/signal_bridge.hpp>
#include <mudhost/engine/event_loop.hpp>

#include <chrono>
#include <csignal>

using namespace mudhost_kernel;

TEST_CASE("Signals map to control events", "[kernel][signals]") {
    REQUIRE(SignalBridge::event_for_signal(SIGHUP) == ControlEvent::CopyoverRequested);
    REQUIRE(SignalBridge::event_for_signal(SIGINT) == ControlEvent::Interrupted);
    REQUIRE(SignalBridge::event_for_signal(SIGTERM) == ControlEvent::Interrupted);
    REQUIRE_FALSE(SignalBridge::event_for_signal(SIGUSR1).has_value());
}

TEST_CASE("The first control event wins", "[kernel][signals]") {
    SignalBridge bridge;
    REQUIRE_FALSE(bridge.pending().has_value());

    REQUIRE(bridge.notify(ControlEvent::Interrupted));
    REQUIRE_FALSE(bridge.notify(ControlEvent::CopyoverRequested));
    REQUIRE(bridge.pending() == ControlEvent::Interrupted);

    REQUIRE(bridge.take() == ControlEvent::Interrupted);
    REQUIRE_FALSE(bridge.take().has_value());
    REQUIRE_FALSE(bridge.pending().has_value());

    // A consumed slot stays closed
    REQUIRE_FALSE(bridge.notify(ControlEvent::Normal));
    REQUIRE_FALSE(bridge.pending().has_value());
}

TEST_CASE("Raised signals reach the registered bridge", "[kernel][signals]") {
    SignalBridge bridge;
    REQUIRE(bridge.register_handlers());
    REQUIRE(bridge.is_registered());

    std::raise(SIGHUP);
    std::raise(SIGINT);
    std::raise(SIGTERM);

    REQUIRE(bridge.pending() == ControlEvent::CopyoverRequested);
    REQUIRE(bridge.take() == ControlEvent::CopyoverRequested);

    bridge.unregister_handlers();
    REQUIRE_FALSE(bridge.is_registered());
}

TEST_CASE("Only one bridge registers at a time", "[kernel][signals]") {
    SignalBridge first;
    SignalBridge second;

    REQUIRE(first.register_handlers());

    auto twice = first.register_handlers();
    REQUIRE_FALSE(twice);
    REQUIRE(twice.error().code() == mudhost_core::ErrorCode::InvalidState);

    auto other = second.register_handlers();
    REQUIRE_FALSE(other);
    REQUIRE(other.error().code() == mudhost_core::ErrorCode::InvalidState);

    first.unregister_handlers();
    REQUIRE(second.register_handlers());
}

TEST_CASE("Previous handlers are restored", "[kernel][signals]") {
    static volatile std::sig_atomic_t seen = 0;
    auto previous = std::signal(SIGHUP, [](int) { seen = 1; });

    {
        SignalBridge bridge;
        REQUIRE(bridge.register_handlers());
        std::raise(SIGHUP);
        REQUIRE(seen == 0);
        REQUIRE(bridge.pending() == ControlEvent::CopyoverRequested);
    }

    std::raise(SIGHUP);
    REQUIRE(seen == 1);

    std::signal(SIGHUP, previous);
}

TEST_CASE("A signal ends the event loop", "[kernel][signals]") {
    SignalBridge bridge;
    REQUIRE(bridge.register_handlers());

    mudhost_engine::EventLoop loop;
    loop.set_stop_check([&bridge]() { return bridge.pending().has_value(); });

    int ticks = 0;
    loop.call_every(std::chrono::milliseconds(1), [&ticks]() { ++ticks; });
    loop.call_later(std::chrono::milliseconds(5), []() { std::raise(SIGINT); });

    loop.start();

    REQUIRE_FALSE(loop.is_running());
    REQUIRE(bridge.take() == ControlEvent::Interrupted);
}
