// mudhost_engine event loop tests

#include <catch2/catch_test_macros.hpp>
#include <mudhost/engine/event_loop.hpp>
#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

#include <unistd.h>

using namespace mudhost_engine;
using namespace std::chrono_literals;

TEST_CASE("Event loop with no work returns immediately", "[engine][event_loop]") {
    EventLoop loop;
    REQUIRE_FALSE(loop.has_work());
    loop.start();
    REQUIRE_FALSE(loop.is_running());
}

TEST_CASE("Deferred callbacks and timers run in order", "[engine][event_loop]") {
    EventLoop loop(10ms);
    std::vector<std::string> order;

    loop.call_later(20ms, [&] { order.push_back("late"); });
    loop.call_later(5ms, [&] { order.push_back("soon"); });
    loop.defer([&] {
        order.push_back("deferred");
        loop.defer([&] { order.push_back("nested"); });
    });

    loop.start();

    REQUIRE(order == std::vector<std::string>{"deferred", "nested", "soon", "late"});
    REQUIRE_FALSE(loop.has_work());
}

TEST_CASE("Repeating timers run until cancelled", "[engine][event_loop]") {
    EventLoop loop(5ms);
    int ticks = 0;
    TimerId id;

    id = loop.call_every(1ms, [&] {
        if (++ticks == 3) {
            REQUIRE(loop.cancel(id));
        }
    });
    REQUIRE(id.is_valid());

    loop.start();
    REQUIRE(ticks == 3);
    REQUIRE_FALSE(loop.cancel(id));
}

TEST_CASE("Stop request ends the loop", "[engine][event_loop]") {
    EventLoop loop(5ms);
    int ticks = 0;

    loop.call_every(1ms, [&] {
        if (++ticks == 2) {
            loop.stop();
        }
    });

    loop.start();
    REQUIRE(ticks == 2);
    REQUIRE(loop.has_work());
}

TEST_CASE("Stop check is evaluated at safe points", "[engine][event_loop]") {
    EventLoop loop(5ms);
    bool stop_now = false;
    int ticks = 0;

    loop.set_stop_check([&] { return stop_now; });
    loop.call_every(1ms, [&] {
        ++ticks;
        if (ticks == 4) stop_now = true;
    });

    loop.start();
    REQUIRE(ticks == 4);

    SECTION("a true check before start never runs callbacks") {
        int runs = 0;
        loop.defer([&] { ++runs; });
        loop.start();
        REQUIRE(runs == 0);
    }
}

TEST_CASE("Callback exceptions are contained", "[engine][event_loop]") {
    EventLoop loop;
    bool after = false;

    loop.defer([] { throw std::runtime_error("bad callback"); });
    loop.defer([&] { after = true; });

    loop.start();
    REQUIRE(after);
}

TEST_CASE("Readers are called when a descriptor is readable", "[engine][event_loop]") {
    int fds[2];
    REQUIRE(::pipe(fds) == 0);

    EventLoop loop(5ms);
    std::string received;

    loop.add_reader(fds[0], [&](int fd) {
        char buffer[16] = {0};
        auto n = ::read(fd, buffer, sizeof(buffer));
        if (n > 0) received.assign(buffer, static_cast<std::size_t>(n));
        loop.remove_reader(fd);
    });
    loop.defer([&] { REQUIRE(::write(fds[1], "ping", 4) == 4); });

    loop.start();
    REQUIRE(received == "ping");
    REQUIRE_FALSE(loop.remove_reader(fds[0]));

    ::close(fds[0]);
    ::close(fds[1]);
}

TEST_CASE("Readers on closed descriptors are dropped", "[engine][event_loop]") {
    int fds[2];
    REQUIRE(::pipe(fds) == 0);

    EventLoop loop(5ms);
    int calls = 0;

    loop.add_reader(fds[0], [&](int) { ++calls; });
    ::close(fds[0]);
    ::close(fds[1]);

    // Without the stale reader there is no work left and the loop returns
    loop.start();

    REQUIRE(calls == 0);
    REQUIRE_FALSE(loop.has_work());
    REQUIRE_FALSE(loop.remove_reader(fds[0]));
    REQUIRE(loop.iteration_count() <= 2);
}
