/// @file event_loop.hpp
/// @brief Cooperative single-threaded event engine
///
/// Provides a poll(2) based loop with:
/// - File descriptor readers
/// - One-shot and repeating timers
/// - Deferred callbacks
/// - A stop check evaluated at every safe point

#pragma once

#include "fwd.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <vector>

namespace mudhost_engine {

// =============================================================================
// Event Engine Interface
// =============================================================================

/// The engine the supervisor hands control to
class IEventEngine {
public:
    virtual ~IEventEngine() = default;

    /// Run until stopped, until the stop check returns true, or until no
    /// work remains. Blocks the calling thread.
    virtual void start() = 0;

    /// Ask a running engine to return after the current iteration
    virtual void stop() = 0;

    /// Install a predicate evaluated at every safe point; true stops the engine
    virtual void set_stop_check(std::function<bool()> check) = 0;
};

// =============================================================================
// Event Loop
// =============================================================================

/// Timer identifier
struct TimerId {
    std::uint64_t value = 0;

    [[nodiscard]] constexpr bool is_valid() const { return value != 0; }
    constexpr bool operator==(const TimerId&) const = default;
};

/// poll(2) driven cooperative event loop
class EventLoop final : public IEventEngine {
public:
    using Clock = std::chrono::steady_clock;
    using Callback = std::function<void()>;
    using ReadCallback = std::function<void(int fd)>;

    /// @param tick Upper bound for a single poll wait
    explicit EventLoop(std::chrono::milliseconds tick = std::chrono::milliseconds{250});
    ~EventLoop() override = default;

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    // =========================================================================
    // IEventEngine
    // =========================================================================

    void start() override;
    void stop() override;
    void set_stop_check(std::function<bool()> check) override;

    // =========================================================================
    // Scheduling
    // =========================================================================

    /// Run a callback on the next iteration
    void defer(Callback callback);

    /// Run a callback once after a delay
    TimerId call_later(std::chrono::milliseconds delay, Callback callback);

    /// Run a callback every interval until cancelled
    TimerId call_every(std::chrono::milliseconds interval, Callback callback);

    /// Cancel a timer. Returns false if it already fired or never existed.
    bool cancel(TimerId id);

    // =========================================================================
    // File Descriptors
    // =========================================================================

    /// Call back whenever fd is readable. Replaces an existing reader on fd.
    void add_reader(int fd, ReadCallback callback);

    bool remove_reader(int fd);

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] bool is_running() const { return m_running; }

    /// True if any reader, timer or deferred callback is pending
    [[nodiscard]] bool has_work() const;

    [[nodiscard]] std::uint64_t iteration_count() const { return m_iterations; }

private:
    struct Timer {
        TimerId id;
        Clock::time_point due;
        std::chrono::milliseconds interval{0};   ///< Zero for one-shot
        Callback callback;
    };

    [[nodiscard]] bool should_stop() const;
    [[nodiscard]] int poll_timeout() const;
    void run_deferred();
    void run_due_timers();
    void wait_for_io();
    void invoke(const char* what, const Callback& callback);

    std::chrono::milliseconds m_tick;
    std::vector<Callback> m_deferred;
    std::map<std::uint64_t, Timer> m_timers;
    std::map<int, ReadCallback> m_readers;
    std::function<bool()> m_stop_check;
    std::uint64_t m_next_timer_id = 1;
    std::uint64_t m_iterations = 0;
    bool m_running = false;
    bool m_stop_requested = false;
};

} // namespace mudhost_engine
