/// @file event_loop.cpp
/// @brief Cooperative event loop implementation

#include <mudhost/engine/event_loop.hpp>
#include <mudhost/core/log.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <exception>

#include <poll.h>

namespace mudhost_engine {

EventLoop::EventLoop(std::chrono::milliseconds tick)
    : m_tick(tick) {
}

// =============================================================================
// IEventEngine
// =============================================================================

void EventLoop::start() {
    if (m_running) {
        mudhost_core::engine_logger()->warn("Event loop already running");
        return;
    }

    m_running = true;
    m_stop_requested = false;

    while (!should_stop()) {
        if (!has_work()) {
            mudhost_core::engine_logger()->debug("Event loop has no work left");
            break;
        }

        run_deferred();
        if (should_stop()) break;

        run_due_timers();
        if (should_stop()) break;

        wait_for_io();
        m_iterations++;
    }

    m_running = false;
}

void EventLoop::stop() {
    m_stop_requested = true;
}

void EventLoop::set_stop_check(std::function<bool()> check) {
    m_stop_check = std::move(check);
}

// =============================================================================
// Scheduling
// =============================================================================

void EventLoop::defer(Callback callback) {
    m_deferred.push_back(std::move(callback));
}

TimerId EventLoop::call_later(std::chrono::milliseconds delay, Callback callback) {
    TimerId id{m_next_timer_id++};
    m_timers[id.value] = Timer{id, Clock::now() + delay, std::chrono::milliseconds{0}, std::move(callback)};
    return id;
}

TimerId EventLoop::call_every(std::chrono::milliseconds interval, Callback callback) {
    if (interval.count() <= 0) {
        interval = std::chrono::milliseconds{1};
    }
    TimerId id{m_next_timer_id++};
    m_timers[id.value] = Timer{id, Clock::now() + interval, interval, std::move(callback)};
    return id;
}

bool EventLoop::cancel(TimerId id) {
    return m_timers.erase(id.value) > 0;
}

// =============================================================================
// File Descriptors
// =============================================================================

void EventLoop::add_reader(int fd, ReadCallback callback) {
    m_readers[fd] = std::move(callback);
}

bool EventLoop::remove_reader(int fd) {
    return m_readers.erase(fd) > 0;
}

bool EventLoop::has_work() const {
    return !m_deferred.empty() || !m_timers.empty() || !m_readers.empty();
}

// =============================================================================
// Internals
// =============================================================================

bool EventLoop::should_stop() const {
    if (m_stop_requested) {
        return true;
    }
    return m_stop_check && m_stop_check();
}

int EventLoop::poll_timeout() const {
    if (!m_deferred.empty()) {
        return 0;
    }

    auto timeout = m_tick;
    if (!m_timers.empty()) {
        auto earliest = std::min_element(m_timers.begin(), m_timers.end(),
            [](const auto& a, const auto& b) { return a.second.due < b.second.due; });
        auto until = std::chrono::duration_cast<std::chrono::milliseconds>(earliest->second.due - Clock::now());
        timeout = std::min(timeout, std::max(until, std::chrono::milliseconds{0}));
    }
    return static_cast<int>(timeout.count());
}

void EventLoop::run_deferred() {
    if (m_deferred.empty()) {
        return;
    }

    // Callbacks deferred while running wait for the next iteration
    std::vector<Callback> batch;
    batch.swap(m_deferred);
    for (std::size_t i = 0; i < batch.size(); ++i) {
        invoke("deferred callback", batch[i]);
        if (m_stop_requested) {
            // Keep what has not run yet
            m_deferred.insert(m_deferred.begin(), batch.begin() + static_cast<std::ptrdiff_t>(i + 1), batch.end());
            return;
        }
    }
}

void EventLoop::run_due_timers() {
    auto now = Clock::now();

    std::vector<std::pair<Clock::time_point, std::uint64_t>> due;
    for (const auto& [key, timer] : m_timers) {
        if (timer.due <= now) {
            due.emplace_back(timer.due, key);
        }
    }
    std::sort(due.begin(), due.end());

    for (const auto& [when, key] : due) {
        auto it = m_timers.find(key);
        if (it == m_timers.end()) {
            continue;   // Cancelled by an earlier callback
        }

        Callback callback = it->second.callback;
        if (it->second.interval.count() > 0) {
            it->second.due += it->second.interval;
            if (it->second.due <= now) {
                it->second.due = now + it->second.interval;
            }
        } else {
            m_timers.erase(it);
        }

        invoke("timer", callback);
        if (should_stop()) {
            return;
        }
    }
}

void EventLoop::wait_for_io() {
    std::vector<pollfd> fds;
    fds.reserve(m_readers.size());
    for (const auto& [fd, _] : m_readers) {
        fds.push_back(pollfd{fd, POLLIN, 0});
    }

    int ready = ::poll(fds.empty() ? nullptr : fds.data(), static_cast<nfds_t>(fds.size()), poll_timeout());
    if (ready < 0) {
        if (errno != EINTR) {
            mudhost_core::engine_logger()->error("poll failed: {}", std::strerror(errno));
        }
        return;
    }

    for (const auto& pfd : fds) {
        if (pfd.revents & POLLNVAL) {
            // Closed without remove_reader(); poll() would report it forever
            if (m_readers.erase(pfd.fd) > 0) {
                mudhost_core::engine_logger()->warn("Dropping reader for closed descriptor {}", pfd.fd);
            }
            continue;
        }
        if ((pfd.revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
            continue;
        }
        auto it = m_readers.find(pfd.fd);
        if (it == m_readers.end()) {
            continue;   // Removed by an earlier callback
        }
        ReadCallback callback = it->second;
        int fd = pfd.fd;
        invoke("reader", [&callback, fd]() { callback(fd); });
        if (should_stop()) {
            return;
        }
    }
}

void EventLoop::invoke(const char* what, const Callback& callback) {
    try {
        callback();
    } catch (const std::exception& e) {
        mudhost_core::engine_logger()->error("Unhandled exception in {}: {}", what, e.what());
    }
}

} // namespace mudhost_engine
