#pragma once

#include <mutex>
#include <atomic>
#include <chrono>
#include <vector>
#include <condition_variable>

#include <boost/asio.hpp>
#include <boost/asio/any_completion_handler.hpp>

// one-shot broadcast: the flag goes false -> true once and every waiter is released with it
class ReadinessGate {
public:
    ReadinessGate() = default;
    ReadinessGate(const ReadinessGate&) = delete;
    ReadinessGate& operator=(const ReadinessGate&) = delete;

    bool is_set() const { return _set.load(std::memory_order_acquire); }

    // returns true only for the call that made the transition
    bool set();

    // shutdown path: wake everyone without setting the flag, later waits return at once
    void close();

    void wait() const;
    bool wait_for(std::chrono::milliseconds timeout) const;

    // suspends the calling coroutine only
    [[nodiscard]] boost::asio::awaitable<void> async_wait();

private:
    void release_waiters(std::unique_lock<std::mutex>& lock);

    std::atomic<bool> _set{false};
    bool _closed = false;

    mutable std::mutex _mutex;
    mutable std::condition_variable _cv;

    std::vector<boost::asio::any_completion_handler<void()>> _waiters;
};
