#include "ReadinessGate.hpp"

bool ReadinessGate::set() {
    std::unique_lock lock(_mutex);

    if (_set.load(std::memory_order_relaxed)) return false;
    _set.store(true, std::memory_order_release);

    release_waiters(lock);
    return true;
}

void ReadinessGate::close() {
    std::unique_lock lock(_mutex);

    if (_closed) return;
    _closed = true;

    release_waiters(lock);
}

// handlers run on their own executors, never under our lock
void ReadinessGate::release_waiters(std::unique_lock<std::mutex>& lock) {
    auto waiters = std::move(_waiters);
    _waiters.clear();

    lock.unlock();
    _cv.notify_all();

    for (auto& handler: waiters) boost::asio::post(std::move(handler));
}

void ReadinessGate::wait() const {
    std::unique_lock lock(_mutex);
    _cv.wait(lock, [this] { return _set.load(std::memory_order_relaxed) || _closed; });
}

bool ReadinessGate::wait_for(std::chrono::milliseconds timeout) const {
    std::unique_lock lock(_mutex);
    _cv.wait_for(lock, timeout, [this] { return _set.load(std::memory_order_relaxed) || _closed; });

    return _set.load(std::memory_order_relaxed);
}

boost::asio::awaitable<void> ReadinessGate::async_wait() {
    if (is_set()) co_return;

    auto token = boost::asio::use_awaitable;

    co_await boost::asio::async_initiate<decltype(token), void()>(
        [this](auto handler) {
            std::unique_lock lock(_mutex);

            if (_set.load(std::memory_order_relaxed) || _closed) {
                lock.unlock();
                boost::asio::post(std::move(handler));
                return;
            }

            _waiters.emplace_back(std::move(handler));
        },
        token
    );
}
