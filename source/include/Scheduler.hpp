#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <functional>

#include <boost/asio.hpp>

// drives rounds back to back: round, wait interval, round ... until stopped
class Scheduler : public std::enable_shared_from_this<Scheduler> {
public:
    using RoundFn = std::function<boost::asio::awaitable<void>()>;

    Scheduler(boost::asio::any_io_executor exec, std::chrono::microseconds interval, RoundFn round);

    // first round is posted immediately, returns without waiting for it
    void start();

    // idempotent and callable from any thread; cancels the in-flight round cooperatively
    void stop();

    bool is_stopped() const { return _stopped.load(std::memory_order_acquire); }

    boost::asio::strand<boost::asio::any_io_executor> strand() const { return _strand; }

private:
    [[nodiscard]] boost::asio::awaitable<void> run();

    boost::asio::strand<boost::asio::any_io_executor> _strand;
    std::chrono::microseconds _interval;
    RoundFn _round;

    boost::asio::steady_timer _timer;
    boost::asio::cancellation_signal _cancel;

    std::atomic<bool> _stopped{false};
};
