#pragma once

#include "BaseProbe.hpp"
#include "ProbeFactory.hpp"

#include <map>
#include <mutex>
#include <algorithm>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <optional>
#include <exception>

#include <boost/asio.hpp>

using namespace std::chrono_literals;

struct ProbeStep {
    enum class Kind { Answer, Fail, Hang, Stall };

    Kind kind = Kind::Answer;
    std::chrono::microseconds latency{};
    std::chrono::milliseconds delay{1};      // real time spent before answering

    static ProbeStep answer(std::chrono::milliseconds latency, std::chrono::milliseconds delay = 1ms) { return { Kind::Answer, latency, delay }; }
    static ProbeStep fail() { return { Kind::Fail, {}, 1ms }; }
    static ProbeStep hang() { return { Kind::Hang, {}, 1h }; }

    // waits out the delay even when cancelled, then answers
    static ProbeStep stall(std::chrono::milliseconds delay, std::chrono::milliseconds latency = 1ms) { return { Kind::Stall, latency, delay }; }
};

// Per-URL list of steps; call n uses step n, the last step repeats.
// Shared by the test body and every probe the factory hands out.
class ProbeScript : public std::enable_shared_from_this<ProbeScript> {
public:
    void set(const std::string& url, std::vector<ProbeStep> steps) {
        std::lock_guard lock(_mutex);
        _steps[url] = std::move(steps);
    }

    ProbeStep next(const std::string& url) {
        std::lock_guard lock(_mutex);

        auto call = _calls[url]++;
        auto it = _steps.find(url);
        if (it == _steps.end() || it->second.empty()) return ProbeStep::fail();

        return it->second[std::min(call, it->second.size() - 1)];
    }

    size_t calls(const std::string& url) const {
        std::lock_guard lock(_mutex);
        auto it = _calls.find(url);
        return it == _calls.end() ? 0 : it->second;
    }

    size_t total_calls() const {
        std::lock_guard lock(_mutex);
        size_t total{};
        for (const auto& [url, n]: _calls) total += n;
        return total;
    }

    size_t probes_made() const {
        std::lock_guard lock(_mutex);
        return _probes_made;
    }

    // calls whose wait ended with operation_aborted
    size_t aborted(const std::string& url) const {
        std::lock_guard lock(_mutex);
        auto it = _aborted.find(url);
        return it == _aborted.end() ? 0 : it->second;
    }

    size_t max_in_flight(const std::string& url) const {
        std::lock_guard lock(_mutex);
        auto it = _max_in_flight.find(url);
        return it == _max_in_flight.end() ? 0 : it->second;
    }

    void started(const std::string& url) {
        std::lock_guard lock(_mutex);
        auto n = ++_in_flight[url];
        _max_in_flight[url] = std::max(_max_in_flight[url], n);
    }

    void finished(const std::string& url, bool aborted) {
        std::lock_guard lock(_mutex);
        --_in_flight[url];
        if (aborted) ++_aborted[url];
    }

    ProbeFactory factory();

private:
    mutable std::mutex _mutex;
    std::map<std::string, std::vector<ProbeStep>> _steps;
    std::map<std::string, size_t> _calls;
    std::map<std::string, size_t> _aborted;
    std::map<std::string, size_t> _in_flight;
    std::map<std::string, size_t> _max_in_flight;
    size_t _probes_made{};
};

class ScriptedProbe : public BaseProbe {
public:
    ScriptedProbe(boost::asio::any_io_executor exec, std::string_view url, std::shared_ptr<ProbeScript> script): BaseProbe(exec, url), _script(std::move(script)) {}

    boost::asio::awaitable<ProbeResponse> async_probe() override {
        auto step = _script->next(_raw_url);
        _script->started(_raw_url);

        boost::system::error_code ec;
        boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);
        timer.expires_after(step.delay);

        if (step.kind == ProbeStep::Kind::Stall) {
            // an empty slot hides the coroutine's cancellation from the timer
            co_await timer.async_wait(boost::asio::bind_cancellation_slot(boost::asio::cancellation_slot(), boost::asio::redirect_error(boost::asio::use_awaitable, ec)));
        }
        else co_await timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));

        _script->finished(_raw_url, ec == boost::asio::error::operation_aborted);

        if (ec) co_return failure(ProbeError::Cancelled, ec.message());
        if (step.kind == ProbeStep::Kind::Answer || step.kind == ProbeStep::Kind::Stall) co_return ProbeResponse{ step.latency, std::nullopt, {} };
        co_return failure(ProbeError::ConnectionFailed, "scripted failure");
    }

private:
    std::shared_ptr<ProbeScript> _script;
};

inline ProbeFactory ProbeScript::factory() {
    auto self = shared_from_this();

    return [self](boost::asio::any_io_executor exec, std::string_view url, std::string_view) -> std::shared_ptr<BaseProbe> {
        {
            std::lock_guard lock(self->_mutex);
            ++self->_probes_made;
        }
        return std::make_shared<ScriptedProbe>(exec, url, self);
    };
}

// io_context running on its own thread for the lifetime of the object
struct IoThread {
    boost::asio::io_context ioc;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> guard = boost::asio::make_work_guard(ioc);
    std::thread thread{ [this] { ioc.run(); } };

    ~IoThread() {
        guard.reset();
        ioc.stop();
        thread.join();
    }

    boost::asio::any_io_executor executor() { return ioc.get_executor(); }
};

template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = 3s) {
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

// runs the io_context on the calling thread until op finishes
template <typename T>
T run_until_done(boost::asio::io_context& ioc, boost::asio::awaitable<T> op) {
    std::optional<T> out;
    std::exception_ptr error;

    boost::asio::co_spawn(ioc, std::move(op), [&](std::exception_ptr e, T value) {
        error = e;
        out = std::move(value);
        ioc.stop();
    });

    ioc.restart();
    ioc.run();

    if (error) std::rethrow_exception(error);
    return std::move(*out);
}
