#include "ClosestProvider.hpp"
#include "BaseProbe.hpp"
#include "Prober.hpp"
#include "Selector.hpp"
#include "ReadinessGate.hpp"
#include "Scheduler.hpp"
#include "Errors.hpp"
#include "Log.hpp"

#include <mutex>
#include <chrono>

struct ClosestProvider::Core {
    Core(std::vector<std::string> urls, std::vector<std::shared_ptr<BaseProbe>> probes, std::chrono::microseconds probe_timeout):
        prober(std::move(probes), probe_timeout),
        selector(std::move(urls), gate)
        {}

    ReadinessGate gate;
    Prober prober;
    Selector selector;

    // held while a round is published so that nothing is written after destroy() returns
    std::mutex lifecycle_mutex;
    Lifecycle lifecycle = Lifecycle::Running;

    [[nodiscard]] boost::asio::awaitable<void> run_round();
};

boost::asio::awaitable<void> ClosestProvider::Core::run_round() {
    auto round = co_await prober.async_run_round();

    std::lock_guard lock(lifecycle_mutex);

    // late results of an abandoned round are dropped
    if (lifecycle == Lifecycle::Destroyed) co_return;

    prober.apply(round);
    selector.on_round(round);
}

ClosestProvider::ClosestProvider(boost::asio::any_io_executor exec, std::vector<std::string> urls, std::chrono::milliseconds interval, BalancerOptions options) {
    if (urls.empty()) throw ConfigurationError("Provider list must not be empty");
    if (interval <= std::chrono::milliseconds::zero()) throw ConfigurationError("Checking interval must be positive");

    // timers add the interval to steady_clock::now() in the clock's own unit
    if (interval > std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::duration::max()))
        throw ConfigurationError("Checking interval is too large");

    if (!(options.probe_timeout_fraction > 0.0 && options.probe_timeout_fraction <= 1.0))
        throw ConfigurationError("Probe timeout fraction must be in (0, 1]");

    if (!options.probe_factory) throw ConfigurationError("Probe factory must be set");

    std::vector<std::shared_ptr<BaseProbe>> probes;
    probes.reserve(urls.size());

    for (const auto& url: urls) {
        auto probe = options.probe_factory(exec, url, options.rpc_method);
        if (!probe) throw ConfigurationError("No probe available for provider URL: " + url);

        probes.push_back(std::move(probe));
    }

    auto probe_timeout = std::chrono::duration_cast<std::chrono::microseconds>(interval * options.probe_timeout_fraction);
    if (probe_timeout < std::chrono::microseconds(1)) probe_timeout = std::chrono::microseconds(1);

    _core = std::make_shared<Core>(std::move(urls), std::move(probes), probe_timeout);

    _scheduler = std::make_shared<Scheduler>(exec, interval, [core = _core]() {
        return core->run_round();
    });

    log_info("measuring {} providers every {}ms, probe timeout {}us", _core->prober.size(), interval.count(), probe_timeout.count());

    _scheduler->start();
}

ClosestProvider::~ClosestProvider() {
    destroy();
}

std::unique_ptr<ClosestProvider> ClosestProvider::init(boost::asio::any_io_executor exec, std::vector<std::string> urls, std::chrono::milliseconds interval, BalancerOptions options) {
    return std::make_unique<ClosestProvider>(exec, std::move(urls), interval, std::move(options));
}

bool ClosestProvider::is_ready() const { return _core->gate.is_set(); }

boost::asio::awaitable<void> ClosestProvider::async_wait_until_ready() const {
    co_await _core->gate.async_wait();
}

void ClosestProvider::wait_until_ready() const { _core->gate.wait(); }

bool ClosestProvider::wait_until_ready_for(std::chrono::milliseconds timeout) const { return _core->gate.wait_for(timeout); }

std::string ClosestProvider::get_fastest_provider() const {
    auto current = _core->selector.current();
    if (!current->fastest_url) throw NotReadyError();

    return *current->fastest_url;
}

SelectionSnapshot ClosestProvider::snapshot() const { return *_core->selector.current(); }

std::vector<ProviderRecord> ClosestProvider::provider_snapshots() const { return _core->prober.provider_snapshots(); }

uint64_t ClosestProvider::rounds_completed() const { return _core->selector.rounds_completed(); }

void ClosestProvider::destroy() {
    {
        std::lock_guard lock(_core->lifecycle_mutex);

        if (_core->lifecycle == Lifecycle::Destroyed) return;
        _core->lifecycle = Lifecycle::Destroyed;
        _core->prober.stop();
    }

    _scheduler->stop();
    _core->gate.close();

    log_info("stopped after {} rounds", _core->selector.rounds_completed());
}

bool ClosestProvider::is_destroyed() const {
    std::lock_guard lock(_core->lifecycle_mutex);
    return _core->lifecycle == Lifecycle::Destroyed;
}
