#include "Prober.hpp"
#include "Log.hpp"

#include <format>
#include <exception>

#include <boost/asio/experimental/parallel_group.hpp>

Prober::Prober(std::vector<std::shared_ptr<BaseProbe>> probes, std::chrono::microseconds probe_timeout):
    _probes(std::move(probes)),
    _probe_timeout(probe_timeout)
    {
        _records.reserve(_probes.size());
        for (const auto& probe: _probes) _records.push_back(ProviderRecord{ std::string(probe->url()) });
    }

void Prober::stop() {
    _stopped.store(true, std::memory_order_release);
    for (const auto& probe: _probes) probe->stop();
}

boost::asio::awaitable<RoundResult> Prober::async_run_round() {
    auto executor = co_await boost::asio::this_coro::executor;

    using ProbeOp = decltype(boost::asio::co_spawn(executor, probe_one(0), boost::asio::deferred));

    std::vector<ProbeOp> ops;
    ops.reserve(_probes.size());

    for (size_t i = 0; i < _probes.size(); ++i) ops.push_back(boost::asio::co_spawn(executor, probe_one(i), boost::asio::deferred));

    // cancelling the round cancels every probe still in the group
    auto [order, exceptions, outcomes] = co_await boost::asio::experimental::make_parallel_group(std::move(ops))
        .async_wait(boost::asio::experimental::wait_for_all(), boost::asio::use_awaitable);

    RoundResult round(outcomes.size());

    for (size_t i = 0; i < outcomes.size(); ++i) {
        if (exceptions[i]) {
            round[i].index = i;
            round[i].error = ProbeError::Cancelled;
            round[i].message = "probe abandoned";
        }
        else round[i] = std::move(outcomes[i]);
    }

    co_return round;
}

namespace {

// shared by probe_one and the probe it runs, which may outlive the wait;
// both sides run on the round's executor (the scheduler strand)
struct PendingProbe {
    explicit PendingProbe(boost::asio::any_io_executor exec): done(exec) {}

    boost::asio::steady_timer done;
    boost::asio::cancellation_signal cancel;

    bool finished = false;
    std::exception_ptr error;
    ProbeResponse response;
};

}

boost::asio::awaitable<RoundOutcome> Prober::probe_one(size_t index) {
    RoundOutcome out;
    out.index = index;

    if (_stopped.load(std::memory_order_acquire)) {
        out.error = ProbeError::Cancelled;
        out.message = "prober stopped";
        co_return out;
    }

    auto executor = co_await boost::asio::this_coro::executor;
    auto probe = _probes[index];
    auto pending = std::make_shared<PendingProbe>(executor);

    // name resolution does not honour cancellation, so the probe runs on its own
    // and this wait ends at the deadline whether or not the probe gave up
    boost::asio::co_spawn(executor, probe->async_probe(),
        boost::asio::bind_cancellation_slot(pending->cancel.slot(), [pending, probe](std::exception_ptr e, ProbeResponse response) {
            pending->finished = true;
            pending->error = e;
            pending->response = std::move(response);
            pending->done.cancel();
        })
    );

    boost::system::error_code ec;
    pending->done.expires_after(_probe_timeout);

    if (!pending->finished) co_await pending->done.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));

    if (!pending->finished) {
        pending->cancel.emit(boost::asio::cancellation_type::terminal);

        if (ec == boost::asio::error::operation_aborted) {
            out.error = ProbeError::Cancelled;
            out.message = "round cancelled";
        }
        else {
            out.error = ProbeError::Timeout;
            out.message = std::format("no answer within {}us", _probe_timeout.count());
        }

        co_return out;
    }

    try {
        if (pending->error) std::rethrow_exception(pending->error);

        auto& response = pending->response;

        if (response.ok()) out.latency = response.latency;
        else {
            out.error = response.error.value_or(ProbeError::ConnectionFailed);
            out.message = std::move(response.message);
        }
    }
    catch (const boost::system::system_error& e) {
        out.error = e.code() == boost::asio::error::operation_aborted ? ProbeError::Cancelled : ProbeError::ConnectionFailed;
        out.message = e.what();
    }
    catch (const std::exception& e) {
        out.error = ProbeError::ConnectionFailed;
        out.message = e.what();
    }

    co_return out;
}

void Prober::apply(const RoundResult& round) {
    std::lock_guard lock(_records_mutex);

    for (const auto& outcome: round) {
        if (outcome.index >= _records.size()) continue;
        auto& record = _records[outcome.index];

        if (outcome.latency) {
            record.last_latency = outcome.latency;
            record.last_error.reset();
            record.consecutive_failures = 0;
            continue;
        }

        record.last_latency.reset();
        record.last_error = outcome.error.value_or(ProbeError::ConnectionFailed);
        ++record.consecutive_failures;

        log_warn("probe failed url={} error={} consecutive_failures={} detail={}", record.url, to_string(*record.last_error), record.consecutive_failures, outcome.message);
    }
}

std::vector<ProviderRecord> Prober::provider_snapshots() const {
    std::lock_guard lock(_records_mutex);
    return _records;
}
