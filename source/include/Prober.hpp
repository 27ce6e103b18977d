#pragma once

#include "BaseProbe.hpp"
#include "ProviderRecord.hpp"
#include "RoundResult.hpp"

#include <mutex>
#include <atomic>
#include <memory>
#include <vector>
#include <chrono>

#include <boost/asio.hpp>

class Prober {
public:
    Prober(std::vector<std::shared_ptr<BaseProbe>> probes, std::chrono::microseconds probe_timeout);

    // fans out one probe per provider and joins once each one answered or timed out
    [[nodiscard]] boost::asio::awaitable<RoundResult> async_run_round();

    // records the round into the provider records and logs the failures
    void apply(const RoundResult& round);

    std::vector<ProviderRecord> provider_snapshots() const;

    // probes that have not been sent yet are skipped from now on, running
    // ones stop before their next transport step
    void stop();

    size_t size() const { return _probes.size(); }

private:
    [[nodiscard]] boost::asio::awaitable<RoundOutcome> probe_one(size_t index);

    std::vector<std::shared_ptr<BaseProbe>> _probes;
    std::chrono::microseconds _probe_timeout;

    std::atomic<bool> _stopped{false};

    mutable std::mutex _records_mutex;
    std::vector<ProviderRecord> _records;
};
