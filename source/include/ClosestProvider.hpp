#pragma once

#include "BalancerOptions.hpp"
#include "ProviderRecord.hpp"
#include "SelectionSnapshot.hpp"

#include <string>
#include <memory>
#include <vector>
#include <chrono>
#include <cstdint>

#include <boost/asio.hpp>

class Scheduler;

// Keeps measuring a fixed list of equivalent JSON-RPC providers and tells callers which one
// answered fastest in the latest round. Callers send their own traffic to that URL.
//
// All background work runs on a strand of the executor given at construction; the object
// itself may be read from any thread.
class ClosestProvider {
public:
    // throws ConfigurationError (empty list, bad interval or options), nothing is started then
    ClosestProvider(boost::asio::any_io_executor exec, std::vector<std::string> urls, std::chrono::milliseconds interval, BalancerOptions options = {});
    ~ClosestProvider();

    ClosestProvider(const ClosestProvider&) = delete;
    ClosestProvider& operator=(const ClosestProvider&) = delete;

    static std::unique_ptr<ClosestProvider> init(boost::asio::any_io_executor exec, std::vector<std::string> urls, std::chrono::milliseconds interval, BalancerOptions options = {});

    bool is_ready() const;

    // true once the first round completed; all three return early after destroy()
    [[nodiscard]] boost::asio::awaitable<void> async_wait_until_ready() const;
    void wait_until_ready() const;
    bool wait_until_ready_for(std::chrono::milliseconds timeout) const;

    // throws NotReadyError until some round had a successful probe
    std::string get_fastest_provider() const;

    SelectionSnapshot snapshot() const;
    std::vector<ProviderRecord> provider_snapshots() const;
    uint64_t rounds_completed() const;

    // stops measuring, the last snapshot stays readable
    void destroy();
    bool is_destroyed() const;

private:
    enum class Lifecycle { Running, Destroyed };

    struct Core;

    std::shared_ptr<Core> _core;
    std::shared_ptr<Scheduler> _scheduler;
};
