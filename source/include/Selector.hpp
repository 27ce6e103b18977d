#pragma once

#include "SelectionSnapshot.hpp"
#include "RoundResult.hpp"

#include <atomic>
#include <memory>
#include <vector>
#include <string>
#include <chrono>
#include <cstdint>
#include <optional>

class ReadinessGate;

class Selector {
public:
    Selector(std::vector<std::string> urls, ReadinessGate& gate);

    // minimum successful latency wins, equal latencies go to the lowest index,
    // a round without any success leaves the previous snapshot untouched
    static SelectionSnapshot select(const RoundResult& round, const SelectionSnapshot& previous, const std::vector<std::string>& urls);

    // single writer, called once per round by the scheduler
    void on_round(const RoundResult& round);

    // one atomic load, readers always get a complete snapshot
    std::shared_ptr<const SelectionSnapshot> current() const { return _current.load(std::memory_order_acquire); }

    uint64_t rounds_completed() const { return _rounds.load(std::memory_order_acquire); }

private:
    std::vector<std::string> _urls;
    ReadinessGate& _gate;

    std::atomic<std::shared_ptr<const SelectionSnapshot>> _current;
    std::atomic<uint64_t> _rounds{};
};
