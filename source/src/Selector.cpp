#include "Selector.hpp"
#include "ReadinessGate.hpp"
#include "Log.hpp"

#include <algorithm>

Selector::Selector(std::vector<std::string> urls, ReadinessGate& gate):
    _urls(std::move(urls)),
    _gate(gate),
    _current(std::make_shared<const SelectionSnapshot>())
    {}

SelectionSnapshot Selector::select(const RoundResult& round, const SelectionSnapshot& previous, const std::vector<std::string>& urls) {
    const RoundOutcome* best = nullptr;

    for (const auto& outcome: round) {
        if (!outcome.latency || outcome.index >= urls.size()) continue;

        // ties go to the lower index, whatever order the probes finished in
        if (!best || *outcome.latency < *best->latency || (*outcome.latency == *best->latency && outcome.index < best->index)) best = &outcome;
    }

    if (!best) return previous;

    SelectionSnapshot next;
    next.fastest_url = urls[best->index];
    next.fastest_latency = best->latency;
    next.generation = previous.generation + 1;

    return next;
}

void Selector::on_round(const RoundResult& round) {
    auto previous = current();
    auto next = select(round, *previous, _urls);

    auto round_number = _rounds.load(std::memory_order_relaxed) + 1;

    if (next.generation != previous->generation) {
        log_info("provider selected url={} latency_us={} generation={}", *next.fastest_url, next.fastest_latency->count(), next.generation);
        _current.store(std::make_shared<const SelectionSnapshot>(std::move(next)), std::memory_order_release);
    }
    else {
        log_error("all providers failed round={} keeping={}", round_number, previous->fastest_url.value_or("<none>"));
    }

    _rounds.store(round_number, std::memory_order_release);

    // first completed round opens the gate, success or not
    if (_gate.set()) log_debug("selector ready after round {}", round_number);
}
