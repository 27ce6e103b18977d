#pragma once

#include "BaseProbe.hpp"

#include <string>
#include <vector>
#include <chrono>
#include <optional>

struct RoundOutcome {
    size_t index{};

    // set on success, a missing latency is the failure marker
    std::optional<std::chrono::microseconds> latency = std::nullopt;
    std::optional<ProbeError> error = std::nullopt;
    std::string message{};
};

// one entry per provider, in list order
using RoundResult = std::vector<RoundOutcome>;
