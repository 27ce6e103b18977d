#pragma once

#include "BaseProbe.hpp"

#include <string>
#include <chrono>
#include <cstdint>
#include <optional>

struct ProviderRecord {
    std::string url{};

    std::optional<std::chrono::microseconds> last_latency = std::nullopt;
    std::optional<ProbeError> last_error = std::nullopt;

    uint32_t consecutive_failures{};
};
