#pragma once

#include <string>
#include <chrono>
#include <cstdint>
#include <optional>

struct SelectionSnapshot {
    std::optional<std::string> fastest_url = std::nullopt;
    std::optional<std::chrono::microseconds> fastest_latency = std::nullopt;

    uint64_t generation{};
};
