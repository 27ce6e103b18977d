#include <catch2/catch_test_macros.hpp>

#include "Selector.hpp"
#include "ReadinessGate.hpp"

#include <chrono>

using namespace std::chrono_literals;

namespace {

const std::vector<std::string> urls = { "https://a.example", "https://b.example", "https://c.example" };

RoundOutcome ok(size_t index, std::chrono::microseconds latency) { return RoundOutcome{ index, latency, std::nullopt, {} }; }
RoundOutcome failed(size_t index, ProbeError error = ProbeError::Timeout) { return RoundOutcome{ index, std::nullopt, error, {} }; }

}

TEST_CASE("Selector picks the minimum successful latency") {
    SelectionSnapshot empty;

    auto next = Selector::select({ ok(0, 50ms), ok(1, 20ms), ok(2, 30ms) }, empty, urls);

    REQUIRE(next.fastest_url == "https://b.example");
    REQUIRE(next.fastest_latency == std::chrono::microseconds(20ms));
    REQUIRE(next.generation == 1);
}

TEST_CASE("Selector breaks equal latencies by list order") {
    SelectionSnapshot empty;

    auto next = Selector::select({ ok(0, 30ms), ok(1, 20ms), ok(2, 20ms) }, empty, urls);
    REQUIRE(next.fastest_url == "https://b.example");

    // completion order must not matter
    auto shuffled = Selector::select({ ok(2, 20ms), ok(0, 30ms), ok(1, 20ms) }, empty, urls);
    REQUIRE(shuffled.fastest_url == "https://b.example");
}

TEST_CASE("Selector ignores failed providers") {
    SelectionSnapshot previous{ "https://b.example", 20ms, 1 };

    auto next = Selector::select({ ok(0, 40ms), failed(1), ok(2, 25ms) }, previous, urls);

    REQUIRE(next.fastest_url == "https://c.example");
    REQUIRE(next.generation == 2);
}

TEST_CASE("Selector keeps the previous snapshot when every provider failed") {
    SelectionSnapshot previous{ "https://a.example", 10ms, 7 };

    auto next = Selector::select({ failed(0), failed(1, ProbeError::BadStatus), failed(2, ProbeError::ConnectionFailed) }, previous, urls);

    REQUIRE(next.fastest_url == "https://a.example");
    REQUIRE(next.fastest_latency == std::chrono::microseconds(10ms));
    REQUIRE(next.generation == 7);
}

TEST_CASE("Selector leaves the url unset when the first round has no success") {
    SelectionSnapshot empty;

    auto next = Selector::select({ failed(0), failed(1), failed(2) }, empty, urls);

    REQUIRE_FALSE(next.fastest_url.has_value());
    REQUIRE(next.generation == 0);
}

TEST_CASE("Selector publishes rounds and opens the gate after the first one") {
    ReadinessGate gate;
    Selector selector(urls, gate);

    REQUIRE_FALSE(gate.is_set());
    REQUIRE_FALSE(selector.current()->fastest_url.has_value());

    selector.on_round({ failed(0), failed(1), failed(2) });

    // ready even though nothing answered
    REQUIRE(gate.is_set());
    REQUIRE(selector.rounds_completed() == 1);
    REQUIRE_FALSE(selector.current()->fastest_url.has_value());

    selector.on_round({ ok(0, 50ms), ok(1, 20ms), ok(2, 30ms) });
    REQUIRE(*selector.current()->fastest_url == "https://b.example");
    REQUIRE(selector.current()->generation == 1);

    selector.on_round({ ok(0, 40ms), failed(1), ok(2, 25ms) });
    REQUIRE(*selector.current()->fastest_url == "https://c.example");
    REQUIRE(selector.current()->generation == 2);

    selector.on_round({ failed(0), failed(1), failed(2) });
    REQUIRE(*selector.current()->fastest_url == "https://c.example");
    REQUIRE(selector.current()->generation == 2);
    REQUIRE(selector.rounds_completed() == 4);
}

TEST_CASE("Selector hands out snapshots that do not change after publication") {
    ReadinessGate gate;
    Selector selector(urls, gate);

    selector.on_round({ ok(0, 10ms), ok(1, 20ms), ok(2, 30ms) });
    auto held = selector.current();

    selector.on_round({ ok(0, 90ms), ok(1, 20ms), ok(2, 30ms) });

    REQUIRE(*held->fastest_url == "https://a.example");
    REQUIRE(held->generation == 1);
    REQUIRE(*selector.current()->fastest_url == "https://b.example");
}
