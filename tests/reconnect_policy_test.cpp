#include <catch2/catch_test_macros.hpp>

#include "wxstream/stream/reconnect_policy.hpp"

#include <chrono>

using namespace wxstream;
using namespace std::chrono_literals;

// ─────────────────────────────────────────────────────────────────────────────
// ReconnectPolicy
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("ReconnectPolicy defaults", "[reconnect][policy]") {
    ReconnectPolicy policy;

    REQUIRE(policy.base_interval == 5000ms);
    REQUIRE(policy.max_attempts == 5);
    REQUIRE(policy.multiplier == 2.0);
    REQUIRE(policy.jitter_factor == 0.0);
}

TEST_CASE("ReconnectPolicy delay grows geometrically from the base interval", "[reconnect][policy]") {
    ReconnectPolicy policy;

    REQUIRE(policy.delay_for(1) == 5000ms);
    REQUIRE(policy.delay_for(2) == 10000ms);
    REQUIRE(policy.delay_for(3) == 20000ms);
    REQUIRE(policy.delay_for(4) == 40000ms);
    REQUIRE(policy.delay_for(5) == 80000ms);
}

TEST_CASE("ReconnectPolicy builders", "[reconnect][policy]") {
    auto policy = ReconnectPolicy{}
        .with_base_interval(250ms)
        .with_max_attempts(3)
        .with_multiplier(3.0)
        .with_jitter(0.1);

    REQUIRE(policy.max_attempts == 3);
    REQUIRE(policy.jitter_factor == 0.1);
    REQUIRE(policy.delay_for(1) == 250ms);
    REQUIRE(policy.delay_for(2) == 750ms);
    REQUIRE(policy.delay_for(3) == 2250ms);
}

TEST_CASE("ReconnectPolicy multiplier of one gives a constant delay", "[reconnect][policy]") {
    auto policy = ReconnectPolicy{}.with_base_interval(1000ms).with_multiplier(1.0);

    REQUIRE(policy.delay_for(1) == 1000ms);
    REQUIRE(policy.delay_for(10) == 1000ms);
}

TEST_CASE("ReconnectPolicy does not overflow for huge attempt numbers", "[reconnect][policy]") {
    ReconnectPolicy policy;

    const auto delay = policy.delay_for(5000);
    REQUIRE(delay.count() > 0);
}

// ─────────────────────────────────────────────────────────────────────────────
// ExponentialBackoff
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("ExponentialBackoff built from a policy follows its schedule", "[reconnect][backoff]") {
    auto backoff = ExponentialBackoff::from(ReconnectPolicy{});

    REQUIRE(backoff->next_delay(1) == 5000ms);
    REQUIRE(backoff->next_delay(2) == 10000ms);
    REQUIRE(backoff->next_delay(5) == 80000ms);
}

TEST_CASE("ExponentialBackoff respects the cap", "[reconnect][backoff]") {
    ExponentialBackoff backoff(100ms, 2.0, 500ms);

    REQUIRE(backoff.next_delay(1) == 100ms);
    REQUIRE(backoff.next_delay(3) == 400ms);
    REQUIRE(backoff.next_delay(4) == 500ms);
    REQUIRE(backoff.next_delay(20) == 500ms);
}

TEST_CASE("ExponentialBackoff jitter stays within bounds", "[reconnect][backoff]") {
    ExponentialBackoff backoff(1000ms, 2.0, std::nullopt, 0.25);

    for (int i = 0; i < 100; ++i) {
        const auto delay = backoff.next_delay(1);
        REQUIRE(delay >= 750ms);
        REQUIRE(delay <= 1250ms);
    }
}

TEST_CASE("NoBackoff always returns zero", "[reconnect][backoff]") {
    NoBackoff backoff;

    REQUIRE(backoff.next_delay(1) == 0ms);
    REQUIRE(backoff.next_delay(100) == 0ms);
}
