#include <catch2/catch_test_macros.hpp>
#include "core/retry_policy.hpp"

using namespace tidemark;
using namespace std::chrono_literals;

TEST_CASE("Nominal delay grows exponentially up to the cap", "[retry]") {
    RetryPolicy policy{.base_delay = 100ms, .multiplier = 2.0, .max_delay = 1000ms,
                       .max_attempts = 10, .jitter = 0.0};

    REQUIRE(policy.nominal_delay(0) == 0ms);
    REQUIRE(policy.nominal_delay(1) == 100ms);
    REQUIRE(policy.nominal_delay(2) == 200ms);
    REQUIRE(policy.nominal_delay(3) == 400ms);
    REQUIRE(policy.nominal_delay(4) == 800ms);
    REQUIRE(policy.nominal_delay(5) == 1000ms);
    REQUIRE(policy.nominal_delay(30) == 1000ms);
}

TEST_CASE("Delay without jitter equals the nominal delay", "[retry]") {
    RetryPolicy policy{.base_delay = 250ms, .jitter = 0.0};
    for (int attempt = 1; attempt <= 6; ++attempt) {
        REQUIRE(policy.delay_for(17, attempt) == policy.nominal_delay(attempt));
    }
}

TEST_CASE("Jittered delay stays inside its window", "[retry]") {
    RetryPolicy policy{.base_delay = 1000ms, .multiplier = 2.0, .max_delay = 60'000ms,
                       .max_attempts = 8, .jitter = 0.2};

    for (int64_t sequence = 1; sequence <= 200; ++sequence) {
        for (int attempt = 1; attempt <= 8; ++attempt) {
            const auto nominal = policy.nominal_delay(attempt).count();
            const auto delay = policy.delay_for(sequence, attempt).count();
            REQUIRE(delay >= static_cast<int64_t>(nominal * 0.8) - 1);
            REQUIRE(delay <= static_cast<int64_t>(nominal * 1.2) + 1);
            REQUIRE(delay <= policy.max_delay.count());
        }
    }
}

TEST_CASE("Jitter is a pure function of item and attempt", "[retry]") {
    RetryPolicy policy;
    REQUIRE(policy.delay_for(42, 3) == policy.delay_for(42, 3));

    SECTION("different seeds give different schedules") {
        RetryPolicy other = policy;
        other.seed = policy.seed + 1;
        bool differs = false;
        for (int64_t sequence = 1; sequence <= 20 && !differs; ++sequence) {
            differs = policy.delay_for(sequence, 2) != other.delay_for(sequence, 2);
        }
        REQUIRE(differs);
    }
}

TEST_CASE("next_attempt_at adds the delay to now", "[retry]") {
    RetryPolicy policy{.base_delay = 500ms, .jitter = 0.0};
    const Timestamp now(10'000);
    REQUIRE(policy.next_attempt_at(now, 1, 1) == Timestamp(10'500));
    REQUIRE(policy.next_attempt_at(now, 1, 2) == Timestamp(11'000));
}

TEST_CASE("Exhaustion happens at max_attempts", "[retry]") {
    RetryPolicy policy{.max_attempts = 3};
    REQUIRE_FALSE(policy.exhausted(2));
    REQUIRE(policy.exhausted(3));
    REQUIRE(policy.exhausted(4));
}

TEST_CASE("Policy validation", "[retry]") {
    REQUIRE(RetryPolicy{}.valid());

    SECTION("multiplier below one") {
        RetryPolicy policy{.multiplier = 0.5};
        REQUIRE_FALSE(policy.valid());
    }
    SECTION("cap below base") {
        RetryPolicy policy{.base_delay = 2000ms, .max_delay = 1000ms};
        REQUIRE_FALSE(policy.valid());
    }
    SECTION("no attempts") {
        RetryPolicy policy{.max_attempts = 0};
        REQUIRE_FALSE(policy.valid());
    }
    SECTION("jitter of one or more") {
        RetryPolicy policy{.jitter = 1.0};
        REQUIRE_FALSE(policy.valid());
    }
}
