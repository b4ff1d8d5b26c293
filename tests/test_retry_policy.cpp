#include <catch2/catch_test_macros.hpp>

#include "adapter/retry_policy.hpp"

using namespace std::chrono_literals;

TEST_CASE("RetryPolicy", "[retry]") {

    SECTION("DoublesUpToCap") {
        RetryPolicy policy(6, 250ms, 1500ms);
        REQUIRE(policy.next_delay() == 250ms);
        REQUIRE(policy.next_delay() == 500ms);
        REQUIRE(policy.next_delay() == 1000ms);
        REQUIRE(policy.next_delay() == 1500ms);
        REQUIRE(policy.next_delay() == 1500ms);
        REQUIRE(policy.attempts() == 5);
    }

    SECTION("ExhaustedAfterMaxAttempts") {
        RetryPolicy policy(2, 100ms, 1000ms);
        REQUIRE(policy.next_delay().has_value());
        REQUIRE(policy.next_delay().has_value());
        REQUIRE(policy.exhausted());
        REQUIRE_FALSE(policy.next_delay().has_value());
        REQUIRE(policy.attempts() == 2);
    }

    SECTION("ResetStartsOver") {
        RetryPolicy policy(3, 100ms, 1000ms);
        policy.next_delay();
        policy.next_delay();
        policy.reset();
        REQUIRE(policy.attempts() == 0);
        REQUIRE(policy.next_delay() == 100ms);
    }

    SECTION("ZeroAttemptsNeverRetries") {
        RetryPolicy policy(0, 100ms, 1000ms);
        REQUIRE(policy.exhausted());
        REQUIRE_FALSE(policy.next_delay().has_value());
    }
}
