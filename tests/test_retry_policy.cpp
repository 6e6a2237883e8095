#include "backpack/retry_policy.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace std::chrono_literals;

TEST_CASE("RetryPolicy grows exponentially up to the cap") {
    backpack::RetryPolicy policy{5, 1000ms, 2.0, 5000ms, 0.0};

    CHECK(policy.delay_for(0) == 1000ms);
    CHECK(policy.delay_for(1) == 2000ms);
    CHECK(policy.delay_for(2) == 4000ms);
    CHECK(policy.delay_for(3) == 5000ms);
    CHECK(policy.delay_for(10) == 5000ms);
}

TEST_CASE("RetryPolicy bounds attempts unless unbounded") {
    backpack::RetryPolicy bounded{3, 100ms, 2.0, 1000ms, 0.0};
    CHECK(bounded.allows_retry(0));
    CHECK(bounded.allows_retry(1));
    CHECK_FALSE(bounded.allows_retry(2));

    backpack::RetryPolicy unbounded{-1, 100ms, 2.0, 1000ms, 0.0};
    CHECK(unbounded.allows_retry(1000));
}

TEST_CASE("RetryPolicy jitter stays within the configured fraction") {
    backpack::RetryPolicy policy{-1, 1000ms, 2.0, 30000ms, 0.2};
    std::mt19937_64 rng{1234};

    for (int i = 0; i < 200; ++i) {
        const auto delay = policy.delay_for(1, rng);
        CHECK(delay >= 1600ms);
        CHECK(delay <= 2400ms);
    }
}
