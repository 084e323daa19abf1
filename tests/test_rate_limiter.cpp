#include <catch2/catch_test_macros.hpp>
#include "warden/rate_limiter.hpp"

using namespace warden;
using namespace std::chrono_literals;

TEST_CASE("RateLimiter refills deterministically from explicit time points", "[rate_limiter]")
{
    AccessRateLimiter rl(AccessRateLimiter::Config{1.0, 2.0});
    auto t0 = std::chrono::steady_clock::time_point{} + 1h;

    REQUIRE(rl.allow("cust-1", t0));
    REQUIRE(rl.allow("cust-1", t0));
    REQUIRE_FALSE(rl.allow("cust-1", t0));

    REQUIRE_FALSE(rl.allow("cust-1", t0 + 500ms));
    REQUIRE(rl.allow("cust-1", t0 + 1s));

    // Refill is capped at the burst size
    REQUIRE(rl.allow("cust-1", t0 + 60s));
    REQUIRE(rl.allow("cust-1", t0 + 60s));
    REQUIRE_FALSE(rl.allow("cust-1", t0 + 60s));
}

TEST_CASE("RateLimiter buckets are per identity", "[rate_limiter]")
{
    AccessRateLimiter rl(AccessRateLimiter::Config{0.0, 1.0});

    REQUIRE(rl.allow("cust-1"));
    REQUIRE_FALSE(rl.allow("cust-1"));
    REQUIRE(rl.allow("cust-2"));

    rl.reset("cust-1");
    REQUIRE(rl.allow("cust-1"));
}
