#include <catch2/catch_test_macros.hpp>
#include "test_support.hpp"
#include <cstdio>
#include <fstream>

using namespace warden;
using namespace std::chrono_literals;
using test::ManualClock;

TEST_CASE("RFC 3339 formatting and parsing", "[clock]")
{
    REQUIRE(format_rfc3339(test::kT0) == "2023-11-14T22:13:20Z");

    auto parsed = parse_rfc3339("2023-11-14T22:13:20Z");
    REQUIRE(parsed.has_value());
    REQUIRE(*parsed == test::kT0);
}

TEST_CASE("RFC 3339 parser rejects malformed input", "[clock]")
{
    for (const char *bad : {"2023-11-14", "2023-11-14T22:13:20", "2023-11-14T22:13:20+01:00",
                            "2023-02-30T00:00:00Z", "2023-11-14T24:00:00Z", "not a timestamp"})
    {
        auto parsed = parse_rfc3339(bad);
        REQUIRE_FALSE(parsed.has_value());
        REQUIRE(parsed.error().code == ErrorCode::MalformedRecord);
    }
}

TEST_CASE("Clock integrity tolerance is exclusive", "[clock]")
{
    ClockIntegrityChecker checker(24h);

    REQUIRE(checker.check(test::kT0, test::kT0));
    REQUIRE(checker.check(test::kT0 + 23h, test::kT0));
    REQUIRE(checker.check(test::kT0 - 23h, test::kT0));
    REQUIRE_FALSE(checker.check(test::kT0 + 24h, test::kT0));
    REQUIRE_FALSE(checker.check(test::kT0, test::kT0 + 48h));
}

TEST_CASE("Clock integrity fails closed when a source is unavailable", "[clock]")
{
    ManualClock local;
    ManualClock reference;
    ClockIntegrityChecker checker;

    REQUIRE(checker.check(local, reference));

    local.set_available(false);
    REQUIRE_FALSE(checker.check(local, reference));

    local.set_available(true);
    reference.set_available(false);
    REQUIRE_FALSE(checker.check(local, reference));
}

TEST_CASE("Monotonic reference clock advances from its base", "[clock]")
{
    auto steady_base = std::chrono::steady_clock::now() - 90s;
    MonotonicReferenceClock reference(test::kT0, steady_base);

    auto now = reference.now();
    REQUIRE(now.has_value());
    REQUIRE(*now >= test::kT0 + 90s);
    REQUIRE(*now < test::kT0 + 1h);
}

TEST_CASE("A high-water mark holds the reference clock forward", "[clock]")
{
    auto wall = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());

    MonotonicReferenceClock ahead(wall + std::chrono::days{3});
    REQUIRE(*ahead.now() >= wall + std::chrono::days{3});

    // A mark in the past leaves the system clock in charge
    MonotonicReferenceClock behind(wall - std::chrono::days{3});
    REQUIRE(*behind.now() >= wall);
    REQUIRE(*behind.now() < wall + 1h);
}

TEST_CASE("High-water mark file only moves forward", "[clock]")
{
    const std::string path = "warden_test_clock_state";
    std::remove(path.c_str());
    HighWaterMarkFile state(path);

    auto empty = state.load();
    REQUIRE(empty.has_value());
    REQUIRE_FALSE(empty->has_value());

    REQUIRE(state.store(test::kT0).has_value());
    REQUIRE(*state.load().value() == test::kT0);

    REQUIRE(state.store(test::kT0 + 2h).has_value());
    REQUIRE(state.store(test::kT0 - std::chrono::days{5}).has_value());
    REQUIRE(*state.load().value() == test::kT0 + 2h);

    {
        std::ofstream out(path, std::ios::trunc);
        out << "yesterday\n";
    }
    auto corrupt = state.load();
    REQUIRE_FALSE(corrupt.has_value());
    REQUIRE(corrupt.error().code == ErrorCode::InvalidInput);
    REQUIRE(state.store(test::kT0).error().code == ErrorCode::InvalidInput);

    std::remove(path.c_str());
}
