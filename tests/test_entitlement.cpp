#include <catch2/catch_test_macros.hpp>
#include "test_support.hpp"
#include "warden/entitlement.hpp"
#include <cstdio>
#include <fstream>

using namespace warden;
using namespace std::chrono_literals;

namespace
{
    nlohmann::json valid_json()
    {
        return nlohmann::json{
            {"license_id", "lic-001"},
            {"identity", "cust-1"},
            {"features", {"analysis", "export"}},
            {"issued_at", "2023-11-14T22:13:20Z"},
            {"expires_at", "2023-11-28T22:13:20Z"},
            {"anchor_timestamp", 1700000000},
            {"signature", std::string(64, 'a')},
            {"metadata", {{"tier", "pro"}}}};
    }

    ErrorCode parse_error(const nlohmann::json &j)
    {
        auto record = EntitlementRecord::parse(j.dump());
        REQUIRE_FALSE(record.has_value());
        return record.error().code;
    }
}

TEST_CASE("Entitlement parses the wire format", "[entitlement]")
{
    auto record = EntitlementRecord::parse(valid_json().dump());
    REQUIRE(record.has_value());
    REQUIRE(record->identity == "cust-1");
    REQUIRE(record->license_id == "lic-001");
    REQUIRE(record->features == std::set<std::string>{"analysis", "export"});
    REQUIRE(record->anchor_timestamp == test::kT0);
    REQUIRE(record->issued_at == test::kT0);
    REQUIRE(record->expires_at == test::kT0 + std::chrono::days{14});
    REQUIRE(record->metadata.at("tier") == "pro");
    REQUIRE(record->has_feature("export"));
    REQUIRE_FALSE(record->has_feature("admin"));
}

TEST_CASE("Entitlement serialization preserves every field", "[entitlement]")
{
    auto original = valid_json();
    auto record = EntitlementRecord::from_json(original);
    REQUIRE(record.has_value());
    REQUIRE(record->to_json() == original);
}

TEST_CASE("Optional fields may be omitted", "[entitlement]")
{
    auto j = valid_json();
    j.erase("license_id");
    j.erase("metadata");
    auto record = EntitlementRecord::from_json(j);
    REQUIRE(record.has_value());
    REQUIRE(record->license_id.empty());
    REQUIRE(record->metadata.empty());
}

TEST_CASE("Malformed entitlements are rejected", "[entitlement]")
{
    SECTION("not JSON")
    {
        auto record = EntitlementRecord::parse("{identity: cust-1");
        REQUIRE_FALSE(record.has_value());
        REQUIRE(record.error().code == ErrorCode::MalformedRecord);
    }

    SECTION("not an object")
    {
        REQUIRE(parse_error(nlohmann::json::array({1, 2})) == ErrorCode::MalformedRecord);
    }

    SECTION("missing required field")
    {
        for (const char *field : {"identity", "features", "issued_at", "expires_at", "anchor_timestamp", "signature"})
        {
            auto j = valid_json();
            j.erase(field);
            REQUIRE(parse_error(j) == ErrorCode::MalformedRecord);
        }
    }

    SECTION("unknown field")
    {
        auto j = valid_json();
        j["grace_days"] = 3;
        REQUIRE(parse_error(j) == ErrorCode::MalformedRecord);
    }

    SECTION("empty identity")
    {
        auto j = valid_json();
        j["identity"] = "";
        REQUIRE(parse_error(j) == ErrorCode::MalformedRecord);
    }

    SECTION("duplicate feature")
    {
        auto j = valid_json();
        j["features"] = {"analysis", "analysis"};
        REQUIRE(parse_error(j) == ErrorCode::MalformedRecord);
    }

    SECTION("feature of the wrong type")
    {
        auto j = valid_json();
        j["features"] = {"analysis", 7};
        REQUIRE(parse_error(j) == ErrorCode::MalformedRecord);
    }

    SECTION("issued after expiry")
    {
        auto j = valid_json();
        j["issued_at"] = "2023-12-01T00:00:00Z";
        REQUIRE(parse_error(j) == ErrorCode::MalformedRecord);
    }

    SECTION("timestamp not RFC 3339")
    {
        auto j = valid_json();
        j["expires_at"] = "28/11/2023";
        REQUIRE(parse_error(j) == ErrorCode::MalformedRecord);
    }

    SECTION("anchor is not an integer")
    {
        auto j = valid_json();
        j["anchor_timestamp"] = "1700000000";
        REQUIRE(parse_error(j) == ErrorCode::MalformedRecord);
    }

    SECTION("anchor beyond the calendar")
    {
        auto j = valid_json();
        j["anchor_timestamp"] = std::int64_t{9223372036854775797};
        REQUIRE(parse_error(j) == ErrorCode::MalformedRecord);
        j["anchor_timestamp"] = kMaxUnixSeconds + 1;
        REQUIRE(parse_error(j) == ErrorCode::MalformedRecord);
        j["anchor_timestamp"] = std::uint64_t{18446744073709551615u};
        REQUIRE(parse_error(j) == ErrorCode::MalformedRecord);
    }

    SECTION("metadata value is not a string")
    {
        auto j = valid_json();
        j["metadata"] = {{"seats", 5}};
        REQUIRE(parse_error(j) == ErrorCode::MalformedRecord);
    }
}

TEST_CASE("Authoritative expiry derives from the anchor only", "[entitlement]")
{
    auto j = valid_json();
    j["expires_at"] = "2099-01-01T00:00:00Z";
    auto record = EntitlementRecord::from_json(j);
    REQUIRE(record.has_value());

    auto window = std::chrono::seconds{std::chrono::days{14}};
    REQUIRE(record->authoritative_expiry(window) == test::kT0 + std::chrono::days{14});
    REQUIRE(record->days_remaining(test::kT0, window) == 14);
    REQUIRE(record->days_remaining(test::kT0 + std::chrono::days{13} + 1h, window) == 0);
    REQUIRE(record->days_remaining(test::kT0 + std::chrono::days{12}, window) == 2);
    REQUIRE(record->days_remaining(test::kT0 + std::chrono::days{20}, window) == 0);
}

TEST_CASE("The last representable second is a valid anchor", "[entitlement]")
{
    auto j = valid_json();
    j["anchor_timestamp"] = kMaxUnixSeconds;
    auto record = EntitlementRecord::from_json(j);
    REQUIRE(record.has_value());
    REQUIRE(to_unix(record->anchor_timestamp) == kMaxUnixSeconds);

    auto window = std::chrono::seconds{std::chrono::days{36500}};
    REQUIRE(record->authoritative_expiry(window) > record->anchor_timestamp);
}

TEST_CASE("Entitlement load reports missing files as IO errors", "[entitlement]")
{
    auto missing = EntitlementRecord::load("/nonexistent/warden/license.json");
    REQUIRE_FALSE(missing.has_value());
    REQUIRE(missing.error().code == ErrorCode::IOError);

    const std::string path = "warden_test_license.json";
    {
        std::ofstream out(path);
        out << valid_json().dump(2);
    }
    auto loaded = EntitlementRecord::load(path);
    std::remove(path.c_str());
    REQUIRE(loaded.has_value());
    REQUIRE(loaded->identity == "cust-1");
}
