#include <catch2/catch_test_macros.hpp>
#include "test_support.hpp"
#include "warden/feature_gate.hpp"

using namespace warden;
using namespace std::chrono_literals;
using test::ManualClock;

namespace
{
    struct GateFixture
    {
        std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>(test::kT0 + 1h);
        std::shared_ptr<SessionStore> store;

        explicit GateFixture(std::uint64_t max_access_count = 1000)
        {
            SessionPolicy policy;
            policy.max_access_count = max_access_count;
            store = std::make_shared<SessionStore>(
                test::make_pipeline(clock, clock),
                std::make_shared<PayloadUnlockEngine>(test::payload_secret(), test::sealed_for("cust-1")),
                policy);
        }
    };
}

TEST_CASE("Gate grants only licensed features", "[feature_gate]")
{
    if (!crypto::AES256GCM::is_available())
        SKIP("AES-256-GCM unavailable on this CPU");

    GateFixture f;
    FeatureGate gate(f.store);
    REQUIRE(f.store->activate(test::issue("cust-1", {"analysis"}).dump()).has_value());

    REQUIRE(gate.check_access("cust-1", "analysis"));
    REQUIRE_FALSE(gate.check_access("cust-1", "export"));
    REQUIRE_FALSE(gate.check_access("cust-2", "analysis"));
    REQUIRE(gate.list_features("cust-1") == std::vector<std::string>{"analysis"});
    REQUIRE(gate.list_features("cust-2").empty());
}

TEST_CASE("Every check counts once, granted or not", "[feature_gate]")
{
    if (!crypto::AES256GCM::is_available())
        SKIP("AES-256-GCM unavailable on this CPU");

    GateFixture f;
    FeatureGate gate(f.store);
    REQUIRE(f.store->activate(test::issue("cust-1", {"analysis"}).dump()).has_value());

    gate.check_access("cust-1", "analysis");
    gate.check_access("cust-1", "export");
    gate.check_access("cust-1", "analysis");

    REQUIRE(f.store->status("cust-1")->access_count == 3);
}

TEST_CASE("Reaching the access cap ends the session", "[feature_gate]")
{
    if (!crypto::AES256GCM::is_available())
        SKIP("AES-256-GCM unavailable on this CPU");

    GateFixture f(2);
    FeatureGate gate(f.store);
    REQUIRE(f.store->activate(test::issue("cust-1").dump()).has_value());

    REQUIRE(gate.check_access("cust-1", "analysis"));
    REQUIRE(gate.check_access("cust-1", "export"));
    REQUIRE_FALSE(gate.check_access("cust-1", "analysis"));
    REQUIRE(gate.list_features("cust-1").empty());

    // The session ended with the access that reached the cap
    REQUIRE(gate.security_status("cust-1") == nlohmann::json{{"license_valid", false}});
    REQUIRE(f.store->size() == 0);
}

TEST_CASE("Rate limiting applies after the entitlement check", "[feature_gate]")
{
    if (!crypto::AES256GCM::is_available())
        SKIP("AES-256-GCM unavailable on this CPU");

    GateFixture f;
    FeatureGate gate(f.store, AccessRateLimiter::Config{0.0, 2.0});
    REQUIRE(f.store->activate(test::issue("cust-1").dump()).has_value());

    REQUIRE(gate.check_access("cust-1", "analysis"));
    REQUIRE(gate.check_access("cust-1", "analysis"));
    REQUIRE_FALSE(gate.check_access("cust-1", "analysis"));

    // Denied for the license before the limiter is consulted
    REQUIRE_FALSE(gate.check_access("cust-1", "admin"));
}

TEST_CASE("Security status reports the session", "[feature_gate]")
{
    if (!crypto::AES256GCM::is_available())
        SKIP("AES-256-GCM unavailable on this CPU");

    GateFixture f;
    FeatureGate gate(f.store);
    REQUIRE(f.store->activate(test::issue("cust-1").dump()).has_value());
    gate.check_access("cust-1", "analysis");

    auto status = gate.security_status("cust-1");
    REQUIRE(status["license_valid"] == true);
    REQUIRE(status["license_id"] == "lic-001");
    REQUIRE(status["days_remaining"] == 13);
    REQUIRE(status["authoritative_expiry"] == "2023-11-28T22:13:20Z");
    REQUIRE(status["session_start"] == "2023-11-14T23:13:20Z");
    REQUIRE(status["access_count"] == 1);
    REQUIRE(status["access_limit"] == 1000);
    REQUIRE(status["watermark"] == watermark_for("cust-1"));

    REQUIRE(gate.security_status("nobody") == nlohmann::json{{"license_valid", false}});
}
