#include <catch2/catch_test_macros.hpp>
#include "warden/audit.hpp"

using namespace warden;

namespace
{
    AuditEvent event(std::string identity, std::string result)
    {
        return AuditEvent{"2023-11-14T22:13:20.000Z", std::move(identity), "activate", "signature",
                          std::move(result), nlohmann::json::object()};
    }
}

TEST_CASE("Audit chain links events", "[audit]")
{
    AuditChain chain;
    REQUIRE_FALSE(chain.head().has_value());

    std::vector<AuditEvent> events{event("cust-1", "ok"), event("cust-2", "SignatureMismatch")};
    auto first = chain.append(events[0]);
    auto second = chain.append(events[1]);

    REQUIRE(first.size() == 64);
    REQUIRE(first != second);
    REQUIRE(chain.length() == 2);
    REQUIRE(chain.head() == second);
    REQUIRE(second == AuditChain::link(first, events[1]));

    REQUIRE(AuditChain::verify(events, second));

    events[0].result = "ExpiredEntitlement";
    REQUIRE_FALSE(AuditChain::verify(events, second));
}

TEST_CASE("Diagnostics keep a bounded history", "[audit]")
{
    DiagnosticsLog log(3);
    for (int i = 0; i < 5; ++i)
        log.record(event("cust-" + std::to_string(i), "ok"));

    auto recent = log.recent();
    REQUIRE(recent.size() == 3);
    REQUIRE(recent.front().identity == "cust-2");
    REQUIRE(recent.back().identity == "cust-4");
    REQUIRE(log.chain_head().has_value());
}

TEST_CASE("Diagnostics report the latest failed activation", "[audit]")
{
    DiagnosticsLog log;
    REQUIRE_FALSE(log.last_failure("cust-1").has_value());

    log.record_failure("cust-1", "activate", "expiration", WardenError::expired("old"));
    log.record_failure("cust-1", "activate", "signature", WardenError::signature("bad tag"));
    log.record(event("cust-1", "ok"));

    auto failure = log.last_failure("cust-1");
    REQUIRE(failure.has_value());
    REQUIRE(failure->layer == "signature");
    REQUIRE(failure->result == "SignatureMismatch");
    REQUIRE(failure->details["message"] == "bad tag");

    REQUIRE_FALSE(log.last_failure("cust-2").has_value());
}
