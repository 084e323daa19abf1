#include <catch2/catch_test_macros.hpp>
#include "test_support.hpp"
#include <cstdio>
#include <fstream>

using namespace warden;

TEST_CASE("Sealed payload unlocks only for its identity", "[payload]")
{
    if (!crypto::AES256GCM::is_available())
        SKIP("AES-256-GCM unavailable on this CPU");

    PayloadUnlockEngine engine(test::payload_secret(), test::sealed_for("cust-1"));

    auto rules = engine.unlock("cust-1");
    REQUIRE(rules.has_value());
    REQUIRE(rules->prompts.at("summary") == "Summarize the module in one paragraph.");
    REQUIRE(rules->patterns.at("module") == std::vector<std::string>{"^mod_[a-z]+$", "^lib_"});
    REQUIRE(rules->confidence_thresholds.at("function") == 0.65);

    auto other = engine.unlock("cust-2");
    REQUIRE_FALSE(other.has_value());
    REQUIRE(other.error().code == ErrorCode::DecryptionFailed);
}

TEST_CASE("Key derivation is deterministic per identity", "[payload]")
{
    PayloadUnlockEngine engine(test::payload_secret(), {});
    REQUIRE(engine.derive_key("cust-1") == engine.derive_key("cust-1"));
    REQUIRE_FALSE(engine.derive_key("cust-1") == engine.derive_key("cust-2"));

    PayloadUnlockEngine other(crypto::SecretBytes("another-deployment"), {});
    REQUIRE_FALSE(engine.derive_key("cust-1") == other.derive_key("cust-1"));
}

TEST_CASE("Decryption failures never yield a partial rule set", "[payload]")
{
    if (!crypto::AES256GCM::is_available())
        SKIP("AES-256-GCM unavailable on this CPU");

    PayloadUnlockEngine engine(test::payload_secret(), {});
    auto sealed = test::sealed_for("cust-1");
    auto key = engine.derive_key("cust-1");

    SECTION("wrong key")
    {
        auto result = PayloadUnlockEngine::decrypt(sealed, engine.derive_key("cust-9"));
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ErrorCode::DecryptionFailed);
    }

    SECTION("tampered nonce")
    {
        sealed[0] ^= 0x01;
        auto result = PayloadUnlockEngine::decrypt(sealed, key);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ErrorCode::DecryptionFailed);
    }

    SECTION("tampered tag")
    {
        sealed.back() ^= 0x01;
        REQUIRE(PayloadUnlockEngine::decrypt(sealed, key).error().code == ErrorCode::DecryptionFailed);
    }

    SECTION("truncated blob")
    {
        crypto::Bytes truncated(sealed.begin(), sealed.begin() + 20);
        REQUIRE(PayloadUnlockEngine::decrypt(truncated, key).error().code == ErrorCode::DecryptionFailed);
    }

    SECTION("authenticated but not a rule set")
    {
        std::string text = "{\"patterns\": {}}";
        auto blob = crypto::AES256GCM::encrypt(key.bytes(), crypto::Bytes(text.begin(), text.end()));
        REQUIRE(blob.has_value());
        REQUIRE(PayloadUnlockEngine::decrypt(*blob, key).error().code == ErrorCode::DecryptionFailed);
    }
}

TEST_CASE("Rule sets accept the flat legacy layout", "[payload]")
{
    auto j = nlohmann::json::parse(R"({
        "module_patterns": ["^mod_"],
        "function_patterns": ["^fn_", "^do_"],
        "llm_prompts": {"summary": "Summarize."},
        "confidence_thresholds": {"module": 0.9}
    })");

    auto rules = RuleSet::from_json(j);
    REQUIRE(rules.has_value());
    REQUIRE(rules->patterns.at("module") == std::vector<std::string>{"^mod_"});
    REQUIRE(rules->patterns.at("function") == std::vector<std::string>{"^fn_", "^do_"});
    REQUIRE(rules->prompts.at("summary") == "Summarize.");
    REQUIRE(rules->confidence_thresholds.at("module") == 0.9);
}

TEST_CASE("Rule set validation", "[payload]")
{
    auto base = test::sample_rules().to_json();

    SECTION("threshold outside [0,1]")
    {
        base["confidence_thresholds"]["module"] = 1.5;
        REQUIRE_FALSE(RuleSet::from_json(base).has_value());
    }

    SECTION("unknown section")
    {
        base["extra"] = true;
        REQUIRE_FALSE(RuleSet::from_json(base).has_value());
    }

    SECTION("missing prompts")
    {
        base.erase("prompts");
        REQUIRE_FALSE(RuleSet::from_json(base).has_value());
    }

    SECTION("non-string pattern")
    {
        base["patterns"]["module"] = nlohmann::json::array({"^ok", 3});
        REQUIRE_FALSE(RuleSet::from_json(base).has_value());
    }
}

TEST_CASE("Pattern order survives sealing", "[payload]")
{
    if (!crypto::AES256GCM::is_available())
        SKIP("AES-256-GCM unavailable on this CPU");

    RuleSet rules = test::sample_rules();
    rules.patterns["module"] = {"zeta", "alpha", "mid"};

    PayloadUnlockEngine issuer(test::payload_secret(), {});
    auto sealed = issuer.seal(rules, "cust-1");
    REQUIRE(sealed.has_value());

    PayloadUnlockEngine engine(test::payload_secret(), *sealed);
    auto unlocked = engine.unlock("cust-1");
    REQUIRE(unlocked.has_value());
    REQUIRE(unlocked->patterns.at("module") == std::vector<std::string>{"zeta", "alpha", "mid"});
}

TEST_CASE("Wiping a rule set empties it", "[payload]")
{
    auto rules = test::sample_rules();
    rules.wipe();
    REQUIRE(rules.patterns.empty());
    REQUIRE(rules.prompts.empty());
    REQUIRE(rules.confidence_thresholds.empty());
}

TEST_CASE("Sealed payloads load from disk", "[payload]")
{
    auto missing = PayloadUnlockEngine::load_sealed("/nonexistent/warden/rules.sealed");
    REQUIRE_FALSE(missing.has_value());
    REQUIRE(missing.error().code == ErrorCode::IOError);

    const std::string path = "warden_test_rules.sealed";
    crypto::Bytes blob{0x00, 0x01, 0xfe, 0xff, 0x0a};
    {
        std::ofstream out(path, std::ios::binary);
        out.write(reinterpret_cast<const char *>(blob.data()), static_cast<std::streamsize>(blob.size()));
    }
    auto loaded = PayloadUnlockEngine::load_sealed(path);
    std::remove(path.c_str());
    REQUIRE(loaded.has_value());
    REQUIRE(*loaded == blob);
}
