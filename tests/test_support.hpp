#pragma once

#include "warden/clock.hpp"
#include "warden/crypto.hpp"
#include "warden/environment.hpp"
#include "warden/payload.hpp"
#include "warden/signature.hpp"
#include "warden/validation.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>

namespace warden::test
{
    // 2023-11-14T22:13:20Z
    inline const Timestamp kT0 = from_unix(1'700'000'000);

    /** Clock whose time is set by the test; can also report itself unavailable */
    class ManualClock : public Clock
    {
    public:
        explicit ManualClock(Timestamp start = kT0) : seconds_(to_unix(start)) {}

        std::optional<Timestamp> now() const override
        {
            if (!available_.load())
                return std::nullopt;
            return from_unix(seconds_.load());
        }

        void set(Timestamp t) { seconds_.store(to_unix(t)); }
        void advance(std::chrono::seconds d) { seconds_.fetch_add(d.count()); }
        void set_available(bool available) { available_.store(available); }

    private:
        std::atomic<std::int64_t> seconds_;
        std::atomic<bool> available_{true};
    };

    class RejectingEnvironment : public EnvironmentAttestor
    {
    public:
        Result<void> attest() const override
        {
            return std::unexpected(WardenError::environment("rejected for test"));
        }
    };

    inline crypto::SecretBytes signing_secret()
    {
        return crypto::SecretBytes("test-issuer-secret");
    }

    inline crypto::SecretBytes payload_secret()
    {
        return crypto::SecretBytes("test-payload-secret");
    }

    inline RuleSet sample_rules()
    {
        RuleSet rules;
        rules.patterns["module"] = {"^mod_[a-z]+$", "^lib_"};
        rules.patterns["function"] = {"^fn_"};
        rules.prompts["summary"] = "Summarize the module in one paragraph.";
        rules.prompts["classify"] = "Classify the following symbol.";
        rules.confidence_thresholds["module"] = 0.8;
        rules.confidence_thresholds["function"] = 0.65;
        return rules;
    }

    inline EntitlementRecord issue(std::string identity,
                                   std::set<std::string> features = {"analysis", "export"},
                                   Timestamp anchor = kT0)
    {
        SignatureCodec codec(signing_secret());
        return codec.issue(std::move(identity), std::move(features), anchor, std::chrono::days{14}, "lic-001");
    }

    inline std::shared_ptr<ValidationPipeline> make_pipeline(std::shared_ptr<const Clock> local,
                                                             std::shared_ptr<const Clock> reference,
                                                             std::shared_ptr<const EnvironmentAttestor> environment =
                                                                 std::make_shared<PermissiveEnvironment>())
    {
        return std::make_shared<ValidationPipeline>(ValidationPipeline::Options{},
                                                    SignatureCodec(signing_secret()),
                                                    std::move(local),
                                                    std::move(reference),
                                                    std::move(environment));
    }

    /** Rules sealed for `identity` under payload_secret() */
    inline crypto::Bytes sealed_for(std::string_view identity)
    {
        PayloadUnlockEngine issuer(payload_secret(), {});
        return issuer.seal(sample_rules(), identity).value();
    }
} // namespace warden::test
