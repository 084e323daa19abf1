#pragma once

#include "clock.hpp"
#include "entitlement.hpp"
#include "environment.hpp"
#include "signature.hpp"
#include "types.hpp"
#include <chrono>
#include <expected>
#include <memory>
#include <string_view>

namespace warden
{

    enum class ValidationLayer
    {
        Structure,
        Expiration,
        Anchor,
        ClockIntegrity,
        Signature,
        Environment
    };

    std::string_view layer_name(ValidationLayer layer);

    struct ValidationFailure
    {
        ValidationLayer layer;
        WardenError error;
    };

    template <typename T>
    using Verdict = std::expected<T, ValidationFailure>;

    /**
     * Ordered, short-circuiting chain of entitlement checks:
     *   1. structure, 2. authoritative expiration (anchor + window),
     *   3. anchor not in the future, 4. clock integrity, 5. signature,
     *   6. environment attestation.
     *
     * The failing layer is reported for operator diagnostics only; callers
     * of the service facade get a binary outcome.
     */
    class ValidationPipeline
    {
    public:
        struct Options
        {
            std::chrono::seconds validity_window{std::chrono::days{14}};
            std::chrono::seconds clock_tolerance{ClockIntegrityChecker::kDefaultTolerance};
        };

        ValidationPipeline(Options options,
                           SignatureCodec codec,
                           std::shared_ptr<const Clock> local_clock,
                           std::shared_ptr<const Clock> reference_clock,
                           std::shared_ptr<const EnvironmentAttestor> environment);

        /** All six layers over raw entitlement bytes */
        Verdict<EntitlementRecord> run(std::string_view entitlement_bytes) const;

        /** Layers 2..6 over an already parsed record */
        Verdict<void> revalidate(const EntitlementRecord &record) const;

        Result<EntitlementRecord> check_structure(std::string_view entitlement_bytes) const;
        Result<void> check_expiration(const EntitlementRecord &record, Timestamp now) const;
        Result<void> check_anchor(const EntitlementRecord &record, Timestamp now) const;
        Result<void> check_clock() const;
        Result<void> check_signature(const EntitlementRecord &record) const;
        Result<void> check_environment() const;

        const Options &options() const { return options_; }
        const SignatureCodec &codec() const { return codec_; }
        std::shared_ptr<const Clock> local_clock() const { return local_clock_; }
        std::shared_ptr<const Clock> reference_clock() const { return reference_clock_; }

    private:
        Options options_;
        SignatureCodec codec_;
        ClockIntegrityChecker clock_checker_;
        std::shared_ptr<const Clock> local_clock_;
        std::shared_ptr<const Clock> reference_clock_;
        std::shared_ptr<const EnvironmentAttestor> environment_;
    };

} // namespace warden
