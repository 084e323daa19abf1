#include "warden/validation.hpp"
#include "warden/logging.hpp"
#include <format>

namespace warden
{

    std::string_view layer_name(ValidationLayer layer)
    {
        switch (layer)
        {
        case ValidationLayer::Structure:
            return "structure";
        case ValidationLayer::Expiration:
            return "expiration";
        case ValidationLayer::Anchor:
            return "anchor";
        case ValidationLayer::ClockIntegrity:
            return "clock_integrity";
        case ValidationLayer::Signature:
            return "signature";
        case ValidationLayer::Environment:
            return "environment";
        }
        return "unknown";
    }

    ValidationPipeline::ValidationPipeline(Options options,
                                           SignatureCodec codec,
                                           std::shared_ptr<const Clock> local_clock,
                                           std::shared_ptr<const Clock> reference_clock,
                                           std::shared_ptr<const EnvironmentAttestor> environment)
        : options_(options),
          codec_(std::move(codec)),
          clock_checker_(options.clock_tolerance),
          local_clock_(std::move(local_clock)),
          reference_clock_(std::move(reference_clock)),
          environment_(std::move(environment))
    {
        if (!local_clock_ || !reference_clock_ || !environment_)
        {
            throw WardenError::config("Validation pipeline requires clocks and an environment attestor");
        }
    }

    Result<EntitlementRecord> ValidationPipeline::check_structure(std::string_view entitlement_bytes) const
    {
        return EntitlementRecord::parse(entitlement_bytes);
    }

    Result<void> ValidationPipeline::check_expiration(const EntitlementRecord &record, Timestamp now) const
    {
        auto expiry = record.authoritative_expiry(options_.validity_window);
        if (now >= expiry)
        {
            return std::unexpected(WardenError::expired(
                std::format("Entitlement expired at {}", format_rfc3339(expiry))));
        }
        return {};
    }

    Result<void> ValidationPipeline::check_anchor(const EntitlementRecord &record, Timestamp now) const
    {
        if (record.anchor_timestamp > now)
        {
            return std::unexpected(WardenError::clock(
                std::format("Anchor timestamp {} is in the future", format_rfc3339(record.anchor_timestamp))));
        }
        return {};
    }

    Result<void> ValidationPipeline::check_clock() const
    {
        if (!clock_checker_.check(*local_clock_, *reference_clock_))
        {
            return std::unexpected(WardenError::clock("Local clock diverges from reference or is unavailable"));
        }
        return {};
    }

    Result<void> ValidationPipeline::check_signature(const EntitlementRecord &record) const
    {
        if (!codec_.verify(record))
        {
            return std::unexpected(WardenError::signature("Entitlement signature mismatch"));
        }
        return {};
    }

    Result<void> ValidationPipeline::check_environment() const
    {
        return environment_->attest();
    }

    Verdict<void> ValidationPipeline::revalidate(const EntitlementRecord &record) const
    {
        auto fail = [](ValidationLayer layer, const WardenError &error) {
            return std::unexpected(ValidationFailure{layer, error});
        };

        auto now = local_clock_->now();
        if (!now)
            return fail(ValidationLayer::Expiration, WardenError::clock("Local clock unavailable"));

        if (auto r = check_expiration(record, *now); !r)
            return fail(ValidationLayer::Expiration, r.error());
        if (auto r = check_anchor(record, *now); !r)
            return fail(ValidationLayer::Anchor, r.error());
        if (auto r = check_clock(); !r)
            return fail(ValidationLayer::ClockIntegrity, r.error());
        if (auto r = check_signature(record); !r)
            return fail(ValidationLayer::Signature, r.error());
        if (auto r = check_environment(); !r)
            return fail(ValidationLayer::Environment, r.error());
        return {};
    }

    Verdict<EntitlementRecord> ValidationPipeline::run(std::string_view entitlement_bytes) const
    {
        auto record = check_structure(entitlement_bytes);
        if (!record)
        {
            return std::unexpected(ValidationFailure{ValidationLayer::Structure, record.error()});
        }

        if (auto verdict = revalidate(*record); !verdict)
        {
            logging::get()->debug("entitlement for '{}' rejected at layer {}",
                                  record->identity, layer_name(verdict.error().layer));
            return std::unexpected(verdict.error());
        }
        return std::move(*record);
    }

} // namespace warden
