#include "warden/warden.hpp"
#include "warden/logging.hpp"

namespace warden
{

    namespace
    {
        Warden::Collaborators with_defaults(Warden::Collaborators c, const WardenConfig &cfg)
        {
            if (!c.local_clock)
                c.local_clock = std::make_shared<SystemClock>();
            if (!c.reference_clock)
            {
                if (c.last_seen)
                    c.reference_clock = std::make_shared<MonotonicReferenceClock>(*c.last_seen);
                else
                    c.reference_clock = std::make_shared<MonotonicReferenceClock>();
            }
            if (!c.environment)
            {
                if (cfg.environment.reject_debugger)
                    c.environment = std::make_shared<TracerAttestor>();
                else
                    c.environment = std::make_shared<PermissiveEnvironment>();
            }
            return c;
        }
    } // namespace

    Warden::Warden(const WardenConfig &cfg, crypto::Bytes sealed_payload, Collaborators collaborators)
        : diagnostics_(std::make_shared<DiagnosticsLog>(cfg.logging.diagnostics_capacity))
    {
        if (cfg.using_placeholder_secrets())
        {
            logging::get()->warn("using placeholder secrets; provision [secrets] or WARDEN_*_SECRET for production");
        }

        auto c = with_defaults(std::move(collaborators), cfg);

        ValidationPipeline::Options options{cfg.entitlement.validity_window, cfg.entitlement.clock_tolerance};
        pipeline_ = std::make_shared<ValidationPipeline>(options,
                                                         SignatureCodec(cfg.secrets.signing_secret),
                                                         c.local_clock,
                                                         c.reference_clock,
                                                         c.environment);
        unlock_engine_ = std::make_shared<PayloadUnlockEngine>(cfg.secrets.payload_secret, std::move(sealed_payload));
        store_ = std::make_shared<SessionStore>(pipeline_, unlock_engine_, cfg.session, diagnostics_);

        std::optional<AccessRateLimiter::Config> rate_limit;
        if (cfg.gate.rate_limit)
            rate_limit = cfg.gate.limiter;
        gate_ = std::make_unique<FeatureGate>(store_, rate_limit);
    }

    Warden::~Warden()
    {
        store_->clear();
    }

    Result<SessionHandle> Warden::activate(std::string_view entitlement_bytes)
    {
        auto handle = store_->activate(entitlement_bytes);
        if (!handle)
        {
            return std::unexpected(WardenError::activation_failed());
        }
        return handle;
    }

    bool Warden::is_live(const SessionHandle &handle) const
    {
        return store_->is_live(handle);
    }

    void Warden::teardown(const SessionHandle &handle)
    {
        store_->teardown(handle);
    }

    bool Warden::is_feature_available(std::string_view identity, std::string_view feature)
    {
        return gate_->check_access(identity, feature);
    }

    std::vector<std::string> Warden::list_features(std::string_view identity) const
    {
        return gate_->list_features(identity);
    }

    Result<RuleSetView> Warden::get_rule_set(std::string_view identity) const
    {
        return store_->rule_set(identity);
    }

    nlohmann::json Warden::security_status(std::string_view identity) const
    {
        return gate_->security_status(identity);
    }

    std::optional<Timestamp> Warden::high_water_mark() const
    {
        return pipeline_->reference_clock()->now();
    }

} // namespace warden
