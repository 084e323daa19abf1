#pragma once

#include "audit.hpp"
#include "clock.hpp"
#include "config.hpp"
#include "environment.hpp"
#include "feature_gate.hpp"
#include "payload.hpp"
#include "session.hpp"
#include "validation.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace warden
{

    /**
     * Entitlement service context. Owns the validation pipeline, payload
     * unlock engine, session store, feature gate and diagnostics channel for
     * its lifetime; all sessions are released on destruction.
     *
     * Activation failures are reported to the caller only as ActivationFailed.
     * The specific reason is recorded in diagnostics().
     */
    class Warden
    {
    public:
        /** Optional overrides; unset members get the production defaults */
        struct Collaborators
        {
            std::shared_ptr<const Clock> local_clock;
            std::shared_ptr<const Clock> reference_clock;
            std::shared_ptr<const EnvironmentAttestor> environment;
            // Seeds the default reference clock; ignored when reference_clock is set
            std::optional<Timestamp> last_seen;
        };

        Warden(const WardenConfig &cfg, crypto::Bytes sealed_payload, Collaborators collaborators = {});
        ~Warden();

        Warden(const Warden &) = delete;
        Warden &operator=(const Warden &) = delete;

        Result<SessionHandle> activate(std::string_view entitlement_bytes);

        bool is_live(const SessionHandle &handle) const;

        void teardown(const SessionHandle &handle);

        bool is_feature_available(std::string_view identity, std::string_view feature);

        std::vector<std::string> list_features(std::string_view identity) const;

        Result<RuleSetView> get_rule_set(std::string_view identity) const;

        nlohmann::json security_status(std::string_view identity) const;

        /** Reference time to persist for the next run's reference clock */
        std::optional<Timestamp> high_water_mark() const;

        const DiagnosticsLog &diagnostics() const { return *diagnostics_; }
        SessionStore &sessions() { return *store_; }
        const ValidationPipeline &pipeline() const { return *pipeline_; }

    private:
        std::shared_ptr<DiagnosticsLog> diagnostics_;
        std::shared_ptr<const ValidationPipeline> pipeline_;
        std::shared_ptr<const PayloadUnlockEngine> unlock_engine_;
        std::shared_ptr<SessionStore> store_;
        std::unique_ptr<FeatureGate> gate_;
    };

} // namespace warden
