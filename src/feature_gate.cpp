#include "warden/feature_gate.hpp"

namespace warden
{

    FeatureGate::FeatureGate(std::shared_ptr<SessionStore> store,
                             std::optional<AccessRateLimiter::Config> rate_limit)
        : store_(std::move(store))
    {
        if (!store_)
        {
            throw WardenError::config("Feature gate requires a session store");
        }
        if (rate_limit)
        {
            limiter_ = std::make_unique<AccessRateLimiter>(*rate_limit);
        }
    }

    bool FeatureGate::check_access(std::string_view identity, std::string_view feature)
    {
        bool allowed = store_->record_access(identity, feature);
        if (!allowed)
            return false;
        return !limiter_ || limiter_->allow(identity);
    }

    std::vector<std::string> FeatureGate::list_features(std::string_view identity) const
    {
        return store_->features(identity);
    }

    nlohmann::json FeatureGate::security_status(std::string_view identity) const
    {
        auto status = store_->status(identity);
        if (!status)
        {
            return nlohmann::json{{"license_valid", false}};
        }

        const auto &pipeline = store_->pipeline();
        auto window = pipeline.options().validity_window;
        auto now = pipeline.local_clock()->now();

        return nlohmann::json{
            {"license_valid", status->live},
            {"license_id", status->record.license_id},
            {"days_remaining", now ? status->record.days_remaining(*now, window) : 0},
            {"authoritative_expiry", format_rfc3339(status->record.authoritative_expiry(window))},
            {"session_start", format_rfc3339(status->started_at)},
            {"access_count", status->access_count},
            {"access_limit", store_->policy().max_access_count},
            {"watermark", status->watermark}};
    }

} // namespace warden
