#pragma once

#include "rate_limiter.hpp"
#include "session.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace warden
{

    /**
     * Answers "may identity X use feature Y now". Every denial looks the
     * same to the caller: unknown identity, expired session, exhausted
     * quota, missing feature and rate limiting all return false.
     */
    class FeatureGate
    {
    public:
        explicit FeatureGate(std::shared_ptr<SessionStore> store,
                             std::optional<AccessRateLimiter::Config> rate_limit = std::nullopt);

        /** Counts one access against the identity's session */
        bool check_access(std::string_view identity, std::string_view feature);

        std::vector<std::string> list_features(std::string_view identity) const;

        /** Operator report for one identity */
        nlohmann::json security_status(std::string_view identity) const;

    private:
        std::shared_ptr<SessionStore> store_;
        std::unique_ptr<AccessRateLimiter> limiter_;
    };

} // namespace warden
