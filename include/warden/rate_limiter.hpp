#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace warden
{
    /**
     * Thread-safe token-bucket limiter keyed by identity.
     * Defaults: 60 accesses per minute with a burst of 60.
     */
    class AccessRateLimiter
    {
    public:
        using TimePoint = std::chrono::steady_clock::time_point;

        struct Config
        {
            double tokens_per_second{1.0};
            double burst_capacity{60.0};
        };

        AccessRateLimiter();
        explicit AccessRateLimiter(const Config &cfg);

        /** Takes a token for `identity` if one is available. */
        bool allow(std::string_view identity);
        bool allow(std::string_view identity, TimePoint now);

        /** Forget an identity's bucket */
        void reset(std::string_view identity);

        const Config &config() const { return cfg_; }

    private:
        struct Bucket
        {
            double tokens{0.0};
            TimePoint last_refill{};
            bool primed{false};
        };

        void refill(Bucket &bucket, TimePoint now) const;

        Config cfg_;
        std::unordered_map<std::string, Bucket> buckets_;
        std::mutex mutex_;
    };
}
