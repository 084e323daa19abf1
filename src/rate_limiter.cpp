#include "warden/rate_limiter.hpp"
#include <algorithm>

namespace warden
{
    AccessRateLimiter::AccessRateLimiter() : cfg_{} {}

    AccessRateLimiter::AccessRateLimiter(const Config &cfg) : cfg_(cfg) {}

    void AccessRateLimiter::refill(Bucket &bucket, TimePoint now) const
    {
        if (!bucket.primed)
        {
            bucket.primed = true;
            bucket.last_refill = now;
            bucket.tokens = cfg_.burst_capacity;
            return;
        }
        auto elapsed = std::chrono::duration<double>(now - bucket.last_refill).count();
        if (elapsed <= 0)
            return;
        bucket.tokens = std::min(cfg_.burst_capacity, bucket.tokens + elapsed * cfg_.tokens_per_second);
        bucket.last_refill = now;
    }

    bool AccessRateLimiter::allow(std::string_view identity)
    {
        return allow(identity, std::chrono::steady_clock::now());
    }

    bool AccessRateLimiter::allow(std::string_view identity, TimePoint now)
    {
        std::lock_guard lock(mutex_);
        auto &bucket = buckets_[std::string(identity)];
        refill(bucket, now);
        if (bucket.tokens < 1.0)
        {
            return false;
        }
        bucket.tokens -= 1.0;
        return true;
    }

    void AccessRateLimiter::reset(std::string_view identity)
    {
        std::lock_guard lock(mutex_);
        buckets_.erase(std::string(identity));
    }

} // namespace warden
