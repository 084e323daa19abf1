#pragma once

#include "types.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace warden
{
    using Timestamp = std::chrono::sys_seconds;

    /** 9999-12-31T23:59:59Z, the last instant RFC 3339 can express */
    inline constexpr std::int64_t kMaxUnixSeconds = 253402300799;

    /** Format as RFC 3339 UTC: YYYY-MM-DDTHH:MM:SSZ */
    std::string format_rfc3339(Timestamp ts);

    /** Parse RFC 3339 UTC (second precision, trailing 'Z' required) */
    Result<Timestamp> parse_rfc3339(const std::string &text);

    inline std::int64_t to_unix(Timestamp ts)
    {
        return ts.time_since_epoch().count();
    }

    inline Timestamp from_unix(std::int64_t seconds)
    {
        return Timestamp{std::chrono::seconds{seconds}};
    }

    /**
     * A time source. An empty result means the source is unavailable and
     * callers must treat it as a failure.
     */
    class Clock
    {
    public:
        virtual ~Clock() = default;
        virtual std::optional<Timestamp> now() const = 0;
    };

    class SystemClock : public Clock
    {
    public:
        std::optional<Timestamp> now() const override;
    };

    /**
     * Wall time captured once at construction, advanced by the steady clock.
     * Rolling the system clock back after construction does not move it.
     *
     * Seeded with a high-water mark, the base is the later of the system
     * clock and the mark, so a rollback made before launch is still caught.
     */
    class MonotonicReferenceClock : public Clock
    {
    public:
        MonotonicReferenceClock();
        explicit MonotonicReferenceClock(Timestamp high_water_mark);
        MonotonicReferenceClock(Timestamp base, std::chrono::steady_clock::time_point steady_base);

        std::optional<Timestamp> now() const override;

    private:
        Timestamp base_;
        std::chrono::steady_clock::time_point steady_base_;
    };

    /**
     * Last reference time seen by a previous run, kept as unix seconds in a
     * text file. The mark only moves forward.
     */
    class HighWaterMarkFile
    {
    public:
        explicit HighWaterMarkFile(std::string path);

        /** Empty when no mark has been stored yet */
        Result<std::optional<Timestamp>> load() const;

        /** Store the later of `seen` and the current mark */
        Result<void> store(Timestamp seen) const;

        const std::string &path() const { return path_; }

    private:
        std::string path_;
    };

    /**
     * Detects divergence between a local clock and an independent reference.
     */
    class ClockIntegrityChecker
    {
    public:
        static constexpr std::chrono::seconds kDefaultTolerance{std::chrono::hours{24}};

        explicit ClockIntegrityChecker(std::chrono::seconds tolerance = kDefaultTolerance);

        /** Passes iff |local - reference| < tolerance */
        bool check(Timestamp local, Timestamp reference) const;

        /** Samples both clocks; an unavailable source fails the check. */
        bool check(const Clock &local, const Clock &reference) const;

        std::chrono::seconds tolerance() const { return tolerance_; }

    private:
        std::chrono::seconds tolerance_;
    };

} // namespace warden
