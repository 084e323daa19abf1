#include "warden/clock.hpp"
#include <format>
#include <algorithm>
#include <charconv>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace warden
{

    std::string format_rfc3339(Timestamp ts)
    {
        auto t = static_cast<std::time_t>(to_unix(ts));
        std::tm tm_buf{};
        gmtime_r(&t, &tm_buf);
        return std::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}Z",
                           tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
                           tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec);
    }

    Result<Timestamp> parse_rfc3339(const std::string &text)
    {
        int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
        int consumed = 0;
        if (text.size() != 20 ||
            std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2dZ%n",
                        &year, &month, &day, &hour, &minute, &second, &consumed) != 6 ||
            consumed != 20)
        {
            return std::unexpected(WardenError::malformed("Invalid RFC 3339 timestamp: " + text));
        }

        std::chrono::year_month_day ymd{std::chrono::year{year},
                                        std::chrono::month{static_cast<unsigned>(month)},
                                        std::chrono::day{static_cast<unsigned>(day)}};
        if (!ymd.ok() || hour > 23 || minute > 59 || second > 59)
        {
            return std::unexpected(WardenError::malformed("Timestamp out of range: " + text));
        }

        return std::chrono::sys_days{ymd} + std::chrono::hours{hour} +
               std::chrono::minutes{minute} + std::chrono::seconds{second};
    }

    std::optional<Timestamp> SystemClock::now() const
    {
        return std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
    }

    MonotonicReferenceClock::MonotonicReferenceClock()
        : base_(std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now())),
          steady_base_(std::chrono::steady_clock::now())
    {
    }

    MonotonicReferenceClock::MonotonicReferenceClock(Timestamp high_water_mark)
        : base_(std::max(std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now()), high_water_mark)),
          steady_base_(std::chrono::steady_clock::now())
    {
    }

    MonotonicReferenceClock::MonotonicReferenceClock(Timestamp base,
                                                     std::chrono::steady_clock::time_point steady_base)
        : base_(base), steady_base_(steady_base)
    {
    }

    std::optional<Timestamp> MonotonicReferenceClock::now() const
    {
        auto elapsed = std::chrono::steady_clock::now() - steady_base_;
        return base_ + std::chrono::floor<std::chrono::seconds>(elapsed);
    }

    HighWaterMarkFile::HighWaterMarkFile(std::string path) : path_(std::move(path)) {}

    Result<std::optional<Timestamp>> HighWaterMarkFile::load() const
    {
        std::error_code ec;
        if (!std::filesystem::exists(path_, ec))
        {
            if (ec)
                return std::unexpected(WardenError::io(std::format("Unable to stat {}: {}", path_, ec.message())));
            return std::optional<Timestamp>{};
        }

        std::ifstream file(path_);
        if (!file.is_open())
            return std::unexpected(WardenError::io("Unable to open " + path_));
        std::stringstream buffer;
        buffer << file.rdbuf();
        std::string text = buffer.str();
        while (!text.empty() && (text.back() == '\n' || text.back() == '\r' || text.back() == ' '))
            text.pop_back();

        std::int64_t seconds = 0;
        auto [end, err] = std::from_chars(text.data(), text.data() + text.size(), seconds);
        if (err != std::errc{} || end != text.data() + text.size() || text.empty() ||
            seconds < 0 || seconds > kMaxUnixSeconds)
        {
            return std::unexpected(WardenError::invalid_input("Corrupt clock state in " + path_));
        }
        return std::optional<Timestamp>{from_unix(seconds)};
    }

    Result<void> HighWaterMarkFile::store(Timestamp seen) const
    {
        auto current = load();
        if (!current)
            return std::unexpected(current.error());
        auto mark = *current ? std::max(**current, seen) : seen;

        auto staging = path_ + ".tmp";
        {
            std::ofstream out(staging, std::ios::trunc);
            if (!out.is_open())
                return std::unexpected(WardenError::io("Unable to open " + staging));
            out << to_unix(mark) << '\n';
            if (!out.flush())
                return std::unexpected(WardenError::io("Unable to write " + staging));
        }

        std::error_code ec;
        std::filesystem::rename(staging, path_, ec);
        if (ec)
            return std::unexpected(WardenError::io(std::format("Unable to replace {}: {}", path_, ec.message())));
        return {};
    }

    ClockIntegrityChecker::ClockIntegrityChecker(std::chrono::seconds tolerance)
        : tolerance_(tolerance)
    {
    }

    bool ClockIntegrityChecker::check(Timestamp local, Timestamp reference) const
    {
        auto drift = local > reference ? local - reference : reference - local;
        return drift < tolerance_;
    }

    bool ClockIntegrityChecker::check(const Clock &local, const Clock &reference) const
    {
        auto local_now = local.now();
        auto reference_now = reference.now();
        if (!local_now || !reference_now)
            return false;
        return check(*local_now, *reference_now);
    }

} // namespace warden
