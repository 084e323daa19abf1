#pragma once

#include "clock.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <string_view>

namespace warden
{

    /**
     * A license: a signed claim granting an identity a feature set.
     *
     * Only anchor_timestamp (signed) feeds the authoritative expiration;
     * expires_at is carried for display and never gates access.
     */
    struct EntitlementRecord
    {
        std::string license_id; // optional
        std::string identity;
        std::set<std::string> features;
        Timestamp issued_at{};
        Timestamp expires_at{};
        Timestamp anchor_timestamp{};
        std::string signature; // lowercase hex HMAC-SHA-256
        std::map<std::string, std::string> metadata;

        /** Parse the JSON wire format; any structural problem is MalformedRecord */
        static Result<EntitlementRecord> parse(std::string_view bytes);

        static Result<EntitlementRecord> from_json(const nlohmann::json &j);

        /** Load a license JSON file */
        static Result<EntitlementRecord> load(const std::string &path);

        nlohmann::json to_json() const;

        std::string dump(int indent = -1) const;

        bool has_feature(std::string_view feature) const;

        Timestamp authoritative_expiry(std::chrono::seconds validity_window) const;

        /** Whole days left before the authoritative expiry, 0 once expired */
        std::int64_t days_remaining(Timestamp now, std::chrono::seconds validity_window) const;
    };

} // namespace warden
