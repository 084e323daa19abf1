#include "warden/entitlement.hpp"
#include <format>
#include <array>
#include <fstream>
#include <sstream>

namespace warden
{

    namespace
    {
        constexpr std::array<std::string_view, 6> kRequiredFields{
            "identity", "features", "issued_at", "expires_at", "anchor_timestamp", "signature"};
        constexpr std::array<std::string_view, 2> kOptionalFields{"license_id", "metadata"};

        bool is_known_field(const std::string &key)
        {
            for (auto f : kRequiredFields)
                if (key == f)
                    return true;
            for (auto f : kOptionalFields)
                if (key == f)
                    return true;
            return false;
        }

        Result<Timestamp> read_timestamp(const nlohmann::json &j, const char *field)
        {
            const auto &value = j.at(field);
            if (!value.is_string())
                return std::unexpected(WardenError::malformed(std::format("'{}' must be an RFC 3339 string", field)));
            return parse_rfc3339(value.get<std::string>());
        }
    } // namespace

    Result<EntitlementRecord> EntitlementRecord::parse(std::string_view bytes)
    {
        nlohmann::json j = nlohmann::json::parse(bytes.begin(), bytes.end(), nullptr, false);
        if (j.is_discarded())
        {
            return std::unexpected(WardenError::malformed("Entitlement is not valid JSON"));
        }
        return from_json(j);
    }

    Result<EntitlementRecord> EntitlementRecord::from_json(const nlohmann::json &j)
    {
        if (!j.is_object())
            return std::unexpected(WardenError::malformed("Entitlement must be a JSON object"));

        for (auto it = j.begin(); it != j.end(); ++it)
        {
            if (!is_known_field(it.key()))
                return std::unexpected(WardenError::malformed("Unknown field: " + it.key()));
        }
        for (auto field : kRequiredFields)
        {
            if (!j.contains(std::string(field)))
                return std::unexpected(WardenError::malformed(std::format("Missing field: {}", field)));
        }

        EntitlementRecord record;

        const auto &identity = j.at("identity");
        if (!identity.is_string() || identity.get_ref<const std::string &>().empty())
            return std::unexpected(WardenError::malformed("'identity' must be a non-empty string"));
        record.identity = identity.get<std::string>();

        const auto &features = j.at("features");
        if (!features.is_array())
            return std::unexpected(WardenError::malformed("'features' must be an array"));
        for (const auto &feature : features)
        {
            if (!feature.is_string() || feature.get_ref<const std::string &>().empty())
                return std::unexpected(WardenError::malformed("Feature names must be non-empty strings"));
            if (!record.features.insert(feature.get<std::string>()).second)
                return std::unexpected(WardenError::malformed("Duplicate feature: " + feature.get<std::string>()));
        }

        auto issued = read_timestamp(j, "issued_at");
        if (!issued)
            return std::unexpected(issued.error());
        auto expires = read_timestamp(j, "expires_at");
        if (!expires)
            return std::unexpected(expires.error());
        if (*issued > *expires)
            return std::unexpected(WardenError::malformed("'issued_at' is after 'expires_at'"));
        record.issued_at = *issued;
        record.expires_at = *expires;

        const auto &anchor = j.at("anchor_timestamp");
        if (!anchor.is_number_integer() || anchor.get<std::int64_t>() < 0)
            return std::unexpected(WardenError::malformed("'anchor_timestamp' must be a non-negative integer"));
        if (anchor.get<std::int64_t>() > kMaxUnixSeconds)
            return std::unexpected(WardenError::malformed("'anchor_timestamp' is past 9999-12-31T23:59:59Z"));
        record.anchor_timestamp = from_unix(anchor.get<std::int64_t>());

        const auto &signature = j.at("signature");
        if (!signature.is_string() || signature.get_ref<const std::string &>().empty())
            return std::unexpected(WardenError::malformed("'signature' must be a non-empty string"));
        record.signature = signature.get<std::string>();

        if (j.contains("license_id"))
        {
            if (!j.at("license_id").is_string())
                return std::unexpected(WardenError::malformed("'license_id' must be a string"));
            record.license_id = j.at("license_id").get<std::string>();
        }

        if (j.contains("metadata"))
        {
            const auto &metadata = j.at("metadata");
            if (!metadata.is_object())
                return std::unexpected(WardenError::malformed("'metadata' must be an object"));
            for (auto it = metadata.begin(); it != metadata.end(); ++it)
            {
                if (!it.value().is_string())
                    return std::unexpected(WardenError::malformed("Metadata values must be strings"));
                record.metadata.emplace(it.key(), it.value().get<std::string>());
            }
        }

        return record;
    }

    Result<EntitlementRecord> EntitlementRecord::load(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            return std::unexpected(WardenError::io("Failed to open license file: " + path));
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return parse(buffer.str());
    }

    nlohmann::json EntitlementRecord::to_json() const
    {
        nlohmann::json j{
            {"identity", identity},
            {"features", features},
            {"issued_at", format_rfc3339(issued_at)},
            {"expires_at", format_rfc3339(expires_at)},
            {"anchor_timestamp", to_unix(anchor_timestamp)},
            {"signature", signature}};
        if (!license_id.empty())
            j["license_id"] = license_id;
        if (!metadata.empty())
            j["metadata"] = metadata;
        return j;
    }

    std::string EntitlementRecord::dump(int indent) const
    {
        return to_json().dump(indent);
    }

    bool EntitlementRecord::has_feature(std::string_view feature) const
    {
        return features.find(std::string(feature)) != features.end();
    }

    Timestamp EntitlementRecord::authoritative_expiry(std::chrono::seconds validity_window) const
    {
        return anchor_timestamp + validity_window;
    }

    std::int64_t EntitlementRecord::days_remaining(Timestamp now, std::chrono::seconds validity_window) const
    {
        auto expiry = authoritative_expiry(validity_window);
        if (now >= expiry)
            return 0;
        return std::chrono::duration_cast<std::chrono::days>(expiry - now).count();
    }

} // namespace warden
