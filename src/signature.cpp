#include "warden/signature.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>

namespace warden
{

    namespace
    {
        constexpr std::string_view kDomain = "warden.entitlement.v1\n";
        constexpr std::size_t kTagHexLength = 64;

        bool is_lower_hex(std::string_view s)
        {
            return std::all_of(s.begin(), s.end(), [](char c) {
                return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
            });
        }
    } // namespace

    SignatureCodec::SignatureCodec(crypto::SecretBytes secret) : secret_(std::move(secret))
    {
        if (secret_.empty())
        {
            throw WardenError::config("Signature secret must not be empty");
        }
    }

    std::string SignatureCodec::signing_message(std::string_view identity,
                                                Timestamp anchor,
                                                const std::set<std::string> &features)
    {
        nlohmann::json payload{
            {"anchor_timestamp", to_unix(anchor)},
            {"features", features},
            {"identity", std::string(identity)}};
        return std::string(kDomain) + payload.dump();
    }

    std::string SignatureCodec::sign(std::string_view identity,
                                     Timestamp anchor,
                                     const std::set<std::string> &features) const
    {
        return crypto::Hex::encode(crypto::HmacSha256::mac(secret_, signing_message(identity, anchor, features)));
    }

    std::string SignatureCodec::sign(const EntitlementRecord &record) const
    {
        return sign(record.identity, record.anchor_timestamp, record.features);
    }

    bool SignatureCodec::verify(const EntitlementRecord &record) const
    {
        if (record.signature.size() != kTagHexLength || !is_lower_hex(record.signature))
            return false;

        auto decoded = crypto::Hex::decode(record.signature);
        if (!decoded || decoded->size() != crypto::HmacTag{}.size())
            return false;

        crypto::HmacTag tag{};
        std::copy(decoded->begin(), decoded->end(), tag.begin());
        return crypto::HmacSha256::verify(
            secret_, signing_message(record.identity, record.anchor_timestamp, record.features), tag);
    }

    EntitlementRecord SignatureCodec::issue(std::string identity,
                                            std::set<std::string> features,
                                            Timestamp anchor,
                                            std::chrono::seconds validity_window,
                                            std::string license_id) const
    {
        EntitlementRecord record;
        record.license_id = std::move(license_id);
        record.identity = std::move(identity);
        record.features = std::move(features);
        record.issued_at = anchor;
        record.anchor_timestamp = anchor;
        record.expires_at = anchor + validity_window;
        record.signature = sign(record);
        return record;
    }

} // namespace warden
