#pragma once

#include "clock.hpp"
#include "crypto.hpp"
#include "entitlement.hpp"
#include <chrono>
#include <set>
#include <string>
#include <string_view>

namespace warden
{

    /**
     * Keyed signature over an entitlement's identity, anchor timestamp and
     * feature set (HMAC-SHA-256 under the issuer secret). Tags are lowercase
     * hex; verification is an exact, constant-time match.
     */
    class SignatureCodec
    {
    public:
        explicit SignatureCodec(crypto::SecretBytes secret);

        std::string sign(std::string_view identity,
                         Timestamp anchor,
                         const std::set<std::string> &features = {}) const;

        std::string sign(const EntitlementRecord &record) const;

        bool verify(const EntitlementRecord &record) const;

        /**
         * Build and sign a record anchored at `anchor`. expires_at is set to
         * the authoritative expiry for display.
         */
        EntitlementRecord issue(std::string identity,
                                std::set<std::string> features,
                                Timestamp anchor,
                                std::chrono::seconds validity_window,
                                std::string license_id = {}) const;

        /** Bytes covered by the tag */
        static std::string signing_message(std::string_view identity,
                                           Timestamp anchor,
                                           const std::set<std::string> &features);

    private:
        crypto::SecretBytes secret_;
    };

} // namespace warden
