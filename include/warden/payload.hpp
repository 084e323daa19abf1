#pragma once

#include "crypto.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace warden
{

    /**
     * The unlocked configuration. Pattern order within a category is
     * significant: earlier patterns win ties.
     */
    struct RuleSet
    {
        std::map<std::string, std::vector<std::string>> patterns;
        std::map<std::string, std::string> prompts;
        std::map<std::string, double> confidence_thresholds;

        /**
         * Accepts {"patterns": {...}, "prompts": {...}, "confidence_thresholds": {...}}
         * and the flat form ("module_patterns", ..., "llm_prompts").
         */
        static Result<RuleSet> from_json(const nlohmann::json &j);

        nlohmann::json to_json() const;

        /** Zero every string and threshold, then empty the containers */
        void wipe();
    };

    /**
     * A derived AES-256 key. Zeroed on destruction; not copyable.
     */
    class SessionKey
    {
    public:
        explicit SessionKey(const crypto::AESKey &key);
        ~SessionKey();

        SessionKey(const SessionKey &) = delete;
        SessionKey &operator=(const SessionKey &) = delete;
        SessionKey(SessionKey &&other) noexcept;
        SessionKey &operator=(SessionKey &&other) noexcept;

        const crypto::AESKey &bytes() const { return key_; }

        bool operator==(const SessionKey &other) const;

    private:
        crypto::AESKey key_;
    };

    /**
     * Unlocks the sealed rule-set blob (nonce(12) || AES-256-GCM ciphertext)
     * with a key derived from a verified identity.
     */
    class PayloadUnlockEngine
    {
    public:
        PayloadUnlockEngine(crypto::SecretBytes deployment_secret, crypto::Bytes sealed_payload);

        /** HMAC-SHA-256 of the identity under the deployment secret */
        SessionKey derive_key(std::string_view identity) const;

        /** Authentication or shape failures are DecryptionFailed, never a partial RuleSet */
        static Result<RuleSet> decrypt(const crypto::Bytes &blob, const SessionKey &key);

        /** Derive, decrypt the embedded blob, discard the key */
        Result<RuleSet> unlock(std::string_view identity) const;

        /** Issuer side: encrypt a rule set for one identity */
        Result<crypto::Bytes> seal(const RuleSet &rules, std::string_view identity) const;

        static Result<crypto::Bytes> load_sealed(const std::string &path);

        const crypto::Bytes &sealed_payload() const { return sealed_payload_; }

    private:
        crypto::SecretBytes deployment_secret_;
        crypto::Bytes sealed_payload_;
    };

} // namespace warden
