#include "warden/payload.hpp"
#include "warden/logging.hpp"
#include <sodium.h>
#include <fstream>
#include <iterator>

namespace warden
{

    namespace
    {
        constexpr std::string_view kKeyDomain = "warden.payload-key.v1\n";
        constexpr std::string_view kPatternSuffix = "_patterns";

        // Zero every string held by a parsed document before it is released
        void wipe_json(nlohmann::json &j)
        {
            if (j.is_string())
            {
                crypto::secure_wipe(j.get_ref<std::string &>());
            }
            else if (j.is_structured())
            {
                for (auto &child : j)
                    wipe_json(child);
            }
        }

        Result<std::vector<std::string>> read_patterns(const nlohmann::json &value, const std::string &category)
        {
            if (!value.is_array())
                return std::unexpected(WardenError::decryption("Patterns for '" + category + "' must be an array"));
            std::vector<std::string> out;
            out.reserve(value.size());
            for (const auto &p : value)
            {
                if (!p.is_string())
                    return std::unexpected(WardenError::decryption("Pattern in '" + category + "' must be a string"));
                out.push_back(p.get<std::string>());
            }
            return out;
        }

        Result<std::map<std::string, std::string>> read_prompts(const nlohmann::json &value)
        {
            if (!value.is_object())
                return std::unexpected(WardenError::decryption("Prompts must be an object"));
            std::map<std::string, std::string> out;
            for (auto it = value.begin(); it != value.end(); ++it)
            {
                if (!it.value().is_string())
                    return std::unexpected(WardenError::decryption("Prompt '" + it.key() + "' must be a string"));
                out.emplace(it.key(), it.value().get<std::string>());
            }
            return out;
        }

        Result<std::map<std::string, double>> read_thresholds(const nlohmann::json &value)
        {
            if (!value.is_object())
                return std::unexpected(WardenError::decryption("Confidence thresholds must be an object"));
            std::map<std::string, double> out;
            for (auto it = value.begin(); it != value.end(); ++it)
            {
                if (!it.value().is_number())
                    return std::unexpected(WardenError::decryption("Threshold '" + it.key() + "' must be a number"));
                double score = it.value().get<double>();
                if (!(score >= 0.0 && score <= 1.0))
                    return std::unexpected(WardenError::decryption("Threshold '" + it.key() + "' outside [0,1]"));
                out.emplace(it.key(), score);
            }
            return out;
        }

        bool ends_with(const std::string &s, std::string_view suffix)
        {
            return s.size() > suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
        }
    } // namespace

    // ============================================================================
    // RuleSet
    // ============================================================================

    Result<RuleSet> RuleSet::from_json(const nlohmann::json &j)
    {
        if (!j.is_object())
            return std::unexpected(WardenError::decryption("Rule set must be a JSON object"));

        RuleSet rules;
        bool has_patterns = false;
        bool has_prompts = false;
        bool has_thresholds = false;

        for (auto it = j.begin(); it != j.end(); ++it)
        {
            const std::string &key = it.key();
            if (key == "patterns")
            {
                if (!it.value().is_object())
                    return std::unexpected(WardenError::decryption("'patterns' must be an object"));
                for (auto cat = it.value().begin(); cat != it.value().end(); ++cat)
                {
                    auto list = read_patterns(cat.value(), cat.key());
                    if (!list)
                        return std::unexpected(list.error());
                    rules.patterns[cat.key()] = std::move(*list);
                }
                has_patterns = true;
            }
            else if (ends_with(key, kPatternSuffix))
            {
                auto category = key.substr(0, key.size() - kPatternSuffix.size());
                auto list = read_patterns(it.value(), category);
                if (!list)
                    return std::unexpected(list.error());
                rules.patterns[category] = std::move(*list);
                has_patterns = true;
            }
            else if (key == "prompts" || key == "llm_prompts")
            {
                if (has_prompts)
                    return std::unexpected(WardenError::decryption("Prompts specified twice"));
                auto prompts = read_prompts(it.value());
                if (!prompts)
                    return std::unexpected(prompts.error());
                rules.prompts = std::move(*prompts);
                has_prompts = true;
            }
            else if (key == "confidence_thresholds")
            {
                auto thresholds = read_thresholds(it.value());
                if (!thresholds)
                    return std::unexpected(thresholds.error());
                rules.confidence_thresholds = std::move(*thresholds);
                has_thresholds = true;
            }
            else
            {
                return std::unexpected(WardenError::decryption("Unknown rule set field: " + key));
            }
        }

        if (!has_patterns || !has_prompts || !has_thresholds)
        {
            rules.wipe();
            return std::unexpected(WardenError::decryption("Rule set is missing patterns, prompts or thresholds"));
        }
        return rules;
    }

    nlohmann::json RuleSet::to_json() const
    {
        return nlohmann::json{
            {"patterns", patterns},
            {"prompts", prompts},
            {"confidence_thresholds", confidence_thresholds}};
    }

    void RuleSet::wipe()
    {
        for (auto &[category, list] : patterns)
        {
            for (auto &p : list)
                crypto::secure_wipe(p);
        }
        patterns.clear();

        for (auto &[name, text] : prompts)
            crypto::secure_wipe(text);
        prompts.clear();

        for (auto &[category, score] : confidence_thresholds)
            sodium_memzero(&score, sizeof(score));
        confidence_thresholds.clear();
    }

    // ============================================================================
    // SessionKey
    // ============================================================================

    SessionKey::SessionKey(const crypto::AESKey &key) : key_(key) {}

    SessionKey::~SessionKey()
    {
        sodium_memzero(key_.data(), key_.size());
    }

    SessionKey::SessionKey(SessionKey &&other) noexcept : key_(other.key_)
    {
        sodium_memzero(other.key_.data(), other.key_.size());
    }

    SessionKey &SessionKey::operator=(SessionKey &&other) noexcept
    {
        if (this != &other)
        {
            key_ = other.key_;
            sodium_memzero(other.key_.data(), other.key_.size());
        }
        return *this;
    }

    bool SessionKey::operator==(const SessionKey &other) const
    {
        return sodium_memcmp(key_.data(), other.key_.data(), key_.size()) == 0;
    }

    // ============================================================================
    // PayloadUnlockEngine
    // ============================================================================

    PayloadUnlockEngine::PayloadUnlockEngine(crypto::SecretBytes deployment_secret, crypto::Bytes sealed_payload)
        : deployment_secret_(std::move(deployment_secret)), sealed_payload_(std::move(sealed_payload))
    {
        if (deployment_secret_.empty())
        {
            throw WardenError::config("Payload deployment secret must not be empty");
        }
    }

    SessionKey PayloadUnlockEngine::derive_key(std::string_view identity) const
    {
        std::string message(kKeyDomain);
        message.append(identity);
        crypto::HmacTag tag = crypto::HmacSha256::mac(deployment_secret_, message);
        SessionKey key(tag);
        sodium_memzero(tag.data(), tag.size());
        return key;
    }

    Result<RuleSet> PayloadUnlockEngine::decrypt(const crypto::Bytes &blob, const SessionKey &key)
    {
        if (blob.size() < crypto::kNonceBytes + crypto::kTagBytes)
        {
            return std::unexpected(WardenError::decryption("Sealed payload too short"));
        }

        auto plaintext = crypto::AES256GCM::decrypt(key.bytes(), blob);
        if (!plaintext)
        {
            return std::unexpected(WardenError::decryption(plaintext.error().what()));
        }

        nlohmann::json doc = nlohmann::json::parse(plaintext->begin(), plaintext->end(), nullptr, false);
        crypto::secure_wipe(*plaintext);
        if (doc.is_discarded())
        {
            return std::unexpected(WardenError::decryption("Decrypted payload is not valid JSON"));
        }

        auto rules = RuleSet::from_json(doc);
        wipe_json(doc);
        return rules;
    }

    Result<RuleSet> PayloadUnlockEngine::unlock(std::string_view identity) const
    {
        auto key = derive_key(identity);
        auto rules = decrypt(sealed_payload_, key);
        if (!rules)
        {
            logging::get()->debug("payload unlock failed: {}", rules.error().what());
        }
        return rules;
    }

    Result<crypto::Bytes> PayloadUnlockEngine::seal(const RuleSet &rules, std::string_view identity) const
    {
        auto key = derive_key(identity);
        std::string serialized = rules.to_json().dump();
        crypto::Bytes plaintext(serialized.begin(), serialized.end());
        crypto::secure_wipe(serialized);

        auto sealed = crypto::AES256GCM::encrypt(key.bytes(), plaintext);
        crypto::secure_wipe(plaintext);
        return sealed;
    }

    Result<crypto::Bytes> PayloadUnlockEngine::load_sealed(const std::string &path)
    {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open())
        {
            return std::unexpected(WardenError::io("Failed to open sealed payload: " + path));
        }
        crypto::Bytes blob((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        return blob;
    }

} // namespace warden
