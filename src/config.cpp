#include "warden/config.hpp"
#include "warden/logging.hpp"
#include <format>
#include <toml++/toml.h>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace warden
{
    namespace
    {
        constexpr std::string_view kPlaceholderSigningSecret = "warden-placeholder-issuer-secret";
        constexpr std::string_view kPlaceholderPayloadSecret = "warden-placeholder-payload-secret";

        using NodeView = toml::node_view<const toml::node>;

        template <typename T>
        Result<std::optional<T>> read_value(NodeView node, std::string_view key)
        {
            if (!node)
                return std::optional<T>{};
            if (auto v = node.value<T>())
                return std::optional<T>{*v};
            return std::unexpected(WardenError::config(std::format("Invalid value for '{}'", key)));
        }

        Result<std::int64_t> positive(std::int64_t value, std::string_view key)
        {
            if (value <= 0)
                return std::unexpected(WardenError::config(std::format("'{}' must be positive", key)));
            return value;
        }

        // Longest accepted entitlement window
        constexpr std::int64_t kMaxValidityDays = 36500;

        Result<std::int64_t> validity_days(std::int64_t value, std::string_view key)
        {
            auto v = positive(value, key);
            if (v && *v > kMaxValidityDays)
                return std::unexpected(WardenError::config(std::format("'{}' must be at most {}", key, kMaxValidityDays)));
            return v;
        }

        Result<crypto::SecretBytes> decode_secret(const std::string &b64, std::string_view key)
        {
            auto decoded = crypto::Base64::decode(b64);
            if (!decoded || decoded->empty())
                return std::unexpected(WardenError::config(std::format("'{}' must be non-empty base64", key)));
            return crypto::SecretBytes(std::move(*decoded));
        }

        std::optional<crypto::AESKey> env_config_key()
        {
            const char *env = std::getenv("WARDEN_CONFIG_KEY");
            if (!env)
                return std::nullopt;
            auto decoded = crypto::Base64::decode(env);
            if (!decoded || decoded->size() != 32)
                return std::nullopt;
            crypto::AESKey key{};
            std::copy_n(decoded->begin(), 32, key.begin());
            crypto::secure_wipe(*decoded);
            return key;
        }

        Result<void> parse_secrets(const toml::table &secrets, SecretSettings &out)
        {
            auto signing = read_value<std::string>(secrets["signing_secret"], "secrets.signing_secret");
            if (!signing)
                return std::unexpected(signing.error());
            if (*signing)
            {
                auto decoded = decode_secret(**signing, "secrets.signing_secret");
                if (!decoded)
                    return std::unexpected(decoded.error());
                out.signing_secret = std::move(*decoded);
                out.placeholder_signing = false;
            }

            auto payload = read_value<std::string>(secrets["payload_secret"], "secrets.payload_secret");
            if (!payload)
                return std::unexpected(payload.error());
            if (*payload)
            {
                auto decoded = decode_secret(**payload, "secrets.payload_secret");
                if (!decoded)
                    return std::unexpected(decoded.error());
                out.payload_secret = std::move(*decoded);
                out.placeholder_payload = false;
            }
            return {};
        }

        Result<void> parse_toml(const toml::table &tbl, WardenConfig &cfg)
        {
            if (auto days = read_value<std::int64_t>(tbl["entitlement"]["validity_days"], "entitlement.validity_days"); !days)
                return std::unexpected(days.error());
            else if (*days)
            {
                auto v = validity_days(**days, "entitlement.validity_days");
                if (!v)
                    return std::unexpected(v.error());
                cfg.entitlement.validity_window = std::chrono::days{*v};
            }

            if (auto hours = read_value<std::int64_t>(tbl["entitlement"]["clock_tolerance_hours"], "entitlement.clock_tolerance_hours"); !hours)
                return std::unexpected(hours.error());
            else if (*hours)
            {
                auto v = positive(**hours, "entitlement.clock_tolerance_hours");
                if (!v)
                    return std::unexpected(v.error());
                cfg.entitlement.clock_tolerance = std::chrono::hours{*v};
            }

            if (auto hours = read_value<std::int64_t>(tbl["session"]["max_age_hours"], "session.max_age_hours"); !hours)
                return std::unexpected(hours.error());
            else if (*hours)
            {
                auto v = positive(**hours, "session.max_age_hours");
                if (!v)
                    return std::unexpected(v.error());
                cfg.session.max_age = std::chrono::hours{*v};
            }

            if (auto count = read_value<std::int64_t>(tbl["session"]["max_access_count"], "session.max_access_count"); !count)
                return std::unexpected(count.error());
            else if (*count)
            {
                auto v = positive(**count, "session.max_access_count");
                if (!v)
                    return std::unexpected(v.error());
                cfg.session.max_access_count = static_cast<std::uint64_t>(*v);
            }

            if (auto enabled = read_value<bool>(tbl["gate"]["rate_limit"], "gate.rate_limit"); !enabled)
                return std::unexpected(enabled.error());
            else if (*enabled)
                cfg.gate.rate_limit = **enabled;

            if (auto tps = read_value<double>(tbl["gate"]["tokens_per_second"], "gate.tokens_per_second"); !tps)
                return std::unexpected(tps.error());
            else if (*tps)
                cfg.gate.limiter.tokens_per_second = **tps;

            if (auto burst = read_value<double>(tbl["gate"]["burst_capacity"], "gate.burst_capacity"); !burst)
                return std::unexpected(burst.error());
            else if (*burst)
                cfg.gate.limiter.burst_capacity = **burst;

            if (auto path = read_value<std::string>(tbl["payload"]["path"], "payload.path"); !path)
                return std::unexpected(path.error());
            else if (*path)
                cfg.payload.path = **path;

            if (auto state = read_value<std::string>(tbl["clock"]["state_path"], "clock.state_path"); !state)
                return std::unexpected(state.error());
            else if (*state)
                cfg.clock.state_path = **state;

            if (auto reject = read_value<bool>(tbl["environment"]["reject_debugger"], "environment.reject_debugger"); !reject)
                return std::unexpected(reject.error());
            else if (*reject)
                cfg.environment.reject_debugger = **reject;

            if (auto level = read_value<std::string>(tbl["logging"]["level"], "logging.level"); !level)
                return std::unexpected(level.error());
            else if (*level)
                cfg.logging.level = **level;

            if (auto cap = read_value<std::int64_t>(tbl["logging"]["diagnostics_capacity"], "logging.diagnostics_capacity"); !cap)
                return std::unexpected(cap.error());
            else if (*cap)
            {
                auto v = positive(**cap, "logging.diagnostics_capacity");
                if (!v)
                    return std::unexpected(v.error());
                cfg.logging.diagnostics_capacity = static_cast<std::size_t>(*v);
            }

            // Encrypted secrets block: secrets.ciphertext (base64 of AES-GCM blob holding TOML)
            if (auto secrets = tbl["secrets"].as_table())
            {
                if (auto res = parse_secrets(*secrets, cfg.secrets); !res)
                    return res;

                if (auto cipher_b64 = (*secrets)["ciphertext"].value<std::string>())
                {
                    auto key = env_config_key();
                    if (!key)
                        return std::unexpected(WardenError::config("secrets.ciphertext present but WARDEN_CONFIG_KEY is missing or invalid"));

                    auto inner = ConfigLoader::decrypt_block(*cipher_b64, *key);
                    if (!inner)
                        return std::unexpected(inner.error());
                    try
                    {
                        auto inner_tbl = toml::parse(*inner);
                        crypto::secure_wipe(*inner);
                        if (auto res = parse_secrets(inner_tbl, cfg.secrets); !res)
                            return res;
                    }
                    catch (const toml::parse_error &e)
                    {
                        crypto::secure_wipe(*inner);
                        return std::unexpected(WardenError::config(std::string("Failed to parse encrypted secrets: ") + e.what()));
                    }
                }
            }

            return {};
        }

        Result<std::int64_t> env_integer(const char *name, const char *value)
        {
            try
            {
                std::size_t consumed = 0;
                auto parsed = std::stoll(value, &consumed);
                if (consumed != std::string(value).size() || parsed <= 0)
                    throw std::invalid_argument(name);
                return parsed;
            }
            catch (const std::exception &)
            {
                return std::unexpected(WardenError::config(std::format("{} must be a positive integer", name)));
            }
        }

        WardenConfig base_config()
        {
            WardenConfig cfg{};
            cfg.secrets.signing_secret = crypto::SecretBytes(kPlaceholderSigningSecret);
            cfg.secrets.payload_secret = crypto::SecretBytes(kPlaceholderPayloadSecret);
            return cfg;
        }

    } // namespace

    Result<WardenConfig> ConfigLoader::defaults()
    {
        WardenConfig cfg = base_config();
        if (auto res = apply_env_overrides(cfg); !res)
            return std::unexpected(res.error());
        return cfg;
    }

    Result<WardenConfig> ConfigLoader::load(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            return std::unexpected(WardenError::config("Unable to open config file: " + path));
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return from_string(buffer.str());
    }

    Result<WardenConfig> ConfigLoader::from_string(const std::string &toml_content)
    {
        WardenConfig cfg = base_config();

        try
        {
            auto tbl = toml::parse(toml_content);
            if (auto res = parse_toml(tbl, cfg); !res)
                return std::unexpected(res.error());
        }
        catch (const toml::parse_error &e)
        {
            return std::unexpected(WardenError::config(std::string("Failed to parse TOML: ") + e.what()));
        }

        if (auto res = apply_env_overrides(cfg); !res)
            return std::unexpected(res.error());
        return cfg;
    }

    Result<void> ConfigLoader::apply_env_overrides(WardenConfig &cfg)
    {
        if (const char *secret = std::getenv("WARDEN_SIGNING_SECRET"))
        {
            auto decoded = decode_secret(secret, "WARDEN_SIGNING_SECRET");
            if (!decoded)
                return std::unexpected(decoded.error());
            cfg.secrets.signing_secret = std::move(*decoded);
            cfg.secrets.placeholder_signing = false;
        }
        if (const char *secret = std::getenv("WARDEN_PAYLOAD_SECRET"))
        {
            auto decoded = decode_secret(secret, "WARDEN_PAYLOAD_SECRET");
            if (!decoded)
                return std::unexpected(decoded.error());
            cfg.secrets.payload_secret = std::move(*decoded);
            cfg.secrets.placeholder_payload = false;
        }
        if (const char *path = std::getenv("WARDEN_PAYLOAD_PATH"))
            cfg.payload.path = path;
        if (const char *state = std::getenv("WARDEN_CLOCK_STATE"))
            cfg.clock.state_path = state;
        if (const char *days = std::getenv("WARDEN_VALIDITY_DAYS"))
        {
            auto v = env_integer("WARDEN_VALIDITY_DAYS", days).and_then(
                [](std::int64_t parsed) { return validity_days(parsed, "WARDEN_VALIDITY_DAYS"); });
            if (!v)
                return std::unexpected(v.error());
            cfg.entitlement.validity_window = std::chrono::days{*v};
        }
        if (const char *count = std::getenv("WARDEN_MAX_ACCESS_COUNT"))
        {
            auto v = env_integer("WARDEN_MAX_ACCESS_COUNT", count);
            if (!v)
                return std::unexpected(v.error());
            cfg.session.max_access_count = static_cast<std::uint64_t>(*v);
        }
        if (const char *level = std::getenv("WARDEN_LOG_LEVEL"))
            cfg.logging.level = level;
        if (const char *reject = std::getenv("WARDEN_REJECT_DEBUGGER"))
            cfg.environment.reject_debugger = std::string(reject) != "0";
        return {};
    }

    Result<std::string> ConfigLoader::decrypt_block(const std::string &cipher_b64, const crypto::AESKey &key)
    {
        auto cipher = crypto::Base64::decode(cipher_b64);
        if (!cipher)
            return std::unexpected(WardenError::config("secrets.ciphertext is not valid base64"));
        auto plain = crypto::AES256GCM::decrypt(key, *cipher);
        if (!plain)
            return std::unexpected(WardenError::config(std::string("Unable to decrypt secrets block: ") + plain.error().what()));
        std::string text(plain->begin(), plain->end());
        crypto::secure_wipe(*plain);
        return text;
    }

    nlohmann::json ConfigLoader::to_json(const WardenConfig &cfg)
    {
        nlohmann::json j;
        j["entitlement"] = {
            {"validity_days", std::chrono::duration_cast<std::chrono::days>(cfg.entitlement.validity_window).count()},
            {"clock_tolerance_hours", std::chrono::duration_cast<std::chrono::hours>(cfg.entitlement.clock_tolerance).count()}};
        j["session"] = {
            {"max_age_hours", std::chrono::duration_cast<std::chrono::hours>(cfg.session.max_age).count()},
            {"max_access_count", cfg.session.max_access_count}};
        j["gate"] = {
            {"rate_limit", cfg.gate.rate_limit},
            {"tokens_per_second", cfg.gate.limiter.tokens_per_second},
            {"burst_capacity", cfg.gate.limiter.burst_capacity}};
        j["payload"] = {{"path", cfg.payload.path}};
        j["clock"] = {{"state_path", cfg.clock.state_path}};
        j["environment"] = {{"reject_debugger", cfg.environment.reject_debugger}};
        j["logging"] = {{"level", cfg.logging.level}, {"diagnostics_capacity", cfg.logging.diagnostics_capacity}};
        j["using_placeholder_secrets"] = cfg.using_placeholder_secrets();
        return j;
    }

} // namespace warden
