#pragma once

#include "crypto.hpp"
#include "rate_limiter.hpp"
#include "session.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace warden
{

    struct EntitlementSettings
    {
        std::chrono::seconds validity_window{std::chrono::days{14}};
        std::chrono::seconds clock_tolerance{std::chrono::hours{24}};
    };

    struct GateSettings
    {
        bool rate_limit{false};
        AccessRateLimiter::Config limiter{};
    };

    struct PayloadSettings
    {
        std::string path{"assets/rules.sealed"};
    };

    struct ClockSettings
    {
        // High-water mark file for the reference clock; empty disables it
        std::string state_path;
    };

    struct EnvironmentSettings
    {
        bool reject_debugger{false};
    };

    struct LoggingSettings
    {
        std::string level{"info"};
        std::size_t diagnostics_capacity{256};
    };

    struct SecretSettings
    {
        crypto::SecretBytes signing_secret;
        crypto::SecretBytes payload_secret;
        bool placeholder_signing{true};
        bool placeholder_payload{true};
    };

    struct WardenConfig
    {
        EntitlementSettings entitlement{};
        SessionPolicy session{};
        GateSettings gate{};
        PayloadSettings payload{};
        ClockSettings clock{};
        EnvironmentSettings environment{};
        LoggingSettings logging{};
        SecretSettings secrets{};

        bool using_placeholder_secrets() const
        {
            return secrets.placeholder_signing || secrets.placeholder_payload;
        }
    };

    /**
     * ConfigLoader loads TOML configs with environment overrides and an
     * optional AES-256-GCM encrypted [secrets] block (key in WARDEN_CONFIG_KEY).
     * Without provisioned secrets the compiled-in placeholders are used.
     */
    class ConfigLoader
    {
    public:
        /** Load config from a TOML file path. Environment overrides take precedence. */
        static Result<WardenConfig> load(const std::string &path);

        /** Parse config from TOML string content. */
        static Result<WardenConfig> from_string(const std::string &toml_content);

        /** Defaults plus environment overrides, no file */
        static Result<WardenConfig> defaults();

        /** Serialize non-secret settings to JSON for inspection. */
        static nlohmann::json to_json(const WardenConfig &cfg);

        /** Decrypt a base64 AES-256-GCM blob into text */
        static Result<std::string> decrypt_block(const std::string &cipher_b64, const crypto::AESKey &key);

    private:
        static Result<void> apply_env_overrides(WardenConfig &cfg);
    };

} // namespace warden
