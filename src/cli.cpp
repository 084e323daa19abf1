#include "warden/cli.hpp"
#include "warden/clock.hpp"
#include "warden/config.hpp"
#include "warden/entitlement.hpp"
#include "warden/logging.hpp"
#include "warden/payload.hpp"
#include "warden/signature.hpp"
#include "warden/warden.hpp"
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <chrono>
#include <fstream>
#include <iostream>
#include <optional>
#include <set>
#include <sstream>

namespace warden::cli
{

    namespace
    {
        Result<WardenConfig> load_config(const std::string &path)
        {
            if (path.empty())
                return ConfigLoader::defaults();
            return ConfigLoader::load(path);
        }

        Result<std::string> read_text(const std::string &path)
        {
            std::ifstream f(path);
            if (!f.is_open())
                return std::unexpected(WardenError::io("Unable to open " + path));
            std::stringstream buf;
            buf << f.rdbuf();
            return buf.str();
        }

        int write_output(const std::string &path, const std::string &content, bool binary)
        {
            if (path.empty())
            {
                std::cout << content;
                return 0;
            }
            std::ofstream out(path, binary ? std::ios::binary : std::ios::out);
            if (!out.is_open())
            {
                std::cerr << "Unable to open output file" << std::endl;
                return 1;
            }
            out << content;
            return 0;
        }
    } // namespace

    int run(int argc, char *argv[])
    {
        CLI::App app{"Warden entitlement tool"};

        std::string config_path;
        app.add_option("--config", config_path, "Path to config TOML");

        auto cfg_cmd = app.add_subcommand("config-print", "Load and print non-secret config as JSON");
        cfg_cmd->add_option("--file", config_path, "Config path");

        std::string issue_identity;
        std::vector<std::string> issue_features;
        std::int64_t issue_anchor{-1};
        std::string issue_license_id;
        std::string issue_out;
        auto issue_cmd = app.add_subcommand("issue", "Sign and emit an entitlement record");
        issue_cmd->add_option("--identity", issue_identity, "License holder identity")->required();
        issue_cmd->add_option("--feature", issue_features, "Granted feature (repeatable)")->required();
        issue_cmd->add_option("--anchor", issue_anchor, "Anchor timestamp, unix seconds (default: now)")
            ->check(CLI::Range(std::int64_t{-1}, kMaxUnixSeconds));
        issue_cmd->add_option("--license-id", issue_license_id, "Optional license identifier");
        issue_cmd->add_option("--out", issue_out, "Output file path (defaults to stdout)");

        std::string seal_rules;
        std::string seal_identity;
        std::string seal_out;
        auto seal_cmd = app.add_subcommand("seal", "Encrypt a rule set JSON for one identity");
        seal_cmd->add_option("--rules", seal_rules, "Rule set JSON path")->required();
        seal_cmd->add_option("--identity", seal_identity, "Identity the payload unlocks for")->required();
        seal_cmd->add_option("--out", seal_out, "Sealed payload output path")->required();

        std::string check_license;
        std::string check_payload;
        std::vector<std::string> check_features;
        auto check_cmd = app.add_subcommand("check", "Activate an entitlement and report its status");
        check_cmd->add_option("--license", check_license, "Entitlement JSON path")->required();
        check_cmd->add_option("--payload", check_payload, "Sealed payload path (defaults to payload.path)");
        check_cmd->add_option("--feature", check_features, "Feature to test (repeatable)");

        CLI11_PARSE(app, argc, argv);

        auto cfg = load_config(config_path);
        if (!cfg)
        {
            std::cerr << cfg.error().what() << std::endl;
            return 1;
        }
        logging::init(cfg->logging.level);

        if (*cfg_cmd)
        {
            std::cout << ConfigLoader::to_json(*cfg).dump(2) << std::endl;
            return 0;
        }

        if (*issue_cmd)
        {
            Timestamp anchor = issue_anchor >= 0
                                   ? from_unix(issue_anchor)
                                   : std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
            SignatureCodec codec(cfg->secrets.signing_secret);
            auto record = codec.issue(issue_identity,
                                      std::set<std::string>(issue_features.begin(), issue_features.end()),
                                      anchor,
                                      cfg->entitlement.validity_window,
                                      issue_license_id);
            return write_output(issue_out, record.dump(2) + "\n", false);
        }

        if (*seal_cmd)
        {
            auto text = read_text(seal_rules);
            if (!text)
            {
                std::cerr << text.error().what() << std::endl;
                return 1;
            }
            auto doc = nlohmann::json::parse(*text, nullptr, false);
            if (doc.is_discarded())
            {
                std::cerr << "Rule set is not valid JSON" << std::endl;
                return 1;
            }
            auto rules = RuleSet::from_json(doc);
            if (!rules)
            {
                std::cerr << rules.error().what() << std::endl;
                return 1;
            }
            PayloadUnlockEngine engine(cfg->secrets.payload_secret, {});
            auto sealed = engine.seal(*rules, seal_identity);
            rules->wipe();
            if (!sealed)
            {
                std::cerr << sealed.error().what() << std::endl;
                return 1;
            }
            return write_output(seal_out, std::string(sealed->begin(), sealed->end()), true);
        }

        if (*check_cmd)
        {
            auto license = read_text(check_license);
            if (!license)
            {
                std::cerr << license.error().what() << std::endl;
                return 1;
            }
            auto sealed = PayloadUnlockEngine::load_sealed(check_payload.empty() ? cfg->payload.path : check_payload);
            if (!sealed)
            {
                std::cerr << sealed.error().what() << std::endl;
                return 1;
            }

            std::optional<HighWaterMarkFile> clock_state;
            Warden::Collaborators collaborators;
            if (!cfg->clock.state_path.empty())
            {
                clock_state.emplace(cfg->clock.state_path);
                auto mark = clock_state->load();
                if (!mark)
                {
                    std::cerr << mark.error().what() << std::endl;
                    return 1;
                }
                collaborators.last_seen = *mark;
            }

            Warden service(*cfg, std::move(*sealed), std::move(collaborators));
            auto handle = service.activate(*license);
            if (clock_state)
            {
                if (auto seen = service.high_water_mark())
                {
                    if (auto stored = clock_state->store(*seen); !stored)
                        logging::get()->warn("clock state not saved: {}", stored.error().what());
                }
            }
            if (!handle)
            {
                std::cerr << handle.error().what() << std::endl;
                for (const auto &event : service.diagnostics().recent())
                {
                    if (event.result != "ok")
                        std::cerr << event.to_json().dump() << std::endl;
                }
                return 2;
            }

            nlohmann::json report;
            report["identity"] = handle->identity;
            report["features"] = service.list_features(handle->identity);
            report["status"] = service.security_status(handle->identity);
            for (const auto &feature : check_features)
                report["checks"][feature] = service.is_feature_available(handle->identity, feature);
            std::cout << report.dump(2) << std::endl;
            return 0;
        }

        std::cout << app.help() << std::endl;
        return 0;
    }

} // namespace warden::cli
