#include "warden/session.hpp"
#include "warden/crypto.hpp"
#include "warden/logging.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>

namespace warden
{

    namespace
    {
        constexpr std::string_view kWatermarkSalt = "warden.watermark.v1";

        // Identity for diagnostics when the record itself was rejected
        std::string best_effort_identity(std::string_view bytes)
        {
            auto j = nlohmann::json::parse(bytes.begin(), bytes.end(), nullptr, false);
            if (j.is_object())
            {
                auto it = j.find("identity");
                if (it != j.end() && it->is_string())
                    return it->get<std::string>();
            }
            return {};
        }
    } // namespace

    std::string watermark_for(std::string_view identity)
    {
        std::string material(identity);
        material.append(kWatermarkSalt);
        auto digest = crypto::SHA256::hash(material);
        return "wm_" + crypto::Hex::encode(digest.data(), 8);
    }

    // ============================================================================
    // Session
    // ============================================================================

    Session::Session(EntitlementRecord record, RuleSet rules, Timestamp started_at, std::uint64_t generation)
        : record_(std::move(record)),
          rules_(std::move(rules)),
          started_at_(started_at),
          generation_(generation),
          watermark_(watermark_for(record_.identity))
    {
    }

    Session::~Session()
    {
        rules_.wipe();
    }

    std::uint64_t Session::access_count() const
    {
        std::lock_guard lock(mutex_);
        return access_count_;
    }

    bool Session::register_access(std::uint64_t cap)
    {
        std::lock_guard lock(mutex_);
        bool under_cap = access_count_ < cap;
        if (under_cap)
            ++access_count_;
        return under_cap;
    }

    // ============================================================================
    // RuleSetView
    // ============================================================================

    RuleSetView::RuleSetView(std::weak_ptr<SessionStore> store,
                             SessionHandle handle,
                             std::weak_ptr<const Session> session)
        : store_(std::move(store)), handle_(std::move(handle)), session_(std::move(session))
    {
    }

    bool RuleSetView::valid() const
    {
        return lock().has_value();
    }

    Result<std::shared_ptr<const Session>> RuleSetView::lock() const
    {
        auto store = store_.lock();
        if (!store || !store->is_live(handle_))
            return std::unexpected(WardenError::session_expired("Session has ended"));
        auto session = session_.lock();
        if (!session)
            return std::unexpected(WardenError::session_expired("Session has ended"));
        return session;
    }

    Result<std::vector<std::string>> RuleSetView::patterns(std::string_view category) const
    {
        auto session = lock();
        if (!session)
            return std::unexpected(session.error());
        const auto &patterns = (*session)->rules().patterns;
        auto it = patterns.find(std::string(category));
        if (it == patterns.end())
            return std::vector<std::string>{};
        return it->second;
    }

    Result<std::vector<std::string>> RuleSetView::categories() const
    {
        auto session = lock();
        if (!session)
            return std::unexpected(session.error());
        std::vector<std::string> out;
        for (const auto &[category, _] : (*session)->rules().patterns)
            out.push_back(category);
        return out;
    }

    Result<std::string> RuleSetView::prompt(std::string_view prompt_type) const
    {
        auto session = lock();
        if (!session)
            return std::unexpected(session.error());
        const auto &prompts = (*session)->rules().prompts;
        auto it = prompts.find(std::string(prompt_type));
        if (it == prompts.end())
            return std::unexpected(WardenError::not_found("Unknown prompt type: " + std::string(prompt_type)));
        return it->second;
    }

    Result<double> RuleSetView::confidence_threshold(std::string_view category) const
    {
        auto session = lock();
        if (!session)
            return std::unexpected(session.error());
        const auto &thresholds = (*session)->rules().confidence_thresholds;
        auto it = thresholds.find(std::string(category));
        if (it == thresholds.end())
            return std::unexpected(WardenError::not_found("No threshold for category: " + std::string(category)));
        return it->second;
    }

    Result<std::string> RuleSetView::watermark() const
    {
        auto session = lock();
        if (!session)
            return std::unexpected(session.error());
        return (*session)->watermark();
    }

    // ============================================================================
    // SessionStore
    // ============================================================================

    SessionStore::SessionStore(std::shared_ptr<const ValidationPipeline> pipeline,
                               std::shared_ptr<const PayloadUnlockEngine> unlock_engine,
                               SessionPolicy policy,
                               std::shared_ptr<DiagnosticsLog> diagnostics)
        : pipeline_(std::move(pipeline)),
          unlock_engine_(std::move(unlock_engine)),
          policy_(policy),
          diagnostics_(std::move(diagnostics))
    {
        if (!pipeline_ || !unlock_engine_)
        {
            throw WardenError::config("Session store requires a pipeline and an unlock engine");
        }
    }

    Result<SessionHandle> SessionStore::activate(std::string_view entitlement_bytes)
    {
        std::lock_guard activation(activation_mutex_);

        auto verdict = pipeline_->run(entitlement_bytes);
        if (!verdict)
        {
            const auto &failure = verdict.error();
            if (diagnostics_)
            {
                diagnostics_->record_failure(best_effort_identity(entitlement_bytes), "activate",
                                             layer_name(failure.layer), failure.error);
            }
            return std::unexpected(failure.error);
        }

        EntitlementRecord record = std::move(*verdict);
        std::string identity = record.identity;

        auto rules = unlock_engine_->unlock(identity);
        if (!rules)
        {
            if (diagnostics_)
                diagnostics_->record_failure(identity, "activate", "payload", rules.error());
            return std::unexpected(rules.error());
        }

        auto now = pipeline_->local_clock()->now();
        if (!now)
        {
            rules->wipe();
            auto error = WardenError::clock("Local clock unavailable");
            if (diagnostics_)
                diagnostics_->record_failure(identity, "activate", "session", error);
            return std::unexpected(error);
        }

        std::uint64_t generation = next_generation_++;
        auto session = std::make_shared<Session>(std::move(record), std::move(*rules), *now, generation);

        std::shared_ptr<Session> replaced;
        {
            std::unique_lock lock(mutex_);
            auto &slot = sessions_[identity];
            replaced = std::move(slot);
            slot = std::move(session);
        }

        if (diagnostics_)
        {
            diagnostics_->record(AuditEvent::make(identity, "activate", "", "ok",
                                                  nlohmann::json{{"generation", generation},
                                                                 {"replaced", replaced != nullptr}}));
        }
        logging::get()->info("session activated for '{}' (generation {})", identity, generation);

        return SessionHandle{identity, generation};
    }

    std::shared_ptr<Session> SessionStore::find(std::string_view identity) const
    {
        std::shared_lock lock(mutex_);
        auto it = sessions_.find(std::string(identity));
        if (it == sessions_.end())
            return nullptr;
        return it->second;
    }

    bool SessionStore::within_age(const Session &session) const
    {
        auto now = pipeline_->local_clock()->now();
        if (!now)
            return false;
        return *now - session.started_at() < policy_.max_age;
    }

    bool SessionStore::live(const Session &session) const
    {
        return session.access_count() < policy_.max_access_count &&
               within_age(session) &&
               pipeline_->revalidate(session.record()).has_value();
    }

    void SessionStore::evict(const std::string &identity, std::uint64_t generation)
    {
        std::shared_ptr<Session> released;
        {
            std::unique_lock lock(mutex_);
            auto it = sessions_.find(identity);
            if (it == sessions_.end() || it->second->generation() != generation)
                return;
            released = std::move(it->second);
            sessions_.erase(it);
        }
        logging::get()->info("session for '{}' ended (generation {})", identity, generation);
    }

    bool SessionStore::live_or_evict(const Session &session)
    {
        if (live(session))
            return true;
        evict(session.record().identity, session.generation());
        return false;
    }

    bool SessionStore::is_live(const SessionHandle &handle)
    {
        auto session = find(handle.identity);
        if (!session || session->generation() != handle.generation)
            return false;
        return live_or_evict(*session);
    }

    void SessionStore::teardown(const SessionHandle &handle)
    {
        evict(handle.identity, handle.generation);
    }

    void SessionStore::clear()
    {
        std::unordered_map<std::string, std::shared_ptr<Session>> released;
        {
            std::unique_lock lock(mutex_);
            released.swap(sessions_);
        }
        if (!released.empty())
            logging::get()->info("released {} session(s)", released.size());
    }

    std::size_t SessionStore::purge_expired()
    {
        std::vector<std::shared_ptr<Session>> candidates;
        {
            std::shared_lock lock(mutex_);
            for (const auto &[identity, session] : sessions_)
                candidates.push_back(session);
        }

        std::size_t purged = 0;
        for (const auto &session : candidates)
        {
            if (!live_or_evict(*session))
                ++purged;
        }
        return purged;
    }

    std::optional<SessionHandle> SessionStore::handle_for(std::string_view identity) const
    {
        auto session = find(identity);
        if (!session)
            return std::nullopt;
        return SessionHandle{session->record().identity, session->generation()};
    }

    bool SessionStore::record_access(std::string_view identity, std::string_view feature)
    {
        auto session = find(identity);
        if (!session)
            return false;

        bool under_cap = session->register_access(policy_.max_access_count);
        bool fresh = within_age(*session);
        bool valid = pipeline_->revalidate(session->record()).has_value();

        if (!fresh || !valid)
        {
            evict(session->record().identity, session->generation());
            return false;
        }

        bool granted = under_cap && session->record().has_feature(feature);
        // The access that reaches the cap is still granted; the session ends with it
        if (session->access_count() >= policy_.max_access_count)
            evict(session->record().identity, session->generation());
        return granted;
    }

    std::vector<std::string> SessionStore::features(std::string_view identity)
    {
        auto session = find(identity);
        if (!session || !live_or_evict(*session))
            return {};
        const auto &features = session->record().features;
        return {features.begin(), features.end()};
    }

    Result<RuleSetView> SessionStore::rule_set(std::string_view identity)
    {
        auto session = find(identity);
        if (!session)
            return std::unexpected(WardenError::not_activated("No session for identity"));
        if (!live_or_evict(*session))
            return std::unexpected(WardenError::session_expired("Session is no longer live"));
        return RuleSetView(weak_from_this(),
                           SessionHandle{session->record().identity, session->generation()},
                           std::weak_ptr<const Session>(session));
    }

    std::optional<SessionStatus> SessionStore::status(std::string_view identity) const
    {
        auto session = find(identity);
        if (!session)
            return std::nullopt;
        return SessionStatus{session->record(),
                             session->started_at(),
                             session->access_count(),
                             session->watermark(),
                             live(*session)};
    }

    std::size_t SessionStore::size() const
    {
        std::shared_lock lock(mutex_);
        return sessions_.size();
    }

} // namespace warden
