#pragma once

#include "audit.hpp"
#include "clock.hpp"
#include "entitlement.hpp"
#include "payload.hpp"
#include "types.hpp"
#include "validation.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace warden
{

    struct SessionHandle
    {
        std::string identity;
        std::uint64_t generation{0};

        bool operator==(const SessionHandle &) const = default;
    };

    struct SessionPolicy
    {
        std::chrono::seconds max_age{std::chrono::hours{24}};
        std::uint64_t max_access_count{1000};
    };

    /** Output watermark for an identity: "wm_" + 16 hex chars */
    std::string watermark_for(std::string_view identity);

    /**
     * A live activation. The record and rule set are fixed at construction;
     * only the access counter changes afterwards. The rule set is wiped when
     * the session is destroyed.
     */
    class Session
    {
    public:
        Session(EntitlementRecord record, RuleSet rules, Timestamp started_at, std::uint64_t generation);
        ~Session();

        Session(const Session &) = delete;
        Session &operator=(const Session &) = delete;

        const EntitlementRecord &record() const { return record_; }
        const RuleSet &rules() const { return rules_; }
        Timestamp started_at() const { return started_at_; }
        std::uint64_t generation() const { return generation_; }
        const std::string &watermark() const { return watermark_; }

        std::uint64_t access_count() const;

        /**
         * Count one access, saturating at `cap`. Returns true iff the counter
         * was below the cap before this access.
         */
        bool register_access(std::uint64_t cap);

    private:
        EntitlementRecord record_;
        RuleSet rules_;
        Timestamp started_at_;
        std::uint64_t generation_;
        std::string watermark_;

        mutable std::mutex mutex_;
        std::uint64_t access_count_{0};
    };

    class SessionStore;

    /**
     * Read-only access to a session's rule set. Holds only weak references:
     * every accessor re-checks liveness through the store and fails with
     * SessionExpired once the session has ended.
     */
    class RuleSetView
    {
    public:
        RuleSetView(std::weak_ptr<SessionStore> store, SessionHandle handle, std::weak_ptr<const Session> session);

        bool valid() const;

        /** Patterns in priority order; unknown categories yield an empty list */
        Result<std::vector<std::string>> patterns(std::string_view category) const;
        Result<std::vector<std::string>> categories() const;
        Result<std::string> prompt(std::string_view prompt_type) const;
        Result<double> confidence_threshold(std::string_view category) const;
        Result<std::string> watermark() const;

    private:
        Result<std::shared_ptr<const Session>> lock() const;

        std::weak_ptr<SessionStore> store_;
        SessionHandle handle_;
        std::weak_ptr<const Session> session_;
    };

    struct SessionStatus
    {
        EntitlementRecord record;
        Timestamp started_at;
        std::uint64_t access_count{0};
        std::string watermark;
        bool live{false};
    };

    /**
     * Registry of activated entitlements, at most one live session per
     * identity. The map is guarded by a shared mutex; activations are
     * serialized; each session guards its own counter.
     *
     * A session found not live by any liveness check is evicted on the spot,
     * which destroys it and wipes its rule set. Rule set views require the
     * store to be owned by a std::shared_ptr.
     */
    class SessionStore : public std::enable_shared_from_this<SessionStore>
    {
    public:
        SessionStore(std::shared_ptr<const ValidationPipeline> pipeline,
                     std::shared_ptr<const PayloadUnlockEngine> unlock_engine,
                     SessionPolicy policy = {},
                     std::shared_ptr<DiagnosticsLog> diagnostics = nullptr);

        /**
         * Validate, unlock and install a session, replacing any previous
         * session for the same identity. On failure nothing changes and the
         * specific error is returned.
         */
        Result<SessionHandle> activate(std::string_view entitlement_bytes);

        /**
         * Re-validates the record; also checks handle currency, age and quota.
         * A current handle whose session is no longer live is evicted.
         */
        bool is_live(const SessionHandle &handle);

        /** Release the session if the handle is still current */
        void teardown(const SessionHandle &handle);

        /** Release every session */
        void clear();

        /** Drop sessions past their age limit, over quota or no longer validating */
        std::size_t purge_expired();

        std::optional<SessionHandle> handle_for(std::string_view identity) const;

        /**
         * Count one access for the identity's session and report whether the
         * feature may be used now. Unknown identities return false.
         */
        bool record_access(std::string_view identity, std::string_view feature);

        /** Sorted feature names while the session is live, else empty */
        std::vector<std::string> features(std::string_view identity);

        Result<RuleSetView> rule_set(std::string_view identity);

        std::optional<SessionStatus> status(std::string_view identity) const;

        std::size_t size() const;

        const SessionPolicy &policy() const { return policy_; }
        const ValidationPipeline &pipeline() const { return *pipeline_; }

    private:
        std::shared_ptr<Session> find(std::string_view identity) const;
        bool within_age(const Session &session) const;
        bool live(const Session &session) const;
        /** live(), evicting the session when it is not */
        bool live_or_evict(const Session &session);
        void evict(const std::string &identity, std::uint64_t generation);

        std::shared_ptr<const ValidationPipeline> pipeline_;
        std::shared_ptr<const PayloadUnlockEngine> unlock_engine_;
        SessionPolicy policy_;
        std::shared_ptr<DiagnosticsLog> diagnostics_;

        std::mutex activation_mutex_;
        std::uint64_t next_generation_{1};

        mutable std::shared_mutex mutex_;
        std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
    };

} // namespace warden
