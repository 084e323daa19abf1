#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace warden
{
    struct AuditEvent
    {
        std::string ts;
        std::string identity;
        std::string action;
        std::string layer;
        std::string result;
        nlohmann::json details;

        nlohmann::json to_json() const;

        /** Build an event stamped with the current wall time */
        static AuditEvent make(std::string identity,
                               std::string action,
                               std::string layer,
                               std::string result,
                               nlohmann::json details = nlohmann::json::object());
    };

    /**
     * AuditChain links events with hashes for tamper detection. Each link is
     * SHA-256 over the previous link and the event's canonical JSON.
     */
    class AuditChain
    {
    public:
        AuditChain();

        /** Append an event, returning its chain hash */
        std::string append(const AuditEvent &event);

        /** Last hash in the chain */
        std::optional<std::string> head() const;

        std::size_t length() const { return length_; }

        /** Hash of one link given the previous link (empty for the first event) */
        static std::string link(const std::string &previous, const AuditEvent &event);

        /** Recompute a chain from scratch and compare against the expected head */
        static bool verify(const std::vector<AuditEvent> &events, const std::string &expected_head);

    private:
        std::string head_;
        std::size_t length_{0};
    };

    /**
     * Operator-facing diagnostics channel. Keeps a bounded history of events,
     * chains them, and writes each to the "warden.audit" logger. The specific
     * reason an activation failed is only visible here.
     */
    class DiagnosticsLog
    {
    public:
        explicit DiagnosticsLog(std::size_t capacity = 256);

        void record(AuditEvent event);

        void record_failure(const std::string &identity,
                            std::string_view action,
                            std::string_view layer,
                            const WardenError &error);

        std::vector<AuditEvent> recent() const;

        /** Most recent failed activation for an identity */
        std::optional<AuditEvent> last_failure(std::string_view identity) const;

        std::optional<std::string> chain_head() const;

        std::size_t capacity() const { return capacity_; }

    private:
        mutable std::mutex mutex_;
        std::deque<AuditEvent> events_;
        AuditChain chain_;
        std::size_t capacity_;
    };

} // namespace warden
