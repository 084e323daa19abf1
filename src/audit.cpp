#include "warden/audit.hpp"
#include "warden/crypto.hpp"
#include "warden/logging.hpp"
#include <format>
#include <chrono>
#include <ctime>

namespace warden
{

    namespace
    {
        std::string now_ts()
        {
            auto now = std::chrono::system_clock::now();
            auto t = std::chrono::system_clock::to_time_t(now);
            auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
            std::tm tm_buf;
            gmtime_r(&t, &tm_buf);
            return std::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:03d}Z",
                               tm_buf.tm_year + 1900,
                               tm_buf.tm_mon + 1,
                               tm_buf.tm_mday,
                               tm_buf.tm_hour,
                               tm_buf.tm_min,
                               tm_buf.tm_sec,
                               static_cast<int>(ms.count()));
        }
    } // namespace

    nlohmann::json AuditEvent::to_json() const
    {
        return nlohmann::json{{"ts", ts},
                              {"identity", identity},
                              {"action", action},
                              {"layer", layer},
                              {"result", result},
                              {"details", details}};
    }

    AuditEvent AuditEvent::make(std::string identity,
                                std::string action,
                                std::string layer,
                                std::string result,
                                nlohmann::json details)
    {
        return AuditEvent{now_ts(),
                          std::move(identity),
                          std::move(action),
                          std::move(layer),
                          std::move(result),
                          std::move(details)};
    }

    AuditChain::AuditChain() = default;

    std::string AuditChain::link(const std::string &previous, const AuditEvent &event)
    {
        // nlohmann::json objects are key-sorted, so dump() is canonical here
        std::string material = previous + "\n" + event.to_json().dump();
        return crypto::Hex::encode(crypto::SHA256::hash(material));
    }

    std::string AuditChain::append(const AuditEvent &event)
    {
        head_ = link(head_, event);
        ++length_;
        return head_;
    }

    std::optional<std::string> AuditChain::head() const
    {
        if (length_ == 0)
            return std::nullopt;
        return head_;
    }

    bool AuditChain::verify(const std::vector<AuditEvent> &events, const std::string &expected_head)
    {
        std::string current;
        for (const auto &event : events)
            current = link(current, event);
        return !events.empty() && current == expected_head;
    }

    DiagnosticsLog::DiagnosticsLog(std::size_t capacity)
        : capacity_(capacity == 0 ? 1 : capacity)
    {
    }

    void DiagnosticsLog::record(AuditEvent event)
    {
        nlohmann::json line = event.to_json();
        {
            std::lock_guard lock(mutex_);
            line["chain_hash"] = chain_.append(event);
            events_.push_back(std::move(event));
            while (events_.size() > capacity_)
                events_.pop_front();
        }
        logging::audit()->info(line.dump());
    }

    void DiagnosticsLog::record_failure(const std::string &identity,
                                        std::string_view action,
                                        std::string_view layer,
                                        const WardenError &error)
    {
        record(AuditEvent::make(identity,
                                std::string(action),
                                std::string(layer),
                                std::string(error_code_name(error.code)),
                                nlohmann::json{{"message", error.what()}}));
    }

    std::vector<AuditEvent> DiagnosticsLog::recent() const
    {
        std::lock_guard lock(mutex_);
        return {events_.begin(), events_.end()};
    }

    std::optional<AuditEvent> DiagnosticsLog::last_failure(std::string_view identity) const
    {
        std::lock_guard lock(mutex_);
        for (auto it = events_.rbegin(); it != events_.rend(); ++it)
        {
            if (it->identity == identity && it->action == "activate" && it->result != "ok")
                return *it;
        }
        return std::nullopt;
    }

    std::optional<std::string> DiagnosticsLog::chain_head() const
    {
        std::lock_guard lock(mutex_);
        return chain_.head();
    }

} // namespace warden
