#include "warden/logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>

namespace warden::logging
{
    namespace
    {
        constexpr const char *kMainLogger = "warden";
        constexpr const char *kAuditLogger = "warden.audit";

        std::mutex &registry_mutex()
        {
            static std::mutex m;
            return m;
        }

        std::shared_ptr<spdlog::logger> get_or_create(const char *name)
        {
            std::lock_guard lock(registry_mutex());
            if (auto existing = spdlog::get(name))
                return existing;
            auto logger = spdlog::stderr_color_mt(name);
            logger->set_pattern("[%Y-%m-%dT%H:%M:%S.%e] [%n] [%l] %v");
            return logger;
        }
    } // namespace

    void init(const std::string &level)
    {
        auto lvl = spdlog::level::from_str(level);
        if (lvl == spdlog::level::off && level != "off")
            lvl = spdlog::level::info;

        get()->set_level(lvl);
        audit()->set_level(lvl);
    }

    std::shared_ptr<spdlog::logger> get()
    {
        return get_or_create(kMainLogger);
    }

    std::shared_ptr<spdlog::logger> audit()
    {
        return get_or_create(kAuditLogger);
    }

} // namespace warden::logging
