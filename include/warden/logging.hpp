#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace warden::logging
{
    /** Configure the warden loggers. Unknown level names fall back to "info". */
    void init(const std::string &level);

    /** Operational logger ("warden") */
    std::shared_ptr<spdlog::logger> get();

    /** Operator diagnostics logger ("warden.audit"), one JSON object per line */
    std::shared_ptr<spdlog::logger> audit();

} // namespace warden::logging
