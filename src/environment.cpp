#include "warden/environment.hpp"
#include <fstream>

namespace warden
{

    TracerAttestor::TracerAttestor(std::string status_path) : status_path_(std::move(status_path)) {}

    Result<void> TracerAttestor::attest() const
    {
        std::ifstream status(status_path_);
        if (!status.is_open())
        {
            return std::unexpected(WardenError::environment("Process status unavailable: " + status_path_));
        }

        const std::string prefix = "TracerPid:";
        std::string line;
        while (std::getline(status, line))
        {
            if (line.rfind(prefix, 0) != 0)
                continue;

            auto value = line.substr(prefix.size());
            auto first = value.find_first_not_of(" \t");
            if (first == std::string::npos)
                break;
            if (value.substr(first) != "0")
            {
                return std::unexpected(WardenError::environment("Process is being traced"));
            }
            return {};
        }

        return std::unexpected(WardenError::environment("TracerPid not reported"));
    }

} // namespace warden
