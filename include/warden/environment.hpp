#pragma once

#include "types.hpp"
#include <string>

namespace warden
{

    /**
     * Deployment-specific attestation invoked as the last validation layer.
     */
    class EnvironmentAttestor
    {
    public:
        virtual ~EnvironmentAttestor() = default;

        /** Returns EnvironmentRejected when execution should not proceed */
        virtual Result<void> attest() const = 0;
    };

    class PermissiveEnvironment : public EnvironmentAttestor
    {
    public:
        Result<void> attest() const override { return {}; }
    };

    /**
     * Rejects execution under a debugger or tracer (Linux TracerPid).
     * An unreadable status file is a rejection.
     */
    class TracerAttestor : public EnvironmentAttestor
    {
    public:
        explicit TracerAttestor(std::string status_path = "/proc/self/status");

        Result<void> attest() const override;

    private:
        std::string status_path_;
    };

} // namespace warden
