#pragma once

#include <expected>
#include <stdexcept>
#include <string>
#include <string_view>

namespace warden
{

    /**
     * Error kinds for entitlement operations.
     * The first group is produced by the validation pipeline and payload
     * unlock; callers of the service facade only ever see ActivationFailed.
     */
    enum class ErrorCode
    {
        MalformedRecord,
        ExpiredEntitlement,
        SignatureMismatch,
        ClockIntegrityFailure,
        EnvironmentRejected,
        DecryptionFailed,
        NotActivated,
        SessionExpired,
        ActivationFailed,
        NotFound,
        ConfigError,
        CryptoError,
        IOError,
        InvalidInput
    };

    /**
     * Stable name of an error code, used in diagnostics events
     */
    std::string_view error_code_name(ErrorCode code);

    /**
     * Warden error with code and message
     */
    class WardenError : public std::runtime_error
    {
    public:
        ErrorCode code;

        WardenError(ErrorCode code, const std::string &message)
            : std::runtime_error(message), code(code) {}

        static WardenError malformed(const std::string &msg)
        {
            return WardenError(ErrorCode::MalformedRecord, msg);
        }

        static WardenError expired(const std::string &msg)
        {
            return WardenError(ErrorCode::ExpiredEntitlement, msg);
        }

        static WardenError signature(const std::string &msg)
        {
            return WardenError(ErrorCode::SignatureMismatch, msg);
        }

        static WardenError clock(const std::string &msg)
        {
            return WardenError(ErrorCode::ClockIntegrityFailure, msg);
        }

        static WardenError environment(const std::string &msg)
        {
            return WardenError(ErrorCode::EnvironmentRejected, msg);
        }

        static WardenError decryption(const std::string &msg)
        {
            return WardenError(ErrorCode::DecryptionFailed, msg);
        }

        static WardenError not_activated(const std::string &msg)
        {
            return WardenError(ErrorCode::NotActivated, msg);
        }

        static WardenError session_expired(const std::string &msg)
        {
            return WardenError(ErrorCode::SessionExpired, msg);
        }

        static WardenError activation_failed()
        {
            return WardenError(ErrorCode::ActivationFailed, "activation failed");
        }

        static WardenError not_found(const std::string &msg)
        {
            return WardenError(ErrorCode::NotFound, msg);
        }

        static WardenError config(const std::string &msg)
        {
            return WardenError(ErrorCode::ConfigError, msg);
        }

        static WardenError crypto(const std::string &msg)
        {
            return WardenError(ErrorCode::CryptoError, msg);
        }

        static WardenError io(const std::string &msg)
        {
            return WardenError(ErrorCode::IOError, msg);
        }

        static WardenError invalid_input(const std::string &msg)
        {
            return WardenError(ErrorCode::InvalidInput, msg);
        }
    };

    /**
     * Result type using C++23 std::expected
     */
    template <typename T>
    using Result = std::expected<T, WardenError>;

} // namespace warden
