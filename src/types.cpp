#include "warden/types.hpp"

namespace warden
{

    std::string_view error_code_name(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::MalformedRecord:
            return "MalformedRecord";
        case ErrorCode::ExpiredEntitlement:
            return "ExpiredEntitlement";
        case ErrorCode::SignatureMismatch:
            return "SignatureMismatch";
        case ErrorCode::ClockIntegrityFailure:
            return "ClockIntegrityFailure";
        case ErrorCode::EnvironmentRejected:
            return "EnvironmentRejected";
        case ErrorCode::DecryptionFailed:
            return "DecryptionFailed";
        case ErrorCode::NotActivated:
            return "NotActivated";
        case ErrorCode::SessionExpired:
            return "SessionExpired";
        case ErrorCode::ActivationFailed:
            return "ActivationFailed";
        case ErrorCode::NotFound:
            return "NotFound";
        case ErrorCode::ConfigError:
            return "ConfigError";
        case ErrorCode::CryptoError:
            return "CryptoError";
        case ErrorCode::IOError:
            return "IOError";
        case ErrorCode::InvalidInput:
            return "InvalidInput";
        }
        return "Unknown";
    }

} // namespace warden
