#include "nimbus/client/errors.hpp"

namespace nimbus::client
{

    namespace
    {
        std::string describe(ErrorCode code, const std::string &message)
        {
            if (message.empty())
            {
                return std::string(nimbus::to_string(code));
            }
            return message;
        }
    } // namespace

    Error::Error(ErrorCode code, const std::string &message)
        : std::runtime_error(describe(code, message)), code_(code) {}

    AuthError::AuthError(Reason reason, const std::string &message)
        : Error(reason == Reason::SessionExpired ? ErrorCode::SessionExpired : ErrorCode::AuthenticationFailed,
                message),
          reason_(reason) {}

    std::string_view to_string(AuthError::Reason reason) noexcept
    {
        switch (reason)
        {
        case AuthError::Reason::InvalidCredentials:
            return "invalid_credentials";
        case AuthError::Reason::AlreadyAuthenticated:
            return "already_authenticated";
        case AuthError::Reason::NotAuthenticated:
            return "not_authenticated";
        case AuthError::Reason::SessionExpired:
            return "session_expired";
        case AuthError::Reason::Revoked:
            return "revoked";
        }
        return "unknown";
    }

    NetworkError::NetworkError(const std::string &message, ErrorCode code)
        : Error(code, message) {}

    NotFoundError::NotFoundError(const std::string &message)
        : Error(ErrorCode::NotFound, message) {}

    IntegrityError::IntegrityError(const std::string &message)
        : Error(ErrorCode::IntegrityMismatch, message) {}

    QuotaError::QuotaError(const std::string &message)
        : Error(ErrorCode::QuotaExceeded, message) {}

    RequestError::RequestError(ErrorCode code, const std::string &message)
        : Error(code, message) {}

    void throw_for_error(ErrorCode code, const std::string &message)
    {
        switch (code)
        {
        case ErrorCode::AuthenticationFailed:
            throw AuthError(AuthError::Reason::InvalidCredentials, message);
        case ErrorCode::AuthenticationRequired:
            throw AuthError(AuthError::Reason::Revoked, message);
        case ErrorCode::SessionExpired:
            throw AuthError(AuthError::Reason::SessionExpired, message);
        case ErrorCode::NotFound:
            throw NotFoundError(message);
        case ErrorCode::QuotaExceeded:
            throw QuotaError(message);
        case ErrorCode::IntegrityMismatch:
            throw IntegrityError(message);
        case ErrorCode::Busy:
        case ErrorCode::Timeout:
        case ErrorCode::InternalError:
            throw NetworkError(message, code);
        default:
            throw RequestError(code, message);
        }
    }

} // namespace nimbus::client
