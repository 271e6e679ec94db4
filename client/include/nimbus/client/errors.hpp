/**
 * Nimbus - Client error taxonomy.
 *
 * Every failure surfaced by the client core is one of the exception types
 * below. NetworkError is the only kind that is retried internally.
 */
#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

#include "nimbus/error_codes.hpp"

namespace nimbus::client
{

    class Error : public std::runtime_error
    {
    public:
        Error(ErrorCode code, const std::string &message);

        ErrorCode code() const noexcept { return code_; }

    private:
        ErrorCode code_;
    };

    class AuthError : public Error
    {
    public:
        enum class Reason
        {
            InvalidCredentials,
            AlreadyAuthenticated,
            NotAuthenticated,
            SessionExpired,
            Revoked
        };

        AuthError(Reason reason, const std::string &message);

        Reason reason() const noexcept { return reason_; }

    private:
        Reason reason_;
    };

    std::string_view to_string(AuthError::Reason reason) noexcept;

    class NetworkError : public Error
    {
    public:
        explicit NetworkError(const std::string &message, ErrorCode code = ErrorCode::Busy);
    };

    class NotFoundError : public Error
    {
    public:
        explicit NotFoundError(const std::string &message);
    };

    class IntegrityError : public Error
    {
    public:
        explicit IntegrityError(const std::string &message);
    };

    class QuotaError : public Error
    {
    public:
        explicit QuotaError(const std::string &message);
    };

    // A mutation the authority refused (conflict, malformed request, ...).
    class RequestError : public Error
    {
    public:
        RequestError(ErrorCode code, const std::string &message);
    };

    // Throws the exception type matching a wire error code.
    [[noreturn]] void throw_for_error(ErrorCode code, const std::string &message);

} // namespace nimbus::client
