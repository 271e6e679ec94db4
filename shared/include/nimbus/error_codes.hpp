/**
 * Nimbus - Error codes shared by the wire protocol, the client core and the server.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace nimbus
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidCommand = 1,
        InvalidPayload = 2,
        NotFound = 3,
        AlreadyExists = 4,
        AuthenticationRequired = 5,
        AuthenticationFailed = 6,
        SessionExpired = 7,
        QuotaExceeded = 8,
        IntegrityMismatch = 9,
        Conflict = 10,
        Busy = 11,
        Unsupported = 12,
        Timeout = 13,
        InternalError = 14
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

} // namespace nimbus
