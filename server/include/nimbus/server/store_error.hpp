#pragma once

#include <stdexcept>
#include <string>

#include "nimbus/error_codes.hpp"

namespace nimbus::server
{

    // Raised by the server stores; the session turns it into an error envelope carrying code().
    class StoreError : public std::runtime_error
    {
    public:
        StoreError(ErrorCode code, const std::string &message);

        ErrorCode code() const noexcept { return code_; }

    private:
        ErrorCode code_;
    };

} // namespace nimbus::server
