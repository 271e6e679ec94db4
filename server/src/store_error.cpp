#include "nimbus/server/store_error.hpp"

namespace nimbus::server
{

    StoreError::StoreError(ErrorCode code, const std::string &message)
        : std::runtime_error(message), code_(code) {}

} // namespace nimbus::server
