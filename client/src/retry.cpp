#include "nimbus/client/retry.hpp"

#include <algorithm>

namespace nimbus::client
{

    std::chrono::milliseconds backoff_delay(const RetryPolicy &policy, std::size_t failed_attempt) noexcept
    {
        if (failed_attempt == 0)
        {
            return std::chrono::milliseconds{0};
        }
        const auto shift = std::min<std::size_t>(failed_attempt - 1, 20);
        const auto delay = policy.base_delay * (1LL << shift);
        return std::min<std::chrono::milliseconds>(delay, policy.max_delay);
    }

} // namespace nimbus::client
