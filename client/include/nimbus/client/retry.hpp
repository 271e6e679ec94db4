#pragma once

#include <chrono>
#include <cstddef>
#include <thread>
#include <type_traits>

#include "nimbus/client/config.hpp"
#include "nimbus/client/errors.hpp"

namespace nimbus::client
{

    // Delay before the retry that follows the given failed attempt (1-based).
    std::chrono::milliseconds backoff_delay(const RetryPolicy &policy, std::size_t failed_attempt) noexcept;

    // Runs op until it succeeds, retrying NetworkError up to policy.max_attempts times in total.
    // on_retry(attempt, error) is called before each wait; other exception types propagate at once.
    template <typename Op, typename OnRetry>
    auto with_retry(const RetryPolicy &policy, Op &&op, OnRetry &&on_retry) -> std::invoke_result_t<Op &>
    {
        for (std::size_t attempt = 1;; ++attempt)
        {
            try
            {
                return op();
            }
            catch (const NetworkError &error)
            {
                if (attempt >= policy.max_attempts)
                {
                    throw;
                }
                on_retry(attempt, error);
                std::this_thread::sleep_for(backoff_delay(policy, attempt));
            }
        }
    }

} // namespace nimbus::client
