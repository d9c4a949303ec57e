#pragma once

#include <chrono>
#include <cstddef>
#include <optional>

#include "feedlink/config.hpp"
#include "feedlink/response.hpp"

namespace feedlink {

    /// @brief base_delay * 2^(attempt-1), capped at max_delay. Attempts are
    /// 1-based; attempt 0 is treated as 1.
    std::chrono::milliseconds nominal_backoff(const RetryPolicy& policy,
                                              std::size_t attempt);

    /**
     * @brief Delay to sleep after failed attempt @p attempt.
     * @param unit_random Sample in [0, 1) scaled to the jitter window
     * [0, base_delay * jitter_fraction).
     */
    std::chrono::milliseconds backoff_delay(const RetryPolicy& policy,
                                            std::size_t attempt,
                                            double unit_random);

    /// @brief Same as above with a thread-local random source.
    std::chrono::milliseconds backoff_delay(const RetryPolicy& policy,
                                            std::size_t attempt);

    inline bool is_retryable_status(const RetryPolicy& policy, int status) {
        return policy.retryable_statuses.count(status) != 0;
    }

    /// @brief Numeric Retry-After (delta-seconds) of a 429 response, capped
    /// at max_retry_after. Empty when absent, non-numeric or disabled.
    std::optional<std::chrono::milliseconds> retry_after_delay(
        const RetryPolicy& policy, const Response& response);

}  // namespace feedlink
