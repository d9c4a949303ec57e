#pragma once

#include <chrono>
#include <mutex>

#include "feedlink/config.hpp"

namespace feedlink {

    /**
     * @brief Per-origin token bucket.
     *
     * Tokens refill continuously at refill_per_second up to capacity. The
     * limiter only delays: a denied admission carries the time after which
     * the same cost will be granted, and the caller either sleeps or
     * suspends for that long before asking again.
     *
     * Thread-safe; every admission check is one read-modify-write under a
     * mutex.
     */
    class RateLimiter {
       public:
        using Clock = std::chrono::steady_clock;

        /// @brief Outcome of one admission check.
        struct Admission {
            bool granted{false};
            /// @brief (cost - tokens) / rate when not granted, else zero.
            Clock::duration wait_hint{};
        };

        explicit RateLimiter(RateLimiterConfig cfg = {});
        RateLimiter(RateLimiterConfig cfg, Clock::time_point start);

        RateLimiter(const RateLimiter&) = delete;
        RateLimiter& operator=(const RateLimiter&) = delete;

        /// @brief Non-blocking admission at the current time.
        Admission try_acquire(double cost = 1.0);

        /// @brief Non-blocking admission at an explicit instant.
        Admission try_acquire_at(Clock::time_point now, double cost = 1.0);

        /// @brief Block the calling thread until @p cost tokens are granted.
        /// @return Total time spent waiting.
        Clock::duration acquire(double cost = 1.0);

        /// @brief Tokens available at @p now (after refill), for tests and
        /// introspection.
        double available_at(Clock::time_point now);

        const RateLimiterConfig& config() const noexcept { return cfg_; }

       private:
        void refill_locked_(Clock::time_point now);

        RateLimiterConfig cfg_;
        std::mutex mu_;
        double tokens_{0.0};
        Clock::time_point last_refill_;
    };

}  // namespace feedlink
