#pragma once

#include <atomic>
#include <cstddef>

#include "feedlink/config.hpp"
#include "feedlink/origin.hpp"
#include "feedlink/resilience/circuit_breaker.hpp"
#include "feedlink/resilience/rate_limiter.hpp"

namespace feedlink {

    /**
     * @brief Mutable resilience state of one origin.
     *
     * Owned by the ConnectionPool entry for the origin and shared by the
     * blocking and the coroutine client of that origin, so both variants
     * draw from one token bucket and trip one breaker.
     */
    struct OriginState {
        OriginState(Origin o, const ClientConfiguration& cfg)
            : origin(o.normalized()),
              limiter(cfg.rate_limit),
              breaker(cfg.circuit_breaker, origin.to_string()) {}

        const Origin origin;
        RateLimiter limiter;
        CircuitBreaker breaker;
        /// @brief Logical calls in progress, including those waiting on the
        /// limiter or sleeping in backoff.
        std::atomic<std::size_t> calls_in_flight{0};
    };

    /// @brief Counts one logical call against its origin while alive.
    class InFlightCall {
       public:
        explicit InFlightCall(OriginState& state) noexcept : state_(state) {
            state_.calls_in_flight.fetch_add(1, std::memory_order_relaxed);
        }

        ~InFlightCall() {
            state_.calls_in_flight.fetch_sub(1, std::memory_order_relaxed);
        }

        InFlightCall(const InFlightCall&) = delete;
        InFlightCall& operator=(const InFlightCall&) = delete;

       private:
        OriginState& state_;
    };

}  // namespace feedlink
