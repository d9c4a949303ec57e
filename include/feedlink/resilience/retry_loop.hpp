#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

#include "feedlink/config.hpp"
#include "feedlink/resilience/circuit_breaker.hpp"
#include "feedlink/resilience/rate_limiter.hpp"
#include "feedlink/response.hpp"
#include "feedlink/result.hpp"

namespace feedlink {

    /**
     * @brief The retry / circuit-breaker algorithm for one logical call,
     * without any I/O or waiting.
     *
     * The blocking and the coroutine client drive the same loop and only
     * differ in how they wait (thread sleep vs. timer suspension):
     *
     * @code
     * RetryLoop loop(policy, limiter, breaker, origin);
     * if (auto rejected = loop.begin()) return *rejected;
     * for (;;) {
     *     while (!(adm = loop.admit()).granted) wait(adm.wait_hint);
     *     auto step = loop.on_outcome(perform_attempt());
     *     if (step.done) return loop.take_result();
     *     wait(step.delay);
     * }
     * @endcode
     *
     * Breaker accounting: when RetryPolicy::count_transient_failures is
     * false only the terminal outcome of the call is reported, so a call
     * that recovers on retry never counts as a failure. When true, every
     * failed attempt is reported and the loop stops with CircuitOpen as
     * soon as the breaker trips.
     *
     * A loop holding the HALF_OPEN trial that is destroyed before any
     * outcome was reported (coroutine frame torn down, exception out of an
     * attempt) releases the trial so the breaker does not reject forever.
     */
    class RetryLoop {
       public:
        struct Step {
            bool done{false};
            std::chrono::milliseconds delay{0};
        };

        RetryLoop(const RetryPolicy& policy, RateLimiter& limiter,
                  CircuitBreaker& breaker, std::string origin);

        ~RetryLoop();

        RetryLoop(const RetryLoop&) = delete;
        RetryLoop& operator=(const RetryLoop&) = delete;

        /// @brief Consult the breaker. Returns the CircuitOpen error when
        /// the call must fail fast; the limiter is not touched then.
        [[nodiscard]] std::optional<Error> begin();

        /// @brief Limiter admission for the next attempt.
        [[nodiscard]] RateLimiter::Admission admit();

        /// @brief Classify one attempt outcome and decide what happens next.
        Step on_outcome(Result<Response> outcome);

        /// @brief Final result once a Step with done == true was returned.
        Result<Response> take_result();

        std::size_t attempts() const noexcept { return attempts_; }

        /// @brief Total time the limiter asked this call to wait.
        RateLimiter::Clock::duration limiter_wait() const noexcept {
            return limiter_wait_;
        }

       private:
        Step transient(Error err, const Response* response);
        Step finish_err(Error err, bool report);
        Error decorate(Error err) const;
        void report_success();
        void report_failure();

        const RetryPolicy& policy_;
        RateLimiter& limiter_;
        CircuitBreaker& breaker_;
        std::string origin_;

        std::size_t max_attempts_;
        std::size_t attempts_{0};
        RateLimiter::Clock::duration limiter_wait_{};
        std::optional<Result<Response>> final_;
        bool trial_{false};
        bool reported_{false};
    };

}  // namespace feedlink
