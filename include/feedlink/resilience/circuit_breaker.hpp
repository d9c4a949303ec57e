#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>

#include "feedlink/config.hpp"

namespace feedlink {

    /// @brief Circuit breaker state.
    enum class CircuitState : std::uint8_t {
        Closed,   ///< Normal operation, attempts allowed
        Open,     ///< Failing fast until the cooldown elapses
        HalfOpen  ///< One trial call in flight
    };

    [[nodiscard]] constexpr std::string_view to_string(
        CircuitState state) noexcept {
        switch (state) {
            case CircuitState::Closed:
                return "CLOSED";
            case CircuitState::Open:
                return "OPEN";
            case CircuitState::HalfOpen:
                return "HALF_OPEN";
        }
        return "UNKNOWN";
    }

    /**
     * @brief Per-origin failure isolation state machine.
     *
     * State machine:
     *   CLOSED    -> OPEN      (failure_threshold consecutive failures)
     *   OPEN      -> HALF_OPEN (first admit() after the cooldown)
     *   HALF_OPEN -> CLOSED    (trial success)
     *   HALF_OPEN -> OPEN      (trial failure, cooldown grows by
     *                           cooldown_multiplier up to max_cooldown)
     *
     * Exactly one trial is admitted per HALF_OPEN period; every other
     * caller is rejected until the trial reports its outcome.
     *
     * Thread-safe. All transitions happen under one mutex; the state is
     * mirrored in an atomic for lock-free observation.
     */
    class CircuitBreaker {
       public:
        using Clock = std::chrono::steady_clock;

        /// @brief Admission decision for one logical call.
        enum class Decision {
            Allowed,  ///< CLOSED, proceed
            Trial,    ///< This call is the HALF_OPEN trial
            Rejected  ///< Fail fast with CircuitOpen
        };

        /// @brief Consistent copy of the breaker's fields.
        struct Snapshot {
            CircuitState state{CircuitState::Closed};
            std::size_t consecutive_failures{0};
            std::size_t failure_threshold{0};
            Clock::duration cooldown{};
            Clock::time_point opened_at{};
            bool trial_in_flight{false};
        };

        explicit CircuitBreaker(CircuitBreakerConfig cfg = {},
                                std::string name = {});

        CircuitBreaker(const CircuitBreaker&) = delete;
        CircuitBreaker& operator=(const CircuitBreaker&) = delete;

        [[nodiscard]] Decision admit() { return admit_at(Clock::now()); }
        [[nodiscard]] Decision admit_at(Clock::time_point now);

        void record_success() { record_success_at(Clock::now()); }
        void record_success_at(Clock::time_point now);

        void record_failure() { record_failure_at(Clock::now()); }
        void record_failure_at(Clock::time_point now);

        /// @brief Give back a HALF_OPEN trial that ended without an outcome
        /// (cancelled or torn down). The next admit() becomes the trial.
        void release_trial();

        [[nodiscard]] CircuitState state() const noexcept {
            return state_.load(std::memory_order_acquire);
        }

        [[nodiscard]] Snapshot snapshot() const;

        /// @brief Calls rejected without a network attempt.
        [[nodiscard]] std::uint64_t rejected_count() const noexcept {
            return rejected_.load(std::memory_order_relaxed);
        }

        /// @brief Number of CLOSED/HALF_OPEN -> OPEN transitions.
        [[nodiscard]] std::uint64_t open_count() const noexcept {
            return opened_.load(std::memory_order_relaxed);
        }

        const CircuitBreakerConfig& config() const noexcept { return cfg_; }

       private:
        void open_locked_(Clock::time_point now);
        void transition_locked_(CircuitState next);

        CircuitBreakerConfig cfg_;
        std::string name_;

        mutable std::mutex mu_;
        std::atomic<CircuitState> state_{CircuitState::Closed};
        std::size_t consecutive_failures_{0};
        Clock::duration cooldown_;
        Clock::time_point opened_at_{};
        bool trial_in_flight_{false};

        std::atomic<std::uint64_t> rejected_{0};
        std::atomic<std::uint64_t> opened_{0};
    };

}  // namespace feedlink
