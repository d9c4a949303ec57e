#include "feedlink/resilience/circuit_breaker.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace feedlink {

    CircuitBreaker::CircuitBreaker(CircuitBreakerConfig cfg, std::string name)
        : cfg_(cfg),
          name_(std::move(name)),
          cooldown_(std::chrono::duration_cast<Clock::duration>(cfg.cooldown)) {
        if (cfg_.failure_threshold == 0) cfg_.failure_threshold = 1;
    }

    CircuitBreaker::Decision CircuitBreaker::admit_at(Clock::time_point now) {
        std::lock_guard<std::mutex> lk(mu_);

        switch (state_.load(std::memory_order_relaxed)) {
            case CircuitState::Closed:
                return Decision::Allowed;

            case CircuitState::Open:
                if (now - opened_at_ >= cooldown_) {
                    transition_locked_(CircuitState::HalfOpen);
                    trial_in_flight_ = true;
                    return Decision::Trial;
                }
                break;

            case CircuitState::HalfOpen:
                if (!trial_in_flight_) {
                    trial_in_flight_ = true;
                    return Decision::Trial;
                }
                break;
        }

        rejected_.fetch_add(1, std::memory_order_relaxed);
        return Decision::Rejected;
    }

    void CircuitBreaker::record_success_at(Clock::time_point) {
        std::lock_guard<std::mutex> lk(mu_);
        consecutive_failures_ = 0;

        if (state_.load(std::memory_order_relaxed) != CircuitState::Closed) {
            trial_in_flight_ = false;
            cooldown_ =
                std::chrono::duration_cast<Clock::duration>(cfg_.cooldown);
            transition_locked_(CircuitState::Closed);
        }
    }

    void CircuitBreaker::record_failure_at(Clock::time_point now) {
        std::lock_guard<std::mutex> lk(mu_);

        switch (state_.load(std::memory_order_relaxed)) {
            case CircuitState::Closed:
                if (++consecutive_failures_ >= cfg_.failure_threshold) {
                    open_locked_(now);
                }
                break;

            case CircuitState::HalfOpen: {
                ++consecutive_failures_;
                trial_in_flight_ = false;
                const auto cap = std::chrono::duration_cast<Clock::duration>(
                    cfg_.max_cooldown);
                if (cfg_.cooldown_multiplier > 1.0) {
                    auto grown = std::chrono::duration_cast<Clock::duration>(
                        cooldown_ * cfg_.cooldown_multiplier);
                    cooldown_ = std::min(grown, std::max(cap, cooldown_));
                }
                open_locked_(now);
                break;
            }

            case CircuitState::Open:
                // Late report from a call admitted before the trip.
                ++consecutive_failures_;
                break;
        }
    }

    void CircuitBreaker::release_trial() {
        std::lock_guard<std::mutex> lk(mu_);
        if (state_.load(std::memory_order_relaxed) == CircuitState::HalfOpen &&
            trial_in_flight_) {
            trial_in_flight_ = false;
            SPDLOG_DEBUG("circuit {} trial abandoned, slot released", name_);
        }
    }

    CircuitBreaker::Snapshot CircuitBreaker::snapshot() const {
        std::lock_guard<std::mutex> lk(mu_);
        Snapshot s;
        s.state = state_.load(std::memory_order_relaxed);
        s.consecutive_failures = consecutive_failures_;
        s.failure_threshold = cfg_.failure_threshold;
        s.cooldown = cooldown_;
        s.opened_at = opened_at_;
        s.trial_in_flight = trial_in_flight_;
        return s;
    }

    void CircuitBreaker::open_locked_(Clock::time_point now) {
        opened_at_ = now;
        opened_.fetch_add(1, std::memory_order_relaxed);
        transition_locked_(CircuitState::Open);
    }

    void CircuitBreaker::transition_locked_(CircuitState next) {
        const auto prev = state_.exchange(next, std::memory_order_acq_rel);
        if (prev == next) return;

        const auto cooldown_ms =
            std::chrono::duration_cast<std::chrono::milliseconds>(cooldown_)
                .count();
        if (next == CircuitState::Open) {
            SPDLOG_WARN("circuit {} {} -> OPEN after {} failures, cooldown {} ms",
                        name_, to_string(prev), consecutive_failures_,
                        cooldown_ms);
        } else if (next == CircuitState::Closed) {
            SPDLOG_INFO("circuit {} {} -> CLOSED", name_, to_string(prev));
        } else {
            SPDLOG_INFO("circuit {} OPEN -> HALF_OPEN, admitting one trial",
                        name_);
        }
    }

}  // namespace feedlink
