#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "feedlink/resilience/circuit_breaker.hpp"

using feedlink::CircuitBreaker;
using feedlink::CircuitBreakerConfig;
using feedlink::CircuitState;
using Decision = CircuitBreaker::Decision;
using namespace std::chrono_literals;

namespace {

    CircuitBreakerConfig three_strikes() {
        CircuitBreakerConfig cfg;
        cfg.failure_threshold = 3;
        cfg.cooldown = 1000ms;
        cfg.cooldown_multiplier = 2.0;
        cfg.max_cooldown = 3000ms;
        return cfg;
    }

    /// Drive a fresh breaker to OPEN at @p t.
    void trip(CircuitBreaker& cb, CircuitBreaker::Clock::time_point t) {
        for (std::size_t i = 0; i < cb.config().failure_threshold; ++i) {
            ASSERT_EQ(cb.admit_at(t), Decision::Allowed);
            cb.record_failure_at(t);
        }
    }

}  // namespace

TEST(CircuitBreakerTest, TripsAfterThresholdAndRejects) {
    const auto t0 = CircuitBreaker::Clock::now();
    CircuitBreaker cb(three_strikes(), "test");

    cb.record_failure_at(t0);
    cb.record_failure_at(t0);
    EXPECT_EQ(cb.state(), CircuitState::Closed);
    cb.record_failure_at(t0);
    EXPECT_EQ(cb.state(), CircuitState::Open);
    EXPECT_EQ(cb.open_count(), 1u);

    EXPECT_EQ(cb.admit_at(t0 + 10ms), Decision::Rejected);
    EXPECT_EQ(cb.rejected_count(), 1u);
}

TEST(CircuitBreakerTest, SuccessResetsConsecutiveFailures) {
    const auto t0 = CircuitBreaker::Clock::now();
    CircuitBreaker cb(three_strikes());

    cb.record_failure_at(t0);
    cb.record_failure_at(t0);
    cb.record_success_at(t0);
    cb.record_failure_at(t0);
    cb.record_failure_at(t0);

    EXPECT_EQ(cb.state(), CircuitState::Closed);
    EXPECT_EQ(cb.snapshot().consecutive_failures, 2u);
}

TEST(CircuitBreakerTest, CooldownAdmitsExactlyOneTrial) {
    const auto t0 = CircuitBreaker::Clock::now();
    CircuitBreaker cb(three_strikes());
    trip(cb, t0);

    EXPECT_EQ(cb.admit_at(t0 + 999ms), Decision::Rejected);
    EXPECT_EQ(cb.admit_at(t0 + 1000ms), Decision::Trial);
    EXPECT_EQ(cb.state(), CircuitState::HalfOpen);
    EXPECT_EQ(cb.admit_at(t0 + 1001ms), Decision::Rejected);
    EXPECT_TRUE(cb.snapshot().trial_in_flight);
}

TEST(CircuitBreakerTest, TrialSuccessCloses) {
    const auto t0 = CircuitBreaker::Clock::now();
    CircuitBreaker cb(three_strikes());
    trip(cb, t0);

    ASSERT_EQ(cb.admit_at(t0 + 1s), Decision::Trial);
    cb.record_success_at(t0 + 1s);

    auto snap = cb.snapshot();
    EXPECT_EQ(snap.state, CircuitState::Closed);
    EXPECT_EQ(snap.consecutive_failures, 0u);
    EXPECT_FALSE(snap.trial_in_flight);
    EXPECT_EQ(cb.admit_at(t0 + 1s), Decision::Allowed);
}

TEST(CircuitBreakerTest, TrialFailureReopensWithGrowingCooldown) {
    const auto t0 = CircuitBreaker::Clock::now();
    CircuitBreaker cb(three_strikes());
    trip(cb, t0);

    const auto t1 = t0 + 1s;
    ASSERT_EQ(cb.admit_at(t1), Decision::Trial);
    cb.record_failure_at(t1);

    auto snap = cb.snapshot();
    EXPECT_EQ(snap.state, CircuitState::Open);
    EXPECT_EQ(snap.opened_at, t1);
    EXPECT_EQ(snap.cooldown, CircuitBreaker::Clock::duration(2s));

    // Old cooldown is not enough any more.
    EXPECT_EQ(cb.admit_at(t1 + 1s), Decision::Rejected);
    ASSERT_EQ(cb.admit_at(t1 + 2s), Decision::Trial);
    cb.record_failure_at(t1 + 2s);

    // Capped at max_cooldown.
    EXPECT_EQ(cb.snapshot().cooldown, CircuitBreaker::Clock::duration(3s));
}

TEST(CircuitBreakerTest, ReleasedTrialLetsNextCallerTry) {
    const auto t0 = CircuitBreaker::Clock::now();
    CircuitBreaker cb(three_strikes());
    trip(cb, t0);

    ASSERT_EQ(cb.admit_at(t0 + 1s), Decision::Trial);
    ASSERT_EQ(cb.admit_at(t0 + 1s), Decision::Rejected);

    cb.release_trial();
    auto snap = cb.snapshot();
    EXPECT_EQ(snap.state, CircuitState::HalfOpen);
    EXPECT_FALSE(snap.trial_in_flight);
    EXPECT_EQ(cb.admit_at(t0 + 1s), Decision::Trial);
    EXPECT_EQ(cb.admit_at(t0 + 1s), Decision::Rejected);
}

TEST(CircuitBreakerTest, ReleaseOutsideHalfOpenIsNoop) {
    const auto t0 = CircuitBreaker::Clock::now();
    CircuitBreaker cb(three_strikes());
    cb.release_trial();
    EXPECT_EQ(cb.state(), CircuitState::Closed);

    trip(cb, t0);
    cb.release_trial();
    EXPECT_EQ(cb.state(), CircuitState::Open);
    EXPECT_EQ(cb.admit_at(t0 + 10ms), Decision::Rejected);
}

TEST(CircuitBreakerTest, ConcurrentCallersGetOneTrial) {
    const auto t0 = CircuitBreaker::Clock::now();
    CircuitBreaker cb(three_strikes());
    trip(cb, t0);

    std::atomic<int> trials{0};
    std::atomic<int> rejected{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 16; ++i) {
        threads.emplace_back([&] {
            auto d = cb.admit_at(t0 + 5s);
            if (d == Decision::Trial) trials.fetch_add(1);
            if (d == Decision::Rejected) rejected.fetch_add(1);
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(trials.load(), 1);
    EXPECT_EQ(rejected.load(), 15);
}

TEST(CircuitBreakerTest, StateNames) {
    EXPECT_EQ(feedlink::to_string(CircuitState::Closed), "CLOSED");
    EXPECT_EQ(feedlink::to_string(CircuitState::Open), "OPEN");
    EXPECT_EQ(feedlink::to_string(CircuitState::HalfOpen), "HALF_OPEN");
}
