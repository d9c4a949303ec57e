#include "feedlink/resilience/rate_limiter.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <thread>

namespace feedlink {

    RateLimiter::RateLimiter(RateLimiterConfig cfg)
        : RateLimiter(cfg, Clock::now()) {}

    RateLimiter::RateLimiter(RateLimiterConfig cfg, Clock::time_point start)
        : cfg_(cfg), last_refill_(start) {
        // A bucket that can never hold one token would deny forever.
        if (cfg_.refill_per_second > 0.0 && cfg_.capacity < 1.0) {
            SPDLOG_WARN("rate limiter capacity {} raised to 1", cfg_.capacity);
            cfg_.capacity = 1.0;
        }
        tokens_ = cfg_.capacity;
    }

    void RateLimiter::refill_locked_(Clock::time_point now) {
        if (now <= last_refill_) return;
        const double elapsed =
            std::chrono::duration<double>(now - last_refill_).count();
        tokens_ =
            std::min(cfg_.capacity, tokens_ + elapsed * cfg_.refill_per_second);
        last_refill_ = now;
    }

    RateLimiter::Admission RateLimiter::try_acquire(double cost) {
        return try_acquire_at(Clock::now(), cost);
    }

    RateLimiter::Admission RateLimiter::try_acquire_at(Clock::time_point now,
                                                       double cost) {
        // Unlimited
        if (cfg_.refill_per_second <= 0.0) return {true, {}};

        // A cost above capacity is granted once the bucket is full.
        cost = std::min(cost, cfg_.capacity);

        std::lock_guard<std::mutex> lk(mu_);
        refill_locked_(now);

        if (tokens_ >= cost) {
            tokens_ -= cost;
            return {true, {}};
        }

        const double seconds = (cost - tokens_) / cfg_.refill_per_second;
        auto hint = std::chrono::duration_cast<Clock::duration>(
            std::chrono::duration<double>(seconds));
        // Round up so the retry lands after the token is available.
        if (std::chrono::duration<double>(hint).count() < seconds)
            hint += Clock::duration(1);
        return {false, hint};
    }

    RateLimiter::Clock::duration RateLimiter::acquire(double cost) {
        Clock::duration waited{};
        for (;;) {
            auto adm = try_acquire(cost);
            if (adm.granted) {
                if (waited > Clock::duration::zero()) {
                    SPDLOG_DEBUG("rate limiter delayed admission by {} ms",
                                 std::chrono::duration_cast<
                                     std::chrono::milliseconds>(waited)
                                     .count());
                }
                return waited;
            }
            std::this_thread::sleep_for(adm.wait_hint);
            waited += adm.wait_hint;
        }
    }

    double RateLimiter::available_at(Clock::time_point now) {
        std::lock_guard<std::mutex> lk(mu_);
        refill_locked_(now);
        return tokens_;
    }

}  // namespace feedlink
