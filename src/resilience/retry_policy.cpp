#include "feedlink/resilience/retry_policy.hpp"

#include <algorithm>
#include <charconv>
#include <random>
#include <string>

namespace feedlink {

    std::chrono::milliseconds nominal_backoff(const RetryPolicy& policy,
                                              std::size_t attempt) {
        const std::size_t k = std::max<std::size_t>(attempt, 1);
        const auto max_ms = policy.max_delay.count();
        auto delay = policy.base_delay.count();
        for (std::size_t i = 1; i < k && delay < max_ms; ++i) delay *= 2;
        return std::chrono::milliseconds(std::min(delay, max_ms));
    }

    std::chrono::milliseconds backoff_delay(const RetryPolicy& policy,
                                            std::size_t attempt,
                                            double unit_random) {
        const double u = std::clamp(unit_random, 0.0, 1.0);
        const double jitter_window =
            static_cast<double>(policy.base_delay.count()) *
            std::max(0.0, policy.jitter_fraction);
        const auto jitter =
            std::chrono::milliseconds(static_cast<long long>(u * jitter_window));
        return std::min(policy.max_delay,
                        nominal_backoff(policy, attempt) + jitter);
    }

    std::chrono::milliseconds backoff_delay(const RetryPolicy& policy,
                                            std::size_t attempt) {
        thread_local std::mt19937_64 rng{std::random_device{}()};
        std::uniform_real_distribution<double> dist(0.0, 1.0);
        return backoff_delay(policy, attempt, dist(rng));
    }

    std::optional<std::chrono::milliseconds> retry_after_delay(
        const RetryPolicy& policy, const Response& response) {
        if (!policy.respect_retry_after || response.status_code != 429)
            return std::nullopt;

        auto value = response.header("Retry-After");
        if (!value || value->empty()) return std::nullopt;

        long long seconds = 0;
        const char* first = value->data();
        const char* last = first + value->size();
        auto [ptr, ec] = std::from_chars(first, last, seconds);
        if (ec != std::errc{} || ptr != last || seconds < 0)
            return std::nullopt;

        return std::min(std::chrono::milliseconds(seconds * 1000),
                        policy.max_retry_after);
    }

}  // namespace feedlink
