#pragma once
#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace feedlink {

    class RequestInterceptor;

    /**
     * @brief Retry/backoff policy shared by both client variants.
     *
     * Delay before attempt k+1 is
     * min(max_delay, base_delay * 2^(k-1) + uniform(0, base_delay * jitter)).
     */
    struct RetryPolicy {
        /** @brief Total attempts including the first one. */
        std::size_t max_attempts{5};
        std::chrono::milliseconds base_delay{500};
        std::chrono::milliseconds max_delay{5000};
        /** @brief Jitter upper bound as a fraction of base_delay. */
        double jitter_fraction{1.0};
        /** @brief Statuses treated as transient. */
        std::set<int> retryable_statuses{302, 403, 429, 500, 502, 503, 504};

        /**
         * @brief When true, every failed attempt is reported to the circuit
         * breaker. When false (default) only the terminal outcome of a call
         * is reported, so transient failures that recover on retry never
         * count toward the trip threshold.
         */
        bool count_transient_failures{false};

        /** @brief Honor a numeric Retry-After header on 429 responses. */
        bool respect_retry_after{true};
        std::chrono::milliseconds max_retry_after{5000};
    };

    /**
     * @brief Token bucket parameters for one origin.
     */
    struct RateLimiterConfig {
        /** @brief Max tokens (burst size). Raised to 1 when lower. */
        double capacity{10.0};
        /** @brief Continuous refill rate in tokens per second. Zero or less
         * disables limiting. */
        double refill_per_second{10.0};
    };

    /**
     * @brief Circuit breaker parameters for one origin.
     */
    struct CircuitBreakerConfig {
        /** @brief Consecutive failures that trip CLOSED -> OPEN. */
        std::size_t failure_threshold{5};
        /** @brief Time OPEN before the next call becomes the trial. */
        std::chrono::milliseconds cooldown{30000};
        /** @brief Cooldown growth after a failed trial (1.0 disables). */
        double cooldown_multiplier{2.0};
        std::chrono::milliseconds max_cooldown{300000};
    };

    /**
     * @brief Configuration for a pooled client bound to one origin.
     */
    struct ClientConfiguration {
        /** @brief Optional base URL (scheme://host[:port][/prefix]). */
        std::optional<std::string> base_url;

        /** @brief User-Agent string sent with each request. */
        std::string user_agent{"feedlink/1.0"};

        /** @brief Default headers to include in every request. */
        std::map<std::string, std::string> default_headers;

        /** @brief Timeout for establishing a connection. */
        std::chrono::milliseconds connect_timeout{5000};

        /** @brief Deadline for one attempt (write + read). */
        std::chrono::milliseconds request_timeout{15000};

        /** @brief Maximum size of buffered response bodies in bytes. */
        std::size_t max_body_bytes{static_cast<std::size_t>(10) * 1024U * 1024U};

        /** @brief Whether to verify TLS certificates. */
        bool verify_tls{true};

        /** @brief Live transport connections kept per origin. */
        std::size_t max_connections{4};

        /** @brief Requests per connection before it is rotated. */
        std::size_t max_connection_reuse_count{1000};

        /** @brief GET_JSON rejects bodies not served as application/json. */
        bool require_json_content_type{true};

        RetryPolicy retry;
        RateLimiterConfig rate_limit;
        CircuitBreakerConfig circuit_breaker;

        /** @brief Middleware interceptors for static header injection. */
        std::vector<std::shared_ptr<const RequestInterceptor>> interceptors;
    };

    /**
     * @brief Configuration for the origin registry.
     */
    struct ConnectionPoolConfiguration {
        /** @brief Template applied to every client the pool creates. The
         * base_url field is replaced with the origin of each entry. */
        ClientConfiguration client;

        /** @brief Entries idle longer than this are evicted (0 disables). */
        std::chrono::milliseconds idle_ttl{300000};
    };

}  // namespace feedlink
