#pragma once

#include <utility>  // std::exchange, needed by boost/asio/awaitable.hpp (Boost 1.74)
#include <boost/asio/awaitable.hpp>
#include <boost/asio/thread_pool.hpp>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "feedlink/origin.hpp"
#include "feedlink/request.hpp"
#include "feedlink/response.hpp"
#include "feedlink/result.hpp"

namespace feedlink {

    class ConnectionPool;

    enum class BatchStrategy {
        Sequential,  ///< One request at a time
        Fixed,       ///< Windows of max_batch_size, max_concurrent in flight
        Adaptive     ///< Windows whose concurrency follows observed health
    };

    inline const char* to_string(BatchStrategy s) noexcept {
        switch (s) {
            case BatchStrategy::Sequential:
                return "sequential";
            case BatchStrategy::Fixed:
                return "fixed";
            case BatchStrategy::Adaptive:
                return "adaptive";
        }
        return "unknown";
    }

    struct BatchConfiguration {
        /// @brief Requests per window.
        std::size_t max_batch_size{10};
        /// @brief Upper bound of requests in flight. Also the number of
        /// worker threads of the blocking batcher.
        std::size_t max_concurrent{3};
        BatchStrategy strategy{BatchStrategy::Adaptive};
        /// @brief Requests unresolved at this deadline fail with Timeout.
        std::optional<std::chrono::milliseconds> batch_timeout;
        /// @brief Starting concurrency of the Adaptive strategy.
        std::size_t initial_concurrency{2};
    };

    /// @brief One logical request of a batch. `index` is the caller-assigned
    /// output position; indices must be a permutation of [0, n).
    struct BatchRequest {
        Origin origin;
        Request request;
        std::size_t index{0};
    };

    struct BatchResult {
        bool success{false};
        std::optional<Response> data;
        std::optional<Error> error;
        std::chrono::steady_clock::duration duration{};
        /// @brief Attempts beyond the first.
        std::size_t retry_count{0};
    };

    /// @brief Partition of one batch's results by success.
    struct BatchSummary {
        std::size_t total{0};
        std::size_t successful{0};
        std::size_t failed{0};
    };

    BatchSummary summarize(const std::vector<BatchResult>& results);

    /// @brief Cumulative counters across submit() calls.
    struct BatchStats {
        std::size_t total_requests{0};
        std::size_t successful_requests{0};
        std::size_t failed_requests{0};
        std::size_t batches{0};
        /// @brief Wall time spent inside submit calls.
        std::chrono::steady_clock::duration total_duration{};
        /// @brief Sum of per-request durations.
        std::chrono::steady_clock::duration request_time{};

        std::chrono::steady_clock::duration avg_request_time() const {
            if (total_requests == 0) return {};
            return request_time / static_cast<long long>(total_requests);
        }

        double requests_per_second() const {
            const double secs =
                std::chrono::duration<double>(total_duration).count();
            return secs > 0.0 ? static_cast<double>(total_requests) / secs
                              : 0.0;
        }
    };

    /**
     * @brief Concurrency level per window.
     *
     * Fixed and Sequential keep a constant level. Adaptive uses additive
     * increase / multiplicative decrease, bounded to [1, max_concurrent]:
     * - any error in a window halves the level
     * - an error-free window raises it by one, unless its mean latency grew
     *   more than 25% over the previous window, in which case it is held
     */
    class ConcurrencyPlanner {
       public:
        ConcurrencyPlanner(BatchStrategy strategy, std::size_t max_concurrent,
                           std::size_t initial);

        std::size_t level() const noexcept { return level_; }

        void observe(std::size_t completed, std::size_t errors,
                     std::chrono::steady_clock::duration mean_latency);

       private:
        BatchStrategy strategy_;
        std::size_t max_;
        std::size_t level_;
        std::optional<std::chrono::steady_clock::duration> prev_latency_;
    };

    /**
     * @brief Fans logical requests out under a concurrency cap and returns
     * results in submission-index order.
     *
     * A failing request never aborts the batch; its failure is captured in
     * its BatchResult. Only malformed input (bad indices) fails the call.
     */
    class RequestBatcher {
       public:
        using Dispatcher = std::function<Result<Response>(const BatchRequest&)>;
        using AsyncDispatcher = std::function<boost::asio::awaitable<
            Result<Response>>(const BatchRequest&)>;

        /// @brief Routes requests through @p pool: blocking clients for
        /// submit(), async clients for async_submit().
        explicit RequestBatcher(std::shared_ptr<ConnectionPool> pool,
                                BatchConfiguration cfg = {});

        /// @brief Custom dispatch, e.g. for tests or non-HTTP work.
        RequestBatcher(Dispatcher dispatch, AsyncDispatcher async_dispatch,
                       BatchConfiguration cfg = {});

        ~RequestBatcher();

        RequestBatcher(const RequestBatcher&) = delete;
        RequestBatcher& operator=(const RequestBatcher&) = delete;

        /// @brief Blocking submit with the configured strategy and cap.
        Result<std::vector<BatchResult>> submit(
            std::vector<BatchRequest> requests);

        /// @brief Blocking submit. @p max_concurrent is capped by the
        /// worker count (BatchConfiguration::max_concurrent).
        Result<std::vector<BatchResult>> submit(
            std::vector<BatchRequest> requests, BatchStrategy strategy,
            std::size_t max_concurrent);

        /**
         * @brief Coroutine submit. Workers run on the calling coroutine's
         * executor, which must not run handlers concurrently (a single
         * threaded io_context or a strand).
         */
        boost::asio::awaitable<Result<std::vector<BatchResult>>> async_submit(
            std::vector<BatchRequest> requests);

        boost::asio::awaitable<Result<std::vector<BatchResult>>> async_submit(
            std::vector<BatchRequest> requests, BatchStrategy strategy,
            std::size_t max_concurrent);

        BatchStats stats() const;
        void reset_stats();

        const BatchConfiguration& config() const noexcept { return cfg_; }

       private:
        void record_(const std::vector<BatchResult>& results,
                     std::chrono::steady_clock::duration elapsed);

        BatchConfiguration cfg_;
        Dispatcher dispatch_;
        AsyncDispatcher async_dispatch_;

        mutable std::mutex stats_mu_;
        BatchStats stats_;

        boost::asio::thread_pool workers_;
    };

}  // namespace feedlink
