#pragma once

#include <atomic>
#include <boost/asio/any_io_executor.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string_view>
#include <unordered_map>

#include "feedlink/async_client.hpp"
#include "feedlink/client.hpp"
#include "feedlink/config.hpp"
#include "feedlink/connection/pool_types.hpp"
#include "feedlink/origin.hpp"
#include "feedlink/origin_state.hpp"
#include "feedlink/result.hpp"

namespace feedlink {

    /**
     * Registry mapping each origin to its clients and resilience state.
     *
     * SAFETY:
     * - All public methods are thread-safe
     * - Lookup and creation happen under one mutex, so concurrent first
     *   requests for an origin create exactly one client per variant
     *
     * INVARIANTS:
     * 1. One OriginState (rate limiter + breaker) per origin, shared by the
     *    blocking and the async client of that origin
     * 2. At most one PooledClient and one AsyncPooledClient per origin
     *
     * LIFECYCLE:
     * Clients are handed out as shared_ptr. Eviction (explicit, idle TTL or
     * close_all) only drops the registry's reference: calls already holding
     * a client finish normally and its connections close when the last
     * holder lets go. The next lookup creates fresh clients.
     *
     * The OriginState outlives its entry while a client still holds it or
     * its breaker is not CLOSED; the next lookup reuses it, so eviction
     * never splits an origin's limiter or resets a tripped breaker. Idle
     * pruning skips origins with a call in flight (including one waiting on
     * the limiter or in backoff) or a breaker that is not CLOSED.
     */
    class ConnectionPool {
       public:
        /// @brief Pool for blocking clients only.
        explicit ConnectionPool(ConnectionPoolConfiguration cfg = {});

        /// @brief Pool that can also hand out async clients bound to @p ex.
        ConnectionPool(boost::asio::any_io_executor ex,
                       ConnectionPoolConfiguration cfg = {});

        ~ConnectionPool();

        ConnectionPool(const ConnectionPool&) = delete;
        ConnectionPool& operator=(const ConnectionPool&) = delete;

        /// @brief The blocking client for @p origin, created on first use.
        std::shared_ptr<PooledClient> get_client(const Origin& origin);

        /// @brief Same, keyed by the origin of an absolute URL.
        Result<std::shared_ptr<PooledClient>> get_client(std::string_view url);

        /**
         * @brief The coroutine client for @p origin, created on first use.
         * @throws std::logic_error if the pool was built without an executor.
         */
        std::shared_ptr<AsyncPooledClient> get_async_client(
            const Origin& origin);

        Result<std::shared_ptr<AsyncPooledClient>> get_async_client(
            std::string_view url);

        /// @brief Resilience state of @p origin, created on first use.
        std::shared_ptr<OriginState> origin_state(const Origin& origin);

        /**
         * @name Collaborator surface
         * Blocking calls routed by the origin of an absolute URL.
         * @{
         */
        Result<Response> get(std::string_view url, QueryParams query = {},
                             Headers headers = {});
        Result<nlohmann::json> get_json(std::string_view url,
                                        QueryParams query = {},
                                        Headers headers = {});
        /** @} */

        /// @brief Drop the entry for @p origin. Returns false if absent.
        bool evict(const Origin& origin);

        /// @brief Drop every entry.
        void close_all();

        /// @brief Evict entries idle for at least idle_ttl with nothing in
        /// flight. Also runs on every lookup.
        std::size_t prune_idle();

        /// @brief Same, against an explicit instant (tests).
        std::size_t prune_idle_at(std::chrono::steady_clock::time_point now);

        PoolStats stats() const;

        [[nodiscard]] const ConnectionPoolConfiguration& config()
            const noexcept {
            return cfg_;
        }

        [[nodiscard]] bool has_executor() const noexcept {
            return ex_.has_value();
        }

        /// @brief Process-wide pool for blocking clients, created on first
        /// use.
        static std::shared_ptr<ConnectionPool> global();

        /// @brief Close the process-wide pool; the next global() call
        /// creates a fresh one.
        static void reset_global();

       private:
        struct Entry {
            std::shared_ptr<OriginState> state;
            std::shared_ptr<PooledClient> sync;
            std::shared_ptr<AsyncPooledClient> async;
            std::chrono::steady_clock::time_point last_access;
        };

        Entry& entry_locked_(const Origin& origin);
        ClientConfiguration client_config_for_(const Origin& origin) const;
        std::size_t prune_locked_(std::chrono::steady_clock::time_point now);
        void release_states_locked_();

        std::optional<boost::asio::any_io_executor> ex_;
        ConnectionPoolConfiguration cfg_;

        mutable std::mutex mu_;
        std::unordered_map<Origin, Entry> entries_;
        // Every live OriginState, including those of evicted entries.
        std::unordered_map<Origin, std::shared_ptr<OriginState>> states_;

        std::atomic<std::uint64_t> clients_created_{0};
        std::atomic<std::uint64_t> clients_evicted_{0};
    };

}  // namespace feedlink
