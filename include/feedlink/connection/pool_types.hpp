#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace feedlink {

    /// @brief Counters for one origin's transport connections.
    struct ConnectionSlotMetrics {
        // Gauges (current state)
        std::atomic<std::size_t> in_use{0};  ///< Currently leased out
        std::atomic<std::size_t> idle{0};    ///< Currently idle
        std::atomic<std::size_t> waiters{0};  ///< Waiting for a free slot

        // Counters (cumulative)
        std::atomic<std::uint64_t> created{0};  ///< New connections
        std::atomic<std::uint64_t> reused{0};   ///< Reused idle
        std::atomic<std::uint64_t> dropped_closed{0};  ///< Idle but closed
        std::atomic<std::uint64_t> dropped_reuse_limit{
            0};  ///< Dropped due to reuse limit
    };

    /// @brief Introspection row for one origin in the registry.
    struct OriginStats {
        std::string origin;
        bool has_sync_client{false};
        bool has_async_client{false};
        /// @brief Live transport connections across both variants.
        std::size_t connections{0};
        std::size_t in_use{0};
        std::chrono::steady_clock::duration idle_for{};
    };

    /// @brief Snapshot returned by ConnectionPool::stats().
    struct PoolStats {
        std::size_t origin_count{0};
        std::size_t sync_clients{0};
        std::size_t async_clients{0};
        std::uint64_t clients_created{0};
        std::uint64_t clients_evicted{0};
        std::chrono::milliseconds idle_ttl{0};
        std::vector<OriginStats> per_origin;
    };

}  // namespace feedlink
