#pragma once

#include <algorithm>
#include <atomic>
#include <utility>  // std::exchange, needed by boost/asio/awaitable.hpp (Boost 1.74)
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <type_traits>
#include <unordered_map>
#include <utility>

#include "feedlink/connection/connection.hpp"
#include "feedlink/connection/pool_types.hpp"
#include "feedlink/origin.hpp"
#include "feedlink/result.hpp"

namespace feedlink {

    /**
     * Bounded set of transport connections to a single origin.
     *
     * SAFETY:
     * - All public methods are thread-safe
     * - A connection is leased to exactly one caller at a time, so two
     *   logical responses never interleave on one socket
     *
     * INVARIANTS:
     * 1. in_use.size() + idle.size() <= max_connections
     * 2. No connection exists in both idle and in_use
     * 3. A waiter is either queued or being woken by release()
     *
     * LIFECYCLE:
     * Destruction marks the shared state dead. Leases that outlive the
     * slots become inert and never call back.
     */
    template <Mode mode>
    class ConnectionSlots {
       public:
        using Conn = Connection<mode>;

        class Lease {
           public:
            Lease() = default;

            Lease(Lease&& other) noexcept { move_from(std::move(other)); }

            Lease& operator=(Lease&& other) noexcept {
                if (this != &other) {
                    reset();
                    move_from(std::move(other));
                }
                return *this;
            }

            Lease(Lease const&) = delete;
            Lease& operator=(Lease const&) = delete;

            ~Lease() { reset(); }

            Conn* operator->() const noexcept { return get(); }

            Conn& operator*() const { return *get(); }

            /// @brief The leased connection, or nullptr if inert.
            Conn* get() const noexcept {
                auto st = state_.lock();
                if (!st || !st->alive.load(std::memory_order_acquire))
                    return nullptr;
                return conn_;
            }

            explicit operator bool() const noexcept { return get() != nullptr; }

            std::uint64_t id() const noexcept { return id_; }

           private:
            friend class ConnectionSlots;

            struct State {
                std::atomic<bool> alive{true};
            };

            Lease(std::weak_ptr<State> st, Conn* c, std::uint64_t id,
                  std::function<void(std::uint64_t)> ret)
                : state_(std::move(st)),
                  conn_(c),
                  id_(id),
                  return_(std::move(ret)) {}

            void reset() noexcept {
                auto st = state_.lock();
                if (!conn_) return;

                if (!st || !st->alive.load(std::memory_order_acquire)) {
                    conn_ = nullptr;
                    return;
                }
                if (return_) return_(id_);
                conn_ = nullptr;
            }

            void move_from(Lease&& other) noexcept {
                state_ = std::move(other.state_);
                conn_ = other.conn_;
                id_ = other.id_;
                return_ = std::move(other.return_);
                other.conn_ = nullptr;
                other.id_ = 0;
            }

            std::weak_ptr<State> state_;
            Conn* conn_{nullptr};
            std::uint64_t id_{0};
            std::function<void(std::uint64_t)> return_;
        };

       private:
        using acquire_ret_t =
            std::conditional_t<mode == Mode::Sync, Result<Lease>,
                               boost::asio::awaitable<Result<Lease>>>;

       public:
        /**
         * @param ex Executor the Async connections run on (unused for Sync).
         * @param max_connections Upper bound of live connections.
         * @param max_reuse Transactions after which a connection is rotated.
         */
        ConnectionSlots(boost::asio::any_io_executor ex,
                        boost::asio::ssl::context& ssl_ctx, Origin origin,
                        ConnectionOptions opts, std::size_t max_connections,
                        std::size_t max_reuse)
            : ex_(std::move(ex)),
              ssl_ctx_(ssl_ctx),
              origin_(origin.normalized()),
              opts_(opts),
              max_connections_(std::max<std::size_t>(1, max_connections)),
              max_reuse_(max_reuse),
              state_(std::make_shared<typename Lease::State>()) {}

        ConnectionSlots(const ConnectionSlots&) = delete;
        ConnectionSlots& operator=(const ConnectionSlots&) = delete;

        ~ConnectionSlots() {
            state_->alive.store(false, std::memory_order_release);

            std::list<std::shared_ptr<boost::asio::steady_timer>> to_cancel;
            {
                std::lock_guard<std::mutex> lk(mu_);
                to_cancel.swap(timers_);
            }
            for (auto& t : to_cancel) t->cancel();
            cv_.notify_all();
        }

        /**
         * @brief Lease a connection, waiting while all slots are busy.
         * @return Sync: Result<Lease>. Async: awaitable Result<Lease>.
         */
        acquire_ret_t acquire() {
            if constexpr (mode == Mode::Sync) {
                return acquire_blocking();
            } else {
                return acquire_async();
            }
        }

        /// @brief Close and drop all idle connections.
        void close_idle() {
            std::lock_guard<std::mutex> lk(mu_);
            for (auto& up : idle_) {
                if (up) up->close();
            }
            metrics_.idle.fetch_sub(idle_.size(), std::memory_order_relaxed);
            idle_.clear();
        }

        /// @brief Live connections (idle + in use).
        std::size_t size() const {
            std::lock_guard<std::mutex> lk(mu_);
            return idle_.size() + in_use_.size();
        }

        std::size_t in_use() const {
            std::lock_guard<std::mutex> lk(mu_);
            return in_use_.size();
        }

        const Origin& origin() const noexcept { return origin_; }

        ConnectionSlotMetrics const& metrics() const { return metrics_; }

       private:
        Result<Lease> acquire_blocking() {
            std::unique_lock<std::mutex> lk(mu_);
            for (;;) {
                if (!state_->alive.load(std::memory_order_acquire)) {
                    return Result<Lease>::err(Error::Code::Unknown,
                                              "connection slots closed");
                }
                if (auto l = try_acquire_locked_()) {
                    return Result<Lease>::ok(std::move(*l));
                }
                metrics_.waiters.fetch_add(1, std::memory_order_relaxed);
                cv_.wait(lk);
                metrics_.waiters.fetch_sub(1, std::memory_order_relaxed);
            }
        }

        boost::asio::awaitable<Result<Lease>> acquire_async() {
            for (;;) {
                auto t = std::make_shared<boost::asio::steady_timer>(ex_);
                t->expires_at(boost::asio::steady_timer::time_point::max());
                {
                    std::lock_guard<std::mutex> lk(mu_);
                    if (!state_->alive.load(std::memory_order_acquire)) {
                        co_return Result<Lease>::err(Error::Code::Unknown,
                                                     "connection slots closed");
                    }
                    if (auto l = try_acquire_locked_()) {
                        co_return Result<Lease>::ok(std::move(*l));
                    }
                    timers_.push_back(t);
                    metrics_.waiters.fetch_add(1, std::memory_order_relaxed);
                }

                boost::system::error_code ec;
                co_await t->async_wait(boost::asio::redirect_error(
                    boost::asio::use_awaitable, ec));

                {
                    std::lock_guard<std::mutex> lk(mu_);
                    auto it = std::find(timers_.begin(), timers_.end(), t);
                    if (it != timers_.end()) timers_.erase(it);
                    metrics_.waiters.fetch_sub(1, std::memory_order_relaxed);
                }

                if (ec && ec != boost::asio::error::operation_aborted) {
                    co_return Result<Lease>::err(
                        Error::Code::Unknown,
                        "Internal error: " + ec.message());
                }
                // Woken by release() or shutdown; loop and re-check.
            }
        }

        void release(std::uint64_t id) noexcept {
            std::shared_ptr<boost::asio::steady_timer> w;
            {
                std::lock_guard<std::mutex> lk(mu_);
                auto it = in_use_.find(id);
                if (it == in_use_.end()) return;

                auto up = std::move(it->second);
                in_use_.erase(it);
                metrics_.in_use.fetch_sub(1, std::memory_order_relaxed);

                if (up && up->mid_stream()) up->close();

                const bool recycle = up && up->is_open() &&
                                     (max_reuse_ == 0 || up->uses() < max_reuse_);
                if (recycle) {
                    idle_.push_back(std::move(up));
                    metrics_.idle.fetch_add(1, std::memory_order_relaxed);
                } else if (up && up->is_open()) {
                    metrics_.dropped_reuse_limit.fetch_add(
                        1, std::memory_order_relaxed);
                }

                if (!timers_.empty()) {
                    w = timers_.front();
                    timers_.pop_front();
                }
            }

            // Wake outside the lock.
            if (w) w->cancel();
            cv_.notify_one();
        }

        std::optional<Lease> try_acquire_locked_() {
            while (!idle_.empty()) {
                auto up = std::move(idle_.back());
                idle_.pop_back();
                metrics_.idle.fetch_sub(1, std::memory_order_relaxed);

                if (!up || !up->is_open()) {
                    metrics_.dropped_closed.fetch_add(
                        1, std::memory_order_relaxed);
                    continue;
                }
                metrics_.reused.fetch_add(1, std::memory_order_relaxed);
                return lease_locked_(std::move(up));
            }

            if (in_use_.size() >= max_connections_) return std::nullopt;

            auto up = std::make_unique<Conn>(ex_, ssl_ctx_, origin_, opts_);
            metrics_.created.fetch_add(1, std::memory_order_relaxed);
            return lease_locked_(std::move(up));
        }

        Lease lease_locked_(std::unique_ptr<Conn> up) {
            Conn* raw = up.get();
            auto id = next_id_++;
            in_use_.emplace(id, std::move(up));
            metrics_.in_use.fetch_add(1, std::memory_order_relaxed);
            return Lease(state_, raw, id,
                         [this](std::uint64_t id_) { release(id_); });
        }

        boost::asio::any_io_executor ex_;
        boost::asio::ssl::context& ssl_ctx_;
        Origin origin_;
        ConnectionOptions opts_;
        std::size_t max_connections_;
        std::size_t max_reuse_;

        mutable std::mutex mu_;
        std::condition_variable cv_;
        std::deque<std::unique_ptr<Conn>> idle_;
        std::unordered_map<std::uint64_t, std::unique_ptr<Conn>> in_use_;
        std::list<std::shared_ptr<boost::asio::steady_timer>> timers_;
        std::uint64_t next_id_{1};

        std::shared_ptr<typename Lease::State> state_;
        ConnectionSlotMetrics metrics_;
    };

}  // namespace feedlink
