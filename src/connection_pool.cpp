#include "feedlink/connection_pool.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <stdexcept>
#include <vector>

namespace feedlink {

    namespace {

        std::mutex& global_mutex() {
            static std::mutex mu;
            return mu;
        }

        std::atomic<std::shared_ptr<ConnectionPool>>& global_slot() {
            static std::atomic<std::shared_ptr<ConnectionPool>> pool;
            return pool;
        }

    }  // namespace

    ConnectionPool::ConnectionPool(ConnectionPoolConfiguration cfg)
        : cfg_(std::move(cfg)) {}

    ConnectionPool::ConnectionPool(boost::asio::any_io_executor ex,
                                   ConnectionPoolConfiguration cfg)
        : ex_(std::move(ex)), cfg_(std::move(cfg)) {}

    ConnectionPool::~ConnectionPool() { close_all(); }

    ClientConfiguration ConnectionPool::client_config_for_(
        const Origin& origin) const {
        ClientConfiguration c = cfg_.client;
        c.base_url = origin.to_string();
        return c;
    }

    ConnectionPool::Entry& ConnectionPool::entry_locked_(const Origin& origin) {
        const auto now = std::chrono::steady_clock::now();
        prune_locked_(now);
        release_states_locked_();

        auto [it, inserted] = entries_.try_emplace(origin);
        Entry& e = it->second;
        if (inserted) {
            auto& state = states_[origin];
            if (!state) {
                state = std::make_shared<OriginState>(origin, cfg_.client);
                SPDLOG_DEBUG("registered origin {}", origin.to_string());
            } else {
                SPDLOG_DEBUG("re-registered origin {} with its {} breaker",
                             origin.to_string(),
                             to_string(state->breaker.state()));
            }
            e.state = state;
        }
        e.last_access = now;
        return e;
    }

    std::shared_ptr<OriginState> ConnectionPool::origin_state(
        const Origin& origin) {
        const Origin key = origin.normalized();
        std::lock_guard<std::mutex> lk(mu_);
        return entry_locked_(key).state;
    }

    std::shared_ptr<PooledClient> ConnectionPool::get_client(
        const Origin& origin) {
        const Origin key = origin.normalized();
        std::lock_guard<std::mutex> lk(mu_);
        Entry& e = entry_locked_(key);
        if (!e.sync) {
            e.sync = std::make_shared<PooledClient>(client_config_for_(key),
                                                    e.state);
            clients_created_.fetch_add(1, std::memory_order_relaxed);
            SPDLOG_INFO("created client for {}", key.to_string());
        }
        return e.sync;
    }

    Result<std::shared_ptr<PooledClient>> ConnectionPool::get_client(
        std::string_view url) {
        auto origin = parse_origin(url);
        if (origin.has_error()) {
            return Result<std::shared_ptr<PooledClient>>::err(
                std::move(origin).error());
        }
        return Result<std::shared_ptr<PooledClient>>::ok(
            get_client(origin.value()));
    }

    std::shared_ptr<AsyncPooledClient> ConnectionPool::get_async_client(
        const Origin& origin) {
        if (!ex_) {
            throw std::logic_error(
                "ConnectionPool was constructed without an executor");
        }
        const Origin key = origin.normalized();
        std::lock_guard<std::mutex> lk(mu_);
        Entry& e = entry_locked_(key);
        if (!e.async) {
            e.async = std::make_shared<AsyncPooledClient>(
                *ex_, client_config_for_(key), e.state);
            clients_created_.fetch_add(1, std::memory_order_relaxed);
            SPDLOG_INFO("created async client for {}", key.to_string());
        }
        return e.async;
    }

    Result<std::shared_ptr<AsyncPooledClient>> ConnectionPool::get_async_client(
        std::string_view url) {
        auto origin = parse_origin(url);
        if (origin.has_error()) {
            return Result<std::shared_ptr<AsyncPooledClient>>::err(
                std::move(origin).error());
        }
        return Result<std::shared_ptr<AsyncPooledClient>>::ok(
            get_async_client(origin.value()));
    }

    Result<Response> ConnectionPool::get(std::string_view url,
                                         QueryParams query, Headers headers) {
        auto client = get_client(url);
        if (client.has_error())
            return Result<Response>::err(std::move(client).error());
        return client.value()->get(std::string(url), std::move(query),
                                   std::move(headers));
    }

    Result<nlohmann::json> ConnectionPool::get_json(std::string_view url,
                                                    QueryParams query,
                                                    Headers headers) {
        auto client = get_client(url);
        if (client.has_error())
            return Result<nlohmann::json>::err(std::move(client).error());
        return client.value()->get_json(std::string(url), std::move(query),
                                        std::move(headers));
    }

    bool ConnectionPool::evict(const Origin& origin) {
        const Origin key = origin.normalized();
        Entry dropped;
        {
            std::lock_guard<std::mutex> lk(mu_);
            auto it = entries_.find(key);
            if (it == entries_.end()) return false;
            dropped = std::move(it->second);
            entries_.erase(it);
            dropped.state.reset();
            release_states_locked_();
        }
        const auto n = static_cast<std::uint64_t>(dropped.sync != nullptr) +
                       static_cast<std::uint64_t>(dropped.async != nullptr);
        clients_evicted_.fetch_add(n, std::memory_order_relaxed);
        SPDLOG_INFO("evicted origin {}", key.to_string());
        // Clients are released outside the lock; in-flight holders keep
        // theirs alive.
        return true;
    }

    void ConnectionPool::close_all() {
        std::unordered_map<Origin, Entry> dropped;
        {
            std::lock_guard<std::mutex> lk(mu_);
            dropped.swap(entries_);
            for (auto& [origin, e] : dropped) e.state.reset();
            release_states_locked_();
        }
        std::uint64_t n = 0;
        for (auto& [origin, e] : dropped) {
            n += static_cast<std::uint64_t>(e.sync != nullptr) +
                 static_cast<std::uint64_t>(e.async != nullptr);
        }
        clients_evicted_.fetch_add(n, std::memory_order_relaxed);
        if (!dropped.empty()) {
            SPDLOG_DEBUG("closed {} origins", dropped.size());
        }
    }

    std::size_t ConnectionPool::prune_idle() {
        return prune_idle_at(std::chrono::steady_clock::now());
    }

    std::size_t ConnectionPool::prune_idle_at(
        std::chrono::steady_clock::time_point now) {
        std::lock_guard<std::mutex> lk(mu_);
        return prune_locked_(now);
    }

    std::size_t ConnectionPool::prune_locked_(
        std::chrono::steady_clock::time_point now) {
        if (cfg_.idle_ttl.count() <= 0) return 0;

        std::size_t pruned = 0;
        for (auto it = entries_.begin(); it != entries_.end();) {
            Entry& e = it->second;
            auto last = e.last_access;
            std::size_t busy =
                e.state->calls_in_flight.load(std::memory_order_relaxed);
            if (e.sync) {
                last = std::max(last, e.sync->last_used());
                busy += e.sync->in_flight();
            }
            if (e.async) {
                last = std::max(last, e.async->last_used());
                busy += e.async->in_flight();
            }

            const bool closed =
                e.state->breaker.state() == CircuitState::Closed;

            if (busy == 0 && closed && now - last >= cfg_.idle_ttl) {
                SPDLOG_DEBUG("pruning idle origin {}", it->first.to_string());
                clients_evicted_.fetch_add(
                    static_cast<std::uint64_t>(e.sync != nullptr) +
                        static_cast<std::uint64_t>(e.async != nullptr),
                    std::memory_order_relaxed);
                it = entries_.erase(it);
                ++pruned;
            } else {
                ++it;
            }
        }
        return pruned;
    }

    void ConnectionPool::release_states_locked_() {
        for (auto it = states_.begin(); it != states_.end();) {
            const auto& state = it->second;
            const bool unused = state.use_count() == 1 &&
                                entries_.find(it->first) == entries_.end();
            if (unused &&
                state->breaker.state() == CircuitState::Closed &&
                state->calls_in_flight.load(std::memory_order_relaxed) == 0) {
                it = states_.erase(it);
            } else {
                ++it;
            }
        }
    }

    PoolStats ConnectionPool::stats() const {
        PoolStats s;
        s.idle_ttl = cfg_.idle_ttl;
        s.clients_created = clients_created_.load(std::memory_order_relaxed);
        s.clients_evicted = clients_evicted_.load(std::memory_order_relaxed);

        const auto now = std::chrono::steady_clock::now();
        std::lock_guard<std::mutex> lk(mu_);
        s.origin_count = entries_.size();
        s.per_origin.reserve(entries_.size());
        for (const auto& [origin, e] : entries_) {
            OriginStats o;
            o.origin = origin.to_string();
            auto last = e.last_access;
            if (e.sync) {
                o.has_sync_client = true;
                o.connections += e.sync->connection_count();
                o.in_use += e.sync->in_flight();
                last = std::max(last, e.sync->last_used());
                ++s.sync_clients;
            }
            if (e.async) {
                o.has_async_client = true;
                o.connections += e.async->connection_count();
                o.in_use += e.async->in_flight();
                last = std::max(last, e.async->last_used());
                ++s.async_clients;
            }
            o.idle_for = now - last;
            s.per_origin.push_back(std::move(o));
        }
        return s;
    }

    std::shared_ptr<ConnectionPool> ConnectionPool::global() {
        auto& slot = global_slot();
        if (auto p = slot.load(std::memory_order_acquire)) return p;

        std::lock_guard<std::mutex> lk(global_mutex());
        auto p = slot.load(std::memory_order_acquire);
        if (!p) {
            p = std::make_shared<ConnectionPool>();
            slot.store(p, std::memory_order_release);
            SPDLOG_DEBUG("created process-wide connection pool");
        }
        return p;
    }

    void ConnectionPool::reset_global() {
        std::shared_ptr<ConnectionPool> old;
        {
            std::lock_guard<std::mutex> lk(global_mutex());
            old = global_slot().exchange(nullptr, std::memory_order_acq_rel);
        }
        if (old) old->close_all();
    }

}  // namespace feedlink
