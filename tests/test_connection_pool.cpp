#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "feedlink/connection_pool.hpp"
#include "test_support.hpp"

using namespace std::chrono_literals;

using feedlink::CircuitState;
using feedlink::ConnectionPool;
using feedlink::ConnectionPoolConfiguration;
using feedlink::Error;
using feedlink::Origin;
using feedlink::PooledClient;
using feedlink::testing::await_or_abort;
using feedlink::testing::fast_config;
using feedlink::testing::HardWatchdog;
using feedlink::testing::HttpTestServer;
using feedlink::testing::IoThreadRunner;

namespace {

    ConnectionPoolConfiguration pool_config() {
        ConnectionPoolConfiguration cfg;
        cfg.client = fast_config(std::nullopt);
        cfg.idle_ttl = 60s;
        return cfg;
    }

}  // namespace

TEST(ConnectionPool, ConcurrentFirstLookupsCreateOneClient) {
    HardWatchdog wd(10s);
    ConnectionPool pool(pool_config());
    const Origin origin{"api.example.com", "443", true};

    constexpr int N = 50;
    std::vector<std::shared_ptr<PooledClient>> seen(N);
    std::vector<std::thread> threads;
    threads.reserve(N);
    for (int i = 0; i < N; ++i) {
        threads.emplace_back(
            [&, i] { seen[static_cast<std::size_t>(i)] = pool.get_client(origin); });
    }
    for (auto& t : threads) t.join();

    for (const auto& c : seen) EXPECT_EQ(c.get(), seen.front().get());
    auto s = pool.stats();
    EXPECT_EQ(s.clients_created, 1u);
    EXPECT_EQ(s.origin_count, 1u);
    EXPECT_EQ(s.sync_clients, 1u);
}

TEST(ConnectionPool, OriginsAreNormalizedForLookup) {
    ConnectionPool pool(pool_config());
    auto a = pool.get_client(Origin{"API.Example.com", "443", true});
    auto b = pool.get_client("https://api.example.com/v1/quotes?x=1");
    ASSERT_TRUE(b.has_value()) << b.error().describe();
    EXPECT_EQ(a.get(), b.value().get());

    auto other = pool.get_client("http://api.example.com/");
    ASSERT_TRUE(other.has_value());
    EXPECT_NE(a.get(), other.value().get());
    EXPECT_EQ(pool.stats().origin_count, 2u);
}

TEST(ConnectionPool, InvalidUrlIsReported) {
    ConnectionPool pool(pool_config());
    auto r = pool.get_client("ftp://example.com/file");
    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, Error::Code::InvalidUrl);

    auto g = pool.get("not-a-url");
    ASSERT_TRUE(g.has_error());
    EXPECT_EQ(g.error().code, Error::Code::InvalidUrl);
}

TEST(ConnectionPool, GetRoutesByUrlOrigin) {
    HardWatchdog wd(5s);
    HttpTestServer srv([](const httplib::Request& req, httplib::Response& res) {
        res.status = 200;
        res.set_content(R"({"path":")" + req.path + R"("})", "application/json");
    });

    ConnectionPool pool(pool_config());
    auto r = pool.get(srv.base_url() + "/quote", {{"s", "TCS"}});
    ASSERT_TRUE(r.has_value()) << r.error().describe();
    EXPECT_EQ(srv.last_target, "/quote?s=TCS");

    auto j = pool.get_json(srv.base_url() + "/history");
    ASSERT_TRUE(j.has_value()) << j.error().describe();
    EXPECT_EQ(j.value()["path"], "/history");

    EXPECT_EQ(pool.stats().clients_created, 1u);
}

TEST(ConnectionPool, EvictWhileInFlightLetsCallFinish) {
    HardWatchdog wd(10s);
    std::atomic<bool> entered{false};
    HttpTestServer srv([&](const httplib::Request&, httplib::Response& res) {
        entered = true;
        std::this_thread::sleep_for(150ms);
        res.status = 200;
        res.set_content("late", "text/plain");
    });

    ConnectionPool pool(pool_config());
    auto client = pool.get_client(srv.origin());

    feedlink::Result<feedlink::Response> result =
        feedlink::Result<feedlink::Response>::err(Error::Code::Unknown, "unset");
    std::thread caller([&] { result = client->get("/slow"); });

    while (!entered.load()) std::this_thread::sleep_for(1ms);
    EXPECT_TRUE(pool.evict(srv.origin()));
    EXPECT_FALSE(pool.evict(srv.origin()));
    caller.join();

    ASSERT_TRUE(result.has_value()) << result.error().describe();
    EXPECT_EQ(result.value().body, "late");

    auto fresh = pool.get_client(srv.origin());
    EXPECT_NE(fresh.get(), client.get());
    auto s = pool.stats();
    EXPECT_EQ(s.clients_created, 2u);
    EXPECT_EQ(s.clients_evicted, 1u);
    // Old and new client still draw from one limiter and one breaker.
    EXPECT_EQ(&fresh->origin_state(), &client->origin_state());
}

TEST(ConnectionPool, OpenBreakerSurvivesPruneAndEvict) {
    auto cfg = pool_config();
    cfg.idle_ttl = 100ms;
    cfg.client.circuit_breaker.failure_threshold = 1;
    cfg.client.circuit_breaker.cooldown = 60s;
    ConnectionPool pool(cfg);
    const Origin origin{"a.example.com", "443", true};

    auto state = pool.origin_state(origin);
    state->breaker.record_failure();
    ASSERT_EQ(state->breaker.state(), CircuitState::Open);
    const feedlink::OriginState* tripped = state.get();
    state.reset();

    const auto now = std::chrono::steady_clock::now();
    EXPECT_EQ(pool.prune_idle_at(now + 2s), 0u);
    EXPECT_EQ(pool.stats().origin_count, 1u);

    EXPECT_TRUE(pool.evict(origin));
    auto again = pool.origin_state(origin);
    EXPECT_EQ(again.get(), tripped);
    EXPECT_EQ(again->breaker.state(), CircuitState::Open);
    EXPECT_EQ(again->breaker.admit(), feedlink::CircuitBreaker::Decision::Rejected);

    auto client = pool.get_client(origin);
    auto r = client->get("/x");
    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, Error::Code::CircuitOpen);
}

TEST(ConnectionPool, ClosedIdleStateIsReleasedAfterEviction) {
    ConnectionPool pool(pool_config());
    const Origin origin{"a.example.com", "443", true};

    std::weak_ptr<feedlink::OriginState> first = pool.origin_state(origin);
    EXPECT_TRUE(pool.evict(origin));
    EXPECT_TRUE(first.expired());

    auto fresh = pool.origin_state(origin);
    EXPECT_EQ(fresh->breaker.state(), CircuitState::Closed);
}

TEST(ConnectionPool, CallSleepingInBackoffIsNotPruned) {
    HardWatchdog wd(10s);
    std::atomic<int> calls{0};
    HttpTestServer srv([&](const httplib::Request&, httplib::Response& res) {
        res.status = calls.fetch_add(1) == 0 ? 503 : 200;
    });

    auto cfg = pool_config();
    cfg.idle_ttl = 50ms;
    cfg.client.retry.max_attempts = 2;
    cfg.client.retry.base_delay = 400ms;
    cfg.client.retry.max_delay = 400ms;
    ConnectionPool pool(cfg);
    auto client = pool.get_client(srv.origin());

    feedlink::Result<feedlink::Response> result =
        feedlink::Result<feedlink::Response>::err(Error::Code::Unknown, "unset");
    std::thread caller([&] { result = client->get("/x"); });

    while (srv.request_count.load() < 1) std::this_thread::sleep_for(1ms);
    // First attempt answered; the call is now waiting out its backoff.
    std::this_thread::sleep_for(150ms);
    EXPECT_EQ(client->origin_state().calls_in_flight.load(), 1u);
    EXPECT_EQ(pool.prune_idle_at(std::chrono::steady_clock::now() + 1h), 0u);
    EXPECT_EQ(pool.stats().origin_count, 1u);

    caller.join();
    ASSERT_TRUE(result.has_value()) << result.error().describe();
    EXPECT_EQ(result.value().attempts, 2u);
    EXPECT_EQ(client->origin_state().calls_in_flight.load(), 0u);
    EXPECT_EQ(pool.prune_idle_at(std::chrono::steady_clock::now() + 1h), 1u);
}

TEST(ConnectionPool, PruneIdleHonorsTtl) {
    auto cfg = pool_config();
    cfg.idle_ttl = 100ms;
    ConnectionPool pool(cfg);

    pool.get_client(Origin{"a.example.com", "443", true});
    pool.get_client(Origin{"b.example.com", "443", true});
    const auto now = std::chrono::steady_clock::now();

    EXPECT_EQ(pool.prune_idle_at(now + 50ms), 0u);
    EXPECT_EQ(pool.stats().origin_count, 2u);
    EXPECT_EQ(pool.prune_idle_at(now + 200ms), 2u);
    EXPECT_EQ(pool.stats().origin_count, 0u);
    EXPECT_EQ(pool.stats().clients_evicted, 2u);
}

TEST(ConnectionPool, ZeroTtlNeverPrunes) {
    auto cfg = pool_config();
    cfg.idle_ttl = 0ms;
    ConnectionPool pool(cfg);
    pool.get_client(Origin{"a.example.com", "443", true});
    EXPECT_EQ(pool.prune_idle_at(std::chrono::steady_clock::now() + 24h), 0u);
    EXPECT_EQ(pool.stats().origin_count, 1u);
}

TEST(ConnectionPool, CloseAllDropsEveryEntry) {
    ConnectionPool pool(pool_config());
    pool.get_client(Origin{"a.example.com", "443", true});
    pool.get_client(Origin{"b.example.com", "80", false});
    pool.close_all();
    auto s = pool.stats();
    EXPECT_EQ(s.origin_count, 0u);
    EXPECT_TRUE(s.per_origin.empty());
    EXPECT_EQ(s.clients_evicted, 2u);
}

TEST(ConnectionPool, AsyncClientWithoutExecutorThrows) {
    ConnectionPool pool(pool_config());
    EXPECT_FALSE(pool.has_executor());
    EXPECT_THROW(pool.get_async_client(Origin{"a.example.com", "443", true}),
                 std::logic_error);
}

TEST(ConnectionPool, SyncAndAsyncClientsShareOriginState) {
    HttpTestServer srv(
        [](const httplib::Request&, httplib::Response& res) { res.status = 500; });

    IoThreadRunner runner;
    auto cfg = pool_config();
    cfg.client.retry.max_attempts = 1;
    cfg.client.circuit_breaker.failure_threshold = 2;
    ConnectionPool pool(runner.ioc().get_executor(), cfg);

    auto sync_client = pool.get_client(srv.origin());
    auto async_client = pool.get_async_client(srv.origin());
    EXPECT_EQ(&sync_client->origin_state(), &async_client->origin_state());
    EXPECT_EQ(pool.origin_state(srv.origin()).get(),
              sync_client->shared_origin_state().get());

    // One failure from each variant trips the shared breaker
    EXPECT_TRUE(sync_client->get("/x").has_error());
    auto r = await_or_abort(runner.ioc(), async_client->get("/x"), 3000ms);
    EXPECT_TRUE(r.has_error());
    EXPECT_EQ(sync_client->origin_state().breaker.state(), CircuitState::Open);

    auto rejected = sync_client->get("/x");
    ASSERT_TRUE(rejected.has_error());
    EXPECT_EQ(rejected.error().code, Error::Code::CircuitOpen);

    auto s = pool.stats();
    ASSERT_EQ(s.per_origin.size(), 1u);
    EXPECT_TRUE(s.per_origin[0].has_sync_client);
    EXPECT_TRUE(s.per_origin[0].has_async_client);
    EXPECT_EQ(s.per_origin[0].origin, srv.origin().to_string());
    EXPECT_EQ(s.per_origin[0].in_use, 0u);

    // Release the async client before the io thread stops
    async_client.reset();
    pool.close_all();
}

TEST(ConnectionPool, GlobalPoolIsSharedUntilReset) {
    ConnectionPool::reset_global();
    auto a = ConnectionPool::global();
    auto b = ConnectionPool::global();
    EXPECT_EQ(a.get(), b.get());

    auto client = a->get_client(Origin{"a.example.com", "443", true});
    ConnectionPool::reset_global();
    EXPECT_EQ(a->stats().origin_count, 0u);

    auto c = ConnectionPool::global();
    EXPECT_NE(c.get(), a.get());
    EXPECT_EQ(c->stats().origin_count, 0u);
    ConnectionPool::reset_global();
}
