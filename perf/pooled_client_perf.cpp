#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "feedlink/batcher.hpp"
#include "feedlink/client.hpp"
#include "feedlink/connection_pool.hpp"
#include "test_support.hpp"

static void print_result(const char* label, int iters,
                         std::chrono::nanoseconds total,
                         std::chrono::nanoseconds min,
                         std::chrono::nanoseconds max) {
    const double total_ms =
        std::chrono::duration<double, std::milli>(total).count();
    const double avg_ms = total_ms / iters;
    const double min_ms =
        std::chrono::duration<double, std::milli>(min).count();
    const double max_ms =
        std::chrono::duration<double, std::milli>(max).count();

    std::cout << "\n[ PERF ] " << label << "\n"
              << "        iters=" << iters << " total_ms=" << std::fixed
              << std::setprecision(2) << total_ms << " avg_ms=" << avg_ms
              << " min_ms=" << min_ms << " max_ms=" << max_ms << "\n";
}

static void print_rps(const char* label, int seconds, std::uint64_t total_reqs,
                      const std::vector<std::uint32_t>& per_sec) {
    std::uint32_t peak = 0;
    for (auto v : per_sec) peak = std::max(peak, v);

    const double avg = seconds > 0 ? (double)total_reqs / (double)seconds : 0.0;

    std::cout << "\n[ PERF ] " << label << "\n"
              << "        duration_s=" << seconds
              << " total_reqs=" << total_reqs << " avg_rps=" << std::fixed
              << std::setprecision(2) << avg << " peak_rps=" << peak << "\n";
}

class PooledClientPerf : public ::testing::Test {
   protected:
    static void SetUpTestSuite() {
        server_ = std::make_unique<feedlink::testing::HttpTestServer>(
            [](const httplib::Request& req, httplib::Response& res) {
                if (req.path.rfind("/quote", 0) == 0) {
                    res.status = 200;
                    res.set_content(R"({"symbol":"SBIN","price":812.5})",
                                    "application/json");
                    return;
                }
                res.status = 404;
            });
        cfg_.base_url = server_->base_url();
        cfg_.user_agent = "feedlink-perf";
        cfg_.max_connections = 8;
        // Keep the limiter out of the measurement
        cfg_.rate_limit.capacity = 1e6;
        cfg_.rate_limit.refill_per_second = 1e6;
    }

    static void TearDownTestSuite() { server_.reset(); }

    static feedlink::Origin origin() { return server_->origin(); }

    static inline std::unique_ptr<feedlink::testing::HttpTestServer> server_;
    static inline feedlink::ClientConfiguration cfg_{};
};

TEST_F(PooledClientPerf, WarmSameClient) {
    constexpr int iters = 200;
    feedlink::PooledClient client(cfg_);

    {
        auto r = client.get("/quote");
        ASSERT_TRUE(r.has_value()) << r.error().describe();
    }

    using clock = std::chrono::steady_clock;
    std::chrono::nanoseconds total{0};
    std::chrono::nanoseconds min = std::chrono::nanoseconds::max();
    std::chrono::nanoseconds max{0};

    for (int i = 0; i < iters; ++i) {
        const auto t0 = clock::now();
        auto r = client.get("/quote");
        const auto t1 = clock::now();
        ASSERT_TRUE(r.has_value()) << r.error().describe();

        const auto dt =
            std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0);
        total += dt;
        min = std::min(min, dt);
        max = std::max(max, dt);
    }

    print_result("Warm (same pooled client -> local server)", iters, total,
                 min, max);
}

TEST_F(PooledClientPerf, GetJsonThroughRegistry) {
    constexpr int iters = 200;
    feedlink::ConnectionPoolConfiguration pcfg;
    pcfg.client = cfg_;
    feedlink::ConnectionPool pool(pcfg);
    const std::string url = *cfg_.base_url + "/quote";

    using clock = std::chrono::steady_clock;
    std::chrono::nanoseconds total{0};
    std::chrono::nanoseconds min = std::chrono::nanoseconds::max();
    std::chrono::nanoseconds max{0};

    for (int i = 0; i < iters; ++i) {
        const auto t0 = clock::now();
        auto r = pool.get_json(url);
        const auto t1 = clock::now();
        ASSERT_TRUE(r.has_value()) << r.error().describe();

        const auto dt =
            std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0);
        total += dt;
        min = std::min(min, dt);
        max = std::max(max, dt);
    }

    print_result("GET_JSON via ConnectionPool", iters, total, min, max);
}

TEST_F(PooledClientPerf, BatchOfFiveHundred) {
    constexpr std::size_t n = 500;
    feedlink::ConnectionPoolConfiguration pcfg;
    pcfg.client = cfg_;
    auto pool = std::make_shared<feedlink::ConnectionPool>(pcfg);

    for (auto strategy : {feedlink::BatchStrategy::Sequential,
                          feedlink::BatchStrategy::Fixed,
                          feedlink::BatchStrategy::Adaptive}) {
        feedlink::BatchConfiguration bcfg;
        bcfg.max_concurrent = 8;
        bcfg.max_batch_size = 50;
        bcfg.strategy = strategy;
        feedlink::RequestBatcher batcher(pool, bcfg);

        std::vector<feedlink::BatchRequest> reqs(n);
        for (std::size_t i = 0; i < n; ++i) {
            reqs[i].origin = origin();
            reqs[i].request.target = "/quote/" + std::to_string(i);
            reqs[i].index = i;
        }

        auto res = batcher.submit(std::move(reqs));
        ASSERT_TRUE(res.has_value()) << res.error().describe();
        ASSERT_EQ(feedlink::summarize(res.value()).successful, n);

        const auto s = batcher.stats();
        std::cout << "\n[ PERF ] batch strategy=" << feedlink::to_string(strategy)
                  << "\n        total_reqs=" << s.total_requests
                  << " rps=" << std::fixed << std::setprecision(2)
                  << s.requests_per_second() << " avg_req_ms="
                  << std::chrono::duration<double, std::milli>(
                         s.avg_request_time())
                         .count()
                  << "\n";
    }
}

TEST_F(PooledClientPerf, MaxRpsFiveSeconds) {
    constexpr int seconds = 5;
    feedlink::PooledClient client(cfg_);

    {
        auto r = client.get("/quote");
        ASSERT_TRUE(r.has_value()) << r.error().describe();
    }

    using clock = std::chrono::steady_clock;
    const auto start = clock::now();

    std::vector<std::uint32_t> per_sec(seconds, 0);
    std::uint64_t total = 0;

    for (;;) {
        const auto elapsed =
            std::chrono::duration_cast<std::chrono::seconds>(clock::now() -
                                                             start)
                .count();
        if (elapsed >= seconds) break;

        auto r = client.get("/quote");
        ASSERT_TRUE(r.has_value()) << r.error().describe();

        ++total;
        ++per_sec[static_cast<std::size_t>(elapsed)];
    }

    print_rps("Max RPS (same pooled client -> local server)", seconds, total,
              per_sec);
}
