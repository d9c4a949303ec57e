#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "feedlink/client.hpp"
#include "feedlink/logging.hpp"
#include "feedlink/middleware.hpp"
#include "test_support.hpp"

using namespace std::chrono_literals;

using feedlink::CircuitState;
using feedlink::Error;
using feedlink::PooledClient;
using feedlink::testing::fast_config;
using feedlink::testing::HardWatchdog;
using feedlink::testing::HttpTestServer;

namespace {

    struct Quote {
        std::string symbol;
        double price{0.0};
    };
    NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Quote, symbol, price)

    void reply_json(httplib::Response& res, const std::string& body) {
        res.status = 200;
        res.set_content(body, "application/json");
    }

}  // namespace

TEST(Logging, SetLogLevelAppliesToDefaultLogger) {
    const auto before = spdlog::get_level();
    feedlink::set_log_level(spdlog::level::warn);
    EXPECT_EQ(spdlog::get_level(), spdlog::level::warn);
    EXPECT_FALSE(spdlog::default_logger()->should_log(spdlog::level::info));
    feedlink::set_log_level(before);
}

TEST(PooledClient, GetReturnsBodyAndHeaders) {
    HardWatchdog wd(5s);
    HttpTestServer srv([](const httplib::Request& req, httplib::Response& res) {
        res.status = 200;
        res.set_header("X-Echo-Path", req.path);
        res.set_content("hello", "text/plain");
    });

    PooledClient client(fast_config(srv.base_url()));
    auto r = client.get("/ping");
    ASSERT_TRUE(r.has_value()) << r.error().describe();
    EXPECT_EQ(r.value().status_code, 200);
    EXPECT_EQ(r.value().body, "hello");
    EXPECT_EQ(r.value().attempts, 1u);
    EXPECT_EQ(r.value().header("x-echo-path").value_or(""), "/ping");
    EXPECT_EQ(srv.last_method, "GET");
    EXPECT_EQ(srv.header("User-Agent"), "feedlink_gtest");
}

TEST(PooledClient, RelativePathJoinsBasePrefix) {
    HardWatchdog wd(5s);
    HttpTestServer srv(
        [](const httplib::Request&, httplib::Response& res) { res.status = 200; });

    PooledClient client(fast_config(srv.base_url() + "/api/v1"));
    auto r = client.get("quotes", {{"symbol", "SBIN"}});
    ASSERT_TRUE(r.has_value()) << r.error().describe();
    EXPECT_EQ(srv.last_target, "/api/v1/quotes?symbol=SBIN");
}

TEST(PooledClient, MissingBaseUrlThrows) {
    EXPECT_THROW({ PooledClient c(fast_config(std::nullopt)); },
                 std::runtime_error);
    EXPECT_THROW({ PooledClient c(fast_config(std::string("not a url"))); },
                 std::runtime_error);
}

TEST(PooledClient, ForeignOriginIsRejectedBeforeSending) {
    HardWatchdog wd(5s);
    HttpTestServer srv(
        [](const httplib::Request&, httplib::Response& res) { res.status = 200; });

    PooledClient client(fast_config(srv.base_url()));
    auto r = client.get("http://other.invalid/x");
    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, Error::Code::InvalidUrl);
    EXPECT_EQ(srv.request_count.load(), 0);
}

TEST(PooledClient, RetriesTransientStatusThenSucceeds) {
    HardWatchdog wd(5s);
    std::atomic<int> calls{0};
    HttpTestServer srv([&](const httplib::Request&, httplib::Response& res) {
        if (calls.fetch_add(1) == 0) {
            res.status = 503;
            return;
        }
        res.status = 200;
        res.set_content("ok", "text/plain");
    });

    PooledClient client(fast_config(srv.base_url()));
    auto r = client.get("/flaky");
    ASSERT_TRUE(r.has_value()) << r.error().describe();
    EXPECT_EQ(r.value().attempts, 2u);
    EXPECT_EQ(srv.request_count.load(), 2);
    EXPECT_EQ(client.origin_state().breaker.state(), CircuitState::Closed);
}

TEST(PooledClient, HonorsRetryAfterOn429) {
    HardWatchdog wd(10s);
    std::atomic<int> calls{0};
    HttpTestServer srv([&](const httplib::Request&, httplib::Response& res) {
        if (calls.fetch_add(1) == 0) {
            res.status = 429;
            res.set_header("Retry-After", "1");
            return;
        }
        res.status = 200;
    });

    PooledClient client(fast_config(srv.base_url()));
    auto t0 = std::chrono::steady_clock::now();
    auto r = client.get("/limited");
    auto elapsed = std::chrono::steady_clock::now() - t0;

    ASSERT_TRUE(r.has_value()) << r.error().describe();
    EXPECT_EQ(r.value().attempts, 2u);
    EXPECT_GE(elapsed, 900ms);
}

TEST(PooledClient, NonRetryableStatusFailsOnFirstAttempt) {
    HardWatchdog wd(5s);
    HttpTestServer srv(
        [](const httplib::Request&, httplib::Response& res) { res.status = 404; });

    PooledClient client(fast_config(srv.base_url()));
    auto r = client.get("/missing");
    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, Error::Code::HttpStatus);
    EXPECT_EQ(r.error().status_code, 404);
    EXPECT_EQ(r.error().attempts, 1u);
    EXPECT_EQ(r.error().origin, srv.origin().to_string());
    EXPECT_EQ(srv.request_count.load(), 1);
}

TEST(PooledClient, ExhaustionReportsLastCause) {
    HardWatchdog wd(5s);
    HttpTestServer srv(
        [](const httplib::Request&, httplib::Response& res) { res.status = 503; });

    PooledClient client(fast_config(srv.base_url()));
    auto r = client.get("/down");
    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, Error::Code::RetryExhausted);
    EXPECT_EQ(r.error().cause, Error::Code::HttpStatus);
    EXPECT_EQ(r.error().status_code, 503);
    EXPECT_EQ(r.error().attempts, 3u);
    EXPECT_EQ(srv.request_count.load(), 3);
}

TEST(PooledClient, ConnectionRefusedIsRetriedAsNetworkError) {
    HardWatchdog wd(10s);
    std::string url;
    {
        HttpTestServer srv([](const httplib::Request&, httplib::Response& res) {
            res.status = 200;
        });
        url = srv.base_url();
    }

    PooledClient client(fast_config(url));
    auto r = client.get("/gone");
    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, Error::Code::RetryExhausted);
    EXPECT_TRUE((Error{r.error().cause, ""}.is_network()));
}

TEST(PooledClient, OpenCircuitRejectsWithoutTouchingServer) {
    HardWatchdog wd(10s);
    HttpTestServer srv(
        [](const httplib::Request&, httplib::Response& res) { res.status = 500; });

    auto cfg = fast_config(srv.base_url());
    cfg.retry.max_attempts = 1;
    cfg.circuit_breaker.failure_threshold = 3;
    PooledClient client(cfg);

    for (int i = 0; i < 3; ++i) {
        auto r = client.get("/fail");
        ASSERT_TRUE(r.has_error());
        EXPECT_EQ(r.error().code, Error::Code::RetryExhausted);
    }
    EXPECT_EQ(client.origin_state().breaker.state(), CircuitState::Open);
    const int seen = srv.request_count.load();

    auto r = client.get("/fail");
    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, Error::Code::CircuitOpen);
    EXPECT_EQ(r.error().attempts, 0u);
    EXPECT_EQ(srv.request_count.load(), seen);
}

TEST(PooledClient, RecoveredRetriesDoNotTripBreaker) {
    HardWatchdog wd(10s);
    std::atomic<int> calls{0};
    HttpTestServer srv([&](const httplib::Request&, httplib::Response& res) {
        // Every other request fails
        res.status = (calls.fetch_add(1) % 2 == 0) ? 502 : 200;
    });

    auto cfg = fast_config(srv.base_url());
    cfg.circuit_breaker.failure_threshold = 2;
    PooledClient client(cfg);

    for (int i = 0; i < 5; ++i) {
        auto r = client.get("/alt");
        ASSERT_TRUE(r.has_value()) << r.error().describe();
    }
    EXPECT_EQ(client.origin_state().breaker.state(), CircuitState::Closed);
}

TEST(PooledClient, RateLimiterDelaysCallsBeyondBurst) {
    HardWatchdog wd(5s);
    HttpTestServer srv([](const httplib::Request&, httplib::Response& res) {
        res.status = 200;
        res.set_content("ok", "text/plain");
    });

    auto cfg = fast_config(srv.base_url());
    cfg.rate_limit.capacity = 2;
    cfg.rate_limit.refill_per_second = 10;
    PooledClient client(cfg);

    const auto start = std::chrono::steady_clock::now();
    std::vector<std::chrono::steady_clock::duration> done_at;
    for (int i = 0; i < 3; ++i) {
        auto r = client.get("/q");
        ASSERT_TRUE(r.has_value()) << r.error().describe();
        done_at.push_back(std::chrono::steady_clock::now() - start);
    }

    // Burst of two goes straight through, the third waits for a token.
    EXPECT_LT(done_at[1], 90ms);
    EXPECT_GE(done_at[2], 95ms);
    EXPECT_EQ(srv.request_count.load(), 3);
}

TEST(PooledClient, GetJsonParsesBody) {
    HardWatchdog wd(5s);
    HttpTestServer srv([](const httplib::Request&, httplib::Response& res) {
        reply_json(res, R"({"data":[1,2,3],"ok":true})");
    });

    PooledClient client(fast_config(srv.base_url()));
    auto r = client.get_json("/data");
    ASSERT_TRUE(r.has_value()) << r.error().describe();
    EXPECT_TRUE(r.value()["ok"].get<bool>());
    EXPECT_EQ(r.value()["data"].size(), 3u);
    EXPECT_EQ(srv.header("Accept"), "application/json");
}

TEST(PooledClient, GetJsonRejectsInvalidBody) {
    HardWatchdog wd(5s);
    HttpTestServer srv([](const httplib::Request&, httplib::Response& res) {
        reply_json(res, "{not json");
    });

    PooledClient client(fast_config(srv.base_url()));
    auto r = client.get_json("/broken");
    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, Error::Code::Parse);
    EXPECT_EQ(r.error().status_code, 200);
}

TEST(PooledClient, GetJsonRejectsNonJsonContentType) {
    HardWatchdog wd(5s);
    HttpTestServer srv([](const httplib::Request&, httplib::Response& res) {
        res.status = 200;
        res.set_content("<html>login</html>", "text/html");
    });

    PooledClient client(fast_config(srv.base_url()));
    auto r = client.get_json("/page");
    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, Error::Code::Parse);

    auto cfg = fast_config(srv.base_url());
    cfg.require_json_content_type = false;
    PooledClient lenient(cfg);
    auto r2 = lenient.get_json("/page");
    ASSERT_TRUE(r2.has_error());
    EXPECT_EQ(r2.error().code, Error::Code::Parse);
}

TEST(PooledClient, TypedGetDecodesIntoStruct) {
    HardWatchdog wd(5s);
    HttpTestServer srv([](const httplib::Request&, httplib::Response& res) {
        reply_json(res, R"({"symbol":"SBIN","price":812.5})");
    });

    PooledClient client(fast_config(srv.base_url()));
    auto r = client.get<Quote>("/quote");
    ASSERT_TRUE(r.has_value()) << r.error().describe();
    EXPECT_EQ(r.value().symbol, "SBIN");
    EXPECT_DOUBLE_EQ(r.value().price, 812.5);

    auto bad = client.get<std::vector<int>>("/quote");
    ASSERT_TRUE(bad.has_error());
    EXPECT_EQ(bad.error().code, Error::Code::Parse);
}

TEST(PooledClient, PostJsonSendsBody) {
    HardWatchdog wd(5s);
    HttpTestServer srv([](const httplib::Request& req, httplib::Response& res) {
        reply_json(res, req.body);
    });

    PooledClient client(fast_config(srv.base_url()));
    nlohmann::json body = {{"symbols", {"SBIN", "TCS"}}};
    auto r = client.post_json("/watch", body);
    ASSERT_TRUE(r.has_value()) << r.error().describe();
    EXPECT_EQ(srv.last_method, "POST");
    EXPECT_EQ(nlohmann::json::parse(srv.last_body), body);
    EXPECT_EQ(srv.header("Content-Type"), "application/json");
}

TEST(PooledClient, InterceptorsAndDefaultHeadersReachServer) {
    HardWatchdog wd(5s);
    HttpTestServer srv(
        [](const httplib::Request&, httplib::Response& res) { res.status = 200; });

    auto cfg = fast_config(srv.base_url());
    cfg.default_headers["Accept-Language"] = "en-US";
    cfg.interceptors.push_back(
        std::make_shared<feedlink::BearerAuthInterceptor>("tok"));
    cfg.interceptors.push_back(std::make_shared<feedlink::ApiKeyInterceptor>(
        "apikey", "k1", feedlink::ApiKeyInterceptor::Location::Query));

    PooledClient client(cfg);
    auto r = client.get("/secure");
    ASSERT_TRUE(r.has_value()) << r.error().describe();
    EXPECT_EQ(srv.header("Authorization"), "Bearer tok");
    EXPECT_EQ(srv.header("Accept-Language"), "en-US");
    EXPECT_EQ(srv.last_target, "/secure?apikey=k1");
}

TEST(PooledClient, OpenStreamReadsBodyIncrementally) {
    HardWatchdog wd(5s);
    const std::string payload(64 * 1024, 'x');
    HttpTestServer srv([&](const httplib::Request&, httplib::Response& res) {
        res.status = 200;
        res.set_content(payload, "text/plain");
    });

    PooledClient client(fast_config(srv.base_url()));
    auto stream = client.open_stream("/big");
    ASSERT_TRUE(stream.has_value()) << stream.error().describe();
    EXPECT_EQ(stream.value().head().status_code, 200);

    std::string got;
    char buf[4096];
    for (;;) {
        auto n = stream.value().read(buf, sizeof(buf));
        ASSERT_TRUE(n.has_value()) << n.error().describe();
        if (n.value() == 0) break;
        got.append(buf, n.value());
    }
    EXPECT_EQ(got, payload);
}

TEST(PooledClient, ConcurrentCallsShareBoundedConnections) {
    HardWatchdog wd(10s);
    HttpTestServer srv([](const httplib::Request&, httplib::Response& res) {
        std::this_thread::sleep_for(20ms);
        res.status = 200;
    });

    auto cfg = fast_config(srv.base_url());
    cfg.max_connections = 2;
    PooledClient client(cfg);

    std::atomic<int> ok{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            if (client.get("/slow").has_value()) ok++;
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(ok.load(), 8);
    EXPECT_LE(srv.max_inflight.load(), 2);
    EXPECT_LE(client.connection_count(), 2u);
    EXPECT_EQ(client.in_flight(), 0u);
}
