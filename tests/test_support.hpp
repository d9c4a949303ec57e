#pragma once

// Shared fixtures for the feedlink tests: an in-process HTTP server, a hard
// watchdog and a helper that runs one awaitable on a background io_context.

#include <gtest/gtest.h>
#include <httplib.h>

#include <atomic>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>

#include "feedlink/config.hpp"
#include "feedlink/origin.hpp"

namespace feedlink::testing {

    namespace net = boost::asio;

    /// Aborts the process if a test outlives its budget, so a deadlock
    /// shows up as a failure instead of a hung CI job.
    struct HardWatchdog {
        explicit HardWatchdog(std::chrono::milliseconds timeout)
            : timeout_(timeout), start_(std::chrono::steady_clock::now()) {
            thread_ = std::thread([this] {
                for (;;) {
                    if (done_.load(std::memory_order_relaxed)) return;
                    auto now = std::chrono::steady_clock::now();
                    if (now - start_ >= timeout_) {
                        std::fprintf(stderr,
                                     "\n[ WATCHDOG ] test exceeded %lld ms; "
                                     "aborting\n",
                                     (long long)timeout_.count());
                        std::fflush(stderr);
                        std::abort();
                    }
                    std::this_thread::sleep_for(std::chrono::milliseconds(10));
                }
            });
        }

        ~HardWatchdog() {
            done_.store(true, std::memory_order_relaxed);
            if (thread_.joinable()) thread_.join();
        }

       private:
        std::chrono::milliseconds timeout_;
        std::chrono::steady_clock::time_point start_;
        std::atomic<bool> done_{false};
        std::thread thread_;
    };

    /// cpp-httplib server on an ephemeral loopback port. Tracks request
    /// counts and the peak number of concurrently handled requests.
    struct HttpTestServer {
        using Handler =
            std::function<void(const httplib::Request&, httplib::Response&)>;

        explicit HttpTestServer(Handler h, bool honor_keep_alive = true)
            : handler_(std::move(h)), honor_keep_alive_(honor_keep_alive) {
            svr_.set_keep_alive_max_count(honor_keep_alive ? 100 : 1);
            svr_.set_keep_alive_timeout(5);

            auto func = [this](const httplib::Request& req,
                               httplib::Response& res) {
                request_count++;
                {
                    std::lock_guard lk(last_req_mu_);
                    last_method = req.method;
                    last_target = req.target;
                    last_body = req.body;
                    last_headers = req.headers;
                }

                int cur = inflight.fetch_add(1) + 1;
                int prev = max_inflight.load();
                while (cur > prev &&
                       !max_inflight.compare_exchange_weak(prev, cur)) {
                }

                handler_(req, res);

                if (!honor_keep_alive_) res.set_header("Connection", "close");
                inflight.fetch_sub(1);
            };

            svr_.Get(".*", func);
            svr_.Post(".*", func);

            port_ = svr_.bind_to_any_port("127.0.0.1");
            thread_ = std::thread([this] { svr_.listen_after_bind(); });
            svr_.wait_until_ready();
        }

        ~HttpTestServer() {
            svr_.stop();
            if (thread_.joinable()) thread_.join();
        }

        uint16_t port() const noexcept { return static_cast<uint16_t>(port_); }

        std::string base_url() const {
            return "http://127.0.0.1:" + std::to_string(port_);
        }

        Origin origin() const {
            return Origin{"127.0.0.1", std::to_string(port_), false};
        }

        std::string header(const std::string& name) {
            std::lock_guard lk(last_req_mu_);
            auto it = last_headers.find(name);
            return it == last_headers.end() ? std::string{} : it->second;
        }

        std::atomic<int> request_count{0};
        std::atomic<int> max_inflight{0};
        std::atomic<int> inflight{0};

        std::mutex last_req_mu_;
        std::string last_method;
        std::string last_target;
        std::string last_body;
        httplib::Headers last_headers;

       private:
        httplib::Server svr_;
        Handler handler_;
        bool honor_keep_alive_;
        std::thread thread_;
        int port_;
    };

    /// Client settings that keep tests fast: tiny backoff, generous limiter.
    inline ClientConfiguration fast_config(std::optional<std::string> base_url) {
        ClientConfiguration cfg{};
        cfg.base_url = std::move(base_url);
        cfg.user_agent = "feedlink_gtest";
        cfg.max_body_bytes = 4 * 1024 * 1024;
        cfg.verify_tls = false;
        cfg.connect_timeout = std::chrono::milliseconds(1000);
        cfg.request_timeout = std::chrono::milliseconds(2000);

        cfg.retry.max_attempts = 3;
        cfg.retry.base_delay = std::chrono::milliseconds(5);
        cfg.retry.max_delay = std::chrono::milliseconds(20);
        cfg.retry.jitter_fraction = 0.0;
        cfg.retry.max_retry_after = std::chrono::milliseconds(2000);

        cfg.rate_limit.capacity = 1000.0;
        cfg.rate_limit.refill_per_second = 1000.0;

        cfg.circuit_breaker.failure_threshold = 5;
        cfg.circuit_breaker.cooldown = std::chrono::milliseconds(30000);
        return cfg;
    }

    struct IoThreadRunner {
        IoThreadRunner() : ioc_(1) { start(); }

        void start() {
            guard_.emplace(net::make_work_guard(ioc_));
            thread_ = std::thread([this] { ioc_.run(); });
        }

        void stop() {
            if (guard_) guard_.reset();
            ioc_.stop();
            if (thread_.joinable()) thread_.join();
        }

        ~IoThreadRunner() { stop(); }

        net::io_context& ioc() { return ioc_; }

       private:
        net::io_context ioc_;
        std::optional<net::executor_work_guard<net::io_context::executor_type>>
            guard_;
        std::thread thread_;
    };

    template <class T>
    T await_or_abort(net::io_context& ioc, net::awaitable<T> aw,
                     std::chrono::milliseconds timeout) {
        HardWatchdog wd(timeout + std::chrono::milliseconds(1500));

        auto prom = std::make_shared<std::promise<T>>();
        auto fut = prom->get_future();

        net::co_spawn(
            ioc,
            [aw = std::move(aw), prom]() mutable -> net::awaitable<void> {
                try {
                    T v = co_await std::move(aw);
                    prom->set_value(std::move(v));
                } catch (...) {
                    prom->set_exception(std::current_exception());
                }
                co_return;
            },
            net::detached);

        if (fut.wait_for(timeout) != std::future_status::ready) {
            ADD_FAILURE() << "async operation timed out after "
                          << timeout.count() << "ms";
            std::abort();
        }

        return fut.get();
    }

}  // namespace feedlink::testing
