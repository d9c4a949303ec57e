#include "feedlink/batcher.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <condition_variable>
#include <exception>
#include <stdexcept>

#include "feedlink/connection_pool.hpp"

namespace feedlink {

    using Clock = std::chrono::steady_clock;

    namespace {

        std::optional<Error> check_indices(
            const std::vector<BatchRequest>& requests) {
            std::vector<bool> seen(requests.size(), false);
            for (const auto& r : requests) {
                if (r.index >= requests.size()) {
                    return Error{Error::Code::InvalidArgument,
                                 "batch index " + std::to_string(r.index) +
                                     " out of range for " +
                                     std::to_string(requests.size()) +
                                     " requests"};
                }
                if (seen[r.index]) {
                    return Error{Error::Code::InvalidArgument,
                                 "duplicate batch index " +
                                     std::to_string(r.index)};
                }
                seen[r.index] = true;
            }
            return std::nullopt;
        }

        BatchResult make_result(Result<Response> outcome,
                                Clock::duration elapsed) {
            BatchResult out;
            out.duration = elapsed;
            if (outcome.has_value()) {
                Response res = std::move(outcome).value();
                out.success = true;
                out.retry_count = res.attempts > 0 ? res.attempts - 1 : 0;
                out.data = std::move(res);
            } else {
                Error err = std::move(outcome).error();
                out.retry_count = err.attempts > 0 ? err.attempts - 1 : 0;
                out.error = std::move(err);
            }
            return out;
        }

        BatchResult deadline_result(const BatchRequest& req,
                                    Clock::duration elapsed) {
            Error err{Error::Code::Timeout, "batch deadline exceeded"};
            err.origin = req.origin.to_string();
            BatchResult out;
            out.error = std::move(err);
            out.duration = elapsed;
            return out;
        }

        std::size_t effective_cap(std::size_t requested, std::size_t limit) {
            return std::clamp<std::size_t>(requested, 1,
                                           std::max<std::size_t>(limit, 1));
        }

        /// @brief Error count and mean latency over results [begin, end).
        std::pair<std::size_t, Clock::duration> window_health(
            const std::vector<BatchRequest>& requests,
            const std::vector<std::optional<BatchResult>>& slots,
            std::size_t begin, std::size_t end) {
            std::size_t errors = 0;
            Clock::duration total{};
            for (std::size_t i = begin; i < end; ++i) {
                const auto& r = slots[requests[i].index];
                if (!r) continue;
                if (!r->success) ++errors;
                total += r->duration;
            }
            const auto n = static_cast<Clock::rep>(end - begin);
            return {errors, n > 0 ? total / n : Clock::duration{}};
        }

        /// Shared by submit() and its worker threads. Workers of a window
        /// that missed the deadline may still be running after submit()
        /// returns; they keep this alive and their results are discarded.
        struct SyncBatch {
            std::vector<BatchRequest> requests;
            RequestBatcher::Dispatcher dispatch;
            Clock::time_point started;

            std::mutex mu;
            std::condition_variable cv;
            std::vector<std::optional<BatchResult>> slots;
            std::size_t next{0};
            std::size_t window_end{0};
            std::size_t completed{0};
            std::size_t generation{0};
            bool abandoned{false};
        };

        /// Pulls positions of window @p generation until it is drained.
        void run_sync_worker(const std::shared_ptr<SyncBatch>& batch,
                             std::size_t generation) {
            for (;;) {
                std::size_t pos;
                {
                    std::lock_guard<std::mutex> lk(batch->mu);
                    if (batch->abandoned || batch->generation != generation ||
                        batch->next >= batch->window_end)
                        return;
                    pos = batch->next++;
                }

                const BatchRequest& req = batch->requests[pos];
                const auto t0 = Clock::now();
                Result<Response> outcome = [&] {
                    try {
                        return batch->dispatch(req);
                    } catch (const std::exception& e) {
                        return Result<Response>::err(Error::Code::Unknown,
                                                     e.what());
                    }
                }();
                auto result = make_result(std::move(outcome), Clock::now() - t0);

                {
                    std::lock_guard<std::mutex> lk(batch->mu);
                    if (batch->abandoned) return;
                    batch->slots[req.index] = std::move(result);
                    ++batch->completed;
                }
                batch->cv.notify_all();
            }
        }

        /// Coroutine counterpart of SyncBatch. All access happens on one
        /// serial executor, so no locking.
        struct AsyncBatch {
            explicit AsyncBatch(boost::asio::any_io_executor ex)
                : signal(std::move(ex)) {}

            std::vector<BatchRequest> requests;
            RequestBatcher::AsyncDispatcher dispatch;

            boost::asio::steady_timer signal;
            std::vector<std::optional<BatchResult>> slots;
            std::size_t next{0};
            std::size_t window_end{0};
            std::size_t window_size{0};
            std::size_t completed{0};
            std::size_t generation{0};
            bool abandoned{false};
        };

        boost::asio::awaitable<void> run_async_worker(
            std::shared_ptr<AsyncBatch> batch, std::size_t generation) {
            while (!batch->abandoned && batch->generation == generation &&
                   batch->next < batch->window_end) {
                const std::size_t pos = batch->next++;
                const BatchRequest& req = batch->requests[pos];

                const auto t0 = Clock::now();
                auto outcome = co_await batch->dispatch(req);
                auto result = make_result(std::move(outcome), Clock::now() - t0);

                if (batch->abandoned) co_return;
                batch->slots[req.index] = std::move(result);
                if (++batch->completed == batch->window_size) {
                    batch->signal.cancel();
                }
            }
        }

        template <typename Slots>
        std::vector<BatchResult> collect(const std::vector<BatchRequest>& requests,
                                         Slots& slots, Clock::time_point started) {
            std::vector<BatchResult> out;
            out.reserve(slots.size());
            const auto elapsed = Clock::now() - started;
            for (std::size_t i = 0; i < requests.size(); ++i) {
                auto& slot = slots[requests[i].index];
                if (!slot) slot = deadline_result(requests[i], elapsed);
            }
            for (auto& slot : slots) out.push_back(std::move(*slot));
            return out;
        }

    }  // namespace

    BatchSummary summarize(const std::vector<BatchResult>& results) {
        BatchSummary s;
        s.total = results.size();
        for (const auto& r : results) {
            if (r.success)
                ++s.successful;
            else
                ++s.failed;
        }
        return s;
    }

    ConcurrencyPlanner::ConcurrencyPlanner(BatchStrategy strategy,
                                           std::size_t max_concurrent,
                                           std::size_t initial)
        : strategy_(strategy), max_(std::max<std::size_t>(max_concurrent, 1)) {
        switch (strategy_) {
            case BatchStrategy::Sequential:
                level_ = 1;
                break;
            case BatchStrategy::Fixed:
                level_ = max_;
                break;
            case BatchStrategy::Adaptive:
                level_ = std::clamp<std::size_t>(initial, 1, max_);
                break;
        }
    }

    void ConcurrencyPlanner::observe(std::size_t completed, std::size_t errors,
                                     Clock::duration mean_latency) {
        if (strategy_ != BatchStrategy::Adaptive || completed == 0) return;

        const std::size_t before = level_;
        if (errors > 0) {
            level_ = std::max<std::size_t>(1, level_ / 2);
        } else if (!prev_latency_ || mean_latency * 4 <= *prev_latency_ * 5) {
            level_ = std::min(max_, level_ + 1);
        }
        prev_latency_ = mean_latency;

        if (level_ != before) {
            SPDLOG_DEBUG("adaptive concurrency {} -> {} ({} errors of {})",
                         before, level_, errors, completed);
        }
    }

    RequestBatcher::RequestBatcher(std::shared_ptr<ConnectionPool> pool,
                                   BatchConfiguration cfg)
        : cfg_(std::move(cfg)),
          workers_(std::max<std::size_t>(cfg_.max_concurrent, 1)) {
        if (!pool) throw std::invalid_argument("RequestBatcher: null pool");

        dispatch_ = [pool](const BatchRequest& r) {
            return pool->get_client(r.origin)->send(r.request);
        };
        if (pool->has_executor()) {
            async_dispatch_ = [pool](const BatchRequest& r)
                -> boost::asio::awaitable<Result<Response>> {
                auto client = pool->get_async_client(r.origin);
                co_return co_await client->send(r.request);
            };
        }
    }

    RequestBatcher::RequestBatcher(Dispatcher dispatch,
                                   AsyncDispatcher async_dispatch,
                                   BatchConfiguration cfg)
        : cfg_(std::move(cfg)),
          dispatch_(std::move(dispatch)),
          async_dispatch_(std::move(async_dispatch)),
          workers_(std::max<std::size_t>(cfg_.max_concurrent, 1)) {}

    RequestBatcher::~RequestBatcher() {
        // Abandoned workers only hold their own batch state; let them finish.
        workers_.join();
    }

    Result<std::vector<BatchResult>> RequestBatcher::submit(
        std::vector<BatchRequest> requests) {
        return submit(std::move(requests), cfg_.strategy, cfg_.max_concurrent);
    }

    Result<std::vector<BatchResult>> RequestBatcher::submit(
        std::vector<BatchRequest> requests, BatchStrategy strategy,
        std::size_t max_concurrent) {
        using R = Result<std::vector<BatchResult>>;

        if (auto bad = check_indices(requests)) return R::err(std::move(*bad));
        if (!dispatch_) {
            return R::err(Error::Code::InvalidArgument,
                          "batcher has no blocking dispatcher");
        }

        const std::size_t n = requests.size();
        const std::size_t cap = effective_cap(max_concurrent, cfg_.max_concurrent);
        const std::size_t window =
            strategy == BatchStrategy::Sequential
                ? std::max<std::size_t>(n, 1)
                : std::max<std::size_t>(cfg_.max_batch_size, 1);

        auto batch = std::make_shared<SyncBatch>();
        batch->requests = std::move(requests);
        batch->dispatch = dispatch_;
        batch->started = Clock::now();
        batch->slots.resize(n);

        std::optional<Clock::time_point> deadline;
        if (cfg_.batch_timeout) deadline = batch->started + *cfg_.batch_timeout;

        SPDLOG_INFO("batch of {} requests: strategy={} max_concurrent={}", n,
                    to_string(strategy), cap);

        ConcurrencyPlanner planner(strategy, cap, cfg_.initial_concurrency);
        for (std::size_t begin = 0; begin < n; begin += window) {
            const std::size_t end = std::min(n, begin + window);
            const std::size_t level = std::min(planner.level(), end - begin);
            std::size_t generation;
            {
                std::lock_guard<std::mutex> lk(batch->mu);
                batch->next = begin;
                batch->window_end = end;
                batch->completed = 0;
                generation = ++batch->generation;
            }
            for (std::size_t i = 0; i < level; ++i) {
                boost::asio::post(workers_, [batch, generation] {
                    run_sync_worker(batch, generation);
                });
            }

            std::unique_lock<std::mutex> lk(batch->mu);
            auto window_done = [&] { return batch->completed == end - begin; };
            bool finished = true;
            if (deadline) {
                finished = batch->cv.wait_until(lk, *deadline, window_done);
            } else {
                batch->cv.wait(lk, window_done);
            }
            if (!finished) {
                batch->abandoned = true;
                SPDLOG_WARN("batch deadline reached with {} of {} resolved",
                            begin + batch->completed, n);
                break;
            }

            auto [errors, latency] =
                window_health(batch->requests, batch->slots, begin, end);
            lk.unlock();
            planner.observe(end - begin, errors, latency);
        }

        std::vector<BatchResult> out;
        {
            std::lock_guard<std::mutex> lk(batch->mu);
            batch->abandoned = true;
            out = collect(batch->requests, batch->slots, batch->started);
        }

        const auto elapsed = Clock::now() - batch->started;
        record_(out, elapsed);
        const auto summary = summarize(out);
        SPDLOG_INFO("batch done: {} ok, {} failed in {} ms", summary.successful,
                    summary.failed,
                    std::chrono::duration_cast<std::chrono::milliseconds>(elapsed)
                        .count());
        return R::ok(std::move(out));
    }

    boost::asio::awaitable<Result<std::vector<BatchResult>>>
    RequestBatcher::async_submit(std::vector<BatchRequest> requests) {
        co_return co_await async_submit(std::move(requests), cfg_.strategy,
                                        cfg_.max_concurrent);
    }

    boost::asio::awaitable<Result<std::vector<BatchResult>>>
    RequestBatcher::async_submit(std::vector<BatchRequest> requests,
                                 BatchStrategy strategy,
                                 std::size_t max_concurrent) {
        using R = Result<std::vector<BatchResult>>;

        if (auto bad = check_indices(requests))
            co_return R::err(std::move(*bad));
        if (!async_dispatch_) {
            co_return R::err(Error::Code::InvalidArgument,
                             "batcher has no async dispatcher");
        }

        auto ex = co_await boost::asio::this_coro::executor;
        const std::size_t n = requests.size();
        // No thread pool here; the cap only bounds coroutines in flight.
        const std::size_t cap = std::max<std::size_t>(max_concurrent, 1);
        const std::size_t window =
            strategy == BatchStrategy::Sequential
                ? std::max<std::size_t>(n, 1)
                : std::max<std::size_t>(cfg_.max_batch_size, 1);

        auto batch = std::make_shared<AsyncBatch>(ex);
        batch->requests = std::move(requests);
        batch->dispatch = async_dispatch_;
        batch->slots.resize(n);

        const auto started = Clock::now();
        const auto deadline = cfg_.batch_timeout
                                  ? started + *cfg_.batch_timeout
                                  : Clock::time_point::max();

        SPDLOG_INFO("async batch of {} requests: strategy={} max_concurrent={}",
                    n, to_string(strategy), cap);

        ConcurrencyPlanner planner(strategy, cap, cfg_.initial_concurrency);
        for (std::size_t begin = 0; begin < n; begin += window) {
            const std::size_t end = std::min(n, begin + window);
            const std::size_t level = std::min(planner.level(), end - begin);
            batch->next = begin;
            batch->window_end = end;
            batch->window_size = end - begin;
            batch->completed = 0;
            const std::size_t generation = ++batch->generation;

            for (std::size_t i = 0; i < level; ++i) {
                boost::asio::co_spawn(ex, run_async_worker(batch, generation),
                                      boost::asio::detached);
            }

            while (batch->completed < batch->window_size &&
                   Clock::now() < deadline) {
                boost::system::error_code ec;
                batch->signal.expires_at(deadline);
                co_await batch->signal.async_wait(
                    boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            }

            if (batch->completed < batch->window_size) {
                batch->abandoned = true;
                SPDLOG_WARN("async batch deadline reached with {} of {} resolved",
                            begin + batch->completed, n);
                break;
            }

            auto [errors, latency] =
                window_health(batch->requests, batch->slots, begin, end);
            planner.observe(end - begin, errors, latency);
        }

        batch->abandoned = true;
        auto out = collect(batch->requests, batch->slots, started);

        const auto elapsed = Clock::now() - started;
        record_(out, elapsed);
        const auto summary = summarize(out);
        SPDLOG_INFO("async batch done: {} ok, {} failed in {} ms",
                    summary.successful, summary.failed,
                    std::chrono::duration_cast<std::chrono::milliseconds>(elapsed)
                        .count());
        co_return R::ok(std::move(out));
    }

    void RequestBatcher::record_(const std::vector<BatchResult>& results,
                                 Clock::duration elapsed) {
        std::lock_guard<std::mutex> lk(stats_mu_);
        ++stats_.batches;
        stats_.total_duration += elapsed;
        for (const auto& r : results) {
            ++stats_.total_requests;
            if (r.success)
                ++stats_.successful_requests;
            else
                ++stats_.failed_requests;
            stats_.request_time += r.duration;
        }
    }

    BatchStats RequestBatcher::stats() const {
        std::lock_guard<std::mutex> lk(stats_mu_);
        return stats_;
    }

    void RequestBatcher::reset_stats() {
        std::lock_guard<std::mutex> lk(stats_mu_);
        stats_ = {};
    }

}  // namespace feedlink
