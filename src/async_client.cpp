#include "feedlink/async_client.hpp"

#include <spdlog/spdlog.h>

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>

#include "feedlink/resilience/retry_loop.hpp"

namespace feedlink {

    namespace {

        /// @brief Suspend for @p d. A cancelled timer simply resumes early.
        template <typename Duration>
        boost::asio::awaitable<void> pause(boost::asio::steady_timer& timer,
                                           Duration d) {
            boost::system::error_code ec;
            timer.expires_after(d);
            co_await timer.async_wait(
                boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            if (ec && ec != boost::asio::error::operation_aborted) {
                SPDLOG_WARN("backoff timer failed: {}", ec.message());
            }
        }

    }  // namespace

    AsyncPooledClient::AsyncPooledClient(boost::asio::any_io_executor ex,
                                         ClientConfiguration cfg)
        : AsyncPooledClient(std::move(ex), std::move(cfg), nullptr) {}

    AsyncPooledClient::AsyncPooledClient(boost::asio::any_io_executor ex,
                                         ClientConfiguration cfg,
                                         std::shared_ptr<OriginState> shared)
        : ClientBase(std::move(cfg), std::move(shared)),
          ex_(std::move(ex)),
          slots_(ex_, m_ssl_context, m_shared->origin,
                 ConnectionOptions{m_config.connect_timeout,
                                   m_config.request_timeout,
                                   m_config.max_body_bytes},
                 m_config.max_connections,
                 m_config.max_connection_reuse_count) {
        SPDLOG_DEBUG("created async client for {}", m_origin_name);
    }

    AsyncPooledClient::~AsyncPooledClient() noexcept {
        SPDLOG_DEBUG("closing async client for {}", m_origin_name);
    }

    boost::asio::awaitable<Result<Response>> AsyncPooledClient::attempt(
        const PreparedRequest& preq) {
        // This may wait if all connections of the origin are leased
        auto lease_result = co_await slots_.acquire();
        if (lease_result.has_error()) {
            co_return Result<Response>::err(std::move(lease_result).error());
        }

        auto lease = std::move(lease_result).value();
        if (!lease) {
            co_return Result<Response>::err(Error::Code::NetworkError,
                                            "connection slots closed");
        }

        // Connection returned to the slots when lease destructs
        co_return co_await lease->request(preq);
    }

    boost::asio::awaitable<Result<Response>> AsyncPooledClient::send(
        Request request) {
        auto prepared = prepare(std::move(request));
        if (prepared.has_error()) {
            co_return Result<Response>::err(std::move(prepared).error());
        }
        touch();

        InFlightCall in_flight(*m_shared);
        RetryLoop loop(m_config.retry, m_shared->limiter, m_shared->breaker,
                       m_origin_name);
        if (auto rejected = loop.begin()) {
            co_return Result<Response>::err(std::move(*rejected));
        }

        boost::asio::steady_timer timer(ex_);
        for (;;) {
            for (auto adm = loop.admit(); !adm.granted; adm = loop.admit()) {
                co_await pause(timer, adm.wait_hint);
            }

            auto outcome = co_await attempt(prepared.value());
            auto step = loop.on_outcome(std::move(outcome));
            if (step.done) co_return loop.take_result();

            co_await pause(timer, step.delay);
        }
    }

    boost::asio::awaitable<Result<Response>> AsyncPooledClient::get(
        std::string path, QueryParams query, Headers headers) {
        co_return co_await send(make_request(HttpMethod::Get, std::move(path),
                                             std::move(query),
                                             std::move(headers)));
    }

    boost::asio::awaitable<Result<nlohmann::json>> AsyncPooledClient::get_json(
        std::string path, QueryParams query, Headers headers) {
        headers.try_emplace("Accept", "application/json");
        co_return to_json(co_await get(std::move(path), std::move(query),
                                       std::move(headers)));
    }

    boost::asio::awaitable<Result<Response>> AsyncPooledClient::post_json(
        std::string path, nlohmann::json body, Headers headers) {
        headers["Content-Type"] = "application/json";
        co_return co_await send(make_request(HttpMethod::Post, std::move(path),
                                             {}, std::move(headers),
                                             body.dump()));
    }

}  // namespace feedlink
