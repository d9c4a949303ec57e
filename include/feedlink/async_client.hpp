#pragma once

#include <utility>  // std::exchange, needed by boost/asio/awaitable.hpp (Boost 1.74)
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

#include "feedlink/client_base.hpp"
#include "feedlink/config.hpp"
#include "feedlink/connection/connection_slots.hpp"
#include "feedlink/origin_state.hpp"
#include "feedlink/request.hpp"
#include "feedlink/response.hpp"
#include "feedlink/result.hpp"

namespace feedlink {

    /**
     * @brief An asynchronous pooled client using C++20 coroutines.
     *
     * Same retry, rate limiting and circuit breaking as PooledClient, but
     * every wait (limiter, backoff, socket I/O) suspends the coroutine
     * instead of blocking a thread. No lock is held across a suspension
     * point.
     */
    class AsyncPooledClient : public ClientBase {
       public:
        /**
         * @brief Constructs a standalone AsyncPooledClient.
         * @param ex The executor the transport connections run on.
         * @param cfg Client configuration; base_url is required.
         * @throws std::runtime_error if base_url is missing or invalid.
         */
        AsyncPooledClient(boost::asio::any_io_executor ex,
                          ClientConfiguration cfg);

        /// @brief Shares @p shared with other clients of the same origin.
        AsyncPooledClient(boost::asio::any_io_executor ex,
                          ClientConfiguration cfg,
                          std::shared_ptr<OriginState> shared);

        ~AsyncPooledClient() noexcept;

        /**
         * @brief Sends a request with retry and circuit breaking.
         * @return An awaitable Result containing the Response or an Error.
         */
        boost::asio::awaitable<Result<Response>> send(Request request);

        /**
         * @brief Performs an asynchronous GET request.
         */
        boost::asio::awaitable<Result<Response>> get(std::string path,
                                                     QueryParams query = {},
                                                     Headers headers = {});

        /// @brief GET and parse the body as JSON.
        boost::asio::awaitable<Result<nlohmann::json>> get_json(
            std::string path, QueryParams query = {}, Headers headers = {});

        /// @brief POST a JSON document.
        boost::asio::awaitable<Result<Response>> post_json(
            std::string path, nlohmann::json body, Headers headers = {});

        /**
         * @brief Performs an asynchronous GET and decodes the body into T.
         * @tparam T A type with an nlohmann from_json overload.
         */
        template <typename T>
        boost::asio::awaitable<Result<T>> get(std::string path,
                                              QueryParams query = {}) {
            co_return to_result_t<T>(
                co_await get(std::move(path), std::move(query)));
        }

        std::size_t connection_count() const { return slots_.size(); }
        std::size_t in_flight() const { return slots_.in_use(); }
        void close_idle() { slots_.close_idle(); }

        boost::asio::any_io_executor get_executor() const noexcept {
            return ex_;
        }

       private:
        boost::asio::awaitable<Result<Response>> attempt(
            const PreparedRequest& preq);

        boost::asio::any_io_executor ex_;
        ConnectionSlots<Mode::Async> slots_;
    };

}  // namespace feedlink
