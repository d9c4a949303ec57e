#pragma once

#include <atomic>
#include <boost/asio/ssl/context.hpp>
#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

#include "feedlink/config.hpp"
#include "feedlink/origin.hpp"
#include "feedlink/origin_state.hpp"
#include "feedlink/request.hpp"
#include "feedlink/response.hpp"
#include "feedlink/result.hpp"
#include "feedlink/serialize_nlohmann.hpp"
#include "feedlink/url.hpp"

namespace feedlink {

    /**
     * @brief State and request preparation shared by PooledClient and
     * AsyncPooledClient. Holds no transport connections itself.
     */
    class ClientBase {
       public:
        ClientBase(const ClientBase&) = delete;
        ClientBase& operator=(const ClientBase&) = delete;

        [[nodiscard]] const ClientConfiguration& config() const noexcept {
            return m_config;
        }

        [[nodiscard]] const Origin& origin() const noexcept {
            return m_shared->origin;
        }

        /// @brief Rate limiter and breaker of this client's origin.
        [[nodiscard]] OriginState& origin_state() const noexcept {
            return *m_shared;
        }

        [[nodiscard]] std::shared_ptr<OriginState> shared_origin_state()
            const noexcept {
            return m_shared;
        }

        /// @brief Time of the last call started through this client.
        [[nodiscard]] std::chrono::steady_clock::time_point last_used()
            const noexcept {
            return std::chrono::steady_clock::time_point(
                std::chrono::steady_clock::duration(
                    m_last_used.load(std::memory_order_relaxed)));
        }

       protected:
        /**
         * @param config base_url is required; it fixes the client's origin.
         * @param shared Origin state to share; created when null.
         * @throws std::runtime_error when base_url is missing or invalid, or
         * names a different origin than @p shared.
         */
        ClientBase(ClientConfiguration config,
                   std::shared_ptr<OriginState> shared);

        ~ClientBase() = default;

        /// @brief Resolve, intercept and build the wire request.
        Result<PreparedRequest> prepare(Request request) const;

        /// @brief Apply the GET_JSON content-type rule and parse the body.
        Result<nlohmann::json> to_json(Result<Response>&& res) const;

        /// @brief Decode a successful response into T through nlohmann's
        /// from_json customization point.
        template <typename T>
        Result<T> to_result_t(Result<Response>&& res) const {
            if (res.has_error()) return Result<T>::err(std::move(res).error());
            T out{};
            auto decoded = deserialize(res.value(), out);
            if (decoded.has_error()) {
                Error e = std::move(decoded).error();
                e.origin = m_origin_name;
                e.status_code = res.value().status_code;
                return Result<T>::err(std::move(e));
            }
            return Result<T>::ok(std::move(out));
        }

        void touch() noexcept {
            m_last_used.store(
                std::chrono::steady_clock::now().time_since_epoch().count(),
                std::memory_order_relaxed);
        }

        static Request make_request(HttpMethod method, std::string path,
                                    QueryParams query, Headers headers,
                                    std::optional<std::string> body = {});

        ClientConfiguration m_config;
        UrlComponents m_base_url;
        std::shared_ptr<OriginState> m_shared;
        std::string m_origin_name;
        boost::asio::ssl::context m_ssl_context;

       private:
        std::atomic<std::chrono::steady_clock::rep> m_last_used;
    };

}  // namespace feedlink
