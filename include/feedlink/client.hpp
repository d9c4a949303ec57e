#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <string>

#include "feedlink/client_base.hpp"
#include "feedlink/config.hpp"
#include "feedlink/connection/connection.hpp"
#include "feedlink/connection/connection_slots.hpp"
#include "feedlink/origin_state.hpp"
#include "feedlink/request.hpp"
#include "feedlink/response.hpp"
#include "feedlink/result.hpp"

namespace feedlink {

    /**
     * @brief Pull-based view of a response body still on the socket.
     *
     * Holds its connection lease until destroyed or fully read. An
     * unfinished body closes the connection on release.
     */
    class BodyStream {
       public:
        using Lease = ConnectionSlots<Mode::Sync>::Lease;

        BodyStream(ResponseHead head, Lease lease, std::string origin)
            : m_head(std::move(head)),
              m_lease(std::move(lease)),
              m_origin(std::move(origin)) {}

        BodyStream(BodyStream&&) noexcept = default;
        BodyStream& operator=(BodyStream&&) noexcept = default;

        const ResponseHead& head() const noexcept { return m_head; }

        /// @brief Read up to @p n bytes; 0 means end of body.
        Result<std::size_t> read(char* dst, std::size_t n);

       private:
        ResponseHead m_head;
        Lease m_lease;
        std::string m_origin;
        bool m_done{false};
    };

    /**
     * @brief Thread-blocking client bound to one origin.
     *
     * Every call passes the origin's circuit breaker and rate limiter and is
     * retried according to ClientConfiguration::retry. Waits (limiter,
     * backoff, socket I/O) block the calling thread. Safe to share between
     * threads; each concurrent call leases its own connection.
     */
    class PooledClient : public ClientBase {
       public:
        /**
         * @brief Constructs a standalone client; it owns its origin state.
         * @throws std::runtime_error if base_url is missing or invalid.
         */
        explicit PooledClient(ClientConfiguration config);

        /// @brief Constructs a client that shares @p shared with other
        /// clients of the same origin (used by ConnectionPool).
        PooledClient(ClientConfiguration config,
                     std::shared_ptr<OriginState> shared);

        PooledClient(const PooledClient&) = delete;
        PooledClient& operator=(const PooledClient&) = delete;

        ~PooledClient() noexcept;

        /**
         * @brief Sends a request with retry and circuit breaking.
         * @return Response with a 2xx status, or an Error: a network kind,
         * Timeout, HttpStatus, CircuitOpen or RetryExhausted.
         */
        Result<Response> send(Request request);

        /**
         * @brief GET a path (relative to base_url) or absolute same-origin URL.
         */
        Result<Response> get(std::string path, QueryParams query = {},
                             Headers headers = {});

        /// @brief GET and parse the body as JSON. Adds Parse to the error set.
        Result<nlohmann::json> get_json(std::string path,
                                        QueryParams query = {},
                                        Headers headers = {});

        /// @brief POST a JSON document.
        Result<Response> post_json(std::string path, const nlohmann::json& body,
                                   Headers headers = {});

        /**
         * @brief GET and decode the body into T via nlohmann's from_json.
         */
        template <typename T>
        Result<T> get(std::string path, QueryParams query = {}) {
            return to_result_t<T>(get(std::move(path), std::move(query)));
        }

        /**
         * @brief GET whose body is read incrementally.
         *
         * Admission, retries and breaker accounting cover everything up to
         * and including the response headers; the body is then pulled by
         * the caller.
         */
        Result<BodyStream> open_stream(std::string path, QueryParams query = {},
                                       Headers headers = {});

        /// @brief Live transport connections (idle + in use).
        std::size_t connection_count() const { return m_slots.size(); }
        std::size_t in_flight() const { return m_slots.in_use(); }

        /// @brief Close idle transport connections; in-flight calls finish.
        void close_idle() { m_slots.close_idle(); }

       private:
        Result<Response> attempt(const PreparedRequest& preq);

        ConnectionSlots<Mode::Sync> m_slots;
    };

}  // namespace feedlink
