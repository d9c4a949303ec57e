#pragma once

#include <utility>  // std::exchange, needed by boost/asio/awaitable.hpp (Boost 1.74)
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/buffer_body.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <chrono>
#include <cstdint>
#include <exception>
#include <limits>
#include <memory>
#include <optional>
#include <type_traits>
#include <unordered_map>
#include <variant>

#include "../origin.hpp"    // Origin, set_sni
#include "../request.hpp"   // PreparedRequest
#include "../response.hpp"  // Response, parse_beast_response
#include "../result.hpp"    // Result, Error

namespace feedlink {

    /** @brief Communication mode for connections. */
    enum class Mode {
        Sync,  /**< Blocking operations. */
        Async  /**< Non-blocking operations using coroutines. */
    };

    /// @brief Per-attempt transport limits.
    struct ConnectionOptions {
        std::chrono::milliseconds connect_timeout{5000};
        std::chrono::milliseconds request_timeout{15000};
        std::size_t max_body_bytes{static_cast<std::size_t>(10) * 1024U * 1024U};
    };

    /// @brief Status line and headers of a response whose body is read
    /// incrementally.
    struct ResponseHead {
        int status_code{0};
        std::unordered_map<std::string, std::string> headers;
    };

    /**
     * @brief A single network connection to an origin.
     *
     * Both modes run the same coroutine code. The Sync mode owns a private
     * io_context and drives it to completion on the calling thread, so the
     * per-attempt deadlines of beast::tcp_stream apply in both modes.
     *
     * @note DNS resolution is not covered by the deadlines.
     * @tparam mode The communication mode (Sync or Async).
     */
    template <Mode mode>
    class Connection {
       private:
        using tcp = boost::asio::ip::tcp;
        using HttpStream = boost::beast::tcp_stream;
        using HttpsStream = boost::beast::ssl_stream<boost::beast::tcp_stream>;
        using Stream = std::variant<std::monostate,  // "not connected yet"
                                    HttpStream, HttpsStream>;

        template <typename T>
        using ret_t = std::conditional_t<mode == Mode::Sync, Result<T>,
                                         boost::asio::awaitable<Result<T>>>;

        enum class BodyState { None, Open, Done };

       public:
        /**
         * @brief Constructs a Connection.
         * @param executor Executor for Async mode. Ignored in Sync mode.
         * @param ssl_ctx The SSL context for HTTPS.
         * @param origin The target origin.
         * @param opts Deadlines and body limit.
         */
        Connection(boost::asio::any_io_executor executor,
                   boost::asio::ssl::context& ssl_ctx, Origin origin,
                   ConnectionOptions opts)
            : m_ioc(mode == Mode::Sync
                        ? std::make_unique<boost::asio::io_context>()
                        : nullptr),
              m_ex(mode == Mode::Sync
                       ? boost::asio::any_io_executor(m_ioc->get_executor())
                       : std::move(executor)),
              m_ssl_ctx(ssl_ctx),
              m_origin(origin.normalized()),
              m_opts(opts) {}

        Connection(const Connection&) = delete;
        Connection& operator=(const Connection&) = delete;
        Connection(Connection&&) = delete;
        Connection& operator=(Connection&&) = delete;

        ~Connection() noexcept { close(); }

        /// @brief Close the socket if open (best-effort, no TLS shutdown).
        void close() noexcept {
            boost::system::error_code ec;
            if (auto* s = std::get_if<HttpStream>(&m_stream)) {
                s->socket().shutdown(tcp::socket::shutdown_both, ec);
                s->socket().close(ec);
            } else if (auto* s = std::get_if<HttpsStream>(&m_stream)) {
                auto& sock = boost::beast::get_lowest_layer(*s).socket();
                sock.shutdown(tcp::socket::shutdown_both, ec);
                sock.close(ec);
            }
            m_stream.template emplace<std::monostate>();
            m_body.reset();
            m_body_state = BodyState::None;
        }

        /**
         * @brief Perform one HTTP transaction and buffer the whole body.
         * @return In Sync mode: Result. In Async mode: awaitable Result.
         */
        ret_t<Response> request(const PreparedRequest& preq) {
            if constexpr (mode == Mode::Sync) {
                return run_blocking(request_async(preq));
            } else {
                return request_async(preq);
            }
        }

        /**
         * @brief Send a request and read only the status line and headers.
         * The body is then pulled with read_some() until it returns 0.
         */
        ret_t<ResponseHead> open_stream(const PreparedRequest& preq) {
            if constexpr (mode == Mode::Sync) {
                return run_blocking(open_stream_async(preq));
            } else {
                return open_stream_async(preq);
            }
        }

        /// @brief Read up to @p n body bytes of the stream opened by
        /// open_stream(). Returns 0 once the body is complete.
        ret_t<std::size_t> read_some(char* dst, std::size_t n) {
            if constexpr (mode == Mode::Sync) {
                return run_blocking(read_some_async(dst, n));
            } else {
                return read_some_async(dst, n);
            }
        }

        /// @brief True while a streamed body has unread bytes. Such a
        /// connection cannot be reused and is closed on release.
        bool mid_stream() const noexcept {
            return m_body_state == BodyState::Open;
        }

        /**
         * @brief Returns the origin this connection is tied to.
         */
        const Origin& origin() const noexcept { return m_origin; }

        /// @brief Completed transactions on this connection.
        std::size_t uses() const noexcept { return m_uses; }

        /**
         * @brief Checks if the connection is currently open.
         */
        bool is_open() const noexcept {
            if (auto* s = std::get_if<HttpStream>(&m_stream))
                return s->socket().is_open();
            if (auto* s = std::get_if<HttpsStream>(&m_stream))
                return boost::beast::get_lowest_layer(*s).socket().is_open();
            return false;
        }

       private:
        template <typename T>
        Result<T> run_blocking(boost::asio::awaitable<Result<T>> op) {
            std::optional<Result<T>> out;
            std::exception_ptr failure;
            m_ioc->restart();
            boost::asio::co_spawn(
                *m_ioc,
                [&]() -> boost::asio::awaitable<void> {
                    out.emplace(co_await std::move(op));
                },
                [&](std::exception_ptr e) { failure = e; });
            m_ioc->run();
            if (failure) std::rethrow_exception(failure);
            if (!out) {
                return Result<T>::err(Error::Code::Unknown,
                                      "operation did not complete");
            }
            return std::move(*out);
        }

        Error make_error(const boost::system::error_code& ec,
                         Error::Code stage) const {
            Error e{ec == boost::beast::error::timeout ? Error::Code::Timeout
                                                       : stage,
                    ec.message()};
            e.origin = m_origin.to_string();
            return e;
        }

        /// @brief The peer closed a kept-alive socket between requests.
        static bool is_stale(const boost::system::error_code& ec) noexcept {
            return ec == boost::beast::http::error::end_of_stream ||
                   ec == boost::asio::error::connection_reset ||
                   ec == boost::asio::error::broken_pipe ||
                   ec == boost::asio::error::eof;
        }

        boost::asio::awaitable<Result<Response>> request_async(
            const PreparedRequest& preq) {
            if (preq.origin != m_origin) {
                co_return Result<Response>::err(
                    Error::Code::InvalidUrl,
                    "PreparedRequest origin does not match Connection origin");
            }

            const bool reused = is_open();
            auto res = co_await transact_once(preq);
            // One silent reconnect when a reused keep-alive socket turned
            // out to be closed by the server. POST is never replayed here.
            if (res.has_error() && reused && m_last_stale &&
                preq.beast_req.method() != boost::beast::http::verb::post) {
                res = co_await transact_once(preq);
            }
            co_return res;
        }

        boost::asio::awaitable<Result<Response>> transact_once(
            const PreparedRequest& preq) {
            m_last_stale = false;
            auto ec = co_await ensure_connected();
            if (ec) {
                co_return Result<Response>::err(
                    make_error(ec, m_connect_stage));
            }
            if (auto* s = std::get_if<HttpsStream>(&m_stream))
                co_return co_await transact(*s, preq);
            co_return co_await transact(std::get<HttpStream>(m_stream), preq);
        }

        template <typename S>
        boost::asio::awaitable<Result<Response>> transact(
            S& stream, const PreparedRequest& preq) {
            namespace http = boost::beast::http;
            boost::system::error_code ec;

            boost::beast::get_lowest_layer(stream).expires_after(
                m_opts.request_timeout);
            co_await http::async_write(
                stream, preq.beast_req,
                boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            if (ec) {
                m_last_stale = is_stale(ec);
                close();
                co_return Result<Response>::err(
                    make_error(ec, Error::Code::SendFailed));
            }

            http::response_parser<http::string_body> parser;
            parser.body_limit(m_opts.max_body_bytes);
            if (preq.beast_req.method() == http::verb::head) parser.skip(true);

            m_buffer.clear();
            co_await http::async_read(
                stream, m_buffer, parser,
                boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            if (ec) {
                m_last_stale = is_stale(ec);
                close();
                co_return Result<Response>::err(
                    make_error(ec, Error::Code::ReceiveFailed));
            }
            boost::beast::get_lowest_layer(stream).expires_never();

            auto beast_res = parser.release();
            if (!beast_res.keep_alive()) close();
            ++m_uses;

            co_return Result<Response>::ok(
                parse_beast_response(std::move(beast_res)));
        }

        boost::asio::awaitable<Result<ResponseHead>> open_stream_async(
            const PreparedRequest& preq) {
            if (preq.origin != m_origin) {
                co_return Result<ResponseHead>::err(
                    Error::Code::InvalidUrl,
                    "PreparedRequest origin does not match Connection origin");
            }
            auto ec = co_await ensure_connected();
            if (ec) {
                co_return Result<ResponseHead>::err(
                    make_error(ec, m_connect_stage));
            }
            if (auto* s = std::get_if<HttpsStream>(&m_stream))
                co_return co_await open_on(*s, preq);
            co_return co_await open_on(std::get<HttpStream>(m_stream), preq);
        }

        template <typename S>
        boost::asio::awaitable<Result<ResponseHead>> open_on(
            S& stream, const PreparedRequest& preq) {
            namespace http = boost::beast::http;
            boost::system::error_code ec;

            boost::beast::get_lowest_layer(stream).expires_after(
                m_opts.request_timeout);
            co_await http::async_write(
                stream, preq.beast_req,
                boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            if (ec) {
                close();
                co_return Result<ResponseHead>::err(
                    make_error(ec, Error::Code::SendFailed));
            }

            m_body.emplace();
            // Streamed bodies are bounded by the consumer, not by us.
            m_body->body_limit(std::numeric_limits<std::uint64_t>::max());
            m_buffer.clear();
            co_await http::async_read_header(
                stream, m_buffer, *m_body,
                boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            if (ec) {
                close();
                co_return Result<ResponseHead>::err(
                    make_error(ec, Error::Code::ReceiveFailed));
            }
            boost::beast::get_lowest_layer(stream).expires_never();

            ResponseHead head;
            head.status_code = static_cast<int>(m_body->get().result_int());
            copy_response_headers(m_body->get().base(), head.headers);
            m_body_state = BodyState::Open;
            if (m_body->is_done()) finish_body();
            co_return Result<ResponseHead>::ok(std::move(head));
        }

        boost::asio::awaitable<Result<std::size_t>> read_some_async(
            char* dst, std::size_t n) {
            if (m_body_state == BodyState::None) {
                co_return Result<std::size_t>::err(
                    Error::Code::InvalidArgument, "no response body is open");
            }
            if (m_body_state == BodyState::Done || n == 0)
                co_return Result<std::size_t>::ok(std::size_t{0});

            if (auto* s = std::get_if<HttpsStream>(&m_stream))
                co_return co_await read_body_on(*s, dst, n);
            if (auto* s = std::get_if<HttpStream>(&m_stream))
                co_return co_await read_body_on(*s, dst, n);
            co_return Result<std::size_t>::err(
                make_error(boost::asio::error::not_connected,
                           Error::Code::ReceiveFailed));
        }

        template <typename S>
        boost::asio::awaitable<Result<std::size_t>> read_body_on(
            S& stream, char* dst, std::size_t n) {
            namespace http = boost::beast::http;
            boost::system::error_code ec;

            auto& body = m_body->get().body();
            body.data = dst;
            body.size = n;

            boost::beast::get_lowest_layer(stream).expires_after(
                m_opts.request_timeout);
            co_await http::async_read(
                stream, m_buffer, *m_body,
                boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            if (ec == http::error::need_buffer) ec = {};
            if (ec) {
                close();
                co_return Result<std::size_t>::err(
                    make_error(ec, Error::Code::ReceiveFailed));
            }
            boost::beast::get_lowest_layer(stream).expires_never();

            const std::size_t got = n - body.size;
            if (m_body->is_done()) finish_body();
            co_return Result<std::size_t>::ok(got);
        }

        void finish_body() {
            const bool keep = m_body->get().keep_alive();
            m_body.reset();
            m_body_state = BodyState::Done;
            ++m_uses;
            if (!keep) {
                close();
                m_body_state = BodyState::Done;
            }
        }

        boost::asio::awaitable<boost::system::error_code> ensure_connected() {
            if (m_body_state == BodyState::Open) close();
            m_body_state = BodyState::None;
            if (is_open()) co_return boost::system::error_code{};
            close();
            if (m_origin.https) co_return co_await connect_https();
            co_return co_await connect_http();
        }

        boost::asio::awaitable<boost::system::error_code> connect_http() {
            boost::system::error_code ec;
            m_connect_stage = Error::Code::ConnectionFailed;

            tcp::resolver resolver(m_ex);
            auto results = co_await resolver.async_resolve(
                m_origin.host, m_origin.port,
                boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            if (ec) co_return ec;

            auto& s = m_stream.template emplace<HttpStream>(m_ex);
            s.expires_after(m_opts.connect_timeout);
            co_await s.async_connect(
                results,
                boost::asio::redirect_error(boost::asio::use_awaitable, ec));

            if (ec) close();
            co_return ec;
        }

        boost::asio::awaitable<boost::system::error_code> connect_https() {
            boost::system::error_code ec;
            m_connect_stage = Error::Code::ConnectionFailed;

            tcp::resolver resolver(m_ex);
            auto results = co_await resolver.async_resolve(
                m_origin.host, m_origin.port,
                boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            if (ec) co_return ec;

            auto& s = m_stream.template emplace<HttpsStream>(m_ex, m_ssl_ctx);
            auto& lowest = boost::beast::get_lowest_layer(s);

            lowest.expires_after(m_opts.connect_timeout);
            co_await lowest.async_connect(
                results,
                boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            if (ec) {
                close();
                co_return ec;
            }

            m_connect_stage = Error::Code::TlsHandshakeFailed;
            if (!set_sni(s, m_origin.host, ec)) {
                close();
                co_return ec;
            }

            co_await s.async_handshake(
                boost::asio::ssl::stream_base::client,
                boost::asio::redirect_error(boost::asio::use_awaitable, ec));

            if (ec) close();
            co_return ec;
        }

        std::unique_ptr<boost::asio::io_context> m_ioc;  // Sync mode only
        boost::asio::any_io_executor m_ex;
        boost::asio::ssl::context& m_ssl_ctx;

        Origin m_origin{};
        ConnectionOptions m_opts{};
        boost::beast::flat_buffer m_buffer{};

        Stream m_stream;
        std::optional<boost::beast::http::response_parser<
            boost::beast::http::buffer_body>>
            m_body;
        BodyState m_body_state{BodyState::None};

        Error::Code m_connect_stage{Error::Code::ConnectionFailed};
        bool m_last_stale{false};
        std::size_t m_uses{0};
    };

}  // namespace feedlink
