#include "feedlink/client.hpp"

#include <spdlog/spdlog.h>

#include <thread>

#include "feedlink/resilience/retry_loop.hpp"

namespace feedlink {

    namespace {

        ConnectionOptions options_from(const ClientConfiguration& cfg) {
            ConnectionOptions o;
            o.connect_timeout = cfg.connect_timeout;
            o.request_timeout = cfg.request_timeout;
            o.max_body_bytes = cfg.max_body_bytes;
            return o;
        }

        void wait_for_admission(RetryLoop& loop) {
            for (auto adm = loop.admit(); !adm.granted; adm = loop.admit()) {
                std::this_thread::sleep_for(adm.wait_hint);
            }
        }

    }  // namespace

    Result<std::size_t> BodyStream::read(char* dst, std::size_t n) {
        if (m_done) return Result<std::size_t>::ok(std::size_t{0});
        auto* conn = m_lease.get();
        if (conn == nullptr) {
            Error e{Error::Code::ReceiveFailed, "client closed during stream"};
            e.origin = m_origin;
            return Result<std::size_t>::err(std::move(e));
        }
        auto got = conn->read_some(dst, n);
        if (got.has_value() && got.value() == 0) {
            m_done = true;
            // Body complete; hand the connection back for reuse.
            m_lease = Lease{};
        }
        return got;
    }

    PooledClient::PooledClient(ClientConfiguration config)
        : PooledClient(std::move(config), nullptr) {}

    PooledClient::PooledClient(ClientConfiguration config,
                               std::shared_ptr<OriginState> shared)
        : ClientBase(std::move(config), std::move(shared)),
          m_slots({}, m_ssl_context, m_shared->origin, options_from(m_config),
                  m_config.max_connections,
                  m_config.max_connection_reuse_count) {
        SPDLOG_DEBUG("created blocking client for {}", m_origin_name);
    }

    PooledClient::~PooledClient() noexcept {
        SPDLOG_DEBUG("closing blocking client for {}", m_origin_name);
    }

    Result<Response> PooledClient::attempt(const PreparedRequest& preq) {
        auto lease_res = m_slots.acquire();
        if (lease_res.has_error())
            return Result<Response>::err(std::move(lease_res).error());

        auto lease = std::move(lease_res).value();
        if (!lease) {
            return Result<Response>::err(Error::Code::NetworkError,
                                         "connection slots closed");
        }
        // Connection returns to the slots when the lease destructs.
        return lease->request(preq);
    }

    Result<Response> PooledClient::send(Request request) {
        auto prepared = prepare(std::move(request));
        if (prepared.has_error())
            return Result<Response>::err(std::move(prepared).error());
        touch();

        InFlightCall in_flight(*m_shared);
        RetryLoop loop(m_config.retry, m_shared->limiter, m_shared->breaker,
                       m_origin_name);
        if (auto rejected = loop.begin())
            return Result<Response>::err(std::move(*rejected));

        for (;;) {
            wait_for_admission(loop);
            auto step = loop.on_outcome(attempt(prepared.value()));
            if (step.done) return loop.take_result();
            std::this_thread::sleep_for(step.delay);
        }
    }

    Result<Response> PooledClient::get(std::string path, QueryParams query,
                                       Headers headers) {
        return send(make_request(HttpMethod::Get, std::move(path),
                                 std::move(query), std::move(headers)));
    }

    Result<nlohmann::json> PooledClient::get_json(std::string path,
                                                  QueryParams query,
                                                  Headers headers) {
        headers.try_emplace("Accept", "application/json");
        return to_json(get(std::move(path), std::move(query), std::move(headers)));
    }

    Result<Response> PooledClient::post_json(std::string path,
                                             const nlohmann::json& body,
                                             Headers headers) {
        headers["Content-Type"] = "application/json";
        return send(make_request(HttpMethod::Post, std::move(path), {},
                                 std::move(headers), body.dump()));
    }

    Result<BodyStream> PooledClient::open_stream(std::string path,
                                                 QueryParams query,
                                                 Headers headers) {
        auto prepared = prepare(make_request(HttpMethod::Get, std::move(path),
                                             std::move(query),
                                             std::move(headers)));
        if (prepared.has_error())
            return Result<BodyStream>::err(std::move(prepared).error());
        touch();

        InFlightCall in_flight(*m_shared);
        RetryLoop loop(m_config.retry, m_shared->limiter, m_shared->breaker,
                       m_origin_name);
        if (auto rejected = loop.begin())
            return Result<BodyStream>::err(std::move(*rejected));

        for (;;) {
            wait_for_admission(loop);

            auto lease_res = m_slots.acquire();
            if (lease_res.has_error())
                return Result<BodyStream>::err(std::move(lease_res).error());
            auto lease = std::move(lease_res).value();
            if (!lease) {
                return Result<BodyStream>::err(Error::Code::NetworkError,
                                               "connection slots closed");
            }

            auto head = lease->open_stream(prepared.value());
            std::optional<ResponseHead> kept;
            Result<Response> outcome = [&]() {
                if (head.has_error())
                    return Result<Response>::err(std::move(head).error());
                Response r;
                r.status_code = head.value().status_code;
                r.headers = head.value().headers;
                kept = std::move(head).value();
                return Result<Response>::ok(std::move(r));
            }();

            auto step = loop.on_outcome(std::move(outcome));
            if (step.done) {
                auto res = loop.take_result();
                if (res.has_error())
                    return Result<BodyStream>::err(std::move(res).error());
                return Result<BodyStream>::ok(std::move(*kept), std::move(lease),
                                              m_origin_name);
            }
            // Unread body of a rejected response: the lease closes it.
            lease = BodyStream::Lease{};
            std::this_thread::sleep_for(step.delay);
        }
    }

}  // namespace feedlink
