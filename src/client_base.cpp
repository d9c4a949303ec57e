#include "feedlink/client_base.hpp"

#include <boost/beast/http/verb.hpp>
#include <cctype>
#include <stdexcept>

#include "feedlink/middleware.hpp"

namespace http = boost::beast::http;

namespace feedlink {

    namespace {

        bool contains_icase(std::string_view haystack, std::string_view needle) {
            if (needle.size() > haystack.size()) return false;
            for (std::size_t i = 0; i + needle.size() <= haystack.size(); ++i) {
                bool match = true;
                for (std::size_t j = 0; j < needle.size(); ++j) {
                    if (std::tolower(static_cast<unsigned char>(haystack[i + j])) !=
                        std::tolower(static_cast<unsigned char>(needle[j]))) {
                        match = false;
                        break;
                    }
                }
                if (match) return true;
            }
            return false;
        }

    }  // namespace

    ClientBase::ClientBase(ClientConfiguration config,
                           std::shared_ptr<OriginState> shared)
        : m_config(std::move(config)),
          m_ssl_context(boost::asio::ssl::context::tls_client),
          m_last_used(std::chrono::steady_clock::now().time_since_epoch().count()) {
        init_tls_on_ssl_context(m_ssl_context, m_config.verify_tls);

        if (!m_config.base_url) {
            throw std::runtime_error("Invalid base_url: a pooled client needs one");
        }
        auto base_res = url_utils::parse_base_url(*m_config.base_url);
        if (base_res.has_error()) {
            throw std::runtime_error("Invalid base_url: " +
                                     base_res.error().message);
        }
        m_base_url = std::move(base_res.value());

        const Origin own = origin_of(m_base_url);
        if (!shared) {
            shared = std::make_shared<OriginState>(own, m_config);
        } else if (shared->origin != own) {
            throw std::runtime_error("Invalid base_url: " + own.to_string() +
                                     " does not match shared origin " +
                                     shared->origin.to_string());
        }
        m_shared = std::move(shared);
        m_origin_name = m_shared->origin.to_string();
    }

    Result<PreparedRequest> ClientBase::prepare(Request request) const {
        auto u_res = url_utils::resolve_url(request.target, &m_base_url);
        if (u_res.has_error()) {
            Error e = std::move(u_res).error();
            e.origin = m_origin_name;
            return Result<PreparedRequest>::err(std::move(e));
        }
        UrlComponents u = std::move(u_res.value());

        if (origin_of(u) != m_shared->origin) {
            Error e{Error::Code::InvalidUrl,
                    "URL " + request.target + " is outside this client's origin"};
            e.origin = m_origin_name;
            return Result<PreparedRequest>::err(std::move(e));
        }

        if (to_boost_http_method(request.method) == http::verb::unknown) {
            return Result<PreparedRequest>::err(Error::Code::InvalidArgument,
                                                "Unknown HTTP method");
        }

        apply_interceptors(m_config.interceptors, request, u);

        PreparedRequest preq;
        preq.origin = m_shared->origin;
        preq.beast_req = prepare_beast_request(request, u, m_config.user_agent,
                                               m_config.default_headers,
                                               /*keep_alive=*/true);
        return Result<PreparedRequest>::ok(std::move(preq));
    }

    Result<nlohmann::json> ClientBase::to_json(Result<Response>&& res) const {
        if (res.has_error())
            return Result<nlohmann::json>::err(std::move(res).error());

        const Response& r = res.value();
        auto fail = [&](std::string msg) {
            Error e{Error::Code::Parse, std::move(msg)};
            e.origin = m_origin_name;
            e.status_code = r.status_code;
            return Result<nlohmann::json>::err(std::move(e));
        };

        if (m_config.require_json_content_type) {
            auto ct = r.header("Content-Type");
            if (!ct || !contains_icase(*ct, "json")) {
                return fail("expected a JSON body, got Content-Type '" +
                            ct.value_or("") + "'");
            }
        }

        auto parsed = parse_json(r.body);
        if (parsed.has_error()) return fail(parsed.error().message);
        return parsed;
    }

    Request ClientBase::make_request(HttpMethod method, std::string path,
                                     QueryParams query, Headers headers,
                                     std::optional<std::string> body) {
        Request r;
        r.method = method;
        r.target = std::move(path);
        r.query = std::move(query);
        r.headers = std::move(headers);
        r.body = std::move(body);
        return r;
    }

}  // namespace feedlink
