#pragma once
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>

#include "http_method.hpp"
#include "origin.hpp"
#include "url.hpp"

namespace feedlink {

    using Headers = std::unordered_map<std::string, std::string>;

    /**
     * @brief One logical request. `target` is a path relative to the client's
     * base URL or an absolute URL on the same origin.
     */
    struct Request {
        HttpMethod method{HttpMethod::Get};
        std::string target;
        QueryParams query;
        Headers headers;
        std::optional<std::string> body;
    };

    /// @brief A request bound to its origin and ready for the wire.
    struct PreparedRequest {
        Origin origin;
        boost::beast::http::request<boost::beast::http::string_body> beast_req;
    };

    /// @brief Apply headers into a Boost.Beast header container.
    /// @note Uses `set()`, so duplicate keys overwrite previous values.
    template <typename Map>
    inline void apply_request_headers(const Map& in,
                                      boost::beast::http::fields& out) {
        for (const auto& [k, v] : in) {
            out.set(k, v);
        }
    }

    /// @brief Build the Beast message. Client default headers are applied
    /// first so per-request headers win.
    inline boost::beast::http::request<boost::beast::http::string_body>
    prepare_beast_request(
        const Request& req, const UrlComponents& url,
        const std::string& user_agent,
        const std::map<std::string, std::string>& default_headers = {},
        const bool keep_alive = true) {
        namespace http = boost::beast::http;
        http::request<http::string_body> beast_req;
        beast_req.version(11);
        beast_req.method(to_boost_http_method(req.method));
        beast_req.target(url_utils::append_query(url.target, req.query));
        beast_req.set(http::field::host, url.host);
        beast_req.set(http::field::user_agent, user_agent);
        apply_request_headers(default_headers, beast_req.base());
        apply_request_headers(req.headers, beast_req.base());
        beast_req.keep_alive(keep_alive);
        if (req.body.has_value()) {
            beast_req.body() = *req.body;
            beast_req.prepare_payload();
        }
        return beast_req;
    }

}  // namespace feedlink
