#pragma once
#include <boost/beast/http/verb.hpp>

namespace feedlink {
    enum class HttpMethod {
        Get,
        Post,
        Head,
    };

    inline constexpr boost::beast::http::verb to_boost_http_method(
        HttpMethod method) {
        namespace http = boost::beast::http;
        switch (method) {
            case HttpMethod::Get:
                return http::verb::get;
            case HttpMethod::Post:
                return http::verb::post;
            case HttpMethod::Head:
                return http::verb::head;
            default:
                return http::verb::unknown;
        }
    }

    inline constexpr const char* to_string(HttpMethod method) {
        switch (method) {
            case HttpMethod::Get:
                return "GET";
            case HttpMethod::Post:
                return "POST";
            case HttpMethod::Head:
                return "HEAD";
            default:
                return "UNKNOWN";
        }
    }

}  // namespace feedlink
