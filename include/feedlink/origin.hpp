#pragma once

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <algorithm>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <boost/system/error_code.hpp>
#include <cctype>
#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "feedlink/result.hpp"
#include "feedlink/url.hpp"

namespace feedlink {

    /**
     * @brief Identity of one upstream service: scheme + host + port.
     *
     * Every origin owns exactly one rate limiter and one circuit breaker
     * inside the ConnectionPool.
     */
    struct Origin {
        std::string host;
        std::string port;
        bool https{false};

        void clear() {
            host.clear();
            port.clear();
            https = false;
        }

        inline void normalize_default_port() {
            if (port.empty()) port = https ? "443" : "80";
        }

        inline void normalize_host() {
            if (host.empty()) host = "localhost";
            std::transform(host.begin(), host.end(), host.begin(),
                           [](unsigned char c) { return std::tolower(c); });
        }

        /// @brief Lowercased host and explicit port.
        [[nodiscard]] Origin normalized() const {
            Origin o = *this;
            o.normalize_default_port();
            o.normalize_host();
            return o;
        }

        /// @brief "https://host:443" form, used in logs and errors.
        [[nodiscard]] std::string to_string() const {
            std::string out = https ? "https://" : "http://";
            out += host;
            out += ':';
            out += port;
            return out;
        }

        friend bool operator==(Origin const& a, Origin const& b) noexcept {
            return a.https == b.https && a.host == b.host && a.port == b.port;
        }

        friend bool operator!=(Origin const& a, Origin const& b) noexcept {
            return !(a == b);
        }
    };

    /// @brief Origin of a parsed URL.
    inline Origin origin_of(const UrlComponents& u) {
        Origin o;
        o.host = u.host;
        o.port = u.port;
        o.https = u.https;
        return o.normalized();
    }

    /// @brief Parse the origin part of an absolute URL; any path is ignored.
    inline Result<Origin> parse_origin(std::string_view url) {
        auto parsed = parse_url(std::string(url));
        if (parsed.has_error()) return Result<Origin>::err(parsed.error());
        return Result<Origin>::ok(origin_of(parsed.value()));
    }

    inline bool set_sni(
        boost::beast::ssl_stream<boost::beast::tcp_stream>& stream,
        const std::string& host, boost::system::error_code& ec) {
        if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
            ec = boost::system::error_code(
                static_cast<int>(::ERR_get_error()),
                boost::asio::error::get_ssl_category());
            return false;
        }
        return true;
    }

    /// @brief Load system CAs and pick the verification mode.
    inline void init_tls_on_ssl_context(boost::asio::ssl::context& ssl_context,
                                        bool verify_peer = true) {
        try {
            ssl_context.set_default_verify_paths();
        } catch (const boost::system::system_error& e) {
            throw std::runtime_error(
                std::string("Failed to set default verify paths: ") + e.what());
        }

        ssl_context.set_verify_mode(verify_peer
                                        ? boost::asio::ssl::verify_peer
                                        : boost::asio::ssl::verify_none);
    }

}  // namespace feedlink

namespace std {
    template <>
    struct hash<feedlink::Origin> {
        size_t operator()(feedlink::Origin const& o) const noexcept {
            // FNV-1a over scheme, host and port.
            size_t h = 1469598103934665603ull;
            auto mix = [&](std::string_view s) {
                for (unsigned char c : s) {
                    h ^= c;
                    h *= 1099511628211ull;
                }
            };
            h ^= static_cast<size_t>(o.https);
            h *= 1099511628211ull;
            mix(o.host);
            mix(o.port);
            return h;
        }
    };
}  // namespace std
