#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "result.hpp"

namespace feedlink {

    struct UrlComponents {
        bool https{false};
        std::string host;
        std::string port;
        // For a parsed absolute URL: full target (path + optional query).
        // For a parsed base URL (via parse_base_url): normalized prefix path
        // ("" or "/api"). For a resolved URL: full request target.
        std::string target;
    };

    /// @brief Ordered query parameters; order is preserved on the wire.
    using QueryParams = std::vector<std::pair<std::string, std::string>>;

    namespace url_utils {

        /// @brief Check if a URL is an absolute HTTP or HTTPS URL.
        inline bool is_absolute_url_with_protocol(std::string_view s) {
            return (s.rfind("https://", 0) == 0) ||
                   (s.rfind("http://", 0) == 0);
        }

        /// @brief Trim trailing slashes from a string.
        inline std::string trim_trailing_slashes(std::string s) {
            while (!s.empty() && s.back() == '/') s.pop_back();
            return s;
        }

        /// @brief Percent-encode everything outside RFC 3986 unreserved.
        inline std::string url_encode(std::string_view in) {
            static constexpr char hex[] = "0123456789ABCDEF";
            std::string out;
            out.reserve(in.size());
            for (unsigned char c : in) {
                const bool unreserved = (c >= 'A' && c <= 'Z') ||
                                        (c >= 'a' && c <= 'z') ||
                                        (c >= '0' && c <= '9') || c == '-' ||
                                        c == '_' || c == '.' || c == '~';
                if (unreserved) {
                    out.push_back(static_cast<char>(c));
                } else {
                    out.push_back('%');
                    out.push_back(hex[c >> 4]);
                    out.push_back(hex[c & 0x0F]);
                }
            }
            return out;
        }

        /// @brief Append encoded query parameters to a target, keeping any
        /// fragment at the end.
        inline std::string append_query(std::string target,
                                        const QueryParams& query) {
            if (query.empty()) return target;

            std::string fragment;
            if (auto pos = target.find('#'); pos != std::string::npos) {
                fragment = target.substr(pos);
                target.erase(pos);
            }

            if (target.find('?') == std::string::npos) {
                target += '?';
            } else if (target.back() != '?' && target.back() != '&') {
                target += '&';
            }

            bool first = true;
            for (const auto& [k, v] : query) {
                if (!first) target += '&';
                first = false;
                target += url_encode(k);
                target += '=';
                target += url_encode(v);
            }
            target += fragment;
            return target;
        }

        /// @brief Parse a base_url into components suitable for resolving
        /// relative targets. The returned UrlComponents.target is a
        /// normalized prefix:
        /// - "/" becomes ""
        /// - trailing '/' removed
        /// - query is rejected (to keep prefix joining simple/fast)
        inline Result<UrlComponents> parse_base_url(std::string_view base_url);

        /// @brief Resolve a request URL (absolute or relative) into
        /// UrlComponents. Relative paths require a base.
        inline Result<UrlComponents> resolve_url(
            std::string_view uri_or_url,
            const UrlComponents* base /*nullable*/);

    }  // namespace url_utils

    /// @brief Parse an absolute URL into its components.
    inline Result<UrlComponents> parse_url(const std::string& url) {
        auto make_err = [&](std::string msg) -> Result<UrlComponents> {
            return Result<UrlComponents>::err(Error::Code::InvalidUrl,
                                              std::move(msg));
        };

        std::string_view s(url);

        bool https = false;
        if (s.rfind("https://", 0) == 0) {
            https = true;
            s.remove_prefix(std::string_view("https://").size());
        } else if (s.rfind("http://", 0) == 0) {
            https = false;
            s.remove_prefix(std::string_view("http://").size());
        } else {
            return make_err("URL must start with http:// or https://");
        }

        // Split host[:port] from path
        std::string_view hostport = s;
        std::string_view path = "/";
        if (auto slash = s.find_first_of("/?"); slash != std::string_view::npos) {
            hostport = s.substr(0, slash);
            path = s.substr(slash);
        }

        if (hostport.empty()) {
            return make_err("URL missing host");
        }

        std::string host;
        std::string port;

        if (auto colon = hostport.rfind(':'); colon != std::string_view::npos) {
            host = std::string(hostport.substr(0, colon));
            port = std::string(hostport.substr(colon + 1));
            if (port.empty()) {
                return make_err("URL has empty port");
            }
            if (port.find_first_not_of("0123456789") != std::string::npos) {
                return make_err("URL has non-numeric port");
            }
        } else {
            host = std::string(hostport);
            port = https ? "443" : "80";
        }

        if (host.empty()) {
            return make_err("URL has empty host");
        }

        UrlComponents out;
        out.https = https;
        out.host = std::move(host);
        out.port = std::move(port);
        if (path.empty()) {
            out.target = "/";
        } else if (path.front() == '?') {
            out.target = "/" + std::string(path);
        } else {
            out.target = std::string(path);
        }
        return Result<UrlComponents>::ok(std::move(out));
    }

    namespace url_utils {

        inline Result<UrlComponents> parse_base_url(std::string_view base_url) {
            auto make_err = [&](std::string msg) -> Result<UrlComponents> {
                return Result<UrlComponents>::err(Error::Code::InvalidUrl,
                                                  std::move(msg));
            };

            if (base_url.empty()) {
                return make_err("base_url is empty");
            }
            if (!is_absolute_url_with_protocol(base_url)) {
                return make_err("base_url must start with http:// or https://");
            }

            auto parsed = feedlink::parse_url(std::string(base_url));
            if (parsed.has_error())
                return Result<UrlComponents>::err(parsed.error());

            UrlComponents b = std::move(parsed.value());

            b.target = trim_trailing_slashes(std::move(b.target));
            if (b.target == "/") b.target.clear();

            if (b.target.find('?') != std::string::npos) {
                return make_err("base_url must not include query parameters");
            }

            return Result<UrlComponents>::ok(std::move(b));
        }

        inline Result<UrlComponents> resolve_url(std::string_view uri_or_url,
                                                 const UrlComponents* base) {
            if (is_absolute_url_with_protocol(uri_or_url)) {
                return feedlink::parse_url(std::string(uri_or_url));
            }

            if (base == nullptr || base->host.empty() || base->port.empty()) {
                return Result<UrlComponents>::err(
                    Error::Code::InvalidUrl,
                    "Relative URI provided but base_url is empty");
            }

            // Normalize rel: "" => "/", "health" => "/health"
            std::string_view rel = uri_or_url;
            std::string rel_storage;

            if (rel.empty()) {
                rel = "/";
            } else if (rel.front() != '/') {
                rel_storage.reserve(rel.size() + 1);
                rel_storage.push_back('/');
                rel_storage.append(rel);
                rel = rel_storage;
            }

            std::string target;
            if (base->target.empty()) {
                target.assign(rel);
            } else {
                target.reserve(base->target.size() + rel.size());
                target.append(base->target);  // prefix has no trailing '/'
                target.append(rel);           // rel begins with '/'
            }

            UrlComponents out;
            out.https = base->https;
            out.host = base->host;
            out.port = base->port;
            out.target = std::move(target);
            return Result<UrlComponents>::ok(std::move(out));
        }

    }  // namespace url_utils

}  // namespace feedlink
