#pragma once

#include <algorithm>
#include <boost/beast/http/fields.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <cctype>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace feedlink {

    /**
     * @brief Represents an HTTP response.
     */
    struct Response {
        /** @brief HTTP status code (e.g., 200, 404). */
        int status_code{0};
        /** @brief HTTP response headers. */
        std::unordered_map<std::string, std::string> headers;
        /** @brief HTTP response body as a string. */
        std::string body;
        /** @brief Network attempts it took to obtain this response. */
        std::size_t attempts{1};

        /// @brief True for 2xx statuses.
        [[nodiscard]] bool ok() const noexcept {
            return status_code >= 200 && status_code < 300;
        }

        /// @brief Case-insensitive header lookup.
        [[nodiscard]] std::optional<std::string> header(
            std::string_view name) const {
            auto eq = [&](const std::string& k) {
                return k.size() == name.size() &&
                       std::equal(k.begin(), k.end(), name.begin(),
                                  [](unsigned char a, unsigned char b) {
                                      return std::tolower(a) ==
                                             std::tolower(b);
                                  });
            };
            for (const auto& [k, v] : headers) {
                if (eq(k)) return v;
            }
            return std::nullopt;
        }
    };

    /// @brief Copy Boost.Beast response headers into a std::unordered_map.
    /// @note If duplicate header keys occur, the last one wins.
    inline void copy_response_headers(
        const boost::beast::http::fields& in,
        std::unordered_map<std::string, std::string>& out) {
        out.clear();
        for (auto const& field : in) {
            out[std::string(field.name_string())] = std::string(field.value());
        }
    }

    /// @brief Convert a Boost.Beast HTTP response to a feedlink::Response.
    inline Response parse_beast_response(
        boost::beast::http::response<boost::beast::http::string_body>&&
            beast_res) {
        Response out;
        out.status_code = static_cast<int>(beast_res.result_int());
        copy_response_headers(beast_res.base(), out.headers);
        out.body = std::move(beast_res.body());
        return out;
    }

}  // namespace feedlink
