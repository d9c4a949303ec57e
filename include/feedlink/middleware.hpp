#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "request.hpp"
#include "url.hpp"

namespace feedlink {

    /**
     * @brief Interface for modifying requests before they are sent.
     *
     * Interceptors only inject static data (headers, query parameters).
     * They run once per logical call, before the first attempt.
     */
    class RequestInterceptor {
       public:
        virtual ~RequestInterceptor() = default;

        /**
         * @brief Performs modifications on the outgoing request.
         * @param req The request object to modify.
         * @param url The resolved URL components for the request.
         */
        virtual void prepare(Request& req, const UrlComponents& url) const = 0;
    };

    /// @brief Sets a fixed set of headers, e.g. Referer or Accept-Language
    /// that an upstream insists on.
    class StaticHeaderInterceptor : public RequestInterceptor {
       public:
        explicit StaticHeaderInterceptor(
            std::map<std::string, std::string> headers)
            : headers_(std::move(headers)) {}

        void prepare(Request& req,
                     const UrlComponents& /*url*/) const override {
            for (const auto& [k, v] : headers_) req.headers[k] = v;
        }

       private:
        std::map<std::string, std::string> headers_;
    };

    /**
     * @brief Interceptor for Bearer Token authentication.
     *
     * Adds an `Authorization: Bearer <token>` header to the request.
     */
    class BearerAuthInterceptor : public RequestInterceptor {
       public:
        explicit BearerAuthInterceptor(std::string token)
            : token_(std::move(token)) {}

        void prepare(Request& req,
                     const UrlComponents& /*url*/) const override {
            req.headers["Authorization"] = "Bearer " + token_;
        }

       private:
        std::string token_;
    };

    /**
     * @brief Interceptor for API Key authentication.
     *
     * Adds an API key either as a header or as a query parameter.
     */
    class ApiKeyInterceptor : public RequestInterceptor {
       public:
        /** @brief Specifies where the API key should be placed. */
        enum class Location : std::uint8_t {
            Header, /**< Place in an HTTP header. */
            Query   /**< Place in the URL query string. */
        };

        explicit ApiKeyInterceptor(std::string key, std::string value,
                                   Location loc = Location::Header)
            : key_(std::move(key)), value_(std::move(value)), loc_(loc) {}

        void prepare(Request& req,
                     const UrlComponents& /*url*/) const override {
            if (loc_ == Location::Header) {
                req.headers[key_] = value_;
            } else {
                req.query.emplace_back(key_, value_);
            }
        }

       private:
        std::string key_;
        std::string value_;
        Location loc_;
    };

    /// @brief Run all interceptors in registration order.
    inline void apply_interceptors(
        const std::vector<std::shared_ptr<const RequestInterceptor>>& chain,
        Request& req, const UrlComponents& url) {
        for (const auto& ic : chain) {
            if (ic) ic->prepare(req, url);
        }
    }

}  // namespace feedlink
