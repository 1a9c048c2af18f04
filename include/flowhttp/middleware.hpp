#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "request.hpp"
#include "url.hpp"

namespace flowhttp {

    /**
     * @brief Interface for intercepting and modifying requests before they
     * are sent.
     *
     * Interceptors run once per submitted request, in configuration order,
     * before the request is resolved into a descriptor. Redirected requests
     * are derived from that descriptor and do not pass through them again.
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
            req.headers.set(http::field::authorization, "Bearer " + token_);
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
                req.headers.set(key_, value_);
                return;
            }

            // Fragments never reach the wire.
            const auto fragment_pos = req.url.find('#');
            if (fragment_pos != std::string::npos) req.url.erase(fragment_pos);

            if (req.url.find('?') == std::string::npos) {
                req.url += "?";
            } else {
                const char last = req.url.back();
                if (last != '?' && last != '&') req.url += "&";
            }
            req.url +=
                url_utils::url_encode(key_) + "=" + url_utils::url_encode(value_);
        }

       private:
        std::string key_;
        std::string value_;
        Location loc_;
    };

}  // namespace flowhttp
