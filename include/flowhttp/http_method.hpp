#pragma once
#include <boost/beast/http/verb.hpp>
#include <string_view>

namespace flowhttp {
    namespace http = boost::beast::http;

    enum class HttpMethod {
        Get,
        Post,
        Put,
        Patch,
        Delete,
        Head,
        Options,
        Trace,
    };

    inline constexpr http::verb to_boost_http_method(HttpMethod method) {
        switch (method) {
            case HttpMethod::Get:
                return http::verb::get;
            case HttpMethod::Post:
                return http::verb::post;
            case HttpMethod::Put:
                return http::verb::put;
            case HttpMethod::Patch:
                return http::verb::patch;
            case HttpMethod::Delete:
                return http::verb::delete_;
            case HttpMethod::Head:
                return http::verb::head;
            case HttpMethod::Options:
                return http::verb::options;
            case HttpMethod::Trace:
                return http::verb::trace;
            default:
                return http::verb::unknown;
        }
    }

    inline constexpr std::string_view to_string(HttpMethod method) {
        switch (method) {
            case HttpMethod::Get:
                return "GET";
            case HttpMethod::Post:
                return "POST";
            case HttpMethod::Put:
                return "PUT";
            case HttpMethod::Patch:
                return "PATCH";
            case HttpMethod::Delete:
                return "DELETE";
            case HttpMethod::Head:
                return "HEAD";
            case HttpMethod::Options:
                return "OPTIONS";
            case HttpMethod::Trace:
                return "TRACE";
        }
        return "UNKNOWN";
    }

    /// @brief Methods whose repetition has the same effect as a single call
    /// (RFC 9110 section 9.2.2). Only these are retried transparently.
    inline constexpr bool is_idempotent(HttpMethod method) {
        switch (method) {
            case HttpMethod::Get:
            case HttpMethod::Head:
            case HttpMethod::Put:
            case HttpMethod::Delete:
            case HttpMethod::Options:
            case HttpMethod::Trace:
                return true;
            default:
                return false;
        }
    }

}  // namespace flowhttp
