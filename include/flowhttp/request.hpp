#pragma once
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/fields.hpp>
#include <memory>
#include <optional>
#include <string>

#include "body_producer.hpp"
#include "decoder_limits.hpp"
#include "http_method.hpp"
#include "url.hpp"

namespace flowhttp {

    /// @brief Ordered, case-insensitive header multimap; duplicates keep
    /// their insertion order.
    using Headers = boost::beast::http::fields;

    /// @brief Request as submitted by the caller.
    struct Request {
        HttpMethod method{HttpMethod::Get};
        /// Absolute URL, or a target relative to the client's base_url.
        std::string url;
        Headers headers;
        /// Absent for body-less requests.
        std::shared_ptr<BodyProducer> body;
        /// Per-request override of the client's decoder limits.
        std::optional<DecoderLimits> limits;
        bool keep_alive{true};
    };

    /**
     * @brief Fully resolved request handed to the pipeline.
     *
     * Redirect decisions derive new descriptors from it and never mutate it.
     * Copies share the body producer.
     */
    struct RequestDescriptor {
        HttpMethod method{HttpMethod::Get};
        UrlComponents uri;
        Headers headers;
        std::shared_ptr<BodyProducer> body;
        /// The caller supplied Content-Length; chunked framing is disabled.
        bool explicit_content_length{false};
        bool keep_alive{true};

        Endpoint endpoint() const { return uri.endpoint(); }

        /// @brief The request may be replayed on a fresh connection.
        bool replayable() const noexcept {
            return !body || body->restartable();
        }
    };

    /// @brief Build a descriptor from a caller request and its resolved URL.
    inline RequestDescriptor make_descriptor(Request req, UrlComponents url) {
        RequestDescriptor d;
        d.method = req.method;
        d.uri = std::move(url);
        d.explicit_content_length =
            req.headers.find(boost::beast::http::field::content_length) !=
            req.headers.end();
        d.headers = std::move(req.headers);
        d.body = std::move(req.body);
        d.keep_alive = req.keep_alive;
        return d;
    }

}  // namespace flowhttp
