#pragma once
#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "decoder_limits.hpp"

namespace flowhttp {

    class MetricsRecorder;
    class RequestInterceptor;
    class SecureSessionFactory;
    struct RequestDescriptor;
    class ResponseState;

    /** @brief Order in which idle connections of an endpoint are leased. */
    enum class LeasingStrategy {
        Lifo, /**< Most recently released first (default). */
        Fifo  /**< Least recently released first. */
    };

    /**
     * @brief Configuration for the connection pool.
     */
    struct PoolConfiguration {
        /** @brief Maximum total connections in the pool (open + opening). */
        std::size_t max_total_connections{64};

        /** @brief Maximum connections per endpoint (open + opening). */
        std::size_t max_connections_per_endpoint{8};

        /** @brief Idle connections older than this are destroyed. Zero
         * disables idle pruning. */
        std::chrono::milliseconds max_idle_time{30000};

        /** @brief Max lifetime of any single connection. Zero means no
         * limit. */
        std::chrono::milliseconds max_life_time{0};

        /** @brief Max exchanges per connection before forcing rotation. */
        std::size_t max_connection_reuse_count{1000};

        /** @brief Period of the background idle sweep. Zero disables the
         * sweep; pruning then only happens inside acquire. */
        std::chrono::milliseconds sweep_interval{5000};

        /** @brief Idle selection order. */
        LeasingStrategy leasing{LeasingStrategy::Lifo};

        /** @brief Whether to close idle connections on pool shutdown. */
        bool close_on_shutdown{true};
    };

    /**
     * @brief TLS settings used when negotiating secure sessions.
     */
    struct TlsConfiguration {
        /** @brief Whether to verify the peer certificate chain. */
        bool verify_peer{true};

        /** @brief Additional CA bundle (PEM). System paths are always
         * loaded. */
        std::optional<std::string> ca_file;

        /** @brief Whether to check the certificate against the host name. */
        bool verify_host_name{true};

        /** @brief Upper bound for the handshake itself. */
        std::chrono::milliseconds handshake_timeout{10000};

        /** @brief ALPN protocol identifiers offered, in preference order. */
        std::vector<std::string> alpn_protocols;

        /** @brief Security provider. The OpenSSL provider is used when
         * empty. */
        std::shared_ptr<SecureSessionFactory> session_factory;
    };

    /**
     * @brief Watermarks of the per-exchange backpressure buffer.
     */
    struct BridgeConfiguration {
        /** @brief Reads stop once this many bytes are buffered. */
        std::size_t high_water_mark{64 * 1024};

        /** @brief Reads resume when the buffer falls below this. */
        std::size_t low_water_mark{16 * 1024};
    };

    /// @brief Decides whether a response is followed as a redirect.
    using RedirectPredicate =
        std::function<bool(const RequestDescriptor&, const ResponseState&)>;

    /// @brief Amends each redirected request before it is issued.
    using RedirectRequestHook = std::function<void(RequestDescriptor&)>;

    /// @brief Maps a concrete request path to a low-cardinality template.
    using UriTagger = std::function<std::string(std::string_view)>;

    /**
     * @brief Configuration for the asynchronous client.
     */
    struct ClientConfiguration {
        /** @brief Optional base URL for relative request targets. */
        std::optional<std::string> base_url;

        /** @brief User-Agent string sent with each request. */
        std::string user_agent{"flowhttp/1.0"};

        /** @brief Default headers to include in every request. */
        std::map<std::string, std::string> default_headers;

        /** @brief Middleware interceptors for request manipulation. */
        std::vector<std::shared_ptr<const RequestInterceptor>> interceptors;

        /** @brief Maximum time to wait for a pooled connection. */
        std::chrono::milliseconds acquire_timeout{10000};

        /** @brief Timeout for TCP connect plus TLS handshake. */
        std::chrono::milliseconds connect_timeout{5000};

        /** @brief Total exchange deadline, from write until the body is
         * drained. Zero disables it. */
        std::chrono::milliseconds exchange_timeout{30000};

        /** @brief Framing limits attached to every request by default. */
        DecoderLimits decoder_limits{};

        PoolConfiguration pool{};
        TlsConfiguration tls{};
        BridgeConfiguration bridge{};

        /** @brief Master switch for redirect following. */
        bool follow_redirects{true};

        /** @brief Replaces the status based redirect rule when set. */
        RedirectPredicate redirect_predicate;

        /** @brief Optional hook applied to each redirected request. */
        RedirectRequestHook redirect_request_hook;

        /** @brief Maximum redirects followed for one exchange. */
        std::size_t max_redirects{10};

        /** @brief Redirect bodies up to this size are drained so the
         * connection can be reused; larger ones are cancelled. */
        std::size_t redirect_drain_limit{64 * 1024};

        /** @brief Advertise gzip/deflate and decode matching responses. */
        bool compress{false};

        /** @brief Trace every write and inbound chunk on the wire logger. */
        bool wiretap{false};

        /** @brief Whether events are reported to the metrics recorder. */
        bool metrics_enabled{false};

        std::shared_ptr<MetricsRecorder> metrics_recorder;

        /** @brief Applied to request paths before recording. */
        UriTagger uri_tagger;
    };
}  // namespace flowhttp
