#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include "../config.hpp"
#include "../endpoint.hpp"
#include "../error.hpp"

namespace flowhttp {

    /**
     * @brief Side-channel observer of pool, pipeline and TLS events.
     *
     * Implementations may throw; the dispatcher logs and discards the
     * exception, so a recorder never changes the outcome of an exchange.
     * Callbacks run on the client strand.
     */
    class MetricsRecorder {
       public:
        virtual ~MetricsRecorder() = default;

        virtual void record_connection_established(
            const Endpoint& ep, std::chrono::nanoseconds connect_time) = 0;

        virtual void record_connection_closed(const Endpoint& ep) = 0;

        virtual void record_tls_handshake(const Endpoint& ep,
                                          std::chrono::nanoseconds duration,
                                          bool success) = 0;

        virtual void record_bytes_sent(const Endpoint& ep, std::string_view uri,
                                       std::uint64_t bytes) = 0;

        virtual void record_bytes_received(const Endpoint& ep,
                                           std::string_view uri,
                                           std::uint64_t bytes) = 0;

        virtual void record_request_complete(const Endpoint& ep,
                                             std::string_view uri,
                                             std::string_view method,
                                             int status,
                                             std::chrono::nanoseconds total) = 0;

        virtual void record_error(const Endpoint& ep, std::string_view uri,
                                  Error::Code code) = 0;
    };

    /// @brief Aggregates for one URI template.
    struct UriMetrics {
        std::uint64_t requests{0};
        std::uint64_t errors{0};
        std::uint64_t bytes_sent{0};
        std::uint64_t bytes_received{0};
        std::chrono::nanoseconds total_time{0};
        std::chrono::nanoseconds max_time{0};
    };

    /// @brief Immutable copy of the aggregates of an InMemoryMetricsRecorder.
    struct DataMetricsSnapshot {
        std::uint64_t connections_established{0};
        std::uint64_t connections_closed{0};
        std::uint64_t tls_handshakes{0};
        std::uint64_t tls_handshake_failures{0};
        std::chrono::nanoseconds tls_handshake_time{0};
        std::chrono::nanoseconds connect_time{0};
        std::uint64_t bytes_sent{0};
        std::uint64_t bytes_received{0};
        std::uint64_t requests_completed{0};
        std::uint64_t errors{0};
        std::map<Error::Code, std::uint64_t> errors_by_code;
        std::map<int, std::uint64_t> responses_by_status;
        std::map<std::string, UriMetrics> by_uri;
    };

    /// @brief Thread-safe recorder keeping counters and timers in memory.
    class InMemoryMetricsRecorder : public MetricsRecorder {
       public:
        void record_connection_established(
            const Endpoint& ep, std::chrono::nanoseconds connect_time) override;
        void record_connection_closed(const Endpoint& ep) override;
        void record_tls_handshake(const Endpoint& ep,
                                  std::chrono::nanoseconds duration,
                                  bool success) override;
        void record_bytes_sent(const Endpoint& ep, std::string_view uri,
                               std::uint64_t bytes) override;
        void record_bytes_received(const Endpoint& ep, std::string_view uri,
                                   std::uint64_t bytes) override;
        void record_request_complete(const Endpoint& ep, std::string_view uri,
                                     std::string_view method, int status,
                                     std::chrono::nanoseconds total) override;
        void record_error(const Endpoint& ep, std::string_view uri,
                          Error::Code code) override;

        DataMetricsSnapshot snapshot() const;

       private:
        mutable std::mutex mu_;
        DataMetricsSnapshot data_;
    };

    /// @brief Replaces all-digit path segments and the query with
    /// placeholders: "/users/42?x=1" becomes "/users/{id}".
    std::string numeric_segment_tagger(std::string_view path);

    /**
     * @brief Front of the metrics layer used by the engine.
     *
     * Applies the URI tagger, skips everything when disabled or when no
     * recorder is set, and isolates the engine from recorder exceptions.
     */
    class MetricsDispatcher {
       public:
        MetricsDispatcher() = default;
        MetricsDispatcher(std::shared_ptr<MetricsRecorder> recorder,
                          UriTagger tagger, bool enabled = true);

        bool enabled() const noexcept { return recorder_ != nullptr; }

        void connection_established(const Endpoint& ep,
                                    std::chrono::nanoseconds connect_time);
        void connection_closed(const Endpoint& ep);
        void tls_handshake(const Endpoint& ep,
                           std::chrono::nanoseconds duration, bool success);
        void bytes_sent(const Endpoint& ep, std::string_view path,
                        std::uint64_t bytes);
        void bytes_received(const Endpoint& ep, std::string_view path,
                            std::uint64_t bytes);
        void request_complete(const Endpoint& ep, std::string_view path,
                              std::string_view method, int status,
                              std::chrono::nanoseconds total);
        void error(const Endpoint& ep, std::string_view path, Error::Code code);

        /// @brief Number of recorder and tagger exceptions caught so far.
        std::uint64_t recorder_failures() const noexcept {
            return failures_.load(std::memory_order_relaxed);
        }

       private:
        template <typename F>
        void dispatch(const char* event, F&& f);

        std::string tag(std::string_view path) const;

        std::shared_ptr<MetricsRecorder> recorder_;
        UriTagger tagger_;
        mutable std::atomic<std::uint64_t> failures_{0};
    };

}  // namespace flowhttp
