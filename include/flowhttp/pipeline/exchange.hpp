#pragma once

#include <atomic>
#include <boost/asio/any_io_executor.hpp>
#include <utility>  // before awaitable.hpp: Boost 1.74 uses std::exchange without it
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "../cancellation.hpp"
#include "../connection/connection_pool.hpp"
#include "../decoder_limits.hpp"
#include "../metrics/metrics.hpp"
#include "../request.hpp"
#include "../response.hpp"
#include "../result.hpp"
#include "backpressure_bridge.hpp"
#include "content_decoder.hpp"
#include "request_writer.hpp"
#include "response_decoder.hpp"

namespace flowhttp {

    /// @brief Per-invocation settings of the pipeline.
    struct PipelineOptions {
        std::chrono::milliseconds acquire_timeout{10000};
        /// Zero disables the exchange deadline.
        std::chrono::milliseconds exchange_timeout{30000};
        BridgeConfiguration bridge{};
        RequestWriterOptions writer{};
    };

    namespace detail {

        /// @brief Where an exchange is in its state machine.
        enum class ExchangeStage {
            Writing,
            AwaitingHeaders,
            StreamingBody,
            Complete,
            Aborted
        };

        /**
         * @brief One request/response on one leased connection.
         *
         * Owns the lease, the backpressure bridge and the decoders. It
         * finishes exactly once: Complete releases the connection (reusable
         * only after a clean, fully framed keep-alive message), anything
         * else closes it. Confined to the client strand; cancel() must be
         * dispatched there.
         */
        class Exchange : public std::enable_shared_from_this<Exchange> {
           public:
            using clock_type = std::chrono::steady_clock;

            Exchange(boost::asio::any_io_executor strand,
                     ConnectionPool::Lease lease, RequestDescriptor request,
                     DecoderLimits limits, const PipelineOptions& opt,
                     std::shared_ptr<MetricsDispatcher> metrics,
                     clock_type::time_point started);

            Exchange(const Exchange&) = delete;
            Exchange& operator=(const Exchange&) = delete;

            ~Exchange();

            /// @brief Attach the bridge, arm the deadline and hook the
            /// cancellation token. Call once, right after construction.
            void start(const CancellationToken& token);

            boost::asio::awaitable<Status> write_request();

            /// @brief Read until the final response head is decoded.
            boost::asio::awaitable<Status> await_head();

            /// @brief Next decoded body chunk, nullopt when complete.
            boost::asio::awaitable<Result<std::optional<std::string>>>
            read_chunk();

            /// @brief Abort with Aborted; the connection is not reused.
            void cancel();

            /// @brief Failed before any response byte because the peer
            /// closed or broke the connection.
            bool retryable() const noexcept { return retryable_; }

            ExchangeStage stage() const noexcept { return stage_; }

            ResponsePhase phase() const noexcept {
                return phase_.load(std::memory_order_acquire);
            }

            /// @brief Final head, with content coding headers dropped when
            /// the body is decoded here.
            ResponseHead head() const;

            /// @brief The connection was handed back to the pool as
            /// reusable.
            bool released_reusable() const noexcept {
                return released_reusable_;
            }

           private:
            boost::asio::awaitable<Result<BridgeBatch>> pull_();
            Status feed_(const BridgeBatch& batch, std::string& body_out);
            Status decode_content_(std::string& body);
            void setup_content_decoder_();
            void complete_();
            void abort_(Error error, bool retryable);
            void finalize_(bool reusable);
            void record_traffic_();

            boost::asio::any_io_executor strand_;
            RequestDescriptor request_;
            PipelineOptions opt_;
            std::shared_ptr<MetricsDispatcher> metrics_;
            clock_type::time_point started_;

            // Destruction order matters: the bridge detaches from the
            // transport before the lease hands the connection back.
            ConnectionPool::Lease lease_;
            std::shared_ptr<Transport> transport_;
            std::unique_ptr<BackpressureBridge> bridge_;
            ResponseDecoder decoder_;
            std::unique_ptr<ContentDecoder> content_;
            boost::asio::steady_timer watchdog_;
            CancellationRegistration cancel_reg_;

            std::string pending_;  ///< Decoded body not yet handed out.
            ExchangeStage stage_{ExchangeStage::Writing};
            std::atomic<ResponsePhase> phase_{ResponsePhase::Pending};
            std::optional<Error> failure_;

            bool retryable_{false};
            bool received_any_{false};  ///< Any response byte observed.
            bool pulling_{false};
            bool finalize_deferred_{false};
            bool finalized_{false};
            bool released_reusable_{false};
            std::uint64_t sent_{0};
        };

    }  // namespace detail

}  // namespace flowhttp
