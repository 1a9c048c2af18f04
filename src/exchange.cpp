#include "flowhttp/pipeline/exchange.hpp"

#include <spdlog/spdlog.h>

#include <boost/asio/dispatch.hpp>

namespace flowhttp::detail {

    namespace asio = boost::asio;

    Exchange::Exchange(asio::any_io_executor strand,
                       ConnectionPool::Lease lease, RequestDescriptor request,
                       DecoderLimits limits, const PipelineOptions& opt,
                       std::shared_ptr<MetricsDispatcher> metrics,
                       clock_type::time_point started)
        : strand_(std::move(strand)),
          request_(std::move(request)),
          opt_(opt),
          metrics_(std::move(metrics)),
          started_(started),
          lease_(std::move(lease)),
          transport_(lease_ ? lease_->transport() : nullptr),
          decoder_(limits, request_.method == HttpMethod::Head),
          watchdog_(strand_) {}

    Exchange::~Exchange() {
        pulling_ = false;
        finalize_(false);
    }

    void Exchange::start(const CancellationToken& token) {
        if (!transport_) {
            abort_(Error{Error::Code::Shutdown, "Pool is shutting down"},
                   false);
            return;
        }

        bridge_ =
            std::make_unique<BackpressureBridge>(strand_, transport_, opt_.bridge);

        std::weak_ptr<Exchange> weak = weak_from_this();

        if (opt_.exchange_timeout.count() > 0) {
            watchdog_.expires_after(opt_.exchange_timeout);
            watchdog_.async_wait([weak](boost::system::error_code ec) {
                if (ec) return;
                if (auto self = weak.lock()) {
                    SPDLOG_DEBUG("Exchange deadline hit for {}",
                                 self->request_.uri.to_string());
                    self->abort_(Error{Error::Code::Timeout,
                                       "Exchange deadline exceeded"},
                                 false);
                }
            });
        }

        if (token.can_be_cancelled()) {
            cancel_reg_ = token.on_cancel([weak, strand = strand_] {
                asio::dispatch(strand, [weak] {
                    if (auto self = weak.lock()) self->cancel();
                });
            });
        }
    }

    asio::awaitable<Status> Exchange::write_request() {
        auto self = shared_from_this();
        if (failure_) co_return Status::err(*failure_);

        stage_ = ExchangeStage::Writing;
        auto wr = co_await flowhttp::write_request(*transport_, request_,
                                                   opt_.writer);
        sent_ = wr.bytes;

        // Deadline or cancellation while writing.
        if (failure_) co_return Status::err(*failure_);

        if (wr.status.has_error()) {
            abort_(wr.status.error(), wr.transport_error && !received_any_);
            co_return Status::err(*failure_);
        }

        stage_ = ExchangeStage::AwaitingHeaders;
        co_return Status::ok();
    }

    asio::awaitable<Status> Exchange::await_head() {
        auto self = shared_from_this();
        std::string raw;

        while (!decoder_.header_done()) {
            if (failure_) co_return Status::err(*failure_);

            auto batch = co_await pull_();
            if (batch.has_error()) {
                abort_(batch.error(), !received_any_);
                co_return Status::err(*failure_);
            }

            auto st = feed_(batch.value(), raw);
            if (st.has_error()) {
                abort_(st.error(), false);
                co_return Status::err(*failure_);
            }

            if (batch.value().end_of_stream && !decoder_.header_done()) {
                auto fin = decoder_.finish(raw);
                abort_(fin.has_error()
                           ? fin.error()
                           : Error{Error::Code::Aborted,
                                   "Connection closed before the response "
                                   "head"},
                       !received_any_);
                co_return Status::err(*failure_);
            }
        }

        stage_ = ExchangeStage::StreamingBody;
        phase_.store(ResponsePhase::HeadersReceived, std::memory_order_release);
        SPDLOG_DEBUG("{} {} -> {}", to_string(request_.method),
                     request_.uri.to_string(), decoder_.head().status);

        setup_content_decoder_();
        auto st = decode_content_(raw);
        if (st.has_error()) {
            abort_(st.error(), false);
            co_return Status::err(*failure_);
        }

        if (decoder_.done()) complete_();
        if (failure_) co_return Status::err(*failure_);
        co_return Status::ok();
    }

    asio::awaitable<Result<std::optional<std::string>>> Exchange::read_chunk() {
        using R = Result<std::optional<std::string>>;
        auto self = shared_from_this();

        for (;;) {
            if (!pending_.empty()) {
                std::string out;
                out.swap(pending_);
                if (stage_ == ExchangeStage::Complete) {
                    phase_.store(ResponsePhase::Complete,
                                 std::memory_order_release);
                }
                co_return R::ok(std::move(out));
            }
            if (stage_ == ExchangeStage::Complete) {
                phase_.store(ResponsePhase::Complete, std::memory_order_release);
                co_return R::ok(std::nullopt);
            }
            if (failure_) co_return R::err(*failure_);

            phase_.store(ResponsePhase::BodyStreaming, std::memory_order_release);

            auto batch = co_await pull_();
            if (batch.has_error()) {
                abort_(batch.error(), false);
                co_return R::err(*failure_);
            }

            const bool eos = batch.value().end_of_stream;
            std::string raw;
            auto st = feed_(batch.value(), raw);
            if (st.has_value() && eos && !decoder_.done()) {
                // Close-delimited bodies end here; anything else is cut
                // short.
                st = decoder_.finish(raw);
            }
            if (st.has_error()) {
                abort_(st.error(), false);
                co_return R::err(*failure_);
            }

            st = decode_content_(raw);
            if (st.has_error()) {
                abort_(st.error(), false);
                co_return R::err(*failure_);
            }

            if (decoder_.done()) {
                complete_();
            } else if (eos) {
                abort_(Error{Error::Code::Aborted,
                             "Connection closed in the middle of a response"},
                       false);
            }
        }
    }

    void Exchange::cancel() {
        if (stage_ == ExchangeStage::Complete) {
            pending_.clear();
            phase_.store(ResponsePhase::Complete, std::memory_order_release);
            return;
        }
        if (failure_) return;
        if (bridge_) bridge_->cancel();
        abort_(Error{Error::Code::Aborted, "Exchange cancelled"}, false);
    }

    ResponseHead Exchange::head() const {
        ResponseHead h = decoder_.head();
        if (content_ && content_->encoding() != ContentEncoding::Identity) {
            h.headers.erase(http::field::content_encoding);
            h.headers.erase(http::field::content_length);
        }
        return h;
    }

    asio::awaitable<Result<BridgeBatch>> Exchange::pull_() {
        pulling_ = true;
        auto batch = co_await bridge_->request(1);
        pulling_ = false;

        if (finalize_deferred_) {
            finalize_deferred_ = false;
            finalize_(false);
        }
        co_return batch;
    }

    Status Exchange::feed_(const BridgeBatch& batch, std::string& body_out) {
        for (auto const& chunk : batch.chunks) {
            if (chunk.empty()) continue;
            received_any_ = true;
            auto st = decoder_.feed(chunk, body_out);
            if (st.has_error()) return st;
        }
        return Status::ok();
    }

    void Exchange::setup_content_decoder_() {
        if (!opt_.writer.compress) return;

        auto const& headers = decoder_.head().headers;
        auto it = headers.find(http::field::content_encoding);
        if (it == headers.end()) return;

        const auto value = it->value();
        auto enc = parse_content_encoding(
            std::string_view(value.data(), value.size()));
        if (!enc) {
            SPDLOG_DEBUG("Leaving unsupported content coding '{}' as is",
                         std::string(value.data(), value.size()));
            return;
        }
        if (*enc != ContentEncoding::Identity) {
            content_ = std::make_unique<ContentDecoder>(*enc);
        }
    }

    Status Exchange::decode_content_(std::string& raw) {
        if (raw.empty()) return Status::ok();
        if (!content_) {
            if (pending_.empty()) {
                pending_.swap(raw);
            } else {
                pending_ += raw;
            }
            return Status::ok();
        }
        return content_->decode(raw, pending_);
    }

    void Exchange::complete_() {
        if (finalized_) return;

        if (content_) {
            auto st = content_->finish();
            if (st.has_error()) {
                abort_(st.error(), false);
                return;
            }
        }

        const int status = decoder_.head().status;
        const bool reusable =
            bridge_ && bridge_->reusable() && bridge_->buffered_bytes() == 0 &&
            decoder_.leftover() == 0 && decoder_.keep_alive() &&
            request_.keep_alive && !decoder_.upgrade() && status != 101;

        stage_ = ExchangeStage::Complete;
        if (pending_.empty()) {
            phase_.store(ResponsePhase::Complete, std::memory_order_release);
        }

        if (metrics_) {
            metrics_->request_complete(
                request_.endpoint(), request_.uri.path(),
                to_string(request_.method), status,
                std::chrono::duration_cast<std::chrono::nanoseconds>(
                    clock_type::now() - started_));
        }
        SPDLOG_DEBUG("{} {} complete, connection {}",
                     to_string(request_.method), request_.uri.to_string(),
                     reusable ? "reusable" : "closed");

        finalize_(reusable);
    }

    void Exchange::abort_(Error error, bool retryable) {
        if (failure_ || stage_ == ExchangeStage::Complete) return;

        const bool head_delivered = stage_ == ExchangeStage::StreamingBody;
        failure_ = std::move(error);
        retryable_ = retryable;
        stage_ = ExchangeStage::Aborted;
        phase_.store(ResponsePhase::Aborted, std::memory_order_release);
        pending_.clear();

        if (bridge_) bridge_->fail(*failure_);

        // Failures before the head reach the pipeline, which records them.
        if (head_delivered && metrics_) {
            metrics_->error(request_.endpoint(), request_.uri.path(),
                            failure_->code);
        }
        SPDLOG_DEBUG("{} {} aborted: {}", to_string(request_.method),
                     request_.uri.to_string(), failure_->message);

        finalize_(false);
    }

    void Exchange::finalize_(bool reusable) {
        if (finalized_) return;

        if (pulling_) {
            // The bridge is still awaited; close now, tear down once the
            // pending request returns.
            finalize_deferred_ = true;
            if (transport_) transport_->close();
            return;
        }
        finalized_ = true;

        watchdog_.cancel();
        cancel_reg_.reset();
        record_traffic_();

        bridge_.reset();
        if (!reusable && transport_) transport_->close();

        released_reusable_ = reusable;
        lease_.release(reusable);
    }

    void Exchange::record_traffic_() {
        if (!metrics_) return;
        const auto ep = request_.endpoint();
        const auto path = request_.uri.path();
        if (sent_) metrics_->bytes_sent(ep, path, sent_);
        if (bridge_ && bridge_->bytes_received()) {
            metrics_->bytes_received(ep, path, bridge_->bytes_received());
        }
    }

}  // namespace flowhttp::detail
