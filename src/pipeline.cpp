#include "flowhttp/pipeline/pipeline.hpp"

#include <spdlog/spdlog.h>

namespace flowhttp {

    namespace asio = boost::asio;

    Pipeline::Pipeline(asio::any_io_executor strand,
                       std::shared_ptr<ConnectionPool> pool,
                       std::shared_ptr<MetricsDispatcher> metrics,
                       PipelineOptions opt)
        : strand_(std::move(strand)),
          pool_(std::move(pool)),
          metrics_(std::move(metrics)),
          opt_(std::move(opt)) {}

    asio::awaitable<Result<ResponseState>> Pipeline::execute(
        RequestDescriptor request, DecoderLimits limits,
        CancellationToken token) {
        invocations_.fetch_add(1, std::memory_order_relaxed);

        for (int attempt = 0;; ++attempt) {
            bool retryable = false;
            auto res = co_await attempt_(request, limits, token, retryable);
            if (res.has_value()) co_return std::move(res);

            const bool retry = retryable && attempt == 0 &&
                               is_idempotent(request.method) &&
                               request.replayable() && !token.cancelled();
            if (!retry) {
                if (metrics_) {
                    metrics_->error(request.endpoint(), request.uri.path(),
                                    res.error().code);
                }
                co_return std::move(res);
            }

            retries_.fetch_add(1, std::memory_order_relaxed);
            SPDLOG_DEBUG("Retrying {} {} on a fresh connection: {}",
                         to_string(request.method), request.uri.to_string(),
                         res.error().message);
        }
    }

    asio::awaitable<Result<ResponseState>> Pipeline::attempt_(
        const RequestDescriptor& request, const DecoderLimits& limits,
        const CancellationToken& token, bool& retryable) {
        using R = Result<ResponseState>;
        retryable = false;

        const auto started = detail::Exchange::clock_type::now();
        const auto timeout =
            opt_.acquire_timeout.count() > 0
                ? std::chrono::duration_cast<ConnectionPool::clock_type::duration>(
                      opt_.acquire_timeout)
                : ConnectionPool::clock_type::duration::max();

        auto lease = co_await pool_->acquire(request.endpoint(), timeout, token);
        if (lease.has_error()) co_return R::err(std::move(lease).error());

        auto exchange = std::make_shared<detail::Exchange>(
            strand_, std::move(lease).value(), request, limits, opt_, metrics_,
            started);
        exchange->start(token);

        auto st = co_await exchange->write_request();
        if (st.has_value()) st = co_await exchange->await_head();

        if (st.has_error()) {
            retryable = exchange->retryable();
            co_return R::err(std::move(st).error());
        }

        ResponseHead head = exchange->head();
        co_return R::ok(std::move(head), ResponseBody(exchange, strand_));
    }

}  // namespace flowhttp
