#pragma once

#include <atomic>
#include <boost/asio/any_io_executor.hpp>
#include <utility>  // before awaitable.hpp: Boost 1.74 uses std::exchange without it
#include <boost/asio/awaitable.hpp>
#include <cstdint>
#include <memory>

#include "../cancellation.hpp"
#include "../connection/connection_pool.hpp"
#include "../decoder_limits.hpp"
#include "../metrics/metrics.hpp"
#include "../request.hpp"
#include "../response.hpp"
#include "../result.hpp"
#include "exchange.hpp"

namespace flowhttp {

    /**
     * @brief Runs one logical exchange: acquire, write, await the response
     * head, and hand the body stream to the caller.
     *
     * A request that fails before any response byte because the peer closed
     * the connection is re-issued once on a fresh connection when its method
     * is idempotent and its body can be replayed. Must be driven on the
     * strand given at construction.
     */
    class Pipeline {
       public:
        Pipeline(boost::asio::any_io_executor strand,
                 std::shared_ptr<ConnectionPool> pool,
                 std::shared_ptr<MetricsDispatcher> metrics,
                 PipelineOptions opt);

        boost::asio::awaitable<Result<ResponseState>> execute(
            RequestDescriptor request, DecoderLimits limits,
            CancellationToken token = {});

        /// @brief Number of execute() calls so far. Transparent retries do
        /// not count.
        std::uint64_t invocations() const noexcept {
            return invocations_.load(std::memory_order_relaxed);
        }

        std::uint64_t retries() const noexcept {
            return retries_.load(std::memory_order_relaxed);
        }

        const PipelineOptions& options() const noexcept { return opt_; }

       private:
        boost::asio::awaitable<Result<ResponseState>> attempt_(
            const RequestDescriptor& request, const DecoderLimits& limits,
            const CancellationToken& token, bool& retryable);

        boost::asio::any_io_executor strand_;
        std::shared_ptr<ConnectionPool> pool_;
        std::shared_ptr<MetricsDispatcher> metrics_;
        PipelineOptions opt_;

        std::atomic<std::uint64_t> invocations_{0};
        std::atomic<std::uint64_t> retries_{0};
    };

}  // namespace flowhttp
