#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <utility>  // before awaitable.hpp: Boost 1.74 uses std::exchange without it
#include <boost/asio/awaitable.hpp>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "cancellation.hpp"
#include "config.hpp"
#include "connection/connection_pool.hpp"
#include "metrics/metrics.hpp"
#include "pipeline/pipeline.hpp"
#include "redirect_policy.hpp"
#include "request.hpp"
#include "response.hpp"
#include "result.hpp"
#include "transport/connector.hpp"
#include "url.hpp"

namespace flowhttp {

    /**
     * @brief An asynchronous HTTP/1.1 client using C++20 coroutines.
     *
     * All exchanges, transports and pool timers of one client run on a
     * strand of the executor given at construction, so send() may be awaited
     * from any coroutine. Redirects are followed according to the configured
     * policy; each hop is a fresh pipeline invocation.
     */
    class Client {
       public:
        /**
         * @brief Constructs a Client.
         * @param ex The executor to use for asynchronous operations.
         * @param cfg The configuration for the client and its internal
         * connection pool.
         * @throws std::invalid_argument when the configuration is invalid
         */
        Client(boost::asio::any_io_executor ex, ClientConfiguration cfg);

        /// @brief Constructs a Client that opens connections through
        /// `connector` instead of TCP/TLS.
        Client(boost::asio::any_io_executor ex, ClientConfiguration cfg,
               std::shared_ptr<ConnectionFactory> connector);

        Client(const Client&) = delete;
        Client& operator=(const Client&) = delete;

        /// @brief Shuts the pool down on the client strand. May run on any
        /// thread; the pool lives until that handler has run, so the
        /// executor must keep running (or be destroyed) afterwards.
        ~Client();

        /**
         * @brief Sends a request asynchronously.
         * @param request The request object.
         * @param token Cancels the exchange at any stage.
         * @return The final response once its head arrived, or an Error.
         */
        boost::asio::awaitable<Result<ResponseState>> send(
            Request request, CancellationToken token = {});

        boost::asio::awaitable<Result<ResponseState>> get(std::string url);
        boost::asio::awaitable<Result<ResponseState>> head(std::string url);
        boost::asio::awaitable<Result<ResponseState>> del(std::string url);
        boost::asio::awaitable<Result<ResponseState>> options(std::string url);

        boost::asio::awaitable<Result<ResponseState>> post(std::string url,
                                                           std::string body);
        boost::asio::awaitable<Result<ResponseState>> put(std::string url,
                                                          std::string body);
        boost::asio::awaitable<Result<ResponseState>> patch(std::string url,
                                                            std::string body);

        /// @brief Stop the pool on the client strand: waiters fail with
        /// Shutdown, idle connections close. In-flight exchanges finish on
        /// their own.
        void shutdown();

        PoolMetricsSnapshot pool_snapshot() const { return pool_->snapshot(); }

        [[nodiscard]] ClientConfiguration const& config() const noexcept {
            return cfg_;
        }

        ConnectionPool& pool() noexcept { return *pool_; }
        const Pipeline& pipeline() const noexcept { return *pipeline_; }

        boost::asio::any_io_executor strand() const { return strand_; }

       private:
        void validate_config_();

        Result<UrlComponents> resolve_request_url(std::string_view url) const;

        boost::asio::awaitable<Result<ResponseState>> send_on_strand_(
            Request request, CancellationToken token);

        boost::asio::awaitable<Result<ResponseState>> simple_(
            HttpMethod method, std::string url,
            std::optional<std::string> body);

        ClientConfiguration cfg_;
        std::optional<UrlComponents> base_url_;

        boost::asio::any_io_executor strand_;

        std::shared_ptr<MetricsDispatcher> metrics_;
        std::shared_ptr<ConnectionFactory> connector_;
        std::shared_ptr<ConnectionPool> pool_;
        std::unique_ptr<Pipeline> pipeline_;
        std::shared_ptr<const RedirectPolicy> redirect_policy_;
    };

}  // namespace flowhttp
