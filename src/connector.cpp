#include "flowhttp/transport/connector.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/error.hpp>

#include "flowhttp/transport/socket_transport.hpp"

namespace flowhttp {

    namespace asio = boost::asio;
    using clock_type = std::chrono::steady_clock;

    namespace {
        /// Steps of one connect that a cancellation interrupts.
        struct ConnectAttempt {
            explicit ConnectAttempt(asio::any_io_executor ex) : resolver(ex) {}

            void interrupt() {
                resolver.cancel();
                if (transport) transport->lowest_layer().cancel();
            }

            asio::ip::tcp::resolver resolver;
            std::shared_ptr<SocketTransport> transport;
        };

        Result<EstablishedConnection> cancelled_connect(const Endpoint& ep) {
            SPDLOG_DEBUG("Connect to {} cancelled", ep.to_string());
            return Result<EstablishedConnection>::err(
                Error::Code::Aborted, "Connect to " + ep.to_string() +
                                          " cancelled");
        }
    }  // namespace

    TcpConnector::TcpConnector(asio::any_io_executor ex,
                               std::shared_ptr<TlsNegotiator> tls,
                               ConnectorOptions opt,
                               std::shared_ptr<MetricsDispatcher> metrics)
        : ex_(std::move(ex)),
          tls_(std::move(tls)),
          opt_(opt),
          metrics_(std::move(metrics)) {}

    asio::awaitable<Result<EstablishedConnection>> TcpConnector::connect(
        const Endpoint& ep, CancellationToken token) {
        using R = Result<EstablishedConnection>;
        const auto started = clock_type::now();
        const auto deadline = started + opt_.connect_timeout;

        if (token.cancelled()) co_return cancelled_connect(ep);

        auto attempt = std::make_shared<ConnectAttempt>(ex_);
        // Cancellation may come from any thread; the attempt lives on ex_.
        std::weak_ptr<ConnectAttempt> weak_attempt = attempt;
        auto registration = token.on_cancel([ex = ex_, weak_attempt] {
            asio::dispatch(ex, [weak_attempt] {
                if (auto a = weak_attempt.lock()) a->interrupt();
            });
        });

        boost::system::error_code ec;
        auto results = co_await attempt->resolver.async_resolve(
            ep.host(), ep.port(), asio::redirect_error(asio::use_awaitable, ec));
        if (token.cancelled()) co_return cancelled_connect(ep);
        if (ec) {
            SPDLOG_WARN("Resolve {} failed: {}", ep.to_string(), ec.message());
            co_return R::err(Error::Code::ConnectFailed,
                             "Failed to resolve " + ep.host() + ": " +
                                 ec.message());
        }

        auto transport = std::make_shared<SocketTransport>(
            ex_, ep, opt_.read_buffer_size, opt_.wiretap);
        attempt->transport = transport;

        SocketTransport::HttpsStream* secure_stream = nullptr;
        if (ep.secure()) {
            if (!tls_) {
                co_return R::err(Error::Code::ConnectFailed,
                                 "No TLS provider configured for " +
                                     ep.to_string());
            }
            secure_stream =
                &transport->emplace_secure(tls_->factory().context());
        } else {
            transport->emplace_plain();
        }

        auto& tcp_layer = transport->lowest_layer();
        tcp_layer.expires_at(deadline);
        co_await tcp_layer.async_connect(
            results, asio::redirect_error(asio::use_awaitable, ec));
        tcp_layer.expires_never();

        if (token.cancelled()) {
            transport->close();
            co_return cancelled_connect(ep);
        }
        if (ec == boost::beast::error::timeout) {
            SPDLOG_WARN("Connect to {} timed out", ep.to_string());
            co_return R::err(Error::Code::Timeout,
                             "Connect to " + ep.to_string() + " timed out");
        }
        if (ec) {
            SPDLOG_WARN("Connect to {} failed: {}", ep.to_string(),
                        ec.message());
            co_return R::err(Error::Code::ConnectFailed,
                             "Connect to " + ep.to_string() +
                                 " failed: " + ec.message());
        }

        EstablishedConnection out;

        if (secure_stream) {
            const auto hs_started = clock_type::now();
            const auto remaining =
                std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - hs_started);
            const auto budget = std::max(
                std::chrono::milliseconds(1),
                std::min(remaining, tls_->config().handshake_timeout));

            auto hs = co_await tls_->negotiate(*secure_stream, ep, budget);

            if (metrics_) {
                metrics_->tls_handshake(ep, clock_type::now() - hs_started,
                                        hs.has_value());
            }
            if (token.cancelled()) {
                transport->close();
                co_return cancelled_connect(ep);
            }
            if (hs.has_error()) {
                transport->close();
                co_return R::err(hs.error());
            }
            out.session = std::move(hs.value());
        }

        transport->start();
        if (metrics_) {
            metrics_->connection_established(ep, clock_type::now() - started);
        }
        SPDLOG_DEBUG("Connected to {}", ep.to_string());

        out.transport = std::move(transport);
        co_return R::ok(std::move(out));
    }

}  // namespace flowhttp
