#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <utility>  // before awaitable.hpp: Boost 1.74 uses std::exchange without it
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <chrono>
#include <memory>
#include <optional>

#include "../cancellation.hpp"
#include "../endpoint.hpp"
#include "../metrics/metrics.hpp"
#include "../result.hpp"
#include "tls_negotiation.hpp"
#include "transport.hpp"

namespace flowhttp {

    /// @brief A freshly opened connection.
    struct EstablishedConnection {
        std::shared_ptr<Transport> transport;
        std::optional<SecureSessionInfo> session;  ///< Set for secure ones
    };

    /**
     * @brief Opens transport connections for the pool.
     *
     * Failures are reported as ConnectFailed (TLS handshake failures
     * included) or Timeout; the pool never retries. Cancelling `token`
     * interrupts whichever step is pending and yields Aborted.
     */
    class ConnectionFactory {
       public:
        virtual ~ConnectionFactory() = default;

        virtual boost::asio::awaitable<Result<EstablishedConnection>> connect(
            const Endpoint& ep, CancellationToken token) = 0;
    };

    struct ConnectorOptions {
        /// Bound for DNS + TCP connect + TLS handshake together.
        std::chrono::milliseconds connect_timeout{5000};
        /// Largest single read. Each read is further capped by the read
        /// budget of the attached sink.
        std::size_t read_buffer_size{16 * 1024};
        bool wiretap{false};
    };

    /// @brief Connector for SocketTransport over TCP and TLS.
    class TcpConnector : public ConnectionFactory {
       public:
        TcpConnector(boost::asio::any_io_executor ex,
                     std::shared_ptr<TlsNegotiator> tls,
                     ConnectorOptions opt,
                     std::shared_ptr<MetricsDispatcher> metrics);

        boost::asio::awaitable<Result<EstablishedConnection>> connect(
            const Endpoint& ep, CancellationToken token) override;

       private:
        boost::asio::any_io_executor ex_;
        std::shared_ptr<TlsNegotiator> tls_;
        ConnectorOptions opt_;
        std::shared_ptr<MetricsDispatcher> metrics_;
    };

}  // namespace flowhttp
