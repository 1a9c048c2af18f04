#pragma once

#include <utility>  // before awaitable.hpp: Boost 1.74 uses std::exchange without it
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "../config.hpp"
#include "../endpoint.hpp"
#include "../result.hpp"

namespace flowhttp {

    /// @brief Parameters negotiated for one secure connection.
    struct SecureSessionInfo {
        std::string provider;  ///< Security provider that built the session
        std::string protocol;  ///< e.g. "TLSv1.3"
        std::string cipher;    ///< e.g. "TLS_AES_256_GCM_SHA384"
        std::string alpn;      ///< Selected ALPN protocol, empty if none
    };

    /**
     * @brief Security provider: owns the context new sessions are created
     * from.
     *
     * Selected once per client (TlsConfiguration::session_factory, or the
     * OpenSSL provider by default).
     */
    class SecureSessionFactory {
       public:
        virtual ~SecureSessionFactory() = default;

        /// @brief Short provider name reported in SecureSessionInfo.
        virtual std::string_view provider() const noexcept = 0;

        virtual boost::asio::ssl::context& context() = 0;
    };

    /// @brief Default provider backed by OpenSSL through Boost.Asio SSL.
    class OpenSslSessionFactory : public SecureSessionFactory {
       public:
        /// @throws std::invalid_argument when the CA file cannot be loaded or
        /// an ALPN identifier is invalid.
        explicit OpenSslSessionFactory(const TlsConfiguration& cfg);

        std::string_view provider() const noexcept override {
            return "openssl";
        }

        boost::asio::ssl::context& context() override { return ctx_; }

       private:
        boost::asio::ssl::context ctx_;
    };

    /// @brief Pick the security provider for a configuration.
    std::shared_ptr<SecureSessionFactory> select_session_factory(
        const TlsConfiguration& cfg);

    /// @brief ALPN protocol list in wire format (length-prefixed).
    /// @throws std::invalid_argument for empty or over-long identifiers.
    std::string encode_alpn_protocols(const std::vector<std::string>& protos);

    /// @brief Load system default CA certificates and require peer
    /// verification.
    void init_tls_on_ssl_context(boost::asio::ssl::context& ssl_context);

    /// @brief Set the SNI host name on a client stream.
    bool set_sni(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream,
                 const std::string& host, boost::system::error_code& ec);

    /**
     * @brief Builds secure sessions on connected TCP streams.
     *
     * Performs SNI, host name verification and the client handshake with a
     * timeout; a failed handshake is ConnectFailed, an expired one Timeout.
     */
    class TlsNegotiator {
       public:
        explicit TlsNegotiator(TlsConfiguration cfg);

        SecureSessionFactory& factory() noexcept { return *factory_; }
        const TlsConfiguration& config() const noexcept { return cfg_; }

        boost::asio::awaitable<Result<SecureSessionInfo>> negotiate(
            boost::beast::ssl_stream<boost::beast::tcp_stream>& stream,
            const Endpoint& ep, std::chrono::milliseconds timeout);

       private:
        TlsConfiguration cfg_;
        std::shared_ptr<SecureSessionFactory> factory_;
    };

}  // namespace flowhttp
