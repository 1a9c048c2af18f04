#include "flowhttp/transport/tls_negotiation.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/system/system_error.hpp>
#include <stdexcept>

namespace flowhttp {

    namespace asio = boost::asio;

    void init_tls_on_ssl_context(asio::ssl::context& ssl_context) {
        // Load system default CA certificates
        try {
            ssl_context.set_default_verify_paths();
        } catch (const boost::system::system_error& e) {
            throw std::runtime_error(
                std::string("Failed to set default verify paths: ") + e.what());
        }

        ssl_context.set_verify_mode(asio::ssl::verify_peer);
    }

    bool set_sni(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream,
                 const std::string& host, boost::system::error_code& ec) {
        if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
            ec = boost::system::error_code(
                static_cast<int>(::ERR_get_error()),
                asio::error::get_ssl_category());
            return false;
        }
        return true;
    }

    std::string encode_alpn_protocols(const std::vector<std::string>& protos) {
        std::string wire;
        for (const auto& p : protos) {
            if (p.empty() || p.size() > 255) {
                throw std::invalid_argument("Invalid ALPN protocol id: '" + p +
                                            "'");
            }
            wire.push_back(static_cast<char>(p.size()));
            wire.append(p);
        }
        return wire;
    }

    OpenSslSessionFactory::OpenSslSessionFactory(const TlsConfiguration& cfg)
        : ctx_(asio::ssl::context::tls_client) {
        init_tls_on_ssl_context(ctx_);

        ctx_.set_verify_mode(cfg.verify_peer ? asio::ssl::verify_peer
                                             : asio::ssl::verify_none);

        if (cfg.ca_file) {
            boost::system::error_code ec;
            ctx_.load_verify_file(*cfg.ca_file, ec);
            if (ec) {
                throw std::invalid_argument("Cannot load CA file '" +
                                            *cfg.ca_file +
                                            "': " + ec.message());
            }
        }

        if (!cfg.alpn_protocols.empty()) {
            const auto wire = encode_alpn_protocols(cfg.alpn_protocols);
            // Returns 0 on success, unlike most of OpenSSL.
            if (SSL_CTX_set_alpn_protos(
                    ctx_.native_handle(),
                    reinterpret_cast<const unsigned char*>(wire.data()),
                    static_cast<unsigned int>(wire.size())) != 0) {
                throw std::invalid_argument("Failed to set ALPN protocols");
            }
        }
    }

    std::shared_ptr<SecureSessionFactory> select_session_factory(
        const TlsConfiguration& cfg) {
        if (cfg.session_factory) return cfg.session_factory;
        return std::make_shared<OpenSslSessionFactory>(cfg);
    }

    TlsNegotiator::TlsNegotiator(TlsConfiguration cfg)
        : cfg_(std::move(cfg)), factory_(select_session_factory(cfg_)) {}

    asio::awaitable<Result<SecureSessionInfo>> TlsNegotiator::negotiate(
        boost::beast::ssl_stream<boost::beast::tcp_stream>& stream,
        const Endpoint& ep, std::chrono::milliseconds timeout) {
        boost::system::error_code ec;

        if (!set_sni(stream, ep.host(), ec)) {
            co_return Result<SecureSessionInfo>::err(
                Error::Code::ConnectFailed,
                "Failed to set SNI for " + ep.host() + ": " + ec.message());
        }

        if (cfg_.verify_peer && cfg_.verify_host_name) {
            stream.set_verify_callback(
                asio::ssl::host_name_verification(ep.host()));
        }

        auto& tcp = boost::beast::get_lowest_layer(stream);
        tcp.expires_after(timeout);
        co_await stream.async_handshake(
            asio::ssl::stream_base::client,
            asio::redirect_error(asio::use_awaitable, ec));
        tcp.expires_never();

        if (ec == boost::beast::error::timeout) {
            co_return Result<SecureSessionInfo>::err(
                Error::Code::Timeout,
                "TLS handshake with " + ep.to_string() + " timed out");
        }
        if (ec) {
            SPDLOG_WARN("TLS handshake with {} failed: {}", ep.to_string(),
                        ec.message());
            co_return Result<SecureSessionInfo>::err(
                Error::Code::ConnectFailed,
                "TLS handshake with " + ep.to_string() +
                    " failed: " + ec.message());
        }

        SecureSessionInfo info;
        info.provider = std::string(factory_->provider());
        SSL* ssl = stream.native_handle();
        if (const char* v = SSL_get_version(ssl)) info.protocol = v;
        if (const char* c = SSL_get_cipher_name(ssl)) info.cipher = c;

        const unsigned char* alpn = nullptr;
        unsigned int alpn_len = 0;
        SSL_get0_alpn_selected(ssl, &alpn, &alpn_len);
        if (alpn && alpn_len) {
            info.alpn.assign(reinterpret_cast<const char*>(alpn), alpn_len);
        }

        SPDLOG_DEBUG("TLS session with {}: {} {} alpn='{}'", ep.to_string(),
                     info.protocol, info.cipher, info.alpn);
        co_return Result<SecureSessionInfo>::ok(std::move(info));
    }

}  // namespace flowhttp
