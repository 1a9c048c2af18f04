#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <utility>  // before awaitable.hpp: Boost 1.74 uses std::exchange without it
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "../endpoint.hpp"
#include "../log.hpp"
#include "transport.hpp"

namespace flowhttp {

    /**
     * @brief Transport over a TCP socket, optionally wrapped in TLS.
     *
     * The stream is emplaced and connected by the connector; start() then
     * launches the read loop. The loop reads only while read-enabled, and
     * each read is sized to the attached sink's budget. Not thread-safe:
     * every call must be made on the executor the transport was created
     * with.
     */
    class SocketTransport
        : public Transport,
          public std::enable_shared_from_this<SocketTransport> {
       public:
        using tcp = boost::asio::ip::tcp;
        using HttpStream = boost::beast::tcp_stream;
        using HttpsStream = boost::beast::ssl_stream<boost::beast::tcp_stream>;

        SocketTransport(boost::asio::any_io_executor ex, Endpoint endpoint,
                        std::size_t read_buffer_size, bool wiretap);

        SocketTransport(const SocketTransport&) = delete;
        SocketTransport& operator=(const SocketTransport&) = delete;

        ~SocketTransport() override;

        /// @brief Create the plain TCP stream (not yet connected).
        HttpStream& emplace_plain();

        /// @brief Create the TLS stream over a fresh TCP stream.
        HttpsStream& emplace_secure(boost::asio::ssl::context& ctx);

        /// @brief The TCP layer, for connecting and per-operation timeouts.
        /// Must only be called after emplace_plain() or emplace_secure().
        HttpStream& lowest_layer();

        /// @brief Begin reading. Call once, after the stream is connected
        /// (and the TLS handshake done).
        void start();

        const Endpoint& endpoint() const noexcept { return endpoint_; }

        boost::asio::awaitable<boost::system::error_code> write(
            std::string_view bytes) override;

        void set_read_enabled(bool enabled) override;
        bool read_enabled() const noexcept override { return read_enabled_; }

        void attach(TransportSink* sink) override;

        bool probe() const noexcept override;
        bool is_open() const noexcept override;
        void close() noexcept override;

        std::uint64_t bytes_received() const noexcept override {
            return bytes_received_;
        }
        std::uint64_t bytes_sent() const noexcept override {
            return bytes_sent_;
        }

       private:
        using Stream = std::variant<std::monostate,  // "not connected yet"
                                    HttpStream, HttpsStream>;

        static boost::asio::awaitable<void> read_loop(
            std::shared_ptr<SocketTransport> self);

        boost::asio::awaitable<std::size_t> read_some(
            std::size_t budget, boost::system::error_code& ec);

        void close_socket() noexcept;

        /// @brief Hand `bytes` to the sink within its read budget and hold
        /// back the rest.
        void deliver(std::string_view bytes);

        boost::asio::any_io_executor ex_;
        Endpoint endpoint_;
        Stream m_stream;
        std::vector<char> m_buffer;
        boost::asio::steady_timer gate_;  ///< Parks the reader.

        TransportSink* sink_{nullptr};
        bool read_enabled_{false};
        bool started_{false};
        bool closed_{false};
        bool peer_closed_{false};
        bool unsolicited_{false};  ///< Bytes arrived with no sink.
        /// Read past the sink's budget (a read started before it attached).
        std::string held_;

        std::uint64_t bytes_received_{0};
        std::uint64_t bytes_sent_{0};

        std::shared_ptr<spdlog::logger> wire_;  ///< Set when wiretap is on.
    };

}  // namespace flowhttp
