#pragma once

#include <utility>  // before awaitable.hpp: Boost 1.74 uses std::exchange without it
#include <boost/asio/awaitable.hpp>
#include <boost/system/error_code.hpp>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace flowhttp {

    /**
     * @brief Receiver of a transport's inbound byte stream.
     *
     * At most one sink is attached to a transport at a time. All callbacks
     * run on the transport's executor.
     */
    class TransportSink {
       public:
        virtual ~TransportSink() = default;

        /// @brief Upper bound for the next read. Zero parks the reader.
        virtual std::size_t read_budget() const noexcept = 0;

        /// @brief Bytes read from the peer, in arrival order.
        virtual void on_bytes(std::string_view bytes) = 0;

        /// @brief The inbound stream ended. `ec` is `asio::error::eof` for a
        /// clean FIN, anything else is an abrupt closure.
        virtual void on_closed(boost::system::error_code ec) = 0;
    };

    /**
     * @brief One ordered, reliable byte stream to an endpoint.
     *
     * Reading is push based: while read-enabled the transport reads and
     * hands bytes to the attached sink; while read-disabled no read is
     * issued and the peer's sends are held back by TCP flow control.
     */
    class Transport {
       public:
        virtual ~Transport() = default;

        /// @brief Write all bytes. Completes with an error when the stream
        /// broke or was closed.
        virtual boost::asio::awaitable<boost::system::error_code> write(
            std::string_view bytes) = 0;

        virtual void set_read_enabled(bool enabled) = 0;
        virtual bool read_enabled() const noexcept = 0;

        /// @brief Attach the inbound sink, or detach with nullptr. Bytes read
        /// while no sink is attached poison the connection.
        virtual void attach(TransportSink* sink) = 0;

        /// @brief Best-effort liveness check for an idle connection: open,
        /// not closed by the peer and no unsolicited bytes received.
        virtual bool probe() const noexcept = 0;

        virtual bool is_open() const noexcept = 0;

        /// @brief Close immediately. An attached sink sees on_closed with
        /// `operation_aborted`.
        virtual void close() noexcept = 0;

        virtual std::uint64_t bytes_received() const noexcept = 0;
        virtual std::uint64_t bytes_sent() const noexcept = 0;
    };

}  // namespace flowhttp
