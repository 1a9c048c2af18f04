#include "flowhttp/transport/socket_transport.hpp"

#include <algorithm>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

namespace flowhttp {

    namespace asio = boost::asio;

    SocketTransport::SocketTransport(asio::any_io_executor ex,
                                     Endpoint endpoint,
                                     std::size_t read_buffer_size,
                                     bool wiretap)
        : ex_(std::move(ex)),
          endpoint_(std::move(endpoint)),
          m_buffer(std::max<std::size_t>(read_buffer_size, 1)),
          gate_(ex_) {
        if (wiretap) wire_ = wire_logger();
    }

    SocketTransport::~SocketTransport() {
        sink_ = nullptr;
        close_socket();
    }

    SocketTransport::HttpStream& SocketTransport::emplace_plain() {
        return m_stream.emplace<HttpStream>(ex_);
    }

    SocketTransport::HttpsStream& SocketTransport::emplace_secure(
        asio::ssl::context& ctx) {
        return m_stream.emplace<HttpsStream>(ex_, ctx);
    }

    SocketTransport::HttpStream& SocketTransport::lowest_layer() {
        if (auto* s = std::get_if<HttpsStream>(&m_stream)) {
            return boost::beast::get_lowest_layer(*s);
        }
        return std::get<HttpStream>(m_stream);
    }

    void SocketTransport::start() {
        if (started_ || closed_) return;
        started_ = true;
        asio::co_spawn(ex_, read_loop(shared_from_this()), asio::detached);
    }

    asio::awaitable<boost::system::error_code> SocketTransport::write(
        std::string_view bytes) {
        boost::system::error_code ec;
        if (closed_) co_return asio::error::not_connected;

        // Keep the stream alive across the suspension.
        auto self = shared_from_this();
        const auto buf = asio::buffer(bytes.data(), bytes.size());

        if (auto* s = std::get_if<HttpStream>(&m_stream)) {
            co_await asio::async_write(
                *s, buf, asio::redirect_error(asio::use_awaitable, ec));
        } else if (auto* s = std::get_if<HttpsStream>(&m_stream)) {
            co_await asio::async_write(
                *s, buf, asio::redirect_error(asio::use_awaitable, ec));
        } else {
            co_return asio::error::not_connected;
        }

        if (!ec) {
            bytes_sent_ += bytes.size();
            if (wire_) {
                SPDLOG_LOGGER_TRACE(wire_, "{} >> {} bytes: {}",
                                    endpoint_.to_string(), bytes.size(),
                                    escape_preview(bytes));
            }
        }
        co_return ec;
    }

    void SocketTransport::set_read_enabled(bool enabled) {
        if (closed_) return;
        read_enabled_ = enabled;
        if (enabled) gate_.cancel();
    }

    void SocketTransport::attach(TransportSink* sink) {
        if (!sink && !held_.empty()) {
            // Bytes beyond the finished exchange.
            unsolicited_ = true;
            held_.clear();
        }
        sink_ = sink;
    }

    void SocketTransport::deliver(std::string_view bytes) {
        if (!sink_) {
            unsolicited_ = true;
            SPDLOG_DEBUG("{}: {} unsolicited bytes on idle connection",
                         endpoint_.to_string(), bytes.size());
            return;
        }
        const std::size_t room = std::min(bytes.size(), sink_->read_budget());
        if (room < bytes.size()) held_.append(bytes.substr(room));
        if (room > 0) sink_->on_bytes(bytes.substr(0, room));
    }

    bool SocketTransport::probe() const noexcept {
        return is_open() && !peer_closed_ && !unsolicited_;
    }

    bool SocketTransport::is_open() const noexcept {
        if (closed_) return false;
        if (auto const* s = std::get_if<HttpStream>(&m_stream)) {
            return s->socket().is_open();
        }
        if (auto const* s = std::get_if<HttpsStream>(&m_stream)) {
            return boost::beast::get_lowest_layer(*s).socket().is_open();
        }
        return false;
    }

    void SocketTransport::close() noexcept {
        if (closed_) return;
        closed_ = true;
        read_enabled_ = false;
        close_socket();
        gate_.cancel();

        if (auto* sink = sink_) {
            sink_ = nullptr;
            sink->on_closed(asio::error::operation_aborted);
        }
    }

    void SocketTransport::close_socket() noexcept {
        boost::system::error_code ec;
        // The stream objects stay alive until destruction; a pending
        // operation may still reference them.
        if (auto* s = std::get_if<HttpStream>(&m_stream)) {
            s->socket().shutdown(tcp::socket::shutdown_both, ec);
            s->socket().close(ec);
        } else if (auto* s = std::get_if<HttpsStream>(&m_stream)) {
            // No TLS shutdown, just close the underlying TCP socket.
            auto& sock = boost::beast::get_lowest_layer(*s).socket();
            sock.shutdown(tcp::socket::shutdown_both, ec);
            sock.close(ec);
        }
    }

    asio::awaitable<std::size_t> SocketTransport::read_some(
        std::size_t budget, boost::system::error_code& ec) {
        const auto buf = asio::buffer(m_buffer.data(), budget);
        if (auto* s = std::get_if<HttpStream>(&m_stream)) {
            co_return co_await s->async_read_some(
                buf, asio::redirect_error(asio::use_awaitable, ec));
        }
        if (auto* s = std::get_if<HttpsStream>(&m_stream)) {
            co_return co_await s->async_read_some(
                buf, asio::redirect_error(asio::use_awaitable, ec));
        }
        ec = asio::error::not_connected;
        co_return 0;
    }

    asio::awaitable<void> SocketTransport::read_loop(
        std::shared_ptr<SocketTransport> self) {
        for (;;) {
            if (self->closed_) co_return;

            if (!self->held_.empty() && self->sink_ && self->read_enabled_) {
                const std::size_t room = std::min(
                    self->held_.size(), self->sink_->read_budget());
                if (room > 0) {
                    const std::string piece = self->held_.substr(0, room);
                    self->held_.erase(0, room);
                    self->sink_->on_bytes(piece);
                    continue;
                }
            }

            std::size_t budget = self->m_buffer.size();
            if (self->sink_) {
                budget = std::min(budget, self->sink_->read_budget());
            }
            if (!self->held_.empty()) budget = 0;

            if (!self->read_enabled_ || budget == 0) {
                boost::system::error_code wait_ec;
                self->gate_.expires_at(asio::steady_timer::time_point::max());
                co_await self->gate_.async_wait(
                    asio::redirect_error(asio::use_awaitable, wait_ec));
                continue;
            }

            boost::system::error_code ec;
            const std::size_t n = co_await self->read_some(budget, ec);
            if (self->closed_) co_return;

            if (n > 0) {
                self->bytes_received_ += n;
                const std::string_view bytes(self->m_buffer.data(), n);
                if (self->wire_) {
                    SPDLOG_LOGGER_TRACE(self->wire_, "{} << {} bytes: {}",
                                        self->endpoint_.to_string(), n,
                                        escape_preview(bytes));
                }
                self->deliver(bytes);
            }

            if (ec) {
                self->peer_closed_ = true;
                self->read_enabled_ = false;
                // Peers commonly skip close_notify; the framing decides
                // whether the message was complete.
                if (ec == asio::ssl::error::stream_truncated) {
                    ec = asio::error::eof;
                }
                if (auto* sink = self->sink_) {
                    sink->on_closed(ec);
                }
                co_return;
            }
        }
    }

}  // namespace flowhttp
