#pragma once

// In-memory Transport for driving the pool, bridge and pipeline without
// sockets. Inbound bytes are delivered from posted handlers, honouring
// read_enabled() and the sink's read budget like SocketTransport does.

#include <algorithm>
#include <boost/asio/any_io_executor.hpp>
#include <utility>  // before awaitable.hpp: Boost 1.74 uses std::exchange without it
#include <boost/asio/awaitable.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <boost/system/error_code.hpp>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "flowhttp/endpoint.hpp"
#include "flowhttp/transport/transport.hpp"

namespace flowhttp::test {

    /// @brief Split one complete HTTP/1.1 request off the front of `buf`.
    /// Understands Content-Length and chunked framing.
    inline std::optional<std::string> take_request(std::string& buf) {
        const auto head_end = buf.find("\r\n\r\n");
        if (head_end == std::string::npos) return std::nullopt;
        const std::size_t body_start = head_end + 4;

        std::string lower = buf.substr(0, body_start);
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return std::tolower(c); });

        std::size_t end = body_start;
        if (auto p = lower.find("\r\ncontent-length:"); p != std::string::npos) {
            const auto v = p + std::string_view("\r\ncontent-length:").size();
            const auto n = std::stoull(lower.substr(v, lower.find("\r\n", v) - v));
            if (buf.size() < body_start + n) return std::nullopt;
            end = body_start + n;
        } else if (lower.find("\r\ntransfer-encoding: chunked") !=
                   std::string::npos) {
            const auto term = buf.find("\r\n0\r\n\r\n", head_end);
            const auto first = buf.compare(body_start, 5, "0\r\n\r\n") == 0;
            if (first) {
                end = body_start + 5;
            } else if (term == std::string::npos) {
                return std::nullopt;
            } else {
                end = term + 7;
            }
        }

        std::string out = buf.substr(0, end);
        buf.erase(0, end);
        return out;
    }

    class FakeTransport : public Transport,
                          public std::enable_shared_from_this<FakeTransport> {
       public:
        /// @brief Called once per complete request written.
        using Responder =
            std::function<void(FakeTransport&, const std::string& request)>;

        FakeTransport(boost::asio::any_io_executor ex, Endpoint ep = {})
            : ex_(std::move(ex)), endpoint_(std::move(ep)) {}

        boost::asio::awaitable<boost::system::error_code> write(
            std::string_view bytes) override {
            if (!open_ || fail_writes_) {
                co_return boost::system::error_code(
                    boost::asio::error::broken_pipe);
            }
            written_.append(bytes);
            pending_request_.append(bytes);
            sent_ += bytes.size();
            ++writes_;

            while (auto req = take_request(pending_request_)) {
                requests_.push_back(*req);
                if (responder_) responder_(*this, *req);
            }
            co_return boost::system::error_code{};
        }

        void set_read_enabled(bool enabled) override {
            if (!open_) return;
            read_enabled_ = enabled;
            ++read_toggles_;
            if (enabled) schedule_pump();
        }

        bool read_enabled() const noexcept override { return read_enabled_; }

        void attach(TransportSink* sink) override {
            sink_ = sink;
            if (sink) schedule_pump();
        }

        bool probe() const noexcept override {
            return open_ && !peer_closed_ && !unsolicited_;
        }

        bool is_open() const noexcept override { return open_; }

        void close() noexcept override {
            if (!open_) return;
            open_ = false;
            read_enabled_ = false;
            ++close_calls_;
            closed_on_ = std::this_thread::get_id();
            inbound_.clear();
            if (auto* sink = sink_) {
                sink_ = nullptr;
                sink->on_closed(boost::asio::error::operation_aborted);
            }
        }

        std::uint64_t bytes_received() const noexcept override {
            return received_;
        }
        std::uint64_t bytes_sent() const noexcept override { return sent_; }

        // ---------------------
        // Peer side
        // ---------------------

        /// @brief Bytes the peer sends; delivered on a later handler.
        void push(std::string bytes) {
            if (!open_ || bytes.empty()) return;
            inbound_.push_back(std::move(bytes));
            schedule_pump();
        }

        /// @brief Clean FIN after everything pushed so far.
        void peer_close() {
            fin_pending_ = true;
            schedule_pump();
        }

        /// @brief Abrupt reset; an attached sink hears about it at once.
        void peer_reset() {
            if (!open_) return;
            peer_closed_ = true;
            read_enabled_ = false;
            inbound_.clear();
            if (auto* sink = sink_) {
                sink->on_closed(boost::asio::error::connection_reset);
            }
        }

        void set_responder(Responder r) { responder_ = std::move(r); }
        void set_fail_writes(bool fail) { fail_writes_ = fail; }

        /// @brief Largest single delivery to the sink.
        void set_max_read(std::size_t n) { max_read_ = std::max<std::size_t>(n, 1); }

        const Endpoint& endpoint() const noexcept { return endpoint_; }
        const std::string& written() const noexcept { return written_; }
        const std::vector<std::string>& requests() const noexcept {
            return requests_;
        }
        std::size_t writes() const noexcept { return writes_; }
        std::size_t close_calls() const noexcept { return close_calls_; }
        /// @brief Thread that closed the transport.
        std::thread::id closed_on() const noexcept { return closed_on_; }
        std::size_t read_toggles() const noexcept { return read_toggles_; }
        std::size_t largest_delivery() const noexcept { return largest_; }
        bool has_sink() const noexcept { return sink_ != nullptr; }
        bool peer_closed() const noexcept { return peer_closed_; }

        std::size_t inbound_pending() const noexcept {
            std::size_t n = 0;
            for (auto const& s : inbound_) n += s.size();
            return n;
        }

       private:
        void schedule_pump() {
            if (pump_scheduled_) return;
            pump_scheduled_ = true;
            boost::asio::post(ex_, [self = shared_from_this()] {
                self->pump_scheduled_ = false;
                self->pump();
            });
        }

        void pump() {
            while (open_ && read_enabled_ && !inbound_.empty()) {
                if (!sink_) {
                    // The idle read loop picks up stray bytes.
                    unsolicited_ = true;
                    received_ += inbound_pending();
                    inbound_.clear();
                    break;
                }
                const std::size_t budget = std::min(max_read_, sink_->read_budget());
                if (budget == 0) return;

                auto& front = inbound_.front();
                const std::size_t n = std::min(budget, front.size());
                std::string piece = front.substr(0, n);
                front.erase(0, n);
                if (front.empty()) inbound_.pop_front();

                received_ += n;
                largest_ = std::max(largest_, n);
                sink_->on_bytes(piece);
            }

            if (open_ && read_enabled_ && inbound_.empty() && fin_pending_ &&
                !peer_closed_) {
                peer_closed_ = true;
                read_enabled_ = false;
                if (auto* sink = sink_) {
                    sink->on_closed(boost::asio::error::eof);
                }
            }
        }

        boost::asio::any_io_executor ex_;
        Endpoint endpoint_;
        Responder responder_;

        TransportSink* sink_{nullptr};
        std::deque<std::string> inbound_;
        std::string written_;
        std::string pending_request_;
        std::vector<std::string> requests_;

        bool open_{true};
        bool read_enabled_{false};
        bool pump_scheduled_{false};
        bool fin_pending_{false};
        bool peer_closed_{false};
        bool unsolicited_{false};
        bool fail_writes_{false};

        std::size_t max_read_{16 * 1024};
        std::size_t largest_{0};
        std::size_t writes_{0};
        std::size_t close_calls_{0};
        std::thread::id closed_on_;
        std::size_t read_toggles_{0};
        std::uint64_t received_{0};
        std::uint64_t sent_{0};
    };

}  // namespace flowhttp::test
