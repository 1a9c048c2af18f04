#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <utility>  // before awaitable.hpp: Boost 1.74 uses std::exchange without it
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../config.hpp"
#include "../result.hpp"
#include "../transport/transport.hpp"

namespace flowhttp {

    /// @brief Chunks handed out by one BackpressureBridge::request().
    struct BridgeBatch {
        std::vector<std::string> chunks;
        /// The peer finished the stream and every buffered chunk has been
        /// handed out.
        bool end_of_stream{false};
    };

    /**
     * @brief Per-exchange adapter between a push-based transport and a
     * pull-based consumer.
     *
     * Inbound chunks are kept in a buffer bounded by the high-water mark.
     * The transport reads exactly while there is unclaimed demand or the
     * buffer is below the low-water mark, and never at or above the
     * high-water mark. Each transport read is budgeted to the room left
     * below the high-water mark.
     *
     * Single consumer; every call must be made on the transport's executor.
     * The bridge attaches itself as the transport's sink on construction and
     * detaches on destruction.
     */
    class BackpressureBridge : public TransportSink {
       public:
        BackpressureBridge(boost::asio::any_io_executor ex,
                           std::shared_ptr<Transport> transport,
                           BridgeConfiguration cfg);

        BackpressureBridge(const BackpressureBridge&) = delete;
        BackpressureBridge& operator=(const BackpressureBridge&) = delete;

        ~BackpressureBridge() override;

        /// @brief Add `n` to the outstanding demand (0 counts as 1) and
        /// suspend until at least one chunk is available, the stream ended
        /// or the bridge failed.
        /// @return Up to `n` chunks in arrival order. Aborted after a
        /// transport error or cancel(); the error given to fail().
        boost::asio::awaitable<Result<BridgeBatch>> request(std::size_t n);

        /// @brief Drop the buffer, stop reading. The connection must not be
        /// reused afterwards.
        void cancel();

        /// @brief Fail the bridge with `error`; pending and future requests
        /// resolve with it.
        void fail(Error error);

        /// @brief Whether the inbound stream is still usable for another
        /// exchange as far as the bridge can tell.
        bool reusable() const noexcept {
            return !cancelled_ && !failure_ && !eos_;
        }

        bool reading() const noexcept { return reading_; }
        bool cancelled() const noexcept { return cancelled_; }
        bool failed() const noexcept { return failure_.has_value(); }
        bool end_of_stream() const noexcept { return eos_; }

        std::size_t buffered_bytes() const noexcept { return buffered_; }
        std::size_t buffered_chunks() const noexcept { return buffer_.size(); }
        std::size_t outstanding_demand() const noexcept { return demand_; }

        /// @brief Bytes accepted from the transport so far.
        std::uint64_t bytes_received() const noexcept { return received_; }

        std::size_t read_budget() const noexcept override;
        void on_bytes(std::string_view bytes) override;
        void on_closed(boost::system::error_code ec) override;

       private:
        void update_read_state();
        void wake();

        std::shared_ptr<Transport> transport_;
        BridgeConfiguration cfg_;
        boost::asio::steady_timer wakeup_;

        std::deque<std::string> buffer_;
        std::size_t buffered_{0};
        std::size_t demand_{0};
        std::uint64_t received_{0};

        bool reading_{false};
        bool waiting_{false};
        bool eos_{false};
        bool cancelled_{false};
        std::optional<Error> failure_;
    };

}  // namespace flowhttp
