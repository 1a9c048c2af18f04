#include "flowhttp/pipeline/backpressure_bridge.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <boost/asio/error.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace flowhttp {

    namespace asio = boost::asio;

    BackpressureBridge::BackpressureBridge(asio::any_io_executor ex,
                                           std::shared_ptr<Transport> transport,
                                           BridgeConfiguration cfg)
        : transport_(std::move(transport)), cfg_(cfg), wakeup_(ex) {
        transport_->attach(this);
        update_read_state();
    }

    BackpressureBridge::~BackpressureBridge() {
        transport_->attach(nullptr);
        transport_->set_read_enabled(false);
    }

    asio::awaitable<Result<BridgeBatch>> BackpressureBridge::request(
        std::size_t n) {
        if (waiting_) {
            co_return Result<BridgeBatch>::err(
                Error::Code::InvalidRequest,
                "Concurrent request on a backpressure bridge");
        }
        if (n == 0) n = 1;
        demand_ += n;
        update_read_state();

        for (;;) {
            if (failure_) {
                demand_ = 0;
                co_return Result<BridgeBatch>::err(*failure_);
            }
            if (cancelled_) {
                demand_ = 0;
                co_return Result<BridgeBatch>::err(Error::Code::Aborted,
                                                   "Response body cancelled");
            }

            if (!buffer_.empty()) {
                BridgeBatch batch;
                while (!buffer_.empty() && batch.chunks.size() < n) {
                    buffered_ -= buffer_.front().size();
                    batch.chunks.push_back(std::move(buffer_.front()));
                    buffer_.pop_front();
                }
                demand_ -= std::min(demand_, batch.chunks.size());
                batch.end_of_stream = eos_ && buffer_.empty();
                update_read_state();
                co_return Result<BridgeBatch>::ok(std::move(batch));
            }

            if (eos_) {
                demand_ = 0;
                BridgeBatch batch;
                batch.end_of_stream = true;
                co_return Result<BridgeBatch>::ok(std::move(batch));
            }

            waiting_ = true;
            wakeup_.expires_at(asio::steady_timer::time_point::max());
            boost::system::error_code ec;
            co_await wakeup_.async_wait(
                asio::redirect_error(asio::use_awaitable, ec));
            waiting_ = false;
        }
    }

    void BackpressureBridge::cancel() {
        if (cancelled_ || failure_) return;
        cancelled_ = true;
        buffer_.clear();
        buffered_ = 0;
        update_read_state();
        wake();
    }

    void BackpressureBridge::fail(Error error) {
        if (failure_) return;
        failure_ = std::move(error);
        buffer_.clear();
        buffered_ = 0;
        update_read_state();
        wake();
    }

    std::size_t BackpressureBridge::read_budget() const noexcept {
        if (!reading_ || buffered_ >= cfg_.high_water_mark) return 0;
        return cfg_.high_water_mark - buffered_;
    }

    void BackpressureBridge::on_bytes(std::string_view bytes) {
        if (bytes.empty() || cancelled_ || failure_ || eos_) return;

        received_ += bytes.size();
        buffered_ += bytes.size();
        buffer_.emplace_back(bytes);
        update_read_state();
        wake();
    }

    void BackpressureBridge::on_closed(boost::system::error_code ec) {
        if (ec == asio::error::eof) {
            eos_ = true;
        } else if (!failure_ && !cancelled_) {
            SPDLOG_DEBUG("Inbound stream aborted: {}", ec.message());
            failure_ =
                Error{Error::Code::Aborted, "Connection closed: " + ec.message()};
            buffer_.clear();
            buffered_ = 0;
        }
        update_read_state();
        wake();
    }

    void BackpressureBridge::update_read_state() {
        const bool want = !failure_ && !cancelled_ && !eos_ &&
                          buffered_ < cfg_.high_water_mark &&
                          (demand_ > 0 || buffered_ < cfg_.low_water_mark);

        // Re-enabling also wakes a reader parked on a zero budget.
        reading_ = want;
        transport_->set_read_enabled(want);
    }

    void BackpressureBridge::wake() {
        if (waiting_) wakeup_.cancel();
    }

}  // namespace flowhttp
