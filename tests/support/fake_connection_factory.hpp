#pragma once

#include <utility>  // before awaitable.hpp: Boost 1.74 uses std::exchange without it
#include <boost/asio/awaitable.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <chrono>
#include <cstddef>
#include <memory>
#include <vector>

#include "fake_transport.hpp"
#include "flowhttp/transport/connector.hpp"

namespace flowhttp::test {

    /// @brief ConnectionFactory handing out FakeTransports. Every transport
    /// gets the same responder; tests script the peer through it.
    class FakeConnectionFactory : public ConnectionFactory {
       public:
        explicit FakeConnectionFactory(FakeTransport::Responder responder = {})
            : responder_(std::move(responder)) {}

        boost::asio::awaitable<Result<EstablishedConnection>> connect(
            const Endpoint& ep, CancellationToken token) override {
            ++connects_;
            endpoints_.push_back(ep);

            auto ex = co_await boost::asio::this_coro::executor;

            if (connect_delay_.count() > 0) {
                auto t = std::make_shared<boost::asio::steady_timer>(ex);
                t->expires_after(connect_delay_);
                std::weak_ptr<boost::asio::steady_timer> weak = t;
                auto registration = token.on_cancel([ex, weak] {
                    boost::asio::dispatch(ex, [weak] {
                        if (auto timer = weak.lock()) timer->cancel();
                    });
                });
                boost::system::error_code ec;
                co_await t->async_wait(
                    boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            }

            if (token.cancelled()) {
                ++cancelled_connects_;
                co_return Result<EstablishedConnection>::err(
                    Error::Code::Aborted, "Connect cancelled");
            }

            if (failures_left_ > 0) {
                --failures_left_;
                co_return Result<EstablishedConnection>::err(
                    Error::Code::ConnectFailed,
                    "Connection refused by " + ep.to_string());
            }

            auto t = std::make_shared<FakeTransport>(ex, ep);
            t->set_responder(responder_);
            transports_.push_back(t);

            EstablishedConnection conn;
            conn.transport = t;
            co_return Result<EstablishedConnection>::ok(std::move(conn));
        }

        void set_responder(FakeTransport::Responder r) {
            responder_ = std::move(r);
        }

        /// @brief Fail the next `n` connects with ConnectFailed.
        void fail_next(std::size_t n) { failures_left_ = n; }

        void set_connect_delay(std::chrono::milliseconds d) {
            connect_delay_ = d;
        }

        std::size_t connects() const noexcept { return connects_; }
        std::size_t cancelled_connects() const noexcept {
            return cancelled_connects_;
        }
        const std::vector<Endpoint>& endpoints() const noexcept {
            return endpoints_;
        }
        const std::vector<std::shared_ptr<FakeTransport>>& transports()
            const noexcept {
            return transports_;
        }

       private:
        FakeTransport::Responder responder_;
        std::size_t connects_{0};
        std::size_t cancelled_connects_{0};
        std::size_t failures_left_{0};
        std::chrono::milliseconds connect_delay_{0};
        std::vector<Endpoint> endpoints_;
        std::vector<std::shared_ptr<FakeTransport>> transports_;
    };

}  // namespace flowhttp::test
