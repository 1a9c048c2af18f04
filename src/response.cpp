#include "flowhttp/response.hpp"

#include <spdlog/spdlog.h>

#include <boost/asio/dispatch.hpp>
#include <exception>

#include "flowhttp/detail/run_on.hpp"
#include "flowhttp/pipeline/exchange.hpp"

namespace flowhttp {

    namespace asio = boost::asio;

    ResponseBody::ResponseBody(std::shared_ptr<detail::Exchange> exchange,
                               asio::any_io_executor strand)
        : exchange_(std::move(exchange)), strand_(std::move(strand)) {}

    ResponseBody& ResponseBody::operator=(ResponseBody&& other) noexcept {
        if (this != &other) {
            abandon();
            exchange_ = std::move(other.exchange_);
            strand_ = std::move(other.strand_);
        }
        return *this;
    }

    ResponseBody::~ResponseBody() { abandon(); }

    asio::awaitable<Result<std::optional<std::string>>> ResponseBody::next() {
        using R = Result<std::optional<std::string>>;
        if (!exchange_) co_return R::ok(std::nullopt);
        co_return co_await detail::run_on(strand_, exchange_->read_chunk());
    }

    asio::awaitable<Result<std::string>> ResponseBody::read_all(
        std::size_t limit) {
        std::string out;
        for (;;) {
            auto chunk = co_await next();
            if (chunk.has_error()) {
                co_return chunk.forward_error<std::string>();
            }
            auto& data = chunk.value();
            if (!data) break;

            if (data->size() > limit - out.size()) {
                cancel();
                co_return Result<std::string>::err(
                    Error::Code::Aborted,
                    "Response body exceeds " + std::to_string(limit) +
                        " bytes");
            }
            out += *data;
        }
        co_return Result<std::string>::ok(std::move(out));
    }

    void ResponseBody::cancel() {
        if (!exchange_) return;
        asio::dispatch(strand_, [ex = exchange_] { ex->cancel(); });
    }

    ResponsePhase ResponseBody::phase() const noexcept {
        return exchange_ ? exchange_->phase() : ResponsePhase::Complete;
    }

    void ResponseBody::abandon() noexcept {
        if (!exchange_) return;
        auto ex = std::move(exchange_);

        const auto phase = ex->phase();
        if (phase == ResponsePhase::Complete || phase == ResponsePhase::Aborted)
            return;

        // Tear the exchange down on its strand.
        try {
            asio::dispatch(strand_, [ex = std::move(ex)] { ex->cancel(); });
        } catch (const std::exception& e) {
            SPDLOG_WARN("Failed to cancel an abandoned response body: {}",
                        e.what());
        }
    }

    std::string ResponseState::header(std::string_view name) const {
        auto it = head_.headers.find(
            boost::beast::string_view(name.data(), name.size()));
        if (it == head_.headers.end()) return {};
        const auto v = it->value();
        return std::string(v.data(), v.size());
    }

}  // namespace flowhttp
