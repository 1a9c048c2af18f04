#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <utility>  // before awaitable.hpp: Boost 1.74 uses std::exchange without it
#include <boost/asio/awaitable.hpp>
#include <cstddef>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "request.hpp"
#include "result.hpp"

namespace flowhttp {

    namespace detail {
        class Exchange;
    }

    /// @brief Lifecycle of a response as seen by the caller.
    enum class ResponsePhase {
        Pending,
        HeadersReceived,
        BodyStreaming,
        Complete,
        Aborted
    };

    inline const char* to_string(ResponsePhase phase) noexcept {
        switch (phase) {
            case ResponsePhase::Pending:
                return "Pending";
            case ResponsePhase::HeadersReceived:
                return "HeadersReceived";
            case ResponsePhase::BodyStreaming:
                return "BodyStreaming";
            case ResponsePhase::Complete:
                return "Complete";
            case ResponsePhase::Aborted:
                return "Aborted";
        }
        return "Unknown";
    }

    /// @brief Status line and header block of a response.
    struct ResponseHead {
        /** @brief HTTP status code (e.g., 200, 404). */
        int status{0};
        std::string reason;
        /** @brief 10 for HTTP/1.0, 11 for HTTP/1.1. */
        unsigned version{11};
        Headers headers;
    };

    /**
     * @brief Lazily consumed response body.
     *
     * Move-only. Each next() pulls one chunk through the exchange's
     * backpressure bridge, so nothing is read from the connection beyond the
     * bridge's high-water mark until the caller asks for it. Dropping an
     * unfinished body cancels it; its connection is then not reused.
     */
    class ResponseBody {
       public:
        ResponseBody() = default;
        ResponseBody(std::shared_ptr<detail::Exchange> exchange,
                     boost::asio::any_io_executor strand);

        ResponseBody(ResponseBody&&) noexcept = default;
        ResponseBody& operator=(ResponseBody&& other) noexcept;
        ResponseBody(const ResponseBody&) = delete;
        ResponseBody& operator=(const ResponseBody&) = delete;

        ~ResponseBody();

        /// @brief Next decoded body chunk, or nullopt once the body is
        /// complete. After Complete or Aborted nothing further is yielded.
        boost::asio::awaitable<Result<std::optional<std::string>>> next();

        /// @brief Read the remaining body into one string.
        /// @param limit Bodies larger than this are cancelled and fail with
        /// Aborted.
        boost::asio::awaitable<Result<std::string>> read_all(
            std::size_t limit = std::numeric_limits<std::size_t>::max());

        /// @brief Stop consuming. Safe from any thread.
        void cancel();

        ResponsePhase phase() const noexcept;

       private:
        void abandon() noexcept;

        std::shared_ptr<detail::Exchange> exchange_;
        boost::asio::any_io_executor strand_;
    };

    /**
     * @brief Terminal result of an exchange: the final response head plus
     * its body stream.
     */
    class ResponseState {
       public:
        ResponseState() = default;
        ResponseState(ResponseHead head, ResponseBody body)
            : head_(std::move(head)), body_(std::move(body)) {}

        int status() const noexcept { return head_.status; }
        std::string_view reason() const noexcept { return head_.reason; }
        unsigned version() const noexcept { return head_.version; }
        const Headers& headers() const noexcept { return head_.headers; }
        const ResponseHead& head() const noexcept { return head_; }

        /// @brief Value of the first header named `name`, empty if absent.
        std::string header(std::string_view name) const;

        ResponseBody& body() noexcept { return body_; }

        ResponsePhase phase() const noexcept { return body_.phase(); }

       private:
        ResponseHead head_;
        ResponseBody body_;
    };

}  // namespace flowhttp
