#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <utility>  // before awaitable.hpp: Boost 1.74 uses std::exchange without it
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <optional>

namespace flowhttp::detail {

    /// @brief Run `op` on `ex` (typically the client strand) and resume the
    /// caller with its value. Exceptions propagate to the caller.
    /// @note co_spawn needs a default-constructible value type; Result<T>
    /// is not one, so the value travels through an optional.
    template <typename T>
    boost::asio::awaitable<T> run_on(boost::asio::any_io_executor ex,
                                     boost::asio::awaitable<T> op) {
        std::optional<T> out;
        co_await boost::asio::co_spawn(
            ex,
            [&]() -> boost::asio::awaitable<void> {
                out.emplace(co_await std::move(op));
            },
            boost::asio::use_awaitable);
        co_return std::move(*out);
    }

}  // namespace flowhttp::detail
