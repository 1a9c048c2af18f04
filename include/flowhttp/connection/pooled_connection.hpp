#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>

#include "../endpoint.hpp"
#include "../transport/tls_negotiation.hpp"
#include "../transport/transport.hpp"

namespace flowhttp {

    enum class ConnectionState {
        Idle,    ///< Owned by the pool, available for leasing
        Leased,  ///< Owned by one exchange (or being opened)
        Closing  ///< Being destroyed
    };

    /**
     * @brief One live transport connection tracked by the pool.
     *
     * Only the pool mutates it. A Leased connection has at most one active
     * exchange.
     */
    class PooledConnection {
       public:
        using clock_type = std::chrono::steady_clock;

        PooledConnection(std::uint64_t id, Endpoint endpoint)
            : id_(id),
              endpoint_(std::move(endpoint)),
              created_(clock_type::now()),
              last_activity_(created_) {}

        PooledConnection(const PooledConnection&) = delete;
        PooledConnection& operator=(const PooledConnection&) = delete;

        std::uint64_t id() const noexcept { return id_; }
        const Endpoint& endpoint() const noexcept { return endpoint_; }
        ConnectionState state() const noexcept { return state_; }

        /// @brief Null while the connection is still being opened.
        const std::shared_ptr<Transport>& transport() const noexcept {
            return transport_;
        }

        const std::optional<SecureSessionInfo>& session() const noexcept {
            return session_;
        }

        clock_type::time_point created() const noexcept { return created_; }
        clock_type::time_point last_activity() const noexcept {
            return last_activity_;
        }

        /// @brief Number of times the connection was leased from idle.
        std::size_t reuse_count() const noexcept { return reuse_count_; }

       private:
        friend class ConnectionPool;

        std::uint64_t id_;
        Endpoint endpoint_;
        ConnectionState state_{ConnectionState::Leased};
        std::shared_ptr<Transport> transport_;
        std::optional<SecureSessionInfo> session_;
        clock_type::time_point created_;
        clock_type::time_point last_activity_;
        std::size_t reuse_count_{0};
    };

}  // namespace flowhttp
