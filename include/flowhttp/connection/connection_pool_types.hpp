#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>

namespace flowhttp {

    /// @brief Metrics for monitoring connection pool behavior
    struct ConnectionPoolMetrics {
        // Gauges (current state)
        std::atomic<std::size_t> total_in_use{0};  ///< Leased or opening
        std::atomic<std::size_t> total_idle{0};    ///< Currently idle
        std::atomic<std::size_t> waiters_total{
            0};  ///< Currently waiting for a connection

        // Counters (cumulative)
        std::atomic<std::uint64_t> acquire_success{0};  ///< Successful acquires
        std::atomic<std::uint64_t> acquire_timeout{0};  ///< Acquire timed out
        std::atomic<std::uint64_t> acquire_shutdown{0};  ///< Pool shutdown
        std::atomic<std::uint64_t> acquire_cancelled{0};  ///< Caller cancelled
        std::atomic<std::uint64_t> connect_failed{0};  ///< Connector failed
        std::atomic<std::uint64_t> connection_created{0};  ///< New connections
        std::atomic<std::uint64_t> connection_reused{0};   ///< Reused idle
        std::atomic<std::uint64_t> connection_pruned{0};   ///< Pruned idle
        std::atomic<std::uint64_t> connection_dropped_unhealthy{
            0};  ///< Failed the liveness probe
        std::atomic<std::uint64_t> connection_dropped_reuse_limit{
            0};  ///< Dropped due to reuse limit
        std::atomic<std::uint64_t> connection_dropped_age_limit{
            0};  ///< Dropped due to age limit
        std::atomic<std::uint64_t> connection_closed{
            0};  ///< Destroyed for any reason
        std::atomic<std::uint64_t> release_invalid_id{
            0};  ///< Released unknown connection
    };

    /// @brief Immutable value copy of ConnectionPoolMetrics.
    struct PoolMetricsSnapshot {
        std::size_t total_in_use{0};
        std::size_t total_idle{0};
        std::size_t waiters_total{0};

        std::uint64_t acquire_success{0};
        std::uint64_t acquire_timeout{0};
        std::uint64_t acquire_shutdown{0};
        std::uint64_t acquire_cancelled{0};
        std::uint64_t connect_failed{0};
        std::uint64_t connection_created{0};
        std::uint64_t connection_reused{0};
        std::uint64_t connection_pruned{0};
        std::uint64_t connection_dropped_unhealthy{0};
        std::uint64_t connection_dropped_reuse_limit{0};
        std::uint64_t connection_dropped_age_limit{0};
        std::uint64_t connection_closed{0};
        std::uint64_t release_invalid_id{0};
    };

    inline PoolMetricsSnapshot snapshot_of(const ConnectionPoolMetrics& m) {
        constexpr auto r = std::memory_order_relaxed;
        PoolMetricsSnapshot s;
        s.total_in_use = m.total_in_use.load(r);
        s.total_idle = m.total_idle.load(r);
        s.waiters_total = m.waiters_total.load(r);
        s.acquire_success = m.acquire_success.load(r);
        s.acquire_timeout = m.acquire_timeout.load(r);
        s.acquire_shutdown = m.acquire_shutdown.load(r);
        s.acquire_cancelled = m.acquire_cancelled.load(r);
        s.connect_failed = m.connect_failed.load(r);
        s.connection_created = m.connection_created.load(r);
        s.connection_reused = m.connection_reused.load(r);
        s.connection_pruned = m.connection_pruned.load(r);
        s.connection_dropped_unhealthy = m.connection_dropped_unhealthy.load(r);
        s.connection_dropped_reuse_limit =
            m.connection_dropped_reuse_limit.load(r);
        s.connection_dropped_age_limit = m.connection_dropped_age_limit.load(r);
        s.connection_closed = m.connection_closed.load(r);
        s.release_invalid_id = m.release_invalid_id.load(r);
        return s;
    }

}  // namespace flowhttp
