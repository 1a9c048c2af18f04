#pragma once

#include <atomic>
#include <boost/asio/any_io_executor.hpp>
#include <utility>  // before awaitable.hpp: Boost 1.74 uses std::exchange without it
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

#include "../cancellation.hpp"
#include "../config.hpp"
#include "../endpoint.hpp"
#include "../metrics/metrics.hpp"
#include "../result.hpp"
#include "../transport/connector.hpp"
#include "connection_pool_types.hpp"
#include "pooled_connection.hpp"

namespace flowhttp {

    /**
     * Connection pool for HTTP/HTTPS transport connections, partitioned by
     * Endpoint.
     *
     * SAFETY:
     * - Bookkeeping is protected by a mutex; try_acquire(), snapshot() and
     *   the metrics are safe from any thread
     * - acquire(), Lease release and the sweep must run on the executor the
     *   pool was created with (the client strand), since they drive timers
     *   and transports
     *
     * INVARIANTS:
     * 1. For each bucket: endpoint_total == in_use.size() + idle.size(),
     *    where in_use includes connections still being opened
     * 2. Global: total_in_use_ == sum(bucket.in_use.size())
     * 3. endpoint_total <= max_connections_per_endpoint and the global total
     *    <= max_total_connections
     * 4. No connection exists in both idle and in_use
     * 5. Only Idle connections are pruned, never Leased ones
     *
     * ERRORS:
     * - Timeout: no capacity freed before the acquire deadline
     * - ConnectFailed: the connector failed (never retried here)
     * - Aborted: the caller's cancellation token fired while waiting
     * - Shutdown: pool permanently closed, all future acquires fail
     *
     * LIFECYCLE:
     * 1. Construction: pool is alive, the idle sweep starts
     * 2. Operation: acquire() and Lease::release() work normally
     * 3. shutdown(): marks pool as shutting down, cancels all waiters
     * 4. drain(): optionally wait for leased connections to be returned
     * 5. Destruction: calls shutdown(), outstanding leases become inert
     */
    class ConnectionPool {
       public:
        using Conn = PooledConnection;
        using clock_type = std::chrono::steady_clock;

        /// @brief Move-only handle owning one Leased connection on behalf of
        /// one exchange.
        class Lease {
           public:
            Lease() = default;

            Lease(Lease&& other) noexcept { move_from(std::move(other)); }

            /// @brief Move lease from another
            Lease& operator=(Lease&& other) noexcept {
                if (this != &other) {
                    release(false);
                    move_from(std::move(other));
                }
                return *this;
            }

            Lease(Lease const&) = delete;
            Lease& operator=(Lease const&) = delete;

            /// @brief A lease dropped without release() is not reusable.
            ~Lease() { release(false); }

            Conn* operator->() const noexcept { return get(); }

            Conn& operator*() const { return *get(); }

            /// @brief Get the underlying connection, or nullptr if inert
            Conn* get() const noexcept {
                auto st = state_.lock();
                if (!st || !st->alive.load(std::memory_order_acquire))
                    return nullptr;
                return conn_;
            }

            explicit operator bool() const noexcept { return get() != nullptr; }

            Endpoint const& endpoint() const noexcept { return endpoint_; }

            std::uint64_t id() const noexcept { return id_; }

            /// @brief Hand the connection back. A reusable connection becomes
            /// Idle, anything else is destroyed. Later calls are no-ops.
            void release(bool reusable) noexcept {
                auto st = state_.lock();
                if (!conn_) return;

                // If pool is already dead, do not call back into it.
                if (!st || !st->alive.load(std::memory_order_acquire)) {
                    conn_ = nullptr;
                    return;
                }
                conn_ = nullptr;
                if (return_to_pool_) return_to_pool_(endpoint_, id_, reusable);
            }

           private:
            friend class ConnectionPool;

            /// @brief Internal state shared with the pool
            /// @note Used to detect pool shutdown
            struct State {
                std::atomic<bool> alive{true};
            };

            using ReturnFn =
                std::function<void(Endpoint const&, std::uint64_t, bool)>;

            Lease(std::weak_ptr<State> st, Conn* c, Endpoint ep,
                  std::uint64_t id, ReturnFn ret)
                : state_(std::move(st)),
                  conn_(c),
                  endpoint_(std::move(ep)),
                  id_(id),
                  return_to_pool_(std::move(ret)) {}

            void move_from(Lease&& other) noexcept {
                state_ = std::move(other.state_);
                conn_ = other.conn_;
                endpoint_ = std::move(other.endpoint_);
                id_ = other.id_;
                return_to_pool_ = std::move(other.return_to_pool_);
                other.conn_ = nullptr;
                other.id_ = 0;
            }

            std::weak_ptr<State> state_;
            Conn* conn_{nullptr};
            Endpoint endpoint_{};
            std::uint64_t id_{0};
            ReturnFn return_to_pool_;
        };

        ConnectionPool(boost::asio::any_io_executor ex,
                       std::shared_ptr<ConnectionFactory> factory,
                       PoolConfiguration cfg,
                       std::shared_ptr<MetricsDispatcher> metrics = {});

        ConnectionPool(const ConnectionPool&) = delete;
        ConnectionPool& operator=(const ConnectionPool&) = delete;

        ~ConnectionPool();

        /// @brief Lease an idle connection immediately, nullopt if none
        /// @note Non-suspending; never opens a new connection
        std::optional<Lease> try_acquire(const Endpoint& ep);

        /// @brief Acquire a connection lease, opening one when under both
        /// bounds
        /// @param ep Endpoint to connect to
        /// @param timeout Maximum time to wait for capacity
        /// @param token Cancels the wait (Aborted)
        boost::asio::awaitable<Result<Lease>> acquire(
            Endpoint ep,
            clock_type::duration timeout = clock_type::duration::max(),
            CancellationToken token = {});

        /// Shutdown the pool immediately, canceling all waiters
        void shutdown();

        /// Wait for all in-use connections to be returned (graceful shutdown)
        boost::asio::awaitable<bool> drain(clock_type::duration timeout);

        /// @brief Destroy expired or dead idle connections now.
        /// @return Number of connections destroyed
        std::size_t sweep();

        ///@brief Access metrics for monitoring
        ConnectionPoolMetrics const& metrics() const { return metrics_; }

        PoolMetricsSnapshot snapshot() const { return snapshot_of(metrics_); }

        std::size_t idle_count(const Endpoint& ep) const;
        std::size_t open_count(const Endpoint& ep) const;

        bool alive() const noexcept {
            return state_->alive.load(std::memory_order_acquire);
        }

       private:
        enum class WaitReason {
            EndpointCapacity,  ///< Blocked by per-endpoint limit
            GlobalCapacity     ///< Blocked by global pool limit
        };

        struct Waiter;

        ///@brief Per-endpoint bucket
        struct Bucket {
            /// Most recently released first.
            std::deque<std::unique_ptr<Conn>> idle;
            std::unordered_map<std::uint64_t, std::unique_ptr<Conn>>
                in_use;  ///< Leased or opening connections

            /// @brief Waiters specifically waiting for this bucket
            /// @note Secondary index into waiters_ list
            std::list<Waiter*> waiters;
        };

        /// @brief Waiter for connection availability
        struct Waiter {
            Endpoint ep;        ///< Endpoint waiting for
            WaitReason reason;  ///< Reason for waiting
            std::shared_ptr<boost::asio::steady_timer> timer;  ///< Timer for
                                                               /// timeout
            bool active{true};  ///< Whether still waiting

            /// @brief Iterator into the secondary queue (Bucket::waiters or
            /// ConnectionPool::global_waiters_)
            std::list<Waiter*>::iterator queue_it;
        };

        using Graveyard = std::vector<std::unique_ptr<Conn>>;

        void start_sweeper_();

        boost::asio::awaitable<Result<Lease>> open_(Lease lease,
                                                    CancellationToken token);

        std::optional<Lease> try_acquire_locked_(Endpoint const& ep,
                                                 bool allow_new, bool& fresh,
                                                 Graveyard& graveyard);

        Lease make_lease_(Endpoint const& ep, Conn* raw, std::uint64_t id);

        void release(Endpoint const& ep, std::uint64_t id,
                     bool reusable) noexcept;

        WaitReason determine_wait_reason_locked_(Endpoint const& ep) const;

        std::shared_ptr<boost::asio::steady_timer>
        pop_waiter_for_endpoint_locked_(Endpoint const& ep);

        void remove_waiter_locked_(std::list<Waiter>::iterator it);

        std::size_t total_idle_locked_() const;

        void prune_idle_locked_(clock_type::time_point now,
                                Graveyard& graveyard);

        bool evict_one_idle_locked_(Endpoint const& except,
                                    Graveyard& graveyard);

        void dispose_(std::unique_ptr<Conn> conn) noexcept;
        void dispose_all_(Graveyard& graveyard) noexcept;

        void check_invariants_locked_() const;

        boost::asio::any_io_executor ex_;  ///< Executor for async operations
        std::shared_ptr<ConnectionFactory> factory_;  ///< Opens connections
        PoolConfiguration cfg_;                       ///< Pool configuration
        std::shared_ptr<MetricsDispatcher> events_;   ///< Recorder front

        mutable std::mutex mu_;  ///< Mutex for protecting internal state
        std::unordered_map<Endpoint, Bucket>
            buckets_;  ///< Per-endpoint buckets

        std::list<Waiter> waiters_;  ///< Stable iterators for removal
        std::list<Waiter*>
            global_waiters_;  ///< Waiters waiting on global capacity

        std::size_t total_in_use_{0};  ///< Total in-use connections
        std::uint64_t next_id_{1};     ///< Next connection ID

        std::shared_ptr<typename Lease::State> state_;  ///< Shared pool state
        std::shared_ptr<boost::asio::steady_timer> sweep_timer_;
        ConnectionPoolMetrics metrics_;  ///< Metrics for monitoring
    };

}  // namespace flowhttp
