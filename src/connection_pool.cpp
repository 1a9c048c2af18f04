#include "flowhttp/connection/connection_pool.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>
#include <cassert>
#include <unordered_set>

namespace flowhttp {

    namespace asio = boost::asio;

    ConnectionPool::ConnectionPool(asio::any_io_executor ex,
                                   std::shared_ptr<ConnectionFactory> factory,
                                   PoolConfiguration cfg,
                                   std::shared_ptr<MetricsDispatcher> metrics)
        : ex_(std::move(ex)),
          factory_(std::move(factory)),
          cfg_(cfg),
          events_(std::move(metrics)),
          state_(std::make_shared<typename Lease::State>()),
          sweep_timer_(std::make_shared<asio::steady_timer>(ex_)) {
        start_sweeper_();
    }

    ConnectionPool::~ConnectionPool() {
        shutdown();
        sweep_timer_->cancel();

        // Leased connections die with the pool; their leases are inert now.
        Graveyard graveyard;
        {
            std::lock_guard<std::mutex> lk(mu_);
            for (auto& [_, bucket] : buckets_) {
                for (auto& e : bucket.idle) graveyard.push_back(std::move(e));
                bucket.idle.clear();
                for (auto& [__, up] : bucket.in_use) {
                    graveyard.push_back(std::move(up));
                }
                bucket.in_use.clear();
            }
            total_in_use_ = 0;
        }
        dispose_all_(graveyard);
    }

    // -------------------------
    // acquire
    // -------------------------

    std::optional<ConnectionPool::Lease> ConnectionPool::try_acquire(
        const Endpoint& ep) {
        Graveyard graveyard;
        std::optional<Lease> out;
        {
            std::lock_guard<std::mutex> lk(mu_);
            bool fresh = false;
            out = try_acquire_locked_(ep, /*allow_new=*/false, fresh,
                                      graveyard);
        }
        dispose_all_(graveyard);
        if (out) {
            metrics_.acquire_success.fetch_add(1, std::memory_order_relaxed);
        }
        return out;
    }

    asio::awaitable<Result<ConnectionPool::Lease>> ConnectionPool::acquire(
        Endpoint ep, clock_type::duration timeout, CancellationToken token) {
        const bool infinite = timeout == clock_type::duration::max();
        const auto deadline = infinite ? clock_type::time_point::max()
                                       : clock_type::now() + timeout;

        for (;;) {
            if (token.cancelled()) {
                metrics_.acquire_cancelled.fetch_add(
                    1, std::memory_order_relaxed);
                co_return Result<Lease>::err(Error::Code::Aborted,
                                             "Acquire cancelled");
            }

            // Fast path: try without allocating a waiter
            {
                Graveyard graveyard;
                std::optional<Lease> l;
                bool fresh = false;
                {
                    std::lock_guard<std::mutex> lk(mu_);
                    l = try_acquire_locked_(ep, /*allow_new=*/true, fresh,
                                            graveyard);
                }
                dispose_all_(graveyard);

                if (l) {
                    if (fresh) {
                        co_return co_await open_(std::move(*l), token);
                    }
                    metrics_.acquire_success.fetch_add(
                        1, std::memory_order_relaxed);
                    co_return Result<Lease>::ok(std::move(*l));
                }
            }

            // Check if we are shutting down
            if (!state_->alive.load(std::memory_order_acquire)) {
                metrics_.acquire_shutdown.fetch_add(1,
                                                    std::memory_order_relaxed);
                co_return Result<Lease>::err(Error::Code::Shutdown,
                                             "Pool is shutting down");
            }

            auto t = std::make_shared<asio::steady_timer>(ex_);
            t->expires_at(deadline);

            std::list<Waiter>::iterator my_waiter_it;
            {
                std::lock_guard<std::mutex> lk(mu_);

                // Re-check shutdown under lock
                if (!state_->alive.load(std::memory_order_acquire)) {
                    metrics_.acquire_shutdown.fetch_add(
                        1, std::memory_order_relaxed);
                    co_return Result<Lease>::err(Error::Code::Shutdown,
                                                 "Pool is shutting down");
                }

                WaitReason reason = determine_wait_reason_locked_(ep);

                my_waiter_it = waiters_.emplace(waiters_.end(),
                                                Waiter{ep, reason, t, true, {}});

                if (reason == WaitReason::EndpointCapacity) {
                    auto& b = buckets_[ep];
                    b.waiters.push_back(&(*my_waiter_it));
                    my_waiter_it->queue_it = std::prev(b.waiters.end());
                } else {
                    global_waiters_.push_back(&(*my_waiter_it));
                    my_waiter_it->queue_it = std::prev(global_waiters_.end());
                }

                metrics_.waiters_total.fetch_add(1, std::memory_order_relaxed);
            }

            SPDLOG_DEBUG("Waiting for a connection to {}", ep.to_string());

            // Cancellation may come from any thread; the timer lives on ex_.
            std::weak_ptr<asio::steady_timer> weak_timer = t;
            auto registration = token.on_cancel([ex = ex_, weak_timer] {
                asio::dispatch(ex, [weak_timer] {
                    if (auto timer = weak_timer.lock()) timer->cancel();
                });
            });

            // A wake-up or cancel delivered before the wait started would be
            // lost on the timer, so check for it first.
            bool woken = token.cancelled();
            {
                std::lock_guard<std::mutex> lk(mu_);
                woken = woken || !my_waiter_it->active;
            }

            boost::system::error_code ec = asio::error::operation_aborted;
            if (!woken) {
                co_await t->async_wait(
                    asio::redirect_error(asio::use_awaitable, ec));
            }
            registration.reset();

            bool handed_wakeup = false;
            {
                std::lock_guard<std::mutex> lk(mu_);
                // Still active means we woke on timeout or cancel and must
                // leave the secondary queue ourselves.
                handed_wakeup = !my_waiter_it->active;
                if (my_waiter_it->active) {
                    remove_waiter_locked_(my_waiter_it);
                }
                waiters_.erase(my_waiter_it);
            }

            const bool cancelled = token.cancelled();
            const bool timed_out = !ec;

            if (cancelled || timed_out) {
                // Pass a wake-up we were handed but will not use.
                if (handed_wakeup) {
                    std::shared_ptr<asio::steady_timer> next;
                    {
                        std::lock_guard<std::mutex> lk(mu_);
                        next = pop_waiter_for_endpoint_locked_(ep);
                    }
                    if (next) next->cancel();
                }
                if (cancelled) {
                    metrics_.acquire_cancelled.fetch_add(
                        1, std::memory_order_relaxed);
                    co_return Result<Lease>::err(Error::Code::Aborted,
                                                 "Acquire cancelled");
                }
                metrics_.acquire_timeout.fetch_add(1,
                                                   std::memory_order_relaxed);
                SPDLOG_DEBUG("Acquire for {} timed out", ep.to_string());
                co_return Result<Lease>::err(Error::Code::Timeout,
                                             "Acquire timeout for " +
                                                 ep.to_string());
            }

            // operation_aborted: capacity was freed or the pool shut down;
            // loop to re-check both.
        }
    }

    asio::awaitable<Result<ConnectionPool::Lease>> ConnectionPool::open_(
        Lease lease, CancellationToken token) {
        const Endpoint ep = lease.endpoint();

        auto res = co_await factory_->connect(ep, token);
        if (token.cancelled()) {
            // The reserved slot goes back before the caller hears of it.
            if (res.has_value() && res.value().transport) {
                res.value().transport->close();
            }
            lease.release(false);
            metrics_.acquire_cancelled.fetch_add(1, std::memory_order_relaxed);
            co_return Result<Lease>::err(Error::Code::Aborted,
                                         "Acquire cancelled while connecting");
        }
        if (res.has_error()) {
            metrics_.connect_failed.fetch_add(1, std::memory_order_relaxed);
            lease.release(false);
            co_return Result<Lease>::err(std::move(res).error());
        }

        auto established = std::move(res).value();
        Conn* c = lease.get();
        if (!c) {
            // Shut down while connecting.
            if (established.transport) established.transport->close();
            metrics_.acquire_shutdown.fetch_add(1, std::memory_order_relaxed);
            co_return Result<Lease>::err(Error::Code::Shutdown,
                                         "Pool is shutting down");
        }

        {
            std::lock_guard<std::mutex> lk(mu_);
            c->transport_ = std::move(established.transport);
            c->session_ = std::move(established.session);
            c->last_activity_ = clock_type::now();
        }
        SPDLOG_DEBUG("Opened connection #{} to {}", c->id(), ep.to_string());

        metrics_.acquire_success.fetch_add(1, std::memory_order_relaxed);
        co_return Result<Lease>::ok(std::move(lease));
    }

    // -------------------------
    // shutdown / drain / sweep
    // -------------------------

    void ConnectionPool::shutdown() {
        state_->alive.store(false, std::memory_order_release);

        // Cancel all waiters; each removes its own entry when it wakes.
        std::vector<std::shared_ptr<asio::steady_timer>> to_cancel;
        Graveyard graveyard;
        {
            std::lock_guard<std::mutex> lk(mu_);
            for (auto it = waiters_.begin(); it != waiters_.end(); ++it) {
                remove_waiter_locked_(it);
                if (it->timer) to_cancel.push_back(it->timer);
            }

            if (cfg_.close_on_shutdown) {
                for (auto& [_, bucket] : buckets_) {
                    for (auto& e : bucket.idle) {
                        graveyard.push_back(std::move(e));
                    }
                    bucket.idle.clear();
                }
                metrics_.total_idle.store(0, std::memory_order_relaxed);
            }
        }

        for (auto& t : to_cancel) t->cancel();
        dispose_all_(graveyard);
    }

    asio::awaitable<bool> ConnectionPool::drain(clock_type::duration timeout) {
        auto deadline = clock_type::now() + timeout;

        while (clock_type::now() < deadline) {
            {
                std::lock_guard<std::mutex> lk(mu_);
                if (total_in_use_ == 0) {
                    co_return true;  // All connections returned
                }
            }

            // Wait a bit before checking again
            auto timer = std::make_shared<asio::steady_timer>(ex_);
            timer->expires_after(std::chrono::milliseconds(10));
            co_await timer->async_wait(asio::use_awaitable);
        }

        std::lock_guard<std::mutex> lk(mu_);
        co_return total_in_use_ == 0;
    }

    std::size_t ConnectionPool::sweep() {
        Graveyard graveyard;
        {
            std::lock_guard<std::mutex> lk(mu_);
            prune_idle_locked_(clock_type::now(), graveyard);
        }
        const auto n = graveyard.size();
        if (n) SPDLOG_DEBUG("Idle sweep destroyed {} connection(s)", n);
        dispose_all_(graveyard);
        return n;
    }

    void ConnectionPool::start_sweeper_() {
        if (cfg_.sweep_interval.count() <= 0) return;

        std::weak_ptr<typename Lease::State> weak = state_;
        auto timer = sweep_timer_;
        const auto interval = cfg_.sweep_interval;

        asio::co_spawn(
            ex_,
            [this, weak, timer, interval]() -> asio::awaitable<void> {
                for (;;) {
                    timer->expires_after(interval);
                    boost::system::error_code ec;
                    co_await timer->async_wait(
                        asio::redirect_error(asio::use_awaitable, ec));

                    // `this` is only valid while the pool is alive.
                    auto st = weak.lock();
                    if (!st || !st->alive.load(std::memory_order_acquire))
                        co_return;
                    sweep();
                }
            },
            asio::detached);
    }

    std::size_t ConnectionPool::idle_count(const Endpoint& ep) const {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = buckets_.find(ep);
        return it == buckets_.end() ? 0 : it->second.idle.size();
    }

    std::size_t ConnectionPool::open_count(const Endpoint& ep) const {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = buckets_.find(ep);
        if (it == buckets_.end()) return 0;
        return it->second.idle.size() + it->second.in_use.size();
    }

    // -------------------------
    // return path
    // -------------------------

    void ConnectionPool::release(Endpoint const& ep, std::uint64_t id,
                                 bool reusable) noexcept {
        std::shared_ptr<asio::steady_timer> w;
        std::unique_ptr<Conn> dead;

        {
            std::lock_guard<std::mutex> lk(mu_);
            auto it = buckets_.find(ep);
            if (it == buckets_.end()) {
                metrics_.release_invalid_id.fetch_add(
                    1, std::memory_order_relaxed);
                return;
            }

            auto& b = it->second;
            auto it2 = b.in_use.find(id);
            if (it2 == b.in_use.end()) {
                metrics_.release_invalid_id.fetch_add(
                    1, std::memory_order_relaxed);
                return;
            }

            auto up = std::move(it2->second);
            b.in_use.erase(it2);
            --total_in_use_;
            metrics_.total_in_use.store(total_in_use_,
                                        std::memory_order_relaxed);

            const auto now = clock_type::now();
            bool keep = reusable && up && up->transport_ &&
                        state_->alive.load(std::memory_order_acquire) &&
                        up->transport_->probe();

            if (keep && up->reuse_count_ >= cfg_.max_connection_reuse_count) {
                metrics_.connection_dropped_reuse_limit.fetch_add(
                    1, std::memory_order_relaxed);
                keep = false;
            }
            if (keep && cfg_.max_life_time.count() > 0 &&
                now - up->created_ > cfg_.max_life_time) {
                metrics_.connection_dropped_age_limit.fetch_add(
                    1, std::memory_order_relaxed);
                keep = false;
            }

            if (keep) {
                up->state_ = ConnectionState::Idle;
                up->last_activity_ = now;
                // Watch the idle socket so a peer close is noticed.
                up->transport_->attach(nullptr);
                up->transport_->set_read_enabled(true);
                b.idle.push_front(std::move(up));
                metrics_.total_idle.fetch_add(1, std::memory_order_relaxed);
            } else {
                dead = std::move(up);
            }

            // Pop waiter UNDER LOCK, but don't cancel just yet
            w = pop_waiter_for_endpoint_locked_(ep);

            check_invariants_locked_();
        }

        if (dead) dispose_(std::move(dead));

        // Cancel OUTSIDE lock to avoid deadlock
        if (w) w->cancel();
    }

    // -------------------------
    // locked helpers
    // -------------------------

    ConnectionPool::Lease ConnectionPool::make_lease_(Endpoint const& ep,
                                                      Conn* raw,
                                                      std::uint64_t id) {
        return Lease(state_, raw, ep, id,
                     [this](Endpoint const& e, std::uint64_t id_, bool reuse) {
                         release(e, id_, reuse);
                     });
    }

    std::optional<ConnectionPool::Lease> ConnectionPool::try_acquire_locked_(
        Endpoint const& ep, bool allow_new, bool& fresh, Graveyard& graveyard) {
        fresh = false;
        if (!state_->alive.load(std::memory_order_acquire)) {
            return std::nullopt;
        }

        const auto now = clock_type::now();
        prune_idle_locked_(now, graveyard);

        auto& b = buckets_[ep];

        // Prefer reusing idle connections
        while (!b.idle.empty()) {
            std::unique_ptr<Conn> up;
            if (cfg_.leasing == LeasingStrategy::Lifo) {
                up = std::move(b.idle.front());
                b.idle.pop_front();
            } else {
                up = std::move(b.idle.back());
                b.idle.pop_back();
            }
            metrics_.total_idle.fetch_sub(1, std::memory_order_relaxed);

            if (!up->transport_ || !up->transport_->probe()) {
                metrics_.connection_dropped_unhealthy.fetch_add(
                    1, std::memory_order_relaxed);
                graveyard.push_back(std::move(up));
                continue;
            }

            if (up->reuse_count_ >= cfg_.max_connection_reuse_count) {
                metrics_.connection_dropped_reuse_limit.fetch_add(
                    1, std::memory_order_relaxed);
                graveyard.push_back(std::move(up));
                continue;
            }

            if (cfg_.max_life_time.count() > 0 &&
                now - up->created_ > cfg_.max_life_time) {
                metrics_.connection_dropped_age_limit.fetch_add(
                    1, std::memory_order_relaxed);
                graveyard.push_back(std::move(up));
                continue;
            }

            // Connection is good to reuse; reads stay off until the exchange
            // attaches its sink.
            up->transport_->set_read_enabled(false);
            up->reuse_count_++;
            up->state_ = ConnectionState::Leased;
            up->last_activity_ = now;

            const auto id = up->id_;
            Conn* raw = up.get();
            b.in_use.emplace(id, std::move(up));
            ++total_in_use_;

            metrics_.total_in_use.store(total_in_use_,
                                        std::memory_order_relaxed);
            metrics_.connection_reused.fetch_add(1, std::memory_order_relaxed);
            SPDLOG_DEBUG("Reusing connection #{} to {}", id, ep.to_string());

            check_invariants_locked_();
            return make_lease_(ep, raw, id);
        }

        if (!allow_new) return std::nullopt;

        // No idle connections available, check capacity for creating new
        const std::size_t endpoint_total = b.in_use.size() + b.idle.size();
        if (endpoint_total >= cfg_.max_connections_per_endpoint)
            return std::nullopt;

        if (total_in_use_ + total_idle_locked_() >= cfg_.max_total_connections) {
            // Idle connections of other endpoints yield to live demand.
            if (!evict_one_idle_locked_(ep, graveyard)) return std::nullopt;
        }

        // Reserve the slot; it counts against both bounds while opening.
        const auto id = next_id_++;
        auto up = std::make_unique<Conn>(id, ep);
        Conn* raw = up.get();
        b.in_use.emplace(id, std::move(up));
        ++total_in_use_;

        metrics_.total_in_use.store(total_in_use_, std::memory_order_relaxed);
        metrics_.connection_created.fetch_add(1, std::memory_order_relaxed);
        fresh = true;

        check_invariants_locked_();
        return make_lease_(ep, raw, id);
    }

    ConnectionPool::WaitReason ConnectionPool::determine_wait_reason_locked_(
        Endpoint const& ep) const {
        auto it = buckets_.find(ep);
        if (it == buckets_.end()) {
            return WaitReason::GlobalCapacity;
        }

        auto const& b = it->second;
        std::size_t ep_total = b.in_use.size() + b.idle.size();

        if (ep_total >= cfg_.max_connections_per_endpoint) {
            return WaitReason::EndpointCapacity;
        }
        return WaitReason::GlobalCapacity;
    }

    std::shared_ptr<asio::steady_timer>
    ConnectionPool::pop_waiter_for_endpoint_locked_(Endpoint const& ep) {
        // First: try endpoint-specific waiters (O(1))
        auto it = buckets_.find(ep);
        if (it != buckets_.end()) {
            auto& b = it->second;
            while (!b.waiters.empty()) {
                Waiter* w = b.waiters.front();
                b.waiters.pop_front();  // Remove from secondary queue

                if (w->active) {
                    w->active = false;
                    metrics_.waiters_total.fetch_sub(
                        1, std::memory_order_relaxed);
                    return w->timer;
                }
            }
        }

        // Second: waiters blocked on global capacity (O(1))
        while (!global_waiters_.empty()) {
            Waiter* w = global_waiters_.front();
            global_waiters_.pop_front();  // Remove from secondary queue

            if (w->active) {
                w->active = false;
                metrics_.waiters_total.fetch_sub(1, std::memory_order_relaxed);
                return w->timer;
            }
        }

        return {};
    }

    void ConnectionPool::remove_waiter_locked_(std::list<Waiter>::iterator it) {
        if (it == waiters_.end() || !it->active) return;
        if (it->reason == WaitReason::EndpointCapacity) {
            auto b = buckets_.find(it->ep);
            if (b != buckets_.end()) b->second.waiters.erase(it->queue_it);
        } else {
            global_waiters_.erase(it->queue_it);
        }
        it->active = false;
        metrics_.waiters_total.fetch_sub(1, std::memory_order_relaxed);
    }

    std::size_t ConnectionPool::total_idle_locked_() const {
        std::size_t n = 0;
        for (auto const& [_, b] : buckets_) n += b.idle.size();
        return n;
    }

    void ConnectionPool::prune_idle_locked_(clock_type::time_point now,
                                            Graveyard& graveyard) {
        const bool idle_limit = cfg_.max_idle_time.count() > 0;
        const bool life_limit = cfg_.max_life_time.count() > 0;

        for (auto& [_, b] : buckets_) {
            for (auto it = b.idle.begin(); it != b.idle.end();) {
                Conn const& c = **it;
                const bool expired =
                    (idle_limit && now - c.last_activity_ > cfg_.max_idle_time) ||
                    (life_limit && now - c.created_ > cfg_.max_life_time);
                const bool dead = !c.transport_ || !c.transport_->probe();

                if (!expired && !dead) {
                    ++it;
                    continue;
                }

                if (expired) {
                    metrics_.connection_pruned.fetch_add(
                        1, std::memory_order_relaxed);
                } else {
                    metrics_.connection_dropped_unhealthy.fetch_add(
                        1, std::memory_order_relaxed);
                }
                graveyard.push_back(std::move(*it));
                it = b.idle.erase(it);
                metrics_.total_idle.fetch_sub(1, std::memory_order_relaxed);
            }
        }
    }

    bool ConnectionPool::evict_one_idle_locked_(Endpoint const& except,
                                                Graveyard& graveyard) {
        Bucket* victim = nullptr;
        for (auto& [ep, b] : buckets_) {
            if (ep == except || b.idle.empty()) continue;
            if (!victim || b.idle.back()->last_activity_ <
                               victim->idle.back()->last_activity_) {
                victim = &b;
            }
        }
        if (!victim) return false;

        graveyard.push_back(std::move(victim->idle.back()));
        victim->idle.pop_back();
        metrics_.total_idle.fetch_sub(1, std::memory_order_relaxed);
        metrics_.connection_pruned.fetch_add(1, std::memory_order_relaxed);
        return true;
    }

    void ConnectionPool::dispose_(std::unique_ptr<Conn> conn) noexcept {
        if (!conn) return;
        conn->state_ = ConnectionState::Closing;
        if (conn->transport_) {
            metrics_.connection_closed.fetch_add(1, std::memory_order_relaxed);
            conn->transport_->close();
            if (events_) events_->connection_closed(conn->endpoint_);
        }
        SPDLOG_DEBUG("Closed connection #{} to {}", conn->id_,
                     conn->endpoint_.to_string());
    }

    void ConnectionPool::dispose_all_(Graveyard& graveyard) noexcept {
        for (auto& c : graveyard) dispose_(std::move(c));
        graveyard.clear();
    }

    /// @brief Check internal invariants, only in debug builds
    void ConnectionPool::check_invariants_locked_() const {
#ifndef NDEBUG
        std::size_t computed_total = 0;

        for (auto const& [ep, b] : buckets_) {
            computed_total += b.in_use.size();
            assert(b.in_use.size() + b.idle.size() <=
                       cfg_.max_connections_per_endpoint &&
                   "per-endpoint bound exceeded");

            std::unordered_set<Conn const*> in_use_ptrs;
            for (auto const& [id, up] : b.in_use) {
                assert(up && "in_use connection is null");
                in_use_ptrs.insert(up.get());
            }

            for (auto const& entry : b.idle) {
                assert(entry && "idle connection is null");
                assert(in_use_ptrs.find(entry.get()) == in_use_ptrs.end() &&
                       "connection in both idle and in_use");
            }
        }

        assert(computed_total == total_in_use_ && "total_in_use_ drift");
#endif
    }

}  // namespace flowhttp
