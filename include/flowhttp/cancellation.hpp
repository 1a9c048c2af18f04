#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace flowhttp {

    namespace detail {
        struct CancellationState {
            std::mutex mu;
            std::atomic<bool> cancelled{false};
            std::uint64_t next_id{1};
            std::map<std::uint64_t, std::function<void()>> callbacks;
        };
    }  // namespace detail

    /**
     * @brief RAII handle for a callback registered on a CancellationToken.
     *
     * Destroying the handle unregisters the callback. Callbacks run on the
     * thread that calls CancellationSource::cancel(); receivers that own
     * strand-confined state must hop onto their strand.
     */
    class CancellationRegistration {
       public:
        CancellationRegistration() = default;

        CancellationRegistration(CancellationRegistration&& other) noexcept
            : state_(std::move(other.state_)), id_(other.id_) {
            other.id_ = 0;
        }

        CancellationRegistration& operator=(
            CancellationRegistration&& other) noexcept {
            if (this != &other) {
                reset();
                state_ = std::move(other.state_);
                id_ = other.id_;
                other.id_ = 0;
            }
            return *this;
        }

        CancellationRegistration(CancellationRegistration const&) = delete;
        CancellationRegistration& operator=(CancellationRegistration const&) =
            delete;

        ~CancellationRegistration() { reset(); }

        void reset() noexcept {
            auto st = state_.lock();
            if (st && id_ != 0) {
                std::lock_guard<std::mutex> lk(st->mu);
                st->callbacks.erase(id_);
            }
            state_.reset();
            id_ = 0;
        }

       private:
        friend class CancellationToken;

        CancellationRegistration(std::weak_ptr<detail::CancellationState> st,
                                 std::uint64_t id)
            : state_(std::move(st)), id_(id) {}

        std::weak_ptr<detail::CancellationState> state_;
        std::uint64_t id_{0};
    };

    /// @brief Observer side of a cancellation signal. A default-constructed
    /// token can never be cancelled.
    class CancellationToken {
       public:
        CancellationToken() = default;

        bool can_be_cancelled() const noexcept { return state_ != nullptr; }

        bool cancelled() const noexcept {
            return state_ && state_->cancelled.load(std::memory_order_acquire);
        }

        /// @brief Register a callback fired once on cancellation. Fires
        /// immediately when the token is already cancelled.
        [[nodiscard]] CancellationRegistration on_cancel(
            std::function<void()> cb) const {
            if (!state_) return {};
            {
                std::lock_guard<std::mutex> lk(state_->mu);
                if (!state_->cancelled.load(std::memory_order_acquire)) {
                    auto id = state_->next_id++;
                    state_->callbacks.emplace(id, std::move(cb));
                    return CancellationRegistration(state_, id);
                }
            }
            cb();
            return {};
        }

       private:
        friend class CancellationSource;

        explicit CancellationToken(
            std::shared_ptr<detail::CancellationState> st)
            : state_(std::move(st)) {}

        std::shared_ptr<detail::CancellationState> state_;
    };

    /// @brief Owner side of a cancellation signal.
    class CancellationSource {
       public:
        CancellationSource()
            : state_(std::make_shared<detail::CancellationState>()) {}

        CancellationToken token() const { return CancellationToken(state_); }

        bool cancelled() const noexcept {
            return state_->cancelled.load(std::memory_order_acquire);
        }

        /// @brief Signal cancellation. Only the first call fires callbacks.
        void cancel() {
            std::vector<std::function<void()>> to_run;
            {
                std::lock_guard<std::mutex> lk(state_->mu);
                if (state_->cancelled.exchange(true, std::memory_order_acq_rel))
                    return;
                for (auto& [id, cb] : state_->callbacks) {
                    (void)id;
                    to_run.push_back(std::move(cb));
                }
                state_->callbacks.clear();
            }
            // Run outside the lock so callbacks may register or reset.
            for (auto& cb : to_run) {
                if (cb) cb();
            }
        }

       private:
        std::shared_ptr<detail::CancellationState> state_;
    };

}  // namespace flowhttp
