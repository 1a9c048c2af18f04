#pragma once

#include <memory>
#include <optional>

#include "config.hpp"
#include "request.hpp"
#include "response.hpp"

namespace flowhttp {

    /// @brief Outcome of evaluating one response. The original request is
    /// never modified; a followed redirect carries a new descriptor.
    struct RedirectDecision {
        bool follow{false};
        std::optional<RequestDescriptor> request;

        static RedirectDecision stop() { return {}; }
    };

    /**
     * @brief Decides whether a response is followed as a redirect, and with
     * which request.
     */
    class RedirectPolicy {
       public:
        virtual ~RedirectPolicy() = default;

        virtual RedirectDecision evaluate(const RequestDescriptor& request,
                                          const ResponseState& response) const = 0;
    };

    /// @brief Follows 301, 302, 307 and 308.
    class DefaultRedirectPolicy : public RedirectPolicy {
       public:
        RedirectDecision evaluate(const RequestDescriptor& request,
                                  const ResponseState& response) const override;
    };

    /// @brief Follows whatever the user predicate accepts.
    class PredicateRedirectPolicy : public RedirectPolicy {
       public:
        explicit PredicateRedirectPolicy(RedirectPredicate predicate)
            : predicate_(std::move(predicate)) {}

        RedirectDecision evaluate(const RequestDescriptor& request,
                                  const ResponseState& response) const override;

       private:
        RedirectPredicate predicate_;
    };

    /// @brief Never follows.
    class NoRedirectPolicy : public RedirectPolicy {
       public:
        RedirectDecision evaluate(const RequestDescriptor&,
                                  const ResponseState&) const override {
            return RedirectDecision::stop();
        }
    };

    /// @brief Status codes the default policy follows.
    constexpr bool is_followed_redirect_status(int status) noexcept {
        return status == 301 || status == 302 || status == 307 ||
               status == 308;
    }

    /**
     * @brief Build the request that follows `response`.
     *
     * Location is resolved against the original URI. 303, and 301/302 for
     * methods other than GET and HEAD, become GET without body. Credentials
     * are dropped when the endpoint changes.
     * @return nullopt when Location is missing or invalid, or when the body
     * would have to be replayed and its producer is not restartable.
     */
    std::optional<RequestDescriptor> build_redirect_request(
        const RequestDescriptor& original, const ResponseState& response);

    /// @brief Policy selected by the client configuration: off, predicate,
    /// or the status default.
    std::shared_ptr<const RedirectPolicy> make_redirect_policy(
        const ClientConfiguration& cfg);

}  // namespace flowhttp
