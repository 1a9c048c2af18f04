#include "flowhttp/redirect_policy.hpp"

#include <spdlog/spdlog.h>

namespace flowhttp {

    namespace {
        RedirectDecision follow_with(const RequestDescriptor& request,
                                     const ResponseState& response) {
            auto next = build_redirect_request(request, response);
            if (!next) return RedirectDecision::stop();
            return RedirectDecision{true, std::move(next)};
        }

        void drop_body(RequestDescriptor& d) {
            d.body.reset();
            d.explicit_content_length = false;
            d.headers.erase(http::field::content_length);
            d.headers.erase(http::field::content_type);
            d.headers.erase(http::field::content_encoding);
            d.headers.erase(http::field::transfer_encoding);
        }
    }  // namespace

    RedirectDecision DefaultRedirectPolicy::evaluate(
        const RequestDescriptor& request, const ResponseState& response) const {
        if (!is_followed_redirect_status(response.status())) {
            return RedirectDecision::stop();
        }
        return follow_with(request, response);
    }

    RedirectDecision PredicateRedirectPolicy::evaluate(
        const RequestDescriptor& request, const ResponseState& response) const {
        if (!predicate_ || !predicate_(request, response)) {
            return RedirectDecision::stop();
        }
        return follow_with(request, response);
    }

    std::optional<RequestDescriptor> build_redirect_request(
        const RequestDescriptor& original, const ResponseState& response) {
        const std::string location = response.header("Location");
        if (location.empty()) {
            SPDLOG_DEBUG("{} response without Location, not following",
                         response.status());
            return std::nullopt;
        }

        auto target = url_utils::resolve_reference(original.uri, location);
        if (target.has_error()) {
            SPDLOG_DEBUG("Not following invalid Location '{}': {}", location,
                         target.error().message);
            return std::nullopt;
        }

        RequestDescriptor next = original;
        next.uri = std::move(target).value();

        const int status = response.status();
        const bool to_get =
            status == 303 ||
            ((status == 301 || status == 302) &&
             original.method != HttpMethod::Get &&
             original.method != HttpMethod::Head);

        if (to_get) {
            if (original.method != HttpMethod::Head) next.method = HttpMethod::Get;
            drop_body(next);
        } else if (next.body && !next.body->restartable()) {
            SPDLOG_DEBUG("Not following {}: request body cannot be replayed",
                         status);
            return std::nullopt;
        }

        if (next.endpoint() != original.endpoint()) {
            next.headers.erase(http::field::authorization);
            next.headers.erase(http::field::cookie);
            next.headers.erase(http::field::proxy_authorization);
            next.headers.erase(http::field::host);
        }
        return next;
    }

    std::shared_ptr<const RedirectPolicy> make_redirect_policy(
        const ClientConfiguration& cfg) {
        if (!cfg.follow_redirects) return std::make_shared<NoRedirectPolicy>();
        if (cfg.redirect_predicate) {
            return std::make_shared<PredicateRedirectPolicy>(
                cfg.redirect_predicate);
        }
        return std::make_shared<DefaultRedirectPolicy>();
    }

}  // namespace flowhttp
