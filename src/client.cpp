#include "flowhttp/client.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/strand.hpp>
#include <stdexcept>

#include "flowhttp/detail/run_on.hpp"
#include "flowhttp/middleware.hpp"
#include "flowhttp/transport/tls_negotiation.hpp"

namespace flowhttp {

    namespace asio = boost::asio;

    namespace {
        PipelineOptions pipeline_options(const ClientConfiguration& cfg) {
            PipelineOptions opt;
            opt.acquire_timeout = cfg.acquire_timeout;
            opt.exchange_timeout = cfg.exchange_timeout;
            opt.bridge = cfg.bridge;
            opt.writer.user_agent = cfg.user_agent;
            opt.writer.default_headers = cfg.default_headers;
            opt.writer.compress = cfg.compress;
            return opt;
        }
    }  // namespace

    Client::Client(asio::any_io_executor ex, ClientConfiguration cfg)
        : Client(ex, std::move(cfg), nullptr) {}

    Client::Client(asio::any_io_executor ex, ClientConfiguration cfg,
                   std::shared_ptr<ConnectionFactory> connector)
        : cfg_(std::move(cfg)), strand_(asio::make_strand(ex)) {
        validate_config_();

        if (cfg_.base_url) {
            auto base_res = url_utils::parse_base_url(*cfg_.base_url);
            if (base_res.has_error()) {
                throw std::invalid_argument("Invalid base_url: " +
                                            base_res.error().message);
            }
            base_url_ = std::move(base_res.value());
        }

        metrics_ = std::make_shared<MetricsDispatcher>(
            cfg_.metrics_recorder, cfg_.uri_tagger, cfg_.metrics_enabled);

        if (connector) {
            connector_ = std::move(connector);
        } else {
            ConnectorOptions copt;
            copt.connect_timeout = cfg_.connect_timeout;
            copt.read_buffer_size =
                std::min<std::size_t>(copt.read_buffer_size,
                                      cfg_.bridge.high_water_mark);
            copt.wiretap = cfg_.wiretap;
            connector_ = std::make_shared<TcpConnector>(
                strand_, std::make_shared<TlsNegotiator>(cfg_.tls), copt,
                metrics_);
        }

        pool_ = std::make_shared<ConnectionPool>(strand_, connector_, cfg_.pool,
                                                 metrics_);
        pipeline_ = std::make_unique<Pipeline>(strand_, pool_, metrics_,
                                               pipeline_options(cfg_));
        redirect_policy_ = make_redirect_policy(cfg_);
    }

    Client::~Client() {
        // The pool is shut down and released on the strand, after the client
        // is gone.
        pipeline_.reset();
        asio::dispatch(strand_,
                       [pool = std::move(pool_)] { pool->shutdown(); });
    }

    void Client::validate_config_() {
        auto bad = [](const std::string& what) {
            throw std::invalid_argument("Invalid client configuration: " +
                                        what);
        };

        if (cfg_.pool.max_total_connections == 0)
            bad("pool.max_total_connections must be positive");
        if (cfg_.pool.max_connections_per_endpoint == 0)
            bad("pool.max_connections_per_endpoint must be positive");
        if (cfg_.pool.max_connection_reuse_count == 0)
            bad("pool.max_connection_reuse_count must be positive");
        if (cfg_.bridge.high_water_mark == 0)
            bad("bridge.high_water_mark must be positive");
        if (cfg_.bridge.low_water_mark > cfg_.bridge.high_water_mark)
            bad("bridge.low_water_mark exceeds bridge.high_water_mark");
        if (cfg_.connect_timeout.count() <= 0)
            bad("connect_timeout must be positive");
        if (cfg_.tls.handshake_timeout.count() <= 0)
            bad("tls.handshake_timeout must be positive");

        auto limits = cfg_.decoder_limits.validate();
        if (limits.has_error()) bad(limits.error().message);
    }

    void Client::shutdown() {
        asio::dispatch(strand_, [pool = pool_] { pool->shutdown(); });
    }

    Result<UrlComponents> Client::resolve_request_url(
        std::string_view url) const {
        const UrlComponents* base = base_url_ ? &*base_url_ : nullptr;
        return url_utils::resolve_url(url, base);
    }

    asio::awaitable<Result<ResponseState>> Client::send(
        Request request, CancellationToken token) {
        co_return co_await detail::run_on(
            strand_, send_on_strand_(std::move(request), std::move(token)));
    }

    asio::awaitable<Result<ResponseState>> Client::send_on_strand_(
        Request request, CancellationToken token) {
        using R = Result<ResponseState>;

        // Resolve URL
        auto u_res = resolve_request_url(request.url);
        if (u_res.has_error()) co_return R::err(u_res.error());

        if (!cfg_.interceptors.empty()) {
            for (auto const& interceptor : cfg_.interceptors) {
                if (interceptor) interceptor->prepare(request, u_res.value());
            }
            // Interceptors may rewrite the URL.
            u_res = resolve_request_url(request.url);
            if (u_res.has_error()) co_return R::err(u_res.error());
        }

        // Validate verb
        if (to_boost_http_method(request.method) == http::verb::unknown) {
            co_return R::err(Error::Code::InvalidRequest, "Unknown HTTP method");
        }

        const DecoderLimits limits =
            request.limits.value_or(cfg_.decoder_limits);
        auto valid = limits.validate();
        if (valid.has_error()) co_return R::err(valid.error());

        RequestDescriptor desc =
            make_descriptor(std::move(request), std::move(u_res.value()));

        for (std::size_t hops = 0;;) {
            auto res = co_await pipeline_->execute(desc, limits, token);
            if (res.has_error()) co_return std::move(res);

            auto& response = res.value();
            auto decision = redirect_policy_->evaluate(desc, response);
            if (!decision.follow || !decision.request) co_return std::move(res);

            if (hops >= cfg_.max_redirects) {
                response.body().cancel();
                co_return R::err(Error::Code::RedirectLimitExceeded,
                                 "More than " +
                                     std::to_string(cfg_.max_redirects) +
                                     " redirects");
            }
            ++hops;

            // Drain a small redirect body so its connection can be reused.
            auto drained =
                co_await response.body().read_all(cfg_.redirect_drain_limit);
            if (drained.has_error()) {
                SPDLOG_DEBUG("Redirect body discarded: {}",
                             drained.error().message);
            }

            RequestDescriptor next = std::move(*decision.request);
            if (cfg_.redirect_request_hook) cfg_.redirect_request_hook(next);

            SPDLOG_DEBUG("Following {} from {} to {}", response.status(),
                         desc.uri.to_string(), next.uri.to_string());
            desc = std::move(next);
        }
    }

    asio::awaitable<Result<ResponseState>> Client::simple_(
        HttpMethod method, std::string url, std::optional<std::string> body) {
        Request r;
        r.method = method;
        r.url = std::move(url);
        if (body) r.body = string_body(std::move(*body));
        co_return co_await send(std::move(r));
    }

    asio::awaitable<Result<ResponseState>> Client::get(std::string url) {
        co_return co_await simple_(HttpMethod::Get, std::move(url), std::nullopt);
    }

    asio::awaitable<Result<ResponseState>> Client::head(std::string url) {
        co_return co_await simple_(HttpMethod::Head, std::move(url),
                                   std::nullopt);
    }

    asio::awaitable<Result<ResponseState>> Client::del(std::string url) {
        co_return co_await simple_(HttpMethod::Delete, std::move(url),
                                   std::nullopt);
    }

    asio::awaitable<Result<ResponseState>> Client::options(std::string url) {
        co_return co_await simple_(HttpMethod::Options, std::move(url),
                                   std::nullopt);
    }

    asio::awaitable<Result<ResponseState>> Client::post(std::string url,
                                                        std::string body) {
        co_return co_await simple_(HttpMethod::Post, std::move(url),
                                   std::move(body));
    }

    asio::awaitable<Result<ResponseState>> Client::put(std::string url,
                                                       std::string body) {
        co_return co_await simple_(HttpMethod::Put, std::move(url),
                                   std::move(body));
    }

    asio::awaitable<Result<ResponseState>> Client::patch(std::string url,
                                                         std::string body) {
        co_return co_await simple_(HttpMethod::Patch, std::move(url),
                                   std::move(body));
    }

}  // namespace flowhttp
