// tests/test_client_httplib.cpp
//
// Client suite against an independent server implementation (cpp-httplib).
//
// Never hangs forever:
// - runs io_context on a dedicated thread
// - waits using std::future::wait_for (not Asio timers)
// - if a timeout happens, fails + aborts to avoid wedging CI.

#include <gtest/gtest.h>
#include <httplib.h>

#include <atomic>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "flowhttp/client.hpp"
#include "support/test_util.hpp"

namespace net = boost::asio;

using flowhttp::test::await_or_abort;
using flowhttp::test::flush_posted;
using flowhttp::test::IoThreadRunner;

namespace {

    // ---------------------
    // Test HTTP Server
    // ---------------------
    struct HttpTestServer {
        using Handler =
            std::function<void(const httplib::Request&, httplib::Response&)>;

        explicit HttpTestServer(Handler h, bool honor_keep_alive = false)
            : handler_(std::move(h)), honor_keep_alive_(honor_keep_alive) {
            svr_.set_keep_alive_max_count(honor_keep_alive ? 10 : 1);
            svr_.set_keep_alive_timeout(5);

            auto func = [this](const httplib::Request& req,
                               httplib::Response& res) {
                request_count++;
                {
                    std::lock_guard lk(last_req_mu_);
                    last_method = req.method;
                    last_target = req.target;
                    last_body = req.body;
                }

                int cur = inflight.fetch_add(1) + 1;
                int prev = max_inflight.load();
                while (cur > prev &&
                       !max_inflight.compare_exchange_weak(prev, cur)) {
                }

                handler_(req, res);

                if (!honor_keep_alive_) {
                    res.set_header("Connection", "close");
                }

                inflight.fetch_sub(1);
            };

            svr_.Get(".*", func);
            svr_.Post(".*", func);
            svr_.Put(".*", func);
            svr_.Patch(".*", func);
            svr_.Delete(".*", func);
            svr_.Options(".*", func);

            port_ = svr_.bind_to_any_port("127.0.0.1");
            thread_ = std::thread([this] { svr_.listen_after_bind(); });
        }

        ~HttpTestServer() {
            svr_.stop();
            if (thread_.joinable()) thread_.join();
        }

        uint16_t port() const noexcept { return static_cast<uint16_t>(port_); }

        std::atomic<int> request_count{0};
        std::atomic<int> max_inflight{0};
        std::atomic<int> inflight{0};

        std::mutex last_req_mu_;
        std::string last_method;
        std::string last_target;
        std::string last_body;

       private:
        httplib::Server svr_;
        Handler handler_;
        bool honor_keep_alive_;
        std::thread thread_;
        int port_;
    };

    // ---------------------
    // Config helpers
    // ---------------------
    flowhttp::ClientConfiguration make_cfg(
        std::optional<std::string> base_url = std::nullopt) {
        flowhttp::ClientConfiguration cfg{};
        cfg.base_url = std::move(base_url);
        cfg.user_agent = "flowhttp_gtest_httplib";

        cfg.pool.max_total_connections = 10;
        cfg.pool.max_connections_per_endpoint = 5;
        cfg.pool.max_idle_time = std::chrono::milliseconds(30000);
        cfg.pool.sweep_interval = std::chrono::milliseconds(0);
        cfg.pool.close_on_shutdown = true;

        cfg.connect_timeout = std::chrono::milliseconds(1000);
        cfg.exchange_timeout = std::chrono::milliseconds(2000);

        return cfg;
    }

    std::string make_url(uint16_t port, std::string path) {
        if (path.empty() || path[0] != '/') path.insert(path.begin(), '/');
        return "http://127.0.0.1:" + std::to_string(port) + path;
    }

    struct Fetched {
        int status{0};
        std::string body;
    };

    /// Response head plus the whole body, read on the client's io thread.
    net::awaitable<flowhttp::Result<Fetched>> fetch(
        net::awaitable<flowhttp::Result<flowhttp::ResponseState>> aw) {
        using R = flowhttp::Result<Fetched>;
        auto r = co_await std::move(aw);
        if (r.has_error()) co_return r.forward_error<Fetched>();
        auto body = co_await r.value().body().read_all(1024 * 1024);
        if (body.has_error()) co_return body.forward_error<Fetched>();
        co_return R::ok(Fetched{r.value().status(), std::move(body.value())});
    }

    /// Client driven by a background io thread. The thread keeps running
    /// until the pool shutdown the client posts on teardown has run.
    struct Harness {
        explicit Harness(flowhttp::ClientConfiguration cfg = make_cfg()) {
            runner.start();
            client = std::make_unique<flowhttp::Client>(
                runner.ioc().get_executor(), std::move(cfg));
        }

        ~Harness() {
            client.reset();
            flush_posted(runner.ioc());
            runner.stop();
        }

        flowhttp::Result<Fetched> run(
            net::awaitable<flowhttp::Result<flowhttp::ResponseState>> aw) {
            return await_or_abort(runner.ioc(), fetch(std::move(aw)),
                                  std::chrono::milliseconds(3000));
        }

        IoThreadRunner runner;
        std::unique_ptr<flowhttp::Client> client;
    };

}  // namespace

// ---------------------
// Tests
// ---------------------

TEST(ClientHttplib, GetAbsoluteUrlOk) {
    HttpTestServer srv([](auto const& req, auto& res) {
        if (req.path == "/ok") {
            res.status = 200;
            res.set_content("hello", "text/plain");
            return;
        }
        res.status = 404;
        res.set_content("nope", "text/plain");
    });

    Harness h;
    auto r = h.run(h.client->get(make_url(srv.port(), "/ok")));
    ASSERT_FALSE(r.has_error()) << r.error().message;
    EXPECT_EQ(r.value().status, 200);
    EXPECT_EQ(r.value().body, "hello");
}

TEST(ClientHttplib, NotFoundIsAResponse) {
    HttpTestServer srv([](auto const&, auto& res) {
        res.status = 404;
        res.set_content("nope", "text/plain");
    });

    Harness h;
    auto r = h.run(h.client->get(make_url(srv.port(), "/missing")));
    ASSERT_FALSE(r.has_error()) << r.error().message;
    EXPECT_EQ(r.value().status, 404);
    EXPECT_EQ(r.value().body, "nope");
}

TEST(ClientHttplib, RelativeUrlWithBaseUrlResolves) {
    HttpTestServer srv([](auto const& req, auto& res) {
        if (req.path == "/api/ping") {
            res.status = 200;
            res.set_content("pong", "text/plain");
            return;
        }
        res.status = 404;
        res.set_content("bad", "text/plain");
    });

    Harness h(make_cfg(make_url(srv.port(), "/api")));
    auto r = h.run(h.client->get("/ping"));
    ASSERT_FALSE(r.has_error()) << r.error().message;
    EXPECT_EQ(r.value().status, 200);
    EXPECT_EQ(r.value().body, "pong");
}

TEST(ClientHttplib, RelativeUrlWithoutBaseUrlErrors) {
    Harness h(make_cfg(std::nullopt));
    auto r = h.run(h.client->get("/ping"));
    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, flowhttp::Error::Code::InvalidUrl);
}

TEST(ClientHttplib, PostEchoBody) {
    HttpTestServer srv([](auto const& req, auto& res) {
        if (req.method == "POST" && req.path == "/echo") {
            res.status = 200;
            res.set_content(req.body, "text/plain");
            return;
        }
        res.status = 400;
        res.set_content("bad", "text/plain");
    });

    Harness h;
    auto r = h.run(h.client->post(make_url(srv.port(), "/echo"), "abc123"));
    ASSERT_FALSE(r.has_error()) << r.error().message;
    EXPECT_EQ(r.value().status, 200);
    EXPECT_EQ(r.value().body, "abc123");

    std::lock_guard lk(srv.last_req_mu_);
    EXPECT_EQ(srv.last_method, "POST");
    EXPECT_EQ(srv.last_target, "/echo");
    EXPECT_EQ(srv.last_body, "abc123");
}

TEST(ClientHttplib, KeepAliveCloseStillAllowsNextRequest) {
    std::atomic<int> n{0};

    HttpTestServer srv(
        [&](auto const&, auto& res) {
            int k = ++n;
            res.status = 200;
            res.set_content((k == 1) ? "first" : "second", "text/plain");
            if (k == 1) res.set_header("Connection", "close");
        },
        true);

    auto cfg = make_cfg();
    cfg.pool.max_connections_per_endpoint = 1;
    cfg.pool.max_total_connections = 2;
    Harness h(cfg);

    auto r1 = h.run(h.client->get(make_url(srv.port(), "/ka")));
    ASSERT_FALSE(r1.has_error()) << r1.error().message;
    EXPECT_EQ(r1.value().body, "first");

    auto r2 = h.run(h.client->get(make_url(srv.port(), "/ka")));
    ASSERT_FALSE(r2.has_error()) << r2.error().message;
    EXPECT_EQ(r2.value().body, "second");

    EXPECT_GE(srv.request_count.load(), 2);
}

TEST(ClientHttplib, UnknownMethodReturnsError) {
    HttpTestServer srv([](auto const&, auto& res) {
        res.status = 200;
        res.set_content("ok", "text/plain");
    });

    Harness h;
    flowhttp::Request req{};
    req.method = static_cast<flowhttp::HttpMethod>(0x7f);
    req.url = make_url(srv.port(), "/ok");

    auto r = h.run(h.client->send(std::move(req)));
    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, flowhttp::Error::Code::InvalidRequest);
    EXPECT_EQ(srv.request_count.load(), 0);
}

TEST(ClientHttplib, InvalidAbsoluteUrlErrors) {
    Harness h;
    auto r = h.run(h.client->get("127.0.0.1:1234/ok"));
    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, flowhttp::Error::Code::InvalidUrl);
}

TEST(ClientHttplib, PoolRespectsMaxConnectionsPerEndpoint) {
    HttpTestServer srv(
        [](auto const&, auto& res) {
            std::this_thread::sleep_for(std::chrono::milliseconds(80));
            res.status = 200;
            res.set_content("ok", "text/plain");
        },
        true);

    auto cfg = make_cfg();
    cfg.pool.max_connections_per_endpoint = 2;
    cfg.pool.max_total_connections = 10;
    cfg.acquire_timeout = std::chrono::milliseconds(5000);
    Harness h(cfg);

    constexpr int N = 8;
    std::vector<std::future<flowhttp::Result<Fetched>>> futs;
    futs.reserve(N);

    for (int i = 0; i < N; ++i) {
        auto prom =
            std::make_shared<std::promise<flowhttp::Result<Fetched>>>();
        futs.push_back(prom->get_future());

        net::co_spawn(
            h.runner.ioc(),
            [aw = fetch(h.client->get(make_url(srv.port(), "/slow"))),
             prom]() mutable -> net::awaitable<void> {
                try {
                    auto r = co_await std::move(aw);
                    prom->set_value(std::move(r));
                } catch (...) {
                    prom->set_exception(std::current_exception());
                }
                co_return;
            },
            net::detached);
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    for (auto& f : futs) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            ADD_FAILURE() << "Timed out waiting for concurrent requests.";
            std::abort();
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - now);
        if (f.wait_for(remaining) != std::future_status::ready) {
            ADD_FAILURE() << "Timed out waiting for concurrent request future.";
            std::abort();
        }
        auto r = f.get();
        ASSERT_FALSE(r.has_error()) << r.error().message;
        EXPECT_EQ(r.value().status, 200);
    }

    EXPECT_LE(srv.max_inflight.load(), 2);
}
