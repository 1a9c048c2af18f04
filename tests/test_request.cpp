#include <gtest/gtest.h>

#include <boost/asio/io_context.hpp>
#include <optional>
#include <string>
#include <vector>

#include "flowhttp/request.hpp"
#include "support/test_util.hpp"

using namespace flowhttp;
using flowhttp::test::run_until_complete;

namespace {

    /// @brief Drain a producer into its chunks.
    std::vector<std::string> collect(boost::asio::io_context& io,
                                     BodyProducer& body) {
        return run_until_complete(
            io, [&body]() -> boost::asio::awaitable<std::vector<std::string>> {
                std::vector<std::string> out;
                for (;;) {
                    auto c = co_await body.next();
                    if (c.has_error() || !c.value()) break;
                    out.push_back(*c.value());
                }
                co_return out;
            }());
    }

}  // namespace

TEST(RequestTest, MakeDescriptorCarriesFields) {
    Request req;
    req.method = HttpMethod::Put;
    req.url = "http://host/x";
    req.headers.set("X-Test", "foo");
    req.body = string_body("abc");
    req.keep_alive = false;

    auto url = parse_url(req.url).value();
    auto d = make_descriptor(std::move(req), url);

    EXPECT_EQ(d.method, HttpMethod::Put);
    EXPECT_EQ(d.uri.target, "/x");
    EXPECT_EQ(d.headers["X-Test"], "foo");
    ASSERT_NE(d.body, nullptr);
    EXPECT_FALSE(d.keep_alive);
    EXPECT_FALSE(d.explicit_content_length);
    EXPECT_EQ(d.endpoint(), (Endpoint{"host", "80", false}));
}

TEST(RequestTest, ExplicitContentLengthIsDetected) {
    Request req;
    req.method = HttpMethod::Post;
    req.headers.set(http::field::content_length, "3");
    auto d = make_descriptor(std::move(req), parse_url("http://h/").value());
    EXPECT_TRUE(d.explicit_content_length);
}

TEST(RequestTest, ReplayableDependsOnBody) {
    RequestDescriptor d;
    EXPECT_TRUE(d.replayable());

    d.body = string_body("x");
    EXPECT_TRUE(d.replayable());

    d.body = generator_body(
        [] { return Result<std::optional<std::string>>::ok(std::nullopt); });
    EXPECT_FALSE(d.replayable());
}

TEST(BodyProducerTest, StringBodyYieldsOnceAndRestarts) {
    boost::asio::io_context io;
    auto body = string_body("hello");
    ASSERT_TRUE(body->size().has_value());
    EXPECT_EQ(*body->size(), 5u);

    EXPECT_EQ(collect(io, *body), std::vector<std::string>{"hello"});
    EXPECT_TRUE(collect(io, *body).empty());

    body->restart();
    EXPECT_EQ(collect(io, *body), std::vector<std::string>{"hello"});
}

TEST(BodyProducerTest, EmptyStringBodyYieldsNothing) {
    boost::asio::io_context io;
    auto body = string_body("");
    EXPECT_TRUE(collect(io, *body).empty());
}

TEST(BodyProducerTest, ChunksBodySkipsEmptyChunksAndHasNoSize) {
    boost::asio::io_context io;
    auto body = chunks_body({"a", "", "bc"});
    EXPECT_FALSE(body->size().has_value());
    EXPECT_TRUE(body->restartable());

    std::vector<std::string> expected{"a", "bc"};
    EXPECT_EQ(collect(io, *body), expected);
    body->restart();
    EXPECT_EQ(collect(io, *body), expected);
}

TEST(BodyProducerTest, GeneratorBodyIsNotRestartable) {
    boost::asio::io_context io;
    int calls = 0;
    auto body = generator_body([&calls] {
        ++calls;
        if (calls > 2) {
            return Result<std::optional<std::string>>::ok(std::nullopt);
        }
        return Result<std::optional<std::string>>::ok(
            std::string(1, static_cast<char>('0' + calls)));
    });
    EXPECT_FALSE(body->restartable());

    std::vector<std::string> expected{"1", "2"};
    EXPECT_EQ(collect(io, *body), expected);
}
