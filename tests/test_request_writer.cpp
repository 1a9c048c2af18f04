#include <gtest/gtest.h>

#include <boost/asio/io_context.hpp>
#include <memory>
#include <optional>
#include <string>

#include "flowhttp/pipeline/request_writer.hpp"
#include "support/fake_transport.hpp"
#include "support/test_util.hpp"

using namespace flowhttp;
using flowhttp::test::FakeTransport;
using flowhttp::test::run_until_complete;

namespace {

    RequestDescriptor make_request(HttpMethod method, std::string url) {
        RequestDescriptor d;
        d.method = method;
        d.uri = parse_url(url).value();
        return d;
    }

    RequestWriterOptions default_opts() {
        RequestWriterOptions opt;
        opt.user_agent = "flowhttp-test";
        return opt;
    }

}  // namespace

TEST(SerializeHeadTest, GetWithoutBody) {
    auto req = make_request(HttpMethod::Get, "http://host:8080/p?q=1");
    auto head = serialize_head(req, default_opts());
    ASSERT_TRUE(head.has_value()) << head.error().message;
    EXPECT_EQ(head.value().bytes,
              "GET /p?q=1 HTTP/1.1\r\n"
              "Host: host:8080\r\n"
              "User-Agent: flowhttp-test\r\n"
              "\r\n");
    EXPECT_EQ(head.value().framing, BodyFraming::None);
}

TEST(SerializeHeadTest, HostOmitsDefaultPort) {
    auto req = make_request(HttpMethod::Get, "https://Secure.Example/");
    auto head = serialize_head(req, default_opts());
    ASSERT_TRUE(head.has_value());
    EXPECT_NE(head.value().bytes.find("Host: secure.example\r\n"),
              std::string::npos);
}

TEST(SerializeHeadTest, DefaultHeadersYieldToRequestHeaders) {
    auto req = make_request(HttpMethod::Get, "http://h/");
    req.headers.set("X-Team", "request");
    req.headers.set(http::field::user_agent, "custom");

    auto opt = default_opts();
    opt.default_headers = {{"X-Team", "default"}, {"X-Trace", "on"}};

    auto head = serialize_head(req, opt);
    ASSERT_TRUE(head.has_value());
    const auto& b = head.value().bytes;
    EXPECT_NE(b.find("X-Trace: on\r\n"), std::string::npos);
    EXPECT_NE(b.find("X-Team: request\r\n"), std::string::npos);
    EXPECT_EQ(b.find("X-Team: default"), std::string::npos);
    EXPECT_NE(b.find("User-Agent: custom\r\n"), std::string::npos);
    EXPECT_EQ(b.find("flowhttp-test"), std::string::npos);
}

TEST(SerializeHeadTest, PostWithoutBodySendsZeroLength) {
    auto req = make_request(HttpMethod::Post, "http://h/items");
    auto head = serialize_head(req, default_opts());
    ASSERT_TRUE(head.has_value());
    EXPECT_NE(head.value().bytes.find("Content-Length: 0\r\n"),
              std::string::npos);
    EXPECT_EQ(head.value().framing, BodyFraming::None);
}

TEST(SerializeHeadTest, SizedBodyUsesContentLength) {
    auto req = make_request(HttpMethod::Put, "http://h/items/1");
    req.body = string_body("{\"a\":1}");
    auto head = serialize_head(req, default_opts());
    ASSERT_TRUE(head.has_value());
    EXPECT_EQ(head.value().framing, BodyFraming::ContentLength);
    EXPECT_EQ(head.value().content_length, 7u);
    EXPECT_NE(head.value().bytes.find("Content-Length: 7\r\n"),
              std::string::npos);
}

TEST(SerializeHeadTest, UnsizedBodyIsChunkedAndCallerFramingDropped) {
    auto req = make_request(HttpMethod::Post, "http://h/upload");
    req.headers.set(http::field::transfer_encoding, "gzip, chunked");
    req.body = chunks_body({"ab", "cde"});
    auto head = serialize_head(req, default_opts());
    ASSERT_TRUE(head.has_value());
    EXPECT_EQ(head.value().framing, BodyFraming::Chunked);
    EXPECT_EQ(head.value().bytes.find("gzip"), std::string::npos);
    EXPECT_NE(head.value().bytes.find("Transfer-Encoding: chunked\r\n"),
              std::string::npos);
}

TEST(SerializeHeadTest, CompressionAdvertisesAcceptEncoding) {
    auto req = make_request(HttpMethod::Get, "http://h/");
    auto opt = default_opts();
    opt.compress = true;
    auto head = serialize_head(req, opt);
    ASSERT_TRUE(head.has_value());
    EXPECT_NE(head.value().bytes.find("Accept-Encoding: gzip, deflate\r\n"),
              std::string::npos);
}

TEST(SerializeHeadTest, ConnectionCloseWithoutKeepAlive) {
    auto req = make_request(HttpMethod::Get, "http://h/");
    req.keep_alive = false;
    auto head = serialize_head(req, default_opts());
    ASSERT_TRUE(head.has_value());
    EXPECT_NE(head.value().bytes.find("Connection: close\r\n"),
              std::string::npos);
}

TEST(SerializeHeadTest, InvalidRequestsAreRejected) {
    auto unknown = make_request(static_cast<HttpMethod>(999), "http://h/");
    auto r1 = serialize_head(unknown, default_opts());
    ASSERT_TRUE(r1.has_error());
    EXPECT_EQ(r1.error().code, Error::Code::InvalidRequest);

    auto spaced = make_request(HttpMethod::Get, "http://h/");
    spaced.uri.target = "/a b";
    auto r2 = serialize_head(spaced, default_opts());
    ASSERT_TRUE(r2.has_error());
    EXPECT_EQ(r2.error().code, Error::Code::InvalidRequest);

    auto bad_length = make_request(HttpMethod::Post, "http://h/");
    bad_length.headers.set(http::field::content_length, "12x");
    bad_length.explicit_content_length = true;
    bad_length.body = string_body("x");
    auto r3 = serialize_head(bad_length, default_opts());
    ASSERT_TRUE(r3.has_error());
    EXPECT_EQ(r3.error().code, Error::Code::InvalidRequest);
}

TEST(WriteRequestTest, WritesHeadThenSizedBody) {
    boost::asio::io_context io;
    auto t = std::make_shared<FakeTransport>(io.get_executor());

    auto req = make_request(HttpMethod::Post, "http://h/echo");
    req.body = string_body("payload");
    auto res = run_until_complete(io, write_request(*t, req, default_opts()));

    ASSERT_TRUE(res.status.has_value()) << res.status.error().message;
    EXPECT_EQ(t->written(),
              "POST /echo HTTP/1.1\r\n"
              "Host: h\r\n"
              "User-Agent: flowhttp-test\r\n"
              "Content-Length: 7\r\n"
              "\r\n"
              "payload");
    EXPECT_EQ(res.bytes, t->written().size());
    ASSERT_EQ(t->requests().size(), 1u);
}

TEST(WriteRequestTest, ChunkedBodyIsFramed) {
    boost::asio::io_context io;
    auto t = std::make_shared<FakeTransport>(io.get_executor());

    auto req = make_request(HttpMethod::Post, "http://h/up");
    req.body = chunks_body({"ab", "cde"});
    auto res = run_until_complete(io, write_request(*t, req, default_opts()));

    ASSERT_TRUE(res.status.has_value());
    const auto& w = t->written();
    const auto body = w.substr(w.find("\r\n\r\n") + 4);
    EXPECT_EQ(body, "2\r\nab\r\n3\r\ncde\r\n0\r\n\r\n");
}

TEST(WriteRequestTest, RestartableBodyIsReplayedFromStart) {
    boost::asio::io_context io;
    auto req = make_request(HttpMethod::Put, "http://h/r");
    req.body = string_body("again");

    for (int i = 0; i < 2; ++i) {
        auto t = std::make_shared<FakeTransport>(io.get_executor());
        auto res =
            run_until_complete(io, write_request(*t, req, default_opts()));
        ASSERT_TRUE(res.status.has_value());
        EXPECT_EQ(t->written().substr(t->written().size() - 5), "again");
    }
}

TEST(WriteRequestTest, ShortBodyForExplicitLengthFails) {
    boost::asio::io_context io;
    auto t = std::make_shared<FakeTransport>(io.get_executor());

    auto req = make_request(HttpMethod::Post, "http://h/");
    req.headers.set(http::field::content_length, "10");
    req.explicit_content_length = true;
    req.body = chunks_body({"abc"});

    auto res = run_until_complete(io, write_request(*t, req, default_opts()));
    ASSERT_TRUE(res.status.has_error());
    EXPECT_EQ(res.status.error().code, Error::Code::InvalidRequest);
    EXPECT_FALSE(res.transport_error);
}

TEST(WriteRequestTest, ProducerErrorAborts) {
    boost::asio::io_context io;
    auto t = std::make_shared<FakeTransport>(io.get_executor());

    auto req = make_request(HttpMethod::Post, "http://h/");
    req.body = generator_body([] {
        return Result<std::optional<std::string>>::err(Error::Code::Aborted,
                                                       "disk gone");
    });

    auto res = run_until_complete(io, write_request(*t, req, default_opts()));
    ASSERT_TRUE(res.status.has_error());
    EXPECT_EQ(res.status.error().code, Error::Code::Aborted);
    EXPECT_FALSE(res.transport_error);
}

TEST(WriteRequestTest, TransportFailureIsFlagged) {
    boost::asio::io_context io;
    auto t = std::make_shared<FakeTransport>(io.get_executor());
    t->set_fail_writes(true);

    auto req = make_request(HttpMethod::Get, "http://h/");
    auto res = run_until_complete(io, write_request(*t, req, default_opts()));
    ASSERT_TRUE(res.status.has_error());
    EXPECT_EQ(res.status.error().code, Error::Code::Aborted);
    EXPECT_TRUE(res.transport_error);
    EXPECT_EQ(res.bytes, 0u);
}
