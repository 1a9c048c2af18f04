#include <string>

#include "flowhttp/url.hpp"
#include "gtest/gtest.h"

using flowhttp::parse_url;
using flowhttp::UrlComponents;
using namespace flowhttp::url_utils;

TEST(ParseUrlTest, ParsesHttpUrl) {
    auto result = parse_url("http://example.com/foo/bar?baz=1");
    ASSERT_TRUE(result.has_value());
    const UrlComponents& url = result.value();
    EXPECT_FALSE(url.secure);
    EXPECT_EQ(url.host, "example.com");
    EXPECT_EQ(url.port, "80");
    EXPECT_EQ(url.target, "/foo/bar?baz=1");
    EXPECT_EQ(url.path(), "/foo/bar");
}

TEST(ParseUrlTest, ParsesHttpsUrl) {
    auto result = parse_url("https://example.com:8443/path");
    ASSERT_TRUE(result.has_value());
    const UrlComponents& url = result.value();
    EXPECT_TRUE(url.secure);
    EXPECT_EQ(url.host, "example.com");
    EXPECT_EQ(url.port, "8443");
    EXPECT_EQ(url.target, "/path");
}

TEST(ParseUrlTest, DefaultPort) {
    auto result = parse_url("https://hostonly");
    ASSERT_TRUE(result.has_value());
    const UrlComponents& url = result.value();
    EXPECT_TRUE(url.secure);
    EXPECT_EQ(url.host, "hostonly");
    EXPECT_EQ(url.port, "443");
    EXPECT_EQ(url.target, "/");
}

TEST(ParseUrlTest, QueryDirectlyAfterAuthority) {
    auto result = parse_url("http://host?x=1");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value().target, "/?x=1");
}

TEST(ParseUrlTest, FragmentIsDropped) {
    auto result = parse_url("http://host/a#frag");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value().target, "/a");
}

TEST(ParseUrlTest, MissingScheme) {
    auto result = parse_url("example.com");
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error().code, flowhttp::Error::Code::InvalidUrl);
}

TEST(ParseUrlTest, EmptyHost) {
    auto result = parse_url("http:///foo");
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error().code, flowhttp::Error::Code::InvalidUrl);
}

TEST(ParseUrlTest, EmptyPort) {
    auto result = parse_url("http://host:");
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error().code, flowhttp::Error::Code::InvalidUrl);
}

TEST(ParseUrlTest, NonNumericPort) {
    auto result = parse_url("http://host:8o/");
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error().code, flowhttp::Error::Code::InvalidUrl);
}

TEST(ParseUrlTest, EndpointIsNormalized) {
    auto a = parse_url("http://Example.COM/x").value().endpoint();
    auto b = parse_url("http://example.com:80/y").value().endpoint();
    EXPECT_EQ(a, b);
}

TEST(UrlUtilsTest, IsAbsoluteUrlWithProtocol) {
    EXPECT_TRUE(is_absolute_url_with_protocol("http://example.com"));
    EXPECT_TRUE(is_absolute_url_with_protocol("https://example.com"));
    EXPECT_FALSE(is_absolute_url_with_protocol("ftp://example.com"));
    EXPECT_FALSE(is_absolute_url_with_protocol("example.com"));
}

TEST(UrlUtilsTest, TrimTrailingSlashes) {
    EXPECT_EQ(trim_trailing_slashes("/foo/bar/"), "/foo/bar");
    EXPECT_EQ(trim_trailing_slashes("/foo/bar"), "/foo/bar");
    EXPECT_EQ(trim_trailing_slashes("/"), "");
    EXPECT_EQ(trim_trailing_slashes(""), "");
}

TEST(UrlUtilsTest, ParseBaseUrl) {
    auto r1 = parse_base_url("http://host/api");
    ASSERT_TRUE(r1.has_value());
    EXPECT_EQ(r1.value().target, "/api");

    auto r2 = parse_base_url("http://host/");
    ASSERT_TRUE(r2.has_value());
    EXPECT_EQ(r2.value().target, "");

    auto r3 = parse_base_url("http://host/api?x=1");
    EXPECT_TRUE(r3.has_error());
    EXPECT_EQ(r3.error().code, flowhttp::Error::Code::InvalidUrl);

    auto r4 = parse_base_url("");
    EXPECT_TRUE(r4.has_error());
    EXPECT_EQ(r4.error().code, flowhttp::Error::Code::InvalidUrl);
}

TEST(UrlUtilsTest, ResolveUrlAbsoluteAndRelative) {
    auto base = parse_base_url("http://host/api").value();
    auto abs = resolve_url("http://other/foo", &base);
    ASSERT_TRUE(abs.has_value());
    EXPECT_EQ(abs.value().host, "other");
    EXPECT_EQ(abs.value().target, "/foo");

    auto rel1 = resolve_url("health", &base);
    ASSERT_TRUE(rel1.has_value());
    EXPECT_EQ(rel1.value().host, "host");
    EXPECT_EQ(rel1.value().target, "/api/health");

    auto rel2 = resolve_url("/bar", &base);
    ASSERT_TRUE(rel2.has_value());
    EXPECT_EQ(rel2.value().target, "/api/bar");

    auto rel3 = resolve_url("", &base);
    ASSERT_TRUE(rel3.has_value());
    EXPECT_EQ(rel3.value().target, "/api/");

    auto rel4 = resolve_url("foo", nullptr);
    EXPECT_TRUE(rel4.has_error());
    EXPECT_EQ(rel4.error().code, flowhttp::Error::Code::InvalidUrl);
}

TEST(UrlUtilsTest, RemoveDotSegments) {
    EXPECT_EQ(remove_dot_segments("/a/b/c/./../../g"), "/a/g");
    EXPECT_EQ(remove_dot_segments("/a/.."), "/");
    EXPECT_EQ(remove_dot_segments("/../x"), "/x");
    EXPECT_EQ(remove_dot_segments("/a/b/"), "/a/b/");
}

TEST(ResolveReferenceTest, AbsolutePathReplacesTarget) {
    auto base = parse_url("http://host:8080/a/b?q=1").value();
    auto r = resolve_reference(base, "/c/d");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r.value().host, "host");
    EXPECT_EQ(r.value().port, "8080");
    EXPECT_EQ(r.value().target, "/c/d");
}

TEST(ResolveReferenceTest, RelativePathMergesWithDirectory) {
    auto base = parse_url("http://host/a/b").value();
    auto r = resolve_reference(base, "c?x=2");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r.value().target, "/a/c?x=2");

    auto up = resolve_reference(base, "../d");
    ASSERT_TRUE(up.has_value());
    EXPECT_EQ(up.value().target, "/d");
}

TEST(ResolveReferenceTest, QueryOnlyKeepsPath) {
    auto base = parse_url("http://host/a/b?old=1").value();
    auto r = resolve_reference(base, "?new=2");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r.value().target, "/a/b?new=2");
}

TEST(ResolveReferenceTest, AbsoluteAndNetworkPath) {
    auto base = parse_url("https://host/a").value();

    auto abs = resolve_reference(base, "http://other:81/x");
    ASSERT_TRUE(abs.has_value());
    EXPECT_FALSE(abs.value().secure);
    EXPECT_EQ(abs.value().host, "other");
    EXPECT_EQ(abs.value().port, "81");

    auto net = resolve_reference(base, "//cdn.example/y");
    ASSERT_TRUE(net.has_value());
    EXPECT_TRUE(net.value().secure);
    EXPECT_EQ(net.value().host, "cdn.example");
    EXPECT_EQ(net.value().port, "443");
    EXPECT_EQ(net.value().target, "/y");
}

TEST(ResolveReferenceTest, UnsupportedSchemeFails) {
    auto base = parse_url("http://host/").value();
    auto r = resolve_reference(base, "ftp://host/file");
    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, flowhttp::Error::Code::InvalidUrl);
}

TEST(ResolveReferenceTest, SurroundingWhitespaceIgnored) {
    auto base = parse_url("http://host/a").value();
    auto r = resolve_reference(base, "  /b  ");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r.value().target, "/b");
}

TEST(UrlEncodeTest, KeepsUnreservedAndEscapesTheRest) {
    EXPECT_EQ(url_encode("abc-_.~09"), "abc-_.~09");
    EXPECT_EQ(url_encode("a b&c=d"), "a%20b%26c%3Dd");
    EXPECT_EQ(url_encode("\xC3\xA9"), "%C3%A9");
}
