#include <gtest/gtest.h>

#include <string>
#include <unordered_set>

#include "flowhttp/endpoint.hpp"

using namespace flowhttp;

TEST(EndpointTest, HostIsLowerCasedAndPortDefaulted) {
    Endpoint plain{"API.Example.com", "", false};
    EXPECT_EQ(plain.host(), "api.example.com");
    EXPECT_EQ(plain.port(), "80");
    EXPECT_FALSE(plain.secure());

    Endpoint secure{"example.com", "", true};
    EXPECT_EQ(secure.port(), "443");
    EXPECT_TRUE(secure.secure());
}

TEST(EndpointTest, EqualityCoversAllThreeFields) {
    Endpoint a{"host", "8080", false};
    EXPECT_EQ(a, (Endpoint{"HOST", "8080", false}));
    EXPECT_NE(a, (Endpoint{"host", "8081", false}));
    EXPECT_NE(a, (Endpoint{"host", "8080", true}));
    EXPECT_NE(a, (Endpoint{"other", "8080", false}));
}

TEST(EndpointTest, EqualEndpointsHashIdentically) {
    std::hash<Endpoint> h;
    EXPECT_EQ(h(Endpoint{"Host", "", true}), h(Endpoint{"host", "443", true}));

    std::unordered_set<Endpoint> set;
    set.insert(Endpoint{"a", "80", false});
    set.insert(Endpoint{"A", "", false});
    set.insert(Endpoint{"a", "80", true});
    EXPECT_EQ(set.size(), 2u);
}

TEST(EndpointTest, AuthorityOmitsDefaultPort) {
    EXPECT_EQ((Endpoint{"h", "80", false}).authority(), "h");
    EXPECT_EQ((Endpoint{"h", "443", true}).authority(), "h");
    EXPECT_EQ((Endpoint{"h", "8443", true}).authority(), "h:8443");
    EXPECT_EQ((Endpoint{"h", "443", false}).authority(), "h:443");
}

TEST(EndpointTest, ToStringNamesScheme) {
    EXPECT_EQ((Endpoint{"h", "81", false}).to_string(), "http://h:81");
    EXPECT_EQ((Endpoint{"h", "", true}).to_string(), "https://h:443");
}

TEST(EndpointTest, DefaultConstructedIsEmpty) {
    Endpoint e;
    EXPECT_TRUE(e.empty());
    EXPECT_FALSE((Endpoint{"h", "1", false}).empty());
}
