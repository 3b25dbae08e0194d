// WatchParty - Watch-party signaling and process supervision core
// Tests for address helpers

#include <gtest/gtest.h>
#include "watchparty/net/address_utils.hpp"

namespace watchparty {
namespace net {
namespace test {

TEST(AddressUtilsTest, ValidatesIpv4) {
    EXPECT_TRUE(isValidIpv4("127.0.0.1"));
    EXPECT_TRUE(isValidIpv4("0.0.0.0"));
    EXPECT_FALSE(isValidIpv4("256.0.0.1"));
    EXPECT_FALSE(isValidIpv4("localhost"));
    EXPECT_FALSE(isValidIpv4("::1"));
}

TEST(AddressUtilsTest, ValidatesIpv6WithBracketsAndScope) {
    EXPECT_TRUE(isValidIpv6("::1"));
    EXPECT_TRUE(isValidIpv6("[2001:db8::1]"));
    EXPECT_TRUE(isValidIpv6("fe80::1%eth0"));
    EXPECT_FALSE(isValidIpv6("fe80::1%"));
    EXPECT_FALSE(isValidIpv6("192.168.0.1"));
    EXPECT_FALSE(isValidIpv6("2001:db8:::1"));
}

TEST(AddressUtilsTest, IsValidIpAcceptsEitherFamily) {
    EXPECT_TRUE(isValidIp("10.0.0.2"));
    EXPECT_TRUE(isValidIp("::"));
    EXPECT_FALSE(isValidIp("example.com"));
}

TEST(AddressUtilsTest, FormatHostForUrlBracketsIpv6Only) {
    EXPECT_EQ(formatHostForUrl("::1"), "[::1]");
    EXPECT_EQ(formatHostForUrl("[::1]"), "[::1]");
    EXPECT_EQ(formatHostForUrl("127.0.0.1"), "127.0.0.1");
    EXPECT_EQ(formatHostForUrl("party.local"), "party.local");
}

TEST(AddressUtilsTest, ParsesHostAndPort) {
    auto result = parseAddress("192.168.1.5:10086");
    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(result.value().host, "192.168.1.5");
    ASSERT_TRUE(result.value().port.has_value());
    EXPECT_EQ(*result.value().port, 10086);
}

TEST(AddressUtilsTest, ParsesBracketedIpv6WithPort) {
    auto result = parseAddress("[2001:db8::7]:10086");
    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(result.value().host, "2001:db8::7");
    EXPECT_EQ(result.value().port, std::optional<uint16_t>(10086));
}

TEST(AddressUtilsTest, ParsesBareHostsWithoutPort) {
    auto v6 = parseAddress("2001:db8::7");
    ASSERT_TRUE(v6.isSuccess());
    EXPECT_EQ(v6.value().host, "2001:db8::7");
    EXPECT_FALSE(v6.value().port.has_value());

    auto bracketed = parseAddress("[::1]");
    ASSERT_TRUE(bracketed.isSuccess());
    EXPECT_EQ(bracketed.value().host, "::1");
    EXPECT_FALSE(bracketed.value().port.has_value());

    auto name = parseAddress("  party.local ");
    ASSERT_TRUE(name.isSuccess());
    EXPECT_EQ(name.value().host, "party.local");
}

TEST(AddressUtilsTest, RejectsMalformedAddresses) {
    EXPECT_TRUE(parseAddress("").isError());
    EXPECT_TRUE(parseAddress("[::1").isError());
    EXPECT_TRUE(parseAddress("[::1]x").isError());
    EXPECT_TRUE(parseAddress("[10.0.0.1]:80").isError());
    EXPECT_TRUE(parseAddress("host:").isError());
    EXPECT_TRUE(parseAddress("host:0").isError());
    EXPECT_TRUE(parseAddress("host:65536").isError());
    EXPECT_TRUE(parseAddress(":10086").isError());
    EXPECT_TRUE(parseAddress("a:b:c").isError());

    auto result = parseAddress("host:abc");
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, core::ErrorCode::InvalidAddress);
}

} // namespace test
} // namespace net
} // namespace watchparty
