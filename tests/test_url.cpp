// =============================================================================
// Unit tests for URL helpers and Device parsing
// =============================================================================
#include <gtest/gtest.h>
#include "aircast/device.hpp"
#include "aircast/url.hpp"

using namespace aircast;

// ===========================================================================
// Encoding
// ===========================================================================

TEST(UrlTest, PathQuotingEscapesSpaces) {
    EXPECT_EQ(url_encode_path("a b.mp4"), "a%20b.mp4");
    EXPECT_EQ(url_encode_path("dir/movie.m3u8"), "dir/movie.m3u8");
    EXPECT_EQ(url_encode_path("100%.ts"), "100%25.ts");
}

TEST(UrlTest, QueryUsesPlusForSpace) {
    EXPECT_EQ(url_encode_query("a b"), "a+b");
    EXPECT_EQ(url_encode_query("x&y=z"), "x%26y%3Dz");
}

TEST(UrlTest, BuildQueryKeepsOrder) {
    EXPECT_EQ(build_query({{"value", "1.0"}, {"b", "2"}}), "value=1.0&b=2");
    EXPECT_EQ(build_query({}), "");
}

TEST(UrlTest, DecodeEscapes) {
    EXPECT_EQ(url_decode("a%20b.mp4"), "a b.mp4");
    EXPECT_EQ(url_decode("%2Fetc"), "/etc");
}

TEST(UrlTest, DecodeKeepsMalformedEscapes) {
    EXPECT_EQ(url_decode("50%"), "50%");
    EXPECT_EQ(url_decode("%zz"), "%zz");
    EXPECT_EQ(url_decode("a+b"), "a+b");
}

// ===========================================================================
// format_decimal
// ===========================================================================

TEST(UrlTest, DecimalAlwaysHasFraction) {
    EXPECT_EQ(format_decimal(0.0), "0.0");
    EXPECT_EQ(format_decimal(1.0), "1.0");
    EXPECT_EQ(format_decimal(0.25), "0.25");
    EXPECT_EQ(format_decimal(1801.0), "1801.0");
    EXPECT_EQ(format_decimal(12.5), "12.5");
}

// ===========================================================================
// Device
// ===========================================================================

TEST(DeviceTest, ParseDefaultsToPort7000) {
    Device d = Device::parse("apple-tv.local");
    EXPECT_EQ(d.host(), "apple-tv.local");
    EXPECT_EQ(d.port(), 7000);
    EXPECT_FALSE(d.name().has_value());
}

TEST(DeviceTest, ParseHostAndPort) {
    Device d = Device::parse("192.168.1.20:7100");
    EXPECT_EQ(d.host(), "192.168.1.20");
    EXPECT_EQ(d.port(), 7100);
    EXPECT_EQ(d.address(), "192.168.1.20:7100");
}

TEST(DeviceTest, BadPortMeansWholeStringIsHost) {
    Device d = Device::parse("tv:abc");
    EXPECT_EQ(d.host(), "tv:abc");
    EXPECT_EQ(d.port(), default_port);
}

TEST(DeviceTest, EqualityIgnoresName) {
    EXPECT_EQ(Device("tv", 7000, std::string("Living Room")), Device("tv"));
    EXPECT_NE(Device("tv", 7000), Device("tv", 7001));
}
