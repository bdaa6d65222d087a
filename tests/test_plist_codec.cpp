// =============================================================================
// Unit tests for body decoders (include/aircast/plist_codec.hpp)
// =============================================================================
#include <gtest/gtest.h>
#include "aircast/errors.hpp"
#include "aircast/plist_codec.hpp"

using namespace aircast;

namespace {

const char *playback_info_xml =
    "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
    "<!DOCTYPE plist PUBLIC \"-//Apple//DTD PLIST 1.0//EN\" \"http://www.apple.com/DTDs/PropertyList-1.0.dtd\">\n"
    "<plist version=\"1.0\">\n"
    "<dict>\n"
    "\t<key>duration</key>\n"
    "\t<real>1801.0</real>\n"
    "\t<key>position</key>\n"
    "\t<real>12.5</real>\n"
    "\t<key>rate</key>\n"
    "\t<integer>1</integer>\n"
    "\t<key>readyToPlay</key>\n"
    "\t<true/>\n"
    "\t<key>loadedTimeRanges</key>\n"
    "\t<array>\n"
    "\t\t<dict>\n"
    "\t\t\t<key>start</key>\n"
    "\t\t\t<real>0.0</real>\n"
    "\t\t</dict>\n"
    "\t</array>\n"
    "\t<key>uuid</key>\n"
    "\t<string>AB-CD</string>\n"
    "</dict>\n"
    "</plist>\n";

} // namespace

// ===========================================================================
// text/parameters
// ===========================================================================

TEST(ParametersTest, OrderPreservedAndTrimmed) {
    Parameters p = parse_parameters("duration: 83.124794\r\nposition:  14.467000 \r\n");
    ASSERT_EQ(p.size(), 2u);
    EXPECT_EQ(p[0].first, "duration");
    EXPECT_EQ(p[0].second, "83.124794");
    EXPECT_EQ(p[1].first, "position");
    EXPECT_EQ(p[1].second, "14.467000");
}

TEST(ParametersTest, StopsAtBlankLine) {
    Parameters p = parse_parameters("a: 1\n\nb: 2\n");
    ASSERT_EQ(p.size(), 1u);
    EXPECT_EQ(find_parameter(p, "a"), std::optional<std::string>("1"));
    EXPECT_FALSE(find_parameter(p, "b").has_value());
}

TEST(ParametersTest, ValueMayContainColons) {
    Parameters p = parse_parameters("Content-Location: http://10.0.0.2:8000/a.mp4\n");
    ASSERT_EQ(p.size(), 1u);
    EXPECT_EQ(p[0].second, "http://10.0.0.2:8000/a.mp4");
}

// ===========================================================================
// XML property lists
// ===========================================================================

TEST(PlistTest, DecodesNestedDocument) {
    PlistDict d = parse_plist(playback_info_xml);
    EXPECT_DOUBLE_EQ(d.at("duration").as_real(), 1801.0);
    EXPECT_DOUBLE_EQ(d.at("position").as_real(), 12.5);
    EXPECT_EQ(d.at("rate").as_integer(), 1);
    EXPECT_TRUE(d.at("readyToPlay").as_bool());
    EXPECT_EQ(d.at("uuid").as_string(), "AB-CD");

    const PlistArray &ranges = d.at("loadedTimeRanges").as_array();
    ASSERT_EQ(ranges.size(), 1u);
    EXPECT_DOUBLE_EQ(ranges[0].as_dict().at("start").as_real(), 0.0);
}

TEST(PlistTest, EncodedDocumentDecodesToSameDict) {
    PlistDict original{
        {"duration", PlistValue(1801.0)},
        {"state", PlistValue("playing")},
        {"count", PlistValue(3)},
        {"flags", PlistValue(PlistArray{PlistValue(true), PlistValue(false)})},
        {"note", PlistValue("a < b & c")},
    };
    std::string xml = encode_plist(original);
    EXPECT_NE(xml.find("<real>1801.0</real>"), std::string::npos);
    EXPECT_EQ(parse_plist(xml), original);
}

TEST(PlistTest, WrongTypeAccessIsParseError) {
    PlistDict d = parse_plist(playback_info_xml);
    EXPECT_THROW(d.at("uuid").as_integer(), ParseError);
    EXPECT_THROW(d.at("duration").as_string(), ParseError);
}

TEST(PlistTest, BinaryPlistIsUnsupported) {
    EXPECT_THROW(parse_plist(std::string("bplist00\xd1\x01\x02", 11)), UnsupportedOperationError);
}

TEST(PlistTest, MalformedInputIsParseError) {
    EXPECT_THROW(parse_plist("<plist><dict><key>a</key>"), ParseError);
    EXPECT_THROW(parse_plist("<html></html>"), ParseError);
    EXPECT_THROW(parse_plist("<plist version=\"1.0\"><array/></plist>"), ParseError);
    EXPECT_THROW(parse_plist("<plist><dict><key>a</key><integer>x1</integer></dict></plist>"), ParseError);
}

TEST(PlistTest, FindStringSkipsOtherTypes) {
    PlistDict d{{"category", PlistValue("video")}, {"rate", PlistValue(1.0)}};
    EXPECT_EQ(find_string(d, "category"), std::optional<std::string>("video"));
    EXPECT_FALSE(find_string(d, "rate").has_value());
    EXPECT_FALSE(find_string(d, "missing").has_value());
}
