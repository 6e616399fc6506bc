/**
 * StringUtilsTest.cpp
 */

#include "utils/StringUtils.hpp"

#include <gtest/gtest.h>

using fetchkit::utils::StringUtils;

TEST(StringUtilsTest, FormatBytes) {
    EXPECT_EQ(StringUtils::formatBytes(0), "0 B");
    EXPECT_EQ(StringUtils::formatBytes(512), "512 B");
    EXPECT_EQ(StringUtils::formatBytes(1536), "1.5 KB");
    EXPECT_EQ(StringUtils::formatBytes(10LL * 1024 * 1024), "10.0 MB");
}

TEST(StringUtilsTest, FormatSpeed) {
    EXPECT_EQ(StringUtils::formatSpeed(2048.0), "2.0 KB/s");
    EXPECT_EQ(StringUtils::formatSpeed(-1.0), "0 B/s");
}

TEST(StringUtilsTest, FormatEta) {
    EXPECT_EQ(StringUtils::formatEta(std::nullopt), "unknown");
    EXPECT_EQ(StringUtils::formatEta(42.7), "42s");
    EXPECT_EQ(StringUtils::formatEta(125.0), "2m 5s");
    EXPECT_EQ(StringUtils::formatEta(7320.0), "2h 2m");
}

TEST(StringUtilsTest, FormatPercentage) {
    EXPECT_EQ(StringUtils::formatPercentage(42.26), "42.3%");
    EXPECT_EQ(StringUtils::formatPercentage(100.0, 0), "100%");
}

TEST(StringUtilsTest, ParseHeader) {
    auto header = StringUtils::parseHeader("Content-Length:  1234 ");
    ASSERT_TRUE(header.has_value());
    EXPECT_EQ(header->first, "Content-Length");
    EXPECT_EQ(header->second, "1234");

    auto bearer = StringUtils::parseHeader("Authorization: Bearer a:b");
    ASSERT_TRUE(bearer.has_value());
    EXPECT_EQ(bearer->second, "Bearer a:b");

    EXPECT_FALSE(StringUtils::parseHeader("no colon here").has_value());
    EXPECT_FALSE(StringUtils::parseHeader(": value").has_value());
}

TEST(StringUtilsTest, ParseNumbers) {
    EXPECT_EQ(StringUtils::parseInt("17"), 17);
    EXPECT_EQ(StringUtils::parseInt("abc", -1), -1);
    EXPECT_EQ(StringUtils::parseLong("9000000000"), 9000000000LL);
    EXPECT_EQ(StringUtils::parseLong("", 5), 5);
}

TEST(StringUtilsTest, ParseStatusLine) {
    EXPECT_EQ(StringUtils::parseStatusLine("HTTP/1.1 206 Partial Content"), 206);
    EXPECT_EQ(StringUtils::parseStatusLine("HTTP/2 200"), 200);
    EXPECT_EQ(StringUtils::parseStatusLine("HTTP/1.0 416 Range Not Satisfiable"), 416);

    EXPECT_EQ(StringUtils::parseStatusLine("Content-Length: 200"), 0);
    EXPECT_EQ(StringUtils::parseStatusLine("HTTP/1.1"), 0);
    EXPECT_EQ(StringUtils::parseStatusLine("HTTP/1.1 2x0 Odd"), 0);
    EXPECT_EQ(StringUtils::parseStatusLine("HTTP/1.1 2000"), 0);
}

TEST(StringUtilsTest, ParseContentLength) {
    EXPECT_EQ(StringUtils::parseContentLength("10000").value_or(-1), 10000);
    EXPECT_EQ(StringUtils::parseContentLength(" 0 ").value_or(-1), 0);
    EXPECT_EQ(StringUtils::parseContentLength("5368709120").value_or(-1), 5368709120LL);

    EXPECT_FALSE(StringUtils::parseContentLength("").has_value());
    EXPECT_FALSE(StringUtils::parseContentLength("-1").has_value());
    EXPECT_FALSE(StringUtils::parseContentLength("12, 12").has_value());
    EXPECT_FALSE(StringUtils::parseContentLength("1e6").has_value());
}

TEST(StringUtilsTest, TrimLowerPrefix) {
    EXPECT_EQ(StringUtils::trim("  a b \r\n"), "a b");
    EXPECT_EQ(StringUtils::toLower("Content-Type"), "content-type");
    EXPECT_TRUE(StringUtils::startsWith("HTTP/1.1 200", "HTTP/"));
}
