// RowDoc 库
// 组件：内容类型嗅探测试

#include "rowdoc/utils/MimeSniffer.hpp"
#include <gtest/gtest.h>

namespace rowdoc {
namespace utils {

TEST(MimeSnifferTest, BinaryFormats) {
    EXPECT_EQ(MimeSniffer::sniff("%PDF-1.4\n%..."), "application/pdf");
    EXPECT_EQ(MimeSniffer::sniff(std::string("\x89PNG\r\n\x1A\n\0\0", 10)), "image/png");
    EXPECT_EQ(MimeSniffer::sniff("\xFF\xD8\xFF\xE0"), "image/jpeg");
    EXPECT_EQ(MimeSniffer::sniff("GIF89a...."), "image/gif");
    EXPECT_EQ(MimeSniffer::sniff("PK\x03\x04rest"), "application/zip");
    EXPECT_EQ(MimeSniffer::sniff("\xD0\xCF\x11\xE0\xA1\xB1\x1A\xE1"), "application/msword");
    EXPECT_EQ(MimeSniffer::sniff("\x1F\x8B\x08"), "application/x-gzip");
    EXPECT_EQ(MimeSniffer::sniff("{\\rtf1\\ansi"), "application/rtf");
}

TEST(MimeSnifferTest, MarkupWithLeadingWhitespaceAndBom) {
    EXPECT_EQ(MimeSniffer::sniff("  \n<!doctype HTML><html>"), "text/html");
    EXPECT_EQ(MimeSniffer::sniff("\xEF\xBB\xBF<HTML><body>"), "text/html");
    EXPECT_EQ(MimeSniffer::sniff("<?xml version=\"1.0\"?><root/>"), "text/xml");
}

TEST(MimeSnifferTest, InconclusiveReturnsNothing) {
    EXPECT_FALSE(MimeSniffer::sniff("").has_value());
    EXPECT_FALSE(MimeSniffer::sniff("hello world").has_value());
    EXPECT_FALSE(MimeSniffer::sniff("%PD").has_value());
}

}} // namespace rowdoc::utils
