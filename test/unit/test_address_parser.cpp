#include "xlsxextract/utils/AddressParser.hpp"
#include "xlsxextract/core/Exception.hpp"
#include <gtest/gtest.h>

namespace xlsxextract {
namespace utils {

// 测试1: 单个地址
TEST(AddressParserTest, ParsesSingleCell) {
    auto ref = AddressParser::parse("B3");
    EXPECT_FALSE(ref.hasSheet());
    EXPECT_TRUE(ref.isCell());
    EXPECT_EQ(ref.first_row, 3);
    EXPECT_EQ(ref.first_col, 2);

    auto absolute = AddressParser::parse("$XFD$1048576");
    EXPECT_EQ(absolute.first_col, AddressParser::kMaxColumns);
    EXPECT_EQ(absolute.first_row, AddressParser::kMaxRows);
}

// 测试2: 带工作表名，包括引号和转义的单引号
TEST(AddressParserTest, ParsesSheetNames) {
    auto plain = AddressParser::parse("Summary!C3");
    EXPECT_EQ(plain.sheet, "Summary");

    auto quoted = AddressParser::parse("'Report 1'!$B$5:$F$9");
    EXPECT_EQ(quoted.sheet, "Report 1");
    EXPECT_EQ(quoted.first_row, 5);
    EXPECT_EQ(quoted.first_col, 2);
    EXPECT_EQ(quoted.last_row, 9);
    EXPECT_EQ(quoted.last_col, 6);

    auto escaped = AddressParser::parse("'Bob''s data'!A1");
    EXPECT_EQ(escaped.sheet, "Bob's data");
}

// 测试3: 起止顺序规范化
TEST(AddressParserTest, NormalizesRangeCorners) {
    auto ref = AddressParser::parse("F9:B5");
    EXPECT_EQ(ref.first_row, 5);
    EXPECT_EQ(ref.first_col, 2);
    EXPECT_EQ(ref.last_row, 9);
    EXPECT_EQ(ref.last_col, 6);
    EXPECT_FALSE(ref.isCell());
}

TEST(AddressParserTest, RejectsMalformedReferences) {
    EXPECT_FALSE(AddressParser::tryParse(""));
    EXPECT_FALSE(AddressParser::tryParse("MonthlyData"));
    EXPECT_FALSE(AddressParser::tryParse("A0"));
    EXPECT_FALSE(AddressParser::tryParse("XFE1"));
    EXPECT_FALSE(AddressParser::tryParse("A1048577"));
    EXPECT_FALSE(AddressParser::tryParse("A1:"));
    EXPECT_THROW(AddressParser::parse("not a ref"), core::CellException);
}

TEST(AddressParserTest, ColumnConversions) {
    EXPECT_EQ(AddressParser::columnToIndex("A"), 1);
    EXPECT_EQ(AddressParser::columnToIndex("z"), 26);
    EXPECT_EQ(AddressParser::columnToIndex("AA"), 27);
    EXPECT_EQ(AddressParser::columnToIndex("XFD"), 16384);
    EXPECT_EQ(AddressParser::columnToIndex("A1"), 0);

    EXPECT_EQ(AddressParser::indexToColumn(1), "A");
    EXPECT_EQ(AddressParser::indexToColumn(28), "AB");
    EXPECT_EQ(AddressParser::indexToColumn(703), "AAA");
    EXPECT_THROW(AddressParser::indexToColumn(0), core::CellException);
}

TEST(AddressParserTest, Formatting) {
    EXPECT_EQ(AddressParser::formatCell(3, 2), "B3");
    EXPECT_EQ(AddressParser::formatCell(3, 2, true), "$B$3");
    EXPECT_EQ(AddressParser::formatRange(5, 2, 9, 6), "B5:F9");
    EXPECT_EQ(AddressParser::formatRange(5, 2, 5, 2, true), "$B$5");

    EXPECT_EQ(AddressParser::quoteSheetName("Summary"), "Summary");
    EXPECT_EQ(AddressParser::quoteSheetName("Report 1"), "'Report 1'");
    EXPECT_EQ(AddressParser::quoteSheetName("2021"), "'2021'");
    EXPECT_EQ(AddressParser::quoteSheetName("Bob's"), "'Bob''s'");
}

}} // namespace xlsxextract::utils
