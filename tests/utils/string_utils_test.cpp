/**
 * @file string_utils_test.cpp
 * @brief Unit tests for string helpers
 */

#include "utils/string_utils.h"

#include <gtest/gtest.h>

using namespace binlogsync::utils;

TEST(StringUtilsTest, CaseConversion) {
  EXPECT_EQ(ToLower("ROW"), "row");
  EXPECT_EQ(ToUpper("minimal"), "MINIMAL");
  EXPECT_EQ(ToLower("MiXeD_123"), "mixed_123");
  EXPECT_EQ(ToUpper(""), "");
}

TEST(StringUtilsTest, EqualsIgnoreCase) {
  EXPECT_TRUE(EqualsIgnoreCase("MariaDB", "mariadb"));
  EXPECT_TRUE(EqualsIgnoreCase("", ""));
  EXPECT_FALSE(EqualsIgnoreCase("mysql", "mysq"));
  EXPECT_FALSE(EqualsIgnoreCase("row", "raw"));
}

TEST(StringUtilsTest, Trim) {
  EXPECT_EQ(Trim("  COMMIT \n"), "COMMIT");
  EXPECT_EQ(Trim("\t\r\n "), "");
  EXPECT_EQ(Trim("no-space"), "no-space");
  EXPECT_EQ(Trim(" inner space "), "inner space");
}

TEST(StringUtilsTest, SplitKeepsEmptyPieces) {
  auto parts = Split("a&&b&", '&');
  ASSERT_EQ(parts.size(), 4u);
  EXPECT_EQ(parts[0], "a");
  EXPECT_EQ(parts[1], "");
  EXPECT_EQ(parts[2], "b");
  EXPECT_EQ(parts[3], "");

  auto single = Split("mydb.users", ',');
  ASSERT_EQ(single.size(), 1u);
  EXPECT_EQ(single[0], "mydb.users");
}

TEST(StringUtilsTest, PercentDecode) {
  auto decoded = PercentDecode("p%40ss+word%2F1");
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, "p@ss word/1");

  auto lower_hex = PercentDecode("%3a%3B");
  ASSERT_TRUE(lower_hex.has_value());
  EXPECT_EQ(*lower_hex, ":;");
}

TEST(StringUtilsTest, PercentDecodeRejectsMalformedEscapes) {
  EXPECT_FALSE(PercentDecode("%").has_value());
  EXPECT_FALSE(PercentDecode("abc%4").has_value());
  EXPECT_FALSE(PercentDecode("%zz").has_value());
  EXPECT_FALSE(PercentDecode("%g1tail").has_value());
}

TEST(StringUtilsTest, PercentEncode) {
  EXPECT_EQ(PercentEncode("bin.000005"), "bin.000005");
  EXPECT_EQ(PercentEncode("Asia/Tokyo"), "Asia%2FTokyo");
  EXPECT_EQ(PercentEncode("host:3306"), "host:3306");
  EXPECT_EQ(PercentEncode("a b&c=d"), "a%20b%26c%3Dd");
  EXPECT_EQ(PercentEncode("p@ss"), "p%40ss");
}

TEST(StringUtilsTest, PercentEncodeDecodesBack) {
  const std::string original = "weird?&= value%";
  auto decoded = PercentDecode(PercentEncode(original));
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, original);
}

TEST(StringUtilsTest, ParseUint64) {
  EXPECT_EQ(ParseUint64("0"), 0u);
  EXPECT_EQ(ParseUint64("4"), 4u);
  EXPECT_EQ(ParseUint64("18446744073709551615"), UINT64_MAX);
  EXPECT_FALSE(ParseUint64("").has_value());
  EXPECT_FALSE(ParseUint64("-1").has_value());
  EXPECT_FALSE(ParseUint64("12abc").has_value());
  EXPECT_FALSE(ParseUint64(" 12").has_value());
  EXPECT_FALSE(ParseUint64("18446744073709551616").has_value());
}

TEST(StringUtilsTest, EscapeSqlString) {
  EXPECT_EQ(EscapeSqlString("CRC32"), "CRC32");
  EXPECT_EQ(EscapeSqlString("it's"), "it\\'s");
  EXPECT_EQ(EscapeSqlString("a\\b"), "a\\\\b");
  EXPECT_EQ(EscapeSqlString(std::string("x\0y", 3)), "x\\0y");
  EXPECT_EQ(EscapeSqlString("line\nbreak\r"), "line\\nbreak\\r");
}

TEST(StringUtilsTest, QuoteIdentifier) {
  EXPECT_EQ(QuoteIdentifier("users"), "`users`");
  EXPECT_EQ(QuoteIdentifier("odd`name"), "`odd``name`");
  EXPECT_EQ(QuoteIdentifier(""), "``");
}
