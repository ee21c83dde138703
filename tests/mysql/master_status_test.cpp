/**
 * @file master_status_test.cpp
 * @brief Unit tests for replication coordinates
 */

#include "mysql/master_status.h"

#include <gtest/gtest.h>

using namespace binlogsync::mysql;
using binlogsync::utils::ErrorCode;

TEST(MasterStatusTest, WriteToAppends) {
  MasterStatus status{"mysql-bin.000003", 1547, ""};
  std::string out = "pos=";
  status.WriteTo(out);
  EXPECT_EQ(out, "pos=mysql-bin.000003;1547");
  EXPECT_EQ(status.ToString(), "mysql-bin.000003;1547");
}

TEST(MasterStatusTest, GtidSetIsAppendedWhenPresent) {
  MasterStatus status{"bin.000001", 4, "3E11FA47-71CA-11E1-9E33-C80AA9429562:1-5"};
  EXPECT_EQ(status.ToString(), "bin.000001;4;3E11FA47-71CA-11E1-9E33-C80AA9429562:1-5");
}

TEST(MasterStatusTest, ParseReadsWhatWriteToWrote) {
  MasterStatus original{"bin.000042", 987654321, "uuid:1-10,uuid2:1-3"};
  auto parsed = MasterStatus::Parse(original.ToString());
  ASSERT_TRUE(parsed) << parsed.error().to_string();
  EXPECT_EQ(*parsed, original);
}

TEST(MasterStatusTest, ParseTrimsWhitespace) {
  auto parsed = MasterStatus::Parse("  bin.000005;4\n");
  ASSERT_TRUE(parsed);
  EXPECT_EQ(parsed->file, "bin.000005");
  EXPECT_EQ(parsed->position, 4u);
  EXPECT_TRUE(parsed->executed_gtid_set.empty());
}

TEST(MasterStatusTest, ParseRejectsMalformedText) {
  for (const char* text : {"", "   ", "bin.000001", ";120", "bin.000001;", "bin.000001;12x", "bin.000001;-5"}) {
    auto parsed = MasterStatus::Parse(text);
    ASSERT_FALSE(parsed) << text;
    EXPECT_EQ(parsed.error().code(), ErrorCode::kStorageInvalidFormat) << text;
  }
}

TEST(MasterStatusTest, ParseRejectsPositionBelowHeader) {
  auto parsed = MasterStatus::Parse("bin.000001;3");
  ASSERT_FALSE(parsed);
  EXPECT_EQ(parsed.error().code(), ErrorCode::kOutOfRange);
}

TEST(MasterStatusTest, Equality) {
  MasterStatus lhs{"bin.000001", 120, ""};
  MasterStatus rhs{"bin.000001", 120, ""};
  EXPECT_EQ(lhs, rhs);
  rhs.position = 121;
  EXPECT_NE(lhs, rhs);
  EXPECT_TRUE(MasterStatus{}.IsEmpty());
  EXPECT_FALSE(lhs.IsEmpty());
}
