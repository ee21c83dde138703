/**
 * @file binlog_util_test.cpp
 * @brief Unit tests for binlog byte helpers
 */

#include "mysql/binlog_util.h"

#include <gtest/gtest.h>

using namespace binlogsync::mysql::binlog_util;

TEST(BinlogUtilTest, LittleEndianReaders) {
  const uint8_t data[] = {0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08};
  EXPECT_EQ(uint2korr(data), 0x0201u);
  EXPECT_EQ(uint3korr(data), 0x030201u);
  EXPECT_EQ(uint4korr(data), 0x04030201u);
  EXPECT_EQ(uint6korr(data), 0x060504030201ULL);
  EXPECT_EQ(uint8korr(data), 0x0807060504030201ULL);
  EXPECT_EQ(read_big_endian(data, 3), 0x010203u);
}

TEST(BinlogUtilTest, Bitmaps) {
  EXPECT_EQ(bitmap_bytes(0), 0u);
  EXPECT_EQ(bitmap_bytes(1), 1u);
  EXPECT_EQ(bitmap_bytes(8), 1u);
  EXPECT_EQ(bitmap_bytes(9), 2u);

  const uint8_t bitmap[] = {0x05, 0x80};
  EXPECT_TRUE(bitmap_is_set(bitmap, 0));
  EXPECT_FALSE(bitmap_is_set(bitmap, 1));
  EXPECT_TRUE(bitmap_is_set(bitmap, 2));
  EXPECT_TRUE(bitmap_is_set(bitmap, 15));
}

TEST(BinlogUtilTest, DecimalBinarySize) {
  EXPECT_EQ(decimal_binary_size(5, 2), 3u);
  EXPECT_EQ(decimal_binary_size(10, 0), 5u);
  EXPECT_EQ(decimal_binary_size(18, 9), 8u);
  EXPECT_EQ(decimal_binary_size(2, 3), 0u);
}

TEST(BinlogUtilTest, DecodeDecimal) {
  const uint8_t positive[] = {0x80, 0x7B, 0x2D};
  EXPECT_EQ(decode_decimal(positive, 5, 2), "123.45");

  const uint8_t negative[] = {0x7F, 0x84, 0xD2};
  EXPECT_EQ(decode_decimal(negative, 5, 2), "-123.45");

  const uint8_t zero_fraction[] = {0x80, 0x00, 0x05};
  EXPECT_EQ(decode_decimal(zero_fraction, 5, 2), "0.05");

  // DECIMAL(10,0) = 1234567890: one leading digit byte then a full group
  const uint8_t wide[] = {0x81, 0x0D, 0xFB, 0x38, 0xD2};
  EXPECT_EQ(decode_decimal(wide, 10, 0), "1234567890");
}

TEST(ByteReaderTest, ReadsSequentially) {
  const uint8_t data[] = {0x2A, 0x34, 0x12, 'a', 'b', 'c'};
  ByteReader reader(data, sizeof(data));

  uint8_t byte = 0;
  uint16_t word = 0;
  std::string text;
  ASSERT_TRUE(reader.ReadU8(byte));
  ASSERT_TRUE(reader.ReadU16(word));
  ASSERT_TRUE(reader.ReadString(3, text));
  EXPECT_EQ(byte, 0x2A);
  EXPECT_EQ(word, 0x1234);
  EXPECT_EQ(text, "abc");
  EXPECT_TRUE(reader.AtEnd());
}

TEST(ByteReaderTest, FailedReadDoesNotAdvance) {
  const uint8_t data[] = {0x01, 0x02, 0x03};
  ByteReader reader(data, sizeof(data));

  uint32_t value = 0;
  EXPECT_FALSE(reader.ReadU32(value));
  EXPECT_EQ(reader.Offset(), 0u);
  EXPECT_FALSE(reader.Skip(4));
  EXPECT_TRUE(reader.Skip(3));
  EXPECT_EQ(reader.Remaining(), 0u);
}

TEST(ByteReaderTest, PackedIntegers) {
  const uint8_t data[] = {0xFA, 0xFC, 0x34, 0x12, 0xFD, 0x01, 0x02, 0x03, 0xFB, 0xFF};
  ByteReader reader(data, sizeof(data));

  uint64_t value = 0;
  ASSERT_TRUE(reader.ReadPacked(value));
  EXPECT_EQ(value, 250u);
  ASSERT_TRUE(reader.ReadPacked(value));
  EXPECT_EQ(value, 0x1234u);
  ASSERT_TRUE(reader.ReadPacked(value));
  EXPECT_EQ(value, 0x030201u);
  ASSERT_TRUE(reader.ReadPacked(value));
  EXPECT_EQ(value, 0u);
  EXPECT_FALSE(reader.ReadPacked(value));
}

TEST(ByteReaderTest, PackedIntegerTruncated) {
  const uint8_t data[] = {0xFE, 0x01, 0x02};
  ByteReader reader(data, sizeof(data));
  uint64_t value = 0;
  EXPECT_FALSE(reader.ReadPacked(value));
  EXPECT_EQ(reader.Offset(), 0u);
}
