/**
 * @file binlog_util.h
 * @brief Utilities for parsing MySQL binlog binary format
 *
 * Integers in the binlog are little-endian unless noted. Temporal and
 * decimal payloads of the row image are big-endian.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>

// NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic)
// NOLINTBEGIN(readability-magic-numbers,cppcoreguidelines-avoid-magic-numbers)

namespace binlogsync::mysql::binlog_util {

/**
 * @brief Read 2 bytes in little-endian format
 */
inline uint16_t uint2korr(const uint8_t* ptr) {
  return static_cast<uint16_t>(ptr[0] | (ptr[1] << 8));
}

/**
 * @brief Read 3 bytes in little-endian format
 */
inline uint32_t uint3korr(const uint8_t* ptr) {
  return static_cast<uint32_t>(ptr[0]) | (static_cast<uint32_t>(ptr[1]) << 8) | (static_cast<uint32_t>(ptr[2]) << 16);
}

/**
 * @brief Read 4 bytes in little-endian format
 */
inline uint32_t uint4korr(const uint8_t* ptr) {
  return static_cast<uint32_t>(ptr[0]) | (static_cast<uint32_t>(ptr[1]) << 8) |
         (static_cast<uint32_t>(ptr[2]) << 16) | (static_cast<uint32_t>(ptr[3]) << 24);
}

/**
 * @brief Read 6 bytes in little-endian format (table ids)
 */
inline uint64_t uint6korr(const uint8_t* ptr) {
  return static_cast<uint64_t>(uint4korr(ptr)) | (static_cast<uint64_t>(uint2korr(ptr + 4)) << 32);
}

/**
 * @brief Read 8 bytes in little-endian format
 */
inline uint64_t uint8korr(const uint8_t* ptr) {
  return static_cast<uint64_t>(uint4korr(ptr)) | (static_cast<uint64_t>(uint4korr(ptr + 4)) << 32);
}

/**
 * @brief Read up to 8 bytes in big-endian format
 */
inline uint64_t read_big_endian(const uint8_t* ptr, size_t length) {
  uint64_t value = 0;
  for (size_t i = 0; i < length; ++i) {
    value = (value << 8) | ptr[i];
  }
  return value;
}

/**
 * @brief Calculate number of bytes needed for bitmap
 */
inline size_t bitmap_bytes(size_t bit_count) {
  return (bit_count + 7) / 8;
}

/**
 * @brief Check if bit is set in bitmap
 */
inline bool bitmap_is_set(const uint8_t* bitmap, size_t bit_index) {
  return (bitmap[bit_index / 8] & (1U << (bit_index % 8))) != 0;
}

/// Bytes used by the trailing partial group of a binary decimal
inline constexpr int kDecimalDigitBytes[10] = {0, 1, 1, 2, 2, 3, 3, 4, 4, 4};
inline constexpr int kDecimalDigitsPerGroup = 9;
inline constexpr int kDecimalGroupBytes = 4;

/**
 * @brief Storage size of a NEWDECIMAL(precision, scale) value
 *
 * Based on MySQL's decimal_bin_size()
 */
inline size_t decimal_binary_size(uint8_t precision, uint8_t scale) {
  if (scale > precision) {
    return 0;
  }
  int intg = precision - scale;
  int intg0 = intg / kDecimalDigitsPerGroup;
  int frac0 = scale / kDecimalDigitsPerGroup;
  return static_cast<size_t>(intg0 * kDecimalGroupBytes + kDecimalDigitBytes[intg % kDecimalDigitsPerGroup] +
                             frac0 * kDecimalGroupBytes + kDecimalDigitBytes[scale % kDecimalDigitsPerGroup]);
}

/**
 * @brief Decode MySQL NEWDECIMAL binary format
 *
 * Based on MySQL's bin2decimal(). The caller guarantees that
 * decimal_binary_size(precision, scale) bytes are readable.
 *
 * The first byte carries the sign in its high bit (set for non-negative
 * values). Negative values are stored with every byte inverted.
 */
inline std::string decode_decimal(const uint8_t* data, uint8_t precision, uint8_t scale) {
  size_t size = decimal_binary_size(precision, scale);
  if (precision == 0 || size == 0) {
    return "0";
  }

  std::string bytes(reinterpret_cast<const char*>(data), size);
  const bool is_negative = (static_cast<uint8_t>(bytes[0]) & 0x80) == 0;
  bytes[0] = static_cast<char>(static_cast<uint8_t>(bytes[0]) ^ 0x80);
  if (is_negative) {
    for (auto& chr : bytes) {
      chr = static_cast<char>(~static_cast<uint8_t>(chr));
    }
  }
  const auto* ptr = reinterpret_cast<const uint8_t*>(bytes.data());

  const int intg = precision - scale;
  const int intg0 = intg / kDecimalDigitsPerGroup;
  const int intg_rem = intg % kDecimalDigitsPerGroup;
  const int frac0 = scale / kDecimalDigitsPerGroup;
  const int frac_rem = scale % kDecimalDigitsPerGroup;

  char buf[16];
  std::string integer_part;
  if (intg_rem > 0) {
    int width = kDecimalDigitBytes[intg_rem];
    integer_part += std::to_string(read_big_endian(ptr, static_cast<size_t>(width)));
    ptr += width;
  }
  for (int i = 0; i < intg0; ++i) {
    auto group = static_cast<uint32_t>(read_big_endian(ptr, kDecimalGroupBytes));
    ptr += kDecimalGroupBytes;
    std::snprintf(buf, sizeof(buf), "%09u", group);
    integer_part += buf;
  }

  size_t first_digit = integer_part.find_first_not_of('0');
  integer_part = first_digit == std::string::npos ? "0" : integer_part.substr(first_digit);

  std::string result = is_negative ? "-" + integer_part : integer_part;
  if (scale > 0) {
    result += '.';
    for (int i = 0; i < frac0; ++i) {
      auto group = static_cast<uint32_t>(read_big_endian(ptr, kDecimalGroupBytes));
      ptr += kDecimalGroupBytes;
      std::snprintf(buf, sizeof(buf), "%09u", group);
      result += buf;
    }
    if (frac_rem > 0) {
      int width = kDecimalDigitBytes[frac_rem];
      auto group = static_cast<uint32_t>(read_big_endian(ptr, static_cast<size_t>(width)));
      std::snprintf(buf, sizeof(buf), "%0*u", frac_rem, group);
      result += buf;
    }
  }
  return result;
}

/**
 * @brief Bounds-checked cursor over an event buffer
 *
 * Every read returns false instead of running past the end, leaving the
 * cursor where it was.
 */
class ByteReader {
 public:
  ByteReader(const uint8_t* data, size_t size) : data_(data), size_(size) {}

  [[nodiscard]] size_t Offset() const { return offset_; }
  [[nodiscard]] size_t Remaining() const { return size_ - offset_; }
  [[nodiscard]] bool AtEnd() const { return offset_ >= size_; }
  [[nodiscard]] const uint8_t* Current() const { return data_ + offset_; }

  bool Skip(size_t count) {
    if (count > Remaining()) {
      return false;
    }
    offset_ += count;
    return true;
  }

  bool ReadU8(uint8_t& out) {
    if (Remaining() < 1) {
      return false;
    }
    out = data_[offset_++];
    return true;
  }

  bool ReadU16(uint16_t& out) { return ReadFixed(2, out, uint2korr); }
  bool ReadU24(uint32_t& out) { return ReadFixed(3, out, uint3korr); }
  bool ReadU32(uint32_t& out) { return ReadFixed(4, out, uint4korr); }
  bool ReadU48(uint64_t& out) { return ReadFixed(6, out, uint6korr); }
  bool ReadU64(uint64_t& out) { return ReadFixed(8, out, uint8korr); }

  /**
   * @brief Read a length-encoded integer
   *
   * Based on MySQL's net_field_length_ll. 0xFB (NULL) reads as 0.
   */
  bool ReadPacked(uint64_t& out) {
    if (Remaining() < 1) {
      return false;
    }
    uint8_t first = data_[offset_];
    size_t extra = 0;
    if (first < 0xFB) {
      out = first;
      ++offset_;
      return true;
    }
    if (first == 0xFB) {
      out = 0;
      ++offset_;
      return true;
    }
    if (first == 0xFC) {
      extra = 2;
    } else if (first == 0xFD) {
      extra = 3;
    } else if (first == 0xFE) {
      extra = 8;
    } else {
      return false;
    }
    if (Remaining() < 1 + extra) {
      return false;
    }
    const uint8_t* ptr = data_ + offset_ + 1;
    out = extra == 2 ? uint2korr(ptr) : extra == 3 ? uint3korr(ptr) : uint8korr(ptr);
    offset_ += 1 + extra;
    return true;
  }

  bool ReadBytes(size_t count, const uint8_t*& out) {
    if (count > Remaining()) {
      return false;
    }
    out = data_ + offset_;
    offset_ += count;
    return true;
  }

  bool ReadString(size_t count, std::string& out) {
    const uint8_t* ptr = nullptr;
    if (!ReadBytes(count, ptr)) {
      return false;
    }
    out.assign(reinterpret_cast<const char*>(ptr), count);
    return true;
  }

 private:
  template <typename T, typename Fn>
  bool ReadFixed(size_t count, T& out, Fn decode) {
    if (Remaining() < count) {
      return false;
    }
    out = static_cast<T>(decode(data_ + offset_));
    offset_ += count;
    return true;
  }

  const uint8_t* data_;
  size_t size_;
  size_t offset_ = 0;
};

}  // namespace binlogsync::mysql::binlog_util

// NOLINTEND(readability-magic-numbers,cppcoreguidelines-avoid-magic-numbers)
// NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)
