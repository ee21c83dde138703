/**
 * @file binlog_event_decoder.cpp
 * @brief Binlog event decoding
 *
 * Layouts follow libbinlogevents (MySQL 8.x) and the MariaDB event
 * extensions. All value readers go through ByteReader so malformed events
 * surface as kMySQLBinlogError rather than out-of-bounds reads.
 */

#include "mysql/binlog_event_decoder.h"

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <zlib.h>

#include <cstring>
#include <ctime>
#include <stdexcept>
#include <string>

#include "mysql/binlog_util.h"

// NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic)
// NOLINTBEGIN(readability-magic-numbers,cppcoreguidelines-avoid-magic-numbers)

namespace binlogsync::mysql {

using binlog_util::ByteReader;
using utils::ErrorCode;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

constexpr size_t kServerVersionLength = 50;
// binlog_version + server_version + create_timestamp + header_length
constexpr size_t kFormatDescriptionFixedLength = 2 + kServerVersionLength + 4 + 1;
// checksum algorithm byte + checksum
constexpr size_t kFormatDescriptionChecksumTrailer = 1 + kBinlogChecksumSize;

constexpr uint8_t kQueryPostHeaderLength = 13;
constexpr uint8_t kRotatePostHeaderLength = 8;
constexpr uint8_t kTableMapPostHeaderLength = 8;
constexpr uint8_t kRowsV1PostHeaderLength = 8;
constexpr uint8_t kRowsV2PostHeaderLength = 10;

constexpr int64_t kTimefIntOffset = 0x800000;
constexpr int64_t kTimefOffset = 0x800000000000LL;
constexpr int64_t kDatetimefIntOffset = 0x8000000000LL;

utils::Error Truncated(const char* what) {
  return MakeError(ErrorCode::kMySQLBinlogError, std::string("truncated ") + what);
}

/**
 * @brief Compare "x.y.z-suffix" against a minimum version
 */
bool VersionAtLeast(const std::string& version, int major, int minor, int patch) {
  int parts[3] = {0, 0, 0};
  size_t index = 0;
  for (char chr : version) {
    if (chr >= '0' && chr <= '9') {
      parts[index] = parts[index] * 10 + (chr - '0');
    } else if (chr == '.' && index < 2) {
      ++index;
    } else {
      break;
    }
  }
  if (parts[0] != major) {
    return parts[0] > major;
  }
  if (parts[1] != minor) {
    return parts[1] > minor;
  }
  return parts[2] >= patch;
}

bool HasChecksumAlgorithmByte(const std::string& server_version) {
  if (server_version.find("MariaDB") != std::string::npos || server_version.find("-maria-") != std::string::npos) {
    return VersionAtLeast(server_version, 5, 3, 0);
  }
  return VersionAtLeast(server_version, 5, 6, 1);
}

utils::Expected<void, utils::Error> VerifyCrc32(const uint8_t* data, size_t size) {
  if (size < kBinlogHeaderSize + kBinlogChecksumSize) {
    return MakeUnexpected(Truncated("event checksum"));
  }
  size_t payload = size - kBinlogChecksumSize;
  uLong crc = crc32(0L, Z_NULL, 0);
  crc = crc32(crc, data, static_cast<uInt>(payload));
  uint32_t expected = binlog_util::uint4korr(data + payload);
  if (static_cast<uint32_t>(crc) != expected) {
    return MakeUnexpected(MakeError(ErrorCode::kMySQLChecksumMismatch,
                                    fmt::format("binlog event checksum mismatch: computed {:08x}, stored {:08x}",
                                                static_cast<uint32_t>(crc), expected)));
  }
  return {};
}

std::string FormatUuid(const uint8_t* sid) {
  std::string out;
  out.reserve(36);
  for (size_t i = 0; i < 16; ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      out += '-';
    }
    out += fmt::format("{:02x}", sid[i]);
  }
  return out;
}

/**
 * @brief Scale the stored fractional part of a temporal value to microseconds
 */
uint32_t FractionToMicros(uint64_t frac, uint16_t precision) {
  switch (precision) {
    case 1:
    case 2:
      return static_cast<uint32_t>(frac * 10000);
    case 3:
    case 4:
      return static_cast<uint32_t>(frac * 100);
    default:
      return static_cast<uint32_t>(frac);
  }
}

/// Append ".ffffff" truncated to the column precision
void AppendFraction(std::string& out, uint32_t micros, uint16_t precision) {
  if (precision == 0) {
    return;
  }
  std::string digits = fmt::format("{:06d}", micros);
  out += '.';
  out += digits.substr(0, precision > 6 ? 6 : precision);
}

std::string FormatUnixTime(uint32_t seconds) {
  if (seconds == 0) {
    return "0000-00-00 00:00:00";
  }
  std::time_t time = seconds;
  std::tm parts{};
  gmtime_r(&time, &parts);
  return fmt::format("{:04d}-{:02d}-{:02d} {:02d}:{:02d}:{:02d}", parts.tm_year + 1900, parts.tm_mon + 1,
                     parts.tm_mday, parts.tm_hour, parts.tm_min, parts.tm_sec);
}

/// Width of the length prefix of a BLOB-like value (1-4 bytes)
utils::Expected<std::string, utils::Error> ReadLengthPrefixed(const uint8_t* data, size_t available, size_t prefix,
                                                              size_t& consumed, const char* what) {
  if (prefix == 0 || prefix > 4) {
    return MakeUnexpected(MakeError(ErrorCode::kMySQLBinlogError,
                                    fmt::format("invalid length prefix {} for {}", prefix, what)));
  }
  if (available < prefix) {
    return MakeUnexpected(Truncated(what));
  }
  uint64_t length = 0;
  switch (prefix) {
    case 1:
      length = data[0];
      break;
    case 2:
      length = binlog_util::uint2korr(data);
      break;
    case 3:
      length = binlog_util::uint3korr(data);
      break;
    default:
      length = binlog_util::uint4korr(data);
      break;
  }
  if (length > available - prefix) {
    return MakeUnexpected(Truncated(what));
  }
  consumed = prefix + static_cast<size_t>(length);
  return std::string(reinterpret_cast<const char*>(data + prefix), static_cast<size_t>(length));
}

utils::Expected<std::string, utils::Error> DecodeTime2(const uint8_t* data, size_t available, uint16_t precision,
                                                       size_t& consumed) {
  size_t frac_bytes = (precision + 1U) / 2U;
  if (available < 3 + frac_bytes) {
    return MakeUnexpected(Truncated("TIME2 value"));
  }
  consumed = 3 + frac_bytes;

  int64_t packed = 0;
  switch (precision) {
    case 1:
    case 2: {
      int64_t int_part = static_cast<int64_t>(binlog_util::read_big_endian(data, 3)) - kTimefIntOffset;
      int64_t frac = data[3];
      if (int_part < 0 && frac > 0) {
        int_part++;
        frac -= 0x100;
      }
      packed = int_part * (1LL << 24) + frac * 10000;
      break;
    }
    case 3:
    case 4: {
      int64_t int_part = static_cast<int64_t>(binlog_util::read_big_endian(data, 3)) - kTimefIntOffset;
      int64_t frac = static_cast<int64_t>(binlog_util::read_big_endian(data + 3, 2));
      if (int_part < 0 && frac > 0) {
        int_part++;
        frac -= 0x10000;
      }
      packed = int_part * (1LL << 24) + frac * 100;
      break;
    }
    case 5:
    case 6:
      packed = static_cast<int64_t>(binlog_util::read_big_endian(data, 6)) - kTimefOffset;
      break;
    default:
      packed = (static_cast<int64_t>(binlog_util::read_big_endian(data, 3)) - kTimefIntOffset) * (1LL << 24);
      break;
  }

  std::string sign;
  if (packed < 0) {
    sign = "-";
    packed = -packed;
  }
  int64_t hms = packed >> 24;
  auto micros = static_cast<uint32_t>(packed % (1LL << 24));
  std::string out = fmt::format("{}{:02d}:{:02d}:{:02d}", sign, (hms >> 12) % (1 << 10), (hms >> 6) % (1 << 6),
                                hms % (1 << 6));
  AppendFraction(out, micros, precision);
  return out;
}

utils::Expected<std::string, utils::Error> DecodeDatetime2(const uint8_t* data, size_t available,
                                                           uint16_t precision, size_t& consumed) {
  size_t frac_bytes = (precision + 1U) / 2U;
  if (available < 5 + frac_bytes) {
    return MakeUnexpected(Truncated("DATETIME2 value"));
  }
  consumed = 5 + frac_bytes;

  int64_t int_part = static_cast<int64_t>(binlog_util::read_big_endian(data, 5)) - kDatetimefIntOffset;
  uint32_t micros = 0;
  if (frac_bytes > 0) {
    micros = FractionToMicros(binlog_util::read_big_endian(data + 5, frac_bytes), precision);
  }

  if (int_part == 0) {
    std::string out = "0000-00-00 00:00:00";
    AppendFraction(out, 0, precision);
    return out;
  }
  if (int_part < 0) {
    int_part = -int_part;
  }

  int64_t ymd = int_part >> 17;
  int64_t year_month = ymd >> 5;
  int64_t hms = int_part % (1LL << 17);
  std::string out = fmt::format("{:04d}-{:02d}-{:02d} {:02d}:{:02d}:{:02d}", year_month / 13, year_month % 13,
                                ymd % (1 << 5), hms >> 12, (hms >> 6) % (1 << 6), hms % (1 << 6));
  AppendFraction(out, micros, precision);
  return out;
}

utils::Expected<std::string, utils::Error> DecodeTimestamp2(const uint8_t* data, size_t available,
                                                            uint16_t precision, size_t& consumed) {
  size_t frac_bytes = (precision + 1U) / 2U;
  if (available < 4 + frac_bytes) {
    return MakeUnexpected(Truncated("TIMESTAMP2 value"));
  }
  consumed = 4 + frac_bytes;

  auto seconds = static_cast<uint32_t>(binlog_util::read_big_endian(data, 4));
  uint32_t micros = 0;
  if (frac_bytes > 0) {
    micros = FractionToMicros(binlog_util::read_big_endian(data + 4, frac_bytes), precision);
  }
  std::string out = FormatUnixTime(seconds);
  AppendFraction(out, micros, precision);
  return out;
}

/**
 * @brief Decode one row image (null bitmap + values of the present columns)
 */
utils::Expected<Row, utils::Error> DecodeRowImage(ByteReader& reader, const TableMapEvent& table,
                                                  const uint8_t* present, size_t present_count) {
  const size_t column_count = table.ColumnCount();
  const uint8_t* null_bitmap = nullptr;
  if (!reader.ReadBytes(binlog_util::bitmap_bytes(present_count), null_bitmap)) {
    return MakeUnexpected(Truncated("row null bitmap"));
  }

  Row row(column_count);
  size_t null_index = 0;
  for (size_t col = 0; col < column_count; ++col) {
    if (!binlog_util::bitmap_is_set(present, col)) {
      continue;
    }
    bool is_null = binlog_util::bitmap_is_set(null_bitmap, null_index++);
    if (is_null) {
      continue;
    }
    size_t consumed = 0;
    auto value = DecodeColumnValue(table.column_types[col], table.column_metadata[col], reader.Current(),
                                   reader.Remaining(), consumed);
    if (!value) {
      return MakeUnexpected(MakeError(value.error().code(), value.error().message(),
                                      fmt::format("{}.{} column {}", table.schema, table.table, col)));
    }
    reader.Skip(consumed);
    row[col] = std::move(*value);
  }
  return row;
}

size_t CountBits(const uint8_t* bitmap, size_t bit_count) {
  size_t count = 0;
  for (size_t i = 0; i < bit_count; ++i) {
    if (binlog_util::bitmap_is_set(bitmap, i)) {
      ++count;
    }
  }
  return count;
}

}  // namespace

bool IsIntegerColumn(ColumnType type) {
  switch (type) {
    case ColumnType::TINY:
    case ColumnType::SHORT:
    case ColumnType::INT24:
    case ColumnType::LONG:
    case ColumnType::LONGLONG:
      return true;
    default:
      return false;
  }
}

std::string ReinterpretUnsigned(ColumnType type, const std::string& value) {
  if (!IsIntegerColumn(type) || value.empty() || value[0] != '-') {
    return value;
  }
  int64_t signed_value = 0;
  try {
    signed_value = std::stoll(value);
  } catch (const std::exception&) {
    return value;
  }
  switch (type) {
    case ColumnType::TINY:
      return std::to_string(static_cast<uint8_t>(signed_value));
    case ColumnType::SHORT:
      return std::to_string(static_cast<uint16_t>(signed_value));
    case ColumnType::INT24:
      return std::to_string(static_cast<uint32_t>(signed_value) & 0xFFFFFFU);
    case ColumnType::LONG:
      return std::to_string(static_cast<uint32_t>(signed_value));
    default:
      return std::to_string(static_cast<uint64_t>(signed_value));
  }
}

utils::Expected<std::string, utils::Error> DecodeColumnValue(ColumnType type, uint16_t metadata, const uint8_t* data,
                                                             size_t available, size_t& consumed) {
  auto need = [&](size_t bytes, const char* what) -> utils::Expected<void, utils::Error> {
    if (available < bytes) {
      return MakeUnexpected(Truncated(what));
    }
    consumed = bytes;
    return {};
  };

  // CHAR columns carry the real type (ENUM/SET/STRING) in the high metadata byte
  if (type == ColumnType::STRING && metadata >= 0x100) {
    auto real_type = static_cast<ColumnType>(metadata >> 8);
    if (real_type == ColumnType::ENUM || real_type == ColumnType::SET) {
      type = real_type;
      metadata &= 0xFF;
    }
  }

  switch (type) {
    case ColumnType::TINY: {
      if (auto ok = need(1, "TINYINT value"); !ok) {
        return MakeUnexpected(ok.error());
      }
      return std::to_string(static_cast<int8_t>(data[0]));
    }
    case ColumnType::SHORT: {
      if (auto ok = need(2, "SMALLINT value"); !ok) {
        return MakeUnexpected(ok.error());
      }
      return std::to_string(static_cast<int16_t>(binlog_util::uint2korr(data)));
    }
    case ColumnType::INT24: {
      if (auto ok = need(3, "MEDIUMINT value"); !ok) {
        return MakeUnexpected(ok.error());
      }
      uint32_t value = binlog_util::uint3korr(data);
      if ((value & 0x800000U) != 0U) {
        value |= 0xFF000000U;
      }
      return std::to_string(static_cast<int32_t>(value));
    }
    case ColumnType::LONG: {
      if (auto ok = need(4, "INT value"); !ok) {
        return MakeUnexpected(ok.error());
      }
      return std::to_string(static_cast<int32_t>(binlog_util::uint4korr(data)));
    }
    case ColumnType::LONGLONG: {
      if (auto ok = need(8, "BIGINT value"); !ok) {
        return MakeUnexpected(ok.error());
      }
      return std::to_string(static_cast<int64_t>(binlog_util::uint8korr(data)));
    }
    case ColumnType::FLOAT: {
      if (auto ok = need(4, "FLOAT value"); !ok) {
        return MakeUnexpected(ok.error());
      }
      uint32_t bits = binlog_util::uint4korr(data);
      float value = 0;
      std::memcpy(&value, &bits, sizeof(value));
      return fmt::format("{}", value);
    }
    case ColumnType::DOUBLE: {
      if (auto ok = need(8, "DOUBLE value"); !ok) {
        return MakeUnexpected(ok.error());
      }
      uint64_t bits = binlog_util::uint8korr(data);
      double value = 0;
      std::memcpy(&value, &bits, sizeof(value));
      return fmt::format("{}", value);
    }
    case ColumnType::YEAR: {
      if (auto ok = need(1, "YEAR value"); !ok) {
        return MakeUnexpected(ok.error());
      }
      return data[0] == 0 ? std::string("0000") : std::to_string(1900 + data[0]);
    }
    case ColumnType::NEWDECIMAL: {
      auto precision = static_cast<uint8_t>(metadata >> 8);
      auto scale = static_cast<uint8_t>(metadata & 0xFF);
      size_t size = binlog_util::decimal_binary_size(precision, scale);
      if (size == 0) {
        return MakeUnexpected(MakeError(ErrorCode::kMySQLBinlogError,
                                        fmt::format("invalid DECIMAL({},{}) metadata", precision, scale)));
      }
      if (auto ok = need(size, "DECIMAL value"); !ok) {
        return MakeUnexpected(ok.error());
      }
      return binlog_util::decode_decimal(data, precision, scale);
    }
    case ColumnType::DATE:
    case ColumnType::NEWDATE: {
      if (auto ok = need(3, "DATE value"); !ok) {
        return MakeUnexpected(ok.error());
      }
      uint32_t value = binlog_util::uint3korr(data);
      return fmt::format("{:04d}-{:02d}-{:02d}", value >> 9, (value >> 5) & 0x0F, value & 0x1F);
    }
    case ColumnType::TIME: {
      if (auto ok = need(3, "TIME value"); !ok) {
        return MakeUnexpected(ok.error());
      }
      uint32_t raw = binlog_util::uint3korr(data);
      if ((raw & 0x800000U) != 0U) {
        raw |= 0xFF000000U;
      }
      auto value = static_cast<int32_t>(raw);
      std::string sign = value < 0 ? "-" : "";
      value = value < 0 ? -value : value;
      return fmt::format("{}{:02d}:{:02d}:{:02d}", sign, value / 10000, (value % 10000) / 100, value % 100);
    }
    case ColumnType::TIME2:
      return DecodeTime2(data, available, metadata, consumed);
    case ColumnType::DATETIME: {
      if (auto ok = need(8, "DATETIME value"); !ok) {
        return MakeUnexpected(ok.error());
      }
      uint64_t value = binlog_util::uint8korr(data);
      uint64_t date = value / 1000000;
      uint64_t time = value % 1000000;
      return fmt::format("{:04d}-{:02d}-{:02d} {:02d}:{:02d}:{:02d}", date / 10000, (date % 10000) / 100, date % 100,
                         time / 10000, (time % 10000) / 100, time % 100);
    }
    case ColumnType::DATETIME2:
      return DecodeDatetime2(data, available, metadata, consumed);
    case ColumnType::TIMESTAMP: {
      if (auto ok = need(4, "TIMESTAMP value"); !ok) {
        return MakeUnexpected(ok.error());
      }
      return FormatUnixTime(binlog_util::uint4korr(data));
    }
    case ColumnType::TIMESTAMP2:
      return DecodeTimestamp2(data, available, metadata, consumed);
    case ColumnType::VARCHAR:
    case ColumnType::VAR_STRING:
      return ReadLengthPrefixed(data, available, metadata > 255 ? 2 : 1, consumed, "VARCHAR value");
    case ColumnType::STRING: {
      uint32_t max_length = (((metadata >> 4) & 0x300U) ^ 0x300U) + (metadata & 0xFFU);
      return ReadLengthPrefixed(data, available, max_length > 255 ? 2 : 1, consumed, "CHAR value");
    }
    case ColumnType::ENUM: {
      if (metadata != 1 && metadata != 2) {
        return MakeUnexpected(
            MakeError(ErrorCode::kMySQLBinlogError, fmt::format("invalid ENUM pack length {}", metadata)));
      }
      if (auto ok = need(metadata, "ENUM value"); !ok) {
        return MakeUnexpected(ok.error());
      }
      return std::to_string(metadata == 1 ? data[0] : binlog_util::uint2korr(data));
    }
    case ColumnType::SET: {
      if (metadata == 0 || metadata > 8) {
        return MakeUnexpected(
            MakeError(ErrorCode::kMySQLBinlogError, fmt::format("invalid SET pack length {}", metadata)));
      }
      if (auto ok = need(metadata, "SET value"); !ok) {
        return MakeUnexpected(ok.error());
      }
      uint64_t bits = 0;
      for (size_t i = 0; i < metadata; ++i) {
        bits |= static_cast<uint64_t>(data[i]) << (8 * i);
      }
      return std::to_string(bits);
    }
    case ColumnType::BIT: {
      size_t nbits = ((metadata >> 8) * 8U) + (metadata & 0xFFU);
      size_t nbytes = (nbits + 7) / 8;
      if (nbytes == 0 || nbytes > 8) {
        return MakeUnexpected(
            MakeError(ErrorCode::kMySQLBinlogError, fmt::format("invalid BIT width {}", nbits)));
      }
      if (auto ok = need(nbytes, "BIT value"); !ok) {
        return MakeUnexpected(ok.error());
      }
      return std::to_string(binlog_util::read_big_endian(data, nbytes));
    }
    case ColumnType::TINY_BLOB:
    case ColumnType::MEDIUM_BLOB:
    case ColumnType::LONG_BLOB:
    case ColumnType::BLOB:
    case ColumnType::GEOMETRY:
      return ReadLengthPrefixed(data, available, metadata, consumed, "BLOB value");
    case ColumnType::JSON:
      // Binary JSON is passed through as stored
      return ReadLengthPrefixed(data, available, metadata == 0 ? 4 : metadata, consumed, "JSON value");
    case ColumnType::NULL_TYPE:
      consumed = 0;
      return std::string();
    default:
      return MakeUnexpected(MakeError(ErrorCode::kMySQLBinlogError,
                                      fmt::format("unsupported column type {}", static_cast<int>(type))));
  }
}

void BinlogEventDecoder::Reset() {
  has_format_ = false;
  checksum_ = ChecksumAlgorithm::kOff;
  post_header_lengths_.clear();
  table_maps_.clear();
}

ChecksumAlgorithm BinlogEventDecoder::Checksum() const {
  return has_format_ ? checksum_ : negotiated_checksum_;
}

std::shared_ptr<const TableMapEvent> BinlogEventDecoder::FindTableMap(uint64_t table_id) const {
  auto it = table_maps_.find(table_id);
  return it == table_maps_.end() ? nullptr : it->second;
}

uint8_t BinlogEventDecoder::PostHeaderLength(BinlogEventType type, uint8_t fallback) const {
  auto index = static_cast<size_t>(type);
  if (index == 0 || index > post_header_lengths_.size()) {
    return fallback;
  }
  return post_header_lengths_[index - 1];
}

utils::Expected<BinlogEvent, utils::Error> BinlogEventDecoder::Decode(const uint8_t* data, size_t size) {
  if (data == nullptr || size < kBinlogHeaderSize) {
    return MakeUnexpected(Truncated("event header"));
  }

  BinlogEvent event;
  ByteReader header(data, kBinlogHeaderSize);
  uint8_t type_code = 0;
  header.ReadU32(event.header.timestamp);
  header.ReadU8(type_code);
  header.ReadU32(event.header.server_id);
  header.ReadU32(event.header.event_size);
  header.ReadU32(event.header.log_pos);
  header.ReadU16(event.header.flags);
  event.header.type = static_cast<BinlogEventType>(type_code);

  if (event.header.event_size < kBinlogHeaderSize || event.header.event_size > size) {
    return MakeUnexpected(MakeError(ErrorCode::kMySQLBinlogError,
                                    fmt::format("event size {} does not fit buffer of {} bytes",
                                                event.header.event_size, size)));
  }
  size_t length = event.header.event_size;

  if (event.header.type == BinlogEventType::FORMAT_DESCRIPTION_EVENT) {
    if (auto decoded = DecodeFormatDescription(data, length, event); !decoded) {
      return MakeUnexpected(decoded.error());
    }
    return event;
  }

  if (Checksum() == ChecksumAlgorithm::kCrc32) {
    if (auto verified = VerifyCrc32(data, length); !verified) {
      return MakeUnexpected(verified.error());
    }
    length -= kBinlogChecksumSize;
  }

  const uint8_t* body = data + kBinlogHeaderSize;
  const size_t body_size = length - kBinlogHeaderSize;
  ByteReader reader(body, body_size);

  switch (event.header.type) {
    case BinlogEventType::ROTATE_EVENT: {
      RotateEvent rotate;
      uint8_t post_header = PostHeaderLength(event.header.type, kRotatePostHeaderLength);
      if (post_header >= 8) {
        if (!reader.ReadU64(rotate.position) || !reader.Skip(post_header - 8U)) {
          return MakeUnexpected(Truncated("rotate event"));
        }
      }
      reader.ReadString(reader.Remaining(), rotate.next_file);
      event.kind = EventKind::kRotate;
      event.body = std::move(rotate);
      break;
    }
    case BinlogEventType::QUERY_EVENT: {
      QueryEvent query;
      uint8_t post_header = PostHeaderLength(event.header.type, kQueryPostHeaderLength);
      uint8_t schema_length = 0;
      uint16_t status_length = 0;
      if (!reader.ReadU32(query.thread_id) || !reader.ReadU32(query.exec_time) || !reader.ReadU8(schema_length) ||
          !reader.ReadU16(query.error_code)) {
        return MakeUnexpected(Truncated("query event post-header"));
      }
      if (post_header >= kQueryPostHeaderLength) {
        if (!reader.ReadU16(status_length) || !reader.Skip(post_header - kQueryPostHeaderLength)) {
          return MakeUnexpected(Truncated("query event post-header"));
        }
      }
      if (!reader.Skip(status_length) || !reader.ReadString(schema_length, query.schema) || !reader.Skip(1)) {
        return MakeUnexpected(Truncated("query event body"));
      }
      reader.ReadString(reader.Remaining(), query.query);
      event.kind = EventKind::kQuery;
      event.body = std::move(query);
      break;
    }
    case BinlogEventType::XID_EVENT: {
      XidEvent xid;
      if (!reader.ReadU64(xid.xid)) {
        return MakeUnexpected(Truncated("xid event"));
      }
      event.kind = EventKind::kXid;
      event.body = xid;
      break;
    }
    case BinlogEventType::TABLE_MAP_EVENT:
      if (auto decoded = DecodeTableMap(body, body_size, event); !decoded) {
        return MakeUnexpected(decoded.error());
      }
      break;
    case BinlogEventType::WRITE_ROWS_EVENT_V1:
    case BinlogEventType::UPDATE_ROWS_EVENT_V1:
    case BinlogEventType::DELETE_ROWS_EVENT_V1:
    case BinlogEventType::WRITE_ROWS_EVENT:
    case BinlogEventType::UPDATE_ROWS_EVENT:
    case BinlogEventType::DELETE_ROWS_EVENT:
      if (auto decoded = DecodeRows(body, body_size, event); !decoded) {
        return MakeUnexpected(decoded.error());
      }
      break;
    case BinlogEventType::GTID_LOG_EVENT: {
      uint8_t flags = 0;
      const uint8_t* sid = nullptr;
      uint64_t gno = 0;
      if (!reader.ReadU8(flags) || !reader.ReadBytes(16, sid) || !reader.ReadU64(gno)) {
        return MakeUnexpected(Truncated("gtid event"));
      }
      event.kind = EventKind::kGtid;
      event.body = GtidEvent{FormatUuid(sid) + ":" + std::to_string(gno), false};
      break;
    }
    case BinlogEventType::MARIADB_GTID_EVENT: {
      uint64_t sequence = 0;
      uint32_t domain = 0;
      if (!reader.ReadU64(sequence) || !reader.ReadU32(domain)) {
        return MakeUnexpected(Truncated("mariadb gtid event"));
      }
      event.kind = EventKind::kGtid;
      event.body = GtidEvent{fmt::format("{}-{}-{}", domain, event.header.server_id, sequence), true};
      break;
    }
    case BinlogEventType::HEARTBEAT_LOG_EVENT: {
      HeartbeatEvent heartbeat;
      reader.ReadString(reader.Remaining(), heartbeat.log_file);
      event.kind = EventKind::kHeartbeat;
      event.body = std::move(heartbeat);
      break;
    }
    case BinlogEventType::HEARTBEAT_LOG_EVENT_V2:
      event.kind = EventKind::kHeartbeat;
      event.body = HeartbeatEvent{};
      break;
    default:
      event.kind = EventKind::kUnknown;
      break;
  }
  return event;
}

utils::Expected<void, utils::Error> BinlogEventDecoder::DecodeFormatDescription(const uint8_t* data, size_t size,
                                                                                BinlogEvent& event) {
  if (size < kBinlogHeaderSize + kFormatDescriptionFixedLength) {
    return MakeUnexpected(Truncated("format description event"));
  }

  FormatDescriptionEvent fde;
  ByteReader reader(data + kBinlogHeaderSize, size - kBinlogHeaderSize);
  std::string raw_version;
  reader.ReadU16(fde.binlog_version);
  reader.ReadString(kServerVersionLength, raw_version);
  reader.ReadU32(fde.create_timestamp);
  reader.ReadU8(fde.header_length);
  fde.server_version = raw_version.substr(0, raw_version.find('\0'));

  size_t trailer = 0;
  fde.checksum = ChecksumAlgorithm::kOff;
  if (HasChecksumAlgorithmByte(fde.server_version)) {
    if (size < kBinlogHeaderSize + kFormatDescriptionFixedLength + kFormatDescriptionChecksumTrailer) {
      return MakeUnexpected(Truncated("format description checksum trailer"));
    }
    trailer = kFormatDescriptionChecksumTrailer;
    fde.checksum = static_cast<ChecksumAlgorithm>(data[size - kFormatDescriptionChecksumTrailer]);
    if (fde.checksum == ChecksumAlgorithm::kCrc32) {
      if (auto verified = VerifyCrc32(data, size); !verified) {
        return MakeUnexpected(verified.error());
      }
    }
  }

  size_t lengths_count = size - kBinlogHeaderSize - kFormatDescriptionFixedLength - trailer;
  const uint8_t* lengths = nullptr;
  reader.ReadBytes(lengths_count, lengths);
  post_header_lengths_.assign(lengths, lengths + lengths_count);

  checksum_ = fde.checksum == ChecksumAlgorithm::kCrc32 ? ChecksumAlgorithm::kCrc32 : ChecksumAlgorithm::kOff;
  has_format_ = true;

  spdlog::debug("Format description: binlog v{}, server {}, checksum {}", fde.binlog_version, fde.server_version,
                checksum_ == ChecksumAlgorithm::kCrc32 ? "CRC32" : "NONE");

  event.kind = EventKind::kFormatDescription;
  event.body = std::move(fde);
  return {};
}

utils::Expected<void, utils::Error> BinlogEventDecoder::DecodeTableMap(const uint8_t* body, size_t size,
                                                                       BinlogEvent& event) {
  auto table = std::make_shared<TableMapEvent>();
  ByteReader reader(body, size);

  uint8_t post_header = PostHeaderLength(BinlogEventType::TABLE_MAP_EVENT, kTableMapPostHeaderLength);
  bool ok = true;
  if (post_header == 6) {
    uint32_t short_id = 0;
    ok = reader.ReadU32(short_id);
    table->table_id = short_id;
  } else {
    ok = reader.ReadU48(table->table_id);
  }
  ok = ok && reader.ReadU16(table->flags);

  uint8_t schema_length = 0;
  uint8_t table_length = 0;
  ok = ok && reader.ReadU8(schema_length) && reader.ReadString(schema_length, table->schema) && reader.Skip(1);
  ok = ok && reader.ReadU8(table_length) && reader.ReadString(table_length, table->table) && reader.Skip(1);

  uint64_t column_count = 0;
  ok = ok && reader.ReadPacked(column_count);
  if (!ok || column_count > reader.Remaining()) {
    return MakeUnexpected(Truncated("table map event"));
  }

  const uint8_t* types = nullptr;
  reader.ReadBytes(static_cast<size_t>(column_count), types);
  table->column_types.reserve(column_count);
  for (size_t i = 0; i < column_count; ++i) {
    table->column_types.push_back(static_cast<ColumnType>(types[i]));
  }

  uint64_t metadata_length = 0;
  const uint8_t* metadata = nullptr;
  if (!reader.ReadPacked(metadata_length) || !reader.ReadBytes(static_cast<size_t>(metadata_length), metadata)) {
    return MakeUnexpected(Truncated("table map metadata"));
  }

  ByteReader meta(metadata, static_cast<size_t>(metadata_length));
  table->column_metadata.assign(column_count, 0);
  for (size_t i = 0; i < column_count; ++i) {
    uint16_t value = 0;
    bool read = true;
    switch (table->column_types[i]) {
      case ColumnType::FLOAT:
      case ColumnType::DOUBLE:
      case ColumnType::TINY_BLOB:
      case ColumnType::MEDIUM_BLOB:
      case ColumnType::LONG_BLOB:
      case ColumnType::BLOB:
      case ColumnType::GEOMETRY:
      case ColumnType::JSON:
      case ColumnType::TIME2:
      case ColumnType::DATETIME2:
      case ColumnType::TIMESTAMP2: {
        uint8_t byte = 0;
        read = meta.ReadU8(byte);
        value = byte;
        break;
      }
      case ColumnType::VARCHAR:
      case ColumnType::VAR_STRING:
      case ColumnType::BIT:
        read = meta.ReadU16(value);
        break;
      case ColumnType::NEWDECIMAL:
      case ColumnType::STRING:
      case ColumnType::ENUM:
      case ColumnType::SET: {
        const uint8_t* pair = nullptr;
        read = meta.ReadBytes(2, pair);
        if (read) {
          value = static_cast<uint16_t>((pair[0] << 8) | pair[1]);
        }
        break;
      }
      default:
        break;
    }
    if (!read) {
      return MakeUnexpected(Truncated("table map column metadata"));
    }
    table->column_metadata[i] = value;
  }

  const uint8_t* null_bitmap = nullptr;
  size_t null_bytes = binlog_util::bitmap_bytes(static_cast<size_t>(column_count));
  if (!reader.ReadBytes(null_bytes, null_bitmap)) {
    return MakeUnexpected(Truncated("table map null bitmap"));
  }
  table->null_bitmap.assign(null_bitmap, null_bitmap + null_bytes);

  table_maps_[table->table_id] = table;
  event.kind = EventKind::kTableMap;
  event.body = std::shared_ptr<const TableMapEvent>(table);
  return {};
}

utils::Expected<void, utils::Error> BinlogEventDecoder::DecodeRows(const uint8_t* body, size_t size,
                                                                   BinlogEvent& event) {
  RowsEvent rows;
  const auto type = event.header.type;
  rows.version = static_cast<uint8_t>(type) >= static_cast<uint8_t>(BinlogEventType::WRITE_ROWS_EVENT) ? 2 : 1;
  switch (type) {
    case BinlogEventType::WRITE_ROWS_EVENT_V1:
    case BinlogEventType::WRITE_ROWS_EVENT:
      rows.kind = RowsEventKind::kWrite;
      break;
    case BinlogEventType::UPDATE_ROWS_EVENT_V1:
    case BinlogEventType::UPDATE_ROWS_EVENT:
      rows.kind = RowsEventKind::kUpdate;
      break;
    default:
      rows.kind = RowsEventKind::kDelete;
      break;
  }

  ByteReader reader(body, size);
  uint8_t post_header =
      PostHeaderLength(type, rows.version == 2 ? kRowsV2PostHeaderLength : kRowsV1PostHeaderLength);
  bool ok = true;
  if (post_header == 6) {
    uint32_t short_id = 0;
    ok = reader.ReadU32(short_id);
    rows.table_id = short_id;
  } else {
    ok = reader.ReadU48(rows.table_id);
  }
  ok = ok && reader.ReadU16(rows.flags);
  if (ok && rows.version == 2) {
    // extra_data_len counts its own two bytes
    uint16_t extra_length = 0;
    ok = reader.ReadU16(extra_length) && extra_length >= 2 && reader.Skip(extra_length - 2U);
  }
  if (!ok) {
    return MakeUnexpected(Truncated("rows event post-header"));
  }

  rows.table = FindTableMap(rows.table_id);
  if (!rows.table) {
    return MakeUnexpected(MakeError(ErrorCode::kMySQLBinlogError,
                                    fmt::format("rows event refers to unknown table id {}", rows.table_id)));
  }

  uint64_t column_count = 0;
  if (!reader.ReadPacked(column_count)) {
    return MakeUnexpected(Truncated("rows event column count"));
  }
  if (column_count != rows.table->ColumnCount()) {
    return MakeUnexpected(MakeError(ErrorCode::kMySQLBinlogError,
                                    fmt::format("rows event has {} columns but table map {}.{} has {}", column_count,
                                                rows.table->schema, rows.table->table, rows.table->ColumnCount())));
  }

  const size_t bitmap_size = binlog_util::bitmap_bytes(static_cast<size_t>(column_count));
  const uint8_t* before_present = nullptr;
  const uint8_t* after_present = nullptr;
  if (!reader.ReadBytes(bitmap_size, before_present)) {
    return MakeUnexpected(Truncated("rows event column bitmap"));
  }
  after_present = before_present;
  if (rows.kind == RowsEventKind::kUpdate && !reader.ReadBytes(bitmap_size, after_present)) {
    return MakeUnexpected(Truncated("rows event update bitmap"));
  }

  const size_t before_count = CountBits(before_present, static_cast<size_t>(column_count));
  const size_t after_count = CountBits(after_present, static_cast<size_t>(column_count));

  while (!reader.AtEnd()) {
    const size_t row_start = reader.Offset();
    auto before = DecodeRowImage(reader, *rows.table, before_present, before_count);
    if (!before) {
      return MakeUnexpected(before.error());
    }
    rows.rows.push_back(std::move(*before));
    if (rows.kind == RowsEventKind::kUpdate) {
      auto after = DecodeRowImage(reader, *rows.table, after_present, after_count);
      if (!after) {
        return MakeUnexpected(after.error());
      }
      rows.rows.push_back(std::move(*after));
    }
    if (reader.Offset() == row_start) {
      return MakeUnexpected(MakeError(ErrorCode::kMySQLBinlogError, "rows event image consumed no bytes"));
    }
  }

  event.kind = EventKind::kRows;
  event.body = std::move(rows);
  return {};
}

}  // namespace binlogsync::mysql

// NOLINTEND(readability-magic-numbers,cppcoreguidelines-avoid-magic-numbers)
// NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)
