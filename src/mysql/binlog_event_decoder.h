/**
 * @file binlog_event_decoder.h
 * @brief Raw binlog event buffers to decoded events
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "mysql/binlog_event.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace binlogsync::mysql {

/**
 * @brief Stateful binlog event decoder
 *
 * Keeps the state a replication stream builds up while it is read: the
 * format description (post-header lengths and checksum algorithm) and
 * the TABLE_MAP definitions that later rows events refer to by id.
 *
 * One decoder serves one stream and is not thread-safe.
 */
class BinlogEventDecoder {
 public:
  BinlogEventDecoder() = default;

  /**
   * @brief Checksum algorithm agreed with the server before the first FDE
   *
   * Events that arrive ahead of the format description event (the
   * artificial rotate) follow the negotiated setting.
   */
  void SetNegotiatedChecksum(ChecksumAlgorithm algorithm) { negotiated_checksum_ = algorithm; }

  /**
   * @brief Decode one event
   * @param data Event bytes starting at the common header (no OK byte)
   * @param size Number of bytes available
   */
  utils::Expected<BinlogEvent, utils::Error> Decode(const uint8_t* data, size_t size);

  /**
   * @brief Forget the format description and table maps (new connection)
   */
  void Reset();

  [[nodiscard]] ChecksumAlgorithm Checksum() const;

  [[nodiscard]] std::shared_ptr<const TableMapEvent> FindTableMap(uint64_t table_id) const;

  [[nodiscard]] size_t TableMapCount() const { return table_maps_.size(); }

 private:
  utils::Expected<void, utils::Error> DecodeFormatDescription(const uint8_t* data, size_t size, BinlogEvent& event);
  utils::Expected<void, utils::Error> DecodeTableMap(const uint8_t* body, size_t size, BinlogEvent& event);
  utils::Expected<void, utils::Error> DecodeRows(const uint8_t* body, size_t size, BinlogEvent& event);

  /// Post-header length announced by the FDE, or the given fallback
  [[nodiscard]] uint8_t PostHeaderLength(BinlogEventType type, uint8_t fallback) const;

  bool has_format_ = false;
  ChecksumAlgorithm negotiated_checksum_ = ChecksumAlgorithm::kOff;
  ChecksumAlgorithm checksum_ = ChecksumAlgorithm::kOff;
  std::vector<uint8_t> post_header_lengths_;
  std::unordered_map<uint64_t, std::shared_ptr<const TableMapEvent>> table_maps_;
};

/**
 * @brief Decode one column value of a row image
 *
 * Integers come out signed; see ReinterpretUnsigned().
 *
 * @param type Column type from the table map
 * @param metadata Column metadata from the table map
 * @param data Start of the value
 * @param available Bytes readable from data
 * @param consumed Set to the number of bytes the value occupies
 */
utils::Expected<std::string, utils::Error> DecodeColumnValue(ColumnType type, uint16_t metadata, const uint8_t* data,
                                                             size_t available, size_t& consumed);

/**
 * @brief Reinterpret a signed integer rendering as the column's unsigned value
 *
 * Non-integer types and non-negative values are returned unchanged.
 */
std::string ReinterpretUnsigned(ColumnType type, const std::string& value);

/**
 * @brief Whether the column type is one of the integer types
 */
bool IsIntegerColumn(ColumnType type);

}  // namespace binlogsync::mysql
