/**
 * @file binlog_event.h
 * @brief Decoded binlog event structures
 */

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "mysql/binlog_event_types.h"

namespace binlogsync::mysql {

/// One row image; std::nullopt is SQL NULL or a column absent from the image
using Row = std::vector<std::optional<std::string>>;

/**
 * @brief Common 19-byte event header
 */
struct BinlogEventHeader {
  uint32_t timestamp = 0;
  BinlogEventType type = BinlogEventType::UNKNOWN_EVENT;
  uint32_t server_id = 0;
  uint32_t event_size = 0;
  uint32_t log_pos = 0;  ///< end offset of this event in the binlog file
  uint16_t flags = 0;
};

/// Size of the v4 common header
constexpr size_t kBinlogHeaderSize = 19;

/// Size of the CRC32 trailer
constexpr size_t kBinlogChecksumSize = 4;

struct RotateEvent {
  uint64_t position = 0;
  std::string next_file;
};

struct FormatDescriptionEvent {
  uint16_t binlog_version = 0;
  std::string server_version;
  uint32_t create_timestamp = 0;
  uint8_t header_length = 0;
  ChecksumAlgorithm checksum = ChecksumAlgorithm::kOff;
};

struct QueryEvent {
  uint32_t thread_id = 0;
  uint32_t exec_time = 0;
  uint16_t error_code = 0;
  std::string schema;
  std::string query;
};

struct XidEvent {
  uint64_t xid = 0;
};

/**
 * @brief GTID marker (MySQL "uuid:gno" or MariaDB "domain-server-seq")
 */
struct GtidEvent {
  std::string gtid;
  bool mariadb = false;
};

struct HeartbeatEvent {
  std::string log_file;
};

/**
 * @brief Table definition carried by TABLE_MAP events
 */
struct TableMapEvent {
  uint64_t table_id = 0;
  uint16_t flags = 0;
  std::string schema;
  std::string table;
  std::vector<ColumnType> column_types;
  std::vector<uint16_t> column_metadata;
  std::vector<uint8_t> null_bitmap;

  [[nodiscard]] size_t ColumnCount() const { return column_types.size(); }
};

/**
 * @brief Kind of row change carried by a rows event
 */
enum class RowsEventKind : uint8_t {
  kWrite,
  kUpdate,
  kDelete,
};

/**
 * @brief Decoded WRITE/UPDATE/DELETE rows event
 *
 * Every row has ColumnCount() entries. Update events store rows as
 * before/after pairs: [before0, after0, before1, after1, ...].
 */
struct RowsEvent {
  RowsEventKind kind = RowsEventKind::kWrite;
  uint8_t version = 2;
  uint64_t table_id = 0;
  uint16_t flags = 0;
  std::shared_ptr<const TableMapEvent> table;
  std::vector<Row> rows;
};

/**
 * @brief Event classification used by consumers
 */
enum class EventKind : uint8_t {
  kUnknown,
  kRotate,
  kFormatDescription,
  kQuery,
  kXid,
  kTableMap,
  kRows,
  kGtid,
  kHeartbeat,
};

/**
 * @brief A decoded binlog event
 */
struct BinlogEvent {
  BinlogEventHeader header;
  EventKind kind = EventKind::kUnknown;
  std::variant<std::monostate, RotateEvent, FormatDescriptionEvent, QueryEvent, XidEvent,
               std::shared_ptr<const TableMapEvent>, RowsEvent, GtidEvent, HeartbeatEvent>
      body;

  template <typename T>
  [[nodiscard]] const T* As() const {
    return std::get_if<T>(&body);
  }
};

}  // namespace binlogsync::mysql
