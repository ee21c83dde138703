/**
 * @file binlog_event_types.h
 * @brief Binlog event type codes and column type codes
 *
 * Values follow enum Log_event_type / enum_field_types of the MySQL
 * server, plus the MariaDB-specific event codes starting at 160.
 */

#pragma once

#include <cstdint>

namespace binlogsync::mysql {

/**
 * @brief Binlog event type codes
 */
enum class BinlogEventType : uint8_t {
  UNKNOWN_EVENT = 0,
  START_EVENT_V3 = 1,
  QUERY_EVENT = 2,
  STOP_EVENT = 3,
  ROTATE_EVENT = 4,
  INTVAR_EVENT = 5,
  RAND_EVENT = 13,
  USER_VAR_EVENT = 14,
  FORMAT_DESCRIPTION_EVENT = 15,
  XID_EVENT = 16,
  TABLE_MAP_EVENT = 19,

  // v1 rows events (MySQL 5.1 - 5.5, MariaDB)
  WRITE_ROWS_EVENT_V1 = 23,
  UPDATE_ROWS_EVENT_V1 = 24,
  DELETE_ROWS_EVENT_V1 = 25,

  INCIDENT_EVENT = 26,
  HEARTBEAT_LOG_EVENT = 27,
  IGNORABLE_LOG_EVENT = 28,
  ROWS_QUERY_LOG_EVENT = 29,

  // v2 rows events (MySQL 5.6+)
  WRITE_ROWS_EVENT = 30,
  UPDATE_ROWS_EVENT = 31,
  DELETE_ROWS_EVENT = 32,

  GTID_LOG_EVENT = 33,
  ANONYMOUS_GTID_LOG_EVENT = 34,
  PREVIOUS_GTIDS_LOG_EVENT = 35,
  TRANSACTION_CONTEXT_EVENT = 36,
  VIEW_CHANGE_EVENT = 37,
  XA_PREPARE_LOG_EVENT = 38,
  PARTIAL_UPDATE_ROWS_EVENT = 39,
  TRANSACTION_PAYLOAD_EVENT = 40,
  HEARTBEAT_LOG_EVENT_V2 = 41,

  // MariaDB
  MARIADB_ANNOTATE_ROWS_EVENT = 160,
  MARIADB_BINLOG_CHECKPOINT_EVENT = 161,
  MARIADB_GTID_EVENT = 162,
  MARIADB_GTID_LIST_EVENT = 163,
};

/**
 * @brief Get event type name as string
 */
inline const char* GetEventTypeName(BinlogEventType type) {
  switch (type) {
    case BinlogEventType::QUERY_EVENT: return "QUERY_EVENT";
    case BinlogEventType::STOP_EVENT: return "STOP_EVENT";
    case BinlogEventType::ROTATE_EVENT: return "ROTATE_EVENT";
    case BinlogEventType::FORMAT_DESCRIPTION_EVENT: return "FORMAT_DESCRIPTION_EVENT";
    case BinlogEventType::XID_EVENT: return "XID_EVENT";
    case BinlogEventType::TABLE_MAP_EVENT: return "TABLE_MAP_EVENT";
    case BinlogEventType::WRITE_ROWS_EVENT_V1: return "WRITE_ROWS_EVENT_V1";
    case BinlogEventType::UPDATE_ROWS_EVENT_V1: return "UPDATE_ROWS_EVENT_V1";
    case BinlogEventType::DELETE_ROWS_EVENT_V1: return "DELETE_ROWS_EVENT_V1";
    case BinlogEventType::HEARTBEAT_LOG_EVENT: return "HEARTBEAT_LOG_EVENT";
    case BinlogEventType::ROWS_QUERY_LOG_EVENT: return "ROWS_QUERY_LOG_EVENT";
    case BinlogEventType::WRITE_ROWS_EVENT: return "WRITE_ROWS_EVENT";
    case BinlogEventType::UPDATE_ROWS_EVENT: return "UPDATE_ROWS_EVENT";
    case BinlogEventType::DELETE_ROWS_EVENT: return "DELETE_ROWS_EVENT";
    case BinlogEventType::GTID_LOG_EVENT: return "GTID_LOG_EVENT";
    case BinlogEventType::ANONYMOUS_GTID_LOG_EVENT: return "ANONYMOUS_GTID_LOG_EVENT";
    case BinlogEventType::PREVIOUS_GTIDS_LOG_EVENT: return "PREVIOUS_GTIDS_LOG_EVENT";
    case BinlogEventType::HEARTBEAT_LOG_EVENT_V2: return "HEARTBEAT_LOG_EVENT_V2";
    case BinlogEventType::MARIADB_ANNOTATE_ROWS_EVENT: return "MARIADB_ANNOTATE_ROWS_EVENT";
    case BinlogEventType::MARIADB_BINLOG_CHECKPOINT_EVENT: return "MARIADB_BINLOG_CHECKPOINT_EVENT";
    case BinlogEventType::MARIADB_GTID_EVENT: return "MARIADB_GTID_EVENT";
    case BinlogEventType::MARIADB_GTID_LIST_EVENT: return "MARIADB_GTID_LIST_EVENT";
    default: return "UNKNOWN_EVENT";
  }
}

/**
 * @brief Column type codes as they appear in TABLE_MAP events
 */
enum class ColumnType : uint8_t {
  DECIMAL = 0,        // pre-5.0 DECIMAL
  TINY = 1,           // TINYINT
  SHORT = 2,          // SMALLINT
  LONG = 3,           // INT
  FLOAT = 4,          // FLOAT
  DOUBLE = 5,         // DOUBLE
  NULL_TYPE = 6,      // NULL
  TIMESTAMP = 7,      // TIMESTAMP
  LONGLONG = 8,       // BIGINT
  INT24 = 9,          // MEDIUMINT
  DATE = 10,          // DATE
  TIME = 11,          // TIME
  DATETIME = 12,      // DATETIME
  YEAR = 13,          // YEAR
  NEWDATE = 14,       // Internal
  VARCHAR = 15,       // VARCHAR
  BIT = 16,           // BIT
  TIMESTAMP2 = 17,    // TIMESTAMP with fractional seconds
  DATETIME2 = 18,     // DATETIME with fractional seconds
  TIME2 = 19,         // TIME with fractional seconds
  JSON = 245,         // JSON
  NEWDECIMAL = 246,   // DECIMAL
  ENUM = 247,         // ENUM
  SET = 248,          // SET
  TINY_BLOB = 249,    // TINYBLOB/TINYTEXT
  MEDIUM_BLOB = 250,  // MEDIUMBLOB/MEDIUMTEXT
  LONG_BLOB = 251,    // LONGBLOB/LONGTEXT
  BLOB = 252,         // BLOB/TEXT
  VAR_STRING = 253,   // VARCHAR/VARBINARY
  STRING = 254,       // CHAR/BINARY
  GEOMETRY = 255      // Spatial types
};

/// Checksum algorithm announced by the format description event
enum class ChecksumAlgorithm : uint8_t {
  kOff = 0,
  kCrc32 = 1,
  kUndefined = 255,
};

}  // namespace binlogsync::mysql
