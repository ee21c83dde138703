/**
 * @file table_schema.h
 * @brief Table metadata loaded from information_schema
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace binlogsync::mysql {

/**
 * @brief One column as reported by information_schema.COLUMNS
 */
struct ColumnInfo {
  std::string name;
  std::string data_type;    // e.g. "int"
  std::string column_type;  // e.g. "int(10) unsigned"
  bool nullable = false;
  std::string key;  // PRI, UNI, MUL or empty
  std::string extra;
  bool is_unsigned = false;
  uint32_t position = 0;  // 1-based ordinal

  [[nodiscard]] bool IsPrimaryKey() const { return key == "PRI"; }
};

/**
 * @brief Immutable snapshot of a table definition
 *
 * Shared as std::shared_ptr<const TableSchema>; a schema change replaces
 * the snapshot instead of mutating it.
 */
struct TableSchema {
  std::string schema;
  std::string name;
  std::vector<ColumnInfo> columns;
  bool is_view = false;
  std::optional<std::string> create_statement;

  /**
   * @brief Find a column by name (case-insensitive, as MySQL compares them)
   */
  [[nodiscard]] const ColumnInfo* FindColumn(std::string_view column_name) const;

  /**
   * @brief Primary key columns in ordinal order
   */
  [[nodiscard]] std::vector<const ColumnInfo*> PrimaryKeyColumns() const;

  /// "schema.name"
  [[nodiscard]] std::string QualifiedName() const { return schema + "." + name; }
};

}  // namespace binlogsync::mysql
