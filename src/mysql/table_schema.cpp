/**
 * @file table_schema.cpp
 * @brief Table metadata helpers
 */

#include "mysql/table_schema.h"

#include "utils/string_utils.h"

namespace binlogsync::mysql {

const ColumnInfo* TableSchema::FindColumn(std::string_view column_name) const {
  for (const auto& column : columns) {
    if (utils::EqualsIgnoreCase(column.name, column_name)) {
      return &column;
    }
  }
  return nullptr;
}

std::vector<const ColumnInfo*> TableSchema::PrimaryKeyColumns() const {
  std::vector<const ColumnInfo*> keys;
  for (const auto& column : columns) {
    if (column.IsPrimaryKey()) {
      keys.push_back(&column);
    }
  }
  return keys;
}

}  // namespace binlogsync::mysql
