/**
 * @file rows_event_handler.h
 * @brief Consumer interface for decoded row changes
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "mysql/binlog_event.h"
#include "mysql/table_schema.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace binlogsync::canal {

using mysql::Row;

enum class RowsAction : uint8_t {
  kInsert,
  kUpdate,
  kDelete,
};

inline const char* RowsActionName(RowsAction action) {
  switch (action) {
    case RowsAction::kInsert:
      return "insert";
    case RowsAction::kUpdate:
      return "update";
    case RowsAction::kDelete:
      return "delete";
  }
  return "unknown";
}

/**
 * @brief Receives row changes from the replication worker
 *
 * Handlers run synchronously on the worker thread in registration order.
 * Returning an error stops replication without advancing the position
 * past the failing event.
 */
class RowsEventHandler {
 public:
  virtual ~RowsEventHandler() = default;

  /**
   * @brief Handle the rows of one event
   *
   * For kUpdate, rows alternate before and after images:
   * [before0, after0, before1, after1, ...].
   */
  virtual utils::Expected<void, utils::Error> Do(RowsAction action, const mysql::TableSchema& table,
                                                 const std::vector<Row>& rows) = 0;

  /**
   * @brief Called at transaction commit
   */
  virtual utils::Expected<void, utils::Error> Complete() = 0;

  [[nodiscard]] virtual std::string Name() const = 0;
};

}  // namespace binlogsync::canal
