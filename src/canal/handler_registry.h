/**
 * @file handler_registry.h
 * @brief Ordered set of row event handlers
 */

#pragma once

#include <memory>
#include <shared_mutex>
#include <vector>

#include "canal/rows_event_handler.h"

namespace binlogsync::canal {

class HandlerRegistry {
 public:
  /**
   * @brief Append a handler; it sees events from the next dispatch on
   */
  utils::Expected<void, utils::Error> Register(std::shared_ptr<RowsEventHandler> handler);

  /**
   * @brief Invoke every handler's Do in registration order
   * @return First handler error, annotated with the handler's name
   */
  utils::Expected<void, utils::Error> Dispatch(RowsAction action, const mysql::TableSchema& table,
                                               const std::vector<Row>& rows) const;

  utils::Expected<void, utils::Error> Complete() const;

  [[nodiscard]] size_t Size() const;

 private:
  [[nodiscard]] std::vector<std::shared_ptr<RowsEventHandler>> Snapshot() const;

  mutable std::shared_mutex mutex_;
  std::vector<std::shared_ptr<RowsEventHandler>> handlers_;
};

}  // namespace binlogsync::canal
