/**
 * @file handler_registry.cpp
 * @brief Handler registry implementation
 */

#include "canal/handler_registry.h"

#include <mutex>
#include <utility>

namespace binlogsync::canal {

namespace {

utils::Error Annotate(const utils::Error& error, const RowsEventHandler& handler, const char* stage) {
  std::string context = "handler=" + handler.Name() + " stage=" + stage;
  if (!error.context().empty()) {
    context += " " + error.context();
  }
  return utils::MakeError(error.code(), error.message(), std::move(context));
}

}  // namespace

utils::Expected<void, utils::Error> HandlerRegistry::Register(std::shared_ptr<RowsEventHandler> handler) {
  if (!handler) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kInvalidArgument, "Cannot register a null rows event handler"));
  }
  std::unique_lock lock(mutex_);
  handlers_.push_back(std::move(handler));
  return {};
}

std::vector<std::shared_ptr<RowsEventHandler>> HandlerRegistry::Snapshot() const {
  std::shared_lock lock(mutex_);
  return handlers_;
}

utils::Expected<void, utils::Error> HandlerRegistry::Dispatch(RowsAction action, const mysql::TableSchema& table,
                                                              const std::vector<Row>& rows) const {
  for (const auto& handler : Snapshot()) {
    auto result = handler->Do(action, table, rows);
    if (!result) {
      return utils::MakeUnexpected(Annotate(result.error(), *handler, RowsActionName(action)));
    }
  }
  return {};
}

utils::Expected<void, utils::Error> HandlerRegistry::Complete() const {
  for (const auto& handler : Snapshot()) {
    auto result = handler->Complete();
    if (!result) {
      return utils::MakeUnexpected(Annotate(result.error(), *handler, "complete"));
    }
  }
  return {};
}

size_t HandlerRegistry::Size() const {
  std::shared_lock lock(mutex_);
  return handlers_.size();
}

}  // namespace binlogsync::canal
