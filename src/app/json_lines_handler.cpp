/**
 * @file json_lines_handler.cpp
 * @brief JSON lines rows event handler
 */

#include "app/json_lines_handler.h"

#include <nlohmann/json.hpp>

#include <utility>

namespace binlogsync::app {

namespace {

using json = nlohmann::json;

json RowToJson(const mysql::TableSchema& table, const canal::Row& row) {
  json object = json::object();
  for (size_t i = 0; i < row.size(); ++i) {
    std::string key = i < table.columns.size() ? table.columns[i].name : "@" + std::to_string(i);
    if (row[i].has_value()) {
      object[key] = *row[i];
    } else {
      object[key] = nullptr;
    }
  }
  return object;
}

json Envelope(canal::RowsAction action, const mysql::TableSchema& table) {
  return json{{"action", canal::RowsActionName(action)}, {"schema", table.schema}, {"table", table.name}};
}

}  // namespace

JsonLinesHandler::JsonLinesHandler(std::ostream& out) : out_(&out) {}

JsonLinesHandler::JsonLinesHandler(std::unique_ptr<std::ofstream> file) : file_(std::move(file)), out_(file_.get()) {}

utils::Expected<std::shared_ptr<JsonLinesHandler>, utils::Error> JsonLinesHandler::OpenFile(const std::string& path) {
  auto file = std::make_unique<std::ofstream>(path, std::ios::out | std::ios::app);
  if (!file->is_open()) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kIOError, "Failed to open output file for appending", path));
  }
  return std::shared_ptr<JsonLinesHandler>(new JsonLinesHandler(std::move(file)));
}

utils::Expected<void, utils::Error> JsonLinesHandler::Do(canal::RowsAction action, const mysql::TableSchema& table,
                                                         const std::vector<canal::Row>& rows) {
  // Binary column values need not be valid UTF-8
  const auto dump = [](const json& value) { return value.dump(-1, ' ', false, json::error_handler_t::replace); };

  if (action == canal::RowsAction::kUpdate) {
    if (rows.size() % 2 != 0) {
      return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kInvalidArgument,
                                                    "Update rows must come in before/after pairs",
                                                    table.QualifiedName()));
    }
    for (size_t i = 0; i + 1 < rows.size(); i += 2) {
      json line = Envelope(action, table);
      line["before"] = RowToJson(table, rows[i]);
      line["after"] = RowToJson(table, rows[i + 1]);
      auto written = WriteLine(dump(line));
      if (!written) {
        return written;
      }
    }
    return {};
  }

  for (const auto& row : rows) {
    json line = Envelope(action, table);
    line["row"] = RowToJson(table, row);
    auto written = WriteLine(dump(line));
    if (!written) {
      return written;
    }
  }
  return {};
}

utils::Expected<void, utils::Error> JsonLinesHandler::WriteLine(const std::string& line) {
  std::scoped_lock lock(mutex_);
  *out_ << line << '\n';
  if (!out_->good()) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kIOError, "Failed to write JSON line"));
  }
  ++lines_written_;
  return {};
}

utils::Expected<void, utils::Error> JsonLinesHandler::Complete() {
  std::scoped_lock lock(mutex_);
  out_->flush();
  if (!out_->good()) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kIOError, "Failed to flush JSON lines output"));
  }
  return {};
}

uint64_t JsonLinesHandler::LinesWritten() const {
  std::scoped_lock lock(mutex_);
  return lines_written_;
}

}  // namespace binlogsync::app
