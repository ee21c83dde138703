/**
 * @file json_lines_handler.h
 * @brief Rows event handler that prints one JSON object per changed row
 */

#ifndef BINLOGSYNC_APP_JSON_LINES_HANDLER_H_
#define BINLOGSYNC_APP_JSON_LINES_HANDLER_H_

#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

#include "canal/rows_event_handler.h"

namespace binlogsync::app {

/**
 * @brief Writes row changes as JSON lines
 *
 * Insert/delete:
 *   {"action":"insert","schema":"shop","table":"orders","row":{"id":"1",...}}
 * Update:
 *   {"action":"update","schema":"shop","table":"orders","before":{...},"after":{...}}
 *
 * Values are strings or null. The stream is flushed on Complete().
 */
class JsonLinesHandler : public canal::RowsEventHandler {
 public:
  /**
   * @param out Destination; must outlive the handler
   */
  explicit JsonLinesHandler(std::ostream& out);

  /**
   * @brief Append to a file, creating it if needed
   */
  static utils::Expected<std::shared_ptr<JsonLinesHandler>, utils::Error> OpenFile(const std::string& path);

  utils::Expected<void, utils::Error> Do(canal::RowsAction action, const mysql::TableSchema& table,
                                         const std::vector<canal::Row>& rows) override;

  utils::Expected<void, utils::Error> Complete() override;

  [[nodiscard]] std::string Name() const override { return "json_lines"; }

  [[nodiscard]] uint64_t LinesWritten() const;

 private:
  explicit JsonLinesHandler(std::unique_ptr<std::ofstream> file);

  utils::Expected<void, utils::Error> WriteLine(const std::string& line);

  std::unique_ptr<std::ofstream> file_;
  std::ostream* out_;
  mutable std::mutex mutex_;
  uint64_t lines_written_ = 0;
};

}  // namespace binlogsync::app

#endif  // BINLOGSYNC_APP_JSON_LINES_HANDLER_H_
