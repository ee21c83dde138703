/**
 * @file master_status.h
 * @brief Replication coordinates (binlog file, offset, optional GTID set)
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "utils/error.h"
#include "utils/expected.h"

namespace binlogsync::mysql {

/**
 * @brief Position in the source's binary log
 *
 * Text form is "file;position" with an optional ";executed_gtid_set".
 */
struct MasterStatus {
  std::string file;
  uint64_t position = 0;
  std::string executed_gtid_set;

  /**
   * @brief Append the text form to out
   */
  void WriteTo(std::string& out) const;

  [[nodiscard]] std::string ToString() const;

  /**
   * @brief Parse the text form
   *
   * Rejects empty input, a missing ';', a non-numeric position and
   * positions below 4.
   */
  static utils::Expected<MasterStatus, utils::Error> Parse(std::string_view text);

  [[nodiscard]] bool IsEmpty() const { return file.empty(); }

  bool operator==(const MasterStatus& other) const {
    return file == other.file && position == other.position && executed_gtid_set == other.executed_gtid_set;
  }
  bool operator!=(const MasterStatus& other) const { return !(*this == other); }
};

}  // namespace binlogsync::mysql
