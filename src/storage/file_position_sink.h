/**
 * @file file_position_sink.h
 * @brief PositionSink that keeps one file per key under a base directory
 */

#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

#include "storage/position_sink.h"

namespace binlogsync::storage {

/**
 * @brief File-backed position sink
 *
 * Key "sql/binlogsync/master_position" is stored at
 * "<base_dir>/sql/binlogsync/master_position". Writes go to a temporary
 * file that is renamed over the target, so readers never observe a
 * partially written value.
 */
class FilePositionSink : public PositionSink {
 public:
  explicit FilePositionSink(std::filesystem::path base_dir);

  utils::Expected<void, utils::Error> Set(const std::string& key, const std::string& value) override;

  utils::Expected<std::optional<std::string>, utils::Error> Get(const std::string& key) override;

  [[nodiscard]] const std::filesystem::path& BaseDir() const { return base_dir_; }

  /**
   * @brief Path a key maps to
   * @return kInvalidArgument for empty keys or keys escaping the base directory
   */
  [[nodiscard]] utils::Expected<std::filesystem::path, utils::Error> PathFor(const std::string& key) const;

 private:
  std::filesystem::path base_dir_;
  std::mutex mutex_;
};

}  // namespace binlogsync::storage
