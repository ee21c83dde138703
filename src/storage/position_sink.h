/**
 * @file position_sink.h
 * @brief Key/value store used to persist the replication position
 */

#pragma once

#include <optional>
#include <string>

#include "utils/error.h"
#include "utils/expected.h"

namespace binlogsync::storage {

/**
 * @brief Durable key/value sink
 *
 * Implementations must be safe to call from the replication worker while
 * another thread reads.
 */
class PositionSink {
 public:
  virtual ~PositionSink() = default;

  virtual utils::Expected<void, utils::Error> Set(const std::string& key, const std::string& value) = 0;

  /**
   * @brief Read a value back
   * @return nullopt when the key was never written
   */
  virtual utils::Expected<std::optional<std::string>, utils::Error> Get(const std::string& key) = 0;
};

}  // namespace binlogsync::storage
