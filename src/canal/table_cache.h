/**
 * @file table_cache.h
 * @brief Per-client table metadata cache with single-flight loading
 */

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "canal/single_flight.h"
#include "mysql/table_schema.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace binlogsync::canal {

using TablePtr = std::shared_ptr<const mysql::TableSchema>;

/**
 * @brief Table metadata cache
 *
 * Hits are served under a shared lock with no I/O. Misses go through a
 * SingleFlight so that concurrent lookups of one table share a single load.
 * Failed loads are not cached.
 */
class TableCache {
 public:
  using Loader = std::function<utils::Expected<TablePtr, utils::Error>(const std::string& name)>;

  explicit TableCache(Loader loader);

  /**
   * @brief Return cached metadata, loading it on a miss
   */
  utils::Expected<TablePtr, utils::Error> FindTable(const std::string& name);

  /**
   * @brief Evict one table
   *
   * A load already in flight for this name still answers its callers but
   * its result is not inserted.
   */
  void ClearTableCache(const std::string& name);

  void ClearAll();

  [[nodiscard]] size_t Size() const;
  [[nodiscard]] bool Contains(const std::string& name) const;

 private:
  [[nodiscard]] uint64_t GenerationLocked(const std::string& name) const;

  Loader loader_;
  SingleFlight<std::string, utils::Expected<TablePtr, utils::Error>> flight_;

  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, TablePtr> tables_;
  std::unordered_map<std::string, uint64_t> generations_;  // per-name eviction count
  uint64_t epoch_ = 0;                                     // ClearAll count
};

}  // namespace binlogsync::canal
