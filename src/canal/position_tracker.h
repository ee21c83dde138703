/**
 * @file position_tracker.h
 * @brief Current replication coordinates with throttled persistence
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>

#include "mysql/master_status.h"
#include "storage/position_sink.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace binlogsync::canal {

/// Sink key the position is stored under
inline constexpr const char* kPositionKey = "sql/binlogsync/master_position";

/**
 * @brief Holds the synced position and checkpoints it to a sink
 *
 * Two positions are kept. The synced position follows every processed
 * event. The checkpoint only moves on Save, which the caller issues at
 * transaction boundaries, and is the only position written to the sink.
 * At most one write per save interval reaches the sink; a failed write is
 * logged and retried on the next Save.
 */
class PositionTracker {
 public:
  using Clock = std::chrono::steady_clock;
  using ClockFn = std::function<Clock::time_point()>;

  static constexpr std::chrono::milliseconds kDefaultSaveInterval{1000};

  PositionTracker(mysql::MasterStatus initial, std::shared_ptr<storage::PositionSink> sink,
                  std::chrono::milliseconds save_interval = kDefaultSaveInterval, ClockFn clock = Clock::now);

  /**
   * @brief Move both the synced position and the checkpoint, then persist
   *        the checkpoint unless throttled
   */
  void Save(const std::string& file, uint64_t position);

  /**
   * @brief Move the synced position only (inside a transaction)
   */
  void Advance(const std::string& file, uint64_t position);

  /**
   * @brief Switch to a new binlog file
   *
   * The offset baseline restarts at the given position, so the offset may
   * go backwards relative to the previous file.
   */
  void Rotate(const std::string& file, uint64_t position);

  [[nodiscard]] mysql::MasterStatus SyncedPosition() const;

  /**
   * @brief Last position that is safe to resume from
   */
  [[nodiscard]] mysql::MasterStatus Checkpoint() const;

  /**
   * @brief Persist the checkpoint regardless of the throttle
   * @return Sink error, or success when no sink is configured
   */
  utils::Expected<void, utils::Error> Flush();

  /**
   * @brief Number of successful sink writes
   */
  [[nodiscard]] uint64_t PersistCount() const;

  /**
   * @brief Read a previously persisted position from a sink
   * @return nullopt when nothing is stored
   */
  static utils::Expected<std::optional<mysql::MasterStatus>, utils::Error> LoadPersisted(
      storage::PositionSink& sink);

 private:
  utils::Expected<void, utils::Error> PersistLocked(Clock::time_point now);

  mutable std::shared_mutex mutex_;
  mysql::MasterStatus position_;
  mysql::MasterStatus checkpoint_;
  std::shared_ptr<storage::PositionSink> sink_;
  std::chrono::milliseconds save_interval_;
  ClockFn clock_;
  std::optional<Clock::time_point> last_save_;
  uint64_t persist_count_ = 0;
  bool warned_no_sink_ = false;
};

}  // namespace binlogsync::canal
