/**
 * @file position_tracker.cpp
 * @brief Position tracker implementation
 */

#include "canal/position_tracker.h"

#include <spdlog/spdlog.h>

#include <mutex>
#include <utility>

#include "utils/structured_log.h"

namespace binlogsync::canal {

PositionTracker::PositionTracker(mysql::MasterStatus initial, std::shared_ptr<storage::PositionSink> sink,
                                 std::chrono::milliseconds save_interval, ClockFn clock)
    : position_(initial),
      checkpoint_(std::move(initial)),
      sink_(std::move(sink)),
      save_interval_(save_interval),
      clock_(std::move(clock)) {}

void PositionTracker::Save(const std::string& file, uint64_t position) {
  std::unique_lock lock(mutex_);
  position_.file = file;
  position_.position = position;
  checkpoint_ = position_;

  auto now = clock_();
  if (last_save_.has_value() && now - *last_save_ < save_interval_) {
    return;
  }

  if (!sink_) {
    if (!warned_no_sink_) {
      spdlog::debug("No position sink configured; position {} kept in memory only", checkpoint_.ToString());
      warned_no_sink_ = true;
    }
    last_save_ = now;
    return;
  }

  auto result = PersistLocked(now);
  if (!result) {
    utils::StructuredLog()
        .Event("position_save_failed")
        .Field("file", checkpoint_.file)
        .Field("position", checkpoint_.position)
        .Field("error", result.error().to_string())
        .Error();
  }
}

void PositionTracker::Advance(const std::string& file, uint64_t position) {
  std::unique_lock lock(mutex_);
  position_.file = file;
  position_.position = position;
}

void PositionTracker::Rotate(const std::string& file, uint64_t position) {
  spdlog::info("Binlog rotated to {}:{}", file, position);
  Save(file, position);
}

mysql::MasterStatus PositionTracker::SyncedPosition() const {
  std::shared_lock lock(mutex_);
  return position_;
}

mysql::MasterStatus PositionTracker::Checkpoint() const {
  std::shared_lock lock(mutex_);
  return checkpoint_;
}

utils::Expected<void, utils::Error> PositionTracker::Flush() {
  std::unique_lock lock(mutex_);
  if (!sink_) {
    return {};
  }
  return PersistLocked(clock_());
}

uint64_t PositionTracker::PersistCount() const {
  std::shared_lock lock(mutex_);
  return persist_count_;
}

utils::Expected<void, utils::Error> PositionTracker::PersistLocked(Clock::time_point now) {
  std::string encoded;
  checkpoint_.WriteTo(encoded);
  auto result = sink_->Set(kPositionKey, encoded);
  if (!result) {
    return result;
  }
  last_save_ = now;
  ++persist_count_;
  return {};
}

utils::Expected<std::optional<mysql::MasterStatus>, utils::Error> PositionTracker::LoadPersisted(
    storage::PositionSink& sink) {
  auto stored = sink.Get(kPositionKey);
  if (!stored) {
    return utils::MakeUnexpected(stored.error());
  }
  if (!stored->has_value()) {
    return std::optional<mysql::MasterStatus>{};
  }
  auto parsed = mysql::MasterStatus::Parse(**stored);
  if (!parsed) {
    return utils::MakeUnexpected(parsed.error());
  }
  return std::optional<mysql::MasterStatus>(*parsed);
}

}  // namespace binlogsync::canal
