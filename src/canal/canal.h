/**
 * @file canal.h
 * @brief Binlog replication client: setup, worker loop and shutdown
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <string>
#include <thread>

#include "canal/handler_registry.h"
#include "canal/position_tracker.h"
#include "canal/rows_event_handler.h"
#include "canal/table_cache.h"
#include "mysql/binlog_stream.h"
#include "mysql/database_client.h"
#include "mysql/dsn.h"
#include "mysql/master_status.h"
#include "storage/position_sink.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace binlogsync::canal {

/**
 * @brief Lifecycle of a replication client
 *
 * kCreated -> kConnected (Create succeeded) -> kStreaming (Start)
 * -> kClosing (Close, or the worker stopping on an error) -> kClosed.
 * A closed client cannot be restarted.
 */
enum class CanalState : uint8_t {
  kCreated,
  kConnected,
  kStreaming,
  kClosing,
  kClosed,
};

const char* CanalStateName(CanalState state);

using DatabaseFactory = std::function<utils::Expected<std::shared_ptr<mysql::DatabaseClient>, utils::Error>(
    const std::string& dsn, size_t pool_size)>;

using StreamFactory = std::function<utils::Expected<std::unique_ptr<mysql::IBinlogStream>, utils::Error>(
    const mysql::BinlogStreamConfig& config)>;

/**
 * @brief Options for Canal::Create
 */
// NOLINTBEGIN(readability-magic-numbers,cppcoreguidelines-avoid-magic-numbers)
struct CanalOptions {
  /// Shared client; not closed by Canal::Close
  std::shared_ptr<mysql::DatabaseClient> database;
  /// Used when database is empty; receives the DSN without replication parameters
  DatabaseFactory database_factory;
  StreamFactory stream_factory;
  std::shared_ptr<storage::PositionSink> position_sink;
  bool resume_from_sink = false;
  std::chrono::milliseconds save_interval{1000};
  std::optional<std::string> check_row_image;
  size_t pool_size = 4;
  std::chrono::milliseconds heartbeat_period{30000};
  /// Skip rows events of schemas other than the DSN database
  bool include_schema_only = true;
  /// Clock for the position throttle; steady_clock when empty
  PositionTracker::ClockFn clock;
};
// NOLINTEND(readability-magic-numbers,cppcoreguidelines-avoid-magic-numbers)

/**
 * @brief Replication parameters taken from the DSN query string
 */
struct ReplicationParams {
  std::optional<std::string> start_file;
  std::optional<uint64_t> start_position;
  uint32_t slave_id = 100;
  mysql::Flavor flavor = mysql::Flavor::kMySQL;
};

/**
 * @brief Extract and remove BinlogStartFile, BinlogStartPosition,
 *        BinlogSlaveId and flavor from a parsed DSN
 */
utils::Expected<ReplicationParams, utils::Error> ExtractReplicationParams(mysql::Dsn& dsn);

/**
 * @brief Table name captured from an ALTER TABLE statement
 */
struct AlterTarget {
  std::string schema;  // empty when unqualified
  std::string table;
};

/**
 * @brief Binlog replication client
 *
 * One worker thread pulls events from the replication stream, resolves
 * table metadata and dispatches row changes to the registered handlers.
 * All public methods may be called concurrently with the worker. When the
 * worker stops on a handler or stream error it closes the client itself.
 */
class Canal {
 public:
  /**
   * @brief Connect, verify the server and open the replication stream
   *
   * Setup errors: kInvalidArgument (DSN), kMySQLConnectionFailed (ping),
   * kNotSupported (binlog format or row image), or the stream's error.
   */
  static utils::Expected<std::unique_ptr<Canal>, utils::Error> Create(const std::string& dsn,
                                                                      CanalOptions options = {});

  ~Canal();

  Canal(const Canal&) = delete;
  Canal& operator=(const Canal&) = delete;
  Canal(Canal&&) = delete;
  Canal& operator=(Canal&&) = delete;

  /**
   * @brief Spawn the worker and return immediately
   * @return kAlreadyExists when already streaming, kCancelled once closed
   */
  utils::Expected<void, utils::Error> Start();

  /**
   * @brief Stop the worker and release the stream and owned database client
   *
   * Safe to call repeatedly and concurrently. Every step runs even if an
   * earlier one fails; the first failure is returned. From a handler
   * (the worker thread) this only requests the stop: the worker finishes
   * the current event, then releases the resources on its way out.
   */
  utils::Expected<void, utils::Error> Close();

  [[nodiscard]] mysql::MasterStatus SyncedPosition() const { return tracker_->SyncedPosition(); }

  [[nodiscard]] CanalState State() const { return state_.load(); }

  [[nodiscard]] bool IsRunning() const;

  /**
   * @brief Error that ended the worker, if it ended on its own
   */
  [[nodiscard]] std::optional<utils::Error> TerminationError() const;

  /**
   * @brief Wait for the worker to exit
   * @return true if the worker is not running when this returns
   */
  bool WaitForTermination(std::chrono::milliseconds timeout);

  utils::Expected<void, utils::Error> RegisterRowsEventHandler(std::shared_ptr<RowsEventHandler> handler) {
    return registry_.Register(std::move(handler));
  }

  /**
   * @brief Resolve table metadata ("table" in the DSN database, or "schema.table")
   */
  utils::Expected<TablePtr, utils::Error> FindTable(const std::string& name) { return tables_.FindTable(name); }

  void ClearTableCache(const std::string& name) { tables_.ClearTableCache(name); }

  void ClearAllTableCache() { tables_.ClearAll(); }

  /**
   * @brief Require the server's binlog_row_image to match
   *
   * No-op for MariaDB. An empty server value (pre 5.6) is accepted.
   */
  utils::Expected<void, utils::Error> CheckBinlogRowImage(const std::string& image);

  /**
   * @brief Match an ALTER TABLE statement
   */
  [[nodiscard]] std::optional<AlterTarget> MatchAlterTable(const std::string& query) const;

  [[nodiscard]] const ReplicationParams& Params() const { return params_; }
  [[nodiscard]] const std::string& ConnectorDsn() const { return connector_dsn_; }
  [[nodiscard]] const std::string& Database() const { return database_name_; }
  [[nodiscard]] mysql::DatabaseClient& Client() { return *database_; }
  [[nodiscard]] size_t HandlerCount() const { return registry_.Size(); }

 private:
  Canal(std::string connector_dsn, std::string database_name, ReplicationParams params, CanalOptions options,
        std::regex alter_table_regex);

  void Run();
  utils::Expected<void, utils::Error> HandleEvent(const mysql::BinlogEvent& event);
  utils::Expected<void, utils::Error> HandleRows(const mysql::RowsEvent& rows);
  utils::Expected<void, utils::Error> HandleQuery(const mysql::QueryEvent& query);
  utils::Expected<TablePtr, utils::Error> LoadTable(const std::string& name);
  void FinishWorker(std::optional<utils::Error> error);
  void BeginClosing();
  void InterruptStream();
  utils::Expected<void, utils::Error> ReleaseResources();

  std::string connector_dsn_;
  std::string database_name_;
  ReplicationParams params_;
  CanalOptions options_;
  std::regex alter_table_regex_;

  std::shared_ptr<mysql::DatabaseClient> database_;
  bool owns_database_ = false;
  std::unique_ptr<mysql::IBinlogStream> stream_;
  std::unique_ptr<PositionTracker> tracker_;
  TableCache tables_;
  HandlerRegistry registry_;

  std::atomic<CanalState> state_{CanalState::kCreated};
  std::mutex close_mutex_;  // serialises Start and Close
  std::thread worker_;
  std::string current_file_;  // worker thread only
  bool in_transaction_ = false;  // worker thread only
  std::atomic<bool> release_on_exit_{false};

  std::mutex release_mutex_;
  bool released_ = false;

  mutable std::mutex worker_mutex_;
  std::condition_variable worker_cv_;
  bool running_ = false;
  std::optional<utils::Error> termination_error_;
};

}  // namespace binlogsync::canal
