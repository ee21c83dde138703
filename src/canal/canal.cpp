/**
 * @file canal.cpp
 * @brief Binlog replication client implementation
 */

#include "canal/canal.h"

#include <spdlog/spdlog.h>

#include <limits>
#include <utility>

#include "mysql/binlog_event_decoder.h"
#include "mysql/connection.h"
#include "mysql/mysql_binlog_stream.h"
#include "mysql/mysql_database_client.h"
#include "utils/constants.h"
#include "utils/string_utils.h"
#include "utils/structured_log.h"

namespace binlogsync::canal {

using utils::ErrorCode;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

// Group 1: optional schema qualifier, group 2: table name
constexpr const char* kAlterTablePattern =
    R"(^ALTER\sTABLE\s.*?`{0,1}(.*?)`{0,1}\.{0,1}`{0,1}([^`\.]+?)`{0,1}\s.*)";

utils::Expected<std::regex, utils::Error> CompileAlterTableRegex() {
  try {
    return std::regex(kAlterTablePattern, std::regex::ECMAScript | std::regex::icase);
  } catch (const std::regex_error& e) {
    return MakeUnexpected(
        MakeError(ErrorCode::kInternalError, std::string("Invalid ALTER TABLE pattern: ") + e.what()));
  }
}

RowsAction ToAction(mysql::RowsEventKind kind) {
  switch (kind) {
    case mysql::RowsEventKind::kWrite:
      return RowsAction::kInsert;
    case mysql::RowsEventKind::kUpdate:
      return RowsAction::kUpdate;
    case mysql::RowsEventKind::kDelete:
      return RowsAction::kDelete;
  }
  return RowsAction::kInsert;
}

/**
 * @brief Integers are decoded signed; fix up columns the schema marks unsigned
 */
std::vector<Row> NormalizeUnsigned(const mysql::RowsEvent& event, const mysql::TableSchema& schema) {
  std::vector<Row> rows = event.rows;
  const auto& types = event.table->column_types;
  for (size_t col = 0; col < types.size() && col < schema.columns.size(); ++col) {
    if (!schema.columns[col].is_unsigned || !mysql::IsIntegerColumn(types[col])) {
      continue;
    }
    for (auto& row : rows) {
      if (col < row.size() && row[col].has_value()) {
        row[col] = mysql::ReinterpretUnsigned(types[col], *row[col]);
      }
    }
  }
  return rows;
}

// Canal whose worker runs on this thread, if any
thread_local const Canal* current_worker = nullptr;

utils::Expected<std::unique_ptr<mysql::IBinlogStream>, utils::Error> DefaultStreamFactory(
    const mysql::BinlogStreamConfig& config) {
  return std::unique_ptr<mysql::IBinlogStream>(std::make_unique<mysql::MySQLBinlogStream>(config));
}

}  // namespace

const char* CanalStateName(CanalState state) {
  switch (state) {
    case CanalState::kCreated:
      return "created";
    case CanalState::kConnected:
      return "connected";
    case CanalState::kStreaming:
      return "streaming";
    case CanalState::kClosing:
      return "closing";
    case CanalState::kClosed:
      return "closed";
  }
  return "unknown";
}

utils::Expected<ReplicationParams, utils::Error> ExtractReplicationParams(mysql::Dsn& dsn) {
  ReplicationParams params;

  if (auto file = dsn.TakeParam("BinlogStartFile"); file.has_value() && !file->empty()) {
    params.start_file = *file;
  }

  if (auto position = dsn.TakeParam("BinlogStartPosition"); position.has_value()) {
    auto parsed = utils::ParseUint64(*position);
    if (parsed.has_value() && *parsed >= constants::kMinBinlogPosition) {
      params.start_position = *parsed;
    } else {
      spdlog::warn("Ignoring BinlogStartPosition={}: must be an integer >= {}", *position,
                   constants::kMinBinlogPosition);
    }
  }

  if (auto slave_id = dsn.TakeParam("BinlogSlaveId"); slave_id.has_value()) {
    auto parsed = utils::ParseUint64(*slave_id);
    if (!parsed.has_value() || *parsed == 0 || *parsed > std::numeric_limits<uint32_t>::max()) {
      return MakeUnexpected(
          MakeError(ErrorCode::kInvalidArgument, "BinlogSlaveId must be an integer in [1, 4294967295]", *slave_id));
    }
    params.slave_id = static_cast<uint32_t>(*parsed);
  }

  if (auto flavor = dsn.TakeParam("flavor"); flavor.has_value()) {
    std::string lowered = utils::ToLower(*flavor);
    if (lowered == "mariadb") {
      params.flavor = mysql::Flavor::kMariaDB;
    } else if (!lowered.empty() && lowered != "mysql") {
      spdlog::warn("Unknown flavor '{}', using mysql", *flavor);
    }
  }
  return params;
}

Canal::Canal(std::string connector_dsn, std::string database_name, ReplicationParams params, CanalOptions options,
             std::regex alter_table_regex)
    : connector_dsn_(std::move(connector_dsn)),
      database_name_(std::move(database_name)),
      params_(std::move(params)),
      options_(std::move(options)),
      alter_table_regex_(std::move(alter_table_regex)),
      tables_([this](const std::string& name) { return LoadTable(name); }) {}

Canal::~Canal() {
  auto result = Close();
  if (!result) {
    spdlog::warn("Error while closing replication client: {}", result.error().to_string());
  }
}

utils::Expected<std::unique_ptr<Canal>, utils::Error> Canal::Create(const std::string& dsn, CanalOptions options) {
  auto parsed = mysql::Dsn::Parse(dsn);
  if (!parsed) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, parsed.error().message(), parsed.error().context()));
  }
  auto params = ExtractReplicationParams(*parsed);
  if (!params) {
    return MakeUnexpected(params.error());
  }
  auto regex = CompileAlterTableRegex();
  if (!regex) {
    return MakeUnexpected(regex.error());
  }

  std::string connector_dsn = parsed->Format();
  std::unique_ptr<Canal> canal(
      new Canal(connector_dsn, parsed->database, std::move(*params), std::move(options), std::move(*regex)));
  CanalOptions& opts = canal->options_;

  // Owned resources are released by ~Canal on any early return
  if (opts.database) {
    canal->database_ = opts.database;
  } else {
    auto factory =
        opts.database_factory ? opts.database_factory : DatabaseFactory(mysql::MySQLDatabaseClient::FromDsn);
    auto client = factory(connector_dsn, opts.pool_size);
    if (!client) {
      return MakeUnexpected(client.error());
    }
    canal->database_ = std::move(*client);
    canal->owns_database_ = true;
  }

  auto pinged = canal->database_->Ping();
  if (!pinged) {
    utils::LogMySQLConnectionError(parsed->IsUnixSocket() ? parsed->address : parsed->Host(), parsed->Port(),
                                   pinged.error().message());
    return MakeUnexpected(MakeError(ErrorCode::kMySQLConnectionFailed, pinged.error().message(), "ping"));
  }

  // Start position: explicit file, then persisted state, then live status
  mysql::MasterStatus start;
  const ReplicationParams& rp = canal->params_;
  if (rp.start_file.has_value()) {
    start.file = *rp.start_file;
    start.position = rp.start_position.value_or(constants::kMinBinlogPosition);
  } else {
    bool resumed = false;
    if (opts.resume_from_sink && opts.position_sink) {
      auto persisted = PositionTracker::LoadPersisted(*opts.position_sink);
      if (!persisted) {
        spdlog::warn("Ignoring persisted position: {}", persisted.error().to_string());
      } else if (persisted->has_value()) {
        start = **persisted;
        resumed = true;
        spdlog::info("Resuming from persisted position {}", start.ToString());
      }
    }
    if (!resumed) {
      auto status = canal->database_->GetMasterStatus();
      if (!status) {
        return MakeUnexpected(status.error());
      }
      start = *status;
    }
    if (rp.start_position.has_value()) {
      start.position = *rp.start_position;
    }
  }

  auto format = canal->database_->GetGlobalVariable("binlog_format");
  if (!format) {
    return MakeUnexpected(format.error());
  }
  if (!utils::EqualsIgnoreCase(*format, "ROW")) {
    return MakeUnexpected(
        MakeError(ErrorCode::kNotSupported, "binlog_format must be ROW, server has '" + *format + "'"));
  }

  if (opts.check_row_image.has_value()) {
    auto image = canal->CheckBinlogRowImage(*opts.check_row_image);
    if (!image) {
      return MakeUnexpected(image.error());
    }
  }

  auto conn_config = mysql::Connection::ConfigFromDsn(*parsed);
  if (!conn_config) {
    return MakeUnexpected(conn_config.error());
  }
  mysql::BinlogStreamConfig stream_config;
  stream_config.server_id = rp.slave_id;
  stream_config.flavor = rp.flavor;
  stream_config.host = conn_config->host;
  stream_config.port = conn_config->port;
  stream_config.unix_socket = conn_config->unix_socket;
  stream_config.user = conn_config->user;
  stream_config.password = conn_config->password;
  stream_config.connect_timeout = conn_config->connect_timeout;
  stream_config.heartbeat_period = opts.heartbeat_period;
  stream_config.ssl_mode = conn_config->ssl_mode;

  auto stream_factory = opts.stream_factory ? opts.stream_factory : StreamFactory(DefaultStreamFactory);
  auto stream = stream_factory(stream_config);
  if (!stream) {
    return MakeUnexpected(stream.error());
  }
  canal->stream_ = std::move(*stream);
  auto opened = canal->stream_->Open(start);
  if (!opened) {
    return MakeUnexpected(opened.error());
  }

  auto clock = opts.clock ? opts.clock : PositionTracker::ClockFn(PositionTracker::Clock::now);
  canal->tracker_ = std::make_unique<PositionTracker>(start, opts.position_sink, opts.save_interval, clock);
  canal->current_file_ = start.file;
  canal->state_.store(CanalState::kConnected);

  utils::StructuredLog()
      .Event("replication_connected")
      .Field("file", start.file)
      .Field("position", start.position)
      .Field("server_id", static_cast<uint64_t>(rp.slave_id))
      .Field("flavor", mysql::FlavorName(rp.flavor))
      .Field("database", canal->database_name_)
      .Info();
  return canal;
}

utils::Expected<void, utils::Error> Canal::CheckBinlogRowImage(const std::string& image) {
  if (params_.flavor == mysql::Flavor::kMariaDB) {
    return {};
  }
  auto value = database_->GetGlobalVariable("binlog_row_image");
  if (!value) {
    return MakeUnexpected(value.error());
  }
  if (!value->empty() && !utils::EqualsIgnoreCase(*value, image)) {
    return MakeUnexpected(MakeError(ErrorCode::kNotSupported,
                                    "binlog_row_image must be " + image + ", server has '" + *value + "'"));
  }
  return {};
}

utils::Expected<void, utils::Error> Canal::Start() {
  std::scoped_lock lock(close_mutex_);
  CanalState expected = CanalState::kConnected;
  if (!state_.compare_exchange_strong(expected, CanalState::kStreaming)) {
    if (expected == CanalState::kStreaming) {
      return MakeUnexpected(MakeError(ErrorCode::kAlreadyExists, "Replication already started"));
    }
    return MakeUnexpected(
        MakeError(ErrorCode::kCancelled, std::string("Cannot start replication in state ") + CanalStateName(expected)));
  }

  {
    std::scoped_lock worker_lock(worker_mutex_);
    running_ = true;
    termination_error_.reset();
  }
  worker_ = std::thread([this]() { Run(); });
  return {};
}

void Canal::Run() {
  current_worker = this;
  auto start = tracker_->SyncedPosition();
  utils::StructuredLog()
      .Event("replication_started")
      .Field("file", start.file)
      .Field("position", start.position)
      .Info();

  std::optional<utils::Error> failure;
  while (true) {
    CanalState state = state_.load();
    if (state == CanalState::kClosing || state == CanalState::kClosed) {
      break;
    }
    auto event = stream_->Fetch();
    if (!event) {
      state = state_.load();
      if (state == CanalState::kClosing || state == CanalState::kClosed) {
        spdlog::debug("Replication worker stopping: {}", event.error().message());
        break;
      }
      auto position = tracker_->SyncedPosition();
      utils::LogBinlogError("unexpected_termination", position.file, position.position, event.error().to_string());
      failure = event.error();
      break;
    }

    auto handled = HandleEvent(*event);
    if (!handled) {
      auto position = tracker_->SyncedPosition();
      utils::StructuredLog()
          .Event("replication_halted")
          .Field("file", position.file)
          .Field("position", position.position)
          .Field("event_log_pos", static_cast<uint64_t>(event->header.log_pos))
          .Field("error", handled.error().to_string())
          .Error();
      failure = handled.error();
      break;
    }
  }

  bool release = release_on_exit_.load();
  if (failure.has_value()) {
    CanalState expected = CanalState::kStreaming;
    if (state_.compare_exchange_strong(expected, CanalState::kClosing)) {
      release = true;
    }
  }
  if (release) {
    auto released = ReleaseResources();
    if (!released) {
      spdlog::warn("Error while closing replication client: {}", released.error().to_string());
    }
  }
  current_worker = nullptr;
  FinishWorker(std::move(failure));
}

void Canal::FinishWorker(std::optional<utils::Error> error) {
  {
    std::scoped_lock lock(worker_mutex_);
    running_ = false;
    termination_error_ = std::move(error);
  }
  worker_cv_.notify_all();
}

utils::Expected<void, utils::Error> Canal::HandleEvent(const mysql::BinlogEvent& event) {
  switch (event.kind) {
    case mysql::EventKind::kRotate: {
      const auto* rotate = event.As<mysql::RotateEvent>();
      if (rotate != nullptr) {
        current_file_ = rotate->next_file;
        tracker_->Rotate(rotate->next_file, rotate->position);
      }
      // log_pos of a rotate refers to the previous file
      return {};
    }
    case mysql::EventKind::kRows: {
      const auto* rows = event.As<mysql::RowsEvent>();
      if (rows != nullptr) {
        auto result = HandleRows(*rows);
        if (!result) {
          return result;
        }
      }
      break;
    }
    case mysql::EventKind::kQuery: {
      const auto* query = event.As<mysql::QueryEvent>();
      if (query != nullptr) {
        auto result = HandleQuery(*query);
        if (!result) {
          return result;
        }
      }
      break;
    }
    case mysql::EventKind::kXid: {
      in_transaction_ = false;
      auto result = registry_.Complete();
      if (!result) {
        return result;
      }
      break;
    }
    case mysql::EventKind::kHeartbeat:
      return {};
    default:
      break;
  }

  // Only transaction boundaries are checkpointed, so a resume never lands
  // between a table map and its rows events
  if (event.header.log_pos > 0) {
    if (in_transaction_) {
      tracker_->Advance(current_file_, event.header.log_pos);
    } else {
      tracker_->Save(current_file_, event.header.log_pos);
    }
  }
  return {};
}

utils::Expected<void, utils::Error> Canal::HandleRows(const mysql::RowsEvent& rows) {
  if (!rows.table) {
    spdlog::error("Rows event for table id {} without table map; dropped", rows.table_id);
    return {};
  }
  const auto& map = *rows.table;
  // Without a DSN database every schema is in scope and names are qualified
  bool has_database = !database_name_.empty();
  bool in_database = has_database && utils::EqualsIgnoreCase(map.schema, database_name_);
  if (options_.include_schema_only && has_database && !in_database) {
    return {};
  }

  std::string name = in_database ? map.table : map.schema + "." + map.table;
  auto table = tables_.FindTable(name);
  if (!table) {
    utils::StructuredLog()
        .Event("table_resolution_failed")
        .Field("schema", map.schema)
        .Field("table", map.table)
        .Field("error", table.error().to_string())
        .Error();
    return {};
  }

  auto normalized = NormalizeUnsigned(rows, **table);
  return registry_.Dispatch(ToAction(rows.kind), **table, normalized);
}

std::optional<AlterTarget> Canal::MatchAlterTable(const std::string& query) const {
  std::smatch match;
  if (!std::regex_search(query, match, alter_table_regex_)) {
    return std::nullopt;
  }
  return AlterTarget{match[1].str(), match[2].str()};
}

utils::Expected<void, utils::Error> Canal::HandleQuery(const mysql::QueryEvent& query) {
  if (auto target = MatchAlterTable(query.query); target.has_value()) {
    std::string schema = target->schema.empty() ? query.schema : target->schema;
    tables_.ClearTableCache(target->table);
    if (!schema.empty()) {
      tables_.ClearTableCache(schema + "." + target->table);
    }
    utils::StructuredLog()
        .Event("table_cache_invalidated")
        .Field("schema", schema)
        .Field("table", target->table)
        .Info();
    return {};
  }

  std::string statement = utils::Trim(query.query);
  if (utils::EqualsIgnoreCase(statement, "BEGIN")) {
    in_transaction_ = true;
    return {};
  }
  if (utils::EqualsIgnoreCase(statement, "ROLLBACK")) {
    in_transaction_ = false;
    return {};
  }
  // Non-transactional engines commit with a query event instead of XID
  if (utils::EqualsIgnoreCase(statement, "COMMIT")) {
    in_transaction_ = false;
    return registry_.Complete();
  }
  return {};
}

utils::Expected<TablePtr, utils::Error> Canal::LoadTable(const std::string& name) {
  std::string schema = database_name_;
  std::string table = name;
  auto dot = name.find('.');
  if (dot != std::string::npos) {
    schema = name.substr(0, dot);
    table = name.substr(dot + 1);
  }
  if (schema.empty()) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument,
                                    "Table name must be schema-qualified when the DSN has no database", name));
  }
  auto loaded = database_->LoadTableSchema(schema, table);
  if (!loaded) {
    return MakeUnexpected(loaded.error());
  }
  return TablePtr(std::make_shared<const mysql::TableSchema>(std::move(*loaded)));
}

bool Canal::IsRunning() const {
  std::scoped_lock lock(worker_mutex_);
  return running_;
}

std::optional<utils::Error> Canal::TerminationError() const {
  std::scoped_lock lock(worker_mutex_);
  return termination_error_;
}

bool Canal::WaitForTermination(std::chrono::milliseconds timeout) {
  std::unique_lock lock(worker_mutex_);
  return worker_cv_.wait_for(lock, timeout, [this]() { return !running_; });
}

utils::Expected<void, utils::Error> Canal::Close() {
  if (current_worker == this) {
    // A handler cannot join its own thread; Run releases after this event
    BeginClosing();
    release_on_exit_.store(true);
    InterruptStream();
    return {};
  }

  std::scoped_lock lock(close_mutex_);
  BeginClosing();
  InterruptStream();
  if (worker_.joinable()) {
    worker_.join();
  }
  return ReleaseResources();
}

void Canal::BeginClosing() {
  CanalState current = state_.load();
  while (current != CanalState::kClosing && current != CanalState::kClosed) {
    if (state_.compare_exchange_weak(current, CanalState::kClosing)) {
      break;
    }
  }
}

void Canal::InterruptStream() {
  std::scoped_lock lock(release_mutex_);
  if (stream_ && !released_) {
    stream_->Interrupt();
  }
}

utils::Expected<void, utils::Error> Canal::ReleaseResources() {
  std::scoped_lock lock(release_mutex_);
  if (released_) {
    return {};
  }
  released_ = true;

  std::optional<utils::Error> first_error;
  if (tracker_) {
    auto flushed = tracker_->Flush();
    if (!flushed) {
      spdlog::warn("Failed to persist final position: {}", flushed.error().to_string());
    }
  }

  if (stream_) {
    auto closed = stream_->Close();
    if (!closed) {
      first_error = closed.error();
    }
  }

  if (owns_database_ && database_) {
    auto closed = database_->Close();
    if (!closed && !first_error.has_value()) {
      first_error = closed.error();
    }
  }

  state_.store(CanalState::kClosed);
  if (tracker_) {
    auto position = tracker_->Checkpoint();
    utils::StructuredLog()
        .Event("replication_closed")
        .Field("file", position.file)
        .Field("position", position.position)
        .Info();
  }
  if (first_error.has_value()) {
    return MakeUnexpected(*first_error);
  }
  return {};
}

}  // namespace binlogsync::canal
