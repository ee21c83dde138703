/**
 * @file mysql_binlog_stream.cpp
 * @brief Replication stream over a dedicated libmysqlclient connection
 */

#include "mysql/mysql_binlog_stream.h"

#include <spdlog/spdlog.h>
#include <sys/socket.h>

#include <chrono>
#include <thread>
#include <utility>

#include "utils/constants.h"
#include "utils/string_utils.h"
#include "utils/structured_log.h"

namespace binlogsync::mysql {

using utils::ErrorCode;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

// mysql_binlog_fetch() reports "no event yet" with an empty buffer
constexpr auto kNoDataBackoff = std::chrono::milliseconds(10);
constexpr uint64_t kNoDataLogEvery = 100;

// Announces GTID/annotate support so MariaDB sends its native events
constexpr int kMariaDBSlaveCapability = 4;

}  // namespace

MySQLBinlogStream::MySQLBinlogStream(BinlogStreamConfig config) : config_(std::move(config)) {}

MySQLBinlogStream::~MySQLBinlogStream() {
  auto result = Close();
  if (!result) {
    spdlog::debug("Binlog stream close on destruction failed: {}", result.error().message());
  }
}

utils::Expected<void, utils::Error> MySQLBinlogStream::Open(const MasterStatus& position) {
  if (position.position < constants::kMinBinlogPosition) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument,
                                    "Binlog position must be at least 4: " + position.ToString()));
  }

  auto closed = Close();
  if (!closed) {
    return MakeUnexpected(closed.error());
  }
  interrupted_.store(false);
  decoder_.Reset();

  utils::StructuredLog()
      .Event("binlog_connection_init")
      .Field("host", config_.unix_socket.empty() ? config_.host : config_.unix_socket)
      .Field("server_id", static_cast<uint64_t>(config_.server_id))
      .Field("flavor", FlavorName(config_.flavor))
      .Field("file", position.file)
      .Field("position", position.position)
      .Info();

  Connection::Config conn_config;
  conn_config.host = config_.host;
  conn_config.port = config_.port;
  conn_config.unix_socket = config_.unix_socket;
  conn_config.user = config_.user;
  conn_config.password = config_.password;
  conn_config.connect_timeout = config_.connect_timeout;
  conn_config.ssl_mode = config_.ssl_mode;
  // Fetch blocks until the next event; heartbeats bound the silence
  conn_config.read_timeout = 0;
  if (config_.heartbeat_period.count() > 0) {
    auto seconds = (config_.heartbeat_period.count() + constants::kMillisecondsPerSecond - 1) /
                   constants::kMillisecondsPerSecond;
    conn_config.read_timeout = static_cast<uint32_t>(seconds * 2);
  }

  auto connection = std::make_unique<Connection>(conn_config);
  auto connected = connection->Connect("binlog");
  if (!connected) {
    utils::LogBinlogError("connection_failed", position.file, position.position, connected.error().message());
    return MakeUnexpected(connected.error());
  }

  {
    std::scoped_lock lock(mutex_);
    connection_ = std::move(connection);
  }

  auto negotiated = NegotiateChecksum();
  if (!negotiated) {
    return MakeUnexpected(negotiated.error());
  }
  auto configured = ConfigureSession();
  if (!configured) {
    return MakeUnexpected(configured.error());
  }

  start_file_ = position.file;
  rpl_ = MYSQL_RPL{};
  rpl_.file_name_length = start_file_.size();
  rpl_.file_name = start_file_.c_str();
  rpl_.start_position = position.position;
  rpl_.server_id = config_.server_id;
  rpl_.flags = 0;

  if (mysql_binlog_open(connection_->GetHandle(), &rpl_) != 0) {
    unsigned int err_no = mysql_errno(connection_->GetHandle());
    std::string message = mysql_error(connection_->GetHandle());
    utils::StructuredLog()
        .Event("binlog_error")
        .Field("type", "dump_request_failed")
        .Field("file", position.file)
        .Field("position", position.position)
        .Field("errno", static_cast<int64_t>(err_no))
        .Field("error", message)
        .Error();
    return MakeUnexpected(MakeError(ErrorCode::kMySQLReplicationError, "Failed to start binlog dump: " + message,
                                    "errno=" + std::to_string(err_no)));
  }
  dump_open_ = true;

  utils::StructuredLog()
      .Event("binlog_stream_opened")
      .Field("file", position.file)
      .Field("position", position.position)
      .Field("checksum", decoder_.Checksum() == ChecksumAlgorithm::kCrc32 ? "CRC32" : "NONE")
      .Info();
  return {};
}

utils::Expected<void, utils::Error> MySQLBinlogStream::NegotiateChecksum() {
  auto value = connection_->QueryScalar("SELECT @@global.binlog_checksum");
  if (!value) {
    // Servers without checksum support (pre 5.6) have no such variable
    spdlog::debug("binlog_checksum not available, assuming NONE: {}", value.error().message());
    decoder_.SetNegotiatedChecksum(ChecksumAlgorithm::kOff);
    return {};
  }

  std::string checksum = utils::ToUpper(utils::Trim(*value));
  if (checksum.empty()) {
    decoder_.SetNegotiatedChecksum(ChecksumAlgorithm::kOff);
    return {};
  }

  std::string quoted = "'" + utils::EscapeSqlString(checksum) + "'";
  auto set =
      connection_->ExecuteUpdate("SET @source_binlog_checksum=" + quoted + ", @master_binlog_checksum=" + quoted);
  if (!set) {
    return MakeUnexpected(MakeError(ErrorCode::kMySQLReplicationError,
                                    "Failed to announce checksum support: " + set.error().message()));
  }
  decoder_.SetNegotiatedChecksum(checksum == "CRC32" ? ChecksumAlgorithm::kCrc32 : ChecksumAlgorithm::kOff);
  return {};
}

utils::Expected<void, utils::Error> MySQLBinlogStream::ConfigureSession() {
  if (config_.heartbeat_period.count() > 0) {
    auto nanoseconds = static_cast<uint64_t>(config_.heartbeat_period.count()) * constants::kNanosecondsPerMillisecond;
    auto period = std::to_string(nanoseconds);
    auto result =
        connection_->ExecuteUpdate("SET @master_heartbeat_period=" + period + ", @source_heartbeat_period=" + period);
    if (!result) {
      return MakeUnexpected(MakeError(ErrorCode::kMySQLReplicationError,
                                      "Failed to set heartbeat period: " + result.error().message()));
    }
  }

  if (config_.flavor == Flavor::kMariaDB) {
    auto result =
        connection_->ExecuteUpdate("SET @mariadb_slave_capability=" + std::to_string(kMariaDBSlaveCapability));
    if (!result) {
      return MakeUnexpected(MakeError(ErrorCode::kMySQLReplicationError,
                                      "Failed to announce MariaDB capability: " + result.error().message()));
    }
  }
  return {};
}

utils::Expected<BinlogEvent, utils::Error> MySQLBinlogStream::Fetch() {
  if (!dump_open_ || !connection_) {
    return MakeUnexpected(MakeError(ErrorCode::kMySQLDisconnected, "Binlog stream is not open"));
  }

  uint64_t no_data_count = 0;
  while (true) {
    if (interrupted_.load()) {
      return MakeUnexpected(MakeError(ErrorCode::kCancelled, "Binlog stream interrupted"));
    }

    MYSQL* handle = connection_->GetHandle();
    if (mysql_binlog_fetch(handle, &rpl_) != 0) {
      unsigned int err_no = mysql_errno(handle);
      std::string message = mysql_error(handle);
      if (interrupted_.load()) {
        return MakeUnexpected(MakeError(ErrorCode::kCancelled, "Binlog stream interrupted"));
      }
      if (err_no == constants::kErrMasterFatalReadingBinlog) {
        return MakeUnexpected(MakeError(ErrorCode::kMySQLReplicationError, message,
                                        "errno=" + std::to_string(err_no)));
      }
      return MakeUnexpected(MakeError(ErrorCode::kMySQLDisconnected, "Binlog fetch failed: " + message,
                                      "errno=" + std::to_string(err_no)));
    }

    if (rpl_.size == 0 || rpl_.buffer == nullptr) {
      if (no_data_count++ % kNoDataLogEvery == 0) {
        spdlog::debug("Binlog fetch returned no data (count={})", no_data_count);
      }
      std::this_thread::sleep_for(kNoDataBackoff);
      continue;
    }

    // buffer[0] is the OK byte of the network packet
    return decoder_.Decode(rpl_.buffer + 1, rpl_.size - 1);
  }
}

void MySQLBinlogStream::Interrupt() {
  interrupted_.store(true);
  std::scoped_lock lock(mutex_);
  if (connection_ && connection_->GetHandle() != nullptr) {
    ::shutdown(connection_->GetHandle()->net.fd, SHUT_RDWR);
  }
}

utils::Expected<void, utils::Error> MySQLBinlogStream::Close() {
  std::unique_ptr<Connection> connection;
  {
    std::scoped_lock lock(mutex_);
    connection = std::move(connection_);
  }
  if (!connection) {
    dump_open_ = false;
    return {};
  }
  if (dump_open_ && connection->GetHandle() != nullptr) {
    mysql_binlog_close(connection->GetHandle(), &rpl_);
  }
  dump_open_ = false;
  connection->Close();
  utils::StructuredLog().Event("binlog_stream_closed").Field("file", start_file_).Debug();
  return {};
}

}  // namespace binlogsync::mysql
