/**
 * @file mysql_binlog_stream.h
 * @brief IBinlogStream over the libmysqlclient mysql_binlog_* API
 */

#pragma once

#include <mysql.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

#include "mysql/binlog_event_decoder.h"
#include "mysql/binlog_stream.h"
#include "mysql/connection.h"

namespace binlogsync::mysql {

class MySQLBinlogStream : public IBinlogStream {
 public:
  explicit MySQLBinlogStream(BinlogStreamConfig config);
  ~MySQLBinlogStream() override;

  MySQLBinlogStream(const MySQLBinlogStream&) = delete;
  MySQLBinlogStream& operator=(const MySQLBinlogStream&) = delete;
  MySQLBinlogStream(MySQLBinlogStream&&) = delete;
  MySQLBinlogStream& operator=(MySQLBinlogStream&&) = delete;

  /**
   * @brief Connect, negotiate checksum/heartbeat and send the dump request
   */
  utils::Expected<void, utils::Error> Open(const MasterStatus& position) override;

  /**
   * @brief Fetch and decode the next event
   *
   * Errors: kCancelled after Interrupt(), kMySQLReplicationError when the
   * server refuses the position (errno 1236), kMySQLDisconnected otherwise.
   */
  utils::Expected<BinlogEvent, utils::Error> Fetch() override;

  /**
   * @brief Shut the replication socket down so a blocked Fetch() returns
   */
  void Interrupt() override;

  utils::Expected<void, utils::Error> Close() override;

  [[nodiscard]] const BinlogStreamConfig& GetConfig() const { return config_; }

 private:
  utils::Expected<void, utils::Error> NegotiateChecksum();
  utils::Expected<void, utils::Error> ConfigureSession();

  BinlogStreamConfig config_;
  BinlogEventDecoder decoder_;

  std::mutex mutex_;  // guards connection_ lifetime against Interrupt()
  std::unique_ptr<Connection> connection_;
  MYSQL_RPL rpl_{};
  std::string start_file_;  // rpl_.file_name points here
  bool dump_open_ = false;
  std::atomic<bool> interrupted_{false};
};

}  // namespace binlogsync::mysql
