/**
 * @file mysql_database_client.h
 * @brief DatabaseClient backed by a libmysqlclient connection pool
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <string>

#include "mysql/connection.h"
#include "mysql/connection_pool.h"
#include "mysql/database_client.h"

namespace binlogsync::mysql {

class MySQLDatabaseClient : public DatabaseClient {
 public:
  MySQLDatabaseClient(Connection::Config config, size_t pool_size);
  ~MySQLDatabaseClient() override;

  MySQLDatabaseClient(const MySQLDatabaseClient&) = delete;
  MySQLDatabaseClient& operator=(const MySQLDatabaseClient&) = delete;
  MySQLDatabaseClient(MySQLDatabaseClient&&) = delete;
  MySQLDatabaseClient& operator=(MySQLDatabaseClient&&) = delete;

  /**
   * @brief Build a client from a DSN with the custom parameters already stripped
   */
  static utils::Expected<std::shared_ptr<DatabaseClient>, utils::Error> FromDsn(const std::string& dsn,
                                                                                size_t pool_size);

  utils::Expected<void, utils::Error> Ping() override;
  utils::Expected<MasterStatus, utils::Error> GetMasterStatus() override;
  utils::Expected<std::string, utils::Error> GetGlobalVariable(const std::string& name) override;
  utils::Expected<TableSchema, utils::Error> LoadTableSchema(const std::string& schema,
                                                             const std::string& table) override;
  utils::Expected<void, utils::Error> Execute(const std::string& statement) override;
  utils::Expected<void, utils::Error> Close() override;

 private:
  /// Lease a connection; lost connections are dropped rather than returned
  utils::Expected<ConnectionPool::Lease, utils::Error> AcquireLease();

  utils::Expected<MySQLResult, utils::Error> Query(ConnectionPool::Lease& lease, const std::string& query);

  ConnectionPool pool_;
  std::atomic<bool> closed_{false};
};

}  // namespace binlogsync::mysql
