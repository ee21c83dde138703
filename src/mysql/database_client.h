/**
 * @file database_client.h
 * @brief Interface for the SQL side of the replication client
 */

#pragma once

#include <string>

#include "mysql/master_status.h"
#include "mysql/table_schema.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace binlogsync::mysql {

/**
 * @brief Metadata and status queries against the source server
 *
 * Implementations must be safe for concurrent use.
 */
class DatabaseClient {
 public:
  virtual ~DatabaseClient() = default;

  virtual utils::Expected<void, utils::Error> Ping() = 0;

  /**
   * @brief Current binlog coordinates of the server
   *
   * Tries SHOW BINARY LOG STATUS (8.0.22+) and falls back to SHOW MASTER STATUS.
   */
  virtual utils::Expected<MasterStatus, utils::Error> GetMasterStatus() = 0;

  /**
   * @brief Value of a global variable, empty when the server does not know it
   */
  virtual utils::Expected<std::string, utils::Error> GetGlobalVariable(const std::string& name) = 0;

  /**
   * @brief Load a table definition
   * @return Schema snapshot or kMySQLTableNotFound
   */
  virtual utils::Expected<TableSchema, utils::Error> LoadTableSchema(const std::string& schema,
                                                                     const std::string& table) = 0;

  /**
   * @brief Run a statement without a result set
   */
  virtual utils::Expected<void, utils::Error> Execute(const std::string& statement) = 0;

  virtual utils::Expected<void, utils::Error> Close() = 0;
};

}  // namespace binlogsync::mysql
