/**
 * @file connection.h
 * @brief RAII wrapper around a libmysqlclient connection
 */

#pragma once

#include <mysql.h>

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "utils/error.h"
#include "utils/expected.h"

namespace binlogsync::mysql {

struct Dsn;

/**
 * @brief RAII wrapper for MYSQL_RES* to prevent memory leaks
 *
 * Custom deleter for std::unique_ptr that calls mysql_free_result
 */
struct MySQLResultDeleter {
  void operator()(MYSQL_RES* res) const {
    if (res != nullptr) {
      mysql_free_result(res);
    }
  }
};

/// Type alias for RAII-managed MYSQL_RES*
using MySQLResult = std::unique_ptr<MYSQL_RES, MySQLResultDeleter>;

/**
 * @brief TLS negotiation policy
 */
enum class SslMode : uint8_t {
  kDefault,     ///< leave the client library default
  kDisabled,    ///< tls=false
  kPreferred,   ///< tls=preferred
  kRequired,    ///< tls=skip-verify
  kVerifyCa,    ///< tls=true
};

/**
 * @brief MySQL connection wrapper
 */
class Connection {
 public:
  /**
   * @brief Connection configuration
   */
  // NOLINTBEGIN(readability-magic-numbers,cppcoreguidelines-avoid-magic-numbers) - Default MySQL
  // connection settings
  struct Config {
    std::string host = "127.0.0.1";
    uint16_t port = 3306;
    std::string unix_socket;
    std::string user;
    std::string password;
    std::string database;
    uint32_t connect_timeout = 10;  // seconds
    uint32_t read_timeout = 30;     // seconds
    uint32_t write_timeout = 30;    // seconds
    SslMode ssl_mode = SslMode::kDefault;
    std::string ssl_ca;
    std::string ssl_cert;
    std::string ssl_key;
    /// Applied as "SET name=value" right after connecting
    std::vector<std::pair<std::string, std::string>> session_variables;
  };
  // NOLINTEND(readability-magic-numbers,cppcoreguidelines-avoid-magic-numbers)

  /**
   * @brief Build a connection config from a DSN
   *
   * Understands timeout, readTimeout, writeTimeout and tls. Every other
   * parameter becomes a session variable. Custom replication parameters
   * must already be stripped.
   */
  static utils::Expected<Config, utils::Error> ConfigFromDsn(const Dsn& dsn);

  /**
   * @brief Construct connection (not yet connected)
   */
  explicit Connection(Config config);

  ~Connection();

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  Connection(Connection&& other) noexcept;
  Connection& operator=(Connection&& other) noexcept;

  /**
   * @brief Connect to MySQL server
   * @param context Label for log lines (e.g. "pool", "binlog")
   */
  utils::Expected<void, utils::Error> Connect(const std::string& context = "");

  [[nodiscard]] bool IsConnected() const;

  utils::Expected<void, utils::Error> Ping();

  /**
   * @brief Drop the current handle and connect again with the same config
   */
  utils::Expected<void, utils::Error> Reconnect();

  void Close();

  /**
   * @brief Execute a query returning a result set
   *
   * Statements without a result set yield an empty MySQLResult.
   */
  utils::Expected<MySQLResult, utils::Error> Execute(const std::string& query);

  /**
   * @brief Execute a statement without a result set
   */
  utils::Expected<void, utils::Error> ExecuteUpdate(const std::string& query);

  /**
   * @brief Return the first column of the first row ("" when there is no row or it is NULL)
   */
  utils::Expected<std::string, utils::Error> QueryScalar(const std::string& query);

  [[nodiscard]] const std::string& GetLastError() const { return last_error_; }

  /// mysql_errno of the last failure, 0 if none
  [[nodiscard]] unsigned int GetLastErrno() const { return last_errno_; }

  [[nodiscard]] const Config& GetConfig() const { return config_; }

  MYSQL* GetHandle() { return mysql_; }

 private:
  Config config_;
  MYSQL* mysql_ = nullptr;
  std::string last_error_;
  unsigned int last_errno_ = 0;
  std::string context_;

  void SetMySQLError();
  utils::Error QueryError(const std::string& query) const;
};

}  // namespace binlogsync::mysql
