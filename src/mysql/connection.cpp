/**
 * @file connection.cpp
 * @brief MySQL connection wrapper implementation
 */

#include "mysql/connection.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

#include "mysql/dsn.h"
#include "utils/constants.h"
#include "utils/string_utils.h"
#include "utils/structured_log.h"

namespace binlogsync::mysql {

using utils::ErrorCode;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

std::string ContextPrefix(const std::string& context) {
  return context.empty() ? "" : "[" + context + "] ";
}

utils::Expected<uint32_t, utils::Error> TimeoutSeconds(const std::string& name, const std::string& value) {
  auto duration = ParseDuration(value);
  if (!duration) {
    return MakeUnexpected(MakeError(ErrorCode::kMySQLInvalidDsn, "invalid duration for " + name + ": " + value));
  }
  // libmysqlclient takes whole seconds; round partial seconds up
  auto millis = duration->count();
  if (millis <= 0) {
    return 0U;
  }
  return static_cast<uint32_t>((millis + constants::kMillisecondsPerSecond - 1) / constants::kMillisecondsPerSecond);
}

}  // namespace

utils::Expected<Connection::Config, utils::Error> Connection::ConfigFromDsn(const Dsn& dsn) {
  Config config;
  config.user = dsn.user;
  config.password = dsn.password;
  config.database = dsn.database;
  if (dsn.IsUnixSocket()) {
    config.host = "localhost";
    config.port = 0;
    config.unix_socket = dsn.address;
  } else {
    config.host = dsn.Host();
    config.port = dsn.Port();
  }

  for (const auto& [name, value] : dsn.params) {
    if (name == "timeout" || name == "readTimeout" || name == "writeTimeout") {
      auto seconds = TimeoutSeconds(name, value);
      if (!seconds) {
        return MakeUnexpected(seconds.error());
      }
      if (name == "timeout") {
        config.connect_timeout = *seconds;
      } else if (name == "readTimeout") {
        config.read_timeout = *seconds;
      } else {
        config.write_timeout = *seconds;
      }
    } else if (name == "tls") {
      std::string mode = utils::ToLower(value);
      if (mode == "true") {
        config.ssl_mode = SslMode::kVerifyCa;
      } else if (mode == "false") {
        config.ssl_mode = SslMode::kDisabled;
      } else if (mode == "skip-verify") {
        config.ssl_mode = SslMode::kRequired;
      } else if (mode == "preferred") {
        config.ssl_mode = SslMode::kPreferred;
      } else {
        return MakeUnexpected(MakeError(ErrorCode::kMySQLInvalidDsn, "invalid value for tls: " + value));
      }
    } else {
      config.session_variables.emplace_back(name, value);
    }
  }
  return config;
}

Connection::Connection(Config config) : config_(std::move(config)), mysql_(mysql_init(nullptr)) {
  if (mysql_ == nullptr) {
    last_error_ = "Failed to initialize MySQL handle";
  }
}

Connection::~Connection() {
  Close();
}

Connection::Connection(Connection&& other) noexcept
    : config_(std::move(other.config_)),
      mysql_(other.mysql_),
      last_error_(std::move(other.last_error_)),
      last_errno_(other.last_errno_),
      context_(std::move(other.context_)) {
  other.mysql_ = nullptr;
}

Connection& Connection::operator=(Connection&& other) noexcept {
  if (this != &other) {
    Close();
    config_ = std::move(other.config_);
    mysql_ = other.mysql_;
    last_error_ = std::move(other.last_error_);
    last_errno_ = other.last_errno_;
    context_ = std::move(other.context_);
    other.mysql_ = nullptr;
  }
  return *this;
}

utils::Expected<void, utils::Error> Connection::Connect(const std::string& context) {
  context_ = context;
  if (mysql_ == nullptr) {
    mysql_ = mysql_init(nullptr);
    if (mysql_ == nullptr) {
      last_error_ = "MySQL handle not initialized";
      return MakeUnexpected(MakeError(ErrorCode::kMySQLConnectionFailed, last_error_));
    }
  }

  mysql_options(mysql_, MYSQL_OPT_CONNECT_TIMEOUT, &config_.connect_timeout);
  if (config_.read_timeout > 0) {
    mysql_options(mysql_, MYSQL_OPT_READ_TIMEOUT, &config_.read_timeout);
  }
  if (config_.write_timeout > 0) {
    mysql_options(mysql_, MYSQL_OPT_WRITE_TIMEOUT, &config_.write_timeout);
  }

  if (config_.ssl_mode != SslMode::kDefault) {
    unsigned int ssl_mode = SSL_MODE_DISABLED;
    switch (config_.ssl_mode) {
      case SslMode::kPreferred:
        ssl_mode = SSL_MODE_PREFERRED;
        break;
      case SslMode::kRequired:
        ssl_mode = SSL_MODE_REQUIRED;
        break;
      case SslMode::kVerifyCa:
        ssl_mode = SSL_MODE_VERIFY_CA;
        break;
      default:
        break;
    }
    mysql_options(mysql_, MYSQL_OPT_SSL_MODE, &ssl_mode);

    if (!config_.ssl_ca.empty()) {
      mysql_options(mysql_, MYSQL_OPT_SSL_CA, config_.ssl_ca.c_str());
    }
    if (!config_.ssl_cert.empty()) {
      mysql_options(mysql_, MYSQL_OPT_SSL_CERT, config_.ssl_cert.c_str());
    }
    if (!config_.ssl_key.empty()) {
      mysql_options(mysql_, MYSQL_OPT_SSL_KEY, config_.ssl_key.c_str());
    }
  }

  const char* database = config_.database.empty() ? nullptr : config_.database.c_str();
  const char* socket = config_.unix_socket.empty() ? nullptr : config_.unix_socket.c_str();
  if (mysql_real_connect(mysql_, config_.host.c_str(), config_.user.c_str(), config_.password.c_str(), database,
                         config_.port, socket, 0) == nullptr) {
    SetMySQLError();
    utils::LogMySQLConnectionError(config_.host, config_.port, last_error_);
    // 1045: access denied
    constexpr unsigned int kErrAccessDenied = 1045;
    auto code = last_errno_ == kErrAccessDenied ? ErrorCode::kMySQLAuthFailed : ErrorCode::kMySQLConnectionFailed;
    return MakeUnexpected(MakeError(code, ContextPrefix(context) + last_error_,
                                    config_.host + ":" + std::to_string(config_.port)));
  }

  for (const auto& [name, value] : config_.session_variables) {
    if (auto applied = ExecuteUpdate("SET " + name + "=" + value); !applied) {
      Close();
      return MakeUnexpected(applied.error());
    }
  }

  std::string db_info = config_.database.empty() ? "" : "/" + config_.database;
  spdlog::info("{}Connected to MySQL {}:{}{}", ContextPrefix(context), config_.host, config_.port, db_info);
  return {};
}

bool Connection::IsConnected() const {
  if (mysql_ == nullptr) {
    return false;
  }
  // thread_id stays 0 until the handshake has completed
  return mysql_thread_id(mysql_) != 0;
}

utils::Expected<void, utils::Error> Connection::Ping() {
  if (mysql_ == nullptr) {
    last_error_ = "Not connected";
    return MakeUnexpected(MakeError(ErrorCode::kMySQLDisconnected, last_error_));
  }

  if (mysql_ping(mysql_) != 0) {
    SetMySQLError();
    spdlog::warn("{}MySQL ping failed: {}", ContextPrefix(context_), last_error_);
    return MakeUnexpected(MakeError(ErrorCode::kMySQLDisconnected, last_error_));
  }
  return {};
}

utils::Expected<void, utils::Error> Connection::Reconnect() {
  spdlog::info("{}Attempting to reconnect to MySQL {}:{}...", ContextPrefix(context_), config_.host, config_.port);
  Close();
  return Connect(context_);
}

void Connection::Close() {
  if (mysql_ != nullptr) {
    mysql_close(mysql_);
    mysql_ = nullptr;
    spdlog::debug("{}MySQL connection closed", ContextPrefix(context_));
  }
}

utils::Expected<MySQLResult, utils::Error> Connection::Execute(const std::string& query) {
  if (mysql_ == nullptr) {
    last_error_ = "Not connected";
    return MakeUnexpected(MakeError(ErrorCode::kMySQLDisconnected, last_error_));
  }

  spdlog::debug("Executing query: {}", query);

  if (mysql_query(mysql_, query.c_str()) != 0) {
    SetMySQLError();
    return MakeUnexpected(QueryError(query));
  }

  MySQLResult result(mysql_store_result(mysql_));
  if (!result && mysql_field_count(mysql_) > 0) {
    SetMySQLError();
    return MakeUnexpected(QueryError(query));
  }
  return result;
}

utils::Expected<void, utils::Error> Connection::ExecuteUpdate(const std::string& query) {
  auto result = Execute(query);
  if (!result) {
    return MakeUnexpected(result.error());
  }
  return {};
}

utils::Expected<std::string, utils::Error> Connection::QueryScalar(const std::string& query) {
  auto result = Execute(query);
  if (!result) {
    return MakeUnexpected(result.error());
  }
  if (!*result) {
    return std::string();
  }
  MYSQL_ROW row = mysql_fetch_row(result->get());
  if (row == nullptr || row[0] == nullptr) {
    return std::string();
  }
  unsigned long* lengths = mysql_fetch_lengths(result->get());
  return std::string(row[0], lengths != nullptr ? lengths[0] : std::char_traits<char>::length(row[0]));
}

void Connection::SetMySQLError() {
  if (mysql_ != nullptr) {
    last_error_ = std::string(mysql_error(mysql_));
    last_errno_ = mysql_errno(mysql_);
  }
}

utils::Error Connection::QueryError(const std::string& query) const {
  utils::LogMySQLQueryError(query, last_error_);
  bool lost = last_errno_ == constants::kErrServerLost || last_errno_ == constants::kErrServerGone;
  return MakeError(lost ? ErrorCode::kMySQLDisconnected : ErrorCode::kMySQLQueryFailed, last_error_,
                   "errno " + std::to_string(last_errno_));
}

}  // namespace binlogsync::mysql
