/**
 * @file error.h
 * @brief Error codes and error value type used across binlogsync
 *
 * Errors are plain values carried through Expected<T, Error>. Codes are
 * grouped by subsystem so that logs and callers can tell a configuration
 * problem from a replication problem at a glance.
 */

#pragma once

#include <string>
#include <utility>

namespace binlogsync::utils {

/**
 * @brief Error codes grouped by subsystem
 *
 * - 0-999:     general
 * - 1000-1999: configuration
 * - 2000-2999: MySQL and replication
 * - 5000-5999: storage
 */
// NOLINTNEXTLINE(performance-enum-size)
enum class ErrorCode {
  // General
  kSuccess = 0,
  kUnknown = 1,
  kInvalidArgument = 2,
  kOutOfRange = 3,
  kNotImplemented = 4,
  kInternalError = 5,
  kIOError = 6,
  kPermissionDenied = 7,
  kNotFound = 8,
  kAlreadyExists = 9,
  kTimeout = 10,
  kCancelled = 11,
  kNotSupported = 12,

  // Configuration
  kConfigFileNotFound = 1000,
  kConfigParseError = 1001,
  kConfigValidationError = 1002,
  kConfigMissingRequired = 1003,
  kConfigInvalidValue = 1004,
  kConfigSchemaError = 1005,
  kConfigYamlError = 1006,
  kConfigJsonError = 1007,

  // MySQL / replication
  kMySQLConnectionFailed = 2000,
  kMySQLQueryFailed = 2001,
  kMySQLDisconnected = 2002,
  kMySQLAuthFailed = 2003,
  kMySQLTimeout = 2004,
  kMySQLInvalidDsn = 2005,
  kMySQLReplicationError = 2006,
  kMySQLBinlogError = 2007,
  kMySQLChecksumMismatch = 2008,
  kMySQLTableNotFound = 2009,
  kMySQLInvalidSchema = 2010,

  // Storage
  kStorageFileNotFound = 5000,
  kStorageReadError = 5001,
  kStorageWriteError = 5002,
  kStorageInvalidFormat = 5003,
};

/**
 * @brief Human-readable name of an error code
 */
inline const char* ErrorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSuccess:
      return "Success";
    case ErrorCode::kUnknown:
      return "Unknown error";
    case ErrorCode::kInvalidArgument:
      return "Invalid argument";
    case ErrorCode::kOutOfRange:
      return "Out of range";
    case ErrorCode::kNotImplemented:
      return "Not implemented";
    case ErrorCode::kInternalError:
      return "Internal error";
    case ErrorCode::kIOError:
      return "I/O error";
    case ErrorCode::kPermissionDenied:
      return "Permission denied";
    case ErrorCode::kNotFound:
      return "Not found";
    case ErrorCode::kAlreadyExists:
      return "Already exists";
    case ErrorCode::kTimeout:
      return "Timeout";
    case ErrorCode::kCancelled:
      return "Cancelled";
    case ErrorCode::kNotSupported:
      return "Not supported";

    case ErrorCode::kConfigFileNotFound:
      return "Configuration file not found";
    case ErrorCode::kConfigParseError:
      return "Configuration parse error";
    case ErrorCode::kConfigValidationError:
      return "Configuration validation error";
    case ErrorCode::kConfigMissingRequired:
      return "Missing required configuration";
    case ErrorCode::kConfigInvalidValue:
      return "Invalid configuration value";
    case ErrorCode::kConfigSchemaError:
      return "JSON schema error";
    case ErrorCode::kConfigYamlError:
      return "YAML parsing error";
    case ErrorCode::kConfigJsonError:
      return "JSON parsing error";

    case ErrorCode::kMySQLConnectionFailed:
      return "MySQL connection failed";
    case ErrorCode::kMySQLQueryFailed:
      return "MySQL query failed";
    case ErrorCode::kMySQLDisconnected:
      return "MySQL disconnected";
    case ErrorCode::kMySQLAuthFailed:
      return "MySQL authentication failed";
    case ErrorCode::kMySQLTimeout:
      return "MySQL timeout";
    case ErrorCode::kMySQLInvalidDsn:
      return "Invalid DSN";
    case ErrorCode::kMySQLReplicationError:
      return "Replication error";
    case ErrorCode::kMySQLBinlogError:
      return "Binlog error";
    case ErrorCode::kMySQLChecksumMismatch:
      return "Binlog checksum mismatch";
    case ErrorCode::kMySQLTableNotFound:
      return "Table not found";
    case ErrorCode::kMySQLInvalidSchema:
      return "Invalid schema";

    case ErrorCode::kStorageFileNotFound:
      return "Storage file not found";
    case ErrorCode::kStorageReadError:
      return "Storage read error";
    case ErrorCode::kStorageWriteError:
      return "Storage write error";
    case ErrorCode::kStorageInvalidFormat:
      return "Invalid format";
  }
  return "Unknown error code";
}

/**
 * @brief Error value with code, message and optional context
 */
class Error {
 public:
  Error() = default;

  explicit Error(ErrorCode code) : code_(code), message_(ErrorCodeToString(code)) {}

  Error(ErrorCode code, std::string message) : code_(code), message_(std::move(message)) {}

  Error(ErrorCode code, std::string message, std::string context)
      : code_(code), message_(std::move(message)), context_(std::move(context)) {}

  [[nodiscard]] ErrorCode code() const { return code_; }
  [[nodiscard]] const std::string& message() const { return message_; }
  [[nodiscard]] const std::string& context() const { return context_; }
  [[nodiscard]] bool is_error() const { return code_ != ErrorCode::kSuccess; }

  [[nodiscard]] const char* what() const { return message_.c_str(); }

  /**
   * @brief Format as "[Name (code)] message (context: ctx)"
   */
  [[nodiscard]] std::string to_string() const {
    std::string result = "[";
    result += ErrorCodeToString(code_);
    result += " (";
    result += std::to_string(static_cast<int>(code_));
    result += ")] ";
    result += message_;
    if (!context_.empty()) {
      result += " (context: ";
      result += context_;
      result += ")";
    }
    return result;
  }

  // NOLINTNEXTLINE(google-explicit-constructor)
  operator std::string() const { return to_string(); }

 private:
  ErrorCode code_ = ErrorCode::kSuccess;
  std::string message_;
  std::string context_;
};

inline Error MakeError(ErrorCode code) {
  return Error(code);
}

inline Error MakeError(ErrorCode code, std::string message) {
  return {code, std::move(message)};
}

inline Error MakeError(ErrorCode code, std::string message, std::string context) {
  return {code, std::move(message), std::move(context)};
}

}  // namespace binlogsync::utils

/// Create an Error whose context records the call site
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define BINLOGSYNC_ERROR(code, msg) \
  ::binlogsync::utils::MakeError((code), (msg), std::string(__FILE__) + ":" + std::to_string(__LINE__))
