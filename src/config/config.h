/**
 * @file config.h
 * @brief Configuration structures and YAML/JSON loader
 */

#pragma once

#include <cstdint>
#include <string>

#include "utils/error.h"
#include "utils/expected.h"

namespace binlogsync::config {

// Default values for configuration
namespace defaults {

constexpr int kPoolSize = 4;
constexpr int kHeartbeatPeriodMs = 30000;
constexpr int kSaveIntervalMs = 1000;

}  // namespace defaults

/**
 * @brief Source server settings
 */
struct MysqlConfig {
  /// user:password@tcp(host:port)/db?params, replication parameters included
  std::string dsn;
  int pool_size = defaults::kPoolSize;
  int heartbeat_period_ms = defaults::kHeartbeatPeriodMs;  ///< 0 disables heartbeats
};

/**
 * @brief Replication behaviour
 */
struct ReplicationConfig {
  bool resume_from_state = false;  ///< Start from the persisted position when the DSN names none
  std::string check_row_image;     ///< Required binlog_row_image (empty = no check)
  bool include_schema_only = true;
  int save_interval_ms = defaults::kSaveIntervalMs;
};

/**
 * @brief Position persistence
 */
struct StateConfig {
  std::string dir;  ///< Base directory of the file sink (empty = no persistence)
};

struct OutputConfig {
  std::string file;  ///< JSON lines destination (empty = stdout)
};

struct LoggingConfig {
  std::string level = "info";
  std::string format = "text";  ///< "text" or "json"
  std::string file;             ///< Log file path (empty = console)
};

/**
 * @brief Root configuration
 */
struct Config {
  MysqlConfig mysql;
  ReplicationConfig replication;
  StateConfig state;
  OutputConfig output;
  LoggingConfig logging;
};

/**
 * @brief Load configuration from a YAML or JSON file
 *
 * The document is validated against the embedded JSON Schema, or against
 * schema_path when given.
 *
 * @param path Path to configuration file (.yaml, .yml or .json)
 * @param schema_path Optional path to a JSON Schema overriding the embedded one
 */
utils::Expected<Config, utils::Error> LoadConfig(const std::string& path, const std::string& schema_path = "");

/**
 * @brief Load configuration from YAML or JSON text
 */
utils::Expected<Config, utils::Error> LoadConfigFromString(const std::string& text,
                                                           const std::string& schema_json_str = "");

/**
 * @brief Validate JSON configuration against schema
 *
 * @param config_json_str JSON configuration string
 * @param schema_json_str JSON Schema string (empty = embedded schema)
 */
utils::Expected<void, utils::Error> ValidateConfigJson(const std::string& config_json_str,
                                                       const std::string& schema_json_str);

}  // namespace binlogsync::config
