/**
 * @file configuration_manager.h
 * @brief Loads the configuration and applies its logging section
 */

#ifndef BINLOGSYNC_APP_CONFIGURATION_MANAGER_H_
#define BINLOGSYNC_APP_CONFIGURATION_MANAGER_H_

#include <iosfwd>
#include <memory>
#include <string>

#include "config/config.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace binlogsync::app {

using utils::Error;
using utils::Expected;

/**
 * @brief Owns the loaded configuration
 */
class ConfigurationManager {
 public:
  /**
   * @brief Load and validate the configuration file
   * @param schema_file Optional schema file path (empty = embedded schema)
   */
  static Expected<std::unique_ptr<ConfigurationManager>, Error> Create(const std::string& config_file,
                                                                       const std::string& schema_file = "");

  /**
   * @brief Wrap an already loaded configuration
   */
  static std::unique_ptr<ConfigurationManager> FromConfig(config::Config config);

  ~ConfigurationManager() = default;

  ConfigurationManager(const ConfigurationManager&) = delete;
  ConfigurationManager& operator=(const ConfigurationManager&) = delete;
  ConfigurationManager(ConfigurationManager&&) = delete;
  ConfigurationManager& operator=(ConfigurationManager&&) = delete;

  const config::Config& GetConfig() const { return config_; }

  /**
   * @brief Print a summary for -t; the DSN password is masked
   * @return Exit code
   */
  int PrintConfigTest(std::ostream& out) const;

  /**
   * @brief Set level, sink and structured log format from logging.*
   */
  Expected<void, Error> ApplyLoggingConfig();

  /**
   * @brief Reopen logging.file after rotation (no-op for console logging)
   */
  Expected<void, Error> ReopenLogFile() const;

  const std::string& GetConfigFilePath() const { return config_file_; }

 private:
  ConfigurationManager(std::string config_file, std::string schema_file, config::Config initial_config);

  std::string config_file_;
  std::string schema_file_;
  config::Config config_;
};

/**
 * @brief DSN with the password replaced by "****"
 */
std::string MaskDsnPassword(const std::string& dsn);

}  // namespace binlogsync::app

#endif  // BINLOGSYNC_APP_CONFIGURATION_MANAGER_H_
