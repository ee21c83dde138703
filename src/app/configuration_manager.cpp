/**
 * @file configuration_manager.cpp
 * @brief Configuration manager implementation
 */

#include "app/configuration_manager.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <ostream>
#include <system_error>

#include "mysql/dsn.h"
#include "utils/structured_log.h"

namespace binlogsync::app {

namespace {

constexpr const char* kLoggerName = "binlogsync";

}  // namespace

std::string MaskDsnPassword(const std::string& dsn) {
  auto parsed = mysql::Dsn::Parse(dsn);
  if (!parsed) {
    return "<invalid dsn>";
  }
  if (!parsed->password.empty()) {
    parsed->password = "****";
  }
  return parsed->Format();
}

Expected<std::unique_ptr<ConfigurationManager>, Error> ConfigurationManager::Create(const std::string& config_file,
                                                                                    const std::string& schema_file) {
  auto config_result = config::LoadConfig(config_file, schema_file);
  if (!config_result) {
    return utils::MakeUnexpected(config_result.error());
  }
  return std::unique_ptr<ConfigurationManager>(
      new ConfigurationManager(config_file, schema_file, std::move(*config_result)));
}

std::unique_ptr<ConfigurationManager> ConfigurationManager::FromConfig(config::Config config) {
  return std::unique_ptr<ConfigurationManager>(new ConfigurationManager("", "", std::move(config)));
}

ConfigurationManager::ConfigurationManager(std::string config_file, std::string schema_file,
                                           config::Config initial_config)
    : config_file_(std::move(config_file)), schema_file_(std::move(schema_file)), config_(std::move(initial_config)) {}

int ConfigurationManager::PrintConfigTest(std::ostream& out) const {
  const auto& replication = config_.replication;
  out << "Configuration file syntax is OK\n"
      << "Configuration details:\n"
      << "  MySQL DSN: " << MaskDsnPassword(config_.mysql.dsn) << "\n"
      << "  Pool size: " << config_.mysql.pool_size << "\n"
      << "  Heartbeat: " << config_.mysql.heartbeat_period_ms << " ms\n"
      << "  Resume from state: " << (replication.resume_from_state ? "yes" : "no") << "\n"
      << "  Row image check: " << (replication.check_row_image.empty() ? "off" : replication.check_row_image) << "\n"
      << "  Schema filter: " << (replication.include_schema_only ? "DSN database only" : "all schemas") << "\n"
      << "  Position save interval: " << replication.save_interval_ms << " ms\n"
      << "  State dir: " << (config_.state.dir.empty() ? "(none)" : config_.state.dir) << "\n"
      << "  Output: " << (config_.output.file.empty() ? "stdout" : config_.output.file) << "\n"
      << "  Logging: " << config_.logging.level << " (" << config_.logging.format << ")\n";
  return 0;
}

Expected<void, Error> ConfigurationManager::ApplyLoggingConfig() {
  if (!config_.logging.file.empty()) {
    std::filesystem::path log_dir = std::filesystem::path(config_.logging.file).parent_path();
    if (!log_dir.empty()) {
      std::error_code ec;
      std::filesystem::create_directories(log_dir, ec);
      if (ec) {
        return utils::MakeUnexpected(
            utils::MakeError(utils::ErrorCode::kIOError, "Failed to create log directory: " + ec.message()));
      }
    }
    try {
      spdlog::drop(kLoggerName);
      spdlog::set_default_logger(spdlog::basic_logger_mt(kLoggerName, config_.logging.file));
    } catch (const spdlog::spdlog_ex& ex) {
      return utils::MakeUnexpected(
          utils::MakeError(utils::ErrorCode::kIOError, std::string("Log file initialization failed: ") + ex.what()));
    }
  }

  spdlog::set_level(spdlog::level::from_str(config_.logging.level));
  utils::StructuredLog::SetFormat(utils::StructuredLog::ParseFormat(config_.logging.format));

  if (!config_.logging.file.empty()) {
    spdlog::info("Logging to file: {}", config_.logging.file);
  }
  return {};
}

Expected<void, Error> ConfigurationManager::ReopenLogFile() const {
  if (config_.logging.file.empty()) {
    return {};
  }
  try {
    auto current_level = spdlog::get_level();
    spdlog::drop(kLoggerName);
    spdlog::set_default_logger(spdlog::basic_logger_mt(kLoggerName, config_.logging.file));
    spdlog::set_level(current_level);
    spdlog::info("Log file reopened");
  } catch (const spdlog::spdlog_ex& ex) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kIOError, std::string("Log file reopen failed: ") + ex.what()));
  }
  return {};
}

}  // namespace binlogsync::app
