/**
 * @file application.cpp
 * @brief Main application class implementation
 */

#include "app/application.h"

#include <spdlog/spdlog.h>

#include <chrono>
#include <iostream>

#include "storage/file_position_sink.h"
#include "utils/daemon_utils.h"
#include "utils/structured_log.h"
#include "version.h"

namespace binlogsync::app {

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(100);

void LogStartupFailure(const char* type, const Error& error) {
  utils::StructuredLog()
      .Event("application_error")
      .Field("type", type)
      .Field("phase", "startup")
      .Field("error", error.to_string())
      .Error();
}

}  // namespace

// NOLINTNEXTLINE(cppcoreguidelines-avoid-c-arrays,modernize-avoid-c-arrays) - Standard C/C++ main signature
Expected<std::unique_ptr<Application>, Error> Application::Create(int argc, char* argv[]) {
  auto args_result = CommandLineParser::Parse(argc, argv);
  if (!args_result) {
    return utils::MakeUnexpected(args_result.error());
  }
  CommandLineArgs args = std::move(*args_result);

  if (args.show_help) {
    CommandLineParser::PrintHelp(argv[0]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    return std::unique_ptr<Application>(new Application(std::move(args), nullptr));
  }
  if (args.show_version) {
    CommandLineParser::PrintVersion();
    return std::unique_ptr<Application>(new Application(std::move(args), nullptr));
  }

  auto config_mgr = ConfigurationManager::Create(args.config_file, args.schema_file);
  if (!config_mgr) {
    return utils::MakeUnexpected(config_mgr.error());
  }
  return std::unique_ptr<Application>(new Application(std::move(args), std::move(*config_mgr)));
}

Application::Application(CommandLineArgs args, std::unique_ptr<ConfigurationManager> config_mgr)
    : args_(std::move(args)), config_manager_(std::move(config_mgr)) {}

Application::~Application() {
  auto stopped = Stop();
  if (!stopped) {
    spdlog::warn("Shutdown error: {}", stopped.error().to_string());
  }
}

int Application::Run() {
  if (args_.show_help || args_.show_version) {
    return 0;
  }
  if (args_.config_test_mode) {
    return config_manager_->PrintConfigTest(std::cout);
  }

  auto logging_result = config_manager_->ApplyLoggingConfig();
  if (!logging_result) {
    LogStartupFailure("logging_config_failed", logging_result.error());
    return 1;
  }
  spdlog::info("{} starting...", Version::FullString());

  auto daemon_result = DaemonizeIfRequested();
  if (!daemon_result) {
    LogStartupFailure("daemonization_failed", daemon_result.error());
    return 1;
  }

  auto init_result = Initialize();
  if (!init_result) {
    LogStartupFailure("initialization_failed", init_result.error());
    return 1;
  }

  auto start_result = canal_->Start();
  if (!start_result) {
    LogStartupFailure("replication_start_failed", start_result.error());
    return 1;
  }

  bool unexpected_stop = RunMainLoop();

  auto stopped = Stop();
  if (!stopped) {
    spdlog::warn("Shutdown error: {}", stopped.error().to_string());
  }
  spdlog::info("binlogsync stopped");
  return unexpected_stop ? 1 : 0;
}

canal::CanalOptions Application::BuildCanalOptions() const {
  const auto& config = config_manager_->GetConfig();
  canal::CanalOptions options;
  options.position_sink = position_sink_;
  options.resume_from_sink = config.replication.resume_from_state;
  options.save_interval = std::chrono::milliseconds(config.replication.save_interval_ms);
  if (!config.replication.check_row_image.empty()) {
    options.check_row_image = config.replication.check_row_image;
  }
  options.pool_size = static_cast<size_t>(config.mysql.pool_size);
  options.heartbeat_period = std::chrono::milliseconds(config.mysql.heartbeat_period_ms);
  options.include_schema_only = config.replication.include_schema_only;
  return options;
}

Expected<void, Error> Application::Initialize() {
  const auto& config = config_manager_->GetConfig();

  auto signal_mgr = SignalManager::Create();
  if (!signal_mgr) {
    return utils::MakeUnexpected(signal_mgr.error());
  }
  signal_manager_ = std::move(*signal_mgr);

  if (!config.state.dir.empty()) {
    position_sink_ = std::make_shared<storage::FilePositionSink>(config.state.dir);
  }

  if (config.output.file.empty()) {
    output_ = std::make_shared<JsonLinesHandler>(std::cout);
  } else {
    auto file = JsonLinesHandler::OpenFile(config.output.file);
    if (!file) {
      return utils::MakeUnexpected(file.error());
    }
    output_ = std::move(*file);
  }

  auto created = canal::Canal::Create(config.mysql.dsn, BuildCanalOptions());
  if (!created) {
    return utils::MakeUnexpected(created.error());
  }
  canal_ = std::move(*created);

  auto registered = canal_->RegisterRowsEventHandler(output_);
  if (!registered) {
    return utils::MakeUnexpected(registered.error());
  }
  return {};
}

bool Application::RunMainLoop() {
  spdlog::debug("Entering main loop...");
  while (!SignalManager::IsShutdownRequested()) {
    if (SignalManager::ConsumeLogReopenRequest()) {
      auto reopen_result = config_manager_->ReopenLogFile();
      if (!reopen_result) {
        std::cerr << "Failed to reopen log file: " << reopen_result.error().to_string() << '\n';
      }
    }

    if (canal_->WaitForTermination(kPollInterval)) {
      auto error = canal_->TerminationError();
      utils::StructuredLog()
          .Event("replication_stopped")
          .Field("error", error.has_value() ? error->to_string() : std::string("none"))
          .Error();
      return true;
    }
  }
  spdlog::info("Shutdown requested");
  return false;
}

Expected<void, Error> Application::Stop() {
  if (!canal_) {
    return {};
  }
  auto closed = canal_->Close();
  auto position = canal_->SyncedPosition();
  spdlog::info("Last synced position: {}", position.ToString());
  canal_.reset();
  return closed;
}

Expected<void, Error> Application::DaemonizeIfRequested() const {
  if (!args_.daemon_mode) {
    return {};
  }
  spdlog::info("Daemonizing process...");
  return utils::Daemonize();
}

}  // namespace binlogsync::app
