/**
 * @file application.h
 * @brief Main application class
 */

#ifndef BINLOGSYNC_APP_APPLICATION_H_
#define BINLOGSYNC_APP_APPLICATION_H_

#include <memory>

#include "app/command_line_parser.h"
#include "app/configuration_manager.h"
#include "app/json_lines_handler.h"
#include "app/signal_manager.h"
#include "canal/canal.h"
#include "storage/position_sink.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace binlogsync::app {

/**
 * @brief Process lifecycle: parse arguments, load configuration, run the
 *        replication client until a signal or a fatal worker error
 *
 * @code
 * auto app = Application::Create(argc, argv);
 * if (!app) {
 *   std::cerr << app.error().to_string() << "\n";
 *   return 1;
 * }
 * return (*app)->Run();
 * @endcode
 */
class Application {
 public:
  /**
   * @brief Parse arguments and load configuration
   *
   * Help and version are printed here; Run() then returns 0.
   */
  // NOLINTNEXTLINE(cppcoreguidelines-avoid-c-arrays,modernize-avoid-c-arrays) - Standard C/C++ main signature
  static Expected<std::unique_ptr<Application>, Error> Create(int argc, char* argv[]);

  ~Application();

  Application(const Application&) = delete;
  Application& operator=(const Application&) = delete;
  Application(Application&&) = delete;
  Application& operator=(Application&&) = delete;

  /**
   * @brief Run until shutdown
   * @return 0 on a signal-initiated shutdown, 1 on startup failure or when
   *         replication stopped on its own
   */
  int Run();

 private:
  Application(CommandLineArgs args, std::unique_ptr<ConfigurationManager> config_mgr);

  Expected<void, Error> Initialize();
  Expected<void, Error> DaemonizeIfRequested() const;
  canal::CanalOptions BuildCanalOptions() const;

  /**
   * @brief Poll signals and the worker
   * @return true when the worker stopped without being asked to
   */
  bool RunMainLoop();

  Expected<void, Error> Stop();

  CommandLineArgs args_;

  std::unique_ptr<ConfigurationManager> config_manager_;
  std::unique_ptr<SignalManager> signal_manager_;
  std::shared_ptr<storage::PositionSink> position_sink_;
  std::shared_ptr<JsonLinesHandler> output_;
  std::unique_ptr<canal::Canal> canal_;
};

}  // namespace binlogsync::app

#endif  // BINLOGSYNC_APP_APPLICATION_H_
