/**
 * @file signal_manager.h
 * @brief RAII signal handler manager
 */

#ifndef BINLOGSYNC_APP_SIGNAL_MANAGER_H_
#define BINLOGSYNC_APP_SIGNAL_MANAGER_H_

#include <csignal>
#include <memory>

#include "utils/error.h"
#include "utils/expected.h"

namespace binlogsync::app {

using utils::Error;
using utils::Expected;

/**
 * @brief Flags written by the signal handler
 *
 * Only sig_atomic_t members; the handler may not touch anything else.
 */
struct SignalFlags {
  // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
  volatile std::sig_atomic_t shutdown_requested = 0;
  // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
  volatile std::sig_atomic_t log_reopen_requested = 0;
};

/**
 * @brief Installs SIGINT/SIGTERM/SIGUSR1 handlers and ignores SIGPIPE
 *
 * The previous dispositions are restored on destruction. The main loop
 * polls IsShutdownRequested() and ConsumeLogReopenRequest().
 */
class SignalManager {
 public:
  static Expected<std::unique_ptr<SignalManager>, Error> Create();

  ~SignalManager();

  SignalManager(const SignalManager&) = delete;
  SignalManager& operator=(const SignalManager&) = delete;
  SignalManager(SignalManager&&) = delete;
  SignalManager& operator=(SignalManager&&) = delete;

  /**
   * @brief SIGINT or SIGTERM was received (flag is not cleared)
   */
  static bool IsShutdownRequested();

  /**
   * @brief SIGUSR1 was received since the last call (flag is cleared)
   */
  static bool ConsumeLogReopenRequest();

  /**
   * @brief Clear both flags
   */
  static void Reset();

  // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
  static SignalFlags signal_flags_;

 private:
  SignalManager() = default;

  Expected<void, Error> RegisterHandlers();
  void RestoreHandlers();

  struct sigaction original_sigint_ {};
  struct sigaction original_sigterm_ {};
  struct sigaction original_sigusr1_ {};
  struct sigaction original_sigpipe_ {};
};

}  // namespace binlogsync::app

#endif  // BINLOGSYNC_APP_SIGNAL_MANAGER_H_
