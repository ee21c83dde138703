/**
 * @file signal_manager.cpp
 * @brief RAII signal handler manager implementation
 */

#include "app/signal_manager.h"

#include <cerrno>
#include <cstring>
#include <string>
#include <utility>

namespace binlogsync::app {

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
SignalFlags SignalManager::signal_flags_;

namespace {

// Async-signal-safe: assignments to sig_atomic_t only
void SignalHandlerFunction(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    SignalManager::signal_flags_.shutdown_requested = 1;
  } else if (signal == SIGUSR1) {
    SignalManager::signal_flags_.log_reopen_requested = 1;
  }
}

struct HandlerSlot {
  int signal;
  const char* name;
  struct sigaction* saved;
};

Error RegistrationError(const char* name) {
  return utils::MakeError(utils::ErrorCode::kInternalError,
                          std::string("Failed to register ") + name + " handler: " + std::strerror(errno));
}

}  // namespace

Expected<std::unique_ptr<SignalManager>, Error> SignalManager::Create() {
  auto manager = std::unique_ptr<SignalManager>(new SignalManager());
  auto registered = manager->RegisterHandlers();
  if (!registered) {
    return utils::MakeUnexpected(registered.error());
  }
  return manager;
}

SignalManager::~SignalManager() {
  RestoreHandlers();
}

bool SignalManager::IsShutdownRequested() {  // static
  return signal_flags_.shutdown_requested != 0;
}

bool SignalManager::ConsumeLogReopenRequest() {  // static
  if (signal_flags_.log_reopen_requested != 0) {
    signal_flags_.log_reopen_requested = 0;
    return true;
  }
  return false;
}

void SignalManager::Reset() {  // static
  signal_flags_.shutdown_requested = 0;
  signal_flags_.log_reopen_requested = 0;
}

Expected<void, Error> SignalManager::RegisterHandlers() {
  struct sigaction handler_action {};
  handler_action.sa_handler = SignalHandlerFunction;
  sigemptyset(&handler_action.sa_mask);
  handler_action.sa_flags = 0;  // no SA_RESTART: blocking waits should see EINTR

  struct sigaction ignore_action {};
  ignore_action.sa_handler = SIG_IGN;
  sigemptyset(&ignore_action.sa_mask);

  // Writes to a closed output pipe must fail with EPIPE, not kill the process
  // NOLINTNEXTLINE(cppcoreguidelines-avoid-c-arrays,modernize-avoid-c-arrays)
  const HandlerSlot slots[] = {
      {SIGINT, "SIGINT", &original_sigint_},
      {SIGTERM, "SIGTERM", &original_sigterm_},
      {SIGUSR1, "SIGUSR1", &original_sigusr1_},
      {SIGPIPE, "SIGPIPE", &original_sigpipe_},
  };

  size_t installed = 0;
  for (const auto& slot : slots) {
    const struct sigaction* action = slot.signal == SIGPIPE ? &ignore_action : &handler_action;
    if (sigaction(slot.signal, action, slot.saved) != 0) {
      Error error = RegistrationError(slot.name);
      for (size_t i = 0; i < installed; ++i) {
        sigaction(slots[i].signal, slots[i].saved, nullptr);
      }
      return utils::MakeUnexpected(std::move(error));
    }
    ++installed;
  }
  return {};
}

void SignalManager::RestoreHandlers() {
  sigaction(SIGINT, &original_sigint_, nullptr);
  sigaction(SIGTERM, &original_sigterm_, nullptr);
  sigaction(SIGUSR1, &original_sigusr1_, nullptr);
  sigaction(SIGPIPE, &original_sigpipe_, nullptr);
}

}  // namespace binlogsync::app
