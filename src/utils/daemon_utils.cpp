/**
 * @file daemon_utils.cpp
 * @brief Daemon process utilities implementation
 */

#include "utils/daemon_utils.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <string>

#include "utils/structured_log.h"

namespace binlogsync::utils {

namespace {

Expected<void, Error> ForkAndExitParent(const char* stage) {
  pid_t pid = fork();
  if (pid < 0) {
    return MakeUnexpected(MakeError(ErrorCode::kInternalError,
                                    std::string("fork failed (") + stage + "): " + std::strerror(errno)));
  }
  if (pid > 0) {
    std::exit(0);
  }
  return {};
}

}  // namespace

Expected<void, Error> Daemonize() {
  if (auto forked = ForkAndExitParent("first"); !forked) {
    return forked;
  }

  if (setsid() < 0) {
    return MakeUnexpected(
        MakeError(ErrorCode::kInternalError, std::string("setsid failed: ") + std::strerror(errno)));
  }

  // Second fork: a session leader could still acquire a terminal
  if (auto forked = ForkAndExitParent("second"); !forked) {
    return forked;
  }

  if (chdir("/") < 0) {
    StructuredLog().Event("daemon_warning").Field("type", "chdir_failed").Field("target", "/").Warn();
  }

  umask(0);

  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-vararg)
  int null_fd = open("/dev/null", O_RDWR, 0);
  if (null_fd != -1) {
    dup2(null_fd, STDIN_FILENO);
    dup2(null_fd, STDOUT_FILENO);
    dup2(null_fd, STDERR_FILENO);
    if (null_fd > STDERR_FILENO) {
      close(null_fd);
    }
  } else {
    StructuredLog()
        .Event("daemon_warning")
        .Field("error", "Failed to open /dev/null for file descriptor redirection")
        .Warn();
  }

  StructuredLog().Event("process_daemonized").Info();
  return {};
}

}  // namespace binlogsync::utils
