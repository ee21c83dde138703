/**
 * @file daemon_utils.h
 * @brief Daemon process utilities
 */

#pragma once

#include "utils/error.h"
#include "utils/expected.h"

namespace binlogsync::utils {

/**
 * @brief Detach from the controlling terminal
 *
 * Double-forks, starts a new session, changes to "/" and points the
 * standard descriptors at /dev/null. The parent processes exit with 0.
 *
 * @note Do not use under systemd Type=simple units.
 */
Expected<void, Error> Daemonize();

}  // namespace binlogsync::utils
