/**
 * @file dsn.h
 * @brief MySQL data source name parsing
 *
 * Accepts the go-sql-driver layout:
 *   [user[:password]@][protocol[(address)]]/dbname[?param1=value1&paramN=valueN]
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "utils/error.h"
#include "utils/expected.h"

namespace binlogsync::mysql {

/**
 * @brief Parsed DSN
 *
 * Parameters keep their original order so Format() reproduces the input
 * minus whatever was taken out with TakeParam().
 */
struct Dsn {
  std::string user;
  std::string password;
  std::string protocol = "tcp";
  std::string address;  ///< "host:port" for tcp, socket path for unix
  std::string database;
  std::vector<std::pair<std::string, std::string>> params;

  /**
   * @brief Parse a DSN string
   * @return Parsed DSN or kMySQLInvalidDsn
   */
  static utils::Expected<Dsn, utils::Error> Parse(std::string_view text);

  /**
   * @brief Render back into DSN text
   */
  [[nodiscard]] std::string Format() const;

  /**
   * @brief Remove a parameter and return its value
   */
  std::optional<std::string> TakeParam(std::string_view name);

  [[nodiscard]] std::optional<std::string> GetParam(std::string_view name) const;

  [[nodiscard]] bool IsUnixSocket() const { return protocol == "unix"; }

  /// Host part of a tcp address ("127.0.0.1" when absent)
  [[nodiscard]] std::string Host() const;

  /// Port part of a tcp address (3306 when absent)
  [[nodiscard]] uint16_t Port() const;
};

/**
 * @brief Parse a Go-style duration ("10s", "500ms", "1m30s", "2h")
 */
std::optional<std::chrono::milliseconds> ParseDuration(std::string_view text);

}  // namespace binlogsync::mysql
