/**
 * @file binlog_stream.h
 * @brief Interface of a replication event stream
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include "mysql/binlog_event.h"
#include "mysql/connection.h"
#include "mysql/master_status.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace binlogsync::mysql {

/**
 * @brief Server flavor
 */
enum class Flavor : uint8_t {
  kMySQL,
  kMariaDB,
};

inline const char* FlavorName(Flavor flavor) {
  return flavor == Flavor::kMariaDB ? "mariadb" : "mysql";
}

/**
 * @brief Settings for the dedicated replication connection
 */
// NOLINTBEGIN(readability-magic-numbers,cppcoreguidelines-avoid-magic-numbers)
struct BinlogStreamConfig {
  uint32_t server_id = 100;
  Flavor flavor = Flavor::kMySQL;
  std::string host = "127.0.0.1";
  uint16_t port = 3306;
  std::string unix_socket;
  std::string user;
  std::string password;
  uint32_t connect_timeout = 10;  // seconds
  std::chrono::milliseconds heartbeat_period{30000};  // 0 disables heartbeats
  SslMode ssl_mode = SslMode::kDefault;
};
// NOLINTEND(readability-magic-numbers,cppcoreguidelines-avoid-magic-numbers)

/**
 * @brief Pull-based source of decoded binlog events
 *
 * Fetch() is called from a single consumer thread. Interrupt() may be
 * called from any thread and makes a blocked or later Fetch() return
 * kCancelled.
 */
class IBinlogStream {
 public:
  virtual ~IBinlogStream() = default;

  /**
   * @brief Register as a replica and request events from the given position
   */
  virtual utils::Expected<void, utils::Error> Open(const MasterStatus& position) = 0;

  /**
   * @brief Block until the next event arrives
   */
  virtual utils::Expected<BinlogEvent, utils::Error> Fetch() = 0;

  virtual void Interrupt() = 0;

  virtual utils::Expected<void, utils::Error> Close() = 0;
};

}  // namespace binlogsync::mysql
