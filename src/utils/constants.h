/**
 * @file constants.h
 * @brief Constants shared across modules
 */

#pragma once

#include <cstdint>

namespace binlogsync::constants {

/// Milliseconds per second
constexpr int64_t kMillisecondsPerSecond = 1000;

/// Nanoseconds per millisecond
constexpr int64_t kNanosecondsPerMillisecond = 1000000;

/// First valid event offset in a binlog file (after the 4-byte magic)
constexpr uint64_t kMinBinlogPosition = 4;

/// Replication server id used when the DSN does not set BinlogSlaveId
constexpr uint32_t kDefaultSlaveId = 100;

/// MySQL client error: lost connection during query
constexpr unsigned int kErrServerLost = 2013;

/// MySQL client error: server has gone away
constexpr unsigned int kErrServerGone = 2006;

/// MySQL server error sent by the dump thread (purged or unreadable binlog)
constexpr unsigned int kErrMasterFatalReadingBinlog = 1236;

}  // namespace binlogsync::constants
