/**
 * @file connection_pool.cpp
 * @brief Connection pool implementation
 */

#include "mysql/connection_pool.h"

#include <spdlog/spdlog.h>

#include <utility>

#include "utils/structured_log.h"

namespace binlogsync::mysql {

using utils::ErrorCode;
using utils::MakeError;
using utils::MakeUnexpected;

void ConnectionPool::Lease::Release() {
  if (pool_ != nullptr && conn_) {
    pool_->Return(std::move(conn_), broken_);
  }
  pool_ = nullptr;
}

ConnectionPool::ConnectionPool(Connection::Config config, size_t max_size)
    : config_(std::move(config)), max_size_(max_size == 0 ? 1 : max_size) {
  utils::StructuredLog()
      .Event("connection_pool_created")
      .Field("host", config_.host)
      .Field("max_size", static_cast<uint64_t>(max_size_))
      .Debug();
}

ConnectionPool::~ConnectionPool() {
  Close();
}

utils::Expected<ConnectionPool::Lease, utils::Error> ConnectionPool::Acquire() {
  std::unique_ptr<Connection> conn;
  {
    std::unique_lock<std::mutex> lock(mutex_);
    available_.wait(lock, [this] { return closed_ || !idle_.empty() || open_ < max_size_; });
    if (closed_) {
      return MakeUnexpected(MakeError(ErrorCode::kCancelled, "connection pool is closed"));
    }
    if (!idle_.empty()) {
      conn = std::move(idle_.front());
      idle_.pop_front();
    } else {
      ++open_;
    }
  }

  if (conn) {
    if (conn->Ping()) {
      return Lease(this, std::move(conn));
    }
    if (auto reconnected = conn->Reconnect(); !reconnected) {
      Return(std::move(conn), true);
      return MakeUnexpected(reconnected.error());
    }
    return Lease(this, std::move(conn));
  }

  conn = std::make_unique<Connection>(config_);
  if (auto connected = conn->Connect("pool"); !connected) {
    Return(std::move(conn), true);
    return MakeUnexpected(connected.error());
  }
  return Lease(this, std::move(conn));
}

void ConnectionPool::Return(std::unique_ptr<Connection> conn, bool broken) {
  std::unique_ptr<Connection> discard;
  {
    std::scoped_lock lock(mutex_);
    if (closed_ || broken) {
      discard = std::move(conn);
      --open_;
    } else {
      idle_.push_back(std::move(conn));
    }
  }
  available_.notify_one();
}

void ConnectionPool::Close() {
  std::deque<std::unique_ptr<Connection>> idle;
  {
    std::scoped_lock lock(mutex_);
    if (closed_) {
      return;
    }
    closed_ = true;
    idle.swap(idle_);
    open_ -= idle.size();
  }
  available_.notify_all();
  if (!idle.empty()) {
    spdlog::debug("Closing {} pooled MySQL connections", idle.size());
  }
}

size_t ConnectionPool::IdleCount() const {
  std::scoped_lock lock(mutex_);
  return idle_.size();
}

size_t ConnectionPool::OpenCount() const {
  std::scoped_lock lock(mutex_);
  return open_;
}

}  // namespace binlogsync::mysql
