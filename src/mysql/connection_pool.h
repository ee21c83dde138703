/**
 * @file connection_pool.h
 * @brief Bounded pool of MySQL connections with RAII leases
 */

#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>

#include "mysql/connection.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace binlogsync::mysql {

/**
 * @brief Fixed-size connection pool
 *
 * Connections are opened lazily up to max_size. Acquire() blocks while
 * every connection is leased out. Idle connections are pinged before they
 * are handed out again and reconnected when the ping fails.
 *
 * The pool must outlive every Lease it hands out.
 */
class ConnectionPool {
 public:
  class Lease {
   public:
    Lease() = default;
    Lease(ConnectionPool* pool, std::unique_ptr<Connection> conn) : pool_(pool), conn_(std::move(conn)) {}
    ~Lease() { Release(); }

    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;

    Lease(Lease&& other) noexcept : pool_(other.pool_), conn_(std::move(other.conn_)), broken_(other.broken_) {
      other.pool_ = nullptr;
    }
    Lease& operator=(Lease&& other) noexcept {
      if (this != &other) {
        Release();
        pool_ = other.pool_;
        conn_ = std::move(other.conn_);
        broken_ = other.broken_;
        other.pool_ = nullptr;
      }
      return *this;
    }

    Connection* operator->() const { return conn_.get(); }
    Connection& operator*() const { return *conn_; }

    /**
     * @brief Drop the connection instead of returning it to the pool
     */
    void MarkBroken() { broken_ = true; }

   private:
    void Release();

    ConnectionPool* pool_ = nullptr;
    std::unique_ptr<Connection> conn_;
    bool broken_ = false;
  };

  ConnectionPool(Connection::Config config, size_t max_size);
  ~ConnectionPool();

  ConnectionPool(const ConnectionPool&) = delete;
  ConnectionPool& operator=(const ConnectionPool&) = delete;
  ConnectionPool(ConnectionPool&&) = delete;
  ConnectionPool& operator=(ConnectionPool&&) = delete;

  /**
   * @brief Lease a connected connection
   * @return Lease, kCancelled after Close(), or the connect error
   */
  utils::Expected<Lease, utils::Error> Acquire();

  /**
   * @brief Close idle connections and reject further Acquire() calls
   *
   * Connections currently leased are closed when they come back.
   */
  void Close();

  [[nodiscard]] size_t IdleCount() const;
  [[nodiscard]] size_t OpenCount() const;
  [[nodiscard]] size_t MaxSize() const { return max_size_; }

 private:
  void Return(std::unique_ptr<Connection> conn, bool broken);

  Connection::Config config_;
  size_t max_size_;

  mutable std::mutex mutex_;
  std::condition_variable available_;
  std::deque<std::unique_ptr<Connection>> idle_;
  size_t open_ = 0;
  bool closed_ = false;
};

}  // namespace binlogsync::mysql
