/**
 * @file single_flight.h
 * @brief Collapse concurrent calls for the same key into one execution
 */

#pragma once

#include <exception>
#include <functional>
#include <future>
#include <mutex>
#include <unordered_map>
#include <utility>

namespace binlogsync::canal {

/**
 * @brief Duplicate call suppression
 *
 * The first caller for a key runs the function. Callers arriving while it
 * runs block on the same shared future and receive the identical result.
 * The entry is dropped once the call returns, so results (failures
 * included) are never cached here.
 *
 * @tparam Key Hashable key type
 * @tparam Value Copyable result type
 */
template <typename Key, typename Value>
class SingleFlight {
 public:
  /**
   * @brief Run fn once per key among concurrent callers
   * @param shared Set to true when the result came from another caller's run
   */
  Value Do(const Key& key, const std::function<Value()>& fn, bool* shared = nullptr) {
    std::unique_lock lock(mutex_);
    auto iter = calls_.find(key);
    if (iter != calls_.end()) {
      std::shared_future<Value> pending = iter->second;
      lock.unlock();
      if (shared != nullptr) {
        *shared = true;
      }
      return pending.get();
    }

    std::promise<Value> promise;
    std::shared_future<Value> future = promise.get_future().share();
    calls_.emplace(key, future);
    lock.unlock();
    if (shared != nullptr) {
      *shared = false;
    }

    try {
      Value result = fn();
      Forget(key);
      promise.set_value(result);
      return result;
    } catch (...) {
      // Waiters observe the same exception; the caller gets it rethrown
      Forget(key);
      promise.set_exception(std::current_exception());
      throw;
    }
  }

  /**
   * @brief Number of keys with a call in progress
   */
  [[nodiscard]] size_t InFlight() const {
    std::scoped_lock lock(mutex_);
    return calls_.size();
  }

 private:
  void Forget(const Key& key) {
    std::scoped_lock lock(mutex_);
    calls_.erase(key);
  }

  mutable std::mutex mutex_;
  std::unordered_map<Key, std::shared_future<Value>> calls_;
};

}  // namespace binlogsync::canal
