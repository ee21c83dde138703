/**
 * @file table_cache.cpp
 * @brief Table metadata cache implementation
 */

#include "canal/table_cache.h"

#include <spdlog/spdlog.h>

#include <mutex>
#include <utility>

namespace binlogsync::canal {

TableCache::TableCache(Loader loader) : loader_(std::move(loader)) {}

uint64_t TableCache::GenerationLocked(const std::string& name) const {
  auto iter = generations_.find(name);
  return iter == generations_.end() ? 0 : iter->second;
}

utils::Expected<TablePtr, utils::Error> TableCache::FindTable(const std::string& name) {
  {
    std::shared_lock lock(mutex_);
    auto iter = tables_.find(name);
    if (iter != tables_.end()) {
      return iter->second;
    }
  }

  return flight_.Do(name, [this, &name]() -> utils::Expected<TablePtr, utils::Error> {
    uint64_t generation = 0;
    uint64_t epoch = 0;
    {
      std::shared_lock lock(mutex_);
      auto iter = tables_.find(name);
      if (iter != tables_.end()) {
        return iter->second;
      }
      generation = GenerationLocked(name);
      epoch = epoch_;
    }

    auto loaded = loader_(name);
    if (!loaded) {
      return loaded;
    }

    std::unique_lock lock(mutex_);
    if (GenerationLocked(name) == generation && epoch_ == epoch) {
      tables_[name] = *loaded;
    } else {
      spdlog::debug("Table {} was invalidated during load; result not cached", name);
    }
    return loaded;
  });
}

void TableCache::ClearTableCache(const std::string& name) {
  std::unique_lock lock(mutex_);
  tables_.erase(name);
  ++generations_[name];
}

void TableCache::ClearAll() {
  std::unique_lock lock(mutex_);
  tables_.clear();
  generations_.clear();
  ++epoch_;
}

size_t TableCache::Size() const {
  std::shared_lock lock(mutex_);
  return tables_.size();
}

bool TableCache::Contains(const std::string& name) const {
  std::shared_lock lock(mutex_);
  return tables_.find(name) != tables_.end();
}

}  // namespace binlogsync::canal
