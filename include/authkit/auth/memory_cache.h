#ifndef AUTHKIT_AUTH_MEMORY_CACHE_H
#define AUTHKIT_AUTH_MEMORY_CACHE_H

#include <chrono>
#include <list>
#include <mutex>
#include <unordered_map>

#include "authkit/core/compat.h"

/**
 * @file memory_cache.h
 * @brief LRU cache with per-entry TTL
 */

namespace authkit {

/**
 * @tparam Key The key type
 * @tparam Value The value type
 * @tparam Hash The hash function for the key type
 */
template <typename Key, typename Value, typename Hash = std::hash<Key>>
class MemoryCache {
 public:
  explicit MemoryCache(size_t max_size = 1000,
                       std::chrono::seconds default_ttl = std::chrono::seconds(3600))
      : max_size_(max_size), default_ttl_(default_ttl) {}

  /**
   * @brief Insert or replace an entry
   * @param ttl Lifetime of this entry, default_ttl when unset
   */
  void put(const Key& key, const Value& value,
           optional<std::chrono::seconds> ttl = nullopt) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto expiry = std::chrono::steady_clock::now() + ttl.value_or(default_ttl_);

    auto map_it = cache_map_.find(key);
    if (map_it != cache_map_.end()) {
      lru_list_.erase(map_it->second.list_iterator);
      cache_map_.erase(map_it);
    }

    lru_list_.push_front(key);
    cache_map_.emplace(key, CacheData{lru_list_.begin(), value, expiry});

    while (cache_map_.size() > max_size_) {
      evict_lru();
    }
  }

  // nullopt when absent or expired; a hit becomes most recently used
  optional<Value> get(const Key& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = cache_map_.find(key);
    if (it == cache_map_.end()) {
      return nullopt;
    }

    if (std::chrono::steady_clock::now() >= it->second.expiry) {
      lru_list_.erase(it->second.list_iterator);
      cache_map_.erase(it);
      return nullopt;
    }

    lru_list_.splice(lru_list_.begin(), lru_list_, it->second.list_iterator);
    it->second.list_iterator = lru_list_.begin();
    return it->second.value;
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_map_.clear();
    lru_list_.clear();
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_map_.size();
  }

 private:
  struct CacheData {
    typename std::list<Key>::iterator list_iterator;
    Value value;
    std::chrono::steady_clock::time_point expiry;
  };

  void evict_lru() {
    if (!lru_list_.empty()) {
      auto key = lru_list_.back();
      lru_list_.pop_back();
      cache_map_.erase(key);
    }
  }

  mutable std::mutex mutex_;
  size_t max_size_;
  std::chrono::seconds default_ttl_;
  std::list<Key> lru_list_;  // Front is most recently used
  std::unordered_map<Key, CacheData, Hash> cache_map_;
};

}  // namespace authkit

#endif  // AUTHKIT_AUTH_MEMORY_CACHE_H
