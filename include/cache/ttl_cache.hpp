#pragma once
#include "common/clock.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>

// Key -> immutable value with one TTL for the whole namespace.
// An entry stored at T is served while now - T < ttl; refreshes replace the pointer, never the value.
template <class K, class V, class Hash = std::hash<K>>
class TtlCache {
public:
  TtlCache(const Clock& clock, int64_t ttl_ms) : clock_(clock), ttl_ms_(ttl_ms) {}

  std::shared_ptr<const V> Get(const K& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) return nullptr;
    if (clock_.NowMs() - it->second.stored_at_ms >= ttl_ms_) return nullptr;
    return it->second.value;
  }

  std::shared_ptr<const V> Put(const K& key, V value) { return PutAt(key, std::move(value), clock_.NowMs()); }

  // Stores with an explicit timestamp, e.g. the time the chain data was observed
  std::shared_ptr<const V> PutAt(const K& key, V value, int64_t stored_at_ms) {
    auto ptr = std::make_shared<const V>(std::move(value));
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[key] = Entry{ptr, stored_at_ms};
    return ptr;
  }

  // Drops expired entries; returns how many were removed
  size_t Prune() {
    std::lock_guard<std::mutex> lock(mutex_);
    int64_t now = clock_.NowMs();
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
      if (now - it->second.stored_at_ms >= ttl_ms_) {
        it = entries_.erase(it);
        ++removed;
      } else {
        ++it;
      }
    }
    return removed;
  }

  void Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
  }

  size_t Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
  }

private:
  struct Entry {
    std::shared_ptr<const V> value;
    int64_t stored_at_ms = 0;
  };
  const Clock& clock_;
  int64_t ttl_ms_;
  mutable std::mutex mutex_;
  std::unordered_map<K, Entry, Hash> entries_;
};
