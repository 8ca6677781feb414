// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>

namespace chainsync {
namespace util {

/**
 * ThreadSafeMap - unordered_map behind a single mutex
 *
 * ForEach and EraseIf callbacks run with the lock held and must not call
 * back into the same map.
 */
template <typename K, typename V, typename Hash = std::hash<K>>
class ThreadSafeMap {
public:
  // Insert or overwrite. Returns the value that was replaced, if any.
  std::optional<V> InsertOrUpdate(const K& key, V value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = map_.find(key);
    if (it == map_.end()) {
      map_.emplace(key, std::move(value));
      return std::nullopt;
    }
    std::optional<V> previous(std::move(it->second));
    it->second = std::move(value);
    return previous;
  }

  bool Contains(const K& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return map_.find(key) != map_.end();
  }

  bool Erase(const K& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return map_.erase(key) > 0;
  }

  // Erase entries matching pred. Returns the number erased.
  size_t EraseIf(const std::function<bool(const K&, const V&)>& pred) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t erased = 0;
    for (auto it = map_.begin(); it != map_.end();) {
      if (pred(it->first, it->second)) {
        it = map_.erase(it);
        ++erased;
      } else {
        ++it;
      }
    }
    return erased;
  }

  // Visit every entry under one lock
  void ForEach(const std::function<void(const K&, const V&)>& fn) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [key, value] : map_) {
      fn(key, value);
    }
  }

  size_t Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return map_.size();
  }

  bool Empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return map_.empty();
  }

  void Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    map_.clear();
  }

private:
  mutable std::mutex mutex_;
  std::unordered_map<K, V, Hash> map_;
};

}  // namespace util
}  // namespace chainsync
