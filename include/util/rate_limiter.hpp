// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>

namespace chainsync {
namespace util {

/**
 * RateLimiter - per-callsite token bucket for log output
 *
 * Peer churn and misbehaving collaborators can make the same warning fire
 * every tick. Each callsite key owns a bucket holding at most
 * tokens_per_period tokens, refilled linearly over period_seconds.
 * A new bucket starts full.
 */
class RateLimiter {
public:
  // True if a message from callsite_key may be logged now (consumes a token).
  bool should_log(const std::string& callsite_key, int tokens_per_period, int period_seconds);

  // Drop all buckets
  void reset();

  static RateLimiter& instance();

private:
  struct Bucket {
    double tokens{0.0};
    std::chrono::steady_clock::time_point refilled_at{};
  };

  std::mutex mutex_;
  std::unordered_map<std::string, Bucket> buckets_;
};

}  // namespace util
}  // namespace chainsync
