// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/rate_limiter.hpp"

#include "util/time.hpp"

#include <algorithm>

namespace chainsync {
namespace util {

bool RateLimiter::should_log(const std::string& callsite_key, int tokens_per_period, int period_seconds) {
  if (tokens_per_period <= 0 || period_seconds <= 0) {
    return false;
  }

  const auto now = GetSteadyTime();
  const double capacity = static_cast<double>(tokens_per_period);

  std::lock_guard<std::mutex> lock(mutex_);
  auto [it, inserted] = buckets_.try_emplace(callsite_key);
  Bucket& bucket = it->second;
  if (inserted) {
    bucket.tokens = capacity;
    bucket.refilled_at = now;
  }

  // Whole seconds only, so mock time steps refill deterministically
  const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - bucket.refilled_at).count();
  if (elapsed > 0) {
    const double per_second = capacity / static_cast<double>(period_seconds);
    bucket.tokens = std::min(capacity, bucket.tokens + per_second * static_cast<double>(elapsed));
    bucket.refilled_at = now;
  }

  if (bucket.tokens < 1.0) {
    return false;
  }
  bucket.tokens -= 1.0;
  return true;
}

void RateLimiter::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  buckets_.clear();
}

RateLimiter& RateLimiter::instance() {
  static RateLimiter limiter;
  return limiter;
}

}  // namespace util
}  // namespace chainsync
