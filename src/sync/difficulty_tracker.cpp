// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "sync/difficulty_tracker.hpp"

namespace chainsync {
namespace sync {

DifficultyTracker::DifficultyTracker(const arith_uint256& initial_floor) : lower_useful_(initial_floor) {}

arith_uint256 DifficultyTracker::LowerUseful() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return lower_useful_;
}

bool DifficultyTracker::RaiseTo(const arith_uint256& candidate) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (candidate > lower_useful_) {
    lower_useful_ = candidate;
    return true;
  }
  return false;
}

void DifficultyTracker::RecordBestKnown(const arith_uint256& total_difficulty) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!best_known_ || total_difficulty > *best_known_) {
    best_known_ = total_difficulty;
  }
}

std::optional<arith_uint256> DifficultyTracker::BestKnown() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return best_known_;
}

}  // namespace sync
}  // namespace chainsync
