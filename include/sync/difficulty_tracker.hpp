// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "util/arith_uint256.hpp"

#include <mutex>
#include <optional>

namespace chainsync {
namespace sync {

/*
 DifficultyTracker — usefulness floor and best advertised total difficulty

 The floor ("lower useful difficulty") is the total difficulty a peer or
 candidate must exceed to be worth syncing with. It never decreases:
 RaiseTo() is compare-and-raise, so concurrent callers cannot lower it.
*/
class DifficultyTracker {
public:
  explicit DifficultyTracker(const arith_uint256& initial_floor);

  arith_uint256 LowerUseful() const;

  // Raise the floor to candidate if higher. Returns true if it was raised.
  bool RaiseTo(const arith_uint256& candidate);

  // Best total difficulty a peer has advertised at admission
  void RecordBestKnown(const arith_uint256& total_difficulty);
  std::optional<arith_uint256> BestKnown() const;

private:
  mutable std::mutex mutex_;
  arith_uint256 lower_useful_;
  std::optional<arith_uint256> best_known_;
};

}  // namespace sync
}  // namespace chainsync
