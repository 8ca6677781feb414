// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/node_discovery.hpp"

#include <algorithm>

namespace chainsync {
namespace network {

bool CompareByTotalDifficultyDesc(const CandidateNode& a, const CandidateNode& b) {
  const auto& ta = a.stats.last_status_total_difficulty;
  const auto& tb = b.stats.last_status_total_difficulty;
  if (ta && tb) {
    return *ta > *tb;
  }
  // Known sorts before unknown; two unknowns are equivalent
  return ta.has_value() && !tb.has_value();
}

std::vector<CandidateNode> SelectCandidates(const std::vector<CandidateNode>& nodes, const CandidateFilter& filter,
                                            const NodeComparator& comparator, size_t limit) {
  std::vector<CandidateNode> selected;
  if (limit == 0) {
    return selected;
  }
  for (const auto& node : nodes) {
    if (!filter || filter(node)) {
      selected.push_back(node);
    }
  }
  if (comparator) {
    std::stable_sort(selected.begin(), selected.end(), comparator);
  }
  if (selected.size() > limit) {
    selected.resize(limit);
  }
  return selected;
}

}  // namespace network
}  // namespace chainsync
