// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 NodeDiscovery — interface to the node discovery subsystem

 The discovery algorithm itself lives elsewhere. Consumers can:
 1. Subscribe: AddDiscoverListener / RemoveDiscoverListener. The filter is
    evaluated by discovery on each node's statistics; only matching nodes
    are reported to the listener.
 2. Query: GetNodes returns the best `limit` candidates accepted by the
    filter, ordered by the comparator.
*/

#include "network/node.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <vector>

namespace chainsync {
namespace network {

class DiscoverListener {
public:
  virtual ~DiscoverListener() = default;

  virtual void OnNodeAppeared(const CandidateNode& node) = 0;
  virtual void OnNodeDisappeared(const CandidateNode& node) = 0;
};

using DiscoverListenerPtr = std::shared_ptr<DiscoverListener>;

// Predicate over a node's last known chain statistics
using NodeFilter = std::function<bool(const NodeStatistics&)>;

// Predicate over a whole candidate (identity + statistics)
using CandidateFilter = std::function<bool(const CandidateNode&)>;

// Strict weak ordering; true if `a` should be tried before `b`
using NodeComparator = std::function<bool(const CandidateNode& a, const CandidateNode& b)>;

// Known total difficulty descending, known before unknown, unknown ties equal
bool CompareByTotalDifficultyDesc(const CandidateNode& a, const CandidateNode& b);

// Reference selection for NodeDiscovery::GetNodes implementations:
// filter, stable sort by comparator, truncate to limit
std::vector<CandidateNode> SelectCandidates(const std::vector<CandidateNode>& nodes, const CandidateFilter& filter,
                                            const NodeComparator& comparator, size_t limit);

class NodeDiscovery {
public:
  virtual ~NodeDiscovery() = default;

  virtual void AddDiscoverListener(DiscoverListenerPtr listener, NodeFilter filter) = 0;
  virtual void RemoveDiscoverListener(const DiscoverListenerPtr& listener) = 0;

  virtual std::vector<CandidateNode> GetNodes(const CandidateFilter& filter, const NodeComparator& comparator,
                                              size_t limit) = 0;
};

}  // namespace network
}  // namespace chainsync
