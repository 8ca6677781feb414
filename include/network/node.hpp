// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "util/arith_uint256.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace chainsync {
namespace network {

// Lower-case hex of the node's public id
using NodeId = std::string;

// First 8 characters, for log lines
std::string ShortNodeId(const NodeId& id);

// Last known chain statistics of a discovered node
struct NodeStatistics {
  // Total difficulty from the node's last inbound status message.
  // nullopt until a status message has been received.
  std::optional<arith_uint256> last_status_total_difficulty;

  bool HasStatus() const { return last_status_total_difficulty.has_value(); }
};

// A discovered node. Not a peer until connection and handshake succeed.
struct CandidateNode {
  NodeId id;
  std::string host;
  uint16_t port{0};
  NodeStatistics stats;
};

}  // namespace network
}  // namespace chainsync
