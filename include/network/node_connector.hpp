// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/node.hpp"

namespace chainsync {
namespace network {

// Outbound connection requests. Fire-and-forget: Connect() returns
// immediately and success surfaces later as a handshaken peer.
class NodeConnector {
public:
  virtual ~NodeConnector() = default;

  virtual void Connect(const CandidateNode& node) = 0;
};

}  // namespace network
}  // namespace chainsync
