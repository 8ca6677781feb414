// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/node.hpp"

namespace chainsync {
namespace network {

std::string ShortNodeId(const NodeId& id) {
  return id.substr(0, 8);
}

}  // namespace network
}  // namespace chainsync
