// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "sync/peer_set.hpp"

#include <algorithm>

namespace chainsync {
namespace sync {

PeerHandlePtr PeerSet::Add(const PeerHandlePtr& peer) {
  if (!peer) {
    return nullptr;
  }
  auto previous = peers_.InsertOrUpdate(peer->GetNodeId(), peer);
  if (!previous || *previous == peer) {
    return nullptr;
  }
  return *previous;
}

bool PeerSet::Remove(const PeerHandlePtr& peer) {
  if (!peer) {
    return false;
  }
  const auto id = peer->GetNodeId();
  return peers_.EraseIf([&](const network::NodeId& key, const PeerHandlePtr& stored) {
    return key == id && stored == peer;
  }) > 0;
}

size_t PeerSet::RemoveAll(const std::vector<PeerHandlePtr>& peers) {
  if (peers.empty()) {
    return 0;
  }
  return peers_.EraseIf([&](const network::NodeId&, const PeerHandlePtr& stored) {
    return std::find(peers.begin(), peers.end(), stored) != peers.end();
  });
}

std::vector<PeerHandlePtr> PeerSet::Snapshot() const {
  std::vector<PeerHandlePtr> result;
  peers_.ForEach([&](const network::NodeId&, const PeerHandlePtr& peer) { result.push_back(peer); });
  return result;
}

std::vector<network::NodeId> PeerSet::NodeIds() const {
  std::vector<network::NodeId> result;
  peers_.ForEach([&](const network::NodeId& id, const PeerHandlePtr&) { result.push_back(id); });
  return result;
}

}  // namespace sync
}  // namespace chainsync
