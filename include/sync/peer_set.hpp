// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/node.hpp"
#include "sync/peer_handle.hpp"
#include "util/threadsafe_containers.hpp"

#include <cstddef>
#include <vector>

namespace chainsync {
namespace sync {

// PeerSet - peers currently taking part in sync, keyed by node id
//
// Iteration is always over a Snapshot(), so concurrent Add/Remove never
// invalidate a pass in progress.
class PeerSet {
public:
  // Insert or replace the entry for the peer's node id. Null is ignored.
  // Returns the handle that was displaced, if it is a different object
  // (a peer that reconnected before its old session was removed).
  PeerHandlePtr Add(const PeerHandlePtr& peer);

  // Remove only if the stored handle is this peer (a reconnected peer with
  // the same id stays)
  bool Remove(const PeerHandlePtr& peer);

  // Remove a batch under one lock. Returns the number removed.
  size_t RemoveAll(const std::vector<PeerHandlePtr>& peers);

  bool Contains(const network::NodeId& id) const { return peers_.Contains(id); }

  std::vector<PeerHandlePtr> Snapshot() const;
  std::vector<network::NodeId> NodeIds() const;

  size_t Size() const { return peers_.Size(); }
  bool Empty() const { return peers_.Empty(); }
  void Clear() { peers_.Clear(); }

private:
  util::ThreadSafeMap<network::NodeId, PeerHandlePtr> peers_;
};

}  // namespace sync
}  // namespace chainsync
