// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/node.hpp"
#include "sync/sync_state.hpp"
#include "util/arith_uint256.hpp"
#include "util/uint.hpp"

#include <memory>

namespace chainsync {
namespace sync {

// Chain status a peer declared during its handshake
struct HandshakeStatus {
  network::NodeId node_id;
  arith_uint256 total_difficulty;
  uint256 best_hash;
};

// PeerHandle - a connected, handshake-complete remote peer
//
// Implemented by the peer protocol layer, which owns the connection. The
// coordinator sets the peer's sync sub-state and polls its progress.
// All methods may be called from any thread.
class PeerHandle {
public:
  virtual ~PeerHandle() = default;

  virtual HandshakeStatus GetHandshakeStatus() const = 0;

  network::NodeId GetNodeId() const { return GetHandshakeStatus().node_id; }

  virtual void SetSyncState(SyncState state) = 0;
  virtual SyncState GetSyncState() const = 0;

  virtual bool IsHashRetrievingDone() const = 0;
  virtual bool HasNoMoreBlocks() const = 0;
  virtual bool IsSyncDone() const = 0;
  virtual bool IsIdle() const = 0;

  // Emit download statistics to the log
  virtual void LogSyncStats() const = 0;
};

using PeerHandlePtr = std::shared_ptr<PeerHandle>;

}  // namespace sync
}  // namespace chainsync
