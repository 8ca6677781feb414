// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

namespace chainsync {
namespace sync {

// Global sync progress (INIT .. DONE_SYNC) and per-peer work assignment.
// IDLE is only ever assigned to peers. DONE_SYNC is terminal.
enum class SyncState {
  IDLE,
  INIT,
  HASH_RETRIEVING,
  BLOCK_RETRIEVING,
  DONE_SYNC,
};

const char* SyncStateToString(SyncState state);

}  // namespace sync
}  // namespace chainsync
