// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "sync/sync_state.hpp"

namespace chainsync {
namespace sync {

const char* SyncStateToString(SyncState state) {
  switch (state) {
  case SyncState::IDLE:
    return "IDLE";
  case SyncState::INIT:
    return "INIT";
  case SyncState::HASH_RETRIEVING:
    return "HASH_RETRIEVING";
  case SyncState::BLOCK_RETRIEVING:
    return "BLOCK_RETRIEVING";
  case SyncState::DONE_SYNC:
    return "DONE_SYNC";
  }
  return "UNKNOWN";
}

}  // namespace sync
}  // namespace chainsync
