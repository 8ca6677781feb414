// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 ChainStore / BlockQueue — the local chain as seen by the sync coordinator

 Both are implemented by the storage layer. The coordinator only reads the
 local total difficulty and steers the hash/block queue:
 - highest known total difficulty: the best chain any peer has advertised
   (nullopt until the first peer is admitted)
 - best hash: head the hash retrieval phase walks toward
 - pending hashes: retrieved hashes whose blocks are not downloaded yet

 All methods may be called from any thread.
*/

#include "util/arith_uint256.hpp"
#include "util/uint.hpp"

#include <optional>

namespace chainsync {
namespace chain {

class BlockQueue {
public:
  virtual ~BlockQueue() = default;

  virtual std::optional<arith_uint256> GetHighestTotalDifficulty() const = 0;
  virtual void SetHighestTotalDifficulty(const arith_uint256& total_difficulty) = 0;

  virtual void SetBestHash(const uint256& hash) = 0;

  virtual bool HasPendingHashes() const = 0;
};

class ChainStore {
public:
  virtual ~ChainStore() = default;

  // Cumulative difficulty of the local best chain. Non-decreasing.
  virtual arith_uint256 GetTotalDifficulty() const = 0;

  virtual BlockQueue& GetQueue() = 0;
};

}  // namespace chain
}  // namespace chainsync
