// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 SyncCoordinator — chooses sync peers and drives the global sync state

 Responsibilities:
 - Peer admission (AddPeer): discard peers whose total difficulty does not
   beat the local chain; elect a new master when a peer advertises a
   strictly higher total difficulty than anything known so far
 - Peer removal (RemovePeer)
 - Global state machine (ChangeState): INIT -> HASH_RETRIEVING ->
   BLOCK_RETRIEVING -> DONE_SYNC, pushing sub-states to the peers
 - Reconciliation tick: master check, peer health check, in-flight
   connection staleness sweep, peer top-up from discovery
 - Discovery listener: connect to newly appeared nodes that beat the best
   known total difficulty

 Threading:
 - Both periodic tasks run on one io_context. With an owned io_context a
   single worker thread runs it; with an external one (tests) the caller
   drives it.
 - AddPeer, RemovePeer, ChangeState and the acting part of each tick check
   serialize on state_mutex_ (recursive: peer handles may call back in from
   SetSyncState).
 - The sync-done callback runs after state_mutex_ is released.
 - Lock order: state_mutex_ -> PendingConnections. Discovery is never
   called with state_mutex_ held except RemoveDiscoverListener during the
   DONE_SYNC teardown.
 - NodeConnector::Connect runs under the in-flight record lock and must not
   call back into the coordinator synchronously.

 DONE_SYNC is terminal: afterwards AddPeer, RemovePeer, ChangeState and
 ticks are no-ops, and the sync-done callback has fired exactly once.
*/

#include "chain/chain_store.hpp"
#include "network/node_connector.hpp"
#include "network/node_discovery.hpp"
#include "sync/difficulty_tracker.hpp"
#include "sync/peer_handle.hpp"
#include "sync/peer_set.hpp"
#include "sync/pending_connections.hpp"
#include "sync/sync_config.hpp"
#include "sync/sync_state.hpp"
#include "util/periodic_task.hpp"

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>

namespace chainsync {

namespace test {
class SyncCoordinatorTestAccess;
}  // namespace test

namespace sync {

// Invoked once, on the thread that drives the transition to DONE_SYNC, after
// the teardown and with no coordinator lock held. When a tick ends sync this
// is the coordinator's worker thread, so the callback must not destroy the
// coordinator.
using SyncDoneCallback = std::function<void()>;

class SyncCoordinator {
public:
  // Throws std::invalid_argument if config fails ValidateSyncConfig.
  // The usefulness floor starts at the chain's current total difficulty.
  // Must not be destroyed from its own worker thread (std::terminate).
  SyncCoordinator(chain::ChainStore& chain, network::NodeDiscovery& discovery, network::NodeConnector& connector,
                  SyncDoneCallback on_sync_done, const SyncConfig& config = SyncConfig{},
                  std::shared_ptr<asio::io_context> external_io_context = nullptr);
  ~SyncCoordinator();

  SyncCoordinator(const SyncCoordinator&) = delete;
  SyncCoordinator& operator=(const SyncCoordinator&) = delete;

  // Register the discovery listener and schedule the periodic tasks.
  // Single-use: returns false if already started or already DONE_SYNC.
  bool Start();

  // Cancel tasks, drop the discovery listener, join the worker. Idempotent.
  void Stop();

  bool IsRunning() const;

  // Called by the protocol layer after a successful handshake
  void AddPeer(const PeerHandlePtr& peer);

  // Called by the protocol layer when a peer disconnects
  void RemovePeer(const PeerHandlePtr& peer);

  // Global state transition. Throws std::logic_error when entering
  // HASH_RETRIEVING without a master peer, or when asked for IDLE.
  void ChangeState(SyncState new_state);

  SyncState GetState() const { return state_.load(std::memory_order_acquire); }
  bool IsDone() const { return GetState() == SyncState::DONE_SYNC; }

  PeerHandlePtr GetMasterPeer() const;
  uint256 GetBestHash() const;
  arith_uint256 GetLowerUsefulDifficulty() const { return difficulty_.LowerUseful(); }

  size_t PeerCount() const { return peers_.Size(); }
  std::vector<PeerHandlePtr> GetPeers() const { return peers_.Snapshot(); }

  size_t PendingConnectionCount() const { return pending_.Size(); }
  bool IsPendingConnection(const network::NodeId& id) const { return pending_.Contains(id); }

  const SyncConfig& config() const { return config_; }

private:
  friend class test::SyncCoordinatorTestAccess;

  class DiscoveryBridge;

  // One reconciliation pass
  void Tick();
  void CheckMaster();
  // Returns true if a peer finished sync and this pass entered DONE_SYNC
  bool CheckPeers();
  void RemoveOutdatedConnections();
  void AskNewPeers();

  void LogStats();

  void InitiateConnection(const network::CandidateNode& node);

  // Discovery listener filter
  bool AcceptsDiscoveredNode(const network::NodeStatistics& stats) const;

  // Caller holds state_mutex_. Returns true if this call entered DONE_SYNC;
  // the caller then owes a NotifySyncDone() once the lock is released.
  bool ChangeStateLocked(SyncState new_state);

  // Caller holds state_mutex_
  void SetAllPeersState(SyncState state);
  void TearDown();

  // Caller must not hold state_mutex_
  void NotifySyncDone();

  void DetachDiscovery();

  chain::ChainStore& chain_;
  network::NodeDiscovery& discovery_;
  network::NodeConnector& connector_;
  SyncDoneCallback on_sync_done_;
  const SyncConfig config_;

  // Declared before the tasks: timers must be destroyed first
  std::shared_ptr<asio::io_context> io_context_;
  const bool external_io_context_;
  std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_guard_;
  std::thread worker_;

  mutable std::recursive_mutex state_mutex_;
  std::atomic<SyncState> state_{SyncState::INIT};
  PeerHandlePtr master_peer_;  // guarded by state_mutex_
  uint256 best_hash_;          // guarded by state_mutex_

  PeerSet peers_;
  PendingConnections pending_;
  DifficultyTracker difficulty_;

  std::mutex listener_mutex_;
  std::shared_ptr<DiscoveryBridge> listener_;

  std::unique_ptr<util::PeriodicTask> tick_task_;
  std::unique_ptr<util::PeriodicTask> stats_task_;

  std::atomic<bool> sync_done_notified_{false};

  std::mutex start_stop_mutex_;
  bool started_{false};  // guarded by start_stop_mutex_
  std::atomic<bool> running_{false};
};

}  // namespace sync
}  // namespace chainsync
