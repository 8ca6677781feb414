// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "sync/sync_coordinator.hpp"

#include "util/logging.hpp"

#include <exception>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>

namespace chainsync {
namespace sync {

using network::ShortNodeId;

// Forwards discovery events to the coordinator until detached. Detach()
// waits for a callback in progress, so no event reaches the coordinator
// once it returns.
class SyncCoordinator::DiscoveryBridge : public network::DiscoverListener {
public:
  explicit DiscoveryBridge(SyncCoordinator* owner) : owner_(owner) {}

  void OnNodeAppeared(const network::CandidateNode& node) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (owner_) {
      owner_->InitiateConnection(node);
    }
  }

  void OnNodeDisappeared(const network::CandidateNode&) override {}

  void Detach() {
    std::lock_guard<std::mutex> lock(mutex_);
    owner_ = nullptr;
  }

private:
  std::mutex mutex_;
  SyncCoordinator* owner_;
};

SyncCoordinator::SyncCoordinator(chain::ChainStore& chain, network::NodeDiscovery& discovery,
                                 network::NodeConnector& connector, SyncDoneCallback on_sync_done,
                                 const SyncConfig& config, std::shared_ptr<asio::io_context> external_io_context)
    : chain_(chain),
      discovery_(discovery),
      connector_(connector),
      on_sync_done_(std::move(on_sync_done)),
      config_(config),
      io_context_(external_io_context ? external_io_context : std::make_shared<asio::io_context>()),
      external_io_context_(external_io_context != nullptr),
      pending_(config.connection_timeout),
      difficulty_(chain.GetTotalDifficulty()) {
  ValidateSyncConfig(config_);

  tick_task_ = std::make_unique<util::PeriodicTask>(*io_context_, "sync-tick", config_.tick_interval,
                                                    [this]() { Tick(); });
  stats_task_ = std::make_unique<util::PeriodicTask>(*io_context_, "sync-stats", config_.stats_interval,
                                                     [this]() { LogStats(); });

  LOG_SYNC_TRACE("SyncCoordinator initialized (local td {}, target peers {}, external_io_context: {})",
                 difficulty_.LowerUseful().ToString(), config_.target_peer_count,
                 external_io_context_ ? "yes" : "no");
}

SyncCoordinator::~SyncCoordinator() {
  if (worker_.joinable() && worker_.get_id() == std::this_thread::get_id()) {
    // The worker's own frames (tick, timer handler, io_context::run) would
    // outlive the object
    LOG_SYNC_ERROR("SyncCoordinator destroyed from its own worker thread");
    std::terminate();
  }
  Stop();
  if (worker_.joinable()) {
    worker_.join();
  }
}

bool SyncCoordinator::Start() {
  std::lock_guard<std::mutex> lock(start_stop_mutex_);
  if (started_ || IsDone()) {
    return false;
  }
  started_ = true;
  running_.store(true, std::memory_order_release);

  {
    std::lock_guard<std::mutex> listener_lock(listener_mutex_);
    listener_ = std::make_shared<DiscoveryBridge>(this);
    discovery_.AddDiscoverListener(listener_, [this](const network::NodeStatistics& stats) {
      return AcceptsDiscoveredNode(stats);
    });
  }

  tick_task_->Start();
  if (util::LogManager::IsEnabled("sync", spdlog::level::info)) {
    stats_task_->Start();
  }

  // Only drive the io_context ourselves if we own it
  if (!external_io_context_) {
    work_guard_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(
        asio::make_work_guard(*io_context_));
    worker_ = std::thread([this]() {
      try {
        io_context_->run();
      } catch (const std::logic_error& e) {
        LOG_SYNC_ERROR("sync worker halted: {}", e.what());
        running_.store(false, std::memory_order_release);
      }
    });
  }

  LOG_SYNC_INFO("sync started (tick every {}ms, target {} peers)", config_.tick_interval.count(),
                config_.target_peer_count);
  return true;
}

void SyncCoordinator::Stop() {
  std::lock_guard<std::mutex> lock(start_stop_mutex_);
  if (!started_) {
    return;
  }

  const bool was_running = running_.exchange(false, std::memory_order_acq_rel);

  DetachDiscovery();
  tick_task_->Cancel();
  stats_task_->Cancel();

  if (!external_io_context_) {
    work_guard_.reset();
    io_context_->stop();
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
      worker_.join();
    }
  }

  if (was_running) {
    LOG_SYNC_INFO("sync stopped in state {}", SyncStateToString(GetState()));
  }
}

bool SyncCoordinator::IsRunning() const {
  return running_.load(std::memory_order_acquire) && !IsDone();
}

void SyncCoordinator::AddPeer(const PeerHandlePtr& peer) {
  if (!peer) {
    return;
  }

  std::lock_guard<std::recursive_mutex> lock(state_mutex_);
  if (IsDone()) {
    return;
  }

  const HandshakeStatus status = peer->GetHandshakeStatus();
  const std::string short_id = ShortNodeId(status.node_id);

  // Handshake finished; the attempt is no longer in flight
  pending_.Erase(status.node_id);

  const arith_uint256 local_td = chain_.GetTotalDifficulty();
  if (status.total_difficulty <= local_td) {
    LOG_SYNC_INFO("peer {}: difficulty not above ours: {} vs {}, skipping", short_id,
                  status.total_difficulty.ToString(), local_td.ToString());
    return;
  }

  chain::BlockQueue& queue = chain_.GetQueue();
  const std::optional<arith_uint256> highest_known = queue.GetHighestTotalDifficulty();

  if (!highest_known || status.total_difficulty > *highest_known) {
    LOG_SYNC_INFO("peer {}: chain is better than previously known: {} vs {}", short_id,
                  status.total_difficulty.ToString(), highest_known ? highest_known->ToString() : "0");
    LOG_SYNC_DEBUG("peer {}: best hash [{}]", short_id, status.best_hash.GetHex());

    best_hash_ = status.best_hash;
    master_peer_ = peer;
    queue.SetHighestTotalDifficulty(status.total_difficulty);
    difficulty_.RecordBestKnown(status.total_difficulty);

    ChangeStateLocked(SyncState::HASH_RETRIEVING);
  }

  // Late peer joining a download in progress
  if (GetState() == SyncState::BLOCK_RETRIEVING) {
    peer->SetSyncState(SyncState::BLOCK_RETRIEVING);
  }

  LOG_SYNC_INFO("peer {}: adding to pool", short_id);
  const PeerHandlePtr replaced = peers_.Add(peer);
  if (!replaced) {
    return;
  }

  // Reconnect before the old session was removed
  LOG_SYNC_WARN("peer {}: replacing previous session", short_id);
  replaced->SetSyncState(SyncState::IDLE);
  if (master_peer_ == replaced) {
    master_peer_ = peer;
    if (GetState() == SyncState::HASH_RETRIEVING) {
      peer->SetSyncState(SyncState::HASH_RETRIEVING);
    }
  }
}

void SyncCoordinator::RemovePeer(const PeerHandlePtr& peer) {
  if (!peer) {
    return;
  }

  std::lock_guard<std::recursive_mutex> lock(state_mutex_);
  if (IsDone()) {
    return;
  }

  pending_.Erase(peer->GetNodeId());
  peer->SetSyncState(SyncState::IDLE);
  if (peers_.Remove(peer)) {
    LOG_SYNC_DEBUG("peer {}: removed from pool", ShortNodeId(peer->GetNodeId()));
  }
}

void SyncCoordinator::ChangeState(SyncState new_state) {
  bool finished = false;
  {
    std::lock_guard<std::recursive_mutex> lock(state_mutex_);
    finished = ChangeStateLocked(new_state);
  }
  if (finished) {
    NotifySyncDone();
  }
}

bool SyncCoordinator::ChangeStateLocked(SyncState new_state) {
  const SyncState old_state = GetState();
  if (old_state == SyncState::DONE_SYNC) {
    LOG_SYNC_TRACE("ignoring transition to {} after sync is done", SyncStateToString(new_state));
    return false;
  }

  switch (new_state) {
  case SyncState::IDLE:
    LOG_SYNC_ERROR("IDLE is a peer state, not a global sync state");
    throw std::logic_error("SyncCoordinator::ChangeState: IDLE is not a global state");

  case SyncState::INIT:
    break;

  case SyncState::HASH_RETRIEVING:
    if (!master_peer_) {
      LOG_SYNC_ERROR("cannot enter HASH_RETRIEVING: no master peer designated");
      throw std::logic_error("SyncCoordinator::ChangeState: HASH_RETRIEVING requires a master peer");
    }
    SetAllPeersState(SyncState::IDLE);
    chain_.GetQueue().SetBestHash(best_hash_);
    master_peer_->SetSyncState(SyncState::HASH_RETRIEVING);
    break;

  case SyncState::BLOCK_RETRIEVING:
    SetAllPeersState(SyncState::BLOCK_RETRIEVING);
    break;

  case SyncState::DONE_SYNC:
    TearDown();
    LOG_SYNC_INFO("sync state: {} -> {}", SyncStateToString(old_state), SyncStateToString(new_state));
    return true;
  }

  state_.store(new_state, std::memory_order_release);
  LOG_SYNC_INFO("sync state: {} -> {}", SyncStateToString(old_state), SyncStateToString(new_state));
  return false;
}

void SyncCoordinator::SetAllPeersState(SyncState state) {
  for (const auto& peer : peers_.Snapshot()) {
    peer->SetSyncState(state);
  }
}

void SyncCoordinator::TearDown() {
  SetAllPeersState(SyncState::IDLE);
  peers_.Clear();
  pending_.Close();
  master_peer_.reset();

  DetachDiscovery();
  tick_task_->Cancel();
  stats_task_->Cancel();

  state_.store(SyncState::DONE_SYNC, std::memory_order_release);
}

void SyncCoordinator::NotifySyncDone() {
  if (sync_done_notified_.exchange(true, std::memory_order_acq_rel) || !on_sync_done_) {
    return;
  }
  try {
    on_sync_done_();
  } catch (const std::exception& e) {
    LOG_SYNC_ERROR("sync-done callback threw: {}", e.what());
  }
}

void SyncCoordinator::DetachDiscovery() {
  std::shared_ptr<DiscoveryBridge> listener;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listener = std::move(listener_);
  }
  if (!listener) {
    return;
  }
  listener->Detach();
  discovery_.RemoveDiscoverListener(listener);
  LOG_SYNC_DEBUG("discovery listener removed");
}

void SyncCoordinator::Tick() {
  if (IsDone()) {
    return;
  }
  CheckMaster();
  if (IsDone()) {
    return;
  }
  if (CheckPeers()) {
    NotifySyncDone();
    return;
  }
  if (IsDone()) {
    return;
  }
  RemoveOutdatedConnections();
  if (IsDone()) {
    return;
  }
  AskNewPeers();
}

void SyncCoordinator::CheckMaster() {
  std::lock_guard<std::recursive_mutex> lock(state_mutex_);
  if (GetState() == SyncState::HASH_RETRIEVING && master_peer_ && master_peer_->IsHashRetrievingDone()) {
    LOG_SYNC_DEBUG("master {}: hash retrieval done", ShortNodeId(master_peer_->GetNodeId()));
    ChangeStateLocked(SyncState::BLOCK_RETRIEVING);
  }
}

bool SyncCoordinator::CheckPeers() {
  std::lock_guard<std::recursive_mutex> lock(state_mutex_);
  if (IsDone()) {
    return false;
  }

  std::vector<PeerHandlePtr> depleted;
  for (const auto& peer : peers_.Snapshot()) {
    if (peer->IsSyncDone()) {
      LOG_SYNC_INFO("peer {}: sync done", ShortNodeId(peer->GetNodeId()));
      return ChangeStateLocked(SyncState::DONE_SYNC);
    }

    if (peer->HasNoMoreBlocks()) {
      const HandshakeStatus status = peer->GetHandshakeStatus();
      LOG_SYNC_INFO("peer {}: has no more blocks, removing", ShortNodeId(status.node_id));
      depleted.push_back(peer);
      peer->SetSyncState(SyncState::IDLE);
      if (difficulty_.RaiseTo(status.total_difficulty)) {
        LOG_SYNC_DEBUG("lower useful difficulty raised to {}", status.total_difficulty.ToString());
      }
    }
  }

  if (difficulty_.RaiseTo(chain_.GetTotalDifficulty())) {
    LOG_SYNC_DEBUG("lower useful difficulty raised to local td {}", difficulty_.LowerUseful().ToString());
  }
  peers_.RemoveAll(depleted);

  // Peers go idle when they see an empty hash queue mid-download; keep
  // them working while hashes remain
  if (GetState() == SyncState::BLOCK_RETRIEVING && chain_.GetQueue().HasPendingHashes()) {
    for (const auto& peer : peers_.Snapshot()) {
      if (peer->IsIdle()) {
        peer->SetSyncState(SyncState::BLOCK_RETRIEVING);
      }
    }
  }
  return false;
}

void SyncCoordinator::RemoveOutdatedConnections() {
  for (const auto& id : pending_.RemoveExpired()) {
    LOG_SYNC_DEBUG("node {}: connection attempt timed out", ShortNodeId(id));
  }
}

void SyncCoordinator::AskNewPeers() {
  const size_t peer_count = peers_.Size();
  if (peer_count >= config_.target_peer_count) {
    return;
  }
  const size_t lack = config_.target_peer_count - peer_count;

  std::unordered_set<network::NodeId> in_use;
  for (auto& id : peers_.NodeIds()) {
    in_use.insert(std::move(id));
  }
  for (auto& id : pending_.Ids()) {
    in_use.insert(std::move(id));
  }
  const arith_uint256 floor = difficulty_.LowerUseful();

  const auto candidates = discovery_.GetNodes(
      [&in_use, &floor](const network::CandidateNode& node) {
        if (!node.stats.HasStatus()) {
          return false;
        }
        if (in_use.count(node.id) > 0) {
          return false;
        }
        return *node.stats.last_status_total_difficulty > floor;
      },
      network::CompareByTotalDifficultyDesc, lack);

  if (!candidates.empty()) {
    LOG_SYNC_DEBUG("{} of {} peers, trying {} new nodes", peer_count, config_.target_peer_count, candidates.size());
  }
  for (const auto& node : candidates) {
    if (IsDone()) {
      return;
    }
    InitiateConnection(node);
  }
}

void SyncCoordinator::LogStats() {
  const auto best_known = difficulty_.BestKnown();
  LOG_SYNC_INFO("sync stats: state {}, {} peers, {} connecting, best td {}, floor {}", SyncStateToString(GetState()),
                peers_.Size(), pending_.Size(), best_known ? best_known->ToString() : "unknown",
                difficulty_.LowerUseful().ToString());
  for (const auto& peer : peers_.Snapshot()) {
    peer->LogSyncStats();
  }
}

void SyncCoordinator::InitiateConnection(const network::CandidateNode& node) {
  if (IsDone()) {
    return;
  }
  try {
    if (pending_.TryBegin(node.id, [&]() { connector_.Connect(node); })) {
      LOG_SYNC_DEBUG("node {}: connecting to {}:{}", ShortNodeId(node.id), node.host, node.port);
    }
  } catch (const std::exception& e) {
    LOG_SYNC_WARN_RL("node {}: connect request failed: {}", ShortNodeId(node.id), e.what());
  }
}

bool SyncCoordinator::AcceptsDiscoveredNode(const network::NodeStatistics& stats) const {
  if (!stats.HasStatus()) {
    return false;
  }
  const std::optional<arith_uint256> highest_known = chain_.GetQueue().GetHighestTotalDifficulty();
  if (!highest_known) {
    return true;
  }
  return *stats.last_status_total_difficulty > *highest_known;
}

PeerHandlePtr SyncCoordinator::GetMasterPeer() const {
  std::lock_guard<std::recursive_mutex> lock(state_mutex_);
  return master_peer_;
}

uint256 SyncCoordinator::GetBestHash() const {
  std::lock_guard<std::recursive_mutex> lock(state_mutex_);
  return best_hash_;
}

}  // namespace sync
}  // namespace chainsync
