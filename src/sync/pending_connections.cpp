// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "sync/pending_connections.hpp"

#include "util/time.hpp"

namespace chainsync {
namespace sync {

PendingConnections::PendingConnections(std::chrono::milliseconds timeout) : timeout_(timeout) {}

bool PendingConnections::TryBegin(const network::NodeId& id, const std::function<void()>& start) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_ || started_.count(id) > 0) {
    return false;
  }
  start();
  started_.emplace(id, util::GetSteadyTime());
  return true;
}

bool PendingConnections::Erase(const network::NodeId& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return started_.erase(id) > 0;
}

std::vector<network::NodeId> PendingConnections::RemoveExpired() {
  std::vector<network::NodeId> expired;
  const auto now = util::GetSteadyTime();

  std::lock_guard<std::mutex> lock(mutex_);
  for (auto it = started_.begin(); it != started_.end();) {
    if (now - it->second > timeout_) {
      expired.push_back(it->first);
      it = started_.erase(it);
    } else {
      ++it;
    }
  }
  return expired;
}

bool PendingConnections::Contains(const network::NodeId& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return started_.count(id) > 0;
}

std::vector<network::NodeId> PendingConnections::Ids() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<network::NodeId> ids;
  ids.reserve(started_.size());
  for (const auto& [id, started_at] : started_) {
    ids.push_back(id);
  }
  return ids;
}

size_t PendingConnections::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return started_.size();
}

void PendingConnections::Close() {
  std::lock_guard<std::mutex> lock(mutex_);
  started_.clear();
  closed_ = true;
}

bool PendingConnections::IsClosed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

}  // namespace sync
}  // namespace chainsync
