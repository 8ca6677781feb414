// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/node.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace chainsync {
namespace sync {

/*
 PendingConnections — outbound connection attempts still in flight

 Maps node id -> time the attempt was initiated. An id is present only
 between "connect requested" and either a completed handshake (Erase) or
 expiry (RemoveExpired). This is the only de-duplication of connection
 attempts, so every read-modify-write happens under one mutex.

 After Close() no new attempt can begin.
*/
class PendingConnections {
public:
  using Clock = std::chrono::steady_clock;

  explicit PendingConnections(std::chrono::milliseconds timeout);

  // If id is not pending, run start() and record id with the current time,
  // all under the lock. Returns false (start not run) if id is already
  // pending or the record is closed. If start() throws, nothing is recorded
  // and the exception propagates.
  bool TryBegin(const network::NodeId& id, const std::function<void()>& start);

  bool Erase(const network::NodeId& id);

  // Drop entries older than the timeout. Returns the dropped ids.
  std::vector<network::NodeId> RemoveExpired();

  bool Contains(const network::NodeId& id) const;
  std::vector<network::NodeId> Ids() const;
  size_t Size() const;

  // Clear and refuse further TryBegin calls
  void Close();
  bool IsClosed() const;

private:
  const std::chrono::milliseconds timeout_;

  mutable std::mutex mutex_;
  std::unordered_map<network::NodeId, Clock::time_point> started_;
  bool closed_{false};
};

}  // namespace sync
}  // namespace chainsync
