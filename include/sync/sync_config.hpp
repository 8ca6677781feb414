// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace chainsync {
namespace sync {

struct SyncConfig {
  // Peer top-up stops once this many peers are syncing
  size_t target_peer_count = 5;

  // Reconciliation pass (master check, peer check, staleness sweep, top-up)
  std::chrono::milliseconds tick_interval{3000};

  // Peer statistics logging; only scheduled if the "sync" logger emits info
  std::chrono::milliseconds stats_interval{30000};

  // In-flight connection attempts older than this are forgotten
  std::chrono::milliseconds connection_timeout{60000};

  // Logging, applied by InitializeLogging
  std::string log_level = "info";
  bool log_to_file = false;
  std::string log_file = "sync.log";
};

// Throws std::invalid_argument naming the offending field
void ValidateSyncConfig(const SyncConfig& config);

// Parse a JSON object. Unknown keys are ignored and missing keys keep their
// defaults. Throws std::runtime_error on malformed JSON, a wrong value type,
// or a value that fails ValidateSyncConfig.
SyncConfig LoadSyncConfigFromString(const std::string& json_text);

// As LoadSyncConfigFromString; also throws std::runtime_error if the file
// cannot be opened
SyncConfig LoadSyncConfigFromFile(const std::string& path);

// Configure process logging from the log_* fields. If logging is already
// initialized, only the "sync" logger's level changes. Throws
// std::invalid_argument if config fails ValidateSyncConfig.
void InitializeLogging(const SyncConfig& config);

}  // namespace sync
}  // namespace chainsync
