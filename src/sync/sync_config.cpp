// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "sync/sync_config.hpp"

#include "util/logging.hpp"

#include <array>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace chainsync {
namespace sync {

namespace {

constexpr std::array<const char*, 7> kLogLevels = {"trace", "debug", "info", "warn", "error", "critical", "off"};

bool IsKnownLogLevel(const std::string& level) {
  for (const char* known : kLogLevels) {
    if (level == known) {
      return true;
    }
  }
  return false;
}

// Integer key that must be > 0. Absent keys return current.
int64_t ReadPositive(const json& j, const char* key, int64_t current) {
  auto it = j.find(key);
  if (it == j.end()) {
    return current;
  }
  if (!it->is_number_integer()) {
    throw std::runtime_error(std::string("sync config: '") + key + "' must be an integer");
  }
  const int64_t value = it->get<int64_t>();
  if (value <= 0) {
    throw std::runtime_error(std::string("sync config: '") + key + "' must be positive, got " +
                             std::to_string(value));
  }
  return value;
}

}  // namespace

void ValidateSyncConfig(const SyncConfig& config) {
  if (config.target_peer_count == 0) {
    throw std::invalid_argument("sync config: target_peer_count must be at least 1");
  }
  if (config.tick_interval.count() <= 0) {
    throw std::invalid_argument("sync config: tick_interval must be positive");
  }
  if (config.stats_interval.count() <= 0) {
    throw std::invalid_argument("sync config: stats_interval must be positive");
  }
  if (config.connection_timeout.count() <= 0) {
    throw std::invalid_argument("sync config: connection_timeout must be positive");
  }
  if (!IsKnownLogLevel(config.log_level)) {
    throw std::invalid_argument("sync config: unknown log_level '" + config.log_level + "'");
  }
  if (config.log_to_file && config.log_file.empty()) {
    throw std::invalid_argument("sync config: log_file must be set when log_to_file is true");
  }
}

SyncConfig LoadSyncConfigFromString(const std::string& json_text) {
  json j;
  try {
    j = json::parse(json_text);
  } catch (const json::parse_error& e) {
    throw std::runtime_error(std::string("sync config: malformed JSON: ") + e.what());
  }
  if (!j.is_object()) {
    throw std::runtime_error("sync config: top level must be a JSON object");
  }

  SyncConfig config;
  config.target_peer_count = static_cast<size_t>(
      ReadPositive(j, "target_peer_count", static_cast<int64_t>(config.target_peer_count)));
  config.tick_interval =
      std::chrono::milliseconds(ReadPositive(j, "tick_interval_ms", config.tick_interval.count()));
  config.stats_interval =
      std::chrono::milliseconds(ReadPositive(j, "stats_interval_ms", config.stats_interval.count()));
  config.connection_timeout =
      std::chrono::milliseconds(ReadPositive(j, "connection_timeout_ms", config.connection_timeout.count()));

  try {
    config.log_level = j.value("log_level", config.log_level);
    config.log_to_file = j.value("log_to_file", config.log_to_file);
    config.log_file = j.value("log_file", config.log_file);
  } catch (const json::type_error& e) {
    throw std::runtime_error(std::string("sync config: wrong value type: ") + e.what());
  }

  try {
    ValidateSyncConfig(config);
  } catch (const std::invalid_argument& e) {
    throw std::runtime_error(e.what());
  }
  return config;
}

SyncConfig LoadSyncConfigFromFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("sync config: cannot open " + path);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  SyncConfig config = LoadSyncConfigFromString(buffer.str());
  LOG_SYNC_DEBUG("loaded sync config from {} (target peers {}, tick {}ms)", path, config.target_peer_count,
                 config.tick_interval.count());
  return config;
}

void InitializeLogging(const SyncConfig& config) {
  ValidateSyncConfig(config);
  util::LogManager::Initialize(config.log_level, config.log_to_file, config.log_file);
  util::LogManager::SetComponentLevel("sync", config.log_level);
}

}  // namespace sync
}  // namespace chainsync
