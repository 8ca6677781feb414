// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/logging.hpp"

#include <iostream>
#include <map>
#include <mutex>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace chainsync {
namespace util {

namespace {

const std::vector<std::string> kComponents = {"default", "sync"};

std::mutex g_log_mutex;
bool g_initialized = false;
std::map<std::string, std::shared_ptr<spdlog::logger>> g_loggers;

// Caller holds g_log_mutex
void InitializeLocked(const std::string& log_level, bool log_to_file, const std::string& log_file_path) {
  std::vector<spdlog::sink_ptr> sinks;
  try {
    if (log_to_file) {
      sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file_path, false));
    } else {
      sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }
  } catch (const spdlog::spdlog_ex& ex) {
    // Unwritable log file: fall back to stdout rather than running blind
    std::cerr << "Log initialization failed: " << ex.what() << ", logging to stdout" << std::endl;
    sinks.clear();
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  }

  const auto level = spdlog::level::from_str(log_level);
  for (const auto& sink : sinks) {
    sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
  }

  for (const auto& component : kComponents) {
    auto logger = std::make_shared<spdlog::logger>(component, sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    g_loggers[component] = logger;
  }

  g_initialized = true;
  g_loggers["default"]->info("logging initialized (level: {})", log_level);
}

}  // namespace

void LogManager::Initialize(const std::string& log_level, bool log_to_file, const std::string& log_file_path) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  if (g_initialized) {
    return;
  }
  InitializeLocked(log_level, log_to_file, log_file_path);
}

void LogManager::Shutdown() {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  if (!g_initialized) {
    return;
  }
  for (auto& [name, logger] : g_loggers) {
    logger->flush();
  }
  g_loggers.clear();
  g_initialized = false;
}

std::shared_ptr<spdlog::logger> LogManager::GetLogger(const std::string& name) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  if (!g_initialized) {
    InitializeLocked("off", false, "");
  }
  auto it = g_loggers.find(name);
  if (it != g_loggers.end()) {
    return it->second;
  }
  return g_loggers["default"];
}

void LogManager::SetLogLevel(const std::string& level) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  if (!g_initialized) {
    return;
  }
  const auto parsed = spdlog::level::from_str(level);
  for (auto& [name, logger] : g_loggers) {
    logger->set_level(parsed);
  }
}

void LogManager::SetComponentLevel(const std::string& component, const std::string& level) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  if (!g_initialized) {
    return;
  }
  auto it = g_loggers.find(component);
  if (it == g_loggers.end()) {
    g_loggers["default"]->warn("unknown log component: {}", component);
    return;
  }
  it->second->set_level(spdlog::level::from_str(level));
}

bool LogManager::IsEnabled(const std::string& component, spdlog::level::level_enum level) {
  return GetLogger(component)->should_log(level);
}

}  // namespace util
}  // namespace chainsync
