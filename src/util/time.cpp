// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/time.hpp"

#include <atomic>
#include <mutex>

namespace chainsync {
namespace util {

namespace {

// 0 = real clocks
std::atomic<int64_t> g_mock_time{0};

// Steady clock emulation under mock time: the first GetSteadyTime() call with
// mock time active pins (real steady now, mock seconds). Later calls return
// the pinned steady point shifted by the mock delta.
struct MockSteadyAnchor {
  std::mutex mutex;
  bool pinned{false};
  std::chrono::steady_clock::time_point steady_base{};
  int64_t mock_base{0};
};

MockSteadyAnchor& SteadyAnchor() {
  static MockSteadyAnchor anchor;
  return anchor;
}

}  // namespace

std::chrono::steady_clock::time_point GetSteadyTime() {
  const int64_t mock = g_mock_time.load(std::memory_order_relaxed);
  if (mock == 0) {
    return std::chrono::steady_clock::now();
  }

  auto& anchor = SteadyAnchor();
  std::lock_guard<std::mutex> lock(anchor.mutex);
  if (!anchor.pinned) {
    anchor.steady_base = std::chrono::steady_clock::now();
    anchor.mock_base = mock;
    anchor.pinned = true;
  }
  return anchor.steady_base + std::chrono::seconds(mock - anchor.mock_base);
}

void SetMockTime(int64_t time) {
  g_mock_time.store(time, std::memory_order_relaxed);

  // Keep the anchor while mock time moves so steady time stays monotonic;
  // drop it when mock time is switched off.
  if (time == 0) {
    auto& anchor = SteadyAnchor();
    std::lock_guard<std::mutex> lock(anchor.mutex);
    anchor.pinned = false;
  }
}

int64_t GetMockTime() {
  return g_mock_time.load(std::memory_order_relaxed);
}

}  // namespace util
}  // namespace chainsync
