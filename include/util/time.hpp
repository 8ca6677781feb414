// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>

namespace chainsync {
namespace util {

// Monotonic clock. With mock time active, advances by the mock time delta
// from the moment mock time was first observed.
std::chrono::steady_clock::time_point GetSteadyTime();

// Set mock time (0 disables mock time)
void SetMockTime(int64_t time);

int64_t GetMockTime();

// RAII mock time: sets on construction, restores the previous value on destruction
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t time) : previous_(GetMockTime()) { SetMockTime(time); }
  ~MockTimeScope() { SetMockTime(previous_); }

  MockTimeScope(const MockTimeScope&) = delete;
  MockTimeScope& operator=(const MockTimeScope&) = delete;

private:
  int64_t previous_;
};

}  // namespace util
}  // namespace chainsync
