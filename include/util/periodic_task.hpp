// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>

namespace chainsync {
namespace util {

/*
 PeriodicTask — fixed-delay repeating callback on an asio io_context

 - The next run is scheduled `interval` after the previous run returns, so
   runs of one task never overlap even on a multi-threaded io_context.
 - Cancel() is safe from inside the callback. Once it returns, no new run
   starts; a run already in progress finishes.
 - std::runtime_error-style exceptions from the callback are logged and the
   schedule continues. std::logic_error cancels the task and propagates out
   of io_context::run().
 - Handlers hold a shared cancellation token, never `this`-only state, so a
   destroyed task whose timer handler is still queued is a no-op.
*/
class PeriodicTask {
public:
  using Callback = std::function<void()>;

  PeriodicTask(asio::io_context& io_context, std::string name, std::chrono::milliseconds interval,
               Callback callback);
  ~PeriodicTask();

  PeriodicTask(const PeriodicTask&) = delete;
  PeriodicTask& operator=(const PeriodicTask&) = delete;

  // First run after initial_delay (zero = as soon as the io_context runs)
  void Start(std::chrono::milliseconds initial_delay = std::chrono::milliseconds{0});

  void Cancel();

  bool IsCancelled() const { return token_->load(std::memory_order_acquire); }
  uint64_t RunCount() const { return run_count_.load(std::memory_order_relaxed); }
  const std::string& name() const { return name_; }

private:
  void ScheduleNext(std::chrono::milliseconds delay);
  void RunOnce();

  asio::steady_timer timer_;
  std::string name_;
  std::chrono::milliseconds interval_;
  Callback callback_;

  // true = cancelled
  std::shared_ptr<std::atomic<bool>> token_;
  std::atomic<bool> started_{false};
  std::atomic<uint64_t> run_count_{0};
};

}  // namespace util
}  // namespace chainsync
