// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/periodic_task.hpp"

#include "util/logging.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

namespace chainsync {
namespace util {

PeriodicTask::PeriodicTask(asio::io_context& io_context, std::string name, std::chrono::milliseconds interval,
                           Callback callback)
    : timer_(io_context),
      name_(std::move(name)),
      interval_(interval),
      callback_(std::move(callback)),
      token_(std::make_shared<std::atomic<bool>>(false)) {}

PeriodicTask::~PeriodicTask() {
  Cancel();
}

void PeriodicTask::Start(std::chrono::milliseconds initial_delay) {
  if (IsCancelled() || started_.exchange(true)) {
    return;
  }
  LOG_TRACE("periodic task '{}' started (interval {}ms)", name_, interval_.count());
  ScheduleNext(initial_delay);
}

void PeriodicTask::Cancel() {
  if (token_->exchange(true, std::memory_order_acq_rel)) {
    return;
  }
  timer_.cancel();
  LOG_TRACE("periodic task '{}' cancelled after {} runs", name_, RunCount());
}

void PeriodicTask::ScheduleNext(std::chrono::milliseconds delay) {
  if (IsCancelled()) {
    return;
  }
  timer_.expires_after(delay);
  timer_.async_wait([this, token = token_](const asio::error_code& ec) {
    if (ec || token->load(std::memory_order_acquire)) {
      return;
    }
    RunOnce();
    ScheduleNext(interval_);
  });
}

void PeriodicTask::RunOnce() {
  run_count_.fetch_add(1, std::memory_order_relaxed);
  try {
    callback_();
  } catch (const std::logic_error& e) {
    // Broken invariant: stop this task and let it surface
    LOG_ERROR("periodic task '{}' hit a logic error: {}", name_, e.what());
    Cancel();
    throw;
  } catch (const std::exception& e) {
    LOG_ERROR("periodic task '{}' threw: {}", name_, e.what());
  }
}

}  // namespace util
}  // namespace chainsync
