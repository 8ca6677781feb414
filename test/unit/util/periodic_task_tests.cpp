// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Tests for PeriodicTask on a caller-driven io_context

#include <catch2/catch_test_macros.hpp>

#include "util/periodic_task.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>

#include <asio/io_context.hpp>

using namespace chainsync::util;
using namespace std::chrono_literals;

TEST_CASE("PeriodicTask: runs repeatedly until cancelled", "[periodic_task]") {
  asio::io_context io;
  int runs = 0;
  PeriodicTask task(io, "test", 10ms, [&runs]() { ++runs; });

  task.Start();
  io.run_for(100ms);
  CHECK(runs >= 2);
  CHECK(task.RunCount() == static_cast<uint64_t>(runs));

  task.Cancel();
  CHECK(task.IsCancelled());
  const int after_cancel = runs;
  io.restart();
  io.run_for(50ms);
  CHECK(runs == after_cancel);
}

TEST_CASE("PeriodicTask: Start is single-shot", "[periodic_task]") {
  asio::io_context io;
  int runs = 0;
  PeriodicTask task(io, "test", 1h, [&runs]() { ++runs; });

  task.Start();
  task.Start();
  io.run_for(50ms);
  CHECK(runs == 1);
}

TEST_CASE("PeriodicTask: initial delay", "[periodic_task]") {
  asio::io_context io;
  int runs = 0;
  PeriodicTask task(io, "test", 1h, [&runs]() { ++runs; });

  task.Start(1h);
  io.run_for(30ms);
  CHECK(runs == 0);
}

TEST_CASE("PeriodicTask: cancel from inside the callback", "[periodic_task]") {
  asio::io_context io;
  int runs = 0;
  std::unique_ptr<PeriodicTask> task;
  task = std::make_unique<PeriodicTask>(io, "test", 1ms, [&]() {
    if (++runs == 3) {
      task->Cancel();
    }
  });

  task->Start();
  io.run_for(100ms);
  CHECK(runs == 3);
  CHECK(task->IsCancelled());
}

TEST_CASE("PeriodicTask: cancelled before start never runs", "[periodic_task]") {
  asio::io_context io;
  int runs = 0;
  PeriodicTask task(io, "test", 1ms, [&runs]() { ++runs; });

  task.Cancel();
  task.Start();
  io.run_for(30ms);
  CHECK(runs == 0);
}

TEST_CASE("PeriodicTask: callback exceptions", "[periodic_task]") {
  asio::io_context io;

  SECTION("runtime errors are logged and the schedule continues") {
    int runs = 0;
    PeriodicTask task(io, "test", 1ms, [&runs]() {
      ++runs;
      throw std::runtime_error("collaborator failed");
    });
    task.Start();
    io.run_for(50ms);
    CHECK(runs >= 2);
    CHECK_FALSE(task.IsCancelled());
  }

  SECTION("logic errors cancel the task and propagate") {
    PeriodicTask task(io, "test", 1ms, []() { throw std::logic_error("broken invariant"); });
    task.Start();
    CHECK_THROWS_AS(io.run_for(50ms), std::logic_error);
    CHECK(task.IsCancelled());
    CHECK(task.RunCount() == 1);
  }
}

TEST_CASE("PeriodicTask: destroyed task leaves queued handlers harmless", "[periodic_task]") {
  asio::io_context io;
  int runs = 0;
  {
    PeriodicTask task(io, "test", 1ms, [&runs]() { ++runs; });
    task.Start();
  }
  io.run_for(20ms);
  CHECK(runs == 0);
}
