// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// Tests for WorkerGroup lifecycle tracking

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <gossamer/core/cancellation.hpp>
#include <gossamer/core/worker_group.hpp>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace gossamer::core;

TEST_CASE("WorkerGroup counts live workers", "[worker_group]")
{
  WorkerGroup group;
  CancellationSource stop;
  std::atomic<int> started{0};

  for (int i = 0; i < 3; ++i)
  {
    group.spawn("blocker",
                [&]
                {
                  ++started;
                  while (!stop.isCancelled())
                  {
                    std::this_thread::sleep_for(std::chrono::milliseconds(2));
                  }
                });
  }

  REQUIRE(gossamer::test::waitForCondition([&] { return started.load() == 3; }));
  REQUIRE(group.active() == 3);
  REQUIRE(group.spawned() == 3);
  REQUIRE_FALSE(group.waitFor(std::chrono::milliseconds(20)));

  stop.cancel();
  group.wait();
  REQUIRE(group.active() == 0);
  REQUIRE(group.spawned() == 3);
}

TEST_CASE("WorkerGroup survives a throwing worker", "[worker_group]")
{
  WorkerGroup group;
  std::atomic<bool> ranAfter{false};

  group.spawn("thrower", [] { throw std::runtime_error("boom"); });
  group.spawn("normal", [&] { ranAfter = true; });

  REQUIRE(group.waitFor(std::chrono::milliseconds(2000)));
  REQUIRE(ranAfter.load());
  REQUIRE(group.active() == 0);
}

TEST_CASE("WorkerGroup wait on an empty group returns immediately", "[worker_group]")
{
  WorkerGroup group;
  group.wait();
  REQUIRE(group.waitFor(std::chrono::milliseconds(0)));
  REQUIRE(group.spawned() == 0);
}

TEST_CASE("WorkerGroup workers may spawn more workers", "[worker_group]")
{
  WorkerGroup group;
  std::atomic<int> done{0};

  group.spawn("parent",
              [&]
              {
                group.spawn("child", [&] { ++done; });
                ++done;
              });

  REQUIRE(gossamer::test::waitForCondition([&] { return done.load() == 2; }));
  group.wait();
  REQUIRE(group.spawned() == 2);
}
