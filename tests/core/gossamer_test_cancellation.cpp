// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// Tests for CancellationSource / CancellationToken

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <gossamer/core/cancellation.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

using namespace gossamer::core;

TEST_CASE("Default token is never cancelled", "[cancellation]")
{
  CancellationToken token = CancellationToken::none();
  REQUIRE_FALSE(token.isCancelled());
  REQUIRE(token.reason().empty());

  bool ran = false;
  auto reg = token.onCancel([&] { ran = true; });
  REQUIRE_FALSE(ran);
}

TEST_CASE("Cancel is one-shot and keeps the first reason", "[cancellation]")
{
  CancellationSource source;
  auto token = source.token();

  REQUIRE_FALSE(token.isCancelled());
  REQUIRE(source.cancel("transport shutdown"));
  REQUIRE_FALSE(source.cancel("second"));

  REQUIRE(token.isCancelled());
  REQUIRE(source.isCancelled());
  REQUIRE(token.reason() == "transport shutdown");
}

TEST_CASE("Callbacks fire once on cancel", "[cancellation][callback]")
{
  CancellationSource source;
  std::atomic<int> calls{0};

  auto r1 = source.token().onCancel([&] { ++calls; });
  auto r2 = source.token().onCancel([&] { ++calls; });

  source.cancel();
  source.cancel();
  REQUIRE(calls.load() == 2);
}

TEST_CASE("Callback registered after cancel runs inline", "[cancellation][callback]")
{
  CancellationSource source;
  source.cancel();

  bool ran = false;
  auto reg = source.token().onCancel([&] { ran = true; });
  REQUIRE(ran);
}

TEST_CASE("Dropped registration does not fire", "[cancellation][callback]")
{
  CancellationSource source;
  bool ran = false;
  {
    auto reg = source.token().onCancel([&] { ran = true; });
  }
  source.cancel();
  REQUIRE_FALSE(ran);
}

TEST_CASE("Registration can be moved and reset", "[cancellation][callback]")
{
  CancellationSource source;
  int calls = 0;

  CancellationRegistration outer;
  {
    auto reg = source.token().onCancel([&] { ++calls; });
    outer = std::move(reg);
  }
  outer.reset();
  source.cancel();
  REQUIRE(calls == 0);
}

TEST_CASE("Cancel wakes a waiter on another thread", "[cancellation][threads]")
{
  CancellationSource source;
  auto token = source.token();
  std::mutex m;
  std::condition_variable cv;
  bool woke = false;

  std::thread waiter(
    [&]
    {
      auto reg = token.onCancel(
        [&]
        {
          std::lock_guard<std::mutex> g(m);
          cv.notify_all();
        });
      std::unique_lock<std::mutex> lk(m);
      cv.wait(lk, [&] { return token.isCancelled(); });
      woke = true;
    });

  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  source.cancel("wake");
  waiter.join();
  REQUIRE(woke);
}
