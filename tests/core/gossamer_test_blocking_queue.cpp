// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// Tests for the bounded BlockingQueue used for packet and stream delivery

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <gossamer/core/blocking_queue.hpp>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace gossamer::core;

// ══════════════════════════════════════════════════════════════════════════
// Basic operations
// ══════════════════════════════════════════════════════════════════════════

TEST_CASE("BlockingQueue basic queue and dequeue", "[blocking_queue][basic]")
{
  BlockingQueue<int> queue(10);

  REQUIRE(queue.empty());
  REQUIRE(queue.capacity() == 10);

  REQUIRE(queue.queue(1));
  REQUIRE(queue.queue(2));
  REQUIRE(queue.queue(3));
  REQUIRE(queue.size() == 3);

  int value = 0;
  REQUIRE(queue.dequeue(value));
  REQUIRE(value == 1);
  REQUIRE(queue.dequeue(value));
  REQUIRE(value == 2);
  REQUIRE(queue.dequeue(value));
  REQUIRE(value == 3);
  REQUIRE(queue.empty());
}

TEST_CASE("BlockingQueue rejects zero capacity", "[blocking_queue][basic]")
{
  REQUIRE_THROWS_AS(BlockingQueue<int>(0), std::invalid_argument);
}

TEST_CASE("BlockingQueue tryQueue fails when full", "[blocking_queue][capacity]")
{
  BlockingQueue<int> queue(2);

  REQUIRE(queue.tryQueue(1));
  REQUIRE(queue.tryQueue(2));
  REQUIRE_FALSE(queue.tryQueue(3));
  REQUIRE(queue.size() == 2);

  int value = 0;
  REQUIRE(queue.tryDequeue(value));
  REQUIRE(queue.tryQueue(3));
}

TEST_CASE("BlockingQueue dequeue with timeout", "[blocking_queue][timeout]")
{
  BlockingQueue<int> queue(4);
  int value = 0;

  auto start = std::chrono::steady_clock::now();
  REQUIRE_FALSE(queue.dequeue(value, std::chrono::milliseconds(50)));
  REQUIRE(std::chrono::steady_clock::now() - start >= std::chrono::milliseconds(45));

  std::thread producer(
    [&queue]
    {
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
      queue.queue(42);
    });
  REQUIRE(queue.dequeue(value, std::chrono::milliseconds(1000)));
  REQUIRE(value == 42);
  producer.join();
}

// ══════════════════════════════════════════════════════════════════════════
// Close semantics
// ══════════════════════════════════════════════════════════════════════════

TEST_CASE("BlockingQueue close wakes a blocked consumer", "[blocking_queue][close]")
{
  BlockingQueue<int> queue(4);
  std::atomic<bool> returned{false};
  bool result = true;

  std::thread consumer(
    [&]
    {
      int value = 0;
      result = queue.dequeue(value);
      returned = true;
    });

  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  REQUIRE_FALSE(returned.load());
  queue.close();
  consumer.join();

  REQUIRE(returned.load());
  REQUIRE_FALSE(result);
  REQUIRE(queue.isClosed());
}

TEST_CASE("BlockingQueue drains remaining items after close", "[blocking_queue][close]")
{
  BlockingQueue<int> queue(4);
  queue.queue(7);
  queue.queue(8);
  queue.close();

  REQUIRE_FALSE(queue.queue(9));
  REQUIRE_FALSE(queue.tryQueue(9));

  int value = 0;
  REQUIRE(queue.dequeue(value));
  REQUIRE(value == 7);
  REQUIRE(queue.tryDequeue(value));
  REQUIRE(value == 8);
  REQUIRE_FALSE(queue.dequeue(value));
}

TEST_CASE("BlockingQueue close wakes a blocked producer", "[blocking_queue][close]")
{
  BlockingQueue<int> queue(1);
  queue.queue(1);
  bool result = true;

  std::thread producer([&] { result = queue.queue(2); });
  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  queue.close();
  producer.join();

  REQUIRE_FALSE(result);
}

// ══════════════════════════════════════════════════════════════════════════
// Cancellation
// ══════════════════════════════════════════════════════════════════════════

TEST_CASE("BlockingQueue dequeue returns when the token fires", "[blocking_queue][cancel]")
{
  BlockingQueue<int> queue(4);
  CancellationSource source;
  bool result = true;

  std::thread consumer(
    [&]
    {
      int value = 0;
      result = queue.dequeue(value, source.token());
    });

  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  source.cancel("stop");
  consumer.join();

  REQUIRE_FALSE(result);
  REQUIRE_FALSE(queue.isClosed());
}

TEST_CASE("BlockingQueue queue gives up on a full queue when cancelled", "[blocking_queue][cancel]")
{
  BlockingQueue<int> queue(1);
  queue.queue(1);
  CancellationSource source;
  bool result = true;

  std::thread producer([&] { result = queue.queue(2, source.token()); });
  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  source.cancel();
  producer.join();

  REQUIRE_FALSE(result);
  REQUIRE(queue.size() == 1);
}

TEST_CASE("BlockingQueue with an already cancelled token does not block", "[blocking_queue][cancel]")
{
  BlockingQueue<int> queue(4);
  CancellationSource source;
  source.cancel();

  int value = 0;
  REQUIRE_FALSE(queue.dequeue(value, source.token()));
  REQUIRE_FALSE(queue.queue(5, source.token()));
  REQUIRE(queue.empty());
}

// ══════════════════════════════════════════════════════════════════════════
// Concurrency
// ══════════════════════════════════════════════════════════════════════════

TEST_CASE("BlockingQueue multiple producers and consumers", "[blocking_queue][concurrency]")
{
  BlockingQueue<int> queue(16);
  constexpr int kProducers = 4;
  constexpr int kPerProducer = 500;
  std::atomic<int> consumed{0};
  std::atomic<long> sum{0};

  std::vector<std::thread> consumers;
  for (int i = 0; i < 3; ++i)
  {
    consumers.emplace_back(
      [&]
      {
        int value = 0;
        while (queue.dequeue(value))
        {
          sum += value;
          ++consumed;
        }
      });
  }

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p)
  {
    producers.emplace_back(
      [&queue]
      {
        for (int i = 1; i <= kPerProducer; ++i)
        {
          queue.queue(int(i));
        }
      });
  }
  for (auto &t : producers)
  {
    t.join();
  }

  REQUIRE(gossamer::test::waitForCondition([&] { return consumed.load() == kProducers * kPerProducer; },
                                           std::chrono::milliseconds(5000)));
  queue.close();
  for (auto &t : consumers)
  {
    t.join();
  }

  REQUIRE(sum.load() == long(kProducers) * kPerProducer * (kPerProducer + 1) / 2);
}

TEST_CASE("QueueReader exposes the consumer side only", "[blocking_queue][reader]")
{
  BlockingQueue<std::string> queue(3);
  QueueReader<std::string> reader(queue);

  queue.queue("a");
  REQUIRE(reader.size() == 1);
  REQUIRE(reader.capacity() == 3);

  std::string s;
  REQUIRE(reader.tryDequeue(s));
  REQUIRE(s == "a");
  REQUIRE_FALSE(reader.dequeue(s, std::chrono::milliseconds(10)));

  queue.close();
  REQUIRE(reader.isClosed());
  REQUIRE_FALSE(reader.dequeue(s));
}
