// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Gossamer, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <stdexcept>

#include "gossamer/core/cancellation.hpp"

namespace gossamer
{
namespace core
{

/// \brief Thread-safe blocking queue with bounded capacity
///
/// Multiple producers and consumers; producers block while the queue is full
/// and consumers block while it is empty. Every blocking call has a variant
/// that also returns when a CancellationToken fires, so a producer parked on
/// a full queue never holds up shutdown.
///
/// After close() no new items are accepted; items already queued can still
/// be dequeued until the queue is empty.
///
/// \code
///   BlockingQueue<Packet> packets(256);
///
///   // Producer racing the shutdown signal
///   if (!packets.queue(std::move(pkt), shutdownToken)) {
///     return; // closed or shutting down
///   }
///
///   // Consumer
///   Packet pkt;
///   while (packets.dequeue(pkt)) { ... }
/// \endcode
template <typename T> class BlockingQueue
{
public:
  /// \throws std::invalid_argument if maxSize is 0
  explicit BlockingQueue(std::size_t maxSize = 1024) : _maxSize(maxSize), _closed(false)
  {
    if (maxSize == 0)
    {
      throw std::invalid_argument("BlockingQueue maxSize must be greater than 0");
    }
  }

  ~BlockingQueue() { close(); }

  BlockingQueue(const BlockingQueue &) = delete;
  BlockingQueue &operator=(const BlockingQueue &) = delete;
  BlockingQueue(BlockingQueue &&) = delete;
  BlockingQueue &operator=(BlockingQueue &&) = delete;

  /// \brief Add an item, blocking while the queue is full.
  /// \return true if queued, false if the queue is closed
  bool queue(T &&item) { return queue(std::move(item), CancellationToken::none()); }

  /// \brief Add an item, blocking while the queue is full or until \p token
  /// is cancelled.
  /// \return true if queued, false if the queue is closed or \p token fired
  bool queue(T &&item, const CancellationToken &token)
  {
    auto reg = token.onCancel(
      [this]()
      {
        std::lock_guard<std::mutex> g(_mutex);
        _condNotFull.notify_all();
      });

    std::unique_lock<std::mutex> lock(_mutex);
    _condNotFull.wait(lock,
                      [&]()
                      {
                        return _queue.size() < _maxSize ||
                               _closed.load(std::memory_order_acquire) || token.isCancelled();
                      });

    if (_closed.load(std::memory_order_acquire) || token.isCancelled())
    {
      return false;
    }

    _queue.push_back(std::move(item));
    lock.unlock();
    _condNotEmpty.notify_one();
    return true;
  }

  /// \brief Add an item without blocking.
  /// \return true if queued, false if full or closed
  bool tryQueue(T &&item)
  {
    std::unique_lock<std::mutex> lock(_mutex);

    if (_closed.load(std::memory_order_acquire) || _queue.size() >= _maxSize)
    {
      return false;
    }

    _queue.push_back(std::move(item));
    lock.unlock();
    _condNotEmpty.notify_one();
    return true;
  }

  /// \brief Remove an item, blocking while the queue is empty.
  /// \return true if an item was dequeued, false if closed and empty
  bool dequeue(T &out) { return dequeue(out, CancellationToken::none()); }

  /// \brief Remove an item, blocking while the queue is empty or until
  /// \p token is cancelled.
  bool dequeue(T &out, const CancellationToken &token)
  {
    auto reg = token.onCancel(
      [this]()
      {
        std::lock_guard<std::mutex> g(_mutex);
        _condNotEmpty.notify_all();
      });

    std::unique_lock<std::mutex> lock(_mutex);
    _condNotEmpty.wait(lock,
                       [&]()
                       {
                         return !_queue.empty() || _closed.load(std::memory_order_acquire) ||
                                token.isCancelled();
                       });

    if (_queue.empty() || token.isCancelled())
    {
      return false;
    }

    out = std::move(_queue.front());
    _queue.pop_front();
    lock.unlock();
    _condNotFull.notify_one();
    return true;
  }

  /// \brief Remove an item, waiting at most \p timeout.
  /// \return true if an item was dequeued, false on timeout or closed and empty
  bool dequeue(T &out, std::chrono::milliseconds timeout)
  {
    std::unique_lock<std::mutex> lock(_mutex);

    bool success = _condNotEmpty.wait_for(
      lock, timeout,
      [this]() { return !_queue.empty() || _closed.load(std::memory_order_acquire); });

    if (!success || _queue.empty())
    {
      return false;
    }

    out = std::move(_queue.front());
    _queue.pop_front();
    lock.unlock();
    _condNotFull.notify_one();
    return true;
  }

  /// \brief Remove an item without blocking.
  bool tryDequeue(T &out)
  {
    std::unique_lock<std::mutex> lock(_mutex);

    if (_queue.empty())
    {
      return false;
    }

    out = std::move(_queue.front());
    _queue.pop_front();
    lock.unlock();
    _condNotFull.notify_one();
    return true;
  }

  /// \brief Close the queue and wake all waiting threads.
  void close()
  {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (_closed.exchange(true, std::memory_order_acq_rel))
      {
        return;
      }
    }

    _condNotEmpty.notify_all();
    _condNotFull.notify_all();
  }

  bool isClosed() const { return _closed.load(std::memory_order_acquire); }

  std::size_t size() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _queue.size();
  }

  bool empty() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _queue.empty();
  }

  std::size_t capacity() const { return _maxSize; }

private:
  mutable std::mutex _mutex;
  std::condition_variable _condNotEmpty;
  std::condition_variable _condNotFull;
  std::deque<T> _queue;
  const std::size_t _maxSize;
  std::atomic<bool> _closed;
};

/// \brief Consumer-only view of a BlockingQueue. Handed out by components
/// that own the producing side so callers can drain but never inject.
template <typename T> class QueueReader
{
public:
  explicit QueueReader(BlockingQueue<T> &q) : _q(q) {}

  bool dequeue(T &out) { return _q.dequeue(out); }
  bool dequeue(T &out, const CancellationToken &token) { return _q.dequeue(out, token); }
  bool dequeue(T &out, std::chrono::milliseconds timeout) { return _q.dequeue(out, timeout); }
  bool tryDequeue(T &out) { return _q.tryDequeue(out); }

  bool isClosed() const { return _q.isClosed(); }
  std::size_t size() const { return _q.size(); }
  std::size_t capacity() const { return _q.capacity(); }

private:
  BlockingQueue<T> &_q;
};

} // namespace core
} // namespace gossamer
