// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Gossamer, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

#include "gossamer/core/logger.hpp"

namespace gossamer
{
namespace core
{

/// \brief Supervised group of long-lived worker threads.
///
/// Each spawn() runs one function on its own thread and counts it as live
/// until the function returns. wait() blocks until the count drops to zero,
/// which makes "no worker outlives shutdown" an observable property. Threads
/// are detached; the group only tracks completion, so finished workers never
/// accumulate.
class WorkerGroup
{
public:
  WorkerGroup() = default;
  ~WorkerGroup() { wait(); }

  WorkerGroup(const WorkerGroup &) = delete;
  WorkerGroup &operator=(const WorkerGroup &) = delete;

  /// \brief Start \p fn on a new thread. Exceptions escaping \p fn are logged
  /// and end the worker.
  /// \throws std::system_error if the thread cannot be created
  void spawn(const std::string &name, std::function<void()> fn)
  {
    {
      std::lock_guard<std::mutex> g(_mutex);
      ++_active;
      ++_spawned;
    }
    try
    {
      std::thread(
        [this, name, fn = std::move(fn)]() mutable
        {
          try
          {
            fn();
          }
          catch (const std::exception &ex)
          {
            GOSSAMER_LOG_ERROR("worker '" << name << "' terminated by exception: " << ex.what());
          }
          fn = nullptr;
          std::lock_guard<std::mutex> g(_mutex);
          --_active;
          _cv.notify_all();
        })
        .detach();
    }
    catch (...)
    {
      std::lock_guard<std::mutex> g(_mutex);
      --_active;
      --_spawned;
      _cv.notify_all();
      throw;
    }
  }

  /// \brief Block until every spawned worker has returned.
  void wait()
  {
    std::unique_lock<std::mutex> lk(_mutex);
    _cv.wait(lk, [this] { return _active == 0; });
  }

  /// \brief Wait at most \p timeout. Returns true if the group drained.
  bool waitFor(std::chrono::milliseconds timeout)
  {
    std::unique_lock<std::mutex> lk(_mutex);
    return _cv.wait_for(lk, timeout, [this] { return _active == 0; });
  }

  std::size_t active() const
  {
    std::lock_guard<std::mutex> g(_mutex);
    return _active;
  }

  /// \brief Total number of workers ever started.
  std::size_t spawned() const
  {
    std::lock_guard<std::mutex> g(_mutex);
    return _spawned;
  }

private:
  mutable std::mutex _mutex;
  std::condition_variable _cv;
  std::size_t _active{0};
  std::size_t _spawned{0};
};

} // namespace core
} // namespace gossamer
