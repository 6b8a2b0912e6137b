// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Gossamer, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace gossamer
{
namespace core
{

/// \brief Shared state between a CancellationSource and its tokens.
class CancellationState
{
public:
  using Callback = std::function<void()>;

  bool isCancelled() const { return _cancelled.load(std::memory_order_acquire); }

  std::string reason() const
  {
    std::lock_guard<std::mutex> g(_mutex);
    return _reason;
  }

  /// \brief Fire all callbacks once. Returns false if already cancelled.
  bool cancel(const std::string &reason)
  {
    std::vector<Callback> toRun;
    {
      std::lock_guard<std::mutex> g(_mutex);
      if (_cancelled.load(std::memory_order_acquire))
      {
        return false;
      }
      _reason = reason;
      _cancelled.store(true, std::memory_order_release);
      for (auto &kv : _callbacks)
      {
        toRun.push_back(std::move(kv.second));
      }
      _callbacks.clear();
      _firing = true;
      _firingThread = std::this_thread::get_id();
    }
    for (auto &cb : toRun)
    {
      cb();
    }
    {
      std::lock_guard<std::mutex> g(_mutex);
      _firing = false;
    }
    _firedCv.notify_all();
    return true;
  }

  /// \brief Register \p cb; runs it inline when already cancelled.
  /// \return registration id (0 when the callback already ran)
  std::uint64_t add(Callback cb)
  {
    {
      std::lock_guard<std::mutex> g(_mutex);
      if (!_cancelled.load(std::memory_order_acquire))
      {
        auto id = ++_nextId;
        _callbacks.emplace(id, std::move(cb));
        return id;
      }
    }
    cb();
    return 0;
  }

  /// \brief Unregister a callback. If cancel() is currently running the
  /// callbacks on another thread, waits for it so the callback never
  /// outlives the waiter that registered it.
  void remove(std::uint64_t id)
  {
    if (id == 0)
    {
      return;
    }
    std::unique_lock<std::mutex> lk(_mutex);
    if (_callbacks.erase(id) > 0)
    {
      return;
    }
    if (_firing && _firingThread != std::this_thread::get_id())
    {
      _firedCv.wait(lk, [this] { return !_firing; });
    }
  }

private:
  mutable std::mutex _mutex;
  std::atomic<bool> _cancelled{false};
  std::string _reason;
  std::uint64_t _nextId{0};
  std::map<std::uint64_t, Callback> _callbacks;
  bool _firing{false};
  std::thread::id _firingThread;
  std::condition_variable _firedCv;
};

/// \brief RAII handle for a callback registered on a token. The callback
/// is unregistered when the handle goes out of scope.
class CancellationRegistration
{
public:
  CancellationRegistration() = default;
  CancellationRegistration(std::shared_ptr<CancellationState> state, std::uint64_t id)
      : _state(std::move(state)), _id(id)
  {
  }
  ~CancellationRegistration() { reset(); }

  CancellationRegistration(const CancellationRegistration &) = delete;
  CancellationRegistration &operator=(const CancellationRegistration &) = delete;

  CancellationRegistration(CancellationRegistration &&other) noexcept
      : _state(std::move(other._state)), _id(other._id)
  {
    other._id = 0;
  }

  CancellationRegistration &operator=(CancellationRegistration &&other) noexcept
  {
    if (this != &other)
    {
      reset();
      _state = std::move(other._state);
      _id = other._id;
      other._id = 0;
    }
    return *this;
  }

  void reset()
  {
    if (_state)
    {
      _state->remove(_id);
      _state.reset();
    }
    _id = 0;
  }

private:
  std::shared_ptr<CancellationState> _state;
  std::uint64_t _id{0};
};

/// \brief Observer side of a cancellation signal, threaded through every
/// blocking call. A default-constructed token is never cancelled.
class CancellationToken
{
public:
  CancellationToken() = default;
  explicit CancellationToken(std::shared_ptr<CancellationState> state) : _state(std::move(state))
  {
  }

  static CancellationToken none() { return CancellationToken(); }

  bool isCancelled() const { return _state && _state->isCancelled(); }

  std::string reason() const { return _state ? _state->reason() : std::string(); }

  /// \brief Invoke \p cb when the token is cancelled (immediately if it
  /// already is). Blocking primitives use this to wake their waiters.
  CancellationRegistration onCancel(std::function<void()> cb) const
  {
    if (!_state)
    {
      return CancellationRegistration();
    }
    auto id = _state->add(std::move(cb));
    return CancellationRegistration(_state, id);
  }

private:
  std::shared_ptr<CancellationState> _state;
};

/// \brief Owner side of a cancellation signal. Cancelling is one-shot and
/// broadcast to every token handed out.
class CancellationSource
{
public:
  CancellationSource() : _state(std::make_shared<CancellationState>()) {}

  CancellationToken token() const { return CancellationToken(_state); }

  bool cancel(const std::string &reason = "cancelled") { return _state->cancel(reason); }

  bool isCancelled() const { return _state->isCancelled(); }

private:
  std::shared_ptr<CancellationState> _state;
};

} // namespace core
} // namespace gossamer
