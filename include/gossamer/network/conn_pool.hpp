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
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include "gossamer/core/cancellation.hpp"
#include "gossamer/core/logger.hpp"
#include "gossamer/network/ip_utils.hpp"
#include "gossamer/network/mux_session.hpp"
#include "gossamer/network/session.hpp"
#include "gossamer/network/tls_config.hpp"
#include "gossamer/network/transport_types.hpp"

namespace gossamer
{
namespace network
{

/// \brief At most one live session per peer address.
///
/// Concurrent callers asking for the same address serialize on that
/// address's dial lock, so exactly one physical dial happens however many
/// callers race. Unrelated addresses never contend: the map lock is only
/// held to look up, insert or erase an entry.
///
/// Lock order: entry state lock, then map lock. The map lock is never held
/// while taking an entry lock. The duplicate list lock is taken last.
///
/// A session that loses its address to a live pooled one (an inbound
/// session racing our dial, or the reverse) stays open, since the peer may
/// be using it as its own pooled session. The pool still ages it out and
/// closes it at shutdown.
///
/// \code
///   ConnPool pool(transport, tls, {}, [&](const SessionPtr &s) { startLoops(s); });
///   SessionPtr s = pool.getOrDial(token, "10.0.0.2:7946");
/// \endcode
class ConnPool
{
public:
  using NewConnHook = std::function<void(const SessionPtr &)>;
  using RangeFn = std::function<bool(const std::string &address, const SessionPtr &session)>;

  struct Config
  {
    std::chrono::milliseconds maxConnectionAge{0}; ///< 0 = unbounded
    std::chrono::milliseconds sweepInterval{30000}; ///< 0 disables the sweep thread
  };

  /// \param onNewConn called for every successfully dialed outbound
  /// session; inbound sessions get their loops from the accept path
  ConnPool(ISocketTransport &transport, TlsConfig tls, Config cfg, NewConnHook onNewConn = {})
      : _transport(transport), _tls(std::move(tls)), _cfg(cfg), _onNewConn(std::move(onNewConn))
  {
    if (_cfg.sweepInterval.count() > 0)
    {
      _sweepThread = std::thread([this] { sweepLoop(); });
    }
  }

  ~ConnPool() { shutdown(); }

  ConnPool(const ConnPool &) = delete;
  ConnPool &operator=(const ConnPool &) = delete;

  /// \brief Live session for \p address, or nullptr. Never dials and never
  /// waits for a dial in progress. A dead entry found here is evicted.
  SessionPtr getConnection(const std::string &address)
  {
    auto e = find(address);
    if (!e)
    {
      return nullptr;
    }
    {
      std::lock_guard<std::mutex> g(e->mutex);
      if (auto s = aliveLocked(*e))
      {
        return s;
      }
    }
    evictIfDead(address, e);
    return nullptr;
  }

  /// \brief Live session for \p address, dialing one if needed.
  /// \throws TransportException (Resolve, Connect, TLSHandshake, Timeout,
  /// Cancelled, Shutdown, ...) from resolution or the dial
  SessionPtr getOrDial(const core::CancellationToken &token, const std::string &address)
  {
    throwIfClosed();
    if (auto s = getConnection(address))
    {
      return s;
    }

    // Resolution failures surface before any entry lock is taken.
    const std::string resolved = resolveAddress(address);
    const auto hostPort = splitHostPort(resolved);

    for (;;)
    {
      throwIfClosed();
      auto e = obtain(address);
      std::lock_guard<std::mutex> dialLock(e->dialMutex);
      {
        std::lock_guard<std::mutex> g(e->mutex);
        if (e->retired)
        {
          continue;
        }
        if (auto s = aliveLocked(*e))
        {
          return s;
        }
        e->dialing = true;
      }

      SessionPtr s;
      try
      {
        s = dialLinked(token, hostPort.first, hostPort.second);
      }
      catch (const TransportException &ex)
      {
        GOSSAMER_LOG_DEBUG("ConnPool: dial " << address << " failed: " << ex.what());
        std::lock_guard<std::mutex> g(e->mutex);
        e->dialing = false;
        if (ex.code() == TransportError::Cancelled && _closed.load())
        {
          throw TransportException(TransportError::Shutdown, "transport shutdown");
        }
        throw;
      }

      SessionPtr pooled;
      {
        std::lock_guard<std::mutex> g(e->mutex);
        e->dialing = false;
        if (e->retired)
        {
          s->closeWithError(kCloseShutdown, "transport shutdown");
          if (_closed.load())
          {
            throw TransportException(TransportError::Shutdown, "transport shutdown");
          }
          throw TransportException(TransportError::SessionClosed,
                                   "connection to " + address + " closed during dial");
        }
        pooled = aliveLocked(*e);
        if (!pooled)
        {
          e->conn = s;
          e->createdAt = MonoClock::now();
        }
      }

      if (_onNewConn)
      {
        _onNewConn(s);
      }
      if (pooled)
      {
        // An inbound session from the same peer was registered while we
        // dialed. It keeps the slot; ours stays open for the peer.
        GOSSAMER_LOG_DEBUG("ConnPool: " << address << " already pooled, dialed session "
                                        << s->id() << " kept as a duplicate");
        keepDuplicate(s);
        return pooled;
      }
      GOSSAMER_LOG_DEBUG("ConnPool: dialed " << address << " (session " << s->id() << ")");
      return s;
    }
  }

  /// \brief Remove and close the session for \p address. No-op if absent.
  void closeConnection(const std::string &address)
  {
    std::shared_ptr<Entry> e;
    {
      std::unique_lock<std::shared_mutex> lk(_mapMutex);
      auto it = _entries.find(address);
      if (it == _entries.end())
      {
        return;
      }
      e = it->second;
      _entries.erase(it);
    }
    SessionPtr s;
    {
      std::lock_guard<std::mutex> g(e->mutex);
      e->retired = true;
      s = std::move(e->conn);
    }
    if (s)
    {
      s->closeWithError(kCloseNoError, "connection closed");
    }
  }

  /// \brief Register a session accepted by the listener, keyed by its
  /// remote address. A live pooled session for that address is kept and
  /// \p session is held open as a duplicate: never returned by lookups,
  /// but still subject to the age limit and closed by shutdown().
  void addInbound(const SessionPtr &session)
  {
    if (_closed.load())
    {
      return;
    }
    const std::string address = session->remoteAddress();
    for (;;)
    {
      std::shared_ptr<Entry> e;
      {
        std::unique_lock<std::shared_mutex> lk(_mapMutex);
        if (_closed.load())
        {
          return;
        }
        auto it = _entries.find(address);
        if (it == _entries.end())
        {
          auto fresh = std::make_shared<Entry>();
          fresh->conn = session;
          fresh->createdAt = MonoClock::now();
          _entries.emplace(address, std::move(fresh));
          return;
        }
        e = it->second;
      }
      std::lock_guard<std::mutex> g(e->mutex);
      if (e->retired)
      {
        continue;
      }
      if (aliveLocked(*e))
      {
        GOSSAMER_LOG_DEBUG("ConnPool: inbound session " << session->id() << " from " << address
                                                        << " raced a pooled session, kept as duplicate");
        keepDuplicate(session);
        return;
      }
      e->conn = session;
      e->createdAt = MonoClock::now();
      return;
    }
  }

  /// \brief Visit every live session; \p fn returns false to stop.
  void range(const RangeFn &fn)
  {
    for (auto &kv : snapshot())
    {
      SessionPtr s;
      {
        std::lock_guard<std::mutex> g(kv.second->mutex);
        s = aliveLocked(*kv.second);
      }
      if (s && !fn(kv.first, s))
      {
        return;
      }
    }
  }

  /// \brief Number of live sessions.
  std::size_t len()
  {
    std::size_t n = 0;
    for (auto &kv : snapshot())
    {
      std::lock_guard<std::mutex> g(kv.second->mutex);
      if (aliveLocked(*kv.second))
      {
        ++n;
      }
    }
    return n;
  }

  /// \brief One sweep pass: drop dead entries and close sessions older than
  /// the configured maximum age. Runs on the sweep thread.
  void sweep()
  {
    const auto now = MonoClock::now();
    std::vector<SessionPtr> aged;
    for (auto &kv : snapshot())
    {
      auto &e = kv.second;
      {
        std::lock_guard<std::mutex> g(e->mutex);
        if (e->dialing || e->retired)
        {
          continue;
        }
        if (aliveLocked(*e))
        {
          if (_cfg.maxConnectionAge.count() <= 0 || now - e->createdAt <= _cfg.maxConnectionAge)
          {
            continue;
          }
          aged.push_back(e->conn);
          GOSSAMER_LOG_DEBUG("ConnPool: " << kv.first << " exceeded max connection age");
        }
        else
        {
          GOSSAMER_LOG_DEBUG("ConnPool: sweeping dead connection to " << kv.first);
        }
        e->retired = true;
        e->conn.reset();
        eraseIfMapped(kv.first, e);
      }
    }
    {
      std::lock_guard<std::mutex> g(_dupMutex);
      auto it = _duplicates.begin();
      while (it != _duplicates.end())
      {
        bool dead = !it->conn->alive();
        bool old = _cfg.maxConnectionAge.count() > 0 && now - it->createdAt > _cfg.maxConnectionAge;
        if (!dead && !old)
        {
          ++it;
          continue;
        }
        if (!dead)
        {
          GOSSAMER_LOG_DEBUG("ConnPool: duplicate session " << it->conn->id()
                                                            << " exceeded max connection age");
          aged.push_back(it->conn);
        }
        it = _duplicates.erase(it);
      }
    }
    for (auto &s : aged)
    {
      s->closeWithError(kCloseMaxAge, "max connection age exceeded");
    }
  }

  /// \brief Sessions held open beside a pooled one for the same address.
  std::size_t duplicateCount() const
  {
    std::lock_guard<std::mutex> g(_dupMutex);
    return _duplicates.size();
  }

  /// \brief Stop the sweep thread, close every session and clear the map.
  /// Dials in flight are cancelled and fail with Shutdown.
  void shutdown()
  {
    if (_closed.exchange(true))
    {
      return;
    }
    _shutdown.cancel("transport shutdown");
    {
      std::lock_guard<std::mutex> g(_sweepMutex);
      _sweepCv.notify_all();
    }
    if (_sweepThread.joinable())
    {
      _sweepThread.join();
    }

    std::unordered_map<std::string, std::shared_ptr<Entry>> entries;
    {
      std::unique_lock<std::shared_mutex> lk(_mapMutex);
      entries.swap(_entries);
    }
    for (auto &kv : entries)
    {
      SessionPtr s;
      {
        std::lock_guard<std::mutex> g(kv.second->mutex);
        kv.second->retired = true;
        s = std::move(kv.second->conn);
      }
      if (s)
      {
        s->closeWithError(kCloseShutdown, "transport shutdown");
      }
    }

    std::vector<Duplicate> duplicates;
    {
      std::lock_guard<std::mutex> g(_dupMutex);
      duplicates.swap(_duplicates);
    }
    for (auto &d : duplicates)
    {
      d.conn->closeWithError(kCloseShutdown, "transport shutdown");
    }
  }

  bool isShutdown() const { return _closed.load(); }

  /// \brief Addresses held in the map, live or not, dials in flight included.
  std::size_t entryCount() const
  {
    std::shared_lock<std::shared_mutex> lk(_mapMutex);
    return _entries.size();
  }

private:
  struct Entry
  {
    std::mutex dialMutex; ///< dedup boundary, held across the dial
    std::mutex mutex;     ///< guards the fields below, never held across I/O
    SessionPtr conn;
    MonoTime createdAt{};
    bool dialing{false};
    bool retired{false}; ///< removed from the map; callers must start over
  };

  /// A session that lost the slot for its address to a live one.
  struct Duplicate
  {
    SessionPtr conn;
    MonoTime createdAt;
  };

  /// Leaf lock: nothing else is taken while _dupMutex is held. After
  /// shutdown() drained the list, late duplicates are left to the socket
  /// layer like any other late inbound session.
  void keepDuplicate(const SessionPtr &s)
  {
    std::lock_guard<std::mutex> g(_dupMutex);
    if (_closed.load())
    {
      return;
    }
    _duplicates.push_back(Duplicate{s, MonoClock::now()});
  }

  static SessionPtr aliveLocked(const Entry &e)
  {
    return e.conn && e.conn->alive() ? e.conn : nullptr;
  }

  void throwIfClosed() const
  {
    if (_closed.load())
    {
      throw TransportException(TransportError::Shutdown, "transport shutdown");
    }
  }

  std::shared_ptr<Entry> find(const std::string &address)
  {
    std::shared_lock<std::shared_mutex> lk(_mapMutex);
    auto it = _entries.find(address);
    return it == _entries.end() ? nullptr : it->second;
  }

  /// \throws TransportException(Shutdown) once shutdown() has begun, so no
  /// entry is added after the map was drained.
  std::shared_ptr<Entry> obtain(const std::string &address)
  {
    std::unique_lock<std::shared_mutex> lk(_mapMutex);
    throwIfClosed();
    auto &slot = _entries[address];
    if (!slot)
    {
      slot = std::make_shared<Entry>();
    }
    return slot;
  }

  using Snapshot = std::vector<std::pair<std::string, std::shared_ptr<Entry>>>;

  Snapshot snapshot()
  {
    std::shared_lock<std::shared_mutex> lk(_mapMutex);
    return Snapshot(_entries.begin(), _entries.end());
  }

  /// Caller holds e->mutex.
  void eraseIfMapped(const std::string &address, const std::shared_ptr<Entry> &e)
  {
    std::unique_lock<std::shared_mutex> lk(_mapMutex);
    auto it = _entries.find(address);
    if (it != _entries.end() && it->second == e)
    {
      _entries.erase(it);
    }
  }

  void evictIfDead(const std::string &address, const std::shared_ptr<Entry> &e)
  {
    std::lock_guard<std::mutex> g(e->mutex);
    if (e->dialing || e->retired || aliveLocked(*e))
    {
      return;
    }
    e->retired = true;
    e->conn.reset();
    eraseIfMapped(address, e);
  }

  /// Dial with a token that also fires on pool shutdown.
  SessionPtr dialLinked(const core::CancellationToken &token, const std::string &host,
                        std::uint16_t port)
  {
    core::CancellationSource linked;
    auto callerReg = token.onCancel([&linked, &token] { linked.cancel(token.reason()); });
    auto shutdownReg =
      _shutdown.token().onCancel([&linked] { linked.cancel("transport shutdown"); });
    return _transport.dial(linked.token(), host, port, _tls.cloneWithServerName(host));
  }

  void sweepLoop()
  {
    GOSSAMER_LOG_DEBUG("ConnPool: sweep thread started, interval "
                       << _cfg.sweepInterval.count() << "ms");
    std::unique_lock<std::mutex> lk(_sweepMutex);
    while (!_closed.load())
    {
      _sweepCv.wait_for(lk, _cfg.sweepInterval, [this] { return _closed.load(); });
      if (_closed.load())
      {
        break;
      }
      lk.unlock();
      sweep();
      lk.lock();
    }
  }

  ISocketTransport &_transport;
  const TlsConfig _tls;
  const Config _cfg;
  NewConnHook _onNewConn;

  mutable std::shared_mutex _mapMutex;
  std::unordered_map<std::string, std::shared_ptr<Entry>> _entries;

  mutable std::mutex _dupMutex;
  std::vector<Duplicate> _duplicates;

  std::atomic<bool> _closed{false};
  core::CancellationSource _shutdown;
  std::mutex _sweepMutex;
  std::condition_variable _sweepCv;
  std::thread _sweepThread;
};

} // namespace network
} // namespace gossamer
