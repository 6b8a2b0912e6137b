// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// In-memory sessions and socket layer for tests that need no real sockets

#pragma once

#include "gossamer/gossamer.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace gossamer
{
namespace test
{

using network::ByteBuffer;
using network::MuxSession;
using network::MuxSettings;
using network::Role;

/// \brief Two MuxSessions wired back to back. Each direction has its own
/// delivery thread, the way the socket layer delivers on its I/O thread.
class MuxPipe
{
public:
  explicit MuxPipe(MuxSettings dialerSettings = {}, MuxSettings acceptorSettings = {},
                   std::chrono::milliseconds idleTimeout = std::chrono::milliseconds(30000))
      : _toAcceptor(std::make_shared<Wire>()), _toDialer(std::make_shared<Wire>())
  {
    dialer = std::make_shared<MuxSession>(
      options(Role::Dialer, 1, "127.0.0.1:1001", "127.0.0.1:2002", "node-b", dialerSettings,
              idleTimeout),
      Wire::sink(_toAcceptor));
    acceptor = std::make_shared<MuxSession>(
      options(Role::Acceptor, 2, "127.0.0.1:2002", "127.0.0.1:1001", "node-a", acceptorSettings,
              idleTimeout),
      Wire::sink(_toDialer));
    _toAcceptor->run(acceptor);
    _toDialer->run(dialer);
    dialer->start();
    acceptor->start();
  }

  ~MuxPipe()
  {
    auto status = network::IoResult::failure(network::TransportError::Shutdown, "test finished");
    dialer->terminate(status);
    acceptor->terminate(status);
    _toAcceptor->stop();
    _toDialer->stop();
  }

  MuxPipe(const MuxPipe &) = delete;
  MuxPipe &operator=(const MuxPipe &) = delete;

  bool waitReady(std::chrono::milliseconds timeout = std::chrono::milliseconds(2000))
  {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!(dialer->ready() && acceptor->ready()))
    {
      if (std::chrono::steady_clock::now() >= deadline)
      {
        return false;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return true;
  }

  /// \brief Stop delivering in both directions, as if the network vanished.
  void cut()
  {
    _toAcceptor->blackhole = true;
    _toDialer->blackhole = true;
  }

  std::shared_ptr<MuxSession> dialer;
  std::shared_ptr<MuxSession> acceptor;

private:
  struct Wire
  {
    core::BlockingQueue<ByteBuffer> frames{1 << 16};
    std::thread thread;
    std::atomic<bool> blackhole{false};

    static MuxSession::Output sink(std::shared_ptr<Wire> wire)
    {
      return [wire](ByteBuffer &&frame, bool) -> bool
      {
        if (wire->blackhole.load())
        {
          return true;
        }
        return wire->frames.tryQueue(std::move(frame));
      };
    }

    void run(std::weak_ptr<MuxSession> target)
    {
      thread = std::thread(
        [this, target]
        {
          ByteBuffer frame;
          while (frames.dequeue(frame))
          {
            if (blackhole.load())
            {
              continue;
            }
            if (auto s = target.lock())
            {
              s->onBytes(frame.data(), frame.size());
            }
          }
        });
    }

    void stop()
    {
      frames.close();
      if (thread.joinable())
      {
        thread.join();
      }
    }
  };

  static MuxSession::Options options(Role role, network::SessionId id, const std::string &local,
                                     const std::string &remote, const std::string &peerName,
                                     MuxSettings settings, std::chrono::milliseconds idle)
  {
    MuxSession::Options o;
    o.role = role;
    o.id = id;
    o.localAddress = local;
    o.remoteAddress = remote;
    o.peerCommonName = peerName;
    o.settings = settings;
    o.maxIdleTimeout = idle;
    o.keepAlivePeriod = std::chrono::milliseconds(idle.count() / 3 > 0 ? idle.count() / 3 : 1);
    return o;
  }

  std::shared_ptr<Wire> _toAcceptor;
  std::shared_ptr<Wire> _toDialer;
};

/// \brief Session with no traffic at all; only liveness and close are real.
class FakeSession : public network::ISession
{
public:
  FakeSession(network::SessionId id, std::string remote, std::string local = "127.0.0.1:7000")
      : _id(id), _remote(std::move(remote)), _local(std::move(local))
  {
  }

  network::SessionId id() const override { return _id; }
  std::string remoteAddress() const override { return _remote; }
  std::string localAddress() const override { return _local; }

  bool alive() const override { return !_dead.load(); }

  network::IoResult closeStatus() const override
  {
    std::lock_guard<std::mutex> g(_mutex);
    return _status;
  }

  bool remoteSupportsDatagrams() const override { return true; }
  std::size_t maxDatagramSize() const override { return 1200; }
  void sendDatagram(const ByteBuffer &) override { throwClosed(); }

  ByteBuffer receiveDatagram(const core::CancellationToken &) override
  {
    throwClosed();
    return {};
  }

  std::shared_ptr<network::IStream> openStream() override
  {
    throwClosed();
    return nullptr;
  }
  std::shared_ptr<network::ISendStream> openUniStream() override
  {
    throwClosed();
    return nullptr;
  }
  std::shared_ptr<network::IStream> acceptStream(const core::CancellationToken &) override
  {
    throwClosed();
    return nullptr;
  }
  std::shared_ptr<network::IReceiveStream>
  acceptUniStream(const core::CancellationToken &) override
  {
    throwClosed();
    return nullptr;
  }

  void closeWithError(std::uint32_t code, const std::string &reason) override
  {
    std::lock_guard<std::mutex> g(_mutex);
    if (_dead.exchange(true))
    {
      return;
    }
    _closeCode = code;
    _closeReason = reason;
    _closedLocally = true;
    _status = network::IoResult::failure(network::TransportError::SessionClosed, reason);
  }

  std::optional<std::string> peerCommonName() const override { return std::string("fake-peer"); }

  /// \brief Die without a local close, like a peer that went away.
  void kill()
  {
    std::lock_guard<std::mutex> g(_mutex);
    _dead = true;
    _status = network::IoResult::failure(network::TransportError::PeerClosed, "killed");
  }

  bool closedLocally() const
  {
    std::lock_guard<std::mutex> g(_mutex);
    return _closedLocally;
  }
  std::uint32_t closeCode() const
  {
    std::lock_guard<std::mutex> g(_mutex);
    return _closeCode;
  }
  std::string closeReason() const
  {
    std::lock_guard<std::mutex> g(_mutex);
    return _closeReason;
  }

private:
  [[noreturn]] void throwClosed() const
  {
    throw network::TransportException(network::TransportError::SessionClosed,
                                      "fake session carries no traffic");
  }

  network::SessionId _id;
  std::string _remote;
  std::string _local;
  std::atomic<bool> _dead{false};
  mutable std::mutex _mutex;
  network::IoResult _status;
  std::uint32_t _closeCode{0};
  std::string _closeReason;
  bool _closedLocally{false};
};

/// \brief Socket layer whose dials create FakeSessions after an optional
/// delay. Counts dials and records the expected peer names it was given.
class FakeSocketTransport : public network::ISocketTransport
{
public:
  std::shared_ptr<network::IListener> listen() override
  {
    throw network::TransportException(network::TransportError::Listen, "fake transport");
  }

  network::SessionPtr dial(const core::CancellationToken &token, const std::string &host,
                           std::uint16_t port, const network::TlsConfig &tls) override
  {
    {
      std::lock_guard<std::mutex> g(_mutex);
      ++_dials;
      _serverNames.push_back(tls.serverName);
    }
    auto reg = token.onCancel(
      [this]
      {
        std::lock_guard<std::mutex> g(_mutex);
        _cv.notify_all();
      });
    {
      std::unique_lock<std::mutex> lk(_mutex);
      _cv.wait_for(lk, dialDelay, [&] { return token.isCancelled(); });
    }
    if (token.isCancelled())
    {
      throw network::TransportException(network::TransportError::Cancelled, token.reason());
    }
    if (failDials.load())
    {
      throw network::TransportException(network::TransportError::Connect, "connection refused");
    }
    auto s = std::make_shared<FakeSession>(_nextId++, network::joinHostPort(host, port));
    std::lock_guard<std::mutex> g(_mutex);
    _sessions.push_back(s);
    return s;
  }

  void close() override {}
  std::string localAddress() const override { return "127.0.0.1:7000"; }
  std::uint16_t localPort() const override { return 7000; }

  int dials() const
  {
    std::lock_guard<std::mutex> g(_mutex);
    return _dials;
  }

  std::vector<std::string> serverNames() const
  {
    std::lock_guard<std::mutex> g(_mutex);
    return _serverNames;
  }

  std::vector<std::shared_ptr<FakeSession>> sessions() const
  {
    std::lock_guard<std::mutex> g(_mutex);
    return _sessions;
  }

  std::chrono::milliseconds dialDelay{0};
  std::atomic<bool> failDials{false};

private:
  mutable std::mutex _mutex;
  std::condition_variable _cv;
  int _dials{0};
  std::atomic<network::SessionId> _nextId{100};
  std::vector<std::string> _serverNames;
  std::vector<std::shared_ptr<FakeSession>> _sessions;
};

} // namespace test
} // namespace gossamer
