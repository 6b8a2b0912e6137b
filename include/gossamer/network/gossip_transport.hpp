// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Gossamer, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include "gossamer/core/blocking_queue.hpp"
#include "gossamer/core/cancellation.hpp"
#include "gossamer/core/logger.hpp"
#include "gossamer/core/worker_group.hpp"
#include "gossamer/network/accept_dispatcher.hpp"
#include "gossamer/network/conn_pool.hpp"
#include "gossamer/network/fallback_send.hpp"
#include "gossamer/network/ip_utils.hpp"
#include "gossamer/network/membership_transport.hpp"
#include "gossamer/network/stream_conn.hpp"
#include "gossamer/network/tls_socket_transport.hpp"
#include "gossamer/network/transport_config.hpp"

namespace gossamer
{
namespace network
{

/// \brief Gossip membership transport over one multiplexed TLS socket.
///
/// Packets go out as datagrams, or as framed unidirectional streams when
/// too large; streams map to multiplexed bidirectional streams. Inbound and
/// outbound sessions share the listening port and the connection pool.
///
/// \code
///   TransportConfig cfg;
///   cfg.bindAddr = "10.0.0.1";
///   cfg.bindPort = 7946;
///   cfg.tls = mutualTlsConfig(certPem, keyPem, caPem);
///   GossipTransport t(cfg);
///
///   t.writeTo(payload, "10.0.0.2:7946");
///   Packet pkt;
///   while (t.packetCh().dequeue(pkt)) { ... }
///   t.shutdown();
/// \endcode
class GossipTransport : public INodeAwareTransport
{
public:
  /// \brief Bind, listen and start accepting.
  /// \throws TransportException(Config) without TLS material, or the
  /// socket layer's Bind/Listen/Socket errors. Nothing is left running on
  /// failure.
  explicit GossipTransport(const TransportConfig &config)
      : _cfg(checked(config).withDefaults()), _tls(_cfg.tls->cloneWithAlpn({kMuxAlpn})),
        _packets(_cfg.packetQueueSize), _streams(_cfg.streamQueueSize), _packetReader(_packets),
        _streamReader(_streams),
        _dispatcher(_workers, _packets, _streams, _shutdown.token(), _cfg.maxIdleTimeout)
  {
    _socket = std::make_unique<TlsSocketTransport>(_cfg.socketConfig(), _tls);
    _socket->start();
    try
    {
      _listener = _socket->listen();
      _pool = std::make_unique<ConnPool>(
        *_socket, _tls, ConnPool::Config{_cfg.maxConnectionAge, _cfg.poolSweepInterval},
        [this](const SessionPtr &s) { _dispatcher.startSessionLoops(s); });
      _workers.spawn("accept", [this] { _dispatcher.runAcceptLoop(*_listener, *_pool); });
    }
    catch (...)
    {
      stop();
      throw;
    }
    GOSSAMER_LOG_INFO("GossipTransport: listening on " << _socket->localAddress());
  }

  ~GossipTransport() override { shutdown(); }

  GossipTransport(const GossipTransport &) = delete;
  GossipTransport &operator=(const GossipTransport &) = delete;

  std::pair<std::string, std::uint16_t> finalAdvertiseAddr(const std::string &ip,
                                                           std::uint16_t port) override
  {
    std::string advertise = ip;
    if (!isIpLiteral(advertise))
    {
      advertise = splitHostPort(_socket->localAddress()).first;
      if (isUnspecifiedAddress(advertise))
      {
        auto priv = privateInterfaceAddress();
        if (!priv)
        {
          throw TransportException(TransportError::Resolve,
                                   "failed to get private IP: no private IP address found");
        }
        advertise = *priv;
      }
    }
    if (port == 0)
    {
      port = _socket->localPort();
    }
    return {advertise, port};
  }

  WallTime writeTo(const ByteBuffer &payload, const std::string &address) override
  {
    return writeToAddress(payload, Address{address, {}});
  }

  WallTime writeToAddress(const ByteBuffer &payload, const Address &address) override
  {
    throwIfShutdown();
    try
    {
      auto session = _pool->getOrDial(_shutdown.token(), address.addr);
      return sendPacket(*session, payload);
    }
    catch (const TransportException &)
    {
      throwIfShutdown();
      throw;
    }
  }

  core::QueueReader<Packet> &packetCh() override { return _packetReader; }

  NetConnPtr dialTimeout(const std::string &address, std::chrono::milliseconds timeout) override
  {
    return dialAddressTimeout(Address{address, {}}, timeout);
  }

  NetConnPtr dialAddressTimeout(const Address &address, std::chrono::milliseconds timeout) override
  {
    throwIfShutdown();
    try
    {
      auto session = _pool->getOrDial(_shutdown.token(), address.addr);
      auto conn = std::make_shared<StreamConn>(session->openStream(), session->localAddress(),
                                               session->remoteAddress());
      if (timeout.count() > 0)
      {
        conn->setDeadline(MonoClock::now() + timeout);
      }
      return conn;
    }
    catch (const TransportException &)
    {
      throwIfShutdown();
      throw;
    }
  }

  core::QueueReader<NetConnPtr> &streamCh() override { return _streamReader; }

  /// \brief Close the listener, the pool and the socket layer, then wait for
  /// every worker. Concurrent and repeated calls all return once the
  /// workers are gone.
  void shutdown() override
  {
    stop();
    _workers.wait();
    _packets.close();
    _streams.close();
  }

  ConnPool &connPool() { return *_pool; }

  /// \brief Socket layer shared by the listener and every dial.
  TlsSocketTransport &rawTransport() { return *_socket; }

  std::size_t workerCount() const { return _workers.active(); }

  const TransportConfig &config() const { return _cfg; }

  const AcceptDispatcher &dispatcher() const { return _dispatcher; }

private:
  static const TransportConfig &checked(const TransportConfig &c)
  {
    if (!c.tls || c.tls->empty())
    {
      throw TransportException(TransportError::Config, "TLS config is required");
    }
    return c;
  }

  void throwIfShutdown() const
  {
    if (_stopping.load())
    {
      throw TransportException(TransportError::Shutdown, "transport shutdown");
    }
  }

  /// Concurrent callers block until the first one has finished.
  void stop()
  {
    std::call_once(_stopOnce,
                   [this]
                   {
                     _stopping.store(true);
                     GOSSAMER_LOG_DEBUG("GossipTransport: shutting down");
                     _shutdown.cancel("transport shutdown");
                     _dispatcher.close();
                     if (_listener)
                     {
                       _listener->close();
                     }
                     if (_pool)
                     {
                       _pool->shutdown();
                     }
                     if (_socket)
                     {
                       _socket->close();
                     }
                   });
  }

  TransportConfig _cfg;
  TlsConfig _tls;

  core::BlockingQueue<Packet> _packets;
  core::BlockingQueue<NetConnPtr> _streams;
  core::QueueReader<Packet> _packetReader;
  core::QueueReader<NetConnPtr> _streamReader;

  core::CancellationSource _shutdown;
  std::atomic<bool> _stopping{false};
  std::once_flag _stopOnce;
  core::WorkerGroup _workers;
  AcceptDispatcher _dispatcher;

  std::unique_ptr<TlsSocketTransport> _socket;
  std::shared_ptr<IListener> _listener;
  std::unique_ptr<ConnPool> _pool;
};

} // namespace network
} // namespace gossamer
