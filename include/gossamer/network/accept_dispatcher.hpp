// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Gossamer, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "gossamer/core/blocking_queue.hpp"
#include "gossamer/core/cancellation.hpp"
#include "gossamer/core/logger.hpp"
#include "gossamer/core/worker_group.hpp"
#include "gossamer/network/conn_pool.hpp"
#include "gossamer/network/fallback_send.hpp"
#include "gossamer/network/membership_transport.hpp"
#include "gossamer/network/session.hpp"
#include "gossamer/network/stream_conn.hpp"

namespace gossamer
{
namespace network
{

/// \brief Turns accepted sessions and their inbound traffic into Packet and
/// NetConnPtr events.
///
/// Every session, inbound or dialed, gets three workers: datagrams,
/// bidirectional streams and unidirectional streams. Each unidirectional
/// stream is decoded on a worker of its own; the session caps how many such
/// streams a peer may hold open, and \p framedReadTimeout caps how long one
/// may take to arrive. All workers belong to one WorkerGroup, so the owner
/// can wait for every one of them after close().
class AcceptDispatcher
{
public:
  static constexpr std::chrono::milliseconds kDefaultFramedReadTimeout{10000};

  AcceptDispatcher(core::WorkerGroup &workers, core::BlockingQueue<Packet> &packets,
                   core::BlockingQueue<NetConnPtr> &streams, core::CancellationToken shutdown,
                   std::chrono::milliseconds framedReadTimeout = kDefaultFramedReadTimeout)
      : _workers(workers), _packets(packets), _streams(streams), _shutdown(std::move(shutdown)),
        _framedReadTimeout(framedReadTimeout)
  {
  }

  AcceptDispatcher(const AcceptDispatcher &) = delete;
  AcceptDispatcher &operator=(const AcceptDispatcher &) = delete;

  /// \brief Start the three receive loops of \p session. Ignored after close().
  void startSessionLoops(const SessionPtr &session)
  {
    spawn("datagrams", [this, session] { receiveDatagrams(session); });
    spawn("streams", [this, session] { acceptStreams(session); });
    spawn("uni-streams", [this, session] { acceptUniStreams(session); });
  }

  /// \brief Accept sessions from \p listener until shutdown, registering
  /// each in \p pool before starting its loops. Runs on the calling thread.
  void runAcceptLoop(IListener &listener, ConnPool &pool)
  {
    for (;;)
    {
      SessionPtr session;
      try
      {
        session = listener.accept(_shutdown);
      }
      catch (const TransportException &ex)
      {
        if (_shutdown.isCancelled())
        {
          return;
        }
        GOSSAMER_LOG_ERROR("AcceptDispatcher: accept error: " << ex.what());
        if (ex.code() == TransportError::ListenerClosed)
        {
          return;
        }
        continue;
      }
      GOSSAMER_LOG_DEBUG("AcceptDispatcher: accepted session " << session->id() << " from "
                                                               << session->remoteAddress());
      pool.addInbound(session);
      startSessionLoops(session);
    }
  }

  /// \brief Refuse further workers. Workers already running are not
  /// interrupted; cancel the shutdown token and close sessions for that.
  void close()
  {
    std::lock_guard<std::mutex> g(_mutex);
    _closed = true;
  }

  std::uint64_t packetsDelivered() const { return _packetsDelivered.load(); }
  std::uint64_t framedPacketsDropped() const { return _framedDropped.load(); }

private:
  void spawn(const std::string &name, std::function<void()> fn)
  {
    std::lock_guard<std::mutex> g(_mutex);
    if (_closed)
    {
      return;
    }
    _workers.spawn(name, std::move(fn));
  }

  bool deliver(Packet &&pkt)
  {
    if (!_packets.queue(std::move(pkt), _shutdown))
    {
      return false;
    }
    _packetsDelivered++;
    return true;
  }

  void receiveDatagrams(const SessionPtr &session)
  {
    for (;;)
    {
      ByteBuffer msg;
      try
      {
        msg = session->receiveDatagram(_shutdown);
      }
      catch (const TransportException &)
      {
        return;
      }
      if (!deliver(Packet{std::move(msg), session->remoteAddress(), WallClock::now()}))
      {
        return;
      }
    }
  }

  void acceptStreams(const SessionPtr &session)
  {
    for (;;)
    {
      std::shared_ptr<IStream> stream;
      try
      {
        stream = session->acceptStream(_shutdown);
      }
      catch (const TransportException &)
      {
        return;
      }
      auto conn =
        std::make_shared<StreamConn>(stream, session->localAddress(), session->remoteAddress());
      if (!_streams.queue(NetConnPtr(conn), _shutdown))
      {
        closeQuietly(*stream);
        return;
      }
    }
  }

  void acceptUniStreams(const SessionPtr &session)
  {
    for (;;)
    {
      std::shared_ptr<IReceiveStream> stream;
      try
      {
        stream = session->acceptUniStream(_shutdown);
      }
      catch (const TransportException &)
      {
        return;
      }
      std::string from = session->remoteAddress();
      spawn("uni-stream", [this, stream, from] { handleUniStream(*stream, from); });
    }
  }

  void handleUniStream(IReceiveStream &stream, const std::string &from)
  {
    std::optional<ByteBuffer> buf;
    try
    {
      stream.setReadDeadline(MonoClock::now() + _framedReadTimeout);
      buf = readFramedPacket(stream);
    }
    catch (const TransportException &ex)
    {
      GOSSAMER_LOG_TRACE("AcceptDispatcher: framed packet from " << from << " lost: "
                                                                 << ex.what());
    }
    if (!buf)
    {
      _framedDropped++;
      GOSSAMER_LOG_DEBUG("AcceptDispatcher: dropped framed packet from " << from);
      return;
    }
    deliver(Packet{std::move(*buf), from, WallClock::now()});
  }

  static void closeQuietly(IStream &stream)
  {
    try
    {
      stream.close();
    }
    catch (const TransportException &ex)
    {
      GOSSAMER_LOG_TRACE("AcceptDispatcher: closing undelivered stream: " << ex.what());
    }
  }

  core::WorkerGroup &_workers;
  core::BlockingQueue<Packet> &_packets;
  core::BlockingQueue<NetConnPtr> &_streams;
  core::CancellationToken _shutdown;
  const std::chrono::milliseconds _framedReadTimeout;

  std::mutex _mutex;
  bool _closed{false};
  std::atomic<std::uint64_t> _packetsDelivered{0};
  std::atomic<std::uint64_t> _framedDropped{0};
};

} // namespace network
} // namespace gossamer
