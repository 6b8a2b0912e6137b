// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Gossamer, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>

#include "gossamer/core/blocking_queue.hpp"
#include "gossamer/network/session.hpp"
#include "gossamer/network/transport_types.hpp"

namespace gossamer
{
namespace network
{

/// \brief One inbound packet, whichever path delivered it.
struct Packet
{
  ByteBuffer buf;
  std::string from; ///< remote "ip:port" of the session it arrived on
  WallTime timestamp{};
};

/// \brief Peer address with an optional node name.
struct Address
{
  std::string addr;
  std::string name;
};

/// \brief Byte-stream connection handed to the membership engine.
class INetConn
{
public:
  virtual ~INetConn() = default;

  /// \return bytes read, 0 once the peer finished sending
  /// \throws TransportException (Timeout when a read deadline passes)
  virtual std::size_t read(std::uint8_t *buf, std::size_t len) = 0;
  virtual std::size_t write(const std::uint8_t *data, std::size_t len) = 0;
  /// \brief Finish the sending direction.
  virtual void close() = 0;

  virtual std::string localAddress() const = 0;
  virtual std::string remoteAddress() const = 0;

  virtual void setDeadline(Deadline t) = 0;
  virtual void setReadDeadline(Deadline t) = 0;
  virtual void setWriteDeadline(Deadline t) = 0;
};

using NetConnPtr = std::shared_ptr<INetConn>;

/// \brief Transport capabilities a gossip membership engine needs.
class IMembershipTransport
{
public:
  virtual ~IMembershipTransport() = default;

  /// \brief Address and port to advertise to other members.
  /// \param ip explicit address, or empty to derive one from the bind address
  /// \param port explicit port, or 0 for the bound port
  virtual std::pair<std::string, std::uint16_t> finalAdvertiseAddr(const std::string &ip,
                                                                   std::uint16_t port) = 0;

  /// \brief Send one packet to \p address.
  /// \return time the packet was handed to the session
  virtual WallTime writeTo(const ByteBuffer &payload, const std::string &address) = 0;

  virtual core::QueueReader<Packet> &packetCh() = 0;

  /// \brief Open a reliable stream to \p address. A nonzero \p timeout
  /// becomes an absolute deadline on the returned stream; it does not bound
  /// the dial.
  virtual NetConnPtr dialTimeout(const std::string &address, std::chrono::milliseconds timeout) = 0;

  virtual core::QueueReader<NetConnPtr> &streamCh() = 0;

  virtual void shutdown() = 0;
};

/// \brief Variant of IMembershipTransport addressed by node.
class INodeAwareTransport : public IMembershipTransport
{
public:
  virtual WallTime writeToAddress(const ByteBuffer &payload, const Address &address) = 0;
  virtual NetConnPtr dialAddressTimeout(const Address &address,
                                        std::chrono::milliseconds timeout) = 0;
};

} // namespace network
} // namespace gossamer
