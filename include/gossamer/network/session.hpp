// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Gossamer, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

/// \file session.hpp
/// \brief Abstract multiplexed-session contract the pool, dispatcher and
/// orchestrator are written against.

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "gossamer/core/cancellation.hpp"
#include "gossamer/network/tls_config.hpp"
#include "gossamer/network/transport_types.hpp"

namespace gossamer
{
namespace network
{

using Deadline = std::optional<MonoTime>;

/// \brief Sending half of a multiplexed stream.
class ISendStream
{
public:
  virtual ~ISendStream() = default;

  /// \brief Write all \p len bytes, blocking on flow control.
  /// \throws TransportException (Timeout, StreamReset, SessionClosed, ...)
  virtual std::size_t write(const std::uint8_t *data, std::size_t len) = 0;

  /// \brief Half-close: no further writes, peer reads EOF after the data.
  virtual void close() = 0;

  /// \brief Abort the sending side; unsent data is discarded.
  virtual void cancelWrite(std::uint32_t code) = 0;

  virtual void setWriteDeadline(Deadline t) = 0;
};

/// \brief Receiving half of a multiplexed stream.
class IReceiveStream
{
public:
  virtual ~IReceiveStream() = default;

  /// \brief Read up to \p len bytes. Returns 0 at end of stream.
  /// \throws TransportException (Timeout, StreamReset, SessionClosed, ...)
  virtual std::size_t read(std::uint8_t *buf, std::size_t len) = 0;

  /// \brief Stop receiving; the peer's writer is told to stop sending.
  virtual void cancelRead(std::uint32_t code) = 0;

  virtual void setReadDeadline(Deadline t) = 0;
};

/// \brief Bidirectional stream.
class IStream : public ISendStream, public IReceiveStream
{
public:
  void setDeadline(Deadline t)
  {
    setReadDeadline(t);
    setWriteDeadline(t);
  }
};

/// \brief One authenticated, multiplexed session to a peer.
class ISession
{
public:
  virtual ~ISession() = default;

  virtual SessionId id() const = 0;
  virtual std::string remoteAddress() const = 0;
  virtual std::string localAddress() const = 0;

  /// \brief False once the session has terminated for any reason.
  virtual bool alive() const = 0;

  /// \brief Terminal status; ok while the session is alive.
  virtual IoResult closeStatus() const = 0;

  virtual bool remoteSupportsDatagrams() const = 0;
  virtual std::size_t maxDatagramSize() const = 0;

  /// \throws TransportException(DatagramTooLarge) if \p payload exceeds
  /// maxDatagramSize(), another code if the session is unusable
  virtual void sendDatagram(const ByteBuffer &payload) = 0;

  /// \brief Block until a datagram arrives.
  /// \throws TransportException when the session closes or \p token fires
  virtual ByteBuffer receiveDatagram(const core::CancellationToken &token) = 0;

  virtual std::shared_ptr<IStream> openStream() = 0;
  virtual std::shared_ptr<ISendStream> openUniStream() = 0;
  virtual std::shared_ptr<IStream> acceptStream(const core::CancellationToken &token) = 0;
  virtual std::shared_ptr<IReceiveStream> acceptUniStream(const core::CancellationToken &token) = 0;

  /// \brief Close the session, reporting \p code and \p reason to the peer.
  virtual void closeWithError(std::uint32_t code, const std::string &reason) = 0;

  /// \brief Common Name of the authenticated peer certificate, if any.
  virtual std::optional<std::string> peerCommonName() const = 0;
};

using SessionPtr = std::shared_ptr<ISession>;

/// \brief Listening side of the socket layer.
class IListener
{
public:
  virtual ~IListener() = default;

  /// \brief Block until a fully established session is available.
  /// \throws TransportException(ListenerClosed) after close(), Cancelled when
  /// \p token fires
  virtual SessionPtr accept(const core::CancellationToken &token) = 0;

  virtual void close() = 0;
  virtual std::string localAddress() const = 0;
  virtual std::uint16_t localPort() const = 0;
};

/// \brief The single bound socket every session originates from.
class ISocketTransport
{
public:
  virtual ~ISocketTransport() = default;

  /// \brief Start accepting sessions. Only one listener per transport.
  virtual std::shared_ptr<IListener> listen() = 0;

  /// \brief Dial \p host (numeric) : \p port and complete the handshake.
  /// \throws TransportException on failure, Cancelled when \p token fires
  virtual SessionPtr dial(const core::CancellationToken &token, const std::string &host,
                          std::uint16_t port, const TlsConfig &tls) = 0;

  /// \brief Close every session and the listener; further dials fail.
  virtual void close() = 0;

  virtual std::string localAddress() const = 0;
  virtual std::uint16_t localPort() const = 0;
};

/// \brief Read exactly \p len bytes.
/// \return false if the stream ended first
inline bool readFull(IReceiveStream &s, std::uint8_t *buf, std::size_t len)
{
  std::size_t got = 0;
  while (got < len)
  {
    std::size_t n = s.read(buf + got, len - got);
    if (n == 0)
    {
      return false;
    }
    got += n;
  }
  return true;
}

} // namespace network
} // namespace gossamer
