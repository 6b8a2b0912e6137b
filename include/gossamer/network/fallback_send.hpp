// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Gossamer, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

/// \file fallback_send.hpp
/// \brief Packet delivery over a session: datagram first, framed
/// unidirectional stream when the datagram path cannot carry the payload.
///
/// Framed packet on a unidirectional stream:
///
/// \code
///   u32 length   (big-endian, at most kMaxFramedPacketSize)
///   length bytes of payload
/// \endcode
///
/// The stream is finished right after the payload.

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "gossamer/network/byte_order.hpp"
#include "gossamer/network/session.hpp"
#include "gossamer/network/transport_types.hpp"

namespace gossamer
{
namespace network
{

inline constexpr std::size_t kMaxFramedPacketSize = 65536;

/// Application code used when a receiver abandons a framed packet.
inline constexpr std::uint32_t kFramedPacketRejected = 0;

/// \brief Deliver \p payload as one framed packet on a new unidirectional
/// stream.
/// \throws TransportException(PayloadTooLarge) above kMaxFramedPacketSize,
/// or whatever opening or writing the stream throws
inline void sendViaStream(ISession &session, const ByteBuffer &payload)
{
  if (payload.size() > kMaxFramedPacketSize)
  {
    throw TransportException(TransportError::PayloadTooLarge,
                             "packet of " + std::to_string(payload.size()) +
                               " bytes exceeds framed limit of " +
                               std::to_string(kMaxFramedPacketSize));
  }
  auto stream = session.openUniStream();
  std::uint8_t hdr[4];
  putU32(hdr, static_cast<std::uint32_t>(payload.size()));
  stream->write(hdr, sizeof(hdr));
  if (!payload.empty())
  {
    stream->write(payload.data(), payload.size());
  }
  stream->close();
}

/// \brief Send one packet, preferring a datagram.
///
/// Falls back to sendViaStream() when the peer does not accept datagrams or
/// the payload exceeds the negotiated datagram size. Any other datagram
/// failure is thrown unchanged.
/// \return time the send was started
inline WallTime sendPacket(ISession &session, const ByteBuffer &payload)
{
  WallTime now = WallClock::now();
  if (!session.remoteSupportsDatagrams())
  {
    sendViaStream(session, payload);
    return now;
  }
  try
  {
    session.sendDatagram(payload);
  }
  catch (const TransportException &ex)
  {
    if (ex.code() != TransportError::DatagramTooLarge)
    {
      throw;
    }
    sendViaStream(session, payload);
  }
  return now;
}

/// \brief Read one framed packet from \p stream.
/// \return the payload, or nullopt if the stream ended early or declared
/// more than kMaxFramedPacketSize bytes (reading is then cancelled)
/// \throws TransportException if the stream is reset or the session dies
inline std::optional<ByteBuffer> readFramedPacket(IReceiveStream &stream)
{
  std::uint8_t hdr[4];
  if (!readFull(stream, hdr, sizeof(hdr)))
  {
    return std::nullopt;
  }
  std::uint32_t size = getU32(hdr);
  if (size > kMaxFramedPacketSize)
  {
    stream.cancelRead(kFramedPacketRejected);
    return std::nullopt;
  }
  ByteBuffer buf(size);
  if (size > 0 && !readFull(stream, buf.data(), buf.size()))
  {
    return std::nullopt;
  }
  return buf;
}

} // namespace network
} // namespace gossamer
