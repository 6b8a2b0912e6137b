// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Gossamer, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

/// \file mux_frame.hpp
/// \brief Framing of streams and datagrams inside one TLS session.
///
/// Every frame is a 10-byte header followed by the payload:
///
/// \code
///   u8  type
///   u8  flags
///   u32 streamId   (big-endian, 0 for session-level frames)
///   u32 length     (big-endian, payload bytes that follow)
/// \endcode

#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string>

#include "gossamer/network/byte_order.hpp"
#include "gossamer/network/transport_types.hpp"

namespace gossamer
{
namespace network
{

enum class FrameType : std::uint8_t
{
  Settings = 0x01,
  StreamOpen = 0x02,
  StreamData = 0x03,
  StreamFin = 0x04,
  StreamReset = 0x05,
  StopSending = 0x06,
  WindowUpdate = 0x07,
  Datagram = 0x08,
  Ping = 0x09,
  Close = 0x0A
};

inline constexpr std::size_t kFrameHeaderSize = 10;
inline constexpr std::size_t kMaxFramePayload = 65536 + 16;

inline constexpr std::uint8_t kFlagUni = 0x01; ///< StreamOpen
inline constexpr std::uint8_t kFlagAck = 0x01; ///< Ping

inline constexpr std::size_t kSettingsPayloadSize = 9;

struct Frame
{
  FrameType type{FrameType::Ping};
  std::uint8_t flags{0};
  StreamId streamId{0};
  ByteBuffer payload;
};

/// \brief Parameters each side announces in its first frame.
struct MuxSettings
{
  bool datagrams{true};
  std::uint32_t maxDatagramSize{1200};
  std::uint32_t initialWindow{256 * 1024};
};

inline const char *toString(FrameType t)
{
  switch (t)
  {
  case FrameType::Settings:
    return "Settings";
  case FrameType::StreamOpen:
    return "StreamOpen";
  case FrameType::StreamData:
    return "StreamData";
  case FrameType::StreamFin:
    return "StreamFin";
  case FrameType::StreamReset:
    return "StreamReset";
  case FrameType::StopSending:
    return "StopSending";
  case FrameType::WindowUpdate:
    return "WindowUpdate";
  case FrameType::Datagram:
    return "Datagram";
  case FrameType::Ping:
    return "Ping";
  case FrameType::Close:
    return "Close";
  }
  return "Unknown";
}

/// \brief Serialize one frame.
inline ByteBuffer encodeFrame(FrameType type, std::uint8_t flags, StreamId sid,
                              const std::uint8_t *payload, std::size_t len)
{
  ByteBuffer out(kFrameHeaderSize + len);
  out[0] = static_cast<std::uint8_t>(type);
  out[1] = flags;
  putU32(&out[2], sid);
  putU32(&out[6], static_cast<std::uint32_t>(len));
  if (len > 0)
  {
    std::memcpy(&out[kFrameHeaderSize], payload, len);
  }
  return out;
}

inline ByteBuffer encodeFrame(FrameType type, std::uint8_t flags = 0, StreamId sid = 0)
{
  return encodeFrame(type, flags, sid, nullptr, 0);
}

/// \brief Frame whose payload is a single u32 (reset, stop, window update).
inline ByteBuffer encodeCodeFrame(FrameType type, StreamId sid, std::uint32_t value)
{
  std::uint8_t p[4];
  putU32(p, value);
  return encodeFrame(type, 0, sid, p, sizeof(p));
}

inline ByteBuffer encodeSettings(const MuxSettings &s)
{
  std::uint8_t p[kSettingsPayloadSize];
  p[0] = s.datagrams ? 1 : 0;
  putU32(&p[1], s.maxDatagramSize);
  putU32(&p[5], s.initialWindow);
  return encodeFrame(FrameType::Settings, 0, 0, p, sizeof(p));
}

inline MuxSettings decodeSettings(const Frame &f)
{
  MuxSettings s;
  s.datagrams = f.payload[0] != 0;
  s.maxDatagramSize = getU32(&f.payload[1]);
  s.initialWindow = getU32(&f.payload[5]);
  return s;
}

inline ByteBuffer encodeClose(std::uint32_t code, const std::string &reason)
{
  std::size_t rlen = reason.size() > 1024 ? 1024 : reason.size();
  ByteBuffer p(4 + rlen);
  putU32(p.data(), code);
  std::memcpy(p.data() + 4, reason.data(), rlen);
  return encodeFrame(FrameType::Close, 0, 0, p.data(), p.size());
}

/// \brief Incremental frame parser over the decrypted byte stream.
///
/// Any malformed header or payload throws TransportException(Protocol); the
/// session owning the decoder must then be closed, as the byte stream can
/// no longer be resynchronised.
class FrameDecoder
{
public:
  void feed(const std::uint8_t *data, std::size_t len)
  {
    if (_pos > 0 && _pos == _buf.size())
    {
      _buf.clear();
      _pos = 0;
    }
    _buf.insert(_buf.end(), data, data + len);
  }

  /// \brief Next complete frame, or nullopt if more bytes are needed.
  std::optional<Frame> next()
  {
    std::size_t avail = _buf.size() - _pos;
    if (avail < kFrameHeaderSize)
    {
      compact();
      return std::nullopt;
    }
    const std::uint8_t *h = _buf.data() + _pos;
    std::uint8_t rawType = h[0];
    std::uint32_t len = getU32(h + 6);
    if (rawType < static_cast<std::uint8_t>(FrameType::Settings) ||
        rawType > static_cast<std::uint8_t>(FrameType::Close))
    {
      throw TransportException(TransportError::Protocol,
                               "unknown frame type " + std::to_string(rawType));
    }
    if (len > kMaxFramePayload)
    {
      throw TransportException(TransportError::Protocol,
                               "frame payload too large: " + std::to_string(len));
    }
    if (avail < kFrameHeaderSize + len)
    {
      compact();
      return std::nullopt;
    }

    Frame f;
    f.type = static_cast<FrameType>(rawType);
    f.flags = h[1];
    f.streamId = getU32(h + 2);
    f.payload.assign(h + kFrameHeaderSize, h + kFrameHeaderSize + len);
    _pos += kFrameHeaderSize + len;
    validate(f);
    return f;
  }

  std::size_t buffered() const { return _buf.size() - _pos; }

private:
  static void validate(const Frame &f)
  {
    std::size_t n = f.payload.size();
    bool ok = true;
    switch (f.type)
    {
    case FrameType::Settings:
      ok = n == kSettingsPayloadSize;
      break;
    case FrameType::StreamOpen:
    case FrameType::StreamFin:
    case FrameType::Ping:
      ok = n == 0;
      break;
    case FrameType::StreamReset:
    case FrameType::StopSending:
    case FrameType::WindowUpdate:
      ok = n == 4;
      break;
    case FrameType::Close:
      ok = n >= 4;
      break;
    case FrameType::StreamData:
    case FrameType::Datagram:
      break;
    }
    if (!ok)
    {
      throw TransportException(TransportError::Protocol,
                               std::string("bad payload length for ") + toString(f.type));
    }
  }

  void compact()
  {
    if (_pos > 0)
    {
      _buf.erase(_buf.begin(), _buf.begin() + static_cast<std::ptrdiff_t>(_pos));
      _pos = 0;
    }
  }

  ByteBuffer _buf;
  std::size_t _pos{0};
};

} // namespace network
} // namespace gossamer
