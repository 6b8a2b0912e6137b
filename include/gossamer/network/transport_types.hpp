// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Gossamer, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once
#ifndef __linux__
#error "Linux-only (epoll/eventfd/timerfd)"
#endif

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace gossamer
{
namespace network
{

using SessionId = std::uint64_t;
using StreamId = std::uint32_t;
using ByteBuffer = std::vector<std::uint8_t>;
using MonoClock = std::chrono::steady_clock;
using MonoTime = std::chrono::time_point<MonoClock>;
using WallClock = std::chrono::system_clock;
using WallTime = std::chrono::time_point<WallClock>;

/// \brief Which side of the handshake a session is on.
enum class Role
{
  Dialer,
  Acceptor
};

enum class TransportError
{
  None = 0,
  Socket,
  Resolve,
  Bind,
  Listen,
  Accept,
  Connect,
  TLSHandshake,
  TLSIO,
  PeerClosed,
  Protocol,
  WriteBackpressure,
  Config,
  DatagramTooLarge,
  PayloadTooLarge,
  StreamReset,
  SessionClosed,
  ListenerClosed,
  IdleTimeout,
  Timeout,
  Cancelled,
  Shutdown,
  NoPeerIdentity,
  Unknown
};

inline const char *toString(TransportError e)
{
  switch (e)
  {
  case TransportError::None:
    return "None";
  case TransportError::Socket:
    return "Socket";
  case TransportError::Resolve:
    return "Resolve";
  case TransportError::Bind:
    return "Bind";
  case TransportError::Listen:
    return "Listen";
  case TransportError::Accept:
    return "Accept";
  case TransportError::Connect:
    return "Connect";
  case TransportError::TLSHandshake:
    return "TLSHandshake";
  case TransportError::TLSIO:
    return "TLSIO";
  case TransportError::PeerClosed:
    return "PeerClosed";
  case TransportError::Protocol:
    return "Protocol";
  case TransportError::WriteBackpressure:
    return "WriteBackpressure";
  case TransportError::Config:
    return "Config";
  case TransportError::DatagramTooLarge:
    return "DatagramTooLarge";
  case TransportError::PayloadTooLarge:
    return "PayloadTooLarge";
  case TransportError::StreamReset:
    return "StreamReset";
  case TransportError::SessionClosed:
    return "SessionClosed";
  case TransportError::ListenerClosed:
    return "ListenerClosed";
  case TransportError::IdleTimeout:
    return "IdleTimeout";
  case TransportError::Timeout:
    return "Timeout";
  case TransportError::Cancelled:
    return "Cancelled";
  case TransportError::Shutdown:
    return "Shutdown";
  case TransportError::NoPeerIdentity:
    return "NoPeerIdentity";
  case TransportError::Unknown:
    return "Unknown";
  }
  return "Unknown";
}

struct IoResult
{
  bool ok{true};
  TransportError code{TransportError::None};
  std::string message;
  int sysErrno{0};
  int tlsError{0};

  static IoResult success() { return {true, TransportError::None, "", 0, 0}; }

  static IoResult failure(TransportError c, const std::string &m, int se = 0, int te = 0)
  {
    return {false, c, m, se, te};
  }
};

/// \brief Error thrown by the synchronous transport API.
class TransportException : public std::runtime_error
{
public:
  TransportException(TransportError code, const std::string &message, int sysErrno = 0)
      : std::runtime_error(message), _code(code), _sysErrno(sysErrno)
  {
  }

  explicit TransportException(const IoResult &r)
      : std::runtime_error(r.message), _code(r.code), _sysErrno(r.sysErrno)
  {
  }

  TransportError code() const noexcept { return _code; }
  int sysErrno() const noexcept { return _sysErrno; }

private:
  TransportError _code;
  int _sysErrno;
};

} // namespace network
} // namespace gossamer
