// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Gossamer, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <memory>
#include <string>
#include <utility>

#include "gossamer/network/membership_transport.hpp"
#include "gossamer/network/session.hpp"

namespace gossamer
{
namespace network
{

/// \brief INetConn over one bidirectional session stream.
///
/// Holds no state beyond the stream and the session addresses captured when
/// it was opened or accepted; deadline expiry surfaces as the stream's own
/// TransportException(Timeout).
class StreamConn : public INetConn
{
public:
  StreamConn(std::shared_ptr<IStream> stream, std::string localAddress, std::string remoteAddress)
      : _stream(std::move(stream)), _local(std::move(localAddress)),
        _remote(std::move(remoteAddress))
  {
  }

  std::size_t read(std::uint8_t *buf, std::size_t len) override { return _stream->read(buf, len); }

  std::size_t write(const std::uint8_t *data, std::size_t len) override
  {
    return _stream->write(data, len);
  }

  void close() override { _stream->close(); }

  std::string localAddress() const override { return _local; }
  std::string remoteAddress() const override { return _remote; }

  void setDeadline(Deadline t) override { _stream->setDeadline(t); }
  void setReadDeadline(Deadline t) override { _stream->setReadDeadline(t); }
  void setWriteDeadline(Deadline t) override { _stream->setWriteDeadline(t); }

  IStream &stream() { return *_stream; }

private:
  std::shared_ptr<IStream> _stream;
  std::string _local;
  std::string _remote;
};

} // namespace network
} // namespace gossamer
