// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Gossamer, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

/// \file mux_session.hpp
/// \brief Streams, datagrams, flow control and liveness over one ordered,
/// reliable byte channel.
///
/// MuxSession is independent of sockets: decrypted bytes are pushed in with
/// onBytes() and encoded frames leave through the Output sink supplied at
/// construction. The socket layer drives it from its I/O thread; tests can
/// wire two sessions back to back.

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstring>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "gossamer/core/cancellation.hpp"
#include "gossamer/core/logger.hpp"
#include "gossamer/network/mux_frame.hpp"
#include "gossamer/network/session.hpp"

namespace gossamer
{
namespace network
{

/// Application close codes carried in Close frames.
inline constexpr std::uint32_t kCloseNoError = 0;
inline constexpr std::uint32_t kCloseShutdown = 1;
inline constexpr std::uint32_t kCloseMaxAge = 2;
inline constexpr std::uint32_t kCloseProtocol = 3;
inline constexpr std::uint32_t kCloseIdle = 4;

/// Stream error code used when a stream is refused or abandoned.
inline constexpr std::uint32_t kStreamCancelled = 0;
inline constexpr std::uint32_t kStreamRefused = 1;

class MuxStream;

class MuxSession : public ISession, public std::enable_shared_from_this<MuxSession>
{
public:
  static constexpr std::size_t kDefaultMaxIncomingUniStreams = 100;
  /// Highest stream id either side may open.
  static constexpr StreamId kMaxStreamId = 0xFFFFFFFFu - 2;

  struct Options
  {
    Role role{Role::Dialer};
    SessionId id{0};
    std::string localAddress;
    std::string remoteAddress;
    std::optional<std::string> peerCommonName;
    MuxSettings settings;
    std::chrono::milliseconds maxIdleTimeout{30000};
    std::chrono::milliseconds keepAlivePeriod{10000};
    std::size_t datagramQueueSize{256};
    std::size_t acceptBacklog{256};
    /// Peer-opened unidirectional streams alive at once; further opens are
    /// refused with kStreamRefused.
    std::size_t maxIncomingUniStreams{kDefaultMaxIncomingUniStreams};
  };

  /// Sink for encoded frames. May drop the frame (returning false) only when
  /// \p droppable is set. Must not call back into the session synchronously.
  using Output = std::function<bool(ByteBuffer &&frame, bool droppable)>;
  using ReadyHook = std::function<void()>;
  using CloseHook = std::function<void(const IoResult &)>;

  static constexpr std::size_t kMaxDataChunk = 16384;

  MuxSession(Options opts, Output out) : _opts(std::move(opts)), _output(std::move(out))
  {
    auto now = MonoClock::now();
    _lastReceived = now;
    _lastSent = now;
    _nextLocalId = _opts.role == Role::Dialer ? 0 : 1;
    _nextPeerId = _opts.role == Role::Dialer ? 1 : 0;
  }

  MuxSession(const MuxSession &) = delete;
  MuxSession &operator=(const MuxSession &) = delete;

  /// \brief Install lifecycle hooks. Call before start().
  void setHooks(ReadyHook onReady, CloseHook onClose)
  {
    std::lock_guard<std::mutex> g(_mutex);
    _readyHook = std::move(onReady);
    _closeHook = std::move(onClose);
  }

  /// \brief Announce local settings. Must be the first frame sent.
  void start() { emit(encodeSettings(_opts.settings)); }

  /// \brief True once the peer's settings have arrived.
  bool ready() const
  {
    std::lock_guard<std::mutex> g(_mutex);
    return _peerSettings.has_value();
  }

  Role role() const { return _opts.role; }

  /// \brief Feed decrypted bytes received from the peer.
  void onBytes(const std::uint8_t *data, std::size_t len)
  {
    Pending p;
    {
      std::lock_guard<std::mutex> g(_mutex);
      if (_closed)
      {
        return;
      }
      _lastReceived = MonoClock::now();
      try
      {
        _decoder.feed(data, len);
        while (auto f = _decoder.next())
        {
          handleFrame(*f, p);
          if (p.peerClosed)
          {
            break;
          }
        }
      }
      catch (const TransportException &ex)
      {
        p.violation = ex.what();
      }
      if (p.becameReady)
      {
        p.readyHook = _readyHook;
      }
    }

    if (p.violation)
    {
      GOSSAMER_LOG_DEBUG("session " << _opts.id << " protocol violation from "
                                    << _opts.remoteAddress << ": " << *p.violation);
      fail(TransportError::Protocol, kCloseProtocol, *p.violation);
      return;
    }
    for (auto &f : p.out)
    {
      emit(std::move(f));
    }
    if (p.readyHook)
    {
      p.readyHook();
    }
    if (p.peerClosed)
    {
      terminate(*p.peerClosed);
    }
  }

  /// \brief Housekeeping: idle timeout and keep-alive. Called periodically.
  void tick(MonoTime now)
  {
    bool idle = false;
    {
      std::lock_guard<std::mutex> g(_mutex);
      if (_closed)
      {
        return;
      }
      idle = now - _lastReceived >= _opts.maxIdleTimeout;
    }
    if (idle)
    {
      GOSSAMER_LOG_DEBUG("session " << _opts.id << " to " << _opts.remoteAddress
                                    << " idle timeout");
      fail(TransportError::IdleTimeout, kCloseIdle, "idle timeout");
      return;
    }
    bool ping = false;
    {
      std::lock_guard<std::mutex> g(_outMutex);
      ping = now - _lastSent >= _opts.keepAlivePeriod;
    }
    if (ping)
    {
      emit(encodeFrame(FrameType::Ping));
    }
  }

  /// \brief End the session without notifying the peer (socket error, EOF,
  /// shutdown of the socket layer). Idempotent.
  void terminate(const IoResult &status)
  {
    CloseHook hook;
    {
      std::lock_guard<std::mutex> g(_mutex);
      if (_closed)
      {
        return;
      }
      _closed = true;
      _status = status.ok ? IoResult::failure(TransportError::SessionClosed, "session closed")
                          : status;
      for (auto &kv : _streams)
      {
        kv.second->cv.notify_all();
      }
      _streams.clear();
      _incomingUni = 0;
      _dgCv.notify_all();
      _acceptCv.notify_all();
      hook = _closeHook;
    }
    {
      std::lock_guard<std::mutex> g(_outMutex);
      _outClosed = true;
    }
    GOSSAMER_LOG_TRACE("session " << _opts.id << " to " << _opts.remoteAddress
                                  << " terminated: " << status.message);
    if (hook)
    {
      hook(status);
    }
  }

  // ISession

  SessionId id() const override { return _opts.id; }
  std::string remoteAddress() const override { return _opts.remoteAddress; }
  std::string localAddress() const override { return _opts.localAddress; }

  bool alive() const override
  {
    std::lock_guard<std::mutex> g(_mutex);
    return !_closed;
  }

  IoResult closeStatus() const override
  {
    std::lock_guard<std::mutex> g(_mutex);
    return _closed ? _status : IoResult::success();
  }

  bool remoteSupportsDatagrams() const override
  {
    std::lock_guard<std::mutex> g(_mutex);
    return _opts.settings.datagrams && _peerSettings && _peerSettings->datagrams;
  }

  std::size_t maxDatagramSize() const override
  {
    std::lock_guard<std::mutex> g(_mutex);
    if (!_peerSettings || !_peerSettings->datagrams)
    {
      return 0;
    }
    return std::min<std::size_t>(_peerSettings->maxDatagramSize, kMaxFramePayload);
  }

  void sendDatagram(const ByteBuffer &payload) override
  {
    {
      std::lock_guard<std::mutex> g(_mutex);
      throwIfClosed();
      if (!_peerSettings || !_peerSettings->datagrams || !_opts.settings.datagrams)
      {
        throw TransportException(TransportError::Protocol, "peer does not support datagrams");
      }
      std::size_t limit = std::min<std::size_t>(_peerSettings->maxDatagramSize, kMaxFramePayload);
      if (payload.size() > limit)
      {
        throw TransportException(TransportError::DatagramTooLarge,
                                 "datagram of " + std::to_string(payload.size()) +
                                   " bytes exceeds maximum of " + std::to_string(limit));
      }
    }
    emit(encodeFrame(FrameType::Datagram, 0, 0, payload.data(), payload.size()), true);
  }

  ByteBuffer receiveDatagram(const core::CancellationToken &token) override
  {
    auto reg = token.onCancel(
      [this]()
      {
        std::lock_guard<std::mutex> g(_mutex);
        _dgCv.notify_all();
      });
    std::unique_lock<std::mutex> lk(_mutex);
    _dgCv.wait(lk, [&] { return !_datagrams.empty() || _closed || token.isCancelled(); });
    if (token.isCancelled())
    {
      throw TransportException(TransportError::Cancelled, token.reason());
    }
    throwIfClosed();
    ByteBuffer d = std::move(_datagrams.front());
    _datagrams.pop_front();
    return d;
  }

  std::shared_ptr<IStream> openStream() override;
  std::shared_ptr<ISendStream> openUniStream() override;
  std::shared_ptr<IStream> acceptStream(const core::CancellationToken &token) override;
  std::shared_ptr<IReceiveStream> acceptUniStream(const core::CancellationToken &token) override;

  void closeWithError(std::uint32_t code, const std::string &reason) override
  {
    fail(code == kCloseShutdown ? TransportError::Shutdown : TransportError::SessionClosed, code,
         reason);
  }

  std::optional<std::string> peerCommonName() const override { return _opts.peerCommonName; }

  /// \brief Number of streams with at least one open direction.
  std::size_t streamCount() const
  {
    std::lock_guard<std::mutex> g(_mutex);
    return _streams.size();
  }

  /// \brief Number of peer-opened unidirectional streams not yet retired.
  std::size_t incomingUniStreams() const
  {
    std::lock_guard<std::mutex> g(_mutex);
    return _incomingUni;
  }

private:
  friend class MuxStream;

  struct StreamState
  {
    StreamId id{0};
    bool canSend{false};
    bool canRecv{false};

    std::uint64_t sendCredit{0};
    bool finSent{false};
    bool sendReset{false};
    std::optional<std::uint32_t> stopCode;

    ByteBuffer rx;
    std::size_t rxPos{0};
    std::uint64_t recvAvail{0};
    std::uint64_t consumedSinceUpdate{0};
    bool finReceived{false};
    std::optional<std::uint32_t> resetCode;
    bool readCancelled{false};

    Deadline readDeadline;
    Deadline writeDeadline;
    std::condition_variable cv;

    std::size_t buffered() const { return rx.size() - rxPos; }
  };
  using StreamPtr = std::shared_ptr<StreamState>;

  struct Pending
  {
    std::vector<ByteBuffer> out;
    bool becameReady{false};
    ReadyHook readyHook;
    std::optional<IoResult> peerClosed;
    std::optional<std::string> violation;
  };

  bool emit(ByteBuffer &&frame, bool droppable = false)
  {
    std::lock_guard<std::mutex> g(_outMutex);
    if (_outClosed)
    {
      return false;
    }
    _lastSent = MonoClock::now();
    return _output(std::move(frame), droppable);
  }

  /// Send Close to the peer, then terminate locally with \p code.
  void fail(TransportError code, std::uint32_t wireCode, const std::string &reason)
  {
    emit(encodeClose(wireCode, reason));
    terminate(IoResult::failure(code, reason));
  }

  void throwIfClosed() const
  {
    if (_closed)
    {
      throw TransportException(_status);
    }
  }

  bool isPeerStream(StreamId sid) const
  {
    return (sid & 1u) == (_opts.role == Role::Dialer ? 1u : 0u);
  }

  StreamPtr makeStream(StreamId sid, bool uni, bool local)
  {
    auto st = std::make_shared<StreamState>();
    st->id = sid;
    st->canSend = !uni || local;
    st->canRecv = !uni || !local;
    st->sendCredit = _peerSettings ? _peerSettings->initialWindow : 0;
    st->recvAvail = _opts.settings.initialWindow;
    _streams.emplace(sid, st);
    if (uni && !local)
    {
      ++_incomingUni;
    }
    return st;
  }

  /// Drop the stream from the table once both directions are finished.
  void maybeRetire(const StreamPtr &st)
  {
    bool sendDone = !st->canSend || st->finSent || st->sendReset;
    bool recvDone = !st->canRecv || st->readCancelled || st->resetCode.has_value() ||
                    (st->finReceived && st->buffered() == 0);
    if (sendDone && recvDone && _streams.erase(st->id) > 0 && !st->canSend)
    {
      --_incomingUni;
    }
  }

  /// Look up a stream addressed by a peer frame. Frames for streams that
  /// were already retired are ignored; frames for ids never opened are fatal.
  StreamPtr lookupForFrame(StreamId sid) const
  {
    auto it = _streams.find(sid);
    if (it != _streams.end())
    {
      return it->second;
    }
    bool known = isPeerStream(sid) ? sid < _nextPeerId : sid < _nextLocalId;
    if (!known)
    {
      throw TransportException(TransportError::Protocol,
                               "frame for unopened stream " + std::to_string(sid));
    }
    return nullptr;
  }

  void handleFrame(Frame &f, Pending &p)
  {
    if (!_peerSettings && f.type != FrameType::Settings)
    {
      throw TransportException(TransportError::Protocol,
                               std::string("expected Settings, got ") + toString(f.type));
    }

    switch (f.type)
    {
    case FrameType::Settings:
      if (_peerSettings)
      {
        throw TransportException(TransportError::Protocol, "duplicate Settings");
      }
      _peerSettings = decodeSettings(f);
      p.becameReady = true;
      break;

    case FrameType::StreamOpen:
    {
      if (!isPeerStream(f.streamId) || f.streamId < _nextPeerId || f.streamId > kMaxStreamId)
      {
        throw TransportException(TransportError::Protocol,
                                 "invalid stream id " + std::to_string(f.streamId));
      }
      _nextPeerId = f.streamId + 2;
      bool uni = (f.flags & kFlagUni) != 0;
      auto &backlog = uni ? _acceptUni : _acceptBidi;
      if (backlog.size() >= _opts.acceptBacklog ||
          (uni && _incomingUni >= _opts.maxIncomingUniStreams))
      {
        p.out.push_back(encodeCodeFrame(FrameType::StopSending, f.streamId, kStreamRefused));
        if (!uni)
        {
          p.out.push_back(encodeCodeFrame(FrameType::StreamReset, f.streamId, kStreamRefused));
        }
        break;
      }
      backlog.push_back(makeStream(f.streamId, uni, false));
      _acceptCv.notify_all();
      break;
    }

    case FrameType::StreamData:
    {
      auto st = lookupForFrame(f.streamId);
      if (!st)
      {
        break;
      }
      if (!st->canRecv || st->finReceived)
      {
        throw TransportException(TransportError::Protocol,
                                 "unexpected data on stream " + std::to_string(f.streamId));
      }
      if (f.payload.size() > st->recvAvail)
      {
        throw TransportException(TransportError::Protocol,
                                 "flow control violation on stream " + std::to_string(f.streamId));
      }
      st->recvAvail -= f.payload.size();
      if (st->readCancelled || st->resetCode)
      {
        break;
      }
      if (st->rxPos > 0 && st->rxPos == st->rx.size())
      {
        st->rx.clear();
        st->rxPos = 0;
      }
      st->rx.insert(st->rx.end(), f.payload.begin(), f.payload.end());
      st->cv.notify_all();
      break;
    }

    case FrameType::StreamFin:
    {
      auto st = lookupForFrame(f.streamId);
      if (!st)
      {
        break;
      }
      if (!st->canRecv)
      {
        throw TransportException(TransportError::Protocol,
                                 "FIN on send-only stream " + std::to_string(f.streamId));
      }
      st->finReceived = true;
      st->cv.notify_all();
      maybeRetire(st);
      break;
    }

    case FrameType::StreamReset:
    {
      auto st = lookupForFrame(f.streamId);
      if (!st)
      {
        break;
      }
      if (!st->canRecv)
      {
        throw TransportException(TransportError::Protocol,
                                 "reset on send-only stream " + std::to_string(f.streamId));
      }
      st->resetCode = getU32(f.payload.data());
      st->rx.clear();
      st->rxPos = 0;
      st->cv.notify_all();
      maybeRetire(st);
      break;
    }

    case FrameType::StopSending:
    {
      auto st = lookupForFrame(f.streamId);
      if (!st)
      {
        break;
      }
      if (!st->canSend)
      {
        throw TransportException(TransportError::Protocol,
                                 "stop on receive-only stream " + std::to_string(f.streamId));
      }
      std::uint32_t code = getU32(f.payload.data());
      st->stopCode = code;
      if (!st->finSent && !st->sendReset)
      {
        st->sendReset = true;
        p.out.push_back(encodeCodeFrame(FrameType::StreamReset, f.streamId, code));
      }
      st->cv.notify_all();
      maybeRetire(st);
      break;
    }

    case FrameType::WindowUpdate:
    {
      auto st = lookupForFrame(f.streamId);
      if (!st)
      {
        break;
      }
      st->sendCredit += getU32(f.payload.data());
      st->cv.notify_all();
      break;
    }

    case FrameType::Datagram:
      if (!_opts.settings.datagrams || f.payload.size() > _opts.settings.maxDatagramSize)
      {
        GOSSAMER_LOG_TRACE("session " << _opts.id << " dropping unexpected datagram");
        break;
      }
      if (_datagrams.size() >= _opts.datagramQueueSize)
      {
        GOSSAMER_LOG_TRACE("session " << _opts.id << " datagram queue full, dropping");
        break;
      }
      _datagrams.push_back(std::move(f.payload));
      _dgCv.notify_one();
      break;

    case FrameType::Ping:
      if (!(f.flags & kFlagAck))
      {
        p.out.push_back(encodeFrame(FrameType::Ping, kFlagAck));
      }
      break;

    case FrameType::Close:
    {
      std::uint32_t code = getU32(f.payload.data());
      std::string reason(f.payload.begin() + 4, f.payload.end());
      p.peerClosed = IoResult::failure(TransportError::PeerClosed,
                                       "peer closed session (code " + std::to_string(code) +
                                         "): " + reason);
      break;
    }
    }
  }

  /// Block on \p st until \p pred holds, re-reading the deadline each pass.
  template <typename Pred>
  bool waitStream(std::unique_lock<std::mutex> &lk, StreamState &st, const Deadline &dl,
                  Pred pred)
  {
    while (!pred())
    {
      if (dl)
      {
        if (MonoClock::now() >= *dl)
        {
          return false;
        }
        st.cv.wait_until(lk, *dl);
      }
      else
      {
        st.cv.wait(lk);
      }
    }
    return true;
  }

  std::size_t streamWrite(const StreamPtr &st, const std::uint8_t *data, std::size_t len)
  {
    std::size_t total = 0;
    while (total < len)
    {
      std::size_t chunk = 0;
      {
        std::unique_lock<std::mutex> lk(_mutex);
        if (!st->canSend)
        {
          throw TransportException(TransportError::Protocol, "stream is receive-only");
        }
        bool ok = waitStream(lk, *st, st->writeDeadline,
                             [&]
                             {
                               return st->sendCredit > 0 || st->sendReset || st->finSent ||
                                      _closed;
                             });
        throwIfClosed();
        if (st->stopCode)
        {
          throw TransportException(TransportError::StreamReset,
                                   "peer stopped stream (code " + std::to_string(*st->stopCode) +
                                     ")");
        }
        if (st->sendReset)
        {
          throw TransportException(TransportError::StreamReset, "write on reset stream");
        }
        if (st->finSent)
        {
          throw TransportException(TransportError::SessionClosed, "write on closed stream");
        }
        if (!ok)
        {
          throw TransportException(TransportError::Timeout, "write deadline exceeded");
        }
        chunk = static_cast<std::size_t>(
          std::min<std::uint64_t>({st->sendCredit, len - total, kMaxDataChunk}));
        st->sendCredit -= chunk;
      }
      if (!emit(encodeFrame(FrameType::StreamData, 0, st->id, data + total, chunk)))
      {
        std::lock_guard<std::mutex> g(_mutex);
        throwIfClosed();
        throw TransportException(TransportError::SessionClosed, "session output closed");
      }
      total += chunk;
    }
    return total;
  }

  void streamFin(const StreamPtr &st)
  {
    {
      std::lock_guard<std::mutex> g(_mutex);
      if (!st->canSend || st->finSent || st->sendReset || _closed)
      {
        return;
      }
      st->finSent = true;
      maybeRetire(st);
    }
    emit(encodeFrame(FrameType::StreamFin, 0, st->id));
  }

  void streamCancelWrite(const StreamPtr &st, std::uint32_t code)
  {
    {
      std::lock_guard<std::mutex> g(_mutex);
      if (!st->canSend || st->finSent || st->sendReset || _closed)
      {
        return;
      }
      st->sendReset = true;
      st->cv.notify_all();
      maybeRetire(st);
    }
    emit(encodeCodeFrame(FrameType::StreamReset, st->id, code));
  }

  std::size_t streamRead(const StreamPtr &st, std::uint8_t *buf, std::size_t len)
  {
    std::size_t n = 0;
    std::uint64_t update = 0;
    {
      std::unique_lock<std::mutex> lk(_mutex);
      if (!st->canRecv)
      {
        throw TransportException(TransportError::Protocol, "stream is send-only");
      }
      if (st->readCancelled)
      {
        throw TransportException(TransportError::StreamReset, "read on cancelled stream");
      }
      bool ok = waitStream(lk, *st, st->readDeadline,
                           [&]
                           {
                             return st->buffered() > 0 || st->finReceived ||
                                    st->resetCode.has_value() || _closed;
                           });
      if (st->resetCode)
      {
        throw TransportException(TransportError::StreamReset,
                                 "stream reset by peer (code " + std::to_string(*st->resetCode) +
                                   ")");
      }
      if (st->buffered() == 0)
      {
        if (st->finReceived)
        {
          maybeRetire(st);
          return 0;
        }
        throwIfClosed();
        if (!ok)
        {
          throw TransportException(TransportError::Timeout, "read deadline exceeded");
        }
      }
      n = std::min(len, st->buffered());
      std::memcpy(buf, st->rx.data() + st->rxPos, n);
      st->rxPos += n;
      if (st->finReceived)
      {
        maybeRetire(st);
      }
      else
      {
        st->consumedSinceUpdate += n;
        if (st->consumedSinceUpdate >= _opts.settings.initialWindow / 2)
        {
          update = st->consumedSinceUpdate;
          st->recvAvail += update;
          st->consumedSinceUpdate = 0;
        }
      }
      if (_closed)
      {
        update = 0;
      }
    }
    if (update > 0)
    {
      emit(encodeCodeFrame(FrameType::WindowUpdate, st->id, static_cast<std::uint32_t>(update)));
    }
    return n;
  }

  void streamCancelRead(const StreamPtr &st, std::uint32_t code)
  {
    bool notify = false;
    {
      std::lock_guard<std::mutex> g(_mutex);
      if (!st->canRecv || st->readCancelled || _closed)
      {
        return;
      }
      st->readCancelled = true;
      notify = !st->finReceived && !st->resetCode;
      st->rx.clear();
      st->rxPos = 0;
      st->cv.notify_all();
      maybeRetire(st);
    }
    if (notify)
    {
      emit(encodeCodeFrame(FrameType::StopSending, st->id, code));
    }
  }

  void streamSetReadDeadline(const StreamPtr &st, Deadline t)
  {
    std::lock_guard<std::mutex> g(_mutex);
    st->readDeadline = t;
    st->cv.notify_all();
  }

  void streamSetWriteDeadline(const StreamPtr &st, Deadline t)
  {
    std::lock_guard<std::mutex> g(_mutex);
    st->writeDeadline = t;
    st->cv.notify_all();
  }

  /// Finish whatever direction the handle owner left open.
  void streamRelease(const StreamPtr &st)
  {
    bool reset = false;
    bool stop = false;
    {
      std::lock_guard<std::mutex> g(_mutex);
      if (_closed)
      {
        return;
      }
      if (st->canSend && !st->finSent && !st->sendReset)
      {
        st->sendReset = true;
        reset = true;
      }
      if (st->canRecv && !st->readCancelled && !st->resetCode &&
          !(st->finReceived && st->buffered() == 0))
      {
        st->readCancelled = true;
        stop = !st->finReceived;
        st->rx.clear();
        st->rxPos = 0;
      }
      maybeRetire(st);
    }
    if (reset)
    {
      emit(encodeCodeFrame(FrameType::StreamReset, st->id, kStreamCancelled));
    }
    if (stop)
    {
      emit(encodeCodeFrame(FrameType::StopSending, st->id, kStreamCancelled));
    }
  }

  StreamPtr openLocal(bool uni)
  {
    StreamPtr st;
    {
      std::lock_guard<std::mutex> g(_mutex);
      throwIfClosed();
      if (!_peerSettings)
      {
        throw TransportException(TransportError::Protocol, "session not ready");
      }
      if (_nextLocalId > kMaxStreamId)
      {
        throw TransportException(TransportError::Protocol, "stream ids exhausted");
      }
      StreamId sid = _nextLocalId;
      _nextLocalId += 2;
      st = makeStream(sid, uni, true);
    }
    emit(encodeFrame(FrameType::StreamOpen, uni ? kFlagUni : 0, st->id));
    return st;
  }

  StreamPtr acceptFrom(std::deque<StreamPtr> &backlog, const core::CancellationToken &token)
  {
    auto reg = token.onCancel(
      [this]()
      {
        std::lock_guard<std::mutex> g(_mutex);
        _acceptCv.notify_all();
      });
    std::unique_lock<std::mutex> lk(_mutex);
    _acceptCv.wait(lk, [&] { return !backlog.empty() || _closed || token.isCancelled(); });
    if (token.isCancelled())
    {
      throw TransportException(TransportError::Cancelled, token.reason());
    }
    throwIfClosed();
    StreamPtr st = std::move(backlog.front());
    backlog.pop_front();
    return st;
  }

  const Options _opts;
  Output _output;

  mutable std::mutex _mutex;
  bool _closed{false};
  IoResult _status;
  ReadyHook _readyHook;
  CloseHook _closeHook;
  FrameDecoder _decoder;
  std::optional<MuxSettings> _peerSettings;
  MonoTime _lastReceived;
  StreamId _nextLocalId{0};
  StreamId _nextPeerId{0};
  std::size_t _incomingUni{0};
  std::unordered_map<StreamId, StreamPtr> _streams;
  std::deque<StreamPtr> _acceptBidi;
  std::deque<StreamPtr> _acceptUni;
  std::condition_variable _acceptCv;
  std::deque<ByteBuffer> _datagrams;
  std::condition_variable _dgCv;

  std::mutex _outMutex;
  bool _outClosed{false};
  MonoTime _lastSent;
};

/// \brief User handle for one stream of a MuxSession.
///
/// Dropping the handle resets whatever direction is still open, so abandoned
/// streams do not linger in the session table.
class MuxStream : public IStream
{
public:
  MuxStream(std::shared_ptr<MuxSession> session, MuxSession::StreamPtr state)
      : _session(std::move(session)), _state(std::move(state))
  {
  }

  ~MuxStream() override { _session->streamRelease(_state); }

  MuxStream(const MuxStream &) = delete;
  MuxStream &operator=(const MuxStream &) = delete;

  StreamId streamId() const { return _state->id; }

  std::size_t write(const std::uint8_t *data, std::size_t len) override
  {
    return _session->streamWrite(_state, data, len);
  }

  void close() override { _session->streamFin(_state); }

  void cancelWrite(std::uint32_t code) override { _session->streamCancelWrite(_state, code); }

  void setWriteDeadline(Deadline t) override { _session->streamSetWriteDeadline(_state, t); }

  std::size_t read(std::uint8_t *buf, std::size_t len) override
  {
    return _session->streamRead(_state, buf, len);
  }

  void cancelRead(std::uint32_t code) override { _session->streamCancelRead(_state, code); }

  void setReadDeadline(Deadline t) override { _session->streamSetReadDeadline(_state, t); }

private:
  std::shared_ptr<MuxSession> _session;
  MuxSession::StreamPtr _state;
};

inline std::shared_ptr<IStream> MuxSession::openStream()
{
  return std::make_shared<MuxStream>(shared_from_this(), openLocal(false));
}

inline std::shared_ptr<ISendStream> MuxSession::openUniStream()
{
  return std::make_shared<MuxStream>(shared_from_this(), openLocal(true));
}

inline std::shared_ptr<IStream> MuxSession::acceptStream(const core::CancellationToken &token)
{
  return std::make_shared<MuxStream>(shared_from_this(), acceptFrom(_acceptBidi, token));
}

inline std::shared_ptr<IReceiveStream>
MuxSession::acceptUniStream(const core::CancellationToken &token)
{
  return std::make_shared<MuxStream>(shared_from_this(), acceptFrom(_acceptUni, token));
}

} // namespace network
} // namespace gossamer
