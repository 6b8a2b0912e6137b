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

/// \file tls_socket_transport.hpp
/// \brief Header-only, Linux-only epoll transport that carries multiplexed
/// sessions over mutually authenticated TLS.
/// \details
///   - Single I/O thread (epoll + eventfd + timerfd)
///   - One listening socket; outbound dials bind the same local port
///   - TLS 1.3 with ALPN, peer verification on both sides
///   - Each established connection runs one MuxSession
///   - Handshake timeout, idle timeout and keep-alive driven by the timerfd
///   - Blocking public API (dial, accept) completed by the I/O thread

#include <atomic>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstring>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/socket.h>
#include <sys/timerfd.h>
#include <unistd.h>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include "gossamer/core/blocking_queue.hpp"
#include "gossamer/core/logger.hpp"
#include "gossamer/network/ip_utils.hpp"
#include "gossamer/network/mux_session.hpp"
#include "gossamer/network/session.hpp"
#include "gossamer/network/tls_util.hpp"
#include "gossamer/network/transport_types.hpp"

namespace gossamer
{
namespace network
{

/// \brief Shared TLS socket layer: the single origin of every inbound and
/// outbound session.
/// \note Linux-only.
class TlsSocketTransport : public ISocketTransport
{
public:
  /// \brief Runtime configuration.
  struct Config
  {
    std::string bindAddr{"0.0.0.0"};
    std::uint16_t bindPort{0};
    bool reusePortForDial{true};

    int epollMaxEvents{256};
    std::size_t ioReadChunk{64 * 1024};
    std::size_t maxWriteQueueBytes{16 * 1024 * 1024};
    std::size_t datagramDropThreshold{1024 * 1024}; ///< queued bytes above which datagrams drop
    std::size_t acceptQueueSize{1024};

    std::chrono::milliseconds handshakeTimeout{10000};
    std::chrono::milliseconds maxIdleTimeout{30000};
    std::chrono::milliseconds keepAlivePeriod{10000};
    std::chrono::milliseconds closeLinger{2000};
    std::chrono::milliseconds tickInterval{100};

    MuxSettings mux;
    std::size_t datagramQueueSize{256};
    bool enableTcpNoDelay{true};
  };

  /// \brief Basic counters (monotonic).
  struct Stats
  {
    std::uint64_t accepted{0}, dialed{0}, established{0}, closed{0}, tlsFailures{0},
      datagramsDropped{0}, backpressureCloses{0};
    std::size_t sessionsCurrent{0};
  };

  TlsSocketTransport(const Config &cfg, const TlsConfig &tls)
      : _cfg(cfg), _tls(tls), _cmdq(std::make_shared<CommandQueue>()),
        _acceptq(std::make_shared<core::BlockingQueue<SessionPtr>>(
          cfg.acceptQueueSize > 0 ? cfg.acceptQueueSize : 1))
  {
  }

  /// \brief Destructor; calls close() if needed.
  ~TlsSocketTransport() override { close(); }

  TlsSocketTransport(const TlsSocketTransport &) = delete;
  TlsSocketTransport &operator=(const TlsSocketTransport &) = delete;

  /// \brief Build the TLS contexts, bind and listen, and start the I/O thread.
  /// \throws TransportException (Config, Socket, Bind, Listen)
  void start()
  {
    bool exp = false;
    if (!_running.compare_exchange_strong(exp, true))
    {
      throw TransportException(TransportError::Config, "transport already started");
    }
    try
    {
      _alpnPref = tls::alpnWire(_tls.alpn);
      _serverCtx = tls::buildContext(_tls, true, &_alpnPref);
      openListenSocket();

      _epollFd = ::epoll_create1(EPOLL_CLOEXEC);
      if (_epollFd < 0)
      {
        throw TransportException(TransportError::Socket, "epoll_create1: " + lastErr(), errno);
      }
      _eventFd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
      if (_eventFd < 0)
      {
        throw TransportException(TransportError::Socket, "eventfd: " + lastErr(), errno);
      }
      _timerFd = ::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
      if (_timerFd < 0)
      {
        throw TransportException(TransportError::Socket, "timerfd_create: " + lastErr(), errno);
      }
      addEpoll(_eventFd, EPOLLIN);
      addEpoll(_timerFd, EPOLLIN);
      addEpoll(_listenFd, EPOLLIN);
      armTimer(_cfg.tickInterval);
      _cmdq->attach(_eventFd);

      _loop = std::thread([this] { loop(); });
    }
    catch (...)
    {
      cleanupStartFail();
      throw;
    }
    GOSSAMER_LOG_DEBUG("TlsSocketTransport: listening on " << _localAddress);
  }

  std::shared_ptr<IListener> listen() override
  {
    std::lock_guard<std::mutex> g(_listenerMutex);
    if (!_running.load() && !_stopped.load())
    {
      throw TransportException(TransportError::Listen, "transport not started");
    }
    if (_listener)
    {
      throw TransportException(TransportError::Listen, "listener already created");
    }
    _listener = std::make_shared<Listener>(_acceptq, _cmdq, _localAddress, _boundPort);
    return _listener;
  }

  SessionPtr dial(const core::CancellationToken &token, const std::string &host,
                  std::uint16_t port, const TlsConfig &tls) override
  {
    if (_stopped.load() || !_running.load())
    {
      throw TransportException(TransportError::Shutdown, "transport shutdown");
    }
    if (token.isCancelled())
    {
      throw TransportException(TransportError::Cancelled, token.reason());
    }

    auto pd = std::make_shared<PendingDial>();
    pd->host = host;
    pd->port = port;
    pd->tls = tls;

    if (!_cmdq->push(Command::connect(pd)))
    {
      throw TransportException(TransportError::Shutdown, "transport shutdown");
    }

    auto reg = token.onCancel(
      [pd]()
      {
        std::lock_guard<std::mutex> g(pd->mutex);
        pd->cv.notify_all();
      });

    // The I/O thread enforces the handshake timeout; the extra second only
    // covers a wedged I/O thread.
    auto limit = MonoClock::now() + _cfg.handshakeTimeout + std::chrono::seconds(1);
    std::unique_lock<std::mutex> lk(pd->mutex);
    pd->cv.wait_until(lk, limit, [&] { return pd->done || token.isCancelled(); });
    if (!pd->done)
    {
      pd->abandoned = true;
      lk.unlock();
      _cmdq->push(Command::abort(pd));
      if (token.isCancelled())
      {
        throw TransportException(TransportError::Cancelled, token.reason());
      }
      throw TransportException(TransportError::Timeout,
                               "dial " + joinHostPort(host, port) + " timed out");
    }
    if (!pd->result.ok)
    {
      throw TransportException(pd->result);
    }
    return pd->session;
  }

  /// \brief Stop the I/O thread, close every session and the listener.
  void close() override
  {
    bool exp = true;
    if (!_running.compare_exchange_strong(exp, false))
    {
      return;
    }
    _stopped.store(true);
    _cmdq->push(Command::shutdown());
    if (_loop.joinable())
    {
      _loop.join();
    }
  }

  std::string localAddress() const override { return _localAddress; }
  std::uint16_t localPort() const override { return _boundPort; }

  Stats stats() const
  {
    Stats s;
    s.accepted = _stats.accepted.load();
    s.dialed = _stats.dialed.load();
    s.established = _stats.established.load();
    s.closed = _stats.closed.load();
    s.tlsFailures = _stats.tlsFailures.load();
    s.datagramsDropped = _dropped->load();
    s.backpressureCloses = _stats.backpressureCloses.load();
    s.sessionsCurrent = _stats.sessionsCurrent.load();
    return s;
  }

private:
  struct PendingDial
  {
    std::string host;
    std::uint16_t port{0};
    TlsConfig tls;

    std::mutex mutex;
    std::condition_variable cv;
    bool done{false};
    bool abandoned{false};
    IoResult result;
    SessionPtr session;

    /// \return false if the caller already gave up; \p session is then
    /// the completer's to close
    bool complete(const IoResult &r, SessionPtr s)
    {
      std::lock_guard<std::mutex> g(mutex);
      if (abandoned || done)
      {
        return false;
      }
      done = true;
      result = r;
      session = std::move(s);
      cv.notify_all();
      return true;
    }
  };

  enum class Cmd
  {
    Shutdown,
    Dial,
    Abort,
    Send,
    Close,
    CloseListener
  };

  struct Command
  {
    Cmd t;
    SessionId sid{0};
    ByteBuffer payload;
    std::shared_ptr<PendingDial> pending;

    static Command shutdown() { return Command{Cmd::Shutdown}; }
    static Command connect(std::shared_ptr<PendingDial> pd)
    {
      Command x{Cmd::Dial};
      x.pending = std::move(pd);
      return x;
    }
    static Command abort(std::shared_ptr<PendingDial> pd)
    {
      Command x{Cmd::Abort};
      x.pending = std::move(pd);
      return x;
    }
    static Command send(SessionId sid, ByteBuffer &&b)
    {
      Command x{Cmd::Send};
      x.sid = sid;
      x.payload = std::move(b);
      return x;
    }
    static Command close(SessionId sid)
    {
      Command x{Cmd::Close};
      x.sid = sid;
      return x;
    }
    static Command closeListener() { return Command{Cmd::CloseListener}; }
  };

  /// Command queue shared with sessions and listeners, which may outlive
  /// the transport. Pushes after detach() are refused.
  struct CommandQueue
  {
    std::mutex mutex;
    std::deque<Command> cmds;
    int eventFd{-1};

    void attach(int fd)
    {
      std::lock_guard<std::mutex> g(mutex);
      eventFd = fd;
    }

    void detach()
    {
      std::lock_guard<std::mutex> g(mutex);
      eventFd = -1;
      cmds.clear();
    }

    bool push(Command &&c)
    {
      std::lock_guard<std::mutex> g(mutex);
      if (eventFd < 0)
      {
        return false;
      }
      cmds.push_back(std::move(c));
      std::uint64_t one = 1;
      ssize_t w = ::write(eventFd, &one, sizeof(one));
      // EAGAIN means the counter is saturated; the loop is awake anyway.
      (void)w;
      return true;
    }

    std::deque<Command> take()
    {
      std::deque<Command> q;
      std::lock_guard<std::mutex> g(mutex);
      q.swap(cmds);
      return q;
    }
  };

  class Listener : public IListener
  {
  public:
    Listener(std::shared_ptr<core::BlockingQueue<SessionPtr>> q, std::shared_ptr<CommandQueue> cmdq,
             std::string addr, std::uint16_t port)
        : _q(std::move(q)), _cmdq(std::move(cmdq)), _addr(std::move(addr)), _port(port)
    {
    }

    SessionPtr accept(const core::CancellationToken &token) override
    {
      if (_closed.load())
      {
        throw TransportException(TransportError::ListenerClosed, "listener closed");
      }
      SessionPtr s;
      if (_q->dequeue(s, token))
      {
        return s;
      }
      if (token.isCancelled())
      {
        throw TransportException(TransportError::Cancelled, token.reason());
      }
      throw TransportException(TransportError::ListenerClosed, "listener closed");
    }

    void close() override
    {
      if (_closed.exchange(true))
      {
        return;
      }
      _q->close();
      _cmdq->push(Command::closeListener());
      // Sessions established but never accepted have no other owner.
      SessionPtr s;
      while (_q->tryDequeue(s))
      {
        s->closeWithError(kCloseNoError, "listener closed");
      }
    }

    std::string localAddress() const override { return _addr; }
    std::uint16_t localPort() const override { return _port; }

  private:
    std::shared_ptr<core::BlockingQueue<SessionPtr>> _q;
    std::shared_ptr<CommandQueue> _cmdq;
    std::string _addr;
    std::uint16_t _port;
    std::atomic<bool> _closed{false};
  };

  enum class ConnState
  {
    Connecting,
    Handshake,
    Open
  };

  struct Conn
  {
    SessionId id{};
    int fd{-1};
    SSL *ssl{nullptr};
    Role role{Role::Acceptor};
    ConnState state{ConnState::Handshake};
    bool hsWantWrite{false};
    bool ready{false};
    bool closed{false};

    std::deque<ByteBuffer> wq;
    std::size_t wqBytes{0};
    std::shared_ptr<std::atomic<std::size_t>> queued;
    bool wantWrite{false};
    bool closeAfterFlush{false};
    MonoTime closeRequested{};

    MonoTime started{};
    std::string local, remote;
    std::shared_ptr<MuxSession> mux;
    std::shared_ptr<PendingDial> dial;
  };

  // ===== helpers =====

  static std::string lastErr()
  {
    int e = errno;
    char buf[128];
    return std::string(::strerror_r(e, buf, sizeof(buf)));
  }

  bool addEpoll(int fd, std::uint32_t ev)
  {
    epoll_event e{};
    e.events = ev;
    e.data.fd = fd;
    return ::epoll_ctl(_epollFd, EPOLL_CTL_ADD, fd, &e) == 0;
  }

  bool modEpoll(int fd, std::uint32_t ev)
  {
    epoll_event e{};
    e.events = ev;
    e.data.fd = fd;
    return ::epoll_ctl(_epollFd, EPOLL_CTL_MOD, fd, &e) == 0;
  }

  void delEpoll(int fd) { ::epoll_ctl(_epollFd, EPOLL_CTL_DEL, fd, nullptr); }

  void armTimer(std::chrono::milliseconds every)
  {
    itimerspec its{};
    its.it_interval.tv_sec = every.count() / 1000;
    its.it_interval.tv_nsec = (every.count() % 1000) * 1000000;
    its.it_value = its.it_interval;
    ::timerfd_settime(_timerFd, 0, &its, nullptr);
  }

  void drainFd(int fd)
  {
    std::uint64_t n = 0;
    while (::read(fd, &n, sizeof(n)) > 0)
    {
    }
  }

  static std::string sockName(int fd, bool peer)
  {
    sockaddr_storage ss{};
    socklen_t sl = sizeof(ss);
    int rc = peer ? ::getpeername(fd, reinterpret_cast<sockaddr *>(&ss), &sl)
                  : ::getsockname(fd, reinterpret_cast<sockaddr *>(&ss), &sl);
    return rc == 0 ? sockaddrToString(ss) : std::string();
  }

  /// Fill \p ss with \p host:\p port. Returns the address family or -1.
  static int makeSockaddr(const std::string &host, std::uint16_t port, sockaddr_storage &ss,
                          socklen_t &sl)
  {
    std::memset(&ss, 0, sizeof(ss));
    in_addr a4{};
    in6_addr a6{};
    if (::inet_pton(AF_INET, host.c_str(), &a4) == 1)
    {
      auto *sin = reinterpret_cast<sockaddr_in *>(&ss);
      sin->sin_family = AF_INET;
      sin->sin_port = htons(port);
      sin->sin_addr = a4;
      sl = sizeof(sockaddr_in);
      return AF_INET;
    }
    if (::inet_pton(AF_INET6, host.c_str(), &a6) == 1)
    {
      auto *sin6 = reinterpret_cast<sockaddr_in6 *>(&ss);
      sin6->sin6_family = AF_INET6;
      sin6->sin6_port = htons(port);
      sin6->sin6_addr = a6;
      sl = sizeof(sockaddr_in6);
      return AF_INET6;
    }
    return -1;
  }

  static void setReuse(int fd)
  {
    int one = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
#ifdef SO_REUSEPORT
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEPORT, &one, sizeof(one));
#endif
  }

  void applySockOpts(int fd)
  {
    if (_cfg.enableTcpNoDelay)
    {
      int one = 1;
      (void)::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
    }
  }

  void openListenSocket()
  {
    sockaddr_storage ss{};
    socklen_t sl = 0;
    std::string host = _cfg.bindAddr.empty() ? std::string("0.0.0.0") : _cfg.bindAddr;
    int family = makeSockaddr(host, _cfg.bindPort, ss, sl);
    if (family < 0)
    {
      throw TransportException(TransportError::Bind, "invalid bind address: " + host);
    }
    _listenFd = ::socket(family, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (_listenFd < 0)
    {
      throw TransportException(TransportError::Socket, "socket: " + lastErr(), errno);
    }
    if (family == AF_INET6)
    {
      int v6only = 0;
      ::setsockopt(_listenFd, IPPROTO_IPV6, IPV6_V6ONLY, &v6only, sizeof(v6only));
    }
    setReuse(_listenFd);
    if (::bind(_listenFd, reinterpret_cast<sockaddr *>(&ss), sl) < 0)
    {
      throw TransportException(TransportError::Bind,
                               "bind " + joinHostPort(host, _cfg.bindPort) + ": " + lastErr(),
                               errno);
    }
    if (::listen(_listenFd, 256) < 0)
    {
      throw TransportException(TransportError::Listen, "listen: " + lastErr(), errno);
    }
    _family = family;
    _localAddress = sockName(_listenFd, false);
    _boundPort = splitHostPort(_localAddress).second;
  }

  void cleanupStartFail()
  {
    for (int *fd : {&_timerFd, &_eventFd, &_epollFd, &_listenFd})
    {
      if (*fd >= 0)
      {
        ::close(*fd);
        *fd = -1;
      }
    }
    _cmdq->detach();
    if (_serverCtx)
    {
      ::SSL_CTX_free(_serverCtx);
      _serverCtx = nullptr;
    }
    _running.store(false);
  }

  // ===== event loop =====

  void loop()
  {
    std::vector<epoll_event> evs(static_cast<std::size_t>(_cfg.epollMaxEvents));
    while (_running.load() || !_shutdownSeen)
    {
      int n = ::epoll_wait(_epollFd, evs.data(), static_cast<int>(evs.size()), -1);
      if (n < 0)
      {
        if (errno == EINTR)
        {
          continue;
        }
        GOSSAMER_LOG_ERROR("TlsSocketTransport: epoll_wait: " << lastErr());
        continue;
      }

      for (int i = 0; i < n && !_shutdownSeen; ++i)
      {
        int fd = evs[static_cast<std::size_t>(i)].data.fd;
        std::uint32_t events = evs[static_cast<std::size_t>(i)].events;

        if (fd == _eventFd)
        {
          drainFd(_eventFd);
          process();
          continue;
        }
        if (fd == _timerFd)
        {
          drainFd(_timerFd);
          housekeeping();
          continue;
        }
        if (fd == _listenFd)
        {
          onListener();
          continue;
        }
        auto it = _byFd.find(fd);
        if (it != _byFd.end())
        {
          onSession(it->second, events);
        }
      }
      reap();
    }
    teardown();
  }

  void process()
  {
    std::deque<Command> q = _cmdq->take();
    for (auto &c : q)
    {
      switch (c.t)
      {
      case Cmd::Shutdown:
        _shutdownSeen = true;
        break;
      case Cmd::Dial:
        if (_shutdownSeen)
        {
          c.pending->complete(IoResult::failure(TransportError::Shutdown, "transport shutdown"),
                              nullptr);
        }
        else
        {
          doDial(c.pending);
        }
        break;
      case Cmd::Abort:
        doAbort(c.pending);
        break;
      case Cmd::Send:
        doSend(c.sid, std::move(c.payload));
        break;
      case Cmd::Close:
      {
        auto it = _conns.find(c.sid);
        if (it != _conns.end() && !it->second->closed)
        {
          Conn *s = it->second.get();
          if (s->wq.empty())
          {
            closeNow(s, TransportError::SessionClosed, "closed locally");
          }
          else
          {
            s->closeAfterFlush = true;
            s->closeRequested = MonoClock::now();
          }
        }
        break;
      }
      case Cmd::CloseListener:
        if (_listenFd >= 0)
        {
          delEpoll(_listenFd);
          ::close(_listenFd);
          _listenFd = -1;
        }
        break;
      }
    }
  }

  void onListener()
  {
    for (;;)
    {
      sockaddr_storage peer{};
      socklen_t pl = sizeof(peer);
      int cfd = ::accept4(_listenFd, reinterpret_cast<sockaddr *>(&peer), &pl,
                          SOCK_NONBLOCK | SOCK_CLOEXEC);
      if (cfd < 0)
      {
        if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)
        {
          GOSSAMER_LOG_WARN("TlsSocketTransport: accept4: " << lastErr());
        }
        break;
      }
      applySockOpts(cfd);

      SSL *ssl = ::SSL_new(_serverCtx);
      if (!ssl)
      {
        GOSSAMER_LOG_ERROR("TlsSocketTransport: SSL_new(server): " << tls::lastError());
        ::close(cfd);
        continue;
      }
      ::SSL_set_fd(ssl, cfd);
      ::SSL_set_accept_state(ssl);

      auto s = std::make_unique<Conn>();
      s->id = _nextSessionId++;
      s->fd = cfd;
      s->ssl = ssl;
      s->role = Role::Acceptor;
      s->state = ConnState::Handshake;
      s->started = MonoClock::now();
      s->remote = sockaddrToString(peer);
      s->local = sockName(cfd, false);
      s->queued = std::make_shared<std::atomic<std::size_t>>(0);
      insert(std::move(s), EPOLLIN);
      _stats.accepted++;
    }
  }

  int openDialSocket(int family, const sockaddr_storage &dst, socklen_t dl, bool bindLocal)
  {
    int fd = ::socket(family, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd < 0)
    {
      return -1;
    }
    applySockOpts(fd);
    if (bindLocal)
    {
      setReuse(fd);
      sockaddr_storage local{};
      socklen_t ll = 0;
      std::string host = _cfg.bindAddr.empty() ? std::string("0.0.0.0") : _cfg.bindAddr;
      if (makeSockaddr(host, _boundPort, local, ll) != family ||
          ::bind(fd, reinterpret_cast<sockaddr *>(&local), ll) < 0)
      {
        ::close(fd);
        errno = EADDRNOTAVAIL;
        return -1;
      }
    }
    if (::connect(fd, reinterpret_cast<const sockaddr *>(&dst), dl) < 0 && errno != EINPROGRESS)
    {
      int e = errno;
      ::close(fd);
      errno = e;
      return -1;
    }
    return fd;
  }

  void doDial(const std::shared_ptr<PendingDial> &pd)
  {
    {
      std::lock_guard<std::mutex> g(pd->mutex);
      if (pd->abandoned)
      {
        return;
      }
    }
    sockaddr_storage dst{};
    socklen_t dl = 0;
    int family = makeSockaddr(pd->host, pd->port, dst, dl);
    if (family < 0)
    {
      pd->complete(IoResult::failure(TransportError::Resolve, "not a numeric address: " + pd->host),
                   nullptr);
      return;
    }

    int fd = -1;
    if (_cfg.reusePortForDial && family == _family)
    {
      fd = openDialSocket(family, dst, dl, true);
      if (fd < 0)
      {
        GOSSAMER_LOG_DEBUG("TlsSocketTransport: dial " << joinHostPort(pd->host, pd->port)
                                                       << " from shared port failed ("
                                                       << lastErr() << "), using ephemeral port");
      }
    }
    if (fd < 0)
    {
      fd = openDialSocket(family, dst, dl, false);
    }
    if (fd < 0)
    {
      pd->complete(IoResult::failure(TransportError::Connect,
                                     "connect " + joinHostPort(pd->host, pd->port) + ": " +
                                       lastErr(),
                                     errno),
                   nullptr);
      return;
    }

    SSL *ssl = nullptr;
    try
    {
      SSL_CTX *ctx = tls::buildContext(pd->tls, false, nullptr);
      ssl = ::SSL_new(ctx);
      ::SSL_CTX_free(ctx);
      if (!ssl)
      {
        tls::fail("SSL_new(client)");
      }
      tls::setExpectedPeer(ssl, pd->tls.serverName);
    }
    catch (const TransportException &ex)
    {
      if (ssl)
      {
        ::SSL_free(ssl);
      }
      ::close(fd);
      pd->complete(IoResult::failure(ex.code(), ex.what()), nullptr);
      return;
    }
    ::SSL_set_fd(ssl, fd);
    ::SSL_set_connect_state(ssl);

    auto s = std::make_unique<Conn>();
    s->id = _nextSessionId++;
    s->fd = fd;
    s->ssl = ssl;
    s->role = Role::Dialer;
    s->state = ConnState::Connecting;
    s->started = MonoClock::now();
    s->remote = joinHostPort(pd->host, pd->port);
    s->queued = std::make_shared<std::atomic<std::size_t>>(0);
    s->dial = pd;
    insert(std::move(s), EPOLLIN | EPOLLOUT);
    _stats.dialed++;
  }

  void doAbort(const std::shared_ptr<PendingDial> &pd)
  {
    for (auto &kv : _conns)
    {
      Conn *s = kv.second.get();
      if (s->dial == pd && !s->closed)
      {
        closeNow(s, TransportError::Cancelled, "dial abandoned");
        return;
      }
    }
    // Already established: the ready hook found the dial abandoned and closed it.
  }

  void insert(std::unique_ptr<Conn> s, std::uint32_t ev)
  {
    int fd = s->fd;
    Conn *raw = s.get();
    _conns.emplace(s->id, std::move(s));
    _byFd[fd] = raw;
    addEpoll(fd, ev);
    _stats.sessionsCurrent++;
  }

  void onSession(Conn *s, std::uint32_t events)
  {
    if (s->closed)
    {
      return;
    }

    if (s->state == ConnState::Connecting)
    {
      if (!(events & (EPOLLOUT | EPOLLERR | EPOLLHUP)))
      {
        return;
      }
      int err = 0;
      socklen_t el = sizeof(err);
      if (::getsockopt(s->fd, SOL_SOCKET, SO_ERROR, &err, &el) != 0 || err != 0)
      {
        closeNow(s, TransportError::Connect,
                 "connect " + s->remote + ": " + std::strerror(err != 0 ? err : errno));
        return;
      }
      s->state = ConnState::Handshake;
      s->local = sockName(s->fd, false);
    }

    if (s->state == ConnState::Handshake)
    {
      driveHandshake(s);
      return;
    }

    if (events & (EPOLLIN | EPOLLHUP | EPOLLERR))
    {
      readAvail(s);
      if (s->closed)
      {
        return;
      }
    }
    if (events & (EPOLLHUP | EPOLLERR))
    {
      closeNow(s, TransportError::PeerClosed, "connection closed by peer");
      return;
    }
    if (events & EPOLLOUT)
    {
      writePending(s);
    }
  }

  void driveHandshake(Conn *s)
  {
    ERR_clear_error();
    int rc = ::SSL_do_handshake(s->ssl);
    if (rc != 1)
    {
      int errc = ::SSL_get_error(s->ssl, rc);
      if (errc == SSL_ERROR_WANT_READ || errc == SSL_ERROR_WANT_WRITE)
      {
        s->hsWantWrite = errc == SSL_ERROR_WANT_WRITE;
        updateInterest(s);
        return;
      }
      _stats.tlsFailures++;
      std::string msg = errc == SSL_ERROR_SYSCALL ? std::string("connection reset during handshake")
                                                  : tls::lastError();
      long verify = ::SSL_get_verify_result(s->ssl);
      if (verify != X509_V_OK)
      {
        msg += std::string(" (certificate verify: ") + X509_verify_cert_error_string(verify) + ")";
      }
      closeNow(s, TransportError::TLSHandshake, "TLS handshake with " + s->remote + " failed: " + msg);
      return;
    }

    s->hsWantWrite = false;
    if (!_tls.alpn.empty())
    {
      const unsigned char *proto = nullptr;
      unsigned int plen = 0;
      ::SSL_get0_alpn_selected(s->ssl, &proto, &plen);
      std::string selected(reinterpret_cast<const char *>(proto), proto ? plen : 0);
      bool known = false;
      for (const auto &p : _tls.alpn)
      {
        known = known || p == selected;
      }
      if (!known)
      {
        _stats.tlsFailures++;
        closeNow(s, TransportError::TLSHandshake,
                 "ALPN mismatch with " + s->remote + ": '" + selected + "'");
        return;
      }
    }

    s->state = ConnState::Open;
    if (s->local.empty())
    {
      s->local = sockName(s->fd, false);
    }
    startMux(s);
    updateInterest(s);
    // Records may already be buffered inside the SSL object.
    readAvail(s);
  }

  void startMux(Conn *s)
  {
    MuxSession::Options o;
    o.role = s->role;
    o.id = s->id;
    o.localAddress = s->local;
    o.remoteAddress = s->remote;
    o.peerCommonName = tls::peerCommonName(s->ssl);
    o.settings = _cfg.mux;
    o.maxIdleTimeout = _cfg.maxIdleTimeout;
    o.keepAlivePeriod = _cfg.keepAlivePeriod;
    o.datagramQueueSize = _cfg.datagramQueueSize;

    auto cmdq = _cmdq;
    auto queued = s->queued;
    SessionId sid = s->id;
    std::size_t dropAbove = _cfg.datagramDropThreshold;
    auto dropped = _dropped;
    auto mux = std::make_shared<MuxSession>(
      std::move(o),
      [cmdq, queued, sid, dropAbove, dropped](ByteBuffer &&frame, bool droppable) -> bool
      {
        if (droppable && queued->load() > dropAbove)
        {
          (*dropped)++;
          return false;
        }
        std::size_t n = frame.size();
        queued->fetch_add(n);
        if (!cmdq->push(Command::send(sid, std::move(frame))))
        {
          queued->fetch_sub(n);
          return false;
        }
        return true;
      });

    std::weak_ptr<MuxSession> weak = mux;
    MuxSession::ReadyHook onReady;
    if (s->role == Role::Dialer)
    {
      auto pd = s->dial;
      onReady = [pd, weak]()
      {
        auto m = weak.lock();
        if (m && pd && !pd->complete(IoResult::success(), m))
        {
          m->closeWithError(kCloseNoError, "dial abandoned");
        }
      };
    }
    else
    {
      auto q = _acceptq;
      onReady = [q, weak]()
      {
        auto m = weak.lock();
        if (m && !q->tryQueue(SessionPtr(m)))
        {
          GOSSAMER_LOG_WARN("TlsSocketTransport: accept queue full, refusing session from "
                            << m->remoteAddress());
          m->closeWithError(kCloseNoError, "accept queue full");
        }
      };
    }
    mux->setHooks(std::move(onReady),
                  [cmdq, sid](const IoResult &) { cmdq->push(Command::close(sid)); });
    s->mux = mux;
    _stats.established++;
    mux->start();
    GOSSAMER_LOG_TRACE("TlsSocketTransport: session " << sid << " " << s->local << " <-> "
                                                      << s->remote << " TLS established");
  }

  void readAvail(Conn *s)
  {
    std::vector<std::uint8_t> &buf = _readBuf;
    buf.resize(_cfg.ioReadChunk);
    for (;;)
    {
      ERR_clear_error();
      int n = ::SSL_read(s->ssl, buf.data(), static_cast<int>(buf.size()));
      if (n > 0)
      {
        if (s->mux)
        {
          s->mux->onBytes(buf.data(), static_cast<std::size_t>(n));
        }
        if (s->closed)
        {
          return;
        }
        continue;
      }
      int ge = ::SSL_get_error(s->ssl, n);
      if (ge == SSL_ERROR_WANT_READ || ge == SSL_ERROR_WANT_WRITE)
      {
        return;
      }
      if (ge == SSL_ERROR_ZERO_RETURN || ge == SSL_ERROR_SYSCALL)
      {
        closeNow(s, TransportError::PeerClosed, "peer closed connection");
        return;
      }
      closeNow(s, TransportError::TLSIO, "TLS read: " + tls::lastError());
      return;
    }
  }

  /// \return false if the session was closed
  bool writeOne(Conn *s, ByteBuffer &d)
  {
    ERR_clear_error();
    int n = ::SSL_write(s->ssl, d.data(), static_cast<int>(d.size()));
    if (n > 0)
    {
      return true;
    }
    int ge = ::SSL_get_error(s->ssl, n);
    if (ge == SSL_ERROR_WANT_WRITE || ge == SSL_ERROR_WANT_READ)
    {
      s->wantWrite = true;
      return true;
    }
    closeNow(s, TransportError::TLSIO, "TLS write: " + tls::lastError());
    return false;
  }

  void writePending(Conn *s)
  {
    s->wantWrite = false;
    while (!s->wq.empty())
    {
      ByteBuffer &d = s->wq.front();
      if (!writeOne(s, d))
      {
        return;
      }
      if (s->wantWrite)
      {
        break;
      }
      s->wqBytes -= d.size();
      s->queued->fetch_sub(d.size());
      s->wq.pop_front();
    }
    if (s->wq.empty() && s->closeAfterFlush)
    {
      closeNow(s, TransportError::SessionClosed, "closed locally");
      return;
    }
    updateInterest(s);
  }

  void doSend(SessionId sid, ByteBuffer &&payload)
  {
    auto it = _conns.find(sid);
    if (it == _conns.end())
    {
      return;
    }
    Conn *s = it->second.get();
    if (s->closed)
    {
      return;
    }
    std::size_t n = payload.size();
    if (s->wq.empty())
    {
      if (!writeOne(s, payload))
      {
        return;
      }
      if (!s->wantWrite)
      {
        s->queued->fetch_sub(n);
        return;
      }
    }
    s->wq.push_back(std::move(payload));
    s->wqBytes += n;
    if (s->wqBytes > _cfg.maxWriteQueueBytes)
    {
      _stats.backpressureCloses++;
      closeNow(s, TransportError::WriteBackpressure, "write queue overflow");
      return;
    }
    updateInterest(s);
  }

  void updateInterest(Conn *s)
  {
    std::uint32_t ev = EPOLLIN;
    if (s->state == ConnState::Connecting || (s->state == ConnState::Handshake && s->hsWantWrite) ||
        s->wantWrite || !s->wq.empty())
    {
      ev |= EPOLLOUT;
    }
    modEpoll(s->fd, ev);
  }

  void closeNow(Conn *s, TransportError why, const std::string &msg)
  {
    if (s->closed)
    {
      return;
    }
    s->closed = true;
    GOSSAMER_LOG_DEBUG("TlsSocketTransport: closing session " << s->id << " (" << s->remote
                                                              << "): " << msg);
    delEpoll(s->fd);
    if (s->ssl)
    {
      if (s->state == ConnState::Open)
      {
        ::SSL_shutdown(s->ssl);
      }
      ::SSL_free(s->ssl);
      s->ssl = nullptr;
    }
    ::close(s->fd);
    _byFd.erase(s->fd);

    IoResult r = IoResult::failure(why, msg);
    if (s->dial)
    {
      s->dial->complete(r, nullptr);
    }
    if (s->mux)
    {
      s->mux->terminate(r);
    }
    s->queued->store(0);
    _stats.closed++;
    _stats.sessionsCurrent--;
    _graveyard.push_back(s->id);
  }

  void reap()
  {
    for (auto id : _graveyard)
    {
      _conns.erase(id);
    }
    _graveyard.clear();
  }

  void housekeeping()
  {
    const auto now = MonoClock::now();
    for (auto &kv : _conns)
    {
      Conn *s = kv.second.get();
      if (s->closed)
      {
        continue;
      }
      if (!s->ready && s->mux && s->mux->ready())
      {
        s->ready = true;
        s->dial.reset();
      }
      if (!s->ready)
      {
        if (now - s->started > _cfg.handshakeTimeout)
        {
          closeNow(s, TransportError::Timeout, "handshake with " + s->remote + " timed out");
        }
        continue;
      }
      if (s->closeAfterFlush && now - s->closeRequested > _cfg.closeLinger)
      {
        closeNow(s, TransportError::SessionClosed, "closed locally");
        continue;
      }
      s->mux->tick(now);
    }
    reap();
  }

  void teardown()
  {
    // Pending commands: refuse dials, drop the rest.
    for (auto &c : _cmdq->take())
    {
      if (c.t == Cmd::Dial)
      {
        c.pending->complete(IoResult::failure(TransportError::Shutdown, "transport shutdown"),
                            nullptr);
      }
    }
    _cmdq->detach();

    for (auto &kv : _conns)
    {
      Conn *s = kv.second.get();
      if (!s->closed)
      {
        closeNow(s, TransportError::Shutdown, "transport shutdown");
      }
    }
    _conns.clear();
    _graveyard.clear();
    _acceptq->close();
    {
      std::lock_guard<std::mutex> g(_listenerMutex);
      if (_listener)
      {
        _listener->close();
      }
    }

    for (int *fd : {&_listenFd, &_timerFd, &_eventFd, &_epollFd})
    {
      if (*fd >= 0)
      {
        ::close(*fd);
        *fd = -1;
      }
    }
    if (_serverCtx)
    {
      ::SSL_CTX_free(_serverCtx);
      _serverCtx = nullptr;
    }
    GOSSAMER_LOG_DEBUG("TlsSocketTransport: stopped");
  }

  struct AtomicStats
  {
    std::atomic<std::uint64_t> accepted{0}, dialed{0}, established{0}, closed{0}, tlsFailures{0},
      backpressureCloses{0};
    std::atomic<std::size_t> sessionsCurrent{0};
  };

  Config _cfg;
  TlsConfig _tls;
  std::vector<unsigned char> _alpnPref;
  SSL_CTX *_serverCtx{nullptr};

  std::shared_ptr<CommandQueue> _cmdq;
  std::shared_ptr<core::BlockingQueue<SessionPtr>> _acceptq;
  std::mutex _listenerMutex;
  std::shared_ptr<Listener> _listener;

  std::atomic<bool> _running{false};
  std::atomic<bool> _stopped{false};
  bool _shutdownSeen{false};
  int _epollFd{-1}, _eventFd{-1}, _timerFd{-1}, _listenFd{-1};
  int _family{AF_INET};
  std::string _localAddress;
  std::uint16_t _boundPort{0};
  std::thread _loop;

  // I/O thread only
  std::unordered_map<SessionId, std::unique_ptr<Conn>> _conns;
  std::unordered_map<int, Conn *> _byFd;
  std::vector<SessionId> _graveyard;
  std::vector<std::uint8_t> _readBuf;
  SessionId _nextSessionId{1};

  AtomicStats _stats;
  std::shared_ptr<std::atomic<std::uint64_t>> _dropped{
    std::make_shared<std::atomic<std::uint64_t>>(0)};
};

} // namespace network
} // namespace gossamer
