// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Gossamer, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <chrono>
#include <cstdint>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

#include "gossamer/core/config_loader.hpp"
#include "gossamer/core/logger.hpp"
#include "gossamer/network/tls_config.hpp"
#include "gossamer/network/tls_socket_transport.hpp"
#include "gossamer/network/tls_util.hpp"
#include "gossamer/network/transport_types.hpp"

namespace gossamer
{
namespace network
{

inline constexpr std::chrono::milliseconds kDefaultMaxIdleTimeout{30000};
inline constexpr std::chrono::milliseconds kDefaultKeepAlivePeriod{10000};
inline constexpr std::chrono::milliseconds kDefaultPoolSweepInterval{30000};
inline constexpr std::chrono::milliseconds kDefaultHandshakeTimeout{10000};
inline constexpr std::size_t kDefaultPacketQueueSize = 256;
inline constexpr std::size_t kDefaultStreamQueueSize = 16;
inline constexpr std::size_t kDefaultMaxDatagramSize = 1200;
inline constexpr std::size_t kDefaultStreamReceiveWindow = 256 * 1024;

/// \brief Options of a GossipTransport. Zero values mean "use the default".
struct TransportConfig
{
  std::string bindAddr;
  std::uint16_t bindPort{0}; ///< 0 picks an ephemeral port

  /// Required. Cloned per dial with the resolved host as expected peer.
  std::optional<TlsConfig> tls;

  std::chrono::milliseconds maxIdleTimeout{0};
  std::chrono::milliseconds keepAlivePeriod{0};
  std::size_t packetQueueSize{0};
  std::size_t streamQueueSize{0};
  std::chrono::milliseconds maxConnectionAge{0}; ///< 0 = unbounded
  std::chrono::milliseconds poolSweepInterval{0};

  std::size_t maxDatagramSize{0};
  std::chrono::milliseconds handshakeTimeout{0};
  bool reusePortForDial{true};
  std::size_t streamReceiveWindow{0};

  TransportConfig withDefaults() const
  {
    TransportConfig c = *this;
    if (c.bindAddr.empty())
    {
      c.bindAddr = "0.0.0.0";
    }
    if (c.maxIdleTimeout.count() <= 0)
    {
      c.maxIdleTimeout = kDefaultMaxIdleTimeout;
    }
    if (c.keepAlivePeriod.count() <= 0)
    {
      c.keepAlivePeriod = kDefaultKeepAlivePeriod;
    }
    if (c.packetQueueSize == 0)
    {
      c.packetQueueSize = kDefaultPacketQueueSize;
    }
    if (c.streamQueueSize == 0)
    {
      c.streamQueueSize = kDefaultStreamQueueSize;
    }
    if (c.poolSweepInterval.count() <= 0)
    {
      c.poolSweepInterval = kDefaultPoolSweepInterval;
    }
    if (c.maxConnectionAge.count() < 0)
    {
      c.maxConnectionAge = std::chrono::milliseconds(0);
    }
    if (c.maxDatagramSize == 0)
    {
      c.maxDatagramSize = kDefaultMaxDatagramSize;
    }
    if (c.handshakeTimeout.count() <= 0)
    {
      c.handshakeTimeout = kDefaultHandshakeTimeout;
    }
    if (c.streamReceiveWindow == 0)
    {
      c.streamReceiveWindow = kDefaultStreamReceiveWindow;
    }
    return c;
  }

  /// \brief Socket layer settings derived from these options.
  /// \pre withDefaults() was applied
  TlsSocketTransport::Config socketConfig() const
  {
    TlsSocketTransport::Config sc;
    sc.bindAddr = bindAddr;
    sc.bindPort = bindPort;
    sc.reusePortForDial = reusePortForDial;
    sc.handshakeTimeout = handshakeTimeout;
    sc.maxIdleTimeout = maxIdleTimeout;
    sc.keepAlivePeriod = keepAlivePeriod;
    sc.mux.datagrams = true;
    sc.mux.maxDatagramSize = static_cast<std::uint32_t>(maxDatagramSize);
    sc.mux.initialWindow = static_cast<std::uint32_t>(streamReceiveWindow);
    sc.datagramQueueSize = packetQueueSize;
    return sc;
  }
};

namespace detail
{

inline std::string readPemFile(const std::string &path)
{
  std::ifstream in(path, std::ios::binary);
  if (!in)
  {
    throw TransportException(TransportError::Config, "cannot open TLS file: " + path);
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

template <typename T, typename Fn> void withConfigErrors(const std::string &key, T &target, Fn get)
{
  try
  {
    auto v = get(key);
    if (v)
    {
      target = static_cast<T>(*v);
    }
  }
  catch (const std::runtime_error &ex)
  {
    throw TransportException(TransportError::Config, ex.what());
  }
}

} // namespace detail

/// \brief Map a loaded JSON document onto TransportConfig.
///
/// Recognised keys (all optional except the TLS files):
/// \code
/// {
///   "transport": {
///     "bindAddr": "0.0.0.0", "bindPort": 7946,
///     "maxIdleTimeoutMs": 30000, "keepAlivePeriodMs": 10000,
///     "packetQueueSize": 256, "streamQueueSize": 16,
///     "maxConnectionAgeMs": 0, "poolSweepIntervalMs": 30000,
///     "maxDatagramSize": 1200, "handshakeTimeoutMs": 10000,
///     "reusePortForDial": true, "streamReceiveWindow": 262144,
///     "tls": { "certFile": "...", "keyFile": "...", "caFile": "..." }
///   }
/// }
/// \endcode
/// \throws TransportException(Config) on wrong types, negative values or
/// unreadable TLS files
inline TransportConfig loadTransportConfig(const core::ConfigLoader &loader)
{
  TransportConfig c;
  auto getInt = [&](const std::string &k) { return loader.getInt(k); };
  auto getNonNegative = [&](const std::string &k) -> std::optional<std::int64_t>
  {
    auto v = loader.getInt(k);
    if (v && *v < 0)
    {
      throw std::runtime_error("ConfigLoader: value at '" + k + "' must not be negative");
    }
    return v;
  };
  auto getMs = [&](const std::string &k) -> std::optional<std::chrono::milliseconds>
  {
    auto v = getNonNegative(k);
    if (!v)
    {
      return std::nullopt;
    }
    return std::chrono::milliseconds(*v);
  };

  detail::withConfigErrors("transport.bindAddr", c.bindAddr,
                           [&](const std::string &k) { return loader.getString(k); });
  std::int64_t port = 0;
  detail::withConfigErrors("transport.bindPort", port, getInt);
  if (port < 0 || port > 65535)
  {
    throw TransportException(TransportError::Config,
                             "transport.bindPort out of range: " + std::to_string(port));
  }
  c.bindPort = static_cast<std::uint16_t>(port);

  detail::withConfigErrors("transport.maxIdleTimeoutMs", c.maxIdleTimeout, getMs);
  detail::withConfigErrors("transport.keepAlivePeriodMs", c.keepAlivePeriod, getMs);
  detail::withConfigErrors("transport.packetQueueSize", c.packetQueueSize, getNonNegative);
  detail::withConfigErrors("transport.streamQueueSize", c.streamQueueSize, getNonNegative);
  detail::withConfigErrors("transport.maxConnectionAgeMs", c.maxConnectionAge, getMs);
  detail::withConfigErrors("transport.poolSweepIntervalMs", c.poolSweepInterval, getMs);
  detail::withConfigErrors("transport.maxDatagramSize", c.maxDatagramSize, getNonNegative);
  detail::withConfigErrors("transport.handshakeTimeoutMs", c.handshakeTimeout, getMs);
  detail::withConfigErrors("transport.reusePortForDial", c.reusePortForDial,
                           [&](const std::string &k) { return loader.getBool(k); });
  detail::withConfigErrors("transport.streamReceiveWindow", c.streamReceiveWindow,
                           getNonNegative);

  std::string certFile, keyFile, caFile;
  auto getString = [&](const std::string &k) { return loader.getString(k); };
  detail::withConfigErrors("transport.tls.certFile", certFile, getString);
  detail::withConfigErrors("transport.tls.keyFile", keyFile, getString);
  detail::withConfigErrors("transport.tls.caFile", caFile, getString);
  if (!certFile.empty() || !keyFile.empty() || !caFile.empty())
  {
    if (certFile.empty() || keyFile.empty() || caFile.empty())
    {
      throw TransportException(TransportError::Config,
                               "transport.tls needs certFile, keyFile and caFile");
    }
    c.tls = mutualTlsConfig(detail::readPemFile(certFile), detail::readPemFile(keyFile),
                            detail::readPemFile(caFile));
  }
  return c;
}

/// \throws TransportException(Config) if the file cannot be loaded
inline TransportConfig loadTransportConfig(const std::string &path)
{
  try
  {
    core::ConfigLoader loader(path);
    return loadTransportConfig(loader);
  }
  catch (const TransportException &)
  {
    throw;
  }
  catch (const std::runtime_error &ex)
  {
    throw TransportException(TransportError::Config, ex.what());
  }
}

/// \brief Apply the optional "log" section (level, file, sourceLocation).
inline void applyLoggingConfig(const core::ConfigLoader &loader)
{
  using core::Logger;
  Logger::Level level = Logger::Level::Info;
  std::string file;
  bool withSource = false;
  try
  {
    if (auto name = loader.getString("log.level"))
    {
      auto parsed = Logger::parseLevel(*name);
      if (!parsed)
      {
        throw TransportException(TransportError::Config, "unknown log level: " + *name);
      }
      level = *parsed;
    }
    file = loader.getString("log.file").value_or("");
    withSource = loader.getBool("log.sourceLocation").value_or(false);
  }
  catch (const TransportException &)
  {
    throw;
  }
  catch (const std::runtime_error &ex)
  {
    throw TransportException(TransportError::Config, ex.what());
  }
  Logger::init(level, file, withSource);
}

} // namespace network
} // namespace gossamer
