// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// Shared test helpers for the Gossamer test suite

#pragma once

#include "gossamer/gossamer.hpp"

#include <chrono>
#include <cstdio>
#include <fstream>
#include <functional>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

namespace gossamer
{
namespace test
{

struct LoggerInit
{
  LoggerInit() { core::Logger::setLevel(core::Logger::Level::Debug); }
};

/// \brief Call once per test executable
inline void initializeTestLogging()
{
  static LoggerInit init;
  (void)init;
}

/// \brief Poll \p condition until it holds or \p timeout passes.
inline bool waitForCondition(const std::function<bool()> &condition,
                             std::chrono::milliseconds timeout = std::chrono::milliseconds(2000))
{
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!condition())
  {
    if (std::chrono::steady_clock::now() >= deadline)
    {
      return condition();
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return true;
}

inline network::ByteBuffer bytes(const std::string &s) { return network::ByteBuffer(s.begin(), s.end()); }

inline std::string str(const network::ByteBuffer &b) { return std::string(b.begin(), b.end()); }

/// \brief Deterministic non-repeating-looking payload of \p n bytes.
inline network::ByteBuffer pattern(std::size_t n, std::uint8_t seed = 7)
{
  network::ByteBuffer b(n);
  std::uint32_t x = seed;
  for (std::size_t i = 0; i < n; ++i)
  {
    x = x * 1103515245u + 12345u;
    b[i] = static_cast<std::uint8_t>(x >> 16);
  }
  return b;
}

/// \brief Cluster CA plus per-node certificates valid for 127.0.0.1.
class TestPki
{
public:
  TestPki() : _ca(network::generateCa("gossamer-test", std::chrono::hours(1))) {}

  const network::PemPair &ca() const { return _ca; }

  network::TlsConfig nodeTls(const std::string &nodeId) const
  {
    auto pair = network::generateNodeCertWithIps(_ca.certPem, _ca.keyPem, nodeId, {"127.0.0.1"},
                                                 std::chrono::hours(1));
    return network::mutualTlsConfig(pair.certPem, pair.keyPem, _ca.certPem);
  }

private:
  network::PemPair _ca;
};

/// \brief Loopback transport options with test-friendly timers.
inline network::TransportConfig loopbackConfig(const network::TlsConfig &tls, std::uint16_t port = 0)
{
  network::TransportConfig cfg;
  cfg.bindAddr = "127.0.0.1";
  cfg.bindPort = port;
  cfg.tls = tls;
  cfg.handshakeTimeout = std::chrono::milliseconds(3000);
  return cfg;
}

/// \brief File removed when the helper goes out of scope.
class TempFile
{
public:
  TempFile(const std::string &stem, const std::string &content)
      : _path("/tmp/" + stem + "_" + std::to_string(::getpid()) + "_" +
              std::to_string(counter()++))
  {
    std::ofstream out(_path, std::ios::binary);
    out << content;
  }
  ~TempFile() { std::remove(_path.c_str()); }

  TempFile(const TempFile &) = delete;
  TempFile &operator=(const TempFile &) = delete;

  const std::string &path() const { return _path; }

private:
  static int &counter()
  {
    static int n = 0;
    return n;
  }

  std::string _path;
};

} // namespace test
} // namespace gossamer
