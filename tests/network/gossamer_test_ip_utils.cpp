// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// Tests for address parsing and formatting helpers

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <gossamer/network/ip_utils.hpp>

#include <cstring>
#include <functional>

using namespace gossamer::network;

namespace
{
TransportError errorOf(const std::function<void()> &fn)
{
  try
  {
    fn();
  }
  catch (const TransportException &ex)
  {
    return ex.code();
  }
  return TransportError::None;
}

using HostPort = std::pair<std::string, std::uint16_t>;
} // namespace

TEST_CASE("splitHostPort accepts IPv4, names and bracketed IPv6", "[ip_utils]")
{
  REQUIRE(splitHostPort("10.0.0.1:7946") == HostPort("10.0.0.1", 7946));
  REQUIRE(splitHostPort("node-a.cluster:1") == HostPort("node-a.cluster", 1));
  REQUIRE(splitHostPort("[::1]:65535") == HostPort("::1", 65535));
  REQUIRE(splitHostPort(":80") == HostPort("", 80));
}

TEST_CASE("splitHostPort rejects malformed addresses", "[ip_utils]")
{
  for (const char *bad : {"10.0.0.1", "10.0.0.1:", "10.0.0.1:65536", "10.0.0.1:12a", "::1:80",
                          "[::1]80", "[::1", "host:123456"})
  {
    INFO(bad);
    REQUIRE(errorOf([&] { splitHostPort(bad); }) == TransportError::Resolve);
  }
}

TEST_CASE("joinHostPort brackets IPv6 literals", "[ip_utils]")
{
  REQUIRE(joinHostPort("10.0.0.1", 7946) == "10.0.0.1:7946");
  REQUIRE(joinHostPort("::1", 80) == "[::1]:80");
  REQUIRE(splitHostPort(joinHostPort("fe80::2", 9)) == HostPort("fe80::2", 9));
}

TEST_CASE("address classification", "[ip_utils]")
{
  REQUIRE(isIpLiteral("127.0.0.1"));
  REQUIRE(isIpLiteral("::1"));
  REQUIRE_FALSE(isIpLiteral("localhost"));
  REQUIRE_FALSE(isIpLiteral("256.1.1.1"));
  REQUIRE_FALSE(isIpLiteral(""));

  REQUIRE(isUnspecifiedAddress(""));
  REQUIRE(isUnspecifiedAddress("0.0.0.0"));
  REQUIRE(isUnspecifiedAddress("::"));
  REQUIRE_FALSE(isUnspecifiedAddress("127.0.0.1"));

  REQUIRE(IPv4::isPrivate("10.1.2.3"));
  REQUIRE(IPv4::isPrivate("172.16.0.1"));
  REQUIRE(IPv4::isPrivate("172.31.255.255"));
  REQUIRE_FALSE(IPv4::isPrivate("172.32.0.1"));
  REQUIRE(IPv4::isPrivate("192.168.1.1"));
  REQUIRE_FALSE(IPv4::isPrivate("8.8.8.8"));
  REQUIRE_FALSE(IPv4::isPrivate("not-an-ip"));

  std::uint32_t v = 0;
  REQUIRE(IPv4::parse("127.0.0.1", v));
  REQUIRE(IPv4::isLoopback(v));
}

TEST_CASE("resolveAddress keeps literals and resolves names", "[ip_utils]")
{
  REQUIRE(resolveAddress("10.0.0.1:7946") == "10.0.0.1:7946");
  auto local = resolveAddress("localhost:7946");
  REQUIRE((local == "127.0.0.1:7946" || local == "[::1]:7946"));
  REQUIRE(errorOf([] { resolveAddress("no-such-host.invalid:1"); }) == TransportError::Resolve);
}

TEST_CASE("sockaddrToString renders both families", "[ip_utils]")
{
  sockaddr_storage ss{};
  auto *sin = reinterpret_cast<sockaddr_in *>(&ss);
  sin->sin_family = AF_INET;
  sin->sin_port = htons(7946);
  ::inet_pton(AF_INET, "192.168.0.7", &sin->sin_addr);
  REQUIRE(sockaddrToString(ss) == "192.168.0.7:7946");

  std::memset(&ss, 0, sizeof(ss));
  auto *sin6 = reinterpret_cast<sockaddr_in6 *>(&ss);
  sin6->sin6_family = AF_INET6;
  sin6->sin6_port = htons(80);
  ::inet_pton(AF_INET6, "::1", &sin6->sin6_addr);
  REQUIRE(sockaddrToString(ss) == "[::1]:80");
}
