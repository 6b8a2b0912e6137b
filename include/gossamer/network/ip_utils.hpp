// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Gossamer, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

/// \file ip_utils.hpp
/// \brief Address helpers: IPv4 classification, host:port handling, name
/// resolution and private interface discovery.

#pragma once

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <array>
#include <cctype>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string>
#include <utility>

#include "gossamer/network/transport_types.hpp"

namespace gossamer
{
namespace network
{

/// \brief IPv4 address parsing and classification
class IPv4
{
public:
  /// \brief Parse a dotted quad into host byte order. Leading zeros are
  /// rejected to avoid octal ambiguity.
  static bool parse(const std::string &ip, std::uint32_t &result)
  {
    std::array<std::uint32_t, 4> octets{};
    std::size_t pos = 0;
    for (std::size_t i = 0; i < 4; ++i)
    {
      if (i > 0)
      {
        if (pos >= ip.size() || ip[pos] != '.')
        {
          return false;
        }
        ++pos;
      }
      std::size_t start = pos;
      std::uint32_t octet = 0;
      while (pos < ip.size() && std::isdigit(static_cast<unsigned char>(ip[pos])))
      {
        octet = octet * 10 + static_cast<std::uint32_t>(ip[pos] - '0');
        if (octet > 255)
        {
          return false;
        }
        ++pos;
      }
      if (pos == start || (pos - start > 1 && ip[start] == '0'))
      {
        return false;
      }
      octets[i] = octet;
    }
    if (pos != ip.size())
    {
      return false;
    }
    result = (octets[0] << 24) | (octets[1] << 16) | (octets[2] << 8) | octets[3];
    return true;
  }

  static bool isValid(const std::string &ip)
  {
    std::uint32_t unused = 0;
    return parse(ip, unused);
  }

  /// \brief RFC1918: 10/8, 172.16/12, 192.168/16
  static bool isPrivate(std::uint32_t ip)
  {
    return (ip & 0xFF000000) == 0x0A000000 || (ip & 0xFFF00000) == 0xAC100000 ||
           (ip & 0xFFFF0000) == 0xC0A80000;
  }

  static bool isPrivate(const std::string &ip)
  {
    std::uint32_t v = 0;
    return parse(ip, v) && isPrivate(v);
  }

  static bool isLoopback(std::uint32_t ip) { return (ip & 0xFF000000) == 0x7F000000; }
};

/// \brief True for "", "0.0.0.0", "::" and "[::]".
inline bool isUnspecifiedAddress(const std::string &host)
{
  return host.empty() || host == "0.0.0.0" || host == "::" || host == "[::]";
}

/// \brief True if \p host is a literal IPv4 or IPv6 address.
inline bool isIpLiteral(const std::string &host)
{
  in6_addr a6{};
  return IPv4::isValid(host) || ::inet_pton(AF_INET6, host.c_str(), &a6) == 1;
}

/// \brief Format "host:port", bracketing IPv6 literals.
inline std::string joinHostPort(const std::string &host, std::uint16_t port)
{
  if (host.find(':') != std::string::npos)
  {
    return "[" + host + "]:" + std::to_string(port);
  }
  return host + ":" + std::to_string(port);
}

/// \brief Split "host:port" or "[v6]:port".
/// \throws TransportException(Resolve) on a malformed address
inline std::pair<std::string, std::uint16_t> splitHostPort(const std::string &address)
{
  std::string host;
  std::string portStr;
  if (!address.empty() && address[0] == '[')
  {
    auto close = address.find(']');
    if (close == std::string::npos || close + 1 >= address.size() || address[close + 1] != ':')
    {
      throw TransportException(TransportError::Resolve, "malformed address: " + address);
    }
    host = address.substr(1, close - 1);
    portStr = address.substr(close + 2);
  }
  else
  {
    auto colon = address.rfind(':');
    if (colon == std::string::npos || address.find(':') != colon)
    {
      throw TransportException(TransportError::Resolve, "missing port in address: " + address);
    }
    host = address.substr(0, colon);
    portStr = address.substr(colon + 1);
  }
  if (portStr.empty() || portStr.size() > 5)
  {
    throw TransportException(TransportError::Resolve, "invalid port in address: " + address);
  }
  unsigned long port = 0;
  for (char c : portStr)
  {
    if (!std::isdigit(static_cast<unsigned char>(c)))
    {
      throw TransportException(TransportError::Resolve, "invalid port in address: " + address);
    }
    port = port * 10 + static_cast<unsigned long>(c - '0');
  }
  if (port > 65535)
  {
    throw TransportException(TransportError::Resolve, "port out of range: " + address);
  }
  return {host, static_cast<std::uint16_t>(port)};
}

/// \brief Resolve \p host to a numeric address (first result, IPv4 preferred).
/// \throws TransportException(Resolve)
inline std::string resolveHost(const std::string &host)
{
  if (isIpLiteral(host))
  {
    return host;
  }
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo *res = nullptr;
  int rc = ::getaddrinfo(host.c_str(), nullptr, &hints, &res);
  if (rc != 0 || !res)
  {
    throw TransportException(TransportError::Resolve,
                             "cannot resolve " + host + ": " + ::gai_strerror(rc));
  }
  std::string v4;
  std::string v6;
  char buf[INET6_ADDRSTRLEN] = {0};
  for (addrinfo *ai = res; ai; ai = ai->ai_next)
  {
    if (ai->ai_family == AF_INET && v4.empty())
    {
      auto *sin = reinterpret_cast<sockaddr_in *>(ai->ai_addr);
      ::inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf));
      v4 = buf;
    }
    else if (ai->ai_family == AF_INET6 && v6.empty())
    {
      auto *sin6 = reinterpret_cast<sockaddr_in6 *>(ai->ai_addr);
      ::inet_ntop(AF_INET6, &sin6->sin6_addr, buf, sizeof(buf));
      v6 = buf;
    }
  }
  ::freeaddrinfo(res);
  if (!v4.empty())
  {
    return v4;
  }
  if (!v6.empty())
  {
    return v6;
  }
  throw TransportException(TransportError::Resolve, "no usable address for " + host);
}

/// \brief Resolve the host part of "host:port", returning "ip:port".
inline std::string resolveAddress(const std::string &address)
{
  auto hp = splitHostPort(address);
  return joinHostPort(resolveHost(hp.first), hp.second);
}

/// \brief First RFC1918 IPv4 address on an interface that is up.
inline std::optional<std::string> privateInterfaceAddress()
{
  ifaddrs *ifs = nullptr;
  if (::getifaddrs(&ifs) != 0)
  {
    return std::nullopt;
  }
  std::optional<std::string> found;
  for (ifaddrs *it = ifs; it && !found; it = it->ifa_next)
  {
    if (!it->ifa_addr || it->ifa_addr->sa_family != AF_INET || !(it->ifa_flags & IFF_UP))
    {
      continue;
    }
    auto *sin = reinterpret_cast<sockaddr_in *>(it->ifa_addr);
    std::uint32_t ip = ntohl(sin->sin_addr.s_addr);
    if (IPv4::isPrivate(ip))
    {
      char buf[INET_ADDRSTRLEN] = {0};
      ::inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf));
      found = std::string(buf);
    }
  }
  ::freeifaddrs(ifs);
  return found;
}

/// \brief Render a socket address as "ip:port".
inline std::string sockaddrToString(const sockaddr_storage &ss)
{
  char buf[INET6_ADDRSTRLEN] = {0};
  if (ss.ss_family == AF_INET)
  {
    auto *sin = reinterpret_cast<const sockaddr_in *>(&ss);
    ::inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf));
    return joinHostPort(buf, ntohs(sin->sin_port));
  }
  if (ss.ss_family == AF_INET6)
  {
    auto *sin6 = reinterpret_cast<const sockaddr_in6 *>(&ss);
    ::inet_ntop(AF_INET6, &sin6->sin6_addr, buf, sizeof(buf));
    return joinHostPort(buf, ntohs(sin6->sin6_port));
  }
  return std::string();
}

} // namespace network
} // namespace gossamer
