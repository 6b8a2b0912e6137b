// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Gossamer, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <string>
#include <utility>
#include <vector>

namespace gossamer
{
namespace network
{

/// Application protocol identifier negotiated on every session.
inline constexpr const char *kMuxAlpn = "gossamer-mux/1";

/// \brief Mutual-TLS material and policy for both sides of a session.
///
/// The transport treats this as an opaque value: it is copied into the SSL
/// contexts at bind time and cloned per dial with the expected peer name.
struct TlsConfig
{
  std::string certPem; ///< local certificate chain (leaf first)
  std::string keyPem;
  std::string caPem; ///< trust anchors for the peer certificate
  std::string ciphers; ///< TLS 1.2 cipher list; empty keeps OpenSSL defaults
  std::vector<std::string> alpn;
  std::string serverName; ///< expected peer name when dialing (IP or DNS)
  bool verifyPeer{true};
  bool requireClientCert{true};
  bool tls13Only{true};

  bool empty() const { return certPem.empty() || keyPem.empty(); }

  TlsConfig cloneWithServerName(const std::string &name) const
  {
    TlsConfig c = *this;
    c.serverName = name;
    return c;
  }

  TlsConfig cloneWithAlpn(std::vector<std::string> protos) const
  {
    TlsConfig c = *this;
    c.alpn = std::move(protos);
    return c;
  }
};

} // namespace network
} // namespace gossamer
