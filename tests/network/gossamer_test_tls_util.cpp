// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// Tests for certificate generation, mutual TLS configuration and peer identity

#define CATCH_CONFIG_MAIN
#include "fake_session.hpp"
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <gossamer/network/tls_util.hpp>

#include <functional>

#include <openssl/pem.h>
#include <openssl/x509v3.h>

using namespace gossamer::network;
using gossamer::test::FakeSession;
using gossamer::test::TestPki;

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

tls::X509Ptr parseCert(const std::string &pem)
{
  auto certs = tls::readCerts(pem);
  REQUIRE(certs.size() == 1);
  return std::move(certs[0]);
}

std::shared_ptr<MuxSession> sessionWithPeer(std::optional<std::string> cn)
{
  MuxSession::Options opts;
  opts.peerCommonName = std::move(cn);
  return std::make_shared<MuxSession>(opts, [](ByteBuffer &&, bool) -> bool { return true; });
}
} // namespace

// ══════════════════════════════════════════════════════════════════════════
// Certificates
// ══════════════════════════════════════════════════════════════════════════

TEST_CASE("generateCa issues a self-signed authority", "[tls_util][certs]")
{
  gossamer::test::initializeTestLogging();
  auto ca = generateCa("cluster", std::chrono::hours(1));
  REQUIRE(ca.certPem.find("BEGIN CERTIFICATE") != std::string::npos);
  REQUIRE(ca.keyPem.find("PRIVATE KEY") != std::string::npos);

  auto cert = parseCert(ca.certPem);
  REQUIRE(X509_check_ca(cert.get()) == 1);
  REQUIRE(X509_check_issued(cert.get(), cert.get()) == X509_V_OK);
}

TEST_CASE("generateNodeCert carries the node id and IP SANs", "[tls_util][certs]")
{
  TestPki pki;

  auto node = generateNodeCertWithIps(pki.ca().certPem, pki.ca().keyPem, "node-7",
                                      {"127.0.0.1", "10.1.2.3"}, std::chrono::hours(1));
  auto cert = parseCert(node.certPem);
  auto ca = parseCert(pki.ca().certPem);

  REQUIRE(X509_check_issued(ca.get(), cert.get()) == X509_V_OK);
  REQUIRE(X509_check_ca(cert.get()) == 0);
  REQUIRE(X509_check_ip_asc(cert.get(), "10.1.2.3", 0) == 1);
  REQUIRE(X509_check_ip_asc(cert.get(), "127.0.0.1", 0) == 1);
  REQUIRE(X509_check_ip_asc(cert.get(), "10.1.2.4", 0) == 0);

  char cn[64] = {};
  X509_NAME_get_text_by_NID(X509_get_subject_name(cert.get()), NID_commonName, cn, sizeof(cn));
  REQUIRE(std::string(cn) == "node-7");

  REQUIRE(errorOf(
            [&]
            {
              generateNodeCertWithIps(pki.ca().certPem, pki.ca().keyPem, "node-8",
                                      {"example.org"}, std::chrono::hours(1));
            }) == TransportError::Config);

  auto plain = generateNodeCert(pki.ca().certPem, pki.ca().keyPem, "node-9", std::chrono::hours(1));
  REQUIRE(X509_check_ip_asc(parseCert(plain.certPem).get(), "127.0.0.1", 0) == 0);
}

TEST_CASE("mutualTlsConfig validates its inputs", "[tls_util][config]")
{
  TestPki pki;
  auto node = generateNodeCert(pki.ca().certPem, pki.ca().keyPem, "node-1", std::chrono::hours(1));

  auto cfg = mutualTlsConfig(node.certPem, node.keyPem, pki.ca().certPem);
  REQUIRE(cfg.verifyPeer);
  REQUIRE(cfg.requireClientCert);
  REQUIRE(cfg.tls13Only);
  REQUIRE_FALSE(cfg.empty());

  REQUIRE(errorOf([&] { mutualTlsConfig("garbage", node.keyPem, pki.ca().certPem); }) ==
          TransportError::Config);
  REQUIRE(errorOf([&] { mutualTlsConfig(node.certPem, "garbage", pki.ca().certPem); }) ==
          TransportError::Config);
  REQUIRE(errorOf([&] { mutualTlsConfig(node.certPem, node.keyPem, ""); }) ==
          TransportError::Config);
}

TEST_CASE("TlsConfig clones keep credentials", "[tls_util][config]")
{
  TestPki pki;
  auto base = pki.nodeTls("node-1");
  auto dial = base.cloneWithServerName("127.0.0.1").cloneWithAlpn({kMuxAlpn});

  REQUIRE(dial.certPem == base.certPem);
  REQUIRE(dial.serverName == "127.0.0.1");
  REQUIRE(dial.alpn == std::vector<std::string>{kMuxAlpn});
  REQUIRE(base.serverName.empty());
  REQUIRE(base.alpn.empty());
}

// ══════════════════════════════════════════════════════════════════════════
// Contexts
// ══════════════════════════════════════════════════════════════════════════

TEST_CASE("buildContext requires credentials", "[tls_util][context]")
{
  REQUIRE(errorOf([] { tls::buildContext(TlsConfig{}, false, nullptr); }) ==
          TransportError::Config);

  TestPki pki;
  auto cfg = pki.nodeTls("node-1");
  auto wire = tls::alpnWire({kMuxAlpn});
  SSL_CTX *server = tls::buildContext(cfg, true, &wire);
  REQUIRE(server != nullptr);
  SSL_CTX_free(server);

  auto mismatched = cfg;
  mismatched.keyPem = generateNodeCert(pki.ca().certPem, pki.ca().keyPem, "other",
                                       std::chrono::hours(1))
                        .keyPem;
  REQUIRE(errorOf([&] { tls::buildContext(mismatched, false, nullptr); }) ==
          TransportError::Config);
}

TEST_CASE("alpnWire length-prefixes each protocol", "[tls_util][context]")
{
  auto wire = tls::alpnWire({"h2", "", "gossamer-mux/1"});
  std::vector<unsigned char> expected{2, 'h', '2', 14};
  expected.insert(expected.end(), {'g', 'o', 's', 's', 'a', 'm', 'e', 'r', '-', 'm', 'u', 'x', '/',
                                   '1'});
  REQUIRE(wire == expected);
  REQUIRE(tls::alpnWire({}).empty());
}

// ══════════════════════════════════════════════════════════════════════════
// Peer identity
// ══════════════════════════════════════════════════════════════════════════

TEST_CASE("nodeIdFromSession reads the peer Common Name", "[tls_util][identity]")
{
  FakeSession fake(1, "127.0.0.1:9000");
  REQUIRE(nodeIdFromSession(fake) == "fake-peer");

  auto named = sessionWithPeer(std::string("node-3"));
  REQUIRE(nodeIdFromSession(*named) == "node-3");

  auto anonymous = sessionWithPeer(std::nullopt);
  REQUIRE(errorOf([&] { nodeIdFromSession(*anonymous); }) == TransportError::NoPeerIdentity);

  auto unnamed = sessionWithPeer(std::string());
  REQUIRE(errorOf([&] { nodeIdFromSession(*unnamed); }) == TransportError::NoPeerIdentity);
}
