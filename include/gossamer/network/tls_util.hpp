// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Gossamer, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

/// \file tls_util.hpp
/// \brief Certificate generation, mutual-TLS configuration and OpenSSL
/// context construction.

#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include "gossamer/network/ip_utils.hpp"
#include "gossamer/network/session.hpp"
#include "gossamer/network/tls_config.hpp"
#include "gossamer/network/transport_types.hpp"

namespace gossamer
{
namespace network
{

/// \brief PEM-encoded certificate and private key.
struct PemPair
{
  std::string certPem;
  std::string keyPem;
};

namespace tls
{

struct X509Deleter
{
  void operator()(X509 *p) const { X509_free(p); }
};
struct PkeyDeleter
{
  void operator()(EVP_PKEY *p) const { EVP_PKEY_free(p); }
};
struct PkeyCtxDeleter
{
  void operator()(EVP_PKEY_CTX *p) const { EVP_PKEY_CTX_free(p); }
};
struct BioDeleter
{
  void operator()(BIO *p) const { BIO_free(p); }
};
struct BnDeleter
{
  void operator()(BIGNUM *p) const { BN_free(p); }
};

using X509Ptr = std::unique_ptr<X509, X509Deleter>;
using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using BioPtr = std::unique_ptr<BIO, BioDeleter>;

/// \brief Drain the OpenSSL error queue into one message.
inline std::string lastError()
{
  std::string out;
  unsigned long e = 0;
  while ((e = ERR_get_error()) != 0)
  {
    char buf[256];
    ERR_error_string_n(e, buf, sizeof(buf));
    if (!out.empty())
    {
      out += "; ";
    }
    out += buf;
  }
  return out.empty() ? std::string("unknown OpenSSL error") : out;
}

[[noreturn]] inline void fail(const std::string &what)
{
  throw TransportException(TransportError::Config, what + ": " + lastError());
}

inline void initOnce()
{
  static std::once_flag flag;
  std::call_once(flag,
                 []
                 {
#if OPENSSL_VERSION_NUMBER < 0x10100000L
                   SSL_load_error_strings();
                   SSL_library_init();
                   OpenSSL_add_all_algorithms();
#else
                   OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS |
                                      OPENSSL_INIT_LOAD_CRYPTO_STRINGS,
                                    nullptr);
#endif
                 });
}

inline BioPtr memBio(const std::string &pem)
{
  BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
  if (!bio)
  {
    fail("BIO_new_mem_buf");
  }
  return bio;
}

/// \brief All certificates in a PEM bundle, in order.
inline std::vector<X509Ptr> readCerts(const std::string &pem)
{
  std::vector<X509Ptr> out;
  auto bio = memBio(pem);
  for (;;)
  {
    X509 *x = PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr);
    if (!x)
    {
      break;
    }
    out.emplace_back(x);
  }
  // The loop always ends on a "no start line" error.
  ERR_clear_error();
  if (out.empty())
  {
    throw TransportException(TransportError::Config, "no certificate found in PEM data");
  }
  return out;
}

inline PkeyPtr readKey(const std::string &pem)
{
  auto bio = memBio(pem);
  PkeyPtr key(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr));
  if (!key)
  {
    fail("cannot parse private key PEM");
  }
  return key;
}

inline std::string toPem(X509 *x)
{
  BioPtr bio(BIO_new(BIO_s_mem()));
  if (!bio || PEM_write_bio_X509(bio.get(), x) != 1)
  {
    fail("PEM_write_bio_X509");
  }
  char *data = nullptr;
  long n = BIO_get_mem_data(bio.get(), &data);
  return std::string(data, static_cast<std::size_t>(n));
}

inline std::string toPem(EVP_PKEY *k)
{
  BioPtr bio(BIO_new(BIO_s_mem()));
  if (!bio || PEM_write_bio_PrivateKey(bio.get(), k, nullptr, nullptr, 0, nullptr, nullptr) != 1)
  {
    fail("PEM_write_bio_PrivateKey");
  }
  char *data = nullptr;
  long n = BIO_get_mem_data(bio.get(), &data);
  return std::string(data, static_cast<std::size_t>(n));
}

/// \brief Fresh EC P-256 key.
inline PkeyPtr generateKey()
{
  std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter> ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr));
  if (!ctx || EVP_PKEY_keygen_init(ctx.get()) <= 0 ||
      EVP_PKEY_CTX_set_ec_paramgen_curve_nid(ctx.get(), NID_X9_62_prime256v1) <= 0)
  {
    fail("EC key context");
  }
  EVP_PKEY *raw = nullptr;
  if (EVP_PKEY_keygen(ctx.get(), &raw) <= 0)
  {
    fail("EVP_PKEY_keygen");
  }
  return PkeyPtr(raw);
}

inline void addExt(X509 *cert, X509 *issuer, int nid, const std::string &value)
{
  X509V3_CTX ctx;
  X509V3_set_ctx_nodb(&ctx);
  X509V3_set_ctx(&ctx, issuer, cert, nullptr, nullptr, 0);
  X509_EXTENSION *ext = X509V3_EXT_conf_nid(nullptr, &ctx, nid, value.c_str());
  if (!ext)
  {
    fail("extension " + value);
  }
  int ok = X509_add_ext(cert, ext, -1);
  X509_EXTENSION_free(ext);
  if (ok != 1)
  {
    fail("X509_add_ext");
  }
}

/// \brief Unsigned certificate skeleton: version 3, 128-bit random serial,
/// validity starting one minute in the past.
inline X509Ptr newCert(EVP_PKEY *key, std::chrono::seconds validity)
{
  X509Ptr cert(X509_new());
  if (!cert || X509_set_version(cert.get(), 2) != 1)
  {
    fail("X509_new");
  }
  std::unique_ptr<BIGNUM, BnDeleter> serial(BN_new());
  if (!serial || BN_rand(serial.get(), 128, BN_RAND_TOP_ANY, BN_RAND_BOTTOM_ANY) != 1 ||
      !BN_to_ASN1_INTEGER(serial.get(), X509_get_serialNumber(cert.get())))
  {
    fail("certificate serial");
  }
  if (!X509_gmtime_adj(X509_getm_notBefore(cert.get()), -60) ||
      !X509_gmtime_adj(X509_getm_notAfter(cert.get()), static_cast<long>(validity.count())))
  {
    fail("certificate validity");
  }
  if (X509_set_pubkey(cert.get(), key) != 1)
  {
    fail("X509_set_pubkey");
  }
  return cert;
}

/// \brief Wire format of an ALPN list: length-prefixed protocol names.
inline std::vector<unsigned char> alpnWire(const std::vector<std::string> &protos)
{
  std::vector<unsigned char> out;
  for (const auto &p : protos)
  {
    if (!p.empty() && p.size() <= 255)
    {
      out.push_back(static_cast<unsigned char>(p.size()));
      out.insert(out.end(), p.begin(), p.end());
    }
  }
  return out;
}

/// \brief Build an SSL_CTX carrying the credentials, trust anchors and
/// protocol policy of \p cfg. Caller owns the result (SSL_CTX_free).
///
/// For server contexts \p alpnPref must outlive the context; it backs the
/// ALPN selection callback.
/// \throws TransportException(Config)
inline SSL_CTX *buildContext(const TlsConfig &cfg, bool server,
                             const std::vector<unsigned char> *alpnPref)
{
  initOnce();
  if (cfg.empty())
  {
    throw TransportException(TransportError::Config, "TLS certificate and key are required");
  }
  SSL_CTX *ctx = SSL_CTX_new(server ? TLS_server_method() : TLS_client_method());
  if (!ctx)
  {
    fail(server ? "SSL_CTX_new(server)" : "SSL_CTX_new(client)");
  }
  try
  {
    SSL_CTX_set_min_proto_version(ctx, cfg.tls13Only ? TLS1_3_VERSION : TLS1_2_VERSION);
    SSL_CTX_set_mode(ctx, SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);
    if (!cfg.ciphers.empty() && SSL_CTX_set_cipher_list(ctx, cfg.ciphers.c_str()) != 1)
    {
      fail("SSL_CTX_set_cipher_list");
    }

    auto chain = readCerts(cfg.certPem);
    if (SSL_CTX_use_certificate(ctx, chain[0].get()) != 1)
    {
      fail("SSL_CTX_use_certificate");
    }
    for (std::size_t i = 1; i < chain.size(); ++i)
    {
      if (SSL_CTX_add1_chain_cert(ctx, chain[i].get()) != 1)
      {
        fail("SSL_CTX_add1_chain_cert");
      }
    }
    auto key = readKey(cfg.keyPem);
    if (SSL_CTX_use_PrivateKey(ctx, key.get()) != 1 || SSL_CTX_check_private_key(ctx) != 1)
    {
      fail("certificate and private key do not match");
    }

    if (cfg.verifyPeer)
    {
      if (cfg.caPem.empty())
      {
        throw TransportException(TransportError::Config, "peer verification requires a CA");
      }
      X509_STORE *store = SSL_CTX_get_cert_store(ctx);
      for (auto &ca : readCerts(cfg.caPem))
      {
        if (X509_STORE_add_cert(store, ca.get()) != 1)
        {
          fail("X509_STORE_add_cert");
        }
      }
      int mode = SSL_VERIFY_PEER;
      if (server && cfg.requireClientCert)
      {
        mode |= SSL_VERIFY_FAIL_IF_NO_PEER_CERT;
      }
      SSL_CTX_set_verify(ctx, mode, nullptr);
    }
    else
    {
      SSL_CTX_set_verify(ctx, SSL_VERIFY_NONE, nullptr);
    }

    if (!cfg.alpn.empty())
    {
      if (server)
      {
        SSL_CTX_set_alpn_select_cb(
          ctx,
          [](SSL *, const unsigned char **out, unsigned char *outlen, const unsigned char *in,
             unsigned int inlen, void *arg) -> int
          {
            auto *pref = static_cast<const std::vector<unsigned char> *>(arg);
            unsigned char *selected = nullptr;
            if (SSL_select_next_proto(&selected, outlen, pref->data(),
                                      static_cast<unsigned int>(pref->size()), in,
                                      inlen) != OPENSSL_NPN_NEGOTIATED)
            {
              return SSL_TLSEXT_ERR_ALERT_FATAL;
            }
            *out = selected;
            return SSL_TLSEXT_ERR_OK;
          },
          const_cast<std::vector<unsigned char> *>(alpnPref));
      }
      else
      {
        auto wire = alpnWire(cfg.alpn);
        // Unlike most OpenSSL calls this one returns 0 on success.
        if (SSL_CTX_set_alpn_protos(ctx, wire.data(), static_cast<unsigned int>(wire.size())) !=
            0)
        {
          fail("SSL_CTX_set_alpn_protos");
        }
      }
    }
  }
  catch (...)
  {
    SSL_CTX_free(ctx);
    throw;
  }
  return ctx;
}

/// \brief Configure \p ssl to verify the peer against \p name (IP literal
/// or DNS name) and send SNI for DNS names.
inline void setExpectedPeer(SSL *ssl, const std::string &name)
{
  if (name.empty())
  {
    return;
  }
  if (isIpLiteral(name))
  {
    X509_VERIFY_PARAM *param = SSL_get0_param(ssl);
    if (X509_VERIFY_PARAM_set1_ip_asc(param, name.c_str()) != 1)
    {
      fail("X509_VERIFY_PARAM_set1_ip_asc");
    }
    return;
  }
  SSL_set_tlsext_host_name(ssl, name.c_str());
  if (SSL_set1_host(ssl, name.c_str()) != 1)
  {
    fail("SSL_set1_host");
  }
}

/// \brief Common Name of the verified peer certificate.
/// \return nullopt without a peer certificate, "" when it has no CN
inline std::optional<std::string> peerCommonName(SSL *ssl)
{
#if OPENSSL_VERSION_NUMBER >= 0x30000000L
  X509Ptr cert(SSL_get1_peer_certificate(ssl));
#else
  X509Ptr cert(SSL_get_peer_certificate(ssl));
#endif
  if (!cert)
  {
    return std::nullopt;
  }
  X509_NAME *subject = X509_get_subject_name(cert.get());
  int len = subject ? X509_NAME_get_text_by_NID(subject, NID_commonName, nullptr, 0) : -1;
  if (len <= 0)
  {
    return std::string();
  }
  std::string cn(static_cast<std::size_t>(len) + 1, '\0');
  X509_NAME_get_text_by_NID(subject, NID_commonName, &cn[0], len + 1);
  cn.resize(static_cast<std::size_t>(len));
  return cn;
}

} // namespace tls

/// \brief Self-signed CA for issuing node certificates (EC P-256).
/// \throws TransportException(Config)
inline PemPair generateCa(const std::string &org, std::chrono::seconds validity)
{
  tls::initOnce();
  auto key = tls::generateKey();
  auto cert = tls::newCert(key.get(), validity);
  X509_NAME *name = X509_get_subject_name(cert.get());
  if (X509_NAME_add_entry_by_txt(name, "O", MBSTRING_ASC,
                                 reinterpret_cast<const unsigned char *>(org.c_str()), -1, -1,
                                 0) != 1 ||
      X509_set_issuer_name(cert.get(), name) != 1)
  {
    tls::fail("CA subject");
  }
  tls::addExt(cert.get(), cert.get(), NID_basic_constraints, "critical,CA:TRUE");
  tls::addExt(cert.get(), cert.get(), NID_key_usage, "critical,keyCertSign,cRLSign");
  tls::addExt(cert.get(), cert.get(), NID_subject_key_identifier, "hash");
  if (X509_sign(cert.get(), key.get(), EVP_sha256()) <= 0)
  {
    tls::fail("X509_sign(CA)");
  }
  return {tls::toPem(cert.get()), tls::toPem(key.get())};
}

/// \brief Node certificate signed by the CA, Common Name = \p nodeId, with
/// an IP SAN for each entry of \p ips.
/// \throws TransportException(Config)
inline PemPair generateNodeCertWithIps(const std::string &caCertPem, const std::string &caKeyPem,
                                       const std::string &nodeId,
                                       const std::vector<std::string> &ips,
                                       std::chrono::seconds validity)
{
  tls::initOnce();
  auto caChain = tls::readCerts(caCertPem);
  auto caKey = tls::readKey(caKeyPem);
  X509 *ca = caChain[0].get();

  auto key = tls::generateKey();
  auto cert = tls::newCert(key.get(), validity);
  X509_NAME *name = X509_get_subject_name(cert.get());
  if (X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_UTF8,
                                 reinterpret_cast<const unsigned char *>(nodeId.c_str()), -1, -1,
                                 0) != 1 ||
      X509_set_issuer_name(cert.get(), X509_get_subject_name(ca)) != 1)
  {
    tls::fail("node subject");
  }
  tls::addExt(cert.get(), ca, NID_basic_constraints, "critical,CA:FALSE");
  tls::addExt(cert.get(), ca, NID_key_usage, "critical,digitalSignature,keyEncipherment");
  tls::addExt(cert.get(), ca, NID_ext_key_usage, "serverAuth,clientAuth");
  tls::addExt(cert.get(), ca, NID_authority_key_identifier, "keyid:always");
  if (!ips.empty())
  {
    std::string san;
    for (const auto &ip : ips)
    {
      if (!isIpLiteral(ip))
      {
        throw TransportException(TransportError::Config, "not an IP address: " + ip);
      }
      if (!san.empty())
      {
        san += ',';
      }
      san += "IP:" + ip;
    }
    tls::addExt(cert.get(), ca, NID_subject_alt_name, san);
  }
  if (X509_sign(cert.get(), caKey.get(), EVP_sha256()) <= 0)
  {
    tls::fail("X509_sign(node)");
  }
  return {tls::toPem(cert.get()), tls::toPem(key.get())};
}

inline PemPair generateNodeCert(const std::string &caCertPem, const std::string &caKeyPem,
                                const std::string &nodeId, std::chrono::seconds validity)
{
  return generateNodeCertWithIps(caCertPem, caKeyPem, nodeId, {}, validity);
}

/// \brief Mutual-TLS configuration: client certificates required and
/// verified against \p caPem, TLS 1.3 minimum.
/// \throws TransportException(Config) if any PEM block does not parse
inline TlsConfig mutualTlsConfig(const std::string &certPem, const std::string &keyPem,
                                 const std::string &caPem)
{
  tls::initOnce();
  tls::readCerts(certPem);
  tls::readKey(keyPem);
  tls::readCerts(caPem);

  TlsConfig cfg;
  cfg.certPem = certPem;
  cfg.keyPem = keyPem;
  cfg.caPem = caPem;
  cfg.verifyPeer = true;
  cfg.requireClientCert = true;
  cfg.tls13Only = true;
  return cfg;
}

/// \brief Node id (certificate Common Name) of the peer of \p session.
/// \throws TransportException(NoPeerIdentity)
inline std::string nodeIdFromSession(const ISession &session)
{
  auto cn = session.peerCommonName();
  if (!cn)
  {
    throw TransportException(TransportError::NoPeerIdentity, "no peer certificates");
  }
  if (cn->empty())
  {
    throw TransportException(TransportError::NoPeerIdentity,
                             "peer certificate has no Common Name");
  }
  return *cn;
}

} // namespace network
} // namespace gossamer
