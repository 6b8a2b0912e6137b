// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// Tests for ConfigLoader and the transport configuration built on it

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <gossamer/core/config_loader.hpp>
#include <gossamer/network/transport_config.hpp>

using gossamer::core::ConfigLoader;
using gossamer::core::Json;
using gossamer::network::TransportError;
using gossamer::network::TransportException;
using gossamer::test::TempFile;

namespace
{
TransportError configErrorOf(const ConfigLoader &loader)
{
  try
  {
    gossamer::network::loadTransportConfig(loader);
  }
  catch (const TransportException &ex)
  {
    return ex.code();
  }
  return TransportError::None;
}
} // namespace

// ══════════════════════════════════════════════════════════════════════════
// ConfigLoader
// ══════════════════════════════════════════════════════════════════════════

TEST_CASE("ConfigLoader reads typed values by dotted key", "[config][loader]")
{
  TempFile file("gossamer_cfg", R"({
    "transport": {
      "bindAddr": "127.0.0.1",
      "bindPort": 7946,
      "reusePortForDial": false,
      "seeds": ["a:1", "b:2"]
    }
  })");

  ConfigLoader loader(file.path());
  REQUIRE(loader.getString("transport.bindAddr") == std::string("127.0.0.1"));
  REQUIRE(loader.getInt("transport.bindPort") == 7946);
  REQUIRE(loader.getBool("transport.reusePortForDial") == false);

  auto seeds = loader.getStringArray("transport.seeds");
  REQUIRE(seeds);
  REQUIRE(seeds->size() == 2);
  REQUIRE((*seeds)[1] == "b:2");

  REQUIRE_FALSE(loader.getInt("transport.missing"));
  REQUIRE_FALSE(loader.getString("nothing.here.at.all"));
  REQUIRE(loader.contains("transport"));
  REQUIRE_FALSE(loader.contains("transport.bindAddr.deeper"));
}

TEST_CASE("ConfigLoader throws on a type mismatch", "[config][loader]")
{
  auto loader = ConfigLoader::fromJson(Json{{"a", "text"}, {"b", 12}, {"c", {1, 2}}});

  REQUIRE_THROWS_AS(loader.getInt("a"), std::runtime_error);
  REQUIRE_THROWS_AS(loader.getBool("b"), std::runtime_error);
  REQUIRE_THROWS_AS(loader.getString("b"), std::runtime_error);
  REQUIRE_THROWS_AS(loader.getStringArray("c"), std::runtime_error);
  REQUIRE_THROWS_AS(loader.getStringArray("a"), std::runtime_error);
}

TEST_CASE("ConfigLoader rejects unreadable or invalid files", "[config][loader]")
{
  REQUIRE_THROWS_AS(ConfigLoader("/nonexistent/gossamer.json"), std::runtime_error);

  TempFile broken("gossamer_cfg_broken", "{ not json");
  REQUIRE_THROWS_AS(ConfigLoader(broken.path()), std::runtime_error);

  TempFile array("gossamer_cfg_array", "[1, 2, 3]");
  REQUIRE_THROWS_AS(ConfigLoader(array.path()), std::runtime_error);
}

TEST_CASE("ConfigLoader reload keeps the previous document on failure", "[config][loader]")
{
  std::string path = "/tmp/gossamer_cfg_reload_" + std::to_string(::getpid());
  {
    std::ofstream out(path);
    out << R"({"transport": {"bindPort": 1}})";
  }
  ConfigLoader loader(path);
  REQUIRE(loader.getInt("transport.bindPort") == 1);

  {
    std::ofstream out(path, std::ios::trunc);
    out << "garbage";
  }
  REQUIRE_FALSE(loader.reload());
  REQUIRE(loader.getInt("transport.bindPort") == 1);

  {
    std::ofstream out(path, std::ios::trunc);
    out << R"({"transport": {"bindPort": 2}})";
  }
  REQUIRE(loader.reload());
  REQUIRE(loader.getInt("transport.bindPort") == 2);
  std::remove(path.c_str());
}

// ══════════════════════════════════════════════════════════════════════════
// Transport configuration
// ══════════════════════════════════════════════════════════════════════════

TEST_CASE("Transport config defaults apply to missing keys", "[config][transport]")
{
  auto loader = ConfigLoader::fromJson(Json::object());
  auto cfg = gossamer::network::loadTransportConfig(loader).withDefaults();

  REQUIRE(cfg.bindAddr == "0.0.0.0");
  REQUIRE(cfg.bindPort == 0);
  REQUIRE_FALSE(cfg.tls);
  REQUIRE(cfg.packetQueueSize == gossamer::network::kDefaultPacketQueueSize);
  REQUIRE(cfg.streamQueueSize == gossamer::network::kDefaultStreamQueueSize);
  REQUIRE(cfg.maxIdleTimeout == gossamer::network::kDefaultMaxIdleTimeout);
  REQUIRE(cfg.keepAlivePeriod == gossamer::network::kDefaultKeepAlivePeriod);
  REQUIRE(cfg.poolSweepInterval == gossamer::network::kDefaultPoolSweepInterval);
  REQUIRE(cfg.maxConnectionAge.count() == 0);
}

TEST_CASE("Transport config reads every documented key", "[config][transport]")
{
  auto loader = ConfigLoader::fromJson(Json::parse(R"({
    "transport": {
      "bindAddr": "10.1.2.3",
      "bindPort": 7946,
      "maxIdleTimeoutMs": 5000,
      "keepAlivePeriodMs": 1000,
      "packetQueueSize": 64,
      "streamQueueSize": 4,
      "maxConnectionAgeMs": 60000,
      "poolSweepIntervalMs": 250,
      "maxDatagramSize": 900,
      "handshakeTimeoutMs": 2000,
      "reusePortForDial": false,
      "streamReceiveWindow": 65536
    }
  })"));

  auto cfg = gossamer::network::loadTransportConfig(loader);
  REQUIRE(cfg.bindAddr == "10.1.2.3");
  REQUIRE(cfg.bindPort == 7946);
  REQUIRE(cfg.maxIdleTimeout == std::chrono::milliseconds(5000));
  REQUIRE(cfg.keepAlivePeriod == std::chrono::milliseconds(1000));
  REQUIRE(cfg.packetQueueSize == 64);
  REQUIRE(cfg.streamQueueSize == 4);
  REQUIRE(cfg.maxConnectionAge == std::chrono::milliseconds(60000));
  REQUIRE(cfg.poolSweepInterval == std::chrono::milliseconds(250));
  REQUIRE(cfg.maxDatagramSize == 900);
  REQUIRE(cfg.handshakeTimeout == std::chrono::milliseconds(2000));
  REQUIRE_FALSE(cfg.reusePortForDial);
  REQUIRE(cfg.streamReceiveWindow == 65536);
}

TEST_CASE("Transport config rejects invalid values", "[config][transport]")
{
  SECTION("port out of range")
  {
    auto loader = ConfigLoader::fromJson(Json{{"transport", {{"bindPort", 70000}}}});
    REQUIRE(configErrorOf(loader) == TransportError::Config);
  }
  SECTION("negative queue size")
  {
    auto loader = ConfigLoader::fromJson(Json{{"transport", {{"packetQueueSize", -1}}}});
    REQUIRE(configErrorOf(loader) == TransportError::Config);
  }
  SECTION("wrong type")
  {
    auto loader = ConfigLoader::fromJson(Json{{"transport", {{"maxIdleTimeoutMs", "30s"}}}});
    REQUIRE(configErrorOf(loader) == TransportError::Config);
  }
  SECTION("partial TLS material")
  {
    auto loader =
      ConfigLoader::fromJson(Json{{"transport", {{"tls", {{"certFile", "/tmp/node.pem"}}}}}});
    REQUIRE(configErrorOf(loader) == TransportError::Config);
  }
  SECTION("missing TLS files")
  {
    auto loader = ConfigLoader::fromJson(
      Json{{"transport",
            {{"tls",
              {{"certFile", "/nonexistent/c.pem"},
               {"keyFile", "/nonexistent/k.pem"},
               {"caFile", "/nonexistent/ca.pem"}}}}}});
    REQUIRE(configErrorOf(loader) == TransportError::Config);
  }
}

TEST_CASE("Transport config loads TLS material from files", "[config][transport][tls]")
{
  gossamer::test::TestPki pki;
  auto node = gossamer::network::generateNodeCertWithIps(pki.ca().certPem, pki.ca().keyPem,
                                                         "node-1", {"127.0.0.1"},
                                                         std::chrono::hours(1));
  TempFile cert("gossamer_cert", node.certPem);
  TempFile key("gossamer_key", node.keyPem);
  TempFile ca("gossamer_ca", pki.ca().certPem);
  TempFile file("gossamer_cfg_tls", Json{{"transport",
                                          {{"bindPort", 7000},
                                           {"tls",
                                            {{"certFile", cert.path()},
                                             {"keyFile", key.path()},
                                             {"caFile", ca.path()}}}}}}
                                       .dump());

  auto cfg = gossamer::network::loadTransportConfig(file.path());
  REQUIRE(cfg.bindPort == 7000);
  REQUIRE(cfg.tls);
  REQUIRE(cfg.tls->certPem == node.certPem);
  REQUIRE(cfg.tls->keyPem == node.keyPem);
  REQUIRE(cfg.tls->caPem == pki.ca().certPem);
}

TEST_CASE("Transport config from a missing file is a Config error", "[config][transport]")
{
  try
  {
    gossamer::network::loadTransportConfig("/nonexistent/gossamer.json");
    FAIL("expected an exception");
  }
  catch (const TransportException &ex)
  {
    REQUIRE(ex.code() == TransportError::Config);
  }
}

TEST_CASE("Logging config sets the level", "[config][logging]")
{
  auto previous = gossamer::core::Logger::getLevel();

  auto loader = ConfigLoader::fromJson(Json{{"log", {{"level", "warn"}}}});
  gossamer::network::applyLoggingConfig(loader);
  REQUIRE(gossamer::core::Logger::getLevel() == gossamer::core::Logger::Level::Warning);

  auto bad = ConfigLoader::fromJson(Json{{"log", {{"level", "loud"}}}});
  REQUIRE_THROWS_AS(gossamer::network::applyLoggingConfig(bad), TransportException);

  gossamer::core::Logger::init(previous);
}
