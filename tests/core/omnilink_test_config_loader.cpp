// Copyright (c) 2025 Omnilink Authors
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Omnilink, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <cstdio>
#include <fstream>

using omnilink::client::BroadcastRoute;
using omnilink::client::ClientConfig;
using omnilink::client::FactoryConfig;
using omnilink::core::ConfigError;
using omnilink::core::ConfigLoader;
using omnilink::core::Json;

TEST_CASE("ConfigLoader basic operations", "[config][ConfigLoader]")
{
  const std::string cfgFile = "omnilink_test_config.json";
  {
    std::ofstream out(cfgFile);
    out << "{\n"
        << "  \"section\": { \"int_val\": 42, \"bool_val\": true, \"str_val\": \"hello\",\n"
        << "               \"list\": [\"a\", \"b\"] },\n"
        << "  \"other\": { \"float_val\": 3.14 }\n"
        << "}\n";
  }

  ConfigLoader loader(cfgFile);

  SECTION("Reload and load returns table")
  {
    REQUIRE(loader.reload());
    const auto &tbl = loader.load();
    REQUIRE(tbl.contains("section"));
    REQUIRE(tbl.contains("other"));
  }

  SECTION("get<T> returns correct values")
  {
    REQUIRE(loader.get<std::int64_t>("section.int_val").value() == 42);
    REQUIRE(loader.get<bool>("section.bool_val").value());
    REQUIRE(loader.get<std::string>("section.str_val").value() == "hello");
    REQUIRE_FALSE(loader.get<std::int64_t>("section.missing").has_value());
    REQUIRE_FALSE(loader.get<std::int64_t>("section.str_val").has_value());
  }

  SECTION("getInt, getBool, getString, getStringArray work as expected")
  {
    REQUIRE(loader.getInt("section.int_val").value() == 42);
    REQUIRE(loader.getBool("section.bool_val").value());
    REQUIRE(loader.getString("section.str_val").value() == "hello");
    REQUIRE(loader.getStringArray("section.list").value() == std::vector<std::string>{"a", "b"});
    REQUIRE_FALSE(loader.getStringArray("section.int_val").has_value());
    REQUIRE(loader.contains("other.float_val"));
    REQUIRE_FALSE(loader.contains("other.float_val.deeper"));
  }

  std::remove(cfgFile.c_str());
}

TEST_CASE("ConfigLoader reports a missing file", "[config][ConfigLoader]")
{
  REQUIRE_THROWS_AS(ConfigLoader("does_not_exist_omnilink.json"), ConfigError);
}

TEST_CASE("ClientConfig reads the client section", "[config][ClientConfig]")
{
  auto loader = ConfigLoader::fromJson(Json::parse(R"({
    "client": {
      "endpoints": ["wss://v1.example.com:8546", "ws://localhost:8546"],
      "sharedSecret": "s3cret",
      "clientId": "omni_fixed",
      "chainId": 137,
      "reconnect": { "baseDelayMs": 500, "maxDelayMs": 8000, "maxAttempts": 7 },
      "call": { "timeoutMs": 5000, "connectGracePeriodMs": 250, "sweepIntervalMs": 50 },
      "broadcast": { "route": "jsonrpc-http", "url": "https://rpc.example.com" },
      "tls": { "verifyPeer": false, "caFile": "/etc/ssl/ca.pem" },
      "maxMessageSize": 65536
    }
  })"));

  auto cfg = ClientConfig::fromLoader(loader);
  REQUIRE(cfg.endpoints.size() == 2);
  REQUIRE(cfg.endpoints[0] == "wss://v1.example.com:8546");
  REQUIRE(cfg.sharedSecret == "s3cret");
  REQUIRE(cfg.protocolVersion == "1.0.0");
  REQUIRE(cfg.clientId == "omni_fixed");
  REQUIRE(cfg.chainId == 137);
  REQUIRE(cfg.baseReconnectDelay == std::chrono::milliseconds(500));
  REQUIRE(cfg.maxReconnectDelay == std::chrono::milliseconds(8000));
  REQUIRE(cfg.maxReconnectAttempts == 7);
  REQUIRE(cfg.defaultCallTimeout == std::chrono::milliseconds(5000));
  REQUIRE(cfg.connectGracePeriod == std::chrono::milliseconds(250));
  REQUIRE(cfg.sweepInterval == std::chrono::milliseconds(50));
  REQUIRE(cfg.broadcastRoute == BroadcastRoute::JsonRpcHttp);
  REQUIRE(cfg.broadcastUrl == "https://rpc.example.com");
  REQUIRE_FALSE(cfg.tls.verifyPeer);
  REQUIRE(cfg.tls.caFile == "/etc/ssl/ca.pem");
  REQUIRE(cfg.maxMessageSize == 65536);
  REQUIRE_NOTHROW(cfg.validate());
}

TEST_CASE("ClientConfig keeps defaults for absent keys", "[config][ClientConfig]")
{
  auto loader = ConfigLoader::fromJson(Json::parse(R"({"client": {"endpoints": ["ws://a"]}})"));
  auto cfg = ClientConfig::fromLoader(loader);

  REQUIRE(cfg.sharedSecret == "omnibazaar-wallet-v1");
  REQUIRE(cfg.chainId == 1);
  REQUIRE(cfg.baseReconnectDelay == std::chrono::milliseconds(1000));
  REQUIRE(cfg.maxReconnectDelay == std::chrono::milliseconds(30000));
  REQUIRE(cfg.maxReconnectAttempts == 5);
  REQUIRE(cfg.defaultCallTimeout == std::chrono::milliseconds(30000));
  REQUIRE(cfg.connectGracePeriod == std::chrono::milliseconds(1000));
  REQUIRE(cfg.broadcastRoute == BroadcastRoute::Authenticated);
  REQUIRE(cfg.tls.verifyPeer);
  REQUIRE(cfg.clientId.empty());
}

TEST_CASE("ClientConfig rejects mistyped keys", "[config][ClientConfig]")
{
  SECTION("endpoints must be strings")
  {
    auto loader = ConfigLoader::fromJson(Json::parse(R"({"client": {"endpoints": [1, 2]}})"));
    REQUIRE_THROWS_AS(ClientConfig::fromLoader(loader), ConfigError);
  }
  SECTION("timeouts must be non-negative integers")
  {
    auto loader = ConfigLoader::fromJson(Json::parse(R"({"client": {"call": {"timeoutMs": -5}}})"));
    REQUIRE_THROWS_AS(ClientConfig::fromLoader(loader), ConfigError);
  }
  SECTION("unknown broadcast route")
  {
    auto loader = ConfigLoader::fromJson(Json::parse(R"({"client": {"broadcast": {"route": "carrier-pigeon"}}})"));
    REQUIRE_THROWS_AS(ClientConfig::fromLoader(loader), ConfigError);
  }
  SECTION("verifyPeer must be boolean")
  {
    auto loader = ConfigLoader::fromJson(Json::parse(R"({"client": {"tls": {"verifyPeer": "no"}}})"));
    REQUIRE_THROWS_AS(ClientConfig::fromLoader(loader), ConfigError);
  }
}

TEST_CASE("ClientConfig validation", "[config][validate]")
{
  ClientConfig cfg;
  cfg.endpoints = {"ws://a.test"};
  REQUIRE_NOTHROW(cfg.validate());

  SECTION("empty endpoint list")
  {
    cfg.endpoints.clear();
    REQUIRE_THROWS_AS(cfg.validate(), ConfigError);
  }
  SECTION("non websocket endpoint")
  {
    cfg.endpoints = {"https://a.test"};
    REQUIRE_THROWS_AS(cfg.validate(), ConfigError);
  }
  SECTION("empty secret")
  {
    cfg.sharedSecret.clear();
    REQUIRE_THROWS_AS(cfg.validate(), ConfigError);
  }
  SECTION("zero call timeout")
  {
    cfg.defaultCallTimeout = std::chrono::milliseconds(0);
    REQUIRE_THROWS_AS(cfg.validate(), ConfigError);
  }
  SECTION("cap below base delay")
  {
    cfg.baseReconnectDelay = std::chrono::milliseconds(5000);
    cfg.maxReconnectDelay = std::chrono::milliseconds(1000);
    REQUIRE_THROWS_AS(cfg.validate(), ConfigError);
  }
  SECTION("http broadcast without URL")
  {
    cfg.broadcastRoute = BroadcastRoute::JsonRpcHttp;
    REQUIRE_THROWS_AS(cfg.validate(), ConfigError);
    cfg.broadcastUrl = "http://127.0.0.1:8545";
    REQUIRE_NOTHROW(cfg.validate());
  }
}

TEST_CASE("FactoryConfig reads per-chain endpoint overrides", "[config][FactoryConfig]")
{
  auto loader = ConfigLoader::fromJson(Json::parse(R"({
    "client": { "endpoints": ["ws://default.test"] },
    "chains": {
      "137": { "endpoints": ["wss://polygon.test", "wss://polygon2.test"] },
      "56": {}
    }
  })"));

  auto cfg = FactoryConfig::fromLoader(loader);
  REQUIRE(cfg.chainEndpoints.size() == 1);

  auto polygon = cfg.forChain(137);
  REQUIRE(polygon.chainId == 137);
  REQUIRE(polygon.endpoints == std::vector<std::string>{"wss://polygon.test", "wss://polygon2.test"});

  auto bsc = cfg.forChain(56);
  REQUIRE(bsc.chainId == 56);
  REQUIRE(bsc.endpoints == std::vector<std::string>{"ws://default.test"});

  auto bad = ConfigLoader::fromJson(Json::parse(R"({"chains": {"mainnet": {"endpoints": ["ws://x"]}}})"));
  REQUIRE_THROWS_AS(FactoryConfig::fromLoader(bad), ConfigError);
}
