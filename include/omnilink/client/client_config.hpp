// Copyright (c) 2025 Omnilink Authors
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Omnilink, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "omnilink/core/config_loader.hpp"
#include "omnilink/network/stream_socket.hpp"
#include "omnilink/network/transport.hpp"
#include "omnilink/network/url.hpp"

namespace omnilink
{
namespace client
{

/// \brief Deploy-time shared secret used when none is configured.
inline constexpr const char *kDefaultSharedSecret = "omnibazaar-wallet-v1";
inline constexpr const char *kDefaultProtocolVersion = "1.0.0";

/// \brief Where eth_sendRawTransaction is sent.
enum class BroadcastRoute
{
  Authenticated,
  JsonRpcHttp
};

/// \brief Client configuration.
struct ClientConfig
{
  /// \brief ws:// or wss:// endpoints, tried round-robin.
  std::vector<std::string> endpoints;

  std::string sharedSecret{kDefaultSharedSecret};
  std::string protocolVersion{kDefaultProtocolVersion};

  /// \brief Empty means generate one per client.
  std::string clientId;

  std::uint64_t chainId{1};

  std::chrono::milliseconds baseReconnectDelay{1000};
  std::chrono::milliseconds maxReconnectDelay{30000};
  std::uint32_t maxReconnectAttempts{5};

  std::chrono::milliseconds defaultCallTimeout{30000};

  /// \brief How long a call waits for the connection to open before it
  /// fails with NotConnected.
  std::chrono::milliseconds connectGracePeriod{1000};

  /// \brief Upper bound between two expiry sweeps.
  std::chrono::milliseconds sweepInterval{250};

  BroadcastRoute broadcastRoute{BroadcastRoute::Authenticated};
  std::string broadcastUrl;

  network::TlsConfig tls;
  std::size_t maxMessageSize{16 * 1024 * 1024};

  /// \brief Creates one transport per connect attempt. Empty means
  /// network::WebSocketTransport.
  network::TransportFactory transportFactory;

  /// \brief Read "<section>.*" keys. Keys that are absent keep their
  /// defaults.
  /// \throws core::ConfigError if a key is present with the wrong type
  static ClientConfig fromLoader(const core::ConfigLoader &loader,
                                 const std::string &section = "client")
  {
    ClientConfig cfg;
    const std::string p = section.empty() ? "" : section + ".";

    if (auto v = stringArray(loader, p + "endpoints"))
    {
      cfg.endpoints = *v;
    }
    readString(loader, p + "sharedSecret", cfg.sharedSecret);
    readString(loader, p + "protocolVersion", cfg.protocolVersion);
    readString(loader, p + "clientId", cfg.clientId);
    if (auto v = readInt(loader, p + "chainId"))
    {
      cfg.chainId = static_cast<std::uint64_t>(*v);
    }
    readMillis(loader, p + "reconnect.baseDelayMs", cfg.baseReconnectDelay);
    readMillis(loader, p + "reconnect.maxDelayMs", cfg.maxReconnectDelay);
    if (auto v = readInt(loader, p + "reconnect.maxAttempts"))
    {
      cfg.maxReconnectAttempts = static_cast<std::uint32_t>(*v);
    }
    readMillis(loader, p + "call.timeoutMs", cfg.defaultCallTimeout);
    readMillis(loader, p + "call.connectGracePeriodMs", cfg.connectGracePeriod);
    readMillis(loader, p + "call.sweepIntervalMs", cfg.sweepInterval);

    std::string route;
    if (readString(loader, p + "broadcast.route", route))
    {
      if (route == "authenticated")
      {
        cfg.broadcastRoute = BroadcastRoute::Authenticated;
      }
      else if (route == "jsonrpc-http")
      {
        cfg.broadcastRoute = BroadcastRoute::JsonRpcHttp;
      }
      else
      {
        throw core::ConfigError("Invalid '" + p + "broadcast.route': " + route +
                                " (expected 'authenticated' or 'jsonrpc-http')");
      }
    }
    readString(loader, p + "broadcast.url", cfg.broadcastUrl);

    if (loader.contains(p + "tls.verifyPeer"))
    {
      auto v = loader.getBool(p + "tls.verifyPeer");
      if (!v)
      {
        throw core::ConfigError("'" + p + "tls.verifyPeer' must be a boolean");
      }
      cfg.tls.verifyPeer = *v;
    }
    readString(loader, p + "tls.caFile", cfg.tls.caFile);
    if (auto v = readInt(loader, p + "maxMessageSize"))
    {
      cfg.maxMessageSize = static_cast<std::size_t>(*v);
    }
    return cfg;
  }

  /// \throws core::ConfigError describing the first invalid setting
  void validate() const
  {
    if (endpoints.empty())
    {
      throw core::ConfigError("ClientConfig: endpoint list cannot be empty");
    }
    for (const auto &e : endpoints)
    {
      auto url = network::Url::parse(e);
      if (!url || !url->isWebSocket())
      {
        throw core::ConfigError("ClientConfig: endpoint must be ws:// or wss://: " + e);
      }
    }
    if (sharedSecret.empty())
    {
      throw core::ConfigError("ClientConfig: shared secret cannot be empty");
    }
    if (defaultCallTimeout.count() <= 0)
    {
      throw core::ConfigError("ClientConfig: call timeout must be positive");
    }
    if (baseReconnectDelay.count() <= 0)
    {
      throw core::ConfigError("ClientConfig: base reconnect delay must be positive");
    }
    if (maxReconnectDelay < baseReconnectDelay)
    {
      throw core::ConfigError("ClientConfig: max reconnect delay is below the base delay");
    }
    if (connectGracePeriod.count() < 0)
    {
      throw core::ConfigError("ClientConfig: connect grace period cannot be negative");
    }
    if (sweepInterval.count() <= 0)
    {
      throw core::ConfigError("ClientConfig: sweep interval must be positive");
    }
    if (maxMessageSize == 0)
    {
      throw core::ConfigError("ClientConfig: max message size must be positive");
    }
    if (broadcastRoute == BroadcastRoute::JsonRpcHttp)
    {
      auto url = network::Url::parse(broadcastUrl);
      if (!url || url->isWebSocket())
      {
        throw core::ConfigError("ClientConfig: jsonrpc-http broadcast needs an http(s) URL, got '" +
                                broadcastUrl + "'");
      }
    }
  }

private:
  static std::optional<std::vector<std::string>> stringArray(const core::ConfigLoader &loader,
                                                             const std::string &key)
  {
    if (!loader.contains(key))
    {
      return std::nullopt;
    }
    auto v = loader.getStringArray(key);
    if (!v)
    {
      throw core::ConfigError("'" + key + "' must be an array of strings");
    }
    return v;
  }

  static bool readString(const core::ConfigLoader &loader, const std::string &key, std::string &out)
  {
    if (!loader.contains(key))
    {
      return false;
    }
    auto v = loader.getString(key);
    if (!v)
    {
      throw core::ConfigError("'" + key + "' must be a string");
    }
    out = *v;
    return true;
  }

  static std::optional<std::int64_t> readInt(const core::ConfigLoader &loader, const std::string &key)
  {
    if (!loader.contains(key))
    {
      return std::nullopt;
    }
    auto v = loader.getInt(key);
    if (!v || *v < 0)
    {
      throw core::ConfigError("'" + key + "' must be a non-negative integer");
    }
    return v;
  }

  static void readMillis(const core::ConfigLoader &loader, const std::string &key,
                         std::chrono::milliseconds &out)
  {
    if (auto v = readInt(loader, key))
    {
      out = std::chrono::milliseconds(*v);
    }
  }
};

/// \brief Factory configuration: defaults for every chain plus per-chain
/// endpoint overrides read from "chains.<chainId>.endpoints".
struct FactoryConfig
{
  ClientConfig defaults;
  std::map<std::uint64_t, std::vector<std::string>> chainEndpoints;

  static FactoryConfig fromLoader(const core::ConfigLoader &loader)
  {
    FactoryConfig cfg;
    cfg.defaults = ClientConfig::fromLoader(loader, "client");

    const core::Json *chains = loader.find("chains");
    if (chains == nullptr)
    {
      return cfg;
    }
    if (!chains->is_object())
    {
      throw core::ConfigError("'chains' must be an object keyed by chain id");
    }
    for (auto it = chains->begin(); it != chains->end(); ++it)
    {
      std::uint64_t chainId = 0;
      try
      {
        std::size_t used = 0;
        chainId = std::stoull(it.key(), &used);
        if (used != it.key().size())
        {
          throw std::invalid_argument(it.key());
        }
      }
      catch (const std::exception &)
      {
        throw core::ConfigError("'chains' key is not a chain id: " + it.key());
      }
      const std::string key = "chains." + it.key() + ".endpoints";
      if (!loader.contains(key))
      {
        continue;
      }
      auto endpoints = loader.getStringArray(key);
      if (!endpoints || endpoints->empty())
      {
        throw core::ConfigError("'" + key + "' must be a non-empty array of strings");
      }
      cfg.chainEndpoints[chainId] = *endpoints;
    }
    return cfg;
  }

  /// \brief Configuration for \p chainId: the defaults with chainId set and
  /// any endpoint override applied.
  ClientConfig forChain(std::uint64_t chainId) const
  {
    ClientConfig cfg = defaults;
    cfg.chainId = chainId;
    auto it = chainEndpoints.find(chainId);
    if (it != chainEndpoints.end())
    {
      cfg.endpoints = it->second;
    }
    return cfg;
  }
};

} // namespace client
} // namespace omnilink
