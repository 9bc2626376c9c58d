// Copyright (c) 2025 Omnilink Authors
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Omnilink, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "omnilink/client/client.hpp"
#include "omnilink/client/client_config.hpp"
#include "omnilink/core/logger.hpp"

namespace omnilink
{
namespace client
{

/// \brief Owns one Client per chain id.
///
/// Clients are created on first access and live until disconnectAll() or
/// the factory's destruction. References returned by get() stay valid until
/// then.
class ClientFactory
{
public:
  explicit ClientFactory(FactoryConfig config) : _config(std::move(config)) {}

  ~ClientFactory() { disconnectAll(); }

  ClientFactory(const ClientFactory &) = delete;
  ClientFactory &operator=(const ClientFactory &) = delete;

  /// \brief Client for \p chainId, created with the default configuration
  /// and any per-chain endpoint override.
  /// \throws core::ConfigError if the resulting configuration is invalid
  Client &get(std::uint64_t chainId)
  {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _clients.find(chainId);
    if (it != _clients.end())
    {
      return *it->second;
    }

    ClientConfig cfg = _config.forChain(chainId);
    if (!_sharedClientId.empty())
    {
      cfg.clientId = _sharedClientId;
    }
    auto client = std::make_unique<Client>(std::move(cfg));
    Client &ref = *client;
    _clients.emplace(chainId, std::move(client));
    OMNILINK_LOG_DEBUG("ClientFactory: created client for chain " << chainId);
    return ref;
  }

  /// \brief Client for the chain a legacy RPC URL points at.
  Client &getForRpcUrl(const std::string &rpcUrl) { return get(chainIdForRpcUrl(rpcUrl)); }

  std::vector<Client *> getAll()
  {
    std::lock_guard<std::mutex> lock(_mutex);
    std::vector<Client *> out;
    out.reserve(_clients.size());
    for (auto &entry : _clients)
    {
      out.push_back(entry.second.get());
    }
    return out;
  }

  /// \brief Disconnect and destroy every cached client.
  void disconnectAll()
  {
    std::map<std::uint64_t, std::unique_ptr<Client>> clients;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      clients.swap(_clients);
    }
    for (auto &entry : clients)
    {
      entry.second->disconnect();
    }
    if (!clients.empty())
    {
      OMNILINK_LOG_INFO("ClientFactory: disconnected " << clients.size() << " client(s)");
    }
  }

  /// \brief Client id used by clients created after this call. Empty
  /// restores per-client generated ids.
  void setSharedClientId(const std::string &clientId)
  {
    std::lock_guard<std::mutex> lock(_mutex);
    _sharedClientId = clientId;
  }

  std::size_t size() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _clients.size();
  }

  /// \brief Chain id implied by the host of a legacy RPC URL; 1 when
  /// nothing matches.
  static std::uint64_t chainIdForRpcUrl(const std::string &rpcUrl)
  {
    std::string url = rpcUrl;
    std::transform(url.begin(), url.end(), url.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto has = [&url](const char *needle) { return url.find(needle) != std::string::npos; };

    if (has("polygon") || has("matic"))
    {
      return 137;
    }
    if (has("bsc") || has("binance"))
    {
      return 56;
    }
    if (has("avalanche") || has("avax"))
    {
      return 43114;
    }
    if (has("arbitrum"))
    {
      return 42161;
    }
    if (has("optimism"))
    {
      return 10;
    }
    if (has("base"))
    {
      return 8453;
    }
    return 1;
  }

private:
  FactoryConfig _config;
  std::string _sharedClientId;
  mutable std::mutex _mutex;
  std::map<std::uint64_t, std::unique_ptr<Client>> _clients;
};

} // namespace client
} // namespace omnilink
