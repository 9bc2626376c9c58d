// Copyright (c) 2025 Omnilink Authors
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Omnilink, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <boost/multiprecision/cpp_int.hpp>

#include "omnilink/auth/authenticator.hpp"
#include "omnilink/client/client_config.hpp"
#include "omnilink/client/client_stats.hpp"
#include "omnilink/client/connection.hpp"
#include "omnilink/core/json.hpp"
#include "omnilink/core/logger.hpp"
#include "omnilink/core/timer.hpp"
#include "omnilink/ids/call_id.hpp"
#include "omnilink/network/json_rpc_http_client.hpp"
#include "omnilink/network/websocket_transport.hpp"
#include "omnilink/rpc/errors.hpp"
#include "omnilink/rpc/pending_call_registry.hpp"

namespace omnilink
{
namespace client
{

/// \brief Arbitrary precision unsigned/signed integer for on-chain quantities.
using BigInt = boost::multiprecision::cpp_int;

/// \brief Authenticated RPC client for one chain.
///
/// Multiplexes concurrent calls over one persistent connection to one of the
/// configured endpoints. Each call is signed, registered under a fresh 128-bit
/// id and completed by the matching response, by its deadline, or by
/// connection loss.
class Client
{
public:
  using SuccessCallback = std::function<void(core::Json)>;
  using ErrorCallback = std::function<void(std::exception_ptr)>;

  /// \throws core::ConfigError if \p config does not validate
  explicit Client(ClientConfig config)
    : _config(prepare(std::move(config))),
      _auth(auth::Identity{_config.clientId, _config.sharedSecret, _config.protocolVersion}),
      _registry(rpc::PendingCallRegistry::Options{true, _config.sweepInterval}),
      _timer("omnilink-reconnect"),
      _connection(connectionOptions(_config), _registry, _timer, &_stats)
  {
    if (_config.broadcastRoute == BroadcastRoute::JsonRpcHttp)
    {
      network::JsonRpcHttpClient::Config httpConfig;
      httpConfig.tls = _config.tls;
      httpConfig.timeout = _config.defaultCallTimeout;
      _httpClient = std::make_unique<network::JsonRpcHttpClient>(_config.broadcastUrl, httpConfig);
    }
    OMNILINK_LOG_INFO("Client: created for chain " << _config.chainId << " as " << _auth.clientId()
                                                   << " with " << _config.endpoints.size()
                                                   << " endpoint(s)");
  }

  ~Client()
  {
    _connection.shutdown();
    _timer.stop();
    _registry.stopSweeper();
    _registry.rejectAll(std::make_exception_ptr(rpc::DisconnectedError("Client destroyed")));
  }

  Client(const Client &) = delete;
  Client &operator=(const Client &) = delete;

  /// \brief Start connecting; see Connection::connect().
  void connect() { _connection.connect(); }

  /// \brief Close the connection and fail pending calls with
  /// DisconnectedError. A later call or connect() reconnects.
  void disconnect() { _connection.disconnect(); }

  /// \brief Block until the connection is open, has failed for good, or
  /// \p timeout elapses.
  bool waitForConnected(std::chrono::milliseconds timeout) { return _connection.waitForOpen(timeout); }

  bool isConnected() const { return _connection.isOpen(); }
  bool isFailed() const { return _connection.isFailed(); }
  ConnectionState state() const { return _connection.state(); }
  const std::string &clientId() const { return _auth.clientId(); }
  std::uint64_t chainId() const { return _config.chainId; }
  const ClientConfig &config() const { return _config; }
  std::size_t pendingCalls() const { return _registry.size(); }

  const ClientStats &getStats() const noexcept { return _stats; }
  void resetStats() { _stats.reset(); }

  /// \brief Issue \p method and deliver exactly one of \p onSuccess or
  /// \p onError. NotConnected is delivered on the calling thread; every
  /// other outcome on the thread that completes the call.
  void callAsync(const std::string &method, const core::Json &params, SuccessCallback onSuccess,
                 ErrorCallback onError, std::optional<std::chrono::milliseconds> timeout = std::nullopt)
  {
    sendCall(method, params, std::move(onSuccess), std::move(onError), timeout.value_or(_config.defaultCallTimeout));
  }

  std::future<core::Json> callAsync(const std::string &method, const core::Json &params,
                                    std::optional<std::chrono::milliseconds> timeout = std::nullopt)
  {
    auto promise = std::make_shared<std::promise<core::Json>>();
    auto future = promise->get_future();
    callAsync(
      method, params, [promise](core::Json result) { promise->set_value(std::move(result)); },
      [promise](std::exception_ptr error) { promise->set_exception(error); }, timeout);
    return future;
  }

  /// \brief Blocking call.
  /// \throws rpc::ClientError subclasses on failure
  core::Json call(const std::string &method, const core::Json &params,
                  std::optional<std::chrono::milliseconds> timeout = std::nullopt)
  {
    return callAsync(method, params, timeout).get();
  }

  /// \brief eth_getBalance as an integer amount in wei.
  BigInt getBalance(const std::string &address, const std::string &blockTag = "latest")
  {
    return toBigInt(call("eth_getBalance", withChainId(core::Json::array({address, blockTag}))), "eth_getBalance");
  }

  std::uint64_t getTransactionCount(const std::string &address, const std::string &blockTag = "latest")
  {
    BigInt count = toBigInt(call("eth_getTransactionCount", withChainId(core::Json::array({address, blockTag}))),
                            "eth_getTransactionCount");
    if (count < 0 || count > std::numeric_limits<std::uint64_t>::max())
    {
      throw rpc::MalformedResultError("eth_getTransactionCount: nonce out of range");
    }
    return count.convert_to<std::uint64_t>();
  }

  /// \brief eth_call; returns the hex-encoded return data.
  std::string ethCall(const core::Json &tx, const std::string &blockTag = "latest")
  {
    return toHexString(call("eth_call", withChainId(core::Json::array({tx, blockTag}))), "eth_call");
  }

  BigInt estimateGas(const core::Json &tx)
  {
    return toBigInt(call("eth_estimateGas", withChainId(core::Json::array({tx}))), "eth_estimateGas");
  }

  /// \brief Relay an already signed raw transaction; returns its hash.
  std::string broadcastTransaction(const std::string &signedRawTx)
  {
    if (_config.broadcastRoute == BroadcastRoute::JsonRpcHttp && _httpClient)
    {
      _stats.totalCalls++;
      try
      {
        auto result = _httpClient->call("eth_sendRawTransaction", core::Json::array({signedRawTx}));
        _stats.succeededCalls++;
        return toHexString(result, "eth_sendRawTransaction");
      }
      catch (const rpc::ClientError &e)
      {
        _stats.failedCalls++;
        OMNILINK_LOG_WARN("Client: HTTP broadcast failed: " << e.what());
        throw;
      }
    }
    return toHexString(call("eth_sendRawTransaction", withChainId(core::Json::array({signedRawTx}))),
                       "eth_sendRawTransaction");
  }

  core::Json getNFTs(const std::string &address, std::optional<std::uint64_t> chainId = std::nullopt)
  {
    return call("omni_getNFTs", {{"address", address}, {"chainId", chainId.value_or(_config.chainId)}});
  }

  core::Json getNFTMetadata(const std::string &contract, const std::string &tokenId,
                            std::optional<std::uint64_t> chainId = std::nullopt)
  {
    return call("omni_getNFTMetadata", {{"contract", contract},
                                        {"tokenId", tokenId},
                                        {"chainId", chainId.value_or(_config.chainId)}});
  }

  core::Json getCollections(const std::string &address, std::optional<std::uint64_t> chainId = std::nullopt)
  {
    return call("omni_getCollections",
                {{"address", address}, {"chainId", chainId.value_or(_config.chainId)}});
  }

  /// \brief Marketplace listings; \p filter is passed through unchanged.
  core::Json getMarketplaceListings(const core::Json &filter = core::Json::object())
  {
    return call("omni_getMarketplaceListings", filter);
  }

  core::Json getPriceOracle(const std::vector<std::string> &tokens)
  {
    return call("omni_getPriceOracle", {{"tokens", tokens}});
  }

  core::Json getValidatorStatus() { return call("omni_getValidatorStatus", core::Json::object()); }

  /// \brief Coerce a quantity: "0x" hex string, decimal string or JSON
  /// integer.
  /// \throws rpc::MalformedResultError for anything else
  static BigInt toBigInt(const core::Json &value, const std::string &what = "quantity")
  {
    if (value.is_number_unsigned())
    {
      return BigInt(value.get<std::uint64_t>());
    }
    if (value.is_number_integer())
    {
      return BigInt(value.get<std::int64_t>());
    }
    if (!value.is_string())
    {
      throw rpc::MalformedResultError(what + ": expected a quantity, got " + value.dump());
    }

    const std::string &s = value.get_ref<const std::string &>();
    BigInt result = 0;
    if (s.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X'))
    {
      for (std::size_t i = 2; i < s.size(); ++i)
      {
        int digit = hexDigit(s[i]);
        if (digit < 0)
        {
          throw rpc::MalformedResultError(what + ": bad hex quantity '" + s + "'");
        }
        result = result * 16 + digit;
      }
      return result;
    }
    if (s.empty())
    {
      throw rpc::MalformedResultError(what + ": empty quantity");
    }
    for (char c : s)
    {
      if (c < '0' || c > '9')
      {
        throw rpc::MalformedResultError(what + ": bad quantity '" + s + "'");
      }
      result = result * 10 + (c - '0');
    }
    return result;
  }

private:
  static ClientConfig prepare(ClientConfig config)
  {
    config.validate();
    if (!config.transportFactory)
    {
      network::WebSocketTransport::Options options;
      options.tls = config.tls;
      options.maxMessageSize = config.maxMessageSize;
      config.transportFactory = [options]()
      { return std::make_shared<network::WebSocketTransport>(options); };
    }
    return config;
  }

  static Connection::Options connectionOptions(const ClientConfig &config)
  {
    Connection::Options options;
    options.endpoints = config.endpoints;
    options.transportFactory = config.transportFactory;
    options.baseReconnectDelay = config.baseReconnectDelay;
    options.maxReconnectDelay = config.maxReconnectDelay;
    options.maxReconnectAttempts = config.maxReconnectAttempts;
    return options;
  }

  static int hexDigit(char c)
  {
    if (c >= '0' && c <= '9')
    {
      return c - '0';
    }
    if (c >= 'a' && c <= 'f')
    {
      return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F')
    {
      return c - 'A' + 10;
    }
    return -1;
  }

  static std::string toHexString(const core::Json &value, const std::string &what)
  {
    if (!value.is_string())
    {
      throw rpc::MalformedResultError(what + ": expected a hex string, got " + value.dump());
    }
    return value.get<std::string>();
  }

  /// \brief Positional params with the client's chain id appended.
  core::Json withChainId(core::Json params) const
  {
    params.push_back(_config.chainId);
    return params;
  }

  void sendCall(const std::string &method, const core::Json &params, SuccessCallback onSuccess,
                ErrorCallback onError, std::chrono::milliseconds timeout)
  {
    _stats.totalCalls++;

    if (!_connection.isOpen())
    {
      _connection.connect();
      if (!_connection.waitForOpen(_config.connectGracePeriod))
      {
        _stats.notConnected++;
        _stats.failedCalls++;
        OMNILINK_LOG_WARN("Client: " << method << " not sent, no open connection within "
                                     << _config.connectGracePeriod.count() << "ms");
        deliver(onError, std::make_exception_ptr(rpc::NotConnectedError()));
        return;
      }
    }

    auto succeed = [this, method, onSuccess](core::Json result)
    {
      _stats.succeededCalls++;
      OMNILINK_LOG_TRACE("Client: " << method << " succeeded");
      if (onSuccess)
      {
        onSuccess(std::move(result));
      }
    };
    auto fail = [this, method, onError](std::exception_ptr error)
    {
      countFailure(error);
      deliver(onError, std::move(error));
    };

    const auto deadline = rpc::PendingCallRegistry::Clock::now() + timeout;
    std::string id;
    std::string frame;
    for (int tries = 0;; ++tries)
    {
      id = ids::CallId::next();
      try
      {
        frame = _auth.makeEnvelope(id, method, params).dump();
      }
      catch (const core::Json::exception &e)
      {
        _stats.sendFailures++;
        OMNILINK_LOG_WARN("Client: " << method << " not sent, request not encodable: " << e.what());
        fail(std::make_exception_ptr(
          rpc::SendFailedError(std::string("Request could not be encoded: ") + e.what())));
        return;
      }
      try
      {
        _registry.registerCall(id, deadline, succeed, fail);
        break;
      }
      catch (const rpc::DuplicateIdError &)
      {
        if (tries >= 2)
        {
          OMNILINK_LOG_ERROR("Client: " << method << " not sent, call id collided " << tries + 1
                                        << " times");
          fail(std::current_exception());
          return;
        }
        OMNILINK_LOG_WARN("Client: call id collision, regenerating");
      }
    }

    OMNILINK_LOG_DEBUG("Client: -> " << method << " id=" << id << " timeout=" << timeout.count()
                                     << "ms");
    auto r = _connection.send(frame);
    if (!r.ok)
    {
      _stats.sendFailures++;
      OMNILINK_LOG_WARN("Client: send of " << method << " failed: " << r.describe());
      _registry.reject(id, std::make_exception_ptr(rpc::SendFailedError(r.describe())));
    }
  }

  void countFailure(const std::exception_ptr &error)
  {
    _stats.failedCalls++;
    try
    {
      std::rethrow_exception(error);
    }
    catch (const rpc::TimeoutError &)
    {
      _stats.timedOutCalls++;
    }
    catch (const rpc::RemoteError &)
    {
      _stats.remoteErrors++;
    }
    catch (const std::exception &)
    {
      // counted as failed only
    }
  }

  static void deliver(const ErrorCallback &onError, std::exception_ptr error)
  {
    if (onError)
    {
      onError(std::move(error));
    }
  }

  ClientConfig _config;
  ClientStats _stats;
  auth::Authenticator _auth;
  rpc::PendingCallRegistry _registry;
  core::TimerService _timer;
  Connection _connection;
  std::unique_ptr<network::JsonRpcHttpClient> _httpClient;
};

} // namespace client
} // namespace omnilink
