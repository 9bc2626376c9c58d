// Copyright (c) 2025 Omnilink Authors
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Omnilink, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "omnilink/client/client_stats.hpp"
#include "omnilink/core/logger.hpp"
#include "omnilink/core/timer.hpp"
#include "omnilink/network/endpoint_selector.hpp"
#include "omnilink/network/transport.hpp"
#include "omnilink/rpc/envelope.hpp"
#include "omnilink/rpc/errors.hpp"
#include "omnilink/rpc/pending_call_registry.hpp"

namespace omnilink
{
namespace client
{

enum class ConnectionState
{
  Disconnected,
  Connecting,
  Open,
  Closing
};

inline const char *toString(ConnectionState s)
{
  switch (s)
  {
  case ConnectionState::Disconnected:
    return "Disconnected";
  case ConnectionState::Connecting:
    return "Connecting";
  case ConnectionState::Open:
    return "Open";
  case ConnectionState::Closing:
    return "Closing";
  }
  return "Unknown";
}

/// \brief Owns the single transport of a client and keeps it connected.
///
/// State machine:
///   Disconnected --connect()--> Connecting --open--> Open
///   Open|Connecting --close/error--> Disconnected, then either a reconnect is
///   scheduled (attempts < maxAttempts) or the connection is Failed and all
///   pending calls are rejected with ConnectionLostError.
///
/// Each connect attempt gets a new generation number; callbacks from a
/// transport of an older generation are ignored. A transport that reported
/// closure is parked in a retired list and destroyed from the next connect or
/// from teardown, never on its own I/O thread.
class Connection
{
public:
  struct Options
  {
    std::vector<std::string> endpoints;
    network::TransportFactory transportFactory;
    std::chrono::milliseconds baseReconnectDelay{1000};
    std::chrono::milliseconds maxReconnectDelay{30000};
    std::uint32_t maxReconnectAttempts{5};
  };

  /// \throws std::invalid_argument if the endpoint list is empty or no
  /// transport factory is given
  Connection(Options options, rpc::PendingCallRegistry &registry, core::TimerService &timer,
             ClientStats *stats = nullptr)
    : _options(std::move(options)),
      _selector(_options.endpoints),
      _registry(registry),
      _timer(timer),
      _stats(stats)
  {
    if (!_options.transportFactory)
    {
      throw std::invalid_argument("Connection: transport factory is required");
    }
  }

  ~Connection() { shutdown(); }

  Connection(const Connection &) = delete;
  Connection &operator=(const Connection &) = delete;

  /// \brief Start connecting to the next endpoint. No-op while Open or
  /// Connecting. Clears the Failed condition, resets the attempt counter
  /// after failure or disconnect(), and cancels any scheduled reconnect.
  void connect() { startAttempt(true, std::nullopt); }

  /// \brief Close without reconnecting and reject all pending calls with
  /// DisconnectedError.
  void disconnect()
  {
    teardown(ConnectionState::Disconnected);
    std::size_t n = _registry.rejectAll(std::make_exception_ptr(rpc::DisconnectedError()));
    OMNILINK_LOG_INFO("Connection: disconnected" << (n ? ", rejected " : "")
                                                 << (n ? std::to_string(n) + " pending call(s)" : ""));
  }

  /// \brief Permanent stop used during client teardown. Pending calls are
  /// left to the owner.
  void shutdown()
  {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (_shutdown)
      {
        return;
      }
      _shutdown = true;
    }
    teardown(ConnectionState::Disconnected);
  }

  /// \brief Wait until the connection is Open, it Failed, or \p timeout
  /// elapses. Returns true if Open.
  bool waitForOpen(std::chrono::milliseconds timeout)
  {
    std::unique_lock<std::mutex> lock(_mutex);
    _stateCv.wait_for(lock, timeout, [this]()
                      { return _state == ConnectionState::Open || _failed || _shutdown; });
    return _state == ConnectionState::Open;
  }

  /// \brief Transmit one text frame over the active transport.
  network::IoResult send(const std::string &text)
  {
    std::shared_ptr<network::ITransport> transport;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (_state != ConnectionState::Open || !_transport)
      {
        return network::IoResult::failure(network::TransportError::NotOpen,
                                          std::string("connection is ") + toString(_state));
      }
      transport = _transport;
    }
    return transport->send(text);
  }

  ConnectionState state() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _state;
  }

  bool isOpen() const { return state() == ConnectionState::Open; }

  /// \brief True once the reconnect budget is exhausted, until the next
  /// connect().
  bool isFailed() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _failed;
  }

  std::uint32_t attempts() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _attempts;
  }

  /// \brief Endpoint of the current (or last) connect attempt.
  std::string currentEndpoint() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _currentEndpoint;
  }

  /// \brief min(base * 2^attempts, cap).
  static std::chrono::milliseconds backoffDelay(std::uint32_t attempts, std::chrono::milliseconds base,
                                                std::chrono::milliseconds cap)
  {
    auto delay = base;
    for (std::uint32_t i = 0; i < attempts && delay < cap; ++i)
    {
      delay *= 2;
    }
    return std::min(delay, cap);
  }

private:
  void startAttempt(bool callerIssued, std::optional<std::uint64_t> expectedGeneration)
  {
    std::shared_ptr<network::ITransport> transport;
    std::vector<std::shared_ptr<network::ITransport>> retired;
    std::uint64_t timerToCancel = 0;
    std::uint64_t generation = 0;
    std::string endpoint;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (_shutdown)
      {
        return;
      }
      if (expectedGeneration && (*expectedGeneration != _generation || _failed))
      {
        return;
      }
      if (_state == ConnectionState::Open || _state == ConnectionState::Connecting)
      {
        return;
      }
      if (callerIssued && (_failed || _disconnected))
      {
        _attempts = 0;
      }
      _failed = false;
      _disconnected = false;
      timerToCancel = _reconnectTimer;
      _reconnectTimer = 0;
      retired.swap(_retired);

      endpoint = _selector.next();
      _currentEndpoint = endpoint;
      generation = ++_generation;
      _state = ConnectionState::Connecting;
    }

    if (timerToCancel != 0)
    {
      _timer.cancel(timerToCancel);
    }
    retired.clear();

    OMNILINK_LOG_INFO("Connection: connecting to " << endpoint << " (attempt "
                                                   << attempts() + 1 << ")");
    try
    {
      transport = _options.transportFactory();
    }
    catch (const std::exception &e)
    {
      handleClose(generation, network::IoResult::failure(network::TransportError::Config,
                                                         std::string("transport factory threw: ") +
                                                           e.what()));
      return;
    }
    if (!transport)
    {
      handleClose(generation, network::IoResult::failure(network::TransportError::Config,
                                                         "transport factory returned null"));
      return;
    }

    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (generation != _generation)
      {
        retired.push_back(std::move(transport));
      }
      else
      {
        _transport = transport;
      }
    }
    if (!transport)
    {
      // superseded by disconnect() while the transport was being built
      return;
    }

    network::TransportCallbacks callbacks;
    callbacks.onOpen = [this, generation]() { handleOpen(generation); };
    callbacks.onMessage = [this, generation](const std::string &text) { handleMessage(generation, text); };
    callbacks.onClose = [this, generation](const network::IoResult &reason) { handleClose(generation, reason); };
    transport->open(endpoint, std::move(callbacks));
  }

  void handleOpen(std::uint64_t generation)
  {
    std::string endpoint;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (generation != _generation || _state != ConnectionState::Connecting)
      {
        return;
      }
      _state = ConnectionState::Open;
      _attempts = 0;
      endpoint = _currentEndpoint;
    }
    _stateCv.notify_all();
    if (_stats)
    {
      _stats->connectionsOpened++;
    }
    OMNILINK_LOG_INFO("Connection: open to " << endpoint);
  }

  void handleMessage(std::uint64_t generation, const std::string &text)
  {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (generation != _generation || _state != ConnectionState::Open)
      {
        return;
      }
    }

    auto response = rpc::parseResponse(text);
    if (!response)
    {
      if (_stats)
      {
        _stats->malformedFrames++;
      }
      OMNILINK_LOG_WARN("Connection: discarding malformed frame (" << text.size() << " bytes)");
      return;
    }
    if (response->cached)
    {
      OMNILINK_LOG_DEBUG("Connection: response " << response->id << " served from cache by "
                                                 << (response->servedBy.empty() ? "unknown"
                                                                                : response->servedBy));
    }

    if (response->error)
    {
      const auto &err = *response->error;
      _registry.reject(response->id,
                       std::make_exception_ptr(rpc::RemoteError(err.code, err.message, err.data)));
    }
    else
    {
      _registry.resolve(response->id, std::move(*response->result));
    }
  }

  void handleClose(std::uint64_t generation, const network::IoResult &reason)
  {
    bool failedNow = false;
    std::uint32_t attempt = 0;
    std::chrono::milliseconds delay{0};
    ConnectionState previous;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (generation != _generation || _shutdown)
      {
        return;
      }
      previous = _state;
      if (_transport)
      {
        _retired.push_back(std::move(_transport));
        _transport.reset();
      }
      _state = ConnectionState::Disconnected;
      attempt = ++_attempts;
      if (_attempts >= _options.maxReconnectAttempts)
      {
        _failed = true;
        failedNow = true;
      }
      else
      {
        delay = backoffDelay(_attempts, _options.baseReconnectDelay, _options.maxReconnectDelay);
        auto expected = _generation;
        _reconnectTimer = _timer.scheduleAfter(delay, [this, expected]()
                                               { startAttempt(false, expected); });
      }
    }
    _stateCv.notify_all();

    OMNILINK_LOG_INFO("Connection: " << toString(previous) << " -> Disconnected: "
                                     << reason.describe());
    if (failedNow)
    {
      OMNILINK_LOG_ERROR("Connection: giving up after " << attempt
                                                        << " consecutive failure(s); connection lost");
      _registry.rejectAll(std::make_exception_ptr(rpc::ConnectionLostError()));
      return;
    }
    if (_stats)
    {
      _stats->reconnectsScheduled++;
    }
    OMNILINK_LOG_WARN("Connection: reconnecting in " << delay.count() << "ms (attempt " << attempt
                                                     << "/" << _options.maxReconnectAttempts << ")");
  }

  void teardown(ConnectionState finalState)
  {
    std::shared_ptr<network::ITransport> transport;
    std::vector<std::shared_ptr<network::ITransport>> retired;
    std::uint64_t timerToCancel = 0;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      ++_generation;
      transport = std::move(_transport);
      _transport.reset();
      retired.swap(_retired);
      timerToCancel = _reconnectTimer;
      _reconnectTimer = 0;
      _state = transport ? ConnectionState::Closing : finalState;
      _disconnected = true;
      _failed = false;
    }
    if (timerToCancel != 0)
    {
      _timer.cancel(timerToCancel);
    }
    if (transport)
    {
      transport->close();
      transport.reset();
    }
    retired.clear();
    {
      std::lock_guard<std::mutex> lock(_mutex);
      _state = finalState;
    }
    _stateCv.notify_all();
  }

  Options _options;
  network::EndpointSelector _selector;
  rpc::PendingCallRegistry &_registry;
  core::TimerService &_timer;
  ClientStats *_stats;

  mutable std::mutex _mutex;
  std::condition_variable _stateCv;
  ConnectionState _state{ConnectionState::Disconnected};
  bool _failed{false};
  bool _disconnected{false};
  bool _shutdown{false};
  std::uint32_t _attempts{0};
  std::uint64_t _generation{0};
  std::uint64_t _reconnectTimer{0};
  std::string _currentEndpoint;
  std::shared_ptr<network::ITransport> _transport;
  std::vector<std::shared_ptr<network::ITransport>> _retired;
};

} // namespace client
} // namespace omnilink
