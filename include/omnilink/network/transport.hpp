// Copyright (c) 2025 Omnilink Authors
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Omnilink, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <functional>
#include <memory>
#include <string>

namespace omnilink
{
namespace network
{

enum class TransportError
{
  None = 0,
  Socket,
  Resolve,
  Connect,
  TLSHandshake,
  TLSIO,
  Handshake,
  Protocol,
  MessageTooLarge,
  PeerClosed,
  NotOpen,
  Config,
  Cancelled,
  Timeout,
  Unknown
};

inline const char *toString(TransportError e)
{
  switch (e)
  {
  case TransportError::None:
    return "None";
  case TransportError::Socket:
    return "Socket";
  case TransportError::Resolve:
    return "Resolve";
  case TransportError::Connect:
    return "Connect";
  case TransportError::TLSHandshake:
    return "TLSHandshake";
  case TransportError::TLSIO:
    return "TLSIO";
  case TransportError::Handshake:
    return "Handshake";
  case TransportError::Protocol:
    return "Protocol";
  case TransportError::MessageTooLarge:
    return "MessageTooLarge";
  case TransportError::PeerClosed:
    return "PeerClosed";
  case TransportError::NotOpen:
    return "NotOpen";
  case TransportError::Config:
    return "Config";
  case TransportError::Cancelled:
    return "Cancelled";
  case TransportError::Timeout:
    return "Timeout";
  case TransportError::Unknown:
    return "Unknown";
  }
  return "Unknown";
}

struct IoResult
{
  bool ok{true};
  TransportError code{TransportError::None};
  std::string message;
  int sysErrno{0};
  int tlsError{0};

  static IoResult success() { return {true, TransportError::None, "", 0, 0}; }

  static IoResult failure(TransportError c, const std::string &m, int se = 0, int te = 0)
  {
    return {false, c, m, se, te};
  }

  std::string describe() const
  {
    if (ok)
    {
      return "ok";
    }
    std::string s = std::string(toString(code)) + ": " + message;
    if (sysErrno != 0)
    {
      s += " (errno " + std::to_string(sysErrno) + ")";
    }
    return s;
  }
};

/// \brief Callbacks a transport delivers from its I/O thread. onClose is
/// always the last one and is delivered exactly once per open().
struct TransportCallbacks
{
  std::function<void()> onOpen;
  std::function<void(const std::string &)> onMessage;
  std::function<void(const IoResult &)> onClose;
};

/// \brief A message-framed duplex connection carrying one text envelope per
/// frame.
class ITransport
{
public:
  virtual ~ITransport() = default;

  /// \brief Start connecting to \p uri. Returns immediately; the outcome is
  /// reported through onOpen or onClose.
  virtual void open(const std::string &uri, TransportCallbacks callbacks) = 0;

  /// \brief Transmit one text message. Fails synchronously when the
  /// transport is not open or the write fails.
  virtual IoResult send(const std::string &text) = 0;

  /// \brief Close the connection. No reconnection is implied; onClose is
  /// still delivered if the transport had been opened.
  virtual void close() = 0;
};

using TransportFactory = std::function<std::shared_ptr<ITransport>()>;

} // namespace network
} // namespace omnilink
