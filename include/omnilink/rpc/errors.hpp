// Copyright (c) 2025 Omnilink Authors
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Omnilink, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

#include "omnilink/core/json.hpp"

namespace omnilink
{
namespace rpc
{

enum class ErrorCode
{
  NotConnected,
  SendFailed,
  Timeout,
  ConnectionLost,
  Disconnected,
  RemoteError,
  DuplicateId,
  MalformedResult
};

inline const char *toString(ErrorCode code)
{
  switch (code)
  {
  case ErrorCode::NotConnected:
    return "NotConnected";
  case ErrorCode::SendFailed:
    return "SendFailed";
  case ErrorCode::Timeout:
    return "Timeout";
  case ErrorCode::ConnectionLost:
    return "ConnectionLost";
  case ErrorCode::Disconnected:
    return "Disconnected";
  case ErrorCode::RemoteError:
    return "RemoteError";
  case ErrorCode::DuplicateId:
    return "DuplicateId";
  case ErrorCode::MalformedResult:
    return "MalformedResult";
  }
  return "Unknown";
}

/// \brief Base exception for all client call failures.
class ClientError : public std::runtime_error
{
public:
  ClientError(ErrorCode code, const std::string &what) : std::runtime_error(what), _kind(code) {}

  ErrorCode kind() const noexcept { return _kind; }

private:
  ErrorCode _kind;
};

/// \brief The call never left the client: no open connection within the
/// grace period.
class NotConnectedError : public ClientError
{
public:
  explicit NotConnectedError(const std::string &what = "Not connected to backend network")
    : ClientError(ErrorCode::NotConnected, what)
  {
  }
};

/// \brief Transmission failed after the call was registered.
class SendFailedError : public ClientError
{
public:
  explicit SendFailedError(const std::string &what) : ClientError(ErrorCode::SendFailed, what) {}
};

class TimeoutError : public ClientError
{
public:
  explicit TimeoutError(const std::string &what = "Request timeout")
    : ClientError(ErrorCode::Timeout, what)
  {
  }
};

/// \brief Reconnect budget exhausted; every outstanding call is failed with
/// this error.
class ConnectionLostError : public ClientError
{
public:
  explicit ConnectionLostError(const std::string &what = "Connection lost: reconnect attempts exhausted")
    : ClientError(ErrorCode::ConnectionLost, what)
  {
  }
};

class DisconnectedError : public ClientError
{
public:
  explicit DisconnectedError(const std::string &what = "Client disconnected")
    : ClientError(ErrorCode::Disconnected, what)
  {
  }
};

class DuplicateIdError : public ClientError
{
public:
  explicit DuplicateIdError(const std::string &id)
    : ClientError(ErrorCode::DuplicateId, "Duplicate call id: " + id)
  {
  }
};

/// \brief The backend returned a result that could not be coerced into the
/// type the caller asked for.
class MalformedResultError : public ClientError
{
public:
  explicit MalformedResultError(const std::string &what)
    : ClientError(ErrorCode::MalformedResult, what)
  {
  }
};

/// \brief Thrown when a response envelope carries an error object.
class RemoteError : public ClientError
{
public:
  RemoteError(std::int64_t code, const std::string &message, core::Json data = nullptr)
    : ClientError(ErrorCode::RemoteError,
                  "Remote error: (" + std::to_string(code) + ") " + message),
      _code(code),
      _message(message),
      _data(std::move(data))
  {
  }

  std::int64_t code() const noexcept { return _code; }

  const std::string &message() const noexcept { return _message; }

  const core::Json &data() const noexcept { return _data; }

private:
  std::int64_t _code;
  std::string _message;
  core::Json _data;
};

} // namespace rpc
} // namespace omnilink
