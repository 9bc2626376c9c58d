// Copyright (c) 2025 Omnilink Authors
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Omnilink, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

#include "omnilink/core/json.hpp"
#include "omnilink/crypto/secure_rng.hpp"
#include "omnilink/ids/call_id.hpp"

namespace omnilink
{
namespace auth
{

/// \brief The credentials a client presents on every call. Immutable once
/// constructed.
struct Identity
{
  std::string clientId;
  std::string sharedSecret;
  std::string protocolVersion;
};

/// \brief Signs outgoing calls and builds the request envelope.
///
/// The signature is hex(HMAC-SHA256(key = sharedSecret,
/// message = "clientId:method:timestamp:sharedSecret")). Freshness of the
/// timestamp is checked by the backend only.
class Authenticator
{
public:
  /// \param identity Client credentials. An empty clientId is replaced by a
  /// freshly generated one.
  /// \throws std::invalid_argument if the shared secret is empty
  explicit Authenticator(Identity identity) : _identity(std::move(identity))
  {
    if (_identity.sharedSecret.empty())
    {
      throw std::invalid_argument("Authenticator: shared secret cannot be empty");
    }
    if (_identity.clientId.empty())
    {
      _identity.clientId = ids::CallId::clientId();
    }
  }

  /// \brief Pure signature function; deterministic for identical inputs.
  static std::string sign(const std::string &clientId, const std::string &method,
                          std::int64_t timestampMs, const std::string &sharedSecret)
  {
    std::string message;
    message.reserve(clientId.size() + method.size() + sharedSecret.size() + 24);
    message += clientId;
    message += ':';
    message += method;
    message += ':';
    message += std::to_string(timestampMs);
    message += ':';
    message += sharedSecret;
    return crypto::SecureRng::hmacSha256Hex(sharedSecret, message);
  }

  /// \brief Sender wall-clock time in milliseconds since the Unix epoch.
  static std::int64_t nowMillis()
  {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
  }

  /// \brief Builds {id, method, params, auth:{clientId, signature, timestamp,
  /// version}}.
  core::Json makeEnvelope(const std::string &id, const std::string &method,
                          const core::Json &params, std::int64_t timestampMs) const
  {
    core::Json auth = {
      {"clientId", _identity.clientId},
      {"signature", sign(_identity.clientId, method, timestampMs, _identity.sharedSecret)},
      {"timestamp", timestampMs},
      {"version", _identity.protocolVersion}};
    return core::Json{{"id", id}, {"method", method}, {"params", params}, {"auth", std::move(auth)}};
  }

  core::Json makeEnvelope(const std::string &id, const std::string &method,
                          const core::Json &params) const
  {
    return makeEnvelope(id, method, params, nowMillis());
  }

  const Identity &identity() const { return _identity; }
  const std::string &clientId() const { return _identity.clientId; }

private:
  Identity _identity;
};

} // namespace auth
} // namespace omnilink
