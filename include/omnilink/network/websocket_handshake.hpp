// Copyright (c) 2025 Omnilink Authors
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Omnilink, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>

#include "omnilink/crypto/secure_rng.hpp"
#include "omnilink/network/http_message.hpp"
#include "omnilink/network/transport.hpp"
#include "omnilink/network/url.hpp"

namespace omnilink
{
namespace network
{

/// \brief HTTP/1.1 upgrade handshake for the client side of RFC 6455.
class WebSocketHandshake
{
public:
  /// \brief 16 random bytes, base64 encoded (24 chars).
  static std::string generateKey()
  {
    std::array<std::uint8_t, 16> nonce{};
    crypto::SecureRng::fill(nonce);
    return crypto::SecureRng::base64(nonce.data(), nonce.size());
  }

  /// \brief Expected Sec-WebSocket-Accept for \p key.
  static std::string acceptKey(const std::string &key)
  {
    static const std::string kGuid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
    auto digest = crypto::SecureRng::sha1(key + kGuid);
    return crypto::SecureRng::base64(digest.data(), digest.size());
  }

  static std::string buildRequest(const Url &url, const std::string &key,
                                  const HttpHeaders &extraHeaders = {})
  {
    HttpHeaders headers = extraHeaders;
    headers["Host"] = url.hostHeader();
    headers["Upgrade"] = "websocket";
    headers["Connection"] = "Upgrade";
    headers["Sec-WebSocket-Key"] = key;
    headers["Sec-WebSocket-Version"] = "13";
    return buildHttpRequest("GET", url.target, headers);
  }

  /// \brief Check the server's response head against the key we sent.
  static IoResult validateResponse(const std::string &head, const std::string &key)
  {
    HttpResponse response;
    try
    {
      response = HttpResponse::parseHead(head);
    }
    catch (const std::invalid_argument &e)
    {
      return IoResult::failure(TransportError::Handshake, e.what());
    }

    if (response.statusCode != 101)
    {
      return IoResult::failure(TransportError::Handshake,
                               "Upgrade rejected with HTTP " + std::to_string(response.statusCode) +
                                 " " + response.statusText);
    }
    if (!response.headerHasToken("Upgrade", "websocket"))
    {
      return IoResult::failure(TransportError::Handshake, "Missing 'Upgrade: websocket'");
    }
    if (!response.headerHasToken("Connection", "upgrade"))
    {
      return IoResult::failure(TransportError::Handshake, "Missing 'Connection: Upgrade'");
    }
    if (response.getHeader("Sec-WebSocket-Accept") != acceptKey(key))
    {
      return IoResult::failure(TransportError::Handshake, "Sec-WebSocket-Accept mismatch");
    }
    return IoResult::success();
  }
};

} // namespace network
} // namespace omnilink
