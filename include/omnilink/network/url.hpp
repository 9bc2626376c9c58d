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
#include <optional>
#include <string>

namespace omnilink
{
namespace network
{

/// \brief Parsed ws/wss/http/https URL.
struct Url
{
  std::string scheme;
  std::string host;
  std::uint16_t port{0};
  std::string target{"/"};

  bool secure() const { return scheme == "wss" || scheme == "https"; }
  bool isWebSocket() const { return scheme == "ws" || scheme == "wss"; }

  /// \brief Host header value; the port is omitted when it is the scheme
  /// default.
  std::string hostHeader() const
  {
    std::string h = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    if (port != defaultPort(scheme))
    {
      h += ":" + std::to_string(port);
    }
    return h;
  }

  static std::uint16_t defaultPort(const std::string &scheme)
  {
    if (scheme == "wss" || scheme == "https")
    {
      return 443;
    }
    if (scheme == "ws" || scheme == "http")
    {
      return 80;
    }
    return 0;
  }

  /// \brief Parse \p text. Returns std::nullopt for an unknown scheme, an
  /// empty host or a bad port.
  static std::optional<Url> parse(const std::string &text)
  {
    auto sep = text.find("://");
    if (sep == std::string::npos)
    {
      return std::nullopt;
    }

    Url url;
    url.scheme = text.substr(0, sep);
    std::transform(url.scheme.begin(), url.scheme.end(), url.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (defaultPort(url.scheme) == 0)
    {
      return std::nullopt;
    }

    std::string rest = text.substr(sep + 3);
    auto slash = rest.find_first_of("/?#");
    std::string authority = rest.substr(0, slash);
    if (slash != std::string::npos)
    {
      std::string target = rest.substr(slash);
      auto hash = target.find('#');
      if (hash != std::string::npos)
      {
        target.erase(hash);
      }
      if (target.empty() || target[0] != '/')
      {
        target.insert(target.begin(), '/');
      }
      url.target = target;
    }

    auto at = authority.rfind('@');
    if (at != std::string::npos)
    {
      authority.erase(0, at + 1);
    }

    std::string portText;
    if (!authority.empty() && authority[0] == '[')
    {
      auto close = authority.find(']');
      if (close == std::string::npos)
      {
        return std::nullopt;
      }
      url.host = authority.substr(1, close - 1);
      std::string tail = authority.substr(close + 1);
      if (!tail.empty())
      {
        if (tail[0] != ':')
        {
          return std::nullopt;
        }
        portText = tail.substr(1);
      }
    }
    else
    {
      auto colon = authority.find(':');
      url.host = authority.substr(0, colon);
      if (colon != std::string::npos)
      {
        portText = authority.substr(colon + 1);
      }
    }

    if (url.host.empty())
    {
      return std::nullopt;
    }

    url.port = defaultPort(url.scheme);
    if (!portText.empty())
    {
      if (portText.size() > 5 ||
          !std::all_of(portText.begin(), portText.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; }))
      {
        return std::nullopt;
      }
      unsigned long value = std::stoul(portText);
      if (value == 0 || value > 65535)
      {
        return std::nullopt;
      }
      url.port = static_cast<std::uint16_t>(value);
    }
    return url;
  }
};

} // namespace network
} // namespace omnilink
