// Copyright (c) 2025 Omnilink Authors
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Omnilink, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace omnilink
{
namespace network
{

/// \brief Case-insensitive string comparison for headers
struct CaseInsensitiveCompare
{
  bool operator()(const std::string &a, const std::string &b) const
  {
    return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(), [](char x, char y)
                                        {
                                          return std::tolower(static_cast<unsigned char>(x)) <
                                                 std::tolower(static_cast<unsigned char>(y));
                                        });
  }
};

using HttpHeaders = std::map<std::string, std::string, CaseInsensitiveCompare>;

/// \brief Rejects header names or values that would allow CRLF injection.
inline bool isValidHeader(const std::string &key, const std::string &value)
{
  if (key.empty())
  {
    return false;
  }
  auto bad = [](const std::string &s) { return s.find_first_of("\r\n") != std::string::npos; };
  return !bad(key) && !bad(value);
}

/// \brief Serializes an HTTP/1.1 request.
inline std::string buildHttpRequest(const std::string &method, const std::string &target,
                                    const HttpHeaders &headers, const std::string &body = "")
{
  std::string out;
  out.reserve(256 + body.size());
  out += method;
  out += ' ';
  out += target;
  out += " HTTP/1.1\r\n";
  for (const auto &kv : headers)
  {
    if (!isValidHeader(kv.first, kv.second))
    {
      throw std::invalid_argument("Invalid HTTP header: " + kv.first);
    }
    out += kv.first;
    out += ": ";
    out += kv.second;
    out += "\r\n";
  }
  out += "\r\n";
  out += body;
  return out;
}

/// \brief HTTP response status line and headers, plus the body once known.
class HttpResponse
{
public:
  int statusCode{0};
  std::string statusText;
  HttpHeaders headers;
  std::string body;

  bool isSuccess() const { return statusCode >= 200 && statusCode < 300; }

  std::string getHeader(const std::string &name) const
  {
    auto it = headers.find(name);
    return it != headers.end() ? it->second : std::string{};
  }

  bool hasHeader(const std::string &name) const { return headers.find(name) != headers.end(); }

  /// \brief True when the comma-separated header \p name lists \p token.
  bool headerHasToken(const std::string &name, const std::string &token) const
  {
    std::string value = lower(getHeader(name));
    std::string want = lower(token);
    std::istringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ','))
    {
      item.erase(0, item.find_first_not_of(" \t"));
      item.erase(item.find_last_not_of(" \t") + 1);
      if (item == want)
      {
        return true;
      }
    }
    return false;
  }

  /// \brief Parse the status line and headers (everything before the blank
  /// line). The body is left empty.
  /// \throws std::invalid_argument for a malformed status line
  static HttpResponse parseHead(const std::string &head)
  {
    HttpResponse response;
    std::istringstream stream(head);
    std::string line;
    bool firstLine = true;
    while (std::getline(stream, line))
    {
      if (!line.empty() && line.back() == '\r')
      {
        line.pop_back();
      }
      if (firstLine)
      {
        parseStatusLine(line, response);
        firstLine = false;
      }
      else if (!line.empty())
      {
        parseHeaderLine(line, response.headers);
      }
    }
    if (firstLine)
    {
      throw std::invalid_argument("Invalid HTTP response: empty head");
    }
    return response;
  }

  /// \brief Decode a complete chunked body. Returns std::nullopt if the
  /// chunk stream is incomplete or malformed.
  static std::optional<std::string> decodeChunked(const std::string &data)
  {
    std::string result;
    std::size_t pos = 0;
    while (true)
    {
      auto eol = data.find("\r\n", pos);
      if (eol == std::string::npos)
      {
        return std::nullopt;
      }
      std::string sizeLine = data.substr(pos, eol - pos);
      auto semi = sizeLine.find(';');
      if (semi != std::string::npos)
      {
        sizeLine.erase(semi);
      }
      if (sizeLine.empty() ||
          !std::all_of(sizeLine.begin(), sizeLine.end(),
                       [](unsigned char c) { return std::isxdigit(c) != 0; }))
      {
        return std::nullopt;
      }
      std::size_t chunkSize = std::stoul(sizeLine, nullptr, 16);
      pos = eol + 2;
      if (chunkSize == 0)
      {
        return result;
      }
      if (data.size() < pos + chunkSize + 2)
      {
        return std::nullopt;
      }
      result.append(data, pos, chunkSize);
      pos += chunkSize + 2;
    }
  }

private:
  static std::string lower(std::string s)
  {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
  }

  static void parseStatusLine(const std::string &line, HttpResponse &response)
  {
    std::istringstream iss(line);
    std::string version;
    iss >> version >> response.statusCode;
    if (version.compare(0, 5, "HTTP/") != 0 || iss.fail())
    {
      throw std::invalid_argument("Invalid HTTP status line: " + line);
    }
    std::string remaining;
    std::getline(iss, remaining);
    response.statusText = remaining.empty() ? "" : remaining.substr(1);
  }

  static void parseHeaderLine(const std::string &line, HttpHeaders &headers)
  {
    auto colonPos = line.find(':');
    if (colonPos == std::string::npos)
    {
      return;
    }
    std::string key = line.substr(0, colonPos);
    std::string value = line.substr(colonPos + 1);
    key.erase(0, key.find_first_not_of(" \t"));
    key.erase(key.find_last_not_of(" \t") + 1);
    value.erase(0, value.find_first_not_of(" \t"));
    value.erase(value.find_last_not_of(" \t") + 1);
    headers[key] = value;
  }
};

} // namespace network
} // namespace omnilink
