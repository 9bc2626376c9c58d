// Copyright (c) 2025 Omnilink Authors
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Omnilink, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>

#include "omnilink/core/json.hpp"
#include "omnilink/core/logger.hpp"
#include "omnilink/network/http_message.hpp"
#include "omnilink/network/stream_socket.hpp"
#include "omnilink/network/url.hpp"
#include "omnilink/rpc/errors.hpp"

namespace omnilink
{
namespace network
{

/// \brief Blocking JSON-RPC 2.0 client over a single HTTP(S) POST per call.
///
/// Used to relay already signed transactions to a conventional node. Each
/// call opens a fresh connection with "Connection: close".
class JsonRpcHttpClient
{
public:
  struct Config
  {
    TlsConfig tls;
    std::chrono::milliseconds timeout{30000};
    std::size_t maxResponseSize{16 * 1024 * 1024};
    HttpHeaders headers;
  };

  /// \throws std::invalid_argument if \p url is not an http(s) URL
  explicit JsonRpcHttpClient(const std::string &url) : JsonRpcHttpClient(url, Config{}) {}

  JsonRpcHttpClient(const std::string &url, Config config) : _config(std::move(config))
  {
    auto parsed = Url::parse(url);
    if (!parsed || parsed->isWebSocket())
    {
      throw std::invalid_argument("JsonRpcHttpClient: not an http(s) URL: " + url);
    }
    _url = *parsed;
  }

  /// \brief Invoke \p method and return its result.
  /// \throws rpc::RemoteError if the response carries an error object
  /// \throws rpc::TimeoutError if no complete response arrives in time
  /// \throws rpc::SendFailedError on connection or HTTP failure
  /// \throws rpc::MalformedResultError if the body is not a JSON-RPC response
  core::Json call(const std::string &method, const core::Json &params)
  {
    const std::uint64_t id = ++_nextId;
    core::Json request = {{"jsonrpc", "2.0"}, {"method", method}, {"params", params}, {"id", id}};
    const std::string body = request.dump();

    HttpHeaders headers = _config.headers;
    headers["Host"] = _url.hostHeader();
    headers["Content-Type"] = "application/json";
    headers["Accept"] = "application/json";
    headers["Content-Length"] = std::to_string(body.size());
    headers["Connection"] = "close";

    OMNILINK_LOG_DEBUG("JsonRpcHttpClient: POST " << _url.host << _url.target << " " << method
                                                  << " id=" << id);

    const auto deadline = std::chrono::steady_clock::now() + _config.timeout;
    StreamSocket socket;
    auto r = socket.connect(_url, _config.tls, _config.timeout);
    if (!r.ok)
    {
      throwIo("connect", r);
    }
    r = socket.writeAll(buildHttpRequest("POST", _url.target, headers, body), remaining(deadline));
    if (!r.ok)
    {
      throwIo("write", r);
    }

    HttpResponse response = readResponse(socket, deadline);
    return parseResult(response, id);
  }

private:
  static std::chrono::milliseconds remaining(std::chrono::steady_clock::time_point deadline)
  {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline -
                                                                      std::chrono::steady_clock::now());
    return left.count() > 0 ? left : std::chrono::milliseconds(0);
  }

  [[noreturn]] static void throwIo(const char *stage, const IoResult &r)
  {
    if (r.code == TransportError::Timeout)
    {
      throw rpc::TimeoutError(std::string("HTTP ") + stage + " timed out: " + r.message);
    }
    throw rpc::SendFailedError(std::string("HTTP ") + stage + " failed: " + r.describe());
  }

  HttpResponse readResponse(StreamSocket &socket, std::chrono::steady_clock::time_point deadline)
  {
    std::string buf;
    bool eof = false;
    auto readMore = [&]()
    {
      auto left = remaining(deadline);
      if (left.count() == 0)
      {
        throw rpc::TimeoutError("HTTP response timed out");
      }
      if (buf.size() > _config.maxResponseSize)
      {
        throw rpc::MalformedResultError("HTTP response exceeds size limit");
      }
      auto r = socket.readSome(buf, std::min(left, std::chrono::milliseconds(100)));
      if (!r.ok)
      {
        if (r.code == TransportError::PeerClosed)
        {
          eof = true;
          return;
        }
        throwIo("read", r);
      }
    };

    std::size_t headEnd;
    while ((headEnd = buf.find("\r\n\r\n")) == std::string::npos)
    {
      if (eof)
      {
        throw rpc::SendFailedError("HTTP connection closed before response head");
      }
      readMore();
    }

    HttpResponse response;
    try
    {
      response = HttpResponse::parseHead(buf.substr(0, headEnd));
    }
    catch (const std::invalid_argument &e)
    {
      throw rpc::MalformedResultError(e.what());
    }
    const std::size_t bodyStart = headEnd + 4;

    const bool chunked = response.headerHasToken("Transfer-Encoding", "chunked");
    const std::string lengthHeader = response.getHeader("Content-Length");
    if (chunked)
    {
      while (true)
      {
        auto decoded = HttpResponse::decodeChunked(buf.substr(bodyStart));
        if (decoded)
        {
          response.body = std::move(*decoded);
          break;
        }
        if (eof)
        {
          throw rpc::MalformedResultError("HTTP chunked body truncated");
        }
        readMore();
      }
    }
    else if (!lengthHeader.empty())
    {
      std::size_t length = 0;
      try
      {
        length = std::stoul(lengthHeader);
      }
      catch (const std::exception &)
      {
        throw rpc::MalformedResultError("bad Content-Length: " + lengthHeader);
      }
      while (buf.size() - bodyStart < length)
      {
        if (eof)
        {
          throw rpc::MalformedResultError("HTTP body truncated");
        }
        readMore();
      }
      response.body = buf.substr(bodyStart, length);
    }
    else
    {
      while (!eof)
      {
        readMore();
      }
      response.body = buf.substr(bodyStart);
    }
    return response;
  }

  static core::Json parseResult(const HttpResponse &response, std::uint64_t id)
  {
    core::Json doc = core::Json::parse(response.body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object())
    {
      if (!response.isSuccess())
      {
        throw rpc::SendFailedError("HTTP " + std::to_string(response.statusCode) + " " +
                                   response.statusText);
      }
      throw rpc::MalformedResultError("HTTP body is not a JSON-RPC response object");
    }

    auto err = doc.find("error");
    if (err != doc.end() && !err->is_null())
    {
      std::int64_t code = -32000;
      std::string message = "Unknown error";
      core::Json data = nullptr;
      if (err->is_object())
      {
        auto codeIt = err->find("code");
        if (codeIt != err->end() && codeIt->is_number_integer() &&
            !(codeIt->is_number_unsigned() &&
              codeIt->get<std::uint64_t>() >
                static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())))
        {
          code = codeIt->get<std::int64_t>();
        }
        if (err->contains("message") && (*err)["message"].is_string())
        {
          message = (*err)["message"].get<std::string>();
        }
        if (err->contains("data"))
        {
          data = (*err)["data"];
        }
      }
      throw rpc::RemoteError(code, message, std::move(data));
    }

    if (!response.isSuccess())
    {
      throw rpc::SendFailedError("HTTP " + std::to_string(response.statusCode) + " " +
                                 response.statusText);
    }
    auto idIt = doc.find("id");
    if (idIt != doc.end() && idIt->is_number_unsigned() && idIt->get<std::uint64_t>() != id)
    {
      throw rpc::MalformedResultError("JSON-RPC response id mismatch");
    }
    auto result = doc.find("result");
    if (result == doc.end())
    {
      throw rpc::MalformedResultError("JSON-RPC response has neither result nor error");
    }
    return *result;
  }

  Url _url;
  Config _config;
  std::atomic<std::uint64_t> _nextId{0};
};

} // namespace network
} // namespace omnilink
