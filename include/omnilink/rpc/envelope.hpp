// Copyright (c) 2025 Omnilink Authors
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Omnilink, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <string>

#include "omnilink/core/json.hpp"

namespace omnilink
{
namespace rpc
{

/// \brief Error object of a response envelope.
struct ResponseError
{
  std::int64_t code{0};
  std::string message;
  core::Json data;
};

/// \brief A parsed response envelope: exactly one of result / error is set.
struct Response
{
  std::string id;
  std::optional<core::Json> result;
  std::optional<ResponseError> error;
  bool cached{false};
  std::string servedBy;

  bool isError() const { return error.has_value(); }
};

/// \brief Parse one inbound text frame. Returns std::nullopt for anything
/// that is not a well-formed response envelope; never throws.
inline std::optional<Response> parseResponse(const std::string &text)
{
  core::Json doc = core::Json::parse(text, nullptr, false);
  if (doc.is_discarded() || !doc.is_object())
  {
    return std::nullopt;
  }

  auto idIt = doc.find("id");
  if (idIt == doc.end() || !idIt->is_string())
  {
    return std::nullopt;
  }

  auto resultIt = doc.find("result");
  auto errorIt = doc.find("error");
  bool hasResult = resultIt != doc.end();
  bool hasError = errorIt != doc.end() && !errorIt->is_null();
  if (hasResult == hasError)
  {
    return std::nullopt;
  }

  Response response;
  response.id = idIt->get<std::string>();
  if (hasError)
  {
    if (!errorIt->is_object())
    {
      return std::nullopt;
    }
    auto codeIt = errorIt->find("code");
    auto messageIt = errorIt->find("message");
    if (codeIt == errorIt->end() || !codeIt->is_number_integer() ||
        messageIt == errorIt->end() || !messageIt->is_string())
    {
      return std::nullopt;
    }
    if (codeIt->is_number_unsigned() &&
        codeIt->get<std::uint64_t>() >
          static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
    {
      return std::nullopt;
    }
    ResponseError err;
    err.code = codeIt->get<std::int64_t>();
    err.message = messageIt->get<std::string>();
    auto dataIt = errorIt->find("data");
    if (dataIt != errorIt->end())
    {
      err.data = *dataIt;
    }
    response.error = std::move(err);
  }
  else
  {
    response.result = std::move(*resultIt);
  }

  auto cachedIt = doc.find("cached");
  if (cachedIt != doc.end() && cachedIt->is_boolean())
  {
    response.cached = cachedIt->get<bool>();
  }
  auto servedByIt = doc.find("servedBy");
  if (servedByIt != doc.end() && servedByIt->is_string())
  {
    response.servedBy = servedByIt->get<std::string>();
  }
  return response;
}

} // namespace rpc
} // namespace omnilink
