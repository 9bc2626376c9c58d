// Copyright (c) 2025 Omnilink Authors
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Omnilink, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <string>

#include "omnilink/crypto/secure_rng.hpp"

namespace omnilink
{
namespace ids
{

  /// \brief Identifier generators for calls and client instances.
  class CallId
  {
  public:
    /// \brief Fresh 128-bit random call id as 32 lower-case hex chars.
    static std::string next() { return crypto::SecureRng::randomHex(16); }

    /// \brief Client id of the form "omni_<base36 epoch ms>_<16 hex chars>".
    static std::string clientId()
    {
      const auto now = std::chrono::time_point_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
      auto ms = static_cast<std::uint64_t>(now.time_since_epoch().count());
      return "omni_" + toBase36(ms) + "_" + crypto::SecureRng::randomHex(8);
    }

    static std::string toBase36(std::uint64_t value)
    {
      static constexpr char kDigits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
      if (value == 0)
      {
        return "0";
      }
      std::string s;
      while (value > 0)
      {
        s.push_back(kDigits[value % 36]);
        value /= 36;
      }
      std::reverse(s.begin(), s.end());
      return s;
    }
  };

} // namespace ids
} // namespace omnilink
