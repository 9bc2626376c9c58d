// Copyright (c) 2025 Omnilink Authors
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Omnilink, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace omnilink
{
namespace network
{

/// \brief Round-robin cursor over an immutable, non-empty endpoint list.
/// Not synchronized; the owning connection serializes access.
class EndpointSelector
{
public:
  /// \throws std::invalid_argument if \p endpoints is empty
  explicit EndpointSelector(std::vector<std::string> endpoints) : _endpoints(std::move(endpoints))
  {
    if (_endpoints.empty())
    {
      throw std::invalid_argument("EndpointSelector: endpoint list cannot be empty");
    }
  }

  /// \brief Endpoint under the cursor; advances the cursor, wrapping.
  const std::string &next()
  {
    const std::string &endpoint = _endpoints[_cursor];
    _cursor = (_cursor + 1) % _endpoints.size();
    return endpoint;
  }

  const std::vector<std::string> &endpoints() const { return _endpoints; }
  std::size_t size() const { return _endpoints.size(); }
  std::size_t cursor() const { return _cursor; }

private:
  const std::vector<std::string> _endpoints;
  std::size_t _cursor{0};
};

} // namespace network
} // namespace omnilink
