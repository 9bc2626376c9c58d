// Copyright (c) 2025 Omnilink Authors
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Omnilink, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cstdint>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

#include "omnilink/core/json.hpp"

namespace omnilink
{
namespace core
{

/// \brief Thrown for missing, unreadable or invalid configuration.
class ConfigError : public std::runtime_error
{
public:
  explicit ConfigError(const std::string &what) : std::runtime_error(what) {}
};

/// \brief Loads a JSON configuration file and exposes typed lookups by
/// dotted key path (e.g. "client.reconnect.maxAttempts").
class ConfigLoader
{
public:
  /// \brief Constructs and loads a configuration file.
  explicit ConfigLoader(const std::string &filename) : _filename(filename) { load(); }

  /// \brief Wraps an already parsed document (no backing file).
  static ConfigLoader fromJson(Json document)
  {
    ConfigLoader loader;
    loader._table = std::move(document);
    return loader;
  }

  /// \brief Reloads the configuration from disk.
  bool reload()
  {
    std::ifstream in(_filename);
    if (!in)
    {
      _table = Json::object();
      return false;
    }
    Json parsed = Json::parse(in, nullptr, false, true);
    if (parsed.is_discarded() || !parsed.is_object())
    {
      _table = Json::object();
      return false;
    }
    _table = std::move(parsed);
    return true;
  }

  const Json &load()
  {
    if (_table.empty())
    {
      if (!reload())
      {
        throw ConfigError("Failed to load configuration file: " + _filename);
      }
    }
    return _table;
  }

  /// \brief Gets the full configuration document.
  const Json &table() const { return _table; }

  /// \brief Returns the node at \p dottedKey, or nullptr if any segment is
  /// missing.
  const Json *find(const std::string &dottedKey) const
  {
    const Json *node = &_table;
    std::size_t start = 0;
    while (start <= dottedKey.size())
    {
      auto dot = dottedKey.find('.', start);
      auto segment = dottedKey.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
      if (!node->is_object())
      {
        return nullptr;
      }
      auto it = node->find(segment);
      if (it == node->end())
      {
        return nullptr;
      }
      node = &(*it);
      if (dot == std::string::npos)
      {
        break;
      }
      start = dot + 1;
    }
    return node;
  }

  bool contains(const std::string &dottedKey) const { return find(dottedKey) != nullptr; }

  /// \brief Gets a typed value from the configuration. Returns std::nullopt
  /// when the key is absent or holds a value of another type.
  template <typename T> std::optional<T> get(const std::string &dottedKey) const
  {
    const Json *node = find(dottedKey);
    if (node == nullptr || node->is_null() || node->is_structured())
    {
      return std::nullopt;
    }
    if constexpr (std::is_same_v<T, bool>)
    {
      if (!node->is_boolean())
      {
        return std::nullopt;
      }
    }
    else if constexpr (std::is_integral_v<T>)
    {
      if (!node->is_number_integer())
      {
        return std::nullopt;
      }
    }
    else if constexpr (std::is_floating_point_v<T>)
    {
      if (!node->is_number())
      {
        return std::nullopt;
      }
    }
    else if constexpr (std::is_same_v<T, std::string>)
    {
      if (!node->is_string())
      {
        return std::nullopt;
      }
    }
    return node->get<T>();
  }

  /// \brief Gets an int value from the configuration.
  std::optional<std::int64_t> getInt(const std::string &key) const { return get<std::int64_t>(key); }

  /// \brief Gets a bool value from the configuration.
  std::optional<bool> getBool(const std::string &key) const { return get<bool>(key); }

  /// \brief Gets a string value from the configuration.
  std::optional<std::string> getString(const std::string &key) const
  {
    return get<std::string>(key);
  }

  /// \brief Gets an array of strings from the configuration.
  /// \throws ConfigError if the key is an array but any element is not a
  /// string.
  std::optional<std::vector<std::string>> getStringArray(const std::string &key) const
  {
    const Json *node = find(key);
    if (node == nullptr || !node->is_array())
    {
      return std::nullopt;
    }
    std::vector<std::string> result;
    for (const auto &elem : *node)
    {
      if (!elem.is_string())
      {
        throw ConfigError("ConfigLoader: Array element at '" + key + "' is not a string");
      }
      result.push_back(elem.get<std::string>());
    }
    return result;
  }

private:
  ConfigLoader() : _table(Json::object()) {}

  std::string _filename;
  Json _table;
};

} // namespace core
} // namespace omnilink
