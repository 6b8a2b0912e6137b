// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Gossamer, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cstdint>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "gossamer/core/json.hpp"

namespace gossamer
{
namespace core
{
/// \brief Loads and queries JSON configuration files.
///
/// Keys are addressed with dotted paths ("transport.bindPort"). A missing key
/// yields std::nullopt; a key that exists with the wrong JSON type throws, so
/// typos in values are not silently replaced by defaults.
class ConfigLoader
{
public:
  /// \brief Constructs and loads a JSON configuration file.
  /// \throws std::runtime_error if the file cannot be read or parsed
  explicit ConfigLoader(const std::string &filename) : _filename(filename) { load(); }

  /// \brief Builds a loader over an in-memory document.
  static ConfigLoader fromJson(Json doc)
  {
    ConfigLoader loader;
    loader._root = std::move(doc);
    return loader;
  }

  /// \brief Reloads the configuration from disk.
  /// \return false if the file is unreadable or not valid JSON; the previous
  /// document is kept in that case
  bool reload()
  {
    std::ifstream in(_filename);
    if (!in)
    {
      _lastError = "cannot open " + _filename;
      return false;
    }
    try
    {
      Json parsed = Json::parse(in);
      if (!parsed.is_object())
      {
        _lastError = "top-level value is not an object";
        return false;
      }
      _root = std::move(parsed);
      _lastError.clear();
      return true;
    }
    catch (const Json::parse_error &ex)
    {
      _lastError = ex.what();
      return false;
    }
  }

  const Json &load()
  {
    if (!reload())
    {
      throw std::runtime_error("Failed to load configuration file: " + _filename + " (" +
                               _lastError + ")");
    }
    return _root;
  }

  /// \brief Gets the full configuration document.
  const Json &root() const { return _root; }

  /// \brief Gets the node at \p dottedKey, or nullptr if absent.
  const Json *node(const std::string &dottedKey) const
  {
    const Json *cur = &_root;
    std::istringstream parts(dottedKey);
    std::string part;
    while (std::getline(parts, part, '.'))
    {
      if (!cur->is_object())
      {
        return nullptr;
      }
      auto it = cur->find(part);
      if (it == cur->end())
      {
        return nullptr;
      }
      cur = &(*it);
    }
    return cur;
  }

  bool contains(const std::string &dottedKey) const { return node(dottedKey) != nullptr; }

  /// \brief Gets an int value from the configuration.
  /// \throws std::runtime_error if the value is not an integer
  std::optional<std::int64_t> getInt(const std::string &key) const
  {
    const Json *n = node(key);
    if (!n || n->is_null())
    {
      return std::nullopt;
    }
    if (!n->is_number_integer())
    {
      throw std::runtime_error("ConfigLoader: value at '" + key + "' is not an integer");
    }
    return n->get<std::int64_t>();
  }

  /// \brief Gets a bool value from the configuration.
  std::optional<bool> getBool(const std::string &key) const
  {
    const Json *n = node(key);
    if (!n || n->is_null())
    {
      return std::nullopt;
    }
    if (!n->is_boolean())
    {
      throw std::runtime_error("ConfigLoader: value at '" + key + "' is not a boolean");
    }
    return n->get<bool>();
  }

  /// \brief Gets a string value from the configuration.
  std::optional<std::string> getString(const std::string &key) const
  {
    const Json *n = node(key);
    if (!n || n->is_null())
    {
      return std::nullopt;
    }
    if (!n->is_string())
    {
      throw std::runtime_error("ConfigLoader: value at '" + key + "' is not a string");
    }
    return n->get<std::string>();
  }

  /// \brief Gets an array of strings from the configuration.
  /// \throws std::runtime_error if the key is not an array or any element is
  /// not a string
  std::optional<std::vector<std::string>> getStringArray(const std::string &key) const
  {
    const Json *n = node(key);
    if (!n || n->is_null())
    {
      return std::nullopt;
    }
    if (!n->is_array())
    {
      throw std::runtime_error("ConfigLoader: value at '" + key + "' is not an array");
    }
    std::vector<std::string> result;
    for (const auto &elem : *n)
    {
      if (!elem.is_string())
      {
        throw std::runtime_error("ConfigLoader: Array element at '" + key + "' is not a string");
      }
      result.push_back(elem.get<std::string>());
    }
    return result;
  }

  const std::string &filename() const { return _filename; }

private:
  ConfigLoader() : _root(Json::object()) {}

  std::string _filename;
  std::string _lastError;
  Json _root;
};

} // namespace core
} // namespace gossamer
