// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of VaultRelay, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <vaultrelay/parsers/minimal_toml.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace vaultrelay
{
namespace core
{

/// \brief Raised for a value of the wrong type or out of range.
class ConfigTypeError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

/// \brief Typed, dotted-key access to a TOML document.
///
/// Missing keys yield std::nullopt; a present key of the wrong type throws
/// ConfigTypeError so typos in values are not silently replaced by defaults.
class ConfigLoader
{
public:
  ConfigLoader() = default;

  /// \brief Load from a file.
  /// \throws std::runtime_error if the file cannot be read or parsed
  explicit ConfigLoader(const std::string &filename) : _filename(filename) { reload(); }

  static ConfigLoader fromString(const std::string &document)
  {
    ConfigLoader loader;
    loader._table = parsers::toml::parse(document);
    return loader;
  }

  /// \brief Re-read the file; on failure the previous contents are kept.
  /// \throws std::runtime_error describing the failure
  void reload()
  {
    if (_filename.empty())
    {
      throw std::runtime_error("ConfigLoader: no file to reload");
    }
    try
    {
      _table = parsers::toml::parse_file(_filename);
    }
    catch (const std::exception &e)
    {
      throw std::runtime_error("Failed to load configuration file " + _filename + ": " +
                               e.what());
    }
  }

  const std::string &filename() const { return _filename; }

  const parsers::toml::table &table() const { return _table; }

  bool contains(const std::string &dottedKey) const
  {
    return static_cast<bool>(_table.at_path(dottedKey));
  }

  template <typename T> std::optional<T> get(const std::string &dottedKey) const
  {
    auto node = _table.at_path(dottedKey);
    if (!node)
    {
      return std::nullopt;
    }
    if (auto value = node.as<T>())
    {
      return value;
    }
    throw ConfigTypeError("configuration key '" + dottedKey + "' has the wrong type");
  }

  std::optional<std::int64_t> getInt(const std::string &key) const
  {
    return get<std::int64_t>(key);
  }

  std::optional<bool> getBool(const std::string &key) const { return get<bool>(key); }

  std::optional<std::string> getString(const std::string &key) const
  {
    return get<std::string>(key);
  }

  /// \brief Millisecond duration from an integer key. Negative values throw.
  std::optional<std::chrono::milliseconds> getMillis(const std::string &key) const
  {
    auto value = getInt(key);
    if (!value)
    {
      return std::nullopt;
    }
    if (*value < 0)
    {
      throw ConfigTypeError("configuration key '" + key + "' must not be negative");
    }
    return std::chrono::milliseconds(*value);
  }

  /// \brief Array of strings.
  /// \throws ConfigTypeError if the key is not an array or holds a
  /// non-string element
  std::optional<std::vector<std::string>> getStringArray(const std::string &key) const
  {
    auto node = _table.at_path(key);
    if (!node)
    {
      return std::nullopt;
    }
    const auto *items = node.as_array();
    if (!items)
    {
      throw ConfigTypeError("configuration key '" + key + "' is not an array");
    }
    std::vector<std::string> result;
    for (const auto &item : *items)
    {
      auto text = item.as<std::string>();
      if (!text)
      {
        throw ConfigTypeError("array '" + key + "' contains a non-string element");
      }
      result.push_back(*text);
    }
    return result;
  }

private:
  std::string _filename;
  parsers::toml::table _table;
};

} // namespace core
} // namespace vaultrelay
