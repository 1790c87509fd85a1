// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of jsonflow, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <jsonflow/parsers/minimal_toml.hpp>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace jsonflow
{
namespace core
{
/// \brief Loads and parses TOML configuration files for the application.
class ConfigLoader
{
public:
  /// \brief Constructs a loader for \p filename without reading it.
  explicit ConfigLoader(std::string filename) : _filename(std::move(filename)) {}

  /// \brief Builds a loader over an in-memory document.
  static ConfigLoader fromString(const std::string &toml)
  {
    ConfigLoader loader("<memory>");
    loader._table = parsers::toml::parse(toml);
    loader._loaded = true;
    return loader;
  }

  /// \brief Reads and parses the file.
  /// \throws std::runtime_error if the file is missing or malformed.
  const parsers::toml::table &load()
  {
    try
    {
      _table = parsers::toml::parse_file(_filename);
      _loaded = true;
    }
    catch (const std::exception &e)
    {
      _table = parsers::toml::table{};
      _loaded = false;
      throw std::runtime_error("Failed to load configuration file " + _filename + ": " + e.what());
    }
    return _table;
  }

  bool isLoaded() const { return _loaded; }

  const std::string &filename() const { return _filename; }

  /// \brief Gets the full configuration table.
  const parsers::toml::table &table() const { return _table; }

  /// \brief Gets a typed value from the configuration.
  /// \tparam T int64_t, double, bool or std::string
  template <typename T> std::optional<T> get(const std::string &dottedKey) const
  {
    auto node = _table.at_path(dottedKey);
    if (node)
    {
      if (auto val = node.as<T>())
      {
        return val;
      }
    }
    return std::nullopt;
  }

  std::optional<int64_t> getInt(const std::string &key) const { return get<int64_t>(key); }

  std::optional<bool> getBool(const std::string &key) const { return get<bool>(key); }

  std::optional<std::string> getString(const std::string &key) const
  {
    return get<std::string>(key);
  }

  /// \brief Gets a strictly positive integer.
  /// \throws std::invalid_argument if the key is present but not a positive
  /// integer.
  std::optional<std::size_t> getPositive(const std::string &key) const
  {
    auto node = _table.at_path(key);
    if (!node)
    {
      return std::nullopt;
    }
    auto val = node.as<int64_t>();
    if (!val || *val <= 0)
    {
      throw std::invalid_argument("ConfigLoader: '" + key + "' must be a positive integer");
    }
    return static_cast<std::size_t>(*val);
  }

private:
  std::string _filename;
  parsers::toml::table _table;
  bool _loaded{false};
};

} // namespace core
} // namespace jsonflow
