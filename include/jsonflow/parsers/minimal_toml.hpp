// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of jsonflow, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

/// \file minimal_toml.hpp
/// \brief Flat TOML subset used for jsonflow configuration files.
///
/// Supported: comments, `[section]` and `[a.b]` headers, bare/dotted keys,
/// basic and literal strings, integers, floats and booleans. Values are stored
/// under their fully qualified dotted key ("stream.chunk_buffer_size").
/// Arrays, inline tables and dates are rejected.

#include <cctype>
#include <cstdint>
#include <fstream>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>

namespace jsonflow
{
namespace parsers
{
namespace toml
{

using value_type = std::variant<std::monostate, int64_t, double, bool, std::string>;

/// \brief Thrown for malformed TOML input; carries the 1-based line.
class parse_error : public std::runtime_error
{
public:
  parse_error(const std::string &msg, std::size_t line)
      : std::runtime_error("TOML parse error at line " + std::to_string(line) + ": " + msg),
        _line(line)
  {
  }

  std::size_t line() const { return _line; }

private:
  std::size_t _line;
};

class node
{
public:
  node() = default;
  node(value_type val) : _value(std::move(val)) {}

  bool is_value() const { return !std::holds_alternative<std::monostate>(_value); }
  bool is_string() const { return std::holds_alternative<std::string>(_value); }
  bool is_integer() const { return std::holds_alternative<int64_t>(_value); }
  bool is_floating_point() const { return std::holds_alternative<double>(_value); }
  bool is_boolean() const { return std::holds_alternative<bool>(_value); }

  template <typename T> std::optional<T> as() const
  {
    if constexpr (std::is_same_v<T, double>)
    {
      if (auto *val = std::get_if<double>(&_value))
        return *val;
      if (auto *val = std::get_if<int64_t>(&_value))
        return static_cast<double>(*val);
    }
    else
    {
      if (auto *val = std::get_if<T>(&_value))
        return *val;
    }
    return std::nullopt;
  }

  explicit operator bool() const { return is_value(); }

private:
  value_type _value;
};

/// \brief Parsed document: dotted key to value.
class table
{
public:
  using container_type = std::map<std::string, node>;
  using const_iterator = container_type::const_iterator;

  bool contains(const std::string &dottedKey) const
  {
    return _values.find(dottedKey) != _values.end();
  }

  /// \brief True when any key lives under \p section ("stream" matches
  /// "stream.fragment_size").
  bool has_section(const std::string &section) const
  {
    auto it = _values.lower_bound(section + ".");
    return it != _values.end() && it->first.compare(0, section.size() + 1, section + ".") == 0;
  }

  bool empty() const { return _values.empty(); }
  std::size_t size() const { return _values.size(); }

  node at_path(const std::string &dottedKey) const
  {
    auto it = _values.find(dottedKey);
    return it == _values.end() ? node() : it->second;
  }

  void insert(const std::string &dottedKey, node value) { _values[dottedKey] = std::move(value); }

  const_iterator begin() const { return _values.begin(); }
  const_iterator end() const { return _values.end(); }

private:
  container_type _values;
};

class parser
{
public:
  explicit parser(std::string input) : _input(std::move(input)) {}

  table parse()
  {
    table root;
    std::string section;

    while (true)
    {
      skipWhitespaceAndComments();
      if (isEnd())
        break;

      if (peek() == '[')
      {
        section = parseSection();
      }
      else
      {
        std::string key = parseKey();
        skipWhitespace();
        if (peek() != '=')
          fail("Expected '=' after key '" + key + "'");
        advance();
        skipWhitespace();

        std::string fullKey = section.empty() ? key : section + "." + key;
        if (root.contains(fullKey))
          fail("Duplicate key '" + fullKey + "'");
        root.insert(fullKey, node(parseValue()));
        expectEndOfLine();
      }
    }
    return root;
  }

private:
  std::string _input;
  std::size_t _pos{0};
  std::size_t _line{1};

  [[noreturn]] void fail(const std::string &msg) const { throw parse_error(msg, _line); }

  bool isEnd() const { return _pos >= _input.size(); }
  char peek() const { return isEnd() ? '\0' : _input[_pos]; }
  char advance()
  {
    if (isEnd())
      return '\0';
    char c = _input[_pos++];
    if (c == '\n')
      ++_line;
    return c;
  }

  static bool isBareKeyChar(char c)
  {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
  }

  void skipWhitespace()
  {
    while (!isEnd() && (peek() == ' ' || peek() == '\t'))
      advance();
  }

  void skipWhitespaceAndComments()
  {
    while (!isEnd())
    {
      if (std::isspace(static_cast<unsigned char>(peek())))
      {
        advance();
      }
      else if (peek() == '#')
      {
        while (!isEnd() && peek() != '\n')
          advance();
      }
      else
      {
        break;
      }
    }
  }

  void expectEndOfLine()
  {
    skipWhitespace();
    if (peek() == '#')
    {
      while (!isEnd() && peek() != '\n')
        advance();
    }
    if (peek() == '\r')
      advance();
    if (!isEnd() && peek() != '\n')
      fail("Unexpected trailing characters");
  }

  std::string parseSection()
  {
    advance(); // skip '['
    skipWhitespace();
    std::string section = parseKey();
    skipWhitespace();
    if (peek() != ']')
      fail("Unterminated section header");
    advance();
    expectEndOfLine();
    return section;
  }

  std::string parseKey()
  {
    std::string key;
    while (true)
    {
      std::string part;
      if (peek() == '"' || peek() == '\'')
      {
        part = parseString();
      }
      else
      {
        while (!isEnd() && isBareKeyChar(peek()))
          part += advance();
      }
      if (part.empty())
        fail("Expected key");
      key += part;

      skipWhitespace();
      if (peek() != '.')
        break;
      advance();
      skipWhitespace();
      key += '.';
    }
    return key;
  }

  value_type parseValue()
  {
    char c = peek();
    if (c == '"' || c == '\'')
      return parseString();
    if (c == 't' || c == 'f')
      return parseBool();
    if (c == '+' || c == '-' || std::isdigit(static_cast<unsigned char>(c)))
      return parseNumber();
    if (c == '[' || c == '{')
      fail("Arrays and inline tables are not supported");
    fail("Invalid value");
  }

  std::string parseString()
  {
    char quote = advance();
    std::string str;
    while (!isEnd() && peek() != quote && peek() != '\n')
    {
      if (quote == '"' && peek() == '\\')
      {
        advance();
        char c = advance();
        switch (c)
        {
        case 'n':
          str += '\n';
          break;
        case 't':
          str += '\t';
          break;
        case 'r':
          str += '\r';
          break;
        case '\\':
          str += '\\';
          break;
        case '"':
          str += '"';
          break;
        default:
          fail(std::string("Invalid escape sequence '\\") + c + "'");
        }
      }
      else
      {
        str += advance();
      }
    }
    if (peek() != quote)
      fail("Unterminated string");
    advance();
    return str;
  }

  bool parseBool()
  {
    std::string word;
    while (!isEnd() && std::isalpha(static_cast<unsigned char>(peek())))
      word += advance();

    if (word == "true")
      return true;
    if (word == "false")
      return false;
    fail("Invalid boolean value: " + word);
  }

  value_type parseNumber()
  {
    std::string num;
    bool isFloat = false;

    if (peek() == '+' || peek() == '-')
      num += advance();

    while (!isEnd())
    {
      char c = peek();
      if (c == '_')
      {
        advance();
        continue;
      }
      if (c == '.' || c == 'e' || c == 'E')
        isFloat = true;
      else if (!std::isdigit(static_cast<unsigned char>(c)) &&
               !((c == '+' || c == '-') && (num.back() == 'e' || num.back() == 'E')))
        break;
      num += advance();
    }

    try
    {
      std::size_t used = 0;
      value_type result;
      if (isFloat)
        result = std::stod(num, &used);
      else
        result = static_cast<int64_t>(std::stoll(num, &used));
      if (used != num.size())
        fail("Invalid number: " + num);
      return result;
    }
    catch (const std::logic_error &)
    {
      fail("Invalid number: " + num);
    }
  }
};

inline table parse(const std::string &tomlString)
{
  parser p(tomlString);
  return p.parse();
}

inline table parse_file(const std::string &filename)
{
  std::ifstream file(filename);
  if (!file.is_open())
    throw std::runtime_error("Cannot open file: " + filename);

  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

} // namespace toml
} // namespace parsers
} // namespace jsonflow
