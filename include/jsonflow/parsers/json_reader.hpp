// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of jsonflow, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once
/// \file json_reader.hpp
/// \brief Forward-only, resumable UTF-8 JSON tokenizer.
///
/// Features
/// --------
/// - Reads one token per read() call out of a caller-owned byte span
/// - Never reports a partially received token: when the span ends inside a
///   token, read() returns false and bytesConsumed() stops before it
/// - All cross-call bookkeeping lives in the copyable \c JsonReaderState, so a
///   new reader over "leftover + new bytes" continues exactly where the last
///   one stopped
/// - Strict RFC 8259 lexing: literals, number grammar, string escapes
///   (\\uXXXX and surrogate pairs decoded to UTF-8), UTF-8 validation,
///   commas, colons and container balance
///
/// Notes
/// -----
/// - Errors are thrown as \c JsonReaderException. Running out of bytes is not
///   an error unless the reader was created with \c isFinalBlock.
/// - A number that touches the end of a non-final span is incomplete, since
///   more digits may follow.
/// - Only one root value is accepted; anything but whitespace after it is an
///   error.

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <locale>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace jsonflow
{
namespace parsers
{

/// \brief JSON token kinds reported by \c JsonReader.
enum class JsonTokenType
{
  None,
  StartObject,
  EndObject,
  StartArray,
  EndArray,
  PropertyName,
  String,
  Number,
  True,
  False,
  Null
};

inline const char *tokenTypeName(JsonTokenType type)
{
  switch (type)
  {
  case JsonTokenType::None:
    return "None";
  case JsonTokenType::StartObject:
    return "StartObject";
  case JsonTokenType::EndObject:
    return "EndObject";
  case JsonTokenType::StartArray:
    return "StartArray";
  case JsonTokenType::EndArray:
    return "EndArray";
  case JsonTokenType::PropertyName:
    return "PropertyName";
  case JsonTokenType::String:
    return "String";
  case JsonTokenType::Number:
    return "Number";
  case JsonTokenType::True:
    return "True";
  case JsonTokenType::False:
    return "False";
  case JsonTokenType::Null:
    return "Null";
  }
  return "Unknown";
}

/// \brief Limits applied while tokenizing.
struct JsonReaderOptions
{
  std::size_t maxDepth{64}; ///< Maximum container nesting depth
};

/// \brief Lexical error: the bytes seen so far cannot start a valid JSON
/// document.
class JsonReaderException : public std::runtime_error
{
public:
  JsonReaderException(const std::string &reason, std::size_t offset, std::size_t line,
                      std::size_t column)
      : std::runtime_error("JSON lexical error at line " + std::to_string(line) + ", column " +
                           std::to_string(column) + " (offset " + std::to_string(offset) +
                           "): " + reason),
        _reason(reason), _offset(offset), _line(line), _column(column)
  {
  }

  const std::string &reason() const { return _reason; }
  std::size_t offset() const { return _offset; }
  std::size_t line() const { return _line; }
  std::size_t column() const { return _column; }

private:
  std::string _reason;
  std::size_t _offset;
  std::size_t _line;
  std::size_t _column;
};

enum class JsonContainer : std::uint8_t
{
  Object,
  Array
};

/// \brief Resume state carried between readers.
struct JsonReaderState
{
  std::vector<JsonContainer> containers; ///< Open containers, innermost last
  JsonTokenType tokenType{JsonTokenType::None}; ///< Last complete token
  bool rootCompleted{false};    ///< The root value has been fully read
  std::size_t bytesConsumed{0}; ///< Absolute bytes validated so far
  std::size_t line{1};          ///< 1-based line of the next unread byte
  std::size_t column{1};        ///< 1-based column of the next unread byte

  std::size_t depth() const { return containers.size(); }
};

class JsonReader
{
public:
  /// \param buffer Bytes to tokenize; must outlive the reader
  /// \param isFinalBlock True when no more bytes will ever follow \p buffer
  /// \param state State returned by the previous reader's currentState()
  JsonReader(std::string_view buffer, bool isFinalBlock, JsonReaderState state = {},
             JsonReaderOptions options = {})
      : _buffer(buffer), _isFinalBlock(isFinalBlock), _state(std::move(state)), _options(options)
  {
    if (_options.maxDepth == 0)
    {
      throw std::invalid_argument("JsonReader maxDepth must be greater than 0");
    }
  }

  /// \brief Advances to the next complete token.
  /// \return false when the buffer holds no further complete token
  /// \throws JsonReaderException on invalid input
  bool read()
  {
    std::size_t pos = _consumed;
    _skipWhitespace(pos);
    if (pos >= _buffer.size())
    {
      return _needMoreData(pos);
    }

    const char c = _buffer[pos];
    if (_state.containers.empty())
    {
      if (_state.rootCompleted)
      {
        _fail(pos, "Extra characters after JSON value");
      }
      return _readValue(pos);
    }

    if (_state.containers.back() == JsonContainer::Object)
    {
      switch (_state.tokenType)
      {
      case JsonTokenType::StartObject:
        if (c == '}')
        {
          return _closeContainer(pos, JsonContainer::Object);
        }
        if (c == '"')
        {
          return _readPropertyName(pos);
        }
        _fail(pos, "Expected property name or '}'");
      case JsonTokenType::PropertyName:
        if (c != ':')
        {
          _fail(pos, "Expected ':' after property name");
        }
        ++pos;
        _skipWhitespace(pos);
        if (pos >= _buffer.size())
        {
          return _needMoreData(pos);
        }
        return _readValue(pos);
      default:
        if (c == '}')
        {
          return _closeContainer(pos, JsonContainer::Object);
        }
        if (c != ',')
        {
          _fail(pos, "Expected ',' or '}'");
        }
        ++pos;
        _skipWhitespace(pos);
        if (pos >= _buffer.size())
        {
          return _needMoreData(pos);
        }
        if (_buffer[pos] != '"')
        {
          _fail(pos, "Expected property name after ','");
        }
        return _readPropertyName(pos);
      }
    }

    if (_state.tokenType == JsonTokenType::StartArray)
    {
      if (c == ']')
      {
        return _closeContainer(pos, JsonContainer::Array);
      }
      return _readValue(pos);
    }
    if (c == ']')
    {
      return _closeContainer(pos, JsonContainer::Array);
    }
    if (c != ',')
    {
      _fail(pos, "Expected ',' or ']'");
    }
    ++pos;
    _skipWhitespace(pos);
    if (pos >= _buffer.size())
    {
      return _needMoreData(pos);
    }
    if (_buffer[pos] == ']')
    {
      _fail(pos, "Trailing comma before ']'");
    }
    return _readValue(pos);
  }

  JsonTokenType tokenType() const { return _tokenType; }

  /// \brief Raw bytes of the current token. Strings and property names are
  /// returned without quotes and still escaped.
  std::string_view valueSpan() const { return _valueSpan; }

  /// \brief Unescaped value of a String or PropertyName token.
  const std::string &getString() const
  {
    if (_tokenType != JsonTokenType::String && _tokenType != JsonTokenType::PropertyName)
    {
      throw std::logic_error(std::string("JsonReader: cannot read a string from a ") +
                             tokenTypeName(_tokenType) + " token");
    }
    return _decoded;
  }

  /// \brief Reads the current Number token as a 32-bit integer.
  /// \return false if the token is not an integral number in range
  bool tryGetInt32(std::int32_t &out) const { return _tryGetInteger(out); }

  bool tryGetInt64(std::int64_t &out) const { return _tryGetInteger(out); }

  double getDouble() const
  {
    if (_tokenType != JsonTokenType::Number)
    {
      throw std::logic_error(std::string("JsonReader: cannot read a number from a ") +
                             tokenTypeName(_tokenType) + " token");
    }
    // The classic locale keeps '.' as the decimal point whatever LC_NUMERIC says.
    std::istringstream in{std::string(_valueSpan)};
    in.imbue(std::locale::classic());
    double value = 0.0;
    in >> value;
    return value;
  }

  bool getBoolean() const
  {
    if (_tokenType == JsonTokenType::True)
    {
      return true;
    }
    if (_tokenType == JsonTokenType::False)
    {
      return false;
    }
    throw std::logic_error(std::string("JsonReader: cannot read a boolean from a ") +
                           tokenTypeName(_tokenType) + " token");
  }

  /// \brief Bytes of this reader's buffer covered by complete tokens.
  std::size_t bytesConsumed() const { return _consumed; }

  /// \brief State to hand to the reader of the next buffer.
  const JsonReaderState &currentState() const { return _state; }

  std::size_t currentDepth() const { return _state.depth(); }

  bool isFinalBlock() const { return _isFinalBlock; }

private:
  enum class Scan
  {
    Complete,
    Incomplete
  };

  std::string_view _buffer;
  bool _isFinalBlock;
  JsonReaderState _state;
  JsonReaderOptions _options;
  std::size_t _consumed{0};

  JsonTokenType _tokenType{JsonTokenType::None};
  std::string_view _valueSpan;
  std::string _decoded;
  std::string _scratch;

  static bool _isWhitespace(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; }

  static bool _isDigit(char c) { return c >= '0' && c <= '9'; }

  static int _hexValue(char c)
  {
    if (c >= '0' && c <= '9')
      return c - '0';
    if (c >= 'a' && c <= 'f')
      return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
      return c - 'A' + 10;
    return -1;
  }

  void _skipWhitespace(std::size_t &pos) const
  {
    while (pos < _buffer.size() && _isWhitespace(_buffer[pos]))
    {
      ++pos;
    }
  }

  [[noreturn]] void _fail(std::size_t pos, const std::string &reason) const
  {
    std::size_t line = _state.line;
    std::size_t column = _state.column;
    for (std::size_t i = _consumed; i < pos && i < _buffer.size(); ++i)
    {
      if (_buffer[i] == '\n')
      {
        ++line;
        column = 1;
      }
      else
      {
        ++column;
      }
    }
    throw JsonReaderException(reason, _state.bytesConsumed + (pos - _consumed), line, column);
  }

  bool _needMoreData(std::size_t pos)
  {
    if (_isFinalBlock && !_state.rootCompleted)
    {
      _fail(pos, "Unexpected end of input");
    }
    return false;
  }

  Scan _incomplete(std::size_t pos)
  {
    if (_isFinalBlock)
    {
      _fail(pos, "Unexpected end of input");
    }
    return Scan::Incomplete;
  }

  void _advanceTo(std::size_t end)
  {
    for (std::size_t i = _consumed; i < end; ++i)
    {
      if (_buffer[i] == '\n')
      {
        ++_state.line;
        _state.column = 1;
      }
      else
      {
        ++_state.column;
      }
    }
    _state.bytesConsumed += end - _consumed;
    _consumed = end;
  }

  bool _commit(JsonTokenType type, std::size_t end, std::string_view span)
  {
    _advanceTo(end);
    _tokenType = type;
    _state.tokenType = type;
    _valueSpan = span;
    if (_state.containers.empty())
    {
      _state.rootCompleted = true;
    }
    return true;
  }

  bool _openContainer(std::size_t pos, JsonContainer container)
  {
    if (_state.containers.size() >= _options.maxDepth)
    {
      _fail(pos, "Maximum nesting depth exceeded");
    }
    _state.containers.push_back(container);
    _advanceTo(pos + 1);
    _tokenType = container == JsonContainer::Object ? JsonTokenType::StartObject
                                                    : JsonTokenType::StartArray;
    _state.tokenType = _tokenType;
    _valueSpan = _buffer.substr(pos, 1);
    return true;
  }

  bool _closeContainer(std::size_t pos, JsonContainer container)
  {
    _state.containers.pop_back();
    return _commit(container == JsonContainer::Object ? JsonTokenType::EndObject
                                                      : JsonTokenType::EndArray,
                   pos + 1, _buffer.substr(pos, 1));
  }

  bool _readPropertyName(std::size_t pos)
  {
    std::size_t end = 0;
    if (_scanString(pos, end) == Scan::Incomplete)
    {
      return false;
    }
    _decoded.swap(_scratch);
    _advanceTo(end);
    _tokenType = JsonTokenType::PropertyName;
    _state.tokenType = JsonTokenType::PropertyName;
    _valueSpan = _buffer.substr(pos + 1, end - pos - 2);
    return true;
  }

  bool _readValue(std::size_t pos)
  {
    std::size_t end = 0;
    switch (_buffer[pos])
    {
    case '{':
      return _openContainer(pos, JsonContainer::Object);
    case '[':
      return _openContainer(pos, JsonContainer::Array);
    case '"':
      if (_scanString(pos, end) == Scan::Incomplete)
      {
        return false;
      }
      _decoded.swap(_scratch);
      return _commit(JsonTokenType::String, end, _buffer.substr(pos + 1, end - pos - 2));
    case 't':
      return _readLiteral(pos, "true", JsonTokenType::True);
    case 'f':
      return _readLiteral(pos, "false", JsonTokenType::False);
    case 'n':
      return _readLiteral(pos, "null", JsonTokenType::Null);
    case '-':
    case '0':
    case '1':
    case '2':
    case '3':
    case '4':
    case '5':
    case '6':
    case '7':
    case '8':
    case '9':
      if (_scanNumber(pos, end) == Scan::Incomplete)
      {
        return false;
      }
      return _commit(JsonTokenType::Number, end, _buffer.substr(pos, end - pos));
    default:
      _fail(pos, "Unexpected character");
    }
  }

  bool _readLiteral(std::size_t pos, std::string_view literal, JsonTokenType type)
  {
    for (std::size_t i = 0; i < literal.size(); ++i)
    {
      if (pos + i >= _buffer.size())
      {
        _incomplete(pos + i);
        return false;
      }
      if (_buffer[pos + i] != literal[i])
      {
        _fail(pos + i, "Invalid literal");
      }
    }
    return _commit(type, pos + literal.size(), _buffer.substr(pos, literal.size()));
  }

  /// A number is complete only once a non-number byte follows it, or the
  /// block is final.
  Scan _numberEnd(std::size_t p, std::size_t &end) const
  {
    end = p;
    return _isFinalBlock ? Scan::Complete : Scan::Incomplete;
  }

  Scan _scanNumber(std::size_t start, std::size_t &end)
  {
    std::size_t p = start;
    if (_buffer[p] == '-')
    {
      ++p;
      if (p >= _buffer.size())
        return _incomplete(p);
    }

    if (!_isDigit(_buffer[p]))
    {
      _fail(p, "Invalid number: expected digit");
    }
    if (_buffer[p] == '0')
    {
      ++p;
      if (p < _buffer.size() && _isDigit(_buffer[p]))
      {
        _fail(p, "Invalid number: leading zero");
      }
    }
    else
    {
      while (p < _buffer.size() && _isDigit(_buffer[p]))
        ++p;
    }
    if (p >= _buffer.size())
      return _numberEnd(p, end);

    if (_buffer[p] == '.')
    {
      ++p;
      if (p >= _buffer.size())
        return _incomplete(p);
      if (!_isDigit(_buffer[p]))
      {
        _fail(p, "Invalid number: expected digit after '.'");
      }
      while (p < _buffer.size() && _isDigit(_buffer[p]))
        ++p;
      if (p >= _buffer.size())
        return _numberEnd(p, end);
    }

    if (_buffer[p] == 'e' || _buffer[p] == 'E')
    {
      ++p;
      if (p >= _buffer.size())
        return _incomplete(p);
      if (_buffer[p] == '+' || _buffer[p] == '-')
      {
        ++p;
        if (p >= _buffer.size())
          return _incomplete(p);
      }
      if (!_isDigit(_buffer[p]))
      {
        _fail(p, "Invalid number: expected digit in exponent");
      }
      while (p < _buffer.size() && _isDigit(_buffer[p]))
        ++p;
      if (p >= _buffer.size())
        return _numberEnd(p, end);
    }

    end = p;
    return Scan::Complete;
  }

  /// Reads 4 hex digits at \p p. Returns false when the buffer ends first;
  /// invalid digits among the available bytes fail immediately.
  bool _readHex4(std::size_t p, std::uint32_t &out) const
  {
    out = 0;
    for (std::size_t i = 0; i < 4; ++i)
    {
      if (p + i >= _buffer.size())
      {
        return false;
      }
      int v = _hexValue(_buffer[p + i]);
      if (v < 0)
      {
        _fail(p + i, "Invalid \\u escape");
      }
      out = (out << 4) | static_cast<std::uint32_t>(v);
    }
    return true;
  }

  static void _appendUtf8(std::string &out, std::uint32_t cp)
  {
    if (cp < 0x80)
    {
      out += static_cast<char>(cp);
    }
    else if (cp < 0x800)
    {
      out += static_cast<char>(0xC0 | (cp >> 6));
      out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    else if (cp < 0x10000)
    {
      out += static_cast<char>(0xE0 | (cp >> 12));
      out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
      out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    else
    {
      out += static_cast<char>(0xF0 | (cp >> 18));
      out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
      out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
      out += static_cast<char>(0x80 | (cp & 0x3F));
    }
  }

  /// Validates the UTF-8 sequence starting at \p p against the bytes that are
  /// available; returns the sequence length, or 0 when it is cut off by the
  /// end of the buffer.
  std::size_t _checkUtf8(std::size_t p) const
  {
    const auto lead = static_cast<unsigned char>(_buffer[p]);
    std::size_t len = 0;
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF)
    {
      len = 2;
    }
    else if (lead >= 0xE0 && lead <= 0xEF)
    {
      len = 3;
      if (lead == 0xE0)
        lo = 0xA0;
      else if (lead == 0xED)
        hi = 0x9F;
    }
    else if (lead >= 0xF0 && lead <= 0xF4)
    {
      len = 4;
      if (lead == 0xF0)
        lo = 0x90;
      else if (lead == 0xF4)
        hi = 0x8F;
    }
    else
    {
      _fail(p, "Invalid UTF-8 lead byte");
    }

    for (std::size_t i = 1; i < len; ++i)
    {
      if (p + i >= _buffer.size())
      {
        return 0;
      }
      const auto b = static_cast<unsigned char>(_buffer[p + i]);
      const unsigned char min = i == 1 ? lo : 0x80;
      const unsigned char max = i == 1 ? hi : 0xBF;
      if (b < min || b > max)
      {
        _fail(p + i, "Invalid UTF-8 continuation byte");
      }
    }
    return len;
  }

  Scan _scanString(std::size_t start, std::size_t &end)
  {
    _scratch.clear();
    std::size_t p = start + 1;
    while (true)
    {
      if (p >= _buffer.size())
      {
        return _incomplete(p);
      }

      const auto c = static_cast<unsigned char>(_buffer[p]);
      if (c == '"')
      {
        end = p + 1;
        return Scan::Complete;
      }

      if (c == '\\')
      {
        if (p + 1 >= _buffer.size())
        {
          return _incomplete(p + 1);
        }
        switch (_buffer[p + 1])
        {
        case '"':
          _scratch += '"';
          break;
        case '\\':
          _scratch += '\\';
          break;
        case '/':
          _scratch += '/';
          break;
        case 'b':
          _scratch += '\b';
          break;
        case 'f':
          _scratch += '\f';
          break;
        case 'n':
          _scratch += '\n';
          break;
        case 'r':
          _scratch += '\r';
          break;
        case 't':
          _scratch += '\t';
          break;
        case 'u':
        {
          std::uint32_t cp = 0;
          if (!_readHex4(p + 2, cp))
          {
            return _incomplete(_buffer.size());
          }
          if (cp >= 0xDC00 && cp <= 0xDFFF)
          {
            _fail(p, "Unpaired low surrogate in \\u escape");
          }
          if (cp >= 0xD800 && cp <= 0xDBFF)
          {
            const std::size_t q = p + 6;
            if (q >= _buffer.size())
            {
              return _incomplete(q);
            }
            if (_buffer[q] != '\\')
            {
              _fail(q, "Expected low surrogate after high surrogate");
            }
            if (q + 1 >= _buffer.size())
            {
              return _incomplete(q + 1);
            }
            if (_buffer[q + 1] != 'u')
            {
              _fail(q + 1, "Expected low surrogate after high surrogate");
            }
            std::uint32_t low = 0;
            if (!_readHex4(q + 2, low))
            {
              return _incomplete(_buffer.size());
            }
            if (low < 0xDC00 || low > 0xDFFF)
            {
              _fail(q, "Invalid low surrogate in \\u escape");
            }
            cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
            p += 6;
          }
          _appendUtf8(_scratch, cp);
          p += 6;
          continue;
        }
        default:
          _fail(p + 1, "Invalid escape sequence");
        }
        p += 2;
      }
      else if (c < 0x20)
      {
        _fail(p, "Control character in string");
      }
      else if (c < 0x80)
      {
        _scratch += static_cast<char>(c);
        ++p;
      }
      else
      {
        std::size_t len = _checkUtf8(p);
        if (len == 0)
        {
          return _incomplete(_buffer.size());
        }
        _scratch.append(_buffer.data() + p, len);
        p += len;
      }
    }
  }

  template <typename Int> bool _tryGetInteger(Int &out) const
  {
    if (_tokenType != JsonTokenType::Number)
    {
      return false;
    }
    const char *first = _valueSpan.data();
    const char *last = first + _valueSpan.size();
    Int value{};
    auto result = std::from_chars(first, last, value);
    if (result.ec != std::errc{} || result.ptr != last)
    {
      return false;
    }
    out = value;
    return true;
  }
};

} // namespace parsers
} // namespace jsonflow
