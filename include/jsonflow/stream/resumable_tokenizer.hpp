// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of jsonflow, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <jsonflow/parsers/json_reader.hpp>
#include <cstddef>
#include <string>
#include <utility>

namespace jsonflow
{
namespace stream
{

/// \brief Outcome of one drive cycle.
struct DriveResult
{
  std::size_t bytesConsumed{0}; ///< Bytes of the buffer covered by complete tokens
  std::size_t leftoverBytes{0}; ///< Bytes carried into the next cycle
};

/// \brief Owns the reader resume state and the leftover-byte carry.
///
/// Each drive() runs a fresh \c JsonReader over the whole buffer with the
/// state of the previous cycle, lets the visitor pull tokens from it, then
/// cuts the consumed prefix off the buffer. What remains (an incomplete
/// string, number or literal) is the seed of the next cycle's buffer.
class ResumableTokenizer
{
public:
  explicit ResumableTokenizer(parsers::JsonReaderOptions options = {}) : _options(options) {}

  /// \param buffer Leftover of the previous cycle plus newly appended bytes;
  /// truncated in place to the new leftover
  /// \param isFinal True only if no byte will ever follow \p buffer
  /// \param visitor Callable taking \c parsers::JsonReader&
  /// \throws parsers::JsonReaderException on lexical errors; the buffer and
  /// state are then left as they were before the call
  template <typename Visitor>
  DriveResult drive(std::string &buffer, bool isFinal, Visitor &&visitor)
  {
    parsers::JsonReader reader(buffer, isFinal, _state, _options);
    std::forward<Visitor>(visitor)(reader);

    DriveResult result;
    result.bytesConsumed = reader.bytesConsumed();
    result.leftoverBytes = buffer.size() - result.bytesConsumed;
    _state = reader.currentState();
    buffer.erase(0, result.bytesConsumed);
    return result;
  }

  const parsers::JsonReaderState &state() const { return _state; }

  void reset() { _state = parsers::JsonReaderState{}; }

private:
  parsers::JsonReaderOptions _options;
  parsers::JsonReaderState _state;
};

} // namespace stream
} // namespace jsonflow
