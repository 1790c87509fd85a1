// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of jsonflow, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <jsonflow/core/cancellation.hpp>
#include <jsonflow/stream/fragment_source.hpp>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace jsonflow
{
namespace stream
{

/// \brief Collects fragments into the byte buffer of the next drive cycle.
///
/// The buffer is never cleared by fill(): it starts with whatever the
/// tokenizer left unconsumed in the previous cycle and fragments are appended
/// behind it.
class ChunkAccumulator
{
public:
  /// \brief Pulls up to \p maxFragments fragments from \p source.
  ///
  /// Null and empty fragments count towards \p maxFragments but add no bytes.
  /// When \p cancel is set before a pull, filling stops without pulling.
  /// \return true if the source reported exhaustion
  /// \throws std::invalid_argument if maxFragments is 0
  bool fill(IFragmentSource &source, std::size_t maxFragments,
            const core::CancellationToken *cancel = nullptr)
  {
    if (maxFragments == 0)
    {
      throw std::invalid_argument("ChunkAccumulator: maxFragments must be greater than 0");
    }

    for (std::size_t i = 0; i < maxFragments; ++i)
    {
      if (cancel && cancel->isCancelled())
      {
        return false;
      }

      Fragment fragment;
      if (!source.next(fragment))
      {
        return true;
      }
      ++_fragmentsPulled;

      if (!fragment || fragment->empty())
      {
        continue;
      }
      _buffer.append(*fragment);
      _bytesAppended += fragment->size();
    }
    return false;
  }

  std::string &buffer() { return _buffer; }
  const std::string &buffer() const { return _buffer; }

  /// \brief Drops buffered bytes (cancellation, abandoned documents).
  void discard() { _buffer.clear(); }

  std::size_t fragmentsPulled() const { return _fragmentsPulled; }
  std::size_t bytesAppended() const { return _bytesAppended; }

private:
  std::string _buffer;
  std::size_t _fragmentsPulled{0};
  std::size_t _bytesAppended{0};
};

} // namespace stream
} // namespace jsonflow
