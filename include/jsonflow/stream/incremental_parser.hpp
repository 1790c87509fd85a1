// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of jsonflow, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <jsonflow/parsers/json_reader.hpp>
#include <vector>

namespace jsonflow
{
namespace stream
{

/// \brief Turns the tokens of one drive cycle into domain events.
///
/// Implementations keep their parsing state between calls; the reader they
/// receive starts where the previous cycle's reader stopped.
///
/// \tparam TOut Domain event type
template <typename TOut> class IIncrementalJsonParser
{
public:
  virtual ~IIncrementalJsonParser() = default;

  /// \brief Reads every complete token available in \p reader.
  ///
  /// Events are appended to \p events as soon as they are finalized, so the
  /// ones produced before an exception are still there for the caller.
  /// \param completed Set to true once the expected document shape has
  /// closed; no token is read after that point.
  virtual void continueParsing(parsers::JsonReader &reader, std::vector<TOut> &events,
                               bool &completed) = 0;

  /// \brief Returns the parser to its initial state for a new document.
  virtual void reset() = 0;
};

} // namespace stream
} // namespace jsonflow
