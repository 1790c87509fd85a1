// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of jsonflow, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace jsonflow
{
namespace stream
{

/// \brief Base class for data-contract violations raised while turning tokens
/// into events.
class JsonStreamError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

/// \brief An entity closed before every required field was set.
class IncompleteElementError : public JsonStreamError
{
public:
  IncompleteElementError(std::string element, std::string field)
      : JsonStreamError("Incomplete " + element + ": required field '" + field + "' is missing"),
        _element(std::move(element)), _field(std::move(field))
  {
  }

  /// \brief Entity kind, e.g. "todo list item".
  const std::string &element() const { return _element; }

  /// \brief Name of the missing field as it appears in the document.
  const std::string &field() const { return _field; }

private:
  std::string _element;
  std::string _field;
};

} // namespace stream
} // namespace jsonflow
