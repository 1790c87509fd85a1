// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of jsonflow, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include <nlohmann/json.hpp>
namespace jsonflow {
namespace core
{
  /// JSON document type used for event serialization; keeps the third-party
  /// namespace out of the public headers.
  using Json = nlohmann::json;
} } // namespace jsonflow:: core
