// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of jsonflow, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <atomic>
#include <memory>

namespace jsonflow
{
namespace core
{

/// \brief Shared cancellation flag for a drive loop.
///
/// Copies observe the same flag, so a token can be handed to the fragment
/// source and the feeder while the owner keeps one to cancel with. cancel()
/// is a single atomic store and may be called from a signal handler.
class CancellationToken
{
public:
  CancellationToken() : _cancelled(std::make_shared<std::atomic<bool>>(false)) {}

  /// \brief Cancel any operations using this token
  void cancel() const { _cancelled->store(true, std::memory_order_release); }

  /// \brief Check if token has been cancelled
  bool isCancelled() const { return _cancelled->load(std::memory_order_acquire); }

  /// \brief Reset token for reuse
  void reset() const { _cancelled->store(false, std::memory_order_release); }

private:
  std::shared_ptr<std::atomic<bool>> _cancelled;
};

} // namespace core
} // namespace jsonflow
