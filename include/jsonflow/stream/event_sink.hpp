// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of jsonflow, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <jsonflow/core/json.hpp>
#include <cstddef>
#include <functional>
#include <ostream>
#include <stdexcept>
#include <utility>

namespace jsonflow
{
namespace stream
{

/// Content type of an HTTP body carrying the event stream.
constexpr const char *NDJSON_CONTENT_TYPE = "application/x-ndjson";

/// \brief Receives events in emission order.
template <typename TOut> class IEventSink
{
public:
  virtual ~IEventSink() = default;

  virtual void emit(const TOut &event) = 0;

  /// \brief Called after every drive cycle and when the feed ends.
  virtual void flush() {}
};

/// \brief Writes one compact JSON object per line.
///
/// The event type must be convertible to \c core::Json through a \c to_json
/// overload found by argument-dependent lookup.
template <typename TOut> class NdjsonStreamSink : public IEventSink<TOut>
{
public:
  /// \param flushEachEvent Flush \p out after every line, so a streaming
  /// HTTP body or a pipe sees each event as soon as it exists
  explicit NdjsonStreamSink(std::ostream &out, bool flushEachEvent = true)
      : _out(out), _flushEachEvent(flushEachEvent)
  {
  }

  void emit(const TOut &event) override
  {
    core::Json json = event;
    _out << json.dump() << '\n';
    if (_flushEachEvent)
    {
      _out.flush();
    }
    if (!_out)
    {
      throw std::runtime_error("NdjsonStreamSink: write failed");
    }
    ++_written;
  }

  void flush() override { _out.flush(); }

  std::size_t written() const { return _written; }

private:
  std::ostream &_out;
  bool _flushEachEvent;
  std::size_t _written{0};
};

/// \brief Forwards each event to a callback.
template <typename TOut> class CallbackEventSink : public IEventSink<TOut>
{
public:
  using Callback = std::function<void(const TOut &)>;

  explicit CallbackEventSink(Callback callback) : _callback(std::move(callback))
  {
    if (!_callback)
    {
      throw std::invalid_argument("CallbackEventSink: callback must not be empty");
    }
  }

  void emit(const TOut &event) override { _callback(event); }

private:
  Callback _callback;
};

} // namespace stream
} // namespace jsonflow
