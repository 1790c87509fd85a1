// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of jsonflow, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <jsonflow/core/blocking_queue.hpp>
#include <jsonflow/core/cancellation.hpp>
#include <chrono>
#include <cstddef>
#include <exception>
#include <istream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace jsonflow
{
namespace stream
{

/// A fragment as delivered by the text generator. Null fragments are legal
/// and carry no bytes.
using Fragment = std::optional<std::string>;

/// \brief Ordered, lazily produced sequence of text fragments.
class IFragmentSource
{
public:
  virtual ~IFragmentSource() = default;

  /// \brief Pulls the next fragment, blocking until one is available.
  /// \return false once the source is exhausted; never throws for a normal
  /// end of stream
  virtual bool next(Fragment &fragment) = 0;

  /// \brief Releases the upstream producer. Safe to call more than once.
  virtual void close() {}
};

/// \brief Cuts \p text into fragments of \p size bytes (the last may be
/// shorter). Multi-byte UTF-8 sequences may be split across fragments.
inline std::vector<Fragment> splitFragments(std::string_view text, std::size_t size)
{
  if (size == 0)
  {
    throw std::invalid_argument("splitFragments: fragment size must be greater than 0");
  }
  std::vector<Fragment> fragments;
  fragments.reserve(text.size() / size + 1);
  for (std::size_t pos = 0; pos < text.size(); pos += size)
  {
    fragments.emplace_back(std::string(text.substr(pos, size)));
  }
  return fragments;
}

/// \brief Replays an in-memory list of fragments.
class VectorFragmentSource : public IFragmentSource
{
public:
  explicit VectorFragmentSource(std::vector<Fragment> fragments)
      : _fragments(std::move(fragments))
  {
  }

  bool next(Fragment &fragment) override
  {
    if (_closed || _index >= _fragments.size())
    {
      return false;
    }
    fragment = _fragments[_index++];
    return true;
  }

  void close() override { _closed = true; }

  /// \brief Number of fragments handed out so far.
  std::size_t pulled() const { return _index; }

  bool isClosed() const { return _closed; }

private:
  std::vector<Fragment> _fragments;
  std::size_t _index{0};
  bool _closed{false};
};

/// \brief Reads a stream in fixed-size fragments.
class IstreamFragmentSource : public IFragmentSource
{
public:
  IstreamFragmentSource(std::istream &in, std::size_t fragmentSize)
      : _in(in), _fragmentSize(fragmentSize)
  {
    if (fragmentSize == 0)
    {
      throw std::invalid_argument("IstreamFragmentSource: fragment size must be greater than 0");
    }
  }

  bool next(Fragment &fragment) override
  {
    if (_closed || !_in.good())
    {
      return false;
    }
    std::string data(_fragmentSize, '\0');
    _in.read(&data[0], static_cast<std::streamsize>(_fragmentSize));
    const auto count = static_cast<std::size_t>(_in.gcount());
    if (count == 0)
    {
      if (_in.bad())
      {
        throw std::runtime_error("IstreamFragmentSource: read failed");
      }
      return false;
    }
    data.resize(count);
    fragment = std::move(data);
    return true;
  }

  void close() override { _closed = true; }

private:
  std::istream &_in;
  std::size_t _fragmentSize;
  bool _closed{false};
};

/// \brief Fragment source fed by a producer thread.
///
/// The producer calls push() per fragment and then complete() or fail(). The
/// drive loop pulls with next(), which waits for the producer; while waiting
/// it polls the cancellation token so a cancelled feed does not hang on a
/// silent producer. close() closes the underlying queue, which makes the
/// producer's next push() return false.
class QueueFragmentSource : public IFragmentSource
{
public:
  explicit QueueFragmentSource(std::size_t capacity = 256,
                               core::CancellationToken cancel = core::CancellationToken(),
                               std::chrono::milliseconds pollInterval = std::chrono::milliseconds(50))
      : _queue(capacity), _cancel(std::move(cancel)), _pollInterval(pollInterval)
  {
  }

  /// \brief Producer side: queue one fragment.
  /// \return false if the consumer closed the source
  bool push(Fragment fragment) { return _queue.queue(Entry{Entry::Kind::Text, std::move(fragment), {}}); }

  /// \brief Producer side: signal normal end of stream.
  void complete() { _queue.queue(Entry{Entry::Kind::End, std::nullopt, {}}); }

  /// \brief Producer side: report a failure; the consumer rethrows it on its
  /// next pull.
  void fail(std::exception_ptr error)
  {
    _queue.queue(Entry{Entry::Kind::Error, std::nullopt, std::move(error)});
  }

  bool next(Fragment &fragment) override
  {
    if (_finished)
    {
      return false;
    }
    Entry entry;
    while (true)
    {
      switch (_queue.dequeue(entry, _pollInterval))
      {
      case core::DequeueStatus::Item:
        if (entry.kind == Entry::Kind::End)
        {
          _finished = true;
          return false;
        }
        if (entry.kind == Entry::Kind::Error)
        {
          _finished = true;
          std::rethrow_exception(entry.error);
        }
        fragment = std::move(entry.text);
        return true;
      case core::DequeueStatus::Timeout:
        if (_cancel.isCancelled())
        {
          return false;
        }
        break;
      case core::DequeueStatus::Closed:
        _finished = true;
        return false;
      }
    }
  }

  void close() override
  {
    _finished = true;
    _queue.close();
  }

private:
  struct Entry
  {
    enum class Kind
    {
      Text,
      End,
      Error
    };
    Kind kind{Kind::Text};
    Fragment text;
    std::exception_ptr error;
  };

  core::BlockingQueue<Entry> _queue;
  core::CancellationToken _cancel;
  std::chrono::milliseconds _pollInterval;
  bool _finished{false};
};

} // namespace stream
} // namespace jsonflow
