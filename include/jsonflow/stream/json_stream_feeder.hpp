// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of jsonflow, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <jsonflow/core/cancellation.hpp>
#include <jsonflow/core/logger.hpp>
#include <jsonflow/parsers/json_reader.hpp>
#include <jsonflow/stream/chunk_accumulator.hpp>
#include <jsonflow/stream/event_sink.hpp>
#include <jsonflow/stream/fragment_source.hpp>
#include <jsonflow/stream/incremental_parser.hpp>
#include <jsonflow/stream/resumable_tokenizer.hpp>
#include <cstddef>
#include <exception>
#include <stdexcept>
#include <vector>

namespace jsonflow
{
namespace stream
{

/// \brief Tuning of the drive loop.
struct FeederOptions
{
  /// Fragments pulled per drive cycle. Small values emit events sooner, large
  /// values run the tokenizer less often.
  std::size_t chunkBufferSize{48};
  parsers::JsonReaderOptions reader;
};

/// \brief Summary of one feed() run.
struct FeedResult
{
  bool completed{false}; ///< The expected document shape closed
  bool exhausted{false}; ///< The source ran out before the document completed
  bool cancelled{false}; ///< Stopped by the cancellation token
  std::size_t cycles{0};
  std::size_t fragments{0};
  std::size_t bytes{0};
  std::size_t events{0};
  std::size_t leftoverBytes{0}; ///< Unconsumed bytes at the end of the run
};

/// \brief Drives fragments through the tokenizer and the parser into a sink.
///
/// One cycle: pull up to \c chunkBufferSize fragments, tokenize the buffer,
/// hand the tokens to the parser, emit the resulting events in order and
/// flush the sink. The loop ends when the parser reports completion (even if
/// the source has more to say), when the source is exhausted, or when the
/// cancellation token is set. The source is closed on every exit path.
///
/// Lexical errors, incomplete elements and source failures are logged and
/// rethrown; events produced before the failure have already reached the
/// sink.
template <typename TOut> class JsonStreamFeeder
{
public:
  /// \throws std::invalid_argument if chunkBufferSize is 0
  explicit JsonStreamFeeder(IIncrementalJsonParser<TOut> &parser, FeederOptions options = {})
      : _parser(parser), _options(options)
  {
    if (_options.chunkBufferSize == 0)
    {
      throw std::invalid_argument("JsonStreamFeeder: chunkBufferSize must be greater than 0");
    }
  }

  /// \brief Runs one document from \p source to \p sink. The parser is
  /// reset first, so a feeder can be reused for consecutive documents.
  FeedResult feed(IFragmentSource &source, IEventSink<TOut> &sink,
                  const core::CancellationToken *cancel = nullptr)
  {
    SourceCloser closer(source);
    _parser.reset();
    ChunkAccumulator accumulator;
    ResumableTokenizer tokenizer(_options.reader);
    FeedResult result;
    std::vector<TOut> events;

    try
    {
      while (!result.completed)
      {
        if (_isCancelled(cancel))
        {
          result.cancelled = true;
          break;
        }

        bool exhausted = accumulator.fill(source, _options.chunkBufferSize, cancel);
        if (_isCancelled(cancel))
        {
          accumulator.discard();
          result.cancelled = true;
          break;
        }

        ++result.cycles;
        events.clear();
        auto drive = tokenizer.drive(accumulator.buffer(), false,
                                     [&](parsers::JsonReader &reader)
                                     { _parser.continueParsing(reader, events, result.completed); });
        JSONFLOW_LOG_DEBUG("Cycle " << result.cycles << ": consumed " << drive.bytesConsumed
                                    << " bytes, " << drive.leftoverBytes << " left over, "
                                    << events.size() << " event(s)");

        _emit(sink, events, result);
        sink.flush();

        if (exhausted && !result.completed)
        {
          result.exhausted = true;
          break;
        }
      }
    }
    catch (const std::exception &e)
    {
      // Tokens read before the failure already produced these events.
      _emit(sink, events, result);
      sink.flush();
      JSONFLOW_LOG_ERROR("Feed aborted after " << result.events << " event(s): " << e.what());
      throw;
    }

    result.fragments = accumulator.fragmentsPulled();
    result.bytes = accumulator.bytesAppended();
    result.leftoverBytes = accumulator.buffer().size();
    accumulator.discard();
    sink.flush();

    if (result.completed)
    {
      JSONFLOW_LOG_INFO("Document complete: " << result.events << " event(s) in " << result.cycles
                                              << " cycle(s)");
    }
    else if (result.cancelled)
    {
      JSONFLOW_LOG_INFO("Feed cancelled after " << result.events << " event(s)");
    }
    else
    {
      JSONFLOW_LOG_WARN("Source exhausted before the document completed; discarding "
                        << result.leftoverBytes << " unconsumed byte(s)");
    }
    return result;
  }

private:
  /// Closes the source when feed() returns or throws.
  class SourceCloser
  {
  public:
    explicit SourceCloser(IFragmentSource &source) : _source(source) {}
    SourceCloser(const SourceCloser &) = delete;
    SourceCloser &operator=(const SourceCloser &) = delete;

    ~SourceCloser()
    {
      try
      {
        _source.close();
      }
      catch (const std::exception &e)
      {
        JSONFLOW_LOG_WARN("Failed to close fragment source: " << e.what());
      }
    }

  private:
    IFragmentSource &_source;
  };

  IIncrementalJsonParser<TOut> &_parser;
  FeederOptions _options;

  static bool _isCancelled(const core::CancellationToken *cancel)
  {
    return cancel && cancel->isCancelled();
  }

  static void _emit(IEventSink<TOut> &sink, std::vector<TOut> &events, FeedResult &result)
  {
    std::vector<TOut> pending;
    pending.swap(events);
    for (const auto &event : pending)
    {
      sink.emit(event);
      ++result.events;
    }
  }
};

} // namespace stream
} // namespace jsonflow
