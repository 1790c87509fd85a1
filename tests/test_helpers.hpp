// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// Shared test helpers for the jsonflow test suite

#pragma once

#include "jsonflow/jsonflow.hpp"
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace jsonflow::test
{

/// \brief Quiets the feeder's info and warning logs. Each test executable
/// holds one instance at namespace scope; raise the level to Debug when
/// chasing a failure.
struct LoggerInit
{
  LoggerInit() { jsonflow::core::Logger::setLevel(jsonflow::core::Logger::Level::Error); }
};

/// \brief The document the model is asked to produce, pretty-printed the way
/// a model usually writes it.
inline const std::string BUCKET_LIST_JSON = R"({
  "listName": "Bucket List",
  "items": [
    {
      "recommendedAge": 30,
      "description": "Skydiving"
    },
    {
      "recommendedAge": 50,
      "description": "Visit all seven continents"
    }
  ]
})";

inline std::vector<todo::TodoListEvent> bucketListEvents()
{
  return {todo::TodoListCreated{"Bucket List"}, todo::TodoListItemAdded{1, 30, "Skydiving"},
          todo::TodoListItemAdded{2, 50, "Visit all seven continents"}};
}

/// \brief Sink that records every event and counts flushes.
template <typename TOut> class RecordingSink : public stream::IEventSink<TOut>
{
public:
  void emit(const TOut &event) override { events.push_back(event); }
  void flush() override { ++flushes; }

  std::vector<TOut> events;
  std::size_t flushes{0};
};

/// \brief Events and summary of one feed.
struct TodoFeedOutcome
{
  std::vector<todo::TodoListEvent> events;
  stream::FeedResult result;
};

/// \brief Feeds \p fragments through a fresh todo-list parser.
inline TodoFeedOutcome feedTodoList(std::vector<stream::Fragment> fragments,
                                    std::size_t chunkBufferSize)
{
  todo::TodoListJsonParser parser;
  stream::FeederOptions options;
  options.chunkBufferSize = chunkBufferSize;
  stream::JsonStreamFeeder<todo::TodoListEvent> feeder(parser, options);
  stream::VectorFragmentSource source(std::move(fragments));
  RecordingSink<todo::TodoListEvent> sink;

  TodoFeedOutcome outcome;
  outcome.result = feeder.feed(source, sink);
  outcome.events = std::move(sink.events);
  return outcome;
}

inline TodoFeedOutcome feedTodoList(std::string_view document, std::size_t fragmentSize,
                                    std::size_t chunkBufferSize)
{
  return feedTodoList(stream::splitFragments(document, fragmentSize), chunkBufferSize);
}

/// \brief Runs a single reader over a complete document and returns the token
/// types it reports.
inline std::vector<parsers::JsonTokenType> tokenize(std::string_view document,
                                                    bool isFinalBlock = true)
{
  parsers::JsonReader reader(document, isFinalBlock);
  std::vector<parsers::JsonTokenType> tokens;
  while (reader.read())
  {
    tokens.push_back(reader.tokenType());
  }
  return tokens;
}

} // namespace jsonflow::test
