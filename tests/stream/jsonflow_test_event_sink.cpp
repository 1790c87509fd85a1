// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of jsonflow, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <sstream>
#include <string>
#include <vector>

namespace
{
static jsonflow::test::LoggerInit init;
} // namespace

using namespace jsonflow;
using namespace jsonflow::stream;
using todo::TodoListCreated;
using todo::TodoListEvent;
using todo::TodoListItemAdded;

namespace
{

std::vector<std::string> lines(const std::string &text)
{
  std::vector<std::string> out;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line))
  {
    out.push_back(line);
  }
  return out;
}

} // namespace

TEST_CASE("Todo events serialize with a type discriminator", "[events][json]")
{
  core::Json created = TodoListEvent{TodoListCreated{"Bucket List"}};
  REQUIRE(created["$type"] == "todoListCreated");
  REQUIRE(created["name"] == "Bucket List");
  REQUIRE(created.size() == 2);

  core::Json added = TodoListEvent{TodoListItemAdded{2, 50, "Visit all seven continents"}};
  REQUIRE(added["$type"] == "todoListItemAdded");
  REQUIRE(added["index"] == 2);
  REQUIRE(added["recommendedAge"] == 50);
  REQUIRE(added["description"] == "Visit all seven continents");
}

TEST_CASE("NdjsonStreamSink writes one object per line", "[sink][ndjson]")
{
  std::ostringstream out;
  NdjsonStreamSink<TodoListEvent> sink(out);

  for (const auto &event : test::bucketListEvents())
  {
    sink.emit(event);
  }
  sink.flush();

  auto written = lines(out.str());
  REQUIRE(written.size() == 3);
  REQUIRE(sink.written() == 3);
  REQUIRE(out.str().back() == '\n');

  for (const auto &line : written)
  {
    auto parsed = core::Json::parse(line);
    REQUIRE(parsed.contains("$type"));
  }
  REQUIRE(core::Json::parse(written[0])["name"] == "Bucket List");
  REQUIRE(core::Json::parse(written[2])["description"] == "Visit all seven continents");
  REQUIRE(std::string(NDJSON_CONTENT_TYPE) == "application/x-ndjson");
}

TEST_CASE("NdjsonStreamSink escapes string content", "[sink][ndjson]")
{
  std::ostringstream out;
  NdjsonStreamSink<TodoListEvent> sink(out, false);
  sink.emit(TodoListItemAdded{1, 8, "Say \"hi\"\non two lines"});

  auto written = lines(out.str());
  REQUIRE(written.size() == 1);
  REQUIRE(core::Json::parse(written[0])["description"] == "Say \"hi\"\non two lines");
}

TEST_CASE("NdjsonStreamSink reports a failed stream", "[sink][ndjson]")
{
  std::ostringstream out;
  out.setstate(std::ios::badbit);
  NdjsonStreamSink<TodoListEvent> sink(out);
  REQUIRE_THROWS_AS(sink.emit(TodoListCreated{"x"}), std::runtime_error);
  REQUIRE(sink.written() == 0);
}

TEST_CASE("CallbackEventSink forwards events", "[sink][callback]")
{
  std::vector<TodoListEvent> seen;
  CallbackEventSink<TodoListEvent> sink([&seen](const TodoListEvent &e) { seen.push_back(e); });
  sink.emit(TodoListCreated{"Chores"});
  sink.flush();
  REQUIRE(seen == std::vector<TodoListEvent>{TodoListCreated{"Chores"}});

  REQUIRE_THROWS_AS(CallbackEventSink<TodoListEvent>(nullptr), std::invalid_argument);
}

TEST_CASE("TodoListTextSink renders the console layout", "[sink][text]")
{
  std::ostringstream out;
  todo::TodoListTextSink sink(out);
  for (const auto &event : test::bucketListEvents())
  {
    sink.emit(event);
  }

  REQUIRE(out.str() == "Bucket List\n"
                       "--------------\n"
                       "1. Skydiving at 30\n"
                       "2. Visit all seven continents at 50\n");
}
