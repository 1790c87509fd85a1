// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of jsonflow, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <functional>
#include <string>
#include <vector>

namespace
{
static jsonflow::test::LoggerInit init;
} // namespace

using namespace jsonflow::stream;
using jsonflow::parsers::JsonReader;
using jsonflow::parsers::JsonReaderException;
using jsonflow::parsers::JsonTokenType;

namespace
{

/// \brief Visitor that reads every available token.
struct TokenCollector
{
  std::vector<JsonTokenType> tokens;
  std::vector<std::string> strings;

  void operator()(JsonReader &reader)
  {
    while (reader.read())
    {
      tokens.push_back(reader.tokenType());
      if (reader.tokenType() == JsonTokenType::String ||
          reader.tokenType() == JsonTokenType::PropertyName)
      {
        strings.push_back(reader.getString());
      }
    }
  }
};

} // namespace

TEST_CASE("ResumableTokenizer carries the unconsumed suffix", "[tokenizer][leftover]")
{
  ResumableTokenizer tokenizer;
  TokenCollector collector;

  std::string buffer = R"({"listName": "Buck)";
  auto result = tokenizer.drive(buffer, false, std::ref(collector));

  REQUIRE(result.bytesConsumed == 11);
  REQUIRE(result.leftoverBytes == 7);
  REQUIRE(buffer == R"(: "Buck)");
  REQUIRE(collector.tokens ==
          std::vector<JsonTokenType>{JsonTokenType::StartObject, JsonTokenType::PropertyName});

  buffer += R"(et List", )";
  result = tokenizer.drive(buffer, false, std::ref(collector));

  REQUIRE(collector.strings == std::vector<std::string>{"listName", "Bucket List"});
  REQUIRE(buffer == ", ");
  REQUIRE(result.leftoverBytes == 2);
  REQUIRE(tokenizer.state().bytesConsumed == 26);
  REQUIRE(tokenizer.state().depth() == 1);
}

TEST_CASE("ResumableTokenizer waits on a number at the buffer end", "[tokenizer][leftover]")
{
  ResumableTokenizer tokenizer;
  TokenCollector collector;

  std::string buffer = R"({"recommendedAge": 3)";
  tokenizer.drive(buffer, false, std::ref(collector));
  REQUIRE(buffer == ": 3");

  buffer += "0}";
  tokenizer.drive(buffer, false, std::ref(collector));
  REQUIRE(buffer.empty());
  REQUIRE(collector.tokens.back() == JsonTokenType::EndObject);
  REQUIRE(tokenizer.state().rootCompleted);
}

TEST_CASE("ResumableTokenizer makes progress one byte at a time", "[tokenizer][leftover]")
{
  const std::string document = jsonflow::test::BUCKET_LIST_JSON;
  const auto expected = jsonflow::test::tokenize(document);

  ResumableTokenizer tokenizer;
  TokenCollector collector;
  std::string buffer;
  for (char c : document)
  {
    buffer += c;
    tokenizer.drive(buffer, false, std::ref(collector));
  }

  REQUIRE(buffer.empty());
  REQUIRE(collector.tokens == expected);
  REQUIRE(tokenizer.state().bytesConsumed == document.size());
}

TEST_CASE("ResumableTokenizer leaves state untouched on a lexical error", "[tokenizer][errors]")
{
  ResumableTokenizer tokenizer;
  TokenCollector collector;

  std::string buffer = R"({"a": 1)";
  tokenizer.drive(buffer, false, std::ref(collector));
  const auto consumedBefore = tokenizer.state().bytesConsumed;
  const std::string leftoverBefore = buffer;

  buffer += " ]";
  REQUIRE_THROWS_AS(tokenizer.drive(buffer, false, std::ref(collector)), JsonReaderException);
  REQUIRE(tokenizer.state().bytesConsumed == consumedBefore);
  REQUIRE(buffer == leftoverBefore + " ]");
}

TEST_CASE("ResumableTokenizer reset starts a new document", "[tokenizer][reset]")
{
  ResumableTokenizer tokenizer;
  TokenCollector collector;

  std::string buffer = "[1]";
  tokenizer.drive(buffer, true, std::ref(collector));
  REQUIRE(tokenizer.state().rootCompleted);

  tokenizer.reset();
  REQUIRE_FALSE(tokenizer.state().rootCompleted);
  REQUIRE(tokenizer.state().bytesConsumed == 0);

  buffer = "[2]";
  REQUIRE_NOTHROW(tokenizer.drive(buffer, true, std::ref(collector)));
}

TEST_CASE("ResumableTokenizer honours the depth option", "[tokenizer][depth]")
{
  jsonflow::parsers::JsonReaderOptions options;
  options.maxDepth = 2;
  ResumableTokenizer tokenizer(options);
  TokenCollector collector;

  std::string buffer = "[[[";
  REQUIRE_THROWS_AS(tokenizer.drive(buffer, false, std::ref(collector)), JsonReaderException);
}
