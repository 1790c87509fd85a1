// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of jsonflow, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <optional>
#include <string>
#include <vector>

namespace
{
static jsonflow::test::LoggerInit init;
} // namespace

using namespace jsonflow::stream;
using jsonflow::core::CancellationToken;

TEST_CASE("ChunkAccumulator pulls at most a batch per fill", "[chunk_accumulator][batch]")
{
  VectorFragmentSource source({"ab", "cd", "ef", "gh", "ij"});
  ChunkAccumulator accumulator;

  REQUIRE_FALSE(accumulator.fill(source, 2));
  REQUIRE(accumulator.buffer() == "abcd");
  REQUIRE(source.pulled() == 2);

  REQUIRE_FALSE(accumulator.fill(source, 2));
  REQUIRE(accumulator.buffer() == "abcdefgh");

  REQUIRE(accumulator.fill(source, 2));
  REQUIRE(accumulator.buffer() == "abcdefghij");
  REQUIRE(accumulator.fragmentsPulled() == 5);
  REQUIRE(accumulator.bytesAppended() == 10);
}

TEST_CASE("ChunkAccumulator reports exhaustion on an exact batch boundary",
          "[chunk_accumulator][batch]")
{
  VectorFragmentSource source({"ab", "cd"});
  ChunkAccumulator accumulator;

  REQUIRE_FALSE(accumulator.fill(source, 2));
  REQUIRE(accumulator.fill(source, 2));
  REQUIRE(accumulator.buffer() == "abcd");
}

TEST_CASE("ChunkAccumulator appends behind the leftover", "[chunk_accumulator][leftover]")
{
  VectorFragmentSource source({"\"Bucket", " List\""});
  ChunkAccumulator accumulator;

  REQUIRE_FALSE(accumulator.fill(source, 1));
  accumulator.buffer().erase(0, 1);
  REQUIRE(accumulator.fill(source, 4));
  REQUIRE(accumulator.buffer() == "Bucket List\"");
}

TEST_CASE("ChunkAccumulator counts null and empty fragments", "[chunk_accumulator][null]")
{
  VectorFragmentSource source({std::nullopt, "a", std::string(), std::nullopt, "b"});
  ChunkAccumulator accumulator;

  REQUIRE_FALSE(accumulator.fill(source, 3));
  REQUIRE(accumulator.buffer() == "a");
  REQUIRE(accumulator.fragmentsPulled() == 3);
  REQUIRE(accumulator.bytesAppended() == 1);

  REQUIRE(accumulator.fill(source, 3));
  REQUIRE(accumulator.buffer() == "ab");
  REQUIRE(accumulator.fragmentsPulled() == 5);
}

TEST_CASE("ChunkAccumulator stops pulling once cancelled", "[chunk_accumulator][cancel]")
{
  VectorFragmentSource source({"a", "b", "c"});
  ChunkAccumulator accumulator;
  CancellationToken cancel;

  REQUIRE_FALSE(accumulator.fill(source, 1, &cancel));
  cancel.cancel();
  REQUIRE_FALSE(accumulator.fill(source, 3, &cancel));
  REQUIRE(source.pulled() == 1);
  REQUIRE(accumulator.buffer() == "a");

  accumulator.discard();
  REQUIRE(accumulator.buffer().empty());
}

TEST_CASE("ChunkAccumulator rejects an empty batch", "[chunk_accumulator][errors]")
{
  VectorFragmentSource source({"a"});
  ChunkAccumulator accumulator;
  REQUIRE_THROWS_AS(accumulator.fill(source, 0), std::invalid_argument);
}
