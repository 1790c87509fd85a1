// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of jsonflow, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

// Core
#include "jsonflow/core/blocking_queue.hpp"
#include "jsonflow/core/cancellation.hpp"
#include "jsonflow/core/config_loader.hpp"
#include "jsonflow/core/json.hpp"
#include "jsonflow/core/logger.hpp"

// Parsers
#include "jsonflow/parsers/json_reader.hpp"
#include "jsonflow/parsers/minimal_toml.hpp"

// Streaming
#include "jsonflow/stream/chunk_accumulator.hpp"
#include "jsonflow/stream/errors.hpp"
#include "jsonflow/stream/event_sink.hpp"
#include "jsonflow/stream/fragment_source.hpp"
#include "jsonflow/stream/incremental_parser.hpp"
#include "jsonflow/stream/json_stream_feeder.hpp"
#include "jsonflow/stream/resumable_tokenizer.hpp"

// Todo list
#include "jsonflow/todo/todo_events.hpp"
#include "jsonflow/todo/todo_list_parser.hpp"
#include "jsonflow/todo/todo_text_sink.hpp"
