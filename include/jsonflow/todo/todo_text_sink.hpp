// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of jsonflow, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <jsonflow/stream/event_sink.hpp>
#include <jsonflow/todo/todo_events.hpp>
#include <ostream>
#include <stdexcept>
#include <variant>

namespace jsonflow
{
namespace todo
{

/// \brief Renders the list for a terminal:
/// \code
/// Bucket List
/// --------------
/// 1. Skydiving at 30
/// \endcode
class TodoListTextSink : public stream::IEventSink<TodoListEvent>
{
public:
  explicit TodoListTextSink(std::ostream &out) : _out(out) {}

  void emit(const TodoListEvent &event) override
  {
    if (const auto *created = std::get_if<TodoListCreated>(&event))
    {
      _out << created->name << '\n' << "--------------" << '\n';
    }
    else
    {
      const auto &item = std::get<TodoListItemAdded>(event);
      _out << item.index << ". " << item.description << " at " << item.recommendedAge << '\n';
    }
    if (!_out)
    {
      throw std::runtime_error("TodoListTextSink: write failed");
    }
  }

  void flush() override { _out.flush(); }

private:
  std::ostream &_out;
};

} // namespace todo
} // namespace jsonflow
