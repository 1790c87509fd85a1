// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of jsonflow, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <jsonflow/core/json.hpp>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <variant>

namespace jsonflow
{
namespace todo
{

/// \brief The list's name has been read.
struct TodoListCreated
{
  std::string name;

  bool operator==(const TodoListCreated &other) const { return name == other.name; }
  bool operator!=(const TodoListCreated &other) const { return !(*this == other); }
};

/// \brief One item of the list has been read in full.
struct TodoListItemAdded
{
  std::size_t index{0}; ///< 1-based position in the items array
  std::int32_t recommendedAge{0};
  std::string description;

  bool operator==(const TodoListItemAdded &other) const
  {
    return index == other.index && recommendedAge == other.recommendedAge &&
           description == other.description;
  }
  bool operator!=(const TodoListItemAdded &other) const { return !(*this == other); }
};

using TodoListEvent = std::variant<TodoListCreated, TodoListItemAdded>;

/// Discriminator values written under the "$type" key.
constexpr const char *TODO_LIST_CREATED_TYPE = "todoListCreated";
constexpr const char *TODO_LIST_ITEM_ADDED_TYPE = "todoListItemAdded";

inline void to_json(core::Json &j, const TodoListCreated &event)
{
  j = core::Json{{"$type", TODO_LIST_CREATED_TYPE}, {"name", event.name}};
}

inline void to_json(core::Json &j, const TodoListItemAdded &event)
{
  j = core::Json{{"$type", TODO_LIST_ITEM_ADDED_TYPE},
                 {"index", event.index},
                 {"recommendedAge", event.recommendedAge},
                 {"description", event.description}};
}

inline void to_json(core::Json &j, const TodoListEvent &event)
{
  std::visit([&j](const auto &e) { to_json(j, e); }, event);
}

/// \brief Human-readable form used by test failure messages.
inline std::ostream &operator<<(std::ostream &os, const TodoListEvent &event)
{
  core::Json j;
  to_json(j, event);
  return os << j.dump();
}

} // namespace todo
} // namespace jsonflow
