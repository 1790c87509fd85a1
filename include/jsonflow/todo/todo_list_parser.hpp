// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of jsonflow, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <jsonflow/parsers/json_reader.hpp>
#include <jsonflow/stream/errors.hpp>
#include <jsonflow/stream/incremental_parser.hpp>
#include <jsonflow/todo/todo_events.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jsonflow
{
namespace todo
{

/// \brief Where the parser stands in the todo-list document.
enum class TodoParsingState
{
  None,                      ///< Idle; tokens are ignored until a known property
  ReadingName,               ///< Expecting the listName string
  ReadingItems,              ///< Inside the items array
  ReadingItem,               ///< Inside an item, fields pending
  ReadingItemRecommendedAge, ///< Expecting the recommendedAge number
  ReadingItemDescription     ///< Expecting the description string
};

inline const char *stateName(TodoParsingState state)
{
  switch (state)
  {
  case TodoParsingState::None:
    return "None";
  case TodoParsingState::ReadingName:
    return "ReadingName";
  case TodoParsingState::ReadingItems:
    return "ReadingItems";
  case TodoParsingState::ReadingItem:
    return "ReadingItem";
  case TodoParsingState::ReadingItemRecommendedAge:
    return "ReadingItemRecommendedAge";
  case TodoParsingState::ReadingItemDescription:
    return "ReadingItemDescription";
  }
  return "Unknown";
}

/// \brief State reached by a property name. Unknown names return to idle,
/// even in the middle of an item.
inline TodoParsingState stateForProperty(std::string_view name)
{
  if (name == "listName")
  {
    return TodoParsingState::ReadingName;
  }
  if (name == "items")
  {
    return TodoParsingState::ReadingItems;
  }
  if (name == "recommendedAge")
  {
    return TodoParsingState::ReadingItemRecommendedAge;
  }
  if (name == "description")
  {
    return TodoParsingState::ReadingItemDescription;
  }
  return TodoParsingState::None;
}

/// \brief Transition table of the todo-list document.
///
/// \p propertyName is only looked at for property-name tokens. Scalar tokens
/// move on only when the state expects them; whether a number is actually
/// accepted as an age is decided by the caller before asking.
inline TodoParsingState nextState(TodoParsingState state, parsers::JsonTokenType token,
                                  std::string_view propertyName = {})
{
  using parsers::JsonTokenType;
  switch (token)
  {
  case JsonTokenType::PropertyName:
    return stateForProperty(propertyName);
  case JsonTokenType::String:
    if (state == TodoParsingState::ReadingName)
    {
      return TodoParsingState::None;
    }
    if (state == TodoParsingState::ReadingItemDescription)
    {
      return TodoParsingState::ReadingItem;
    }
    return state;
  case JsonTokenType::Number:
    if (state == TodoParsingState::ReadingItemRecommendedAge)
    {
      return TodoParsingState::ReadingItem;
    }
    return state;
  case JsonTokenType::StartObject:
    if (state == TodoParsingState::ReadingItems)
    {
      return TodoParsingState::ReadingItem;
    }
    return state;
  case JsonTokenType::EndObject:
    if (state == TodoParsingState::ReadingItem ||
        state == TodoParsingState::ReadingItemRecommendedAge ||
        state == TodoParsingState::ReadingItemDescription)
    {
      return TodoParsingState::ReadingItems;
    }
    return state;
  default:
    return state;
  }
}

/// \brief Fields of the list read so far.
struct ListState
{
  std::optional<std::string> name;

  /// \throws stream::IncompleteElementError if the name is missing
  TodoListCreated toEvent() const
  {
    if (!name)
    {
      throw stream::IncompleteElementError("todo list", "listName");
    }
    return TodoListCreated{*name};
  }

  void reset() { name.reset(); }
};

/// \brief Fields of the current item read so far.
struct ItemState
{
  std::optional<std::int32_t> recommendedAge;
  std::optional<std::string> description;

  /// \throws stream::IncompleteElementError naming the first missing field,
  /// description before recommendedAge
  TodoListItemAdded toEvent(std::size_t index) const
  {
    if (!description)
    {
      throw stream::IncompleteElementError("todo list item", "description");
    }
    if (!recommendedAge)
    {
      throw stream::IncompleteElementError("todo list item", "recommendedAge");
    }
    return TodoListItemAdded{index, *recommendedAge, *description};
  }

  void reset()
  {
    recommendedAge.reset();
    description.reset();
  }
};

/// \brief Event state machine for documents of the shape
/// <tt>{"listName": "...", "items": [{"recommendedAge": 30, "description": "..."}]}</tt>.
///
/// Emits \c TodoListCreated as soon as the name string is read and one
/// \c TodoListItemAdded per closed item. The closing bracket of the items
/// array completes the document; nothing after it is read, so a model that
/// keeps talking after the JSON does not stall or break the stream.
class TodoListJsonParser : public stream::IIncrementalJsonParser<TodoListEvent>
{
public:
  void continueParsing(parsers::JsonReader &reader, std::vector<TodoListEvent> &events,
                       bool &completed) override
  {
    completed = _completed;
    while (!_completed && reader.read())
    {
      _visit(reader, events);
    }
    completed = _completed;
  }

  void reset() override
  {
    _state = TodoParsingState::None;
    _list.reset();
    _item.reset();
    _nextIndex = 1;
    _itemsDepth = 0;
    _completed = false;
  }

  TodoParsingState state() const { return _state; }
  bool completed() const { return _completed; }

private:
  TodoParsingState _state{TodoParsingState::None};
  ListState _list;
  ItemState _item;
  std::size_t _nextIndex{1};
  std::size_t _itemsDepth{0}; ///< Reader depth inside the items array, 0 until it opens
  bool _completed{false};

  void _visit(const parsers::JsonReader &reader, std::vector<TodoListEvent> &events)
  {
    using parsers::JsonTokenType;
    const JsonTokenType token = reader.tokenType();
    switch (token)
    {
    case JsonTokenType::PropertyName:
      _state = nextState(_state, token, reader.getString());
      return;
    case JsonTokenType::String:
      if (_state == TodoParsingState::ReadingName)
      {
        _list.name = reader.getString();
        events.emplace_back(_list.toEvent());
      }
      else if (_state == TodoParsingState::ReadingItemDescription)
      {
        _item.description = reader.getString();
      }
      break;
    case JsonTokenType::Number:
      if (_state == TodoParsingState::ReadingItemRecommendedAge)
      {
        std::int32_t age = 0;
        if (!reader.tryGetInt32(age))
        {
          return;
        }
        _item.recommendedAge = age;
      }
      break;
    case JsonTokenType::StartObject:
      // Every element of the items array starts empty, even one opened while
      // the state machine is idle after an unknown field.
      if (_itemsDepth != 0 && reader.currentDepth() == _itemsDepth + 1)
      {
        _item.reset();
      }
      break;
    case JsonTokenType::StartArray:
      if (_state == TodoParsingState::ReadingItems && _itemsDepth == 0)
      {
        _itemsDepth = reader.currentDepth();
      }
      return;
    case JsonTokenType::EndObject:
      if (_state == TodoParsingState::ReadingItem ||
          _state == TodoParsingState::ReadingItemRecommendedAge ||
          _state == TodoParsingState::ReadingItemDescription)
      {
        events.emplace_back(_item.toEvent(_nextIndex));
        ++_nextIndex;
        _item.reset();
      }
      break;
    case JsonTokenType::EndArray:
      if (_state == TodoParsingState::ReadingItems)
      {
        _completed = true;
      }
      return;
    default:
      return;
    }
    _state = nextState(_state, token);
  }
};

} // namespace todo
} // namespace jsonflow
