/*
MIT License

Copyright (c) 2023-2024 Jason Turner

Permission is hereby granted, free of charge, to any person obtaining a copy
of this software and associated documentation files (the "Software"), to deal
in the Software without restriction, including without limitation the rights
to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
copies of the Software, and to permit persons to whom the Software is
furnished to do so, subject to the following conditions:

The above copyright notice and this permission notice shall be included in all
copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
SOFTWARE.
*/

#ifndef EFFECT_EXPR_COLLECTIONS_HPP
#define EFFECT_EXPR_COLLECTIONS_HPP

#include "callable.hpp"
#include "runtime.hpp"
#include "value.hpp"

#include <fmt/format.h>

#include <deque>
#include <memory>
#include <type_traits>
#include <utility>

// Persistent map, set, queue, deque and heap builtins. The collection is always
// the last argument, every operation returns a new collection.

namespace effect_expr {

namespace detail {
  [[nodiscard]] inline Value map_value(MapEntries entries)
  {
    return Value{ Map{ std::make_shared<const MapEntries>(std::move(entries)) } };
  }

  [[nodiscard]] inline Value set_value(SetMembers members)
  {
    return Value{ Set{ std::make_shared<const SetMembers>(std::move(members)) } };
  }

  [[nodiscard]] inline Value queue_value(std::deque<Value> items)
  {
    return Value{ Queue{ std::make_shared<const std::deque<Value>>(std::move(items)) } };
  }

  [[nodiscard]] inline Value deque_value(std::deque<Value> items)
  {
    return Value{ Deque{ std::make_shared<const std::deque<Value>>(std::move(items)) } };
  }

  [[nodiscard]] inline Value heap_value(HeapEntries entries)
  {
    return Value{ Heap{ std::make_shared<const HeapEntries>(std::move(entries)) } };
  }

  [[nodiscard]] inline ValueVector entry_tuples(const MapEntries &entries)
  {
    ValueVector items;
    items.reserve(entries.size());
    for (const auto &[key, value] : entries) { items.push_back(make_tuple({ key, value })); }
    return items;
  }

  [[nodiscard]] inline Value optional_value(const Value *value)
  {
    if (value == nullptr) { return make_none(); }
    return make_some(*value);
  }
}// namespace detail

[[nodiscard]] inline Value map_record()
{
  RecordFields fields;
  fields.emplace("empty", detail::map_value({}));
  fields.emplace("size", make_builtin("map.size", 1, [](ValueVector args, Runtime &) -> Result<Value> {
    auto map = value_as<Map>(args[0], "map.size");
    if (!map) { return std::unexpected(map.error()); }
    return make_int(static_cast<std::int64_t>(map->entries->size()));
  }));
  fields.emplace("has", make_builtin("map.has", 2, [](ValueVector args, Runtime &) -> Result<Value> {
    auto key = key_arg(args[0], "map.has");
    if (!key) { return key; }
    auto map = value_as<Map>(args[1], "map.has");
    if (!map) { return std::unexpected(map.error()); }
    return make_bool(map->entries->contains(*key));
  }));
  fields.emplace("get", make_builtin("map.get", 2, [](ValueVector args, Runtime &) -> Result<Value> {
    auto key = key_arg(args[0], "map.get");
    if (!key) { return key; }
    auto map = value_as<Map>(args[1], "map.get");
    if (!map) { return std::unexpected(map.error()); }
    const auto found = map->entries->find(*key);
    return detail::optional_value(found == map->entries->end() ? nullptr : &found->second);
  }));
  fields.emplace("insert", make_builtin("map.insert", 3, [](ValueVector args, Runtime &) -> Result<Value> {
    auto key = key_arg(args[0], "map.insert");
    if (!key) { return key; }
    auto map = value_as<Map>(args[2], "map.insert");
    if (!map) { return std::unexpected(map.error()); }
    MapEntries entries = *map->entries;
    entries.insert_or_assign(std::move(*key), std::move(args[1]));
    return detail::map_value(std::move(entries));
  }));
  fields.emplace("update", make_builtin("map.update", 3, [](ValueVector args, Runtime &runtime) -> Result<Value> {
    auto key = key_arg(args[0], "map.update");
    if (!key) { return key; }
    auto map = value_as<Map>(args[2], "map.update");
    if (!map) { return std::unexpected(map.error()); }
    const auto found = map->entries->find(*key);
    if (found == map->entries->end()) { return args[2]; }
    auto updated = runtime.apply(std::move(args[1]), found->second);
    if (!updated) { return updated; }
    MapEntries entries = *map->entries;
    entries.insert_or_assign(std::move(*key), std::move(*updated));
    return detail::map_value(std::move(entries));
  }));
  fields.emplace("remove", make_builtin("map.remove", 2, [](ValueVector args, Runtime &) -> Result<Value> {
    auto key = key_arg(args[0], "map.remove");
    if (!key) { return key; }
    auto map = value_as<Map>(args[1], "map.remove");
    if (!map) { return std::unexpected(map.error()); }
    MapEntries entries = *map->entries;
    entries.erase(*key);
    return detail::map_value(std::move(entries));
  }));
  fields.emplace("keys", make_builtin("map.keys", 1, [](ValueVector args, Runtime &) -> Result<Value> {
    auto map = value_as<Map>(args[0], "map.keys");
    if (!map) { return std::unexpected(map.error()); }
    ValueVector keys;
    for (const auto &entry : *map->entries) { keys.push_back(entry.first); }
    return make_list(std::move(keys));
  }));
  fields.emplace("values", make_builtin("map.values", 1, [](ValueVector args, Runtime &) -> Result<Value> {
    auto map = value_as<Map>(args[0], "map.values");
    if (!map) { return std::unexpected(map.error()); }
    ValueVector values;
    for (const auto &entry : *map->entries) { values.push_back(entry.second); }
    return make_list(std::move(values));
  }));
  const auto entries = [](std::string_view name) {
    return make_builtin(std::string{ name }, 1, [name](ValueVector args, Runtime &) -> Result<Value> {
      auto map = value_as<Map>(args[0], name);
      if (!map) { return std::unexpected(map.error()); }
      return make_list(detail::entry_tuples(*map->entries));
    });
  };
  fields.emplace("entries", entries("map.entries"));
  fields.emplace("toList", entries("map.toList"));
  fields.emplace("fromList", make_builtin("map.fromList", 1, [](ValueVector args, Runtime &) -> Result<Value> {
    auto list = value_as<List>(args[0], "map.fromList");
    if (!list) { return std::unexpected(list.error()); }
    MapEntries entries;
    for (const auto &item : *list->items) {
      const auto *pair = item.get_if<Tuple>();
      if (pair == nullptr || pair->items->size() != 2) {
        return std::unexpected(RuntimeError::message("map.fromList expects List (k, v)"));
      }
      auto key = key_arg((*pair->items)[0], "map.fromList");
      if (!key) { return key; }
      entries.insert_or_assign(std::move(*key), (*pair->items)[1]);
    }
    return detail::map_value(std::move(entries));
  }));
  fields.emplace("union", make_builtin("map.union", 2, [](ValueVector args, Runtime &) -> Result<Value> {
    auto left = value_as<Map>(args[0], "map.union");
    if (!left) { return std::unexpected(left.error()); }
    auto right = value_as<Map>(args[1], "map.union");
    if (!right) { return std::unexpected(right.error()); }
    MapEntries entries = *left->entries;
    for (const auto &[key, value] : *right->entries) { entries.insert_or_assign(key, value); }
    return detail::map_value(std::move(entries));
  }));
  return make_record(std::move(fields));
}

[[nodiscard]] inline Value set_record()
{
  RecordFields fields;
  fields.emplace("empty", detail::set_value({}));
  fields.emplace("size", make_builtin("set.size", 1, [](ValueVector args, Runtime &) -> Result<Value> {
    auto set = value_as<Set>(args[0], "set.size");
    if (!set) { return std::unexpected(set.error()); }
    return make_int(static_cast<std::int64_t>(set->members->size()));
  }));
  fields.emplace("has", make_builtin("set.has", 2, [](ValueVector args, Runtime &) -> Result<Value> {
    auto key = key_arg(args[0], "set.has");
    if (!key) { return key; }
    auto set = value_as<Set>(args[1], "set.has");
    if (!set) { return std::unexpected(set.error()); }
    return make_bool(set->members->contains(*key));
  }));
  fields.emplace("insert", make_builtin("set.insert", 2, [](ValueVector args, Runtime &) -> Result<Value> {
    auto key = key_arg(args[0], "set.insert");
    if (!key) { return key; }
    auto set = value_as<Set>(args[1], "set.insert");
    if (!set) { return std::unexpected(set.error()); }
    SetMembers members = *set->members;
    members.insert(std::move(*key));
    return detail::set_value(std::move(members));
  }));
  fields.emplace("remove", make_builtin("set.remove", 2, [](ValueVector args, Runtime &) -> Result<Value> {
    auto key = key_arg(args[0], "set.remove");
    if (!key) { return key; }
    auto set = value_as<Set>(args[1], "set.remove");
    if (!set) { return std::unexpected(set.error()); }
    SetMembers members = *set->members;
    members.erase(*key);
    return detail::set_value(std::move(members));
  }));

  enum struct Combine { set_union, intersection, difference };
  const auto combine = [](std::string_view name, Combine mode) {
    return make_builtin(std::string{ name }, 2, [name, mode](ValueVector args, Runtime &) -> Result<Value> {
      auto left = value_as<Set>(args[0], name);
      if (!left) { return std::unexpected(left.error()); }
      auto right = value_as<Set>(args[1], name);
      if (!right) { return std::unexpected(right.error()); }
      SetMembers members;
      switch (mode) {
      case Combine::set_union:
        members = *left->members;
        members.insert(right->members->begin(), right->members->end());
        break;
      case Combine::intersection:
        for (const auto &member : *left->members) {
          if (right->members->contains(member)) { members.insert(member); }
        }
        break;
      case Combine::difference:
        for (const auto &member : *left->members) {
          if (!right->members->contains(member)) { members.insert(member); }
        }
        break;
      }
      return detail::set_value(std::move(members));
    });
  };
  fields.emplace("union", combine("set.union", Combine::set_union));
  fields.emplace("intersection", combine("set.intersection", Combine::intersection));
  fields.emplace("difference", combine("set.difference", Combine::difference));

  fields.emplace("fromList", make_builtin("set.fromList", 1, [](ValueVector args, Runtime &) -> Result<Value> {
    auto list = value_as<List>(args[0], "set.fromList");
    if (!list) { return std::unexpected(list.error()); }
    SetMembers members;
    for (const auto &item : *list->items) {
      auto key = key_arg(item, "set.fromList");
      if (!key) { return key; }
      members.insert(std::move(*key));
    }
    return detail::set_value(std::move(members));
  }));
  fields.emplace("toList", make_builtin("set.toList", 1, [](ValueVector args, Runtime &) -> Result<Value> {
    auto set = value_as<Set>(args[0], "set.toList");
    if (!set) { return std::unexpected(set.error()); }
    return make_list(ValueVector(set->members->begin(), set->members->end()));
  }));
  return make_record(std::move(fields));
}

// queue and deque share their representation, Kind picks the wrapper
template<typename Kind> [[nodiscard]] Value sequence_value(std::deque<Value> items)
{
  if constexpr (std::is_same_v<Kind, Queue>) {
    return detail::queue_value(std::move(items));
  } else {
    return detail::deque_value(std::move(items));
  }
}

template<typename Kind> void add_sequence_builtins(RecordFields &fields, std::string_view prefix)
{
  const auto name = [prefix](std::string_view operation) { return fmt::format("{}.{}", prefix, operation); };

  fields.emplace("empty", sequence_value<Kind>({}));
  fields.emplace("size", make_builtin(name("size"), 1, [builtin = name("size")](ValueVector args, Runtime &) -> Result<Value> {
    auto sequence = value_as<Kind>(args[0], builtin);
    if (!sequence) { return std::unexpected(sequence.error()); }
    return make_int(static_cast<std::int64_t>(sequence->items->size()));
  }));
  fields.emplace("fromList",
    make_builtin(name("fromList"), 1, [builtin = name("fromList")](ValueVector args, Runtime &) -> Result<Value> {
      auto list = value_as<List>(args[0], builtin);
      if (!list) { return std::unexpected(list.error()); }
      return sequence_value<Kind>(std::deque<Value>(list->items->begin(), list->items->end()));
    }));
  fields.emplace("toList",
    make_builtin(name("toList"), 1, [builtin = name("toList")](ValueVector args, Runtime &) -> Result<Value> {
      auto sequence = value_as<Kind>(args[0], builtin);
      if (!sequence) { return std::unexpected(sequence.error()); }
      return make_list(ValueVector(sequence->items->begin(), sequence->items->end()));
    }));

  const auto push = [&](std::string_view operation, bool front) {
    fields.emplace(std::string{ operation },
      make_builtin(name(operation), 2, [builtin = name(operation), front](ValueVector args, Runtime &) -> Result<Value> {
        auto sequence = value_as<Kind>(args[1], builtin);
        if (!sequence) { return std::unexpected(sequence.error()); }
        std::deque<Value> items = *sequence->items;
        if (front) {
          items.push_front(std::move(args[0]));
        } else {
          items.push_back(std::move(args[0]));
        }
        return sequence_value<Kind>(std::move(items));
      }));
  };

  // Some((value, rest)) or None
  const auto pop = [&](std::string_view operation, bool front) {
    fields.emplace(std::string{ operation },
      make_builtin(name(operation), 1, [builtin = name(operation), front](ValueVector args, Runtime &) -> Result<Value> {
        auto sequence = value_as<Kind>(args[0], builtin);
        if (!sequence) { return std::unexpected(sequence.error()); }
        if (sequence->items->empty()) { return make_none(); }
        std::deque<Value> items = *sequence->items;
        Value value;
        if (front) {
          value = std::move(items.front());
          items.pop_front();
        } else {
          value = std::move(items.back());
          items.pop_back();
        }
        return make_some(make_tuple({ std::move(value), sequence_value<Kind>(std::move(items)) }));
      }));
  };

  const auto peek = [&](std::string_view operation, bool front) {
    fields.emplace(std::string{ operation },
      make_builtin(name(operation), 1, [builtin = name(operation), front](ValueVector args, Runtime &) -> Result<Value> {
        auto sequence = value_as<Kind>(args[0], builtin);
        if (!sequence) { return std::unexpected(sequence.error()); }
        if (sequence->items->empty()) { return make_none(); }
        return make_some(front ? sequence->items->front() : sequence->items->back());
      }));
  };

  if constexpr (std::is_same_v<Kind, Queue>) {
    push("enqueue", false);
    pop("dequeue", true);
    peek("peek", true);
  } else {
    push("pushFront", true);
    push("pushBack", false);
    pop("popFront", true);
    pop("popBack", false);
    peek("peekFront", true);
    peek("peekBack", false);
  }
}

[[nodiscard]] inline Value queue_record()
{
  RecordFields fields;
  add_sequence_builtins<Queue>(fields, "queue");
  return make_record(std::move(fields));
}

[[nodiscard]] inline Value deque_record()
{
  RecordFields fields;
  add_sequence_builtins<Deque>(fields, "deque");
  return make_record(std::move(fields));
}

[[nodiscard]] inline Value heap_record()
{
  RecordFields fields;
  fields.emplace("empty", detail::heap_value({}));
  fields.emplace("size", make_builtin("heap.size", 1, [](ValueVector args, Runtime &) -> Result<Value> {
    auto heap = value_as<Heap>(args[0], "heap.size");
    if (!heap) { return std::unexpected(heap.error()); }
    return make_int(static_cast<std::int64_t>(heap->entries->size()));
  }));
  fields.emplace("push", make_builtin("heap.push", 2, [](ValueVector args, Runtime &) -> Result<Value> {
    auto key = key_arg(args[0], "heap.push");
    if (!key) { return key; }
    auto heap = value_as<Heap>(args[1], "heap.push");
    if (!heap) { return std::unexpected(heap.error()); }
    HeapEntries entries = *heap->entries;
    entries.insert(std::move(*key));
    return detail::heap_value(std::move(entries));
  }));
  fields.emplace("popMin", make_builtin("heap.popMin", 1, [](ValueVector args, Runtime &) -> Result<Value> {
    auto heap = value_as<Heap>(args[0], "heap.popMin");
    if (!heap) { return std::unexpected(heap.error()); }
    if (heap->entries->empty()) { return make_none(); }
    HeapEntries entries = *heap->entries;
    Value minimum = *entries.begin();
    entries.erase(entries.begin());
    return make_some(make_tuple({ std::move(minimum), detail::heap_value(std::move(entries)) }));
  }));
  fields.emplace("peekMin", make_builtin("heap.peekMin", 1, [](ValueVector args, Runtime &) -> Result<Value> {
    auto heap = value_as<Heap>(args[0], "heap.peekMin");
    if (!heap) { return std::unexpected(heap.error()); }
    if (heap->entries->empty()) { return make_none(); }
    return make_some(*heap->entries->begin());
  }));
  fields.emplace("fromList", make_builtin("heap.fromList", 1, [](ValueVector args, Runtime &) -> Result<Value> {
    auto list = value_as<List>(args[0], "heap.fromList");
    if (!list) { return std::unexpected(list.error()); }
    HeapEntries entries;
    for (const auto &item : *list->items) {
      auto key = key_arg(item, "heap.fromList");
      if (!key) { return key; }
      entries.insert(std::move(*key));
    }
    return detail::heap_value(std::move(entries));
  }));
  fields.emplace("toList", make_builtin("heap.toList", 1, [](ValueVector args, Runtime &) -> Result<Value> {
    auto heap = value_as<Heap>(args[0], "heap.toList");
    if (!heap) { return std::unexpected(heap.error()); }
    return make_list(ValueVector(heap->entries->begin(), heap->entries->end()));
  }));
  return make_record(std::move(fields));
}

[[nodiscard]] inline Value collections_record()
{
  return make_record(RecordFields{ { "map", map_record() },
    { "set", set_record() },
    { "queue", queue_record() },
    { "deque", deque_record() },
    { "heap", heap_record() } });
}

}// namespace effect_expr

#endif
