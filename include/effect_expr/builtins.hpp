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

#ifndef EFFECT_EXPR_BUILTINS_HPP
#define EFFECT_EXPR_BUILTINS_HPP

#include "callable.hpp"
#include "collections.hpp"
#include "concurrency.hpp"
#include "environment.hpp"
#include "numeric.hpp"
#include "runtime.hpp"
#include "utility.hpp"
#include "value.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <array>
#include <cstddef>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>

namespace effect_expr {

[[nodiscard]] inline Value make_constructor_builtin(std::string name, std::size_t arity)
{
  return make_builtin(name, arity, [name](ValueVector args, Runtime &) -> Result<Value> {
    return make_constructor(name, std::move(args));
  });
}

[[nodiscard]] inline Result<Value> effect_pure(ValueVector args, Runtime &)
{
  return make_effect([value = std::move(args[0])](Runtime &) -> Result<Value> { return value; });
}

[[nodiscard]] inline Result<Value> effect_fail(ValueVector args, Runtime &)
{
  return make_effect(
    [value = std::move(args[0])](Runtime &) -> Result<Value> { return std::unexpected(RuntimeError::error(value)); });
}

[[nodiscard]] inline Result<Value> effect_bind(ValueVector args, Runtime &)
{
  return make_effect([effect = std::move(args[0]), func = std::move(args[1])](Runtime &runtime) -> Result<Value> {
    auto value = runtime.run_effect_value(effect);
    if (!value) { return value; }
    auto next = runtime.apply(func, std::move(*value));
    if (!next) { return next; }
    return runtime.run_effect_value(*next);
  });
}

// only language level failures are turned into Err, cancellation and internal errors pass through
[[nodiscard]] inline Result<Value> effect_attempt(ValueVector args, Runtime &)
{
  return make_effect([effect = std::move(args[0])](Runtime &runtime) -> Result<Value> {
    auto value = runtime.run_effect_value(effect);
    if (value) { return make_ok(std::move(*value)); }
    if (value.error().is_error()) { return make_err(std::move(value.error().payload)); }
    return value;
  });
}

[[nodiscard]] inline Result<Value> effect_load(ValueVector args, Runtime &)
{
  if (!args[0].holds<EffectPtr>()) { return std::unexpected(RuntimeError::message("load expects an Effect")); }
  return std::move(args[0]);
}

template<bool Newline> [[nodiscard]] Result<Value> effect_print(ValueVector args, Runtime &)
{
  return make_effect([text = to_string(args[0])](Runtime &) -> Result<Value> {
    if constexpr (Newline) {
      std::cout << text << '\n';
    } else {
      std::cout << text;
    }
    std::cout.flush();
    return unit();
  });
}

[[nodiscard]] inline Result<Value> builtin_map(ValueVector args, Runtime &runtime)
{
  const auto &func = args[0];
  const auto &container = args[1];

  if (const auto *list = container.get_if<List>(); list != nullptr) {
    ValueVector mapped;
    mapped.reserve(list->items->size());
    for (const auto &item : *list->items) {
      auto value = runtime.apply(func, item);
      if (!value) { return value; }
      mapped.push_back(std::move(*value));
    }
    return make_list(std::move(mapped));
  }

  if (const auto *ctor = container.get_if<Constructor>(); ctor != nullptr) {
    if ((ctor->name == "None" && ctor->args->empty()) || (ctor->name == "Err" && ctor->args->size() == 1)) {
      return container;
    }
    if ((ctor->name == "Some" || ctor->name == "Ok") && ctor->args->size() == 1) {
      auto value = runtime.apply(func, ctor->args->front());
      if (!value) { return value; }
      return make_constructor(ctor->name, { std::move(*value) });
    }
  }

  return std::unexpected(
    RuntimeError::message(fmt::format("map expects List/Option/Result, got {}", to_string(container))));
}

[[nodiscard]] inline Result<Value> builtin_chain(ValueVector args, Runtime &runtime)
{
  const auto &func = args[0];
  const auto &container = args[1];

  if (const auto *list = container.get_if<List>(); list != nullptr) {
    ValueVector chained;
    for (const auto &item : *list->items) {
      auto value = runtime.apply(func, item);
      if (!value) { return value; }
      const auto *inner = value->get_if<List>();
      if (inner == nullptr) {
        return std::unexpected(RuntimeError::message(
          fmt::format("chain on List expects f : A -> List B, got {}", to_string(*value))));
      }
      chained.insert(chained.end(), inner->items->begin(), inner->items->end());
    }
    return make_list(std::move(chained));
  }

  if (const auto *ctor = container.get_if<Constructor>(); ctor != nullptr) {
    if ((ctor->name == "None" && ctor->args->empty()) || (ctor->name == "Err" && ctor->args->size() == 1)) {
      return container;
    }
    if ((ctor->name == "Some" || ctor->name == "Ok") && ctor->args->size() == 1) {
      return runtime.apply(func, ctor->args->front());
    }
  }

  return std::unexpected(
    RuntimeError::message(fmt::format("chain expects List/Option/Result, got {}", to_string(container))));
}

[[nodiscard]] inline Result<Value> builtin_assert_eq(ValueVector args, Runtime &)
{
  const bool equal = values_equal(args[0], args[1]);
  auto failure = equal ? std::string{}
                       : fmt::format("assertEq failed: left={}, right={}", to_string(args[0]), to_string(args[1]));
  return make_effect([equal, failure = std::move(failure)](Runtime &) -> Result<Value> {
    if (equal) { return unit(); }
    return std::unexpected(RuntimeError::error(make_text(failure)));
  });
}

// generators are curried step -> seed -> result functions
[[nodiscard]] inline Result<Value> builtin_fold_gen(ValueVector args, Runtime &runtime)
{
  auto with_step = runtime.apply(std::move(args[0]), std::move(args[1]));
  if (!with_step) { return with_step; }
  return runtime.apply(std::move(*with_step), std::move(args[2]));
}

// Installs every builtin into the given (global) scope, which must not be sealed yet.
[[nodiscard]] inline Result<void> register_builtins(Environment &env)
{
  Bindings builtins;
  const auto bind = [&](std::string_view name, Value value) { builtins.emplace_back(std::string{ name }, std::move(value)); };
  const auto add = [&](std::string_view name, std::size_t arity, NativeFunction function) {
    bind(name, make_builtin(std::string{ name }, arity, std::move(function)));
  };

  bind("Unit", unit());
  bind("True", make_bool(true));
  bind("False", make_bool(false));
  bind("None", make_none());
  bind("Some", make_constructor_builtin("Some", 1));
  bind("Ok", make_constructor_builtin("Ok", 1));
  bind("Err", make_constructor_builtin("Err", 1));
  bind("Closed", make_closed());

  add("pure", 1, effect_pure);
  add("fail", 1, effect_fail);
  add("bind", 2, effect_bind);
  add("attempt", 1, effect_attempt);
  add("load", 1, effect_load);
  add("print", 1, effect_print<false>);
  add("println", 1, effect_print<true>);

  add("map", 2, builtin_map);
  add("chain", 2, builtin_chain);
  add("assertEq", 2, builtin_assert_eq);
  add("foldGen", 3, builtin_fold_gen);

  bind("channel", channel_record());
  bind("concurrent", concurrent_record());

  const auto collections = collections_record();
  static constexpr std::array<std::pair<std::string_view, std::string_view>, 5> aliases{
    { { "map", "Map" }, { "set", "Set" }, { "queue", "Queue" }, { "deque", "Deque" }, { "heap", "Heap" } }
  };
  for (const auto &[field, name] : aliases) {
    if (const auto *record = record_field(collections, field); record != nullptr) { bind(name, *record); }
  }
  bind("collections", collections);

  bind("bigint", bigint_record());
  bind("rational", rational_record());
  bind("decimal", decimal_record());

  return env.set_all(std::move(builtins));
}

}// namespace effect_expr

#endif
