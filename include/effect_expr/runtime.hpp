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

#ifndef EFFECT_EXPR_RUNTIME_HPP
#define EFFECT_EXPR_RUNTIME_HPP

#include "callable.hpp"
#include "cancel_token.hpp"
#include "environment.hpp"
#include "expr.hpp"
#include "utility.hpp"
#include "value.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <memory>
#include <optional>
#include <regex>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

namespace effect_expr {

struct RuntimeConfig
{
  std::chrono::milliseconds poll_interval{ default_poll_interval };
  bool trace_effects{ false };

  // EFFECT_EXPR_TRACE_EFFECT turns on effect step tracing, EFFECT_EXPR_POLL_MS overrides the poll interval
  [[nodiscard]] static RuntimeConfig from_environment()
  {
    RuntimeConfig config;
    if (const char *trace = std::getenv("EFFECT_EXPR_TRACE_EFFECT"); trace != nullptr) {
      const std::string_view value{ trace };
      config.trace_effects = !value.empty() && value != "0";
    }
    if (const char *poll = std::getenv("EFFECT_EXPR_POLL_MS"); poll != nullptr) {
      const std::string_view value{ poll };
      std::int64_t millis = 0;
      const auto [end, error] = std::from_chars(value.data(), value.data() + value.size(), millis);
      if (error == std::errc{} && end == value.data() + value.size() && millis > 0) {
        config.poll_interval = std::chrono::milliseconds{ millis };
      } else {
        spdlog::warn("ignoring invalid EFFECT_EXPR_POLL_MS value '{}'", value);
      }
    }
    return config;
  }
};

// state shared by every runtime working on the same program
struct Context
{
  Env globals;
  RuntimeConfig config;
};

using ContextPtr = std::shared_ptr<const Context>;

[[nodiscard]] inline ContextPtr make_context(Env globals, RuntimeConfig config = {})
{
  return std::make_shared<const Context>(Context{ std::move(globals), config });
}

// integer when the text is only digits and '-', otherwise a float
[[nodiscard]] inline std::optional<Value> parse_number(std::string_view text)
{
  if (text.empty() || text == "-") { return std::nullopt; }

  const auto *begin = text.data();
  const auto *end = text.data() + text.size();

  const bool integral = std::ranges::all_of(text, [](char ch) { return (ch >= '0' && ch <= '9') || ch == '-'; });
  if (integral) {
    std::int64_t value = 0;
    if (const auto [last, error] = std::from_chars(begin, end, value); error == std::errc{} && last == end) {
      return make_int(value);
    }
  }

  double value = 0;
  if (const auto [last, error] = std::from_chars(begin, end, value); error == std::errc{} && last == end) {
    return make_float(value);
  }
  return std::nullopt;
}

template<typename Type> [[nodiscard]] constexpr std::string_view kind_name() noexcept
{
  if constexpr (std::is_same_v<Type, bool>) {
    return "Bool";
  } else if constexpr (std::is_same_v<Type, std::int64_t>) {
    return "Int";
  } else if constexpr (std::is_same_v<Type, double>) {
    return "Float";
  } else if constexpr (std::is_same_v<Type, std::string>) {
    return "Text";
  } else if constexpr (std::is_same_v<Type, BigInt>) {
    return "BigInt";
  } else if constexpr (std::is_same_v<Type, Rational>) {
    return "Rational";
  } else if constexpr (std::is_same_v<Type, Decimal>) {
    return "Decimal";
  } else if constexpr (std::is_same_v<Type, List>) {
    return "List";
  } else if constexpr (std::is_same_v<Type, Tuple>) {
    return "Tuple";
  } else if constexpr (std::is_same_v<Type, Record>) {
    return "Record";
  } else if constexpr (std::is_same_v<Type, Map>) {
    return "Map";
  } else if constexpr (std::is_same_v<Type, Set>) {
    return "Set";
  } else if constexpr (std::is_same_v<Type, Queue>) {
    return "Queue";
  } else if constexpr (std::is_same_v<Type, Deque>) {
    return "Deque";
  } else if constexpr (std::is_same_v<Type, Heap>) {
    return "Heap";
  } else if constexpr (std::is_same_v<Type, EffectPtr>) {
    return "Effect";
  } else {
    return "a different value";
  }
}

// type check at a builtin boundary, a mismatch is an internal error
template<typename Type> [[nodiscard]] Result<Type> value_as(const Value &value, std::string_view builtin)
{
  if (const auto *found = value.get_if<Type>(); found != nullptr) { return *found; }
  return std::unexpected(
    RuntimeError::message(fmt::format("{} expects {}, got {}", builtin, kind_name<Type>(), to_string(value))));
}

[[nodiscard]] inline Result<Value> key_arg(const Value &value, std::string_view builtin)
{
  if (is_key(value)) { return value; }
  return std::unexpected(
    RuntimeError::message(fmt::format("{} expects a hashable key, got {}", builtin, to_string(value))));
}

namespace detail {
  [[nodiscard]] inline const Value *field_path(const Value &value, const std::vector<std::string> &path)
  {
    const Value *current = &value;
    for (const auto &segment : path) {
      current = record_field(*current, segment);
      if (current == nullptr) { return nullptr; }
    }
    return current;
  }

  [[nodiscard]] inline bool text_field_equals(const Value &record, std::string_view name, std::string_view expected)
  {
    const auto *field = record_field(record, name);
    if (field == nullptr) { return false; }
    const auto *text = field->get_if<std::string>();
    return text != nullptr && *text == expected;
  }

  [[nodiscard]] inline std::int64_t wrapping(std::uint64_t value) noexcept { return static_cast<std::int64_t>(value); }
}// namespace detail

[[nodiscard]] inline bool match_literal(const Literal &pattern, const Value &value)
{
  return std::visit(
    [&]<typename Lit>(const Lit &lit) -> bool {
      if constexpr (std::is_same_v<Lit, literal::Number>) {
        const auto number = parse_number(lit.text);
        if (!number) { return false; }
        if (const auto *int_value = value.get_if<std::int64_t>(); int_value != nullptr) {
          const auto *expected = number->template get_if<std::int64_t>();
          return expected != nullptr && *expected == *int_value;
        }
        if (const auto *float_value = value.get_if<double>(); float_value != nullptr) {
          if (const auto *expected = number->template get_if<std::int64_t>(); expected != nullptr) {
            return static_cast<double>(*expected) == *float_value;
          }
          return std::get<double>(number->value) == *float_value;
        }
        return false;
      } else if constexpr (std::is_same_v<Lit, literal::Text>) {
        const auto *text = value.get_if<std::string>();
        return text != nullptr && *text == lit.text;
      } else if constexpr (std::is_same_v<Lit, literal::Sigil>) {
        // raw text comparison, no normalization of the body or flags
        return detail::text_field_equals(value, "tag", lit.tag) && detail::text_field_equals(value, "body", lit.body)
               && detail::text_field_equals(value, "flags", lit.flags);
      } else if constexpr (std::is_same_v<Lit, literal::Bool>) {
        const auto *boolean = value.get_if<bool>();
        return boolean != nullptr && *boolean == lit.value;
      } else {
        const auto *date_time = value.get_if<DateTime>();
        return date_time != nullptr && date_time->text == lit.text;
      }
    },
    pattern);
}

// Structural match. On failure the contents of bindings are unspecified.
[[nodiscard]] inline bool match_pattern(const Pattern &pattern, const Value &value, Bindings &bindings)
{
  const auto match_all = [&](const std::vector<PatternPtr> &patterns, std::span<const Value> values) {
    if (patterns.size() != values.size()) { return false; }
    for (std::size_t index = 0; index < patterns.size(); ++index) {
      if (!match_pattern(*patterns[index], values[index], bindings)) { return false; }
    }
    return true;
  };

  return std::visit(
    [&]<typename Node>(const Node &node) -> bool {
      if constexpr (std::is_same_v<Node, Pattern::Wildcard>) {
        return true;
      } else if constexpr (std::is_same_v<Node, Pattern::Var>) {
        bindings.emplace_back(node.name, value);
        return true;
      } else if constexpr (std::is_same_v<Node, Pattern::Literal>) {
        return match_literal(node.value, value);
      } else if constexpr (std::is_same_v<Node, Pattern::Constructor>) {
        const auto *ctor = value.get_if<Constructor>();
        return ctor != nullptr && ctor->name == node.name && match_all(node.args, *ctor->args);
      } else if constexpr (std::is_same_v<Node, Pattern::Tuple>) {
        const auto *tuple = value.get_if<Tuple>();
        return tuple != nullptr && match_all(node.items, *tuple->items);
      } else if constexpr (std::is_same_v<Node, Pattern::List>) {
        const auto *list = value.get_if<List>();
        if (list == nullptr) { return false; }
        const std::span<const Value> items{ *list->items };
        if (!node.rest) { return match_all(node.items, items); }
        if (items.size() < node.items.size()) { return false; }
        if (!match_all(node.items, items.first(node.items.size()))) { return false; }
        const auto suffix = items.subspan(node.items.size());
        return match_pattern(*node.rest, make_list(ValueVector(suffix.begin(), suffix.end())), bindings);
      } else {
        return std::ranges::all_of(node.fields, [&](const Pattern::RecordField &field) {
          const auto *found = detail::field_path(value, field.path);
          return found != nullptr && match_pattern(*field.pattern, *found, bindings);
        });
      }
    },
    pattern.node);
}

// One evaluator. A Runtime belongs to a single thread; concurrent combinators
// build a fresh Runtime for every thread they start.
class Runtime
{
public:
  Runtime(ContextPtr context, CancelTokenPtr cancel, std::optional<std::uint64_t> fuel = std::nullopt)
    : context_(std::move(context)), cancel_(std::move(cancel)), fuel_(fuel)
  {}

  [[nodiscard]] const ContextPtr &context() const noexcept { return context_; }
  [[nodiscard]] const Env &globals() const noexcept { return context_->globals; }
  [[nodiscard]] const CancelTokenPtr &cancel_token() const noexcept { return cancel_; }
  [[nodiscard]] std::chrono::milliseconds poll_interval() const noexcept { return context_->config.poll_interval; }
  [[nodiscard]] std::optional<std::uint64_t> fuel() const noexcept { return fuel_; }

  // Polled on every evaluation step. Fuel exhaustion reports as cancellation.
  [[nodiscard]] Result<void> check_cancelled()
  {
    if (cancel_mask_ > 0) { return {}; }
    if (fuel_) {
      if (*fuel_ == 0) { return std::unexpected(RuntimeError::cancelled()); }
      --*fuel_;
    }
    if (cancel_->is_cancelled()) { return std::unexpected(RuntimeError::cancelled()); }
    return {};
  }

  template<typename Func> auto uncancelable(Func &&func)
  {
    ++cancel_mask_;
    auto result = std::forward<Func>(func)();
    --cancel_mask_;
    return result;
  }

  // runs func with a runtime for this thread under another token, the fuel budget is shared
  template<typename Func> auto with_token(CancelTokenPtr cancel, Func &&func)
  {
    Runtime nested{ context_, std::move(cancel), fuel_ };
    nested.cancel_mask_ = cancel_mask_;
    auto result = std::forward<Func>(func)(nested);
    fuel_ = nested.fuel_;
    return result;
  }

  [[nodiscard]] Result<Value> force(Value value);
  [[nodiscard]] Result<Value> eval(const Expr &expr, const Env &env);
  [[nodiscard]] Result<Value> apply(Value callee, Value arg);
  [[nodiscard]] Result<Value> apply_all(Value callee, ValueVector args);
  [[nodiscard]] Result<Value> run_effect_value(const Value &value);
  [[nodiscard]] Result<Value> run_effect_block(const Env &env, const std::vector<BlockItem> &items);
  [[nodiscard]] Result<void> release_all(ValueVector releases);

private:
  [[nodiscard]] Result<Value> eval_node(const Expr::Var &node, const Env &env);
  [[nodiscard]] Result<Value> eval_node(const Expr::Number &node, const Env &env);
  [[nodiscard]] Result<Value> eval_node(const Expr::Text &node, const Env &env);
  [[nodiscard]] Result<Value> eval_node(const Expr::Interpolate &node, const Env &env);
  [[nodiscard]] Result<Value> eval_node(const Expr::Sigil &node, const Env &env);
  [[nodiscard]] Result<Value> eval_node(const Expr::Bool &node, const Env &env);
  [[nodiscard]] Result<Value> eval_node(const Expr::DateTime &node, const Env &env);
  [[nodiscard]] Result<Value> eval_node(const Expr::Lambda &node, const Env &env);
  [[nodiscard]] Result<Value> eval_node(const Expr::App &node, const Env &env);
  [[nodiscard]] Result<Value> eval_node(const Expr::Call &node, const Env &env);
  [[nodiscard]] Result<Value> eval_node(const Expr::List &node, const Env &env);
  [[nodiscard]] Result<Value> eval_node(const Expr::Tuple &node, const Env &env);
  [[nodiscard]] Result<Value> eval_node(const Expr::Record &node, const Env &env);
  [[nodiscard]] Result<Value> eval_node(const Expr::Patch &node, const Env &env);
  [[nodiscard]] Result<Value> eval_node(const Expr::FieldAccess &node, const Env &env);
  [[nodiscard]] Result<Value> eval_node(const Expr::Index &node, const Env &env);
  [[nodiscard]] Result<Value> eval_node(const Expr::Match &node, const Env &env);
  [[nodiscard]] Result<Value> eval_node(const Expr::If &node, const Env &env);
  [[nodiscard]] Result<Value> eval_node(const Expr::Binary &node, const Env &env);
  [[nodiscard]] Result<Value> eval_node(const Expr::Block &node, const Env &env);

  [[nodiscard]] Result<void> insert_field(RecordFields &fields, std::span<const std::string> path, Value value);
  [[nodiscard]] Result<void>
    patch_field(RecordFields &fields, std::span<const std::string> path, const Expr &expr, const Env &env);
  [[nodiscard]] Result<Value> eval_plain_block(const std::vector<BlockItem> &items, const Env &env);
  [[nodiscard]] Result<void>
    generate_items(const std::vector<BlockItem> &items, std::size_t index, const Env &env, ValueVector &produced);
  [[nodiscard]] Result<Value> apply_multi_clause(const MultiClause &multi, const Value &arg);
  [[nodiscard]] Result<Value> run_effect_item(const BlockItem &item, const Env &local, ValueVector &releases);
  [[nodiscard]] Result<std::pair<Value, Value>> acquire_resource(const Resource &resource);

  ContextPtr context_;
  CancelTokenPtr cancel_;
  std::optional<std::uint64_t> fuel_;
  std::size_t cancel_mask_{ 0 };
};

inline Result<Value> Runtime::force(Value value)
{
  const auto *pending = value.get_if<ThunkPtr>();
  if (pending == nullptr) { return value; }
  const ThunkPtr thunk = *pending;

  std::unique_lock lock(thunk->mutex_);
  while (thunk->state_ != Thunk::State::pending) {
    if (thunk->state_ == Thunk::State::done) { return *thunk->result_; }
    if (thunk->owner_ == std::this_thread::get_id()) {
      return std::unexpected(RuntimeError::message("recursive definition detected"));
    }
    if (auto ok = check_cancelled(); !ok) { return std::unexpected(ok.error()); }
    thunk->finished_.wait_for(lock, poll_interval());
  }

  thunk->state_ = Thunk::State::in_progress;
  thunk->owner_ = std::this_thread::get_id();
  lock.unlock();

  auto result = eval(*thunk->expr_, thunk->env_);

  lock.lock();
  thunk->owner_ = std::thread::id{};
  if (!result && result.error().is_cancelled()) {
    // the forcer was cancelled, leave the thunk for the next forcer
    thunk->state_ = Thunk::State::pending;
  } else {
    thunk->state_ = Thunk::State::done;
    thunk->result_ = result;
  }
  lock.unlock();
  thunk->finished_.notify_all();
  return result;
}

inline Result<Value> Runtime::eval(const Expr &expr, const Env &env)
{
  if (auto ok = check_cancelled(); !ok) { return std::unexpected(ok.error()); }
  return std::visit([&](const auto &node) { return eval_node(node, env); }, expr.node);
}

inline Result<Value> Runtime::eval_node(const Expr::Var &node, const Env &env)
{
  if (auto value = env->get(node.name); value) { return force(std::move(*value)); }

  // record.field.field for builtin records such as Map.insert
  if (const auto dot = node.name.find('.'); dot != std::string::npos && dot > 0) {
    if (auto root = env->get(std::string_view{ node.name }.substr(0, dot)); root) {
      auto current = force(std::move(*root));
      if (!current) { return current; }
      std::string_view rest{ node.name };
      rest.remove_prefix(dot + 1);
      while (!rest.empty()) {
        const auto next = rest.find('.');
        const auto field = rest.substr(0, next);
        const auto *found = record_field(*current, field);
        if (found == nullptr) { return std::unexpected(RuntimeError::message(fmt::format("missing field {}", field))); }
        current = *found;
        rest = next == std::string_view::npos ? std::string_view{} : rest.substr(next + 1);
      }
      return current;
    }
  }

  // an unbound capitalized name is a nullary constructor
  const auto segment = std::string_view{ node.name }.substr(node.name.rfind('.') + 1);
  if (!segment.empty() && std::isupper(static_cast<unsigned char>(segment.front())) != 0) {
    return make_constructor(std::string{ segment });
  }
  return std::unexpected(RuntimeError::message(fmt::format("unknown name {}", node.name)));
}

inline Result<Value> Runtime::eval_node(const Expr::Number &node, const Env &env)
{
  if (auto number = parse_number(node.text); number) { return *number; }
  // domain literals such as 10ms are resolved as names
  if (auto value = env->get(node.text); value) { return force(std::move(*value)); }
  return std::unexpected(RuntimeError::message(fmt::format("invalid number literal {}", node.text)));
}

inline Result<Value> Runtime::eval_node(const Expr::Text &node, const Env &) { return make_text(node.text); }

inline Result<Value> Runtime::eval_node(const Expr::Interpolate &node, const Env &env)
{
  std::string text;
  for (const auto &part : node.parts) {
    if (!part.expr) {
      text += part.text;
      continue;
    }
    auto value = eval(*part.expr, env);
    if (!value) { return value; }
    text += to_string(*value);
  }
  return make_text(std::move(text));
}

inline Result<Value> Runtime::eval_node(const Expr::Sigil &node, const Env &)
{
  if (node.tag == "r") {
    auto flags = std::regex::ECMAScript;
    if (node.flags.find('i') != std::string::npos) { flags |= std::regex::icase; }
    std::regex compiled;
    try {
      compiled = std::regex(node.body, flags);
    } catch (const std::regex_error &error) {
      return std::unexpected(RuntimeError::message(fmt::format("invalid regex literal: {}", error.what())));
    }
    return Value{ Regex{ std::make_shared<const CompiledRegex>(CompiledRegex{ node.body, node.flags, std::move(compiled) }) } };
  }

  if (node.tag == "d") {
    const std::string_view body{ node.body };
    std::array<std::int64_t, 3> parts{};
    const auto parse_part = [&](std::size_t offset, std::size_t length, std::int64_t &out) {
      if (body.size() < offset + length) { return false; }
      const auto *begin = body.data() + offset;
      const auto [last, error] = std::from_chars(begin, begin + length, out);
      return error == std::errc{} && last == begin + length;
    };
    if (body.size() != 10 || body[4] != '-' || body[7] != '-' || !parse_part(0, 4, parts[0])
        || !parse_part(5, 2, parts[1]) || !parse_part(8, 2, parts[2])) {
      return std::unexpected(RuntimeError::message(fmt::format("invalid date literal: {}", node.body)));
    }
    return make_record(
      RecordFields{ { "year", make_int(parts[0]) }, { "month", make_int(parts[1]) }, { "day", make_int(parts[2]) } });
  }

  if (node.tag == "t" || node.tag == "dt") { return Value{ DateTime{ node.body } }; }

  return make_record(RecordFields{
    { "tag", make_text(node.tag) }, { "body", make_text(node.body) }, { "flags", make_text(node.flags) } });
}

inline Result<Value> Runtime::eval_node(const Expr::Bool &node, const Env &) { return make_bool(node.value); }

inline Result<Value> Runtime::eval_node(const Expr::DateTime &node, const Env &)
{
  return Value{ effect_expr::DateTime{ node.text } };
}

inline Result<Value> Runtime::eval_node(const Expr::Lambda &node, const Env &env)
{
  return Value{ std::make_shared<const Closure>(Closure{ node.parameter, node.body, env }) };
}

inline Result<Value> Runtime::eval_node(const Expr::App &node, const Env &env)
{
  auto func = eval(*node.func, env);
  if (!func) { return func; }
  auto arg = eval(*node.arg, env);
  if (!arg) { return arg; }
  return apply(std::move(*func), std::move(*arg));
}

inline Result<Value> Runtime::eval_node(const Expr::Call &node, const Env &env)
{
  auto func = eval(*node.func, env);
  if (!func) { return func; }
  ValueVector args;
  args.reserve(node.args.size());
  for (const auto &arg : node.args) {
    auto value = eval(*arg, env);
    if (!value) { return value; }
    args.push_back(std::move(*value));
  }
  return apply_all(std::move(*func), std::move(args));
}

inline Result<Value> Runtime::eval_node(const Expr::List &node, const Env &env)
{
  ValueVector items;
  for (const auto &item : node.items) {
    auto value = eval(*item.expr, env);
    if (!value) { return value; }
    if (!item.spread) {
      items.push_back(std::move(*value));
      continue;
    }
    const auto *list = value->get_if<List>();
    if (list == nullptr) {
      return std::unexpected(RuntimeError::message(fmt::format("list spread expects a list, got {}", to_string(*value))));
    }
    items.insert(items.end(), list->items->begin(), list->items->end());
  }
  return make_list(std::move(items));
}

inline Result<Value> Runtime::eval_node(const Expr::Tuple &node, const Env &env)
{
  ValueVector items;
  items.reserve(node.items.size());
  for (const auto &item : node.items) {
    auto value = eval(*item, env);
    if (!value) { return value; }
    items.push_back(std::move(*value));
  }
  return make_tuple(std::move(items));
}

inline Result<void> Runtime::insert_field(RecordFields &fields, std::span<const std::string> path, Value value)
{
  if (path.empty()) { return std::unexpected(RuntimeError::message("record field path must not be empty")); }
  if (path.size() == 1) {
    fields.insert_or_assign(path.front(), std::move(value));
    return {};
  }

  RecordFields nested;
  if (const auto found = fields.find(path.front()); found != fields.end()) {
    if (const auto *record = found->second.get_if<Record>(); record != nullptr) { nested = *record->fields; }
  }
  if (auto inserted = insert_field(nested, path.subspan(1), std::move(value)); !inserted) { return inserted; }
  fields.insert_or_assign(path.front(), make_record(std::move(nested)));
  return {};
}

inline Result<Value> Runtime::eval_node(const Expr::Record &node, const Env &env)
{
  RecordFields fields;
  for (const auto &field : node.fields) {
    auto value = eval(*field.value, env);
    if (!value) { return value; }
    if (field.spread) {
      const auto *record = value->get_if<Record>();
      if (record == nullptr) {
        return std::unexpected(
          RuntimeError::message(fmt::format("record spread expects a record, got {}", to_string(*value))));
      }
      for (const auto &[name, field_value] : *record->fields) { fields.insert_or_assign(name, field_value); }
      continue;
    }
    if (auto inserted = insert_field(fields, field.path, std::move(*value)); !inserted) {
      return std::unexpected(inserted.error());
    }
  }
  return make_record(std::move(fields));
}

// a callable patch value transforms the existing field instead of replacing it
inline Result<void>
  Runtime::patch_field(RecordFields &fields, std::span<const std::string> path, const Expr &expr, const Env &env)
{
  if (path.empty()) { return std::unexpected(RuntimeError::message("patch field path must not be empty")); }

  const auto &name = path.front();
  const auto existing = fields.find(name);

  if (path.size() == 1) {
    auto value = eval(expr, env);
    if (!value) { return std::unexpected(value.error()); }
    if (is_callable(*value)) {
      if (existing == fields.end()) {
        return std::unexpected(RuntimeError::message(fmt::format("patch transform expects existing field {}", name)));
      }
      value = apply(std::move(*value), existing->second);
      if (!value) { return std::unexpected(value.error()); }
    }
    fields.insert_or_assign(name, std::move(*value));
    return {};
  }

  RecordFields nested;
  if (existing != fields.end()) {
    const auto *record = existing->second.get_if<Record>();
    if (record == nullptr) { return std::unexpected(RuntimeError::message(fmt::format("patch path conflict at {}", name))); }
    nested = *record->fields;
  }
  if (auto patched = patch_field(nested, path.subspan(1), expr, env); !patched) { return patched; }
  fields.insert_or_assign(name, make_record(std::move(nested)));
  return {};
}

inline Result<Value> Runtime::eval_node(const Expr::Patch &node, const Env &env)
{
  auto target = eval(*node.target, env);
  if (!target) { return target; }
  const auto *record = target->get_if<Record>();
  if (record == nullptr) { return std::unexpected(RuntimeError::message("patch target must be a record")); }

  RecordFields fields = *record->fields;
  for (const auto &field : node.fields) {
    if (field.spread) { return std::unexpected(RuntimeError::message("patch fields do not support record spread")); }
    if (auto patched = patch_field(fields, field.path, *field.value, env); !patched) {
      return std::unexpected(patched.error());
    }
  }
  return make_record(std::move(fields));
}

inline Result<Value> Runtime::eval_node(const Expr::FieldAccess &node, const Env &env)
{
  auto base = eval(*node.base, env);
  if (!base) { return base; }
  if (!base->holds<Record>()) {
    return std::unexpected(RuntimeError::message(fmt::format("field access on non-record {}", to_string(*base))));
  }
  if (const auto *field = record_field(*base, node.field); field != nullptr) { return *field; }
  return std::unexpected(RuntimeError::message(fmt::format("missing field {}", node.field)));
}

inline Result<Value> Runtime::eval_node(const Expr::Index &node, const Env &env)
{
  auto base = eval(*node.base, env);
  if (!base) { return base; }
  auto index = eval(*node.index, env);
  if (!index) { return index; }

  if (const auto *map = base->get_if<Map>(); map != nullptr) {
    if (!is_key(*index)) { return std::unexpected(RuntimeError::message("malformed map key")); }
    if (const auto found = map->entries->find(*index); found != map->entries->end()) { return found->second; }
    return std::unexpected(RuntimeError::message(fmt::format("missing map key {}", to_string(*index))));
  }

  const SharedValues *items = nullptr;
  if (const auto *list = base->get_if<List>(); list != nullptr) { items = &list->items; }
  if (const auto *tuple = base->get_if<Tuple>(); tuple != nullptr) { items = &tuple->items; }
  if (items == nullptr) {
    return std::unexpected(RuntimeError::message(fmt::format("index on unsupported value {}", to_string(*base))));
  }

  const auto *position = index->get_if<std::int64_t>();
  if (position == nullptr) { return std::unexpected(RuntimeError::message("index expects an Int")); }
  if (*position < 0 || static_cast<std::uint64_t>(*position) >= (*items)->size()) {
    return std::unexpected(RuntimeError::message(fmt::format("index {} out of bounds", *position)));
  }
  return (**items)[static_cast<std::size_t>(*position)];
}

inline Result<Value> Runtime::eval_node(const Expr::Match &node, const Env &env)
{
  auto scrutinee = eval(*node.scrutinee, env);
  if (!scrutinee) { return scrutinee; }

  for (const auto &arm : node.arms) {
    Bindings bindings;
    if (!match_pattern(*arm.pattern, *scrutinee, bindings)) { continue; }
    const auto arm_env = Environment::make(env, std::move(bindings));
    if (arm.guard) {
      auto guard = eval(*arm.guard, arm_env);
      if (!guard) { return guard; }
      if (const auto *passed = guard->get_if<bool>(); passed == nullptr || !*passed) { continue; }
    }
    return eval(*arm.body, arm_env);
  }
  return std::unexpected(RuntimeError::non_exhaustive_match());
}

inline Result<Value> Runtime::eval_node(const Expr::If &node, const Env &env)
{
  auto condition = eval(*node.condition, env);
  if (!condition) { return condition; }
  if (const auto *taken = condition->get_if<bool>(); taken != nullptr && *taken) { return eval(*node.then_branch, env); }
  return eval(*node.else_branch, env);
}

// the operators the evaluator handles without looking up an (op) definition
[[nodiscard]] inline Result<std::optional<Value>>
  eval_binary_builtin(std::string_view op, const Value &lhs, const Value &rhs)
{
  if (op == "==") { return make_bool(values_equal(lhs, rhs)); }
  if (op == "!=") { return make_bool(!values_equal(lhs, rhs)); }

  if (const auto *left = lhs.get_if<std::int64_t>(), *right = rhs.get_if<std::int64_t>();
      left != nullptr && right != nullptr) {
    const auto a = static_cast<std::uint64_t>(*left);
    const auto b = static_cast<std::uint64_t>(*right);
    if (op == "+") { return make_int(detail::wrapping(a + b)); }
    if (op == "-") { return make_int(detail::wrapping(a - b)); }
    if (op == "*") { return make_int(detail::wrapping(a * b)); }
    if (op == "/" || op == "%") {
      if (*right == 0) { return std::unexpected(RuntimeError::message("division by zero")); }
      if (*right == -1) { return make_int(op == "/" ? detail::wrapping(0 - a) : 0); }
      return make_int(op == "/" ? *left / *right : *left % *right);
    }
    if (op == "<") { return make_bool(*left < *right); }
    if (op == "<=") { return make_bool(*left <= *right); }
    if (op == ">") { return make_bool(*left > *right); }
    if (op == ">=") { return make_bool(*left >= *right); }
    return std::optional<Value>{};
  }

  if (const auto *left = lhs.get_if<double>(), *right = rhs.get_if<double>(); left != nullptr && right != nullptr) {
    if (op == "+") { return make_float(*left + *right); }
    if (op == "-") { return make_float(*left - *right); }
    if (op == "*") { return make_float(*left * *right); }
    if (op == "/") { return make_float(*left / *right); }
    if (op == "%") { return make_float(std::fmod(*left, *right)); }
    if (op == "<") { return make_bool(*left < *right); }
    if (op == "<=") { return make_bool(*left <= *right); }
    if (op == ">") { return make_bool(*left > *right); }
    if (op == ">=") { return make_bool(*left >= *right); }
    return std::optional<Value>{};
  }

  if (const auto *left = lhs.get_if<bool>(), *right = rhs.get_if<bool>(); left != nullptr && right != nullptr) {
    if (op == "&&") { return make_bool(*left && *right); }
    if (op == "||") { return make_bool(*left || *right); }
  }

  return std::optional<Value>{};
}

inline Result<Value> Runtime::eval_node(const Expr::Binary &node, const Env &env)
{
  auto left = eval(*node.left, env);
  if (!left) { return left; }
  auto right = eval(*node.right, env);
  if (!right) { return right; }

  auto builtin = eval_binary_builtin(node.op, *left, *right);
  if (!builtin) { return std::unexpected(builtin.error()); }
  if (*builtin) { return std::move(**builtin); }

  if (auto op = env->get(fmt::format("({})", node.op)); op) {
    return apply_all(std::move(*op), { std::move(*left), std::move(*right) });
  }
  return std::unexpected(RuntimeError::message(fmt::format("unsupported binary operator {}", node.op)));
}

inline Result<Value> Runtime::eval_plain_block(const std::vector<BlockItem> &items, const Env &env)
{
  const auto local = Environment::make(env);
  Value last = unit();
  for (const auto &item : items) {
    switch (item.kind) {
    case BlockItem::Kind::bind: {
      auto value = eval(*item.expr, local);
      if (!value) { return value; }
      Bindings bindings;
      if (!match_pattern(*item.pattern, *value, bindings)) {
        return std::unexpected(RuntimeError::message("pattern match failed in block binding"));
      }
      if (auto stored = local->set_all(std::move(bindings)); !stored) { return std::unexpected(stored.error()); }
      last = unit();
      break;
    }
    case BlockItem::Kind::expr: {
      auto value = eval(*item.expr, local);
      if (!value) { return value; }
      last = std::move(*value);
      break;
    }
    case BlockItem::Kind::filter:
    case BlockItem::Kind::yield:
    case BlockItem::Kind::recurse:
      return std::unexpected(RuntimeError::message("unsupported item in plain block"));
    }
  }
  return last;
}

inline Result<void>
  Runtime::generate_items(const std::vector<BlockItem> &items, std::size_t index, const Env &env, ValueVector &produced)
{
  for (; index < items.size(); ++index) {
    const auto &item = items[index];
    switch (item.kind) {
    case BlockItem::Kind::bind: {
      auto source = eval(*item.expr, env);
      if (!source) { return std::unexpected(source.error()); }
      const auto *list = source->get_if<List>();
      if (list == nullptr) {
        return std::unexpected(
          RuntimeError::message(fmt::format("generator binding expects a list, got {}", to_string(*source))));
      }
      for (const auto &element : *list->items) {
        Bindings bindings;
        if (!match_pattern(*item.pattern, element, bindings)) { continue; }
        if (auto rest = generate_items(items, index + 1, Environment::make(env, std::move(bindings)), produced); !rest) {
          return rest;
        }
      }
      return {};
    }
    case BlockItem::Kind::filter: {
      auto keep = eval(*item.expr, env);
      if (!keep) { return std::unexpected(keep.error()); }
      if (const auto *passed = keep->get_if<bool>(); passed == nullptr || !*passed) { return {}; }
      break;
    }
    case BlockItem::Kind::yield: {
      auto value = eval(*item.expr, env);
      if (!value) { return std::unexpected(value.error()); }
      produced.push_back(std::move(*value));
      break;
    }
    case BlockItem::Kind::expr: {
      if (auto value = eval(*item.expr, env); !value) { return std::unexpected(value.error()); }
      break;
    }
    case BlockItem::Kind::recurse:
      return std::unexpected(RuntimeError::message("recurse is not supported in generate blocks"));
    }
  }
  return {};
}

inline Result<Value> Runtime::eval_node(const Expr::Block &node, const Env &env)
{
  switch (node.kind) {
  case BlockKind::plain:
    return eval_plain_block(*node.items, env);
  case BlockKind::effect:
    return Value{ std::make_shared<const Effect>(Effect{ Effect::Block{ env, node.items } }) };
  case BlockKind::resource:
    return Value{ std::make_shared<const Resource>(Resource{ env, node.items }) };
  case BlockKind::generate:
    break;
  }

  ValueVector produced;
  if (auto generated = generate_items(*node.items, 0, env, produced); !generated) {
    return std::unexpected(generated.error());
  }

  // step -> seed -> result, the step receives the accumulator first
  return make_builtin("<generator>",
    2,
    [items = share(std::move(produced))](ValueVector args, Runtime &runtime) -> Result<Value> {
      Value accumulator = args[1];
      for (const auto &item : *items) {
        auto next = runtime.apply_all(args[0], { std::move(accumulator), item });
        if (!next) { return next; }
        accumulator = std::move(*next);
      }
      return accumulator;
    });
}

inline Result<Value> Runtime::apply(Value callee, Value arg)
{
  auto forced = force(std::move(callee));
  if (!forced) { return forced; }
  const Value &func = *forced;

  if (const auto *closure = func.get_if<ClosurePtr>(); closure != nullptr) {
    Bindings bindings;
    if (!match_pattern(*(*closure)->parameter, arg, bindings)) {
      return std::unexpected(RuntimeError::non_exhaustive_match());
    }
    return eval(*(*closure)->body, Environment::make((*closure)->env, std::move(bindings)));
  }

  if (const auto *builtin = func.get_if<Builtin>(); builtin != nullptr) {
    ValueVector args = *builtin->args;
    args.push_back(std::move(arg));
    if (args.size() >= builtin->impl->arity) { return builtin->impl->function(std::move(args), *this); }
    return Value{ Builtin{ builtin->impl, share(std::move(args)) } };
  }

  if (const auto *multi = func.get_if<MultiClause>(); multi != nullptr) { return apply_multi_clause(*multi, arg); }

  if (const auto *ctor = func.get_if<Constructor>(); ctor != nullptr) {
    ValueVector args = *ctor->args;
    args.push_back(std::move(arg));
    return make_constructor(ctor->name, std::move(args));
  }

  return std::unexpected(
    RuntimeError::message(fmt::format("attempted to call a non-function: {}", to_string(func))));
}

inline Result<Value> Runtime::apply_all(Value callee, ValueVector args)
{
  Value current = std::move(callee);
  for (auto &arg : args) {
    auto next = apply(std::move(current), std::move(arg));
    if (!next) { return next; }
    current = std::move(*next);
  }
  return current;
}

// Clauses are tried in declaration order. A clause that answers with a plain value
// ends the dispatch. Clauses that answer with another callable (curried equations)
// are kept together so the next argument keeps choosing among them.
inline Result<Value> Runtime::apply_multi_clause(const MultiClause &multi, const Value &arg)
{
  ValueVector continuations;
  for (const auto &clause : *multi.clauses) {
    auto callee = force(clause);
    if (!callee) { return callee; }

    Result<Value> result = unit();
    if (const auto *closure = callee->get_if<ClosurePtr>(); closure != nullptr) {
      Bindings bindings;
      if (!match_pattern(*(*closure)->parameter, arg, bindings)) { continue; }
      result = eval(*(*closure)->body, Environment::make((*closure)->env, std::move(bindings)));
      if (!result) { return result; }
    } else {
      result = apply(std::move(*callee), arg);
      if (!result) {
        if (result.error().is_non_exhaustive_match()) { continue; }
        return result;
      }
    }

    if (is_callable(*result)) {
      continuations.push_back(std::move(*result));
    } else if (continuations.empty()) {
      return result;
    }
  }

  if (continuations.empty()) { return std::unexpected(RuntimeError::non_exhaustive_match()); }
  if (continuations.size() == 1) { return std::move(continuations.front()); }
  return Value{ MultiClause{ share(std::move(continuations)) } };
}

inline Result<Value> Runtime::run_effect_value(const Value &value)
{
  if (auto ok = check_cancelled(); !ok) { return std::unexpected(ok.error()); }

  const auto *pending = value.get_if<EffectPtr>();
  if (pending == nullptr) {
    return std::unexpected(RuntimeError::message(fmt::format("expected Effect, got {}", to_string(value))));
  }
  const EffectPtr effect = *pending;

  if (const auto *block = std::get_if<Effect::Block>(&effect->body); block != nullptr) {
    return run_effect_block(block->env, *block->items);
  }
  return std::get<NativeEffect>(effect->body)(*this);
}

inline Result<Value> Runtime::run_effect_block(const Env &env, const std::vector<BlockItem> &items)
{
  const auto local = Environment::make(env);
  ValueVector releases;
  Result<Value> result = unit();

  for (std::size_t index = 0; index < items.size(); ++index) {
    if (context_->config.trace_effects) { spdlog::trace("effect step {} of {}", index + 1, items.size()); }
    if (auto ok = check_cancelled(); !ok) {
      result = std::unexpected(ok.error());
      break;
    }
    auto step = run_effect_item(items[index], local, releases);
    if (!step || index + 1 == items.size()) {
      result = std::move(step);
      if (!result) { break; }
    }
  }

  // releases run on every exit path, including cancellation
  auto released = release_all(std::move(releases));
  if (!released) {
    if (result) { return std::unexpected(released.error()); }
    spdlog::warn("release failed after an earlier failure: {}", describe(released.error()));
  }
  return result;
}

inline Result<Value> Runtime::run_effect_item(const BlockItem &item, const Env &local, ValueVector &releases)
{
  switch (item.kind) {
  case BlockItem::Kind::bind: {
    auto value = eval(*item.expr, local);
    if (!value) { return value; }

    Value bound;
    if (const auto *resource = value->get_if<ResourcePtr>(); resource != nullptr) {
      auto acquired = acquire_resource(**resource);
      if (!acquired) { return std::unexpected(acquired.error()); }
      releases.push_back(std::move(acquired->second));
      bound = std::move(acquired->first);
    } else if (value->holds<EffectPtr>()) {
      auto ran = run_effect_value(*value);
      if (!ran) { return ran; }
      bound = std::move(*ran);
    } else {
      bound = std::move(*value);
    }

    Bindings bindings;
    if (!match_pattern(*item.pattern, bound, bindings)) {
      return std::unexpected(RuntimeError::message("pattern match failed in effect binding"));
    }
    if (auto stored = local->set_all(std::move(bindings)); !stored) { return std::unexpected(stored.error()); }
    return unit();
  }
  case BlockItem::Kind::expr: {
    auto value = eval(*item.expr, local);
    if (!value) { return value; }
    if (!value->holds<EffectPtr>()) {
      return std::unexpected(
        RuntimeError::message(fmt::format("expected Effect in effect block, got {}", to_string(*value))));
    }
    return run_effect_value(*value);
  }
  case BlockItem::Kind::filter:
  case BlockItem::Kind::yield:
  case BlockItem::Kind::recurse:
    break;
  }
  return std::unexpected(RuntimeError::message("unsupported item in effect block"));
}

// Runs the items before the first yield. Returns the yielded value and the effect
// that releases it.
inline Result<std::pair<Value, Value>> Runtime::acquire_resource(const Resource &resource)
{
  const auto local = Environment::make(resource.env);
  const auto &items = *resource.items;
  ValueVector nested;

  const auto unwind = [&](RuntimeError error) -> Result<std::pair<Value, Value>> {
    if (auto released = release_all(std::move(nested)); !released) {
      spdlog::warn("release failed while unwinding a resource: {}", describe(released.error()));
    }
    return std::unexpected(std::move(error));
  };

  for (std::size_t index = 0; index < items.size(); ++index) {
    const auto &item = items[index];
    if (item.kind != BlockItem::Kind::yield) {
      if (auto step = run_effect_item(item, local, nested); !step) { return unwind(step.error()); }
      continue;
    }

    auto value = eval(*item.expr, local);
    if (!value) { return unwind(value.error()); }

    auto release_items = std::make_shared<const std::vector<BlockItem>>(items.begin() + static_cast<std::ptrdiff_t>(index) + 1, items.end());
    Value release = make_effect([local, release_items, nested](Runtime &runtime) -> Result<Value> {
      auto result = runtime.run_effect_block(local, *release_items);
      auto released = runtime.release_all(nested);
      if (result && !released) { return std::unexpected(released.error()); }
      return result;
    });
    return std::pair{ std::move(*value), std::move(release) };
  }

  return unwind(RuntimeError::message("resource block missing yield"));
}

inline Result<void> Runtime::release_all(ValueVector releases)
{
  return uncancelable([&]() -> Result<void> {
    std::optional<RuntimeError> first_failure;
    for (auto release = releases.rbegin(); release != releases.rend(); ++release) {
      if (auto result = run_effect_value(*release); !result) {
        if (!first_failure) {
          first_failure = result.error();
        } else {
          spdlog::warn("release failed: {}", describe(result.error()));
        }
      }
    }
    if (first_failure) { return std::unexpected(std::move(*first_failure)); }
    return {};
  });
}

}// namespace effect_expr

#endif
