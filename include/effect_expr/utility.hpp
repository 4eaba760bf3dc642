#ifndef EFFECT_EXPR_UTILITY_HPP
#define EFFECT_EXPR_UTILITY_HPP

#include "callable.hpp"
#include "value.hpp"

#include <fmt/format.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace effect_expr {

inline std::string to_string(const Value &input, bool annotate = false);

namespace detail {
  inline std::string annotation(bool annotate, std::string_view kind)
  {
    if (annotate) { return fmt::format("[{}] ", kind); }
    return {};
  }

  inline std::string join(const auto &values, std::string_view separator)
  {
    std::string result;
    bool first = true;
    for (const Value &value : values) {
      if (!first) { result += separator; }
      first = false;
      result += to_string(value, false);
    }
    return result;
  }
}// namespace detail

inline std::string to_string(const std::monostate &, bool annotate)
{
  return detail::annotation(annotate, "Unit") + "Unit";
}

inline std::string to_string(const bool input, bool annotate)
{
  std::string result = detail::annotation(annotate, "Bool");
  if (input) {
    return result + "True";
  } else {
    return result + "False";
  }
}

inline std::string to_string(const std::int64_t input, bool annotate)
{
  return detail::annotation(annotate, "Int") + fmt::format("{}", input);
}

inline std::string to_string(const double input, bool annotate)
{
  return detail::annotation(annotate, "Float") + fmt::format("{}", input);
}

inline std::string to_string(const std::string &input, bool annotate)
{
  return detail::annotation(annotate, "Text") + input;
}

inline std::string to_string(const Bytes &input, bool annotate)
{
  return detail::annotation(annotate, "Bytes") + fmt::format("<bytes:{}>", input.data->size());
}

inline std::string to_string(const DateTime &input, bool annotate)
{
  return detail::annotation(annotate, "DateTime") + input.text;
}

inline std::string to_string(const BigInt &input, bool annotate)
{
  return detail::annotation(annotate, "BigInt") + input.value->get_str();
}

inline std::string to_string(const Rational &input, bool annotate)
{
  return detail::annotation(annotate, "Rational") + input.value->get_str();
}

inline std::string decimal_text(const DecimalNumber &number)
{
  const bool negative = sgn(number.unscaled) < 0;
  const mpz_class magnitude = abs(number.unscaled);
  std::string digits = magnitude.get_str();
  if (number.scale > 0) {
    if (digits.size() <= number.scale) { digits.insert(0, number.scale - digits.size() + 1, '0'); }
    digits.insert(digits.size() - number.scale, 1, '.');
  }
  if (negative) { digits.insert(0, 1, '-'); }
  return digits;
}

inline std::string to_string(const Decimal &input, bool annotate)
{
  return detail::annotation(annotate, "Decimal") + decimal_text(*input.value);
}

inline std::string to_string(const Regex &input, bool annotate)
{
  return detail::annotation(annotate, "Regex") + fmt::format("<regex:{}>", input.compiled->source);
}

inline std::string to_string(const List &list, bool annotate)
{
  return detail::annotation(annotate, "List") + "[" + detail::join(*list.items, ", ") + "]";
}

inline std::string to_string(const Tuple &tuple, bool annotate)
{
  return detail::annotation(annotate, "Tuple") + "(" + detail::join(*tuple.items, ", ") + ")";
}

inline std::string to_string(const Record &record, bool annotate)
{
  std::string result = detail::annotation(annotate, "Record") + "{";
  bool first = true;
  for (const auto &[name, value] : *record.fields) {
    if (!first) { result += ", "; }
    first = false;
    result += fmt::format("{}: {}", name, to_string(value, false));
  }
  return result + "}";
}

inline std::string to_string(const Map &map, bool annotate)
{
  return detail::annotation(annotate, "Map") + fmt::format("<map:{}>", map.entries->size());
}

inline std::string to_string(const Set &set, bool annotate)
{
  return detail::annotation(annotate, "Set") + fmt::format("<set:{}>", set.members->size());
}

inline std::string to_string(const Queue &queue, bool annotate)
{
  return detail::annotation(annotate, "Queue") + fmt::format("<queue:{}>", queue.items->size());
}

inline std::string to_string(const Deque &deque, bool annotate)
{
  return detail::annotation(annotate, "Deque") + fmt::format("<deque:{}>", deque.items->size());
}

inline std::string to_string(const Heap &heap, bool annotate)
{
  return detail::annotation(annotate, "Heap") + fmt::format("<heap:{}>", heap.entries->size());
}

inline std::string to_string(const Constructor &ctor, bool annotate)
{
  std::string result = detail::annotation(annotate, "Constructor") + ctor.name;
  for (const auto &arg : *ctor.args) {
    const auto *nested = arg.get_if<Constructor>();
    if (nested != nullptr && !nested->args->empty()) {
      result += fmt::format(" ({})", to_string(arg, false));
    } else {
      result += fmt::format(" {}", to_string(arg, false));
    }
  }
  return result;
}

inline std::string to_string(const ClosurePtr &, bool) { return "<closure>"; }

inline std::string to_string(const Builtin &builtin, bool) { return fmt::format("<builtin:{}>", builtin.impl->name); }

inline std::string to_string(const MultiClause &, bool) { return "<multi-clause>"; }

inline std::string to_string(const ThunkPtr &, bool) { return "<thunk>"; }

inline std::string to_string(const EffectPtr &, bool) { return "<effect>"; }

inline std::string to_string(const ResourcePtr &, bool) { return "<resource>"; }

inline std::string to_string(const ChannelSendPtr &, bool) { return "<channel:send>"; }

inline std::string to_string(const ChannelRecvPtr &, bool) { return "<channel:recv>"; }

inline std::string to_string(const NativeHandlePtr &handle, bool) { return fmt::format("<handle:{}>", handle->kind()); }

inline std::string to_string(const Value &input, bool annotate)
{
  return std::visit([&](const auto &value) { return to_string(value, annotate); }, input.value);
}

inline std::string describe(const RuntimeError &error)
{
  switch (error.kind) {
  case RuntimeError::Kind::cancelled:
    return "execution cancelled";
  case RuntimeError::Kind::message:
    return error.text;
  case RuntimeError::Kind::error:
    return fmt::format("runtime error: {}", to_string(error.payload));
  }
  return error.text;
}

}// namespace effect_expr

#endif
