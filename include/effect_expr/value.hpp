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

#ifndef EFFECT_EXPR_VALUE_HPP
#define EFFECT_EXPR_VALUE_HPP

#include <gmpxx.h>

#include <algorithm>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <regex>
#include <set>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

/// Goals
// * every value is immutable once built, "mutation" builds a new value
// * values are cheap to copy: aggregates share storage through shared_ptr<const ...>
// * the set of value kinds is closed, every consumer visits all of them

namespace effect_expr {

inline constexpr int effect_expr_version_major{ 0 };
inline constexpr int effect_expr_version_minor{ 1 };
inline constexpr int effect_expr_version_patch{ 0 };

struct Value;
struct Closure;
struct BuiltinImpl;
struct Effect;
struct Resource;
struct ChannelSend;
struct ChannelRecv;
struct NativeHandle;
class Thunk;

// ordering for map keys, set members and heap entries, see is_key
struct KeyOrder
{
  [[nodiscard]] bool operator()(const Value &lhs, const Value &rhs) const;
};

using ValueVector = std::vector<Value>;
using SharedValues = std::shared_ptr<const ValueVector>;

struct Bytes
{
  std::shared_ptr<const std::vector<std::uint8_t>> data;
};

struct DateTime
{
  std::string text;
};

struct BigInt
{
  std::shared_ptr<const mpz_class> value;
};

struct Rational
{
  std::shared_ptr<const mpq_class> value;
};

struct DecimalNumber
{
  mpz_class unscaled;
  std::uint32_t scale{ 0 };
};

struct Decimal
{
  std::shared_ptr<const DecimalNumber> value;
};

struct CompiledRegex
{
  std::string source;
  std::string flags;
  std::regex regex;
};

struct Regex
{
  std::shared_ptr<const CompiledRegex> compiled;
};

struct List
{
  SharedValues items;
};

struct Tuple
{
  SharedValues items;
};

using RecordFields = std::map<std::string, Value, std::less<>>;
struct Record
{
  std::shared_ptr<const RecordFields> fields;
};

using MapEntries = std::map<Value, Value, KeyOrder>;
struct Map
{
  std::shared_ptr<const MapEntries> entries;
};

using SetMembers = std::set<Value, KeyOrder>;
struct Set
{
  std::shared_ptr<const SetMembers> members;
};

struct Queue
{
  std::shared_ptr<const std::deque<Value>> items;
};

struct Deque
{
  std::shared_ptr<const std::deque<Value>> items;
};

// a min-heap kept as a sorted multiset, begin() is the minimum
using HeapEntries = std::multiset<Value, KeyOrder>;
struct Heap
{
  std::shared_ptr<const HeapEntries> entries;
};

struct Constructor
{
  std::string name;
  SharedValues args;
};

struct Builtin
{
  std::shared_ptr<const BuiltinImpl> impl;
  SharedValues args;
};

struct MultiClause
{
  SharedValues clauses;
};

using ClosurePtr = std::shared_ptr<const Closure>;
using ThunkPtr = std::shared_ptr<Thunk>;
using EffectPtr = std::shared_ptr<const Effect>;
using ResourcePtr = std::shared_ptr<const Resource>;
using ChannelSendPtr = std::shared_ptr<ChannelSend>;
using ChannelRecvPtr = std::shared_ptr<ChannelRecv>;
using NativeHandlePtr = std::shared_ptr<NativeHandle>;

struct Value
{
  using variant_type = std::variant<std::monostate,
    bool,
    std::int64_t,
    double,
    std::string,
    Bytes,
    DateTime,
    BigInt,
    Rational,
    Decimal,
    Regex,
    List,
    Tuple,
    Record,
    Map,
    Set,
    Queue,
    Deque,
    Heap,
    Constructor,
    ClosurePtr,
    Builtin,
    MultiClause,
    ThunkPtr,
    EffectPtr,
    ResourcePtr,
    ChannelSendPtr,
    ChannelRecvPtr,
    NativeHandlePtr>;

  variant_type value;

  template<typename Type> [[nodiscard]] const Type *get_if() const noexcept { return std::get_if<Type>(&value); }
  template<typename Type> [[nodiscard]] bool holds() const noexcept { return std::holds_alternative<Type>(value); }
};

// an opaque runtime resource (file, socket, server...) shared by reference count
struct NativeHandle
{
  virtual ~NativeHandle() = default;
  [[nodiscard]] virtual std::string_view kind() const noexcept = 0;
};

struct RuntimeError
{
  enum struct Kind : std::uint8_t { error, cancelled, message };

  Kind kind{ Kind::message };
  Value payload{};
  std::string text;

  static constexpr std::string_view non_exhaustive_match_text{ "non-exhaustive match" };

  [[nodiscard]] static RuntimeError error(Value payload)
  {
    return RuntimeError{ Kind::error, std::move(payload), {} };
  }
  [[nodiscard]] static RuntimeError cancelled() { return RuntimeError{ Kind::cancelled, {}, {} }; }
  [[nodiscard]] static RuntimeError message(std::string text)
  {
    return RuntimeError{ Kind::message, {}, std::move(text) };
  }
  [[nodiscard]] static RuntimeError non_exhaustive_match() { return message(std::string{ non_exhaustive_match_text }); }

  [[nodiscard]] bool is_error() const noexcept { return kind == Kind::error; }
  [[nodiscard]] bool is_cancelled() const noexcept { return kind == Kind::cancelled; }
  [[nodiscard]] bool is_message() const noexcept { return kind == Kind::message; }
  [[nodiscard]] bool is_non_exhaustive_match() const noexcept
  {
    return kind == Kind::message && text == non_exhaustive_match_text;
  }
};

template<typename Type> using Result = std::expected<Type, RuntimeError>;

[[nodiscard]] inline Value unit() { return Value{ std::monostate{} }; }
[[nodiscard]] inline Value make_bool(bool value) { return Value{ value }; }
[[nodiscard]] inline Value make_int(std::int64_t value) { return Value{ value }; }
[[nodiscard]] inline Value make_float(double value) { return Value{ value }; }
[[nodiscard]] inline Value make_text(std::string text) { return Value{ std::move(text) }; }

[[nodiscard]] inline SharedValues share(ValueVector values)
{
  return std::make_shared<const ValueVector>(std::move(values));
}

[[nodiscard]] inline Value make_list(ValueVector items) { return Value{ List{ share(std::move(items)) } }; }
[[nodiscard]] inline Value make_tuple(ValueVector items) { return Value{ Tuple{ share(std::move(items)) } }; }

[[nodiscard]] inline Value make_record(RecordFields fields)
{
  return Value{ Record{ std::make_shared<const RecordFields>(std::move(fields)) } };
}

[[nodiscard]] inline Value make_constructor(std::string name, ValueVector args = {})
{
  return Value{ Constructor{ std::move(name), share(std::move(args)) } };
}

[[nodiscard]] inline Value make_some(Value value) { return make_constructor("Some", { std::move(value) }); }
[[nodiscard]] inline Value make_none() { return make_constructor("None"); }
[[nodiscard]] inline Value make_ok(Value value) { return make_constructor("Ok", { std::move(value) }); }
[[nodiscard]] inline Value make_err(Value value) { return make_constructor("Err", { std::move(value) }); }
[[nodiscard]] inline Value make_closed() { return make_constructor("Closed"); }

[[nodiscard]] inline Value make_bigint(mpz_class value)
{
  return Value{ BigInt{ std::make_shared<const mpz_class>(std::move(value)) } };
}

[[nodiscard]] inline Value make_rational(mpq_class value)
{
  value.canonicalize();
  return Value{ Rational{ std::make_shared<const mpq_class>(std::move(value)) } };
}

[[nodiscard]] inline Value make_decimal(mpz_class unscaled, std::uint32_t scale)
{
  return Value{ Decimal{ std::make_shared<const DecimalNumber>(DecimalNumber{ std::move(unscaled), scale }) } };
}

[[nodiscard]] inline const Value *record_field(const Value &value, std::string_view name)
{
  const auto *record = value.get_if<Record>();
  if (record == nullptr) { return nullptr; }
  const auto found = record->fields->find(name);
  if (found == record->fields->end()) { return nullptr; }
  return &found->second;
}

[[nodiscard]] inline bool is_constructor(const Value &value, std::string_view name)
{
  const auto *ctor = value.get_if<Constructor>();
  return ctor != nullptr && ctor->name == name;
}

[[nodiscard]] inline bool is_callable(const Value &value)
{
  return value.holds<ClosurePtr>() || value.holds<Builtin>() || value.holds<MultiClause>();
}

// the value kinds accepted as map keys, set members and heap entries
[[nodiscard]] inline bool is_key(const Value &value)
{
  return std::visit(
    []<typename Type>(const Type &) {
      return std::is_same_v<Type, std::monostate> || std::is_same_v<Type, bool> || std::is_same_v<Type, std::int64_t>
             || std::is_same_v<Type, double> || std::is_same_v<Type, std::string> || std::is_same_v<Type, Bytes>
             || std::is_same_v<Type, DateTime> || std::is_same_v<Type, BigInt> || std::is_same_v<Type, Rational>
             || std::is_same_v<Type, Decimal>;
    },
    value.value);
}

[[nodiscard]] inline mpz_class pow10(std::uint32_t exponent)
{
  mpz_class result;
  mpz_ui_pow_ui(result.get_mpz_t(), 10, exponent);
  return result;
}

[[nodiscard]] inline int compare_decimals(const DecimalNumber &lhs, const DecimalNumber &rhs)
{
  if (lhs.scale == rhs.scale) { return cmp(lhs.unscaled, rhs.unscaled); }
  if (lhs.scale < rhs.scale) {
    const mpz_class scaled = lhs.unscaled * pow10(rhs.scale - lhs.scale);
    return cmp(scaled, rhs.unscaled);
  }
  const mpz_class scaled = rhs.unscaled * pow10(lhs.scale - rhs.scale);
  return cmp(lhs.unscaled, scaled);
}

namespace detail {
  [[nodiscard]] inline std::strong_ordering to_ordering(int result) noexcept
  {
    if (result < 0) { return std::strong_ordering::less; }
    if (result > 0) { return std::strong_ordering::greater; }
    return std::strong_ordering::equal;
  }

  [[nodiscard]] inline std::strong_ordering compare_keys(const Value &lhs, const Value &rhs)
  {
    if (lhs.value.index() != rhs.value.index()) { return lhs.value.index() <=> rhs.value.index(); }

    return std::visit(
      [&]<typename Type>(const Type &left) -> std::strong_ordering {
        const auto &right = std::get<Type>(rhs.value);
        if constexpr (std::is_same_v<Type, std::monostate>) {
          return std::strong_ordering::equal;
        } else if constexpr (std::is_same_v<Type, bool> || std::is_same_v<Type, std::int64_t>
                             || std::is_same_v<Type, std::string>) {
          return left <=> right;
        } else if constexpr (std::is_same_v<Type, double>) {
          return std::strong_order(left, right);
        } else if constexpr (std::is_same_v<Type, DateTime>) {
          return left.text <=> right.text;
        } else if constexpr (std::is_same_v<Type, Bytes>) {
          return *left.data <=> *right.data;
        } else if constexpr (std::is_same_v<Type, BigInt> || std::is_same_v<Type, Rational>) {
          return to_ordering(cmp(*left.value, *right.value));
        } else if constexpr (std::is_same_v<Type, Decimal>) {
          return to_ordering(compare_decimals(*left.value, *right.value));
        } else {
          // not a key kind, insertion is rejected before it gets here
          return std::strong_ordering::equal;
        }
      },
      lhs.value);
  }
}// namespace detail

inline bool KeyOrder::operator()(const Value &lhs, const Value &rhs) const { return detail::compare_keys(lhs, rhs) < 0; }

[[nodiscard]] inline bool values_equal(const Value &lhs, const Value &rhs);

namespace detail {
  [[nodiscard]] inline bool sequences_equal(const auto &lhs, const auto &rhs)
  {
    return std::ranges::equal(lhs, rhs, [](const Value &left, const Value &right) { return values_equal(left, right); });
  }
}// namespace detail

[[nodiscard]] inline bool values_equal(const Value &lhs, const Value &rhs)
{
  if (lhs.value.index() != rhs.value.index()) { return false; }

  return std::visit(
    [&]<typename Type>(const Type &left) -> bool {
      const auto &right = std::get<Type>(rhs.value);
      if constexpr (std::is_same_v<Type, std::monostate>) {
        return true;
      } else if constexpr (std::is_same_v<Type, bool> || std::is_same_v<Type, std::int64_t>
                           || std::is_same_v<Type, double> || std::is_same_v<Type, std::string>) {
        return left == right;
      } else if constexpr (std::is_same_v<Type, DateTime>) {
        return left.text == right.text;
      } else if constexpr (std::is_same_v<Type, Bytes>) {
        return *left.data == *right.data;
      } else if constexpr (std::is_same_v<Type, BigInt> || std::is_same_v<Type, Rational>) {
        return *left.value == *right.value;
      } else if constexpr (std::is_same_v<Type, Decimal>) {
        return compare_decimals(*left.value, *right.value) == 0;
      } else if constexpr (std::is_same_v<Type, Regex>) {
        return left.compiled->source == right.compiled->source && left.compiled->flags == right.compiled->flags;
      } else if constexpr (std::is_same_v<Type, List> || std::is_same_v<Type, Tuple>) {
        return detail::sequences_equal(*left.items, *right.items);
      } else if constexpr (std::is_same_v<Type, Queue> || std::is_same_v<Type, Deque>) {
        return detail::sequences_equal(*left.items, *right.items);
      } else if constexpr (std::is_same_v<Type, Heap>) {
        return detail::sequences_equal(*left.entries, *right.entries);
      } else if constexpr (std::is_same_v<Type, Record>) {
        return std::ranges::equal(*left.fields, *right.fields, [](const auto &lhs_field, const auto &rhs_field) {
          return lhs_field.first == rhs_field.first && values_equal(lhs_field.second, rhs_field.second);
        });
      } else if constexpr (std::is_same_v<Type, Map>) {
        if (left.entries->size() != right.entries->size()) { return false; }
        return std::ranges::all_of(*left.entries, [&](const auto &entry) {
          const auto found = right.entries->find(entry.first);
          return found != right.entries->end() && values_equal(entry.second, found->second);
        });
      } else if constexpr (std::is_same_v<Type, Set>) {
        if (left.members->size() != right.members->size()) { return false; }
        return std::ranges::all_of(*left.members, [&](const Value &member) { return right.members->contains(member); });
      } else if constexpr (std::is_same_v<Type, Constructor>) {
        return left.name == right.name && detail::sequences_equal(*left.args, *right.args);
      } else if constexpr (std::is_same_v<Type, Builtin>) {
        return left.impl == right.impl && detail::sequences_equal(*left.args, *right.args);
      } else if constexpr (std::is_same_v<Type, MultiClause>) {
        return left.clauses == right.clauses;
      } else {
        // closures, thunks, effects, resources and handles compare by identity
        return left == right;
      }
    },
    lhs.value);
}

}// namespace effect_expr

#endif
