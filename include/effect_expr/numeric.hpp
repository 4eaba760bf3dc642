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

#ifndef EFFECT_EXPR_NUMERIC_HPP
#define EFFECT_EXPR_NUMERIC_HPP

#include "callable.hpp"
#include "runtime.hpp"
#include "utility.hpp"
#include "value.hpp"

#include <fmt/format.h>
#include <gmpxx.h>

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

// Arbitrary precision numbers backed by GMP: BigInt (mpz), Rational (mpq) and a
// fixed scale Decimal (unscaled mpz plus a count of fractional digits).

namespace effect_expr {

[[nodiscard]] inline std::optional<mpz_class> parse_bigint(std::string_view text)
{
  std::string_view digits = text;
  if (!digits.empty() && digits.front() == '-') { digits.remove_prefix(1); }
  if (digits.empty() || !std::ranges::all_of(digits, [](char ch) { return ch >= '0' && ch <= '9'; })) {
    return std::nullopt;
  }
  return mpz_class{ std::string{ text }, 10 };
}

[[nodiscard]] inline std::optional<DecimalNumber> parse_decimal(std::string_view text)
{
  const bool negative = !text.empty() && text.front() == '-';
  if (negative) { text.remove_prefix(1); }

  const auto point = text.find('.');
  const std::string_view whole = text.substr(0, point);
  const std::string_view fraction = point == std::string_view::npos ? std::string_view{} : text.substr(point + 1);
  if (point != std::string_view::npos && fraction.empty()) { return std::nullopt; }

  const auto is_digits = [](std::string_view part) {
    return std::ranges::all_of(part, [](char ch) { return ch >= '0' && ch <= '9'; });
  };
  if (whole.empty() || !is_digits(whole) || !is_digits(fraction)) { return std::nullopt; }

  mpz_class unscaled{ fmt::format("{}{}{}", negative ? "-" : "", whole, fraction), 10 };
  return DecimalNumber{ std::move(unscaled), static_cast<std::uint32_t>(fraction.size()) };
}

[[nodiscard]] inline DecimalNumber add_decimals(const DecimalNumber &lhs, const DecimalNumber &rhs)
{
  const auto scale = std::max(lhs.scale, rhs.scale);
  return DecimalNumber{ lhs.unscaled * pow10(scale - lhs.scale) + rhs.unscaled * pow10(scale - rhs.scale), scale };
}

[[nodiscard]] inline Value bigint_record()
{
  RecordFields fields;
  fields.emplace("fromInt", make_builtin("bigint.fromInt", 1, [](ValueVector args, Runtime &) -> Result<Value> {
    auto value = value_as<std::int64_t>(args[0], "bigint.fromInt");
    if (!value) { return std::unexpected(value.error()); }
    // mpz_class has no int64_t constructor on every platform, go through text
    return make_bigint(mpz_class{ std::to_string(*value), 10 });
  }));
  fields.emplace("fromText", make_builtin("bigint.fromText", 1, [](ValueVector args, Runtime &) -> Result<Value> {
    auto text = value_as<std::string>(args[0], "bigint.fromText");
    if (!text) { return std::unexpected(text.error()); }
    auto parsed = parse_bigint(*text);
    if (!parsed) { return std::unexpected(RuntimeError::message(fmt::format("invalid bigint literal: {}", *text))); }
    return make_bigint(std::move(*parsed));
  }));
  fields.emplace("add", make_builtin("bigint.add", 2, [](ValueVector args, Runtime &) -> Result<Value> {
    auto lhs = value_as<BigInt>(args[0], "bigint.add");
    if (!lhs) { return std::unexpected(lhs.error()); }
    auto rhs = value_as<BigInt>(args[1], "bigint.add");
    if (!rhs) { return std::unexpected(rhs.error()); }
    return make_bigint(*lhs->value + *rhs->value);
  }));
  fields.emplace("mul", make_builtin("bigint.mul", 2, [](ValueVector args, Runtime &) -> Result<Value> {
    auto lhs = value_as<BigInt>(args[0], "bigint.mul");
    if (!lhs) { return std::unexpected(lhs.error()); }
    auto rhs = value_as<BigInt>(args[1], "bigint.mul");
    if (!rhs) { return std::unexpected(rhs.error()); }
    return make_bigint(*lhs->value * *rhs->value);
  }));
  fields.emplace("toText", make_builtin("bigint.toText", 1, [](ValueVector args, Runtime &) -> Result<Value> {
    auto value = value_as<BigInt>(args[0], "bigint.toText");
    if (!value) { return std::unexpected(value.error()); }
    return make_text(value->value->get_str());
  }));
  return make_record(std::move(fields));
}

[[nodiscard]] inline Value rational_record()
{
  RecordFields fields;
  fields.emplace("fromInts", make_builtin("rational.fromInts", 2, [](ValueVector args, Runtime &) -> Result<Value> {
    auto numerator = value_as<std::int64_t>(args[0], "rational.fromInts");
    if (!numerator) { return std::unexpected(numerator.error()); }
    auto denominator = value_as<std::int64_t>(args[1], "rational.fromInts");
    if (!denominator) { return std::unexpected(denominator.error()); }
    if (*denominator == 0) { return std::unexpected(RuntimeError::message("rational.fromInts: zero denominator")); }
    return make_rational(
      mpq_class{ mpz_class{ std::to_string(*numerator), 10 }, mpz_class{ std::to_string(*denominator), 10 } });
  }));
  fields.emplace("add", make_builtin("rational.add", 2, [](ValueVector args, Runtime &) -> Result<Value> {
    auto lhs = value_as<Rational>(args[0], "rational.add");
    if (!lhs) { return std::unexpected(lhs.error()); }
    auto rhs = value_as<Rational>(args[1], "rational.add");
    if (!rhs) { return std::unexpected(rhs.error()); }
    return make_rational(*lhs->value + *rhs->value);
  }));
  return make_record(std::move(fields));
}

[[nodiscard]] inline Value decimal_record()
{
  RecordFields fields;
  fields.emplace("fromText", make_builtin("decimal.fromText", 1, [](ValueVector args, Runtime &) -> Result<Value> {
    auto text = value_as<std::string>(args[0], "decimal.fromText");
    if (!text) { return std::unexpected(text.error()); }
    auto parsed = parse_decimal(*text);
    if (!parsed) { return std::unexpected(RuntimeError::message(fmt::format("invalid decimal literal: {}", *text))); }
    return make_decimal(std::move(parsed->unscaled), parsed->scale);
  }));
  fields.emplace("add", make_builtin("decimal.add", 2, [](ValueVector args, Runtime &) -> Result<Value> {
    auto lhs = value_as<Decimal>(args[0], "decimal.add");
    if (!lhs) { return std::unexpected(lhs.error()); }
    auto rhs = value_as<Decimal>(args[1], "decimal.add");
    if (!rhs) { return std::unexpected(rhs.error()); }
    auto sum = add_decimals(*lhs->value, *rhs->value);
    return make_decimal(std::move(sum.unscaled), sum.scale);
  }));
  fields.emplace("toText", make_builtin("decimal.toText", 1, [](ValueVector args, Runtime &) -> Result<Value> {
    auto value = value_as<Decimal>(args[0], "decimal.toText");
    if (!value) { return std::unexpected(value.error()); }
    return make_text(decimal_text(*value->value));
  }));
  return make_record(std::move(fields));
}

}// namespace effect_expr

#endif
