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

#ifndef EFFECT_EXPR_READER_HPP
#define EFFECT_EXPR_READER_HPP

#include "expr.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <iterator>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Reader for the s-expression rendering of lowered programs. Reading happens in
// two passes: text to a tree of atoms and lists, then the tree to Expr/Pattern nodes.
//
//   program := (def NAME expr) | (module NAME (def NAME expr)...)
//   expr    := NUMBER | "text" | true | false | NAME
//            | (fn PATTERN expr) | (app F A) | (call F A...) | (F A...)
//            | (list ITEM...) | (tuple expr...) | (record FIELD...) | (patch expr FIELD...)
//            | (. expr NAME) | (index expr expr) | (if expr expr expr)
//            | (match expr (PATTERN expr)... (PATTERN when guard expr)...)
//            | (OP expr expr) | (binary OP expr expr) | (text PART...)
//            | (sigil TAG "body" "flags") | (datetime "text")
//            | (do ITEM...) | (effect ITEM...) | (generate ITEM...) | (resource ITEM...)
//   ITEM    := (<- PATTERN expr) | (yield expr) | (filter expr) | (recurse expr) | expr
//   pattern := _ | name | Ctor | literal | (Ctor PATTERN...) | (tuple PATTERN...)
//            | (list PATTERN... & PATTERN) | (record (PATH PATTERN)...)

namespace effect_expr {

struct ReadError
{
  std::string expected;
  std::string got;
};

template<typename Type> using ReadResult = std::expected<Type, ReadError>;

[[nodiscard]] inline std::string describe(const ReadError &error)
{
  return fmt::format("read error: expected {}, got {}", error.expected, error.got);
}

struct Token
{
  enum struct Kind : std::uint8_t { end, open, close, text, unterminated_text, atom };

  Kind kind{ Kind::end };
  std::string_view parsed;
  std::string_view remaining;
};

namespace detail {
  [[nodiscard]] constexpr bool is_blank(char ch) { return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r'; }

  // characters that end an atom
  [[nodiscard]] constexpr bool is_delimiter(char ch)
  {
    return is_blank(ch) || ch == '(' || ch == ')' || ch == '"' || ch == ';';
  }

  // whitespace, and comments running from ';' to the end of the line
  [[nodiscard]] constexpr std::string_view skip_blank(std::string_view input)
  {
    std::size_t position = 0;
    while (position < input.size()) {
      if (is_blank(input[position])) {
        ++position;
      } else if (input[position] == ';') {
        while (position < input.size() && input[position] != '\n') { ++position; }
      } else {
        break;
      }
    }
    return input.substr(position);
  }

  // size of the quoted literal at the front of input, both quotes included; 0 when it never closes
  [[nodiscard]] constexpr std::size_t quoted_size(std::string_view input)
  {
    for (std::size_t position = 1; position < input.size(); ++position) {
      if (input[position] == '\\') {
        ++position;
      } else if (input[position] == '"') {
        return position + 1;
      }
    }
    return 0;
  }
}// namespace detail

[[nodiscard]] constexpr Token next_token(std::string_view input)
{
  input = detail::skip_blank(input);
  const auto take = [input](Token::Kind kind, std::size_t size) {
    return Token{ kind, input.substr(0, size), detail::skip_blank(input.substr(size)) };
  };

  if (input.empty()) { return Token{}; }

  switch (input.front()) {
  case '(':
    return take(Token::Kind::open, 1);
  case ')':
    return take(Token::Kind::close, 1);
  case '"':
    if (const auto size = detail::quoted_size(input); size != 0) { return take(Token::Kind::text, size); }
    return take(Token::Kind::unterminated_text, input.size());
  default:
    break;
  }

  std::size_t size = 0;
  while (size < input.size() && !detail::is_delimiter(input[size])) { ++size; }
  return take(Token::Kind::atom, size);
}

// first pass output
struct Syntax
{
  enum struct Kind : std::uint8_t { atom, text, list };

  Kind kind{ Kind::atom };
  std::string text;
  std::vector<Syntax> items;

  [[nodiscard]] bool is_atom(std::string_view name) const { return kind == Kind::atom && text == name; }
  [[nodiscard]] bool is_list() const { return kind == Kind::list; }
};

[[nodiscard]] inline std::string to_string(const Syntax &syntax)
{
  switch (syntax.kind) {
  case Syntax::Kind::atom:
    return syntax.text;
  case Syntax::Kind::text:
    return fmt::format("\"{}\"", syntax.text);
  case Syntax::Kind::list:
    break;
  }
  std::string result = "(";
  for (const auto &item : syntax.items) {
    if (result.size() > 1) { result += ' '; }
    result += to_string(item);
  }
  return result + ")";
}

// a text token without its quotes, with escapes resolved
[[nodiscard]] inline std::string unquote(std::string_view token)
{
  std::string result;
  bool in_escape = false;
  for (const char ch : token.substr(1, token.size() - 2)) {
    if (!in_escape && ch == '\\') {
      in_escape = true;
      continue;
    }
    if (in_escape && ch == 'n') {
      result += '\n';
    } else if (in_escape && ch == 't') {
      result += '\t';
    } else {
      result += ch;
    }
    in_escape = false;
  }
  return result;
}

namespace detail {
  struct Parsed
  {
    std::vector<Syntax> items;
    std::string_view remaining;
    bool closed{ false };
  };

  [[nodiscard]] inline ReadResult<Parsed> parse(std::string_view input)
  {
    Parsed result;
    for (auto token = next_token(input); token.kind != Token::Kind::end;) {
      switch (token.kind) {
      case Token::Kind::open: {
        auto inner = parse(token.remaining);
        if (!inner) { return inner; }
        if (!inner->closed) { return std::unexpected(ReadError{ "')'", "end of input" }); }
        result.items.push_back(Syntax{ Syntax::Kind::list, {}, std::move(inner->items) });
        token = next_token(inner->remaining);
        continue;
      }
      case Token::Kind::close:
        result.closed = true;
        result.remaining = token.remaining;
        return result;
      case Token::Kind::unterminated_text:
        return std::unexpected(ReadError{ "terminated string", std::string{ token.parsed } });
      case Token::Kind::text:
        result.items.push_back(Syntax{ Syntax::Kind::text, unquote(token.parsed), {} });
        break;
      case Token::Kind::atom:
        result.items.push_back(Syntax{ Syntax::Kind::atom, std::string{ token.parsed }, {} });
        break;
      case Token::Kind::end:
        break;
      }
      token = next_token(token.remaining);
    }
    return result;
  }

  [[nodiscard]] inline ReadError unexpected_form(std::string_view expected, const Syntax &got)
  {
    return ReadError{ std::string{ expected }, to_string(got) };
  }

  [[nodiscard]] inline bool is_number(std::string_view text)
  {
    if (text.starts_with('-')) { text.remove_prefix(1); }
    return !text.empty() && std::isdigit(static_cast<unsigned char>(text.front())) != 0;
  }

  [[nodiscard]] inline bool is_upper(std::string_view text)
  {
    return !text.empty() && std::isupper(static_cast<unsigned char>(text.front())) != 0;
  }

  [[nodiscard]] inline std::vector<std::string> split_path(std::string_view path)
  {
    std::vector<std::string> segments;
    std::size_t start = 0;
    while (true) {
      const auto dot = path.find('.', start);
      segments.emplace_back(path.substr(start, dot - start));
      if (dot == std::string_view::npos) { break; }
      start = dot + 1;
    }
    return segments;
  }

  [[nodiscard]] inline bool is_path(std::string_view path)
  {
    const auto segments = split_path(path);
    return std::ranges::none_of(segments, [](const std::string &segment) { return segment.empty(); });
  }

  inline constexpr std::array<std::string_view, 13> binary_operators{
    "+", "-", "*", "/", "%", "==", "!=", "<", "<=", ">", ">=", "&&", "||"
  };

  class Lowering
  {
  public:
    [[nodiscard]] ReadResult<ExprPtr> expr(const Syntax &syntax);
    [[nodiscard]] ReadResult<PatternPtr> pattern(const Syntax &syntax);

  private:
    [[nodiscard]] ReadResult<std::vector<ExprPtr>> exprs(std::span<const Syntax> items);
    [[nodiscard]] ReadResult<std::vector<PatternPtr>> patterns(std::span<const Syntax> items);
    [[nodiscard]] ReadResult<ExprPtr> form(const Syntax &syntax);
    [[nodiscard]] ReadResult<std::vector<FieldInit>> fields(std::span<const Syntax> items);
    [[nodiscard]] ReadResult<MatchArm> arm(const Syntax &syntax);
    [[nodiscard]] ReadResult<ExprPtr> block(BlockKind kind, std::span<const Syntax> items);
    [[nodiscard]] ReadResult<Literal> sigil(const Syntax &syntax);
  };

  inline ReadResult<std::vector<ExprPtr>> Lowering::exprs(std::span<const Syntax> items)
  {
    std::vector<ExprPtr> result;
    result.reserve(items.size());
    for (const auto &item : items) {
      auto lowered = expr(item);
      if (!lowered) { return std::unexpected(lowered.error()); }
      result.push_back(std::move(*lowered));
    }
    return result;
  }

  inline ReadResult<std::vector<PatternPtr>> Lowering::patterns(std::span<const Syntax> items)
  {
    std::vector<PatternPtr> result;
    result.reserve(items.size());
    for (const auto &item : items) {
      auto lowered = pattern(item);
      if (!lowered) { return std::unexpected(lowered.error()); }
      result.push_back(std::move(*lowered));
    }
    return result;
  }

  inline ReadResult<ExprPtr> Lowering::expr(const Syntax &syntax)
  {
    switch (syntax.kind) {
    case Syntax::Kind::text:
      return make_expr(Expr::Text{ syntax.text });
    case Syntax::Kind::atom:
      if (syntax.text == "true" || syntax.text == "false") { return make_expr(Expr::Bool{ syntax.text == "true" }); }
      if (is_number(syntax.text)) { return make_expr(Expr::Number{ syntax.text }); }
      return make_expr(Expr::Var{ syntax.text });
    case Syntax::Kind::list:
      break;
    }
    if (syntax.items.empty()) { return std::unexpected(unexpected_form("expression", syntax)); }
    return form(syntax);
  }

  // (sigil TAG "body" "flags"), the flags may be left out
  inline ReadResult<Literal> Lowering::sigil(const Syntax &syntax)
  {
    const auto &items = syntax.items;
    if ((items.size() != 3 && items.size() != 4) || items[1].kind != Syntax::Kind::atom
        || items[2].kind != Syntax::Kind::text || (items.size() == 4 && items[3].kind != Syntax::Kind::text)) {
      return std::unexpected(unexpected_form("(sigil TAG \"body\" \"flags\")", syntax));
    }
    return literal::Sigil{ items[1].text, items[2].text, items.size() == 4 ? items[3].text : std::string{} };
  }

  inline ReadResult<std::vector<FieldInit>> Lowering::fields(std::span<const Syntax> items)
  {
    std::vector<FieldInit> result;
    for (const auto &item : items) {
      if (!item.is_list() || item.items.size() != 2 || item.items[0].kind != Syntax::Kind::atom) {
        return std::unexpected(unexpected_form("(PATH expr) or (... expr)", item));
      }
      auto value = expr(item.items[1]);
      if (!value) { return std::unexpected(value.error()); }
      if (item.items[0].text == "...") {
        result.push_back(FieldInit{ {}, std::move(*value), true });
        continue;
      }
      if (!is_path(item.items[0].text)) { return std::unexpected(unexpected_form("field path", item.items[0])); }
      result.push_back(FieldInit{ split_path(item.items[0].text), std::move(*value), false });
    }
    return result;
  }

  inline ReadResult<MatchArm> Lowering::arm(const Syntax &syntax)
  {
    const bool guarded = syntax.is_list() && syntax.items.size() == 4 && syntax.items[1].is_atom("when");
    if (!syntax.is_list() || (syntax.items.size() != 2 && !guarded)) {
      return std::unexpected(unexpected_form("(PATTERN expr) or (PATTERN when guard expr)", syntax));
    }
    auto matched = pattern(syntax.items[0]);
    if (!matched) { return std::unexpected(matched.error()); }
    MatchArm result{ std::move(*matched), nullptr, nullptr };
    if (guarded) {
      auto guard = expr(syntax.items[2]);
      if (!guard) { return std::unexpected(guard.error()); }
      result.guard = std::move(*guard);
    }
    auto body = expr(syntax.items.back());
    if (!body) { return std::unexpected(body.error()); }
    result.body = std::move(*body);
    return result;
  }

  inline ReadResult<ExprPtr> Lowering::block(BlockKind kind, std::span<const Syntax> items)
  {
    std::vector<BlockItem> lowered;
    for (const auto &item : items) {
      const auto keyword = [&](std::string_view name, std::size_t size) {
        return item.is_list() && item.items.size() == size && item.items[0].is_atom(name);
      };

      BlockItem result;
      if (keyword("<-", 3)) {
        auto bound = pattern(item.items[1]);
        if (!bound) { return std::unexpected(bound.error()); }
        result.kind = BlockItem::Kind::bind;
        result.pattern = std::move(*bound);
      } else if (keyword("yield", 2)) {
        result.kind = BlockItem::Kind::yield;
      } else if (keyword("filter", 2)) {
        result.kind = BlockItem::Kind::filter;
      } else if (keyword("recurse", 2)) {
        result.kind = BlockItem::Kind::recurse;
      }

      auto value = expr(result.kind == BlockItem::Kind::expr ? item : item.items.back());
      if (!value) { return std::unexpected(value.error()); }
      result.expr = std::move(*value);
      lowered.push_back(std::move(result));
    }
    return make_expr(Expr::Block{ kind, std::make_shared<const std::vector<BlockItem>>(std::move(lowered)) });
  }

  inline ReadResult<ExprPtr> Lowering::form(const Syntax &syntax)
  {
    const auto &head = syntax.items.front();
    const std::span<const Syntax> args{ std::next(syntax.items.begin()), syntax.items.end() };
    const auto expect_size = [&](std::size_t size, std::string_view shape) -> std::optional<ReadError> {
      if (args.size() != size) { return unexpected_form(shape, syntax); }
      return std::nullopt;
    };

    if (head.kind != Syntax::Kind::atom) {
      auto func = expr(head);
      if (!func) { return func; }
      auto call_args = exprs(args);
      if (!call_args) { return std::unexpected(call_args.error()); }
      return make_expr(Expr::Call{ std::move(*func), std::move(*call_args) });
    }

    const std::string_view name = head.text;

    if (name == "fn") {
      if (auto error = expect_size(2, "(fn PATTERN expr)")) { return std::unexpected(*error); }
      auto parameter = pattern(args[0]);
      if (!parameter) { return std::unexpected(parameter.error()); }
      auto body = expr(args[1]);
      if (!body) { return body; }
      return make_expr(Expr::Lambda{ std::move(*parameter), std::move(*body) });
    }

    if (name == "app") {
      if (auto error = expect_size(2, "(app F A)")) { return std::unexpected(*error); }
      auto func = expr(args[0]);
      if (!func) { return func; }
      auto arg = expr(args[1]);
      if (!arg) { return arg; }
      return make_expr(Expr::App{ std::move(*func), std::move(*arg) });
    }

    if (name == "call") {
      if (args.empty()) { return std::unexpected(unexpected_form("(call F A...)", syntax)); }
      auto func = expr(args[0]);
      if (!func) { return func; }
      auto call_args = exprs(args.subspan(1));
      if (!call_args) { return std::unexpected(call_args.error()); }
      return make_expr(Expr::Call{ std::move(*func), std::move(*call_args) });
    }

    if (name == "list") {
      std::vector<ListItem> items;
      for (const auto &item : args) {
        const bool spread = item.is_list() && item.items.size() == 2 && item.items[0].is_atom("...");
        auto value = expr(spread ? item.items[1] : item);
        if (!value) { return value; }
        items.push_back(ListItem{ std::move(*value), spread });
      }
      return make_expr(Expr::List{ std::move(items) });
    }

    if (name == "tuple") {
      auto items = exprs(args);
      if (!items) { return std::unexpected(items.error()); }
      return make_expr(Expr::Tuple{ std::move(*items) });
    }

    if (name == "record") {
      auto inits = fields(args);
      if (!inits) { return std::unexpected(inits.error()); }
      return make_expr(Expr::Record{ std::move(*inits) });
    }

    if (name == "patch") {
      if (args.empty()) { return std::unexpected(unexpected_form("(patch expr FIELD...)", syntax)); }
      auto target = expr(args[0]);
      if (!target) { return target; }
      auto inits = fields(args.subspan(1));
      if (!inits) { return std::unexpected(inits.error()); }
      return make_expr(Expr::Patch{ std::move(*target), std::move(*inits) });
    }

    if (name == ".") {
      if (auto error = expect_size(2, "(. expr NAME)")) { return std::unexpected(*error); }
      if (args[1].kind != Syntax::Kind::atom) { return std::unexpected(unexpected_form("field name", args[1])); }
      auto base = expr(args[0]);
      if (!base) { return base; }
      return make_expr(Expr::FieldAccess{ std::move(*base), args[1].text });
    }

    if (name == "index") {
      if (auto error = expect_size(2, "(index expr expr)")) { return std::unexpected(*error); }
      auto base = expr(args[0]);
      if (!base) { return base; }
      auto position = expr(args[1]);
      if (!position) { return position; }
      return make_expr(Expr::Index{ std::move(*base), std::move(*position) });
    }

    if (name == "match") {
      if (args.empty()) { return std::unexpected(unexpected_form("(match expr ARM...)", syntax)); }
      auto scrutinee = expr(args[0]);
      if (!scrutinee) { return scrutinee; }
      std::vector<MatchArm> arms;
      for (const auto &item : args.subspan(1)) {
        auto lowered = arm(item);
        if (!lowered) { return std::unexpected(lowered.error()); }
        arms.push_back(std::move(*lowered));
      }
      return make_expr(Expr::Match{ std::move(*scrutinee), std::move(arms) });
    }

    if (name == "if") {
      if (auto error = expect_size(3, "(if expr expr expr)")) { return std::unexpected(*error); }
      auto parts = exprs(args);
      if (!parts) { return std::unexpected(parts.error()); }
      return make_expr(Expr::If{ (*parts)[0], (*parts)[1], (*parts)[2] });
    }

    if (name == "binary" || std::ranges::find(binary_operators, name) != binary_operators.end()) {
      const bool named = name == "binary";
      if (args.size() != (named ? 3U : 2U) || (named && args[0].kind != Syntax::Kind::atom)) {
        return std::unexpected(unexpected_form(named ? "(binary OP expr expr)" : "(OP expr expr)", syntax));
      }
      auto operands = exprs(args.subspan(named ? 1 : 0));
      if (!operands) { return std::unexpected(operands.error()); }
      return make_expr(Expr::Binary{ named ? args[0].text : std::string{ name }, (*operands)[0], (*operands)[1] });
    }

    if (name == "text") {
      std::vector<TextPart> parts;
      for (const auto &item : args) {
        if (item.kind == Syntax::Kind::text) {
          parts.push_back(TextPart{ item.text, nullptr });
          continue;
        }
        auto value = expr(item);
        if (!value) { return value; }
        parts.push_back(TextPart{ {}, std::move(*value) });
      }
      return make_expr(Expr::Interpolate{ std::move(parts) });
    }

    if (name == "sigil") {
      auto lit = sigil(syntax);
      if (!lit) { return std::unexpected(lit.error()); }
      auto &parts = std::get<literal::Sigil>(*lit);
      return make_expr(Expr::Sigil{ std::move(parts.tag), std::move(parts.body), std::move(parts.flags) });
    }

    if (name == "datetime") {
      if (args.size() != 1 || args[0].kind != Syntax::Kind::text) {
        return std::unexpected(unexpected_form("(datetime \"text\")", syntax));
      }
      return make_expr(Expr::DateTime{ args[0].text });
    }

    if (name == "do") { return block(BlockKind::plain, args); }
    if (name == "effect") { return block(BlockKind::effect, args); }
    if (name == "generate") { return block(BlockKind::generate, args); }
    if (name == "resource") { return block(BlockKind::resource, args); }

    // any other head is a call
    auto func = expr(head);
    if (!func) { return func; }
    auto call_args = exprs(args);
    if (!call_args) { return std::unexpected(call_args.error()); }
    return make_expr(Expr::Call{ std::move(*func), std::move(*call_args) });
  }

  inline ReadResult<PatternPtr> Lowering::pattern(const Syntax &syntax)
  {
    if (syntax.kind == Syntax::Kind::text) { return make_pattern(Pattern::Literal{ literal::Text{ syntax.text } }); }

    if (syntax.kind == Syntax::Kind::atom) {
      const auto &text = syntax.text;
      if (text == "_") { return make_pattern(Pattern::Wildcard{}); }
      if (text == "true" || text == "false") {
        return make_pattern(Pattern::Literal{ literal::Bool{ text == "true" } });
      }
      if (is_number(text)) { return make_pattern(Pattern::Literal{ literal::Number{ text } }); }
      if (is_upper(text)) { return make_pattern(Pattern::Constructor{ text, {} }); }
      return make_pattern(Pattern::Var{ text });
    }

    if (syntax.items.empty() || syntax.items[0].kind != Syntax::Kind::atom) {
      return std::unexpected(unexpected_form("pattern", syntax));
    }

    const std::string_view name = syntax.items[0].text;
    const std::span<const Syntax> args{ std::next(syntax.items.begin()), syntax.items.end() };

    if (name == "tuple") {
      auto items = patterns(args);
      if (!items) { return std::unexpected(items.error()); }
      return make_pattern(Pattern::Tuple{ std::move(*items) });
    }

    if (name == "list") {
      const auto rest_marker = std::ranges::find_if(args, [](const Syntax &item) { return item.is_atom("&"); });
      const auto head_count = static_cast<std::size_t>(std::distance(args.begin(), rest_marker));
      auto items = patterns(args.first(head_count));
      if (!items) { return std::unexpected(items.error()); }
      PatternPtr rest;
      if (rest_marker != args.end()) {
        if (args.size() != head_count + 2) { return std::unexpected(unexpected_form("(list PATTERN... & PATTERN)", syntax)); }
        auto tail = pattern(args.back());
        if (!tail) { return tail; }
        rest = std::move(*tail);
      }
      return make_pattern(Pattern::List{ std::move(*items), std::move(rest) });
    }

    if (name == "record") {
      std::vector<Pattern::RecordField> fields;
      for (const auto &item : args) {
        if (!item.is_list() || item.items.size() != 2 || item.items[0].kind != Syntax::Kind::atom
            || !is_path(item.items[0].text)) {
          return std::unexpected(unexpected_form("(PATH PATTERN)", item));
        }
        auto field = pattern(item.items[1]);
        if (!field) { return field; }
        fields.push_back(Pattern::RecordField{ split_path(item.items[0].text), std::move(*field) });
      }
      return make_pattern(Pattern::Record{ std::move(fields) });
    }

    if (name == "sigil") {
      auto lit = sigil(syntax);
      if (!lit) { return std::unexpected(lit.error()); }
      return make_pattern(Pattern::Literal{ std::move(*lit) });
    }

    if (name == "datetime") {
      if (args.size() != 1 || args[0].kind != Syntax::Kind::text) {
        return std::unexpected(unexpected_form("(datetime \"text\")", syntax));
      }
      return make_pattern(Pattern::Literal{ literal::DateTime{ args[0].text } });
    }

    if (is_upper(name)) {
      auto items = patterns(args);
      if (!items) { return std::unexpected(items.error()); }
      return make_pattern(Pattern::Constructor{ std::string{ name }, std::move(*items) });
    }

    return std::unexpected(unexpected_form("pattern", syntax));
  }

  [[nodiscard]] inline ReadResult<Definition> definition(Lowering &lowering, const Syntax &syntax)
  {
    if (!syntax.is_list() || syntax.items.size() != 3 || !syntax.items[0].is_atom("def")
        || syntax.items[1].kind != Syntax::Kind::atom) {
      return std::unexpected(unexpected_form("(def NAME expr)", syntax));
    }
    auto body = lowering.expr(syntax.items[2]);
    if (!body) { return std::unexpected(body.error()); }
    return Definition{ syntax.items[1].text, std::move(*body) };
  }

  [[nodiscard]] inline ReadResult<std::vector<Syntax>> parse_all(std::string_view text)
  {
    auto parsed = parse(text);
    if (!parsed) { return std::unexpected(parsed.error()); }
    if (parsed->closed) { return std::unexpected(ReadError{ "end of input", "')'" }); }
    return std::move(parsed->items);
  }
}// namespace detail

// reads a single expression, mostly useful for tests and the REPL style --exec
[[nodiscard]] inline ReadResult<ExprPtr> read_expr(std::string_view text)
{
  auto forms = detail::parse_all(text);
  if (!forms) { return std::unexpected(forms.error()); }
  if (forms->size() != 1) {
    return std::unexpected(ReadError{ "one expression", fmt::format("{} forms", forms->size()) });
  }
  detail::Lowering lowering;
  return lowering.expr(forms->front());
}

[[nodiscard]] inline ReadResult<Program> read_program(std::string_view text)
{
  auto forms = detail::parse_all(text);
  if (!forms) { return std::unexpected(forms.error()); }

  detail::Lowering lowering;
  std::vector<Module> modules;
  for (const auto &form : *forms) {
    if (form.is_list() && !form.items.empty() && form.items[0].is_atom("module")) {
      if (form.items.size() < 2 || form.items[1].kind != Syntax::Kind::atom) {
        return std::unexpected(detail::unexpected_form("(module NAME (def NAME expr)...)", form));
      }
      Module module{ form.items[1].text, {} };
      for (const auto &item : std::span{ form.items }.subspan(2)) {
        auto def = detail::definition(lowering, item);
        if (!def) { return std::unexpected(def.error()); }
        module.definitions.push_back(std::move(*def));
      }
      modules.push_back(std::move(module));
      continue;
    }

    auto def = detail::definition(lowering, form);
    if (!def) { return std::unexpected(def.error()); }
    modules.push_back(Module{ {}, { std::move(*def) } });
  }
  return flatten(modules);
}

}// namespace effect_expr

#endif
