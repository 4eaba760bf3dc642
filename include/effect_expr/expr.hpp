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

#ifndef EFFECT_EXPR_EXPR_HPP
#define EFFECT_EXPR_EXPR_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

// The lowered program form the evaluator consumes. Every node is immutable and
// shared through shared_ptr<const ...>, closures and thunks keep the nodes they
// reference alive.

namespace effect_expr {

struct Expr;
struct Pattern;
using ExprPtr = std::shared_ptr<const Expr>;
using PatternPtr = std::shared_ptr<const Pattern>;

namespace literal {
  struct Number
  {
    std::string text;
  };
  struct Text
  {
    std::string text;
  };
  struct Sigil
  {
    std::string tag;
    std::string body;
    std::string flags;
  };
  struct Bool
  {
    bool value;
  };
  struct DateTime
  {
    std::string text;
  };
}// namespace literal

using Literal = std::variant<literal::Number, literal::Text, literal::Sigil, literal::Bool, literal::DateTime>;

struct Pattern
{
  struct Wildcard
  {
  };
  struct Var
  {
    std::string name;
  };
  struct Literal
  {
    effect_expr::Literal value;
  };
  struct Constructor
  {
    std::string name;
    std::vector<PatternPtr> args;
  };
  struct Tuple
  {
    std::vector<PatternPtr> items;
  };
  struct List
  {
    std::vector<PatternPtr> items;
    PatternPtr rest;
  };
  struct RecordField
  {
    std::vector<std::string> path;
    PatternPtr pattern;
  };
  struct Record
  {
    std::vector<RecordField> fields;
  };

  std::variant<Wildcard, Var, Literal, Constructor, Tuple, List, Record> node;
};

enum struct BlockKind : std::uint8_t { plain, effect, generate, resource };

struct BlockItem
{
  enum struct Kind : std::uint8_t { bind, filter, yield, recurse, expr };

  Kind kind{ Kind::expr };
  PatternPtr pattern;
  ExprPtr expr;
};

using BlockItems = std::shared_ptr<const std::vector<BlockItem>>;

// a piece of interpolated text, literal when expr is null
struct TextPart
{
  std::string text;
  ExprPtr expr;
};

struct ListItem
{
  ExprPtr expr;
  bool spread{ false };
};

struct FieldInit
{
  std::vector<std::string> path;
  ExprPtr value;
  bool spread{ false };
};

struct MatchArm
{
  PatternPtr pattern;
  ExprPtr guard;
  ExprPtr body;
};

struct Expr
{
  struct Var
  {
    std::string name;
  };
  struct Number
  {
    std::string text;
  };
  struct Text
  {
    std::string text;
  };
  struct Interpolate
  {
    std::vector<TextPart> parts;
  };
  struct Sigil
  {
    std::string tag;
    std::string body;
    std::string flags;
  };
  struct Bool
  {
    bool value;
  };
  struct DateTime
  {
    std::string text;
  };
  struct Lambda
  {
    PatternPtr parameter;
    ExprPtr body;
  };
  struct App
  {
    ExprPtr func;
    ExprPtr arg;
  };
  struct Call
  {
    ExprPtr func;
    std::vector<ExprPtr> args;
  };
  struct List
  {
    std::vector<ListItem> items;
  };
  struct Tuple
  {
    std::vector<ExprPtr> items;
  };
  struct Record
  {
    std::vector<FieldInit> fields;
  };
  struct Patch
  {
    ExprPtr target;
    std::vector<FieldInit> fields;
  };
  struct FieldAccess
  {
    ExprPtr base;
    std::string field;
  };
  struct Index
  {
    ExprPtr base;
    ExprPtr index;
  };
  struct Match
  {
    ExprPtr scrutinee;
    std::vector<MatchArm> arms;
  };
  struct If
  {
    ExprPtr condition;
    ExprPtr then_branch;
    ExprPtr else_branch;
  };
  struct Binary
  {
    std::string op;
    ExprPtr left;
    ExprPtr right;
  };
  struct Block
  {
    BlockKind kind{ BlockKind::plain };
    BlockItems items;
  };

  std::variant<Var,
    Number,
    Text,
    Interpolate,
    Sigil,
    Bool,
    DateTime,
    Lambda,
    App,
    Call,
    List,
    Tuple,
    Record,
    Patch,
    FieldAccess,
    Index,
    Match,
    If,
    Binary,
    Block>
    node;
};

template<typename Node> [[nodiscard]] ExprPtr make_expr(Node node)
{
  return std::make_shared<const Expr>(Expr{ std::move(node) });
}

template<typename Node> [[nodiscard]] PatternPtr make_pattern(Node node)
{
  return std::make_shared<const Pattern>(Pattern{ std::move(node) });
}

struct Definition
{
  std::string name;
  ExprPtr expr;
};

struct Module
{
  std::string name;
  std::vector<Definition> definitions;
};

// the flat definition table, a name may repeat (one entry per clause)
struct Program
{
  std::vector<Definition> definitions;
};

// every definition is registered both bare and qualified by its module name
[[nodiscard]] inline Program flatten(const std::vector<Module> &modules)
{
  Program program;
  for (const auto &module : modules) {
    for (const auto &definition : module.definitions) {
      program.definitions.push_back(definition);
      if (!module.name.empty()) {
        program.definitions.push_back(Definition{ module.name + "." + definition.name, definition.expr });
      }
    }
  }
  return program;
}

}// namespace effect_expr

#endif
