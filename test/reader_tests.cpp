#include <catch2/catch_test_macros.hpp>

#include <effect_expr/reader.hpp>

#include <string>
#include <variant>

using effect_expr::Expr;
using effect_expr::Pattern;
using effect_expr::read_expr;
using effect_expr::read_program;

template<typename Node> const Node &node_of(const effect_expr::ReadResult<effect_expr::ExprPtr> &expr)
{
  REQUIRE(expr);
  const auto *node = std::get_if<Node>(&(*expr)->node);
  REQUIRE(node != nullptr);
  return *node;
}

TEST_CASE("tokenizer", "[reader]")
{
  auto token = effect_expr::next_token("  ; comment\n; another\n (def x 1)");
  CHECK(token.parsed == "(");
  token = effect_expr::next_token(token.remaining);
  CHECK(token.parsed == "def");

  token = effect_expr::next_token(R"("a \" b" rest)");
  CHECK(token.kind == effect_expr::Token::Kind::text);
  CHECK(token.parsed == R"("a \" b")");
  CHECK(token.remaining == "rest");
}

TEST_CASE("tokens are classified as they are split", "[reader]")
{
  using Kind = effect_expr::Token::Kind;

  STATIC_REQUIRE(effect_expr::next_token("").kind == Kind::end);
  STATIC_REQUIRE(effect_expr::next_token("  ; only a comment").kind == Kind::end);
  STATIC_REQUIRE(effect_expr::next_token(")").kind == Kind::close);

  // atoms stop at quotes and comments as well as parens and whitespace
  auto token = effect_expr::next_token(R"(<-"x")");
  CHECK(token.kind == Kind::atom);
  CHECK(token.parsed == "<-");
  token = effect_expr::next_token(token.remaining);
  CHECK(token.kind == Kind::text);
  CHECK(token.parsed == R"("x")");

  token = effect_expr::next_token("abc; trailing\n)");
  CHECK(token.parsed == "abc");
  CHECK(effect_expr::next_token(token.remaining).kind == Kind::close);

  token = effect_expr::next_token(R"("never closed \")");
  CHECK(token.kind == Kind::unterminated_text);
  CHECK(token.remaining.empty());
}

TEST_CASE("atoms", "[reader]")
{
  CHECK(node_of<Expr::Number>(read_expr("42")).text == "42");
  CHECK(node_of<Expr::Number>(read_expr("-1.5")).text == "-1.5");
  CHECK(node_of<Expr::Bool>(read_expr("true")).value);
  CHECK(node_of<Expr::Var>(read_expr("collections.map")).name == "collections.map");
  CHECK(node_of<Expr::Text>(read_expr(R"("a\"b\n")")).text == "a\"b\n");
}

TEST_CASE("application forms", "[reader]")
{
  const auto &binary = node_of<Expr::Binary>(read_expr("(+ 1 2)"));
  CHECK(binary.op == "+");

  const auto &named = node_of<Expr::Binary>(read_expr("(binary ++ xs ys)"));
  CHECK(named.op == "++");

  const auto &call = node_of<Expr::Call>(read_expr("(f a b)"));
  CHECK(call.args.size() == 2);

  const auto &explicit_call = node_of<Expr::Call>(read_expr("(call list 1)"));
  CHECK(explicit_call.args.size() == 1);

  const auto &app = node_of<Expr::App>(read_expr("(app f x)"));
  CHECK(std::get<Expr::Var>(app.func->node).name == "f");
}

TEST_CASE("collection forms", "[reader]")
{
  const auto &list = node_of<Expr::List>(read_expr("(list 1 (... xs) 3)"));
  REQUIRE(list.items.size() == 3);
  CHECK_FALSE(list.items[0].spread);
  CHECK(list.items[1].spread);

  const auto &record = node_of<Expr::Record>(read_expr("(record (a.b 1) (... base))"));
  REQUIRE(record.fields.size() == 2);
  CHECK(record.fields[0].path == std::vector<std::string>{ "a", "b" });
  CHECK(record.fields[1].spread);

  const auto &patch = node_of<Expr::Patch>(read_expr("(patch r (a.c 2))"));
  CHECK(patch.fields.size() == 1);

  CHECK(node_of<Expr::FieldAccess>(read_expr("(. r name)")).field == "name");
  CHECK(node_of<Expr::Tuple>(read_expr("(tuple 1 2)")).items.size() == 2);
}

TEST_CASE("blocks", "[reader]")
{
  const auto &block = node_of<Expr::Block>(read_expr("(effect (<- x (pure 1)) (println x) (pure x))"));
  CHECK(block.kind == effect_expr::BlockKind::effect);
  REQUIRE(block.items->size() == 3);
  CHECK((*block.items)[0].kind == effect_expr::BlockItem::Kind::bind);
  CHECK((*block.items)[1].kind == effect_expr::BlockItem::Kind::expr);

  const auto &generator = node_of<Expr::Block>(read_expr("(generate (<- x xs) (filter (> x 1)) (yield x))"));
  CHECK(generator.kind == effect_expr::BlockKind::generate);
  CHECK((*generator.items)[1].kind == effect_expr::BlockItem::Kind::filter);
  CHECK((*generator.items)[2].kind == effect_expr::BlockItem::Kind::yield);

  CHECK(node_of<Expr::Block>(read_expr("(resource (yield 1) (pure Unit))")).kind == effect_expr::BlockKind::resource);
  CHECK(node_of<Expr::Block>(read_expr("(do (<- x 1) x)")).kind == effect_expr::BlockKind::plain);
}

TEST_CASE("patterns", "[reader]")
{
  const auto &lambda = node_of<Expr::Lambda>(read_expr("(fn (list x & rest) x)"));
  const auto &list = std::get<Pattern::List>(lambda.parameter->node);
  CHECK(list.items.size() == 1);
  CHECK(list.rest != nullptr);

  const auto &match = node_of<Expr::Match>(read_expr(R"(
    (match value
      (0 "zero")
      ((Some y) when (> y 0) y)
      ((tuple a _) a)
      ((record (user.name n)) n)
      (None "none")
      (_ "other")))"));
  REQUIRE(match.arms.size() == 6);
  CHECK(std::holds_alternative<Pattern::Literal>(match.arms[0].pattern->node));
  CHECK(match.arms[1].guard != nullptr);
  CHECK(std::get<Pattern::Constructor>(match.arms[1].pattern->node).args.size() == 1);
  CHECK(std::holds_alternative<Pattern::Tuple>(match.arms[2].pattern->node));
  CHECK(std::get<Pattern::Record>(match.arms[3].pattern->node).fields[0].path.size() == 2);
  CHECK(std::get<Pattern::Constructor>(match.arms[4].pattern->node).args.empty());
  CHECK(std::holds_alternative<Pattern::Wildcard>(match.arms[5].pattern->node));
}

TEST_CASE("programs and modules", "[reader]")
{
  auto program = read_program(R"(
    ; helpers
    (module util
      (def inc (fn x (+ x 1))))
    (def main (pure 1))
    (def main (pure 2))
  )");
  REQUIRE(program);
  REQUIRE(program->definitions.size() == 4);
  CHECK(program->definitions[0].name == "inc");
  CHECK(program->definitions[1].name == "util.inc");
  CHECK(program->definitions[0].expr == program->definitions[1].expr);
  CHECK(program->definitions[2].name == "main");
  CHECK(program->definitions[3].name == "main");
}

TEST_CASE("malformed input", "[reader][error]")
{
  auto unclosed = read_program("(def main (pure 1)");
  REQUIRE_FALSE(unclosed);
  CHECK(unclosed.error().expected == "')'");
  CHECK(unclosed.error().got == "end of input");

  auto stray = read_program("(def x 1))");
  REQUIRE_FALSE(stray);
  CHECK(stray.error().expected == "end of input");

  auto unterminated = read_expr(R"("abc)");
  REQUIRE_FALSE(unterminated);
  CHECK(unterminated.error().expected == "terminated string");

  auto empty = read_expr("()");
  REQUIRE_FALSE(empty);
  CHECK(empty.error().expected == "expression");

  auto lambda = read_expr("(fn x)");
  REQUIRE_FALSE(lambda);
  CHECK(lambda.error().expected == "(fn PATTERN expr)");
  CHECK(lambda.error().got == "(fn x)");

  auto not_a_definition = read_program("(main 1)");
  REQUIRE_FALSE(not_a_definition);
  CHECK(effect_expr::describe(not_a_definition.error()) == "read error: expected (def NAME expr), got (main 1)");
}
