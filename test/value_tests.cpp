#include <catch2/catch_test_macros.hpp>

#include "test_helpers.hpp"

#include <effect_expr/environment.hpp>
#include <effect_expr/utility.hpp>
#include <effect_expr/value.hpp>

using effect_expr::make_int;
using effect_expr::make_list;
using effect_expr::make_text;
using effect_expr::to_string;
using effect_expr::values_equal;

TEST_CASE("structural equality", "[value]")
{
  CHECK(values_equal(make_list({ make_int(1), make_text("a") }), make_list({ make_int(1), make_text("a") })));
  CHECK_FALSE(values_equal(make_list({ make_int(1) }), make_list({ make_int(1), make_int(2) })));
  CHECK_FALSE(values_equal(make_int(1), effect_expr::make_float(1.0)));
  CHECK(values_equal(effect_expr::make_some(make_int(3)), effect_expr::make_some(make_int(3))));
  CHECK_FALSE(values_equal(effect_expr::make_some(make_int(3)), effect_expr::make_ok(make_int(3))));
  CHECK(values_equal(effect_expr::make_record({ { "a", make_int(1) }, { "b", make_text("x") } }),
    effect_expr::make_record({ { "b", make_text("x") }, { "a", make_int(1) } })));
}

TEST_CASE("callables compare by identity", "[value]")
{
  auto runtime = make_runtime();
  auto first = eval_text(runtime, "(fn x x)");
  auto second = eval_text(runtime, "(fn x x)");
  REQUIRE(first);
  REQUIRE(second);
  CHECK(values_equal(*first, *first));
  CHECK_FALSE(values_equal(*first, *second));
}

TEST_CASE("decimals compare by value", "[value]")
{
  const auto one = effect_expr::make_decimal(mpz_class{ 1 }, 0);
  const auto one_point_zero = effect_expr::make_decimal(mpz_class{ 10 }, 1);
  CHECK(values_equal(one, one_point_zero));
}

TEST_CASE("rationals are canonical", "[value]")
{
  CHECK(values_equal(effect_expr::make_rational(mpq_class{ 2, 4 }), effect_expr::make_rational(mpq_class{ 1, 2 })));
  CHECK(to_string(effect_expr::make_rational(mpq_class{ 2, -4 })) == "-1/2");
}

TEST_CASE("formatting values", "[value][format]")
{
  CHECK(to_string(effect_expr::unit()) == "Unit");
  CHECK(to_string(effect_expr::make_bool(true)) == "True");
  CHECK(to_string(make_int(-42)) == "-42");
  CHECK(to_string(make_text("hello")) == "hello");
  CHECK(to_string(make_list({ make_int(1), make_int(2) })) == "[1, 2]");
  CHECK(to_string(effect_expr::make_tuple({ make_int(1), make_text("a") })) == "(1, a)");
  CHECK(to_string(effect_expr::make_record({ { "b", make_int(2) }, { "a", make_int(1) } })) == "{a: 1, b: 2}");
  CHECK(to_string(effect_expr::make_some(effect_expr::make_some(make_int(1)))) == "Some (Some 1)");
  CHECK(to_string(effect_expr::make_some(effect_expr::make_none())) == "Some None");
  CHECK(to_string(effect_expr::make_decimal(mpz_class{ -5 }, 2)) == "-0.05");
}

TEST_CASE("annotated formatting", "[value][format]")
{
  CHECK(to_string(make_int(7), true) == "[Int] 7");
  CHECK(to_string(make_list({ make_int(7) }), true) == "[List] [7]");
}

TEST_CASE("describe runtime errors", "[value][error]")
{
  CHECK(effect_expr::describe(effect_expr::RuntimeError::cancelled()) == "execution cancelled");
  CHECK(effect_expr::describe(effect_expr::RuntimeError::message("unknown name x")) == "unknown name x");
  CHECK(effect_expr::describe(effect_expr::RuntimeError::error(make_text("boom"))) == "runtime error: boom");
  CHECK(effect_expr::RuntimeError::non_exhaustive_match().is_non_exhaustive_match());
  CHECK_FALSE(effect_expr::RuntimeError::message("other").is_non_exhaustive_match());
}

TEST_CASE("key ordering", "[value]")
{
  const effect_expr::KeyOrder less{};
  CHECK(less(make_int(1), make_int(2)));
  CHECK_FALSE(less(make_int(2), make_int(1)));
  CHECK(less(make_text("a"), make_text("b")));
  CHECK(effect_expr::is_key(make_text("a")));
  CHECK_FALSE(effect_expr::is_key(make_list({})));
}

TEST_CASE("environment lookup walks the parent chain", "[environment]")
{
  auto globals = effect_expr::Environment::make();
  REQUIRE(globals->set("x", make_int(1)));
  globals->seal();
  auto local = effect_expr::Environment::make(globals, { { "y", make_int(2) } });
  REQUIRE(local->set("x", make_int(3)));

  REQUIRE(local->get("x"));
  CHECK(values_equal(*local->get("x"), make_int(3)));
  CHECK(values_equal(*globals->get("x"), make_int(1)));
  CHECK(local->contains("y"));
  CHECK_FALSE(globals->contains("y"));
  CHECK(globals->sealed());
  CHECK_FALSE(local->sealed());
}

TEST_CASE("a sealed scope rejects writes", "[environment]")
{
  auto globals = effect_expr::Environment::make();
  REQUIRE(globals->set_all({ { "x", make_int(1) }, { "y", make_int(2) } }));
  globals->seal();

  auto rebound = globals->set("x", make_int(5));
  REQUIRE_FALSE(rebound);
  CHECK(rebound.error().is_message());
  CHECK(rebound.error().text == "cannot bind x in a sealed scope");
  CHECK(values_equal(*globals->get("x"), make_int(1)));

  CHECK_FALSE(globals->set_all({ { "z", make_int(3) } }));
  CHECK_FALSE(globals->contains("z"));
}
