#include <catch2/catch_test_macros.hpp>

#include <effect_expr/cancel_token.hpp>

using effect_expr::CancelToken;

TEST_CASE("cancelling a token is visible below it", "[cancel]")
{
  auto root = CancelToken::root();
  auto child = CancelToken::child(root);
  auto grandchild = CancelToken::child(child);

  CHECK_FALSE(grandchild->is_cancelled());
  child->cancel();
  CHECK(child->is_cancelled());
  CHECK(grandchild->is_cancelled());
  CHECK_FALSE(root->is_cancelled());
}

TEST_CASE("cancelling a token leaves siblings alone", "[cancel]")
{
  auto root = CancelToken::root();
  auto left = CancelToken::child(root);
  auto right = CancelToken::child(root);

  left->cancel();
  CHECK(left->is_cancelled());
  CHECK_FALSE(right->is_cancelled());

  root->cancel();
  CHECK(right->is_cancelled());
}

TEST_CASE("parent links", "[cancel]")
{
  auto root = CancelToken::root();
  auto child = CancelToken::child(root);
  CHECK(root->parent() == nullptr);
  CHECK(child->parent() == root);
}

TEST_CASE("default poll interval", "[cancel]") { STATIC_REQUIRE(effect_expr::default_poll_interval.count() == 25); }
