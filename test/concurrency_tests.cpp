#include <catch2/catch_test_macros.hpp>

#include "test_helpers.hpp"

#include <chrono>
#include <thread>

using effect_expr::make_int;
using effect_expr::make_text;
using effect_expr::to_string;
using effect_expr::values_equal;

TEST_CASE("channels deliver in order", "[concurrency][channel]")
{
  auto result = run_text(R"(
    (def main
      (effect
        (<- (tuple tx rx) (channel.make Unit))
        (channel.send tx 1)
        (channel.send tx 2)
        (<- a (channel.recv rx))
        (<- b (channel.recv rx))
        (pure (tuple a b))))
  )");
  REQUIRE(result);
  CHECK(to_string(*result) == "(Ok 1, Ok 2)");
}

TEST_CASE("closed channels", "[concurrency][channel]")
{
  auto drained = run_text(R"(
    (def main
      (effect
        (<- (tuple tx rx) (channel.make Unit))
        (channel.send tx 1)
        (channel.close tx)
        (<- a (channel.recv rx))
        (<- b (channel.recv rx))
        (<- c (attempt (channel.send tx 2)))
        (pure (tuple a b c))))
  )");
  REQUIRE(drained);
  CHECK(to_string(*drained) == "(Ok 1, Err Closed, Err Closed)");

  auto failed = run_text(R"(
    (def main
      (effect
        (<- (tuple tx rx) (channel.make Unit))
        (channel.close tx)
        (channel.send tx 1)))
  )");
  REQUIRE_FALSE(failed);
  REQUIRE(failed.error().is_error());
  CHECK(to_string(failed.error().payload) == "Closed");
}

TEST_CASE("recv waits for a sender on another thread", "[concurrency][channel]")
{
  auto result = run_text(R"(
    (def main
      (effect
        (<- (tuple tx rx) (channel.make Unit))
        (concurrent.par (channel.recv rx) (channel.send tx 7))))
  )");
  REQUIRE(result);
  CHECK(to_string(*result) == "(Ok 7, Unit)");
}

TEST_CASE("recv gives up when cancelled", "[concurrency][channel][cancel]")
{
  auto result = run_text(R"(
    (def main
      (effect
        (<- (tuple tx rx) (channel.make Unit))
        (concurrent.race (channel.recv rx) (pure "timeout"))))
  )");
  REQUIRE(result);
  CHECK(values_equal(*result, make_text("timeout")));
}

TEST_CASE("par", "[concurrency][par]")
{
  auto spins = make_counter();
  auto runtime = make_runtime({ { "spin", spinner(spins) }, { "wait", delayed(20ms, effect_expr::unit()) } });

  SECTION("both branches succeed")
  {
    auto result = run_effect_text(runtime, "(concurrent.par (pure 1) (pure 2))");
    REQUIRE(result);
    CHECK(to_string(*result) == "(1, 2)");
  }

  SECTION("a failure cancels the sibling")
  {
    auto result = run_effect_text(runtime, "(concurrent.par (fail \"left\") spin)");
    REQUIRE_FALSE(result);
    REQUIRE(result.error().is_error());
    CHECK(values_equal(result.error().payload, make_text("left")));
    CHECK(settled(spins));
  }

  SECTION("the cancelled sibling never hides the failure")
  {
    auto result = run_effect_text(runtime, "(concurrent.par spin (fail \"right\"))");
    REQUIRE_FALSE(result);
    REQUIRE(result.error().is_error());
    CHECK(values_equal(result.error().payload, make_text("right")));
  }

  SECTION("when both fail the left failure wins")
  {
    for (int attempt = 0; attempt < 20; ++attempt) {
      auto result = run_effect_text(runtime, "(concurrent.par (fail \"a\") (fail \"b\"))");
      REQUIRE_FALSE(result);
      REQUIRE(result.error().is_error());
      CHECK(values_equal(result.error().payload, make_text("a")));
    }
  }

  SECTION("a left branch cancelled before it fails gives way to the right failure")
  {
    auto result = run_effect_text(runtime, "(concurrent.par (effect wait (fail \"a\")) (fail \"b\"))");
    REQUIRE_FALSE(result);
    REQUIRE(result.error().is_error());
    CHECK(values_equal(result.error().payload, make_text("b")));
  }
}

TEST_CASE("race", "[concurrency][race]")
{
  auto spins = make_counter();
  auto runtime = make_runtime({ { "spin", spinner(spins) }, { "slow", delayed(10ms, make_int(1)) } });

  SECTION("the first result wins and the loser is drained")
  {
    auto result = run_effect_text(runtime, "(concurrent.race slow spin)");
    REQUIRE(result);
    CHECK(values_equal(*result, make_int(1)));
    CHECK(settled(spins));
  }

  SECTION("a failure can win")
  {
    auto result = run_effect_text(runtime, "(concurrent.race spin (fail \"lost\"))");
    REQUIRE_FALSE(result);
    CHECK(values_equal(result.error().payload, make_text("lost")));
  }
}

TEST_CASE("cancelling the parent cancels par and race", "[concurrency][cancel]")
{
  auto spins = make_counter();
  auto runtime = make_runtime({ { "spin", spinner(spins) } });

  for (const auto *text : { "(concurrent.par spin spin)", "(concurrent.race spin spin)" }) {
    auto effect = eval_text(runtime, text);
    REQUIRE(effect);

    auto token = effect_expr::CancelToken::child(runtime.cancel_token());
    effect_expr::Result<effect_expr::Value> result = effect_expr::unit();
    std::thread worker([&] {
      effect_expr::Runtime cancellable{ runtime.context(), token };
      result = cancellable.run_effect_value(*effect);
    });
    const int before = *spins;
    const bool started = eventually([&] { return *spins > before + 2; });
    token->cancel();
    worker.join();
    REQUIRE(started);

    REQUIRE_FALSE(result);
    CHECK(result.error().is_cancelled());
    CHECK(settled(spins));
  }
  CHECK_FALSE(runtime.cancel_token()->is_cancelled());
}

TEST_CASE("scope cancels what it spawned", "[concurrency][scope]")
{
  auto spins = make_counter();
  auto runtime = make_runtime({ { "spin", spinner(spins) }, { "wait", delayed(20ms, effect_expr::unit()) } });

  auto result = run_effect_text(runtime, R"(
    (concurrent.scope
      (effect
        (concurrent.scope (concurrent.spawnDetached spin))
        wait
        (pure 5)))
  )");
  REQUIRE(result);
  CHECK(values_equal(*result, make_int(5)));

  // the task outlived the inner scope, and stopped with the outer one
  CHECK(*spins > 0);
  CHECK(settled(spins));
  CHECK_FALSE(runtime.cancel_token()->is_cancelled());
}

TEST_CASE("detached tasks follow the token they hang off", "[concurrency][scope]")
{
  auto spins = make_counter();
  auto runtime = make_runtime({ { "spin", spinner(spins) } });

  REQUIRE(run_effect_text(runtime, "(concurrent.spawnDetached spin)"));
  REQUIRE(eventually([&] { return *spins > 3; }));

  // still running after the spawning effect returned
  const int before = *spins;
  CHECK(eventually([&] { return *spins > before; }));

  runtime.cancel_token()->cancel();
  CHECK(settled(spins));
}

TEST_CASE("scope shares the fuel budget", "[concurrency][scope][fuel]")
{
  auto runtime = make_runtime({}, 30);
  auto result = run_effect_text(runtime, R"(
    (concurrent.scope
      (effect
        (<- xs (pure (list 1 2 3 4 5 6 7 8 9 10 11 12 13 14 15 16 17 18 19 20)))
        (pure (foldGen (generate (<- x xs) (yield x)) (fn acc (fn x (+ acc x))) 0))))
  )");
  REQUIRE_FALSE(result);
  CHECK(result.error().is_cancelled());
}
