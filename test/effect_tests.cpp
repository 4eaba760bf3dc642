#include <catch2/catch_test_macros.hpp>

#include "test_helpers.hpp"

#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using effect_expr::make_int;
using effect_expr::make_text;
using effect_expr::to_string;
using effect_expr::values_equal;

namespace {

// records the order in which log effects run
struct EventLog
{
  std::mutex mutex;
  std::vector<std::string> events;
};

effect_expr::Value logging_builtin(std::shared_ptr<EventLog> log)
{
  return effect_expr::make_builtin(
    "log", 1, [log](effect_expr::ValueVector args, effect_expr::Runtime &) -> effect_expr::Result<effect_expr::Value> {
      return effect_expr::make_effect(
        [log, text = to_string(args[0])](effect_expr::Runtime &) -> effect_expr::Result<effect_expr::Value> {
          const std::scoped_lock lock(log->mutex);
          log->events.push_back(text);
          return effect_expr::unit();
        });
    });
}

// swaps std::cout for a string buffer while alive
class CaptureStdout
{
public:
  CaptureStdout() : previous_(std::cout.rdbuf(buffer_.rdbuf())) {}
  CaptureStdout(const CaptureStdout &) = delete;
  CaptureStdout &operator=(const CaptureStdout &) = delete;
  ~CaptureStdout() { std::cout.rdbuf(previous_); }

  [[nodiscard]] std::string text() const { return buffer_.str(); }

private:
  std::ostringstream buffer_;
  std::streambuf *previous_;
};

}// namespace

TEST_CASE("bind sequences effects", "[effect]")
{
  CHECK(run_to<std::int64_t>("(def main (bind (pure 1) (fn x (pure (+ x 1)))))") == 2);
}

TEST_CASE("fail carries its payload", "[effect]")
{
  auto result = run_text("(def main (fail \"boom\"))");
  REQUIRE_FALSE(result);
  REQUIRE(result.error().is_error());
  CHECK(values_equal(result.error().payload, make_text("boom")));
}

TEST_CASE("attempt turns failures into Err", "[effect][attempt]")
{
  CHECK(run_to<std::string>(R"(
    (def main
      (bind (attempt (fail "boom"))
        (fn r (match r ((Ok v) (pure v)) ((Err e) (pure e))))))
  )") == "boom");

  auto ok = run_text("(def main (attempt (pure 1)))");
  REQUIRE(ok);
  CHECK(to_string(*ok) == "Ok 1");
}

TEST_CASE("attempt does not catch cancellation or internal errors", "[effect][attempt]")
{
  auto internal = run_text("(def main (attempt (effect (pure (/ 1 0)))))");
  REQUIRE_FALSE(internal);
  CHECK(internal.error().is_message());
  CHECK(internal.error().text == "division by zero");

  auto cancelled = effect_expr::make_effect(
    [](effect_expr::Runtime &) -> effect_expr::Result<effect_expr::Value> {
      return std::unexpected(effect_expr::RuntimeError::cancelled());
    });
  auto runtime = make_runtime({ { "stop", cancelled } });
  auto result = run_effect_text(runtime, "(attempt stop)");
  REQUIRE_FALSE(result);
  CHECK(result.error().is_cancelled());
}

TEST_CASE("building an effect runs nothing", "[effect]")
{
  auto counter = make_counter();
  auto runtime = make_runtime({ { "tick", counting_builtin(counter) } });

  auto effect = eval_text(runtime, "(bind (fail 1) tick)");
  REQUIRE(effect);
  CHECK(effect->holds<effect_expr::EffectPtr>());
  CHECK(*counter == 0);

  auto result = runtime.run_effect_value(*effect);
  REQUIRE_FALSE(result);
  CHECK(values_equal(result.error().payload, make_int(1)));
  CHECK(*counter == 0);
}

TEST_CASE("load accepts only effects", "[effect]")
{
  auto runtime = make_runtime();
  auto rejected = eval_text(runtime, "(load 1)");
  REQUIRE_FALSE(rejected);
  CHECK(rejected.error().text == "load expects an Effect");

  auto loaded = run_effect_text(runtime, "(load (pure 3))");
  REQUIRE(loaded);
  CHECK(values_equal(*loaded, make_int(3)));
}

TEST_CASE("print and println write when run", "[effect][io]")
{
  auto runtime = make_runtime();
  CaptureStdout capture;

  auto effect = eval_text(runtime, "(println (list 1 2))");
  REQUIRE(effect);
  CHECK(capture.text().empty());

  REQUIRE(runtime.run_effect_value(*effect));
  REQUIRE(run_effect_text(runtime, "(print \"a\")"));
  REQUIRE(run_effect_text(runtime, "(print \"b\")"));
  CHECK(capture.text() == "[1, 2]\nab");
}

TEST_CASE("effect blocks", "[effect][block]")
{
  CHECK(run_to<std::int64_t>(R"(
    (def main
      (effect
        (<- x (pure 20))
        (<- y (+ x 1))
        (<- (tuple a b) (pure (tuple 1 y)))
        (pure (+ a b))))
  )") == 22);

  auto not_effect = run_text("(def main (effect (pure 1) 2))");
  REQUIRE_FALSE(not_effect);
  CHECK(not_effect.error().text == "expected Effect in effect block, got 2");

  auto mismatch = run_text("(def main (effect (<- (Some x) (pure None)) (pure x)))");
  REQUIRE_FALSE(mismatch);
  CHECK(mismatch.error().text == "pattern match failed in effect binding");

  auto runtime = make_runtime();
  auto direct = runtime.run_effect_value(make_int(1));
  REQUIRE_FALSE(direct);
  CHECK(direct.error().text == "expected Effect, got 1");
}

TEST_CASE("resources release after the block", "[effect][resource]")
{
  auto opened = make_counter();
  auto closed = make_counter();
  auto runtime = make_runtime({ { "opened", counting_effect(opened) }, { "closed", counting_effect(closed) } });

  auto success = run_effect_text(runtime, "(effect (<- r (resource opened (yield 5) closed)) (pure r))");
  REQUIRE(success);
  CHECK(values_equal(*success, make_int(5)));
  CHECK(*opened == 1);
  CHECK(*closed == 1);

  auto failure = run_effect_text(runtime, "(effect (<- r (resource opened (yield 5) closed)) (fail \"oops\"))");
  REQUIRE_FALSE(failure);
  CHECK(values_equal(failure.error().payload, make_text("oops")));
  CHECK(*opened == 2);
  CHECK(*closed == 2);
}

TEST_CASE("resources release when cancelled", "[effect][resource][cancel]")
{
  auto closed = make_counter();
  auto spins = make_counter();
  auto runtime = make_runtime({ { "closed", counting_effect(closed) }, { "spin", spinner(spins) } });

  auto effect = eval_text(runtime, "(effect (<- r (resource (yield 1) closed)) spin)");
  REQUIRE(effect);

  auto token = effect_expr::CancelToken::child(runtime.cancel_token());
  effect_expr::Result<effect_expr::Value> result = effect_expr::unit();
  std::thread worker([&] {
    effect_expr::Runtime cancellable{ runtime.context(), token };
    result = cancellable.run_effect_value(*effect);
  });
  const bool started = eventually([&] { return *spins > 0; });
  token->cancel();
  worker.join();
  REQUIRE(started);

  REQUIRE_FALSE(result);
  CHECK(result.error().is_cancelled());
  CHECK(*closed == 1);
}

TEST_CASE("releases run in reverse order", "[effect][resource]")
{
  auto log = std::make_shared<EventLog>();
  auto runtime = make_runtime({ { "log", logging_builtin(log) } });

  auto result = run_effect_text(runtime, R"(
    (effect
      (<- a (resource (log "open a") (yield "a") (log "close a")))
      (<- b (resource (log "open b") (yield "b") (log "close b")))
      (log (text "use " a b)))
  )");
  REQUIRE(result);
  CHECK(log->events == std::vector<std::string>{ "open a", "open b", "use ab", "close b", "close a" });
}

TEST_CASE("a failing release does not stop the others", "[effect][resource]")
{
  auto closed = make_counter();
  auto runtime = make_runtime({ { "closed", counting_effect(closed) } });

  auto result = run_effect_text(runtime, R"(
    (effect
      (<- a (resource (yield 1) closed))
      (<- b (resource (yield 2) (fail "release failed")))
      (pure (+ a b)))
  )");
  REQUIRE_FALSE(result);
  CHECK(values_equal(result.error().payload, make_text("release failed")));
  CHECK(*closed == 1);

  auto earlier = run_effect_text(runtime, R"(
    (effect
      (<- b (resource (yield 2) (fail "release failed")))
      (fail "body failed"))
  )");
  REQUIRE_FALSE(earlier);
  CHECK(values_equal(earlier.error().payload, make_text("body failed")));
}

TEST_CASE("a resource without yield", "[effect][resource]")
{
  auto result = run_text("(def main (effect (<- r (resource (pure 1))) (pure r)))");
  REQUIRE_FALSE(result);
  CHECK(result.error().text == "resource block missing yield");
}

TEST_CASE("assertEq", "[effect]")
{
  auto runtime = make_runtime();
  REQUIRE(run_effect_text(runtime, "(assertEq (list 1 2) (list 1 2))"));

  auto failed = run_effect_text(runtime, "(assertEq 1 2)");
  REQUIRE_FALSE(failed);
  CHECK(values_equal(failed.error().payload, make_text("assertEq failed: left=1, right=2")));
}

TEST_CASE("map and chain over containers", "[effect][builtin]")
{
  auto runtime = make_runtime();
  const auto check = [&](std::string_view text, std::string_view expected) {
    auto value = eval_text(runtime, text);
    REQUIRE(value);
    CHECK(to_string(*value) == expected);
  };

  check("(map (fn x (* x 2)) (list 1 2 3))", "[2, 4, 6]");
  check("(map (fn x (* x 2)) (Some 4))", "Some 8");
  check("(map (fn x (* x 2)) None)", "None");
  check("(map (fn x (* x 2)) (Err \"e\"))", "Err e");
  check("(chain (fn x (list x x)) (list 1 2))", "[1, 1, 2, 2]");
  check("(chain (fn x (Ok (+ x 1))) (Ok 1))", "Ok 2");

  auto wrong = eval_text(runtime, "(map (fn x x) 3)");
  REQUIRE_FALSE(wrong);
  CHECK(wrong.error().text == "map expects List/Option/Result, got 3");
}
