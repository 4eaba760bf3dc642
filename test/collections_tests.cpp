#include <catch2/catch_test_macros.hpp>

#include "test_helpers.hpp"

#include <fmt/format.h>

#include <string>
#include <string_view>

using effect_expr::to_string;

namespace {

std::string show(effect_expr::Runtime &runtime, std::string_view text)
{
  auto value = eval_text(runtime, text);
  if (!value) { FAIL(effect_expr::describe(value.error())); }
  return to_string(*value);
}

std::string failure(effect_expr::Runtime &runtime, std::string_view text)
{
  auto value = eval_text(runtime, text);
  REQUIRE_FALSE(value);
  return effect_expr::describe(value.error());
}

}// namespace

TEST_CASE("Map", "[collections][map]")
{
  auto runtime = make_runtime();

  CHECK(show(runtime, "(Map.size (Map.insert \"b\" 2 (Map.insert \"a\" 1 Map.empty)))") == "2");
  CHECK(show(runtime, "(Map.get \"a\" (Map.insert \"a\" 1 Map.empty))") == "Some 1");
  CHECK(show(runtime, "(Map.get \"z\" (Map.insert \"a\" 1 Map.empty))") == "None");
  CHECK(show(runtime, "(Map.has \"a\" (Map.remove \"a\" (Map.insert \"a\" 1 Map.empty)))") == "False");
  CHECK(show(runtime, "(Map.insert \"a\" 1 Map.empty)") == "<map:1>");

  SECTION("entries come out in key order")
  {
    const std::string_view pairs = "(Map.fromList (list (tuple \"b\" 2) (tuple \"a\" 1)))";
    CHECK(show(runtime, fmt::format("(Map.keys {})", pairs)) == "[a, b]");
    CHECK(show(runtime, fmt::format("(Map.values {})", pairs)) == "[1, 2]");
    CHECK(show(runtime, fmt::format("(Map.entries {})", pairs)) == "[(a, 1), (b, 2)]");
    CHECK(show(runtime, fmt::format("(Map.toList {})", pairs)) == "[(a, 1), (b, 2)]");
  }

  SECTION("update applies the function to an existing entry only")
  {
    CHECK(show(runtime, "(Map.values (Map.update \"a\" (fn v (+ v 10)) (Map.fromList (list (tuple \"a\" 1)))))")
          == "[11]");
    CHECK(show(runtime, "(Map.size (Map.update \"z\" (fn v (+ v 10)) (Map.fromList (list (tuple \"a\" 1)))))") == "1");
  }

  SECTION("union prefers the right side")
  {
    CHECK(show(runtime, R"((Map.get "a" (Map.union (Map.fromList (list (tuple "a" 1) (tuple "b" 1)))
                                                    (Map.fromList (list (tuple "a" 2))))))")
          == "Some 2");
  }

  SECTION("malformed input")
  {
    CHECK(failure(runtime, "(Map.fromList (list 1 2))") == "map.fromList expects List (k, v)");
    CHECK(failure(runtime, "(Map.insert (fn x x) 1 Map.empty)") == "map.insert expects a hashable key, got <closure>");
    CHECK(failure(runtime, "(Map.size (list))") == "map.size expects Map, got []");
  }

  SECTION("maps can be used as index targets")
  {
    CHECK(show(runtime, "(index (Map.insert 3 \"three\" Map.empty) 3)") == "three");
  }
}

TEST_CASE("Set", "[collections][set]")
{
  auto runtime = make_runtime();

  CHECK(show(runtime, "(Set.toList (Set.fromList (list 3 1 3 2)))") == "[1, 2, 3]");
  CHECK(show(runtime, "(Set.size (Set.insert 1 (Set.insert 1 Set.empty)))") == "1");
  CHECK(show(runtime, "(Set.has 2 (Set.fromList (list 1 2)))") == "True");
  CHECK(show(runtime, "(Set.has 2 (Set.remove 2 (Set.fromList (list 1 2))))") == "False");

  const auto combined = [&](std::string_view operation) {
    return show(runtime,
      fmt::format("(Set.toList ({} (Set.fromList (list 1 2 3)) (Set.fromList (list 2 3 4))))", operation));
  };
  CHECK(combined("Set.union") == "[1, 2, 3, 4]");
  CHECK(combined("Set.intersection") == "[2, 3]");
  CHECK(combined("Set.difference") == "[1]");
}

TEST_CASE("Queue and Deque", "[collections][queue]")
{
  auto runtime = make_runtime();

  CHECK(show(runtime, "(Queue.dequeue (Queue.enqueue 2 (Queue.enqueue 1 Queue.empty)))") == "Some (1, <queue:1>)");
  CHECK(show(runtime, "(Queue.dequeue Queue.empty)") == "None");
  CHECK(show(runtime, "(Queue.peek (Queue.fromList (list 7 8)))") == "Some 7");
  CHECK(show(runtime, "(Queue.toList (Queue.enqueue 3 (Queue.fromList (list 1 2))))") == "[1, 2, 3]");

  CHECK(show(runtime, "(Deque.toList (Deque.pushFront 0 (Deque.pushBack 2 (Deque.fromList (list 1)))))") == "[0, 1, 2]");
  CHECK(show(runtime, "(Deque.popBack (Deque.fromList (list 1 2 3)))") == "Some (3, <deque:2>)");
  CHECK(show(runtime, "(Deque.popFront (Deque.fromList (list 1 2 3)))") == "Some (1, <deque:2>)");
  CHECK(show(runtime, "(Deque.peekBack (Deque.fromList (list 1 2 3)))") == "Some 3");
  CHECK(show(runtime, "(Deque.peekFront Deque.empty)") == "None");

  CHECK(failure(runtime, "(Queue.size Deque.empty)") == "queue.size expects Queue, got <deque:0>");
}

TEST_CASE("Heap", "[collections][heap]")
{
  auto runtime = make_runtime();

  CHECK(show(runtime, "(Heap.toList (Heap.fromList (list 5 1 3 1)))") == "[1, 1, 3, 5]");
  CHECK(show(runtime, "(Heap.popMin (Heap.fromList (list 5 1 3)))") == "Some (1, <heap:2>)");
  CHECK(show(runtime, "(Heap.peekMin (Heap.push 4 (Heap.push 9 Heap.empty)))") == "Some 4");
  CHECK(show(runtime, "(Heap.peekMin Heap.empty)") == "None");
  CHECK(show(runtime, "(Heap.size (Heap.push 1 (Heap.push 1 Heap.empty)))") == "2");
}

TEST_CASE("collections record holds the same modules", "[collections]")
{
  auto runtime = make_runtime();
  CHECK(show(runtime, "(collections.map.size (collections.map.insert 1 2 collections.map.empty))") == "1");
  CHECK(show(runtime, "(collections.heap.toList (Heap.fromList (list 2 1)))") == "[1, 2]");
}

TEST_CASE("BigInt", "[numeric][bigint]")
{
  auto runtime = make_runtime();

  CHECK(show(runtime, "(bigint.toText (bigint.mul (bigint.fromText \"123456789012345678901234567890\") (bigint.fromInt 10)))")
        == "1234567890123456789012345678900");
  CHECK(show(runtime, "(bigint.add (bigint.fromInt 9223372036854775807) (bigint.fromInt 1))") == "9223372036854775808");
  CHECK(show(runtime, "(bigint.fromText \"-42\")") == "-42");
  CHECK(failure(runtime, "(bigint.fromText \"12a\")") == "invalid bigint literal: 12a");
  CHECK(failure(runtime, "(bigint.add 1 2)") == "bigint.add expects BigInt, got 1");
}

TEST_CASE("Rational", "[numeric][rational]")
{
  auto runtime = make_runtime();

  CHECK(show(runtime, "(rational.add (rational.fromInts 1 3) (rational.fromInts 1 6))") == "1/2");
  CHECK(show(runtime, "(rational.fromInts 4 -8)") == "-1/2");
  CHECK(show(runtime, "(== (rational.fromInts 2 4) (rational.fromInts 1 2))") == "True");
  CHECK(failure(runtime, "(rational.fromInts 1 0)") == "rational.fromInts: zero denominator");
}

TEST_CASE("Decimal", "[numeric][decimal]")
{
  auto runtime = make_runtime();

  CHECK(show(runtime, "(decimal.toText (decimal.add (decimal.fromText \"1.25\") (decimal.fromText \"0.5\")))") == "1.75");
  CHECK(show(runtime, "(decimal.fromText \"-0.05\")") == "-0.05");
  CHECK(show(runtime, "(== (decimal.fromText \"1.50\") (decimal.fromText \"1.5\"))") == "True");
  CHECK(failure(runtime, "(decimal.fromText \"1.\")") == "invalid decimal literal: 1.");
  CHECK(failure(runtime, "(decimal.fromText \"abc\")") == "invalid decimal literal: abc");
}
