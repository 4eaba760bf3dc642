#include <effect_expr/effect_expr.hpp>
#include <iostream>

auto evaluate(std::string_view input)
{
  auto program = effect_expr::read_program(input);
  if (!program) {
    return effect_expr::Result<effect_expr::Value>{ std::unexpected(
      effect_expr::RuntimeError::message(effect_expr::describe(program.error()))) };
  }
  return effect_expr::run(*program);
}

int main()
{
  const auto result = evaluate(R"(
(def count
  (fn (tuple i max value)
    (if (> i max)
      value
      (count (tuple (+ i 1) max (+ value 1))))))

(def digits (list 0 1 2 3 4 5 6 7 8 9))

(def sum (fn gen (foldGen gen (fn acc (fn x (+ acc x))) 0)))

(def main
  (effect
    (println (count (tuple 1 1000 0)))
    (println (count (tuple -10 500 0)))
    (println (sum (generate (<- a digits) (<- b digits) (<- c digits) (<- d digits) (yield (+ a d)))))
    (println (sum (generate (<- a digits) (<- b digits) (<- c digits) (filter (== b c)) (yield a))))))
)");

  if (!result) {
    std::cerr << effect_expr::describe(result.error()) << '\n';
    return 1;
  }
}
