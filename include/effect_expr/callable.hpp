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

#ifndef EFFECT_EXPR_CALLABLE_HPP
#define EFFECT_EXPR_CALLABLE_HPP

#include "environment.hpp"
#include "expr.hpp"
#include "value.hpp"

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <variant>

namespace effect_expr {

class Runtime;

using NativeFunction = std::function<Result<Value>(ValueVector args, Runtime &runtime)>;
using NativeEffect = std::function<Result<Value>(Runtime &runtime)>;

struct BuiltinImpl
{
  std::string name;
  std::size_t arity{ 0 };
  NativeFunction function;
};

struct Closure
{
  PatternPtr parameter;
  ExprPtr body;
  Env env;
};

struct Effect
{
  struct Block
  {
    Env env;
    BlockItems items;
  };

  std::variant<Block, NativeEffect> body;
};

// items up to the first yield acquire, the items after it release
struct Resource
{
  Env env;
  BlockItems items;
};

// A deferred, memoized computation. Forced by Runtime::force, at most one thread
// evaluates it and every later reader gets the cached result.
class Thunk
{
public:
  Thunk(ExprPtr expr, Env env) : expr_(std::move(expr)), env_(std::move(env)) {}

private:
  friend class Runtime;

  enum struct State : std::uint8_t { pending, in_progress, done };

  ExprPtr expr_;
  Env env_;
  std::mutex mutex_;
  std::condition_variable finished_;
  State state_{ State::pending };
  std::thread::id owner_;
  std::optional<Result<Value>> result_;
};

[[nodiscard]] inline Value make_builtin(std::string name, std::size_t arity, NativeFunction function)
{
  return Value{ Builtin{ std::make_shared<const BuiltinImpl>(BuiltinImpl{ std::move(name), arity, std::move(function) }),
    share({}) } };
}

[[nodiscard]] inline Value make_effect(NativeEffect effect)
{
  return Value{ std::make_shared<const Effect>(Effect{ std::move(effect) }) };
}

[[nodiscard]] inline Value make_thunk(ExprPtr expr, Env env)
{
  return Value{ std::make_shared<Thunk>(std::move(expr), std::move(env)) };
}

}// namespace effect_expr

#endif
