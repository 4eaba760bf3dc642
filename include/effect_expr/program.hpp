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

#ifndef EFFECT_EXPR_PROGRAM_HPP
#define EFFECT_EXPR_PROGRAM_HPP

#include "builtins.hpp"
#include "callable.hpp"
#include "cancel_token.hpp"
#include "environment.hpp"
#include "expr.hpp"
#include "runtime.hpp"
#include "utility.hpp"
#include "value.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace effect_expr {

struct TestFailure
{
  std::string name;
  std::string message;
};

struct TestReport
{
  std::size_t passed{ 0 };
  std::size_t failed{ 0 };
  std::vector<TestFailure> failures;
};

// Loads the definition table into a sealed global scope. Builtins are installed
// first, then the host's natives, and a definition with a name already taken by
// either is skipped. Each definition is a lazily evaluated thunk, a name defined
// more than once becomes a multi-clause function of its thunks in definition order.
[[nodiscard]] inline Result<Runtime> build_runtime(const Program &program,
  RuntimeConfig config = {},
  std::optional<std::uint64_t> fuel = std::nullopt,
  Bindings natives = {})
{
  if (program.definitions.empty()) { return std::unexpected(RuntimeError::message("no definitions to run")); }

  auto globals = Environment::make();
  if (auto installed = register_builtins(*globals); !installed) { return std::unexpected(installed.error()); }
  if (auto installed = globals->set_all(std::move(natives)); !installed) { return std::unexpected(installed.error()); }

  std::vector<std::string> order;
  std::map<std::string, ValueVector, std::less<>> clauses;
  for (const auto &definition : program.definitions) {
    if (!clauses.contains(definition.name) && globals->contains(definition.name)) {
      spdlog::debug("definition '{}' shadows a builtin and is ignored", definition.name);
      continue;
    }
    auto &thunks = clauses[definition.name];
    if (thunks.empty()) { order.push_back(definition.name); }
    thunks.push_back(make_thunk(definition.expr, globals));
  }

  Bindings definitions;
  for (const auto &name : order) {
    auto &thunks = clauses[name];
    if (thunks.size() == 1) {
      definitions.emplace_back(name, std::move(thunks.front()));
    } else {
      definitions.emplace_back(name, Value{ MultiClause{ share(std::move(thunks)) } });
    }
  }
  if (auto installed = globals->set_all(std::move(definitions)); !installed) {
    return std::unexpected(installed.error());
  }
  globals->seal();

  return Runtime{ make_context(std::move(globals), config), CancelToken::root(), fuel };
}

namespace detail {
  // Runs one top-level effect under the runtime's root token. The root is cancelled
  // on the way out, which stops detached tasks hanging off it.
  [[nodiscard]] inline Result<Value> run_root_effect(Runtime &runtime, const Value &entry, std::string_view name)
  {
    auto value = runtime.force(entry);
    if (value && !value->holds<EffectPtr>()) {
      value = std::unexpected(
        RuntimeError::message(fmt::format("{} must be an Effect value, got {}", name, to_string(*value))));
    }
    if (value) { value = runtime.run_effect_value(*value); }
    runtime.cancel_token()->cancel();
    return value;
  }

  [[nodiscard]] inline Result<Value> run_entry(Runtime &runtime, std::string_view name)
  {
    auto entry = runtime.globals()->get(name);
    if (!entry) { return std::unexpected(RuntimeError::message(fmt::format("missing {} definition", name))); }
    return run_root_effect(runtime, *entry, name);
  }
}// namespace detail

// runs main and returns its result or its failure
[[nodiscard]] inline Result<Value> run(const Program &program, RuntimeConfig config = {}, Bindings natives = {})
{
  auto runtime = build_runtime(program, config, std::nullopt, std::move(natives));
  if (!runtime) { return std::unexpected(runtime.error()); }
  return detail::run_entry(*runtime, "main");
}

// An empty optional means the budget ran out before main finished.
[[nodiscard]] inline Result<std::optional<Value>>
  run_with_fuel(const Program &program, std::uint64_t budget, RuntimeConfig config = {}, Bindings natives = {})
{
  auto runtime = build_runtime(program, config, budget, std::move(natives));
  if (!runtime) { return std::unexpected(runtime.error()); }

  auto result = detail::run_entry(*runtime, "main");
  if (result) { return std::optional<Value>{ std::move(*result) }; }
  if (result.error().is_cancelled()) {
    spdlog::debug("fuel budget of {} steps exhausted", budget);
    return std::optional<Value>{};
  }
  return std::unexpected(std::move(result.error()));
}

// Every named test runs as its own effect under its own root token, a failing
// test never stops the suite.
[[nodiscard]] inline Result<TestReport> run_test_suite(const Program &program,
  const std::vector<std::string> &names,
  RuntimeConfig config = {},
  Bindings natives = {})
{
  auto runtime = build_runtime(program, config, std::nullopt, std::move(natives));
  if (!runtime) { return std::unexpected(runtime.error()); }

  TestReport report;
  for (const auto &name : names) {
    auto entry = runtime->globals()->get(name);
    std::optional<std::string> failure;
    if (!entry) {
      failure = "missing definition";
    } else {
      Runtime test_runtime{ runtime->context(), CancelToken::root() };
      if (auto result = detail::run_root_effect(test_runtime, *entry, "test"); !result) {
        failure = describe(result.error());
      }
    }

    if (failure) {
      spdlog::debug("test '{}' failed: {}", name, *failure);
      ++report.failed;
      report.failures.push_back(TestFailure{ name, std::move(*failure) });
    } else {
      ++report.passed;
    }
  }
  return report;
}

}// namespace effect_expr

#endif
