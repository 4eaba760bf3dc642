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

#ifndef EFFECT_EXPR_ENVIRONMENT_HPP
#define EFFECT_EXPR_ENVIRONMENT_HPP

#include "value.hpp"

#include <fmt/format.h>

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace effect_expr {

class Environment;
using Env = std::shared_ptr<Environment>;

// pattern bindings, in binding order
using Bindings = std::vector<std::pair<std::string, Value>>;

// One scope in a chain of name -> value scopes. A scope never writes to its parent.
//
// The global scope is sealed once the program table has been loaded, after which it
// is read by every thread without taking the lock. Block scopes stay unsealed because
// a detached thread can hold a closure over a scope whose block is still binding names.
class Environment
{
public:
  explicit Environment(Env parent = nullptr) : parent_(std::move(parent)) {}

  [[nodiscard]] static Env make(Env parent = nullptr) { return std::make_shared<Environment>(std::move(parent)); }

  [[nodiscard]] static Env make(Env parent, Bindings bindings)
  {
    auto env = make(std::move(parent));
    for (auto &[name, value] : bindings) { env->values_.insert_or_assign(std::move(name), std::move(value)); }
    return env;
  }

  [[nodiscard]] std::optional<Value> get(std::string_view name) const
  {
    for (const Environment *scope = this; scope != nullptr; scope = scope->parent_.get()) {
      if (auto found = scope->get_local(name); found) { return found; }
    }
    return std::nullopt;
  }

  [[nodiscard]] bool contains(std::string_view name) const { return get(name).has_value(); }

  // readers of a sealed scope skip the lock, so it rejects every write
  [[nodiscard]] Result<void> set(std::string name, Value value)
  {
    std::unique_lock lock(mutex_);
    if (sealed_.load(std::memory_order_acquire)) {
      return std::unexpected(RuntimeError::message(fmt::format("cannot bind {} in a sealed scope", name)));
    }
    values_.insert_or_assign(std::move(name), std::move(value));
    return {};
  }

  [[nodiscard]] Result<void> set_all(Bindings bindings)
  {
    for (auto &[name, value] : bindings) {
      if (auto bound = set(std::move(name), std::move(value)); !bound) { return bound; }
    }
    return {};
  }

  void seal()
  {
    const std::unique_lock lock(mutex_);
    sealed_.store(true, std::memory_order_release);
  }

  [[nodiscard]] bool sealed() const noexcept { return sealed_.load(std::memory_order_acquire); }
  [[nodiscard]] const Env &parent() const noexcept { return parent_; }

private:
  [[nodiscard]] std::optional<Value> get_local(std::string_view name) const
  {
    if (sealed_.load(std::memory_order_acquire)) { return find(name); }
    std::shared_lock lock(mutex_);
    return find(name);
  }

  [[nodiscard]] std::optional<Value> find(std::string_view name) const
  {
    if (const auto found = values_.find(name); found != values_.end()) { return found->second; }
    return std::nullopt;
  }

  Env parent_;
  std::map<std::string, Value, std::less<>> values_;
  mutable std::shared_mutex mutex_;
  std::atomic<bool> sealed_{ false };
};

}// namespace effect_expr

#endif
