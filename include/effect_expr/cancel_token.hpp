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

#ifndef EFFECT_EXPR_CANCEL_TOKEN_HPP
#define EFFECT_EXPR_CANCEL_TOKEN_HPP

#include <atomic>
#include <chrono>
#include <memory>

namespace effect_expr {

// upper bound on how long any blocking wait goes without re-checking cancellation
inline constexpr std::chrono::milliseconds default_poll_interval{ 25 };

class CancelToken;
using CancelTokenPtr = std::shared_ptr<CancelToken>;

// A node in the cancellation tree. Cancelling a node is visible to the node and
// everything below it, never to its parent or siblings.
class CancelToken
{
public:
  explicit CancelToken(CancelTokenPtr parent = nullptr) noexcept : parent_(std::move(parent)) {}

  [[nodiscard]] static CancelTokenPtr root() { return std::make_shared<CancelToken>(); }
  [[nodiscard]] static CancelTokenPtr child(CancelTokenPtr parent)
  {
    return std::make_shared<CancelToken>(std::move(parent));
  }

  void cancel() noexcept { local_.store(true, std::memory_order_release); }

  [[nodiscard]] bool is_cancelled() const noexcept
  {
    for (const CancelToken *token = this; token != nullptr; token = token->parent_.get()) {
      if (token->local_.load(std::memory_order_acquire)) { return true; }
    }
    return false;
  }

  [[nodiscard]] const CancelTokenPtr &parent() const noexcept { return parent_; }

private:
  std::atomic<bool> local_{ false };
  CancelTokenPtr parent_;
};

}// namespace effect_expr

#endif
