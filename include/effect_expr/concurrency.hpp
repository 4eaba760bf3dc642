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

#ifndef EFFECT_EXPR_CONCURRENCY_HPP
#define EFFECT_EXPR_CONCURRENCY_HPP

#include "callable.hpp"
#include "cancel_token.hpp"
#include "runtime.hpp"
#include "utility.hpp"
#include "value.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <array>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>

namespace effect_expr {

struct ChannelState
{
  std::mutex mutex;
  std::condition_variable available;
  std::deque<Value> queue;
  bool closed{ false };
  bool receiver_dropped{ false };
};

struct ChannelSend
{
  std::shared_ptr<ChannelState> state;
};

// dropping the last reference to the receive side makes further sends fail
struct ChannelRecv
{
  explicit ChannelRecv(std::shared_ptr<ChannelState> channel) : state(std::move(channel)) {}
  ChannelRecv(const ChannelRecv &) = delete;
  ChannelRecv &operator=(const ChannelRecv &) = delete;
  ~ChannelRecv()
  {
    const std::scoped_lock lock(state->mutex);
    state->receiver_dropped = true;
  }

  std::shared_ptr<ChannelState> state;
};

[[nodiscard]] inline Result<Value> channel_make(ValueVector, Runtime &)
{
  return make_effect([](Runtime &) -> Result<Value> {
    auto state = std::make_shared<ChannelState>();
    return make_tuple(
      { Value{ std::make_shared<ChannelSend>(ChannelSend{ state }) }, Value{ std::make_shared<ChannelRecv>(state) } });
  });
}

[[nodiscard]] inline Result<Value> channel_send(ValueVector args, Runtime &)
{
  const auto *sender = args[0].get_if<ChannelSendPtr>();
  if (sender == nullptr) {
    return std::unexpected(RuntimeError::message(fmt::format("channel.send expects a sender, got {}", to_string(args[0]))));
  }
  return make_effect([state = (*sender)->state, value = std::move(args[1])](Runtime &) -> Result<Value> {
    {
      const std::scoped_lock lock(state->mutex);
      if (state->closed || state->receiver_dropped) { return std::unexpected(RuntimeError::error(make_closed())); }
      state->queue.push_back(value);
    }
    state->available.notify_one();
    return unit();
  });
}

[[nodiscard]] inline Result<Value> channel_recv(ValueVector args, Runtime &)
{
  const auto *receiver = args[0].get_if<ChannelRecvPtr>();
  if (receiver == nullptr) {
    return std::unexpected(RuntimeError::message(fmt::format("channel.recv expects a receiver, got {}", to_string(args[0]))));
  }
  return make_effect([endpoint = *receiver](Runtime &runtime) -> Result<Value> {
    auto &state = *endpoint->state;
    std::unique_lock lock(state.mutex);
    while (true) {
      if (!state.queue.empty()) {
        Value value = std::move(state.queue.front());
        state.queue.pop_front();
        return make_ok(std::move(value));
      }
      if (state.closed) { return make_err(make_closed()); }
      if (auto ok = runtime.check_cancelled(); !ok) { return std::unexpected(ok.error()); }
      state.available.wait_for(lock, runtime.poll_interval());
    }
  });
}

[[nodiscard]] inline Result<Value> channel_close(ValueVector args, Runtime &)
{
  const auto *sender = args[0].get_if<ChannelSendPtr>();
  if (sender == nullptr) {
    return std::unexpected(RuntimeError::message(fmt::format("channel.close expects a sender, got {}", to_string(args[0]))));
  }
  return make_effect([state = (*sender)->state](Runtime &) -> Result<Value> {
    {
      const std::scoped_lock lock(state->mutex);
      state->closed = true;
    }
    state->available.notify_all();
    return unit();
  });
}

[[nodiscard]] inline Value channel_record()
{
  return make_record(RecordFields{ { "make", make_builtin("channel.make", 1, channel_make) },
    { "send", make_builtin("channel.send", 2, channel_send) },
    { "recv", make_builtin("channel.recv", 1, channel_recv) },
    { "close", make_builtin("channel.close", 1, channel_close) } });
}

// results posted by worker threads, tagged with the branch that produced them
class Mailbox
{
public:
  using Message = std::pair<std::size_t, Result<Value>>;

  void post(std::size_t branch, Result<Value> result)
  {
    {
      const std::scoped_lock lock(mutex_);
      messages_.emplace_back(branch, std::move(result));
    }
    ready_.notify_one();
  }

  [[nodiscard]] std::optional<Message> wait_for(std::chrono::milliseconds timeout)
  {
    std::unique_lock lock(mutex_);
    if (!ready_.wait_for(lock, timeout, [&] { return !messages_.empty(); })) { return std::nullopt; }
    Message message = std::move(messages_.front());
    messages_.pop_front();
    return message;
  }

private:
  std::mutex mutex_;
  std::condition_variable ready_;
  std::deque<Message> messages_;
};

// Two effects running on their own threads, each under its own child token.
// The right branch is started once the left one is running. The threads are
// always joined before the pair goes away.
class BranchPair
{
public:
  BranchPair(Runtime &runtime, const Value &left, const Value &right)
    : tokens_{ CancelToken::child(runtime.cancel_token()), CancelToken::child(runtime.cancel_token()) }
  {
    std::promise<void> left_running;
    auto running = left_running.get_future();
    workers_[0] = spawn(0, left, runtime.context(), std::move(left_running));
    running.wait();
    workers_[1] = spawn(1, right, runtime.context(), std::nullopt);
  }

  BranchPair(const BranchPair &) = delete;
  BranchPair &operator=(const BranchPair &) = delete;

  ~BranchPair() { join(); }

  void cancel(std::size_t branch) noexcept { tokens_[branch]->cancel(); }
  void cancel_all() noexcept
  {
    for (const auto &token : tokens_) { token->cancel(); }
  }

  [[nodiscard]] std::optional<Mailbox::Message> next(std::chrono::milliseconds timeout)
  {
    return mailbox_->wait_for(timeout);
  }

  void join()
  {
    for (auto &worker : workers_) {
      if (worker.joinable()) { worker.join(); }
    }
  }

private:
  [[nodiscard]] std::thread
    spawn(std::size_t branch, Value effect, ContextPtr context, std::optional<std::promise<void>> running)
  {
    return std::thread([branch,
                         effect = std::move(effect),
                         context = std::move(context),
                         token = tokens_[branch],
                         mailbox = mailbox_,
                         running = std::move(running)]() mutable {
      Runtime runtime{ context, token };
      if (running) { running->set_value(); }
      mailbox->post(branch, runtime.run_effect_value(effect));
    });
  }

  std::shared_ptr<Mailbox> mailbox_ = std::make_shared<Mailbox>();
  std::array<CancelTokenPtr, 2> tokens_;
  std::array<std::thread, 2> workers_;
};

[[nodiscard]] inline Result<Value> concurrent_scope(ValueVector args, Runtime &)
{
  return make_effect([effect = std::move(args[0])](Runtime &runtime) -> Result<Value> {
    auto token = CancelToken::child(runtime.cancel_token());
    auto result = runtime.with_token(token, [&](Runtime &scoped) { return scoped.run_effect_value(effect); });
    token->cancel();
    return result;
  });
}

[[nodiscard]] inline Result<Value> concurrent_par(ValueVector args, Runtime &)
{
  return make_effect([left = std::move(args[0]), right = std::move(args[1])](Runtime &runtime) -> Result<Value> {
    BranchPair branches(runtime, left, right);
    std::array<std::optional<Result<Value>>, 2> results;
    bool cancelled = false;

    while (!results[0] || !results[1]) {
      if (!cancelled && !runtime.check_cancelled()) {
        cancelled = true;
        branches.cancel_all();
      }
      auto message = branches.next(runtime.poll_interval());
      if (!message) { continue; }
      auto &[branch, result] = *message;
      if (!result) { branches.cancel(1 - branch); }
      results[branch] = std::move(result);
    }
    branches.join();

    if (cancelled) { return std::unexpected(RuntimeError::cancelled()); }

    auto &left_result = *results[0];
    auto &right_result = *results[1];
    if (left_result && right_result) { return make_tuple({ std::move(*left_result), std::move(*right_result) }); }
    // a branch cancelled because its sibling failed never hides the sibling's failure
    if (!left_result && (!left_result.error().is_cancelled() || right_result)) {
      return std::unexpected(std::move(left_result.error()));
    }
    return std::unexpected(std::move(right_result.error()));
  });
}

[[nodiscard]] inline Result<Value> concurrent_race(ValueVector args, Runtime &)
{
  return make_effect([left = std::move(args[0]), right = std::move(args[1])](Runtime &runtime) -> Result<Value> {
    BranchPair branches(runtime, left, right);
    std::optional<Result<Value>> winner;
    std::size_t pending = 2;
    bool cancelled = false;

    while (pending > 0) {
      if (!cancelled && !runtime.check_cancelled()) {
        cancelled = true;
        branches.cancel_all();
      }
      auto message = branches.next(runtime.poll_interval());
      if (!message) { continue; }
      --pending;
      if (!winner) {
        branches.cancel(1 - message->first);
        winner = std::move(message->second);
      }
    }
    // the loser has posted its result, so its thread is finishing
    branches.join();

    if (cancelled) { return std::unexpected(RuntimeError::cancelled()); }
    return std::move(*winner);
  });
}

// The detached task hangs off the parent of the current token, so it outlives
// the enclosing scope but not the one above it.
[[nodiscard]] inline Result<Value> concurrent_spawn_detached(ValueVector args, Runtime &)
{
  return make_effect([effect = std::move(args[0])](Runtime &runtime) -> Result<Value> {
    const auto &parent = runtime.cancel_token()->parent();
    auto token = CancelToken::child(parent ? parent : runtime.cancel_token());
    std::thread([effect, context = runtime.context(), token]() {
      Runtime detached{ context, token };
      if (auto result = detached.run_effect_value(effect); !result) {
        if (result.error().is_cancelled()) {
          spdlog::debug("detached task cancelled");
        } else {
          spdlog::warn("detached task failed: {}", describe(result.error()));
        }
      }
    }).detach();
    spdlog::debug("spawned detached task");
    return unit();
  });
}

[[nodiscard]] inline Value concurrent_record()
{
  return make_record(RecordFields{ { "scope", make_builtin("concurrent.scope", 1, concurrent_scope) },
    { "par", make_builtin("concurrent.par", 2, concurrent_par) },
    { "race", make_builtin("concurrent.race", 2, concurrent_race) },
    { "spawnDetached", make_builtin("concurrent.spawnDetached", 1, concurrent_spawn_detached) } });
}

}// namespace effect_expr

#endif
