#pragma once
#ifndef _STRATA_NOTIFY_SIGNAL_H_
#define _STRATA_NOTIFY_SIGNAL_H_
#include <asio/any_io_executor.hpp>
#include <asio/as_tuple.hpp>
#include <asio/awaitable.hpp>
#include <asio/experimental/awaitable_operators.hpp>
#include <asio/post.hpp>
#include <asio/steady_timer.hpp>
#include <asio/use_awaitable.hpp>
#include <atomic>
#include <chrono>
#include <memory>

#include "basic/utility_macros.h"
#include "coroutine/coro_types.h"
#include "error/coro_error.h"
#include "error/expected.h"

namespace strata::coro {

// notify_signal is a one-shot event that wakes every waiter, the ones already
// suspended and the ones arriving later. Nothing is ever sent on the
// underlying channel; closing it is the notification.
//
// fire() may be called from any thread, the close itself runs on the
// channel's executor. Waiters must run on that executor (or a strand of it).
class notify_signal : public std::enable_shared_from_this<notify_signal> {
  NOT_COPYABLE_NOT_MOVABLE(notify_signal)

 public:
  explicit notify_signal(asio::any_io_executor executor) : chan_(executor) {}

  static std::shared_ptr<notify_signal> make(asio::any_io_executor executor) {
    return std::make_shared<notify_signal>(executor);
  }

  // fire returns false if the signal had already been fired.
  bool fire() {
    if (fired_.exchange(true)) {
      return false;
    }
    asio::post(chan_.get_executor(), [self = shared_from_this()]() { self->chan_.close(); });
    return true;
  }

  bool fired() const { return fired_.load(); }

  asio::awaitable<void> async_wait() {
    // the channel never carries a value, the only completion is the close.
    auto [ec] = co_await chan_.async_receive(asio::as_tuple(asio::use_awaitable));
    STRATA_UNUSED(ec);
    co_return;
  }

  asio::awaitable<expected<void>> async_wait_for(std::chrono::steady_clock::duration timeout) {
    using namespace asio::experimental::awaitable_operators;
    asio::steady_timer timer(chan_.get_executor(), timeout);
    auto result = co_await (async_wait() || timer.async_wait(asio::as_tuple(asio::use_awaitable)));
    if (result.index() == 0) {
      co_return ok();
    }
    co_return tl::unexpected(make_error_code(coro_error::TIMEOUT));
  }

 private:
  signal_channel chan_;
  std::atomic<bool> fired_{false};
};

using notify_signal_handle = std::shared_ptr<notify_signal>;

}  // namespace strata::coro

#endif  // _STRATA_NOTIFY_SIGNAL_H_
