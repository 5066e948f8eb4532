#pragma once
#ifndef _STRATA_RESULT_CHANNEL_H_
#define _STRATA_RESULT_CHANNEL_H_
#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

#include "basic/utility_macros.h"
#include "coroutine/notify_signal.h"
#include "error/coro_error.h"
#include "error/expected.h"

namespace strata::coro {

// result_channel carries at most one value to any number of receivers.
// Receivers are released when the channel is closed; a receiver that arrives
// after the close still observes the value.
template <typename T>
class result_channel {
  NOT_COPYABLE_NOT_MOVABLE(result_channel)

 public:
  explicit result_channel(asio::any_io_executor executor) : closed_signal_(notify_signal::make(executor)) {}

  // try_send stores value unless a value was already sent or the channel is
  // closed.
  bool try_send(T value) {
    std::lock_guard<std::mutex> guard(mutex_);
    if (closed_ || value_.has_value()) {
      return false;
    }
    value_.emplace(std::move(value));
    return true;
  }

  void close() {
    {
      std::lock_guard<std::mutex> guard(mutex_);
      closed_ = true;
    }
    closed_signal_->fire();
  }

  bool is_closed() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return closed_;
  }

  std::optional<T> try_receive() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return value_;
  }

  asio::awaitable<expected<T>> async_receive() {
    co_await closed_signal_->async_wait();
    std::lock_guard<std::mutex> guard(mutex_);
    if (!value_.has_value()) {
      co_return tl::unexpected(make_error_code(coro_error::CHANNEL_CLOSED));
    }
    co_return *value_;
  }

 private:
  mutable std::mutex mutex_;
  bool closed_ = false;
  std::optional<T> value_;
  notify_signal_handle closed_signal_;
};

template <typename T>
using result_channel_handle = std::shared_ptr<result_channel<T>>;

}  // namespace strata::coro

#endif  // _STRATA_RESULT_CHANNEL_H_
