#pragma once
#ifndef _STRATA_CORO_TYPES_H_
#define _STRATA_CORO_TYPES_H_
#include <asio/experimental/channel.hpp>
namespace strata::coro {
template <typename T>
using channel = asio::experimental::channel<void(asio::error_code, T)>;

using signal_channel = asio::experimental::channel<void(asio::error_code)>;
}  // namespace strata::coro

#endif  // _STRATA_CORO_TYPES_H_
