#pragma once
#ifndef _STRATA_CORO_ERROR_H_
#define _STRATA_CORO_ERROR_H_

#include <string>
#include <system_error>

#include "error/base_error_category.h"
namespace strata {

// coro_error is what the awaitable helpers in coroutine/ complete with.
enum class coro_error {
  // the result channel was closed before a value was delivered.
  CHANNEL_CLOSED = 1,
  // a notify_signal did not fire within the wait.
  TIMEOUT,
};

class coro_error_category : public base_error_category {
 public:
  const char* name() const noexcept override { return "coro_error"; }

  std::string message(int ev) const override {
    switch (static_cast<coro_error>(ev)) {
      case coro_error::CHANNEL_CLOSED:
        return "result channel closed without a value";
      case coro_error::TIMEOUT:
        return "signal wait timed out";
      default:
        return "unrecognized coroutine error";
    }
  }
};

inline const coro_error_category& get_coro_error_category() {
  static coro_error_category instance;
  return instance;
}

inline std::error_code make_error_code(coro_error e) { return {static_cast<int>(e), get_coro_error_category()}; }
}  // namespace strata

namespace std {

template <>
struct is_error_code_enum<strata::coro_error> : true_type {};
}  // namespace std

#endif  // _STRATA_CORO_ERROR_H_
