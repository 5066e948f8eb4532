#pragma once
#ifndef _STRATA_ERROR_H_
#define _STRATA_ERROR_H_
#include <asio/error_code.hpp>
#include <source_location>
#include <string>
#include <system_error>
#include <tl/expected.hpp>
#include <utility>

#include "error/leaf.h"  // IWYU pragma: keep

namespace strata {

template <typename T>
concept can_make_error_code = requires(T t) {
  // 关键：通过 ADL 找到自定义 std::error_code 里的 make_error_code 函数定义
  { make_error_code(t) } -> std::same_as<std::error_code>;
};

template <typename T>
concept strata_err_types = can_make_error_code<T> || std::is_error_code_enum_v<T>;

template <typename T>
concept err_types = strata_err_types<T> || std::is_same_v<T, std::error_code> || std::is_same_v<T, asio::error_code>;

// strata_error is the error object every synchronous API raises through
// boost::leaf. message carries the details a category message can not know,
// e.g. the name of a conflicting field.
struct strata_error {
  std::error_code err_code;
  std::string message;
  std::source_location location;

  strata_error(std::error_code code, std::source_location location) : err_code(code), location(location) {}

  strata_error(std::error_code code, std::string msg, std::source_location location)
      : err_code(code), message(std::move(msg)), location(location) {}

  template <strata_err_types err_type>
  strata_error(err_type code, std::source_location location) : err_code(make_error_code(code)), location(location) {}

  template <strata_err_types err_type>
  strata_error(err_type code, std::string msg, std::source_location location)
      : err_code(make_error_code(code)), message(std::move(msg)), location(location) {}

  // what returns the message when present and the category message otherwise.
  std::string what() const {
    if (message.empty()) {
      return err_code.message();
    }
    return message;
  }
};

template <err_types err_type>
bool operator==(const strata_error& error, const err_type& code) {
  return error.err_code == code;
}

template <err_types err_type>
bool operator==(const err_type& code, const strata_error& error) {
  return code == error.err_code;
}

inline bool operator==(const strata_error& error, const std::error_code& code) { return error.err_code == code; }

inline bool operator==(const std::error_code& code, const strata_error& error) { return code == error.err_code; }

template <err_types error_code_type, typename error_msg_type>
auto new_error(error_code_type code, error_msg_type&& msg,
               std::source_location location = std::source_location::current()) {
  return boost::leaf::new_error(
      strata_error{code, std::string(std::forward<error_msg_type>(msg)), std::move(location)});
}

template <err_types error_code_type>
auto new_error(error_code_type code, std::source_location location = std::source_location::current()) {
  return boost::leaf::new_error(strata_error{code, std::move(location)});
}

inline auto new_error(const strata::strata_error& err) { return boost::leaf::new_error(err); }

template <err_types error_code_type>
inline auto unexpected(error_code_type error_code) {
  return tl::unexpected(make_error_code(error_code));
}

}  // namespace strata

#endif  // _STRATA_ERROR_H_
