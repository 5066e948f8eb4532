#pragma once
#ifndef _STRATA_LOGIC_ERROR_H_
#define _STRATA_LOGIC_ERROR_H_
#include <string>
#include <system_error>

#include "error/base_error_category.h"
namespace strata {

// logic_error reports a caller handing strata something it cannot use: a
// missing collaborator, an unknown or duplicate range, a bad config value.
enum class logic_error {
  NULL_POINTER = 1,
  KEY_NOT_FOUND,
  INVALID_PARAM,
  KEY_EXISTS,
};

class logic_error_category : public base_error_category {
 public:
  const char* name() const noexcept override { return "logic_error"; }

  std::string message(int ev) const override {
    switch (static_cast<logic_error>(ev)) {
      case logic_error::NULL_POINTER:
        return "required object is null";
      case logic_error::KEY_NOT_FOUND:
        return "no such key";
      case logic_error::INVALID_PARAM:
        return "invalid parameter";
      case logic_error::KEY_EXISTS:
        return "key already registered";
      default:
        return "unrecognized logic error";
    }
  }
};

inline const logic_error_category& get_logic_error_category() {
  static logic_error_category instance;
  return instance;
}

inline std::error_code make_error_code(logic_error e) { return {static_cast<int>(e), get_logic_error_category()}; }
}  // namespace strata

namespace std {

template <>
struct is_error_code_enum<strata::logic_error> : true_type {};
}  // namespace std

#endif  // _STRATA_LOGIC_ERROR_H_
