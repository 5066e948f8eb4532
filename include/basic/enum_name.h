#pragma once
#ifndef _STRATA_ENUM_NAME_H_
#define _STRATA_ENUM_NAME_H_
#include <magic_enum.hpp>
#include <string_view>

namespace strata {

template <typename T>
inline std::string_view enum_name(T value) {
  auto name = magic_enum::enum_name(value);
  if (name.empty()) {
    return "UNKNOWN";
  }
  return name;
}

}  // namespace strata

#endif  // _STRATA_ENUM_NAME_H_
