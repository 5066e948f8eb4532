#pragma once
#ifndef _STRATA_STORAGE_ERROR_H_
#define _STRATA_STORAGE_ERROR_H_
#include <string>
#include <system_error>

#include "error/base_error_category.h"

namespace strata {

enum class storage_error {
  // the engine failed to write a batch.
  WRITE_FAILED = 1,
  // a stored value could not be decoded into its protobuf message.
  DECODE_FAILED,
};

class storage_error_category : public base_error_category {
 public:
  const char* name() const noexcept override { return "storage_error"; }

  std::string message(int ev) const override {
    switch (static_cast<storage_error>(ev)) {
      case storage_error::WRITE_FAILED:
        return "engine: write batch failed";
      case storage_error::DECODE_FAILED:
        return "engine: stored value could not be decoded";
      default:
        return "Unrecognized storage error";
    }
  }
};

inline const storage_error_category& get_storage_error_category() {
  static storage_error_category instance;
  return instance;
}

inline std::error_code make_error_code(storage_error e) { return {static_cast<int>(e), get_storage_error_category()}; }
}  // namespace strata

namespace std {

template <>
struct is_error_code_enum<strata::storage_error> : true_type {};
}  // namespace std

#endif  // _STRATA_STORAGE_ERROR_H_
