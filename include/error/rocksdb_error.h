#pragma once
#ifndef _STRATA_ROCKSDB_ERROR_H_
#define _STRATA_ROCKSDB_ERROR_H_
#include <rocksdb/status.h>

#include <string>
#include <system_error>

#include "error/base_error_category.h"
namespace strata {

enum class rocksdb_error {
  ok = 0,
  not_found,
  corruption,
  not_supported,
  invalid_argument,
  io_error,
  busy,
  timed_out,
  shutdown_in_progress,
  unknown
};

class rocksdb_error_category : public base_error_category {
 public:
  const char* name() const noexcept override { return "rocksdb"; }

  std::string message(int ev) const override {
    switch (static_cast<rocksdb_error>(ev)) {
      case rocksdb_error::ok:
        return "OK";
      case rocksdb_error::not_found:
        return "Not found";
      case rocksdb_error::corruption:
        return "Corruption";
      case rocksdb_error::not_supported:
        return "Not supported";
      case rocksdb_error::invalid_argument:
        return "Invalid argument";
      case rocksdb_error::io_error:
        return "I/O error";
      case rocksdb_error::busy:
        return "Busy";
      case rocksdb_error::timed_out:
        return "Timed out";
      case rocksdb_error::shutdown_in_progress:
        return "Shutdown in progress";
      default:
        return "Unknown RocksDB error";
    }
  }
};

inline const std::error_category& get_rocksdb_error_category() {
  static rocksdb_error_category instance;
  return instance;
}

inline std::error_code make_error_code(rocksdb_error e) {
  return {static_cast<int>(e), get_rocksdb_error_category()};
}

// 将 rocksdb::Status 映射为 rocksdb_error
inline rocksdb_error map_code(rocksdb::Status::Code c) noexcept {
  using C = rocksdb::Status::Code;
  switch (c) {
    case C::kOk:
      return rocksdb_error::ok;
    case C::kNotFound:
      return rocksdb_error::not_found;
    case C::kCorruption:
      return rocksdb_error::corruption;
    case C::kNotSupported:
      return rocksdb_error::not_supported;
    case C::kInvalidArgument:
      return rocksdb_error::invalid_argument;
    case C::kIOError:
      return rocksdb_error::io_error;
    case C::kBusy:
      return rocksdb_error::busy;
    case C::kTimedOut:
      return rocksdb_error::timed_out;
    case C::kShutdownInProgress:
      return rocksdb_error::shutdown_in_progress;
    default:
      return rocksdb_error::unknown;
  }
}

inline std::error_code make_error_code(const rocksdb::Status& s) noexcept {
  return make_error_code(map_code(s.code()));
}

}  // namespace strata

namespace std {
template <>
struct is_error_code_enum<strata::rocksdb_error> : true_type {};
}  // namespace std

#endif  // _STRATA_ROCKSDB_ERROR_H_
