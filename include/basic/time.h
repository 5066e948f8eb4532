#pragma once
#ifndef _STRATA_TIME_H_
#define _STRATA_TIME_H_
#include <chrono>
#include <cstdint>
namespace strata {

inline std::int64_t to_nanos(std::chrono::system_clock::time_point t) {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(t.time_since_epoch()).count();
}

inline std::chrono::system_clock::time_point from_nanos(std::int64_t nanos) {
  return std::chrono::system_clock::time_point(
      std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::nanoseconds(nanos)));
}

}  // namespace strata

#endif  // _STRATA_TIME_H_
