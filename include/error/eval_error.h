#pragma once
#ifndef _STRATA_EVAL_ERROR_H_
#define _STRATA_EVAL_ERROR_H_
#include <string>
#include <system_error>

#include "error/base_error_category.h"

namespace strata {

// eval_error is returned when sub-results of one command can not be combined.
// The command fails as a whole; none of these is retryable.
enum class eval_error {
  // both sides carry the same mutually exclusive effect.
  CONFLICTING_FIELD = 1,
  // the applied indexes are assigned after merging and must not be set on
  // the absorbed result.
  APPLIED_INDEX_SPECIFIED,
  // cumulative stats are owned by the replica; evaluation only produces deltas.
  STATS_SPECIFIED,
};

class eval_error_category : public base_error_category {
 public:
  const char* name() const noexcept override { return "eval_error"; }

  std::string message(int ev) const override {
    switch (static_cast<eval_error>(ev)) {
      case eval_error::CONFLICTING_FIELD:
        return "conflicting eval result field";
      case eval_error::APPLIED_INDEX_SPECIFIED:
        return "must not specify applied index";
      case eval_error::STATS_SPECIFIED:
        return "must not specify stats";
      default:
        return "Unrecognized eval error";
    }
  }
};

inline const eval_error_category& get_eval_error_category() {
  static eval_error_category instance;
  return instance;
}

inline std::error_code make_error_code(eval_error e) { return {static_cast<int>(e), get_eval_error_category()}; }
}  // namespace strata

namespace std {

template <>
struct is_error_code_enum<strata::eval_error> : true_type {};
}  // namespace std

#endif  // _STRATA_EVAL_ERROR_H_
