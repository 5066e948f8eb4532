#pragma once
#ifndef _STRATA_REPLICA_ERROR_H_
#define _STRATA_REPLICA_ERROR_H_
#include <string>
#include <system_error>

#include "error/base_error_category.h"

namespace strata {

enum class replica_error {
  // an eval result still carries a field after every handler ran, i.e. an
  // effect would be dropped silently.
  UNHANDLED_FIELD = 1,
  // in-memory and on-disk state of the replica are known to disagree, or a
  // committed effect could not be applied.
  REPLICA_CORRUPTION,
  // assert_state found the in-memory state different from the persisted one.
  STATE_DIVERGED,
  // the replica stopped applying commands after a fatal error.
  REPLICA_HALTED,
  // the replica has been destroyed and its raft group is gone.
  REPLICA_DESTROYED,
  // a descriptor for another range was installed on this replica.
  RANGE_ID_MISMATCH,
  // the stopper is quiescing and refuses new async tasks.
  STOPPER_QUIESCING,
  // no checksum arrived before the caller's deadline.
  CHECKSUM_TIMEOUT,
  // the digest of a range could not be computed.
  CHECKSUM_FAILED,
};

class replica_error_category : public base_error_category {
 public:
  const char* name() const noexcept override { return "replica_error"; }

  std::string message(int ev) const override {
    switch (static_cast<replica_error>(ev)) {
      case replica_error::UNHANDLED_FIELD:
        return "unhandled field in eval result";
      case replica_error::REPLICA_CORRUPTION:
        return "replica corruption";
      case replica_error::STATE_DIVERGED:
        return "on-disk replica state diverged from in-memory state";
      case replica_error::REPLICA_HALTED:
        return "replica halted after a fatal error";
      case replica_error::REPLICA_DESTROYED:
        return "replica destroyed";
      case replica_error::RANGE_ID_MISMATCH:
        return "range descriptor belongs to another range";
      case replica_error::STOPPER_QUIESCING:
        return "stopper is quiescing";
      case replica_error::CHECKSUM_TIMEOUT:
        return "timed out waiting for checksum";
      case replica_error::CHECKSUM_FAILED:
        return "checksum computation failed";
      default:
        return "Unrecognized replica error";
    }
  }
};

inline const replica_error_category& get_replica_error_category() {
  static replica_error_category instance;
  return instance;
}

inline std::error_code make_error_code(replica_error e) {
  return {static_cast<int>(e), get_replica_error_category()};
}

// is_fatal reports whether ec means the replica may have diverged and must
// stop applying commands.
inline bool is_fatal(const std::error_code& ec) {
  if (ec.category() != get_replica_error_category()) {
    return false;
  }
  switch (static_cast<replica_error>(ec.value())) {
    case replica_error::UNHANDLED_FIELD:
    case replica_error::REPLICA_CORRUPTION:
    case replica_error::STATE_DIVERGED:
    case replica_error::REPLICA_HALTED:
      return true;
    default:
      return false;
  }
}
}  // namespace strata

namespace std {

template <>
struct is_error_code_enum<strata::replica_error> : true_type {};
}  // namespace std

#endif  // _STRATA_REPLICA_ERROR_H_
