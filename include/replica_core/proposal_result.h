#ifndef _STRATA_PROPOSAL_RESULT_H_
#define _STRATA_PROPOSAL_RESULT_H_
#include <replica.pb.h>

#include <optional>

#include "error/error.h"
namespace strata::core {

// proposal_result is the outcome of a proposal, delivered to the waiting
// client once the command applied.
struct proposal_result {
  std::optional<replicapb::batch_response> reply;
  std::optional<strata_error> err;
  // should_retry tells the proposer to propose the command again, e.g. after
  // it lost a race with a lease change.
  bool should_retry = false;
};

}  // namespace strata::core

#endif  // _STRATA_PROPOSAL_RESULT_H_
