#include "replica_core/config.h"

#include "error/error.h"
#include "error/logic_error.h"

namespace strata::core {

leaf::result<void> store_config::validate() const {
  if (this->node_id == 0) {
    return new_error(logic_error::INVALID_PARAM, "cannot use 0 as node id");
  }
  if (this->store_id == 0) {
    return new_error(logic_error::INVALID_PARAM, "cannot use 0 as store id");
  }
  if (this->raft_log_queue_stale_threshold == 0) {
    return new_error(logic_error::INVALID_PARAM, "raft log queue stale threshold must be greater than 0");
  }
  if (this->range_max_bytes <= 0) {
    return new_error(logic_error::INVALID_PARAM, "range max bytes must be greater than 0");
  }
  if (this->checksum_gc_interval.count() < 0) {
    return new_error(logic_error::INVALID_PARAM, "checksum gc interval must not be negative");
  }
  if (this->logger == nullptr) {
    return new_error(logic_error::NULL_POINTER, "logger cannot be null");
  }
  return {};
}

}  // namespace strata::core
