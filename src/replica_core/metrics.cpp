#include "replica_core/metrics.h"

namespace strata::core {

void store_metrics::add_mvcc_stats(const replicapb::mvcc_stats& delta) {
  live_bytes.fetch_add(delta.live_bytes());
  key_bytes.fetch_add(delta.key_bytes());
  val_bytes.fetch_add(delta.val_bytes());
  intent_bytes.fetch_add(delta.intent_bytes());
  sys_bytes.fetch_add(delta.sys_bytes());
  live_count.fetch_add(delta.live_count());
  key_count.fetch_add(delta.key_count());
  val_count.fetch_add(delta.val_count());
  intent_count.fetch_add(delta.intent_count());
  sys_count.fetch_add(delta.sys_count());
  intent_age.fetch_add(delta.intent_age());
  gc_bytes_age.fetch_add(delta.gc_bytes_age());
}

void store_metrics::lease_request_complete(bool success) {
  if (success) {
    lease_request_success_count.fetch_add(1);
  } else {
    lease_request_error_count.fetch_add(1);
  }
}

}  // namespace strata::core
