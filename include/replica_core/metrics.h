#ifndef _STRATA_METRICS_H_
#define _STRATA_METRICS_H_
#include <replica.pb.h>

#include <atomic>
#include <cstdint>

#include "basic/utility_macros.h"
namespace strata::core {

// store_metrics are the process-wide gauges and counters fed by the apply
// path.
class store_metrics {
  NOT_COPYABLE_NOT_MOVABLE(store_metrics)

 public:
  store_metrics() = default;

  // add_mvcc_stats folds the stats delta of one applied command into the
  // store-wide gauges.
  void add_mvcc_stats(const replicapb::mvcc_stats& delta);

  void lease_request_complete(bool success);

  std::atomic<std::int64_t> live_bytes{0};
  std::atomic<std::int64_t> key_bytes{0};
  std::atomic<std::int64_t> val_bytes{0};
  std::atomic<std::int64_t> intent_bytes{0};
  std::atomic<std::int64_t> sys_bytes{0};
  std::atomic<std::int64_t> live_count{0};
  std::atomic<std::int64_t> key_count{0};
  std::atomic<std::int64_t> val_count{0};
  std::atomic<std::int64_t> intent_count{0};
  std::atomic<std::int64_t> sys_count{0};
  std::atomic<std::int64_t> intent_age{0};
  std::atomic<std::int64_t> gc_bytes_age{0};

  std::atomic<std::int64_t> lease_request_success_count{0};
  std::atomic<std::int64_t> lease_request_error_count{0};
};

}  // namespace strata::core

#endif  // _STRATA_METRICS_H_
