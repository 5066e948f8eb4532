#ifndef _STRATA_CONFIG_H_
#define _STRATA_CONFIG_H_
#include <chrono>
#include <cstdint>
#include <memory>
#include <utility>

#include "basic/logger.h"
#include "error/leaf.h"
namespace strata::core {

constexpr std::uint64_t DEFAULT_RAFT_LOG_QUEUE_STALE_THRESHOLD = 100;
constexpr std::int64_t DEFAULT_RANGE_MAX_BYTES = 64 << 20;
constexpr std::chrono::seconds DEFAULT_CHECKSUM_GC_INTERVAL = std::chrono::hours(1);
constexpr double DEFAULT_REPLICA_GC_PRIORITY_REMOVED = 10.0;

// store_config holds the store-wide parameters the apply path depends on.
struct store_config {
#ifdef STRATA_TEST
  store_config() = default;
#endif
  store_config(std::uint64_t node_id, std::uint64_t store_id, std::shared_ptr<strata::logger_interface> &&logger)
      : node_id(node_id), store_id(store_id), logger(std::move(logger)) {}

  store_config(std::uint64_t node_id, std::uint64_t store_id, std::uint64_t raft_log_queue_stale_threshold,
               std::int64_t range_max_bytes, std::chrono::nanoseconds checksum_gc_interval,
               double replica_gc_priority_removed, std::shared_ptr<strata::logger_interface> &&logger)
      : node_id(node_id),
        store_id(store_id),
        raft_log_queue_stale_threshold(raft_log_queue_stale_threshold),
        range_max_bytes(range_max_bytes),
        checksum_gc_interval(checksum_gc_interval),
        replica_gc_priority_removed(replica_gc_priority_removed),
        logger(std::move(logger)) {}

  leaf::result<void> validate() const;

  // raft_log_check_frequency is the number of applied commands between two
  // offers of the range to the raft log queue.
  std::uint64_t raft_log_check_frequency() const { return 1 + raft_log_queue_stale_threshold / 4; }

  // raft_log_check_due reports whether applying index should offer the range
  // to the raft log queue: index 1 and every frequency-th index after it.
  bool raft_log_check_due(std::uint64_t applied_index) const {
    auto frequency = raft_log_check_frequency();
    return applied_index != 0 && applied_index % frequency == 1 % frequency;
  }

  // NodeID and StoreID identify the store this replica lives on. Neither
  // can be 0.
  std::uint64_t node_id = 0;
  std::uint64_t store_id = 0;

  // RaftLogQueueStaleThreshold is the minimum number of entries by which the
  // raft log must grow before the raft log queue considers truncating it.
  std::uint64_t raft_log_queue_stale_threshold = DEFAULT_RAFT_LOG_QUEUE_STALE_THRESHOLD;

  // RangeMaxBytes is the size above which a range becomes a split candidate.
  std::int64_t range_max_bytes = DEFAULT_RANGE_MAX_BYTES;

  // ChecksumGCInterval is how long a computed checksum is kept for
  // collection before the next computation sweeps it.
  std::chrono::nanoseconds checksum_gc_interval = DEFAULT_CHECKSUM_GC_INTERVAL;

  // ReplicaGCPriorityRemoved is the replica GC queue priority of a replica
  // which was removed from its range by a committed replica change.
  double replica_gc_priority_removed = DEFAULT_REPLICA_GC_PRIORITY_REMOVED;

  std::shared_ptr<strata::logger_interface> logger;
};

}  // namespace strata::core

#endif  // _STRATA_CONFIG_H_
