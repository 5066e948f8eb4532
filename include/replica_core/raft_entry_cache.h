#ifndef _STRATA_RAFT_ENTRY_CACHE_H_
#define _STRATA_RAFT_ENTRY_CACHE_H_
#include <absl/container/flat_hash_map.h>
#include <replica.pb.h>

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>

#include "basic/utility_macros.h"
#include "replica_core/pb/types.h"
namespace strata::core {

// raft_entry_cache is the store-wide cache of raft log entries, keyed by
// range id and entry index.
class raft_entry_cache {
  NOT_COPYABLE_NOT_MOVABLE(raft_entry_cache)

 public:
  raft_entry_cache() = default;

  void add(pb::range_id range_id, const pb::repeated_log_entry& entries);

  std::optional<replicapb::log_entry> get(pb::range_id range_id, std::uint64_t index) const;

  // clear_to drops the entries of the range with an index below hi.
  void clear_to(pb::range_id range_id, std::uint64_t hi);

  // size returns the number of cached entries of the range.
  std::size_t size(pb::range_id range_id) const;

 private:
  mutable std::mutex mutex_;
  absl::flat_hash_map<pb::range_id, std::map<std::uint64_t, replicapb::log_entry>> ranges_;
};

}  // namespace strata::core

#endif  // _STRATA_RAFT_ENTRY_CACHE_H_
