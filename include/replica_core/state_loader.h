#ifndef _STRATA_STATE_LOADER_H_
#define _STRATA_STATE_LOADER_H_
#include <replica.pb.h>

#include <cstdint>
#include <optional>
#include <string>

#include "error/leaf.h"
#include "replica_core/engine.h"
#include "replica_core/pb/types.h"
namespace strata::core {

// state_loader knows where the replicated state of one range lives in the
// engine. Reads go through a snapshot; writes are staged into a batch so that
// they commit together with the command that produced them.
//
// Absent keys load as zero values.
class state_loader {
 public:
  explicit state_loader(pb::range_id range_id) : range_id_(range_id) {}

  leaf::result<replicapb::replica_state> load(const engine_snapshot_proxy& snap) const;

  leaf::result<replicapb::mvcc_stats> load_mvcc_stats(const engine_snapshot_proxy& snap) const;

  // stage writes every field of state, zero-valued ones included.
  void stage(engine_batch& batch, const replicapb::replica_state& state) const;

  void stage_applied_index(engine_batch& batch, std::uint64_t raft_applied_index,
                           std::uint64_t lease_applied_index) const;
  void stage_raft_applied_index(engine_batch& batch, std::uint64_t index) const;
  void stage_lease_applied_index(engine_batch& batch, std::uint64_t index) const;
  void stage_mvcc_stats(engine_batch& batch, const replicapb::mvcc_stats& stats) const;
  void stage_lease(engine_batch& batch, const replicapb::lease& l) const;
  void stage_truncated_state(engine_batch& batch, const replicapb::raft_truncated_state& truncated) const;
  void stage_gc_threshold(engine_batch& batch, const replicapb::timestamp& threshold) const;
  void stage_txn_span_gc_threshold(engine_batch& batch, const replicapb::timestamp& threshold) const;
  void stage_frozen_status(engine_batch& batch, replicapb::frozen_status frozen) const;
  void stage_desc(engine_batch& batch, const replicapb::range_descriptor& desc) const;

  // set_mvcc_stats persists stats on its own, outside of any command batch.
  leaf::result<void> set_mvcc_stats(engine_proxy& engine, const replicapb::mvcc_stats& stats) const;

  pb::range_id range_id() const { return range_id_; }

 private:
  pb::range_id range_id_;
};

// write_initial_state persists the state of a freshly created range with the
// given descriptor and lease.
leaf::result<void> write_initial_state(engine_proxy& engine, const replicapb::range_descriptor& desc,
                                       const replicapb::lease& l);

}  // namespace strata::core

#endif  // _STRATA_STATE_LOADER_H_
