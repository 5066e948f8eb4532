#ifndef _STRATA_INTERFACES_H_
#define _STRATA_INTERFACES_H_
#include <proxy.h>
#include <replica.pb.h>

#include <cstdint>
#include <vector>

#include "error/leaf.h"
#include "replica_core/pb/types.h"
namespace strata::core {

// ---------------------------------------------------------------------------
// replica_queue: the raft log, split and replica GC queues. The queue owns
// admission and deduplication, the apply path only offers candidates.
// ---------------------------------------------------------------------------

// MaybeAdd offers the range; the queue decides whether it qualifies.
PRO_DEF_MEM_DISPATCH(queue_maybe_add, maybe_add);

// Add enqueues the range at the given priority. Returns whether the range was
// added, false meaning it was already queued.
PRO_DEF_MEM_DISPATCH(queue_add, add);

// clang-format off
struct replica_queue_builder : pro::facade_builder
  ::add_convention<queue_maybe_add, void(pb::range_id range_id, const replicapb::timestamp& now)>
  ::add_convention<queue_add, leaf::result<bool>(pb::range_id range_id, double priority)>
  ::build{};
// clang-format on

// ---------------------------------------------------------------------------
// gossip
// ---------------------------------------------------------------------------
PRO_DEF_MEM_DISPATCH(gossip_first_range_info, gossip_first_range);
PRO_DEF_MEM_DISPATCH(gossip_system_config, maybe_gossip_system_config);
PRO_DEF_MEM_DISPATCH(gossip_node_liveness, maybe_gossip_node_liveness);

// clang-format off
struct gossip_builder : pro::facade_builder
  ::add_convention<gossip_first_range_info, leaf::result<void>(const replicapb::range_descriptor& desc)>
  ::add_convention<gossip_system_config, void(pb::range_id range_id)>
  ::add_convention<gossip_node_liveness, void(pb::range_id range_id, const replicapb::span& span)>
  ::build{};
// clang-format on

// ---------------------------------------------------------------------------
// intent_resolver
// ---------------------------------------------------------------------------

// ProcessIntentsAsync resolves intents in the background. It never blocks the
// caller.
PRO_DEF_MEM_DISPATCH(resolver_process_intents_async, process_intents_async);

// clang-format off
struct intent_resolver_builder : pro::facade_builder
  ::add_convention<resolver_process_intents_async, void(pb::range_id range_id, std::vector<pb::intents_with_arg>&& intents)>
  ::build{};
// clang-format on

// ---------------------------------------------------------------------------
// raft_group: the consensus group of one replica.
// ---------------------------------------------------------------------------

// Leader returns the replica id of the current leader, or pb::NONE. Fails
// when the group is gone or its storage is broken.
PRO_DEF_MEM_DISPATCH(raft_group_leader, leader);

// TransferLeader asks the group to hand leadership to target. Best effort,
// the transfer may silently not happen.
PRO_DEF_MEM_DISPATCH(raft_group_transfer_leader, transfer_leader);

// clang-format off
struct raft_group_builder : pro::facade_builder
  ::add_convention<raft_group_leader, leaf::result<pb::replica_id>()>
  ::add_convention<raft_group_transfer_leader, leaf::result<void>(pb::replica_id target)>
  ::build{};
// clang-format on

// ---------------------------------------------------------------------------
// range_topology: the store side of splits and merges.
// ---------------------------------------------------------------------------

// SplitPostApply creates the right-hand range and adjusts both descriptors
// after a split committed.
PRO_DEF_MEM_DISPATCH(topology_split_post_apply, split_post_apply);

// MergeRange absorbs the right-hand range into the left-hand one.
PRO_DEF_MEM_DISPATCH(topology_merge_range, merge_range);

// clang-format off
struct range_topology_builder : pro::facade_builder
  ::add_convention<topology_split_post_apply, leaf::result<void>(pb::range_id range_id, const replicapb::mvcc_stats& rhs_delta, const replicapb::split_trigger& trigger)>
  ::add_convention<topology_merge_range, leaf::result<void>(pb::range_id range_id, const replicapb::merge_trigger& trigger)>
  ::build{};
// clang-format on

using replica_queue_proxy = pro::proxy<replica_queue_builder>;
using gossip_proxy = pro::proxy<gossip_builder>;
using intent_resolver_proxy = pro::proxy<intent_resolver_builder>;
using raft_group_proxy = pro::proxy<raft_group_builder>;
using range_topology_proxy = pro::proxy<range_topology_builder>;

}  // namespace strata::core

#endif  // _STRATA_INTERFACES_H_
