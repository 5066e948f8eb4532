#include <fmt/format.h>

#include "error/error.h"
#include "error/replica_error.h"
#include "replica_core/fatal.h"
#include "replica_core/pb/protobuf.h"
#include "replica_core/replica.h"
namespace strata::core {

leaf::result<void> replica::lease_post_apply(const replicapb::lease& new_lease, pb::replica_id replica_id,
                                             const replicapb::lease& prev_lease) {
  bool i_am_the_lease_holder = new_lease.replica().replica_id() == replica_id;
  bool lease_changing_hands = prev_lease.replica().store_id() != new_lease.replica().store_id();

  if (lease_changing_hands && i_am_the_lease_holder) {
    LOGGER_INFO(logger_, "new range lease {} following {}", pb::describe(new_lease), pb::describe(prev_lease));
    // Reads served by the previous holder are not in our cache. Everything
    // below the start of the new lease is treated as read; leases overlap
    // at most by the stasis period.
    {
      std::lock_guard<std::mutex> guard(mu_);
      ts_cache_.set_low_water(new_lease.start());
    }
    if (is_first_range() && pb::covers(new_lease, store_.clock().now())) {
      auto d = desc();
      auto _ = leaf::try_handle_some(
          [&]() -> leaf::result<void> { return store_.gossip()->gossip_first_range(d); },
          [&](const strata_error& err) -> leaf::result<void> {
            LOGGER_ERROR(logger_, "failed to gossip first range descriptor: {}", err.what());
            return {};
          });
    }
  } else if (lease_changing_hands && !i_am_the_lease_holder) {
    // 只有 lease holder 才会用到时间戳缓存
    auto now = store_.clock().now();
    std::lock_guard<std::mutex> guard(mu_);
    ts_cache_.clear(now);
  }

  // Collocate the raft leader with the lease holder.
  if (!i_am_the_lease_holder && pb::covers(new_lease, store_.clock().now())) {
    BOOST_LEAF_CHECK(maybe_transfer_raft_leadership(replica_id, new_lease.replica().replica_id()));
  }
  return {};
}

leaf::result<void> replica::maybe_transfer_raft_leadership(pb::replica_id replica_id, pb::replica_id target) {
  return escalate_fatal(*logger_, "unable to transfer raft leadership", [&]() -> leaf::result<void> {
    if (destroyed()) {
      return new_error(replica_error::REPLICA_DESTROYED);
    }
    BOOST_LEAF_AUTO(leader, raft_group_->leader());
    if (leader != replica_id) {
      return {};
    }
    LOGGER_INFO(logger_, "range lease moved to replica {}, transferring raft leadership", target);
    return raft_group_->transfer_leader(target);
  });
}

}  // namespace strata::core
