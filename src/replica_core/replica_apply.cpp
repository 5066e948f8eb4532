#include <fmt/format.h>

#include <shared_mutex>

#include "error/error.h"
#include "error/replica_error.h"
#include "replica_core/fatal.h"
#include "replica_core/pb/protobuf.h"
#include "replica_core/replica.h"
namespace strata::core {

leaf::result<bool> replica::handle_replicated_eval_result(replicapb::replicated_eval_result rresult) {
  // Fields for which no action is taken in this method are zeroed so that
  // they don't trigger an assertion at the end of the method.
  rresult.clear_is_lease_request();
  rresult.clear_is_consistency_related();
  rresult.clear_is_freeze();
  rresult.clear_timestamp();

  std::unique_lock<std::shared_mutex> read_block;
  if (rresult.block_reads()) {
    read_block = std::unique_lock<std::shared_mutex>(read_only_cmd_mu_);
    rresult.clear_block_reads();
  }

  auto& state = *rresult.mutable_state();

  // Update MVCC stats and the applied indexes.
  bool needs_split_by_size = false;
  {
    std::lock_guard<std::mutex> guard(mu_);
    pb::add(*state_.mutable_stats(), rresult.delta());
    if (state.raft_applied_index() != 0) {
      state_.set_raft_applied_index(state.raft_applied_index());
    }
    if (state.lease_applied_index() != 0) {
      state_.set_lease_applied_index(state.lease_applied_index());
    }
    needs_split_by_size = needs_split_by_size_locked();
  }
  store_.metrics().add_mvcc_stats(rresult.delta());
  rresult.clear_delta();

  // Offer the range to the raft log queue every so often, so that the log
  // gets truncated without checking on every command.
  if (store_.cfg().raft_log_check_due(state.raft_applied_index())) {
    store_.raft_log_queue()->maybe_add(range_id_, store_.clock().now());
  }
  if (needs_split_by_size) {
    store_.split_queue()->maybe_add(range_id_, store_.clock().now());
  }

  state.clear_stats();
  state.clear_raft_applied_index();
  state.clear_lease_applied_index();

  // Everything left is a trigger that is worth an assertion after the fact.
  bool should_assert = unhandled_fields(rresult).any();

  if (rresult.has_split()) {
    // The right-hand side computes its stats against an exact left-hand
    // side, so the estimates flag is cleared and persisted before the split
    // trigger runs.
    replicapb::mvcc_stats stats;
    {
      std::lock_guard<std::mutex> guard(mu_);
      state_.mutable_stats()->set_contains_estimates(false);
      stats = state_.stats();
    }
    BOOST_LEAF_CHECK(escalate_fatal(*logger_, "unable to write MVCC stats", [&]() -> leaf::result<void> {
      return state_loader_.set_mvcc_stats(store_.engine(), stats);
    }));
    const auto& split = rresult.split();
    BOOST_LEAF_CHECK(escalate_fatal(*logger_, "failed to run split trigger", [&]() -> leaf::result<void> {
      return store_.range_topology()->split_post_apply(range_id_, split.rhs_delta(), split.trigger());
    }));
    rresult.clear_split();
  }

  if (rresult.has_merge()) {
    BOOST_LEAF_CHECK(
        escalate_fatal(*logger_, "failed to update store after merging range", [&]() -> leaf::result<void> {
          return store_.range_topology()->merge_range(range_id_, rresult.merge().trigger());
        }));
    rresult.clear_merge();
  }

  if (state.frozen() != replicapb::FROZEN_UNSPECIFIED) {
    {
      std::lock_guard<std::mutex> guard(mu_);
      state_.set_frozen(state.frozen());
    }
    state.clear_frozen();
  }

  if (state.has_desc()) {
    BOOST_LEAF_CHECK(escalate_fatal(*logger_, "failed to update range descriptor",
                                    [&]() -> leaf::result<void> { return set_desc(state.desc()); }));
    state.clear_desc();
  }

  if (rresult.has_change_replicas()) {
    const auto& change = rresult.change_replicas();
    if (change.change_type() == replicapb::REMOVE_REPLICA && change.replica().store_id() == store_.store_id()) {
      auto _ = leaf::try_handle_some(
          [&]() -> leaf::result<void> {
            BOOST_LEAF_AUTO(added,
                            store_.replica_gc_queue()->add(range_id_, store_.cfg().replica_gc_priority_removed));
            LOGGER_DEBUG(logger_, "removed from range, queued for replica GC: {}", added);
            return {};
          },
          [&](const strata_error& err) -> leaf::result<void> {
            LOGGER_ERROR(logger_, "unable to add to replica GC queue: {}", err.what());
            return {};
          });
    }
    rresult.clear_change_replicas();
  }

  if (state.has_lease()) {
    auto new_lease = state.lease();
    replicapb::lease prev_lease;
    pb::replica_id rid = pb::NONE;
    {
      std::lock_guard<std::mutex> guard(mu_);
      prev_lease = state_.lease();
      *state_.mutable_lease() = new_lease;
      rid = replica_id_;
    }
    BOOST_LEAF_CHECK(lease_post_apply(new_lease, rid, prev_lease));
    state.clear_lease();
  }

  if (state.has_truncated_state()) {
    auto index = state.truncated_state().index();
    {
      std::lock_guard<std::mutex> guard(mu_);
      *state_.mutable_truncated_state() = state.truncated_state();
    }
    store_.entry_cache().clear_to(range_id_, index + 1);
    state.clear_truncated_state();
  }

  if (state.has_gc_threshold()) {
    if (!pb::is_empty(state.gc_threshold())) {
      std::lock_guard<std::mutex> guard(mu_);
      *state_.mutable_gc_threshold() = state.gc_threshold();
    }
    state.clear_gc_threshold();
  }

  if (state.has_txn_span_gc_threshold()) {
    if (!pb::is_empty(state.txn_span_gc_threshold())) {
      std::lock_guard<std::mutex> guard(mu_);
      *state_.mutable_txn_span_gc_threshold() = state.txn_span_gc_threshold();
    }
    state.clear_txn_span_gc_threshold();
  }

  if (rresult.has_compute_checksum()) {
    compute_checksum_post_apply(rresult.compute_checksum());
    rresult.clear_compute_checksum();
  }

  if (auto left = unhandled_fields(rresult); left.any()) {
    auto msg = fmt::format("unhandled field in replicated eval result: {}", field_names(left));
    LOGGER_CRITICAL(logger_, "{}", msg);
    return new_error(replica_error::UNHANDLED_FIELD, std::move(msg));
  }
  return should_assert;
}

leaf::result<bool> replica::handle_local_eval_result(const replicapb::replica_descriptor& origin,
                                                     local_eval_result lresult) {
  // Fields for which no action is taken in this method are zeroed so that
  // they don't trigger an assertion at the end of the method.
  lresult.cmd_id.clear();
  lresult.proposed_at_ticks = 0;
  lresult.err.reset();
  lresult.reply.reset();
  lresult.end_cmds = nullptr;
  lresult.done.reset();

  bool is_proposer = origin.store_id() == store_.store_id();

  // Intents are handed over even when the command failed. Only the proposer
  // resolves them, every replica drops them.
  if (is_proposer && lresult.intents) {
    store_.intent_resolver()->process_intents_async(range_id_, std::move(*lresult.intents));
  }
  lresult.intents.reset();

  bool should_assert = unhandled_fields(lresult).any();

  if (lresult.raft_log_size) {
    {
      std::lock_guard<std::mutex> guard(mu_);
      raft_log_size_ = *lresult.raft_log_size;
    }
    lresult.raft_log_size.reset();
  }

  if (lresult.gossip_first_range) {
    // must not block: the lease may be under acquisition behind this command.
    maybe_gossip_first_range();
    lresult.gossip_first_range = false;
  }

  if (lresult.maybe_add_to_split_queue) {
    store_.split_queue()->maybe_add(range_id_, store_.clock().now());
    lresult.maybe_add_to_split_queue = false;
  }

  if (lresult.maybe_gossip_system_config) {
    store_.gossip()->maybe_gossip_system_config(range_id_);
    lresult.maybe_gossip_system_config = false;
  }

  if (is_proposer) {
    if (lresult.lease_metrics_result) {
      store_.metrics().lease_request_complete(*lresult.lease_metrics_result);
    }
    if (lresult.maybe_gossip_node_liveness) {
      store_.gossip()->maybe_gossip_node_liveness(range_id_, *lresult.maybe_gossip_node_liveness);
    }
  }
  // proposer only, but cleared everywhere.
  lresult.lease_metrics_result.reset();
  lresult.maybe_gossip_node_liveness.reset();

  if (auto left = unhandled_fields(lresult); left.any()) {
    auto msg = fmt::format("unhandled field in local eval result: {}", field_names(left));
    LOGGER_CRITICAL(logger_, "{}", msg);
    return new_error(replica_error::UNHANDLED_FIELD, std::move(msg));
  }
  return should_assert;
}

void replica::maybe_gossip_first_range() {
  auto _ = leaf::try_handle_some(
      [&]() -> leaf::result<void> {
        return store_.get_stopper().run_async_task("gossip first range", [weak = weak_from_this()]() {
          if (auto self = weak.lock()) {
            self->gossip_first_range_if_lease_holder();
          }
        });
      },
      [&](const strata_error& err) -> leaf::result<void> {
        LOGGER_INFO(logger_, "unable to gossip first range: {}", err.what());
        return {};
      });
}

void replica::gossip_first_range_if_lease_holder() {
  replicapb::lease l;
  replicapb::range_descriptor d;
  pb::replica_id rid = pb::NONE;
  {
    std::lock_guard<std::mutex> guard(mu_);
    l = state_.lease();
    d = state_.desc();
    rid = replica_id_;
  }
  if (l.replica().replica_id() != rid || !pb::covers(l, store_.clock().now())) {
    LOGGER_DEBUG(logger_, "not gossiping first range, lease {} not held by replica {}", pb::describe(l), rid);
    return;
  }
  auto _ = leaf::try_handle_some(
      [&]() -> leaf::result<void> { return store_.gossip()->gossip_first_range(d); },
      [&](const strata_error& err) -> leaf::result<void> {
        LOGGER_ERROR(logger_, "failed to gossip first range descriptor: {}", err.what());
        return {};
      });
}

}  // namespace strata::core
