#include "replica_core/replica.h"

#include <fmt/format.h>

#include "error/error.h"
#include "error/replica_error.h"
#include "replica_core/fatal.h"
#include "replica_core/pb/protobuf.h"
namespace strata::core {

replica::replica(store& s, pb::range_id range_id, raft_group_proxy&& raft_group)
    : store_(s),
      range_id_(range_id),
      raft_group_(std::move(raft_group)),
      state_loader_(range_id),
      logger_(std::make_shared<tagged_logger>(s.cfg().logger, fmt::format("[s{},r{}]", s.store_id(), range_id))) {}

leaf::result<void> replica::load_state() {
  auto snap = store_.engine()->new_snapshot();
  BOOST_LEAF_AUTO(state, state_loader_.load(snap));
  if (state.has_desc() && state.desc().range_id() != range_id_) {
    return new_error(replica_error::RANGE_ID_MISMATCH,
                     fmt::format("persisted descriptor of range {} found for range {}", state.desc().range_id(),
                                 range_id_));
  }
  std::lock_guard<std::mutex> guard(mu_);
  state_ = std::move(state);
  set_replica_id_locked(state_.desc());
  LOGGER_DEBUG(logger_, "loaded replica state at applied index {}", state_.raft_applied_index());
  return {};
}

pb::replica_id replica::replica_id() const {
  std::lock_guard<std::mutex> guard(mu_);
  return replica_id_;
}

replicapb::replica_state replica::state() const {
  std::lock_guard<std::mutex> guard(mu_);
  return state_;
}

replicapb::range_descriptor replica::desc() const {
  std::lock_guard<std::mutex> guard(mu_);
  return state_.desc();
}

replicapb::lease replica::lease() const {
  std::lock_guard<std::mutex> guard(mu_);
  return state_.lease();
}

std::int64_t replica::raft_log_size() const {
  std::lock_guard<std::mutex> guard(mu_);
  return raft_log_size_;
}

replicapb::timestamp replica::ts_cache_low_water() const {
  std::lock_guard<std::mutex> guard(mu_);
  return ts_cache_.low_water();
}

void replica::record_read(std::string_view key, const replicapb::timestamp& ts) {
  std::lock_guard<std::mutex> guard(mu_);
  ts_cache_.add(key, ts);
}

replicapb::timestamp replica::max_read_timestamp(std::string_view key) const {
  std::lock_guard<std::mutex> guard(mu_);
  return ts_cache_.get_max(key);
}

void replica::destroy() {
  std::lock_guard<std::mutex> guard(mu_);
  destroyed_ = true;
}

bool replica::destroyed() const {
  std::lock_guard<std::mutex> guard(mu_);
  return destroyed_;
}

void replica::set_replica_id_locked(const replicapb::range_descriptor& desc) {
  for (const auto& r : desc.replicas()) {
    if (r.store_id() == store_.store_id()) {
      replica_id_ = r.replica_id();
      return;
    }
  }
  // this store is no longer part of the range
  replica_id_ = pb::NONE;
}

leaf::result<void> replica::set_desc(const replicapb::range_descriptor& desc) {
  if (desc.range_id() != range_id_) {
    return new_error(replica_error::RANGE_ID_MISMATCH,
                     fmt::format("range descriptor ID ({}) does not match replica's range ID ({})", desc.range_id(),
                                 range_id_));
  }
  std::lock_guard<std::mutex> guard(mu_);
  *state_.mutable_desc() = desc;
  set_replica_id_locked(desc);
  return {};
}

bool replica::needs_split_by_size_locked() const {
  return pb::total(state_.stats()) > store_.cfg().range_max_bytes;
}

void replica::halt(const strata_error& err) {
  if (!halted_.exchange(true)) {
    LOGGER_CRITICAL(logger_, "replica halted, no further commands will be applied: {}", err.what());
  }
}

leaf::result<void> replica::apply_command(const replicapb::replica_descriptor& origin, eval_result&& result,
                                          engine_batch&& batch) {
  auto completion = result.local.take_completion();
  auto pr = result.local.take_proposal_result();
  if (halted()) {
    pr.reply.reset();
    pr.err = strata_error{replica_error::REPLICA_HALTED, std::source_location::current()};
    completion.finish(pr);
    return new_error(replica_error::REPLICA_HALTED);
  }
  return leaf::try_handle_some(
      [&]() -> leaf::result<void> {
        BOOST_LEAF_CHECK(apply_command_impl(origin, result, std::move(batch)));
        completion.finish(pr);
        return {};
      },
      [&](const strata_error& err) -> leaf::result<void> {
        if (is_fatal(err.err_code)) {
          halt(err);
        }
        pr.reply.reset();
        pr.err = err;
        completion.finish(pr);
        return new_error(err);
      });
}

leaf::result<void> replica::apply_command_impl(const replicapb::replica_descriptor& origin, eval_result& result,
                                               engine_batch&& batch) {
  BOOST_LEAF_CHECK(commit_replicated_state(result.replicated, std::move(batch)));
  return handle_eval_result(origin, std::move(result.local), std::move(result.replicated));
}

leaf::result<void> replica::commit_replicated_state(const replicapb::replicated_eval_result& rresult,
                                                    engine_batch&& batch) {
  const auto& rs = rresult.state();
  replicapb::mvcc_stats stats;
  {
    std::lock_guard<std::mutex> guard(mu_);
    stats = state_.stats();
  }
  pb::add(stats, rresult.delta());
  state_loader_.stage_mvcc_stats(batch, stats);
  if (rs.raft_applied_index() != 0) {
    state_loader_.stage_raft_applied_index(batch, rs.raft_applied_index());
  }
  if (rs.lease_applied_index() != 0) {
    state_loader_.stage_lease_applied_index(batch, rs.lease_applied_index());
  }
  if (rs.has_lease()) {
    state_loader_.stage_lease(batch, rs.lease());
  }
  if (rs.has_truncated_state()) {
    state_loader_.stage_truncated_state(batch, rs.truncated_state());
  }
  if (rs.has_gc_threshold() && !pb::is_empty(rs.gc_threshold())) {
    state_loader_.stage_gc_threshold(batch, rs.gc_threshold());
  }
  if (rs.has_txn_span_gc_threshold() && !pb::is_empty(rs.txn_span_gc_threshold())) {
    state_loader_.stage_txn_span_gc_threshold(batch, rs.txn_span_gc_threshold());
  }
  if (rs.frozen() != replicapb::FROZEN_UNSPECIFIED) {
    state_loader_.stage_frozen_status(batch, rs.frozen());
  }
  if (rs.has_desc()) {
    state_loader_.stage_desc(batch, rs.desc());
  }
  return escalate_fatal(*logger_, "failed to commit command batch",
                        [&]() -> leaf::result<void> { return store_.engine()->write(std::move(batch)); });
}

leaf::result<void> replica::handle_eval_result(const replicapb::replica_descriptor& origin,
                                               local_eval_result&& lresult,
                                               replicapb::replicated_eval_result&& rresult) {
  // both run unconditionally, the assertion only looks at their verdicts.
  BOOST_LEAF_AUTO(should_assert_replicated, handle_replicated_eval_result(std::move(rresult)));
  BOOST_LEAF_AUTO(should_assert_local, handle_local_eval_result(origin, std::move(lresult)));
  if (should_assert_replicated || should_assert_local) {
    BOOST_LEAF_CHECK(assert_state());
  }
  return {};
}

leaf::result<void> replica::assert_state() {
  auto snap = store_.engine()->new_snapshot();
  replicapb::replica_state disk_state;
  BOOST_LEAF_CHECK(escalate_fatal(*logger_, "unable to load replica state", [&]() -> leaf::result<void> {
    BOOST_LEAF_ASSIGN(disk_state, state_loader_.load(snap));
    return {};
  }));
  auto mem_state = state();
  if (!pb::equal(mem_state, disk_state)) {
    auto msg = fmt::format("on-disk and in-memory state diverged: {}", pb::diff(mem_state, disk_state));
    LOGGER_CRITICAL(logger_, "{}", msg);
    return new_error(replica_error::STATE_DIVERGED, std::move(msg));
  }
  return {};
}

}  // namespace strata::core
