#include "replica_core/eval_result.h"

#include <absl/strings/str_join.h>
#include <fmt/format.h>

#include <algorithm>
#include <iterator>
#include <string_view>

#include "basic/enum_name.h"
#include "basic/logger.h"
#include "error/eval_error.h"
#include "error/replica_error.h"
#include "replica_core/pb/protobuf.h"
namespace strata::core {

void local_eval_result::finish(const proposal_result& pr) {
  if (end_cmds) {
    auto end = std::move(end_cmds);
    end_cmds = nullptr;
    end(pr);
  }
  if (done) {
    auto chan = std::move(done);
    done.reset();
    chan->try_send(pr);
    chan->close();
  }
}

proposal_result local_eval_result::take_proposal_result() {
  proposal_result pr;
  pr.reply = std::move(reply);
  pr.err = std::move(err);
  reply.reset();
  err.reset();
  return pr;
}

local_eval_result local_eval_result::take_completion() {
  local_eval_result completion;
  completion.end_cmds = std::move(end_cmds);
  completion.done = std::move(done);
  end_cmds = nullptr;
  done.reset();
  return completion;
}

static bool is_set(const replicapb::replicated_eval_result& r, replicated_field field) {
  const auto& state = r.state();
  switch (field) {
    case replicated_field::IS_LEASE_REQUEST:
      return r.is_lease_request();
    case replicated_field::IS_CONSISTENCY_RELATED:
      return r.is_consistency_related();
    case replicated_field::IS_FREEZE:
      return r.is_freeze();
    case replicated_field::TIMESTAMP:
      return r.has_timestamp();
    case replicated_field::BLOCK_READS:
      return r.block_reads();
    case replicated_field::STATE_RAFT_APPLIED_INDEX:
      return state.raft_applied_index() != 0;
    case replicated_field::STATE_LEASE_APPLIED_INDEX:
      return state.lease_applied_index() != 0;
    case replicated_field::STATE_DESC:
      return state.has_desc();
    case replicated_field::STATE_LEASE:
      return state.has_lease();
    case replicated_field::STATE_TRUNCATED_STATE:
      return state.has_truncated_state();
    case replicated_field::STATE_GC_THRESHOLD:
      return state.has_gc_threshold();
    case replicated_field::STATE_TXN_SPAN_GC_THRESHOLD:
      return state.has_txn_span_gc_threshold();
    case replicated_field::STATE_STATS:
      return state.has_stats();
    case replicated_field::STATE_FROZEN:
      return state.frozen() != replicapb::FROZEN_UNSPECIFIED;
    case replicated_field::DELTA:
      return r.has_delta();
    case replicated_field::SPLIT:
      return r.has_split();
    case replicated_field::MERGE:
      return r.has_merge();
    case replicated_field::COMPUTE_CHECKSUM:
      return r.has_compute_checksum();
    case replicated_field::CHANGE_REPLICAS:
      return r.has_change_replicas();
    case replicated_field::COUNT:
      break;
  }
  return false;
}

static bool is_set(const local_eval_result& r, local_field field) {
  switch (field) {
    case local_field::CMD_ID:
      return !r.cmd_id.empty();
    case local_field::PROPOSED_AT_TICKS:
      return r.proposed_at_ticks != 0;
    case local_field::ERR:
      return r.err.has_value();
    case local_field::REPLY:
      return r.reply.has_value();
    case local_field::END_CMDS:
      return static_cast<bool>(r.end_cmds);
    case local_field::DONE:
      return r.done != nullptr;
    case local_field::RAFT_LOG_SIZE:
      return r.raft_log_size.has_value();
    case local_field::INTENTS:
      return r.intents.has_value();
    case local_field::LEASE_METRICS_RESULT:
      return r.lease_metrics_result.has_value();
    case local_field::GOSSIP_FIRST_RANGE:
      return r.gossip_first_range;
    case local_field::MAYBE_GOSSIP_SYSTEM_CONFIG:
      return r.maybe_gossip_system_config;
    case local_field::MAYBE_ADD_TO_SPLIT_QUEUE:
      return r.maybe_add_to_split_queue;
    case local_field::MAYBE_GOSSIP_NODE_LIVENESS:
      return r.maybe_gossip_node_liveness.has_value();
    case local_field::COUNT:
      break;
  }
  return false;
}

replicated_field_set unhandled_fields(const replicapb::replicated_eval_result& r) {
  replicated_field_set fields;
  for (std::size_t i = 0; i < fields.size(); ++i) {
    fields.set(i, is_set(r, static_cast<replicated_field>(i)));
  }
  return fields;
}

local_field_set unhandled_fields(const local_eval_result& r) {
  local_field_set fields;
  for (std::size_t i = 0; i < fields.size(); ++i) {
    fields.set(i, is_set(r, static_cast<local_field>(i)));
  }
  return fields;
}

template <typename Field, typename FieldSet>
static std::string join_field_names(const FieldSet& fields) {
  std::vector<std::string_view> names;
  for (std::size_t i = 0; i < fields.size(); ++i) {
    if (fields.test(i)) {
      names.push_back(enum_name(static_cast<Field>(i)));
    }
  }
  return absl::StrJoin(names, ", ", [](std::string* out, std::string_view name) { out->append(name); });
}

std::string field_names(const replicated_field_set& fields) {
  return join_field_names<replicated_field>(fields);
}

std::string field_names(const local_field_set& fields) { return join_field_names<local_field>(fields); }

leaf::result<void> verify_replicated_manifest() {
  const auto* result_desc = replicapb::replicated_eval_result::descriptor();
  const auto* state_desc = replicapb::replica_state::descriptor();
  if (result_desc->FindFieldByName("state") == nullptr) {
    return new_error(replica_error::UNHANDLED_FIELD, "replicated_eval_result has no state field");
  }
  // state itself is flattened into its fields.
  auto proto_fields = static_cast<std::size_t>(result_desc->field_count() - 1 + state_desc->field_count());
  auto manifest_fields = static_cast<std::size_t>(replicated_field::COUNT);
  if (proto_fields != manifest_fields) {
    LOG_CRITICAL("replicated eval result manifest lists {} fields, protobuf declares {}", manifest_fields,
                 proto_fields);
    return new_error(replica_error::UNHANDLED_FIELD,
                     fmt::format("manifest lists {} fields, protobuf declares {}", manifest_fields, proto_fields));
  }
  return {};
}

static auto conflict(std::string_view field) {
  return new_error(eval_error::CONFLICTING_FIELD, fmt::format("conflicting {}", field));
}

static leaf::result<void> merge_replicated(replicapb::replicated_eval_result& p,
                                           replicapb::replicated_eval_result& q) {
  auto& ps = *p.mutable_state();
  auto& qs = *q.mutable_state();

  if (qs.raft_applied_index() != 0 || qs.lease_applied_index() != 0) {
    return new_error(eval_error::APPLIED_INDEX_SPECIFIED);
  }
  if (qs.has_stats()) {
    return new_error(eval_error::STATS_SPECIFIED);
  }

  p.set_is_lease_request(p.is_lease_request() || q.is_lease_request());
  q.clear_is_lease_request();
  p.set_is_consistency_related(p.is_consistency_related() || q.is_consistency_related());
  q.clear_is_consistency_related();
  p.set_is_freeze(p.is_freeze() || q.is_freeze());
  q.clear_is_freeze();
  if (q.has_timestamp()) {
    pb::forward(*p.mutable_timestamp(), q.timestamp());
    q.clear_timestamp();
  }
  p.set_block_reads(p.block_reads() || q.block_reads());
  q.clear_block_reads();

  if (qs.has_desc()) {
    if (ps.has_desc()) {
      return conflict("state.desc");
    }
    ps.mutable_desc()->Swap(qs.mutable_desc());
    qs.clear_desc();
  }
  if (qs.has_lease()) {
    if (ps.has_lease()) {
      return conflict("state.lease");
    }
    ps.mutable_lease()->Swap(qs.mutable_lease());
    qs.clear_lease();
  }
  if (qs.has_truncated_state()) {
    if (ps.has_truncated_state()) {
      return conflict("state.truncated_state");
    }
    ps.mutable_truncated_state()->Swap(qs.mutable_truncated_state());
    qs.clear_truncated_state();
  }
  if (qs.has_gc_threshold()) {
    pb::forward(*ps.mutable_gc_threshold(), qs.gc_threshold());
    qs.clear_gc_threshold();
  }
  if (qs.has_txn_span_gc_threshold()) {
    pb::forward(*ps.mutable_txn_span_gc_threshold(), qs.txn_span_gc_threshold());
    qs.clear_txn_span_gc_threshold();
  }
  if (qs.frozen() != replicapb::FROZEN_UNSPECIFIED) {
    if (ps.frozen() != replicapb::FROZEN_UNSPECIFIED) {
      return conflict("state.frozen");
    }
    ps.set_frozen(qs.frozen());
    qs.clear_frozen();
  }

  if (q.has_delta()) {
    pb::add(*p.mutable_delta(), q.delta());
    q.clear_delta();
  }

  if (q.has_split()) {
    if (p.has_split()) {
      return conflict("split");
    }
    p.mutable_split()->Swap(q.mutable_split());
    q.clear_split();
  }
  if (q.has_merge()) {
    if (p.has_merge()) {
      return conflict("merge");
    }
    p.mutable_merge()->Swap(q.mutable_merge());
    q.clear_merge();
  }
  if (q.has_change_replicas()) {
    if (p.has_change_replicas()) {
      return conflict("change_replicas");
    }
    p.mutable_change_replicas()->Swap(q.mutable_change_replicas());
    q.clear_change_replicas();
  }
  if (q.has_compute_checksum()) {
    if (p.has_compute_checksum()) {
      return conflict("compute_checksum");
    }
    p.mutable_compute_checksum()->Swap(q.mutable_compute_checksum());
    q.clear_compute_checksum();
  }
  return {};
}

static leaf::result<void> merge_local(local_eval_result& p, local_eval_result& q) {
  if (p.cmd_id.empty()) {
    p.cmd_id = std::move(q.cmd_id);
  }
  q.cmd_id.clear();
  p.proposed_at_ticks = std::max(p.proposed_at_ticks, q.proposed_at_ticks);
  q.proposed_at_ticks = 0;

  // the first error wins, the command fails either way.
  if (!p.err) {
    p.err = std::move(q.err);
  }
  q.err.reset();
  if (q.reply) {
    if (p.reply) {
      return conflict("reply");
    }
    p.reply = std::move(q.reply);
    q.reply.reset();
  }
  if (q.end_cmds) {
    if (p.end_cmds) {
      return conflict("end_cmds");
    }
    p.end_cmds = std::move(q.end_cmds);
    q.end_cmds = nullptr;
  }
  if (q.done) {
    if (p.done) {
      return conflict("done");
    }
    p.done = std::move(q.done);
    q.done.reset();
  }

  if (q.raft_log_size) {
    if (p.raft_log_size) {
      return conflict("raft_log_size");
    }
    p.raft_log_size = q.raft_log_size;
    q.raft_log_size.reset();
  }

  if (q.intents) {
    if (!p.intents) {
      p.intents = std::move(q.intents);
    } else {
      auto& dst = *p.intents;
      std::move(q.intents->begin(), q.intents->end(), std::back_inserter(dst));
    }
    q.intents.reset();
  }

  if (q.lease_metrics_result) {
    if (p.lease_metrics_result) {
      return conflict("lease_metrics_result");
    }
    p.lease_metrics_result = q.lease_metrics_result;
    q.lease_metrics_result.reset();
  }

  p.gossip_first_range = p.gossip_first_range || q.gossip_first_range;
  q.gossip_first_range = false;
  p.maybe_gossip_system_config = p.maybe_gossip_system_config || q.maybe_gossip_system_config;
  q.maybe_gossip_system_config = false;
  p.maybe_add_to_split_queue = p.maybe_add_to_split_queue || q.maybe_add_to_split_queue;
  q.maybe_add_to_split_queue = false;

  if (q.maybe_gossip_node_liveness) {
    if (p.maybe_gossip_node_liveness) {
      return conflict("maybe_gossip_node_liveness");
    }
    p.maybe_gossip_node_liveness = std::move(q.maybe_gossip_node_liveness);
    q.maybe_gossip_node_liveness.reset();
  }
  return {};
}

leaf::result<void> merge_and_destroy(eval_result& p, eval_result&& q) {
  BOOST_LEAF_CHECK(merge_replicated(p.replicated, q.replicated));
  BOOST_LEAF_CHECK(merge_local(p.local, q.local));

  auto replicated_left = unhandled_fields(q.replicated);
  auto local_left = unhandled_fields(q.local);
  if (replicated_left.any() || local_left.any()) {
    auto msg = fmt::format("unhandled eval result fields after merge: replicated [{}] local [{}]",
                           field_names(replicated_left), field_names(local_left));
    LOG_CRITICAL("{}", msg);
    return new_error(replica_error::UNHANDLED_FIELD, std::move(msg));
  }
  return {};
}

}  // namespace strata::core
