#ifndef _STRATA_EVAL_RESULT_H_
#define _STRATA_EVAL_RESULT_H_
#include <replica.pb.h>

#include <bitset>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "basic/utility_macros.h"
#include "coroutine/result_channel.h"
#include "error/error.h"
#include "error/leaf.h"
#include "replica_core/pb/types.h"
#include "replica_core/proposal_result.h"
namespace strata::core {

// local_eval_result is the part of an evaluation result which only the
// proposing replica acts upon. It never crosses the wire.
struct local_eval_result {
  local_eval_result() = default;
  MOVABLE_BUT_NOT_COPYABLE(local_eval_result)

  // markers identifying the proposal, meaningless at apply time.
  std::string cmd_id;
  std::int64_t proposed_at_ticks = 0;

  // err and reply are the outcome handed to the client.
  std::optional<strata_error> err;
  std::optional<replicapb::batch_response> reply;

  // end_cmds releases the command queue slots held by the command. Runs once.
  std::function<void(const proposal_result&)> end_cmds;
  // done is where the waiting client receives the outcome.
  coro::result_channel_handle<proposal_result> done;

  std::optional<std::int64_t> raft_log_size;
  std::optional<std::vector<pb::intents_with_arg>> intents;
  std::optional<bool> lease_metrics_result;

  bool gossip_first_range = false;
  bool maybe_gossip_system_config = false;
  bool maybe_add_to_split_queue = false;

  std::optional<replicapb::span> maybe_gossip_node_liveness;

  // finish runs end_cmds, then delivers pr on done and closes it. Safe to
  // call more than once; only the first call has any effect on each hook.
  void finish(const proposal_result& pr);

  // take_proposal_result moves err and reply out into a proposal_result.
  proposal_result take_proposal_result();

  // take_completion moves end_cmds and done into a fresh record.
  local_eval_result take_completion();
};

// eval_result is everything evaluating a command wants to change or trigger.
// It is consumed destructively, first by merge_and_destroy and then by the
// apply path, each handled field being reset to its zero value.
struct eval_result {
  eval_result() = default;
  MOVABLE_BUT_NOT_COPYABLE(eval_result)

  local_eval_result local;
  replicapb::replicated_eval_result replicated;
};

// replicated_field lists every leaf of replicated_eval_result, flattening the
// nested replica_state.
enum class replicated_field : std::uint8_t {
  IS_LEASE_REQUEST,
  IS_CONSISTENCY_RELATED,
  IS_FREEZE,
  TIMESTAMP,
  BLOCK_READS,
  STATE_RAFT_APPLIED_INDEX,
  STATE_LEASE_APPLIED_INDEX,
  STATE_DESC,
  STATE_LEASE,
  STATE_TRUNCATED_STATE,
  STATE_GC_THRESHOLD,
  STATE_TXN_SPAN_GC_THRESHOLD,
  STATE_STATS,
  STATE_FROZEN,
  DELTA,
  SPLIT,
  MERGE,
  COMPUTE_CHECKSUM,
  CHANGE_REPLICAS,
  COUNT,
};

enum class local_field : std::uint8_t {
  CMD_ID,
  PROPOSED_AT_TICKS,
  ERR,
  REPLY,
  END_CMDS,
  DONE,
  RAFT_LOG_SIZE,
  INTENTS,
  LEASE_METRICS_RESULT,
  GOSSIP_FIRST_RANGE,
  MAYBE_GOSSIP_SYSTEM_CONFIG,
  MAYBE_ADD_TO_SPLIT_QUEUE,
  MAYBE_GOSSIP_NODE_LIVENESS,
  COUNT,
};

using replicated_field_set = std::bitset<static_cast<std::size_t>(replicated_field::COUNT)>;
using local_field_set = std::bitset<static_cast<std::size_t>(local_field::COUNT)>;

// unhandled_fields returns the fields of the record which are not at their
// zero value.
replicated_field_set unhandled_fields(const replicapb::replicated_eval_result& r);
local_field_set unhandled_fields(const local_eval_result& r);

std::string field_names(const replicated_field_set& fields);
std::string field_names(const local_field_set& fields);

// verify_replicated_manifest checks that replicated_field has one entry per
// field of the protobuf messages, so that a field added to the proto without
// a handler fails on startup instead of being dropped.
leaf::result<void> verify_replicated_manifest();

// merge_and_destroy folds q into p and leaves q zero-valued.
//
// Exclusive fields set on both sides fail with eval_error::CONFLICTING_FIELD;
// p is then partially merged and the command must fail. A q carrying applied
// indexes or stats is rejected up front.
leaf::result<void> merge_and_destroy(eval_result& p, eval_result&& q);

}  // namespace strata::core

#endif  // _STRATA_EVAL_RESULT_H_
