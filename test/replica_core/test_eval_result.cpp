#include <gtest/gtest.h>
#include <replica.pb.h>

#include <asio/io_context.hpp>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

#include "error/error.h"
#include "error/eval_error.h"
#include "error/leaf.h"
#include "replica_core/eval_result.h"
#include "replica_core/pb/protobuf.h"
#include "test_replica_utils.h"
using namespace strata;
using namespace strata::core;

class eval_result_test_suit : public testing::Test {
 protected:
  static void SetUpTestSuite() { std::cout << "run before first case..." << std::endl; }

  static void TearDownTestSuite() { std::cout << "run after last case..." << std::endl; }

  virtual void SetUp() override { std::cout << "enter from SetUp" << std::endl; }

  virtual void TearDown() override { std::cout << "exit from TearDown" << std::endl; }
};

static std::error_code merge(eval_result &p, eval_result &&q) {
  return error_code_of([&]() -> leaf::result<void> { return merge_and_destroy(p, std::move(q)); });
}

TEST_F(eval_result_test_suit, test_manifest_matches_protobuf) {
  ASSERT_EQ(std::error_code{}, error_code_of([]() { return verify_replicated_manifest(); }));
}

TEST_F(eval_result_test_suit, test_zero_value_has_no_unhandled_fields) {
  eval_result r;
  ASSERT_TRUE(unhandled_fields(r.replicated).none());
  ASSERT_TRUE(unhandled_fields(r.local).none());

  // an empty state submessage is no field
  r.replicated.mutable_state();
  ASSERT_TRUE(unhandled_fields(r.replicated).none());
}

TEST_F(eval_result_test_suit, test_field_names) {
  replicapb::replicated_eval_result r;
  r.mutable_split();
  r.mutable_merge();
  ASSERT_EQ("SPLIT, MERGE", field_names(unhandled_fields(r)));

  local_eval_result l;
  l.gossip_first_range = true;
  l.raft_log_size = 7;
  ASSERT_EQ("RAFT_LOG_SIZE, GOSSIP_FIRST_RANGE", field_names(unhandled_fields(l)));
}

TEST_F(eval_result_test_suit, test_merge_markers_and_timestamp) {
  eval_result p;
  eval_result q;
  q.replicated.set_is_lease_request(true);
  q.replicated.set_block_reads(true);
  *p.replicated.mutable_timestamp() = make_timestamp(5, 1);
  *q.replicated.mutable_timestamp() = make_timestamp(7);
  ASSERT_EQ(std::error_code{}, merge(p, std::move(q)));

  ASSERT_TRUE(p.replicated.is_lease_request());
  ASSERT_TRUE(p.replicated.block_reads());
  ASSERT_FALSE(p.replicated.is_freeze());
  ASSERT_TRUE(pb::equal(make_timestamp(7), p.replicated.timestamp()));
  ASSERT_TRUE(unhandled_fields(q.replicated).none());
  ASSERT_TRUE(unhandled_fields(q.local).none());

  // the timestamp only moves forward
  eval_result older;
  *older.replicated.mutable_timestamp() = make_timestamp(6);
  ASSERT_EQ(std::error_code{}, merge(p, std::move(older)));
  ASSERT_TRUE(pb::equal(make_timestamp(7), p.replicated.timestamp()));
}

TEST_F(eval_result_test_suit, test_merge_delta_and_thresholds) {
  eval_result p;
  eval_result q;
  p.replicated.mutable_delta()->set_live_bytes(10);
  p.replicated.mutable_delta()->set_key_count(1);
  q.replicated.mutable_delta()->set_live_bytes(5);
  q.replicated.mutable_delta()->set_contains_estimates(true);
  *p.replicated.mutable_state()->mutable_gc_threshold() = make_timestamp(20);
  *q.replicated.mutable_state()->mutable_gc_threshold() = make_timestamp(10);
  *q.replicated.mutable_state()->mutable_txn_span_gc_threshold() = make_timestamp(30);
  ASSERT_EQ(std::error_code{}, merge(p, std::move(q)));

  const auto &delta = p.replicated.delta();
  ASSERT_EQ(15, delta.live_bytes());
  ASSERT_EQ(1, delta.key_count());
  ASSERT_TRUE(delta.contains_estimates());
  ASSERT_TRUE(pb::equal(make_timestamp(20), p.replicated.state().gc_threshold()));
  ASSERT_TRUE(pb::equal(make_timestamp(30), p.replicated.state().txn_span_gc_threshold()));
  ASSERT_TRUE(unhandled_fields(q.replicated).none());
}

TEST_F(eval_result_test_suit, test_merge_moves_exclusive_fields) {
  eval_result p;
  eval_result q;
  *q.replicated.mutable_state()->mutable_lease() = make_lease(2, 1, 5, 10);
  q.replicated.mutable_split()->mutable_trigger()->mutable_left_desc()->set_range_id(3);
  q.replicated.mutable_compute_checksum()->set_checksum_id("c1");
  q.replicated.mutable_state()->set_frozen(replicapb::FROZEN);
  ASSERT_EQ(std::error_code{}, merge(p, std::move(q)));

  ASSERT_EQ(2u, p.replicated.state().lease().replica().store_id());
  ASSERT_EQ(3u, p.replicated.split().trigger().left_desc().range_id());
  ASSERT_EQ("c1", p.replicated.compute_checksum().checksum_id());
  ASSERT_EQ(replicapb::FROZEN, p.replicated.state().frozen());
  ASSERT_TRUE(unhandled_fields(q.replicated).none());
}

TEST_F(eval_result_test_suit, test_merge_conflicting_fields) {
  struct test_case {
    std::string name;
    std::function<void(eval_result &)> set;
  };
  std::vector<test_case> tests = {
      {"desc", [](eval_result &r) { r.replicated.mutable_state()->mutable_desc()->set_range_id(1); }},
      {"lease", [](eval_result &r) { *r.replicated.mutable_state()->mutable_lease() = make_lease(1, 1, 2, 3); }},
      {"truncated_state", [](eval_result &r) { r.replicated.mutable_state()->mutable_truncated_state()->set_index(4); }},
      {"frozen", [](eval_result &r) { r.replicated.mutable_state()->set_frozen(replicapb::UNFROZEN); }},
      {"split", [](eval_result &r) { r.replicated.mutable_split(); }},
      {"merge", [](eval_result &r) { r.replicated.mutable_merge(); }},
      {"change_replicas", [](eval_result &r) { r.replicated.mutable_change_replicas(); }},
      {"compute_checksum", [](eval_result &r) { r.replicated.mutable_compute_checksum(); }},
      {"reply", [](eval_result &r) { r.local.reply.emplace(); }},
      {"raft_log_size", [](eval_result &r) { r.local.raft_log_size = 1; }},
      {"lease_metrics_result", [](eval_result &r) { r.local.lease_metrics_result = true; }},
      {"node_liveness", [](eval_result &r) { r.local.maybe_gossip_node_liveness.emplace(); }},
      {"end_cmds", [](eval_result &r) { r.local.end_cmds = [](const proposal_result &) {}; }},
  };
  for (const auto &tt : tests) {
    eval_result p;
    eval_result q;
    tt.set(p);
    tt.set(q);
    ASSERT_EQ(make_error_code(eval_error::CONFLICTING_FIELD), merge(p, std::move(q))) << tt.name;
  }
}

TEST_F(eval_result_test_suit, test_merge_rejects_applied_index_and_stats) {
  {
    eval_result p;
    eval_result q;
    q.replicated.mutable_state()->set_raft_applied_index(3);
    ASSERT_EQ(make_error_code(eval_error::APPLIED_INDEX_SPECIFIED), merge(p, std::move(q)));
  }
  {
    eval_result p;
    eval_result q;
    q.replicated.mutable_state()->set_lease_applied_index(3);
    ASSERT_EQ(make_error_code(eval_error::APPLIED_INDEX_SPECIFIED), merge(p, std::move(q)));
  }
  {
    eval_result p;
    eval_result q;
    q.replicated.mutable_state()->mutable_stats();
    ASSERT_EQ(make_error_code(eval_error::STATS_SPECIFIED), merge(p, std::move(q)));
  }
  {
    // the receiving side may carry the indexes
    auto p = make_command(11, 2);
    eval_result q;
    q.replicated.set_is_consistency_related(true);
    ASSERT_EQ(std::error_code{}, merge(p, std::move(q)));
    ASSERT_EQ(11u, p.replicated.state().raft_applied_index());
  }
}

TEST_F(eval_result_test_suit, test_merge_local) {
  eval_result p;
  eval_result q;
  p.local.cmd_id = "p";
  q.local.cmd_id = "q";
  p.local.proposed_at_ticks = 3;
  q.local.proposed_at_ticks = 9;
  p.local.err = strata_error{eval_error::STATS_SPECIFIED, "first", std::source_location::current()};
  q.local.err = strata_error{eval_error::CONFLICTING_FIELD, "second", std::source_location::current()};
  pb::intents_with_arg a{"a", {pb::intent{"a", "t1"}}};
  pb::intents_with_arg b{"b", {pb::intent{"b", "t2"}}};
  p.local.intents.emplace().push_back(a);
  q.local.intents.emplace().push_back(b);
  q.local.gossip_first_range = true;
  q.local.maybe_add_to_split_queue = true;
  q.local.raft_log_size = 42;
  ASSERT_EQ(std::error_code{}, merge(p, std::move(q)));

  ASSERT_EQ("p", p.local.cmd_id);
  ASSERT_EQ(9, p.local.proposed_at_ticks);
  ASSERT_TRUE(p.local.err.has_value());
  ASSERT_EQ("first", p.local.err->message);
  ASSERT_TRUE(p.local.intents.has_value());
  ASSERT_EQ(2u, p.local.intents->size());
  ASSERT_EQ("b", (*p.local.intents)[1].request_key);
  ASSERT_TRUE(p.local.gossip_first_range);
  ASSERT_TRUE(p.local.maybe_add_to_split_queue);
  ASSERT_FALSE(p.local.maybe_gossip_system_config);
  ASSERT_EQ(42, p.local.raft_log_size.value());
  ASSERT_TRUE(unhandled_fields(q.local).none());

  // 没有 cmd_id 时接收对方的
  eval_result empty;
  eval_result other;
  other.local.cmd_id = "other";
  ASSERT_EQ(std::error_code{}, merge(empty, std::move(other)));
  ASSERT_EQ("other", empty.local.cmd_id);
}

TEST_F(eval_result_test_suit, test_finish_runs_hooks_once) {
  asio::io_context io;
  local_eval_result l;
  int end_calls = 0;
  l.end_cmds = [&](const proposal_result &) { ++end_calls; };
  auto done = std::make_shared<coro::result_channel<proposal_result>>(io.get_executor());
  l.done = done;

  proposal_result pr;
  pr.reply.emplace();
  l.finish(pr);
  ASSERT_EQ(1, end_calls);
  ASSERT_TRUE(done->is_closed());
  ASSERT_TRUE(done->try_receive().has_value());
  ASSERT_TRUE(unhandled_fields(l).none());

  l.finish(pr);
  ASSERT_EQ(1, end_calls);
}

TEST_F(eval_result_test_suit, test_take_completion_and_proposal_result) {
  asio::io_context io;
  eval_result r;
  with_done(r, io.get_executor());
  r.local.end_cmds = [](const proposal_result &) {};
  r.local.reply.emplace();
  r.local.raft_log_size = 3;

  auto completion = r.local.take_completion();
  auto pr = r.local.take_proposal_result();
  ASSERT_TRUE(completion.done != nullptr);
  ASSERT_TRUE(static_cast<bool>(completion.end_cmds));
  ASSERT_TRUE(pr.reply.has_value());
  ASSERT_FALSE(pr.err.has_value());

  auto left = unhandled_fields(r.local);
  ASSERT_EQ(1u, left.count());
  ASSERT_TRUE(left.test(static_cast<std::size_t>(local_field::RAFT_LOG_SIZE)));
}
