#include <gtest/gtest.h>
#include <replica.pb.h>

#include <iostream>
#include <memory>
#include <system_error>
#include <vector>

#include "error/error.h"
#include "error/leaf.h"
#include "error/replica_error.h"
#include "replica_core/replica.h"
#include "test_replica_utils.h"
using namespace strata;
using namespace strata::core;

class local_apply_test_suit : public testing::Test {
 protected:
  static void SetUpTestSuite() { std::cout << "run before first case..." << std::endl; }

  static void TearDownTestSuite() { std::cout << "run after last case..." << std::endl; }

  virtual void SetUp() override { std::cout << "enter from SetUp" << std::endl; }

  virtual void TearDown() override { std::cout << "exit from TearDown" << std::endl; }
};

constexpr std::int64_t SECOND = 1'000'000'000;

static std::shared_ptr<replica> must_make_replica(replica_test_env &env, pb::range_id range_id,
                                                  std::uint64_t lease_store) {
  auto desc = make_range_descriptor(range_id, "a", "m", {1, 2, 3});
  auto lease = make_lease(lease_store, TEST_START_NANOS - 10 * SECOND, TEST_START_NANOS + 100 * SECOND,
                          TEST_START_NANOS + 110 * SECOND);
  auto r = env.make_replica(desc, lease);
  EXPECT_TRUE(r.has_value());
  return r.value();
}

struct local_outcome {
  std::error_code ec;
  bool should_assert = false;
};

static local_outcome handle_local(replica &r, local_eval_result &&lresult, std::uint64_t origin_store = 1) {
  local_outcome out;
  out.ec = error_code_of([&]() -> leaf::result<void> {
    BOOST_LEAF_AUTO(should_assert, r.handle_local_eval_result(make_replica_descriptor(origin_store),
                                                              std::move(lresult)));
    out.should_assert = should_assert;
    return {};
  });
  return out;
}

static std::vector<pb::intents_with_arg> some_intents() {
  pb::intents_with_arg arg;
  arg.request_key = "b";
  arg.intents.push_back(pb::intent{"b", "txn-1"});
  arg.intents.push_back(pb::intent{"c", "txn-1"});
  return {arg};
}

TEST_F(local_apply_test_suit, test_markers_and_outcome_are_dropped) {
  replica_test_env env;
  auto rep = must_make_replica(env, 2, 1);
  local_eval_result l;
  l.cmd_id = "cmd";
  l.proposed_at_ticks = 12;
  l.err = strata_error{replica_error::REPLICA_DESTROYED, std::source_location::current()};
  l.reply.emplace();
  l.end_cmds = [](const proposal_result &) {};
  auto out = handle_local(*rep, std::move(l));
  ASSERT_EQ(std::error_code{}, out.ec);
  ASSERT_FALSE(out.should_assert);
}

TEST_F(local_apply_test_suit, test_proposer_hands_intents_to_resolver) {
  replica_test_env env;
  auto rep = must_make_replica(env, 2, 1);
  local_eval_result l;
  l.intents = some_intents();
  // the command failed, its intents still get resolved
  l.err = strata_error{replica_error::REPLICA_DESTROYED, std::source_location::current()};
  auto out = handle_local(*rep, std::move(l));
  ASSERT_EQ(std::error_code{}, out.ec);
  ASSERT_FALSE(out.should_assert);
  ASSERT_EQ(1u, env.intent_resolver->calls());
  ASSERT_EQ(some_intents(), env.intent_resolver->received());
}

TEST_F(local_apply_test_suit, test_follower_drops_intents) {
  replica_test_env env;
  auto rep = must_make_replica(env, 2, 1);
  local_eval_result l;
  l.intents = some_intents();
  auto out = handle_local(*rep, std::move(l), 2);
  ASSERT_EQ(std::error_code{}, out.ec);
  ASSERT_EQ(0u, env.intent_resolver->calls());

  // the whole command applies on the follower and the replica keeps going
  auto cmd = make_command(11, 1);
  cmd.local.intents = some_intents();
  ASSERT_EQ(std::error_code{}, error_code_of([&]() -> leaf::result<void> {
              return rep->apply_command(make_replica_descriptor(2), std::move(cmd), engine_batch{});
            }));
  ASSERT_EQ(0u, env.intent_resolver->calls());
  ASSERT_FALSE(rep->halted());
}

TEST_F(local_apply_test_suit, test_raft_log_size) {
  replica_test_env env;
  auto rep = must_make_replica(env, 2, 1);
  local_eval_result l;
  l.raft_log_size = 4096;
  auto out = handle_local(*rep, std::move(l), 2);
  ASSERT_EQ(std::error_code{}, out.ec);
  ASSERT_TRUE(out.should_assert);
  ASSERT_EQ(4096, rep->raft_log_size());
}

TEST_F(local_apply_test_suit, test_split_queue_and_system_config) {
  replica_test_env env;
  auto rep = must_make_replica(env, 2, 1);
  local_eval_result l;
  l.maybe_add_to_split_queue = true;
  l.maybe_gossip_system_config = true;
  auto out = handle_local(*rep, std::move(l), 3);
  ASSERT_EQ(std::error_code{}, out.ec);
  ASSERT_TRUE(out.should_assert);
  ASSERT_EQ(std::vector<pb::range_id>{2}, env.split_queue->maybe_added());
  ASSERT_EQ(std::vector<pb::range_id>{2}, env.gossip->system_configs());
}

TEST_F(local_apply_test_suit, test_proposer_only_effects) {
  {
    replica_test_env env;
    auto rep = must_make_replica(env, 2, 1);
    local_eval_result l;
    l.lease_metrics_result = true;
    replicapb::span span;
    span.set_key("liveness-1");
    l.maybe_gossip_node_liveness = span;
    auto out = handle_local(*rep, std::move(l), 1);
    ASSERT_EQ(std::error_code{}, out.ec);
    ASSERT_TRUE(out.should_assert);
    ASSERT_EQ(1, env.get_store().metrics().lease_request_success_count.load());
    ASSERT_EQ(1u, env.gossip->node_liveness().size());
    ASSERT_EQ("liveness-1", env.gossip->node_liveness()[0].key());
  }
  {
    replica_test_env env;
    auto rep = must_make_replica(env, 2, 1);
    local_eval_result l;
    l.lease_metrics_result = false;
    l.maybe_gossip_node_liveness.emplace();
    // followers ignore them but must not trip over them
    auto out = handle_local(*rep, std::move(l), 2);
    ASSERT_EQ(std::error_code{}, out.ec);
    ASSERT_EQ(0, env.get_store().metrics().lease_request_error_count.load());
    ASSERT_TRUE(env.gossip->node_liveness().empty());
  }
}

TEST_F(local_apply_test_suit, test_gossip_first_range_is_async) {
  replica_test_env env;
  auto rep = must_make_replica(env, FIRST_RANGE_ID, 1);
  local_eval_result l;
  l.gossip_first_range = true;
  auto out = handle_local(*rep, std::move(l));
  ASSERT_EQ(std::error_code{}, out.ec);
  ASSERT_TRUE(out.should_assert);
  // nothing happens until the task runs
  ASSERT_TRUE(env.gossip->first_ranges().empty());
  env.run();
  ASSERT_EQ(1u, env.gossip->first_ranges().size());
  ASSERT_EQ(FIRST_RANGE_ID, env.gossip->first_ranges()[0].range_id());
}

TEST_F(local_apply_test_suit, test_gossip_first_range_needs_lease) {
  replica_test_env env;
  auto rep = must_make_replica(env, FIRST_RANGE_ID, 2);
  local_eval_result l;
  l.gossip_first_range = true;
  ASSERT_EQ(std::error_code{}, handle_local(*rep, std::move(l)).ec);
  env.run();
  ASSERT_TRUE(env.gossip->first_ranges().empty());
}

TEST_F(local_apply_test_suit, test_gossip_first_range_while_quiescing) {
  replica_test_env env;
  auto rep = must_make_replica(env, FIRST_RANGE_ID, 1);
  env.task_stopper.quiesce();
  local_eval_result l;
  l.gossip_first_range = true;
  ASSERT_EQ(std::error_code{}, handle_local(*rep, std::move(l)).ec);
  env.run();
  ASSERT_TRUE(env.gossip->first_ranges().empty());
}

TEST_F(local_apply_test_suit, test_gossip_failure_is_logged) {
  replica_test_env env;
  auto rep = must_make_replica(env, FIRST_RANGE_ID, 1);
  env.gossip->fail_first_range = true;
  local_eval_result l;
  l.gossip_first_range = true;
  ASSERT_EQ(std::error_code{}, handle_local(*rep, std::move(l)).ec);
  env.run();
  ASSERT_FALSE(rep->halted());
}
