#include <gtest/gtest.h>
#include <replica.pb.h>

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "error/error.h"
#include "error/leaf.h"
#include "error/storage_error.h"
#include "replica_core/keys.h"
#include "replica_core/memory_engine.h"
#include "replica_core/pb/protobuf.h"
#include "replica_core/state_loader.h"
#include "test_replica_utils.h"
using namespace strata;
using namespace strata::core;

class state_loader_test_suit : public testing::Test {
 protected:
  static void SetUpTestSuite() { std::cout << "run before first case..." << std::endl; }

  static void TearDownTestSuite() { std::cout << "run after last case..." << std::endl; }

  virtual void SetUp() override { std::cout << "enter from SetUp" << std::endl; }

  virtual void TearDown() override { std::cout << "exit from TearDown" << std::endl; }
};

static std::optional<replicapb::replica_state> load_state(const std::shared_ptr<memory_engine> &engine,
                                                          pb::range_id range_id) {
  state_loader loader(range_id);
  auto snap = engine->new_snapshot();
  return leaf::try_handle_all(
      [&]() -> leaf::result<std::optional<replicapb::replica_state>> {
        BOOST_LEAF_AUTO(state, loader.load(snap));
        return std::optional<replicapb::replica_state>{std::move(state)};
      },
      [](const leaf::error_info &) { return std::optional<replicapb::replica_state>{}; });
}

static std::error_code load_error(const std::shared_ptr<memory_engine> &engine, pb::range_id range_id) {
  state_loader loader(range_id);
  auto snap = engine->new_snapshot();
  return error_code_of([&]() -> leaf::result<void> {
    BOOST_LEAF_CHECK(loader.load(snap));
    return {};
  });
}

static std::vector<std::string> scan_keys(const std::shared_ptr<memory_engine> &engine, std::string_view start,
                                          std::string_view end) {
  std::vector<std::string> keys;
  auto ec = error_code_of([&]() {
    return engine->scan(start, end, [&](std::string_view key, std::string_view) { keys.emplace_back(key); });
  });
  EXPECT_EQ(std::error_code{}, ec);
  return keys;
}

TEST_F(state_loader_test_suit, test_memory_engine_snapshot_isolation) {
  auto engine = std::make_shared<memory_engine>();
  engine_proxy proxy{engine};
  ASSERT_EQ(std::error_code{}, error_code_of([&]() { return proxy->write(make_user_batch("a", "1")); }));
  auto snap = proxy->new_snapshot();

  engine_batch batch;
  batch.put("a", "2");
  batch.put("b", "3");
  ASSERT_EQ(std::error_code{}, error_code_of([&]() { return proxy->write(std::move(batch)); }));

  std::optional<std::string> old_a;
  std::optional<std::string> old_b;
  ASSERT_EQ(std::error_code{}, error_code_of([&]() -> leaf::result<void> {
              BOOST_LEAF_ASSIGN(old_a, snap->get("a"));
              BOOST_LEAF_ASSIGN(old_b, snap->get("b"));
              return {};
            }));
  ASSERT_EQ(std::optional<std::string>{"1"}, old_a);
  ASSERT_FALSE(old_b.has_value());
  ASSERT_EQ(2u, engine->size());
}

TEST_F(state_loader_test_suit, test_memory_engine_scan_and_delete) {
  auto engine = std::make_shared<memory_engine>();
  engine_batch batch;
  for (auto key : {"a", "b", "c", "d"}) {
    batch.put(key, "v");
  }
  ASSERT_EQ(std::error_code{}, error_code_of([&]() { return engine->write(std::move(batch)); }));
  ASSERT_EQ((std::vector<std::string>{"b", "c"}), scan_keys(engine, "b", "d"));
  // an empty end runs to the end of the keyspace
  ASSERT_EQ((std::vector<std::string>{"c", "d"}), scan_keys(engine, "c", ""));

  engine_batch del;
  del.del("c");
  del.del("missing");
  ASSERT_EQ(std::error_code{}, error_code_of([&]() { return engine->write(std::move(del)); }));
  ASSERT_EQ((std::vector<std::string>{"a", "b", "d"}), scan_keys(engine, "", ""));
}

TEST_F(state_loader_test_suit, test_memory_engine_failed_write_is_atomic) {
  auto engine = std::make_shared<memory_engine>();
  engine->fail_writes(true);
  engine_batch batch;
  batch.put("a", "1");
  batch.put("b", "2");
  ASSERT_EQ(make_error_code(storage_error::WRITE_FAILED),
            error_code_of([&]() { return engine->write(std::move(batch)); }));
  ASSERT_EQ(0u, engine->size());
  ASSERT_EQ(0u, engine->write_count());

  engine->fail_writes(false);
  ASSERT_EQ(std::error_code{}, error_code_of([&]() { return engine->write(make_user_batch("a", "1")); }));
  ASSERT_EQ(1u, engine->write_count());
}

TEST_F(state_loader_test_suit, test_absent_keys_load_as_zero) {
  auto engine = std::make_shared<memory_engine>();
  auto state = load_state(engine, 5);
  ASSERT_TRUE(state.has_value());
  ASSERT_EQ(0u, state->raft_applied_index());
  ASSERT_EQ(0u, state->lease_applied_index());
  ASSERT_FALSE(state->has_desc());
  ASSERT_FALSE(state->has_lease());
  ASSERT_FALSE(state->has_stats());
  ASSERT_EQ(replicapb::FROZEN_UNSPECIFIED, state->frozen());
}

TEST_F(state_loader_test_suit, test_staged_state_loads_back) {
  auto engine = std::make_shared<memory_engine>();
  state_loader loader(4);
  replicapb::replica_state want;
  want.set_raft_applied_index(42);
  want.set_lease_applied_index(7);
  *want.mutable_desc() = make_range_descriptor(4, "c", "f", {1, 2});
  *want.mutable_lease() = make_lease(2, 100, 200, 300);
  want.mutable_truncated_state()->set_index(30);
  want.mutable_truncated_state()->set_term(3);
  *want.mutable_gc_threshold() = make_timestamp(50);
  *want.mutable_txn_span_gc_threshold() = make_timestamp(60, 1);
  want.mutable_stats()->set_live_bytes(123);
  want.mutable_stats()->set_key_count(4);
  want.set_frozen(replicapb::FROZEN);

  engine_batch batch;
  loader.stage(batch, want);
  ASSERT_EQ(9u, batch.count());
  ASSERT_EQ(std::error_code{}, error_code_of([&]() { return engine->write(std::move(batch)); }));

  auto got = load_state(engine, 4);
  ASSERT_TRUE(got.has_value());
  ASSERT_EQ(want.SerializeAsString(), got->SerializeAsString());

  // other ranges see nothing of it
  auto other = load_state(engine, 5);
  ASSERT_TRUE(other.has_value());
  ASSERT_EQ(0u, other->raft_applied_index());
}

TEST_F(state_loader_test_suit, test_set_mvcc_stats) {
  auto engine = std::make_shared<memory_engine>();
  engine_proxy proxy{engine};
  state_loader loader(3);
  replicapb::mvcc_stats stats;
  stats.set_val_bytes(77);
  ASSERT_EQ(std::error_code{}, error_code_of([&]() { return loader.set_mvcc_stats(proxy, stats); }));

  auto snap = proxy->new_snapshot();
  auto loaded = leaf::try_handle_all(
      [&]() -> leaf::result<std::int64_t> {
        BOOST_LEAF_AUTO(s, loader.load_mvcc_stats(snap));
        return s.val_bytes();
      },
      [](const leaf::error_info &) { return std::int64_t{-1}; });
  ASSERT_EQ(77, loaded);
}

TEST_F(state_loader_test_suit, test_write_initial_state) {
  auto engine = std::make_shared<memory_engine>();
  engine_proxy proxy{engine};
  auto desc = make_range_descriptor(6, "a", "z", {1});
  ASSERT_EQ(std::error_code{},
            error_code_of([&]() { return write_initial_state(proxy, desc, make_lease(1, 1, 2, 3)); }));

  auto state = load_state(engine, 6);
  ASSERT_TRUE(state.has_value());
  ASSERT_EQ(10u, state->raft_applied_index());
  ASSERT_EQ(10u, state->truncated_state().index());
  ASSERT_EQ(5u, state->truncated_state().term());
  ASSERT_EQ(6u, state->desc().range_id());
  ASSERT_EQ(1u, state->lease().replica().store_id());
  // every key of the range id prefix is written
  ASSERT_EQ(9u, scan_keys(engine, keys::make_range_id_prefix(6), keys::prefix_end(keys::make_range_id_prefix(6)))
                    .size());
}

TEST_F(state_loader_test_suit, test_corrupt_values_fail_to_load) {
  {
    auto engine = std::make_shared<memory_engine>();
    ASSERT_EQ(std::error_code{},
              error_code_of([&]() { return engine->write(make_user_batch(keys::raft_applied_index_key(2), "xyz")); }));
    ASSERT_EQ(make_error_code(storage_error::DECODE_FAILED), load_error(engine, 2));
  }
  {
    auto engine = std::make_shared<memory_engine>();
    ASSERT_EQ(std::error_code{}, error_code_of([&]() {
                return engine->write(make_user_batch(keys::range_descriptor_key(2), std::string("\xff\xff\xff", 3)));
              }));
    ASSERT_EQ(make_error_code(storage_error::DECODE_FAILED), load_error(engine, 2));
  }
  {
    auto engine = std::make_shared<memory_engine>();
    ASSERT_EQ(std::error_code{}, error_code_of([&]() {
                return engine->write(
                    make_user_batch(keys::range_frozen_status_key(2), std::string("\0\0\0\0\0\0\0\x09", 8)));
              }));
    ASSERT_EQ(make_error_code(storage_error::DECODE_FAILED), load_error(engine, 2));
  }
}
