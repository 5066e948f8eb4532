#include "test_replica_utils.h"

#include <algorithm>
#include <memory>
#include <utility>

#include "basic/logger.h"
#include "error/error.h"
#include "error/logic_error.h"
#include "error/storage_error.h"
#include "replica_core/state_loader.h"
using namespace strata;
using namespace strata::core;

void fake_queue::maybe_add(pb::range_id range_id, const replicapb::timestamp &) {
  std::lock_guard<std::mutex> guard(mutex_);
  maybe_added_.push_back(range_id);
}

leaf::result<bool> fake_queue::add(pb::range_id range_id, double priority) {
  if (fail_add) {
    return new_error(storage_error::WRITE_FAILED, "fake queue: injected add failure");
  }
  std::lock_guard<std::mutex> guard(mutex_);
  added_.emplace_back(range_id, priority);
  return true;
}

std::vector<pb::range_id> fake_queue::maybe_added() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return maybe_added_;
}

std::vector<std::pair<pb::range_id, double>> fake_queue::added() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return added_;
}

leaf::result<void> fake_gossip::gossip_first_range(const replicapb::range_descriptor &desc) {
  if (fail_first_range) {
    return new_error(storage_error::WRITE_FAILED, "fake gossip: injected failure");
  }
  std::lock_guard<std::mutex> guard(mutex_);
  first_ranges_.push_back(desc);
  return {};
}

void fake_gossip::maybe_gossip_system_config(pb::range_id range_id) {
  std::lock_guard<std::mutex> guard(mutex_);
  system_configs_.push_back(range_id);
}

void fake_gossip::maybe_gossip_node_liveness(pb::range_id, const replicapb::span &span) {
  std::lock_guard<std::mutex> guard(mutex_);
  node_liveness_.push_back(span);
}

std::vector<replicapb::range_descriptor> fake_gossip::first_ranges() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return first_ranges_;
}

std::vector<pb::range_id> fake_gossip::system_configs() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return system_configs_;
}

std::vector<replicapb::span> fake_gossip::node_liveness() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return node_liveness_;
}

void fake_intent_resolver::process_intents_async(pb::range_id, std::vector<pb::intents_with_arg> &&intents) {
  std::lock_guard<std::mutex> guard(mutex_);
  ++calls_;
  for (auto &item : intents) {
    received_.push_back(std::move(item));
  }
}

std::vector<pb::intents_with_arg> fake_intent_resolver::received() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return received_;
}

std::size_t fake_intent_resolver::calls() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return calls_;
}

leaf::result<pb::replica_id> fake_raft_group::leader() {
  if (fail_leader) {
    return new_error(logic_error::KEY_NOT_FOUND, "fake raft group: no group");
  }
  return leader_id;
}

leaf::result<void> fake_raft_group::transfer_leader(pb::replica_id target) {
  std::lock_guard<std::mutex> guard(mutex_);
  transfers_.push_back(target);
  return {};
}

std::vector<pb::replica_id> fake_raft_group::transfers() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return transfers_;
}

leaf::result<void> fake_range_topology::split_post_apply(pb::range_id range_id, const replicapb::mvcc_stats &,
                                                         const replicapb::split_trigger &trigger) {
  if (on_split) {
    on_split(range_id);
  }
  if (fail_split) {
    return new_error(storage_error::WRITE_FAILED, "fake topology: injected split failure");
  }
  std::lock_guard<std::mutex> guard(mutex_);
  splits_.push_back(trigger);
  return {};
}

leaf::result<void> fake_range_topology::merge_range(pb::range_id, const replicapb::merge_trigger &trigger) {
  if (fail_merge) {
    return new_error(storage_error::WRITE_FAILED, "fake topology: injected merge failure");
  }
  std::lock_guard<std::mutex> guard(mutex_);
  merges_.push_back(trigger);
  return {};
}

std::vector<replicapb::split_trigger> fake_range_topology::splits() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return splits_;
}

std::vector<replicapb::merge_trigger> fake_range_topology::merges() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return merges_;
}

replicapb::timestamp make_timestamp(std::int64_t wall_time, std::int32_t logical) {
  replicapb::timestamp ts;
  ts.set_wall_time(wall_time);
  ts.set_logical(logical);
  return ts;
}

replicapb::replica_descriptor make_replica_descriptor(std::uint64_t store_id) {
  replicapb::replica_descriptor r;
  r.set_node_id(store_id);
  r.set_store_id(store_id);
  r.set_replica_id(store_id);
  return r;
}

replicapb::range_descriptor make_range_descriptor(pb::range_id range_id, std::string start_key, std::string end_key,
                                                  std::initializer_list<std::uint64_t> stores) {
  replicapb::range_descriptor desc;
  desc.set_range_id(range_id);
  desc.set_start_key(std::move(start_key));
  desc.set_end_key(std::move(end_key));
  std::uint64_t next = 1;
  for (auto store_id : stores) {
    *desc.add_replicas() = make_replica_descriptor(store_id);
    next = std::max(next, store_id + 1);
  }
  desc.set_next_replica_id(next);
  return desc;
}

replicapb::lease make_lease(std::uint64_t store_id, std::int64_t start, std::int64_t start_stasis,
                            std::int64_t expiration) {
  replicapb::lease l;
  *l.mutable_start() = make_timestamp(start);
  *l.mutable_start_stasis() = make_timestamp(start_stasis);
  *l.mutable_expiration() = make_timestamp(expiration);
  *l.mutable_replica() = make_replica_descriptor(store_id);
  return l;
}

store_config new_test_store_config(std::uint64_t store_id) {
  return store_config{store_id,
                      store_id,
                      DEFAULT_RAFT_LOG_QUEUE_STALE_THRESHOLD,
                      DEFAULT_RANGE_MAX_BYTES,
                      DEFAULT_CHECKSUM_GC_INTERVAL,
                      DEFAULT_REPLICA_GC_PRIORITY_REMOVED,
                      default_logger_ptr()};
}

replica_test_env::replica_test_env(store_config cfg)
    : manual(TEST_START_NANOS),
      clock([this]() { return manual.unix_nanos(); }),
      task_stopper(io.get_executor()),
      engine(std::make_shared<memory_engine>()),
      raft_log_queue(std::make_shared<fake_queue>()),
      split_queue(std::make_shared<fake_queue>()),
      replica_gc_queue(std::make_shared<fake_queue>()),
      gossip(std::make_shared<fake_gossip>()),
      intent_resolver(std::make_shared<fake_intent_resolver>()),
      topology(std::make_shared<fake_range_topology>()) {
  store_collaborators collaborators{
      engine_proxy{engine},          replica_queue_proxy{raft_log_queue},
      replica_queue_proxy{split_queue}, replica_queue_proxy{replica_gc_queue},
      gossip_proxy{gossip},          intent_resolver_proxy{intent_resolver},
      range_topology_proxy{topology},
  };
  store_ = std::make_unique<store>(std::move(cfg), clock, task_stopper, std::move(collaborators));
}

leaf::result<std::shared_ptr<replica>> replica_test_env::make_replica(const replicapb::range_descriptor &desc,
                                                                      const replicapb::lease &lease,
                                                                      std::shared_ptr<fake_raft_group> raft_group) {
  if (raft_group == nullptr) {
    raft_group = std::make_shared<fake_raft_group>(pb::NONE);
  }
  BOOST_LEAF_CHECK(write_initial_state(store_->engine(), desc, lease));
  auto r = std::make_shared<replica>(*store_, desc.range_id(), raft_group_proxy{std::move(raft_group)});
  BOOST_LEAF_CHECK(r->load_state());
  return r;
}

void replica_test_env::run() {
  io.restart();
  io.run();
}

eval_result make_command(std::uint64_t raft_applied_index, std::uint64_t lease_applied_index) {
  eval_result result;
  auto &state = *result.replicated.mutable_state();
  state.set_raft_applied_index(raft_applied_index);
  state.set_lease_applied_index(lease_applied_index);
  return result;
}

coro::result_channel_handle<proposal_result> with_done(eval_result &result, asio::any_io_executor executor) {
  auto done = std::make_shared<coro::result_channel<proposal_result>>(executor);
  result.local.done = done;
  return done;
}

engine_batch make_user_batch(std::string key, std::string value) {
  engine_batch batch;
  batch.put(std::move(key), std::move(value));
  return batch;
}

std::error_code error_code_of(const std::function<leaf::result<void>()> &f) {
  return leaf::try_handle_all(
      [&]() -> leaf::result<std::error_code> {
        BOOST_LEAF_CHECK(f());
        return std::error_code{};
      },
      [](const strata_error &err) -> std::error_code { return err.err_code; },
      [](const leaf::error_info &) -> std::error_code { return make_error_code(std::errc::io_error); });
}
