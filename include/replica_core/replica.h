#ifndef _STRATA_REPLICA_H_
#define _STRATA_REPLICA_H_
#include <absl/container/flat_hash_map.h>
#include <replica.pb.h>

#include <asio/awaitable.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>

#include "basic/logger.h"
#include "basic/utility_macros.h"
#include "coroutine/notify_signal.h"
#include "error/expected.h"
#include "error/leaf.h"
#include "replica_core/engine.h"
#include "replica_core/eval_result.h"
#include "replica_core/interfaces.h"
#include "replica_core/pb/types.h"
#include "replica_core/state_loader.h"
#include "replica_core/store.h"
#include "replica_core/timestamp_cache.h"
namespace strata::core {

// REPLICA_CHECKSUM_VERSION is bumped whenever the digest computation changes.
// Replicas only compute checksums requested for their own version.
constexpr std::uint32_t REPLICA_CHECKSUM_VERSION = 1;

constexpr pb::range_id FIRST_RANGE_ID = 1;

// replica_checksum tracks one consistency check.
//
// An entry is created either by a waiter (pending, not started) or by the
// compute command (started). Once the computation finished, digest holds the
// result (empty when the computation failed), notify has fired and
// gc_timestamp is set. A waiter that times out also sets gc_timestamp so an
// entry that never completes is still swept.
struct replica_checksum {
  bool started = false;
  std::optional<std::string> digest;
  std::optional<replicapb::raft_snapshot_data> snapshot;
  coro::notify_signal_handle notify;
  std::optional<std::chrono::system_clock::time_point> gc_timestamp;
};

struct replica_checksum_result {
  std::optional<std::string> digest;
  std::optional<replicapb::raft_snapshot_data> snapshot;
};

// compute_checksum hashes the replicated state and the user data of the range
// described by desc. When with_snapshot is set every key/value visited is also
// collected into a raft_snapshot_data.
leaf::result<replica_checksum_result> compute_checksum(const engine_snapshot_proxy& snap,
                                                       const replicapb::range_descriptor& desc, bool with_snapshot);

class replica : public std::enable_shared_from_this<replica> {
  NOT_COPYABLE_NOT_MOVABLE(replica)

 public:
  replica(store& s, pb::range_id range_id, raft_group_proxy&& raft_group);

  // load_state reads the persisted replica state from the engine.
  leaf::result<void> load_state();

  pb::range_id range_id() const { return range_id_; }

  pb::replica_id replica_id() const;

  replicapb::replica_state state() const;

  replicapb::range_descriptor desc() const;

  replicapb::lease lease() const;

  std::int64_t raft_log_size() const;

  replicapb::timestamp ts_cache_low_water() const;

  // 读时间戳缓存，内部持有 mu_
  void record_read(std::string_view key, const replicapb::timestamp& ts);
  replicapb::timestamp max_read_timestamp(std::string_view key) const;

  bool is_first_range() const { return range_id_ == FIRST_RANGE_ID; }

  void destroy();

  bool destroyed() const;

  // halted reports whether the replica stopped applying commands after a
  // fatal error.
  bool halted() const { return halted_.load(); }

  // set_desc installs a new descriptor in memory. The descriptor must belong
  // to this range.
  leaf::result<void> set_desc(const replicapb::range_descriptor& desc);

  // ---- apply coordinator ----

  // apply_command applies one committed command: it commits the replicated
  // state together with the command's writes, runs both applicators and
  // finally notifies the proposer. A fatal error halts the replica.
  leaf::result<void> apply_command(const replicapb::replica_descriptor& origin, eval_result&& result,
                                   engine_batch&& batch);

  leaf::result<void> handle_eval_result(const replicapb::replica_descriptor& origin, local_eval_result&& lresult,
                                        replicapb::replicated_eval_result&& rresult);

  // handle_replicated_eval_result applies the effects every replica applies
  // identically. Returns whether the state should be asserted against disk.
  leaf::result<bool> handle_replicated_eval_result(replicapb::replicated_eval_result rresult);

  // handle_local_eval_result applies the effects meant for the proposer and
  // the node-local bookkeeping. Returns whether the state should be asserted
  // against disk.
  leaf::result<bool> handle_local_eval_result(const replicapb::replica_descriptor& origin,
                                              local_eval_result lresult);

  // assert_state compares the in-memory state with what is on disk.
  leaf::result<void> assert_state();

  // ---- lease ----
  leaf::result<void> lease_post_apply(const replicapb::lease& new_lease, pb::replica_id replica_id,
                                      const replicapb::lease& prev_lease);

  leaf::result<void> maybe_transfer_raft_leadership(pb::replica_id replica_id, pb::replica_id target);

  // ---- checksum ----
  void compute_checksum_post_apply(const replicapb::compute_checksum& args);

  void compute_checksum_done(const std::string& id, std::optional<std::string> digest,
                             std::optional<replicapb::raft_snapshot_data> snapshot);

  // get_checksum waits for the checksum with the given id to be computed.
  asio::awaitable<expected<replica_checksum_result>> get_checksum(std::string id,
                                                                  std::chrono::steady_clock::duration timeout);

#ifdef STRATA_TEST
  std::optional<replica_checksum> checksum_entry(const std::string& id) const {
    std::lock_guard<std::mutex> guard(mu_);
    auto iter = checksums_.find(id);
    if (iter == checksums_.end()) {
      return std::nullopt;
    }
    return iter->second;
  }

  std::size_t checksum_count() const {
    std::lock_guard<std::mutex> guard(mu_);
    return checksums_.size();
  }

  std::shared_mutex& read_only_cmd_mutex() { return read_only_cmd_mu_; }
#endif

 private:
  leaf::result<void> apply_command_impl(const replicapb::replica_descriptor& origin, eval_result& result,
                                        engine_batch&& batch);

  // commit_replicated_state stages the durable part of rresult into batch and
  // writes it.
  leaf::result<void> commit_replicated_state(const replicapb::replicated_eval_result& rresult, engine_batch&& batch);

  void halt(const strata_error& err);

  void set_replica_id_locked(const replicapb::range_descriptor& desc);

  bool needs_split_by_size_locked() const;

  void gc_old_checksum_entries_locked(std::chrono::system_clock::time_point now);

  void maybe_gossip_first_range();

  void gossip_first_range_if_lease_holder();

  store& store_;
  const pb::range_id range_id_;
  raft_group_proxy raft_group_;
  state_loader state_loader_;
  std::shared_ptr<tagged_logger> logger_;

  // read_only_cmd_mu_ is held shared by read-only commands and exclusively
  // while a command with block_reads applies.
  std::shared_mutex read_only_cmd_mu_;

  mutable std::mutex mu_;
  replicapb::replica_state state_;
  pb::replica_id replica_id_ = pb::NONE;
  timestamp_cache ts_cache_;
  std::int64_t raft_log_size_ = 0;
  absl::flat_hash_map<std::string, replica_checksum> checksums_;
  bool destroyed_ = false;

  std::atomic<bool> halted_{false};
};

}  // namespace strata::core

#endif  // _STRATA_REPLICA_H_
