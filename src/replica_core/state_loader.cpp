#include "replica_core/state_loader.h"

#include <fmt/format.h>

#include "error/error.h"
#include "error/storage_error.h"
#include "replica_core/keys.h"
namespace strata::core {

static std::string encode_uint64(std::uint64_t v) {
  std::string buf;
  buf.reserve(8);
  for (int shift = 56; shift >= 0; shift -= 8) {
    buf.push_back(static_cast<char>((v >> shift) & 0xff));
  }
  return buf;
}

static leaf::result<std::uint64_t> decode_uint64(const std::string& key, const std::string& buf) {
  if (buf.size() != 8) {
    return new_error(storage_error::DECODE_FAILED,
                     fmt::format("key {:?} holds {} bytes, want 8 for an integer", key, buf.size()));
  }
  std::uint64_t v = 0;
  for (auto c : buf) {
    v = (v << 8) | static_cast<unsigned char>(c);
  }
  return v;
}

static leaf::result<std::uint64_t> load_uint64(const engine_snapshot_proxy& snap, const std::string& key) {
  BOOST_LEAF_AUTO(value, snap->get(key));
  if (!value) {
    return std::uint64_t{0};
  }
  return decode_uint64(key, *value);
}

// load_message calls assign only when key exists, so a field never written
// stays absent in the loaded state.
template <typename Message, typename Assign>
static leaf::result<void> load_message(const engine_snapshot_proxy& snap, const std::string& key, Assign&& assign) {
  BOOST_LEAF_AUTO(value, snap->get(key));
  if (!value) {
    return {};
  }
  Message msg;
  if (!msg.ParseFromString(*value)) {
    return new_error(storage_error::DECODE_FAILED,
                     fmt::format("failed to decode {} stored at {:?}", msg.GetTypeName(), key));
  }
  assign(std::move(msg));
  return {};
}

leaf::result<replicapb::replica_state> state_loader::load(const engine_snapshot_proxy& snap) const {
  replicapb::replica_state state;
  BOOST_LEAF_AUTO(raft_applied, load_uint64(snap, keys::raft_applied_index_key(range_id_)));
  BOOST_LEAF_AUTO(lease_applied, load_uint64(snap, keys::lease_applied_index_key(range_id_)));
  state.set_raft_applied_index(raft_applied);
  state.set_lease_applied_index(lease_applied);

  BOOST_LEAF_CHECK(load_message<replicapb::range_descriptor>(
      snap, keys::range_descriptor_key(range_id_), [&](auto&& m) { *state.mutable_desc() = std::move(m); }));
  BOOST_LEAF_CHECK(load_message<replicapb::lease>(snap, keys::range_lease_key(range_id_),
                                                  [&](auto&& m) { *state.mutable_lease() = std::move(m); }));
  BOOST_LEAF_CHECK(load_message<replicapb::raft_truncated_state>(
      snap, keys::raft_truncated_state_key(range_id_),
      [&](auto&& m) { *state.mutable_truncated_state() = std::move(m); }));
  BOOST_LEAF_CHECK(load_message<replicapb::timestamp>(
      snap, keys::range_gc_threshold_key(range_id_), [&](auto&& m) { *state.mutable_gc_threshold() = std::move(m); }));
  BOOST_LEAF_CHECK(load_message<replicapb::timestamp>(
      snap, keys::range_txn_span_gc_threshold_key(range_id_),
      [&](auto&& m) { *state.mutable_txn_span_gc_threshold() = std::move(m); }));
  BOOST_LEAF_CHECK(load_message<replicapb::mvcc_stats>(snap, keys::range_stats_key(range_id_),
                                                       [&](auto&& m) { *state.mutable_stats() = std::move(m); }));

  BOOST_LEAF_AUTO(frozen, load_uint64(snap, keys::range_frozen_status_key(range_id_)));
  if (!replicapb::frozen_status_IsValid(static_cast<int>(frozen))) {
    return new_error(storage_error::DECODE_FAILED, fmt::format("invalid frozen status {}", frozen));
  }
  state.set_frozen(static_cast<replicapb::frozen_status>(frozen));
  return state;
}

leaf::result<replicapb::mvcc_stats> state_loader::load_mvcc_stats(const engine_snapshot_proxy& snap) const {
  replicapb::mvcc_stats stats;
  BOOST_LEAF_CHECK(load_message<replicapb::mvcc_stats>(snap, keys::range_stats_key(range_id_),
                                                       [&](auto&& m) { stats = std::move(m); }));
  return stats;
}

void state_loader::stage(engine_batch& batch, const replicapb::replica_state& state) const {
  stage_applied_index(batch, state.raft_applied_index(), state.lease_applied_index());
  stage_desc(batch, state.desc());
  stage_lease(batch, state.lease());
  stage_truncated_state(batch, state.truncated_state());
  stage_gc_threshold(batch, state.gc_threshold());
  stage_txn_span_gc_threshold(batch, state.txn_span_gc_threshold());
  stage_mvcc_stats(batch, state.stats());
  stage_frozen_status(batch, state.frozen());
}

void state_loader::stage_applied_index(engine_batch& batch, std::uint64_t raft_applied_index,
                                       std::uint64_t lease_applied_index) const {
  stage_raft_applied_index(batch, raft_applied_index);
  stage_lease_applied_index(batch, lease_applied_index);
}

void state_loader::stage_raft_applied_index(engine_batch& batch, std::uint64_t index) const {
  batch.put(keys::raft_applied_index_key(range_id_), encode_uint64(index));
}

void state_loader::stage_lease_applied_index(engine_batch& batch, std::uint64_t index) const {
  batch.put(keys::lease_applied_index_key(range_id_), encode_uint64(index));
}

void state_loader::stage_mvcc_stats(engine_batch& batch, const replicapb::mvcc_stats& stats) const {
  batch.put_message(keys::range_stats_key(range_id_), stats);
}

void state_loader::stage_lease(engine_batch& batch, const replicapb::lease& l) const {
  batch.put_message(keys::range_lease_key(range_id_), l);
}

void state_loader::stage_truncated_state(engine_batch& batch, const replicapb::raft_truncated_state& truncated) const {
  batch.put_message(keys::raft_truncated_state_key(range_id_), truncated);
}

void state_loader::stage_gc_threshold(engine_batch& batch, const replicapb::timestamp& threshold) const {
  batch.put_message(keys::range_gc_threshold_key(range_id_), threshold);
}

void state_loader::stage_txn_span_gc_threshold(engine_batch& batch, const replicapb::timestamp& threshold) const {
  batch.put_message(keys::range_txn_span_gc_threshold_key(range_id_), threshold);
}

void state_loader::stage_frozen_status(engine_batch& batch, replicapb::frozen_status frozen) const {
  batch.put(keys::range_frozen_status_key(range_id_), encode_uint64(static_cast<std::uint64_t>(frozen)));
}

void state_loader::stage_desc(engine_batch& batch, const replicapb::range_descriptor& desc) const {
  batch.put_message(keys::range_descriptor_key(range_id_), desc);
}

leaf::result<void> state_loader::set_mvcc_stats(engine_proxy& engine, const replicapb::mvcc_stats& stats) const {
  engine_batch batch;
  stage_mvcc_stats(batch, stats);
  return engine->write(std::move(batch));
}

leaf::result<void> write_initial_state(engine_proxy& engine, const replicapb::range_descriptor& desc,
                                       const replicapb::lease& l) {
  replicapb::replica_state state;
  *state.mutable_desc() = desc;
  *state.mutable_lease() = l;
  // 新建的 range 从 raft 的初始 index 开始
  state.set_raft_applied_index(10);
  state.mutable_truncated_state()->set_index(10);
  state.mutable_truncated_state()->set_term(5);
  state_loader loader(desc.range_id());
  engine_batch batch;
  loader.stage(batch, state);
  return engine->write(std::move(batch));
}

}  // namespace strata::core
