#include "replica_core/keys.h"

namespace strata::core::keys {

std::string make_range_id_prefix(std::uint64_t range_id) {
  std::string key(LOCAL_RANGE_ID_PREFIX);
  for (int shift = 56; shift >= 0; shift -= 8) {
    key.push_back(static_cast<char>((range_id >> shift) & 0xff));
  }
  return key;
}

static std::string make_range_id_key(std::uint64_t range_id, std::string_view suffix) {
  auto key = make_range_id_prefix(range_id);
  key.append(suffix);
  return key;
}

std::string raft_applied_index_key(std::uint64_t range_id) {
  return make_range_id_key(range_id, RAFT_APPLIED_INDEX_SUFFIX);
}

std::string lease_applied_index_key(std::uint64_t range_id) {
  return make_range_id_key(range_id, LEASE_APPLIED_INDEX_SUFFIX);
}

std::string range_descriptor_key(std::uint64_t range_id) {
  return make_range_id_key(range_id, RANGE_DESCRIPTOR_SUFFIX);
}

std::string range_lease_key(std::uint64_t range_id) { return make_range_id_key(range_id, RANGE_LEASE_SUFFIX); }

std::string raft_truncated_state_key(std::uint64_t range_id) {
  return make_range_id_key(range_id, RAFT_TRUNCATED_STATE_SUFFIX);
}

std::string range_gc_threshold_key(std::uint64_t range_id) {
  return make_range_id_key(range_id, RANGE_GC_THRESHOLD_SUFFIX);
}

std::string range_txn_span_gc_threshold_key(std::uint64_t range_id) {
  return make_range_id_key(range_id, RANGE_TXN_SPAN_GC_THRESHOLD_SUFFIX);
}

std::string range_stats_key(std::uint64_t range_id) { return make_range_id_key(range_id, RANGE_STATS_SUFFIX); }

std::string range_frozen_status_key(std::uint64_t range_id) {
  return make_range_id_key(range_id, RANGE_FROZEN_STATUS_SUFFIX);
}

std::string prefix_end(std::string_view prefix) {
  std::string end(prefix);
  while (!end.empty()) {
    auto& last = end.back();
    if (static_cast<unsigned char>(last) != 0xff) {
      last = static_cast<char>(static_cast<unsigned char>(last) + 1);
      return end;
    }
    end.pop_back();
  }
  return end;
}

bool is_local(std::string_view key) { return key.starts_with(LOCAL_PREFIX); }

}  // namespace strata::core::keys
