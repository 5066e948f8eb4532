#include "replica_core/raft_entry_cache.h"

namespace strata::core {

void raft_entry_cache::add(pb::range_id range_id, const pb::repeated_log_entry& entries) {
  std::lock_guard<std::mutex> guard(mutex_);
  auto& range = ranges_[range_id];
  for (const auto& entry : entries) {
    range.insert_or_assign(entry.index(), entry);
  }
}

std::optional<replicapb::log_entry> raft_entry_cache::get(pb::range_id range_id, std::uint64_t index) const {
  std::lock_guard<std::mutex> guard(mutex_);
  auto range = ranges_.find(range_id);
  if (range == ranges_.end()) {
    return std::nullopt;
  }
  auto iter = range->second.find(index);
  if (iter == range->second.end()) {
    return std::nullopt;
  }
  return iter->second;
}

void raft_entry_cache::clear_to(pb::range_id range_id, std::uint64_t hi) {
  std::lock_guard<std::mutex> guard(mutex_);
  auto range = ranges_.find(range_id);
  if (range == ranges_.end()) {
    return;
  }
  auto& entries = range->second;
  entries.erase(entries.begin(), entries.lower_bound(hi));
  if (entries.empty()) {
    ranges_.erase(range);
  }
}

std::size_t raft_entry_cache::size(pb::range_id range_id) const {
  std::lock_guard<std::mutex> guard(mutex_);
  auto range = ranges_.find(range_id);
  if (range == ranges_.end()) {
    return 0;
  }
  return range->second.size();
}

}  // namespace strata::core
