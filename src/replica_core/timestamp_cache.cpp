#include "replica_core/timestamp_cache.h"

#include "replica_core/pb/protobuf.h"
namespace strata::core {

void timestamp_cache::add(std::string_view key, const replicapb::timestamp& ts) {
  if (!pb::less(low_water_, ts)) {
    return;
  }
  auto [iter, inserted] = entries_.try_emplace(std::string(key), ts);
  if (!inserted) {
    pb::forward(iter->second, ts);
  }
}

replicapb::timestamp timestamp_cache::get_max(std::string_view key) const {
  auto iter = entries_.find(absl::string_view(key.data(), key.size()));
  if (iter == entries_.end()) {
    return low_water_;
  }
  auto max = low_water_;
  pb::forward(max, iter->second);
  return max;
}

void timestamp_cache::set_low_water(const replicapb::timestamp& ts) {
  if (!pb::forward(low_water_, ts)) {
    return;
  }
  absl::erase_if(entries_, [this](const auto& entry) { return !pb::less(low_water_, entry.second); });
}

void timestamp_cache::clear(const replicapb::timestamp& ts) {
  entries_.clear();
  low_water_ = ts;
}

}  // namespace strata::core
